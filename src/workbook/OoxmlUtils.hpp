#pragma once

#include "CellReference.hpp"

#include <string>
#include <tinyxml2.h>

namespace workbook::ooxml
{

// Package parts are parsed keeping whitespace-only text nodes, so cell text
// such as "   " survives a read and an unrelated rewrite of its worksheet.
constexpr tinyxml2::Whitespace kWhitespaceMode = tinyxml2::PEDANTIC_WHITESPACE;

// Element name without namespace prefix ("x:row" -> "row")
const char* localName(const tinyxml2::XMLElement* element);

const tinyxml2::XMLElement* firstChild(const tinyxml2::XMLElement* parent, const char* local);
tinyxml2::XMLElement* firstChild(tinyxml2::XMLElement* parent, const char* local);
const tinyxml2::XMLElement* nextSibling(const tinyxml2::XMLElement* element, const char* local);
tinyxml2::XMLElement* nextSibling(tinyxml2::XMLElement* element, const char* local);

// Attribute lookup ignoring the prefix ("r:id" matches "id")
const char* attributeByLocalName(const tinyxml2::XMLElement* element, const char* local);

// Text of a <si> or <is> element: plain <t> and rich-text runs, phonetic
// runs excluded, _xHHHH_ escapes decoded.
std::string collectStringItem(const tinyxml2::XMLElement* item);

// _x0001_ -> U+0001, _x005F_ -> '_'
std::string decodeEscapes(const std::string& text);

// Inverse of decodeEscapes for text going back into a worksheet: C0 controls
// other than tab/LF/CR are written as _xHHHH_, and a literal _xHHHH_ gets its
// leading underscore escaped.
std::string encodeEscapes(const std::string& text);

// Resolves a relationship Target against the directory of the source part.
// ("xl/workbook.xml", "worksheets/sheet1.xml") -> "xl/worksheets/sheet1.xml"
std::string resolveTarget(const std::string& source_part, const std::string& target);

// Walks <row>/<c> under <sheetData>, inferring missing r= attributes the way
// spreadsheet applications do (next row / next column).
template<typename Element, typename Fn>
void forEachCell(Element* sheet_data, Fn&& fn)
{
    int row_index = 0;
    for (Element* row = firstChild(sheet_data, "row"); row; row = nextSibling(row, "row"))
    {
        int r = row->IntAttribute("r", 0);
        row_index = r > 0 ? r : row_index + 1;

        int col_index = 0;
        for (Element* cell = firstChild(row, "c"); cell; cell = nextSibling(cell, "c"))
        {
            CellAddress address{ row_index, col_index + 1 };
            const char* ref = cell->Attribute("r");
            CellAddress parsed;
            if (ref && parseCellReference(ref, parsed))
                address = parsed;
            col_index = address.col;
            fn(address, cell);
        }
    }
}

} // namespace workbook::ooxml
