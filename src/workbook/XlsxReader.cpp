#include "XlsxReader.hpp"
#include "OoxmlUtils.hpp"
#include "ZipArchive.hpp"

#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <map>
#include <vector>

#include <plog/Log.h>
#include <tinyxml2.h>

namespace fs = std::filesystem;

namespace workbook
{

namespace
{

constexpr const char* kOfficeDocumentRel =
    "http://schemas.openxmlformats.org/officeDocument/2006/relationships/officeDocument";

struct Relationship
{
    std::string type;
    std::string target;
};

bool endsWith(const std::string& value, const std::string& suffix)
{
    return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string relsPartFor(const std::string& part)
{
    auto slash = part.rfind('/');
    std::string dir = slash == std::string::npos ? std::string() : part.substr(0, slash + 1);
    std::string file = slash == std::string::npos ? part : part.substr(slash + 1);
    return dir + "_rels/" + file + ".rels";
}

std::map<std::string, Relationship> readRelationships(const ZipArchive& zip, const std::string& source_part)
{
    std::map<std::string, Relationship> rels;
    std::string xml;
    if (!zip.read(relsPartFor(source_part), xml))
        return rels;

    tinyxml2::XMLDocument doc(true, ooxml::kWhitespaceMode);
    if (doc.Parse(xml.c_str(), xml.size()) != tinyxml2::XML_SUCCESS || !doc.RootElement())
    {
        PLOG_WARNING << "Unreadable relationships for " << source_part << ": " << doc.ErrorStr();
        return rels;
    }

    for (auto* rel = ooxml::firstChild(doc.RootElement(), "Relationship"); rel;
         rel = ooxml::nextSibling(rel, "Relationship"))
    {
        const char* id = rel->Attribute("Id");
        const char* target = rel->Attribute("Target");
        if (!id || !target)
            continue;
        // External targets (hyperlinks etc.) are not package parts
        const char* mode = rel->Attribute("TargetMode");
        if (mode && std::strcmp(mode, "External") == 0)
            continue;
        const char* type = rel->Attribute("Type");
        rels[id] = { type ? type : "", ooxml::resolveTarget(source_part, target) };
    }
    return rels;
}

std::string findWorkbookPart(const ZipArchive& zip)
{
    for (const auto& [id, rel] : readRelationships(zip, ""))
    {
        if (rel.type == kOfficeDocumentRel)
            return rel.target;
    }
    return "xl/workbook.xml";
}

// Returns false when the table exists but cannot be parsed
bool readSharedStrings(const ZipArchive& zip, const std::string& part, std::vector<std::string>& out,
                       std::string& outError)
{
    std::string xml;
    if (part.empty() || !zip.read(part, xml))
        return true;

    tinyxml2::XMLDocument doc(true, ooxml::kWhitespaceMode);
    if (doc.Parse(xml.c_str(), xml.size()) != tinyxml2::XML_SUCCESS || !doc.RootElement())
    {
        outError = std::string("shared string table unreadable: ") + doc.ErrorStr();
        return false;
    }

    for (auto* si = ooxml::firstChild(doc.RootElement(), "si"); si; si = ooxml::nextSibling(si, "si"))
        out.push_back(ooxml::collectStringItem(si));
    return true;
}

struct SharedStrings
{
    std::vector<std::string> values;
    bool readable = true;
    std::string error;
};

Cell readCell(const tinyxml2::XMLElement* c, const SharedStrings& shared)
{
    Cell cell;
    const char* type = c->Attribute("t");
    const auto* v = ooxml::firstChild(c, "v");
    const char* raw = v ? v->GetText() : nullptr;

    if (ooxml::firstChild(c, "f"))
    {
        cell.kind = CellKind::Formula;
        cell.text = raw ? raw : "";
        return cell;
    }

    if (type && std::strcmp(type, "s") == 0)
    {
        if (!shared.readable)
        {
            cell.kind = CellKind::Unreadable;
            cell.read_error = shared.error;
            return cell;
        }
        char* end = nullptr;
        long index = raw ? std::strtol(raw, &end, 10) : -1;
        if (!raw || end == raw || index < 0 || static_cast<std::size_t>(index) >= shared.values.size())
        {
            cell.kind = CellKind::Unreadable;
            cell.read_error = std::string("shared string index out of range: ") + (raw ? raw : "<none>");
            return cell;
        }
        return Cell::Text(shared.values[static_cast<std::size_t>(index)]);
    }

    if (type && std::strcmp(type, "inlineStr") == 0)
    {
        const auto* is = ooxml::firstChild(c, "is");
        return Cell::Text(is ? ooxml::collectStringItem(is) : std::string());
    }

    if (type && std::strcmp(type, "str") == 0)
    {
        cell.kind = CellKind::Formula;
        cell.text = raw ? raw : "";
        return cell;
    }

    if (type && std::strcmp(type, "b") == 0)
    {
        cell.kind = CellKind::Boolean;
        cell.text = raw ? raw : "";
        cell.number = (raw && std::strcmp(raw, "1") == 0) ? 1.0 : 0.0;
        return cell;
    }

    if (type && std::strcmp(type, "e") == 0)
    {
        cell.kind = CellKind::ErrorValue;
        cell.text = raw ? raw : "";
        return cell;
    }

    if (!raw)
        return cell; // styled but empty

    // "n" (default) and "d" (ISO date) are both non-text
    char* end = nullptr;
    double number = std::strtod(raw, &end);
    return Cell::Number(end != raw ? number : 0.0, raw);
}

void readWorksheet(const ZipArchive& zip, Sheet& sheet, const SharedStrings& shared)
{
    std::string xml;
    if (!zip.read(sheet.partPath(), xml))
    {
        sheet.markUnreadable("worksheet part missing: " + sheet.partPath());
        return;
    }

    tinyxml2::XMLDocument doc(true, ooxml::kWhitespaceMode);
    if (doc.Parse(xml.c_str(), xml.size()) != tinyxml2::XML_SUCCESS || !doc.RootElement())
    {
        sheet.markUnreadable(std::string("worksheet XML unreadable: ") + doc.ErrorStr());
        return;
    }

    const auto* root = doc.RootElement();
    if (std::strcmp(ooxml::localName(root), "worksheet") != 0)
    {
        // chartsheet / dialogsheet: no cells
        PLOG_DEBUG << "Sheet '" << sheet.name() << "' is a " << ooxml::localName(root) << ", no cells";
        return;
    }

    const auto* sheet_data = ooxml::firstChild(root, "sheetData");
    if (!sheet_data)
        return;

    ooxml::forEachCell(sheet_data, [&](const CellAddress& address, const tinyxml2::XMLElement* c) {
        Cell cell = readCell(c, shared);
        if (cell.kind != CellKind::Empty)
            sheet.setCell(address, std::move(cell));
    });
}

} // namespace

bool XlsxReader::open(const std::string& path, Workbook& out, std::string& outError)
{
    std::error_code ec;
    if (!fs::exists(path, ec))
    {
        outError = "File not found: " + path;
        return false;
    }

    ZipArchive zip;
    std::string zip_error;
    if (!zip.open(path, zip_error))
    {
        outError = "Unsupported format (not an .xlsx package): " + path;
        PLOG_ERROR << zip_error;
        return false;
    }

    const std::string workbook_part = findWorkbookPart(zip);
    std::string xml;
    if (!zip.read(workbook_part, xml))
    {
        outError = "Unsupported format (no workbook part " + workbook_part + "): " + path;
        return false;
    }

    tinyxml2::XMLDocument doc(true, ooxml::kWhitespaceMode);
    if (doc.Parse(xml.c_str(), xml.size()) != tinyxml2::XML_SUCCESS || !doc.RootElement())
    {
        outError = "Workbook part is not valid XML: " + path + " (" + doc.ErrorStr() + ")";
        return false;
    }

    const auto rels = readRelationships(zip, workbook_part);

    SharedStrings shared;
    std::string shared_part;
    for (const auto& [id, rel] : rels)
    {
        if (endsWith(rel.type, "/sharedStrings"))
            shared_part = rel.target;
    }
    shared.readable = readSharedStrings(zip, shared_part, shared.values, shared.error);
    if (!shared.readable)
        PLOG_WARNING << "Shared strings in " << path << ": " << shared.error;

    Workbook workbook(path);
    const auto* sheets = ooxml::firstChild(doc.RootElement(), "sheets");
    for (auto* s = sheets ? ooxml::firstChild(sheets, "sheet") : nullptr; s; s = ooxml::nextSibling(s, "sheet"))
    {
        const char* name = s->Attribute("name");
        const char* rid = ooxml::attributeByLocalName(s, "id");
        std::string part;
        if (rid)
        {
            auto it = rels.find(rid);
            if (it != rels.end())
                part = it->second.target;
        }

        Sheet& sheet = workbook.addSheet(name ? name : "", part);
        if (part.empty())
        {
            sheet.markUnreadable(std::string("no worksheet relationship for sheet '") + (name ? name : "") + "'");
            continue;
        }
        readWorksheet(zip, sheet, shared);
        PLOG_DEBUG << "Read sheet '" << sheet.name() << "' (" << part << "): " << sheet.cells().size() << " cells";
    }

    if (workbook.sheets().empty())
    {
        outError = "Workbook has no sheets: " + path;
        return false;
    }

    out = std::move(workbook);
    PLOG_INFO << "Opened workbook " << path << " (" << out.sheets().size() << " sheets)";
    return true;
}

} // namespace workbook
