#include "XlsxWriter.hpp"
#include "OoxmlUtils.hpp"
#include "ZipArchive.hpp"

#include <filesystem>
#include <map>

#include <plog/Log.h>
#include <tinyxml2.h>

namespace fs = std::filesystem;

namespace workbook
{

namespace
{

void rewriteAsInlineString(tinyxml2::XMLDocument& doc, tinyxml2::XMLElement* c, const std::string& text)
{
    for (const char* name : { "v", "is" })
    {
        while (auto* child = ooxml::firstChild(c, name))
            c->DeleteChild(child);
    }
    c->SetAttribute("t", "inlineStr");

    auto* is = doc.NewElement("is");
    auto* t = doc.NewElement("t");
    t->SetAttribute("xml:space", "preserve");
    t->SetText(ooxml::encodeEscapes(text).c_str());
    is->InsertEndChild(t);
    c->InsertFirstChild(is);
}

// Closes and deletes an unfinished output file; the caller already has the error
bool abandon(ZipWriter& writer, const std::string& partial)
{
    std::string close_error;
    if (!writer.finalize(close_error))
        PLOG_DEBUG << "Discarding " << partial << ": " << close_error;

    std::error_code ec;
    fs::remove(partial, ec);
    return false;
}

} // namespace

bool XlsxWriter::patchWorksheetXml(const Sheet& sheet, const std::string& xml, std::string& out,
                                   std::string& outError)
{
    tinyxml2::XMLDocument doc(true, ooxml::kWhitespaceMode);
    if (doc.Parse(xml.c_str(), xml.size()) != tinyxml2::XML_SUCCESS || !doc.RootElement())
    {
        outError = "Worksheet '" + sheet.name() + "' is not valid XML: " + doc.ErrorStr();
        return false;
    }

    auto* sheet_data = ooxml::firstChild(doc.RootElement(), "sheetData");
    if (!sheet_data)
    {
        outError = "Worksheet '" + sheet.name() + "' has no sheetData";
        return false;
    }

    std::map<CellAddress, tinyxml2::XMLElement*> elements;
    ooxml::forEachCell(sheet_data, [&](const CellAddress& address, tinyxml2::XMLElement* c) {
        elements[address] = c;
    });

    for (const auto& address : sheet.modifiedCells())
    {
        auto it = elements.find(address);
        const Cell* cell = sheet.find(address);
        if (it == elements.end() || !cell)
        {
            outError = "Cell " + sheet.name() + "!" + toA1(address) + " not present in " + sheet.partPath();
            return false;
        }
        rewriteAsInlineString(doc, it->second, cell->text);
    }

    tinyxml2::XMLPrinter printer(nullptr, true);
    doc.Print(&printer);
    out.assign(printer.CStr(), static_cast<std::size_t>(printer.CStrSize() - 1));
    return true;
}

bool XlsxWriter::save(const Workbook& workbook, const std::string& path, std::string& outError)
{
    ZipArchive source;
    std::string zip_error;
    if (!source.open(workbook.sourcePath(), zip_error))
    {
        outError = "Cannot reopen source workbook " + workbook.sourcePath() + ": " + zip_error;
        return false;
    }

    std::map<std::string, const Sheet*> dirty;
    for (const auto& sheet : workbook.sheets())
    {
        if (sheet.isModified())
            dirty[sheet.partPath()] = &sheet;
    }

    std::error_code ec;
    const fs::path target(path);
    if (target.has_parent_path())
        fs::create_directories(target.parent_path(), ec);

    const std::string partial = path + ".partial";
    ZipWriter writer;
    if (!writer.open(partial, outError))
        return false;

    const int count = source.fileCount();
    for (int i = 0; i < count; ++i)
    {
        const std::string name = source.fileName(i);
        auto it = dirty.find(name);
        if (it == dirty.end())
        {
            if (!writer.copyFrom(source, i, outError))
                return abandon(writer, partial);
            continue;
        }

        std::string xml;
        std::string patched;
        if (!source.read(name, xml))
        {
            outError = "Cannot read " + name + " from " + workbook.sourcePath();
            return abandon(writer, partial);
        }
        if (!patchWorksheetXml(*it->second, xml, patched, outError) || !writer.add(name, patched, outError))
            return abandon(writer, partial);
        PLOG_DEBUG << "Rewrote " << name << " (" << it->second->modifiedCells().size() << " cells)";
    }

    if (!writer.finalize(outError))
    {
        fs::remove(partial, ec);
        return false;
    }

    fs::rename(partial, path, ec);
    if (ec)
    {
        outError = "Cannot move " + partial + " to " + path + ": " + ec.message();
        fs::remove(partial, ec);
        return false;
    }

    PLOG_INFO << "Saved workbook " << path << " (" << workbook.modifiedCellCount() << " cells changed)";
    return true;
}

} // namespace workbook
