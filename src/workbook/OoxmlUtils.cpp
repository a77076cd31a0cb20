#include "OoxmlUtils.hpp"

#include <cstdio>
#include <cstring>
#include <vector>

#include "../processing/TextUtils.hpp"

namespace workbook::ooxml
{

namespace
{

bool isHex(char c)
{
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

// "_xHHHH_" starting at pos
bool isEscapeAt(const std::string& text, std::size_t pos)
{
    if (pos + 7 > text.size())
        return false;
    if (text[pos] != '_' || text[pos + 1] != 'x' || text[pos + 6] != '_')
        return false;
    for (std::size_t i = pos + 2; i < pos + 6; ++i)
    {
        if (!isHex(text[i]))
            return false;
    }
    return true;
}

bool localNameIs(const tinyxml2::XMLElement* element, const char* local)
{
    return std::strcmp(localName(element), local) == 0;
}

void appendRunText(const tinyxml2::XMLElement* run, std::string& out)
{
    for (auto* t = firstChild(run, "t"); t; t = nextSibling(t, "t"))
    {
        if (const char* value = t->GetText())
            out += value;
    }
}

} // namespace

const char* localName(const tinyxml2::XMLElement* element)
{
    const char* name = element->Name();
    const char* colon = std::strchr(name, ':');
    return colon ? colon + 1 : name;
}

const tinyxml2::XMLElement* firstChild(const tinyxml2::XMLElement* parent, const char* local)
{
    for (auto* child = parent->FirstChildElement(); child; child = child->NextSiblingElement())
    {
        if (localNameIs(child, local))
            return child;
    }
    return nullptr;
}

tinyxml2::XMLElement* firstChild(tinyxml2::XMLElement* parent, const char* local)
{
    return const_cast<tinyxml2::XMLElement*>(firstChild(static_cast<const tinyxml2::XMLElement*>(parent), local));
}

const tinyxml2::XMLElement* nextSibling(const tinyxml2::XMLElement* element, const char* local)
{
    for (auto* sibling = element->NextSiblingElement(); sibling; sibling = sibling->NextSiblingElement())
    {
        if (localNameIs(sibling, local))
            return sibling;
    }
    return nullptr;
}

tinyxml2::XMLElement* nextSibling(tinyxml2::XMLElement* element, const char* local)
{
    return const_cast<tinyxml2::XMLElement*>(nextSibling(static_cast<const tinyxml2::XMLElement*>(element), local));
}

const char* attributeByLocalName(const tinyxml2::XMLElement* element, const char* local)
{
    for (auto* attr = element->FirstAttribute(); attr; attr = attr->Next())
    {
        const char* name = attr->Name();
        const char* colon = std::strchr(name, ':');
        if (std::strcmp(colon ? colon + 1 : name, local) == 0)
            return attr->Value();
    }
    return nullptr;
}

std::string collectStringItem(const tinyxml2::XMLElement* item)
{
    std::string text;
    for (auto* child = item->FirstChildElement(); child; child = child->NextSiblingElement())
    {
        if (localNameIs(child, "t"))
        {
            if (const char* value = child->GetText())
                text += value;
        }
        else if (localNameIs(child, "r"))
        {
            appendRunText(child, text);
        }
        // rPh (phonetic guide) and phoneticPr are not part of the cell value
    }
    return decodeEscapes(text);
}

std::string decodeEscapes(const std::string& text)
{
    if (text.find("_x") == std::string::npos)
        return text;

    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size();)
    {
        if (isEscapeAt(text, i))
        {
            char32_t cp = static_cast<char32_t>(std::stoul(text.substr(i + 2, 4), nullptr, 16));
            out += processing::codepointToUtf8(cp);
            i += 7;
        }
        else
        {
            out.push_back(text[i]);
            ++i;
        }
    }
    return out;
}

std::string encodeEscapes(const std::string& text)
{
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i)
    {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if ((c < 0x20 && c != '\t' && c != '\n' && c != '\r') || isEscapeAt(text, i))
        {
            char buf[8];
            std::snprintf(buf, sizeof(buf), "_x%04X_", static_cast<unsigned>(c));
            out += buf;
        }
        else
        {
            out.push_back(static_cast<char>(c));
        }
    }
    return out;
}

std::string resolveTarget(const std::string& source_part, const std::string& target)
{
    if (!target.empty() && target.front() == '/')
        return target.substr(1);

    std::string base;
    auto slash = source_part.rfind('/');
    if (slash != std::string::npos)
        base = source_part.substr(0, slash + 1);

    std::vector<std::string> segments;
    std::string combined = base + target;
    std::size_t start = 0;
    while (start <= combined.size())
    {
        auto end = combined.find('/', start);
        if (end == std::string::npos)
            end = combined.size();
        std::string segment = combined.substr(start, end - start);
        if (segment == "..")
        {
            if (!segments.empty())
                segments.pop_back();
        }
        else if (!segment.empty() && segment != ".")
        {
            segments.push_back(segment);
        }
        start = end + 1;
    }

    std::string resolved;
    for (const auto& segment : segments)
    {
        if (!resolved.empty())
            resolved += '/';
        resolved += segment;
    }
    return resolved;
}

} // namespace workbook::ooxml
