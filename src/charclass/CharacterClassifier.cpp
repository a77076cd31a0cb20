#include "CharacterClassifier.hpp"

#include <utf8proc.h>

namespace charclass
{

namespace
{

constexpr char32_t kMaxCodepoint = 0x10FFFF;

bool hasDatabaseEntry(char32_t cp)
{
    return cp <= kMaxCodepoint && utf8proc_category(static_cast<utf8proc_int32_t>(cp)) != UTF8PROC_CATEGORY_CN;
}

} // namespace

CharacterClassifier::CharacterClassifier(CodepointRange default_range)
    : default_range_(default_range)
{
}

Classification CharacterClassifier::classify(char32_t cp, const std::optional<TargetSet>& targets) const
{
    Classification result;
    result.is_problematic = isProblematic(cp, targets);
    result.is_printable = isPrintable(cp);
    result.category = describe(cp);
    return result;
}

bool CharacterClassifier::isProblematic(char32_t cp, const std::optional<TargetSet>& targets) const
{
    if (targets)
        return targets->count(cp) != 0;
    return default_range_.contains(cp);
}

bool CharacterClassifier::isPrintable(char32_t cp)
{
    if (cp > kMaxCodepoint)
        return false;

    switch (utf8proc_category(static_cast<utf8proc_int32_t>(cp)))
    {
    case UTF8PROC_CATEGORY_CC:
    case UTF8PROC_CATEGORY_CF:
    case UTF8PROC_CATEGORY_CS:
    case UTF8PROC_CATEGORY_CO:
    case UTF8PROC_CATEGORY_CN:
    case UTF8PROC_CATEGORY_ZL:
    case UTF8PROC_CATEGORY_ZP:
        return false;
    default:
        return true;
    }
}

std::string CharacterClassifier::categoryCode(char32_t cp)
{
    if (cp > kMaxCodepoint)
        return kUndefined;
    const char* code = utf8proc_category_string(static_cast<utf8proc_int32_t>(cp));
    return code ? std::string(code) : std::string(kUndefined);
}

std::string CharacterClassifier::describe(char32_t cp)
{
    if (isPrintable(cp))
        return "Printable";

    const std::string code = categoryCode(cp);
    const std::string detail = hasDatabaseEntry(cp) ? code : std::string(kUndefined);
    return "Non-printable - Unicode category: " + code + " (" + detail + ")";
}

} // namespace charclass
