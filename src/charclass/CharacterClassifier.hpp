#pragma once

#include <optional>
#include <set>
#include <string>

namespace charclass
{

/// Explicit set of codepoints to treat as problematic
using TargetSet = std::set<char32_t>;

/// Inclusive codepoint range used when no TargetSet is supplied
struct CodepointRange
{
    char32_t first = 0x80;
    char32_t last = 0xFF;

    bool contains(char32_t cp) const { return cp >= first && cp <= last; }
};

struct Classification
{
    bool is_problematic = false;
    bool is_printable = false;
    std::string category;
};

/// Decides problematic membership and computes a readable category for a
/// single codepoint. Total: every input yields a Classification.
class CharacterClassifier
{
public:
    static constexpr const char* kUndefined = "UNDEFINED";

    CharacterClassifier() = default;
    explicit CharacterClassifier(CodepointRange default_range);

    [[nodiscard]] Classification classify(char32_t cp, const std::optional<TargetSet>& targets) const;

    /// Membership test only (no category string built)
    [[nodiscard]] bool isProblematic(char32_t cp, const std::optional<TargetSet>& targets) const;

    /// Not a control/format/surrogate/private-use/unassigned codepoint
    /// and not a line or paragraph separator
    static bool isPrintable(char32_t cp);

    /// Two-letter general category ("Cc", "Ll"), or UNDEFINED above U+10FFFF
    static std::string categoryCode(char32_t cp);

    /// "Printable" or "Non-printable - Unicode category: <cat> (<cat-or-UNDEFINED>)"
    static std::string describe(char32_t cp);

private:
    CodepointRange default_range_;
};

} // namespace charclass
