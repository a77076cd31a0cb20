#pragma once

#include "CharacterClassifier.hpp"
#include <string>

namespace charclass
{

/// Parses a user-typed character list into a TargetSet.
///
/// Every codepoint of the (UTF-8) input becomes a target. Backslash escapes
/// are decoded first: \xHH, \uHHHH, \UHHHHHHHH, \\, \t, \n, \r.
/// Example: "\x81\x82é" -> { U+0081, U+0082, U+00E9 }
bool parseTargetSpec(const std::string& spec, TargetSet& out, std::string& outError);

} // namespace charclass
