//===----------------------------------------------------------------------===//
//
// Part of the Zaban project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/common/DiagnosticHelpers.hpp
// Purpose: Message formatting helpers shared by the lexer and parser.
//
//===----------------------------------------------------------------------===//
#pragma once

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

namespace zaban::frontends::common::diag_helpers
{

/// @brief Maximum number of alternatives spelled out in "expected" lists.
constexpr size_t kMaxSuggestions = 5;

/// @brief Quote a string for display in error messages.
[[nodiscard]] inline std::string quote(std::string_view s)
{
    std::string result = "'";
    result += s;
    result += "'";
    return result;
}

/// @brief Format an expected-set as "a", "a or b" or "one of a, b, c".
/// @param expected Human-readable names of acceptable tokens or constructs.
/// @param maxShow Maximum number spelled out before "... (N more)".
[[nodiscard]] inline std::string formatExpectedSet(const std::vector<std::string> &expected,
                                                   size_t maxShow = kMaxSuggestions)
{
    if (expected.empty())
        return "";
    if (expected.size() == 1)
        return expected.front();
    if (expected.size() == 2)
        return expected[0] + " or " + expected[1];

    std::string result = "one of ";
    size_t count = std::min(expected.size(), maxShow);
    for (size_t i = 0; i < count; ++i)
    {
        if (i > 0)
            result += ", ";
        result += expected[i];
    }
    if (expected.size() > maxShow)
    {
        result += ", ... (";
        result += std::to_string(expected.size() - maxShow);
        result += " more)";
    }
    return result;
}

/// @brief Format "expected X, got Y".
[[nodiscard]] inline std::string formatExpectedGot(std::string_view expected, std::string_view got)
{
    std::string result = "expected ";
    result += expected;
    result += ", got ";
    result += got;
    return result;
}

} // namespace zaban::frontends::common::diag_helpers
