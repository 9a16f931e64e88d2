//===----------------------------------------------------------------------===//
//
// Part of the Zaban project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Lookup functions over the static spelling tables.
//
//===----------------------------------------------------------------------===//

#include "frontends/urdu/Lexicon.hpp"

namespace zaban::frontends::urdu
{

std::optional<TokenKind> lookupKeyword(std::string_view spelling)
{
    return common::keyword_table::lookupKeywordBinary(kKeywordTable, spelling);
}

std::optional<TokenKind> lookupOperator(std::string_view spelling)
{
    return common::keyword_table::lookupKeywordBinary(kOperatorTable, spelling);
}

bool isDelimiter(char c)
{
    switch (c)
    {
        case ';':
        case ',':
        case '(':
        case ')':
        case '{':
        case '}':
        case '[':
        case ']':
            return true;
        default:
            return false;
    }
}

} // namespace zaban::frontends::urdu
