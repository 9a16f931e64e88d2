//===----------------------------------------------------------------------===//
//
// Part of the Zaban project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// String conversion helpers for tokens.  Both name tables are generated from
// TokenKinds.def and checked against TokenKind::Count.
//
//===----------------------------------------------------------------------===//

#include "frontends/urdu/Token.hpp"

#include <cstddef>
#include <cstdio>

namespace zaban::frontends::urdu
{
namespace
{
constexpr const char *kTokenDisplay[] = {
#define TOKEN(K, S) S,
#include "frontends/urdu/TokenKinds.def"
#undef TOKEN
};

constexpr const char *kTokenNames[] = {
#define TOKEN(K, S) #K,
#include "frontends/urdu/TokenKinds.def"
#undef TOKEN
};

constexpr std::size_t kTokenNameCount = sizeof(kTokenNames) / sizeof(kTokenNames[0]);

static_assert(kTokenNameCount == static_cast<std::size_t>(TokenKind::Count),
              "TokenKinds.def and TokenKind are out of sync");
static_assert(sizeof(kTokenDisplay) == sizeof(kTokenNames));

/// @brief Escape control characters and quotes for single-line output.
std::string escapeForDump(const std::string &text)
{
    std::string out;
    out.reserve(text.size());
    for (char c : text)
    {
        switch (c)
        {
            case '\n':
                out += "\\n";
                break;
            case '\t':
                out += "\\t";
                break;
            case '\r':
                out += "\\r";
                break;
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20 || static_cast<unsigned char>(c) >= 0x7f)
                {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\x%02X", static_cast<unsigned char>(c));
                    out += buf;
                }
                else
                {
                    out += c;
                }
                break;
        }
    }
    return out;
}
} // namespace

const char *tokenKindToString(TokenKind k)
{
    const auto index = static_cast<std::size_t>(k);
    if (index < kTokenNameCount)
        return kTokenDisplay[index];
    return "?";
}

const char *tokenKindName(TokenKind k)
{
    const auto index = static_cast<std::size_t>(k);
    if (index < kTokenNameCount)
        return kTokenNames[index];
    return "?";
}

bool isTypeKeyword(TokenKind k)
{
    switch (k)
    {
        case TokenKind::KwInt:
        case TokenKind::KwFloat:
        case TokenKind::KwBool:
        case TokenKind::KwString:
        case TokenKind::KwChar:
            return true;
        default:
            return false;
    }
}

std::string describeToken(const Token &tok)
{
    switch (tok.kind)
    {
        case TokenKind::Identifier:
        case TokenKind::IntegerLiteral:
        case TokenKind::FloatLiteral:
            return std::string(tokenKindToString(tok.kind)) + " '" + tok.lexeme + "'";
        case TokenKind::StringLiteral:
        case TokenKind::CharLiteral:
            return std::string(tokenKindToString(tok.kind)) + " " + tok.lexeme;
        default:
            return tokenKindToString(tok.kind);
    }
}

std::string formatToken(const Token &tok)
{
    std::string out = std::to_string(tok.loc.line) + ":" + std::to_string(tok.loc.column);
    out += '\t';
    out += tokenKindName(tok.kind);
    out += "\t\"";
    out += escapeForDump(tok.lexeme);
    out += '"';
    return out;
}

} // namespace zaban::frontends::urdu
