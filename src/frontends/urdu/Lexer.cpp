//===----------------------------------------------------------------------===//
//
// Part of the Zaban project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the lexer.  Each next() call skips trivia, classifies the first
// character and dispatches to a dedicated routine.  Faults are reported once,
// at the start of the offending lexeme (or at the backslash for escapes), and
// the lexeme is returned as an Error token so the parser can stay quiet about
// it.
//
//===----------------------------------------------------------------------===//

#include "frontends/urdu/Lexer.hpp"

#include "frontends/common/CharUtils.hpp"
#include "frontends/common/NumberParsing.hpp"
#include "frontends/urdu/Lexicon.hpp"

#include <cstdio>

namespace zaban::frontends::urdu
{
namespace
{
using common::char_utils::hexByte;
using common::char_utils::isDigit;
using common::char_utils::isHexDigit;
using common::char_utils::isIdentifierContinue;
using common::char_utils::isIdentifierStart;
using common::char_utils::isWhitespace;

/// @brief Printable rendering of a source byte for messages.
std::string displayChar(char c)
{
    auto u = static_cast<unsigned char>(c);
    if (u < 0x20 || u >= 0x7f)
    {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "\\x%02X", u);
        return buf;
    }
    return std::string(1, c);
}

uint32_t widthOf(const std::string &lexeme)
{
    return static_cast<uint32_t>(lexeme.size());
}
} // namespace

Lexer::Lexer(std::string source, uint32_t fileId, DiagnosticEmitter &diag)
    : LexerCursor(fileId), source_(std::move(source)), diag_(diag)
{
}

support::SourceLoc Lexer::currentLoc() const
{
    return {fileId(), line(), column()};
}

void Lexer::report(DiagKind kind, support::SourceLoc loc, uint32_t length, std::string message)
{
    diag_.emit(kind, loc, length, std::move(message));
}

void Lexer::skipWhitespaceAndComments()
{
    while (!eof())
    {
        char c = peek();
        if (isWhitespace(c))
        {
            get();
            continue;
        }
        if (c == '/' && peek(1) == '/')
        {
            common::lexer_base::skipToEndOfLine(*this);
            continue;
        }
        break;
    }
}

/// @brief Lex a numeric literal.
/// @details Collects the maximal run of characters that could belong to a
///          number (digits, letters, underscores, points, and a sign directly
///          after an exponent marker) so that "12abc" or "1.2.3" is reported
///          once as a whole instead of splitting into several tokens.
Token Lexer::lexNumber()
{
    Token tok;
    tok.loc = currentLoc();

    while (!eof())
    {
        char c = peek();
        if (isIdentifierContinue(c) || c == '.')
        {
            tok.lexeme.push_back(get());
            continue;
        }
        if ((c == '+' || c == '-') && !tok.lexeme.empty() &&
            common::number_parsing::isExponentChar(tok.lexeme.back()) && isDigit(peek(1)))
        {
            tok.lexeme.push_back(get());
            continue;
        }
        break;
    }

    auto parsed = common::number_parsing::parseDecimalLiteral(tok.lexeme);
    if (!parsed.valid)
    {
        tok.kind = TokenKind::Error;
        report(DiagKind::InvalidNumberFormat, tok.loc, widthOf(tok.lexeme), parsed.error);
        return tok;
    }

    if (parsed.isFloat)
    {
        tok.kind = TokenKind::FloatLiteral;
        tok.floatValue = parsed.floatValue;
    }
    else
    {
        tok.kind = TokenKind::IntegerLiteral;
        tok.intValue = parsed.intValue;
    }
    return tok;
}

Token Lexer::lexIdentifierOrKeyword()
{
    Token tok;
    tok.loc = currentLoc();
    while (!eof() && isIdentifierContinue(peek()))
        tok.lexeme.push_back(get());

    if (auto kw = lookupKeyword(tok.lexeme))
        tok.kind = *kw;
    else
        tok.kind = TokenKind::Identifier;
    return tok;
}

void Lexer::lexEscape(support::SourceLoc escLoc,
                      std::string &lexeme,
                      std::string &value,
                      std::vector<EscapeFault> &faults)
{
    char e = peek();
    switch (e)
    {
        case 'n':
            value.push_back('\n');
            break;
        case 't':
            value.push_back('\t');
            break;
        case 'r':
            value.push_back('\r');
            break;
        case '0':
            value.push_back('\0');
            break;
        case '\\':
            value.push_back('\\');
            break;
        case '"':
            value.push_back('"');
            break;
        case '\'':
            value.push_back('\'');
            break;
        case 'x':
        {
            lexeme.push_back(get());
            if (isHexDigit(peek()) && isHexDigit(peek(1)))
            {
                char hi = get();
                char lo = get();
                lexeme.push_back(hi);
                lexeme.push_back(lo);
                value.push_back(hexByte(hi, lo));
                return;
            }
            faults.push_back(
                {escLoc, 2, "invalid escape sequence '\\x': expected exactly two hex digits"});
            return;
        }
        default:
            // Newline and end of input are left for the caller's
            // unterminated-literal check.
            if (e == '\n' || e == '\0')
            {
                faults.push_back({escLoc, 1, "incomplete escape sequence"});
                return;
            }
            lexeme.push_back(get());
            faults.push_back({escLoc, 2, "invalid escape sequence '\\" + displayChar(e) + "'"});
            return;
    }
    lexeme.push_back(get());
}

/// @brief Lex a double-quoted string literal.
/// @details A newline or end of input before the closing quote makes the
///          literal unterminated; the diagnostic points at the opening quote
///          and the lexeme runs to the end of the line.  Escape faults are
///          reported only for literals that close properly.
Token Lexer::lexString()
{
    Token tok;
    tok.loc = currentLoc();
    tok.lexeme.push_back(get()); // opening quote

    std::string value;
    std::vector<EscapeFault> faults;

    while (true)
    {
        char c = peek();
        if (eof() || c == '\n')
        {
            tok.kind = TokenKind::Error;
            report(DiagKind::UnterminatedString,
                   tok.loc,
                   widthOf(tok.lexeme),
                   "unterminated string literal");
            return tok;
        }
        if (c == '"')
        {
            tok.lexeme.push_back(get());
            break;
        }
        if (c == '\\')
        {
            support::SourceLoc escLoc = currentLoc();
            tok.lexeme.push_back(get());
            lexEscape(escLoc, tok.lexeme, value, faults);
            continue;
        }
        tok.lexeme.push_back(get());
        value.push_back(c);
    }

    if (!faults.empty())
    {
        tok.kind = TokenKind::Error;
        for (auto &f : faults)
            report(DiagKind::InvalidEscapeSequence, f.loc, f.length, std::move(f.message));
        return tok;
    }

    tok.kind = TokenKind::StringLiteral;
    tok.stringValue = std::move(value);
    return tok;
}

/// @brief Lex a single-quoted character literal.
/// @details Content must decode to exactly one character.  An empty or
///          multi-character literal that closes on the same line is reported
///          as a malformed character literal spanning both quotes.
Token Lexer::lexChar()
{
    Token tok;
    tok.loc = currentLoc();
    tok.lexeme.push_back(get()); // opening quote

    std::string value;
    std::vector<EscapeFault> faults;
    size_t decoded = 0;

    while (true)
    {
        char c = peek();
        if (eof() || c == '\n')
        {
            tok.kind = TokenKind::Error;
            report(DiagKind::UnterminatedChar,
                   tok.loc,
                   widthOf(tok.lexeme),
                   "unterminated character literal");
            return tok;
        }
        if (c == '\'')
        {
            tok.lexeme.push_back(get());
            break;
        }
        if (c == '\\')
        {
            support::SourceLoc escLoc = currentLoc();
            tok.lexeme.push_back(get());
            lexEscape(escLoc, tok.lexeme, value, faults);
            ++decoded;
            continue;
        }
        tok.lexeme.push_back(get());
        value.push_back(c);
        ++decoded;
    }

    if (decoded != 1)
    {
        tok.kind = TokenKind::Error;
        report(DiagKind::UnterminatedChar,
               tok.loc,
               widthOf(tok.lexeme),
               "character literal must contain exactly one character");
        return tok;
    }
    if (!faults.empty())
    {
        tok.kind = TokenKind::Error;
        auto &f = faults.front();
        report(DiagKind::InvalidEscapeSequence, f.loc, f.length, std::move(f.message));
        return tok;
    }

    tok.kind = TokenKind::CharLiteral;
    tok.stringValue = std::move(value);
    return tok;
}

/// @brief Lex an operator or punctuation by maximal munch.
Token Lexer::lexOperator()
{
    Token tok;
    tok.loc = currentLoc();

    if (position() + 1 < source_.size())
    {
        if (auto two = lookupOperator(source().substr(position(), 2)))
        {
            tok.kind = *two;
            tok.lexeme.push_back(get());
            tok.lexeme.push_back(get());
            return tok;
        }
    }
    if (auto one = lookupOperator(source().substr(position(), 1)))
    {
        tok.kind = *one;
        tok.lexeme.push_back(get());
        return tok;
    }
    return lexUnknown();
}

/// @brief Report an unknown character and skip to the next whitespace or
///        delimiter so one stray run produces one diagnostic.
Token Lexer::lexUnknown()
{
    Token tok;
    tok.kind = TokenKind::Error;
    tok.loc = currentLoc();
    char first = get();
    tok.lexeme.push_back(first);
    while (!eof())
    {
        char c = peek();
        if (isWhitespace(c) || isDelimiter(c) || c == '"' || c == '\'')
            break;
        tok.lexeme.push_back(get());
    }
    report(DiagKind::UnknownCharacter,
           tok.loc,
           widthOf(tok.lexeme),
           "unknown character '" + displayChar(first) + "'");
    return tok;
}

Token Lexer::next()
{
    skipWhitespaceAndComments();

    if (eof())
    {
        Token tok;
        tok.kind = TokenKind::Eof;
        tok.loc = currentLoc();
        return tok;
    }

    char c = peek();

    if (isIdentifierStart(c))
        return lexIdentifierOrKeyword();

    if (isDigit(c) || (c == '.' && isDigit(peek(1))))
        return lexNumber();

    if (c == '"')
        return lexString();

    if (c == '\'')
        return lexChar();

    return lexOperator();
}

std::vector<Token> Lexer::tokenize()
{
    std::vector<Token> tokens;
    while (true)
    {
        tokens.push_back(next());
        if (tokens.back().kind == TokenKind::Eof)
            break;
    }
    return tokens;
}

} // namespace zaban::frontends::urdu
