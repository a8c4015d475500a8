//===----------------------------------------------------------------------===//
///
/// @file
/// Implements lexical analysis for `.proto` schema text.
///
/// The lexer converts source characters into parser tokens while preserving
/// line and column positions for diagnostics.
///
//===----------------------------------------------------------------------===//

#include "wiregold/Schema/Lexer.h"

#include <cctype>
#include <utility>

namespace wiregold
{
namespace
{

int hexDigitValue(const char c)
{
    if (c >= '0' && c <= '9')
    {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f')
    {
        return 10 + (c - 'a');
    }
    if (c >= 'A' && c <= 'F')
    {
        return 10 + (c - 'A');
    }
    return -1;
}

}  // namespace

Lexer::Lexer(std::string file, std::string text)
    : file_(std::move(file))
    , text_(std::move(text))
{
}

bool Lexer::isAtEnd() const
{
    return index_ >= text_.size();
}

char Lexer::peek(std::size_t lookahead) const
{
    const std::size_t i = index_ + lookahead;
    return i < text_.size() ? text_[i] : '\0';
}

char Lexer::advance()
{
    if (isAtEnd())
    {
        return '\0';
    }
    const char c = text_[index_++];
    if (c == '\n')
    {
        ++line_;
        column_ = 1;
    }
    else
    {
        ++column_;
    }
    return c;
}

void Lexer::emit(TokenKind kind, std::string text, std::uint32_t line, std::uint32_t column)
{
    tokens_.push_back(Token{kind, std::move(text), DiagnosticSite::atSource(file_, line, column)});
}

bool Lexer::skipBlockComment()
{
    (void) advance();
    (void) advance();
    while (!isAtEnd())
    {
        if (peek() == '*' && peek(1) == '/')
        {
            (void) advance();
            (void) advance();
            return true;
        }
        (void) advance();
    }
    return false;
}

void Lexer::lexIdentifier(std::uint32_t line, std::uint32_t column)
{
    std::string text;
    while (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_')
    {
        text.push_back(advance());
    }
    emit(TokenKind::Identifier, text, line, column);
}

void Lexer::lexNumber(std::uint32_t line, std::uint32_t column)
{
    std::string text;
    bool        isReal = false;

    if (peek() == '0' && (peek(1) == 'x' || peek(1) == 'X'))
    {
        text.push_back(advance());
        text.push_back(advance());
        while (std::isxdigit(static_cast<unsigned char>(peek())))
        {
            text.push_back(advance());
        }
        emit(TokenKind::Integer, text, line, column);
        return;
    }

    while (std::isdigit(static_cast<unsigned char>(peek())))
    {
        text.push_back(advance());
    }
    if (peek() == '.' && std::isdigit(static_cast<unsigned char>(peek(1))))
    {
        isReal = true;
        text.push_back(advance());
        while (std::isdigit(static_cast<unsigned char>(peek())))
        {
            text.push_back(advance());
        }
    }
    if (peek() == 'e' || peek() == 'E')
    {
        isReal = true;
        text.push_back(advance());
        if (peek() == '+' || peek() == '-')
        {
            text.push_back(advance());
        }
        while (std::isdigit(static_cast<unsigned char>(peek())))
        {
            text.push_back(advance());
        }
    }
    emit(isReal ? TokenKind::Real : TokenKind::Integer, text, line, column);
}

void Lexer::lexString(std::uint32_t line, std::uint32_t column, char quote)
{
    std::string value;
    (void) advance();
    while (!isAtEnd() && peek() != quote && peek() != '\n')
    {
        const char c = advance();
        if (c != '\\' || isAtEnd())
        {
            value.push_back(c);
            continue;
        }
        const char esc = advance();
        switch (esc)
        {
        case 'n':
            value.push_back('\n');
            break;
        case 'r':
            value.push_back('\r');
            break;
        case 't':
            value.push_back('\t');
            break;
        case 'x':
        case 'X': {
            int digits = 0;
            int code   = 0;
            while (digits < 2 && hexDigitValue(peek()) >= 0)
            {
                code = code * 16 + hexDigitValue(advance());
                ++digits;
            }
            value.push_back(static_cast<char>(code));
            break;
        }
        default:
            if (esc >= '0' && esc <= '7')
            {
                int code   = esc - '0';
                int digits = 1;
                while (digits < 3 && peek() >= '0' && peek() <= '7')
                {
                    code = code * 8 + (advance() - '0');
                    ++digits;
                }
                value.push_back(static_cast<char>(code));
            }
            else
            {
                value.push_back(esc);
            }
            break;
        }
    }
    if (peek() != quote)
    {
        emit(TokenKind::Invalid, "unterminated string literal", line, column);
        return;
    }
    (void) advance();
    emit(TokenKind::String, value, line, column);
}

std::vector<Token> Lexer::lex()
{
    while (!isAtEnd())
    {
        const std::uint32_t tokLine = line_;
        const std::uint32_t tokCol  = column_;
        const char          c       = peek();

        if (std::isspace(static_cast<unsigned char>(c)))
        {
            (void) advance();
            continue;
        }
        if (c == '/' && peek(1) == '/')
        {
            while (!isAtEnd() && peek() != '\n')
            {
                (void) advance();
            }
            continue;
        }
        if (c == '/' && peek(1) == '*')
        {
            if (!skipBlockComment())
            {
                emit(TokenKind::Invalid, "unterminated block comment", tokLine, tokCol);
            }
            continue;
        }
        if (std::isalpha(static_cast<unsigned char>(c)) || c == '_')
        {
            lexIdentifier(tokLine, tokCol);
            continue;
        }
        if (std::isdigit(static_cast<unsigned char>(c)))
        {
            lexNumber(tokLine, tokCol);
            continue;
        }
        if (c == '\'' || c == '"')
        {
            lexString(tokLine, tokCol, c);
            continue;
        }

        const TokenKind kind = [&]() {
            switch (c)
            {
            case '{':
                return TokenKind::LBrace;
            case '}':
                return TokenKind::RBrace;
            case '(':
                return TokenKind::LParen;
            case ')':
                return TokenKind::RParen;
            case '[':
                return TokenKind::LBracket;
            case ']':
                return TokenKind::RBracket;
            case '<':
                return TokenKind::Less;
            case '>':
                return TokenKind::Greater;
            case ';':
                return TokenKind::Semicolon;
            case '=':
                return TokenKind::Equal;
            case ',':
                return TokenKind::Comma;
            case '.':
                return TokenKind::Dot;
            case '-':
                return TokenKind::Minus;
            case '+':
                return TokenKind::Plus;
            default:
                return TokenKind::Invalid;
            }
        }();
        emit(kind, std::string(1, advance()), tokLine, tokCol);
    }

    emit(TokenKind::Eof, "", line_, column_);
    return tokens_;
}

}  // namespace wiregold
