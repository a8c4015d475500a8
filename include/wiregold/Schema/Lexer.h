//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Token and lexer declarations for transforming `.proto` text into token streams.
///
//===----------------------------------------------------------------------===//
#ifndef WIREGOLD_SCHEMA_LEXER_H
#define WIREGOLD_SCHEMA_LEXER_H

#include "wiregold/Support/Diagnostics.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace wiregold
{

/// @brief Token categories recognized by the schema lexer.
enum class TokenKind
{

    /// @brief End-of-file sentinel.
    Eof,

    /// @brief Character sequence the lexer could not classify.
    Invalid,

    /// @brief Identifier or keyword token.
    Identifier,

    /// @brief Integer literal token (decimal, hex or octal).
    Integer,

    /// @brief Real literal token.
    Real,

    /// @brief String literal token with escapes resolved.
    String,

    /// @brief `{` token.
    LBrace,

    /// @brief `}` token.
    RBrace,

    /// @brief `(` token.
    LParen,

    /// @brief `)` token.
    RParen,

    /// @brief `[` token.
    LBracket,

    /// @brief `]` token.
    RBracket,

    /// @brief `<` token.
    Less,

    /// @brief `>` token.
    Greater,

    /// @brief `;` token.
    Semicolon,

    /// @brief `=` token.
    Equal,

    /// @brief `,` token.
    Comma,

    /// @brief `.` token.
    Dot,

    /// @brief `-` token.
    Minus,

    /// @brief `+` token.
    Plus,
};

/// @brief Single lexical token emitted by @ref Lexer.
struct Token
{
    /// @brief Token category.
    TokenKind kind{TokenKind::Eof};

    /// @brief Token spelling, or the decoded value for strings.
    std::string text;

    /// @brief Start location of the token.
    DiagnosticSite location;
};

/// @brief Converts schema source text into a token stream.
///
/// @details Line comments (`//`) and block comments are skipped. An
/// unterminated block comment or string yields an @ref TokenKind::Invalid
/// token at its start.
class Lexer final
{
public:
    /// @brief Constructs a lexer for one source file.
    /// @param[in] file Logical file name used in token locations.
    /// @param[in] text Full source text to tokenize.
    Lexer(std::string file, std::string text);

    /// @brief Tokenizes the input source.
    /// @return Token sequence terminated by @ref TokenKind::Eof.
    [[nodiscard]] std::vector<Token> lex();

private:
    [[nodiscard]] bool isAtEnd() const;

    [[nodiscard]] char peek(std::size_t lookahead = 0) const;

    char advance();

    void emit(TokenKind kind, std::string text, std::uint32_t line, std::uint32_t column);

    /// @brief Skips a block comment; returns false when it is unterminated.
    bool skipBlockComment();

    void lexIdentifier(std::uint32_t line, std::uint32_t column);

    void lexNumber(std::uint32_t line, std::uint32_t column);

    void lexString(std::uint32_t line, std::uint32_t column, char quote);

    std::string file_;

    std::string text_;

    std::size_t index_{0};

    std::uint32_t line_{1};

    std::uint32_t column_{1};

    std::vector<Token> tokens_;
};

}  // namespace wiregold

#endif  // WIREGOLD_SCHEMA_LEXER_H
