//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Recursive-descent parser for the supported `.proto` subset.
///
//===----------------------------------------------------------------------===//
#ifndef WIREGOLD_SCHEMA_SCHEMAPARSER_H
#define WIREGOLD_SCHEMA_SCHEMAPARSER_H

#include "wiregold/Schema/Lexer.h"
#include "wiregold/Schema/SchemaModel.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace wiregold
{

class DiagnosticEngine;

/// @brief Parses a token stream into an unresolved-then-resolved @ref SchemaFile.
///
/// @details Syntax errors are reported to the diagnostic engine and parsing
/// resumes at the next statement; the result is an error when any were
/// reported. Type references are resolved after the whole file is parsed.
class SchemaParser final
{
public:
    /// @brief Constructs a parser for one schema file.
    /// @param[in] filePath Source file path for diagnostics.
    /// @param[in] tokens Token stream to parse.
    /// @param[in,out] diagnostics Diagnostic sink for parse errors.
    SchemaParser(std::string filePath, std::vector<Token> tokens, DiagnosticEngine& diagnostics);

    /// @brief Parses and resolves the whole file.
    /// @return Resolved schema, or an error (`UnsupportedFieldKind` for
    ///         unresolvable field types, a plain error for syntax failures).
    llvm::Expected<SchemaFile> parseFile();

private:
    /// @brief Field data kept until type resolution.
    struct PendingField final
    {
        std::size_t                messageIndex{0};
        std::size_t                fieldIndex{0};
        std::string                rawType;
        std::string                scope;
        bool                       explicitLabel{false};
        std::optional<bool>        packedOption;
        std::optional<std::string> mapKeyType;
    };

    const Token& current() const;

    const Token& previous() const;

    bool isAtEnd() const;

    bool check(TokenKind kind) const;

    bool checkWord(llvm::StringRef word) const;

    bool match(TokenKind kind);

    bool matchWord(llvm::StringRef word);

    const Token& advance();

    bool expect(TokenKind kind, const std::string& message);

    void fail(const DiagnosticSite& location, std::string message);

    /// @brief Error recovery that advances past the next `;` or to a `}`.
    void syncToStatementEnd();

    /// @brief Skips a balanced `{ ... }` block starting at the current `{`.
    void skipBlock();

    bool parseSyntax();

    bool parsePackage();

    bool parseImport();

    bool parseOption();

    bool parseReservedOrExtensions();

    std::optional<std::string> parseFullIdent();

    std::optional<std::string> parseTypeName();

    std::optional<std::string> parseConstant();

    std::optional<std::int64_t> parseSignedInteger();

    bool parseFieldOptions(std::optional<bool>& packedOption);

    bool parseMessage(const std::string& scope);

    bool parseMessageBody(std::size_t messageIndex, const std::string& scope);

    bool parseField(std::size_t messageIndex, const std::string& scope, const std::string& oneofName);

    bool parseMapField(std::size_t messageIndex, const std::string& scope);

    bool parseOneof(std::size_t messageIndex, const std::string& scope);

    bool parseEnum(const std::string& scope);

    /// @brief Resolves all pending field types and derives presence and packing.
    llvm::Error resolveFields();

    std::string qualify(const std::string& scope, const std::string& name) const;

    std::string filePath_;

    std::vector<Token> tokens_;

    std::size_t cursor_{0};

    DiagnosticEngine& diagnostics_;

    bool failed_{false};

    SchemaFile file_;

    std::vector<PendingField> pending_;
};

/// @brief Lexes, parses and resolves schema text.
/// @param[in] filePath Path used in diagnostics and recorded in the result.
/// @param[in] text Schema source text.
/// @param[in,out] diagnostics Diagnostic sink.
/// @return Resolved schema or an error.
llvm::Expected<SchemaFile> parseSchemaText(const std::string& filePath,
                                           const std::string& text,
                                           DiagnosticEngine&  diagnostics);

/// @brief Reads and parses `<schemaDir>/<fileName>`.
/// @param[in] schemaDir Directory the schema lives in (oracle `--proto_path`).
/// @param[in] fileName File name relative to `schemaDir`.
/// @param[in,out] diagnostics Diagnostic sink.
/// @return Resolved schema, or `SchemaNotFound` when the file does not exist.
llvm::Expected<SchemaFile> loadSchemaFile(llvm::StringRef    schemaDir,
                                          llvm::StringRef    fileName,
                                          DiagnosticEngine&  diagnostics);

}  // namespace wiregold

#endif  // WIREGOLD_SCHEMA_SCHEMAPARSER_H
