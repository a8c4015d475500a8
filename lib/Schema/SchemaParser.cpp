//===----------------------------------------------------------------------===//
///
/// @file
/// Implements recursive-descent parsing for `.proto` schema files.
///
/// The parser builds a flat list of messages and enums with fully-qualified
/// names, synthesizes map-entry messages, and resolves field type references
/// after the whole file has been read.
///
//===----------------------------------------------------------------------===//

#include "wiregold/Schema/SchemaParser.h"

#include "wiregold/Support/Diagnostics.h"
#include "wiregold/Support/GenerationError.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/Path.h"

#include <cctype>
#include <limits>
#include <utility>

namespace wiregold
{
namespace
{

constexpr std::int64_t kMaxFieldNumber = 536870911;

std::string mapEntryName(llvm::StringRef fieldName)
{
    std::string out;
    bool        upperNext = true;
    for (const char c : fieldName)
    {
        if (c == '_')
        {
            upperNext = true;
            continue;
        }
        out.push_back(upperNext ? static_cast<char>(std::toupper(static_cast<unsigned char>(c))) : c);
        upperNext = false;
    }
    return out + "Entry";
}

bool isValidMapKey(const FieldSpec& key)
{
    if (key.isMessage())
    {
        return false;
    }
    switch (key.scalarKind)
    {
    case ScalarKind::Float:
    case ScalarKind::Double:
    case ScalarKind::Bytes:
    case ScalarKind::Enum:
        return false;
    default:
        return true;
    }
}

}  // namespace

SchemaParser::SchemaParser(std::string filePath, std::vector<Token> tokens, DiagnosticEngine& diagnostics)
    : filePath_(std::move(filePath))
    , tokens_(std::move(tokens))
    , diagnostics_(diagnostics)
{
    if (tokens_.empty() || tokens_.back().kind != TokenKind::Eof)
    {
        tokens_.push_back(Token{TokenKind::Eof, "", DiagnosticSite::atSource(filePath_, 0, 0)});
    }
}

const Token& SchemaParser::current() const
{
    return tokens_[cursor_];
}

const Token& SchemaParser::previous() const
{
    return tokens_[cursor_ - 1];
}

bool SchemaParser::isAtEnd() const
{
    return current().kind == TokenKind::Eof;
}

bool SchemaParser::check(TokenKind kind) const
{
    return current().kind == kind;
}

bool SchemaParser::checkWord(llvm::StringRef word) const
{
    return check(TokenKind::Identifier) && current().text == word;
}

bool SchemaParser::match(TokenKind kind)
{
    if (!check(kind))
    {
        return false;
    }
    (void) advance();
    return true;
}

bool SchemaParser::matchWord(llvm::StringRef word)
{
    if (!checkWord(word))
    {
        return false;
    }
    (void) advance();
    return true;
}

const Token& SchemaParser::advance()
{
    if (!isAtEnd())
    {
        ++cursor_;
    }
    return previous();
}

bool SchemaParser::expect(TokenKind kind, const std::string& message)
{
    if (check(kind))
    {
        (void) advance();
        return true;
    }
    fail(current().location, message);
    return false;
}

void SchemaParser::fail(const DiagnosticSite& location, std::string message)
{
    failed_ = true;
    diagnostics_.error(location, std::move(message));
}

void SchemaParser::syncToStatementEnd()
{
    const std::size_t start = cursor_;
    while (!isAtEnd())
    {
        if (match(TokenKind::Semicolon))
        {
            return;
        }
        if (check(TokenKind::RBrace))
        {
            break;
        }
        (void) advance();
    }
    if (cursor_ == start)
    {
        (void) advance();
    }
}

void SchemaParser::skipBlock()
{
    if (!match(TokenKind::LBrace))
    {
        return;
    }
    int depth = 1;
    while (!isAtEnd() && depth > 0)
    {
        if (check(TokenKind::LBrace))
        {
            ++depth;
        }
        else if (check(TokenKind::RBrace))
        {
            --depth;
        }
        (void) advance();
    }
}

std::string SchemaParser::qualify(const std::string& scope, const std::string& name) const
{
    return scope.empty() ? name : scope + "." + name;
}

std::optional<std::string> SchemaParser::parseFullIdent()
{
    if (!expect(TokenKind::Identifier, "expected identifier"))
    {
        return std::nullopt;
    }
    std::string out = previous().text;
    while (match(TokenKind::Dot))
    {
        if (!expect(TokenKind::Identifier, "expected identifier after '.'"))
        {
            return std::nullopt;
        }
        out += "." + previous().text;
    }
    return out;
}

std::optional<std::string> SchemaParser::parseTypeName()
{
    const bool absolute = match(TokenKind::Dot);
    auto       ident    = parseFullIdent();
    if (!ident)
    {
        return std::nullopt;
    }
    return absolute ? "." + *ident : *ident;
}

std::optional<std::string> SchemaParser::parseConstant()
{
    if (match(TokenKind::String) || match(TokenKind::Identifier))
    {
        return previous().text;
    }
    std::string sign;
    if (match(TokenKind::Minus))
    {
        sign = "-";
    }
    else
    {
        (void) match(TokenKind::Plus);
    }
    if (match(TokenKind::Integer) || match(TokenKind::Real) || match(TokenKind::Identifier))
    {
        return sign + previous().text;
    }
    fail(current().location, "expected constant value");
    return std::nullopt;
}

std::optional<std::int64_t> SchemaParser::parseSignedInteger()
{
    const bool negative = match(TokenKind::Minus);
    if (!negative)
    {
        (void) match(TokenKind::Plus);
    }
    if (!expect(TokenKind::Integer, "expected integer literal"))
    {
        return std::nullopt;
    }
    const Token&  token = previous();
    std::uint64_t magnitude{0};
    if (llvm::StringRef(token.text).getAsInteger(0, magnitude) ||
        magnitude > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()) + (negative ? 1U : 0U))
    {
        fail(token.location, "integer literal '" + token.text + "' is out of range");
        return std::nullopt;
    }
    if (negative)
    {
        return static_cast<std::int64_t>(0U - magnitude);
    }
    return static_cast<std::int64_t>(magnitude);
}

bool SchemaParser::parseSyntax()
{
    (void) advance();
    if (!expect(TokenKind::Equal, "expected '=' after 'syntax'") ||
        !expect(TokenKind::String, "expected quoted syntax name"))
    {
        return false;
    }
    const Token& token = previous();
    if (token.text != "proto2" && token.text != "proto3")
    {
        fail(token.location, "unsupported syntax '" + token.text + "'");
        return false;
    }
    file_.syntax = token.text;
    return expect(TokenKind::Semicolon, "expected ';' after syntax declaration");
}

bool SchemaParser::parsePackage()
{
    (void) advance();
    auto name = parseFullIdent();
    if (!name)
    {
        return false;
    }
    file_.package = *name;
    return expect(TokenKind::Semicolon, "expected ';' after package name");
}

bool SchemaParser::parseImport()
{
    (void) advance();
    if (!matchWord("public"))
    {
        (void) matchWord("weak");
    }
    if (!expect(TokenKind::String, "expected quoted import path"))
    {
        return false;
    }
    file_.imports.push_back(previous().text);
    return expect(TokenKind::Semicolon, "expected ';' after import");
}

bool SchemaParser::parseOption()
{
    (void) advance();
    if (match(TokenKind::LParen))
    {
        if (!parseTypeName() || !expect(TokenKind::RParen, "expected ')' after extension option name"))
        {
            return false;
        }
        while (match(TokenKind::Dot))
        {
            if (!expect(TokenKind::Identifier, "expected option name component"))
            {
                return false;
            }
        }
    }
    else if (!parseFullIdent())
    {
        return false;
    }
    if (!expect(TokenKind::Equal, "expected '=' in option") || !parseConstant())
    {
        return false;
    }
    return expect(TokenKind::Semicolon, "expected ';' after option");
}

bool SchemaParser::parseReservedOrExtensions()
{
    (void) advance();
    while (!isAtEnd() && !check(TokenKind::Semicolon) && !check(TokenKind::RBrace))
    {
        (void) advance();
    }
    return expect(TokenKind::Semicolon, "expected ';' after reserved range");
}

bool SchemaParser::parseFieldOptions(std::optional<bool>& packedOption)
{
    if (!match(TokenKind::LBracket))
    {
        return true;
    }
    do
    {
        std::string name;
        if (match(TokenKind::LParen))
        {
            if (!parseTypeName() || !expect(TokenKind::RParen, "expected ')' after extension option name"))
            {
                return false;
            }
        }
        else
        {
            auto ident = parseFullIdent();
            if (!ident)
            {
                return false;
            }
            name = *ident;
        }
        if (!expect(TokenKind::Equal, "expected '=' in field option"))
        {
            return false;
        }
        const DiagnosticSite valueLocation = current().location;
        auto                 value         = parseConstant();
        if (!value)
        {
            return false;
        }
        if (name == "packed")
        {
            if (*value != "true" && *value != "false")
            {
                fail(valueLocation, "'packed' option expects true or false");
                return false;
            }
            packedOption = *value == "true";
        }
    } while (match(TokenKind::Comma));
    return expect(TokenKind::RBracket, "expected ']' after field options");
}

bool SchemaParser::parseMessage(const std::string& scope)
{
    (void) advance();
    if (!expect(TokenKind::Identifier, "expected message name"))
    {
        return false;
    }
    const Token& nameToken = previous();

    MessageSpec message;
    message.fullName  = qualify(scope, nameToken.text);
    message.localName = file_.package.empty() ? message.fullName : message.fullName.substr(file_.package.size() + 1);
    message.location  = nameToken.location;
    if (file_.findMessage(message.fullName) != nullptr || file_.findEnum(message.fullName) != nullptr)
    {
        fail(nameToken.location, "duplicate type name '" + message.fullName + "'");
        return false;
    }

    const std::string fullName = message.fullName;
    file_.messages.push_back(std::move(message));
    const std::size_t index = file_.messages.size() - 1;

    if (!expect(TokenKind::LBrace, "expected '{' after message name"))
    {
        return false;
    }
    return parseMessageBody(index, fullName);
}

bool SchemaParser::parseMessageBody(const std::size_t messageIndex, const std::string& scope)
{
    while (!isAtEnd() && !check(TokenKind::RBrace))
    {
        if (match(TokenKind::Semicolon))
        {
            continue;
        }
        bool ok = true;
        if (check(TokenKind::Invalid))
        {
            fail(current().location, current().text);
            ok = false;
        }
        else if (checkWord("message"))
        {
            ok = parseMessage(scope);
        }
        else if (checkWord("enum"))
        {
            ok = parseEnum(scope);
        }
        else if (checkWord("oneof"))
        {
            ok = parseOneof(messageIndex, scope);
        }
        else if (checkWord("map") && tokens_[cursor_ + 1].kind == TokenKind::Less)
        {
            ok = parseMapField(messageIndex, scope);
        }
        else if (checkWord("option"))
        {
            ok = parseOption();
        }
        else if (checkWord("reserved") || checkWord("extensions"))
        {
            ok = parseReservedOrExtensions();
        }
        else if (checkWord("extend"))
        {
            diagnostics_.warning(current().location, "'extend' blocks are not used by the generator and were skipped");
            while (!isAtEnd() && !check(TokenKind::LBrace))
            {
                (void) advance();
            }
            skipBlock();
        }
        else
        {
            ok = parseField(messageIndex, scope, "");
        }
        if (!ok)
        {
            syncToStatementEnd();
        }
    }
    return expect(TokenKind::RBrace, "expected '}' to close message");
}

bool SchemaParser::parseField(const std::size_t messageIndex, const std::string& scope, const std::string& oneofName)
{
    bool repeated      = false;
    bool explicitLabel = false;
    if (oneofName.empty())
    {
        if (matchWord("repeated"))
        {
            repeated = true;
        }
        else if (matchWord("optional") || matchWord("required"))
        {
            explicitLabel = true;
        }
    }

    const DiagnosticSite typeLocation = current().location;
    auto                 rawType      = parseTypeName();
    if (!rawType)
    {
        return false;
    }
    if (!expect(TokenKind::Identifier, "expected field name"))
    {
        return false;
    }
    const Token& nameToken = previous();
    if (!expect(TokenKind::Equal, "expected '=' after field name"))
    {
        return false;
    }
    const DiagnosticSite numberLocation = current().location;
    auto                 number         = parseSignedInteger();
    if (!number)
    {
        return false;
    }
    if (*number < 1 || *number > kMaxFieldNumber)
    {
        fail(numberLocation, "field number " + std::to_string(*number) + " is out of range");
        return false;
    }

    std::optional<bool> packedOption;
    if (!parseFieldOptions(packedOption))
    {
        return false;
    }
    if (*rawType == "group" && check(TokenKind::LBrace))
    {
        skipBlock();
    }
    else if (!expect(TokenKind::Semicolon, "expected ';' after field declaration"))
    {
        return false;
    }

    MessageSpec& message = file_.messages[messageIndex];
    if (message.findByName(nameToken.text) != nullptr ||
        message.findByNumber(static_cast<std::uint32_t>(*number)) != nullptr)
    {
        fail(nameToken.location,
             "duplicate field '" + nameToken.text + "' or number " + std::to_string(*number) + " in " +
                 message.fullName);
        return false;
    }

    FieldSpec field;
    field.name      = nameToken.text;
    field.number    = static_cast<std::uint32_t>(*number);
    field.repeated  = repeated;
    field.oneofName = oneofName;
    field.location  = typeLocation;
    message.fields.push_back(std::move(field));

    PendingField pending;
    pending.messageIndex  = messageIndex;
    pending.fieldIndex    = message.fields.size() - 1;
    pending.rawType       = *rawType;
    pending.scope         = scope;
    pending.explicitLabel = explicitLabel;
    pending.packedOption  = packedOption;
    pending_.push_back(std::move(pending));
    return true;
}

bool SchemaParser::parseMapField(const std::size_t messageIndex, const std::string& scope)
{
    const DiagnosticSite location = current().location;
    (void) advance();
    (void) advance();
    auto keyType = parseTypeName();
    if (!keyType || !expect(TokenKind::Comma, "expected ',' between map key and value types"))
    {
        return false;
    }
    auto valueType = parseTypeName();
    if (!valueType || !expect(TokenKind::Greater, "expected '>' after map value type"))
    {
        return false;
    }
    if (!expect(TokenKind::Identifier, "expected map field name"))
    {
        return false;
    }
    const std::string fieldName = previous().text;
    if (!expect(TokenKind::Equal, "expected '=' after map field name"))
    {
        return false;
    }
    const DiagnosticSite numberLocation = current().location;
    auto                 number         = parseSignedInteger();
    if (!number)
    {
        return false;
    }
    if (*number < 1 || *number > kMaxFieldNumber)
    {
        fail(numberLocation, "field number " + std::to_string(*number) + " is out of range");
        return false;
    }
    std::optional<bool> ignoredPacked;
    if (!parseFieldOptions(ignoredPacked) || !expect(TokenKind::Semicolon, "expected ';' after map field"))
    {
        return false;
    }

    MessageSpec entry;
    entry.fullName  = qualify(scope, mapEntryName(fieldName));
    entry.localName = file_.package.empty() ? entry.fullName : entry.fullName.substr(file_.package.size() + 1);
    entry.mapEntry  = true;
    entry.location  = location;
    for (const std::uint32_t entryNumber : {1U, 2U})
    {
        FieldSpec entryField;
        entryField.name     = entryNumber == 1U ? "key" : "value";
        entryField.number   = entryNumber;
        entryField.presence = FieldPresence::Always;
        entryField.location = location;
        entry.fields.push_back(std::move(entryField));
    }
    if (file_.findMessage(entry.fullName) != nullptr)
    {
        fail(location, "map entry type '" + entry.fullName + "' collides with a declared type");
        return false;
    }

    MessageSpec& message = file_.messages[messageIndex];
    if (message.findByName(fieldName) != nullptr ||
        message.findByNumber(static_cast<std::uint32_t>(*number)) != nullptr)
    {
        fail(location, "duplicate field '" + fieldName + "' or number " + std::to_string(*number));
        return false;
    }
    FieldSpec field;
    field.name     = fieldName;
    field.number   = static_cast<std::uint32_t>(*number);
    field.category = FieldCategory::Message;
    field.typeName = entry.fullName;
    field.repeated = true;
    field.location = location;
    message.fields.push_back(std::move(field));

    const std::string entryScope = entry.fullName;
    file_.messages.push_back(std::move(entry));
    const std::size_t entryIndex = file_.messages.size() - 1;
    for (std::size_t i = 0; i < 2; ++i)
    {
        PendingField pending;
        pending.messageIndex = entryIndex;
        pending.fieldIndex   = i;
        pending.rawType      = i == 0 ? *keyType : *valueType;
        pending.scope        = entryScope;
        if (i == 0)
        {
            pending.mapKeyType = *keyType;
        }
        pending_.push_back(std::move(pending));
    }
    return true;
}

bool SchemaParser::parseOneof(const std::size_t messageIndex, const std::string& scope)
{
    (void) advance();
    if (!expect(TokenKind::Identifier, "expected oneof name"))
    {
        return false;
    }
    const std::string name = previous().text;
    if (!expect(TokenKind::LBrace, "expected '{' after oneof name"))
    {
        return false;
    }
    while (!isAtEnd() && !check(TokenKind::RBrace))
    {
        if (match(TokenKind::Semicolon))
        {
            continue;
        }
        const bool ok = checkWord("option") ? parseOption() : parseField(messageIndex, scope, name);
        if (!ok)
        {
            syncToStatementEnd();
        }
    }
    return expect(TokenKind::RBrace, "expected '}' to close oneof");
}

bool SchemaParser::parseEnum(const std::string& scope)
{
    (void) advance();
    if (!expect(TokenKind::Identifier, "expected enum name"))
    {
        return false;
    }
    const Token& nameToken = previous();
    EnumSpec     spec;
    spec.fullName = qualify(scope, nameToken.text);
    if (file_.findMessage(spec.fullName) != nullptr || file_.findEnum(spec.fullName) != nullptr)
    {
        fail(nameToken.location, "duplicate type name '" + spec.fullName + "'");
        return false;
    }
    if (!expect(TokenKind::LBrace, "expected '{' after enum name"))
    {
        return false;
    }

    while (!isAtEnd() && !check(TokenKind::RBrace))
    {
        if (match(TokenKind::Semicolon))
        {
            continue;
        }
        bool ok = true;
        if (checkWord("option"))
        {
            ok = parseOption();
        }
        else if (checkWord("reserved"))
        {
            ok = parseReservedOrExtensions();
        }
        else if (expect(TokenKind::Identifier, "expected enum constant name"))
        {
            const Token& constant = previous();
            ok                    = expect(TokenKind::Equal, "expected '=' after enum constant");
            if (ok)
            {
                const DiagnosticSite valueLocation = current().location;
                auto                 value         = parseSignedInteger();
                std::optional<bool>  ignoredPacked;
                ok = value.has_value() && parseFieldOptions(ignoredPacked) &&
                     expect(TokenKind::Semicolon, "expected ';' after enum constant");
                if (ok && (*value < std::numeric_limits<std::int32_t>::min() ||
                           *value > std::numeric_limits<std::int32_t>::max()))
                {
                    fail(valueLocation, "enum value of '" + constant.text + "' does not fit in int32");
                    ok = false;
                }
                if (ok)
                {
                    spec.values.push_back(EnumValueSpec{constant.text, static_cast<std::int32_t>(*value)});
                }
            }
        }
        else
        {
            ok = false;
        }
        if (!ok)
        {
            syncToStatementEnd();
        }
    }
    file_.enums.push_back(std::move(spec));
    return expect(TokenKind::RBrace, "expected '}' to close enum");
}

llvm::Error SchemaParser::resolveFields()
{
    for (const PendingField& pending : pending_)
    {
        MessageSpec& owner = file_.messages[pending.messageIndex];
        FieldSpec&   field = owner.fields[pending.fieldIndex];
        const std::string subject = owner.fullName + "." + field.name;

        if (const auto kind = scalarKindFromSchemaName(pending.rawType))
        {
            field.category   = FieldCategory::Scalar;
            field.scalarKind = *kind;
        }
        else
        {
            const MessageSpec* message = nullptr;
            const EnumSpec*    enumSpec = nullptr;
            if ((!pending.rawType.empty() && pending.rawType.front() == '.') || pending.rawType == "group")
            {
                message  = file_.findMessage(pending.rawType);
                enumSpec = file_.findEnum(pending.rawType);
            }
            else
            {
                std::string scope = pending.scope;
                while (message == nullptr && enumSpec == nullptr)
                {
                    const std::string candidate = qualify(scope, pending.rawType);
                    message                     = file_.findMessage(candidate);
                    enumSpec                    = file_.findEnum(candidate);
                    if (scope.empty())
                    {
                        break;
                    }
                    const std::size_t dot = scope.rfind('.');
                    scope                 = dot == std::string::npos ? std::string() : scope.substr(0, dot);
                }
            }

            if (message != nullptr && pending.rawType != "group")
            {
                field.category = FieldCategory::Message;
                field.typeName = message->fullName;
            }
            else if (enumSpec != nullptr)
            {
                field.category   = FieldCategory::Scalar;
                field.scalarKind = ScalarKind::Enum;
                field.typeName   = enumSpec->fullName;
            }
            else
            {
                return makeGenerationError(GenerationErrorKind::UnsupportedFieldKind,
                                           "schema-resolve",
                                           subject,
                                           "field type '" + pending.rawType + "' at " + field.location.str() +
                                               " is not a supported scalar, enum or message declared in this file");
            }
        }

        if (pending.mapKeyType && !isValidMapKey(field))
        {
            return makeGenerationError(GenerationErrorKind::UnsupportedFieldKind,
                                       "schema-resolve",
                                       subject,
                                       "map key type '" + pending.rawType + "' is not an integral or string type");
        }

        if (owner.mapEntry)
        {
            field.presence = FieldPresence::Always;
        }
        else if (!field.oneofName.empty() || field.isMessage())
        {
            field.presence = FieldPresence::Explicit;
        }
        else if (file_.syntax == "proto3")
        {
            field.presence = pending.explicitLabel ? FieldPresence::Explicit : FieldPresence::Implicit;
        }
        else
        {
            field.presence = FieldPresence::Explicit;
        }

        if (field.repeated)
        {
            const bool packable = !field.isMessage() && scalarKindInfo(field.scalarKind).packable;
            if (pending.packedOption.value_or(false) && !packable)
            {
                return makeGenerationError(GenerationErrorKind::UnsupportedFieldKind,
                                           "schema-resolve",
                                           subject,
                                           "[packed = true] requires a repeated numeric field");
            }
            field.packed = packable && pending.packedOption.value_or(file_.syntax == "proto3");
        }
    }
    return llvm::Error::success();
}

llvm::Expected<SchemaFile> SchemaParser::parseFile()
{
    file_.path = filePath_;
    while (!isAtEnd())
    {
        if (match(TokenKind::Semicolon))
        {
            continue;
        }
        bool ok = true;
        if (check(TokenKind::Invalid))
        {
            fail(current().location, current().text);
            ok = false;
        }
        else if (checkWord("syntax"))
        {
            ok = parseSyntax();
        }
        else if (checkWord("package"))
        {
            ok = parsePackage();
        }
        else if (checkWord("import"))
        {
            ok = parseImport();
        }
        else if (checkWord("option"))
        {
            ok = parseOption();
        }
        else if (checkWord("message"))
        {
            ok = parseMessage(file_.package);
        }
        else if (checkWord("enum"))
        {
            ok = parseEnum(file_.package);
        }
        else if (checkWord("service") || checkWord("extend"))
        {
            diagnostics_.warning(current().location,
                                 "'" + current().text + "' blocks are not used by the generator and were skipped");
            while (!isAtEnd() && !check(TokenKind::LBrace))
            {
                (void) advance();
            }
            skipBlock();
        }
        else
        {
            fail(current().location, "unexpected '" + current().text + "' at file scope");
            ok = false;
        }
        if (!ok)
        {
            syncToStatementEnd();
        }
    }

    if (failed_)
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "failed to parse schema %s",
                                       filePath_.c_str());
    }
    if (llvm::Error err = resolveFields())
    {
        return std::move(err);
    }
    return std::move(file_);
}

llvm::Expected<SchemaFile> parseSchemaText(const std::string& filePath,
                                           const std::string& text,
                                           DiagnosticEngine&  diagnostics)
{
    Lexer        lexer(filePath, text);
    SchemaParser parser(filePath, lexer.lex(), diagnostics);
    return parser.parseFile();
}

llvm::Expected<SchemaFile> loadSchemaFile(llvm::StringRef   schemaDir,
                                          llvm::StringRef   fileName,
                                          DiagnosticEngine& diagnostics)
{
    llvm::SmallString<256> path(schemaDir);
    llvm::sys::path::append(path, fileName);
    if (!llvm::sys::fs::is_regular_file(path))
    {
        return makeGenerationError(GenerationErrorKind::SchemaNotFound,
                                   "schema-load",
                                   fileName.str(),
                                   "no schema file at " + std::string(path.str()));
    }

    auto buffer = llvm::MemoryBuffer::getFile(path);
    if (!buffer)
    {
        return makeGenerationError(GenerationErrorKind::SchemaNotFound,
                                   "schema-load",
                                   fileName.str(),
                                   "cannot read " + std::string(path.str()) + ": " + buffer.getError().message());
    }

    auto schema = parseSchemaText(std::string(path.str()), (*buffer)->getBuffer().str(), diagnostics);
    if (!schema)
    {
        return schema.takeError();
    }
    schema->fileName = fileName.str();
    return schema;
}

}  // namespace wiregold
