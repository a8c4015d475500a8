//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Composite-tier artifact: value structs, schema-driven decode/encode
/// helpers, a designated-initializer case table and per-field assertions.
///
//===----------------------------------------------------------------------===//

#include "wiregold/Domain/LiteralRender.h"
#include "wiregold/Emit/ArtifactEmitter.h"
#include "wiregold/Emit/EmitCommon.h"
#include "wiregold/Support/GenerationError.h"

#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/StringExtras.h"
#include "llvm/ADT/bit.h"
#include "llvm/Support/Base64.h"

#include <algorithm>
#include <sstream>

namespace wiregold
{

namespace
{

constexpr const char* kOperation = "artifact-emit";

bool isCppKeyword(llvm::StringRef name)
{
    static constexpr const char* kKeywords[] = {
        "alignas",  "alignof",  "and",       "asm",      "auto",     "bool",     "break",    "case",
        "catch",    "char",     "class",     "const",    "constexpr", "continue", "default",  "delete",
        "do",       "double",   "else",      "enum",     "explicit", "export",   "extern",   "false",
        "float",    "for",      "friend",    "goto",     "if",       "inline",   "int",      "long",
        "mutable",  "namespace", "new",      "noexcept", "not",      "nullptr",  "operator", "or",
        "private",  "protected", "public",   "register", "return",   "short",    "signed",   "sizeof",
        "static",   "struct",   "switch",    "template", "this",     "throw",    "true",     "try",
        "typedef",  "typename", "union",     "unsigned", "using",    "virtual",  "void",     "volatile",
        "while",
    };
    return llvm::is_contained(kKeywords, name);
}

std::string structName(const MessageSpec& message)
{
    std::string out;
    for (const char c : message.localName)
    {
        if (c != '.')
        {
            out.push_back(c);
        }
    }
    return out;
}

std::string memberName(const FieldSpec& field)
{
    return isCppKeyword(field.name) ? field.name + "_" : field.name;
}

std::string joinParts(const std::vector<std::string>& parts)
{
    return llvm::join(parts.begin(), parts.end(), ", ");
}

/// Renders one message into an ostream. Every referenced message has already
/// been resolved by @ref collectMessages.
class MessageRenderer final
{
public:
    MessageRenderer(const CodecContract& contract, const SchemaFile& schema)
        : contract_(contract)
        , schema_(schema)
    {
    }

    llvm::Error collectMessages(const MessageSpec& message, std::vector<const MessageSpec*>& visiting)
    {
        if (llvm::is_contained(order_, &message))
        {
            return llvm::Error::success();
        }
        if (llvm::is_contained(visiting, &message))
        {
            return makeGenerationError(GenerationErrorKind::UnsupportedFieldKind,
                                       kOperation,
                                       message.fullName,
                                       "recursive message types have no value-struct rendering");
        }
        visiting.push_back(&message);
        for (const FieldSpec& field : message.fields)
        {
            if (!field.isMessage())
            {
                continue;
            }
            auto child = schema_.requireMessage(field.typeName);
            if (!child)
            {
                return child.takeError();
            }
            if (auto err = collectMessages(**child, visiting))
            {
                return err;
            }
        }
        visiting.pop_back();
        order_.push_back(&message);
        return llvm::Error::success();
    }

    [[nodiscard]] const std::vector<const MessageSpec*>& order() const
    {
        return order_;
    }

    [[nodiscard]] PreludeOptions preludeOptions() const
    {
        PreludeOptions options;
        options.hexOf = true;
        for (const MessageSpec* message : order_)
        {
            for (const FieldSpec& field : message->fields)
            {
                if (!field.isMessage())
                {
                    options.floatBits  = options.floatBits || field.scalarKind == ScalarKind::Float;
                    options.doubleBits = options.doubleBits || field.scalarKind == ScalarKind::Double;
                }
            }
        }
        return options;
    }

    void emitStruct(std::ostream& out, const MessageSpec& message) const
    {
        const std::string name = structName(message);
        emitLine(out, 0, "struct " + name);
        emitLine(out, 0, "{");
        for (const FieldSpec& field : message.fields)
        {
            emitLine(out, 1, memberType(field) + " " + memberName(field) + "{};");
        }
        if (!message.fields.empty())
        {
            emitLine(out, 0, "");
        }
        emitLine(out, 1, "bool operator==(const " + name + "&) const = default;");
        emitLine(out, 0, "};");
        emitLine(out, 0, "");
    }

    void emitDecode(std::ostream& out, const MessageSpec& message) const
    {
        const std::string name = structName(message);
        emitLine(out, 0, name + " decode" + name + "(" + contract_.qualify("Reader") + "& reader)");
        emitLine(out, 0, "{");
        emitLine(out, 1, name + " value;");
        emitLine(out, 1, "while (!reader.atEnd())");
        emitLine(out, 1, "{");
        emitLine(out, 2, "const " + contract_.qualify("Tag") + " tag = " + contract_.qualify("readTag") + "(reader);");
        emitLine(out, 2, "switch (tag.number)");
        emitLine(out, 2, "{");
        for (const FieldSpec& field : message.fields)
        {
            emitLine(out, 2, "case " + std::to_string(field.number) + "U: {");
            emitFieldRead(out, 3, message, field);
            emitLine(out, 3, "break;");
            emitLine(out, 2, "}");
        }
        emitLine(out, 2, "default:");
        emitLine(out, 3, contract_.qualify("skipUnknown") + "(reader, tag.wireType);");
        emitLine(out, 3, "break;");
        emitLine(out, 2, "}");
        emitLine(out, 1, "}");
        emitLine(out, 1, "return value;");
        emitLine(out, 0, "}");
        emitLine(out, 0, "");
    }

    void emitEncode(std::ostream& out, const MessageSpec& message) const
    {
        const std::string name = structName(message);

        std::vector<const FieldSpec*> byNumber;
        for (const FieldSpec& field : message.fields)
        {
            byNumber.push_back(&field);
        }
        std::sort(byNumber.begin(), byNumber.end(), [](const FieldSpec* lhs, const FieldSpec* rhs) {
            return lhs->number < rhs->number;
        });

        emitLine(out, 0, "Bytes encode" + name + "(const " + name + "& value)");
        emitLine(out, 0, "{");
        emitLine(out, 1, contract_.qualify("Writer") + " writer;");
        for (const FieldSpec* field : byNumber)
        {
            emitFieldWrite(out, 1, *field);
        }
        emitLine(out, 1, "return writer.bytes();");
        emitLine(out, 0, "}");
        emitLine(out, 0, "");
    }

    llvm::Expected<std::string> renderValue(const MessageSpec& message, const MessageValue& value) const
    {
        std::vector<std::string> parts;
        for (const FieldSpec& field : message.fields)
        {
            const FieldValue* slot = value.find(field.name);
            if (slot == nullptr || (slot->scalars.empty() && slot->messages.empty()))
            {
                continue;
            }

            std::vector<std::string> elements;
            if (field.isMessage())
            {
                const MessageSpec* child = schema_.findMessage(field.typeName);
                if (child == nullptr)
                {
                    return makeGenerationError(GenerationErrorKind::SchemaNotFound,
                                               kOperation,
                                               field.typeName,
                                               "message type is not declared in " + schema_.fileName);
                }
                for (const MessageValue& element : slot->messages)
                {
                    auto rendered = renderValue(*child, element);
                    if (!rendered)
                    {
                        return rendered.takeError();
                    }
                    elements.push_back(std::move(*rendered));
                }
            }
            else
            {
                for (const ScalarValue& element : slot->scalars)
                {
                    auto rendered = renderScalar(message, field, element);
                    if (!rendered)
                    {
                        return rendered.takeError();
                    }
                    elements.push_back(std::move(*rendered));
                }
            }

            if (!field.repeated)
            {
                // Singular slots keep the last decoded occurrence.
                parts.push_back("." + memberName(field) + " = " + elements.back());
            }
            else
            {
                parts.push_back("." + memberName(field) + " = {" + joinParts(elements) + "}");
            }
        }
        return structName(message) + "{" + joinParts(parts) + "}";
    }

private:
    [[nodiscard]] std::string elementType(const FieldSpec& field) const
    {
        if (field.isMessage())
        {
            const MessageSpec* child = schema_.findMessage(field.typeName);
            return child == nullptr ? field.typeName : structName(*child);
        }
        const ScalarKindInfo& info = scalarKindInfo(field.scalarKind);
        return info.floatBits ? floatBitsStorageType(field.scalarKind).str() : info.cppStorageType.str();
    }

    [[nodiscard]] std::string memberType(const FieldSpec& field) const
    {
        const std::string element = elementType(field);
        if (field.repeated)
        {
            return "std::vector<" + element + ">";
        }
        if (field.isMessage() || field.presence == FieldPresence::Explicit)
        {
            return "std::optional<" + element + ">";
        }
        return element;
    }

    [[nodiscard]] std::string readScalar(const FieldSpec& field, llvm::StringRef reader) const
    {
        return scalarKindInfo(field.scalarKind).floatBits ? contract_.readBitsExpr(field.scalarKind, reader)
                                                          : contract_.readExpr(field.scalarKind, reader);
    }

    [[nodiscard]] std::string writeScalar(const FieldSpec& field, llvm::StringRef writer, llvm::StringRef value) const
    {
        return scalarKindInfo(field.scalarKind).floatBits ? contract_.writeBitsExpr(field.scalarKind, writer, value)
                                                          : contract_.writeExpr(field.scalarKind, writer, value);
    }

    void emitFieldRead(std::ostream& out, const int indent, const MessageSpec& message, const FieldSpec& field) const
    {
        const std::string target = "value." + memberName(field);

        if (field.isMessage())
        {
            const std::string childName = elementType(field);
            emitLine(out, indent, "const Bytes payload = " + contract_.qualify("readBytes") + "(reader);");
            emitLine(out, indent, contract_.qualify("Reader") + " nested(payload);");
            if (field.repeated)
            {
                emitLine(out, indent, target + ".push_back(decode" + childName + "(nested));");
            }
            else
            {
                emitLine(out, indent, target + " = decode" + childName + "(nested);");
            }
        }
        else if (field.repeated && scalarKindInfo(field.scalarKind).packable)
        {
            emitLine(out, indent, "if (tag.wireType == " + wireTypeLiteral(WireType::LengthDelimited) + ")");
            emitLine(out, indent, "{");
            emitLine(out,
                     indent + 1,
                     contract_.qualify("readPacked") + "(reader, [&](" + contract_.qualify("Reader") +
                         "& packed) { " + target + ".push_back(" + readScalar(field, "packed") + "); });");
            emitLine(out, indent, "}");
            emitLine(out, indent, "else");
            emitLine(out, indent, "{");
            emitLine(out, indent + 1, target + ".push_back(" + readScalar(field, "reader") + ");");
            emitLine(out, indent, "}");
        }
        else if (field.repeated)
        {
            emitLine(out, indent, target + ".push_back(" + readScalar(field, "reader") + ");");
        }
        else
        {
            emitLine(out, indent, target + " = " + readScalar(field, "reader") + ";");
        }

        if (field.oneofName.empty())
        {
            return;
        }
        for (const FieldSpec& sibling : message.fields)
        {
            if (sibling.oneofName == field.oneofName && sibling.name != field.name)
            {
                emitLine(out, indent, "value." + memberName(sibling) + ".reset();");
            }
        }
    }

    void emitFieldWrite(std::ostream& out, const int indent, const FieldSpec& field) const
    {
        const std::string source = "value." + memberName(field);

        if (field.isMessage())
        {
            const std::string encodeCall = "encode" + elementType(field);
            const std::string tag        = contract_.writeTagExpr("writer", field.number, WireType::LengthDelimited);
            if (field.repeated)
            {
                emitLine(out, indent, "for (const auto& element : " + source + ")");
                emitLine(out, indent, "{");
                emitLine(out, indent + 1, tag + ";");
                emitLine(out, indent + 1, contract_.qualify("writeBytes") + "(writer, " + encodeCall + "(element));");
            }
            else
            {
                emitLine(out, indent, "if (" + source + ".has_value())");
                emitLine(out, indent, "{");
                emitLine(out, indent + 1, tag + ";");
                emitLine(out, indent + 1, contract_.qualify("writeBytes") + "(writer, " + encodeCall + "(*" + source + "));");
            }
            emitLine(out, indent, "}");
            return;
        }

        const std::string elementTag = contract_.writeTagExpr("writer", field.number, field.elementWireType());
        if (field.repeated && field.packed)
        {
            emitLine(out, indent, "if (!" + source + ".empty())");
            emitLine(out, indent, "{");
            emitLine(out, indent + 1, contract_.qualify("Writer") + " packed;");
            emitLine(out, indent + 1, "for (const auto& element : " + source + ")");
            emitLine(out, indent + 1, "{");
            emitLine(out, indent + 2, writeScalar(field, "packed", "element") + ";");
            emitLine(out, indent + 1, "}");
            emitLine(out, indent + 1, contract_.writeTagExpr("writer", field.number, WireType::LengthDelimited) + ";");
            emitLine(out, indent + 1, contract_.qualify("writeBytes") + "(writer, packed.bytes());");
            emitLine(out, indent, "}");
            return;
        }
        if (field.repeated)
        {
            emitLine(out, indent, "for (const auto& element : " + source + ")");
            emitLine(out, indent, "{");
            emitLine(out, indent + 1, elementTag + ";");
            emitLine(out, indent + 1, writeScalar(field, "writer", "element") + ";");
            emitLine(out, indent, "}");
            return;
        }

        switch (field.presence)
        {
        case FieldPresence::Always:
            emitLine(out, indent, elementTag + ";");
            emitLine(out, indent, writeScalar(field, "writer", source) + ";");
            return;
        case FieldPresence::Explicit:
            emitLine(out, indent, "if (" + source + ".has_value())");
            emitLine(out, indent, "{");
            emitLine(out, indent + 1, elementTag + ";");
            emitLine(out, indent + 1, writeScalar(field, "writer", "*" + source) + ";");
            emitLine(out, indent, "}");
            return;
        case FieldPresence::Implicit:
            emitLine(out, indent, "if (" + nonDefaultCondition(field, source) + ")");
            emitLine(out, indent, "{");
            emitLine(out, indent + 1, elementTag + ";");
            emitLine(out, indent + 1, writeScalar(field, "writer", source) + ";");
            emitLine(out, indent, "}");
            return;
        }
    }

    [[nodiscard]] static std::string nonDefaultCondition(const FieldSpec& field, const std::string& source)
    {
        switch (scalarKindInfo(field.scalarKind).domain)
        {
        case ValueDomain::Boolean:
            return source;
        case ValueDomain::Text:
        case ValueDomain::Binary:
            return "!" + source + ".empty()";
        case ValueDomain::Floating:
        case ValueDomain::Unsigned:
            return source + " != 0U";
        case ValueDomain::Signed:
        case ValueDomain::EnumNumber:
            return source + " != 0";
        }
        return source;
    }

    [[nodiscard]] llvm::Expected<std::string> renderScalar(const MessageSpec& message,
                                                           const FieldSpec&   field,
                                                           const ScalarValue& value) const
    {
        if (!scalarFitsKind(field.scalarKind, value))
        {
            return makeGenerationError(GenerationErrorKind::UnsupportedFieldKind,
                                       kOperation,
                                       message.fullName + "." + field.name,
                                       "value does not match the field kind " +
                                           scalarKindInfo(field.scalarKind).schemaName.str());
        }

        if (value.isDouble() && field.scalarKind == ScalarKind::Float)
        {
            return renderCppBitsLiteral(field.scalarKind,
                                        llvm::bit_cast<std::uint32_t>(static_cast<float>(value.asDouble())));
        }
        if (value.isDouble() && field.scalarKind == ScalarKind::Double)
        {
            return renderCppBitsLiteral(field.scalarKind, llvm::bit_cast<std::uint64_t>(value.asDouble()));
        }

        std::string literal = renderScalarLiteral(LiteralGrammar::Cpp, field.scalarKind, value);
        if (value.isEnum() && !value.asEnum().name.empty())
        {
            literal += " /* " + value.asEnum().name + " */";
        }
        return literal;
    }

    const CodecContract&            contract_;
    const SchemaFile&               schema_;
    std::vector<const MessageSpec*> order_;
};

void emitCheck(std::ostream& out, const CodecContract& contract, const MessageSpec& root, const bool hasCases)
{
    const std::string name = structName(root);

    emitLine(out, 0, "bool reportMismatch(const char* label, const char* what)");
    emitLine(out, 0, "{");
    emitLine(out, 1, "std::cerr << \"" + name + " case \" << label << \": \" << what << \" mismatch\\n\";");
    emitLine(out, 1, "return false;");
    emitLine(out, 0, "}");
    emitLine(out, 0, "");

    emitLine(out, 0, "bool check" + name + "()");
    emitLine(out, 0, "{");
    if (hasCases)
    {
        emitLine(out, 1, "for (const " + name + "Case& item : k" + name + "Cases)");
        emitLine(out, 1, "{");
        emitLine(out, 2, "const Bytes fixture = decodeFixture(item.fixture);");
        emitLine(out, 2, contract.qualify("Reader") + " reader(fixture);");
        emitLine(out, 2, "const " + name + " decoded = decode" + name + "(reader);");
        for (const FieldSpec& field : root.fields)
        {
            const std::string member = memberName(field);
            emitLine(out, 2, "if (decoded." + member + " != item.expected." + member + ")");
            emitLine(out, 2, "{");
            emitLine(out, 3, "return reportMismatch(item.label, \"" + field.name + "\");");
            emitLine(out, 2, "}");
        }
        emitLine(out, 2, "const Bytes encoded = encode" + name + "(item.expected);");
        emitLine(out, 2, "if (encoded != fixture)");
        emitLine(out, 2, "{");
        emitLine(out, 3, "std::cerr << \"" + name + " case \" << item.label << \": encoded \" << hexOf(encoded) << '\\n';");
        emitLine(out, 3, "return reportMismatch(item.label, \"encode\");");
        emitLine(out, 2, "}");
        emitLine(out, 1, "}");
    }
    emitLine(out, 1, "return true;");
    emitLine(out, 0, "}");
    emitLine(out, 0, "");
}

}  // namespace

llvm::Expected<std::string> renderMessageArtifact(const CodecContract&                     contract,
                                                  const ArtifactHeader&                    header,
                                                  const SchemaFile&                        schema,
                                                  const MessageSpec&                       root,
                                                  const std::vector<CompositeGoldenEntry>& entries)
{
    MessageRenderer                 renderer(contract, schema);
    std::vector<const MessageSpec*> visiting;
    if (auto err = renderer.collectMessages(root, visiting))
    {
        return std::move(err);
    }

    std::ostringstream out;
    contract.emitPrelude(out, header.source, renderer.preludeOptions());

    for (const MessageSpec* message : renderer.order())
    {
        renderer.emitStruct(out, *message);
        renderer.emitDecode(out, *message);
        renderer.emitEncode(out, *message);
    }

    const std::string name = structName(root);
    if (!entries.empty())
    {
        emitLine(out, 0, "struct " + name + "Case");
        emitLine(out, 0, "{");
        emitLine(out, 1, "const char* label;");
        emitLine(out, 1, "const char* fixture;");
        emitLine(out, 1, name + " expected;");
        emitLine(out, 0, "};");
        emitLine(out, 0, "");
        emitLine(out, 0, "const " + name + "Case k" + name + "Cases[] = {");
        for (const CompositeGoldenEntry& entry : entries)
        {
            auto expected = renderer.renderValue(root, entry.expected);
            if (!expected)
            {
                return expected.takeError();
            }
            emitLine(out, 1, "{");
            emitLine(out, 2, quoteCppString(entry.label) + ",");
            emitLine(out, 2, "\"" + llvm::encodeBase64(entry.fixture) + "\",");
            emitLine(out, 2, *expected + ",");
            emitLine(out, 1, "},");
        }
        emitLine(out, 0, "};");
        emitLine(out, 0, "");
    }

    emitCheck(out, contract, root, !entries.empty());

    emitLine(out, 0, "}  // namespace");
    emitLine(out, 0, "");
    emitLine(out, 0, "bool " + header.entryPoint + "()");
    emitLine(out, 0, "{");
    emitLine(out, 1, "return runCheck(\"" + name + "\", &check" + name + ");");
    emitLine(out, 0, "}");
    return out.str();
}

}  // namespace wiregold
