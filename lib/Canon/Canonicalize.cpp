//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include "wiregold/Canon/Canonicalize.h"

#include "wiregold/Canon/WireCodec.h"
#include "wiregold/Support/GenerationError.h"

#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/StringExtras.h"
#include "llvm/ADT/bit.h"
#include "llvm/Support/ConvertUTF.h"

#include <string>
#include <utility>
#include <vector>

namespace wiregold
{
namespace
{

llvm::Error malformedOutput(std::string subject, std::string detail)
{
    return makeGenerationError(GenerationErrorKind::MalformedOracleOutput,
                               "canonicalize",
                               std::move(subject),
                               std::move(detail));
}

llvm::Error kindMismatch(const std::string& subject, ScalarKind kind)
{
    return makeGenerationError(GenerationErrorKind::UnsupportedFieldKind,
                               "canonical-encode",
                               subject,
                               "value does not fit field kind '" + scalarKindInfo(kind).schemaName.str() + "'");
}

std::string fieldSubject(const MessageSpec& message, const FieldSpec& field)
{
    return message.fullName + "." + field.name;
}

/// Two's-complement image of any integral value representation.
std::optional<std::uint64_t> integerBits(const ScalarValue& value)
{
    if (value.isSigned())
    {
        return static_cast<std::uint64_t>(value.asSigned());
    }
    if (value.isUnsigned())
    {
        return value.asUnsigned();
    }
    if (value.isBool())
    {
        return value.asBool() ? 1U : 0U;
    }
    if (value.isEnum())
    {
        return static_cast<std::uint64_t>(static_cast<std::int64_t>(value.asEnum().number));
    }
    return std::nullopt;
}

bool isDefaultScalar(const ScalarValue& value)
{
    if (value.isDouble())
    {
        return llvm::bit_cast<std::uint64_t>(value.asDouble()) == 0U;
    }
    if (value.isString())
    {
        return value.asString().empty();
    }
    if (value.isBytes())
    {
        return value.asBytes().empty();
    }
    return integerBits(value).value_or(1U) == 0U;
}

llvm::Error encodeScalarElement(WireWriter& writer, ScalarKind kind, const ScalarValue& value, const std::string& subject)
{
    const ScalarKindInfo& info = scalarKindInfo(kind);
    switch (info.domain)
    {
    case ValueDomain::Floating:
        if (!value.isDouble())
        {
            return kindMismatch(subject, kind);
        }
        if (kind == ScalarKind::Float)
        {
            writer.writeFixed32(llvm::bit_cast<std::uint32_t>(static_cast<float>(value.asDouble())));
        }
        else
        {
            writer.writeFixed64(llvm::bit_cast<std::uint64_t>(value.asDouble()));
        }
        return llvm::Error::success();
    case ValueDomain::Text:
        if (!value.isString())
        {
            return kindMismatch(subject, kind);
        }
        writer.writeLengthDelimited(llvm::arrayRefFromStringRef(value.asString()));
        return llvm::Error::success();
    case ValueDomain::Binary:
        if (!value.isBytes())
        {
            return kindMismatch(subject, kind);
        }
        writer.writeLengthDelimited(value.asBytes());
        return llvm::Error::success();
    default:
        break;
    }

    const auto bits = integerBits(value);
    if (!bits)
    {
        return kindMismatch(subject, kind);
    }
    switch (kind)
    {
    case ScalarKind::Int32:
    case ScalarKind::Enum:
        writer.writeVarint(static_cast<std::uint64_t>(static_cast<std::int64_t>(static_cast<std::int32_t>(*bits))));
        break;
    case ScalarKind::UInt32:
        writer.writeVarint(*bits & 0xFFFFFFFFULL);
        break;
    case ScalarKind::SInt32:
        writer.writeVarint(encodeZigZag32(static_cast<std::int32_t>(*bits)));
        break;
    case ScalarKind::SInt64:
        writer.writeVarint(encodeZigZag64(static_cast<std::int64_t>(*bits)));
        break;
    case ScalarKind::Bool:
        writer.writeVarint(*bits != 0U ? 1U : 0U);
        break;
    case ScalarKind::Fixed32:
    case ScalarKind::SFixed32:
        writer.writeFixed32(static_cast<std::uint32_t>(*bits));
        break;
    case ScalarKind::Fixed64:
    case ScalarKind::SFixed64:
        writer.writeFixed64(*bits);
        break;
    default:
        writer.writeVarint(*bits);
        break;
    }
    return llvm::Error::success();
}

llvm::Expected<ScalarValue> decodeScalarElement(WireReader&        reader,
                                                const SchemaFile&  schema,
                                                const FieldSpec&   field,
                                                const std::string& subject)
{
    const ScalarKind kind = field.scalarKind;
    switch (scalarKindInfo(kind).wireType)
    {
    case WireType::Fixed32: {
        auto raw = reader.readFixed32();
        if (!raw)
        {
            return raw.takeError();
        }
        if (kind == ScalarKind::Float)
        {
            return ScalarValue::ofDouble(static_cast<double>(llvm::bit_cast<float>(*raw)));
        }
        if (kind == ScalarKind::SFixed32)
        {
            return ScalarValue::ofSigned(static_cast<std::int32_t>(*raw));
        }
        return ScalarValue::ofUnsigned(*raw);
    }
    case WireType::Fixed64: {
        auto raw = reader.readFixed64();
        if (!raw)
        {
            return raw.takeError();
        }
        if (kind == ScalarKind::Double)
        {
            return ScalarValue::ofDouble(llvm::bit_cast<double>(*raw));
        }
        if (kind == ScalarKind::SFixed64)
        {
            return ScalarValue::ofSigned(static_cast<std::int64_t>(*raw));
        }
        return ScalarValue::ofUnsigned(*raw);
    }
    case WireType::LengthDelimited: {
        auto payload = reader.readLengthDelimited();
        if (!payload)
        {
            return payload.takeError();
        }
        if (kind == ScalarKind::Bytes)
        {
            return ScalarValue::ofBytes(ByteString(payload->begin(), payload->end()));
        }
        const auto* begin = reinterpret_cast<const llvm::UTF8*>(payload->data());
        const auto* end   = begin + payload->size();
        if (!llvm::isLegalUTF8String(&begin, end))
        {
            return malformedOutput(subject, "string field holds invalid UTF-8");
        }
        return ScalarValue::ofString(llvm::toStringRef(*payload).str());
    }
    case WireType::Varint:
        break;
    }

    auto raw = reader.readVarint();
    if (!raw)
    {
        return raw.takeError();
    }
    switch (kind)
    {
    case ScalarKind::Int32:
        return ScalarValue::ofSigned(static_cast<std::int32_t>(*raw));
    case ScalarKind::Int64:
        return ScalarValue::ofSigned(static_cast<std::int64_t>(*raw));
    case ScalarKind::UInt32:
        return ScalarValue::ofUnsigned(*raw & 0xFFFFFFFFULL);
    case ScalarKind::SInt32:
        return ScalarValue::ofSigned(decodeZigZag32(static_cast<std::uint32_t>(*raw)));
    case ScalarKind::SInt64:
        return ScalarValue::ofSigned(decodeZigZag64(*raw));
    case ScalarKind::Bool:
        return ScalarValue::ofBool(*raw != 0U);
    case ScalarKind::Enum: {
        const auto           number   = static_cast<std::int32_t>(*raw);
        const EnumSpec*      enumSpec = schema.findEnum(field.typeName);
        const EnumValueSpec* constant = enumSpec != nullptr ? enumSpec->findByNumber(number) : nullptr;
        return ScalarValue::ofEnum(constant != nullptr ? constant->name : std::string(), number);
    }
    default:
        return ScalarValue::ofUnsigned(*raw);
    }
}

void clearOneofSiblings(const MessageSpec& message, const FieldSpec& field, MessageValue& value)
{
    if (field.oneofName.empty())
    {
        return;
    }
    for (const FieldSpec& other : message.fields)
    {
        if (other.oneofName == field.oneofName && other.number != field.number)
        {
            value.erase(other.name);
        }
    }
}

std::string renderHex(llvm::ArrayRef<std::uint8_t> bytes)
{
    return bytes.empty() ? std::string("<empty>") : llvm::toHex(bytes, true);
}

}  // namespace

llvm::Expected<std::uint32_t> floatBitsFromEncoded(llvm::ArrayRef<std::uint8_t> encoded)
{
    if (encoded.size() < 5U)
    {
        return malformedOutput("float", "float encoding too short (" + std::to_string(encoded.size()) + " bytes)");
    }
    std::uint32_t bits = 0;
    for (std::size_t i = 0; i < 4U; ++i)
    {
        bits |= static_cast<std::uint32_t>(encoded[1U + i]) << (8U * i);
    }
    return bits;
}

llvm::Expected<std::uint64_t> doubleBitsFromEncoded(llvm::ArrayRef<std::uint8_t> encoded)
{
    if (encoded.size() < 9U)
    {
        return malformedOutput("double", "double encoding too short (" + std::to_string(encoded.size()) + " bytes)");
    }
    std::uint64_t bits = 0;
    for (std::size_t i = 0; i < 8U; ++i)
    {
        bits |= static_cast<std::uint64_t>(encoded[1U + i]) << (8U * i);
    }
    return bits;
}

llvm::Error bindMessageValue(const SchemaFile& schema, const MessageSpec& message, MessageValue& value)
{
    for (FieldValue& fieldValue : value.fields)
    {
        const FieldSpec* field = message.findByName(fieldValue.name);
        if (field == nullptr)
        {
            return makeGenerationError(GenerationErrorKind::SchemaNotFound,
                                       "case-bind",
                                       message.fullName + "." + fieldValue.name,
                                       "field is not declared in " + schema.fileName);
        }
        const std::string subject = fieldSubject(message, *field);
        if (field->isMessage())
        {
            if (!fieldValue.scalars.empty())
            {
                return makeGenerationError(GenerationErrorKind::UnsupportedFieldKind,
                                           "case-bind",
                                           subject,
                                           "message field given scalar values");
            }
            auto nested = schema.requireMessage(field->typeName);
            if (!nested)
            {
                return nested.takeError();
            }
            for (MessageValue& element : fieldValue.messages)
            {
                if (llvm::Error err = bindMessageValue(schema, **nested, element))
                {
                    return err;
                }
            }
            continue;
        }
        if (!fieldValue.messages.empty())
        {
            return makeGenerationError(GenerationErrorKind::UnsupportedFieldKind,
                                       "case-bind",
                                       subject,
                                       "scalar field given message values");
        }
        if (field->scalarKind != ScalarKind::Enum)
        {
            continue;
        }
        const EnumSpec* enumSpec = schema.findEnum(field->typeName);
        for (ScalarValue& scalar : fieldValue.scalars)
        {
            if (!scalar.isEnum())
            {
                return kindMismatch(subject, ScalarKind::Enum);
            }
            const EnumValueSpec* constant =
                enumSpec != nullptr ? enumSpec->findByName(scalar.asEnum().name) : nullptr;
            if (constant == nullptr)
            {
                return makeGenerationError(GenerationErrorKind::SchemaNotFound,
                                           "case-bind",
                                           subject,
                                           "enum constant '" + scalar.asEnum().name + "' is not declared in " +
                                               field->typeName);
            }
            scalar = ScalarValue::ofEnum(constant->name, constant->number);
        }
    }
    return llvm::Error::success();
}

llvm::Expected<ByteString> encodeMessage(const SchemaFile& schema, const MessageSpec& message, const MessageValue& value)
{
    std::vector<const FieldSpec*> ordered;
    for (const FieldSpec& field : message.fields)
    {
        ordered.push_back(&field);
    }
    llvm::sort(ordered, [](const FieldSpec* lhs, const FieldSpec* rhs) { return lhs->number < rhs->number; });

    WireWriter writer;
    for (const FieldSpec* field : ordered)
    {
        const FieldValue* fieldValue = value.find(field->name);
        if (fieldValue == nullptr)
        {
            continue;
        }
        const std::string subject = fieldSubject(message, *field);

        if (field->isMessage())
        {
            auto nested = schema.requireMessage(field->typeName);
            if (!nested)
            {
                return nested.takeError();
            }
            for (const MessageValue& element : fieldValue->messages)
            {
                auto payload = encodeMessage(schema, **nested, element);
                if (!payload)
                {
                    return payload.takeError();
                }
                writer.writeTag(field->number, WireType::LengthDelimited);
                writer.writeLengthDelimited(*payload);
            }
            continue;
        }

        if (field->repeated && field->packed)
        {
            if (fieldValue->scalars.empty())
            {
                continue;
            }
            WireWriter block;
            for (const ScalarValue& element : fieldValue->scalars)
            {
                if (llvm::Error err = encodeScalarElement(block, field->scalarKind, element, subject))
                {
                    return std::move(err);
                }
            }
            writer.writeTag(field->number, WireType::LengthDelimited);
            writer.writeLengthDelimited(block.bytes());
            continue;
        }

        for (const ScalarValue& element : fieldValue->scalars)
        {
            if (!field->repeated && field->presence == FieldPresence::Implicit && isDefaultScalar(element))
            {
                continue;
            }
            writer.writeTag(field->number, field->elementWireType());
            if (llvm::Error err = encodeScalarElement(writer, field->scalarKind, element, subject))
            {
                return std::move(err);
            }
        }
    }
    return writer.take();
}

llvm::Expected<MessageValue> decodeMessage(const SchemaFile&             schema,
                                           const MessageSpec&            message,
                                           llvm::ArrayRef<std::uint8_t> encoded)
{
    WireReader   reader(encoded);
    MessageValue value;
    while (!reader.atEnd())
    {
        auto tag = reader.readTag();
        if (!tag)
        {
            return tag.takeError();
        }
        const FieldSpec* field = message.findByNumber(tag->number);
        if (field == nullptr)
        {
            if (llvm::Error err = reader.skip(tag->type))
            {
                return std::move(err);
            }
            continue;
        }
        const std::string subject = fieldSubject(message, *field);

        if (field->isMessage())
        {
            if (tag->type != WireType::LengthDelimited)
            {
                return malformedOutput(subject, "message field carries wire type " + wireTypeName(tag->type).str());
            }
            auto payload = reader.readLengthDelimited();
            if (!payload)
            {
                return payload.takeError();
            }
            auto nestedSpec = schema.requireMessage(field->typeName);
            if (!nestedSpec)
            {
                return nestedSpec.takeError();
            }
            auto nested = decodeMessage(schema, **nestedSpec, *payload);
            if (!nested)
            {
                return nested.takeError();
            }
            if (field->repeated)
            {
                value.appendMessage(field->name, std::move(*nested));
            }
            else
            {
                clearOneofSiblings(message, *field, value);
                value.setMessage(field->name, std::move(*nested));
            }
            continue;
        }

        if (field->repeated && tag->type == WireType::LengthDelimited &&
            scalarKindInfo(field->scalarKind).packable)
        {
            auto payload = reader.readLengthDelimited();
            if (!payload)
            {
                return payload.takeError();
            }
            WireReader               packed(*payload);
            std::vector<ScalarValue> elements;
            while (!packed.atEnd())
            {
                auto element = decodeScalarElement(packed, schema, *field, subject);
                if (!element)
                {
                    return element.takeError();
                }
                elements.push_back(std::move(*element));
            }
            value.append(field->name, std::move(elements));
            continue;
        }

        if (tag->type != field->elementWireType())
        {
            return malformedOutput(subject,
                                   "expected wire type " + wireTypeName(field->elementWireType()).str() + ", found " +
                                       wireTypeName(tag->type).str());
        }
        auto element = decodeScalarElement(reader, schema, *field, subject);
        if (!element)
        {
            return element.takeError();
        }
        if (field->repeated)
        {
            std::vector<ScalarValue> single;
            single.push_back(std::move(*element));
            value.append(field->name, std::move(single));
        }
        else
        {
            clearOneofSiblings(message, *field, value);
            value.set(field->name, std::move(*element));
        }
    }
    return value;
}

llvm::Expected<ScalarValue> canonicalizeScalarCase(const SchemaFile&             schema,
                                                   const MessageSpec&            message,
                                                   const ScalarKind              kind,
                                                   const ScalarValue&            input,
                                                   llvm::ArrayRef<std::uint8_t> oracleBytes)
{
    if (kind == ScalarKind::Float)
    {
        auto bits = floatBitsFromEncoded(oracleBytes);
        if (!bits)
        {
            return bits.takeError();
        }
        return ScalarValue::ofUnsigned(*bits);
    }
    if (kind == ScalarKind::Double)
    {
        auto bits = doubleBitsFromEncoded(oracleBytes);
        if (!bits)
        {
            return bits.takeError();
        }
        return ScalarValue::ofUnsigned(*bits);
    }

    if (message.fields.size() != 1U)
    {
        return makeGenerationError(GenerationErrorKind::UnsupportedFieldKind,
                                   "canonicalize",
                                   message.fullName,
                                   "scalar cases need a message with exactly one field");
    }
    const FieldSpec& field = message.fields.front();

    MessageValue bound;
    bound.set(field.name, input);
    if (llvm::Error err = bindMessageValue(schema, message, bound))
    {
        return std::move(err);
    }

    auto decoded = decodeMessage(schema, message, oracleBytes);
    if (!decoded)
    {
        return decoded.takeError();
    }
    const FieldValue* slot = decoded->find(field.name);
    if (slot == nullptr || slot->scalars.size() != 1U)
    {
        return malformedOutput(fieldSubject(message, field),
                               "oracle output " + renderHex(oracleBytes) + " does not carry exactly one value");
    }
    const ScalarValue& expected = bound.find(field.name)->scalars.front();
    if (!sameScalarValue(slot->scalars.front(), expected))
    {
        return malformedOutput(fieldSubject(message, field),
                               "oracle output " + renderHex(oracleBytes) + " decodes to a different value");
    }
    return slot->scalars.front();
}

llvm::Expected<MessageValue> canonicalizeCompositeCase(const SchemaFile&             schema,
                                                       const MessageSpec&            message,
                                                       const MessageValue&           input,
                                                       llvm::ArrayRef<std::uint8_t> oracleBytes)
{
    MessageValue bound = input;
    if (llvm::Error err = bindMessageValue(schema, message, bound))
    {
        return std::move(err);
    }
    auto inputBytes = encodeMessage(schema, message, bound);
    if (!inputBytes)
    {
        return inputBytes.takeError();
    }
    if (llvm::ArrayRef<std::uint8_t>(*inputBytes) != oracleBytes)
    {
        return malformedOutput(message.fullName,
                               "case re-encodes to " + renderHex(*inputBytes) + " but the oracle produced " +
                                   renderHex(oracleBytes));
    }

    auto decoded = decodeMessage(schema, message, oracleBytes);
    if (!decoded)
    {
        return decoded.takeError();
    }
    auto decodedBytes = encodeMessage(schema, message, *decoded);
    if (!decodedBytes)
    {
        return decodedBytes.takeError();
    }
    if (llvm::ArrayRef<std::uint8_t>(*decodedBytes) != oracleBytes)
    {
        return malformedOutput(message.fullName,
                               "decoded value re-encodes to " + renderHex(*decodedBytes) + " but the oracle produced " +
                                   renderHex(oracleBytes));
    }
    return decoded;
}

}  // namespace wiregold
