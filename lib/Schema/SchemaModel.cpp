//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include "wiregold/Schema/SchemaModel.h"

#include "wiregold/Support/GenerationError.h"

namespace wiregold
{

WireType FieldSpec::elementWireType() const
{
    if (isMessage())
    {
        return WireType::LengthDelimited;
    }
    return scalarKindInfo(scalarKind).wireType;
}

WireType FieldSpec::wireType() const
{
    if (repeated && packed)
    {
        return WireType::LengthDelimited;
    }
    return elementWireType();
}

const EnumValueSpec* EnumSpec::findByName(llvm::StringRef name) const
{
    for (const EnumValueSpec& value : values)
    {
        if (value.name == name)
        {
            return &value;
        }
    }
    return nullptr;
}

const EnumValueSpec* EnumSpec::findByNumber(const std::int32_t number) const
{
    for (const EnumValueSpec& value : values)
    {
        if (value.number == number)
        {
            return &value;
        }
    }
    return nullptr;
}

const FieldSpec* MessageSpec::findByName(llvm::StringRef name) const
{
    for (const FieldSpec& field : fields)
    {
        if (field.name == name)
        {
            return &field;
        }
    }
    return nullptr;
}

const FieldSpec* MessageSpec::findByNumber(const std::uint32_t number) const
{
    for (const FieldSpec& field : fields)
    {
        if (field.number == number)
        {
            return &field;
        }
    }
    return nullptr;
}

const MessageSpec* SchemaFile::findMessage(llvm::StringRef fullName) const
{
    fullName.consume_front(".");
    for (const MessageSpec& message : messages)
    {
        if (message.fullName == fullName)
        {
            return &message;
        }
    }
    return nullptr;
}

const EnumSpec* SchemaFile::findEnum(llvm::StringRef fullName) const
{
    fullName.consume_front(".");
    for (const EnumSpec& spec : enums)
    {
        if (spec.fullName == fullName)
        {
            return &spec;
        }
    }
    return nullptr;
}

llvm::Expected<const MessageSpec*> SchemaFile::requireMessage(llvm::StringRef fullName) const
{
    if (const MessageSpec* message = findMessage(fullName))
    {
        return message;
    }
    return makeGenerationError(GenerationErrorKind::SchemaNotFound,
                               "schema-lookup",
                               fullName.str(),
                               "message type is not declared in " + fileName);
}

}  // namespace wiregold
