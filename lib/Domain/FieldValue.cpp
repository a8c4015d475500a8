//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include "wiregold/Domain/FieldValue.h"

#include "llvm/ADT/bit.h"

#include <algorithm>
#include <utility>

namespace wiregold
{

ScalarValue ScalarValue::ofBool(const bool value)
{
    return ScalarValue{value};
}

ScalarValue ScalarValue::ofSigned(const std::int64_t value)
{
    return ScalarValue{value};
}

ScalarValue ScalarValue::ofUnsigned(const std::uint64_t value)
{
    return ScalarValue{value};
}

ScalarValue ScalarValue::ofDouble(const double value)
{
    return ScalarValue{value};
}

ScalarValue ScalarValue::ofString(std::string value)
{
    return ScalarValue{std::move(value)};
}

ScalarValue ScalarValue::ofBytes(ByteString value)
{
    return ScalarValue{std::move(value)};
}

ScalarValue ScalarValue::ofBytes(llvm::StringRef raw)
{
    return ScalarValue{ByteString(raw.bytes_begin(), raw.bytes_end())};
}

ScalarValue ScalarValue::ofEnum(std::string name)
{
    return ScalarValue{EnumSymbol{std::move(name), 0}};
}

ScalarValue ScalarValue::ofEnum(std::string name, const std::int32_t number)
{
    return ScalarValue{EnumSymbol{std::move(name), number}};
}

bool ScalarValue::isBool() const
{
    return std::holds_alternative<bool>(data);
}

bool ScalarValue::isSigned() const
{
    return std::holds_alternative<std::int64_t>(data);
}

bool ScalarValue::isUnsigned() const
{
    return std::holds_alternative<std::uint64_t>(data);
}

bool ScalarValue::isDouble() const
{
    return std::holds_alternative<double>(data);
}

bool ScalarValue::isString() const
{
    return std::holds_alternative<std::string>(data);
}

bool ScalarValue::isBytes() const
{
    return std::holds_alternative<ByteString>(data);
}

bool ScalarValue::isEnum() const
{
    return std::holds_alternative<EnumSymbol>(data);
}

bool ScalarValue::asBool() const
{
    return std::get<bool>(data);
}

std::int64_t ScalarValue::asSigned() const
{
    return std::get<std::int64_t>(data);
}

std::uint64_t ScalarValue::asUnsigned() const
{
    return std::get<std::uint64_t>(data);
}

double ScalarValue::asDouble() const
{
    return std::get<double>(data);
}

const std::string& ScalarValue::asString() const
{
    return std::get<std::string>(data);
}

const ByteString& ScalarValue::asBytes() const
{
    return std::get<ByteString>(data);
}

const EnumSymbol& ScalarValue::asEnum() const
{
    return std::get<EnumSymbol>(data);
}

bool sameScalarValue(const ScalarValue& lhs, const ScalarValue& rhs)
{
    if (lhs.data.index() != rhs.data.index())
    {
        return false;
    }
    if (lhs.isDouble())
    {
        return llvm::bit_cast<std::uint64_t>(lhs.asDouble()) == llvm::bit_cast<std::uint64_t>(rhs.asDouble());
    }
    if (lhs.isEnum())
    {
        return lhs.asEnum().number == rhs.asEnum().number;
    }
    return lhs.data == rhs.data;
}

const FieldValue* MessageValue::find(llvm::StringRef name) const
{
    for (const FieldValue& field : fields)
    {
        if (field.name == name)
        {
            return &field;
        }
    }
    return nullptr;
}

FieldValue& MessageValue::slot(llvm::StringRef name)
{
    for (FieldValue& field : fields)
    {
        if (field.name == name)
        {
            return field;
        }
    }
    fields.push_back(FieldValue{name.str(), {}, {}});
    return fields.back();
}

MessageValue& MessageValue::set(llvm::StringRef name, ScalarValue value)
{
    FieldValue& field = slot(name);
    field.scalars.clear();
    field.scalars.push_back(std::move(value));
    return *this;
}

MessageValue& MessageValue::append(llvm::StringRef name, std::vector<ScalarValue> values)
{
    FieldValue& field = slot(name);
    for (ScalarValue& value : values)
    {
        field.scalars.push_back(std::move(value));
    }
    return *this;
}

MessageValue& MessageValue::setMessage(llvm::StringRef name, MessageValue value)
{
    FieldValue& field = slot(name);
    field.messages.clear();
    field.messages.push_back(std::move(value));
    return *this;
}

MessageValue& MessageValue::appendMessage(llvm::StringRef name, MessageValue value)
{
    slot(name).messages.push_back(std::move(value));
    return *this;
}

void MessageValue::erase(llvm::StringRef name)
{
    fields.erase(std::remove_if(fields.begin(),
                                fields.end(),
                                [name](const FieldValue& field) { return field.name == name; }),
                 fields.end());
}

bool MessageValue::empty() const
{
    for (const FieldValue& field : fields)
    {
        if (!field.scalars.empty() || !field.messages.empty())
        {
            return false;
        }
    }
    return true;
}

ByteString makeBytes(std::initializer_list<std::uint8_t> octets)
{
    return ByteString(octets);
}

ByteString byteRange(const std::uint32_t count)
{
    ByteString out;
    out.reserve(count);
    for (std::uint32_t i = 0; i < count; ++i)
    {
        out.push_back(static_cast<std::uint8_t>(i));
    }
    return out;
}

}  // namespace wiregold
