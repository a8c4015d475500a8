//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the scalar kind registry.
///
//===----------------------------------------------------------------------===//

#include "wiregold/Domain/ScalarKind.h"

namespace wiregold
{
namespace
{

constexpr ScalarKind kAllKinds[] = {
    ScalarKind::Int32,
    ScalarKind::Int64,
    ScalarKind::UInt32,
    ScalarKind::UInt64,
    ScalarKind::SInt32,
    ScalarKind::SInt64,
    ScalarKind::Bool,
    ScalarKind::Enum,
    ScalarKind::Fixed32,
    ScalarKind::Fixed64,
    ScalarKind::SFixed32,
    ScalarKind::SFixed64,
    ScalarKind::Float,
    ScalarKind::Double,
    ScalarKind::Bytes,
    ScalarKind::String,
};

}  // namespace

const ScalarKindInfo& scalarKindInfo(const ScalarKind kind)
{
    // clang-format off
    static const ScalarKindInfo int32{ScalarKind::Int32, "int32", "Int32", WireType::Varint, 32, ValueDomain::Signed, false, false, false, true, "std::int32_t"};
    static const ScalarKindInfo int64{ScalarKind::Int64, "int64", "Int64", WireType::Varint, 64, ValueDomain::Signed, false, false, false, true, "std::int64_t"};
    static const ScalarKindInfo uint32{ScalarKind::UInt32, "uint32", "UInt32", WireType::Varint, 32, ValueDomain::Unsigned, false, false, false, true, "std::uint32_t"};
    static const ScalarKindInfo uint64{ScalarKind::UInt64, "uint64", "UInt64", WireType::Varint, 64, ValueDomain::Unsigned, false, false, false, true, "std::uint64_t"};
    static const ScalarKindInfo sint32{ScalarKind::SInt32, "sint32", "SInt32", WireType::Varint, 32, ValueDomain::Signed, true, true, false, true, "std::int32_t"};
    static const ScalarKindInfo sint64{ScalarKind::SInt64, "sint64", "SInt64", WireType::Varint, 64, ValueDomain::Signed, true, true, false, true, "std::int64_t"};
    static const ScalarKindInfo boolean{ScalarKind::Bool, "bool", "Bool", WireType::Varint, 1, ValueDomain::Boolean, false, false, false, true, "bool"};
    static const ScalarKindInfo enumeration{ScalarKind::Enum, "enum", "Enum", WireType::Varint, 32, ValueDomain::EnumNumber, false, true, false, true, "std::int32_t"};
    static const ScalarKindInfo fixed32{ScalarKind::Fixed32, "fixed32", "Fixed32", WireType::Fixed32, 32, ValueDomain::Unsigned, false, false, false, true, "std::uint32_t"};
    static const ScalarKindInfo fixed64{ScalarKind::Fixed64, "fixed64", "Fixed64", WireType::Fixed64, 64, ValueDomain::Unsigned, false, false, false, true, "std::uint64_t"};
    static const ScalarKindInfo sfixed32{ScalarKind::SFixed32, "sfixed32", "SFixed32", WireType::Fixed32, 32, ValueDomain::Signed, false, false, false, true, "std::int32_t"};
    static const ScalarKindInfo sfixed64{ScalarKind::SFixed64, "sfixed64", "SFixed64", WireType::Fixed64, 64, ValueDomain::Signed, false, false, false, true, "std::int64_t"};
    static const ScalarKindInfo float32{ScalarKind::Float, "float", "Float", WireType::Fixed32, 32, ValueDomain::Floating, false, false, true, true, "float"};
    static const ScalarKindInfo float64{ScalarKind::Double, "double", "Double", WireType::Fixed64, 64, ValueDomain::Floating, false, false, true, true, "double"};
    static const ScalarKindInfo bytes{ScalarKind::Bytes, "bytes", "Bytes", WireType::LengthDelimited, 0, ValueDomain::Binary, false, false, false, false, "std::vector<std::uint8_t>"};
    static const ScalarKindInfo string{ScalarKind::String, "string", "String", WireType::LengthDelimited, 0, ValueDomain::Text, false, false, false, false, "std::string"};
    // clang-format on

    switch (kind)
    {
    case ScalarKind::Int32:
        return int32;
    case ScalarKind::Int64:
        return int64;
    case ScalarKind::UInt32:
        return uint32;
    case ScalarKind::UInt64:
        return uint64;
    case ScalarKind::SInt32:
        return sint32;
    case ScalarKind::SInt64:
        return sint64;
    case ScalarKind::Bool:
        return boolean;
    case ScalarKind::Enum:
        return enumeration;
    case ScalarKind::Fixed32:
        return fixed32;
    case ScalarKind::Fixed64:
        return fixed64;
    case ScalarKind::SFixed32:
        return sfixed32;
    case ScalarKind::SFixed64:
        return sfixed64;
    case ScalarKind::Float:
        return float32;
    case ScalarKind::Double:
        return float64;
    case ScalarKind::Bytes:
        return bytes;
    case ScalarKind::String:
        return string;
    }
    return int32;
}

llvm::ArrayRef<ScalarKind> allScalarKinds()
{
    return kAllKinds;
}

std::optional<ScalarKind> scalarKindFromSchemaName(llvm::StringRef name)
{
    for (const ScalarKind kind : kAllKinds)
    {
        if (kind != ScalarKind::Enum && scalarKindInfo(kind).schemaName == name)
        {
            return kind;
        }
    }
    return std::nullopt;
}

llvm::StringRef floatBitsStorageType(const ScalarKind kind)
{
    switch (kind)
    {
    case ScalarKind::Float:
        return "std::uint32_t";
    case ScalarKind::Double:
        return "std::uint64_t";
    default:
        return "";
    }
}

}  // namespace wiregold
