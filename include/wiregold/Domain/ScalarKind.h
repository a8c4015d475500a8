//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Closed registry of scalar field kinds and their wire-level behavior.
///
/// Every kind has exactly one registry entry; all per-kind dispatch in the
/// generator goes through @ref scalarKindInfo or an exhaustive switch.
///
//===----------------------------------------------------------------------===//
#ifndef WIREGOLD_DOMAIN_SCALARKIND_H
#define WIREGOLD_DOMAIN_SCALARKIND_H

#include "wiregold/Domain/WireType.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"

#include <cstdint>
#include <optional>

namespace wiregold
{

/// @brief Scalar field kinds of the wire format.
enum class ScalarKind
{
    Int32,
    Int64,
    UInt32,
    UInt64,
    SInt32,
    SInt64,
    Bool,
    Enum,
    Fixed32,
    Fixed64,
    SFixed32,
    SFixed64,
    Float,
    Double,
    Bytes,
    String,
};

/// @brief Semantic value family held by a kind.
enum class ValueDomain
{
    Signed,
    Unsigned,
    Boolean,
    EnumNumber,
    Floating,
    Text,
    Binary,
};

/// @brief Registry entry for one scalar kind.
struct ScalarKindInfo final
{
    /// @brief Kind this entry describes.
    ScalarKind kind;

    /// @brief Schema keyword (`int32`, `sfixed64`, ...); `enum` for enum references.
    llvm::StringRef schemaName;

    /// @brief Suffix of the codec read/write operations (`readSInt32`, `writeBytes`, ...).
    llvm::StringRef codecSuffix;

    /// @brief Wire type of one unpacked element.
    WireType wireType;

    /// @brief Semantic value width in bits, zero for length-delimited kinds.
    std::uint32_t bitWidth;

    /// @brief Semantic value family.
    ValueDomain domain;

    /// @brief Value is zigzag-transformed before varint encoding.
    bool zigzag;

    /// @brief Codec read returns a one-element wrapper exposing `.value`.
    bool unwrap;

    /// @brief Canonical comparison uses the raw IEEE-754 bit pattern.
    bool floatBits;

    /// @brief Repeated fields of this kind may use packed framing.
    bool packable;

    /// @brief C++ type used for this kind in generated structs and tables.
    llvm::StringRef cppStorageType;
};

/// @brief Returns the registry entry for a kind.
[[nodiscard]] const ScalarKindInfo& scalarKindInfo(ScalarKind kind);

/// @brief Returns all kinds in registry order.
[[nodiscard]] llvm::ArrayRef<ScalarKind> allScalarKinds();

/// @brief Resolves a primitive schema keyword to its kind.
/// @return The kind, or empty for non-primitive names (including `enum`).
[[nodiscard]] std::optional<ScalarKind> scalarKindFromSchemaName(llvm::StringRef name);

/// @brief Returns the unsigned C++ type holding the bit pattern of a float kind.
/// @return `std::uint32_t` for float, `std::uint64_t` for double, empty otherwise.
[[nodiscard]] llvm::StringRef floatBitsStorageType(ScalarKind kind);

}  // namespace wiregold

#endif  // WIREGOLD_DOMAIN_SCALARKIND_H
