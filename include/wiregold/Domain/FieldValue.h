//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// In-memory field values used by corpora, oracle rendering and canonicalization.
///
//===----------------------------------------------------------------------===//
#ifndef WIREGOLD_DOMAIN_FIELDVALUE_H
#define WIREGOLD_DOMAIN_FIELDVALUE_H

#include "llvm/ADT/StringRef.h"

#include <cstdint>
#include <initializer_list>
#include <string>
#include <variant>
#include <vector>

namespace wiregold
{

/// @brief Raw byte sequence.
using ByteString = std::vector<std::uint8_t>;

/// @brief Enum constant carried by symbolic name and numeric value.
///
/// @details Corpus values are authored by name; the number is bound from the
/// schema before encoding. Decoded values carry the number and, when the
/// schema declares it, the name.
struct EnumSymbol final
{
    std::string  name;
    std::int32_t number{0};

    bool operator==(const EnumSymbol&) const = default;
};

/// @brief One scalar value in its semantic type.
///
/// @details Float kinds hold a `double` (float32 values are exactly
/// representable). Canonicalized float kinds hold their bit pattern as
/// `std::uint64_t`.
struct ScalarValue final
{
    std::variant<bool, std::int64_t, std::uint64_t, double, std::string, ByteString, EnumSymbol> data;

    static ScalarValue ofBool(bool value);
    static ScalarValue ofSigned(std::int64_t value);
    static ScalarValue ofUnsigned(std::uint64_t value);
    static ScalarValue ofDouble(double value);
    static ScalarValue ofString(std::string value);
    static ScalarValue ofBytes(ByteString value);
    static ScalarValue ofBytes(llvm::StringRef raw);
    static ScalarValue ofEnum(std::string name);
    static ScalarValue ofEnum(std::string name, std::int32_t number);

    [[nodiscard]] bool               isBool() const;
    [[nodiscard]] bool               isSigned() const;
    [[nodiscard]] bool               isUnsigned() const;
    [[nodiscard]] bool               isDouble() const;
    [[nodiscard]] bool               isString() const;
    [[nodiscard]] bool               isBytes() const;
    [[nodiscard]] bool               isEnum() const;
    [[nodiscard]] bool               asBool() const;
    [[nodiscard]] std::int64_t       asSigned() const;
    [[nodiscard]] std::uint64_t      asUnsigned() const;
    [[nodiscard]] double             asDouble() const;
    [[nodiscard]] const std::string& asString() const;
    [[nodiscard]] const ByteString&  asBytes() const;
    [[nodiscard]] const EnumSymbol&  asEnum() const;
};

/// @brief Canonical equality: doubles compare by bit pattern, enums by number.
[[nodiscard]] bool sameScalarValue(const ScalarValue& lhs, const ScalarValue& rhs);

struct MessageValue;

/// @brief All values recorded for one named field of a message.
///
/// @details Singular fields hold at most one entry. Exactly one of
/// `scalars`/`messages` is used, depending on the field kind.
struct FieldValue final
{
    std::string               name;
    std::vector<ScalarValue>  scalars;
    std::vector<MessageValue> messages;
};

/// @brief Dynamic message value keyed by schema field name.
///
/// @details Fields keep insertion order, which is also the order used by the
/// oracle text rendering. Binary encoding reorders by field number.
struct MessageValue final
{
    std::vector<FieldValue> fields;

    /// @brief Returns the named field, or null when absent.
    [[nodiscard]] const FieldValue* find(llvm::StringRef name) const;

    /// @brief Returns the named field, creating an empty entry when absent.
    FieldValue& slot(llvm::StringRef name);

    /// @brief Sets a singular scalar, replacing any previous value.
    MessageValue& set(llvm::StringRef name, ScalarValue value);

    /// @brief Appends repeated scalar elements.
    MessageValue& append(llvm::StringRef name, std::vector<ScalarValue> values);

    /// @brief Sets a singular sub-message, replacing any previous value.
    MessageValue& setMessage(llvm::StringRef name, MessageValue value);

    /// @brief Appends one repeated sub-message element.
    MessageValue& appendMessage(llvm::StringRef name, MessageValue value);

    /// @brief Drops the named field entirely.
    void erase(llvm::StringRef name);

    /// @brief Returns true when no field holds any value.
    [[nodiscard]] bool empty() const;
};

/// @brief Builds a byte string from a list of octets.
[[nodiscard]] ByteString makeBytes(std::initializer_list<std::uint8_t> octets);

/// @brief Builds `0, 1, ..., count - 1` as a byte string.
[[nodiscard]] ByteString byteRange(std::uint32_t count);

}  // namespace wiregold

#endif  // WIREGOLD_DOMAIN_FIELDVALUE_H
