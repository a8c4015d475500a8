//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Physical encoding families selected by the three low bits of a field tag.
///
//===----------------------------------------------------------------------===//
#ifndef WIREGOLD_DOMAIN_WIRETYPE_H
#define WIREGOLD_DOMAIN_WIRETYPE_H

#include "llvm/ADT/StringRef.h"

#include <cstdint>
#include <optional>

namespace wiregold
{

/// @brief Wire types supported by the generator.
///
/// @details Group wire types 3 and 4 are deliberately absent: they are
/// rejected wherever a tag is decoded.
enum class WireType : std::uint8_t
{
    Varint          = 0,
    Fixed64         = 1,
    LengthDelimited = 2,
    Fixed32         = 5,
};

/// @brief Returns the numeric tag suffix of a wire type.
[[nodiscard]] constexpr std::uint32_t wireTypeBits(const WireType type)
{
    return static_cast<std::uint32_t>(type);
}

/// @brief Maps tag suffix bits to a supported wire type.
[[nodiscard]] std::optional<WireType> wireTypeFromBits(std::uint32_t bits);

/// @brief Returns a diagnostic spelling (`varint`, `fixed64`, ...).
[[nodiscard]] llvm::StringRef wireTypeName(WireType type);

/// @brief Composes a tag key from field number and wire type.
[[nodiscard]] constexpr std::uint64_t makeTagKey(const std::uint32_t fieldNumber, const WireType type)
{
    return (static_cast<std::uint64_t>(fieldNumber) << 3U) | wireTypeBits(type);
}

}  // namespace wiregold

#endif  // WIREGOLD_DOMAIN_WIRETYPE_H
