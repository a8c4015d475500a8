//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include "wiregold/Domain/WireType.h"

namespace wiregold
{

std::optional<WireType> wireTypeFromBits(const std::uint32_t bits)
{
    switch (bits)
    {
    case 0:
        return WireType::Varint;
    case 1:
        return WireType::Fixed64;
    case 2:
        return WireType::LengthDelimited;
    case 5:
        return WireType::Fixed32;
    default:
        return std::nullopt;
    }
}

llvm::StringRef wireTypeName(const WireType type)
{
    switch (type)
    {
    case WireType::Varint:
        return "varint";
    case WireType::Fixed64:
        return "fixed64";
    case WireType::LengthDelimited:
        return "length-delimited";
    case WireType::Fixed32:
        return "fixed32";
    }
    return "unknown";
}

}  // namespace wiregold
