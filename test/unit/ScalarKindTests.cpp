//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <iostream>
#include <set>
#include <string>

#include "wiregold/Domain/ScalarKind.h"
#include "wiregold/Domain/WireType.h"

bool runScalarKindTests()
{
    using wiregold::ScalarKind;
    using wiregold::WireType;

    if (wiregold::allScalarKinds().size() != 16U)
    {
        std::cerr << "expected sixteen scalar kinds\n";
        return false;
    }

    std::set<std::string> suffixes;
    for (const ScalarKind kind : wiregold::allScalarKinds())
    {
        const wiregold::ScalarKindInfo& info = wiregold::scalarKindInfo(kind);
        if (info.kind != kind)
        {
            std::cerr << "scalar kind table out of order at " << info.schemaName.str() << "\n";
            return false;
        }
        const auto parsed = wiregold::scalarKindFromSchemaName(info.schemaName);
        if (kind != ScalarKind::Enum && (!parsed || *parsed != kind))
        {
            std::cerr << "schema name does not round-trip for " << info.schemaName.str() << "\n";
            return false;
        }
        suffixes.insert(info.codecSuffix.str());
    }
    if (suffixes.size() != 16U)
    {
        std::cerr << "codec suffixes must be unique\n";
        return false;
    }

    if (wiregold::scalarKindFromSchemaName("group") || wiregold::scalarKindFromSchemaName("Int32"))
    {
        std::cerr << "unexpected scalar kind for unsupported type name\n";
        return false;
    }

    const auto& sint32 = wiregold::scalarKindInfo(ScalarKind::SInt32);
    const auto& fixed64 = wiregold::scalarKindInfo(ScalarKind::Fixed64);
    const auto& text    = wiregold::scalarKindInfo(ScalarKind::String);
    if (!sint32.zigzag || !sint32.unwrap || sint32.wireType != WireType::Varint)
    {
        std::cerr << "sint32 must be a zigzag varint with a wrapped codec value\n";
        return false;
    }
    if (fixed64.wireType != WireType::Fixed64 || fixed64.zigzag)
    {
        std::cerr << "fixed64 wire type mismatch\n";
        return false;
    }
    if (text.packable || text.wireType != WireType::LengthDelimited)
    {
        std::cerr << "string must be a non-packable length-delimited kind\n";
        return false;
    }

    if (wiregold::floatBitsStorageType(ScalarKind::Float) != "std::uint32_t" ||
        wiregold::floatBitsStorageType(ScalarKind::Double) != "std::uint64_t")
    {
        std::cerr << "floating bit storage types mismatch\n";
        return false;
    }

    if (wiregold::makeTagKey(1, WireType::Varint) != 0x08U ||
        wiregold::makeTagKey(2, WireType::LengthDelimited) != 0x12U)
    {
        std::cerr << "tag key packing mismatch\n";
        return false;
    }
    if (wiregold::wireTypeFromBits(3U) || wiregold::wireTypeFromBits(6U) ||
        wiregold::wireTypeFromBits(5U) != WireType::Fixed32)
    {
        std::cerr << "wire type bit decoding mismatch\n";
        return false;
    }

    return true;
}
