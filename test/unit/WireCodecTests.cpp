//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <llvm/Support/Error.h>
#include <cstdint>
#include <iostream>
#include <limits>

#include "wiregold/Canon/WireCodec.h"
#include "wiregold/Support/GenerationError.h"

namespace
{

bool expectMalformed(llvm::Error err, const char* label)
{
    const auto kind = wiregold::consumeGenerationErrorKind(std::move(err));
    if (!kind || *kind != wiregold::GenerationErrorKind::MalformedOracleOutput)
    {
        std::cerr << label << ": expected malformed-oracle-output\n";
        return false;
    }
    return true;
}

}  // namespace

bool runWireCodecTests()
{
    using wiregold::ByteString;
    using wiregold::WireType;

    {
        wiregold::WireWriter writer;
        writer.writeTag(1, WireType::Varint);
        writer.writeVarint(128);
        if (writer.bytes() != wiregold::makeBytes({0x08, 0x80, 0x01}))
        {
            std::cerr << "int32 128 must encode as 08 80 01\n";
            return false;
        }
    }

    // Each 7-bit continuation threshold adds exactly one byte.
    for (unsigned bits = 7; bits <= 63; bits += 7)
    {
        const std::uint64_t  hi = std::uint64_t{1} << bits;
        const std::uint64_t  lo = hi - 1U;
        wiregold::WireWriter loWriter;
        wiregold::WireWriter hiWriter;
        loWriter.writeVarint(lo);
        hiWriter.writeVarint(hi);
        if (loWriter.bytes().size() != bits / 7U || hiWriter.bytes().size() != loWriter.bytes().size() + 1U)
        {
            std::cerr << "varint length must grow by one byte at 2^" << bits << "\n";
            return false;
        }

        wiregold::WireReader loReader(loWriter.bytes());
        wiregold::WireReader hiReader(hiWriter.bytes());
        auto                 loValue = loReader.readVarint();
        auto                 hiValue = hiReader.readVarint();
        if (!loValue || !hiValue)
        {
            llvm::consumeError(loValue.takeError());
            llvm::consumeError(hiValue.takeError());
            std::cerr << "boundary varints at 2^" << bits << " failed to read back\n";
            return false;
        }
        if (*loValue != lo || *hiValue != hi || !loReader.atEnd() || !hiReader.atEnd())
        {
            std::cerr << "boundary varints at 2^" << bits << " decoded to the wrong values\n";
            return false;
        }
    }

    {
        // Negative int32 values sign-extend to ten varint bytes.
        wiregold::WireWriter writer;
        writer.writeVarint(static_cast<std::uint64_t>(static_cast<std::int64_t>(-1)));
        if (writer.bytes().size() != 10U || writer.bytes().back() != 0x01U)
        {
            std::cerr << "negative varint must use ten bytes\n";
            return false;
        }
    }

    if (wiregold::encodeZigZag32(-1) != 1U || wiregold::encodeZigZag32(1) != 2U ||
        wiregold::encodeZigZag32(std::numeric_limits<std::int32_t>::min()) != 0xFFFFFFFFU ||
        wiregold::decodeZigZag32(0xFFFFFFFEU) != std::numeric_limits<std::int32_t>::max())
    {
        std::cerr << "zigzag32 mapping mismatch\n";
        return false;
    }
    if (wiregold::encodeZigZag64(std::numeric_limits<std::int64_t>::min()) != std::numeric_limits<std::uint64_t>::max() ||
        wiregold::decodeZigZag64(3U) != -2)
    {
        std::cerr << "zigzag64 mapping mismatch\n";
        return false;
    }

    {
        wiregold::WireWriter writer;
        writer.writeFixed32(0x12345678U);
        writer.writeFixed64(0x0102030405060708ULL);
        writer.writeLengthDelimited(wiregold::makeBytes({0x61, 0x62}));
        const ByteString expected = wiregold::makeBytes(
            {0x78, 0x56, 0x34, 0x12, 0x08, 0x07, 0x06, 0x05, 0x04, 0x03, 0x02, 0x01, 0x02, 0x61, 0x62});
        if (writer.bytes() != expected)
        {
            std::cerr << "little-endian fixed or length-delimited layout mismatch\n";
            return false;
        }

        wiregold::WireReader reader(writer.bytes());
        auto fixed32 = reader.readFixed32();
        auto fixed64 = reader.readFixed64();
        auto payload = reader.readLengthDelimited();
        if (!fixed32 || !fixed64 || !payload)
        {
            llvm::consumeError(fixed32.takeError());
            llvm::consumeError(fixed64.takeError());
            llvm::consumeError(payload.takeError());
            std::cerr << "reading back fixed and length-delimited values failed\n";
            return false;
        }
        if (*fixed32 != 0x12345678U || *fixed64 != 0x0102030405060708ULL || payload->size() != 2U ||
            !reader.atEnd())
        {
            std::cerr << "read-back values mismatch\n";
            return false;
        }
    }

    {
        const ByteString bytes = wiregold::makeBytes({0x0E});
        wiregold::WireReader reader(bytes);
        auto tag = reader.readTag();
        if (tag)
        {
            std::cerr << "wire type 6 must be rejected\n";
            return false;
        }
        if (!expectMalformed(tag.takeError(), "unknown wire type"))
        {
            return false;
        }
    }

    {
        const ByteString bytes = wiregold::makeBytes({0x0A, 0x02, 0x61});
        wiregold::WireReader reader(bytes);
        auto tag = reader.readTag();
        if (!tag || tag->number != 1U || tag->type != WireType::LengthDelimited)
        {
            llvm::consumeError(tag.takeError());
            std::cerr << "expected field 1 length-delimited tag\n";
            return false;
        }
        auto payload = reader.readLengthDelimited();
        if (payload)
        {
            std::cerr << "payload past the end must be rejected\n";
            return false;
        }
        if (!expectMalformed(payload.takeError(), "truncated payload"))
        {
            return false;
        }
    }

    {
        const ByteString bytes = wiregold::makeBytes({0x00});
        wiregold::WireReader reader(bytes);
        auto tag = reader.readTag();
        if (tag || !expectMalformed(tag.takeError(), "field number zero"))
        {
            std::cerr << "field number zero must be rejected\n";
            return false;
        }
    }

    {
        const ByteString bytes(11, 0xFF);
        wiregold::WireReader reader(bytes);
        auto value = reader.readVarint();
        if (value || !expectMalformed(value.takeError(), "overlong varint"))
        {
            std::cerr << "varints over ten bytes must be rejected\n";
            return false;
        }
    }

    {
        // Unknown field 2 (varint) followed by field 1.
        const ByteString bytes = wiregold::makeBytes({0x10, 0x96, 0x01, 0x08, 0x05});
        wiregold::WireReader reader(bytes);
        auto unknown = reader.readTag();
        if (!unknown || unknown->number != 2U)
        {
            llvm::consumeError(unknown.takeError());
            std::cerr << "expected unknown field tag\n";
            return false;
        }
        if (llvm::Error err = reader.skip(unknown->type))
        {
            std::cerr << "skip failed: " << llvm::toString(std::move(err)) << "\n";
            return false;
        }
        if (reader.offset() != 3U)
        {
            std::cerr << "skip must consume the whole varint\n";
            return false;
        }
    }

    return true;
}
