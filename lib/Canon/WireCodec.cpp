//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include "wiregold/Canon/WireCodec.h"

#include "wiregold/Support/GenerationError.h"

#include <string>

namespace wiregold
{
namespace
{

constexpr std::size_t kMaxVarintBytes = 10;

llvm::Error malformed(std::size_t offset, std::string detail)
{
    return makeGenerationError(GenerationErrorKind::MalformedOracleOutput,
                               "wire-decode",
                               "offset " + std::to_string(offset),
                               std::move(detail));
}

}  // namespace

void WireWriter::writeVarint(std::uint64_t value)
{
    while (value >= 0x80U)
    {
        bytes_.push_back(static_cast<std::uint8_t>((value & 0x7FU) | 0x80U));
        value >>= 7U;
    }
    bytes_.push_back(static_cast<std::uint8_t>(value));
}

void WireWriter::writeTag(const std::uint32_t number, const WireType type)
{
    writeVarint(makeTagKey(number, type));
}

void WireWriter::writeFixed32(const std::uint32_t value)
{
    for (std::uint32_t shift = 0; shift < 32U; shift += 8U)
    {
        bytes_.push_back(static_cast<std::uint8_t>((value >> shift) & 0xFFU));
    }
}

void WireWriter::writeFixed64(const std::uint64_t value)
{
    for (std::uint32_t shift = 0; shift < 64U; shift += 8U)
    {
        bytes_.push_back(static_cast<std::uint8_t>((value >> shift) & 0xFFU));
    }
}

void WireWriter::writeLengthDelimited(llvm::ArrayRef<std::uint8_t> payload)
{
    writeVarint(payload.size());
    bytes_.insert(bytes_.end(), payload.begin(), payload.end());
}

WireReader::WireReader(llvm::ArrayRef<std::uint8_t> bytes)
    : bytes_(bytes)
{
}

llvm::Error WireReader::truncated(const char* what) const
{
    return malformed(offset_, std::string("truncated ") + what);
}

llvm::Expected<std::uint64_t> WireReader::readVarint()
{
    std::uint64_t value = 0;
    for (std::size_t i = 0; i < kMaxVarintBytes; ++i)
    {
        if (atEnd())
        {
            return truncated("varint");
        }
        const std::uint8_t octet = bytes_[offset_++];
        value |= static_cast<std::uint64_t>(octet & 0x7FU) << (7U * i);
        if ((octet & 0x80U) == 0U)
        {
            return value;
        }
    }
    return malformed(offset_, "varint longer than ten bytes");
}

llvm::Expected<WireTag> WireReader::readTag()
{
    const std::size_t start = offset_;
    auto              key   = readVarint();
    if (!key)
    {
        return key.takeError();
    }
    const std::uint64_t number = *key >> 3U;
    if (number == 0U || number > kMaxWireFieldNumber)
    {
        return malformed(start, "field number " + std::to_string(number) + " is out of range");
    }
    const std::uint32_t bits = static_cast<std::uint32_t>(*key & 0x7U);
    const auto          type = wireTypeFromBits(bits);
    if (!type)
    {
        return malformed(start, "unsupported wire type " + std::to_string(bits));
    }
    return WireTag{static_cast<std::uint32_t>(number), *type};
}

llvm::Expected<std::uint32_t> WireReader::readFixed32()
{
    if (bytes_.size() - offset_ < 4U)
    {
        return truncated("fixed32");
    }
    std::uint32_t value = 0;
    for (std::uint32_t i = 0; i < 4U; ++i)
    {
        value |= static_cast<std::uint32_t>(bytes_[offset_++]) << (8U * i);
    }
    return value;
}

llvm::Expected<std::uint64_t> WireReader::readFixed64()
{
    if (bytes_.size() - offset_ < 8U)
    {
        return truncated("fixed64");
    }
    std::uint64_t value = 0;
    for (std::uint32_t i = 0; i < 8U; ++i)
    {
        value |= static_cast<std::uint64_t>(bytes_[offset_++]) << (8U * i);
    }
    return value;
}

llvm::Expected<llvm::ArrayRef<std::uint8_t>> WireReader::readLengthDelimited()
{
    auto length = readVarint();
    if (!length)
    {
        return length.takeError();
    }
    if (*length > bytes_.size() - offset_)
    {
        return malformed(offset_,
                         "length " + std::to_string(*length) + " exceeds the " +
                             std::to_string(bytes_.size() - offset_) + " remaining bytes");
    }
    const llvm::ArrayRef<std::uint8_t> payload = bytes_.slice(offset_, static_cast<std::size_t>(*length));
    offset_ += static_cast<std::size_t>(*length);
    return payload;
}

llvm::Error WireReader::skip(const WireType type)
{
    switch (type)
    {
    case WireType::Varint:
        return readVarint().takeError();
    case WireType::Fixed64:
        return readFixed64().takeError();
    case WireType::LengthDelimited:
        return readLengthDelimited().takeError();
    case WireType::Fixed32:
        return readFixed32().takeError();
    }
    return malformed(offset_, "unsupported wire type");
}

}  // namespace wiregold
