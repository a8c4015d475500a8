//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Minimal protobuf wire-format reader and writer used to canonicalize and
/// cross-check reference-encoder output.
///
//===----------------------------------------------------------------------===//
#ifndef WIREGOLD_CANON_WIRECODEC_H
#define WIREGOLD_CANON_WIRECODEC_H

#include "wiregold/Domain/FieldValue.h"
#include "wiregold/Domain/WireType.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/Support/Error.h"

#include <cstddef>
#include <cstdint>

namespace wiregold
{

/// @brief Largest field number representable in a tag.
inline constexpr std::uint32_t kMaxWireFieldNumber = (1U << 29U) - 1U;

/// @brief Decoded field key.
struct WireTag final
{
    std::uint32_t number{0};
    WireType      type{WireType::Varint};
};

[[nodiscard]] constexpr std::uint64_t encodeZigZag64(const std::int64_t value)
{
    return (static_cast<std::uint64_t>(value) << 1U) ^ static_cast<std::uint64_t>(value >> 63);
}

[[nodiscard]] constexpr std::int64_t decodeZigZag64(const std::uint64_t value)
{
    return static_cast<std::int64_t>(value >> 1U) ^ -static_cast<std::int64_t>(value & 1U);
}

[[nodiscard]] constexpr std::uint32_t encodeZigZag32(const std::int32_t value)
{
    return (static_cast<std::uint32_t>(value) << 1U) ^ static_cast<std::uint32_t>(value >> 31);
}

[[nodiscard]] constexpr std::int32_t decodeZigZag32(const std::uint32_t value)
{
    return static_cast<std::int32_t>(value >> 1U) ^ -static_cast<std::int32_t>(value & 1U);
}

/// @brief Append-only wire-format byte builder.
class WireWriter final
{
public:
    void writeVarint(std::uint64_t value);

    void writeTag(std::uint32_t number, WireType type);

    /// @brief Little-endian four-byte payload.
    void writeFixed32(std::uint32_t value);

    /// @brief Little-endian eight-byte payload.
    void writeFixed64(std::uint64_t value);

    /// @brief Varint length prefix followed by @p payload.
    void writeLengthDelimited(llvm::ArrayRef<std::uint8_t> payload);

    [[nodiscard]] const ByteString& bytes() const
    {
        return bytes_;
    }

    [[nodiscard]] ByteString take()
    {
        return std::move(bytes_);
    }

private:
    ByteString bytes_;
};

/// @brief Bounds-checked cursor over encoded bytes.
///
/// @details Every failure is a `MalformedOracleOutput` error naming the byte
/// offset where decoding stopped.
class WireReader final
{
public:
    explicit WireReader(llvm::ArrayRef<std::uint8_t> bytes);

    [[nodiscard]] bool atEnd() const
    {
        return offset_ >= bytes_.size();
    }

    [[nodiscard]] std::size_t offset() const
    {
        return offset_;
    }

    /// @brief Reads a base-128 varint of at most ten bytes.
    llvm::Expected<std::uint64_t> readVarint();

    /// @brief Reads a field key; rejects field number zero and group or
    /// reserved wire types.
    llvm::Expected<WireTag> readTag();

    llvm::Expected<std::uint32_t> readFixed32();

    llvm::Expected<std::uint64_t> readFixed64();

    /// @brief Reads a length prefix and returns a view of the payload.
    llvm::Expected<llvm::ArrayRef<std::uint8_t>> readLengthDelimited();

    /// @brief Skips one value of the given wire type.
    llvm::Error skip(WireType type);

private:
    llvm::Error truncated(const char* what) const;

    llvm::ArrayRef<std::uint8_t> bytes_;
    std::size_t                  offset_{0};
};

}  // namespace wiregold

#endif  // WIREGOLD_CANON_WIRECODEC_H
