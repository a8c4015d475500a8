//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Schema-driven canonical encode/decode and golden-case canonicalization.
///
/// The canonical encoder writes fields in ascending field-number order and
/// applies each field's default-omission rule. The decoder accepts packed and
/// unpacked repeated encodings, keeps the last occurrence of singular fields
/// and skips unknown field numbers by wire type.
///
//===----------------------------------------------------------------------===//
#ifndef WIREGOLD_CANON_CANONICALIZE_H
#define WIREGOLD_CANON_CANONICALIZE_H

#include "wiregold/Domain/FieldValue.h"
#include "wiregold/Schema/SchemaModel.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/Support/Error.h"

#include <cstdint>

namespace wiregold
{

/// @brief Extracts the float32 bit pattern following exactly one tag byte.
/// @return Bits, or `MalformedOracleOutput` for fewer than five bytes.
llvm::Expected<std::uint32_t> floatBitsFromEncoded(llvm::ArrayRef<std::uint8_t> encoded);

/// @brief Extracts the float64 bit pattern following exactly one tag byte.
/// @return Bits, or `MalformedOracleOutput` for fewer than nine bytes.
llvm::Expected<std::uint64_t> doubleBitsFromEncoded(llvm::ArrayRef<std::uint8_t> encoded);

/// @brief Checks field names against the schema and fills enum numbers from
/// enum symbol names, recursively.
/// @return `SchemaNotFound` for an unknown field or enum constant.
llvm::Error bindMessageValue(const SchemaFile& schema, const MessageSpec& message, MessageValue& value);

/// @brief Encodes a bound value canonically.
llvm::Expected<ByteString> encodeMessage(const SchemaFile& schema,
                                         const MessageSpec& message,
                                         const MessageValue& value);

/// @brief Decodes bytes into a value using the schema for dispatch.
/// @return Decoded value, or `MalformedOracleOutput` on any wire error or
///         invalid UTF-8 in a string field.
llvm::Expected<MessageValue> decodeMessage(const SchemaFile&             schema,
                                           const MessageSpec&            message,
                                           llvm::ArrayRef<std::uint8_t> encoded);

/// @brief Canonical expected value of one single-field scalar case.
///
/// @details Float kinds yield the raw bit pattern as an unsigned value. Every
/// other kind yields the decoded value, which must equal @p input.
llvm::Expected<ScalarValue> canonicalizeScalarCase(const SchemaFile&             schema,
                                                   const MessageSpec&            message,
                                                   ScalarKind                    kind,
                                                   const ScalarValue&            input,
                                                   llvm::ArrayRef<std::uint8_t> oracleBytes);

/// @brief Canonical expected value of one composite case.
///
/// @details Both @p input and the value decoded from @p oracleBytes must
/// re-encode to exactly @p oracleBytes; the decoded value is returned.
llvm::Expected<MessageValue> canonicalizeCompositeCase(const SchemaFile&             schema,
                                                       const MessageSpec&            message,
                                                       const MessageValue&           input,
                                                       llvm::ArrayRef<std::uint8_t> oracleBytes);

}  // namespace wiregold

#endif  // WIREGOLD_CANON_CANONICALIZE_H
