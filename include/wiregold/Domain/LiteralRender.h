//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Literal rendering for scalar values in the oracle text grammar and in
/// generated C++ assertion tables.
///
//===----------------------------------------------------------------------===//
#ifndef WIREGOLD_DOMAIN_LITERALRENDER_H
#define WIREGOLD_DOMAIN_LITERALRENDER_H

#include "wiregold/Domain/FieldValue.h"
#include "wiregold/Domain/ScalarKind.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"

#include <cstdint>
#include <string>

namespace wiregold
{

/// @brief Literal syntax selected for rendering.
enum class LiteralGrammar
{
    /// @brief Protocol-buffers text format consumed by the reference encoder.
    TextFormat,

    /// @brief C++20 expression syntax used by generated artifacts.
    Cpp,
};

/// @brief Returns true when @p value uses the representation expected for
/// @p kind (floats also accept an unsigned bit pattern).
[[nodiscard]] bool scalarFitsKind(ScalarKind kind, const ScalarValue& value);

/// @brief Renders a scalar value as a literal of one grammar.
///
/// @details Float kinds holding an unsigned value (a canonical bit pattern)
/// render as a hexadecimal unsigned literal in the C++ grammar.
///
/// @param[in] grammar Target literal syntax.
/// @param[in] kind Scalar kind of the field the value belongs to.
/// @param[in] value Value to render.
/// @return Rendered literal text.
std::string renderScalarLiteral(LiteralGrammar grammar, ScalarKind kind, const ScalarValue& value);

/// @brief Formats a real number with `significantDigits` digits in `%g` style.
///
/// @details The exponent is normalized: leading zeros and a `+` sign are
/// dropped (`1e+020` becomes `1e20`, `1e-09` becomes `1e-9`). Special values
/// are not handled here.
std::string formatRealDigits(double value, unsigned significantDigits);

/// @brief Normalizes the exponent part of a `%g`-formatted number.
std::string normalizeExponent(llvm::StringRef formatted);

/// @brief Renders a raw float bit pattern as a hexadecimal C++ literal.
/// @param[in] kind `Float` (32-bit literal) or `Double` (64-bit literal).
/// @param[in] bits Bit pattern in the low bits.
std::string renderCppBitsLiteral(ScalarKind kind, std::uint64_t bits);

/// @brief Quotes text for the oracle grammar (octal escapes for non-printable bytes).
std::string quoteTextFormatString(llvm::StringRef text);

/// @brief Quotes bytes for the oracle grammar (`\xHH` for every byte).
std::string quoteTextFormatBytes(llvm::ArrayRef<std::uint8_t> bytes);

/// @brief Quotes text as a C++ string literal expression.
std::string quoteCppString(llvm::StringRef text);

}  // namespace wiregold

#endif  // WIREGOLD_DOMAIN_LITERALRENDER_H
