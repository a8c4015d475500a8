//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Seeded and synthetic case sets for the composite message tiers.
///
/// Synthetic case `i` picks each field from its own candidate pool at index
/// `(i * k) % pool.size()`. Multipliers and pool order are frozen so that
/// regenerated artifacts stay byte-identical.
///
//===----------------------------------------------------------------------===//
#ifndef WIREGOLD_CORPUS_COMPOSITECORPUS_H
#define WIREGOLD_CORPUS_COMPOSITECORPUS_H

#include "wiregold/Domain/FieldValue.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace wiregold
{

inline constexpr const char* kMiddleSchemaFile    = "middle.proto";
inline constexpr const char* kMiddleMessageType   = "codec.middle.Middle";
inline constexpr const char* kDifficultSchemaFile = "difficult.proto";
inline constexpr const char* kDifficultMessageType = "codec.difficult.Difficult";

/// @brief One composite input, fields recorded in oracle text order.
struct CompositeCase final
{
    /// @brief `seed-N` or `synthetic-N`.
    std::string label;

    MessageValue value;
};

struct CompositeCorpus final
{
    std::string                schemaFile;
    std::string                messageType;
    std::vector<CompositeCase> cases;
};

/// @brief Returns the pool index used by synthetic case @p caseIndex.
[[nodiscard]] constexpr std::size_t syntheticPoolIndex(const std::size_t caseIndex,
                                                       const std::size_t multiplier,
                                                       const std::size_t poolSize)
{
    return (caseIndex * multiplier) % poolSize;
}

/// @brief Builds the middle-tier corpus: six seeds then @p syntheticCount generated cases.
[[nodiscard]] CompositeCorpus buildMiddleCorpus(std::uint32_t syntheticCount);

/// @brief Builds the difficult-tier corpus: six seeds then @p syntheticCount generated cases.
[[nodiscard]] CompositeCorpus buildDifficultCorpus(std::uint32_t syntheticCount);

}  // namespace wiregold

#endif  // WIREGOLD_CORPUS_COMPOSITECORPUS_H
