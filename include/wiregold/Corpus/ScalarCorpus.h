//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Boundary-value corpora for the single-field scalar tier.
///
//===----------------------------------------------------------------------===//
#ifndef WIREGOLD_CORPUS_SCALARCORPUS_H
#define WIREGOLD_CORPUS_SCALARCORPUS_H

#include "wiregold/Domain/FieldValue.h"
#include "wiregold/Domain/ScalarKind.h"

#include <string>
#include <vector>

namespace wiregold
{

/// @brief Schema file holding the scalar wrapper messages.
inline constexpr const char* kSimpleSchemaFile = "simple.proto";

/// @brief Ordered input values for one scalar kind.
struct ScalarCorpus final
{
    ScalarKind kind{ScalarKind::Int32};

    /// @brief Fully-qualified wrapper message (`codec.simple.Int32Value`).
    std::string messageType;

    /// @brief Values in emission order; enum values carry symbol names only.
    std::vector<ScalarValue> values;
};

/// @brief Returns the wrapper message type used for @p kind.
[[nodiscard]] std::string scalarWrapperMessage(ScalarKind kind);

/// @brief Builds the corpus for one kind.
[[nodiscard]] ScalarCorpus buildScalarCorpus(ScalarKind kind);

/// @brief Builds corpora for every kind in registry order.
[[nodiscard]] std::vector<ScalarCorpus> buildScalarCorpora();

}  // namespace wiregold

#endif  // WIREGOLD_CORPUS_SCALARCORPUS_H
