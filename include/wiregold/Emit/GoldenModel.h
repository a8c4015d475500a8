//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Canonicalized fixture/expectation pairs handed to the artifact renderers.
///
//===----------------------------------------------------------------------===//
#ifndef WIREGOLD_EMIT_GOLDENMODEL_H
#define WIREGOLD_EMIT_GOLDENMODEL_H

#include "wiregold/Domain/FieldValue.h"
#include "wiregold/Domain/ScalarKind.h"

#include <string>
#include <vector>

namespace wiregold
{

/// @brief Oracle bytes of one single-field message and the canonical value they carry.
///
/// @details Float kinds carry the IEEE-754 bit pattern as an unsigned value.
struct ScalarGoldenEntry final
{
    ByteString  fixture;
    ScalarValue expected;
};

/// @brief All entries for one scalar kind, in corpus order.
struct ScalarGoldenTable final
{
    ScalarKind                     kind{ScalarKind::Int32};
    std::string                    messageType;
    std::vector<ScalarGoldenEntry> entries;
};

/// @brief Oracle bytes of one composite case and the value decoded from them.
struct CompositeGoldenEntry final
{
    std::string  label;
    ByteString   fixture;
    MessageValue expected;
};

}  // namespace wiregold

#endif  // WIREGOLD_EMIT_GOLDENMODEL_H
