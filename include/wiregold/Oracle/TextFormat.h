//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Renders message values in the protobuf text format read by the oracle.
///
//===----------------------------------------------------------------------===//
#ifndef WIREGOLD_ORACLE_TEXTFORMAT_H
#define WIREGOLD_ORACLE_TEXTFORMAT_H

#include "wiregold/Domain/FieldValue.h"
#include "wiregold/Schema/SchemaModel.h"

#include "llvm/Support/Error.h"

#include <string>

namespace wiregold
{

/// @brief Renders @p value as text-format input for `protoc --encode`.
///
/// @details Fields appear in the order they were set. Repeated values become
/// repeated `name: value` lines and sub-messages become brace blocks indented
/// by two spaces per level. The text always ends with a newline when
/// non-empty.
///
/// @return Text, `SchemaNotFound` for an undeclared field, or
///         `UnsupportedFieldKind` when a value does not fit its field kind.
llvm::Expected<std::string> renderTextFormatMessage(const SchemaFile&   schema,
                                                    const MessageSpec&  message,
                                                    const MessageValue& value);

}  // namespace wiregold

#endif  // WIREGOLD_ORACLE_TEXTFORMAT_H
