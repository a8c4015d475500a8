//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the generation error payload and its diagnostic bridge.
///
//===----------------------------------------------------------------------===//

#include "wiregold/Support/GenerationError.h"

#include "wiregold/Support/Diagnostics.h"

#include <utility>

namespace wiregold
{

char GenerationError::ID = 0;

llvm::StringRef generationErrorKindName(const GenerationErrorKind kind)
{
    switch (kind)
    {
    case GenerationErrorKind::SchemaNotFound:
        return "schema-not-found";
    case GenerationErrorKind::OracleInvocationFailed:
        return "oracle-invocation-failed";
    case GenerationErrorKind::MalformedOracleOutput:
        return "malformed-oracle-output";
    case GenerationErrorKind::UnsupportedFieldKind:
        return "unsupported-field-kind";
    }
    return "unknown";
}

GenerationError::GenerationError(GenerationErrorKind kind,
                                 std::string         operation,
                                 std::string         subject,
                                 std::string         detail)
    : kind_(kind)
    , operation_(std::move(operation))
    , subject_(std::move(subject))
    , detail_(std::move(detail))
{
}

void GenerationError::log(llvm::raw_ostream& os) const
{
    os << DiagnosticSite::atOperation(operation_, subject_).str() << ": " << generationErrorKindName(kind_) << ": "
       << detail_;
}

std::error_code GenerationError::convertToErrorCode() const
{
    return llvm::inconvertibleErrorCode();
}

llvm::Error makeGenerationError(GenerationErrorKind kind,
                                std::string         operation,
                                std::string         subject,
                                std::string         detail)
{
    return llvm::make_error<GenerationError>(kind, std::move(operation), std::move(subject), std::move(detail));
}

bool reportGenerationError(llvm::Error err, llvm::StringRef fallbackOperation, DiagnosticEngine& diagnostics)
{
    if (!err)
    {
        return false;
    }
    llvm::handleAllErrors(
        std::move(err),
        [&](const GenerationError& failure) {
            diagnostics.error(DiagnosticSite::atOperation(failure.operation(), failure.subject()),
                              generationErrorKindName(failure.kind()).str() + ": " + failure.detail());
        },
        [&](const llvm::ErrorInfoBase& failure) {
            diagnostics.error(DiagnosticSite::atOperation(fallbackOperation.str()), failure.message());
        });
    return true;
}

std::optional<GenerationErrorKind> consumeGenerationErrorKind(llvm::Error err)
{
    std::optional<GenerationErrorKind> kind;
    llvm::handleAllErrors(
        std::move(err),
        [&](const GenerationError& failure) { kind = failure.kind(); },
        [](const llvm::ErrorInfoBase&) {});
    return kind;
}

}  // namespace wiregold
