//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Fatal generation error taxonomy carried through `llvm::Error`.
///
//===----------------------------------------------------------------------===//
#ifndef WIREGOLD_SUPPORT_GENERATIONERROR_H
#define WIREGOLD_SUPPORT_GENERATIONERROR_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/raw_ostream.h"

#include <optional>
#include <string>
#include <system_error>

namespace wiregold
{

class DiagnosticEngine;

/// @brief Classification of a fatal generation failure.
enum class GenerationErrorKind
{
    /// @brief A schema file, message type, field, or enum constant does not exist.
    SchemaNotFound,

    /// @brief The reference encoder could not be run, exited non-zero, or wrote diagnostics.
    OracleInvocationFailed,

    /// @brief Oracle bytes are shorter than the fixed-width type requires or do not decode.
    MalformedOracleOutput,

    /// @brief A schema field kind has no registered value-domain entry.
    UnsupportedFieldKind,
};

/// @brief Returns the stable spelling of an error kind.
[[nodiscard]] llvm::StringRef generationErrorKindName(GenerationErrorKind kind);

/// @brief Error payload naming the failing operation and its subject.
class GenerationError final : public llvm::ErrorInfo<GenerationError>
{
public:
    /// @brief LLVM RTTI anchor.
    static char ID;

    /// @brief Constructs one error payload.
    /// @param[in] kind Failure classification.
    /// @param[in] operation Pipeline operation that failed.
    /// @param[in] subject Message type, field path, or file being processed.
    /// @param[in] detail Human-readable failure description.
    GenerationError(GenerationErrorKind kind, std::string operation, std::string subject, std::string detail);

    void log(llvm::raw_ostream& os) const override;

    std::error_code convertToErrorCode() const override;

    [[nodiscard]] GenerationErrorKind kind() const
    {
        return kind_;
    }

    [[nodiscard]] const std::string& operation() const
    {
        return operation_;
    }

    [[nodiscard]] const std::string& subject() const
    {
        return subject_;
    }

    [[nodiscard]] const std::string& detail() const
    {
        return detail_;
    }

private:
    GenerationErrorKind kind_;
    std::string         operation_;
    std::string         subject_;
    std::string         detail_;
};

/// @brief Creates an `llvm::Error` holding a @ref GenerationError.
llvm::Error makeGenerationError(GenerationErrorKind kind,
                                std::string         operation,
                                std::string         subject,
                                std::string         detail);

/// @brief Consumes an error and records it as an error diagnostic.
///
/// @details
/// @ref GenerationError payloads keep their operation and subject as the
/// diagnostic site. Any other payload is reported against `fallbackOperation`.
///
/// @param[in] err Error to consume; may be success.
/// @param[in] fallbackOperation Site operation used for foreign payloads.
/// @param[in,out] diagnostics Diagnostic sink.
/// @return True when `err` held a failure.
bool reportGenerationError(llvm::Error err, llvm::StringRef fallbackOperation, DiagnosticEngine& diagnostics);

/// @brief Consumes an error and returns its kind when it is a @ref GenerationError.
[[nodiscard]] std::optional<GenerationErrorKind> consumeGenerationErrorKind(llvm::Error err);

}  // namespace wiregold

#endif  // WIREGOLD_SUPPORT_GENERATIONERROR_H
