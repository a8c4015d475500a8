//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Declarations for diagnostic reporting interfaces used across schema loading, oracle calls, and emission.
///
//===----------------------------------------------------------------------===//
#ifndef WIREGOLD_SUPPORT_DIAGNOSTICS_H
#define WIREGOLD_SUPPORT_DIAGNOSTICS_H

#include <cstdint>
#include <string>
#include <vector>

namespace wiregold
{

/// @brief Severity level for a diagnostic message.
enum class DiagnosticLevel
{

    /// @brief Informational note.
    Note,

    /// @brief Non-fatal warning.
    Warning,

    /// @brief Fatal error.
    Error,
};

/// @brief Identifies where a diagnostic originated.
///
/// @details
/// Schema diagnostics carry a file position. Generation diagnostics carry the
/// failing operation (for example `oracle-encode`) and the subject it was
/// processing (a message type or field path). Either half may be empty.
struct DiagnosticSite
{
    /// @brief Source file path, empty for non-schema diagnostics.
    std::string file;

    /// @brief 1-based source line, zero when unknown.
    std::uint32_t line{0};

    /// @brief 1-based source column, zero when unknown.
    std::uint32_t column{0};

    /// @brief Pipeline operation name.
    std::string operation;

    /// @brief Message type or field path being processed.
    std::string subject;

    /// @brief Builds a site for a position inside a schema file.
    static DiagnosticSite atSource(std::string file, std::uint32_t line, std::uint32_t column);

    /// @brief Builds a site for a pipeline operation.
    static DiagnosticSite atOperation(std::string operation, std::string subject = {});

    /// @brief Formats this site as a human-readable prefix.
    /// @return `file:line:col`, `operation[subject]`, or `wiregold` when empty.
    [[nodiscard]] std::string str() const;
};

/// @brief Single diagnostic record produced by the pipeline.
struct Diagnostic
{
    /// @brief Severity level.
    DiagnosticLevel level;

    /// @brief Origin of the message.
    DiagnosticSite site;

    /// @brief Human-readable message text.
    std::string message;
};

/// @brief Accumulates diagnostics emitted across all generation stages.
class DiagnosticEngine final
{
public:
    /// @brief Appends a diagnostic entry.
    /// @param[in] level Severity level.
    /// @param[in] site Origin of the message.
    /// @param[in] message Human-readable message text.
    void report(DiagnosticLevel level, const DiagnosticSite& site, std::string message);

    /// @brief Emits a note-level diagnostic.
    void note(const DiagnosticSite& site, std::string message);

    /// @brief Emits a warning-level diagnostic.
    void warning(const DiagnosticSite& site, std::string message);

    /// @brief Emits an error-level diagnostic.
    void error(const DiagnosticSite& site, std::string message);

    /// @brief Indicates whether any error diagnostics were recorded.
    /// @return True when at least one error exists.
    [[nodiscard]] bool hasErrors() const;

    /// @brief Returns all recorded diagnostics in insertion order.
    /// @return Immutable diagnostic list.
    [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const
    {
        return diagnostics_;
    }

private:
    /// @brief Backing storage for collected diagnostics.
    std::vector<Diagnostic> diagnostics_;
};

}  // namespace wiregold

#endif  // WIREGOLD_SUPPORT_DIAGNOSTICS_H
