//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements diagnostic collection and site formatting helpers.
///
//===----------------------------------------------------------------------===//

#include "wiregold/Support/Diagnostics.h"

#include <utility>

namespace wiregold
{

DiagnosticSite DiagnosticSite::atSource(std::string file, const std::uint32_t line, const std::uint32_t column)
{
    DiagnosticSite site;
    site.file   = std::move(file);
    site.line   = line;
    site.column = column;
    return site;
}

DiagnosticSite DiagnosticSite::atOperation(std::string operation, std::string subject)
{
    DiagnosticSite site;
    site.operation = std::move(operation);
    site.subject   = std::move(subject);
    return site;
}

std::string DiagnosticSite::str() const
{
    if (!file.empty())
    {
        if (line == 0)
        {
            return file;
        }
        return file + ":" + std::to_string(line) + ":" + std::to_string(column);
    }
    if (operation.empty())
    {
        return subject.empty() ? std::string("wiregold") : subject;
    }
    if (subject.empty())
    {
        return operation;
    }
    return operation + "[" + subject + "]";
}

void DiagnosticEngine::report(DiagnosticLevel level, const DiagnosticSite& site, std::string message)
{
    diagnostics_.push_back(Diagnostic{level, site, std::move(message)});
}

void DiagnosticEngine::note(const DiagnosticSite& site, std::string message)
{
    report(DiagnosticLevel::Note, site, std::move(message));
}

void DiagnosticEngine::warning(const DiagnosticSite& site, std::string message)
{
    report(DiagnosticLevel::Warning, site, std::move(message));
}

void DiagnosticEngine::error(const DiagnosticSite& site, std::string message)
{
    report(DiagnosticLevel::Error, site, std::move(message));
}

bool DiagnosticEngine::hasErrors() const
{
    for (const Diagnostic& d : diagnostics_)
    {
        if (d.level == DiagnosticLevel::Error)
        {
            return true;
        }
    }
    return false;
}

}  // namespace wiregold
