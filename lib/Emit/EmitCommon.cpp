//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Atomic artifact writes and depfile rendering.
///
//===----------------------------------------------------------------------===//

#include "wiregold/Emit/EmitCommon.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/raw_ostream.h"

#include <algorithm>
#include <system_error>

namespace wiregold
{

namespace
{

std::filesystem::perms permsFromMode(const std::uint32_t mode)
{
    using Perm = std::filesystem::perms;
    static constexpr struct
    {
        std::uint32_t bit;
        Perm          perm;
    } kBits[] = {
        {0400U, Perm::owner_read},
        {0200U, Perm::owner_write},
        {0100U, Perm::owner_exec},
        {0040U, Perm::group_read},
        {0020U, Perm::group_write},
        {0010U, Perm::group_exec},
        {0004U, Perm::others_read},
        {0002U, Perm::others_write},
        {0001U, Perm::others_exec},
    };

    Perm out = Perm::none;
    for (const auto& entry : kBits)
    {
        if ((mode & entry.bit) != 0U)
        {
            out |= entry.perm;
        }
    }
    return out;
}

std::string absoluteNormalizedPath(const std::filesystem::path& path)
{
    std::error_code ec;
    const auto      absolute = std::filesystem::absolute(path, ec);
    if (ec)
    {
        return path.lexically_normal().string();
    }
    return absolute.lexically_normal().string();
}

std::string escapeMakeToken(llvm::StringRef text)
{
    std::string out;
    out.reserve(text.size());

    for (const char c : text)
    {
        switch (c)
        {
        case '\\':
            out.append("\\\\");
            break;
        case ' ':
            out.append("\\ ");
            break;
        case '\t':
            out.push_back('\\');
            out.push_back('\t');
            break;
        case '#':
            out.append("\\#");
            break;
        case '$':
            out.append("$$");
            break;
        case ':':
            out.append("\\:");
            break;
        default:
            out.push_back(c);
            break;
        }
    }

    return out;
}

}  // namespace

void emitLine(std::ostream& out, const int indent, llvm::StringRef line)
{
    if (!line.empty())
    {
        out << std::string(static_cast<std::size_t>(indent) * 4U, ' ');
        out.write(line.data(), static_cast<std::streamsize>(line.size()));
    }
    out << '\n';
}

std::string renderGeneratedBanner(llvm::StringRef source)
{
    return "// Code generated by wiregold-gen from " + source.str() + ". DO NOT EDIT.";
}

llvm::Error writeGeneratedFile(const std::filesystem::path& path,
                               llvm::StringRef               content,
                               const EmitWritePolicy&        policy)
{
    std::error_code ec;

    const auto parent = path.parent_path();
    if (!parent.empty())
    {
        std::filesystem::create_directories(parent, ec);
        if (ec)
        {
            return llvm::createStringError(ec, "failed to create output directory %s", parent.string().c_str());
        }
    }

    const std::filesystem::path   model = path.string() + ".tmp-%%%%%%";
    int                           fd    = -1;
    llvm::SmallString<256>        tempPath;
    if (const std::error_code createEc = llvm::sys::fs::createUniqueFile(model.string(), fd, tempPath))
    {
        return llvm::createStringError(createEc, "failed to create temporary file for %s", path.string().c_str());
    }

    {
        llvm::raw_fd_ostream os(fd, /*shouldClose=*/true);
        os << content;
        os.close();
        if (os.has_error())
        {
            const std::error_code writeEc = os.error();
            os.clear_error();
            llvm::sys::fs::remove(tempPath);
            return llvm::createStringError(writeEc, "failed to write %s", path.string().c_str());
        }
    }

    std::filesystem::permissions(tempPath.str().str(),
                                 permsFromMode(policy.fileMode),
                                 std::filesystem::perm_options::replace,
                                 ec);
    if (ec)
    {
        llvm::sys::fs::remove(tempPath);
        return llvm::createStringError(ec, "failed to set mode on %s", path.string().c_str());
    }

    if (const std::error_code renameEc = llvm::sys::fs::rename(tempPath, path.string()))
    {
        llvm::sys::fs::remove(tempPath);
        return llvm::createStringError(renameEc, "failed to replace %s", path.string().c_str());
    }

    if (policy.recordedOutputs != nullptr)
    {
        policy.recordedOutputs->push_back(absoluteNormalizedPath(path));
    }
    return llvm::Error::success();
}

std::string renderMakeDepfile(const std::string& target, const std::vector<std::string>& deps)
{
    std::vector<std::string> normalizedDeps = deps;
    std::sort(normalizedDeps.begin(), normalizedDeps.end());
    normalizedDeps.erase(std::unique(normalizedDeps.begin(), normalizedDeps.end()), normalizedDeps.end());

    std::string out = escapeMakeToken(target);
    out += ':';
    for (const auto& dep : normalizedDeps)
    {
        out.push_back(' ');
        out += escapeMakeToken(dep);
    }
    out.push_back('\n');
    return out;
}

llvm::Error writeDepfileForGeneratedOutput(const std::filesystem::path&    outputPath,
                                           const std::vector<std::string>& deps,
                                           const EmitWritePolicy&          policy)
{
    const std::filesystem::path depfilePath = outputPath.string() + ".d";

    std::vector<std::string> normalizedDeps;
    normalizedDeps.reserve(deps.size());
    for (const auto& dep : deps)
    {
        normalizedDeps.push_back(absoluteNormalizedPath(dep));
    }

    return writeGeneratedFile(depfilePath,
                              renderMakeDepfile(absoluteNormalizedPath(outputPath), normalizedDeps),
                              policy);
}

}  // namespace wiregold
