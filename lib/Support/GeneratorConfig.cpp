//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements JSON configuration loading and validation.
///
//===----------------------------------------------------------------------===//

#include "wiregold/Support/GeneratorConfig.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/Path.h"

#include <cctype>
#include <limits>

namespace wiregold
{
namespace
{

llvm::Error invalidSetting(llvm::StringRef key, llvm::StringRef expectation)
{
    return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                   "invalid configuration value for '%s': expected %s",
                                   key.str().c_str(),
                                   expectation.str().c_str());
}

std::string resolveAgainst(llvm::StringRef baseDir, llvm::StringRef path)
{
    if (baseDir.empty() || path.empty() || llvm::sys::path::is_absolute(path))
    {
        return path.str();
    }
    llvm::SmallString<256> resolved(baseDir);
    llvm::sys::path::append(resolved, path);
    return std::string(resolved.str());
}

llvm::Error applyString(const llvm::json::Object& settings, llvm::StringRef key, std::string& out)
{
    const auto* value = settings.get(key);
    if (!value)
    {
        return llvm::Error::success();
    }
    const auto text = value->getAsString();
    if (!text)
    {
        return invalidSetting(key, "a string");
    }
    out = text->str();
    return llvm::Error::success();
}

llvm::Error applyPath(const llvm::json::Object& settings,
                      llvm::StringRef           key,
                      llvm::StringRef           baseDir,
                      std::string&              out)
{
    const auto* value = settings.get(key);
    if (!value)
    {
        return llvm::Error::success();
    }
    const auto text = value->getAsString();
    if (!text)
    {
        return invalidSetting(key, "a path string");
    }
    out = resolveAgainst(baseDir, *text);
    return llvm::Error::success();
}

llvm::Error applyIncludeDirs(const llvm::json::Object& settings, llvm::StringRef baseDir, GeneratorConfig& config)
{
    const auto* value = settings.get("includeDirs");
    if (!value)
    {
        return llvm::Error::success();
    }
    const auto* array = value->getAsArray();
    if (!array)
    {
        return invalidSetting("includeDirs", "an array of path strings");
    }
    std::vector<std::string> dirs;
    dirs.reserve(array->size());
    for (const llvm::json::Value& item : *array)
    {
        const auto text = item.getAsString();
        if (!text)
        {
            return invalidSetting("includeDirs", "an array of path strings");
        }
        dirs.push_back(resolveAgainst(baseDir, *text));
    }
    config.includeDirs = std::move(dirs);
    return llvm::Error::success();
}

llvm::Error applyCodecSettings(const llvm::json::Object& settings, GeneratorConfig& config)
{
    const auto* codecValue = settings.get("codec");
    if (!codecValue)
    {
        return llvm::Error::success();
    }
    const auto* codec = codecValue->getAsObject();
    if (!codec)
    {
        return invalidSetting("codec", "an object");
    }
    if (llvm::Error err = applyString(*codec, "header", config.codecHeader))
    {
        return err;
    }
    return applyString(*codec, "namespace", config.codecNamespace);
}

llvm::Error applyTiers(const llvm::json::Object& settings, GeneratorConfig& config)
{
    const auto* value = settings.get("tiers");
    if (!value)
    {
        return llvm::Error::success();
    }
    const auto* array = value->getAsArray();
    if (!array)
    {
        return invalidSetting("tiers", "an array of tier names");
    }
    std::vector<GoldenTier> tiers;
    for (const llvm::json::Value& item : *array)
    {
        const auto text = item.getAsString();
        if (!text)
        {
            return invalidSetting("tiers", "an array of tier names");
        }
        const std::optional<GoldenTier> tier = parseGoldenTier(*text);
        if (!tier)
        {
            return invalidSetting("tiers", "one of simple, middle, difficult, malformed");
        }
        tiers.push_back(*tier);
    }
    config.tiers = std::move(tiers);
    return llvm::Error::success();
}

llvm::Error applyCount(const llvm::json::Object& object, llvm::StringRef key, std::uint32_t& out)
{
    const auto* value = object.get(key);
    if (!value)
    {
        return llvm::Error::success();
    }
    const auto count = value->getAsInteger();
    if (!count || *count < 0 || *count > std::numeric_limits<std::uint32_t>::max())
    {
        return invalidSetting(key, "a non-negative integer");
    }
    out = static_cast<std::uint32_t>(*count);
    return llvm::Error::success();
}

llvm::Error applySyntheticCounts(const llvm::json::Object& settings, GeneratorConfig& config)
{
    const auto* syntheticValue = settings.get("synthetic");
    if (!syntheticValue)
    {
        return llvm::Error::success();
    }
    const auto* synthetic = syntheticValue->getAsObject();
    if (!synthetic)
    {
        return invalidSetting("synthetic", "an object");
    }
    if (llvm::Error err = applyCount(*synthetic, "middle", config.middleSyntheticCases))
    {
        return err;
    }
    return applyCount(*synthetic, "difficult", config.difficultSyntheticCases);
}

llvm::Error applyTrace(const llvm::json::Object& settings, GeneratorConfig& config)
{
    const auto* value = settings.get("trace");
    if (!value)
    {
        return llvm::Error::success();
    }
    const auto text = value->getAsString();
    if (!text)
    {
        return invalidSetting("trace", "off, basic, or verbose");
    }
    const std::optional<TraceLevel> level = parseTraceLevel(*text);
    if (!level)
    {
        return invalidSetting("trace", "off, basic, or verbose");
    }
    config.traceLevel = *level;
    return llvm::Error::success();
}

bool isIdentifier(llvm::StringRef text)
{
    if (text.empty() || std::isdigit(static_cast<unsigned char>(text.front())))
    {
        return false;
    }
    for (const char c : text)
    {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_')
        {
            return false;
        }
    }
    return true;
}

}  // namespace

llvm::StringRef goldenTierName(const GoldenTier tier)
{
    switch (tier)
    {
    case GoldenTier::Simple:
        return "simple";
    case GoldenTier::Middle:
        return "middle";
    case GoldenTier::Difficult:
        return "difficult";
    case GoldenTier::Malformed:
        return "malformed";
    }
    return "unknown";
}

std::optional<GoldenTier> parseGoldenTier(llvm::StringRef text)
{
    for (const GoldenTier tier : {GoldenTier::Simple, GoldenTier::Middle, GoldenTier::Difficult, GoldenTier::Malformed})
    {
        if (text == goldenTierName(tier))
        {
            return tier;
        }
    }
    return std::nullopt;
}

std::optional<TraceLevel> parseTraceLevel(llvm::StringRef text)
{
    if (text == "off")
    {
        return TraceLevel::Off;
    }
    if (text == "basic")
    {
        return TraceLevel::Basic;
    }
    if (text == "verbose")
    {
        return TraceLevel::Verbose;
    }
    return std::nullopt;
}

llvm::Error applyConfigJson(const llvm::json::Value& settingsValue, llvm::StringRef baseDir, GeneratorConfig& config)
{
    const auto* settings = settingsValue.getAsObject();
    if (!settings)
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(), "configuration root must be a JSON object");
    }

    if (llvm::Error err = applyPath(*settings, "schemaDir", baseDir, config.schemaDir))
    {
        return err;
    }
    if (llvm::Error err = applyIncludeDirs(*settings, baseDir, config))
    {
        return err;
    }
    if (llvm::Error err = applyPath(*settings, "outDir", baseDir, config.outDir))
    {
        return err;
    }
    if (llvm::Error err = applyString(*settings, "protoc", config.protocPath))
    {
        return err;
    }
    if (llvm::Error err = applyCodecSettings(*settings, config))
    {
        return err;
    }
    if (llvm::Error err = applyTiers(*settings, config))
    {
        return err;
    }
    if (llvm::Error err = applySyntheticCounts(*settings, config))
    {
        return err;
    }
    if (const auto* depfiles = settings->get("depfiles"))
    {
        const auto enabled = depfiles->getAsBoolean();
        if (!enabled)
        {
            return invalidSetting("depfiles", "a boolean");
        }
        config.writeDepfiles = *enabled;
    }
    return applyTrace(*settings, config);
}

llvm::Error loadConfigFile(llvm::StringRef path, GeneratorConfig& config)
{
    auto buffer = llvm::MemoryBuffer::getFile(path);
    if (!buffer)
    {
        return llvm::createStringError(buffer.getError(),
                                       "failed to read configuration file %s",
                                       path.str().c_str());
    }

    llvm::Expected<llvm::json::Value> parsed = llvm::json::parse((*buffer)->getBuffer());
    if (!parsed)
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "invalid JSON in %s: %s",
                                       path.str().c_str(),
                                       llvm::toString(parsed.takeError()).c_str());
    }

    return applyConfigJson(*parsed, llvm::sys::path::parent_path(path), config);
}

llvm::Error validateConfig(const GeneratorConfig& config)
{
    if (config.outDir.empty())
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(), "an output directory is required");
    }
    if (config.schemaDir.empty())
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(), "a schema directory is required");
    }
    if (config.tiers.empty())
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(), "at least one tier must be selected");
    }
    if (config.protocPath.empty())
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(), "the reference encoder path is empty");
    }
    if (config.codecHeader.empty())
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(), "the codec header is empty");
    }

    llvm::StringRef rest = config.codecNamespace;
    rest.consume_front("::");
    while (true)
    {
        const auto [head, tail] = rest.split("::");
        if (!isIdentifier(head))
        {
            return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                           "codec namespace '%s' is not a C++ namespace name",
                                           config.codecNamespace.c_str());
        }
        if (tail.empty() && rest.size() == head.size())
        {
            break;
        }
        rest = tail;
    }
    return llvm::Error::success();
}

}  // namespace wiregold
