#include "model/SourceMapCache.h"
#include "common/JsonUtils.h"
#include "common/Logger.h"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace TEB {

namespace {

constexpr std::string_view SOURCE_MAPPING_PREFIX = "//# sourceMappingURL=";

bool endsWith(const std::string &value, std::string_view suffix) {
    return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::optional<std::string> readLastLine(const std::string &file) {
    std::ifstream stream(file);
    if (!stream) {
        return std::nullopt;
    }
    std::string line;
    std::string lastLine;
    while (std::getline(stream, line)) {
        lastLine = line;
    }
    if (!lastLine.empty() && lastLine.back() == '\r') {
        lastLine.pop_back();
    }
    return lastLine;
}

}  // namespace

std::vector<std::string> SourceMapCache::resolve(const std::string &file) {
    if (!endsWith(file, ".js")) {
        return {file};
    }
    auto cached = fileToSources_.find(file);
    if (cached != fileToSources_.end()) {
        return cached->second;
    }

    const auto lastLine = readLastLine(file);
    if (lastLine && lastLine->rfind(SOURCE_MAPPING_PREFIX, 0) == 0) {
        const std::filesystem::path mapFile = (std::filesystem::path(file).parent_path() /
                                               lastLine->substr(SOURCE_MAPPING_PREFIX.size()))
                                                  .lexically_normal();
        std::ifstream stream(mapFile);
        if (stream) {
            std::stringstream content;
            content << stream.rdbuf();
            auto sourceMap = JsonUtils::parseJson(content.str());
            if (sourceMap) {
                std::vector<std::string> sources;
                for (const auto &source : JsonUtils::getStringArray(*sourceMap, "sources")) {
                    const std::string resolved = (mapFile.parent_path() / source).lexically_normal().string();
                    sourceToFile_[resolved] = file;
                    sources.push_back(resolved);
                }
                fileToSources_[file] = sources;
                return sources;
            }
        }
        LOG_DEBUG("SourceMapCache: Unreadable source map {} for {}", mapFile.string(), file);
    }

    fileToSources_[file] = {file};
    return {file};
}

std::optional<std::vector<std::string>> SourceMapCache::cachedSources(const std::string &file) const {
    auto it = fileToSources_.find(file);
    if (it == fileToSources_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> SourceMapCache::fileForSource(const std::string &source) const {
    auto it = sourceToFile_.find(source);
    if (it == sourceToFile_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void SourceMapCache::invalidate(const std::string &file) {
    auto it = fileToSources_.find(file);
    if (it != fileToSources_.end()) {
        for (const auto &source : it->second) {
            sourceToFile_.erase(source);
        }
        fileToSources_.erase(it);
    }

    auto source = sourceToFile_.find(file);
    if (source != sourceToFile_.end()) {
        const std::string compiled = source->second;
        invalidate(compiled);
    }
}

void SourceMapCache::clear() {
    fileToSources_.clear();
    sourceToFile_.clear();
}

}  // namespace TEB
