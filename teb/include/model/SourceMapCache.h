#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace TEB {

/**
 * @brief Maps compiled test files to the sources they were generated from
 *
 * A ".js" file whose last line is "//# sourceMappingURL=<map>" maps to the
 * entries of the map's "sources" array (resolved against the map's folder).
 * Every other file maps to itself. Results are cached in both directions until
 * invalidate() is called for the file, typically when it is saved.
 */
class SourceMapCache {
public:
    /**
     * @brief Sources of @p file, reading the file and its map on a cache miss
     */
    std::vector<std::string> resolve(const std::string &file);

    /**
     * @brief Cached sources of @p file, without touching the disk
     */
    std::optional<std::vector<std::string>> cachedSources(const std::string &file) const;

    /**
     * @brief Compiled file a source was mapped from, if known
     */
    std::optional<std::string> fileForSource(const std::string &source) const;

    /**
     * @brief Forget @p file, either as compiled file or as source
     */
    void invalidate(const std::string &file);

    void clear();

    size_t size() const {
        return fileToSources_.size();
    }

private:
    std::map<std::string, std::vector<std::string>> fileToSources_;
    std::map<std::string, std::string> sourceToFile_;
};

}  // namespace TEB
