#pragma once

#include <string>
#include <vector>

namespace TEB {

/**
 * @brief File system path helpers shared by the reporter, the tree and the watches
 */
class PathUtils {
public:
    /**
     * @brief Canonical spelling of a file system path
     *
     * Uppercases a leading drive letter ("c:\\a" -> "C:\\a", "/c:/a" -> "C:/a") so that
     * location-keyed lookups agree no matter which subsystem produced the string.
     * POSIX paths come back unchanged.
     */
    static std::string normalizeFsPath(const std::string &path);

    /**
     * @brief True when @p path equals @p ancestor or lies below it
     */
    static bool isSameOrDescendant(const std::string &ancestor, const std::string &path);

    /**
     * @brief True when @p path lies strictly below @p ancestor
     */
    static bool isDescendant(const std::string &ancestor, const std::string &path);

    /**
     * @brief Escape regular expression metacharacters (.*+?^${}()|[]\)
     */
    static std::string escapeRegex(const std::string &text);

    static std::string dirname(const std::string &path);
    static std::string basename(const std::string &path);

    /**
     * @brief Path of @p path relative to @p base, "" when equal
     */
    static std::string relative(const std::string &base, const std::string &path);
};

}  // namespace TEB
