#pragma once

#include <compare>
#include <optional>
#include <string>

namespace TEB {

/**
 * @brief major.minor version of the runner, compared numerically (1.9 < 1.19)
 */
struct RunnerVersion {
    int major = 0;
    int minor = 0;

    auto operator<=>(const RunnerVersion &other) const = default;

    /**
     * @brief First "<major>.<minor>" found in @p text ("Version 1.40.1" -> 1.40)
     */
    static std::optional<RunnerVersion> parse(const std::string &text);

    std::string toString() const {
        return std::to_string(major) + "." + std::to_string(minor);
    }
};

}  // namespace TEB
