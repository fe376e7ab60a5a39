#include "common/RunnerVersion.h"

#include <regex>

namespace TEB {

std::optional<RunnerVersion> RunnerVersion::parse(const std::string &text) {
    static const std::regex pattern(R"((\d+)\.(\d+))");
    std::smatch match;
    if (!std::regex_search(text, match, pattern)) {
        return std::nullopt;
    }
    try {
        return RunnerVersion{std::stoi(match[1].str()), std::stoi(match[2].str())};
    } catch (const std::out_of_range &) {
        return std::nullopt;
    }
}

}  // namespace TEB
