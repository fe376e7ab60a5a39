#include "bridge/ConfigLocator.h"
#include "common/Logger.h"

#include <algorithm>
#include <filesystem>
#include <regex>

namespace TEB {

bool ConfigLocator::isConfigFileName(const std::string &fileName) {
    static const std::regex pattern(R"(.*playwright.*\.config\.(ts|js|mjs))");
    return std::regex_match(fileName, pattern);
}

std::vector<std::string> ConfigLocator::findConfigFiles(const std::string &workspaceRoot, bool isUnderTest) {
    std::vector<std::string> configs;
    std::error_code ec;
    std::filesystem::recursive_directory_iterator it(
        workspaceRoot, std::filesystem::directory_options::skip_permission_denied, ec);
    if (ec) {
        LOG_WARN("ConfigLocator: Cannot scan {}: {}", workspaceRoot, ec.message());
        return configs;
    }

    for (const std::filesystem::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            LOG_DEBUG("ConfigLocator: Skipping entry under {}: {}", workspaceRoot, ec.message());
            ec.clear();
            continue;
        }
        const auto &path = it->path();
        const std::string name = path.filename().string();
        if (it->is_directory(ec)) {
            if (name == "node_modules" || (!isUnderTest && name == "test-results")) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (isConfigFileName(name)) {
            configs.push_back(path.lexically_normal().string());
        }
    }

    std::sort(configs.begin(), configs.end());
    return configs;
}

}  // namespace TEB
