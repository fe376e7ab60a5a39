#pragma once

#include <string>
#include <vector>

namespace TEB {

/**
 * @brief Finds runner configuration files (*playwright*.config.{ts,js,mjs}) in a workspace
 */
class ConfigLocator {
public:
    /**
     * @brief Sorted config files below @p workspaceRoot
     *
     * node_modules folders are not entered; test-results folders only when @p isUnderTest.
     */
    static std::vector<std::string> findConfigFiles(const std::string &workspaceRoot, bool isUnderTest = false);

    static bool isConfigFileName(const std::string &fileName);
};

}  // namespace TEB
