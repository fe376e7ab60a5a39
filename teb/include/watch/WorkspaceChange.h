#pragma once

#include <set>
#include <string>

namespace TEB {

/**
 * @brief File system events collected during one debounce window (absolute paths)
 */
struct WorkspaceChange {
    std::set<std::string> created;
    std::set<std::string> changed;
    std::set<std::string> deleted;

    bool empty() const {
        return created.empty() && changed.empty() && deleted.empty();
    }
};

}  // namespace TEB
