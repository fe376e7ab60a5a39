#pragma once

#include "model/TestTypes.h"
#include <functional>
#include <string>
#include <vector>

namespace TEB {

/**
 * @brief Maps arbitrary changed files to the test files depending on them
 */
class IRelatedFilesResolver {
public:
    using Callback = std::function<void(const RelatedFilesReport &report)>;

    virtual ~IRelatedFilesResolver() = default;

    /**
     * @brief Query the runner of @p config; @p done is invoked exactly once, from the event loop
     */
    virtual void findRelatedTestFiles(const TestConfig &config, const std::vector<std::string> &files,
                                      Callback done) = 0;
};

}  // namespace TEB
