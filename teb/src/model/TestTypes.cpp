#include "model/TestTypes.h"
#include "common/PathUtils.h"

namespace TEB {

ListFilesReport ListFilesReport::fromJson(const json &value) {
    if (!value.is_object()) {
        return ListFilesReport::error("list-files report is not an object");
    }

    if (JsonUtils::hasKey(value, "error")) {
        const TestError error = TestError::fromJson(value["error"]);
        return ListFilesReport::error(error.message.empty() ? JsonUtils::toCompactString(value["error"])
                                                            : error.message);
    }

    std::vector<ProjectListFilesReport> projects;
    if (value.contains("projects") && value["projects"].is_array()) {
        for (const auto &project : value["projects"]) {
            ProjectListFilesReport report;
            report.name = JsonUtils::getString(project, "name");
            report.testDir = PathUtils::normalizeFsPath(JsonUtils::getString(project, "testDir"));
            for (const auto &file : JsonUtils::getStringArray(project, "files")) {
                report.files.push_back(PathUtils::normalizeFsPath(file));
            }
            projects.push_back(std::move(report));
        }
    }
    return ListFilesReport::success(std::move(projects));
}

}  // namespace TEB
