#pragma once

#include "model/SourceMapCache.h"
#include "model/TestTypes.h"
#include "watch/WorkspaceChange.h"
#include <set>
#include <string>
#include <vector>

namespace TEB {

/**
 * @brief What a model needs re-queried after a workspace change
 */
struct ModelRefresh {
    bool relistFiles = false;
    std::vector<std::string> testsToList;

    bool empty() const {
        return !relistFiles && testsToList.empty();
    }
};

/**
 * @brief Projects, files and entries known for one runner configuration
 *
 * Pure state: the runner is queried by the caller, and results are applied
 * here. Projects keep the order of the runner's report, the first being the
 * default one.
 */
class TestModel {
public:
    /**
     * @param sourceMaps Optional cache used to map compiled files to their sources; not owned
     */
    explicit TestModel(TestConfig config, SourceMapCache *sourceMaps = nullptr);

    const TestConfig &config() const {
        return config_;
    }

    /**
     * @brief Apply a list-files report: create new projects and files, drop vanished ones
     *
     * Files of kept projects keep their already listed entries.
     */
    void applyListFiles(const ListFilesReport &report);

    /**
     * @brief Apply the onBegin projects of a list run over @p requestedFiles
     *
     * Reported files replace their previous entries. Requested files the runner
     * reported nothing for are cleared.
     */
    void applyListTests(const std::vector<ReportEntry> &projects, const std::vector<std::string> &requestedFiles);

    /**
     * @brief Merge the onBegin projects of a run; never removes entries
     *
     * A file is replaced only when it had no tests yet.
     */
    void updateFromRunningProjects(const std::vector<ReportEntry> &projects);

    /**
     * @brief Decide which queries a batch of file system events requires
     *
     * Only paths below a project's test directory matter. Created or deleted
     * files require re-listing files; changed files require re-listing their tests.
     */
    ModelRefresh workspaceChanged(const WorkspaceChange &change) const;

    const std::vector<TestProject> &projects() const {
        return projects_;
    }

    const TestProject *project(const std::string &name) const;

    std::vector<const TestProject *> enabledProjects() const;

    /**
     * @return false when no project has that name
     */
    bool setProjectEnabled(const std::string &name, bool enabled);

    /**
     * @brief Files present in at least one enabled project
     */
    std::vector<std::string> enabledFiles() const;

    std::set<std::string> narrowDownFilesToEnabledProjects(const std::set<std::string> &files) const;

    std::vector<std::string> testDirs() const;

    /**
     * @brief Number of structural updates applied so far
     */
    uint64_t revision() const {
        return revision_;
    }

    /**
     * @brief Flatten a file node of an onBegin report into entries with ids and title paths
     */
    static std::vector<Entry> buildFileEntries(const ReportEntry &fileEntry);

    static size_t countTests(const std::vector<Entry> &entries);

private:
    TestProject *findProject(const std::string &name);
    std::vector<std::string> mapFilesToSources(const std::vector<std::string> &testDirs,
                                               const std::set<std::string> &files) const;

    TestConfig config_;
    SourceMapCache *sourceMaps_;
    std::vector<TestProject> projects_;
    uint64_t revision_ = 0;
};

}  // namespace TEB
