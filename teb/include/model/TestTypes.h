#pragma once

#include "common/RunnerVersion.h"
#include "reporter/ReporterEvents.h"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace TEB {

/**
 * @brief One located runner configuration; immutable once discovered
 */
struct TestConfig {
    std::string workspaceFolder;
    std::string configFile;
    // Runner CLI entry point passed to the interpreter
    std::string cli;
    RunnerVersion version;

    bool operator==(const TestConfig &other) const {
        return configFile == other.configFile;
    }
};

struct ProjectListFilesReport {
    std::string name;
    std::string testDir;
    std::vector<std::string> files;
};

/**
 * @brief Result of the runner's list-files query
 */
struct ListFilesReport {
    bool isSuccess = false;
    std::string errorMessage;
    std::vector<ProjectListFilesReport> projects;

    static ListFilesReport success(std::vector<ProjectListFilesReport> projects) {
        ListFilesReport report;
        report.isSuccess = true;
        report.projects = std::move(projects);
        return report;
    }

    static ListFilesReport error(const std::string &message) {
        ListFilesReport report;
        report.errorMessage = message;
        return report;
    }

    /**
     * @brief Parse `{ projects: [{ name, testDir, files }], error? }`
     *
     * A missing projects key is an empty report; a runner-side error becomes an error result.
     */
    static ListFilesReport fromJson(const json &value);
};

/**
 * @brief Result of the runner's find-related-test-files query
 *
 * On failure testFiles still holds a usable answer (the queried files themselves).
 */
struct RelatedFilesReport {
    bool isSuccess = false;
    std::string errorMessage;
    std::vector<std::string> testFiles;

    static RelatedFilesReport success(std::vector<std::string> testFiles) {
        RelatedFilesReport report;
        report.isSuccess = true;
        report.testFiles = std::move(testFiles);
        return report;
    }

    static RelatedFilesReport error(const std::string &message, std::vector<std::string> fallbackFiles) {
        RelatedFilesReport report;
        report.errorMessage = message;
        report.testFiles = std::move(fallbackFiles);
        return report;
    }
};

enum class EntryKind { Suite, Test };

/**
 * @brief Discovered suite or test inside a test file
 *
 * The id is "<file>:<line>", with "#<n>" appended to the n-th later entry
 * declared on an already used line of the same file.
 */
struct Entry {
    EntryKind kind = EntryKind::Test;
    std::string id;
    std::string file;
    int line = 0;
    int column = 0;
    std::string title;
    // Titles of the enclosing suites, outermost first, excluding this entry
    std::vector<std::string> titlePath;
    std::vector<Entry> children;
};

struct TestFile {
    std::string file;
    std::vector<Entry> entries;

    // True once a list or run reported this file's tests
    bool isLoaded = false;
};

struct TestProject {
    std::string name;
    std::string testDir;
    // Position in the runner's report; 0 is the default project
    size_t ordinal = 0;
    bool isEnabled = false;
    std::map<std::string, TestFile> files;
};

}  // namespace TEB
