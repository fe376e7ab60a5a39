#include "model/TestModel.h"
#include "common/Logger.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <stdexcept>
#include <functional>
#include <unordered_map>

namespace TEB {

TestModel::TestModel(TestConfig config, SourceMapCache *sourceMaps)
    : config_(std::move(config)), sourceMaps_(sourceMaps) {
    if (config_.configFile.empty()) {
        throw std::invalid_argument("TestModel requires a config file");
    }
}

void TestModel::applyListFiles(const ListFilesReport &report) {
    if (!report.isSuccess) {
        LOG_WARN("TestModel: list-files failed for {}: {}", config_.configFile, report.errorMessage);
        return;
    }

    std::vector<TestProject> updated;
    updated.reserve(report.projects.size());
    for (const auto &projectReport : report.projects) {
        TestProject project;
        if (const TestProject *existing = findProject(projectReport.name)) {
            project = *existing;
        }
        project.name = projectReport.name;
        project.testDir = projectReport.testDir;
        project.ordinal = updated.size();

        std::set<std::string> filesToKeep;
        for (const auto &file : projectReport.files) {
            if (sourceMaps_) {
                for (const auto &source : sourceMaps_->resolve(file)) {
                    filesToKeep.insert(source);
                }
            } else {
                filesToKeep.insert(file);
            }
        }
        for (const auto &file : filesToKeep) {
            if (!project.files.count(file)) {
                project.files[file] = TestFile{file, {}, false};
            }
        }
        for (auto it = project.files.begin(); it != project.files.end();) {
            if (!filesToKeep.count(it->first)) {
                it = project.files.erase(it);
            } else {
                ++it;
            }
        }
        updated.push_back(std::move(project));
    }

    for (const auto &project : projects_) {
        const bool kept = std::any_of(updated.begin(), updated.end(),
                                      [&](const TestProject &candidate) { return candidate.name == project.name; });
        if (!kept) {
            LOG_DEBUG("TestModel: Project '{}' disappeared from {}", project.name, config_.configFile);
        }
    }

    projects_ = std::move(updated);
    if (!projects_.empty() && enabledProjects().empty()) {
        projects_.front().isEnabled = true;
    }
    ++revision_;
}

void TestModel::applyListTests(const std::vector<ReportEntry> &projects, const std::vector<std::string> &requestedFiles) {
    for (auto &project : projects_) {
        std::set<std::string> filesToClear(requestedFiles.begin(), requestedFiles.end());

        auto reported = std::find_if(projects.begin(), projects.end(),
                                     [&](const ReportEntry &entry) { return entry.title == project.name; });
        if (reported != projects.end()) {
            for (const auto &fileEntry : reported->children) {
                const std::string &file = fileEntry.location.file;
                if (file.empty()) {
                    continue;
                }
                filesToClear.erase(file);
                project.files[file] = TestFile{file, buildFileEntries(fileEntry), true};
            }
        }

        for (const auto &file : filesToClear) {
            auto it = project.files.find(file);
            if (it != project.files.end()) {
                it->second.entries.clear();
                it->second.isLoaded = true;
            }
        }
    }
    ++revision_;
}

void TestModel::updateFromRunningProjects(const std::vector<ReportEntry> &projects) {
    for (const auto &reported : projects) {
        TestProject *project = findProject(reported.title);
        if (!project) {
            continue;
        }
        for (const auto &fileEntry : reported.children) {
            const std::string &file = fileEntry.location.file;
            auto entries = buildFileEntries(fileEntry);
            if (file.empty() || countTests(entries) == 0) {
                continue;
            }
            auto existing = project->files.find(file);
            if (existing == project->files.end() || countTests(existing->second.entries) == 0) {
                project->files[file] = TestFile{file, std::move(entries), true};
            }
        }
    }
    ++revision_;
}

ModelRefresh TestModel::workspaceChanged(const WorkspaceChange &change) const {
    const auto dirs = testDirs();
    ModelRefresh refresh;
    refresh.relistFiles = !mapFilesToSources(dirs, change.created).empty() || !mapFilesToSources(dirs, change.deleted).empty();
    refresh.testsToList = mapFilesToSources(dirs, change.changed);
    return refresh;
}

const TestProject *TestModel::project(const std::string &name) const {
    auto it = std::find_if(projects_.begin(), projects_.end(),
                           [&](const TestProject &project) { return project.name == name; });
    return it == projects_.end() ? nullptr : &*it;
}

TestProject *TestModel::findProject(const std::string &name) {
    auto it = std::find_if(projects_.begin(), projects_.end(),
                           [&](const TestProject &project) { return project.name == name; });
    return it == projects_.end() ? nullptr : &*it;
}

std::vector<const TestProject *> TestModel::enabledProjects() const {
    std::vector<const TestProject *> result;
    for (const auto &project : projects_) {
        if (project.isEnabled) {
            result.push_back(&project);
        }
    }
    return result;
}

bool TestModel::setProjectEnabled(const std::string &name, bool enabled) {
    TestProject *project = findProject(name);
    if (!project) {
        return false;
    }
    project->isEnabled = enabled;
    ++revision_;
    return true;
}

std::vector<std::string> TestModel::enabledFiles() const {
    std::set<std::string> files;
    for (const auto *project : enabledProjects()) {
        for (const auto &[file, testFile] : project->files) {
            files.insert(file);
        }
    }
    return {files.begin(), files.end()};
}

std::set<std::string> TestModel::narrowDownFilesToEnabledProjects(const std::set<std::string> &files) const {
    std::set<std::string> result;
    for (const auto *project : enabledProjects()) {
        for (const auto &file : files) {
            if (project->files.count(file)) {
                result.insert(file);
            }
        }
    }
    return result;
}

std::vector<std::string> TestModel::testDirs() const {
    std::set<std::string> dirs;
    for (const auto &project : projects_) {
        if (!project.testDir.empty()) {
            dirs.insert(project.testDir);
        }
    }
    return {dirs.begin(), dirs.end()};
}

std::vector<std::string> TestModel::mapFilesToSources(const std::vector<std::string> &testDirs,
                                                      const std::set<std::string> &files) const {
    std::set<std::string> result;
    for (const auto &file : files) {
        const bool inTestDir = std::any_of(testDirs.begin(), testDirs.end(),
                                           [&](const std::string &dir) { return PathUtils::isDescendant(dir, file); });
        if (!inTestDir) {
            continue;
        }
        std::optional<std::vector<std::string>> sources;
        if (sourceMaps_) {
            sources = sourceMaps_->cachedSources(file);
        }
        if (sources) {
            result.insert(sources->begin(), sources->end());
        } else {
            result.insert(file);
        }
    }
    return {result.begin(), result.end()};
}

std::vector<Entry> TestModel::buildFileEntries(const ReportEntry &fileEntry) {
    const std::string &fileName = fileEntry.location.file;
    std::unordered_map<std::string, int> entriesPerLocation;

    std::function<Entry(const ReportEntry &, const std::vector<std::string> &)> build;
    build = [&](const ReportEntry &report, const std::vector<std::string> &titlePath) {
        Entry entry;
        entry.kind = report.kind == ReportEntryKind::Test ? EntryKind::Test : EntryKind::Suite;
        entry.file = report.location.file.empty() ? fileName : report.location.file;
        entry.line = report.location.line;
        entry.column = report.location.column;
        entry.title = report.title;
        entry.titlePath = titlePath;

        // First-seen order decides the ordinal of same-location duplicates
        entry.id = entry.file + ":" + std::to_string(entry.line);
        const int seen = entriesPerLocation[entry.id]++;
        if (seen > 0) {
            entry.id += "#" + std::to_string(seen);
        }

        std::vector<std::string> childPath = titlePath;
        childPath.push_back(report.title);
        for (const auto &child : report.children) {
            entry.children.push_back(build(child, childPath));
        }
        return entry;
    };

    std::vector<Entry> entries;
    for (const auto &child : fileEntry.children) {
        entries.push_back(build(child, {}));
    }
    return entries;
}

size_t TestModel::countTests(const std::vector<Entry> &entries) {
    size_t count = 0;
    for (const auto &entry : entries) {
        if (entry.kind == EntryKind::Test) {
            ++count;
        }
        count += countTests(entry.children);
    }
    return count;
}

}  // namespace TEB
