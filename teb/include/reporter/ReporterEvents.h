#pragma once

#include "common/JsonUtils.h"
#include <optional>
#include <string>
#include <vector>

namespace TEB {

/**
 * @brief 1-based source position reported by the runner
 */
struct Location {
    std::string file;
    int line = 0;
    int column = 0;

    bool operator==(const Location &other) const = default;

    static Location fromJson(const json &value);
    json toJson() const;
};

struct TestError {
    std::string message;
    std::string stack;
    std::string value;
    std::optional<Location> location;

    static TestError fromJson(const json &value);
};

enum class ReportEntryKind { Project, File, Suite, Test };

/**
 * @brief Node of the project/file/suite/test tree sent with onBegin
 */
struct ReportEntry {
    ReportEntryKind kind = ReportEntryKind::Test;
    std::string title;
    Location location;
    std::vector<ReportEntry> children;

    static ReportEntry fromJson(const json &value);
};

struct BeginParams {
    std::vector<ReportEntry> projects;

    static BeginParams fromJson(const json &value);
};

struct TestBeginParams {
    std::string testId;
    std::string title;
    Location location;

    static TestBeginParams fromJson(const json &value);
};

struct TestEndParams {
    std::string testId;
    std::string title;
    Location location;
    double duration = 0;
    std::string status;
    std::string expectedStatus;
    std::vector<TestError> errors;

    bool ok() const {
        return status == expectedStatus;
    }

    static TestEndParams fromJson(const json &value);
};

struct StepBeginParams {
    std::string testId;
    std::string stepId;
    std::string title;
    Location location;

    static StepBeginParams fromJson(const json &value);
};

struct StepEndParams {
    std::string testId;
    std::string stepId;
    double duration = 0;
    Location location;
    std::optional<TestError> error;

    static StepEndParams fromJson(const json &value);
};

struct ErrorParams {
    TestError error;

    static ErrorParams fromJson(const json &value);
};

}  // namespace TEB
