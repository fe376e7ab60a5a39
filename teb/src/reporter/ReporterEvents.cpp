#include "reporter/ReporterEvents.h"
#include "common/PathUtils.h"

namespace TEB {

namespace {

ReportEntryKind parseKind(const std::string &type) {
    if (type == "project") {
        return ReportEntryKind::Project;
    }
    if (type == "file") {
        return ReportEntryKind::File;
    }
    if (type == "suite") {
        return ReportEntryKind::Suite;
    }
    return ReportEntryKind::Test;
}

Location locationOf(const json &object) {
    if (object.is_object() && object.contains("location")) {
        return Location::fromJson(object["location"]);
    }
    return Location{};
}

}  // namespace

Location Location::fromJson(const json &value) {
    Location location;
    if (!value.is_object()) {
        return location;
    }
    // Every location entering the bridge is canonicalized here
    location.file = PathUtils::normalizeFsPath(JsonUtils::getString(value, "file"));
    location.line = JsonUtils::getInt(value, "line");
    location.column = JsonUtils::getInt(value, "column");
    return location;
}

json Location::toJson() const {
    return json{{"file", file}, {"line", line}, {"column", column}};
}

TestError TestError::fromJson(const json &value) {
    TestError error;
    if (!value.is_object()) {
        return error;
    }
    error.message = JsonUtils::getString(value, "message");
    error.stack = JsonUtils::getString(value, "stack");
    error.value = JsonUtils::getString(value, "value");
    if (JsonUtils::hasKey(value, "location")) {
        error.location = Location::fromJson(value["location"]);
    }
    return error;
}

ReportEntry ReportEntry::fromJson(const json &value) {
    ReportEntry entry;
    if (!value.is_object()) {
        return entry;
    }
    entry.kind = parseKind(JsonUtils::getString(value, "type"));
    entry.title = JsonUtils::getString(value, "title");
    entry.location = locationOf(value);
    if (value.contains("children") && value["children"].is_array()) {
        for (const auto &child : value["children"]) {
            entry.children.push_back(ReportEntry::fromJson(child));
        }
    }
    return entry;
}

BeginParams BeginParams::fromJson(const json &value) {
    BeginParams params;
    if (value.is_object() && value.contains("projects") && value["projects"].is_array()) {
        for (const auto &project : value["projects"]) {
            params.projects.push_back(ReportEntry::fromJson(project));
        }
    }
    return params;
}

TestBeginParams TestBeginParams::fromJson(const json &value) {
    TestBeginParams params;
    params.testId = JsonUtils::getString(value, "testId");
    params.title = JsonUtils::getString(value, "title");
    params.location = locationOf(value);
    return params;
}

TestEndParams TestEndParams::fromJson(const json &value) {
    TestEndParams params;
    params.testId = JsonUtils::getString(value, "testId");
    params.title = JsonUtils::getString(value, "title");
    params.location = locationOf(value);
    params.duration = JsonUtils::getNumber(value, "duration");
    params.status = JsonUtils::getString(value, "status", "passed");
    params.expectedStatus = JsonUtils::getString(value, "expectedStatus", "passed");
    if (value.is_object() && value.contains("errors") && value["errors"].is_array()) {
        for (const auto &error : value["errors"]) {
            params.errors.push_back(TestError::fromJson(error));
        }
    } else if (JsonUtils::hasKey(value, "error")) {
        params.errors.push_back(TestError::fromJson(value["error"]));
    }
    return params;
}

StepBeginParams StepBeginParams::fromJson(const json &value) {
    StepBeginParams params;
    params.testId = JsonUtils::getString(value, "testId");
    params.stepId = JsonUtils::getString(value, "stepId");
    params.title = JsonUtils::getString(value, "title");
    params.location = locationOf(value);
    return params;
}

StepEndParams StepEndParams::fromJson(const json &value) {
    StepEndParams params;
    params.testId = JsonUtils::getString(value, "testId");
    params.stepId = JsonUtils::getString(value, "stepId");
    params.duration = JsonUtils::getNumber(value, "duration");
    params.location = locationOf(value);
    if (JsonUtils::hasKey(value, "error")) {
        params.error = TestError::fromJson(value["error"]);
    }
    return params;
}

ErrorParams ErrorParams::fromJson(const json &value) {
    ErrorParams params;
    if (JsonUtils::hasKey(value, "error")) {
        params.error = TestError::fromJson(value["error"]);
    }
    return params;
}

}  // namespace TEB
