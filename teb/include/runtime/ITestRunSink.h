#pragma once

#include "reporter/ReporterEvents.h"
#include "tree/TreeNode.h"
#include <optional>
#include <string>
#include <vector>

namespace TEB {

/**
 * @brief Failure annotation shown next to a test
 */
struct TestMessage {
    std::string text;
    std::optional<Location> location;
};

/**
 * @brief Source line of a step that is running or has finished during the current run
 */
struct StepMarker {
    Location location;
    int activeCount = 0;
    double duration = 0;
};

/**
 * @brief Result surface of one UI test run, implemented by the host
 *
 * Nodes passed in are only valid for the duration of the call.
 */
class ITestRunSink {
public:
    virtual ~ITestRunSink() = default;

    virtual void enqueued(const TreeNode &test) = 0;

    virtual void started(const TreeNode &test) = 0;

    virtual void passed(const TreeNode &test, double duration) = 0;

    virtual void skipped(const TreeNode &test) = 0;

    virtual void failed(const TreeNode &test, const std::vector<TestMessage> &messages, double duration) = 0;

    /**
     * @brief Terminal output of the runner, with "\r\n" line endings
     */
    virtual void appendOutput(const std::string &text) = 0;

    virtual void executionLinesChanged(const std::vector<StepMarker> &, const std::vector<StepMarker> &) {}

    /**
     * @brief The run is over; no more calls follow
     */
    virtual void end() = 0;
};

}  // namespace TEB
