#pragma once

#include "reporter/ReporterEvents.h"
#include <string>

namespace TEB {

/**
 * @brief Receiver of one run's lifecycle events
 *
 * Events for a given test id arrive in order (begin before end) and steps nest,
 * but events of concurrently running tests interleave: keep state keyed by id.
 * Every method defaults to doing nothing so listeners override what they use.
 */
class ITestListener {
public:
    virtual ~ITestListener() = default;

    virtual void onBegin(const BeginParams &) {}

    virtual void onTestBegin(const TestBeginParams &) {}

    virtual void onTestEnd(const TestEndParams &) {}

    virtual void onStepBegin(const StepBeginParams &) {}

    virtual void onStepEnd(const StepEndParams &) {}

    /**
     * @brief Runner-level error; the run continues and may still end normally
     */
    virtual void onError(const ErrorParams &) {}

    virtual void onEnd() {}

    virtual void onStdOut(const std::string &) {}

    virtual void onStdErr(const std::string &) {}
};

}  // namespace TEB
