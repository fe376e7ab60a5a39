#pragma once

#include <stdexcept>
#include <string>

namespace TEB {

/**
 * @brief Raised before any child process exists when the runner environment is unusable
 *
 * Callers surface these as one-line warnings.
 */
class EnvironmentError : public std::runtime_error {
public:
    enum class Kind { RunnerNotFound, IncompatibleVersion, SpawnFailed };

    EnvironmentError(Kind kind, const std::string &message) : std::runtime_error(message), kind_(kind) {}

    Kind kind() const {
        return kind_;
    }

private:
    Kind kind_;
};

}  // namespace TEB
