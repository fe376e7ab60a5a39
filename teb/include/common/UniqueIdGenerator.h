#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>

namespace TEB {

/**
 * @brief Thread-safe generator for endpoint guids and tree generations
 */
class UniqueIdGenerator {
public:
    /**
     * @brief 128 random bits as 32 lowercase hex characters
     *
     * Used as the unguessable path component of the debug side-channel URL.
     */
    static std::string generateGuid();

    /**
     * @brief Monotonically increasing generation token ("g1", "g2", ...)
     */
    static std::string generateGeneration();

    /**
     * @brief Reseed and reset counters (tests only)
     */
    static void resetForTesting();

private:
    static std::atomic<uint64_t> generationCounter_;
    static std::mt19937_64 rng_;
    static std::mutex rngMutex_;
};

}  // namespace TEB
