#include "common/UniqueIdGenerator.h"
#include "common/Logger.h"

#include <iomanip>
#include <sstream>

namespace TEB {

std::atomic<uint64_t> UniqueIdGenerator::generationCounter_{0};
std::mt19937_64 UniqueIdGenerator::rng_{std::random_device{}()};
std::mutex UniqueIdGenerator::rngMutex_;

std::string UniqueIdGenerator::generateGuid() {
    uint64_t high = 0;
    uint64_t low = 0;
    {
        std::lock_guard<std::mutex> lock(rngMutex_);
        high = rng_();
        low = rng_();
    }

    std::ostringstream oss;
    oss << std::hex << std::setfill('0') << std::setw(16) << high << std::setw(16) << low;
    return oss.str();
}

std::string UniqueIdGenerator::generateGeneration() {
    return "g" + std::to_string(generationCounter_.fetch_add(1) + 1);
}

void UniqueIdGenerator::resetForTesting() {
    LOG_DEBUG("UniqueIdGenerator: Resetting counters for testing");
    generationCounter_.store(0);

    std::lock_guard<std::mutex> lock(rngMutex_);
    rng_.seed(12345);
}

}  // namespace TEB
