#include "common/Logger.h"
#include <gtest/gtest.h>
#include <vector>

using namespace TEB;

namespace {

struct CapturedLine {
    LogLevel level;
    std::string message;
    unsigned line;
};

class CapturingBackend : public ILoggerBackend {
public:
    explicit CapturingBackend(std::vector<CapturedLine> &lines) : lines_(lines) {}

    void log(LogLevel level, const std::string &message, const std::source_location &loc) override {
        if (level >= level_) {
            lines_.push_back({level, message, loc.line()});
        }
    }

    void setLevel(LogLevel level) override {
        level_ = level;
    }

    void flush() override {}

private:
    std::vector<CapturedLine> &lines_;
    LogLevel level_ = LogLevel::Trace;
};

}  // namespace

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::setBackend(std::make_unique<CapturingBackend>(lines));
    }

    void TearDown() override {
        Logger::setBackend(nullptr);
    }

    std::vector<CapturedLine> lines;
};

TEST_F(LoggerTest, MacrosFormatAndCaptureCallSite) {
    const unsigned expectedLine = __LINE__ + 1;
    LOG_WARN("ProcessBridge: {} runner exited with code {}", "run", 3);

    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].level, LogLevel::Warn);
    EXPECT_EQ(lines[0].message, "ProcessBridge: run runner exited with code 3");
    EXPECT_EQ(lines[0].line, expectedLine);
}

TEST_F(LoggerTest, LevelIsForwardedToBackend) {
    Logger::setLevel(LogLevel::Info);
    LOG_DEBUG("dropped");
    LOG_INFO("kept");

    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].message, "kept");
}

TEST_F(LoggerTest, InitializeKeepsInstalledBackend) {
    Logger::initialize();
    LOG_ERROR("still captured");

    EXPECT_EQ(lines.size(), 1u);
}
