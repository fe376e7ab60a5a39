#include "transport/PipeTransport.h"
#include "common/TestUtils.h"
#include "transport/NulFrameCodec.h"
#include <fcntl.h>
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <unistd.h>
#include <vector>

using namespace TEB;

class PipeTransportTest : public ::testing::Test {
protected:
    void SetUp() override {
        int toChild[2];
        int fromChild[2];
        ASSERT_EQ(::pipe(toChild), 0);
        ASSERT_EQ(::pipe(fromChild), 0);
        childRead = toChild[0];
        childWrite = fromChild[1];
        ::fcntl(childRead, F_SETFL, ::fcntl(childRead, F_GETFL, 0) | O_NONBLOCK);

        transport = std::make_unique<PipeTransport>(loop, toChild[1], fromChild[0]);
        transport->setOnMessage([this](const json &message) { received.push_back(message); });
        transport->setOnClose([this]() { ++closeCount; });
    }

    void TearDown() override {
        transport.reset();
        if (childRead >= 0) {
            ::close(childRead);
        }
        if (childWrite >= 0) {
            ::close(childWrite);
        }
    }

    void childSends(const std::string &bytes) {
        ASSERT_EQ(::write(childWrite, bytes.data(), bytes.size()), static_cast<ssize_t>(bytes.size()));
    }

    std::string childReceives() {
        std::string data;
        char buffer[4096];
        loop.runUntil(
            [&]() {
                ssize_t bytes = ::read(childRead, buffer, sizeof(buffer));
                if (bytes > 0) {
                    data.append(buffer, static_cast<size_t>(bytes));
                }
                return !data.empty() && data.back() == '\0';
            },
            TEB::Test::Utils::STANDARD_WAIT_MS);
        return data;
    }

    EventLoop loop;
    std::unique_ptr<PipeTransport> transport;
    std::vector<json> received;
    int closeCount = 0;
    int childRead = -1;
    int childWrite = -1;
};

TEST_F(PipeTransportTest, DeliversFramesFromChild) {
    childSends(NulFrameCodec::encode(json{{"method", "onBegin"}, {"params", json::object()}}) +
               NulFrameCodec::encode(json{{"method", "onEnd"}}));

    ASSERT_TRUE(TEB::Test::Utils::waitFor(loop, [this]() { return received.size() == 2; }));
    EXPECT_EQ(received[0]["method"], "onBegin");
    EXPECT_EQ(received[1]["method"], "onEnd");
    EXPECT_EQ(closeCount, 0);
}

TEST_F(PipeTransportTest, HandlerMayDestroyTransport) {
    transport->setOnMessage([this](const json &message) {
        received.push_back(message);
        transport.reset();
    });
    childSends(NulFrameCodec::encode(json{{"method", "onBegin"}, {"params", json::object()}}) +
               NulFrameCodec::encode(json{{"method", "onEnd"}}));

    ASSERT_TRUE(TEB::Test::Utils::waitFor(loop, [this]() { return !transport; }));
    loop.runUntil([]() { return false; }, std::chrono::milliseconds(TEB::Test::Utils::getBaseDelay(30)));

    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0]["method"], "onBegin");
    EXPECT_EQ(closeCount, 0);
}

TEST_F(PipeTransportTest, SendWritesTerminatedFrame) {
    transport->send(json{{"id", 0}, {"method", "stop"}, {"params", json::object()}});

    const std::string data = childReceives();
    ASSERT_FALSE(data.empty());
    EXPECT_EQ(data.back(), '\0');
    auto message = json::parse(data.substr(0, data.size() - 1));
    EXPECT_EQ(message["method"], "stop");
    EXPECT_EQ(message["id"], 0);
}

TEST_F(PipeTransportTest, MalformedFrameClosesOnce) {
    childSends(std::string("{not json") + '\0' + NulFrameCodec::encode(json{{"method", "onEnd"}}));

    ASSERT_TRUE(TEB::Test::Utils::waitFor(loop, [this]() { return closeCount > 0; }));
    loop.runOnce(std::chrono::milliseconds(10));

    EXPECT_EQ(closeCount, 1);
    EXPECT_TRUE(received.empty());
    EXPECT_TRUE(transport->isClosed());
    EXPECT_THROW(transport->send(json::object()), std::runtime_error);
}

TEST_F(PipeTransportTest, ChildExitClosesTransport) {
    ::close(childWrite);
    childWrite = -1;

    ASSERT_TRUE(TEB::Test::Utils::waitFor(loop, [this]() { return closeCount == 1; }));
    EXPECT_TRUE(transport->isClosed());
}

TEST_F(PipeTransportTest, ExplicitCloseReportsOnceAndStopsDelivery) {
    childSends(NulFrameCodec::encode(json{{"method", "onEnd"}}));
    transport->close();
    transport->close();

    loop.runUntil([]() { return false; }, std::chrono::milliseconds(TEB::Test::Utils::getBaseDelay(30)));

    EXPECT_EQ(closeCount, 1);
    EXPECT_TRUE(received.empty());
}
