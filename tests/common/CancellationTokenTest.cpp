#include "common/CancellationToken.h"
#include <gtest/gtest.h>
#include <vector>

using namespace TEB;

TEST(CancellationTokenTest, DefaultTokenNeverCancelled) {
    CancellationToken token;
    bool called = false;
    auto registration = token.onCancellationRequested([&called]() { called = true; });

    EXPECT_FALSE(token.isCancellationRequested());
    EXPECT_FALSE(called);
}

TEST(CancellationTokenTest, CallbacksRunOnceInRegistrationOrder) {
    CancellationTokenSource source;
    auto token = source.token();
    std::vector<int> order;
    auto first = token.onCancellationRequested([&order]() { order.push_back(1); });
    auto second = token.onCancellationRequested([&order]() { order.push_back(2); });

    source.cancel();
    source.cancel();

    EXPECT_TRUE(token.isCancellationRequested());
    EXPECT_TRUE(source.isCancellationRequested());
    EXPECT_EQ(order, (std::vector<int>{1, 2}));
}

TEST(CancellationTokenTest, RegistrationAfterCancelRunsImmediately) {
    CancellationTokenSource source;
    source.cancel();

    bool called = false;
    auto registration = source.token().onCancellationRequested([&called]() { called = true; });

    EXPECT_TRUE(called);
}

TEST(CancellationTokenTest, DestroyedRegistrationUnsubscribes) {
    CancellationTokenSource source;
    bool called = false;
    {
        auto registration = source.token().onCancellationRequested([&called]() { called = true; });
    }

    source.cancel();

    EXPECT_FALSE(called);
}

TEST(CancellationTokenTest, MovedRegistrationStaysActive) {
    CancellationTokenSource source;
    int calls = 0;
    CancellationRegistration kept;
    {
        auto registration = source.token().onCancellationRequested([&calls]() { ++calls; });
        kept = std::move(registration);
    }

    source.cancel();

    EXPECT_EQ(calls, 1);
}

TEST(CancellationTokenTest, CallbackMayDropItsOwnRegistration) {
    CancellationTokenSource source;
    CancellationRegistration registration;
    int calls = 0;
    registration = source.token().onCancellationRequested([&]() {
        ++calls;
        registration.reset();
    });

    source.cancel();

    EXPECT_EQ(calls, 1);
}

TEST(CancellationTokenTest, RegistrationOutlivingSourceIsHarmless) {
    CancellationRegistration registration;
    {
        CancellationTokenSource source;
        registration = source.token().onCancellationRequested([]() {});
    }
    registration.reset();
    SUCCEED();
}
