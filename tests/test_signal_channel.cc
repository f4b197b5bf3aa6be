#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <thread>

#include "signal_channel.hpp"

using namespace promfile;
using namespace std::chrono_literals;

class SignalChannelTest : public ::testing::Test {
   protected:
    void SetUp() override { cancellable = g_cancellable_new(); }
    void TearDown() override { g_object_unref(cancellable); }

    GCancellable* cancellable = nullptr;
};

TEST_F(SignalChannelTest, SendCompletesOnlyWhenReceived) {
    SignalChannel channel;
    std::atomic<bool> sent{false};

    std::thread sender([&] {
        EXPECT_TRUE(channel.send());
        sent = true;
    });

    std::this_thread::sleep_for(100ms);
    EXPECT_FALSE(sent.load());

    EXPECT_TRUE(channel.receive());
    sender.join();
    EXPECT_TRUE(sent.load());
}

TEST_F(SignalChannelTest, EachSendDeliversOneSignal) {
    SignalChannel channel;

    std::thread sender([&] {
        for (int i = 0; i < 3; ++i) {
            EXPECT_TRUE(channel.send());
        }
        channel.close();
    });

    int received = 0;
    while (channel.receive()) {
        ++received;
    }
    sender.join();
    EXPECT_EQ(received, 3);
}

TEST_F(SignalChannelTest, CloseHappensOnce) {
    SignalChannel channel;
    EXPECT_FALSE(channel.is_closed());
    EXPECT_TRUE(channel.close());
    EXPECT_FALSE(channel.close());
    EXPECT_TRUE(channel.is_closed());
}

TEST_F(SignalChannelTest, ClosedChannelRejectsSendAndReceive) {
    SignalChannel channel;
    channel.close();
    EXPECT_FALSE(channel.send());
    EXPECT_FALSE(channel.receive());
}

TEST_F(SignalChannelTest, CloseWakesBlockedReceiver) {
    SignalChannel channel;
    auto result = std::async(std::launch::async, [&] { return channel.receive(); });

    std::this_thread::sleep_for(50ms);
    channel.close();

    ASSERT_EQ(result.wait_for(2s), std::future_status::ready);
    EXPECT_FALSE(result.get());
}

TEST_F(SignalChannelTest, CloseWithdrawsUntakenSignal) {
    SignalChannel channel;
    auto result = std::async(std::launch::async, [&] { return channel.send(); });

    std::this_thread::sleep_for(50ms);
    channel.close();

    ASSERT_EQ(result.wait_for(2s), std::future_status::ready);
    EXPECT_FALSE(result.get());
    EXPECT_FALSE(channel.receive());
}

TEST_F(SignalChannelTest, CancellationUnblocksReceive) {
    SignalChannel channel;
    auto result = std::async(std::launch::async, [&] { return channel.receive(cancellable); });

    std::this_thread::sleep_for(50ms);
    g_cancellable_cancel(cancellable);

    ASSERT_EQ(result.wait_for(2s), std::future_status::ready);
    EXPECT_FALSE(result.get());
    EXPECT_FALSE(channel.is_closed());
}

TEST_F(SignalChannelTest, CancelledSendIsWithdrawn) {
    SignalChannel channel;
    auto result = std::async(std::launch::async, [&] { return channel.send(cancellable); });

    std::this_thread::sleep_for(50ms);
    g_cancellable_cancel(cancellable);
    ASSERT_EQ(result.wait_for(2s), std::future_status::ready);
    EXPECT_FALSE(result.get());

    // Nothing left behind for a later receiver
    GCancellable* other = g_cancellable_new();
    auto late = std::async(std::launch::async, [&] { return channel.receive(other); });
    EXPECT_EQ(late.wait_for(100ms), std::future_status::timeout);
    g_cancellable_cancel(other);
    EXPECT_FALSE(late.get());
    g_object_unref(other);
}

TEST_F(SignalChannelTest, AbortChannelClosureWithdrawsSend) {
    auto group = std::make_shared<SignalGroup>();
    SignalChannel channel(group);
    SignalChannel abort(group);

    auto result = std::async(std::launch::async, [&] { return channel.send(cancellable, &abort); });
    EXPECT_EQ(result.wait_for(100ms), std::future_status::timeout);

    abort.close();
    ASSERT_EQ(result.wait_for(2s), std::future_status::ready);
    EXPECT_FALSE(result.get());
    EXPECT_FALSE(channel.is_closed());

    // The withdrawn signal never reaches a later receiver
    auto late = std::async(std::launch::async, [&] { return channel.receive(cancellable); });
    EXPECT_EQ(late.wait_for(100ms), std::future_status::timeout);
    g_cancellable_cancel(cancellable);
    EXPECT_FALSE(late.get());
}

TEST_F(SignalChannelTest, ClosedAbortChannelRefusesSend) {
    auto group = std::make_shared<SignalGroup>();
    SignalChannel channel(group);
    SignalChannel abort(group);
    abort.close();

    EXPECT_FALSE(channel.send(cancellable, &abort));
}

TEST_F(SignalChannelTest, AlreadyCancelledReturnsImmediately) {
    SignalChannel channel;
    g_cancellable_cancel(cancellable);
    EXPECT_FALSE(channel.receive(cancellable));
    EXPECT_FALSE(channel.send(cancellable));
}

TEST_F(SignalChannelTest, SelectReportsWhichChannel) {
    auto group = std::make_shared<SignalGroup>();
    SignalChannel first(group);
    SignalChannel second(group);

    std::thread sender([&] { EXPECT_TRUE(second.send()); });

    auto selection = select_signal({&first, &second}, cancellable);
    sender.join();

    ASSERT_TRUE(selection.has_value());
    EXPECT_EQ(selection->index, 1u);
    EXPECT_TRUE(selection->received);
}

TEST_F(SignalChannelTest, SelectPrefersEarlierChannel) {
    auto group = std::make_shared<SignalGroup>();
    SignalChannel first(group);
    SignalChannel second(group);

    auto pending = std::async(std::launch::async, [&] { return second.send(cancellable); });
    std::this_thread::sleep_for(50ms);
    first.close();

    auto selection = select_signal({&first, &second}, nullptr);
    ASSERT_TRUE(selection.has_value());
    EXPECT_EQ(selection->index, 0u);
    EXPECT_FALSE(selection->received);

    g_cancellable_cancel(cancellable);
    EXPECT_FALSE(pending.get());
}

TEST_F(SignalChannelTest, SelectReturnsNulloptOnCancel) {
    auto group = std::make_shared<SignalGroup>();
    SignalChannel first(group);
    SignalChannel second(group);

    auto result = std::async(std::launch::async, [&] { return select_signal({&first, &second}, cancellable); });
    std::this_thread::sleep_for(50ms);
    g_cancellable_cancel(cancellable);

    ASSERT_EQ(result.wait_for(2s), std::future_status::ready);
    EXPECT_FALSE(result.get().has_value());
}

TEST_F(SignalChannelTest, WaitForCancelTimesOut) {
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(wait_for_cancel(cancellable, 100ms));
    EXPECT_GE(std::chrono::steady_clock::now() - start, 90ms);
}

TEST_F(SignalChannelTest, WaitForCancelWakesEarly) {
    auto result = std::async(std::launch::async, [&] { return wait_for_cancel(cancellable, 10s); });
    std::this_thread::sleep_for(50ms);
    g_cancellable_cancel(cancellable);

    ASSERT_EQ(result.wait_for(2s), std::future_status::ready);
    EXPECT_TRUE(result.get());
}
