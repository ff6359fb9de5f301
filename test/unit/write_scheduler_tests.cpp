// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "network/write_scheduler.hpp"
#include "../network/infra/test_helpers.hpp"
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace peerlink;
using namespace peerlink::network;
using peerlink::message::MessagePtr;
using peerlink::message::MessageType;
using peerlink::test::DataString;
using peerlink::test::MakeMessage;
using peerlink::test::WaitUntil;

namespace {

// Records the order in which the scheduler hands messages out
class SendLog {
public:
    void record(const std::string& tag, const MessagePtr& msg) {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.push_back(tag + ":" + DataString(*msg));
    }

    std::vector<std::string> entries() {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_;
    }

    size_t size() {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

private:
    std::mutex mutex_;
    std::vector<std::string> entries_;
};

MessagePtr Msg(const std::string& body) {
    return MakeMessage(7, MessageType::Ping, body);
}

} // namespace

TEST_CASE("WriteScheduler urgent messages precede queued normal ones", "[scheduler]") {
    SendLog log;
    WriteScheduler scheduler(
        16, [&](const MessagePtr& m) { log.record("U", m); },
        [&](const MessagePtr& m) { log.record("N", m); });

    REQUIRE(scheduler.try_enqueue(Msg("n1"), MessagePriority::Normal));
    REQUIRE(scheduler.try_enqueue(Msg("n2"), MessagePriority::Normal));
    REQUIRE(scheduler.try_enqueue(Msg("u1"), MessagePriority::Urgent));
    REQUIRE(scheduler.try_enqueue(Msg("u2"), MessagePriority::Urgent));

    std::thread loop([&]() { scheduler.run(); });
    REQUIRE(WaitUntil([&]() { return log.size() == 4; }));
    scheduler.stop();
    loop.join();

    std::vector<std::string> expected{"U:u1", "U:u2", "N:n1", "N:n2"};
    CHECK(log.entries() == expected);
}

TEST_CASE("WriteScheduler urgent enqueued during a write beats an earlier normal", "[scheduler]") {
    SendLog log;
    std::mutex gate_mutex;
    std::condition_variable gate_cv;
    bool gate_open = false;
    std::atomic<bool> in_first_send{false};

    WriteScheduler scheduler(
        16,
        [&](const MessagePtr& m) {
            if (DataString(*m) == "u1") {
                in_first_send = true;
                std::unique_lock<std::mutex> lock(gate_mutex);
                gate_cv.wait(lock, [&]() { return gate_open; });
            }
            log.record("U", m);
        },
        [&](const MessagePtr& m) { log.record("N", m); });

    std::thread loop([&]() { scheduler.run(); });

    REQUIRE(scheduler.try_enqueue(Msg("u1"), MessagePriority::Urgent));
    REQUIRE(WaitUntil([&]() { return in_first_send.load(); }));

    // Loop is blocked writing u1
    REQUIRE(scheduler.try_enqueue(Msg("n1"), MessagePriority::Normal));
    REQUIRE(scheduler.try_enqueue(Msg("u2"), MessagePriority::Urgent));

    {
        std::lock_guard<std::mutex> lock(gate_mutex);
        gate_open = true;
    }
    gate_cv.notify_all();

    REQUIRE(WaitUntil([&]() { return log.size() == 3; }));
    scheduler.stop();
    loop.join();

    std::vector<std::string> expected{"U:u1", "U:u2", "N:n1"};
    CHECK(log.entries() == expected);
}

TEST_CASE("WriteScheduler urgent order is preserved", "[scheduler]") {
    SendLog log;
    WriteScheduler scheduler(
        256, [&](const MessagePtr& m) { log.record("U", m); },
        [&](const MessagePtr&) {});

    std::thread loop([&]() { scheduler.run(); });
    for (int i = 0; i < 200; ++i) {
        REQUIRE(scheduler.try_enqueue(Msg(std::to_string(i)), MessagePriority::Urgent));
    }
    REQUIRE(WaitUntil([&]() { return log.size() == 200; }));
    scheduler.stop();
    loop.join();

    auto entries = log.entries();
    for (int i = 0; i < 200; ++i) {
        CHECK(entries[i] == "U:" + std::to_string(i));
    }
}

TEST_CASE("WriteScheduler queue capacity", "[scheduler]") {
    WriteScheduler scheduler(
        protocol::DEFAULT_MESSAGE_QUEUE_SIZE, [](const MessagePtr&) {},
        [](const MessagePtr&) {});

    for (size_t i = 0; i < protocol::DEFAULT_MESSAGE_QUEUE_SIZE; ++i) {
        REQUIRE(scheduler.try_enqueue(Msg("x"), MessagePriority::Normal));
    }
    CHECK(scheduler.normal_size() == protocol::DEFAULT_MESSAGE_QUEUE_SIZE);
    CHECK_FALSE(scheduler.try_enqueue(Msg("overflow"), MessagePriority::Normal));

    // The urgent queue is independent
    CHECK(scheduler.try_enqueue(Msg("u"), MessagePriority::Urgent));
    CHECK(scheduler.urgent_size() == 1);
}

TEST_CASE("WriteScheduler stop", "[scheduler]") {
    std::atomic<int> sent{0};
    WriteScheduler scheduler(
        16, [&](const MessagePtr&) { sent++; }, [&](const MessagePtr&) { sent++; });

    SECTION("Queued messages are discarded") {
        REQUIRE(scheduler.try_enqueue(Msg("a"), MessagePriority::Normal));
        REQUIRE(scheduler.try_enqueue(Msg("b"), MessagePriority::Urgent));

        scheduler.stop();
        scheduler.run(); // returns at once

        CHECK(sent == 0);
        CHECK(scheduler.urgent_size() == 0);
        CHECK(scheduler.normal_size() == 0);
    }

    SECTION("Stop wakes an idle loop") {
        std::thread loop([&]() { scheduler.run(); });
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        scheduler.stop();
        loop.join();
        CHECK(scheduler.is_stopped());
    }

    SECTION("Enqueue after stop fails and stop is idempotent") {
        scheduler.stop();
        scheduler.stop();
        CHECK(scheduler.is_stopped());
        CHECK_FALSE(scheduler.try_enqueue(Msg("late"), MessagePriority::Urgent));
        CHECK_FALSE(scheduler.try_enqueue(Msg("late"), MessagePriority::Normal));
    }
}

TEST_CASE("MessagePriority names", "[scheduler]") {
    CHECK(std::string(ToString(MessagePriority::Urgent)) == "urgent");
    CHECK(std::string(ToString(MessagePriority::Normal)) == "normal");
}
