// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "network/stream_pool.hpp"
#include "../network/infra/memory_stream.hpp"
#include "../network/infra/test_helpers.hpp"
#include <atomic>
#include <set>
#include <thread>
#include <vector>

using namespace peerlink;
using namespace peerlink::network;
using peerlink::test::WaitUntil;

namespace {

// Opener handing out fresh in-memory streams and recording them
struct TestOpener {
    std::atomic<int> opens{0};
    std::atomic<bool> fail{false};
    std::mutex mutex;
    std::vector<MemoryStreamPtr> remotes;

    StreamPtr operator()() {
        opens++;
        if (fail) {
            return nullptr;
        }
        auto [local, remote] = MemoryStream::CreatePair();
        std::lock_guard<std::mutex> lock(mutex);
        remotes.push_back(remote);
        return local;
    }
};

} // namespace

TEST_CASE("StreamPool opens streams up to the cap", "[pool]") {
    TestOpener opener;
    std::atomic<int> opened_callbacks{0};
    StreamPool pool(
        3, [&]() { return opener(); },
        [&](const StreamPtr&) { opened_callbacks++; });

    std::vector<StreamPtr> held;
    for (int i = 0; i < 3; ++i) {
        StreamPtr s;
        REQUIRE(pool.acquire(s) == AcquireStatus::Ok);
        REQUIRE(s != nullptr);
        held.push_back(s);
    }
    CHECK(pool.live_count() == 3);
    CHECK(opener.opens == 3);
    CHECK(opened_callbacks == 3);

    SECTION("Released streams are reused before opening new ones") {
        pool.release(held[0]);
        StreamPtr s;
        REQUIRE(pool.acquire(s) == AcquireStatus::Ok);
        CHECK(s == held[0]);
        CHECK(opener.opens == 3);
    }

    SECTION("Acquire at the cap blocks until a release") {
        std::atomic<bool> acquired{false};
        AcquireStatus status = AcquireStatus::Closed;
        StreamPtr got;
        std::thread waiter([&]() {
            status = pool.acquire(got);
            acquired = true;
        });

        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        CHECK_FALSE(acquired);
        // No open is attempted while at the cap
        CHECK(opener.opens == 3);

        pool.release(held[1]);
        waiter.join();
        CHECK(acquired);
        CHECK(status == AcquireStatus::Ok);
        CHECK(got == held[1]);
    }

    SECTION("Retiring frees a slot for a new stream") {
        pool.retire(held[2]);
        CHECK(pool.live_count() == 2);

        StreamPtr s;
        REQUIRE(pool.acquire(s) == AcquireStatus::Ok);
        CHECK(opener.opens == 4);
        CHECK(s != held[2]);
    }

    SECTION("Shutdown wakes blocked acquirers") {
        std::atomic<int> status{-1};
        std::thread waiter([&]() {
            StreamPtr s;
            status = static_cast<int>(pool.acquire(s));
        });
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        pool.shutdown();
        waiter.join();
        CHECK(status == static_cast<int>(AcquireStatus::Closed));
    }
}

TEST_CASE("StreamPool retire closes for writing and is idempotent", "[pool]") {
    TestOpener opener;
    StreamPool pool(2, [&]() { return opener(); }, nullptr);

    StreamPtr s;
    REQUIRE(pool.acquire(s) == AcquireStatus::Ok);
    auto mem = std::static_pointer_cast<MemoryStream>(s);

    pool.retire(s);
    CHECK(mem->close_write_calls() == 1);
    CHECK(pool.live_count() == 0);

    pool.retire(s);
    CHECK(mem->close_write_calls() == 1);
    CHECK(pool.live_count() == 0);

    // A retired stream is never handed out again, even if released
    pool.release(s);
    CHECK(pool.idle_count() == 0);
    StreamPtr next;
    REQUIRE(pool.acquire(next) == AcquireStatus::Ok);
    CHECK(next != s);
}

TEST_CASE("StreamPool open failure", "[pool]") {
    TestOpener opener;
    opener.fail = true;
    StreamPool pool(2, [&]() { return opener(); }, nullptr);

    StreamPtr s;
    CHECK(pool.acquire(s) == AcquireStatus::OpenFailed);
    CHECK(s == nullptr);
    // The reserved slot is given back
    CHECK(pool.live_count() == 0);

    opener.fail = false;
    CHECK(pool.acquire(s) == AcquireStatus::Ok);
}

TEST_CASE("StreamPool add enforces the cap", "[pool]") {
    StreamPool pool(2, nullptr, nullptr);

    auto [a, ra] = MemoryStream::CreatePair();
    auto [b, rb] = MemoryStream::CreatePair();
    auto [c, rc] = MemoryStream::CreatePair();

    CHECK(pool.add(a));
    CHECK_FALSE(pool.add(a)); // already registered
    CHECK(pool.add(b));
    CHECK_FALSE(pool.add(c));
    CHECK(pool.live_count() == 2);
    CHECK(pool.idle_count() == 2);

    // Added streams are handed out in order
    StreamPtr s;
    REQUIRE(pool.acquire(s) == AcquireStatus::Ok);
    CHECK(s == a);

    pool.shutdown();
    CHECK_FALSE(pool.add(c));
}

TEST_CASE("StreamPool invalidate", "[pool]") {
    StreamPool pool(2, nullptr, nullptr);
    auto [a, ra] = MemoryStream::CreatePair();
    auto [b, rb] = MemoryStream::CreatePair();
    REQUIRE(pool.add(a));
    REQUIRE(pool.add(b));

    SECTION("Idle stream is dropped at once") {
        pool.invalidate(b);
        CHECK(pool.live_count() == 1);
        CHECK(pool.idle_count() == 1);
        CHECK(b->close_write_calls() == 1);
    }

    SECTION("Checked-out stream is retired on release") {
        StreamPtr s;
        REQUIRE(pool.acquire(s) == AcquireStatus::Ok);
        REQUIRE(s == a);

        pool.invalidate(a);
        CHECK(pool.live_count() == 2);

        pool.release(a);
        CHECK(pool.live_count() == 1);
        CHECK(pool.idle_count() == 1);
        CHECK(a->close_write_calls() == 1);
    }
}

TEST_CASE("StreamPool never exceeds the cap under contention", "[pool]") {
    const size_t cap = 4;
    TestOpener opener;
    std::atomic<size_t> checked_out{0};
    std::atomic<size_t> max_checked_out{0};
    std::atomic<size_t> max_live{0};

    StreamPool pool(cap, [&]() { return opener(); }, nullptr);

    std::vector<std::thread> workers;
    for (int t = 0; t < 8; ++t) {
        workers.emplace_back([&, t]() {
            for (int i = 0; i < 200; ++i) {
                StreamPtr s;
                if (pool.acquire(s) != AcquireStatus::Ok) {
                    continue;
                }
                size_t now = ++checked_out;
                size_t prev = max_checked_out.load();
                while (now > prev && !max_checked_out.compare_exchange_weak(prev, now)) {
                }
                size_t live = pool.live_count();
                prev = max_live.load();
                while (live > prev && !max_live.compare_exchange_weak(prev, live)) {
                }
                --checked_out;
                if ((i + t) % 17 == 0) {
                    pool.retire(s);
                } else {
                    pool.release(s);
                }
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    CHECK(max_checked_out <= cap);
    CHECK(max_live <= cap);
    CHECK(pool.live_count() <= cap);
}
