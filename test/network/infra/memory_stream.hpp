#pragma once

#include "network/stream.hpp"
#include <atomic>
#include <boost/asio/error.hpp>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace peerlink {
namespace network {

// One direction of an in-memory stream
struct MemoryPipe {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<uint8_t> data;
    bool write_closed = false; // writer side half-closed (reader sees EOF)
    bool read_closed = false;  // reader side closed (pending reads abort)
};

/**
 * MemoryStream - one endpoint of an in-process duplex pipe
 *
 * CreatePair() returns two connected endpoints. Writes can be stalled to
 * exercise write deadlines: a stalled write waits until the stall is
 * lifted or its deadline passes (then reports timed_out).
 */
class MemoryStream : public Stream {
public:
    static std::pair<std::shared_ptr<MemoryStream>, std::shared_ptr<MemoryStream>>
    CreatePair() {
        auto a_to_b = std::make_shared<MemoryPipe>();
        auto b_to_a = std::make_shared<MemoryPipe>();
        auto a = std::make_shared<MemoryStream>(b_to_a, a_to_b);
        auto b = std::make_shared<MemoryStream>(a_to_b, b_to_a);
        return {a, b};
    }

    MemoryStream(std::shared_ptr<MemoryPipe> in, std::shared_ptr<MemoryPipe> out)
        : in_(std::move(in)), out_(std::move(out)), id_(next_id()) {}

    ~MemoryStream() override { close(); }

    boost::system::error_code read_full(uint8_t* buf, size_t len) override {
        std::unique_lock<std::mutex> lock(in_->mutex);
        in_->cv.wait(lock, [&] {
            return in_->read_closed || in_->write_closed || in_->data.size() >= len;
        });
        if (in_->read_closed) {
            return boost::asio::error::operation_aborted;
        }
        if (in_->data.size() < len) {
            return boost::asio::error::eof;
        }
        for (size_t i = 0; i < len; ++i) {
            buf[i] = in_->data.front();
            in_->data.pop_front();
        }
        return {};
    }

    boost::system::error_code write(const std::vector<uint8_t>& data,
                                    std::chrono::steady_clock::time_point deadline) override {
        {
            std::unique_lock<std::mutex> lock(stall_mutex_);
            if (!stall_cv_.wait_until(lock, deadline, [&] { return !stalled_ || closed_; })) {
                timed_out_writes_++;
                return boost::asio::error::timed_out;
            }
        }
        if (closed_.load()) {
            return boost::asio::error::not_connected;
        }

        std::lock_guard<std::mutex> lock(out_->mutex);
        if (out_->write_closed || out_->read_closed) {
            return boost::asio::error::broken_pipe;
        }
        out_->data.insert(out_->data.end(), data.begin(), data.end());
        writes_++;
        out_->cv.notify_all();
        return {};
    }

    void close_write() override {
        close_write_calls_++;
        std::lock_guard<std::mutex> lock(out_->mutex);
        out_->write_closed = true;
        out_->cv.notify_all();
    }

    void close() override {
        if (closed_.exchange(true)) {
            return;
        }
        {
            std::lock_guard<std::mutex> lock(out_->mutex);
            out_->write_closed = true;
            out_->cv.notify_all();
        }
        {
            std::lock_guard<std::mutex> lock(in_->mutex);
            in_->read_closed = true;
            in_->cv.notify_all();
        }
        {
            std::lock_guard<std::mutex> lock(stall_mutex_);
            stall_cv_.notify_all();
        }
    }

    bool is_open() const override { return !closed_.load(); }
    uint64_t id() const override { return id_; }

    // Test controls
    void set_write_stall(bool stalled) {
        std::lock_guard<std::mutex> lock(stall_mutex_);
        stalled_ = stalled;
        stall_cv_.notify_all();
    }

    // Bytes written by the other endpoint and not yet read here
    size_t pending_bytes() {
        std::lock_guard<std::mutex> lock(in_->mutex);
        return in_->data.size();
    }

    int writes() const { return writes_.load(); }
    int timed_out_writes() const { return timed_out_writes_.load(); }
    int close_write_calls() const { return close_write_calls_.load(); }
    bool write_closed() {
        std::lock_guard<std::mutex> lock(out_->mutex);
        return out_->write_closed;
    }

private:
    static uint64_t next_id() {
        static std::atomic<uint64_t> counter{1};
        return counter++;
    }

    std::shared_ptr<MemoryPipe> in_;
    std::shared_ptr<MemoryPipe> out_;
    const uint64_t id_;
    std::atomic<bool> closed_{false};

    std::mutex stall_mutex_;
    std::condition_variable stall_cv_;
    bool stalled_ = false;

    std::atomic<int> writes_{0};
    std::atomic<int> timed_out_writes_{0};
    std::atomic<int> close_write_calls_{0};
};

using MemoryStreamPtr = std::shared_ptr<MemoryStream>;

/**
 * MemoryConnection - Connection whose streams are MemoryStream pairs
 *
 * open_stream() keeps the local endpoint and queues the remote endpoint
 * for the test to pick up with take_remote().
 */
class MemoryConnection : public Connection {
public:
    MemoryConnection(std::string peer_id = "peer-1", std::string address = "127.0.0.1:9590")
        : peer_id_(std::move(peer_id)), address_(std::move(address)) {}

    std::string remote_peer_id() const override { return peer_id_; }
    std::string remote_address() const override { return address_; }

    StreamPtr open_stream() override {
        std::lock_guard<std::mutex> lock(mutex_);
        open_calls_++;
        if (closed_ || fail_opens_) {
            return nullptr;
        }
        auto [local, remote] = MemoryStream::CreatePair();
        local->set_write_stall(stall_new_streams_);
        local_.push_back(local);
        remote_.push_back(remote);
        return local;
    }

    void close() override {
        std::vector<MemoryStreamPtr> locals;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return;
            }
            closed_ = true;
            locals = local_;
        }
        for (auto& stream : locals) {
            stream->close();
        }
    }

    bool is_open() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return !closed_;
    }

    // Track a stream created by the test so close() closes it too
    void attach(const MemoryStreamPtr& stream) {
        std::lock_guard<std::mutex> lock(mutex_);
        local_.push_back(stream);
    }

    void set_fail_opens(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_opens_ = fail;
    }

    void set_stall_new_streams(bool stall) {
        std::lock_guard<std::mutex> lock(mutex_);
        stall_new_streams_ = stall;
    }

    int open_calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return open_calls_;
    }

    std::vector<MemoryStreamPtr> local_streams() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return local_;
    }

    std::vector<MemoryStreamPtr> remote_streams() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return remote_;
    }

private:
    const std::string peer_id_;
    const std::string address_;

    mutable std::mutex mutex_;
    std::vector<MemoryStreamPtr> local_;
    std::vector<MemoryStreamPtr> remote_;
    bool closed_ = false;
    bool fail_opens_ = false;
    bool stall_new_streams_ = false;
    int open_calls_ = 0;
};

} // namespace network
} // namespace peerlink
