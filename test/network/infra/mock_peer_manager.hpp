#pragma once

#include "network/message.hpp"
#include "network/peer_manager.hpp"
#include "network/stream.hpp"
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace peerlink {
namespace network {

// PeerManager fake that records every call
class MockPeerManager : public PeerManager {
public:
    explicit MockPeerManager(uint32_t chain_id = 7) : chain_id_(chain_id) {}

    void handle_message(const message::MessagePtr& msg, const std::string& sender_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        received_.emplace_back(msg, sender_id);
        cv_.notify_all();
    }

    void remove_neighbor(const std::string& peer_id) override {
        std::function<void(const std::string&)> hook;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            removed_.push_back(peer_id);
            hook = on_remove_;
            cv_.notify_all();
        }
        if (hook) {
            hook(peer_id);
        }
    }

    StreamPtr new_outbound_stream(const std::string& peer_id) override {
        std::function<StreamPtr()> opener;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stream_requests_.push_back(peer_id);
            opener = opener_;
        }
        return opener ? opener() : nullptr;
    }

    uint32_t chain_id() const override { return chain_id_; }

    // Test controls
    void set_opener(std::function<StreamPtr()> opener) {
        std::lock_guard<std::mutex> lock(mutex_);
        opener_ = std::move(opener);
    }

    void set_on_remove(std::function<void(const std::string&)> hook) {
        std::lock_guard<std::mutex> lock(mutex_);
        on_remove_ = std::move(hook);
    }

    bool wait_for_messages(size_t count,
                           std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return received_.size() >= count; });
    }

    bool wait_for_removal(std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return !removed_.empty(); });
    }

    std::vector<std::pair<message::MessagePtr, std::string>> received() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return received_;
    }

    size_t received_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return received_.size();
    }

    std::vector<std::string> removed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return removed_;
    }

    size_t stream_requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stream_requests_.size();
    }

private:
    const uint32_t chain_id_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::pair<message::MessagePtr, std::string>> received_;
    std::vector<std::string> removed_;
    std::vector<std::string> stream_requests_;
    std::function<StreamPtr()> opener_;
    std::function<void(const std::string&)> on_remove_;
};

} // namespace network
} // namespace peerlink
