#pragma once

#include "network/message.hpp"
#include "network/protocol.hpp"
#include "util/endian.hpp"
#include <algorithm>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace peerlink {
namespace test {

// Poll until pred() holds or the timeout elapses
template <typename Pred>
bool WaitUntil(Pred pred, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return true;
}

inline message::MessagePtr MakeMessage(uint32_t chain_id, message::MessageType type,
                                       const std::string& body, bool dedup = false) {
    return std::make_shared<const message::P2PMessage>(
        chain_id, type, std::vector<uint8_t>(body.begin(), body.end()), dedup);
}

// Raw frame with an arbitrary payload (no codec prefix added)
inline std::vector<uint8_t> RawFrame(uint32_t chain_id, const std::vector<uint8_t>& payload,
                                     int64_t send_time_ns) {
    std::vector<uint8_t> frame(protocol::FRAME_HEADER_SIZE + payload.size() +
                               protocol::SEND_TIME_SIZE);
    endian::WriteBE32(frame.data(), chain_id);
    endian::WriteBE32(frame.data() + 4, static_cast<uint32_t>(payload.size()));
    std::copy(payload.begin(), payload.end(), frame.begin() + protocol::FRAME_HEADER_SIZE);
    endian::WriteBE64(frame.data() + protocol::FRAME_HEADER_SIZE + payload.size(),
                      static_cast<uint64_t>(send_time_ns));
    return frame;
}

// Body of a decoded message as a string
inline std::string DataString(const message::P2PMessage& msg) {
    auto data = msg.data();
    return std::string(data.begin(), data.end());
}

} // namespace test
} // namespace peerlink
