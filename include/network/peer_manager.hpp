// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/message.hpp"
#include "network/stream.hpp"
#include <cstdint>
#include <string>

namespace peerlink {
namespace network {

// PeerManager - what a Peer needs from the layer that owns it
// Implemented by NetworkManager; tests substitute a recording fake.
class PeerManager {
public:
  virtual ~PeerManager() = default;

  // Deliver a decoded inbound message; called from the peer's reader threads
  virtual void handle_message(const message::MessagePtr &msg,
                              const std::string &sender_id) = 0;

  // Drop the peer (stop it and forget it); must tolerate unknown ids and
  // calls from the peer's own threads
  virtual void remove_neighbor(const std::string &peer_id) = 0;

  // Open another stream to an existing peer (nullptr on failure)
  virtual StreamPtr new_outbound_stream(const std::string &peer_id) = 0;

  // Local chain identifier; frames carrying any other value are rejected
  virtual uint32_t chain_id() const = 0;
};

} // namespace network
} // namespace peerlink
