// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <boost/system/error_code.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace peerlink {
namespace network {

// Abstract stream/connection interfaces
// Allows dependency injection of different implementations:
// - TcpStream / TcpConnection: TCP sockets via boost::asio
// - MemoryStream / MemoryConnection: in-process pipes for testing (in test/)

class Stream;
class Connection;
using StreamPtr = std::shared_ptr<Stream>;
using ConnectionPtr = std::shared_ptr<Connection>;

// Stream - one duplex byte channel to a peer
//
// Blocking interface: a peer runs one reader thread per stream and at most
// one writer at a time, so read_full() and write() may run concurrently with
// each other but never with themselves.
class Stream {
public:
  virtual ~Stream() = default;

  // Block until exactly len bytes are read into buf
  // Returns eof/operation_aborted/... on failure; partial data is discarded
  virtual boost::system::error_code read_full(uint8_t *buf, size_t len) = 0;

  // Write all of data before deadline
  // Returns boost::asio::error::timed_out once the deadline passes; the
  // stream must not be reused after any error
  virtual boost::system::error_code
  write(const std::vector<uint8_t> &data,
        std::chrono::steady_clock::time_point deadline) = 0;

  // Close for writing only; the remote side can keep writing to us
  virtual void close_write() = 0;

  // Close both directions and unblock any pending read_full()
  virtual void close() = 0;

  virtual bool is_open() const = 0;
  virtual uint64_t id() const = 0;
};

// Connection - the primary connection handle to one remote peer
// Streams are multiplexed within it; closing it closes all of them.
class Connection {
public:
  virtual ~Connection() = default;

  virtual std::string remote_peer_id() const = 0;
  virtual std::string remote_address() const = 0;

  // Open a new outbound stream (nullptr on failure)
  virtual StreamPtr open_stream() = 0;

  virtual void close() = 0;
  virtual bool is_open() const = 0;
};

} // namespace network
} // namespace peerlink
