// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/stream.hpp"
#include <atomic>
#include <utility>  // std::exchange, used by boost/asio/awaitable.hpp in C++20
#include <boost/asio.hpp>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/strand.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace peerlink {
namespace network {

/**
 * TcpStream - boost::asio TCP socket behind the blocking Stream interface
 *
 * Every socket operation runs on the stream's strand; the calling thread
 * waits for the completion. The transport's io_context must be running
 * for I/O to make progress, but close() unblocks waiting readers
 * regardless. async_read() is the non-blocking variant used on I/O threads.
 */
class TcpStream : public Stream, public std::enable_shared_from_this<TcpStream> {
public:
  using ReadHandler =
      std::function<void(const boost::system::error_code &ec, std::vector<uint8_t> data)>;

  static std::shared_ptr<TcpStream> create(boost::asio::io_context &io_context,
                                           boost::asio::ip::tcp::socket socket);

  ~TcpStream() override;

  TcpStream(const TcpStream &) = delete;
  TcpStream &operator=(const TcpStream &) = delete;

  boost::system::error_code read_full(uint8_t *buf, size_t len) override;
  boost::system::error_code
  write(const std::vector<uint8_t> &data,
        std::chrono::steady_clock::time_point deadline) override;
  void close_write() override;
  void close() override;
  bool is_open() const override { return !closed_.load(); }
  uint64_t id() const override { return id_; }

  /**
   * Read exactly len bytes without blocking the caller
   * The handler runs on the stream's strand. Past the deadline the stream
   * is closed and the handler gets timed_out.
   */
  void async_read(size_t len, std::chrono::steady_clock::time_point deadline,
                  ReadHandler handler);

  const std::string &remote_host() const { return remote_host_; }
  uint16_t remote_port() const { return remote_port_; }

private:
  TcpStream(boost::asio::io_context &io_context, boost::asio::ip::tcp::socket socket);

  // Strand-serialized (must be called on strand_)
  void close_impl();

  boost::asio::ip::tcp::socket socket_;
  boost::asio::strand<boost::asio::any_io_executor> strand_;
  uint64_t id_;
  static std::atomic<uint64_t> next_id_;

  std::atomic<bool> closed_{false};
  std::string remote_host_;
  uint16_t remote_port_ = 0;

  // How often a blocked reader re-checks closed_
  static constexpr std::chrono::milliseconds READ_POLL_INTERVAL{50};
};

/**
 * StreamHello - identity preamble written by the dialing side
 *
 *   [2B node id length][node id][2B listen port]   (big-endian)
 *
 * Lets the accepting node route the stream to the right Peer and dial
 * that peer back when it needs more streams.
 */
struct StreamHello {
  static constexpr size_t MAX_NODE_ID_LENGTH = 256;
  static constexpr size_t LENGTH_SIZE = 2;

  using Handler = std::function<void(std::optional<StreamHello> hello)>;

  std::string node_id;
  uint16_t listen_port = 0;

  std::vector<uint8_t> serialize() const;

  // Parse a complete preamble; nullopt if malformed or of the wrong size
  static std::optional<StreamHello> deserialize(const std::vector<uint8_t> &data);

  // Read the preamble off an accepted stream without blocking; the handler
  // gets nullopt on I/O error, timeout or a malformed preamble
  static void async_read(const std::shared_ptr<TcpStream> &stream,
                         std::chrono::steady_clock::time_point deadline, Handler handler);
};

/**
 * TcpTransport - owns the io_context, its I/O threads and the acceptor
 *
 * Shutdown order: stop every peer using this transport (closing their
 * streams) before stop(); stream operations queued after the io_context
 * stops never complete.
 */
class TcpTransport {
public:
  // Called on an I/O thread; must not block
  using AcceptCallback = std::function<void(std::shared_ptr<TcpStream>)>;

  explicit TcpTransport(size_t io_threads = 1);
  ~TcpTransport();

  TcpTransport(const TcpTransport &) = delete;
  TcpTransport &operator=(const TcpTransport &) = delete;

  // Blocking dial (never call from an I/O thread); nullptr on failure
  std::shared_ptr<TcpStream> connect(const std::string &host, uint16_t port,
                                     std::chrono::milliseconds timeout);

  // Port 0 binds an ephemeral port (see listening_port())
  bool listen(uint16_t port, AcceptCallback accept_callback);
  void stop_listening();

  void run();
  void stop();
  bool is_running() const { return running_; }

  boost::asio::io_context &io_context() { return *io_context_; }

  // Bound listening port (0 if not listening)
  uint16_t listening_port() const;

private:
  void start_accept();
  void handle_accept(const boost::system::error_code &ec,
                     boost::asio::ip::tcp::socket socket);

  // io_context_ is destroyed only in the destructor so it outlives every
  // stream created from it
  std::unique_ptr<boost::asio::io_context> io_context_;
  std::unique_ptr<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      work_guard_;
  std::vector<std::thread> io_threads_;
  std::atomic<bool> running_{false};
  size_t desired_io_threads_{1};

  std::mutex acceptor_mutex_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
  AcceptCallback accept_callback_;
  std::atomic<uint16_t> last_listen_port_{0};
};

/**
 * TcpConnection - the Connection grouping every TCP stream to one peer
 *
 * open_stream() dials the peer's advertised endpoint and writes the local
 * preamble; accepted streams are adopted with attach(). close() closes all
 * streams still alive.
 */
class TcpConnection : public Connection {
public:
  TcpConnection(TcpTransport &transport, std::string peer_id, std::string host,
                uint16_t port, std::chrono::milliseconds connect_timeout,
                std::vector<uint8_t> preamble);
  ~TcpConnection() override;

  std::string remote_peer_id() const override { return peer_id_; }
  std::string remote_address() const override;

  StreamPtr open_stream() override;
  void close() override;
  bool is_open() const override { return !closed_.load(); }

  // Track a stream opened elsewhere; closes it at once if already closed
  void attach(const StreamPtr &stream);

  size_t tracked_streams() const;

private:
  TcpTransport &transport_;
  const std::string peer_id_;
  const std::string host_;
  const uint16_t port_;
  const std::chrono::milliseconds connect_timeout_;
  const std::vector<uint8_t> preamble_;

  mutable std::mutex mutex_;
  std::vector<std::weak_ptr<Stream>> streams_;
  std::atomic<bool> closed_{false};
};

} // namespace network
} // namespace peerlink
