// Copyright (c) 2025 The Unicity Foundation
// TCP transport implementation using boost::asio sockets

#include "network/tcp_transport.hpp"
#include "util/endian.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <cstring>
#include <future>

namespace peerlink {
namespace network {

// ============================================================================
// TcpStream
// ============================================================================

std::atomic<uint64_t> TcpStream::next_id_{1};

std::shared_ptr<TcpStream> TcpStream::create(boost::asio::io_context &io_context,
                                             boost::asio::ip::tcp::socket socket) {
  return std::shared_ptr<TcpStream>(new TcpStream(io_context, std::move(socket)));
}

TcpStream::TcpStream(boost::asio::io_context &io_context,
                     boost::asio::ip::tcp::socket socket)
    : socket_(std::move(socket)), strand_(io_context.get_executor()),
      id_(next_id_++) {
  boost::system::error_code ec;
  auto ep = socket_.remote_endpoint(ec);
  if (!ec) {
    remote_host_ = ep.address().to_string();
    remote_port_ = ep.port();
  }

  // Best-effort socket options
  boost::system::error_code opt_ec;
  socket_.set_option(boost::asio::ip::tcp::no_delay(true), opt_ec);
  socket_.set_option(boost::asio::socket_base::keep_alive(true), opt_ec);
}

TcpStream::~TcpStream() {
  // The socket closes itself; do not log here, the logger may already be
  // shut down during program exit
}

boost::system::error_code TcpStream::read_full(uint8_t *buf, size_t len) {
  if (len == 0) {
    return {};
  }
  if (closed_.load()) {
    return boost::asio::error::not_connected;
  }

  // Read into a buffer owned by the operation: a reader unblocked by
  // close() returns before the aborted completion runs
  auto buffer = std::make_shared<std::vector<uint8_t>>(len);
  auto done = std::make_shared<std::promise<boost::system::error_code>>();
  auto result = done->get_future();

  boost::asio::dispatch(strand_, [this, self = shared_from_this(), buffer, done]() {
    if (closed_.load()) {
      done->set_value(boost::asio::error::operation_aborted);
      return;
    }
    boost::asio::async_read(
        socket_, boost::asio::buffer(*buffer),
        boost::asio::bind_executor(
            strand_, [self, buffer, done](const boost::system::error_code &ec, size_t) {
              done->set_value(ec);
            }));
  });

  while (result.wait_for(READ_POLL_INTERVAL) != std::future_status::ready) {
    if (closed_.load()) {
      return boost::asio::error::operation_aborted;
    }
  }

  boost::system::error_code ec = result.get();
  if (ec) {
    return ec;
  }
  std::memcpy(buf, buffer->data(), len);
  return {};
}

boost::system::error_code
TcpStream::write(const std::vector<uint8_t> &data,
                 std::chrono::steady_clock::time_point deadline) {
  if (closed_.load()) {
    return boost::asio::error::not_connected;
  }

  // Copy before posting: the caller may drop its buffer as soon as we
  // return on timeout
  auto payload = std::make_shared<std::vector<uint8_t>>(data);
  auto done = std::make_shared<std::promise<boost::system::error_code>>();
  auto result = done->get_future();

  boost::asio::dispatch(strand_, [this, self = shared_from_this(), payload, done]() {
    if (closed_.load()) {
      done->set_value(boost::asio::error::operation_aborted);
      return;
    }
    boost::asio::async_write(
        socket_, boost::asio::buffer(*payload),
        boost::asio::bind_executor(
            strand_, [self, payload, done](const boost::system::error_code &ec, size_t) {
              done->set_value(ec);
            }));
  });

  if (result.wait_until(deadline) != std::future_status::ready) {
    // A partially written frame leaves the stream unusable
    LOG_NET_DEBUG("write deadline exceeded on stream {} ({}:{}), closing", id_,
                  remote_host_, remote_port_);
    close();
    return boost::asio::error::timed_out;
  }
  return result.get();
}

void TcpStream::async_read(size_t len, std::chrono::steady_clock::time_point deadline,
                           ReadHandler handler) {
  auto buffer = std::make_shared<std::vector<uint8_t>>(len);
  auto timer = std::make_shared<boost::asio::steady_timer>(strand_);
  auto expired = std::make_shared<bool>(false);

  boost::asio::dispatch(strand_, [this, self = shared_from_this(), len, deadline, buffer,
                                  timer, expired, handler = std::move(handler)]() {
    if (closed_.load()) {
      handler(boost::asio::error::operation_aborted, {});
      return;
    }

    timer->expires_at(deadline);
    timer->async_wait(boost::asio::bind_executor(
        strand_, [self, expired](const boost::system::error_code &ec) {
          if (!ec) {
            *expired = true;
            self->close();
          }
        }));

    boost::asio::async_read(
        socket_, boost::asio::buffer(*buffer, len),
        boost::asio::bind_executor(
            strand_, [self, buffer, timer, expired,
                      handler](const boost::system::error_code &ec, size_t) {
              timer->cancel();
              if (*expired) {
                handler(boost::asio::error::timed_out, {});
              } else if (ec) {
                handler(ec, {});
              } else {
                handler(ec, std::move(*buffer));
              }
            }));
  });
}

void TcpStream::close_write() {
  boost::asio::dispatch(strand_, [this, self = shared_from_this()]() {
    if (closed_.load()) {
      return;
    }
    boost::system::error_code ec;
    socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
  });
}

void TcpStream::close() {
  // Flag first so blocked readers return without waiting for the strand
  if (closed_.exchange(true)) {
    return;
  }
  boost::asio::dispatch(strand_, [this, self = shared_from_this()]() { close_impl(); });
}

void TcpStream::close_impl() {
  // Pending operations complete with operation_aborted
  boost::system::error_code ec;
  socket_.cancel(ec);
  socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
  socket_.close(ec);
}

// ============================================================================
// StreamHello
// ============================================================================

std::vector<uint8_t> StreamHello::serialize() const {
  std::vector<uint8_t> out(2 + node_id.size() + 2);
  endian::WriteBE16(out.data(), static_cast<uint16_t>(node_id.size()));
  std::memcpy(out.data() + 2, node_id.data(), node_id.size());
  endian::WriteBE16(out.data() + 2 + node_id.size(), listen_port);
  return out;
}

namespace {

bool ValidNodeIdLength(uint16_t id_len) {
  return id_len != 0 && id_len <= StreamHello::MAX_NODE_ID_LENGTH;
}

} // namespace

std::optional<StreamHello> StreamHello::deserialize(const std::vector<uint8_t> &data) {
  if (data.size() < LENGTH_SIZE) {
    return std::nullopt;
  }
  uint16_t id_len = endian::ReadBE16(data.data());
  if (!ValidNodeIdLength(id_len) || data.size() != LENGTH_SIZE + id_len + 2) {
    return std::nullopt;
  }

  StreamHello hello;
  hello.node_id.assign(data.begin() + LENGTH_SIZE, data.begin() + LENGTH_SIZE + id_len);
  hello.listen_port = endian::ReadBE16(data.data() + LENGTH_SIZE + id_len);
  return hello;
}

void StreamHello::async_read(const std::shared_ptr<TcpStream> &stream,
                             std::chrono::steady_clock::time_point deadline,
                             Handler handler) {
  stream->async_read(
      LENGTH_SIZE, deadline,
      [stream, deadline, handler](const boost::system::error_code &ec,
                                  std::vector<uint8_t> head) {
        if (ec) {
          handler(std::nullopt);
          return;
        }
        uint16_t id_len = endian::ReadBE16(head.data());
        if (!ValidNodeIdLength(id_len)) {
          handler(std::nullopt);
          return;
        }

        stream->async_read(static_cast<size_t>(id_len) + 2, deadline,
                           [head, handler](const boost::system::error_code &rest_ec,
                                           std::vector<uint8_t> rest) {
                             if (rest_ec) {
                               handler(std::nullopt);
                               return;
                             }
                             std::vector<uint8_t> full(head);
                             full.insert(full.end(), rest.begin(), rest.end());
                             handler(deserialize(full));
                           });
      });
}

// ============================================================================
// TcpTransport
// ============================================================================

TcpTransport::TcpTransport(size_t io_threads)
    : io_context_(std::make_unique<boost::asio::io_context>()),
      desired_io_threads_(io_threads == 0 ? 1 : io_threads) {}

TcpTransport::~TcpTransport() { stop(); }

std::shared_ptr<TcpStream> TcpTransport::connect(const std::string &host, uint16_t port,
                                                 std::chrono::milliseconds timeout) {
  if (!running_) {
    return nullptr;
  }

  using tcp = boost::asio::ip::tcp;
  auto strand = boost::asio::make_strand(*io_context_);
  auto socket = std::make_shared<tcp::socket>(*io_context_);
  auto resolver = std::make_shared<tcp::resolver>(*io_context_);
  auto timer = std::make_shared<boost::asio::steady_timer>(*io_context_);
  auto done = std::make_shared<std::promise<boost::system::error_code>>();
  auto result = done->get_future();

  boost::asio::dispatch(strand, [=]() {
    // Exactly one of timeout / resolve failure / connect completion wins
    auto finished = std::make_shared<bool>(false);
    auto finish = [=](const boost::system::error_code &ec) {
      if (*finished) {
        return;
      }
      *finished = true;
      timer->cancel();
      resolver->cancel();
      done->set_value(ec);
    };

    timer->expires_after(timeout);
    timer->async_wait(boost::asio::bind_executor(
        strand, [=](const boost::system::error_code &ec) {
          if (ec == boost::asio::error::operation_aborted || *finished) {
            return;
          }
          boost::system::error_code ignored;
          socket->close(ignored);
          finish(boost::asio::error::timed_out);
        }));

    resolver->async_resolve(
        host, std::to_string(port),
        boost::asio::bind_executor(
            strand, [=](const boost::system::error_code &ec,
                        tcp::resolver::results_type results) {
              if (ec) {
                finish(ec);
                return;
              }
              boost::asio::async_connect(
                  *socket, results,
                  boost::asio::bind_executor(
                      strand, [=](const boost::system::error_code &ec,
                                  const tcp::endpoint &) { finish(ec); }));
            }));
  });

  // The timer normally resolves the future; the margin covers a stalled
  // io_context
  if (result.wait_for(timeout + std::chrono::seconds(1)) != std::future_status::ready) {
    LOG_NET_WARN("connect to {}:{} did not complete", host, port);
    return nullptr;
  }

  boost::system::error_code ec = result.get();
  if (ec) {
    LOG_NET_DEBUG("failed to connect to {}:{}: {}", host, port, ec.message());
    return nullptr;
  }

  LOG_NET_TRACE("connected to {}:{}", host, port);
  return TcpStream::create(*io_context_, std::move(*socket));
}

bool TcpTransport::listen(uint16_t port, AcceptCallback accept_callback) {
  std::lock_guard<std::mutex> lock(acceptor_mutex_);
  if (acceptor_) {
    LOG_NET_TRACE("already listening");
    return false;
  }

  accept_callback_ = std::move(accept_callback);

  try {
    using tcp = boost::asio::ip::tcp;
    acceptor_ = std::make_unique<tcp::acceptor>(*io_context_);

    // Try dual-stack (IPv6 with v6_only=false); fall back to IPv4-only on failure
    try {
      acceptor_->open(tcp::v6());
      acceptor_->set_option(boost::asio::ip::v6_only(false));
      acceptor_->set_option(tcp::acceptor::reuse_address(true));
      acceptor_->bind(tcp::endpoint(tcp::v6(), port));
      acceptor_->listen(boost::asio::socket_base::max_listen_connections);
    } catch (const std::exception &) {
      boost::system::error_code ec;
      acceptor_->close(ec);
      acceptor_->open(tcp::v4());
      acceptor_->set_option(tcp::acceptor::reuse_address(true));
      acceptor_->bind(tcp::endpoint(tcp::v4(), port));
      acceptor_->listen(boost::asio::socket_base::max_listen_connections);
    }

    // Record the actual bound port (handles ephemeral port 0)
    boost::system::error_code ec;
    auto ep = acceptor_->local_endpoint(ec);
    last_listen_port_ = ec ? 0 : ep.port();

    LOG_NET_INFO("listening on port {}", last_listen_port_.load());
    start_accept();
    return true;
  } catch (const std::exception &e) {
    LOG_NET_ERROR("failed to listen on port {}: {}", port, e.what());
    if (acceptor_) {
      boost::system::error_code ec;
      acceptor_->close(ec);
      acceptor_.reset();
    }
    return false;
  }
}

void TcpTransport::start_accept() {
  if (!acceptor_) {
    return;
  }

  // stop_listening()/stop() cancel the pending accept before destruction
  acceptor_->async_accept([this](const boost::system::error_code &ec,
                                 boost::asio::ip::tcp::socket socket) {
    handle_accept(ec, std::move(socket));
  });
}

void TcpTransport::handle_accept(const boost::system::error_code &ec,
                                 boost::asio::ip::tcp::socket socket) {
  std::lock_guard<std::mutex> lock(acceptor_mutex_);
  if (ec) {
    if (ec != boost::asio::error::operation_aborted) {
      LOG_NET_TRACE("accept error: {}", ec.message());
      start_accept();
    }
    return;
  }

  auto stream = TcpStream::create(*io_context_, std::move(socket));
  LOG_NET_DEBUG("connection from {}:{} accepted", stream->remote_host(),
                stream->remote_port());

  if (accept_callback_) {
    try {
      accept_callback_(stream);
    } catch (const std::exception &e) {
      LOG_NET_ERROR("exception in accept callback: {}", e.what());
      stream->close();
    }
  } else {
    stream->close();
  }

  start_accept();
}

void TcpTransport::stop_listening() {
  std::lock_guard<std::mutex> lock(acceptor_mutex_);
  if (acceptor_) {
    boost::system::error_code ec;
    acceptor_->close(ec);
    acceptor_.reset();
  }
  last_listen_port_ = 0;

  // Release anything the callback captured
  accept_callback_ = {};
}

void TcpTransport::run() {
  if (running_.exchange(true)) {
    return;
  }
  io_context_->restart();
  work_guard_ = std::make_unique<boost::asio::executor_work_guard<
      boost::asio::io_context::executor_type>>(boost::asio::make_work_guard(*io_context_));
  for (size_t i = 0; i < desired_io_threads_; i++) {
    io_threads_.emplace_back([this]() { io_context_->run(); });
  }
}

uint16_t TcpTransport::listening_port() const { return last_listen_port_; }

void TcpTransport::stop() {
  running_.store(false);

  // Don't log here - this is called from destructor, logger may be shut down

  stop_listening();

  work_guard_.reset();
  if (io_context_) {
    io_context_->stop();
  }

  for (auto &thread : io_threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  io_threads_.clear();
}

// ============================================================================
// TcpConnection
// ============================================================================

TcpConnection::TcpConnection(TcpTransport &transport, std::string peer_id,
                             std::string host, uint16_t port,
                             std::chrono::milliseconds connect_timeout,
                             std::vector<uint8_t> preamble)
    : transport_(transport), peer_id_(std::move(peer_id)), host_(std::move(host)),
      port_(port), connect_timeout_(connect_timeout), preamble_(std::move(preamble)) {}

TcpConnection::~TcpConnection() { close(); }

std::string TcpConnection::remote_address() const {
  return host_ + ":" + std::to_string(port_);
}

StreamPtr TcpConnection::open_stream() {
  if (closed_.load()) {
    return nullptr;
  }
  if (port_ == 0) {
    LOG_NET_DEBUG("peer {} has no dialable endpoint", peer_id_);
    return nullptr;
  }

  StreamPtr stream = transport_.connect(host_, port_, connect_timeout_);
  if (!stream) {
    return nullptr;
  }

  if (!preamble_.empty()) {
    auto ec = stream->write(preamble_, std::chrono::steady_clock::now() + connect_timeout_);
    if (ec) {
      LOG_NET_DEBUG("preamble to {} failed: {}", remote_address(), ec.message());
      stream->close();
      return nullptr;
    }
  }

  attach(stream);
  if (closed_.load()) {
    return nullptr;
  }
  return stream;
}

void TcpConnection::attach(const StreamPtr &stream) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!closed_.load()) {
      // Drop entries for streams that are already gone
      streams_.erase(std::remove_if(streams_.begin(), streams_.end(),
                                    [](const std::weak_ptr<Stream> &s) {
                                      return s.expired();
                                    }),
                     streams_.end());
      streams_.push_back(stream);
      return;
    }
  }
  stream->close();
}

void TcpConnection::close() {
  std::vector<std::weak_ptr<Stream>> streams;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_.exchange(true)) {
      return;
    }
    streams.swap(streams_);
  }

  for (auto &weak : streams) {
    if (auto stream = weak.lock()) {
      stream->close();
    }
  }
}

size_t TcpConnection::tracked_streams() const {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t n = 0;
  for (const auto &weak : streams_) {
    if (!weak.expired()) {
      ++n;
    }
  }
  return n;
}

} // namespace network
} // namespace peerlink
