#include "tessera/network/tcp_connection.hpp"
#include <boost/log/trivial.hpp>
#include "tessera/network/codec.hpp"
#include "tessera/network/network_error.hpp"

namespace tessera {
namespace network {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

TcpConnection::TcpConnection(std::string id, std::shared_ptr<boost::asio::ip::tcp::socket> socket)
  : id_(std::move(id)),
  socket_(std::move(socket)) {
  boost::system::error_code ec;
  auto endpoint = socket_->remote_endpoint(ec);
  if (!ec) {
    endpoint_ = endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
  }
  BOOST_LOG_TRIVIAL(debug) << "TCP connection: Created " << id_ << " for " << endpoint_;
}

TcpConnection::~TcpConnection() {
  stop();
  BOOST_LOG_TRIVIAL(debug) << "TCP connection: Destroyed " << id_;
}

//==============================================
// CONNECTION INITIATION
//==============================================

std::shared_ptr<boost::asio::ip::tcp::socket> TcpConnection::dial(boost::asio::io_context& io_context,
                                                                  const std::string& host, uint16_t port) {
  try {
    boost::asio::ip::tcp::resolver resolver(io_context);
    auto endpoints = resolver.resolve(host, std::to_string(port));
    auto socket = std::make_shared<boost::asio::ip::tcp::socket>(io_context);
    boost::asio::connect(*socket, endpoints);
    socket->set_option(boost::asio::ip::tcp::no_delay(true));
    BOOST_LOG_TRIVIAL(info) << "TCP connection: Connected to " << host << ":" << port;
    return socket;
  } catch (const boost::system::system_error& e) {
    BOOST_LOG_TRIVIAL(warning) << "TCP connection: Failed to connect to " << host << ":" << port
                               << ": " << e.what();
    throw ConnectionError("cannot reach " + host + ":" + std::to_string(port) + ": " + e.what());
  }
}

//==============================================
// STREAM CONTROL OPERATIONS
//==============================================

bool TcpConnection::start(MessageHandler on_message, CloseHandler on_close) {
  if (!socket_ || !socket_->is_open() || !on_message) {
    BOOST_LOG_TRIVIAL(error) << "TCP connection: Cannot start " << id_ << " - socket closed or no handler set";
    return false;
  }
  if (started_.exchange(true)) {
    BOOST_LOG_TRIVIAL(debug) << "TCP connection: " << id_ << " already started";
    return true;
  }

  on_message_ = std::move(on_message);
  on_close_ = std::move(on_close);

  dispatcher_ = std::thread(&TcpConnection::dispatch_loop, this);
  writer_ = std::thread(&TcpConnection::write_loop, this);
  reader_ = std::thread(&TcpConnection::read_loop, this);

  BOOST_LOG_TRIVIAL(info) << "TCP connection: " << id_ << " processing started";
  return true;
}

void TcpConnection::stop() {
  close();
  join_threads();
}

//==============================================
// PEER INTERFACE
//==============================================

bool TcpConnection::send(const Message& message) {
  if (closed_) {
    BOOST_LOG_TRIVIAL(debug) << "TCP connection: Not sending " << to_string(message.type)
                             << " on closed connection " << id_;
    return false;
  }
  return outbound_.produce(message);
}

void TcpConnection::close() {
  if (closed_.exchange(true)) {
    return;
  }
  BOOST_LOG_TRIVIAL(debug) << "TCP connection: Closing " << id_;
  outbound_.close();
  inbound_.close();
  shutdown_socket();
}

//==============================================
// THREAD LOOPS
//==============================================

void TcpConnection::read_loop() {
  while (!closed_) {
    uint8_t header[Codec::HEADER_SIZE];
    boost::system::error_code ec;
    boost::asio::read(*socket_, boost::asio::buffer(header, sizeof(header)), ec);
    if (ec) {
      if (!closed_ && ec != boost::asio::error::eof) {
        BOOST_LOG_TRIVIAL(warning) << "TCP connection: " << id_ << " read error: " << ec.message();
      }
      break;
    }

    try {
      const uint32_t length = Codec::decode_header(header);
      std::string body(length, '\0');
      boost::asio::read(*socket_, boost::asio::buffer(body.data(), body.size()), ec);
      if (ec) {
        BOOST_LOG_TRIVIAL(warning) << "TCP connection: " << id_ << " truncated frame: " << ec.message();
        break;
      }
      inbound_.produce(Codec::decode_body(body));
    } catch (const CodecError& e) {
      BOOST_LOG_TRIVIAL(warning) << "TCP connection: " << id_ << " dropped for malformed frame: " << e.what();
      break;
    }
  }

  close();
  BOOST_LOG_TRIVIAL(debug) << "TCP connection: " << id_ << " reader finished";
}

void TcpConnection::write_loop() {
  Message message;
  while (true) {
    if (!outbound_.wait_consume(message, POLL_INTERVAL)) {
      if (outbound_.is_closed()) {
        break;
      }
      continue;
    }
    if (closed_) {
      break;
    }

    std::string frame;
    try {
      frame = Codec::encode_frame(message);
    } catch (const CodecError& e) {
      BOOST_LOG_TRIVIAL(error) << "TCP connection: " << id_ << " cannot encode "
                               << to_string(message.type) << ": " << e.what();
      continue;
    }

    boost::system::error_code ec;
    boost::asio::write(*socket_, boost::asio::buffer(frame), ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(warning) << "TCP connection: " << id_ << " write error: " << ec.message();
      close();
      break;
    }
    BOOST_LOG_TRIVIAL(trace) << "TCP connection: " << id_ << " sent " << to_string(message.type);
  }
  BOOST_LOG_TRIVIAL(debug) << "TCP connection: " << id_ << " writer finished";
}

void TcpConnection::dispatch_loop() {
  Message message;
  while (true) {
    if (!inbound_.wait_consume(message, POLL_INTERVAL)) {
      if (inbound_.is_closed()) {
        break;
      }
      continue;
    }
    try {
      on_message_(message);
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "TCP connection: " << id_ << " handler error on "
                               << to_string(message.type) << ": " << e.what();
    }
  }

  if (on_close_) {
    try {
      on_close_();
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "TCP connection: " << id_ << " close handler error: " << e.what();
    }
  }
  BOOST_LOG_TRIVIAL(debug) << "TCP connection: " << id_ << " dispatcher finished";
}

//==============================================
// TEARDOWN
//==============================================

void TcpConnection::shutdown_socket() {
  std::lock_guard<std::mutex> lock(socket_mutex_);
  if (socket_ && socket_->is_open()) {
    boost::system::error_code ec;
    socket_->shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    if (ec && ec != boost::asio::error::not_connected) {
      BOOST_LOG_TRIVIAL(debug) << "TCP connection: Socket shutdown error: " << ec.message();
    }
  }
}

void TcpConnection::join_threads() {
  for (std::thread* thread : {&reader_, &writer_, &dispatcher_}) {
    if (!thread->joinable()) {
      continue;
    }
    if (thread->get_id() == std::this_thread::get_id()) {
      BOOST_LOG_TRIVIAL(warning) << "TCP connection: " << id_ << " stopped from its own thread";
      thread->detach();
    } else {
      thread->join();
    }
  }

  std::lock_guard<std::mutex> lock(socket_mutex_);
  if (socket_ && socket_->is_open()) {
    boost::system::error_code ec;
    socket_->close(ec);
  }
}

} // namespace network
} // namespace tessera
