#include "tessera/network/tcp_server.hpp"
#include <boost/log/trivial.hpp>
#include "tessera/crypto/digest.hpp"

namespace tessera {
namespace network {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

TcpServer::TcpServer(const std::string& address, uint16_t port, AcceptHandler on_accept)
  : address_(address)
  , port_(port)
  , on_accept_(std::move(on_accept)) {
  BOOST_LOG_TRIVIAL(info) << "TCP server: Initializing TCP server on " << address << ":" << port;
}

TcpServer::~TcpServer() {
  shutdown();
}

//==============================================
// INITIALIZATION AND TEARDOWN
//==============================================

bool TcpServer::start_listener() {
  if (is_running_) {
    BOOST_LOG_TRIVIAL(warning) << "TCP server: Server already running";
    return false;
  }

  try {
    boost::asio::ip::tcp::endpoint endpoint(boost::asio::ip::make_address(address_), port_);
    acceptor_ = std::make_unique<boost::asio::ip::tcp::acceptor>(io_context_);
    acceptor_->open(endpoint.protocol());
    acceptor_->set_option(boost::asio::ip::tcp::acceptor::reuse_address(true));
    acceptor_->bind(endpoint);
    acceptor_->listen();

    is_running_ = true;

    BOOST_LOG_TRIVIAL(debug) << "TCP server: Starting to accept connections";
    start_accept();

    io_thread_ = std::make_unique<std::thread>([this]() {
      try {
        auto work = boost::asio::make_work_guard(io_context_);
        io_context_.run();
      } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "TCP server: IO context error: " << e.what();
        is_running_ = false;
      }
    });

    BOOST_LOG_TRIVIAL(info) << "TCP server: Listening on " << address_ << ":" << local_port();
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "TCP server: Failed to start server: " << e.what();
    acceptor_.reset();
    return false;
  }
}

void TcpServer::start_accept() {
  if (!acceptor_ || !is_running_) {
    return;
  }

  auto socket = std::make_shared<boost::asio::ip::tcp::socket>(io_context_);

  acceptor_->async_accept(*socket,
    [this, socket](const boost::system::error_code& error) {
      if (!error) {
        boost::system::error_code ec;
        socket->set_option(boost::asio::ip::tcp::no_delay(true), ec);
        auto connection = std::make_shared<TcpConnection>(make_connection_id(), socket);
        BOOST_LOG_TRIVIAL(info) << "TCP server: Accepted " << connection->id()
                                << " from " << connection->remote_endpoint();
        try {
          on_accept_(connection);
        } catch (const std::exception& e) {
          BOOST_LOG_TRIVIAL(error) << "TCP server: Accept handler failed: " << e.what();
        }
      } else if (error != boost::asio::error::operation_aborted) {
        BOOST_LOG_TRIVIAL(error) << "TCP server: Accept error: " << error.message();
      }
      if (is_running_) {
        start_accept();
      }
    });
}

void TcpServer::shutdown() {
  if (!is_running_.exchange(false)) {
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "TCP server: Initiating server shutdown";

  io_context_.stop();

  if (io_thread_ && io_thread_->joinable()) {
    io_thread_->join();
  }

  // Stop accepting new connections
  if (acceptor_ && acceptor_->is_open()) {
    boost::system::error_code ec;
    acceptor_->close(ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "TCP server: Error closing acceptor: " << ec.message();
    }
  }

  BOOST_LOG_TRIVIAL(info) << "TCP server: Server shutdown complete";
}

//==============================================
// GETTERS
//==============================================

uint16_t TcpServer::local_port() const {
  if (!acceptor_) {
    return port_;
  }
  boost::system::error_code ec;
  auto endpoint = acceptor_->local_endpoint(ec);
  return ec ? port_ : endpoint.port();
}

std::string make_connection_id() {
  return "c-" + crypto::to_hex(crypto::random_bytes(6));
}

} // namespace network
} // namespace tessera
