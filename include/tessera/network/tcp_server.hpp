#pragma once

#include <atomic>
#include <boost/asio.hpp>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include "tessera/network/tcp_connection.hpp"

namespace tessera {
namespace network {

// Accepts TCP connections and hands each one, unstarted, to the accept handler
class TcpServer {
public:
  using AcceptHandler = std::function<void(std::shared_ptr<TcpConnection>)>;

  // -- CONSTRUCTOR AND DESTRUCTOR ----
  TcpServer(const std::string& address, uint16_t port, AcceptHandler on_accept);
  ~TcpServer();


  // ---- INITIALIZATION AND TEARDOWN ----
  bool start_listener();
  void shutdown();


  // ---- GETTERS ----
  // Bound port, useful when constructed with port 0
  uint16_t local_port() const;
  bool is_running() const { return is_running_; }

private:
  // ---- PARAMETERS ----
  const std::string address_;
  const uint16_t port_;
  AcceptHandler on_accept_;

  // Server state
  std::unique_ptr<std::thread> io_thread_;
  std::atomic<bool> is_running_{false};

  // Incoming connection handlers
  boost::asio::io_context io_context_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;


  // ---- INITIALIZATION AND TEARDOWN ----
  // Main listening loop that handles incoming connections
  void start_accept();
};

// Random identifier for a new connection
std::string make_connection_id();

} // namespace network
} // namespace tessera
