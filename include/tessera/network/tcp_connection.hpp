#ifndef TESSERA_NETWORK_TCP_CONNECTION_HPP
#define TESSERA_NETWORK_TCP_CONNECTION_HPP

#include <atomic>
#include <boost/asio.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include "tessera/network/channel.hpp"
#include "tessera/network/peer.hpp"

namespace tessera {
namespace network {

/**
 * Framed message connection over a TCP socket.
 *
 * A reader thread decodes frames into the inbound channel, a dispatch thread
 * hands them to the message handler one at a time in arrival order, and a
 * writer thread drains the outbound channel onto the socket. The close
 * handler runs once on the dispatch thread after the last inbound message.
 */
class TcpConnection : public Peer {
public:
  using MessageHandler = std::function<void(const Message&)>;
  using CloseHandler = std::function<void()>;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  TcpConnection(std::string id, std::shared_ptr<boost::asio::ip::tcp::socket> socket);
  ~TcpConnection() override;

  TcpConnection(const TcpConnection&) = delete;
  TcpConnection& operator=(const TcpConnection&) = delete;


  // ---- CONNECTION INITIATION ----
  // Resolves and connects, throws ConnectionError on failure
  static std::shared_ptr<boost::asio::ip::tcp::socket> dial(boost::asio::io_context& io_context,
                                                            const std::string& host, uint16_t port);


  // ---- STREAM CONTROL OPERATIONS ----
  bool start(MessageHandler on_message, CloseHandler on_close);
  // Closes and joins all threads
  void stop();


  // ---- PEER INTERFACE ----
  const std::string& id() const override { return id_; }
  bool is_open() const override { return !closed_; }
  bool send(const Message& message) override;
  void close() override;


  // ---- GETTERS ----
  const std::string& remote_endpoint() const { return endpoint_; }

private:
  static constexpr std::chrono::milliseconds POLL_INTERVAL{200};

  // ---- PARAMETERS ----
  const std::string id_;
  std::shared_ptr<boost::asio::ip::tcp::socket> socket_;
  std::string endpoint_;

  Channel inbound_;
  Channel outbound_;

  std::atomic<bool> started_{false};
  std::atomic<bool> closed_{false};
  std::mutex socket_mutex_;

  std::thread reader_;
  std::thread writer_;
  std::thread dispatcher_;

  MessageHandler on_message_;
  CloseHandler on_close_;


  // ---- THREAD LOOPS ----
  void read_loop();
  void write_loop();
  void dispatch_loop();


  // ---- TEARDOWN ----
  void shutdown_socket();
  void join_threads();
};

} // namespace network
} // namespace tessera

#endif // TESSERA_NETWORK_TCP_CONNECTION_HPP
