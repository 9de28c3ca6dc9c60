#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <queue>
#include "tessera/network/message.hpp"

namespace tessera {
namespace network {

// Thread safe FIFO of messages between a connection's threads
class Channel {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR
    Channel() = default;
    ~Channel() = default;


    // ---- CHANNEL CONTROL METHODS ----
    // Adds a message to the back of the queue, false once closed
    bool produce(Message message);
    // Retrieves and removes next message without blocking
    bool consume(Message& message);
    // Blocks until a message arrives, the channel closes or timeout passes.
    // Queued messages are still drained after close.
    bool wait_consume(Message& message, std::chrono::milliseconds timeout);
    // Rejects further messages and wakes all waiters
    void close();


    // ---- QUERY METHODS ----
    bool empty() const;
    std::size_t size() const;
    bool is_closed() const;

private:
    // ---- PARAMETERS ----
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<Message> queue_;
    bool closed_ = false;
};

} // namespace network
} // namespace tessera
