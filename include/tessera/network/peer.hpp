#ifndef TESSERA_NETWORK_PEER_HPP
#define TESSERA_NETWORK_PEER_HPP

#include <string>
#include "tessera/network/message.hpp"

namespace tessera {
namespace network {

// One remote endpoint that typed messages can be sent to
class Peer {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    virtual ~Peer() = default;


    // ---- GETTERS ----
    virtual const std::string& id() const = 0;
    virtual bool is_open() const = 0;


    // ---- OUTGOING MESSAGES ----
    // Queues a message, false when the peer is closed
    virtual bool send(const Message& message) = 0;


    // ---- TEARDOWN ----
    // Non blocking, safe from any thread
    virtual void close() = 0;

protected:
    Peer() = default;
};

} // namespace network
} // namespace tessera

#endif // TESSERA_NETWORK_PEER_HPP
