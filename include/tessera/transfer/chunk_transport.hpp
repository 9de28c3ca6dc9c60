#ifndef TESSERA_TRANSFER_CHUNK_TRANSPORT_HPP
#define TESSERA_TRANSFER_CHUNK_TRANSPORT_HPP

#include <cstdint>
#include <string>
#include "tessera/network/message.hpp"

namespace tessera {
namespace transfer {

// Outgoing side of chunk transfer. Returns false when the message could not
// be queued; the tracker's timeouts take care of retrying.
class ChunkTransport {
public:
    virtual ~ChunkTransport() = default;

    virtual bool send_chunk(const network::ChunkMessage& chunk) = 0;
    virtual bool request_chunk(const std::string& content_id, uint32_t index) = 0;
};

} // namespace transfer
} // namespace tessera

#endif // TESSERA_TRANSFER_CHUNK_TRANSPORT_HPP
