#pragma once

#include <cstdint>
#include <string>

namespace meshirc::networking {

using ClientId = std::uint64_t;

// What the chat layer needs from a connection transport.
class Transport {
public:
    virtual ~Transport() = default;

    // Queues one protocol line; the transport appends CRLF.
    virtual void send(ClientId client, const std::string& line) = 0;

    // Closes after already-queued lines are flushed.
    virtual void close(ClientId client) = 0;
};

} // namespace meshirc::networking
