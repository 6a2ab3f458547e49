#pragma once
#include <cstdint>
#include <cstddef>
#include "shadowrelay/protocol.hpp"

namespace shadowrelay {

enum class ChunkPhase { AwaitingHeader, AwaitingPayload };

// Client->remote framing under one-time auth. Every chunk is
//   | len: 2 bytes BE | tag: 10 bytes | payload: len bytes |
// and the framer toggles between the two phases for the whole session.
class ChunkFramer {
public:
    ChunkFramer() = default;

    ChunkPhase phase() const { return phase_; }
    size_t remaining() const { return remaining_; }
    uint64_t chunks_completed() const { return chunks_completed_; }

    // Bytes the next read step asks for, capped by the buffer capacity.
    size_t next_read_size(size_t capacity) const;

    // Takes the 12 decoded head bytes. The tag is not verified.
    void on_header(const uint8_t* decoded, size_t len);
    // Accounts n decoded payload bytes of the current chunk.
    void on_payload(size_t n);

private:
    void finish_chunk();

    ChunkPhase phase_{ChunkPhase::AwaitingHeader};
    size_t remaining_{kChunkHeaderLength};
    uint64_t chunks_completed_{0};
};

} // namespace shadowrelay
