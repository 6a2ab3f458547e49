#include "shadowrelay/chunk_framer.hpp"
#include <algorithm>
#include <stdexcept>

namespace shadowrelay {

size_t ChunkFramer::next_read_size(size_t capacity) const {
  if (phase_ == ChunkPhase::AwaitingHeader)
    return kChunkHeaderLength;
  // a declared length above capacity is read one buffer at a time
  return std::min(remaining_, capacity);
}

void ChunkFramer::on_header(const uint8_t *decoded, size_t len) {
  if (phase_ != ChunkPhase::AwaitingHeader)
    throw std::logic_error("chunk head outside of AwaitingHeader");
  if (len != kChunkHeaderLength)
    throw std::invalid_argument("chunk head must be 12 bytes");
  remaining_ = read_be16(decoded);
  phase_ = ChunkPhase::AwaitingPayload;
  if (remaining_ == 0)
    finish_chunk();
}

void ChunkFramer::on_payload(size_t n) {
  if (phase_ != ChunkPhase::AwaitingPayload || n > remaining_)
    throw std::logic_error("payload exceeds the current chunk");
  remaining_ -= n;
  if (remaining_ == 0)
    finish_chunk();
}

void ChunkFramer::finish_chunk() {
  phase_ = ChunkPhase::AwaitingHeader;
  remaining_ = kChunkHeaderLength;
  ++chunks_completed_;
}

} // namespace shadowrelay
