#include "relay_loop.hpp"
#include "shadowrelay/logging.hpp"

namespace shadowrelay {

static bool would_block(const std::error_code &ec) {
  return ec == asio::error::would_block || ec == asio::error::try_again;
}

void close_socket(asio::ip::tcp::socket &sock, const char *what) {
  if (!sock.is_open())
    return;
  std::error_code ec;
  sock.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
  sock.close(ec);
  if (ec)
    Logger::instance().log(LogLevel::DEBUG, "close %s: %s", what,
                           ec.message().c_str());
}

RelayLoop::RelayLoop(asio::io_context &io, tcp::socket &client,
                     tcp::socket &remote, StreamCryptor &cryptor,
                     std::vector<uint8_t> &buffer, ChunkFramer *framer)
    : io_(io), client_(client), remote_(remote), cryptor_(cryptor),
      buffer_(buffer), framer_(framer) {
  out_.reserve(buffer_.size() + 64);
}

std::error_code RelayLoop::run() {
  std::error_code ec;
  client_.non_blocking(true, ec);
  if (ec)
    return ec;
  remote_.non_blocking(true, ec);
  if (ec)
    return ec;

  done_ = false;
  result_.clear();
  arm(Direction::ClientToRemote);
  arm(Direction::RemoteToClient);
  io_.restart();
  io_.run();
  return result_;
}

void RelayLoop::arm(Direction dir) {
  tcp::socket &sock =
      dir == Direction::ClientToRemote ? client_ : remote_;
  sock.async_wait(tcp::socket::wait_read,
                  [this, dir](const std::error_code &ec) {
                    on_readable(dir, ec);
                  });
}

void RelayLoop::on_readable(Direction dir, const std::error_code &ec) {
  if (done_)
    return;
  if (ec) {
    finish(ec);
    return;
  }
  std::error_code tec;
  if (dir == Direction::ClientToRemote)
    tec = transfer(client_, remote_, dir);
  else
    tec = transfer(remote_, client_, dir);
  if (tec) {
    finish(tec);
    return;
  }
  arm(dir);
}

void RelayLoop::finish(const std::error_code &ec) {
  done_ = true;
  result_ = ec;
  // wakes the other direction's wait with operation_aborted
  std::error_code cec;
  client_.cancel(cec);
  if (cec)
    Logger::instance().log(LogLevel::DEBUG, "cancel client: %s",
                           cec.message().c_str());
  remote_.cancel(cec);
  if (cec)
    Logger::instance().log(LogLevel::DEBUG, "cancel remote: %s",
                           cec.message().c_str());
}

std::error_code RelayLoop::transfer(tcp::socket &source, tcp::socket &target,
                                    Direction dir) {
  bool framed = framer_ != nullptr && dir == Direction::ClientToRemote;
  size_t want = buffer_.size();
  if (framed) {
    if (framer_->phase() == ChunkPhase::AwaitingHeader)
      return read_chunk_header(source);
    want = framer_->next_read_size(buffer_.size());
  }

  std::error_code ec;
  size_t n = source.read_some(asio::buffer(buffer_.data(), want), ec);
  if (would_block(ec))
    return {};
  if (ec == asio::error::eof)
    return relay_errc::clean_end_of_stream;
  if (ec)
    return ec;

  bool ok = dir == Direction::ClientToRemote
                ? cryptor_.decode(buffer_.data(), n, out_)
                : cryptor_.encode(buffer_.data(), n, out_);
  if (!ok)
    return relay_errc::crypto_failure;
  if (framed)
    framer_->on_payload(n);

  // the buffer is reused by the next step, flush everything first
  ec = write_all(target, out_);
  if (ec)
    return ec;
  ++stats_.steps;
  if (dir == Direction::ClientToRemote)
    stats_.client_to_remote += out_.size();
  else
    stats_.remote_to_client += n;
  return {};
}

// For OTA every chunk starts with
//   data len: 2 bytes | HMAC-SHA1: 10 bytes
// It should arrive in one piece, but partial reads are waited out.
std::error_code RelayLoop::read_chunk_header(tcp::socket &source) {
  size_t got = 0;
  while (got < kChunkHeaderLength) {
    std::error_code ec;
    size_t n = source.read_some(
        asio::buffer(buffer_.data() + got, kChunkHeaderLength - got), ec);
    if (would_block(ec)) {
      source.wait(tcp::socket::wait_read, ec);
      if (ec)
        return ec;
      continue;
    }
    if (ec == asio::error::eof) {
      if (got == 0)
        return relay_errc::clean_end_of_stream;
      return relay_errc::truncated_chunk_header;
    }
    if (ec)
      return ec;
    got += n;
  }

  if (!cryptor_.decode(buffer_.data(), kChunkHeaderLength, out_) ||
      out_.size() != kChunkHeaderLength)
    return relay_errc::crypto_failure;
  framer_->on_header(out_.data(), out_.size());
  ++stats_.steps;
  return {};
}

std::error_code RelayLoop::write_all(tcp::socket &target,
                                     const std::vector<uint8_t> &data) {
  size_t off = 0;
  while (off < data.size()) {
    std::error_code ec;
    size_t n = target.write_some(
        asio::buffer(data.data() + off, data.size() - off), ec);
    if (would_block(ec)) {
      target.wait(tcp::socket::wait_write, ec);
      if (ec)
        return ec;
      continue;
    }
    if (ec)
      return ec;
    off += n;
  }
  return {};
}

} // namespace shadowrelay
