#pragma once
#include <asio.hpp>
#include <cstdint>
#include <vector>
#include "shadowrelay/chunk_framer.hpp"
#include "shadowrelay/crypto.hpp"
#include "shadowrelay/protocol.hpp"

namespace shadowrelay {

struct RelayStats {
    uint64_t client_to_remote{0}; // plaintext bytes written to the remote
    uint64_t remote_to_client{0}; // bytes read from the remote
    uint64_t steps{0};
};

// Moves bytes between one client and its remote until either side closes.
// Both sockets are waited on with the session's own io_context, one
// transfer step per readiness completion.
class RelayLoop {
public:
    using tcp = asio::ip::tcp;
    RelayLoop(asio::io_context& io, tcp::socket& client, tcp::socket& remote,
              StreamCryptor& cryptor, std::vector<uint8_t>& buffer,
              ChunkFramer* framer);

    // clean_end_of_stream when a peer closed, otherwise the failure.
    std::error_code run();
    const RelayStats& stats() const { return stats_; }

private:
    void arm(Direction dir);
    void on_readable(Direction dir, const std::error_code& ec);
    std::error_code transfer(tcp::socket& source, tcp::socket& target, Direction dir);
    std::error_code read_chunk_header(tcp::socket& source);
    std::error_code write_all(tcp::socket& target, const std::vector<uint8_t>& data);
    void finish(const std::error_code& ec);

    asio::io_context& io_;
    tcp::socket& client_;
    tcp::socket& remote_;
    StreamCryptor& cryptor_;
    std::vector<uint8_t>& buffer_;
    ChunkFramer* framer_;
    std::vector<uint8_t> out_;
    bool done_{false};
    std::error_code result_;
    RelayStats stats_;
};

// Closes a socket, logging instead of failing; used on teardown paths.
void close_socket(asio::ip::tcp::socket& sock, const char* what);

} // namespace shadowrelay
