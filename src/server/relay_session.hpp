#pragma once
#include <asio.hpp>
#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include "shadowrelay/chunk_framer.hpp"
#include "shadowrelay/crypto.hpp"
#include "shadowrelay/protocol.hpp"
#include "relay_loop.hpp"

namespace shadowrelay {

struct SessionConfig {
    std::string method;
    std::vector<uint8_t> key;
    std::chrono::milliseconds connect_timeout{3000};
};

// One accepted client connection, from header to teardown. The session
// owns the io_context its sockets are bound to, so nothing it waits on is
// shared with another session.
class RelaySession {
public:
    using tcp = asio::ip::tcp;
    RelaySession(std::shared_ptr<asio::io_context> io, tcp::socket client,
                 const SessionConfig& cfg);

    // Runs on the calling thread. Both sockets are closed on return.
    // clean_end_of_stream and connect_timeout are normal endings.
    std::error_code run();

    const Destination& destination() const { return dest_; }
    bool one_time_auth() const { return ota_; }
    bool remote_attempted() const { return remote_attempted_; }
    const ChunkFramer& framer() const { return framer_; }
    const RelayStats& stats() const { return stats_; }

private:
    std::error_code resolve(std::vector<tcp::endpoint>& endpoints);
    std::error_code connect_remote();
    std::error_code report(const std::error_code& ec);

    std::shared_ptr<asio::io_context> io_;
    tcp::socket client_;
    tcp::socket remote_;
    SessionConfig cfg_;
    std::string peer_;

    std::unique_ptr<StreamCryptor> cryptor_;
    std::vector<uint8_t> buffer_;
    ChunkFramer framer_;
    Destination dest_;
    bool header_done_{false};
    bool ota_{false};
    bool remote_attempted_{false};
    RelayStats stats_;
};

} // namespace shadowrelay
