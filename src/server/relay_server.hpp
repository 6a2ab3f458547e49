#pragma once
#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include "relay_session.hpp"
#include "shadowrelay/logging.hpp"

namespace shadowrelay {

struct ServerConfig {
    std::string listen_host{"0.0.0.0"};
    uint16_t listen_port{8388};
    LogLevel log_level{LogLevel::INFO};
    SessionConfig session;
};

// Accepts clients and runs every session on a thread of its own.
class RelayServer {
public:
    using tcp = asio::ip::tcp;
    // Starts a session body on its own thread; may throw std::system_error.
    using Launcher = std::function<void(std::function<void()>)>;

    static constexpr std::chrono::milliseconds kAcceptRetryDelay{100};

    RelayServer(asio::io_context& io, const ServerConfig& cfg);
    void set_launcher(Launcher launcher) { launcher_ = std::move(launcher); }
    void start();
    void stop();
    uint16_t local_port() const;
    size_t active_sessions() const { return active_->load(); }

private:
    void do_accept();
    void dispatch(std::shared_ptr<asio::io_context> ctx, tcp::socket sock);

    asio::io_context& io_;
    ServerConfig cfg_;
    tcp::acceptor acceptor_;
    asio::steady_timer retry_timer_;
    Launcher launcher_;
    // shared with detached session threads, which may outlive the server
    std::shared_ptr<std::atomic<size_t>> active_;
};

} // namespace shadowrelay
