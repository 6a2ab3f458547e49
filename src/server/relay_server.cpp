#include "relay_server.hpp"
#include <exception>
#include <system_error>
#include <thread>

namespace shadowrelay {

RelayServer::RelayServer(asio::io_context &io, const ServerConfig &cfg)
    : io_(io), cfg_(cfg), acceptor_(io), retry_timer_(io),
      launcher_([](std::function<void()> body) {
        std::thread(std::move(body)).detach();
      }),
      active_(std::make_shared<std::atomic<size_t>>(0)) {}

void RelayServer::start() {
  tcp::endpoint ep(asio::ip::make_address(cfg_.listen_host),
                   cfg_.listen_port);
  acceptor_.open(ep.protocol());
  acceptor_.set_option(asio::socket_base::reuse_address(true));
  acceptor_.bind(ep);
  acceptor_.listen();
  Logger::instance().log(LogLevel::INFO, "listening on %s:%u method=%s",
                         cfg_.listen_host.c_str(), (unsigned)local_port(),
                         cfg_.session.method.c_str());
  do_accept();
}

void RelayServer::stop() {
  retry_timer_.cancel();
  std::error_code ec;
  acceptor_.close(ec);
  if (ec)
    Logger::instance().log(LogLevel::WARN, "closing acceptor: %s",
                           ec.message().c_str());
}

uint16_t RelayServer::local_port() const {
  std::error_code ec;
  auto ep = acceptor_.local_endpoint(ec);
  return ec ? 0 : ep.port();
}

void RelayServer::do_accept() {
  // accepted straight into the session's own context
  auto ctx = std::make_shared<asio::io_context>();
  acceptor_.async_accept(
      *ctx, [this, ctx](std::error_code ec, tcp::socket sock) {
        if (ec == asio::error::operation_aborted)
          return;
        if (!ec) {
          dispatch(ctx, std::move(sock));
          do_accept();
          return;
        }
        // EMFILE and friends do not clear up by retrying at once
        Logger::instance().log(LogLevel::ERROR, "accept failed: %s",
                               ec.message().c_str());
        retry_timer_.expires_after(kAcceptRetryDelay);
        retry_timer_.async_wait([this](const std::error_code &tec) {
          if (!tec && acceptor_.is_open())
            do_accept();
        });
      });
}

void RelayServer::dispatch(std::shared_ptr<asio::io_context> ctx,
                           tcp::socket sock) {
  auto active = active_;
  SessionConfig cfg = cfg_.session;
  ++*active;
  Logger::instance().log(LogLevel::DEBUG, "accepted, %zu active",
                         active->load());
  auto session = std::make_shared<RelaySession>(ctx, std::move(sock), cfg);
  try {
    launcher_([session, active]() {
      try {
        // failures are logged by the session itself
        session->run();
      } catch (const std::exception &e) {
        Logger::instance().log(LogLevel::ERROR, "session aborted: %s",
                               e.what());
      }
      --*active;
    });
  } catch (const std::system_error &e) {
    // the session and its client socket go away with this scope
    --*active;
    Logger::instance().log(LogLevel::ERROR, "cannot start session: %s",
                           e.what());
  }
}

} // namespace shadowrelay
