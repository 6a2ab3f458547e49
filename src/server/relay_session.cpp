#include "relay_session.hpp"
#include "address_header.hpp"
#include "shadowrelay/logging.hpp"
#include <algorithm>

namespace shadowrelay {

namespace {

// Releases both sockets of a session however run() is left.
struct SocketGuard {
  asio::ip::tcp::socket &client;
  asio::ip::tcp::socket &remote;
  ~SocketGuard() {
    close_socket(remote, "remote");
    close_socket(client, "client");
  }
};

std::string endpoint_string(const asio::ip::tcp::socket &sock) {
  std::error_code ec;
  auto ep = sock.remote_endpoint(ec);
  if (ec)
    return "unknown peer";
  return ep.address().to_string() + ":" + std::to_string(ep.port());
}

} // namespace

RelaySession::RelaySession(std::shared_ptr<asio::io_context> io,
                           tcp::socket client, const SessionConfig &cfg)
    : io_(std::move(io)), client_(std::move(client)), remote_(*io_),
      cfg_(cfg) {}

std::error_code RelaySession::run() {
  SocketGuard guard{client_, remote_};
  peer_ = endpoint_string(client_);

  std::error_code ec;
  cryptor_ = make_cryptor(cfg_.method, cfg_.key, ec);
  if (!cryptor_)
    return report(ec);
  buffer_.assign(kBufferSize, 0);

  AddressHeaderDecoder decoder(*cryptor_, buffer_);
  if (!decoder.decode(client_, dest_, ota_, ec))
    return report(ec);
  header_done_ = true;

  ec = connect_remote();
  if (ec)
    return report(ec);

  RelayLoop loop(*io_, client_, remote_, *cryptor_, buffer_,
                 ota_ ? &framer_ : nullptr);
  ec = loop.run();
  stats_ = loop.stats();
  return report(ec);
}

std::error_code
RelaySession::resolve(std::vector<tcp::endpoint> &endpoints) {
  endpoints.clear();
  if (dest_.type == AddressType::IPv4) {
    asio::ip::address_v4::bytes_type b;
    std::copy(dest_.ipv4.begin(), dest_.ipv4.end(), b.begin());
    endpoints.emplace_back(asio::ip::address_v4(b), dest_.port);
    return {};
  }
  std::error_code ec;
  tcp::resolver resolver(*io_);
  auto results = resolver.resolve(dest_.host, std::to_string(dest_.port), ec);
  if (ec)
    return ec;
  for (const auto &r : results)
    endpoints.push_back(r.endpoint());
  if (endpoints.empty())
    return asio::error::host_not_found;
  return {};
}

std::error_code RelaySession::connect_remote() {
  std::vector<tcp::endpoint> endpoints;
  std::error_code ec = resolve(endpoints);
  if (ec)
    return ec;

  Logger::instance().log(LogLevel::INFO, "Connecting %s from %s%s",
                         dest_.to_string().c_str(), peer_.c_str(),
                         ota_ ? " (ota)" : "");
  remote_attempted_ = true;

  // A bounded connect keeps an unreachable remote from pinning the session
  // after the client has already gone.
  bool timed_out = false;
  std::error_code result = asio::error::would_block;
  asio::steady_timer timer(*io_);
  timer.expires_after(cfg_.connect_timeout);
  timer.async_wait([&](const std::error_code &tec) {
    // a connect that completed in the same run() pass wins
    if (tec || result != asio::error::would_block)
      return;
    timed_out = true;
    close_socket(remote_, "remote");
  });
  asio::async_connect(remote_, endpoints,
                      [&](const std::error_code &cec, const tcp::endpoint &) {
                        result = cec;
                        timer.cancel();
                      });
  io_->restart();
  io_->run();

  if (timed_out)
    return relay_errc::connect_timeout;
  if (result)
    return result;
  remote_.set_option(tcp::no_delay(true), ec);
  return ec;
}

std::error_code RelaySession::report(const std::error_code &ec) {
  std::string target = peer_;
  if (header_done_)
    target = dest_.to_string();
  else if (!dest_.host.empty())
    target = peer_ + " (" + dest_.host + ")";
  if (!ec || is_benign(ec)) {
    Logger::instance().log(
        LogLevel::DEBUG,
        "session %s closed (%s) up=%llu down=%llu steps=%llu",
        target.c_str(), ec ? ec.message().c_str() : "done",
        (unsigned long long)stats_.client_to_remote,
        (unsigned long long)stats_.remote_to_client,
        (unsigned long long)stats_.steps);
    return ec;
  }
  Logger::instance().log(LogLevel::ERROR, "Target address: %s: %s",
                         target.c_str(), ec.message().c_str());
  return ec;
}

} // namespace shadowrelay
