#include "relay_server.hpp"
#include "shadowrelay/crypto.hpp"
#include "shadowrelay/util.hpp"
#include <asio.hpp>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <system_error>

using namespace shadowrelay;

static void usage(const char *prog) {
  std::cerr << "usage: " << prog
            << " [--listen host:port] [--method name] (--password pw | --key "
               "hex)\n"
               "       [--connect-timeout ms] [--log-level "
               "trace|debug|info|warn|error]\n"
               "methods:";
  for (const auto &m : supported_methods())
    std::cerr << " " << m;
  std::cerr << "\n";
}

int main(int argc, char **argv) {
  std::string listen = "0.0.0.0:8388";
  std::string method = default_method();
  std::string password;
  std::string key_hex;
  std::string timeout_ms = "3000";
  std::string log_level = "info";

  for (int i = 1; i < argc; i++) {
    std::string a = argv[i];
    auto next = [&](int &i) -> std::string {
      if (i + 1 < argc)
        return std::string(argv[++i]);
      std::cerr << "missing value for " << a << "\n";
      std::exit(1);
    };
    if (a == "--listen")
      listen = next(i);
    else if (a == "--method")
      method = next(i);
    else if (a == "--password")
      password = next(i);
    else if (a == "--key")
      key_hex = next(i);
    else if (a == "--connect-timeout")
      timeout_ms = next(i);
    else if (a == "--log-level")
      log_level = next(i);
    else if (a == "--help" || a == "-h") {
      usage(argv[0]);
      return 0;
    } else {
      std::cerr << "unknown option " << a << "\n";
      usage(argv[0]);
      return 1;
    }
  }

  ServerConfig cfg;
  if (!parse_host_port(listen, cfg.listen_host, cfg.listen_port)) {
    std::cerr << "bad listen" << std::endl;
    return 1;
  }
  if (!parse_log_level(log_level, cfg.log_level)) {
    std::cerr << "bad log level" << std::endl;
    return 1;
  }
  uint64_t ms = 0;
  if (!parse_uint(timeout_ms, 600000, ms) || ms == 0) {
    std::cerr << "bad connect timeout" << std::endl;
    return 1;
  }
  if (!is_supported_method(method)) {
    std::cerr << "unsupported method " << method << std::endl;
    usage(argv[0]);
    return 1;
  }

  cfg.session.method = method;
  cfg.session.connect_timeout = std::chrono::milliseconds(ms);
  if (!key_hex.empty())
    cfg.session.key = hex_to_bytes(key_hex);
  else if (!password.empty())
    cfg.session.key = derive_key(password);
  if (cfg.session.key.empty()) {
    std::cerr << "a --password or a hex --key is required" << std::endl;
    return 1;
  }

  Logger::instance().set_level(cfg.log_level);

  asio::io_context io;
  RelayServer server(io, cfg);
  try {
    server.start();
  } catch (const std::system_error &e) {
    std::cerr << "cannot listen on " << listen << ": " << e.what()
              << std::endl;
    return 1;
  }

  asio::signal_set signals(io, SIGINT, SIGTERM);
  signals.async_wait([&](const std::error_code &ec, int sig) {
    if (ec)
      return;
    Logger::instance().log(LogLevel::INFO, "signal %d, stopping", sig);
    server.stop();
    io.stop();
  });

  io.run();
  return 0;
}
