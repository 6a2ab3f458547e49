#include "shadowrelay/protocol.hpp"

namespace shadowrelay {

namespace {

class RelayCategory : public std::error_category {
public:
  const char *name() const noexcept override { return "shadowrelay"; }
  std::string message(int ev) const override {
    switch (static_cast<relay_errc>(ev)) {
    case relay_errc::clean_end_of_stream:
      return "peer closed the stream";
    case relay_errc::unsupported_address_type:
      return "unsupported address type";
    case relay_errc::truncated_header:
      return "address header is too short";
    case relay_errc::truncated_chunk_header:
      return "auth head is too short";
    case relay_errc::crypto_failure:
      return "cipher rejected the data";
    case relay_errc::connect_timeout:
      return "connect timed out";
    case relay_errc::unsupported_method:
      return "unsupported cipher method";
    }
    return "unknown relay error";
  }
};

} // namespace

const std::error_category &relay_category() {
  static RelayCategory cat;
  return cat;
}

std::error_code make_error_code(relay_errc e) {
  return std::error_code(static_cast<int>(e), relay_category());
}

bool is_benign(const std::error_code &ec) {
  return ec == relay_errc::clean_end_of_stream ||
         ec == relay_errc::connect_timeout;
}

std::string Destination::to_string() const {
  return host + ":" + std::to_string(port);
}

} // namespace shadowrelay
