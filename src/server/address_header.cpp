#include "address_header.hpp"
#include <algorithm>
#include <cstdio>

namespace shadowrelay {

AddressHeaderDecoder::AddressHeaderDecoder(StreamCryptor &cryptor,
                                           std::vector<uint8_t> &buffer)
    : cryptor_(cryptor), buffer_(buffer) {}

bool AddressHeaderDecoder::read_decoded(tcp::socket &client, size_t len,
                                        std::error_code &ec) {
  size_t n = asio::read(client, asio::buffer(buffer_.data(), len), ec);
  consumed_ += n;
  if (ec == asio::error::eof) {
    ec = consumed_ == 0 ? make_error_code(relay_errc::clean_end_of_stream)
                        : make_error_code(relay_errc::truncated_header);
    return false;
  }
  if (ec)
    return false;
  if (!cryptor_.decode(buffer_.data(), n, plain_)) {
    ec = relay_errc::crypto_failure;
    return false;
  }
  return true;
}

bool AddressHeaderDecoder::decode(tcp::socket &client, Destination &dest,
                                  bool &one_time_auth, std::error_code &ec) {
  ec.clear();
  one_time_auth = false;
  consumed_ = 0;

  // IV + address type
  if (!read_decoded(client, cryptor_.iv_length() + 1, ec))
    return false;
  if (plain_.size() != 1) {
    ec = relay_errc::crypto_failure;
    return false;
  }
  uint8_t addrtype = plain_[0];
  if (addrtype & kOtaFlag) {
    one_time_auth = true;
    addrtype &= kAddrTypeMask;
  }

  if (addrtype == static_cast<uint8_t>(AddressType::IPv4)) {
    if (!read_decoded(client, 4, ec))
      return false;
    dest.type = AddressType::IPv4;
    std::copy(plain_.begin(), plain_.end(), dest.ipv4.begin());
    char ip[16];
    std::snprintf(ip, sizeof(ip), "%u.%u.%u.%u", dest.ipv4[0], dest.ipv4[1],
                  dest.ipv4[2], dest.ipv4[3]);
    dest.host = ip;
  } else if (addrtype == static_cast<uint8_t>(AddressType::Domain)) {
    if (!read_decoded(client, 1, ec))
      return false;
    size_t len = plain_[0];
    if (!read_decoded(client, len, ec))
      return false;
    dest.type = AddressType::Domain;
    dest.ipv4.fill(0);
    dest.host.assign(plain_.begin(), plain_.end());
  } else {
    dest.host = "addrtype " + std::to_string(addrtype);
    ec = relay_errc::unsupported_address_type;
    return false;
  }

  if (!read_decoded(client, 2, ec))
    return false;
  dest.port = read_be16(plain_.data());

  // The tag is never checked, but it still has to run through the cipher
  // or everything after it decodes wrong.
  if (one_time_auth && !read_decoded(client, kOtaTagLength, ec))
    return false;
  return true;
}

} // namespace shadowrelay
