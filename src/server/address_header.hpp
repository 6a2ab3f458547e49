#pragma once
#include <asio.hpp>
#include <vector>
#include "shadowrelay/crypto.hpp"
#include "shadowrelay/protocol.hpp"

namespace shadowrelay {

/*
 *  IV | addr type: 1 byte | addr | port: 2 bytes big endian | [OTA tag]
 *
 *  addr type 0x01: addr = ipv4, 4 bytes
 *  addr type 0x03: addr = 1 byte length + host name
 *  bit 0x10 of addr type enables one-time auth, which appends a 10 byte
 *  HMAC-SHA1 tag to the header.
 */
class AddressHeaderDecoder {
public:
    using tcp = asio::ip::tcp;
    AddressHeaderDecoder(StreamCryptor& cryptor, std::vector<uint8_t>& buffer);

    // Blocking reads on the client socket. On success the decode stream is
    // positioned at the first byte after the header.
    bool decode(tcp::socket& client, Destination& dest, bool& one_time_auth,
                std::error_code& ec);

private:
    bool read_decoded(tcp::socket& client, size_t len, std::error_code& ec);

    StreamCryptor& cryptor_;
    std::vector<uint8_t>& buffer_;
    std::vector<uint8_t> plain_;
    size_t consumed_{0};
};

} // namespace shadowrelay
