#pragma once
#include <array>
#include <cstdint>
#include <cstddef>
#include <string>
#include <system_error>

namespace shadowrelay {

constexpr size_t kBufferSize = 16384; // 16K, one session buffer

enum class Direction : uint8_t { ClientToRemote = 1, RemoteToClient = 2 };

enum class AddressType : uint8_t {
    IPv4   = 0x01,
    Domain = 0x03
};

constexpr uint8_t kOtaFlag      = 0x10;
constexpr uint8_t kAddrTypeMask = 0x0f;

// OTA chunk head: 2 bytes big-endian length + 10 bytes HMAC-SHA1 tag
constexpr size_t kOtaTagLength       = 10;
constexpr size_t kChunkLengthBytes   = 2;
constexpr size_t kChunkHeaderLength  = kChunkLengthBytes + kOtaTagLength;

struct Destination {
    AddressType type{AddressType::IPv4};
    std::string host;                       // dotted quad or domain name
    std::array<uint8_t, 4> ipv4{};          // valid for AddressType::IPv4
    uint16_t port{0};

    std::string to_string() const;
};

inline uint16_t read_be16(const uint8_t* p) {
    return (uint16_t)((p[0] << 8) | p[1]);
}

enum class relay_errc {
    clean_end_of_stream = 1,
    unsupported_address_type,
    truncated_header,
    truncated_chunk_header,
    crypto_failure,
    connect_timeout,
    unsupported_method
};

const std::error_category& relay_category();
std::error_code make_error_code(relay_errc e);

// Endings that close the session without an error record.
bool is_benign(const std::error_code& ec);

} // namespace shadowrelay

namespace std {
template <>
struct is_error_code_enum<shadowrelay::relay_errc> : true_type {};
} // namespace std
