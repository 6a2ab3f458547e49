#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "shadowrelay/crypto.hpp"
#include "shadowrelay/protocol.hpp"
#include "shadowrelay/util.hpp"
#include "test_util.hpp"

using namespace shadowrelay;

namespace {

std::vector<uint8_t> sample(size_t n) {
    std::vector<uint8_t> v(n);
    for (size_t i = 0; i < n; ++i)
        v[i] = (uint8_t)(i * 31 + 7);
    return v;
}

// Decodes wire in pieces cut at the given offsets.
std::vector<uint8_t> decode_split(StreamCryptor& c, const std::vector<uint8_t>& wire,
                                  const std::vector<size_t>& cuts) {
    std::vector<uint8_t> plain, part;
    size_t prev = 0;
    std::vector<size_t> all = cuts;
    all.push_back(wire.size());
    for (size_t cut : all) {
        EXPECT_TRUE(c.decode(wire.data() + prev, cut - prev, part));
        plain.insert(plain.end(), part.begin(), part.end());
        prev = cut;
    }
    return plain;
}

void check_stream_continuity(const std::string& method, const std::vector<uint8_t>& key) {
    std::error_code ec;
    auto sender = make_cryptor(method, key, ec);
    ASSERT_TRUE(sender) << method;
    auto receiver = make_cryptor(method, key, ec);
    ASSERT_TRUE(receiver) << method;

    // several encode calls form one stream
    auto data = sample(5000);
    std::vector<uint8_t> wire, part;
    ASSERT_TRUE(sender->encode(data.data(), 1, part));
    EXPECT_EQ(part.size(), sender->iv_length() + 1);
    wire.insert(wire.end(), part.begin(), part.end());
    ASSERT_TRUE(sender->encode(data.data() + 1, 64, part));
    EXPECT_EQ(part.size(), 64u);
    wire.insert(wire.end(), part.begin(), part.end());
    ASSERT_TRUE(sender->encode(data.data() + 65, data.size() - 65, part));
    wire.insert(wire.end(), part.begin(), part.end());

    size_t iv = receiver->iv_length();
    auto plain = decode_split(*receiver, wire, {3, iv, iv + 1, iv + 63, iv + 64, iv + 130, iv + 4000});
    EXPECT_EQ(plain, data) << method;
}

} // namespace

TEST(CryptoTest, XorStreamSurvivesArbitrarySplits) {
    check_stream_continuity("xorshift", test::test_key());
}

TEST(CryptoTest, XorStreamIvLength) {
    XorStreamCipher c(test::test_key());
    EXPECT_EQ(c.iv_length(), XorStreamCipher::kIvLength);
}

TEST(CryptoTest, DecodeConsumesIvWithoutOutput) {
    XorStreamCipher sender(test::test_key()), receiver(test::test_key());
    std::vector<uint8_t> msg{'a', 'b'}, wire, out;
    sender.encode(msg.data(), msg.size(), wire);
    ASSERT_EQ(wire.size(), XorStreamCipher::kIvLength + 2);
    ASSERT_TRUE(receiver.decode(wire.data(), XorStreamCipher::kIvLength, out));
    EXPECT_TRUE(out.empty());
    ASSERT_TRUE(receiver.decode(wire.data() + XorStreamCipher::kIvLength, 2, out));
    EXPECT_EQ(out, msg);
}

TEST(CryptoTest, DirectionsAreIndependent) {
    XorStreamCipher a(test::test_key()), b(test::test_key());
    std::vector<uint8_t> up{'u', 'p'}, down{'d', 'o', 'w', 'n'}, w1, w2, p1, p2;
    a.encode(up.data(), up.size(), w1);
    // b encodes before it ever decodes
    b.encode(down.data(), down.size(), w2);
    ASSERT_TRUE(b.decode(w1.data(), w1.size(), p1));
    ASSERT_TRUE(a.decode(w2.data(), w2.size(), p2));
    EXPECT_EQ(p1, up);
    EXPECT_EQ(p2, down);
}

TEST(CryptoTest, WrongKeyDoesNotDecode) {
    XorStreamCipher sender(test::test_key());
    XorStreamCipher receiver(std::vector<uint8_t>{'o', 't', 'h', 'e', 'r'});
    auto data = sample(64);
    std::vector<uint8_t> wire, plain;
    sender.encode(data.data(), data.size(), wire);
    receiver.decode(wire.data(), wire.size(), plain);
    EXPECT_NE(plain, data);
}

TEST(CryptoTest, UnknownMethodIsRejected) {
    std::error_code ec;
    auto c = make_cryptor("rc4-md5", test::test_key(), ec);
    EXPECT_FALSE(c);
    EXPECT_EQ(ec, make_error_code(relay_errc::unsupported_method));
    EXPECT_FALSE(is_supported_method("rc4-md5"));
    EXPECT_TRUE(is_supported_method("xorshift"));
    EXPECT_TRUE(is_supported_method(default_method()));
}

TEST(CryptoTest, PasswordKeyMatchesEvpBytesToKey) {
    // MD5("password") followed by MD5(MD5("password") + "password")
    auto key = derive_key("password");
    EXPECT_EQ(key, hex_to_bytes("5f4dcc3b5aa765d61d8327deb882cf99"
                                "2b95990a9151374abd8ff8c5a7a0fe08"));
    EXPECT_NE(derive_key("pw"), derive_key("pw2"));
    EXPECT_EQ(derive_key("").size(), kKeyLength);
}

#ifdef SHADOWRELAY_HAVE_SODIUM
TEST(CryptoTest, SodiumStreamsSurviveArbitrarySplits) {
    auto key = derive_key("password");
    ASSERT_EQ(key.size(), kKeyLength);
    for (const char* m : {"chacha20", "chacha20-ietf", "salsa20"})
        check_stream_continuity(m, key);
}

TEST(CryptoTest, SodiumIvLengths) {
    std::error_code ec;
    auto key = derive_key("password");
    EXPECT_EQ(make_cryptor("chacha20", key, ec)->iv_length(), 8u);
    EXPECT_EQ(make_cryptor("chacha20-ietf", key, ec)->iv_length(), 12u);
    EXPECT_EQ(make_cryptor("salsa20", key, ec)->iv_length(), 8u);
}

namespace {

// Returns the plaintext a receiver keyed with rx_key gets back.
std::vector<uint8_t> cross_decode(const std::vector<uint8_t>& tx_key,
                                  const std::vector<uint8_t>& rx_key,
                                  const std::vector<uint8_t>& data) {
    std::error_code ec;
    auto tx = make_cryptor("chacha20-ietf", tx_key, ec);
    auto rx = make_cryptor("chacha20-ietf", rx_key, ec);
    std::vector<uint8_t> wire, plain;
    tx->encode(data.data(), data.size(), wire);
    rx->decode(wire.data(), wire.size(), plain);
    return plain;
}

} // namespace

TEST(CryptoTest, ShortKeyIsHashedNotPadded) {
    auto data = sample(100);
    std::vector<uint8_t> short_key(16, 0x11);
    std::vector<uint8_t> padded = short_key;
    padded.resize(kKeyLength, 0);
    EXPECT_EQ(cross_decode(short_key, short_key, data), data);
    EXPECT_NE(cross_decode(short_key, padded, data), data);
}

TEST(CryptoTest, LongKeyIsHashedNotTruncated) {
    auto data = sample(100);
    std::vector<uint8_t> long_key(64);
    for (size_t i = 0; i < long_key.size(); ++i)
        long_key[i] = (uint8_t)i;
    std::vector<uint8_t> prefix(long_key.begin(), long_key.begin() + kKeyLength);
    EXPECT_EQ(cross_decode(long_key, long_key, data), data);
    EXPECT_NE(cross_decode(long_key, prefix, data), data);
}

TEST(CryptoTest, FullLengthKeyIsUsedAsIs) {
    auto data = sample(100);
    auto key = derive_key("password");
    EXPECT_EQ(cross_decode(key, key, data), data);
}
#endif
