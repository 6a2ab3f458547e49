#include "shadowrelay/crypto.hpp"
#include "shadowrelay/protocol.hpp"
#include <algorithm>
#include <cstring>
#include <random>
#include <stdexcept>

#include <openssl/evp.h>

#ifdef SHADOWRELAY_HAVE_SODIUM
#include <sodium.h>
#endif

namespace shadowrelay {

IvStreamCryptor::IvStreamCryptor(std::vector<uint8_t> key, size_t iv_len)
    : key_(std::move(key)), iv_len_(iv_len) {
  dec_iv_.reserve(iv_len_);
}

bool IvStreamCryptor::encode(const uint8_t *data, size_t len,
                             std::vector<uint8_t> &out) {
  out.clear();
  size_t off = 0;
  if (!enc_ready_) {
    std::vector<uint8_t> iv(iv_len_);
    random_iv(iv.data(), iv.size());
    if (!init_stream(kEncode, iv))
      return false;
    enc_ready_ = true;
    out.reserve(iv_len_ + len);
    out.insert(out.end(), iv.begin(), iv.end());
    off = iv_len_;
  }
  out.insert(out.end(), data, data + len);
  return apply_stream(kEncode, out.data() + off, len);
}

bool IvStreamCryptor::decode(const uint8_t *data, size_t len,
                             std::vector<uint8_t> &out) {
  out.clear();
  if (!dec_ready_) {
    size_t take = std::min(iv_len_ - dec_iv_.size(), len);
    dec_iv_.insert(dec_iv_.end(), data, data + take);
    data += take;
    len -= take;
    if (dec_iv_.size() < iv_len_)
      return true;
    if (!init_stream(kDecode, dec_iv_))
      return false;
    dec_ready_ = true;
  }
  out.assign(data, data + len);
  return apply_stream(kDecode, out.data(), out.size());
}

XorStreamCipher::XorStreamCipher(const std::vector<uint8_t> &key)
    : IvStreamCryptor(key, kIvLength) {
  uint64_t a = 0x243f6a8885a308d3ull, b = 0x13198a2e03707344ull;
  for (size_t i = 0; i < key.size(); ++i) {
    a ^= (uint64_t)key[i] << ((i % 8) * 8);
    a = (a << 7) | (a >> 57);
    b ^= (uint64_t)key[i] << (((i + 3) % 8) * 8);
    b = (b << 11) | (b >> 53);
  }
  base0_ = a;
  base1_ = b;
}

void XorStreamCipher::random_iv(uint8_t *iv, size_t len) {
  std::random_device rd;
  for (size_t i = 0; i < len; ++i)
    iv[i] = (uint8_t)(rd() & 0xff);
}

bool XorStreamCipher::init_stream(Side side, const std::vector<uint8_t> &iv) {
  uint64_t n0 = 0, n1 = 0;
  std::memcpy(&n0, iv.data(), 8);
  std::memcpy(&n1, iv.data() + 8, 8);
  State &st = state_[side];
  st.s0 = base0_ ^ (n0 | 1ull);
  st.s1 = base1_ ^ ((n1 << 1) | 1ull);
  st.used = 8;
  for (int i = 0; i < 8; i++)
    (void)next(st);
  return true;
}

uint64_t XorStreamCipher::next(State &st) {
  uint64_t x = st.s0;
  uint64_t y = st.s1;
  st.s0 = y;
  x ^= x << 23;
  x ^= x >> 17;
  x ^= y ^ (y >> 26);
  st.s1 = x;
  return x + y;
}

bool XorStreamCipher::apply_stream(Side side, uint8_t *data, size_t len) {
  State &st = state_[side];
  for (size_t i = 0; i < len; ++i) {
    if (st.used == 8) {
      st.word = next(st);
      st.used = 0;
    }
    data[i] ^= (uint8_t)(st.word >> (st.used * 8));
    ++st.used;
  }
  return true;
}

#ifdef SHADOWRELAY_HAVE_SODIUM
size_t SodiumStreamCipher::iv_size(SodiumStream kind) {
  switch (kind) {
  case SodiumStream::ChaCha20:
    return crypto_stream_chacha20_NONCEBYTES;
  case SodiumStream::ChaCha20Ietf:
    return crypto_stream_chacha20_ietf_NONCEBYTES;
  default:
    return crypto_stream_salsa20_NONCEBYTES;
  }
}

SodiumStreamCipher::SodiumStreamCipher(SodiumStream kind,
                                       const std::vector<uint8_t> &key)
    : IvStreamCryptor(key, iv_size(kind)), kind_(kind) {
  if (sodium_init() < 0)
    throw std::runtime_error("libsodium initialisation failed");
  // a 32 byte key is used as is, anything else is hashed down to one
  if (key_.size() != kKeyLength) {
    std::vector<uint8_t> hashed(kKeyLength);
    crypto_generichash(hashed.data(), hashed.size(), key_.data(), key_.size(),
                       nullptr, 0);
    key_.swap(hashed);
  }
  scratch_.reserve(kBufferSize + 64);
}

void SodiumStreamCipher::random_iv(uint8_t *iv, size_t len) {
  randombytes_buf(iv, len);
}

bool SodiumStreamCipher::init_stream(Side side,
                                     const std::vector<uint8_t> &iv) {
  iv_[side] = iv;
  counter_[side] = 0;
  return true;
}

// The keystream is addressed in 64-byte blocks. A call that starts inside a
// block is padded in front so the block counter stays aligned.
bool SodiumStreamCipher::apply_stream(Side side, uint8_t *data, size_t len) {
  if (len == 0)
    return true;
  uint64_t counter = counter_[side];
  size_t padding = (size_t)(counter % 64);
  uint64_t ic = counter / 64;
  scratch_.assign(padding + len, 0);
  std::memcpy(scratch_.data() + padding, data, len);
  int rc;
  switch (kind_) {
  case SodiumStream::ChaCha20:
    rc = crypto_stream_chacha20_xor_ic(scratch_.data(), scratch_.data(),
                                       scratch_.size(), iv_[side].data(), ic,
                                       key_.data());
    break;
  case SodiumStream::ChaCha20Ietf:
    rc = crypto_stream_chacha20_ietf_xor_ic(scratch_.data(), scratch_.data(),
                                            scratch_.size(), iv_[side].data(),
                                            (uint32_t)ic, key_.data());
    break;
  default:
    rc = crypto_stream_salsa20_xor_ic(scratch_.data(), scratch_.data(),
                                      scratch_.size(), iv_[side].data(), ic,
                                      key_.data());
    break;
  }
  if (rc != 0)
    return false;
  std::memcpy(data, scratch_.data() + padding, len);
  counter_[side] = counter + len;
  return true;
}
#endif

std::vector<std::string> supported_methods() {
  std::vector<std::string> m;
#ifdef SHADOWRELAY_HAVE_SODIUM
  m.push_back("chacha20");
  m.push_back("chacha20-ietf");
  m.push_back("salsa20");
#endif
  m.push_back("xorshift");
  return m;
}

bool is_supported_method(const std::string &method) {
  for (const auto &m : supported_methods())
    if (m == method)
      return true;
  return false;
}

std::string default_method() { return supported_methods().front(); }

std::vector<uint8_t> derive_key(const std::string &password) {
  std::vector<uint8_t> key(kKeyLength);
  // aes-256-cfb only sets the output length, 32 bytes like every method
  int n = EVP_BytesToKey(EVP_aes_256_cfb(), EVP_md5(), nullptr,
                         reinterpret_cast<const unsigned char *>(password.data()),
                         (int)password.size(), 1, key.data(), nullptr);
  if (n != (int)kKeyLength)
    throw std::runtime_error("EVP_BytesToKey failed");
  return key;
}

std::unique_ptr<StreamCryptor> make_cryptor(const std::string &method,
                                            const std::vector<uint8_t> &key,
                                            std::error_code &ec) {
  ec.clear();
#ifdef SHADOWRELAY_HAVE_SODIUM
  if (method == "chacha20")
    return std::unique_ptr<StreamCryptor>(
        new SodiumStreamCipher(SodiumStream::ChaCha20, key));
  if (method == "chacha20-ietf")
    return std::unique_ptr<StreamCryptor>(
        new SodiumStreamCipher(SodiumStream::ChaCha20Ietf, key));
  if (method == "salsa20")
    return std::unique_ptr<StreamCryptor>(
        new SodiumStreamCipher(SodiumStream::Salsa20, key));
#endif
  if (method == "xorshift")
    return std::unique_ptr<StreamCryptor>(new XorStreamCipher(key));
  ec = relay_errc::unsupported_method;
  return nullptr;
}

} // namespace shadowrelay
