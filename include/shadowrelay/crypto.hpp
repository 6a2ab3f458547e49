#pragma once
#include <cstdint>
#include <cstddef>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

namespace shadowrelay {

// One session's cipher state: an independent, order-sensitive stream per
// direction. Every decode call must carry the bytes that directly follow
// the ones passed to the previous call.
class StreamCryptor {
public:
    virtual ~StreamCryptor() = default;
    virtual size_t iv_length() const = 0;
    // The first call emits a fresh IV ahead of the ciphertext.
    virtual bool encode(const uint8_t* data, size_t len, std::vector<uint8_t>& out) = 0;
    // The first iv_length() bytes of the stream set up the IV and produce
    // no output.
    virtual bool decode(const uint8_t* data, size_t len, std::vector<uint8_t>& out) = 0;
};

// IV handling shared by the keystream ciphers below.
class IvStreamCryptor : public StreamCryptor {
public:
    size_t iv_length() const override { return iv_len_; }
    bool encode(const uint8_t* data, size_t len, std::vector<uint8_t>& out) override;
    bool decode(const uint8_t* data, size_t len, std::vector<uint8_t>& out) override;

protected:
    enum Side { kEncode = 0, kDecode = 1 };

    IvStreamCryptor(std::vector<uint8_t> key, size_t iv_len);
    virtual void random_iv(uint8_t* iv, size_t len) = 0;
    virtual bool init_stream(Side side, const std::vector<uint8_t>& iv) = 0;
    // XOR len bytes of keystream into data, advancing the side's position.
    virtual bool apply_stream(Side side, uint8_t* data, size_t len) = 0;

    std::vector<uint8_t> key_;

private:
    size_t iv_len_;
    bool enc_ready_{false};
    bool dec_ready_{false};
    std::vector<uint8_t> dec_iv_;
};

// xorshift128+ keystream seeded from key and IV. No external dependency;
// it is meant for development and tests, not for untrusted networks.
class XorStreamCipher : public IvStreamCryptor {
public:
    static constexpr size_t kIvLength = 16;
    explicit XorStreamCipher(const std::vector<uint8_t>& key);
protected:
    void random_iv(uint8_t* iv, size_t len) override;
    bool init_stream(Side side, const std::vector<uint8_t>& iv) override;
    bool apply_stream(Side side, uint8_t* data, size_t len) override;
private:
    struct State {
        uint64_t s0{0};
        uint64_t s1{0};
        uint64_t word{0};
        size_t used{8};
    };
    uint64_t base0_;
    uint64_t base1_;
    State state_[2];
    static uint64_t next(State& st);
};

#ifdef SHADOWRELAY_HAVE_SODIUM
enum class SodiumStream { ChaCha20, ChaCha20Ietf, Salsa20 };

class SodiumStreamCipher : public IvStreamCryptor {
public:
    SodiumStreamCipher(SodiumStream kind, const std::vector<uint8_t>& key);
protected:
    void random_iv(uint8_t* iv, size_t len) override;
    bool init_stream(Side side, const std::vector<uint8_t>& iv) override;
    bool apply_stream(Side side, uint8_t* data, size_t len) override;
private:
    static size_t iv_size(SodiumStream kind);
    SodiumStream kind_;
    std::vector<uint8_t> iv_[2];
    uint64_t counter_[2]{0, 0};
    std::vector<uint8_t> scratch_;
};
#endif

constexpr size_t kKeyLength = 32;

bool is_supported_method(const std::string& method);
std::vector<std::string> supported_methods();
std::string default_method();

// kKeyLength bytes of key material for a password, EVP_BytesToKey with
// MD5 as stock shadowsocks clients derive it.
std::vector<uint8_t> derive_key(const std::string& password);

// A fresh cipher instance, never shared between sessions.
std::unique_ptr<StreamCryptor> make_cryptor(const std::string& method,
                                            const std::vector<uint8_t>& key,
                                            std::error_code& ec);

} // namespace shadowrelay
