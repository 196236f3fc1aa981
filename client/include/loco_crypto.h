#ifndef LOCO_CLIENT_LOCO_CRYPTO_H
#define LOCO_CLIENT_LOCO_CRYPTO_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "loco_error.h"

namespace loco::client {

// The server accepts exactly one handshake key type and drops the
// connection without a reply for any other value.
constexpr std::uint32_t kDefaultHandshakeKeyType = 16;
constexpr std::uint32_t kEncryptTypeAesCfb128 = 2;

constexpr std::size_t kAesKeyBytes = 16;
constexpr std::size_t kAesIvBytes = 16;
constexpr std::size_t kOaepSeedBytes = 20;
constexpr std::size_t kHandshakePrefixBytes = 12;
constexpr std::size_t kWrappedPlainBytes = kAesKeyBytes + kAesIvBytes + 4;

using AesKey = std::array<std::uint8_t, kAesKeyBytes>;
using AesIv = std::array<std::uint8_t, kAesIvBytes>;
using OaepSeed = std::array<std::uint8_t, kOaepSeedBytes>;

// One of the three accepted forms; the first non-empty one wins.
struct PublicKeyMaterial {
  std::string der_base64;
  std::string pem_path;
  std::string modulus_hex;
  std::uint32_t exponent{0};
};

class ServerPublicKey {
 public:
  ServerPublicKey();
  ~ServerPublicKey();
  ServerPublicKey(ServerPublicKey&& other) noexcept;
  ServerPublicKey& operator=(ServerPublicKey&& other) noexcept;
  ServerPublicKey(const ServerPublicKey&) = delete;
  ServerPublicKey& operator=(const ServerPublicKey&) = delete;

  bool loaded() const { return impl_ != nullptr; }
  std::size_t modulus_bytes() const;
  // SHA-256 over the SubjectPublicKeyInfo DER, hex encoded.
  std::string Fingerprint() const;

  // Holds the OpenSSL key; defined in loco_crypto.cpp.
  struct Impl;
  const Impl* impl() const { return impl_.get(); }
  void Reset(std::unique_ptr<Impl> impl);

 private:
  std::unique_ptr<Impl> impl_;
};

// Key, IV, key type and the two AES-128-CFB128 stream states of one legacy
// connection. Wiped on destruction.
class CryptoContext {
 public:
  CryptoContext();
  ~CryptoContext();
  CryptoContext(CryptoContext&& other) noexcept;
  CryptoContext& operator=(CryptoContext&& other) noexcept;
  CryptoContext(const CryptoContext&) = delete;
  CryptoContext& operator=(const CryptoContext&) = delete;

  // Installs fixed material; both directions restart from the IV.
  bool Init(const AesKey& key, const AesIv& iv, std::uint32_t key_type,
            std::string& error);
  void Wipe();

  bool ready() const { return ready_; }
  const AesKey& key() const { return key_; }
  const AesIv& iv() const { return iv_; }
  std::uint32_t key_type() const { return key_type_; }

  bool Encrypt(const std::uint8_t* data, std::size_t len,
               std::vector<std::uint8_t>& out);
  bool Decrypt(const std::uint8_t* data, std::size_t len,
               std::vector<std::uint8_t>& out);

 private:
  struct CipherState;

  AesKey key_{};
  AesIv iv_{};
  std::uint32_t key_type_{0};
  bool ready_{false};
  std::unique_ptr<CipherState> tx_;
  std::unique_ptr<CipherState> rx_;
};

// Fresh key and IV from the OS CSPRNG, with OpenSSL RAND_bytes as fallback.
bool CreateHandshake(std::uint32_t key_type, CryptoContext& out,
                     Failure& error);

// RSA-OAEP (SHA-1 digest and MGF1) over key || iv || key_type (u32 LE).
// A fixed seed makes the output deterministic.
bool WrapForTransport(const CryptoContext& context, const ServerPublicKey& key,
                      std::vector<std::uint8_t>& out, Failure& error,
                      const OaepSeed* seed = nullptr);

// u32 wrapped length, u32 key type, u32 encrypt type, wrapped key (LE).
bool BuildHandshakePacket(const CryptoContext& context,
                          const std::vector<std::uint8_t>& wrapped,
                          std::vector<std::uint8_t>& out);

bool EncryptBody(CryptoContext& context, const std::vector<std::uint8_t>& plain,
                 std::vector<std::uint8_t>& out);
bool DecryptBody(CryptoContext& context,
                 const std::vector<std::uint8_t>& cipher,
                 std::vector<std::uint8_t>& out);

bool LoadServerPublicKey(const PublicKeyMaterial& material,
                         ServerPublicKey& out, Failure& error);

}  // namespace loco::client

#endif  // LOCO_CLIENT_LOCO_CRYPTO_H
