#include "loco_crypto.h"

#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rand.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>

#include <cstring>
#include <limits>
#include <utility>

#include "hex_utils.h"
#include "platform_random.h"
#include "secure_buffer.h"

namespace loco::client {

namespace {

constexpr std::size_t kSha1Bytes = 20;

void WriteUint32Le(std::uint32_t v, std::uint8_t* out) {
  out[0] = static_cast<std::uint8_t>(v & 0xFF);
  out[1] = static_cast<std::uint8_t>((v >> 8) & 0xFF);
  out[2] = static_cast<std::uint8_t>((v >> 16) & 0xFF);
  out[3] = static_cast<std::uint8_t>((v >> 24) & 0xFF);
}

std::string GetOpenSslError() {
  const unsigned long err = ERR_get_error();
  if (err == 0) {
    return "openssl error";
  }
  char buf[256] = {};
  ERR_error_string_n(err, buf, sizeof(buf));
  return std::string(buf);
}

Failure KeyFormatFailure(std::string message) {
  return MakeFailure(ErrorKind::kKeyFormat, std::move(message));
}

struct PkeyCtxDeleter {
  void operator()(EVP_PKEY_CTX* ctx) const { EVP_PKEY_CTX_free(ctx); }
};
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;

struct MdCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

struct BioDeleter {
  void operator()(BIO* bio) const { BIO_free(bio); }
};
using BioPtr = std::unique_ptr<BIO, BioDeleter>;

// out ^= MGF1-SHA1(seed), RFC 8017 B.2.1.
bool Mgf1Xor(std::uint8_t* out, std::size_t out_len, const std::uint8_t* seed,
             std::size_t seed_len) {
  MdCtxPtr md(EVP_MD_CTX_new());
  if (!md) {
    return false;
  }
  std::uint8_t digest[EVP_MAX_MD_SIZE];
  std::uint32_t counter = 0;
  std::size_t done = 0;
  while (done < out_len) {
    const std::uint8_t c[4] = {
        static_cast<std::uint8_t>((counter >> 24) & 0xFF),
        static_cast<std::uint8_t>((counter >> 16) & 0xFF),
        static_cast<std::uint8_t>((counter >> 8) & 0xFF),
        static_cast<std::uint8_t>(counter & 0xFF)};
    unsigned int digest_len = 0;
    if (EVP_DigestInit_ex(md.get(), EVP_sha1(), nullptr) != 1 ||
        EVP_DigestUpdate(md.get(), seed, seed_len) != 1 ||
        EVP_DigestUpdate(md.get(), c, sizeof(c)) != 1 ||
        EVP_DigestFinal_ex(md.get(), digest, &digest_len) != 1) {
      return false;
    }
    for (unsigned int i = 0; i < digest_len && done < out_len; ++i) {
      out[done++] ^= digest[i];
    }
    ++counter;
  }
  common::SecureWipe(digest, sizeof(digest));
  return true;
}

// EME-OAEP encoding with an empty label, RFC 8017 7.1.1 step 2.
bool OaepEncode(const std::uint8_t* msg, std::size_t msg_len,
                const OaepSeed& seed, std::size_t k,
                std::vector<std::uint8_t>& em) {
  if (k < msg_len + 2 * kSha1Bytes + 2) {
    return false;
  }
  em.assign(k, 0);
  std::uint8_t* masked_seed = em.data() + 1;
  std::uint8_t* db = em.data() + 1 + kSha1Bytes;
  const std::size_t db_len = k - kSha1Bytes - 1;

  unsigned int lhash_len = 0;
  if (EVP_Digest("", 0, db, &lhash_len, EVP_sha1(), nullptr) != 1 ||
      lhash_len != kSha1Bytes) {
    return false;
  }
  db[db_len - msg_len - 1] = 0x01;
  std::memcpy(db + db_len - msg_len, msg, msg_len);

  if (!Mgf1Xor(db, db_len, seed.data(), seed.size())) {
    return false;
  }
  std::memcpy(masked_seed, seed.data(), seed.size());
  return Mgf1Xor(masked_seed, kSha1Bytes, db, db_len);
}

bool RsaEncrypt(EVP_PKEY* pkey, int padding, const std::uint8_t* in,
                std::size_t in_len, std::vector<std::uint8_t>& out,
                std::string& error) {
  PkeyCtxPtr ctx(EVP_PKEY_CTX_new(pkey, nullptr));
  if (!ctx || EVP_PKEY_encrypt_init(ctx.get()) != 1 ||
      EVP_PKEY_CTX_set_rsa_padding(ctx.get(), padding) != 1) {
    error = "rsa init failed: " + GetOpenSslError();
    return false;
  }
  if (padding == RSA_PKCS1_OAEP_PADDING) {
    if (EVP_PKEY_CTX_set_rsa_oaep_md(ctx.get(), EVP_sha1()) != 1 ||
        EVP_PKEY_CTX_set_rsa_mgf1_md(ctx.get(), EVP_sha1()) != 1) {
      error = "rsa oaep setup failed: " + GetOpenSslError();
      return false;
    }
  }
  std::size_t out_len = 0;
  if (EVP_PKEY_encrypt(ctx.get(), nullptr, &out_len, in, in_len) != 1) {
    error = "rsa size query failed: " + GetOpenSslError();
    return false;
  }
  out.resize(out_len);
  if (EVP_PKEY_encrypt(ctx.get(), out.data(), &out_len, in, in_len) != 1) {
    out.clear();
    error = "rsa encrypt failed: " + GetOpenSslError();
    return false;
  }
  out.resize(out_len);
  return true;
}

EVP_PKEY* ParseDer(const std::vector<std::uint8_t>& der) {
  const unsigned char* p = der.data();
  EVP_PKEY* pkey = d2i_PUBKEY(nullptr, &p, static_cast<long>(der.size()));
  if (pkey) {
    return pkey;
  }
  ERR_clear_error();
  p = der.data();
  return d2i_PublicKey(EVP_PKEY_RSA, nullptr, &p,
                       static_cast<long>(der.size()));
}

EVP_PKEY* ParsePemFile(const std::string& path, std::string& error) {
  BioPtr bio(BIO_new_file(path.c_str(), "rb"));
  if (!bio) {
    error = "key file open failed: " + path;
    return nullptr;
  }
  EVP_PKEY* pkey = PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr);
  if (pkey) {
    return pkey;
  }
  ERR_clear_error();
  if (BIO_reset(bio.get()) != 0) {
    error = "key file rewind failed";
    return nullptr;
  }
  RSA* rsa = PEM_read_bio_RSAPublicKey(bio.get(), nullptr, nullptr, nullptr);
  if (!rsa) {
    error = "key file is not a PEM public key";
    return nullptr;
  }
  pkey = EVP_PKEY_new();
  if (!pkey || EVP_PKEY_assign_RSA(pkey, rsa) != 1) {
    EVP_PKEY_free(pkey);
    RSA_free(rsa);
    error = "key wrap failed";
    return nullptr;
  }
  return pkey;
}

EVP_PKEY* ParseModulus(const std::string& modulus_hex, std::uint32_t exponent,
                       std::string& error) {
  std::vector<std::uint8_t> modulus;
  if (!common::HexToBytes(modulus_hex, modulus)) {
    error = "modulus is not hex";
    return nullptr;
  }
  if (exponent < 3 || (exponent % 2) == 0) {
    error = "exponent must be odd and at least 3";
    return nullptr;
  }
  BIGNUM* n = BN_bin2bn(modulus.data(), static_cast<int>(modulus.size()),
                        nullptr);
  BIGNUM* e = BN_new();
  RSA* rsa = RSA_new();
  if (!n || !e || !rsa || BN_set_word(e, exponent) != 1 ||
      RSA_set0_key(rsa, n, e, nullptr) != 1) {
    BN_free(n);
    BN_free(e);
    RSA_free(rsa);
    error = "modulus import failed";
    return nullptr;
  }
  EVP_PKEY* pkey = EVP_PKEY_new();
  if (!pkey || EVP_PKEY_assign_RSA(pkey, rsa) != 1) {
    EVP_PKEY_free(pkey);
    RSA_free(rsa);
    error = "key wrap failed";
    return nullptr;
  }
  return pkey;
}

}  // namespace

struct ServerPublicKey::Impl {
  EVP_PKEY* pkey{nullptr};

  explicit Impl(EVP_PKEY* key) : pkey(key) {}
  ~Impl() { EVP_PKEY_free(pkey); }
  Impl(const Impl&) = delete;
  Impl& operator=(const Impl&) = delete;
};

ServerPublicKey::ServerPublicKey() = default;
ServerPublicKey::~ServerPublicKey() = default;
ServerPublicKey::ServerPublicKey(ServerPublicKey&& other) noexcept = default;
ServerPublicKey& ServerPublicKey::operator=(ServerPublicKey&& other) noexcept =
    default;

void ServerPublicKey::Reset(std::unique_ptr<Impl> impl) {
  impl_ = std::move(impl);
}

std::size_t ServerPublicKey::modulus_bytes() const {
  if (!impl_) {
    return 0;
  }
  const int size = EVP_PKEY_size(impl_->pkey);
  return size > 0 ? static_cast<std::size_t>(size) : 0;
}

std::string ServerPublicKey::Fingerprint() const {
  if (!impl_) {
    return {};
  }
  unsigned char* der = nullptr;
  const int len = i2d_PUBKEY(impl_->pkey, &der);
  if (len <= 0) {
    return {};
  }
  std::string out = common::Sha256Hex(der, static_cast<std::size_t>(len));
  OPENSSL_free(der);
  return out;
}

struct CryptoContext::CipherState {
  EVP_CIPHER_CTX* ctx{nullptr};

  CipherState() : ctx(EVP_CIPHER_CTX_new()) {}
  ~CipherState() { EVP_CIPHER_CTX_free(ctx); }
  CipherState(const CipherState&) = delete;
  CipherState& operator=(const CipherState&) = delete;
};

CryptoContext::CryptoContext() = default;

CryptoContext::~CryptoContext() {
  Wipe();
}

CryptoContext::CryptoContext(CryptoContext&& other) noexcept
    : key_(other.key_),
      iv_(other.iv_),
      key_type_(other.key_type_),
      ready_(other.ready_),
      tx_(std::move(other.tx_)),
      rx_(std::move(other.rx_)) {
  other.Wipe();
}

CryptoContext& CryptoContext::operator=(CryptoContext&& other) noexcept {
  if (this == &other) {
    return *this;
  }
  Wipe();
  key_ = other.key_;
  iv_ = other.iv_;
  key_type_ = other.key_type_;
  ready_ = other.ready_;
  tx_ = std::move(other.tx_);
  rx_ = std::move(other.rx_);
  other.Wipe();
  return *this;
}

bool CryptoContext::Init(const AesKey& key, const AesIv& iv,
                         std::uint32_t key_type, std::string& error) {
  Wipe();
  auto tx = std::make_unique<CipherState>();
  auto rx = std::make_unique<CipherState>();
  if (!tx->ctx || !rx->ctx) {
    error = "cipher alloc failed";
    return false;
  }
  if (EVP_EncryptInit_ex(tx->ctx, EVP_aes_128_cfb128(), nullptr, key.data(),
                         iv.data()) != 1 ||
      EVP_DecryptInit_ex(rx->ctx, EVP_aes_128_cfb128(), nullptr, key.data(),
                         iv.data()) != 1) {
    error = "cipher init failed: " + GetOpenSslError();
    return false;
  }
  key_ = key;
  iv_ = iv;
  key_type_ = key_type;
  tx_ = std::move(tx);
  rx_ = std::move(rx);
  ready_ = true;
  return true;
}

void CryptoContext::Wipe() {
  common::SecureWipe(key_);
  common::SecureWipe(iv_);
  tx_.reset();
  rx_.reset();
  ready_ = false;
}

bool CryptoContext::Encrypt(const std::uint8_t* data, std::size_t len,
                            std::vector<std::uint8_t>& out) {
  out.clear();
  if (!ready_ || !tx_) {
    return false;
  }
  if (len == 0) {
    return true;
  }
  if (!data || len > static_cast<std::size_t>(
                         (std::numeric_limits<int>::max)())) {
    return false;
  }
  out.resize(len);
  int out_len = 0;
  if (EVP_EncryptUpdate(tx_->ctx, out.data(), &out_len, data,
                        static_cast<int>(len)) != 1 ||
      static_cast<std::size_t>(out_len) != len) {
    out.clear();
    return false;
  }
  return true;
}

bool CryptoContext::Decrypt(const std::uint8_t* data, std::size_t len,
                            std::vector<std::uint8_t>& out) {
  out.clear();
  if (!ready_ || !rx_) {
    return false;
  }
  if (len == 0) {
    return true;
  }
  if (!data || len > static_cast<std::size_t>(
                         (std::numeric_limits<int>::max)())) {
    return false;
  }
  out.resize(len);
  int out_len = 0;
  if (EVP_DecryptUpdate(rx_->ctx, out.data(), &out_len, data,
                        static_cast<int>(len)) != 1 ||
      static_cast<std::size_t>(out_len) != len) {
    out.clear();
    return false;
  }
  return true;
}

bool CreateHandshake(std::uint32_t key_type, CryptoContext& out,
                     Failure& error) {
  AesKey key{};
  AesIv iv{};
  common::ScopedWipe key_wipe(key);
  common::ScopedWipe iv_wipe(iv);
  const bool os_ok = platform::RandomBytes(key.data(), key.size()) &&
                     platform::RandomBytes(iv.data(), iv.size());
  if (!os_ok) {
    if (RAND_bytes(key.data(), static_cast<int>(key.size())) != 1 ||
        RAND_bytes(iv.data(), static_cast<int>(iv.size())) != 1) {
      error = MakeFailure(ErrorKind::kEntropy, "no random source available");
      return false;
    }
  }
  std::string init_error;
  if (!out.Init(key, iv, key_type, init_error)) {
    error = MakeFailure(ErrorKind::kEntropy, init_error);
    return false;
  }
  return true;
}

bool WrapForTransport(const CryptoContext& context, const ServerPublicKey& key,
                      std::vector<std::uint8_t>& out, Failure& error,
                      const OaepSeed* seed) {
  out.clear();
  if (!key.impl() || !key.impl()->pkey) {
    error = KeyFormatFailure("server public key not loaded");
    return false;
  }
  if (!context.ready()) {
    error = MakeFailure(ErrorKind::kInvalidState, "crypto context not ready");
    return false;
  }
  std::array<std::uint8_t, kWrappedPlainBytes> plain{};
  common::ScopedWipe plain_wipe(plain);
  std::memcpy(plain.data(), context.key().data(), kAesKeyBytes);
  std::memcpy(plain.data() + kAesKeyBytes, context.iv().data(), kAesIvBytes);
  WriteUint32Le(context.key_type(), plain.data() + kAesKeyBytes + kAesIvBytes);

  EVP_PKEY* pkey = key.impl()->pkey;
  std::string rsa_error;
  if (seed) {
    std::vector<std::uint8_t> em;
    const bool encoded = OaepEncode(plain.data(), plain.size(), *seed,
                                    key.modulus_bytes(), em);
    common::ScopedWipe em_wipe(em);
    if (!encoded) {
      error = KeyFormatFailure("modulus too small for oaep");
      return false;
    }
    if (!RsaEncrypt(pkey, RSA_NO_PADDING, em.data(), em.size(), out,
                    rsa_error)) {
      error = KeyFormatFailure(rsa_error);
      return false;
    }
    return true;
  }
  if (!RsaEncrypt(pkey, RSA_PKCS1_OAEP_PADDING, plain.data(), plain.size(), out,
                  rsa_error)) {
    error = KeyFormatFailure(rsa_error);
    return false;
  }
  return true;
}

bool BuildHandshakePacket(const CryptoContext& context,
                          const std::vector<std::uint8_t>& wrapped,
                          std::vector<std::uint8_t>& out) {
  out.clear();
  if (wrapped.empty() ||
      wrapped.size() > (std::numeric_limits<std::uint32_t>::max)()) {
    return false;
  }
  out.resize(kHandshakePrefixBytes + wrapped.size());
  WriteUint32Le(static_cast<std::uint32_t>(wrapped.size()), out.data());
  WriteUint32Le(context.key_type(), out.data() + 4);
  WriteUint32Le(kEncryptTypeAesCfb128, out.data() + 8);
  std::memcpy(out.data() + kHandshakePrefixBytes, wrapped.data(),
              wrapped.size());
  return true;
}

bool EncryptBody(CryptoContext& context, const std::vector<std::uint8_t>& plain,
                 std::vector<std::uint8_t>& out) {
  return context.Encrypt(plain.data(), plain.size(), out);
}

bool DecryptBody(CryptoContext& context,
                 const std::vector<std::uint8_t>& cipher,
                 std::vector<std::uint8_t>& out) {
  return context.Decrypt(cipher.data(), cipher.size(), out);
}

bool LoadServerPublicKey(const PublicKeyMaterial& material,
                         ServerPublicKey& out, Failure& error) {
  out.Reset(nullptr);
  EVP_PKEY* pkey = nullptr;
  std::string parse_error;
  if (!material.der_base64.empty()) {
    std::vector<std::uint8_t> der;
    if (!common::Base64Decode(material.der_base64, der)) {
      error = KeyFormatFailure("public key is not base64");
      return false;
    }
    pkey = ParseDer(der);
    if (!pkey) {
      error = KeyFormatFailure("public key DER parse failed: " +
                               GetOpenSslError());
      return false;
    }
  } else if (!material.pem_path.empty()) {
    pkey = ParsePemFile(material.pem_path, parse_error);
  } else if (!material.modulus_hex.empty()) {
    pkey = ParseModulus(material.modulus_hex, material.exponent, parse_error);
  } else {
    parse_error = "no public key material";
  }
  if (!pkey) {
    error = KeyFormatFailure(parse_error);
    return false;
  }
  if (EVP_PKEY_base_id(pkey) != EVP_PKEY_RSA) {
    EVP_PKEY_free(pkey);
    error = KeyFormatFailure("public key is not RSA");
    return false;
  }
  out.Reset(std::make_unique<ServerPublicKey::Impl>(pkey));
  if (out.modulus_bytes() < kWrappedPlainBytes + 2 * kSha1Bytes + 2) {
    out.Reset(nullptr);
    error = KeyFormatFailure("public key modulus too small");
    return false;
  }
  return true;
}

}  // namespace loco::client
