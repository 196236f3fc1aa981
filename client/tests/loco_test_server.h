#ifndef LOCO_CLIENT_TESTS_LOCO_TEST_SERVER_H
#define LOCO_CLIENT_TESTS_LOCO_TEST_SERVER_H

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <algorithm>
#include <cstring>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "byte_stream.h"
#include "document.h"
#include "hex_utils.h"
#include "loco_crypto.h"
#include "packet.h"

namespace loco::client::test {

// Stream over a fixed byte script; reports kClosed once drained.
class ScriptedStream final : public ByteStream {
 public:
  explicit ScriptedStream(std::vector<std::uint8_t> script,
                          std::size_t chunk = 0)
      : script_(std::move(script)), chunk_(chunk) {}

  IoStatus ReadSome(std::uint8_t* data, std::size_t len,
                    std::size_t& out_read) override {
    out_read = 0;
    if (pos_ >= script_.size()) {
      return end_status_;
    }
    std::size_t n = std::min(len, script_.size() - pos_);
    if (chunk_ != 0) {
      n = std::min(n, chunk_);
    }
    std::memcpy(data, script_.data() + pos_, n);
    pos_ += n;
    out_read = n;
    return IoStatus::kOk;
  }

  IoStatus WriteAll(const std::uint8_t* data, std::size_t len) override {
    written.insert(written.end(), data, data + len);
    ++write_calls;
    return IoStatus::kOk;
  }

  bool SetReadTimeout(std::uint32_t) override { return true; }
  void Shutdown() override {}
  void Close() override {}

  void set_end_status(IoStatus status) { end_status_ = status; }

  std::vector<std::uint8_t> written;
  std::size_t write_calls{0};

 private:
  std::vector<std::uint8_t> script_;
  std::size_t chunk_{0};
  std::size_t pos_{0};
  IoStatus end_status_{IoStatus::kClosed};
};

// One direction of an in-memory pipe.
struct PipeBuffer {
  std::mutex mutex;
  std::condition_variable cv;
  std::deque<std::uint8_t> data;
  bool closed{false};

  void Close() {
    {
      std::lock_guard<std::mutex> lock(mutex);
      closed = true;
    }
    cv.notify_all();
  }
};

class PipeStream final : public ByteStream {
 public:
  PipeStream(std::shared_ptr<PipeBuffer> in, std::shared_ptr<PipeBuffer> out)
      : in_(std::move(in)), out_(std::move(out)) {}

  ~PipeStream() override { Close(); }

  IoStatus ReadSome(std::uint8_t* data, std::size_t len,
                    std::size_t& out_read) override {
    out_read = 0;
    std::unique_lock<std::mutex> lock(in_->mutex);
    const auto ready = [this] { return in_->closed || !in_->data.empty(); };
    const std::uint32_t timeout_ms = timeout_ms_;
    if (timeout_ms == 0) {
      in_->cv.wait(lock, ready);
    } else if (!in_->cv.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                                 ready)) {
      return IoStatus::kTimeout;
    }
    if (in_->data.empty()) {
      return IoStatus::kClosed;
    }
    while (out_read < len && !in_->data.empty()) {
      data[out_read++] = in_->data.front();
      in_->data.pop_front();
    }
    return IoStatus::kOk;
  }

  IoStatus WriteAll(const std::uint8_t* data, std::size_t len) override {
    {
      std::lock_guard<std::mutex> lock(out_->mutex);
      if (out_->closed) {
        return IoStatus::kClosed;
      }
      out_->data.insert(out_->data.end(), data, data + len);
    }
    out_->cv.notify_all();
    return IoStatus::kOk;
  }

  bool SetReadTimeout(std::uint32_t timeout_ms) override {
    timeout_ms_ = timeout_ms;
    return true;
  }

  void Shutdown() override {
    in_->Close();
    out_->Close();
  }

  void Close() override { Shutdown(); }

 private:
  std::shared_ptr<PipeBuffer> in_;
  std::shared_ptr<PipeBuffer> out_;
  std::uint32_t timeout_ms_{0};
};

inline void MakePipe(std::unique_ptr<ByteStream>& client,
                     std::unique_ptr<ByteStream>& server) {
  auto c2s = std::make_shared<PipeBuffer>();
  auto s2c = std::make_shared<PipeBuffer>();
  client = std::make_unique<PipeStream>(s2c, c2s);
  server = std::make_unique<PipeStream>(c2s, s2c);
}

inline bool ReadExact(ByteStream& stream, std::uint8_t* data,
                      std::size_t len) {
  std::size_t got = 0;
  while (got < len) {
    std::size_t n = 0;
    if (stream.ReadSome(data + got, len - got, n) != IoStatus::kOk) {
      return false;
    }
    got += n;
  }
  return true;
}

inline std::uint32_t LoadUint32Le(const std::uint8_t* p) {
  return static_cast<std::uint32_t>(p[0]) |
         (static_cast<std::uint32_t>(p[1]) << 8) |
         (static_cast<std::uint32_t>(p[2]) << 16) |
         (static_cast<std::uint32_t>(p[3]) << 24);
}

// RSA key pair standing in for the server's private key.
class TestKeyPair {
 public:
  explicit TestKeyPair(int bits = 2048) {
    EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr);
    if (ctx && EVP_PKEY_keygen_init(ctx) == 1 &&
        EVP_PKEY_CTX_set_rsa_keygen_bits(ctx, bits) == 1) {
      EVP_PKEY_keygen(ctx, &pkey_);
    }
    EVP_PKEY_CTX_free(ctx);
  }
  ~TestKeyPair() { EVP_PKEY_free(pkey_); }
  TestKeyPair(const TestKeyPair&) = delete;
  TestKeyPair& operator=(const TestKeyPair&) = delete;

  bool ok() const { return pkey_ != nullptr; }

  // PKCS#1 RSAPublicKey DER, base64.
  std::string PublicPkcs1Base64() const {
    unsigned char* der = nullptr;
    const int len = i2d_PublicKey(pkey_, &der);
    if (len <= 0) {
      return {};
    }
    std::string out =
        common::Base64Encode(der, static_cast<std::size_t>(len));
    OPENSSL_free(der);
    return out;
  }

  // SubjectPublicKeyInfo DER, base64.
  std::string PublicSpkiBase64() const {
    unsigned char* der = nullptr;
    const int len = i2d_PUBKEY(pkey_, &der);
    if (len <= 0) {
      return {};
    }
    std::string out =
        common::Base64Encode(der, static_cast<std::size_t>(len));
    OPENSSL_free(der);
    return out;
  }

  // Big-endian modulus as hex.
  std::string ModulusHex() const {
    BIGNUM* n = nullptr;
    if (EVP_PKEY_get_bn_param(pkey_, OSSL_PKEY_PARAM_RSA_N, &n) != 1) {
      return {};
    }
    char* hex = BN_bn2hex(n);
    std::string out = hex ? hex : "";
    OPENSSL_free(hex);
    BN_free(n);
    return out;
  }

  bool WritePublicPem(const std::string& path) const {
    BIO* bio = BIO_new_file(path.c_str(), "wb");
    if (!bio) {
      return false;
    }
    const bool ok = PEM_write_bio_PUBKEY(bio, pkey_) == 1;
    BIO_free(bio);
    return ok;
  }

  bool DecryptOaepSha1(const std::vector<std::uint8_t>& cipher,
                       std::vector<std::uint8_t>& out) const {
    out.clear();
    EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new(pkey_, nullptr);
    bool ok = ctx && EVP_PKEY_decrypt_init(ctx) == 1 &&
              EVP_PKEY_CTX_set_rsa_padding(ctx, RSA_PKCS1_OAEP_PADDING) == 1 &&
              EVP_PKEY_CTX_set_rsa_oaep_md(ctx, EVP_sha1()) == 1 &&
              EVP_PKEY_CTX_set_rsa_mgf1_md(ctx, EVP_sha1()) == 1;
    std::size_t len = 0;
    ok = ok && EVP_PKEY_decrypt(ctx, nullptr, &len, cipher.data(),
                                cipher.size()) == 1;
    if (ok) {
      out.resize(len);
      ok = EVP_PKEY_decrypt(ctx, out.data(), &len, cipher.data(),
                            cipher.size()) == 1;
      out.resize(ok ? len : 0);
    }
    EVP_PKEY_CTX_free(ctx);
    return ok;
  }

 private:
  EVP_PKEY* pkey_{nullptr};
};

struct StubOptions {
  std::string booking_host{"booking.test"};
  std::string ticket_host{"ticket.test"};
  std::uint16_t ticket_port{5223};
  bool send_ports{true};
  std::string loco_host{"loco.test"};
  std::uint16_t loco_port{9282};
  std::uint32_t accepted_key_type{kDefaultHandshakeKeyType};
  std::int16_t login_header_status{0};
  std::int32_t login_body_status{0};
  std::int64_t user_id{4242};
  // Pushed right after a successful LOGINLIST reply.
  std::vector<std::string> pushes;
  // Reply with packet id 0 instead of echoing the request id.
  bool echo_ids{true};
  // Refuse TCP connections to this host.
  std::string unreachable_host;
  // Connections to this host never complete.
  std::string silent_host;
};

// Server side of Booking, Checkin and Login over in-memory pipes.
class StubServer {
 public:
  explicit StubServer(StubOptions options) : options_(std::move(options)) {}

  ~StubServer() {
    std::vector<std::thread> threads;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      threads.swap(threads_);
    }
    for (auto& t : threads) {
      if (t.joinable()) {
        t.join();
      }
    }
  }

  StubServer(const StubServer&) = delete;
  StubServer& operator=(const StubServer&) = delete;

  const TestKeyPair& key() const { return key_; }
  const StubOptions& options() const { return options_; }

  void Accept(std::unique_ptr<ByteStream> stream, const Endpoint& endpoint,
              Security security) {
    std::lock_guard<std::mutex> lock(mutex_);
    connections_.push_back(endpoint.host);
    securities_.push_back(security);
    threads_.emplace_back(&StubServer::Handle, this,
                          std::shared_ptr<ByteStream>(std::move(stream)),
                          endpoint);
  }

  std::vector<std::string> connections() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_;
  }
  std::vector<Security> securities() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return securities_;
  }
  std::vector<std::string> commands() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return commands_;
  }
  std::vector<std::uint32_t> key_types() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return key_types_;
  }
  std::string last_token() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_token_;
  }

 private:
  void Record(const std::string& command) {
    std::lock_guard<std::mutex> lock(mutex_);
    commands_.push_back(command);
  }

  bool Reply(ByteStream& stream, CryptoContext* crypto,
             const Packet& request, const Document& body,
             std::int16_t status = 0) {
    return Push(stream, crypto, request.header.command, body,
                options_.echo_ids ? request.header.packet_id : 0, status);
  }

  bool Push(ByteStream& stream, CryptoContext* crypto,
            const std::string& command, const Document& body,
            std::uint32_t packet_id, std::int16_t status = 0) {
    Packet packet;
    if (!MakeDocumentPacket(packet_id, command, body, packet)) {
      return false;
    }
    packet.header.status_code = status;
    if (crypto) {
      std::vector<std::uint8_t> sealed;
      if (!crypto->Encrypt(packet.body.data(), packet.body.size(), sealed)) {
        return false;
      }
      packet.body = std::move(sealed);
      packet.header.body_type =
          static_cast<std::uint8_t>(packet.header.body_type |
                                    kBodyEncryptedFlag);
    }
    ErrorKind err = ErrorKind::kNone;
    return WritePacket(stream, packet, err);
  }

  bool Next(ByteStream& stream, CryptoContext* crypto, Packet& packet,
            Document& body) {
    ErrorKind err = ErrorKind::kNone;
    if (!ReadPacket(stream, packet, err)) {
      return false;
    }
    if (packet.IsEncrypted()) {
      std::vector<std::uint8_t> plain;
      if (!crypto ||
          !crypto->Decrypt(packet.body.data(), packet.body.size(), plain)) {
        return false;
      }
      packet.body = std::move(plain);
      packet.header.body_type =
          static_cast<std::uint8_t>(packet.header.body_type &
                                    kBodyEncodingMask);
    }
    CodecError codec = CodecError::kNone;
    if (!DecodeBodyDocument(packet, body, codec)) {
      return false;
    }
    Record(packet.header.command);
    return true;
  }

  bool AcceptHandshake(ByteStream& stream, CryptoContext& crypto) {
    std::uint8_t prefix[kHandshakePrefixBytes];
    if (!ReadExact(stream, prefix, sizeof(prefix))) {
      return false;
    }
    const std::uint32_t wrapped_len = LoadUint32Le(prefix);
    const std::uint32_t key_type = LoadUint32Le(prefix + 4);
    const std::uint32_t encrypt_type = LoadUint32Le(prefix + 8);
    {
      std::lock_guard<std::mutex> lock(mutex_);
      key_types_.push_back(key_type);
    }
    if (wrapped_len == 0 || wrapped_len > 4096) {
      return false;
    }
    std::vector<std::uint8_t> wrapped(wrapped_len);
    if (!ReadExact(stream, wrapped.data(), wrapped.size())) {
      return false;
    }
    // Like the real server: a wrong key type gets no reply at all.
    if (key_type != options_.accepted_key_type ||
        encrypt_type != kEncryptTypeAesCfb128) {
      return false;
    }
    std::vector<std::uint8_t> plain;
    if (!key_.DecryptOaepSha1(wrapped, plain) ||
        plain.size() != kWrappedPlainBytes ||
        LoadUint32Le(plain.data() + kAesKeyBytes + kAesIvBytes) != key_type) {
      return false;
    }
    AesKey aes_key{};
    AesIv aes_iv{};
    std::memcpy(aes_key.data(), plain.data(), kAesKeyBytes);
    std::memcpy(aes_iv.data(), plain.data() + kAesKeyBytes, kAesIvBytes);
    std::string error;
    return crypto.Init(aes_key, aes_iv, key_type, error);
  }

  void HandleBooking(ByteStream& stream) {
    Packet request;
    Document body;
    if (!Next(stream, nullptr, request, body) ||
        request.header.command != "GETCONF") {
      return;
    }
    Document ticket;
    ticket.Set("lsl", Value::Array({Value::String(options_.ticket_host)}));
    Document wifi;
    if (options_.send_ports) {
      wifi.Set("ports", Value::Array({Value::Int32(options_.ticket_port)}));
    }
    Document reply;
    reply.Set("status", Value::Int32(0));
    reply.Set("ticket", Value::Doc(ticket));
    reply.Set("wifi", Value::Doc(wifi));
    Reply(stream, nullptr, request, reply);
  }

  void HandleLegacy(ByteStream& stream) {
    CryptoContext crypto;
    if (!AcceptHandshake(stream, crypto)) {
      return;
    }
    while (true) {
      Packet request;
      Document body;
      if (!Next(stream, &crypto, request, body)) {
        return;
      }
      const std::string& command = request.header.command;
      Document reply;
      if (command == "CHECKIN") {
        reply.Set("status", Value::Int32(0));
        reply.Set("host", Value::String(options_.loco_host));
        reply.Set("port", Value::Int32(options_.loco_port));
        Reply(stream, &crypto, request, reply);
      } else if (command == "LOGINLIST") {
        std::string token;
        body.GetString("oauthToken", token);
        {
          std::lock_guard<std::mutex> lock(mutex_);
          last_token_ = token;
        }
        reply.Set("status", Value::Int32(options_.login_body_status));
        const bool ok = options_.login_header_status == 0 &&
                        options_.login_body_status == 0;
        if (ok) {
          reply.Set("userId", Value::Int64(options_.user_id));
          reply.Set("chatDatas", Value::Array({Value::Doc(Document())}));
        }
        Reply(stream, &crypto, request, reply, options_.login_header_status);
        if (!ok) {
          return;
        }
        for (const auto& push : options_.pushes) {
          Document note;
          note.Set("status", Value::Int32(0));
          Push(stream, &crypto, push, note, 0);
        }
      } else if (command == "PING") {
        reply.Set("status", Value::Int32(0));
        Reply(stream, &crypto, request, reply);
      } else if (command == "SLOW") {
        // Never answered; the client times out.
      } else if (command == "BYE") {
        // Drops the connection without a reply.
        return;
      } else if (command == "SHADOW") {
        // A push under the same command name lands before the real reply.
        Document note;
        note.Set("status", Value::Int32(0));
        note.Set("pushed", Value::Bool(true));
        Push(stream, &crypto, command, note, 0);
        reply.Set("status", Value::Int32(0));
        reply.Set("pushed", Value::Bool(false));
        Reply(stream, &crypto, request, reply);
      } else {
        reply = body;
        reply.Set("status", Value::Int32(0));
        Reply(stream, &crypto, request, reply);
      }
    }
  }

  void Handle(std::shared_ptr<ByteStream> stream, Endpoint endpoint) {
    if (endpoint.host == options_.booking_host) {
      HandleBooking(*stream);
    } else {
      HandleLegacy(*stream);
    }
    stream->Close();
  }

  StubOptions options_;
  TestKeyPair key_;
  mutable std::mutex mutex_;
  std::vector<std::thread> threads_;
  std::vector<std::string> connections_;
  std::vector<Security> securities_;
  std::vector<std::string> commands_;
  std::vector<std::uint32_t> key_types_;
  std::string last_token_;
};

// Transport that hands the server side of each connection to a StubServer.
class MemoryTransport final : public Transport {
 public:
  explicit MemoryTransport(StubServer& server) : server_(server) {}

  bool Connect(const Endpoint& endpoint, Security security,
               std::uint32_t timeout_ms, std::unique_ptr<ByteStream>& out,
               IoStatus& status, std::string& error) override {
    status = IoStatus::kError;
    if (endpoint.host == server_.options().unreachable_host) {
      error = "connection refused";
      return false;
    }
    if (endpoint.host == server_.options().silent_host) {
      status = IoStatus::kTimeout;
      error = "connect timed out";
      return false;
    }
    std::unique_ptr<ByteStream> client;
    std::unique_ptr<ByteStream> server;
    MakePipe(client, server);
    client->SetReadTimeout(timeout_ms);
    server_.Accept(std::move(server), endpoint, security);
    out = std::move(client);
    status = IoStatus::kOk;
    return true;
  }

 private:
  StubServer& server_;
};

}  // namespace loco::client::test

#endif  // LOCO_CLIENT_TESTS_LOCO_TEST_SERVER_H
