#include "secure_channel.h"

#include <utility>
#include <vector>

#include "platform_log.h"

namespace loco::client {

namespace plog = platform::log;

SecureChannel::SecureChannel(std::unique_ptr<ByteStream> stream)
    : stream_(std::move(stream)) {
  if (!stream_) {
    closed_.store(true);
  }
}

SecureChannel::~SecureChannel() {
  Close();
}

bool SecureChannel::SendHandshake(CryptoContext context,
                                  const ServerPublicKey& key, Failure& error,
                                  const OaepSeed* seed) {
  if (closed_.load()) {
    error = MakeFailure(ErrorKind::kConnectionClosed, "channel closed");
    return false;
  }
  if (crypto_) {
    error = MakeFailure(ErrorKind::kInvalidState, "handshake already sent");
    return false;
  }
  std::vector<std::uint8_t> wrapped;
  if (!WrapForTransport(context, key, wrapped, error, seed)) {
    return false;
  }
  std::vector<std::uint8_t> handshake;
  if (!BuildHandshakePacket(context, wrapped, handshake)) {
    error = MakeFailure(ErrorKind::kKeyFormat, "handshake build failed");
    return false;
  }
  plog::Log(plog::Level::kDebug, "channel", "sending handshake",
            {{"key_type", std::to_string(context.key_type())},
             {"wrapped_bytes", std::to_string(wrapped.size())}});
  {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (closed_.load()) {
      error = MakeFailure(ErrorKind::kConnectionClosed, "channel closed");
      return false;
    }
    const IoStatus st = stream_->WriteAll(handshake.data(), handshake.size());
    if (st != IoStatus::kOk) {
      error = MakeFailure(ErrorKindFromIo(st), "handshake write failed");
      return false;
    }
    crypto_ = std::make_unique<CryptoContext>(std::move(context));
  }
  awaiting_first_reply_.store(true);
  return true;
}

bool SecureChannel::Send(const Packet& packet, Failure& error) {
  std::lock_guard<std::mutex> lock(write_mutex_);
  if (closed_.load()) {
    error = MakeFailure(ErrorKind::kConnectionClosed, "channel closed");
    return false;
  }
  ErrorKind kind = ErrorKind::kNone;
  if (!crypto_) {
    if (!WritePacket(*stream_, packet, kind)) {
      error = MakeFailure(kind, "packet write failed");
      return false;
    }
    return true;
  }
  Packet sealed;
  sealed.header = packet.header;
  sealed.header.body_type =
      static_cast<std::uint8_t>(packet.header.body_type | kBodyEncryptedFlag);
  if (!EncryptBody(*crypto_, packet.body, sealed.body)) {
    error = MakeFailure(ErrorKind::kTransport, "body encrypt failed");
    return false;
  }
  sealed.header.body_length = static_cast<std::uint32_t>(sealed.body.size());
  if (!WritePacket(*stream_, sealed, kind)) {
    if (awaiting_first_reply_.load() && kind == ErrorKind::kConnectionClosed) {
      error = MakeFailure(ErrorKind::kHandshakeRejected,
                          "server closed the connection after the handshake");
      return false;
    }
    error = MakeFailure(kind, "packet write failed");
    return false;
  }
  return true;
}

bool SecureChannel::Receive(Packet& out, Failure& error) {
  if (closed_.load()) {
    error = MakeFailure(ErrorKind::kConnectionClosed, "channel closed");
    return false;
  }
  ErrorKind kind = ErrorKind::kNone;
  Packet packet;
  if (!ReadPacket(*stream_, packet, kind)) {
    if (awaiting_first_reply_.load() &&
        kind == ErrorKind::kConnectionClosed) {
      error = MakeFailure(ErrorKind::kHandshakeRejected,
                          "server closed the connection after the handshake");
      return false;
    }
    error = MakeFailure(kind, "packet read failed");
    return false;
  }
  awaiting_first_reply_.store(false);
  if (packet.IsEncrypted()) {
    if (!crypto_) {
      error = MakeFailure(ErrorKind::kMalformedResponse,
                          "encrypted body without a handshake");
      return false;
    }
    std::vector<std::uint8_t> plain;
    if (!DecryptBody(*crypto_, packet.body, plain)) {
      error = MakeFailure(ErrorKind::kMalformedResponse, "body decrypt failed");
      return false;
    }
    packet.body = std::move(plain);
    packet.header.body_type =
        static_cast<std::uint8_t>(packet.header.body_type & kBodyEncodingMask);
    packet.header.body_length = static_cast<std::uint32_t>(packet.body.size());
  }
  out = std::move(packet);
  return true;
}

bool SecureChannel::SetReadTimeout(std::uint32_t timeout_ms) {
  return !closed_.load() && stream_->SetReadTimeout(timeout_ms);
}

void SecureChannel::Shutdown() {
  if (stream_) {
    stream_->Shutdown();
  }
}

void SecureChannel::Close() {
  std::lock_guard<std::mutex> lock(write_mutex_);
  if (closed_.exchange(true)) {
    return;
  }
  stream_->Close();
  if (crypto_) {
    crypto_->Wipe();
    crypto_.reset();
  }
  awaiting_first_reply_.store(false);
}

}  // namespace loco::client
