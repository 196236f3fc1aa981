#ifndef LOCO_CLIENT_SECURE_CHANNEL_H
#define LOCO_CLIENT_SECURE_CHANNEL_H

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>

#include "byte_stream.h"
#include "loco_crypto.h"
#include "loco_error.h"
#include "packet.h"

namespace loco::client {

// Packet I/O over one ByteStream. After SendHandshake every body is
// AES-CFB encrypted; headers stay in the clear.
class SecureChannel {
 public:
  explicit SecureChannel(std::unique_ptr<ByteStream> stream);
  ~SecureChannel();

  SecureChannel(const SecureChannel&) = delete;
  SecureChannel& operator=(const SecureChannel&) = delete;

  // Takes ownership of the context. A close before the first response
  // byte is then reported as kHandshakeRejected.
  bool SendHandshake(CryptoContext context, const ServerPublicKey& key,
                     Failure& error, const OaepSeed* seed = nullptr);

  bool Send(const Packet& packet, Failure& error);
  bool Receive(Packet& out, Failure& error);

  bool SetReadTimeout(std::uint32_t timeout_ms);
  // Safe from any thread; unblocks a pending Receive.
  void Shutdown();
  // Closes the stream and wipes the crypto context. Waits for an in-progress
  // Send; the reader must have stopped.
  void Close();

  bool encrypted() const { return crypto_ != nullptr; }
  bool open() const { return !closed_.load(); }

 private:
  std::unique_ptr<ByteStream> stream_;
  std::unique_ptr<CryptoContext> crypto_;
  std::mutex write_mutex_;
  std::atomic<bool> closed_{false};
  std::atomic<bool> awaiting_first_reply_{false};
};

}  // namespace loco::client

#endif  // LOCO_CLIENT_SECURE_CHANNEL_H
