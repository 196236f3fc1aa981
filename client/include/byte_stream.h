#ifndef LOCO_CLIENT_BYTE_STREAM_H
#define LOCO_CLIENT_BYTE_STREAM_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "platform_net.h"

namespace loco::client {

using platform::net::IoStatus;

// Duplex byte stream handed out by a Transport. One reader and one writer
// may use it concurrently; Shutdown may be called from any thread.
class ByteStream {
 public:
  virtual ~ByteStream() = default;

  // Blocks until at least one byte arrives. out_read is 0 unless kOk.
  virtual IoStatus ReadSome(std::uint8_t* data, std::size_t len,
                            std::size_t& out_read) = 0;
  virtual IoStatus WriteAll(const std::uint8_t* data, std::size_t len) = 0;
  // Zero disables the read timeout.
  virtual bool SetReadTimeout(std::uint32_t timeout_ms) = 0;
  // Unblocks pending reads; the stream stays allocated until Close.
  virtual void Shutdown() = 0;
  virtual void Close() = 0;
};

enum class Security : std::uint8_t { kPlain = 0, kTls = 1 };

struct Endpoint {
  std::string host;
  std::uint16_t port{0};
};

class Transport {
 public:
  virtual ~Transport() = default;

  // On failure status tells a missed deadline (kTimeout) from any other
  // error.
  virtual bool Connect(const Endpoint& endpoint, Security security,
                       std::uint32_t timeout_ms,
                       std::unique_ptr<ByteStream>& out, IoStatus& status,
                       std::string& error) = 0;
};

}  // namespace loco::client

#endif  // LOCO_CLIENT_BYTE_STREAM_H
