#ifndef LOCO_CLIENT_SOCKET_TRANSPORT_H
#define LOCO_CLIENT_SOCKET_TRANSPORT_H

#include <cstdint>
#include <memory>
#include <string>
#include <utility>

#include "byte_stream.h"
#include "client_config.h"
#include "platform_tls.h"

namespace loco::client {

// Peer verification for the Booking TLS connection.
platform::tls::ClientVerifyConfig VerifyConfigFor(const BookingConfig& booking);

// TCP sockets, with OpenSSL TLS for Security::kTls.
class SocketTransport final : public Transport {
 public:
  SocketTransport() = default;
  explicit SocketTransport(platform::tls::ClientVerifyConfig verify)
      : verify_(std::move(verify)) {}

  bool Connect(const Endpoint& endpoint, Security security,
               std::uint32_t timeout_ms, std::unique_ptr<ByteStream>& out,
               IoStatus& status, std::string& error) override;

 private:
  platform::tls::ClientVerifyConfig verify_;
};

}  // namespace loco::client

#endif  // LOCO_CLIENT_SOCKET_TRANSPORT_H
