#ifndef LOCO_PLATFORM_TLS_H
#define LOCO_PLATFORM_TLS_H

#include <cstddef>
#include <cstdint>
#include <string>

#include "platform_net.h"

namespace loco::platform::tls {

struct ClientVerifyConfig {
  bool verify_peer{true};
  bool verify_hostname{true};
  // File or directory; empty uses the system trust store.
  std::string ca_bundle_path;
};

// Owned by the caller; released with Close. The socket stays owned by the
// caller as well.
struct ClientContext {
  void* impl{nullptr};
};

bool ClientHandshake(net::Socket sock, const std::string& host,
                     const ClientVerifyConfig& verify,
                     ClientContext& ctx,
                     net::IoStatus& status,
                     std::string& error);
net::IoStatus Write(ClientContext& ctx, const std::uint8_t* data,
                    std::size_t len);
net::IoStatus Read(ClientContext& ctx, std::uint8_t* data, std::size_t len,
                   std::size_t& out_read);
void Close(ClientContext& ctx);

}  // namespace loco::platform::tls

#endif  // LOCO_PLATFORM_TLS_H
