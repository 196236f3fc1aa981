#ifndef LOCO_CLIENT_CLIENT_CONFIG_H
#define LOCO_CLIENT_CLIENT_CONFIG_H

#include <cstdint>
#include <string>

#include "loco_crypto.h"
#include "loco_error.h"
#include "platform_log.h"

namespace loco::client {

// Values the desktop client reports about itself in GETCONF, CHECKIN and
// LOGINLIST.
struct ClientIdentity {
  std::string os{"mac"};
  std::string app_version{"4.5.0"};
  std::string mccmnc{"99999"};
  std::string model;
  std::string language{"ko"};
  std::string country_iso{"KR"};
  std::string protocol_version{"1"};
  std::int32_t network_type{0};
  std::int32_t device_type{2};
  bool use_sub{true};
};

struct BookingConfig {
  std::string host{"booking-loco.kakao.com"};
  std::uint16_t port{443};
  std::uint32_t timeout_ms{10000};
  bool verify_peer{true};
  bool verify_hostname{true};
  std::string ca_bundle;
};

struct CheckinConfig {
  // Used when GETCONF carries no wifi.ports.
  std::uint16_t fallback_port{5223};
  std::uint32_t timeout_ms{10000};
};

struct LoginConfig {
  std::uint32_t timeout_ms{10000};
  std::uint32_t request_timeout_ms{10000};
  std::string contract{"loginlist-v1"};
  std::int32_t token_invalid_status{kStatusTokenExpired};
};

struct HandshakeConfig {
  // Changing this breaks interoperability without any error from the
  // server; it only exists for testing against other servers.
  std::uint32_t key_type{kDefaultHandshakeKeyType};
  PublicKeyMaterial public_key;
};

struct LogConfig {
  platform::log::Level level{platform::log::Level::kInfo};
};

struct ClientConfig {
  BookingConfig booking;
  CheckinConfig checkin;
  LoginConfig login;
  HandshakeConfig handshake;
  ClientIdentity identity;
  LogConfig log;
};

bool LoadClientConfig(const std::string& path, ClientConfig& out_cfg,
                      std::string& error);

}  // namespace loco::client

#endif  // LOCO_CLIENT_CLIENT_CONFIG_H
