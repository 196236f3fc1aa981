#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>

#include "client_config.h"

using loco::client::ClientConfig;
using loco::client::LoadClientConfig;

namespace {

constexpr char kKeyLine[] =
    "public_key=MIIBCAKCAQEAo7B26MRFhR8ZpnDCMarG20Lv0JcX0GBIpcxWkGzRqye53z\n";

std::filesystem::path MakeTempDir(const std::string& name_prefix) {
  std::error_code ec;
  auto base = std::filesystem::temp_directory_path(ec);
  if (base.empty()) {
    base = std::filesystem::current_path(ec);
  }
  if (base.empty()) {
    base = std::filesystem::path{"."};
  }
  std::filesystem::path dir = base / name_prefix;
  std::filesystem::remove_all(dir, ec);
  std::filesystem::create_directories(dir, ec);
  return dir;
}

void WriteFile(const std::filesystem::path& path, const std::string& text) {
  std::ofstream out(path);
  out << text;
  out.close();
}

}  // namespace

int main() {
  const auto dir = MakeTempDir("loco_client_config_test");
  const auto path = dir / "loco_client.ini";

  {
    WriteFile(path, std::string("[handshake]\n") + kKeyLine);
    ClientConfig cfg;
    std::string err;
    assert(LoadClientConfig(path.string(), cfg, err));
    assert(cfg.booking.host == "booking-loco.kakao.com");
    assert(cfg.booking.port == 443);
    assert(cfg.booking.verify_peer);
    assert(cfg.checkin.fallback_port == 5223);
    assert(cfg.login.contract == "loginlist-v1");
    assert(cfg.login.token_invalid_status == -950);
    assert(cfg.handshake.key_type == 16);
    assert(cfg.handshake.public_key.der_base64 ==
           "MIIBCAKCAQEAo7B26MRFhR8ZpnDCMarG20Lv0JcX0GBIpcxWkGzRqye53z");
    assert(cfg.identity.os == "mac");
    assert(cfg.identity.use_sub);
    assert(cfg.log.level == loco::platform::log::Level::kInfo);
  }

  {
    WriteFile(path,
              "# full file\n"
              "[booking]\n"
              "host = booking.example.test   ; staging\n"
              "port = 8443\n"
              "timeout_ms = 2500\n"
              "verify_peer = off\n"
              "ca_bundle = /etc/ssl/certs/ca.pem\n"
              "[checkin]\n"
              "fallback_port = 995\n"
              "[login]\n"
              "request_timeout_ms = 1500\n"
              "contract = LOGINLIST\n"
              "token_invalid_status = -999\n"
              "[handshake]\n"
              "key_type = 15\n"
              "modulus_hex = C0FFEE\n"
              "exponent = 3\n"
              "[client]\n"
              "os = win32\n"
              "app_version = 3.2.1\n"
              "model = test-rig\n"
              "network_type = -1\n"
              "use_sub = no\n"
              "unknown_key = ignored\n"
              "[log]\n"
              "level = debug\n");
    ClientConfig cfg;
    std::string err;
    assert(LoadClientConfig(path.string(), cfg, err));
    assert(cfg.booking.host == "booking.example.test");
    assert(cfg.booking.port == 8443);
    assert(cfg.booking.timeout_ms == 2500);
    assert(!cfg.booking.verify_peer);
    assert(!cfg.booking.verify_hostname);
    assert(cfg.booking.ca_bundle == "/etc/ssl/certs/ca.pem");
    assert(cfg.checkin.fallback_port == 995);
    assert(cfg.login.request_timeout_ms == 1500);
    assert(cfg.login.contract == "loginlist");
    assert(cfg.login.token_invalid_status == -999);
    assert(cfg.handshake.key_type == 15);
    assert(cfg.handshake.public_key.der_base64.empty());
    assert(cfg.handshake.public_key.modulus_hex == "C0FFEE");
    assert(cfg.handshake.public_key.exponent == 3);
    assert(cfg.identity.os == "win32");
    assert(cfg.identity.app_version == "3.2.1");
    assert(cfg.identity.model == "test-rig");
    assert(cfg.identity.network_type == -1);
    assert(!cfg.identity.use_sub);
    assert(cfg.log.level == loco::platform::log::Level::kDebug);
  }

  {
    ClientConfig cfg;
    std::string err;
    assert(!LoadClientConfig((dir / "missing.ini").string(), cfg, err));
    assert(err.find("not found") != std::string::npos);
  }

  {
    WriteFile(path, "[booking]\nport = 70000\n");
    ClientConfig cfg;
    std::string err;
    assert(!LoadClientConfig(path.string(), cfg, err));
    assert(err == "invalid port at line 2");
  }

  {
    WriteFile(path, "[login]\ntimeout_ms = 0\n");
    ClientConfig cfg;
    std::string err;
    assert(!LoadClientConfig(path.string(), cfg, err));
    assert(err == "invalid timeout_ms at line 2");
  }

  {
    WriteFile(path, "[booking]\njust some words\n");
    ClientConfig cfg;
    std::string err;
    assert(!LoadClientConfig(path.string(), cfg, err));
    assert(err == "invalid line 2");
  }

  {
    WriteFile(path, "[log]\nlevel = chatty\n");
    ClientConfig cfg;
    std::string err;
    assert(!LoadClientConfig(path.string(), cfg, err));
    assert(err == "invalid level at line 2");
  }

  {
    WriteFile(path, "[booking]\nhost = booking.example.test\n");
    ClientConfig cfg;
    std::string err;
    assert(!LoadClientConfig(path.string(), cfg, err));
    assert(err == "handshake public key missing");
  }

  {
    WriteFile(path, "[handshake]\nmodulus_hex = C0FFEE\n");
    ClientConfig cfg;
    std::string err;
    assert(!LoadClientConfig(path.string(), cfg, err));
    assert(err == "handshake exponent missing");
  }

  {
    WriteFile(path, std::string("[booking]\nhost =\n[handshake]\n") + kKeyLine);
    ClientConfig cfg;
    std::string err;
    assert(!LoadClientConfig(path.string(), cfg, err));
    assert(err == "booking host missing");
  }

  {
    WriteFile(path,
              std::string("[login]\ncontract = loginlist-v9\n[handshake]\n") +
                  kKeyLine);
    ClientConfig cfg;
    std::string err;
    assert(!LoadClientConfig(path.string(), cfg, err));
    assert(err.find("unknown login contract") != std::string::npos);
  }

  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
  return 0;
}
