#include "client_config.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <string>

#include "login_contract.h"

namespace loco::client {

namespace {

constexpr std::uint32_t kMaxTimeoutMs = 600000;

std::string Trim(const std::string& s) {
  const auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
  auto b = std::find_if_not(s.begin(), s.end(), is_space);
  auto e = std::find_if_not(s.rbegin(), s.rend(), is_space).base();
  if (b >= e) return {};
  return std::string(b, e);
}

std::string StripInlineComment(const std::string& input) {
  for (std::size_t i = 0; i < input.size(); ++i) {
    const char ch = input[i];
    if ((ch == '#' || ch == ';') &&
        (i == 0 ||
         std::isspace(static_cast<unsigned char>(input[i - 1])) != 0)) {
      return Trim(input.substr(0, i));
    }
  }
  return input;
}

bool ParseUint16(const std::string& text, std::uint16_t& out) {
  if (text.empty()) return false;
  char* end_ptr = nullptr;
  const long v = std::strtol(text.c_str(), &end_ptr, 10);
  if (end_ptr == text.c_str() || *end_ptr != '\0' || v < 0 || v > 65535) {
    return false;
  }
  out = static_cast<std::uint16_t>(v);
  return true;
}

bool ParseUint32(const std::string& text, std::uint32_t& out) {
  if (text.empty() || text.front() == '-') return false;
  char* end_ptr = nullptr;
  errno = 0;
  const unsigned long long v = std::strtoull(text.c_str(), &end_ptr, 10);
  if (end_ptr == text.c_str() || *end_ptr != '\0' || errno == ERANGE ||
      v > 0xFFFFFFFFull) {
    return false;
  }
  out = static_cast<std::uint32_t>(v);
  return true;
}

bool ParseInt32(const std::string& text, std::int32_t& out) {
  if (text.empty()) return false;
  char* end_ptr = nullptr;
  errno = 0;
  const long long v = std::strtoll(text.c_str(), &end_ptr, 10);
  if (end_ptr == text.c_str() || *end_ptr != '\0' || errno == ERANGE ||
      v < -2147483648LL || v > 2147483647LL) {
    return false;
  }
  out = static_cast<std::int32_t>(v);
  return true;
}

std::string ToLower(std::string s) {
  for (auto& ch : s) {
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  }
  return s;
}

bool ParseBool(const std::string& text, bool& out) {
  const std::string t = ToLower(text);
  if (t == "1" || t == "true" || t == "on" || t == "yes") {
    out = true;
    return true;
  }
  if (t == "0" || t == "false" || t == "off" || t == "no") {
    out = false;
    return true;
  }
  return false;
}

bool ParseTimeout(const std::string& text, std::uint32_t& out) {
  std::uint32_t v = 0;
  if (!ParseUint32(text, v) || v == 0 || v > kMaxTimeoutMs) {
    return false;
  }
  out = v;
  return true;
}

// Returns false for a recognised key with a bad value; unknown keys are
// ignored.
bool ApplyKey(const std::string& section, const std::string& key,
              const std::string& val, ClientConfig& cfg) {
  if (section == "booking") {
    if (key == "host") {
      cfg.booking.host = val;
    } else if (key == "port") {
      return ParseUint16(val, cfg.booking.port);
    } else if (key == "timeout_ms") {
      return ParseTimeout(val, cfg.booking.timeout_ms);
    } else if (key == "verify_peer") {
      return ParseBool(val, cfg.booking.verify_peer);
    } else if (key == "verify_hostname") {
      return ParseBool(val, cfg.booking.verify_hostname);
    } else if (key == "ca_bundle") {
      cfg.booking.ca_bundle = val;
    }
  } else if (section == "checkin") {
    if (key == "fallback_port") {
      return ParseUint16(val, cfg.checkin.fallback_port);
    } else if (key == "timeout_ms") {
      return ParseTimeout(val, cfg.checkin.timeout_ms);
    }
  } else if (section == "login") {
    if (key == "timeout_ms") {
      return ParseTimeout(val, cfg.login.timeout_ms);
    } else if (key == "request_timeout_ms") {
      return ParseTimeout(val, cfg.login.request_timeout_ms);
    } else if (key == "contract") {
      cfg.login.contract = ToLower(val);
    } else if (key == "token_invalid_status") {
      return ParseInt32(val, cfg.login.token_invalid_status);
    }
  } else if (section == "handshake") {
    if (key == "key_type") {
      return ParseUint32(val, cfg.handshake.key_type);
    } else if (key == "public_key") {
      cfg.handshake.public_key.der_base64 = val;
    } else if (key == "public_key_pem") {
      cfg.handshake.public_key.pem_path = val;
    } else if (key == "modulus_hex") {
      cfg.handshake.public_key.modulus_hex = val;
    } else if (key == "exponent") {
      return ParseUint32(val, cfg.handshake.public_key.exponent);
    }
  } else if (section == "client") {
    if (key == "os") {
      cfg.identity.os = val;
    } else if (key == "app_version") {
      cfg.identity.app_version = val;
    } else if (key == "mccmnc") {
      cfg.identity.mccmnc = val;
    } else if (key == "model") {
      cfg.identity.model = val;
    } else if (key == "language") {
      cfg.identity.language = val;
    } else if (key == "country_iso") {
      cfg.identity.country_iso = val;
    } else if (key == "protocol_version") {
      cfg.identity.protocol_version = val;
    } else if (key == "network_type") {
      return ParseInt32(val, cfg.identity.network_type);
    } else if (key == "device_type") {
      return ParseInt32(val, cfg.identity.device_type);
    } else if (key == "use_sub") {
      return ParseBool(val, cfg.identity.use_sub);
    }
  } else if (section == "log") {
    if (key == "level") {
      return platform::log::ParseLevel(val, cfg.log.level);
    }
  }
  return true;
}

}  // namespace

bool LoadClientConfig(const std::string& path, ClientConfig& out_cfg,
                      std::string& error) {
  out_cfg = ClientConfig{};
  std::ifstream f(path);
  if (!f.is_open()) {
    error = "client_config not found: " + path;
    return false;
  }
  std::string section;
  std::string line;
  std::size_t line_no = 0;
  while (std::getline(f, line)) {
    ++line_no;
    std::string t = StripInlineComment(Trim(line));
    if (t.empty()) continue;
    if (t.front() == '[' && t.back() == ']') {
      section = ToLower(Trim(t.substr(1, t.size() - 2)));
      continue;
    }
    const auto pos = t.find('=');
    if (pos == std::string::npos) {
      error = "invalid line " + std::to_string(line_no);
      return false;
    }
    const std::string key = Trim(t.substr(0, pos));
    const std::string val = StripInlineComment(Trim(t.substr(pos + 1)));
    if (!ApplyKey(section, key, val, out_cfg)) {
      error = "invalid " + key + " at line " + std::to_string(line_no);
      return false;
    }
  }

  if (out_cfg.booking.host.empty()) {
    error = "booking host missing";
    return false;
  }
  if (out_cfg.booking.port == 0) {
    error = "booking port missing";
    return false;
  }
  if (out_cfg.checkin.fallback_port == 0) {
    error = "checkin fallback_port missing";
    return false;
  }
  if (out_cfg.login.contract.empty()) {
    error = "login contract missing";
    return false;
  }
  if (!MakeLoginContract(out_cfg.login.contract)) {
    error = "unknown login contract: " + out_cfg.login.contract;
    return false;
  }
  const PublicKeyMaterial& key = out_cfg.handshake.public_key;
  if (key.der_base64.empty() && key.pem_path.empty() &&
      key.modulus_hex.empty()) {
    error = "handshake public key missing";
    return false;
  }
  if (!key.modulus_hex.empty() && key.der_base64.empty() &&
      key.pem_path.empty() && key.exponent == 0) {
    error = "handshake exponent missing";
    return false;
  }
  if (!out_cfg.booking.verify_peer && out_cfg.booking.verify_hostname) {
    out_cfg.booking.verify_hostname = false;
  }
  return true;
}

}  // namespace loco::client
