#include "hex_utils.h"

#include <openssl/evp.h>

#include <cctype>
#include <string_view>

namespace loco::common {

namespace {

int HexNibble(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return 10 + (c - 'a');
  }
  if (c >= 'A' && c <= 'F') {
    return 10 + (c - 'A');
  }
  return -1;
}

}  // namespace

std::string BytesToHex(const std::uint8_t* data, std::size_t len) {
  if (!data || len == 0) {
    return {};
  }
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[i * 2] = kHex[data[i] >> 4];
    out[i * 2 + 1] = kHex[data[i] & 0x0F];
  }
  return out;
}

std::string Sha256Hex(const std::uint8_t* data, std::size_t len) {
  if (!data || len == 0) {
    return {};
  }
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  if (EVP_Digest(data, len, digest, &digest_len, EVP_sha256(), nullptr) != 1) {
    return {};
  }
  return BytesToHex(digest, digest_len);
}

bool HexToBytes(std::string_view hex, std::vector<std::uint8_t>& out) {
  out.clear();
  if (hex.empty() || (hex.size() % 2) != 0) {
    return false;
  }
  out.reserve(hex.size() / 2);
  for (std::size_t i = 0; i < hex.size(); i += 2) {
    const int hi = HexNibble(hex[i]);
    const int lo = HexNibble(hex[i + 1]);
    if (hi < 0 || lo < 0) {
      out.clear();
      return false;
    }
    out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
  }
  return true;
}

std::string GroupHex4(const std::string& hex) {
  if (hex.empty()) {
    return {};
  }
  std::string out;
  out.reserve(hex.size() + (hex.size() / 4));
  for (std::size_t i = 0; i < hex.size(); ++i) {
    if (i != 0 && (i % 4) == 0) {
      out.push_back('-');
    }
    out.push_back(hex[i]);
  }
  return out;
}

std::string Base64Encode(const std::uint8_t* data, std::size_t len) {
  if (!data || len == 0) {
    return {};
  }
  std::string out;
  out.resize(4 * ((len + 2) / 3) + 1);
  const int written = EVP_EncodeBlock(
      reinterpret_cast<unsigned char*>(&out[0]), data, static_cast<int>(len));
  if (written < 0) {
    return {};
  }
  out.resize(static_cast<std::size_t>(written));
  return out;
}

bool Base64Decode(std::string_view text, std::vector<std::uint8_t>& out) {
  out.clear();
  std::string compact;
  compact.reserve(text.size());
  for (const char c : text) {
    if (std::isspace(static_cast<unsigned char>(c)) == 0) {
      compact.push_back(c);
    }
  }
  if (compact.empty() || (compact.size() % 4) != 0) {
    return false;
  }
  std::size_t padding = 0;
  if (compact[compact.size() - 1] == '=') {
    ++padding;
    if (compact[compact.size() - 2] == '=') {
      ++padding;
    }
  }
  out.resize((compact.size() / 4) * 3);
  const int written = EVP_DecodeBlock(
      out.data(), reinterpret_cast<const unsigned char*>(compact.data()),
      static_cast<int>(compact.size()));
  if (written < 0 || static_cast<std::size_t>(written) < padding) {
    out.clear();
    return false;
  }
  out.resize(static_cast<std::size_t>(written) - padding);
  return true;
}

}  // namespace loco::common
