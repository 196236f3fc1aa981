#ifndef LOCO_COMMON_HEX_UTILS_H
#define LOCO_COMMON_HEX_UTILS_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace loco::common {

std::string BytesToHex(const std::uint8_t* data, std::size_t len);
std::string Sha256Hex(const std::uint8_t* data, std::size_t len);
bool HexToBytes(std::string_view hex, std::vector<std::uint8_t>& out);
std::string GroupHex4(const std::string& hex);

// Standard alphabet with padding. Whitespace inside the input is ignored.
std::string Base64Encode(const std::uint8_t* data, std::size_t len);
bool Base64Decode(std::string_view text, std::vector<std::uint8_t>& out);

}  // namespace loco::common

#endif  // LOCO_COMMON_HEX_UTILS_H
