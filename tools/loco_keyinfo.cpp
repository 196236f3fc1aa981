#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "client_config.h"
#include "hex_utils.h"
#include "loco_crypto.h"
#include "loco_error.h"
#include "platform_log.h"

namespace {

struct Options {
  std::string config{"loco_client.ini"};
  std::string der_base64;
  std::string pem_path;
  bool handshake{false};
  bool show_help{false};
};

void PrintUsage() {
  std::cout
      << "Usage: loco_keyinfo [--config PATH | --key BASE64 | --pem PATH]"
         " [--handshake]\n"
         "  --config PATH   Read [handshake] from a client config "
         "(default: ./loco_client.ini)\n"
         "  --key BASE64    Base64 DER public key (PKCS#1 or SPKI)\n"
         "  --pem PATH      PEM public key file\n"
         "  --handshake     Build a throwaway handshake and print its layout\n";
}

bool ParseArgs(int argc, char** argv, Options& out, std::string& error) {
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      out.show_help = true;
      return true;
    }
    if (arg == "--handshake") {
      out.handshake = true;
      continue;
    }
    if (arg == "--config" || arg == "--key" || arg == "--pem") {
      if (i + 1 >= argc) {
        error = arg + " requires a value";
        return false;
      }
      const std::string value = argv[++i];
      if (arg == "--config") {
        out.config = value;
      } else if (arg == "--key") {
        out.der_base64 = value;
      } else {
        out.pem_path = value;
      }
      continue;
    }
    error = "unknown argument: " + arg;
    return false;
  }
  return true;
}

bool ResolveKey(const Options& opt, loco::client::PublicKeyMaterial& out,
                std::uint32_t& key_type, std::string& error) {
  key_type = loco::client::kDefaultHandshakeKeyType;
  if (!opt.der_base64.empty()) {
    out.der_base64 = opt.der_base64;
    return true;
  }
  if (!opt.pem_path.empty()) {
    out.pem_path = opt.pem_path;
    return true;
  }
  loco::client::ClientConfig cfg;
  if (!loco::client::LoadClientConfig(opt.config, cfg, error)) {
    return false;
  }
  loco::platform::log::SetMinLevel(cfg.log.level);
  out = cfg.handshake.public_key;
  key_type = cfg.handshake.key_type;
  return true;
}

}  // namespace

int main(int argc, char** argv) {
  Options opt;
  std::string error;
  if (!ParseArgs(argc, argv, opt, error)) {
    std::cerr << "[loco_keyinfo] " << error << "\n";
    PrintUsage();
    return 1;
  }
  if (opt.show_help) {
    PrintUsage();
    return 0;
  }

  loco::client::PublicKeyMaterial material;
  std::uint32_t key_type = 0;
  if (!ResolveKey(opt, material, key_type, error)) {
    std::cerr << "[loco_keyinfo] " << error << "\n";
    return 1;
  }
  loco::client::ServerPublicKey key;
  loco::client::Failure failure;
  if (!loco::client::LoadServerPublicKey(material, key, failure)) {
    std::cerr << "[loco_keyinfo] " << loco::client::DescribeFailure(failure)
              << "\n";
    return 1;
  }

  const std::string fingerprint = key.Fingerprint();
  std::cout << "modulus_bits=" << key.modulus_bytes() * 8 << "\n";
  std::cout << "spki_sha256=" << fingerprint << "\n";
  std::cout << "spki_sha256_short=" << loco::common::GroupHex4(
                                           fingerprint.substr(0, 20))
            << "\n";
  std::cout << "key_type=" << key_type << "\n";

  if (opt.handshake) {
    loco::client::CryptoContext ctx;
    std::vector<std::uint8_t> wrapped;
    std::vector<std::uint8_t> packet;
    if (!loco::client::CreateHandshake(key_type, ctx, failure) ||
        !loco::client::WrapForTransport(ctx, key, wrapped, failure)) {
      std::cerr << "[loco_keyinfo] " << loco::client::DescribeFailure(failure)
                << "\n";
      return 1;
    }
    if (!loco::client::BuildHandshakePacket(ctx, wrapped, packet)) {
      std::cerr << "[loco_keyinfo] handshake build failed\n";
      return 1;
    }
    std::cout << "handshake_bytes=" << packet.size() << "\n";
    std::cout << "handshake_prefix="
              << loco::common::BytesToHex(
                     packet.data(), loco::client::kHandshakePrefixBytes)
              << "\n";
    std::cout << "encrypt_type=" << loco::client::kEncryptTypeAesCfb128
              << "\n";
  }
  return 0;
}
