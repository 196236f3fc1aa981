#ifndef LOCO_CLIENT_PACKET_H
#define LOCO_CLIENT_PACKET_H

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "byte_stream.h"
#include "document.h"
#include "document_codec.h"
#include "loco_error.h"

namespace loco::client {

constexpr std::size_t kPacketHeaderSize = 22;
constexpr std::size_t kCommandFieldSize = 11;
constexpr std::uint32_t kMaxBodyBytes = 32u * 1024u * 1024u;

constexpr std::uint8_t kBodyTypeDocument = 0x00;
constexpr std::uint8_t kBodyEncryptedFlag = 0x80;
constexpr std::uint8_t kBodyEncodingMask = 0x7F;

struct PacketHeader {
  std::uint32_t packet_id{0};
  std::int16_t status_code{0};
  std::string command;
  std::uint8_t body_type{kBodyTypeDocument};
  std::uint32_t body_length{0};

  bool operator==(const PacketHeader& other) const {
    return packet_id == other.packet_id && status_code == other.status_code &&
           command == other.command && body_type == other.body_type &&
           body_length == other.body_length;
  }
};

struct Packet {
  PacketHeader header;
  std::vector<std::uint8_t> body;

  bool IsEncrypted() const {
    return (header.body_type & kBodyEncryptedFlag) != 0;
  }
  bool IsDocument() const {
    return (header.body_type & kBodyEncodingMask) == kBodyTypeDocument;
  }
};

using HeaderBytes = std::array<std::uint8_t, kPacketHeaderSize>;

// Rejects commands longer than 11 characters or outside printable ASCII.
bool EncodePacketHeader(const PacketHeader& header, HeaderBytes& out);
// kMalformedHeader only when body_length exceeds kMaxBodyBytes.
bool DecodePacketHeader(const std::uint8_t* data, std::size_t len,
                        PacketHeader& out, ErrorKind& error);

// Document body with body_length taken from the encoded size.
bool MakeDocumentPacket(std::uint32_t packet_id, const std::string& command,
                        const Document& body, Packet& out);
// An empty body yields an empty document.
bool DecodeBodyDocument(const Packet& packet, Document& out,
                        CodecError& error);

bool ReadPacket(ByteStream& stream, Packet& out, ErrorKind& error);
// Writes header and body in one call; body_length is taken from the body.
bool WritePacket(ByteStream& stream, const Packet& packet, ErrorKind& error);

ErrorKind ErrorKindFromIo(IoStatus status);

class PacketIdCounter {
 public:
  PacketIdCounter() = default;
  explicit PacketIdCounter(std::uint32_t first) : next_(first) {}

  std::uint32_t Next() { return next_.fetch_add(1); }
  std::uint32_t Peek() const { return next_.load(); }

 private:
  std::atomic<std::uint32_t> next_{1};
};

}  // namespace loco::client

#endif  // LOCO_CLIENT_PACKET_H
