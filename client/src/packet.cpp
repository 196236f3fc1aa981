#include "packet.h"

#include <cstring>

namespace loco::client {

namespace {

constexpr std::size_t kCommandOffset = 6;
constexpr std::size_t kBodyTypeOffset = 17;
constexpr std::size_t kBodyLengthOffset = 18;

std::uint16_t ReadUint16Le(const std::uint8_t* p) {
  return static_cast<std::uint16_t>(static_cast<std::uint16_t>(p[0]) |
                                    (static_cast<std::uint16_t>(p[1]) << 8));
}

std::uint32_t ReadUint32Le(const std::uint8_t* p) {
  return static_cast<std::uint32_t>(static_cast<std::uint32_t>(p[0]) |
                                    (static_cast<std::uint32_t>(p[1]) << 8) |
                                    (static_cast<std::uint32_t>(p[2]) << 16) |
                                    (static_cast<std::uint32_t>(p[3]) << 24));
}

void WriteUint16Le(std::uint16_t v, std::uint8_t* out) {
  out[0] = static_cast<std::uint8_t>(v & 0xFF);
  out[1] = static_cast<std::uint8_t>((v >> 8) & 0xFF);
}

void WriteUint32Le(std::uint32_t v, std::uint8_t* out) {
  out[0] = static_cast<std::uint8_t>(v & 0xFF);
  out[1] = static_cast<std::uint8_t>((v >> 8) & 0xFF);
  out[2] = static_cast<std::uint8_t>((v >> 16) & 0xFF);
  out[3] = static_cast<std::uint8_t>((v >> 24) & 0xFF);
}

bool IsValidCommand(const std::string& command) {
  if (command.size() > kCommandFieldSize) {
    return false;
  }
  for (const char c : command) {
    if (c < 0x20 || c > 0x7E) {
      return false;
    }
  }
  return true;
}

// Reads exactly len bytes. got reports how many arrived before a failure.
IoStatus ReadExact(ByteStream& stream, std::uint8_t* data, std::size_t len,
                   std::size_t& got) {
  got = 0;
  while (got < len) {
    std::size_t n = 0;
    const IoStatus st = stream.ReadSome(data + got, len - got, n);
    if (st != IoStatus::kOk) {
      return st;
    }
    got += n;
  }
  return IoStatus::kOk;
}

}  // namespace

bool EncodePacketHeader(const PacketHeader& header, HeaderBytes& out) {
  if (!IsValidCommand(header.command)) {
    return false;
  }
  out.fill(0);
  WriteUint32Le(header.packet_id, out.data());
  WriteUint16Le(static_cast<std::uint16_t>(header.status_code),
                out.data() + 4);
  if (!header.command.empty()) {
    std::memcpy(out.data() + kCommandOffset, header.command.data(),
                header.command.size());
  }
  out[kBodyTypeOffset] = header.body_type;
  WriteUint32Le(header.body_length, out.data() + kBodyLengthOffset);
  return true;
}

bool DecodePacketHeader(const std::uint8_t* data, std::size_t len,
                        PacketHeader& out, ErrorKind& error) {
  error = ErrorKind::kNone;
  if (!data || len < kPacketHeaderSize) {
    error = ErrorKind::kTruncatedInput;
    return false;
  }
  const std::uint32_t body_length = ReadUint32Le(data + kBodyLengthOffset);
  if (body_length > kMaxBodyBytes) {
    error = ErrorKind::kMalformedHeader;
    return false;
  }
  out.packet_id = ReadUint32Le(data);
  out.status_code = static_cast<std::int16_t>(ReadUint16Le(data + 4));
  const char* cmd = reinterpret_cast<const char*>(data + kCommandOffset);
  std::size_t cmd_len = 0;
  while (cmd_len < kCommandFieldSize && cmd[cmd_len] != '\0') {
    ++cmd_len;
  }
  out.command.assign(cmd, cmd_len);
  out.body_type = data[kBodyTypeOffset];
  out.body_length = body_length;
  return true;
}

bool MakeDocumentPacket(std::uint32_t packet_id, const std::string& command,
                        const Document& body, Packet& out) {
  if (!IsValidCommand(command)) {
    return false;
  }
  std::vector<std::uint8_t> encoded;
  if (!EncodeDocument(body, encoded) || encoded.size() > kMaxBodyBytes) {
    return false;
  }
  out.header = PacketHeader{};
  out.header.packet_id = packet_id;
  out.header.command = command;
  out.header.body_type = kBodyTypeDocument;
  out.header.body_length = static_cast<std::uint32_t>(encoded.size());
  out.body = std::move(encoded);
  return true;
}

bool DecodeBodyDocument(const Packet& packet, Document& out,
                        CodecError& error) {
  out.Clear();
  error = CodecError::kNone;
  if (!packet.IsDocument() || packet.IsEncrypted()) {
    error = CodecError::kMalformed;
    return false;
  }
  if (packet.body.empty()) {
    return true;
  }
  std::size_t consumed = 0;
  if (!DecodeDocument(packet.body.data(), packet.body.size(), out, consumed,
                      error)) {
    return false;
  }
  if (consumed != packet.body.size()) {
    out.Clear();
    error = CodecError::kMalformed;
    return false;
  }
  return true;
}

ErrorKind ErrorKindFromIo(IoStatus status) {
  switch (status) {
    case IoStatus::kOk:
      return ErrorKind::kNone;
    case IoStatus::kClosed:
      return ErrorKind::kConnectionClosed;
    case IoStatus::kTimeout:
      return ErrorKind::kTimeout;
    case IoStatus::kError:
      return ErrorKind::kTransport;
  }
  return ErrorKind::kTransport;
}

bool ReadPacket(ByteStream& stream, Packet& out, ErrorKind& error) {
  error = ErrorKind::kNone;
  HeaderBytes header{};
  std::size_t got = 0;
  IoStatus st = ReadExact(stream, header.data(), header.size(), got);
  if (st != IoStatus::kOk) {
    error = (st == IoStatus::kClosed && got > 0) ? ErrorKind::kTruncatedInput
                                                 : ErrorKindFromIo(st);
    return false;
  }
  PacketHeader decoded;
  if (!DecodePacketHeader(header.data(), header.size(), decoded, error)) {
    return false;
  }
  std::vector<std::uint8_t> body(decoded.body_length);
  if (!body.empty()) {
    st = ReadExact(stream, body.data(), body.size(), got);
    if (st != IoStatus::kOk) {
      error = st == IoStatus::kClosed ? ErrorKind::kTruncatedInput
                                      : ErrorKindFromIo(st);
      return false;
    }
  }
  out.header = std::move(decoded);
  out.body = std::move(body);
  return true;
}

bool WritePacket(ByteStream& stream, const Packet& packet, ErrorKind& error) {
  error = ErrorKind::kNone;
  if (packet.body.size() > kMaxBodyBytes) {
    error = ErrorKind::kMalformedHeader;
    return false;
  }
  PacketHeader header = packet.header;
  header.body_length = static_cast<std::uint32_t>(packet.body.size());
  HeaderBytes encoded{};
  if (!EncodePacketHeader(header, encoded)) {
    error = ErrorKind::kMalformedHeader;
    return false;
  }
  std::vector<std::uint8_t> wire;
  wire.reserve(encoded.size() + packet.body.size());
  wire.insert(wire.end(), encoded.begin(), encoded.end());
  wire.insert(wire.end(), packet.body.begin(), packet.body.end());
  const IoStatus st = stream.WriteAll(wire.data(), wire.size());
  if (st != IoStatus::kOk) {
    error = ErrorKindFromIo(st);
    return false;
  }
  return true;
}

}  // namespace loco::client
