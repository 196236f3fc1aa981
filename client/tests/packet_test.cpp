#include <cassert>
#include <cstdint>
#include <string>
#include <vector>

#include "document.h"
#include "loco_test_server.h"
#include "packet.h"

using loco::client::CodecError;
using loco::client::DecodeBodyDocument;
using loco::client::DecodePacketHeader;
using loco::client::Document;
using loco::client::EncodePacketHeader;
using loco::client::ErrorKind;
using loco::client::HeaderBytes;
using loco::client::IoStatus;
using loco::client::kBodyEncryptedFlag;
using loco::client::kMaxBodyBytes;
using loco::client::kPacketHeaderSize;
using loco::client::MakeDocumentPacket;
using loco::client::Packet;
using loco::client::PacketHeader;
using loco::client::PacketIdCounter;
using loco::client::ReadPacket;
using loco::client::Value;
using loco::client::WritePacket;
using loco::client::test::ScriptedStream;

namespace {

std::vector<std::uint8_t> Wire(const Packet& packet) {
  ScriptedStream sink({});
  ErrorKind err = ErrorKind::kNone;
  const bool ok = WritePacket(sink, packet, err);
  assert(ok);
  assert(err == ErrorKind::kNone);
  return sink.written;
}

}  // namespace

int main() {
  {
    PacketHeader header;
    header.packet_id = 0x01020304;
    header.status_code = -950;
    header.command = "LOGINLIST";
    header.body_type = 0;
    header.body_length = 0x1234;
    HeaderBytes bytes{};
    assert(EncodePacketHeader(header, bytes));
    assert(bytes.size() == kPacketHeaderSize);
    assert(bytes[0] == 0x04 && bytes[3] == 0x01);
    // -950 as little-endian two's complement.
    assert(bytes[4] == 0x4A && bytes[5] == 0xFC);
    assert(bytes[6] == 'L' && bytes[14] == 'T');
    assert(bytes[15] == 0 && bytes[16] == 0);
    assert(bytes[17] == 0);
    assert(bytes[18] == 0x34 && bytes[19] == 0x12 && bytes[20] == 0 &&
           bytes[21] == 0);

    PacketHeader parsed;
    ErrorKind err = ErrorKind::kNone;
    assert(DecodePacketHeader(bytes.data(), bytes.size(), parsed, err));
    assert(parsed == header);
  }

  {
    PacketHeader header;
    header.command = "ELEVENCHARS";
    HeaderBytes bytes{};
    assert(EncodePacketHeader(header, bytes));
    PacketHeader parsed;
    ErrorKind err = ErrorKind::kNone;
    assert(DecodePacketHeader(bytes.data(), bytes.size(), parsed, err));
    assert(parsed.command == "ELEVENCHARS");

    header.command = "TWELVE_CHARS";
    assert(!EncodePacketHeader(header, bytes));
    header.command = std::string("BAD\x01", 4);
    assert(!EncodePacketHeader(header, bytes));
  }

  {
    HeaderBytes bytes{};
    PacketHeader parsed;
    ErrorKind err = ErrorKind::kNone;
    assert(!DecodePacketHeader(bytes.data(), kPacketHeaderSize - 1, parsed,
                               err));
    assert(err == ErrorKind::kTruncatedInput);

    PacketHeader big;
    big.command = "GETCONF";
    big.body_length = kMaxBodyBytes + 1;
    assert(EncodePacketHeader(big, bytes));
    assert(!DecodePacketHeader(bytes.data(), bytes.size(), parsed, err));
    assert(err == ErrorKind::kMalformedHeader);

    big.body_length = kMaxBodyBytes;
    assert(EncodePacketHeader(big, bytes));
    assert(DecodePacketHeader(bytes.data(), bytes.size(), parsed, err));
  }

  {
    Document body;
    body.Set("status", Value::Int32(0));
    body.Set("host", Value::String("loco.test"));
    Packet packet;
    assert(MakeDocumentPacket(7, "CHECKIN", body, packet));
    assert(packet.header.body_length == packet.body.size());
    const std::vector<std::uint8_t> wire = Wire(packet);
    assert(wire.size() == kPacketHeaderSize + packet.body.size());

    ScriptedStream source(wire, 3);
    Packet read;
    ErrorKind err = ErrorKind::kNone;
    assert(ReadPacket(source, read, err));
    assert(read.header == packet.header);
    Document parsed;
    CodecError codec = CodecError::kNone;
    assert(DecodeBodyDocument(read, parsed, codec));
    assert(parsed == body);

    // Stream ends cleanly between packets.
    assert(!ReadPacket(source, read, err));
    assert(err == ErrorKind::kConnectionClosed);

    for (std::size_t cut = 1; cut < wire.size(); ++cut) {
      ScriptedStream partial(
          std::vector<std::uint8_t>(wire.begin(), wire.begin() + cut));
      Packet p;
      ErrorKind e = ErrorKind::kNone;
      assert(!ReadPacket(partial, p, e));
      assert(e == ErrorKind::kTruncatedInput);
    }

    ScriptedStream slow(std::vector<std::uint8_t>(wire.begin(),
                                                  wire.begin() + 5));
    slow.set_end_status(IoStatus::kTimeout);
    assert(!ReadPacket(slow, read, err));
    assert(err == ErrorKind::kTimeout);
  }

  {
    Packet packet;
    packet.header.command = "PING";
    const std::vector<std::uint8_t> wire = Wire(packet);
    assert(wire.size() == kPacketHeaderSize);
    ScriptedStream source(wire);
    Packet read;
    ErrorKind err = ErrorKind::kNone;
    assert(ReadPacket(source, read, err));
    assert(read.header.body_length == 0 && read.body.empty());
    Document parsed;
    parsed.Set("stale", Value::Bool(true));
    CodecError codec = CodecError::kNone;
    assert(DecodeBodyDocument(read, parsed, codec));
    assert(parsed.empty());
  }

  {
    // body_length on the wire always follows the body actually sent.
    Packet packet;
    packet.header.command = "ECHO";
    packet.header.body_length = 999;
    packet.body = {5, 0, 0, 0, 0};
    const std::vector<std::uint8_t> wire = Wire(packet);
    assert(wire.size() == kPacketHeaderSize + 5);
    assert(wire[18] == 5 && wire[19] == 0);
  }

  {
    Packet packet;
    packet.header.command = "ECHO";
    packet.header.body_type = kBodyEncryptedFlag;
    packet.body = {5, 0, 0, 0, 0};
    Document parsed;
    CodecError codec = CodecError::kNone;
    assert(!DecodeBodyDocument(packet, parsed, codec));
    assert(codec == CodecError::kMalformed);

    packet.header.body_type = 0;
    packet.body = {5, 0, 0, 0, 0, 0xAA};
    assert(!DecodeBodyDocument(packet, parsed, codec));
    assert(codec == CodecError::kMalformed);
  }

  {
    Packet packet;
    assert(!MakeDocumentPacket(1, "WAY_TOO_LONG_COMMAND", Document(), packet));
  }

  {
    PacketIdCounter ids;
    assert(ids.Peek() == 1);
    assert(ids.Next() == 1);
    assert(ids.Next() == 2);
    assert(ids.Peek() == 3);
    PacketIdCounter from(100);
    assert(from.Next() == 100);
  }

  return 0;
}
