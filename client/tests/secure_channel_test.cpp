#include <cassert>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "document.h"
#include "loco_crypto.h"
#include "loco_test_server.h"
#include "packet.h"
#include "platform_time.h"
#include "secure_channel.h"

using loco::client::AesIv;
using loco::client::AesKey;
using loco::client::ByteStream;
using loco::client::CodecError;
using loco::client::CryptoContext;
using loco::client::DecodeBodyDocument;
using loco::client::Document;
using loco::client::ErrorKind;
using loco::client::Failure;
using loco::client::kBodyEncryptedFlag;
using loco::client::kDefaultHandshakeKeyType;
using loco::client::kHandshakePrefixBytes;
using loco::client::LoadServerPublicKey;
using loco::client::MakeDocumentPacket;
using loco::client::OaepSeed;
using loco::client::Packet;
using loco::client::PublicKeyMaterial;
using loco::client::ReadPacket;
using loco::client::SecureChannel;
using loco::client::ServerPublicKey;
using loco::client::Value;
using loco::client::WritePacket;
using loco::client::test::LoadUint32Le;
using loco::client::test::MakePipe;
using loco::client::test::ReadExact;
using loco::client::test::TestKeyPair;

namespace {

CryptoContext ClientContext() {
  AesKey key{};
  AesIv iv{};
  key.fill(0x11);
  iv.fill(0x22);
  CryptoContext ctx;
  std::string error;
  const bool ok = ctx.Init(key, iv, kDefaultHandshakeKeyType, error);
  assert(ok);
  return ctx;
}

// Reads the handshake off the server end and returns the session context.
bool ServerAccept(ByteStream& server, const TestKeyPair& pair,
                  CryptoContext& out) {
  std::uint8_t prefix[kHandshakePrefixBytes];
  if (!ReadExact(server, prefix, sizeof(prefix))) {
    return false;
  }
  std::vector<std::uint8_t> wrapped(LoadUint32Le(prefix));
  if (LoadUint32Le(prefix + 4) != kDefaultHandshakeKeyType ||
      LoadUint32Le(prefix + 8) != 2 ||
      !ReadExact(server, wrapped.data(), wrapped.size())) {
    return false;
  }
  std::vector<std::uint8_t> plain;
  if (!pair.DecryptOaepSha1(wrapped, plain) || plain.size() != 36) {
    return false;
  }
  AesKey key{};
  AesIv iv{};
  std::memcpy(key.data(), plain.data(), key.size());
  std::memcpy(iv.data(), plain.data() + 16, iv.size());
  std::string error;
  return out.Init(key, iv, LoadUint32Le(plain.data() + 32), error);
}

Packet Request(std::uint32_t id, const std::string& command) {
  Document body;
  body.Set("seq", Value::Int32(static_cast<std::int32_t>(id)));
  Packet packet;
  const bool ok = MakeDocumentPacket(id, command, body, packet);
  assert(ok);
  return packet;
}

}  // namespace

int main() {
  TestKeyPair pair;
  assert(pair.ok());
  PublicKeyMaterial material;
  material.der_base64 = pair.PublicPkcs1Base64();
  ServerPublicKey key;
  {
    Failure err;
    assert(LoadServerPublicKey(material, key, err));
  }

  {
    // Booking-style channel: no handshake, bodies in the clear.
    std::unique_ptr<ByteStream> client_end;
    std::unique_ptr<ByteStream> server_end;
    MakePipe(client_end, server_end);
    SecureChannel channel(std::move(client_end));
    assert(!channel.encrypted());
    Failure err;
    const Packet request = Request(1, "GETCONF");
    assert(channel.Send(request, err));

    Packet seen;
    ErrorKind kind = ErrorKind::kNone;
    assert(ReadPacket(*server_end, seen, kind));
    assert(!seen.IsEncrypted());
    assert(seen.body == request.body);

    assert(WritePacket(*server_end, Request(1, "GETCONF"), kind));
    Packet reply;
    assert(channel.Receive(reply, err));
    assert(reply.header.command == "GETCONF");
  }

  {
    std::unique_ptr<ByteStream> client_end;
    std::unique_ptr<ByteStream> server_end;
    MakePipe(client_end, server_end);
    SecureChannel channel(std::move(client_end));
    OaepSeed seed{};
    seed.fill(0x33);
    Failure err;
    assert(channel.SendHandshake(ClientContext(), key, err, &seed));
    assert(channel.encrypted());
    assert(!channel.SendHandshake(ClientContext(), key, err));
    assert(err.kind == ErrorKind::kInvalidState);

    CryptoContext server;
    assert(ServerAccept(*server_end, pair, server));
    assert(server.key() == ClientContext().key());

    const Packet request = Request(2, "CHECKIN");
    assert(channel.Send(request, err));
    Packet seen;
    ErrorKind kind = ErrorKind::kNone;
    assert(ReadPacket(*server_end, seen, kind));
    assert(seen.IsEncrypted());
    assert(seen.IsDocument());
    assert(seen.header.packet_id == 2);
    assert(seen.header.command == "CHECKIN");
    assert(seen.header.body_length == seen.body.size());
    assert(seen.body != request.body);
    std::vector<std::uint8_t> opened;
    assert(server.Decrypt(seen.body.data(), seen.body.size(), opened));
    assert(opened == request.body);

    Document reply_body;
    reply_body.Set("status", Value::Int32(0));
    reply_body.Set("host", Value::String("loco.test"));
    Packet reply;
    assert(MakeDocumentPacket(2, "CHECKIN", reply_body, reply));
    std::vector<std::uint8_t> sealed;
    assert(server.Encrypt(reply.body.data(), reply.body.size(), sealed));
    reply.body = sealed;
    reply.header.body_type = kBodyEncryptedFlag;
    assert(WritePacket(*server_end, reply, kind));

    Packet received;
    assert(channel.Receive(received, err));
    assert(!received.IsEncrypted());
    Document parsed;
    CodecError codec = CodecError::kNone;
    assert(DecodeBodyDocument(received, parsed, codec));
    assert(parsed == reply_body);

    // Past the first reply a close is an ordinary disconnect.
    server_end->Close();
    assert(!channel.Receive(received, err));
    assert(err.kind == ErrorKind::kConnectionClosed);

    channel.Close();
    assert(!channel.open());
    assert(!channel.encrypted());
    assert(!channel.Send(request, err));
    assert(err.kind == ErrorKind::kConnectionClosed);
  }

  {
    // The server drops the connection instead of answering the handshake.
    std::unique_ptr<ByteStream> client_end;
    std::unique_ptr<ByteStream> server_end;
    MakePipe(client_end, server_end);
    SecureChannel channel(std::move(client_end));
    Failure err;
    assert(channel.SendHandshake(ClientContext(), key, err));
    CryptoContext server;
    assert(ServerAccept(*server_end, pair, server));
    server_end->Close();

    assert(!channel.Send(Request(3, "CHECKIN"), err));
    assert(err.kind == ErrorKind::kHandshakeRejected);
    Packet received;
    assert(!channel.Receive(received, err));
    assert(err.kind == ErrorKind::kHandshakeRejected);
  }

  {
    std::unique_ptr<ByteStream> client_end;
    std::unique_ptr<ByteStream> server_end;
    MakePipe(client_end, server_end);
    SecureChannel channel(std::move(client_end));
    Failure err;
    assert(channel.SendHandshake(ClientContext(), key, err));

    // Half a header, then close.
    const std::uint8_t partial[7] = {1, 0, 0, 0, 0, 0, 'C'};
    assert(server_end->WriteAll(partial, sizeof(partial)) ==
           loco::client::IoStatus::kOk);
    server_end->Close();
    Packet received;
    assert(!channel.Receive(received, err));
    assert(err.kind == ErrorKind::kTruncatedInput);
  }

  {
    std::unique_ptr<ByteStream> client_end;
    std::unique_ptr<ByteStream> server_end;
    MakePipe(client_end, server_end);
    SecureChannel channel(std::move(client_end));
    Failure result;
    std::thread reader([&channel, &result] {
      Packet packet;
      const bool ok = channel.Receive(packet, result);
      assert(!ok);
    });
    loco::platform::SleepMs(50);
    channel.Shutdown();
    reader.join();
    assert(result.kind == ErrorKind::kConnectionClosed);
    channel.Close();
  }

  {
    std::unique_ptr<ByteStream> client_end;
    std::unique_ptr<ByteStream> server_end;
    MakePipe(client_end, server_end);
    SecureChannel channel(std::move(client_end));
    assert(channel.SetReadTimeout(20));
    Failure err;
    Packet packet;
    assert(!channel.Receive(packet, err));
    assert(err.kind == ErrorKind::kTimeout);
  }

  return 0;
}
