#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <iterator>
#include <vector>

#include "byte_stream.h"
#include "document.h"
#include "packet.h"

namespace {

// Replays the input in chunks sized by its first byte.
class ReplayStream final : public loco::client::ByteStream {
 public:
  ReplayStream(const std::uint8_t* data, std::size_t size, std::size_t chunk)
      : data_(data), size_(size), chunk_(chunk == 0 ? 1 : chunk) {}

  loco::client::IoStatus ReadSome(std::uint8_t* out, std::size_t len,
                                  std::size_t& out_read) override {
    out_read = 0;
    if (pos_ >= size_) {
      return loco::client::IoStatus::kClosed;
    }
    const std::size_t n = std::min({len, chunk_, size_ - pos_});
    std::memcpy(out, data_ + pos_, n);
    pos_ += n;
    out_read = n;
    return loco::client::IoStatus::kOk;
  }
  loco::client::IoStatus WriteAll(const std::uint8_t*, std::size_t) override {
    return loco::client::IoStatus::kClosed;
  }
  bool SetReadTimeout(std::uint32_t) override { return true; }
  void Shutdown() override {}
  void Close() override {}

 private:
  const std::uint8_t* data_;
  std::size_t size_;
  std::size_t chunk_;
  std::size_t pos_{0};
};

}  // namespace

extern "C" int LLVMFuzzerTestOneInput(const std::uint8_t* data,
                                      std::size_t size) {
  if (!data || size < 2) {
    return 0;
  }
  if (size > (1u << 20)) {
    return 0;
  }

  ReplayStream stream(data + 1, size - 1, data[0]);
  for (int i = 0; i < 64; ++i) {
    loco::client::Packet packet;
    loco::client::ErrorKind error = loco::client::ErrorKind::kNone;
    if (!loco::client::ReadPacket(stream, packet, error)) {
      break;
    }
    if (packet.body.size() != packet.header.body_length) {
      __builtin_trap();
    }
    loco::client::Document body;
    loco::client::CodecError codec = loco::client::CodecError::kNone;
    if (loco::client::DecodeBodyDocument(packet, body, codec) &&
        codec != loco::client::CodecError::kNone) {
      __builtin_trap();
    }
  }
  return 0;
}

#if defined(LOCO_FUZZ_STANDALONE)
int main(int argc, char** argv) {
  if (argc < 2 || !argv[1]) {
    return 0;
  }
  std::ifstream ifs(argv[1], std::ios::binary);
  if (!ifs) {
    return 0;
  }
  std::vector<std::uint8_t> data((std::istreambuf_iterator<char>(ifs)),
                                 std::istreambuf_iterator<char>());
  if (data.empty()) {
    return 0;
  }
  (void)LLVMFuzzerTestOneInput(data.data(), data.size());
  return 0;
}
#endif
