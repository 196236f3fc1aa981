#include <cstddef>
#include <cstdint>
#include <fstream>
#include <iterator>
#include <vector>

#include "document.h"
#include "document_codec.h"

extern "C" int LLVMFuzzerTestOneInput(const std::uint8_t* data,
                                      std::size_t size) {
  if (!data || size == 0) {
    return 0;
  }
  if (size > (1u << 20)) {
    return 0;
  }

  loco::client::Document doc;
  std::size_t consumed = 0;
  loco::client::CodecError error = loco::client::CodecError::kNone;
  if (!loco::client::DecodeDocument(data, size, doc, consumed, error)) {
    return 0;
  }
  if (consumed > size) {
    __builtin_trap();
  }

  // Anything accepted must re-encode to a document that decodes equal.
  std::vector<std::uint8_t> encoded;
  if (!loco::client::EncodeDocument(doc, encoded)) {
    __builtin_trap();
  }
  loco::client::Document again;
  std::size_t again_consumed = 0;
  if (!loco::client::DecodeDocument(encoded.data(), encoded.size(), again,
                                    again_consumed, error) ||
      again_consumed != encoded.size() || !(again == doc)) {
    __builtin_trap();
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
