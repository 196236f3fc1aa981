#ifndef LOCO_CLIENT_DOCUMENT_CODEC_H
#define LOCO_CLIENT_DOCUMENT_CODEC_H

#include <cstddef>
#include <cstdint>
#include <vector>

#include "document.h"
#include "loco_error.h"

namespace loco::client {

// BSON element tags carried on the wire.
enum class TypeTag : std::uint8_t {
  kDouble = 0x01,
  kString = 0x02,
  kDocument = 0x03,
  kArray = 0x04,
  kBinary = 0x05,
  kBool = 0x08,
  kNull = 0x0A,
  kInt32 = 0x10,
  kInt64 = 0x12
};

enum class CodecError : std::uint8_t {
  kNone = 0,
  kTruncatedInput = 1,
  kUnknownTypeTag = 2,
  kMalformed = 3
};

constexpr std::size_t kMaxDocumentDepth = 128;
constexpr std::size_t kMinDocumentBytes = 5;

// Fails only for keys containing NUL, nesting deeper than kMaxDocumentDepth,
// or sizes that do not fit the int32 length prefixes.
bool EncodeDocument(const Document& doc, std::vector<std::uint8_t>& out);

// Decodes one document from the front of data. consumed is the declared
// document size; trailing bytes are left to the caller.
bool DecodeDocument(const std::uint8_t* data, std::size_t len, Document& out,
                    std::size_t& consumed, CodecError& error);

const char* CodecErrorName(CodecError error);
ErrorKind CodecErrorKind(CodecError error);

}  // namespace loco::client

#endif  // LOCO_CLIENT_DOCUMENT_CODEC_H
