#include "document_codec.h"

#include <cstring>
#include <limits>
#include <string>

namespace loco::client {

namespace {

constexpr std::size_t kMaxEncodedBytes =
    static_cast<std::size_t>((std::numeric_limits<std::int32_t>::max)());

void WriteUint32Le(std::uint32_t v, std::vector<std::uint8_t>& out) {
  out.push_back(static_cast<std::uint8_t>(v & 0xFF));
  out.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFF));
  out.push_back(static_cast<std::uint8_t>((v >> 16) & 0xFF));
  out.push_back(static_cast<std::uint8_t>((v >> 24) & 0xFF));
}

void WriteUint64Le(std::uint64_t v, std::vector<std::uint8_t>& out) {
  for (int i = 0; i < 8; ++i) {
    out.push_back(static_cast<std::uint8_t>((v >> (8 * i)) & 0xFF));
  }
}

void PatchUint32Le(std::uint32_t v, std::vector<std::uint8_t>& out,
                   std::size_t offset) {
  out[offset] = static_cast<std::uint8_t>(v & 0xFF);
  out[offset + 1] = static_cast<std::uint8_t>((v >> 8) & 0xFF);
  out[offset + 2] = static_cast<std::uint8_t>((v >> 16) & 0xFF);
  out[offset + 3] = static_cast<std::uint8_t>((v >> 24) & 0xFF);
}

std::uint32_t ReadUint32Le(const std::uint8_t* p) {
  return static_cast<std::uint32_t>(static_cast<std::uint32_t>(p[0]) |
                                    (static_cast<std::uint32_t>(p[1]) << 8) |
                                    (static_cast<std::uint32_t>(p[2]) << 16) |
                                    (static_cast<std::uint32_t>(p[3]) << 24));
}

std::uint64_t ReadUint64Le(const std::uint8_t* p) {
  std::uint64_t v = 0;
  for (int i = 7; i >= 0; --i) {
    v = (v << 8) | static_cast<std::uint64_t>(p[i]);
  }
  return v;
}

bool WriteCString(const std::string& s, std::vector<std::uint8_t>& out) {
  if (s.find('\0') != std::string::npos) {
    return false;
  }
  out.insert(out.end(), s.begin(), s.end());
  out.push_back(0);
  return true;
}

bool EncodeDocumentAt(const std::vector<Document::Entry>& entries,
                      std::size_t depth, std::vector<std::uint8_t>& out);

bool EncodeArrayAt(const std::vector<Value>& items, std::size_t depth,
                   std::vector<std::uint8_t>& out) {
  std::vector<Document::Entry> entries;
  entries.reserve(items.size());
  for (std::size_t i = 0; i < items.size(); ++i) {
    entries.emplace_back(std::to_string(i), items[i]);
  }
  return EncodeDocumentAt(entries, depth, out);
}

bool EncodeValue(const Value& value, std::size_t depth,
                 std::vector<std::uint8_t>& out) {
  switch (value.type()) {
    case ValueType::kNull:
      return true;
    case ValueType::kBool:
      out.push_back(value.AsBool() ? 1 : 0);
      return true;
    case ValueType::kInt32:
      WriteUint32Le(static_cast<std::uint32_t>(value.AsInt32()), out);
      return true;
    case ValueType::kInt64:
      WriteUint64Le(static_cast<std::uint64_t>(value.AsInt64()), out);
      return true;
    case ValueType::kDouble: {
      const double d = value.AsDouble();
      std::uint64_t bits = 0;
      std::memcpy(&bits, &d, sizeof(bits));
      WriteUint64Le(bits, out);
      return true;
    }
    case ValueType::kString: {
      const std::string& s = value.AsString();
      if (s.size() + 1 > kMaxEncodedBytes) {
        return false;
      }
      WriteUint32Le(static_cast<std::uint32_t>(s.size() + 1), out);
      out.insert(out.end(), s.begin(), s.end());
      out.push_back(0);
      return true;
    }
    case ValueType::kBinary: {
      const auto& bytes = value.AsBinary();
      if (bytes.size() > kMaxEncodedBytes) {
        return false;
      }
      WriteUint32Le(static_cast<std::uint32_t>(bytes.size()), out);
      out.push_back(value.binary_subtype());
      out.insert(out.end(), bytes.begin(), bytes.end());
      return true;
    }
    case ValueType::kArray:
      return EncodeArrayAt(value.AsArray(), depth + 1, out);
    case ValueType::kDocument:
      return EncodeDocumentAt(value.AsDocument().entries(), depth + 1, out);
  }
  return false;
}

TypeTag TagFor(ValueType type) {
  switch (type) {
    case ValueType::kNull:
      return TypeTag::kNull;
    case ValueType::kBool:
      return TypeTag::kBool;
    case ValueType::kInt32:
      return TypeTag::kInt32;
    case ValueType::kInt64:
      return TypeTag::kInt64;
    case ValueType::kDouble:
      return TypeTag::kDouble;
    case ValueType::kString:
      return TypeTag::kString;
    case ValueType::kBinary:
      return TypeTag::kBinary;
    case ValueType::kArray:
      return TypeTag::kArray;
    case ValueType::kDocument:
      return TypeTag::kDocument;
  }
  return TypeTag::kNull;
}

bool EncodeDocumentAt(const std::vector<Document::Entry>& entries,
                      std::size_t depth, std::vector<std::uint8_t>& out) {
  if (depth > kMaxDocumentDepth) {
    return false;
  }
  const std::size_t start = out.size();
  WriteUint32Le(0, out);
  for (const auto& entry : entries) {
    out.push_back(static_cast<std::uint8_t>(TagFor(entry.second.type())));
    if (!WriteCString(entry.first, out)) {
      return false;
    }
    if (!EncodeValue(entry.second, depth, out)) {
      return false;
    }
  }
  out.push_back(0);
  const std::size_t total = out.size() - start;
  if (total > kMaxEncodedBytes) {
    return false;
  }
  PatchUint32Le(static_cast<std::uint32_t>(total), out, start);
  return true;
}

class Reader {
 public:
  Reader(const std::uint8_t* data, std::size_t len) : data_(data), len_(len) {}

  std::size_t remaining() const { return len_ - pos_; }
  std::size_t pos() const { return pos_; }
  const std::uint8_t* cursor() const { return data_ + pos_; }

  bool ReadByte(std::uint8_t& out) {
    if (remaining() < 1) {
      return false;
    }
    out = data_[pos_++];
    return true;
  }

  bool ReadUint32(std::uint32_t& out) {
    if (remaining() < 4) {
      return false;
    }
    out = ReadUint32Le(data_ + pos_);
    pos_ += 4;
    return true;
  }

  bool ReadUint64(std::uint64_t& out) {
    if (remaining() < 8) {
      return false;
    }
    out = ReadUint64Le(data_ + pos_);
    pos_ += 8;
    return true;
  }

  bool ReadCString(std::string& out) {
    const void* nul = std::memchr(data_ + pos_, 0, remaining());
    if (!nul) {
      return false;
    }
    const std::size_t n =
        static_cast<std::size_t>(static_cast<const std::uint8_t*>(nul) -
                                 (data_ + pos_));
    out.assign(reinterpret_cast<const char*>(data_ + pos_), n);
    pos_ += n + 1;
    return true;
  }

  // Callers check remaining() first.
  void Advance(std::size_t n) { pos_ += n; }

 private:
  const std::uint8_t* data_;
  std::size_t len_;
  std::size_t pos_{0};
};

bool DecodeDocumentAt(const std::uint8_t* data, std::size_t len,
                      std::size_t depth, bool as_array, Document& out_doc,
                      std::vector<Value>& out_array, std::size_t& consumed,
                      CodecError& error);

bool DecodeValue(TypeTag tag, Reader& r, std::size_t depth, Value& out,
                 CodecError& error) {
  switch (tag) {
    case TypeTag::kDouble: {
      std::uint64_t bits = 0;
      if (!r.ReadUint64(bits)) {
        error = CodecError::kTruncatedInput;
        return false;
      }
      double d = 0.0;
      std::memcpy(&d, &bits, sizeof(d));
      out = Value::Double(d);
      return true;
    }
    case TypeTag::kString: {
      std::uint32_t n = 0;
      if (!r.ReadUint32(n)) {
        error = CodecError::kTruncatedInput;
        return false;
      }
      if (n == 0 || n > kMaxEncodedBytes) {
        error = CodecError::kMalformed;
        return false;
      }
      if (r.remaining() < n) {
        error = CodecError::kTruncatedInput;
        return false;
      }
      const std::uint8_t* p = r.cursor();
      if (p[n - 1] != 0) {
        error = CodecError::kMalformed;
        return false;
      }
      out = Value::String(
          std::string(reinterpret_cast<const char*>(p), n - 1));
      r.Advance(n);
      return true;
    }
    case TypeTag::kDocument:
    case TypeTag::kArray: {
      Document doc;
      std::vector<Value> items;
      std::size_t used = 0;
      const bool as_array = tag == TypeTag::kArray;
      if (!DecodeDocumentAt(r.cursor(), r.remaining(), depth + 1, as_array,
                            doc, items, used, error)) {
        return false;
      }
      r.Advance(used);
      out = as_array ? Value::Array(std::move(items))
                     : Value::Doc(std::move(doc));
      return true;
    }
    case TypeTag::kBinary: {
      std::uint32_t n = 0;
      std::uint8_t subtype = 0;
      if (!r.ReadUint32(n) || !r.ReadByte(subtype)) {
        error = CodecError::kTruncatedInput;
        return false;
      }
      if (n > kMaxEncodedBytes) {
        error = CodecError::kMalformed;
        return false;
      }
      if (r.remaining() < n) {
        error = CodecError::kTruncatedInput;
        return false;
      }
      std::vector<std::uint8_t> bytes(r.cursor(), r.cursor() + n);
      r.Advance(n);
      out = Value::Binary(std::move(bytes), subtype);
      return true;
    }
    case TypeTag::kBool: {
      std::uint8_t b = 0;
      if (!r.ReadByte(b)) {
        error = CodecError::kTruncatedInput;
        return false;
      }
      if (b > 1) {
        error = CodecError::kMalformed;
        return false;
      }
      out = Value::Bool(b == 1);
      return true;
    }
    case TypeTag::kNull:
      out = Value::Null();
      return true;
    case TypeTag::kInt32: {
      std::uint32_t v = 0;
      if (!r.ReadUint32(v)) {
        error = CodecError::kTruncatedInput;
        return false;
      }
      out = Value::Int32(static_cast<std::int32_t>(v));
      return true;
    }
    case TypeTag::kInt64: {
      std::uint64_t v = 0;
      if (!r.ReadUint64(v)) {
        error = CodecError::kTruncatedInput;
        return false;
      }
      out = Value::Int64(static_cast<std::int64_t>(v));
      return true;
    }
  }
  error = CodecError::kUnknownTypeTag;
  return false;
}

bool IsKnownTag(std::uint8_t tag) {
  switch (static_cast<TypeTag>(tag)) {
    case TypeTag::kDouble:
    case TypeTag::kString:
    case TypeTag::kDocument:
    case TypeTag::kArray:
    case TypeTag::kBinary:
    case TypeTag::kBool:
    case TypeTag::kNull:
    case TypeTag::kInt32:
    case TypeTag::kInt64:
      return true;
  }
  return false;
}

bool DecodeDocumentAt(const std::uint8_t* data, std::size_t len,
                      std::size_t depth, bool as_array, Document& out_doc,
                      std::vector<Value>& out_array, std::size_t& consumed,
                      CodecError& error) {
  if (depth > kMaxDocumentDepth) {
    error = CodecError::kMalformed;
    return false;
  }
  if (len < 4) {
    error = CodecError::kTruncatedInput;
    return false;
  }
  const std::uint32_t total = ReadUint32Le(data);
  if (total < kMinDocumentBytes || total > kMaxEncodedBytes) {
    error = CodecError::kMalformed;
    return false;
  }
  if (total > len) {
    error = CodecError::kTruncatedInput;
    return false;
  }
  if (data[total - 1] != 0) {
    error = CodecError::kMalformed;
    return false;
  }

  // Elements live between the size prefix and the trailing NUL.
  Reader r(data + 4, total - 5);
  while (r.remaining() > 0) {
    std::uint8_t tag = 0;
    if (!r.ReadByte(tag) || tag == 0) {
      error = CodecError::kMalformed;
      return false;
    }
    if (!IsKnownTag(tag)) {
      error = CodecError::kUnknownTypeTag;
      return false;
    }
    std::string key;
    if (!r.ReadCString(key)) {
      error = CodecError::kTruncatedInput;
      return false;
    }
    Value value;
    if (!DecodeValue(static_cast<TypeTag>(tag), r, depth, value, error)) {
      return false;
    }
    if (as_array) {
      if (key != std::to_string(out_array.size())) {
        error = CodecError::kMalformed;
        return false;
      }
      out_array.push_back(std::move(value));
    } else if (!out_doc.Insert(std::move(key), std::move(value))) {
      error = CodecError::kMalformed;
      return false;
    }
  }
  consumed = total;
  return true;
}

}  // namespace

bool EncodeDocument(const Document& doc, std::vector<std::uint8_t>& out) {
  out.clear();
  if (!EncodeDocumentAt(doc.entries(), 0, out)) {
    out.clear();
    return false;
  }
  return true;
}

bool DecodeDocument(const std::uint8_t* data, std::size_t len, Document& out,
                    std::size_t& consumed, CodecError& error) {
  out.Clear();
  consumed = 0;
  error = CodecError::kNone;
  if (!data && len != 0) {
    error = CodecError::kMalformed;
    return false;
  }
  std::vector<Value> unused;
  Document doc;
  if (!DecodeDocumentAt(data, len, 0, false, doc, unused, consumed, error)) {
    consumed = 0;
    return false;
  }
  out = std::move(doc);
  return true;
}

const char* CodecErrorName(CodecError error) {
  switch (error) {
    case CodecError::kNone:
      return "none";
    case CodecError::kTruncatedInput:
      return "truncated input";
    case CodecError::kUnknownTypeTag:
      return "unknown type tag";
    case CodecError::kMalformed:
      return "malformed document";
  }
  return "unknown";
}

ErrorKind CodecErrorKind(CodecError error) {
  switch (error) {
    case CodecError::kNone:
      return ErrorKind::kNone;
    case CodecError::kTruncatedInput:
      return ErrorKind::kTruncatedInput;
    case CodecError::kUnknownTypeTag:
      return ErrorKind::kUnknownTypeTag;
    case CodecError::kMalformed:
      return ErrorKind::kMalformedDocument;
  }
  return ErrorKind::kMalformedDocument;
}

}  // namespace loco::client
