#include "document.h"

#include <cstring>

namespace loco::client {

namespace {

const std::string kEmptyString;
const std::vector<std::uint8_t> kEmptyBinary;
const std::vector<Value> kEmptyArray;
const Document kEmptyDocument;

std::uint64_t DoubleBits(double v) {
  std::uint64_t bits = 0;
  std::memcpy(&bits, &v, sizeof(bits));
  return bits;
}

}  // namespace

Value::Value() = default;
Value::~Value() = default;

Value::Value(const Value& other)
    : type_(other.type_),
      bool_(other.bool_),
      int_(other.int_),
      double_(other.double_),
      subtype_(other.subtype_),
      string_(other.string_),
      binary_(other.binary_),
      array_(other.array_),
      doc_(other.doc_ ? std::make_unique<Document>(*other.doc_) : nullptr) {}

Value& Value::operator=(const Value& other) {
  if (this == &other) {
    return *this;
  }
  Value copy(other);
  *this = std::move(copy);
  return *this;
}

Value::Value(Value&& other) noexcept = default;
Value& Value::operator=(Value&& other) noexcept = default;

Value Value::Null() {
  return Value();
}

Value Value::Bool(bool v) {
  Value out;
  out.type_ = ValueType::kBool;
  out.bool_ = v;
  return out;
}

Value Value::Int32(std::int32_t v) {
  Value out;
  out.type_ = ValueType::kInt32;
  out.int_ = v;
  return out;
}

Value Value::Int64(std::int64_t v) {
  Value out;
  out.type_ = ValueType::kInt64;
  out.int_ = v;
  return out;
}

Value Value::Double(double v) {
  Value out;
  out.type_ = ValueType::kDouble;
  out.double_ = v;
  return out;
}

Value Value::String(std::string v) {
  Value out;
  out.type_ = ValueType::kString;
  out.string_ = std::move(v);
  return out;
}

Value Value::Binary(std::vector<std::uint8_t> bytes, std::uint8_t subtype) {
  Value out;
  out.type_ = ValueType::kBinary;
  out.binary_ = std::move(bytes);
  out.subtype_ = subtype;
  return out;
}

Value Value::Array(std::vector<Value> items) {
  Value out;
  out.type_ = ValueType::kArray;
  out.array_ = std::move(items);
  return out;
}

Value Value::Doc(Document doc) {
  Value out;
  out.type_ = ValueType::kDocument;
  out.doc_ = std::make_unique<Document>(std::move(doc));
  return out;
}

std::int32_t Value::AsInt32() const {
  return type_ == ValueType::kInt32 ? static_cast<std::int32_t>(int_) : 0;
}

std::int64_t Value::AsInt64() const {
  return IsInteger() ? int_ : 0;
}

double Value::AsDouble() const {
  return type_ == ValueType::kDouble ? double_ : 0.0;
}

const std::string& Value::AsString() const {
  return type_ == ValueType::kString ? string_ : kEmptyString;
}

const std::vector<std::uint8_t>& Value::AsBinary() const {
  return type_ == ValueType::kBinary ? binary_ : kEmptyBinary;
}

const std::vector<Value>& Value::AsArray() const {
  return type_ == ValueType::kArray ? array_ : kEmptyArray;
}

const Document& Value::AsDocument() const {
  return (type_ == ValueType::kDocument && doc_) ? *doc_ : kEmptyDocument;
}

bool Value::operator==(const Value& other) const {
  if (type_ != other.type_) {
    return false;
  }
  switch (type_) {
    case ValueType::kNull:
      return true;
    case ValueType::kBool:
      return bool_ == other.bool_;
    case ValueType::kInt32:
    case ValueType::kInt64:
      return int_ == other.int_;
    case ValueType::kDouble:
      return DoubleBits(double_) == DoubleBits(other.double_);
    case ValueType::kString:
      return string_ == other.string_;
    case ValueType::kBinary:
      return subtype_ == other.subtype_ && binary_ == other.binary_;
    case ValueType::kArray:
      return array_ == other.array_;
    case ValueType::kDocument:
      return AsDocument() == other.AsDocument();
  }
  return false;
}

void Document::Set(std::string key, Value value) {
  for (auto& entry : entries_) {
    if (entry.first == key) {
      entry.second = std::move(value);
      return;
    }
  }
  entries_.emplace_back(std::move(key), std::move(value));
}

bool Document::Insert(std::string key, Value value) {
  if (Has(key)) {
    return false;
  }
  entries_.emplace_back(std::move(key), std::move(value));
  return true;
}

bool Document::Remove(std::string_view key) {
  for (auto it = entries_.begin(); it != entries_.end(); ++it) {
    if (it->first == key) {
      entries_.erase(it);
      return true;
    }
  }
  return false;
}

const Value* Document::Find(std::string_view key) const {
  for (const auto& entry : entries_) {
    if (entry.first == key) {
      return &entry.second;
    }
  }
  return nullptr;
}

bool Document::GetString(std::string_view key, std::string& out) const {
  const Value* v = Find(key);
  if (!v || v->type() != ValueType::kString) {
    return false;
  }
  out = v->AsString();
  return true;
}

bool Document::GetInteger(std::string_view key, std::int64_t& out) const {
  const Value* v = Find(key);
  if (!v || !v->IsInteger()) {
    return false;
  }
  out = v->AsInt64();
  return true;
}

bool Document::GetBool(std::string_view key, bool& out) const {
  const Value* v = Find(key);
  if (!v || v->type() != ValueType::kBool) {
    return false;
  }
  out = v->AsBool();
  return true;
}

const Document* Document::GetDocument(std::string_view key) const {
  const Value* v = Find(key);
  if (!v || v->type() != ValueType::kDocument) {
    return nullptr;
  }
  return &v->AsDocument();
}

const std::vector<Value>* Document::GetArray(std::string_view key) const {
  const Value* v = Find(key);
  if (!v || v->type() != ValueType::kArray) {
    return nullptr;
  }
  return &v->AsArray();
}

}  // namespace loco::client
