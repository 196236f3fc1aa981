#ifndef LOCO_CLIENT_DOCUMENT_H
#define LOCO_CLIENT_DOCUMENT_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace loco::client {

enum class ValueType : std::uint8_t {
  kNull = 0,
  kBool = 1,
  kInt32 = 2,
  kInt64 = 3,
  kDouble = 4,
  kString = 5,
  kBinary = 6,
  kArray = 7,
  kDocument = 8
};

class Document;

// One value of a document. Accessors of the wrong type return an empty or
// zero value; callers check type() first when it matters.
class Value {
 public:
  Value();
  ~Value();
  Value(const Value& other);
  Value& operator=(const Value& other);
  Value(Value&& other) noexcept;
  Value& operator=(Value&& other) noexcept;

  static Value Null();
  static Value Bool(bool v);
  static Value Int32(std::int32_t v);
  static Value Int64(std::int64_t v);
  static Value Double(double v);
  static Value String(std::string v);
  static Value Binary(std::vector<std::uint8_t> bytes,
                      std::uint8_t subtype = 0);
  static Value Array(std::vector<Value> items);
  static Value Doc(Document doc);

  ValueType type() const { return type_; }
  bool IsNull() const { return type_ == ValueType::kNull; }
  bool IsInteger() const {
    return type_ == ValueType::kInt32 || type_ == ValueType::kInt64;
  }

  bool AsBool() const { return type_ == ValueType::kBool && bool_; }
  std::int32_t AsInt32() const;
  std::int64_t AsInt64() const;
  double AsDouble() const;
  const std::string& AsString() const;
  const std::vector<std::uint8_t>& AsBinary() const;
  std::uint8_t binary_subtype() const { return subtype_; }
  const std::vector<Value>& AsArray() const;
  const Document& AsDocument() const;

  bool operator==(const Value& other) const;
  bool operator!=(const Value& other) const { return !(*this == other); }

 private:
  ValueType type_{ValueType::kNull};
  bool bool_{false};
  std::int64_t int_{0};
  double double_{0.0};
  std::uint8_t subtype_{0};
  std::string string_;
  std::vector<std::uint8_t> binary_;
  std::vector<Value> array_;
  std::unique_ptr<Document> doc_;
};

// Ordered key/value map with unique keys.
class Document {
 public:
  using Entry = std::pair<std::string, Value>;

  Document() = default;

  // Replaces an existing key in place, otherwise appends.
  void Set(std::string key, Value value);
  // Appends only when the key is new.
  bool Insert(std::string key, Value value);
  bool Remove(std::string_view key);
  void Clear() { entries_.clear(); }

  const Value* Find(std::string_view key) const;
  bool Has(std::string_view key) const { return Find(key) != nullptr; }

  bool GetString(std::string_view key, std::string& out) const;
  // Accepts either integer width.
  bool GetInteger(std::string_view key, std::int64_t& out) const;
  bool GetBool(std::string_view key, bool& out) const;
  const Document* GetDocument(std::string_view key) const;
  const std::vector<Value>* GetArray(std::string_view key) const;

  std::size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }
  const std::vector<Entry>& entries() const { return entries_; }

  bool operator==(const Document& other) const {
    return entries_ == other.entries_;
  }
  bool operator!=(const Document& other) const { return !(*this == other); }

 private:
  std::vector<Entry> entries_;
};

}  // namespace loco::client

#endif  // LOCO_CLIENT_DOCUMENT_H
