// Repository: Pulsecast
// Component: JSON Value
// Purpose: Minimal JSON document model, parser and writer for the wire format,
//          scenario files and the persisted buffer file.
// Copyright (c) 2026 Pulsecast

#ifndef PULSECAST_UTIL_JSON_HPP_
#define PULSECAST_UTIL_JSON_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace pulsecast::util {

std::string JsonEscape(const std::string& s);

// JsonValue is a tagged value. Objects keep insertion order so serialized
// events read "timestamp", "event_type", "scenario", ... in the order the
// producer set them.
//
// Numbers written without fraction or exponent parse as kInt; everything else
// numeric is kDouble. AsInt/AsDouble convert between the two.
class JsonValue {
 public:
  enum class Kind { kNull, kBool, kInt, kDouble, kString, kArray, kObject };

  using Array = std::vector<JsonValue>;
  using Member = std::pair<std::string, JsonValue>;
  using Object = std::vector<Member>;

  JsonValue() = default;
  JsonValue(bool b);                // NOLINT(google-explicit-constructor)
  JsonValue(int i);                 // NOLINT(google-explicit-constructor)
  JsonValue(int64_t i);             // NOLINT(google-explicit-constructor)
  JsonValue(double d);              // NOLINT(google-explicit-constructor)
  JsonValue(std::string s);         // NOLINT(google-explicit-constructor)
  JsonValue(const char* s);         // NOLINT(google-explicit-constructor)

  static JsonValue MakeArray();
  static JsonValue MakeObject();

  Kind kind() const { return kind_; }
  bool IsNull() const { return kind_ == Kind::kNull; }
  bool IsBool() const { return kind_ == Kind::kBool; }
  bool IsInt() const { return kind_ == Kind::kInt; }
  bool IsNumber() const { return kind_ == Kind::kInt || kind_ == Kind::kDouble; }
  bool IsString() const { return kind_ == Kind::kString; }
  bool IsArray() const { return kind_ == Kind::kArray; }
  bool IsObject() const { return kind_ == Kind::kObject; }

  bool AsBool() const { return bool_; }
  int64_t AsInt() const;
  double AsDouble() const;
  const std::string& AsString() const { return string_; }
  const Array& AsArray() const { return array_; }
  const Object& AsObject() const { return object_; }

  // Object access. Find returns nullptr when absent or when this is not an
  // object. Set replaces an existing member or appends a new one.
  const JsonValue* Find(const std::string& key) const;
  void Set(const std::string& key, JsonValue value);

  // Array access.
  void Append(JsonValue value);
  size_t size() const;

  bool operator==(const JsonValue& other) const;
  bool operator!=(const JsonValue& other) const { return !(*this == other); }

 private:
  Kind kind_ = Kind::kNull;
  bool bool_ = false;
  int64_t int_ = 0;
  double double_ = 0.0;
  std::string string_;
  Array array_;
  Object object_;
};

// Parses a complete JSON document. Trailing non-whitespace is an error.
// On failure returns std::nullopt and, when error is non-null, a short
// description with the byte offset.
std::optional<JsonValue> ParseJson(const std::string& text,
                                   std::string* error = nullptr);

// Compact single-line serialization (no whitespace, no trailing newline).
std::string SerializeJson(const JsonValue& value);

// Convenience lookups used by the event and command codecs.
// Return false when the key is missing or has the wrong kind.
bool GetString(const JsonValue& obj, const std::string& key, std::string* out);
bool GetInt(const JsonValue& obj, const std::string& key, int64_t* out);
bool GetDouble(const JsonValue& obj, const std::string& key, double* out);

}  // namespace pulsecast::util

#endif  // PULSECAST_UTIL_JSON_HPP_
