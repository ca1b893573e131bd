// Repository: Pulsecast
// Component: JSON Value
// Purpose: Recursive-descent parser and compact writer.
// Copyright (c) 2026 Pulsecast

#include "pulsecast/util/Json.hpp"

#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace pulsecast::util {

std::string JsonEscape(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 8);
  for (char c : s) {
    if (c == '"') out += "\\\"";
    else if (c == '\\') out += "\\\\";
    else if (c == '\n') out += "\\n";
    else if (c == '\r') out += "\\r";
    else if (c == '\t') out += "\\t";
    else if (c == '\b') out += "\\b";
    else if (c == '\f') out += "\\f";
    else if (static_cast<unsigned char>(c) < 0x20) {
      char buf[8];
      std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
      out += buf;
    } else {
      out += c;
    }
  }
  return out;
}

// =============================================================================
// JsonValue
// =============================================================================

JsonValue::JsonValue(bool b) : kind_(Kind::kBool), bool_(b) {}
JsonValue::JsonValue(int i) : kind_(Kind::kInt), int_(i) {}
JsonValue::JsonValue(int64_t i) : kind_(Kind::kInt), int_(i) {}
JsonValue::JsonValue(double d) : kind_(Kind::kDouble), double_(d) {}
JsonValue::JsonValue(std::string s) : kind_(Kind::kString), string_(std::move(s)) {}
JsonValue::JsonValue(const char* s) : kind_(Kind::kString), string_(s ? s : "") {}

JsonValue JsonValue::MakeArray() {
  JsonValue v;
  v.kind_ = Kind::kArray;
  return v;
}

JsonValue JsonValue::MakeObject() {
  JsonValue v;
  v.kind_ = Kind::kObject;
  return v;
}

int64_t JsonValue::AsInt() const {
  if (kind_ == Kind::kDouble) return static_cast<int64_t>(std::llround(double_));
  return int_;
}

double JsonValue::AsDouble() const {
  if (kind_ == Kind::kInt) return static_cast<double>(int_);
  return double_;
}

const JsonValue* JsonValue::Find(const std::string& key) const {
  if (kind_ != Kind::kObject) return nullptr;
  for (const auto& member : object_) {
    if (member.first == key) return &member.second;
  }
  return nullptr;
}

void JsonValue::Set(const std::string& key, JsonValue value) {
  if (kind_ != Kind::kObject) {
    *this = MakeObject();
  }
  for (auto& member : object_) {
    if (member.first == key) {
      member.second = std::move(value);
      return;
    }
  }
  object_.emplace_back(key, std::move(value));
}

void JsonValue::Append(JsonValue value) {
  if (kind_ != Kind::kArray) {
    *this = MakeArray();
  }
  array_.push_back(std::move(value));
}

size_t JsonValue::size() const {
  if (kind_ == Kind::kArray) return array_.size();
  if (kind_ == Kind::kObject) return object_.size();
  return 0;
}

bool JsonValue::operator==(const JsonValue& other) const {
  if (IsNumber() && other.IsNumber()) {
    if (kind_ == Kind::kInt && other.kind_ == Kind::kInt) return int_ == other.int_;
    return AsDouble() == other.AsDouble();
  }
  if (kind_ != other.kind_) return false;
  switch (kind_) {
    case Kind::kNull: return true;
    case Kind::kBool: return bool_ == other.bool_;
    case Kind::kString: return string_ == other.string_;
    case Kind::kArray: return array_ == other.array_;
    case Kind::kObject: {
      // Member order is not significant for equality.
      if (object_.size() != other.object_.size()) return false;
      for (const auto& member : object_) {
        const JsonValue* theirs = other.Find(member.first);
        if (theirs == nullptr || !(member.second == *theirs)) return false;
      }
      return true;
    }
    default: return false;
  }
}

// =============================================================================
// Parser
// =============================================================================

namespace {

constexpr int kMaxDepth = 64;

class Parser {
 public:
  explicit Parser(const std::string& text) : text_(text) {}

  bool ParseDocument(JsonValue* out) {
    SkipWhitespace();
    if (!ParseValue(out, 0)) return false;
    SkipWhitespace();
    if (pos_ != text_.size()) return Fail("trailing characters");
    return true;
  }

  const std::string& error() const { return error_; }

 private:
  bool Fail(const std::string& what) {
    if (error_.empty()) {
      error_ = what + " at offset " + std::to_string(pos_);
    }
    return false;
  }

  void SkipWhitespace() {
    while (pos_ < text_.size()) {
      char c = text_[pos_];
      if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
        ++pos_;
      } else {
        break;
      }
    }
  }

  bool Consume(char expected) {
    if (pos_ < text_.size() && text_[pos_] == expected) {
      ++pos_;
      return true;
    }
    return false;
  }

  bool ConsumeLiteral(const char* literal) {
    size_t i = 0;
    while (literal[i] != '\0') {
      if (pos_ + i >= text_.size() || text_[pos_ + i] != literal[i]) return false;
      ++i;
    }
    pos_ += i;
    return true;
  }

  bool ParseValue(JsonValue* out, int depth) {
    if (depth > kMaxDepth) return Fail("nesting too deep");
    if (pos_ >= text_.size()) return Fail("unexpected end of input");
    char c = text_[pos_];
    if (c == '{') return ParseObject(out, depth);
    if (c == '[') return ParseArray(out, depth);
    if (c == '"') {
      std::string s;
      if (!ParseString(&s)) return false;
      *out = JsonValue(std::move(s));
      return true;
    }
    if (c == '-' || (c >= '0' && c <= '9')) return ParseNumber(out);
    if (ConsumeLiteral("true")) { *out = JsonValue(true); return true; }
    if (ConsumeLiteral("false")) { *out = JsonValue(false); return true; }
    if (ConsumeLiteral("null")) { *out = JsonValue(); return true; }
    return Fail("unexpected character");
  }

  bool ParseObject(JsonValue* out, int depth) {
    ++pos_;  // '{'
    JsonValue obj = JsonValue::MakeObject();
    SkipWhitespace();
    if (Consume('}')) {
      *out = std::move(obj);
      return true;
    }
    while (true) {
      SkipWhitespace();
      if (pos_ >= text_.size() || text_[pos_] != '"') return Fail("expected object key");
      std::string key;
      if (!ParseString(&key)) return false;
      SkipWhitespace();
      if (!Consume(':')) return Fail("expected ':'");
      SkipWhitespace();
      JsonValue member;
      if (!ParseValue(&member, depth + 1)) return false;
      obj.Set(key, std::move(member));
      SkipWhitespace();
      if (Consume(',')) continue;
      if (Consume('}')) break;
      return Fail("expected ',' or '}'");
    }
    *out = std::move(obj);
    return true;
  }

  bool ParseArray(JsonValue* out, int depth) {
    ++pos_;  // '['
    JsonValue arr = JsonValue::MakeArray();
    SkipWhitespace();
    if (Consume(']')) {
      *out = std::move(arr);
      return true;
    }
    while (true) {
      SkipWhitespace();
      JsonValue element;
      if (!ParseValue(&element, depth + 1)) return false;
      arr.Append(std::move(element));
      SkipWhitespace();
      if (Consume(',')) continue;
      if (Consume(']')) break;
      return Fail("expected ',' or ']'");
    }
    *out = std::move(arr);
    return true;
  }

  static void AppendUtf8(uint32_t cp, std::string* out) {
    if (cp < 0x80) {
      *out += static_cast<char>(cp);
    } else if (cp < 0x800) {
      *out += static_cast<char>(0xC0 | (cp >> 6));
      *out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
      *out += static_cast<char>(0xE0 | (cp >> 12));
      *out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
      *out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
      *out += static_cast<char>(0xF0 | (cp >> 18));
      *out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
      *out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
      *out += static_cast<char>(0x80 | (cp & 0x3F));
    }
  }

  bool ParseHex4(uint32_t* out) {
    if (pos_ + 4 > text_.size()) return Fail("truncated \\u escape");
    uint32_t v = 0;
    for (int i = 0; i < 4; ++i) {
      char c = text_[pos_++];
      v <<= 4;
      if (c >= '0' && c <= '9') v |= static_cast<uint32_t>(c - '0');
      else if (c >= 'a' && c <= 'f') v |= static_cast<uint32_t>(c - 'a' + 10);
      else if (c >= 'A' && c <= 'F') v |= static_cast<uint32_t>(c - 'A' + 10);
      else return Fail("bad \\u escape");
    }
    *out = v;
    return true;
  }

  bool ParseString(std::string* out) {
    ++pos_;  // opening quote
    out->clear();
    while (pos_ < text_.size()) {
      char c = text_[pos_++];
      if (c == '"') return true;
      if (static_cast<unsigned char>(c) < 0x20) return Fail("control character in string");
      if (c != '\\') {
        *out += c;
        continue;
      }
      if (pos_ >= text_.size()) break;
      char esc = text_[pos_++];
      switch (esc) {
        case '"': *out += '"'; break;
        case '\\': *out += '\\'; break;
        case '/': *out += '/'; break;
        case 'b': *out += '\b'; break;
        case 'f': *out += '\f'; break;
        case 'n': *out += '\n'; break;
        case 'r': *out += '\r'; break;
        case 't': *out += '\t'; break;
        case 'u': {
          uint32_t cp = 0;
          if (!ParseHex4(&cp)) return false;
          if (cp >= 0xD800 && cp <= 0xDBFF) {
            uint32_t low = 0;
            if (!ConsumeLiteral("\\u") || !ParseHex4(&low) ||
                low < 0xDC00 || low > 0xDFFF) {
              return Fail("unpaired surrogate");
            }
            cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
          }
          AppendUtf8(cp, out);
          break;
        }
        default:
          return Fail("bad escape");
      }
    }
    return Fail("unterminated string");
  }

  bool ParseNumber(JsonValue* out) {
    size_t start = pos_;
    bool integral = true;
    Consume('-');
    if (pos_ >= text_.size() || text_[pos_] < '0' || text_[pos_] > '9') {
      return Fail("bad number");
    }
    while (pos_ < text_.size()) {
      char c = text_[pos_];
      if (c >= '0' && c <= '9') {
        ++pos_;
      } else if (c == '.' || c == 'e' || c == 'E' || c == '+' || c == '-') {
        integral = false;
        ++pos_;
      } else {
        break;
      }
    }
    std::string literal = text_.substr(start, pos_ - start);
    char* end = nullptr;
    if (integral) {
      errno = 0;
      long long v = std::strtoll(literal.c_str(), &end, 10);
      if (errno == 0 && end != nullptr && *end == '\0') {
        *out = JsonValue(static_cast<int64_t>(v));
        return true;
      }
    }
    errno = 0;
    double d = std::strtod(literal.c_str(), &end);
    if (end == nullptr || *end != '\0' || errno == ERANGE) {
      pos_ = start;
      return Fail("bad number");
    }
    *out = JsonValue(d);
    return true;
  }

  const std::string& text_;
  size_t pos_ = 0;
  std::string error_;
};

void Write(const JsonValue& v, std::string* out) {
  switch (v.kind()) {
    case JsonValue::Kind::kNull:
      *out += "null";
      break;
    case JsonValue::Kind::kBool:
      *out += v.AsBool() ? "true" : "false";
      break;
    case JsonValue::Kind::kInt:
      *out += std::to_string(v.AsInt());
      break;
    case JsonValue::Kind::kDouble: {
      double d = v.AsDouble();
      if (!std::isfinite(d)) {
        *out += "null";
        break;
      }
      char buf[32];
      std::snprintf(buf, sizeof(buf), "%.15g", d);
      std::string s(buf);
      // Keep doubles recognisable as such after a round trip.
      if (s.find_first_of(".eE") == std::string::npos) s += ".0";
      *out += s;
      break;
    }
    case JsonValue::Kind::kString:
      *out += '"';
      *out += JsonEscape(v.AsString());
      *out += '"';
      break;
    case JsonValue::Kind::kArray: {
      *out += '[';
      bool first = true;
      for (const auto& element : v.AsArray()) {
        if (!first) *out += ',';
        first = false;
        Write(element, out);
      }
      *out += ']';
      break;
    }
    case JsonValue::Kind::kObject: {
      *out += '{';
      bool first = true;
      for (const auto& member : v.AsObject()) {
        if (!first) *out += ',';
        first = false;
        *out += '"';
        *out += JsonEscape(member.first);
        *out += "\":";
        Write(member.second, out);
      }
      *out += '}';
      break;
    }
  }
}

}  // namespace

std::optional<JsonValue> ParseJson(const std::string& text, std::string* error) {
  Parser parser(text);
  JsonValue value;
  if (!parser.ParseDocument(&value)) {
    if (error) *error = parser.error();
    return std::nullopt;
  }
  return value;
}

std::string SerializeJson(const JsonValue& value) {
  std::string out;
  Write(value, &out);
  return out;
}

bool GetString(const JsonValue& obj, const std::string& key, std::string* out) {
  const JsonValue* v = obj.Find(key);
  if (v == nullptr || !v->IsString()) return false;
  *out = v->AsString();
  return true;
}

bool GetInt(const JsonValue& obj, const std::string& key, int64_t* out) {
  const JsonValue* v = obj.Find(key);
  if (v == nullptr || !v->IsNumber()) return false;
  *out = v->AsInt();
  return true;
}

bool GetDouble(const JsonValue& obj, const std::string& key, double* out) {
  const JsonValue* v = obj.Find(key);
  if (v == nullptr || !v->IsNumber()) return false;
  *out = v->AsDouble();
  return true;
}

}  // namespace pulsecast::util
