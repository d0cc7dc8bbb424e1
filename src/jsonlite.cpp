#include "warden/jsonlite.hpp"

// Registry documents, config files and persisted record sets all enter the
// engine through this reader, so it is strict:
//   - nesting deeper than kMaxDepth is rejected
//   - unescaped control characters and unknown escapes are rejected
//   - \u escapes are decoded to UTF-8, surrogate pairs included
//   - integers are read with std::from_chars (locale-free); only fractional
//     or exponent forms go through strtod

#include <charconv>
#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace warden::jsonlite {

namespace {

constexpr int kMaxDepth = 64;

JsonError parse_error(std::string message) {
  return JsonError{"json_parse_error", std::move(message)};
}

bool is_ws(char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; }
bool is_digit(char c) { return c >= '0' && c <= '9'; }

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

void put_utf8(std::string& out, uint32_t cp) {
  if (cp < 0x80) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (cp >> 18));
    out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

// ---------------------------------------------------------------------------
// Reader
// ---------------------------------------------------------------------------

class Reader {
 public:
  explicit Reader(const std::string& text) : s_(text) {}

  Value document() {
    Value v = value(0);
    skip_ws();
    if (!err_ && pos_ != s_.size()) fail("trailing data at offset " + std::to_string(pos_));
    return err_ ? Value{} : v;
  }

  const std::optional<JsonError>& error() const { return err_; }

 private:
  void fail(std::string message) {
    if (!err_) err_ = parse_error(std::move(message));
  }

  void skip_ws() {
    while (pos_ < s_.size() && is_ws(s_[pos_])) ++pos_;
  }

  bool consume(char c) {
    skip_ws();
    if (pos_ < s_.size() && s_[pos_] == c) {
      ++pos_;
      return true;
    }
    return false;
  }

  bool literal(const char* word) {
    const std::size_t n = std::strlen(word);
    if (s_.compare(pos_, n, word) != 0) return false;
    pos_ += n;
    return true;
  }

  Value value(int depth) {
    if (depth > kMaxDepth) {
      fail("nesting deeper than " + std::to_string(kMaxDepth));
      return {};
    }
    skip_ws();
    if (pos_ >= s_.size()) {
      fail("unexpected end of input");
      return {};
    }
    switch (s_[pos_]) {
      case '{': return Value{object(depth)};
      case '[': return Value{array(depth)};
      case '"': return Value{string()};
      default: break;
    }
    if (literal("true")) return Value{true};
    if (literal("false")) return Value{false};
    if (literal("null")) return Value{nullptr};
    return number();
  }

  uint32_t hex4() {
    if (pos_ + 4 > s_.size()) {
      fail("truncated \\u escape");
      return 0;
    }
    uint32_t cp = 0;
    for (int k = 0; k < 4; ++k) {
      const int h = hex_value(s_[pos_++]);
      if (h < 0) {
        fail("invalid \\u escape");
        return 0;
      }
      cp = (cp << 4) | static_cast<uint32_t>(h);
    }
    return cp;
  }

  std::string string() {
    std::string out;
    if (!consume('"')) {
      fail("expected string");
      return out;
    }
    while (pos_ < s_.size()) {
      const char c = s_[pos_++];
      if (c == '"') return out;
      if (static_cast<unsigned char>(c) < 0x20) {
        fail("unescaped control character in string");
        return out;
      }
      if (c != '\\') {
        out += c;
        continue;
      }
      if (pos_ >= s_.size()) break;
      const char esc = s_[pos_++];
      switch (esc) {
        case '"':  out += '"'; break;
        case '\\': out += '\\'; break;
        case '/':  out += '/'; break;
        case 'b':  out += '\b'; break;
        case 'f':  out += '\f'; break;
        case 'n':  out += '\n'; break;
        case 'r':  out += '\r'; break;
        case 't':  out += '\t'; break;
        case 'u': {
          uint32_t cp = hex4();
          if (err_) return out;
          if (cp >= 0xD800 && cp <= 0xDBFF) {
            if (!literal("\\u")) {
              fail("unpaired high surrogate");
              return out;
            }
            const uint32_t lo = hex4();
            if (err_) return out;
            if (lo < 0xDC00 || lo > 0xDFFF) {
              fail("invalid low surrogate");
              return out;
            }
            cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
          } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
            fail("unpaired low surrogate");
            return out;
          }
          put_utf8(out, cp);
          break;
        }
        default:
          fail(std::string("invalid escape \\") + esc);
          return out;
      }
    }
    fail("unterminated string");
    return out;
  }

  Value number() {
    const std::size_t start = pos_;
    if (s_.compare(pos_, 3, "NaN") == 0 || s_.compare(pos_, 8, "Infinity") == 0 ||
        s_.compare(pos_, 9, "-Infinity") == 0) {
      fail("NaN/Infinity unsupported");
      return {};
    }
    const bool negative = pos_ < s_.size() && s_[pos_] == '-';
    if (negative) ++pos_;
    if (pos_ >= s_.size() || !is_digit(s_[pos_])) {
      fail("unexpected token at offset " + std::to_string(start));
      return {};
    }
    while (pos_ < s_.size() && is_digit(s_[pos_])) ++pos_;

    bool integral = true;
    if (pos_ < s_.size() && s_[pos_] == '.') {
      integral = false;
      ++pos_;
      if (pos_ >= s_.size() || !is_digit(s_[pos_])) {
        fail("digit expected after decimal point");
        return {};
      }
      while (pos_ < s_.size() && is_digit(s_[pos_])) ++pos_;
    }
    if (pos_ < s_.size() && (s_[pos_] == 'e' || s_[pos_] == 'E')) {
      integral = false;
      ++pos_;
      if (pos_ < s_.size() && (s_[pos_] == '+' || s_[pos_] == '-')) ++pos_;
      if (pos_ >= s_.size() || !is_digit(s_[pos_])) {
        fail("digit expected in exponent");
        return {};
      }
      while (pos_ < s_.size() && is_digit(s_[pos_])) ++pos_;
    }

    const char* first = s_.data() + start;
    const char* last = s_.data() + pos_;
    // Negative integers are kept as doubles; the variant has no signed slot.
    if (integral && !negative) {
      std::uint64_t u = 0;
      auto [ptr, ec] = std::from_chars(first, last, u);
      if (ec != std::errc() || ptr != last) {
        fail("integer out of range");
        return {};
      }
      return Value{u};
    }
    const std::string text(first, last);
    char* end = nullptr;
    const double d = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size()) {
      fail("invalid number");
      return {};
    }
    return Value{d};
  }

  Object object(int depth) {
    Object out;
    consume('{');
    if (consume('}')) return out;
    while (!err_) {
      skip_ws();
      std::string key = string();
      if (err_) break;
      if (out.contains(key)) {
        err_ = JsonError{"json_duplicate_key", "duplicate key: " + key};
        break;
      }
      if (!consume(':')) {
        fail("expected ':' after key " + key);
        break;
      }
      Value v = value(depth + 1);
      if (err_) break;
      out.emplace(std::move(key), std::move(v));
      if (consume('}')) break;
      if (!consume(',')) fail("expected ',' or '}' in object");
    }
    return out;
  }

  Array array(int depth) {
    Array out;
    consume('[');
    if (consume(']')) return out;
    while (!err_) {
      out.push_back(value(depth + 1));
      if (err_) break;
      if (consume(']')) break;
      if (!consume(',')) fail("expected ',' or ']' in array");
    }
    return out;
  }

  const std::string& s_;
  std::size_t pos_{0};
  std::optional<JsonError> err_;
};

// ---------------------------------------------------------------------------
// Writer
// ---------------------------------------------------------------------------

void write_escaped(std::string& out, const std::string& s) {
  for (const char c : s) {
    switch (c) {
      case '"':  out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\b': out += "\\b"; break;
      case '\f': out += "\\f"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x",
                        static_cast<unsigned>(static_cast<unsigned char>(c)));
          out += buf;
        } else {
          out += c;
        }
    }
  }
}

void write(std::string& out, const Value& v) {
  if (const auto* s = std::get_if<std::string>(&v.v)) {
    out += '"';
    write_escaped(out, *s);
    out += '"';
  } else if (const auto* o = std::get_if<Object>(&v.v)) {
    out += '{';
    bool first = true;
    for (const auto& [k, child] : *o) {
      if (!first) out += ',';
      first = false;
      out += '"';
      write_escaped(out, k);
      out += "\":";
      write(out, child);
    }
    out += '}';
  } else if (const auto* a = std::get_if<Array>(&v.v)) {
    out += '[';
    for (std::size_t i = 0; i < a->size(); ++i) {
      if (i) out += ',';
      write(out, (*a)[i]);
    }
    out += ']';
  } else if (const auto* u = std::get_if<std::uint64_t>(&v.v)) {
    out += std::to_string(*u);
  } else if (const auto* d = std::get_if<double>(&v.v)) {
    out += format_double(*d);
  } else if (const auto* b = std::get_if<bool>(&v.v)) {
    out += *b ? "true" : "false";
  } else {
    out += "null";
  }
}

template <typename T>
const T* find_as(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  return it == obj.end() ? nullptr : std::get_if<T>(&it->second.v);
}

}  // namespace

// "%.6f" with trailing zeros trimmed to one fractional digit, so a double
// always reads back as a double ("1.0", never "1").
std::string format_double(double d) {
  char buf[64];
  const int n = std::snprintf(buf, sizeof(buf), "%.6f", d);
  if (n <= 0 || n >= static_cast<int>(sizeof(buf))) return "0.0";
  std::string out(buf, static_cast<std::size_t>(n));
  while (!out.empty() && out.back() == '0') out.pop_back();
  if (!out.empty() && out.back() == '.') out += '0';
  if (out == "-0.0") out = "0.0";
  return out;
}

std::string to_json(const Value& v) {
  std::string out;
  write(out, v);
  return out;
}

std::string escape(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  write_escaped(out, s);
  return out;
}

Value parse_value(const std::string& text, std::optional<JsonError>* error) {
  Reader reader(text);
  Value v = reader.document();
  if (error) *error = reader.error();
  return v;
}

Object parse(const std::string& text, std::optional<JsonError>* error) {
  std::optional<JsonError> err;
  Value v = parse_value(text, &err);
  if (!err && !v.is_object()) err = parse_error("expected a JSON object");
  if (error) *error = err;
  if (err) return {};
  return std::get<Object>(std::move(v.v));
}

std::optional<JsonError> validate_strict(const std::string& text) {
  std::optional<JsonError> err;
  parse_value(text, &err);
  return err;
}

std::string canonicalize_json(const std::string& text, std::optional<JsonError>* error) {
  std::optional<JsonError> err;
  const Value v = parse_value(text, &err);
  if (error) *error = err;
  return err ? std::string() : to_json(v);
}

// ---------------------------------------------------------------------------
// Extractors
// ---------------------------------------------------------------------------

std::string get_string(const Object& obj, const std::string& key, const std::string& def) {
  const auto* s = find_as<std::string>(obj, key);
  return s ? *s : def;
}

bool get_bool(const Object& obj, const std::string& key, bool def) {
  const auto* b = find_as<bool>(obj, key);
  return b ? *b : def;
}

unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def) {
  const auto* u = find_as<std::uint64_t>(obj, key);
  return u ? *u : def;
}

double get_double(const Object& obj, const std::string& key, double def) {
  if (const auto* d = find_as<double>(obj, key)) return *d;
  if (const auto* u = find_as<std::uint64_t>(obj, key)) return static_cast<double>(*u);
  return def;
}

std::vector<std::string> get_string_array(const Object& obj, const std::string& key) {
  std::vector<std::string> out;
  if (const auto* arr = find_as<Array>(obj, key)) {
    for (const auto& item : *arr) {
      if (const auto* s = std::get_if<std::string>(&item.v)) out.push_back(*s);
    }
  }
  return out;
}

std::map<std::string, std::string> get_string_map(const Object& obj, const std::string& key) {
  std::map<std::string, std::string> out;
  if (const auto* o = find_as<Object>(obj, key)) {
    for (const auto& [k, v] : *o) {
      if (const auto* s = std::get_if<std::string>(&v.v)) out[k] = *s;
    }
  }
  return out;
}

const Object* get_object(const Object& obj, const std::string& key) {
  return find_as<Object>(obj, key);
}

const Array* get_array(const Object& obj, const std::string& key) {
  return find_as<Array>(obj, key);
}

bool has_key(const Object& obj, const std::string& key) { return obj.find(key) != obj.end(); }

}  // namespace warden::jsonlite
