#include "rompatch/Json.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <ostream>
#include <sstream>

namespace rompatch {

namespace {

JsonValue MakeJson(JsonValue::Type type)
{
  JsonValue v;
  v.type = type;
  return v;
}

JsonValue MakeJsonBool(bool b)
{
  JsonValue v = MakeJson(JsonValue::Type::Bool);
  v.boolValue = b;
  return v;
}

} // namespace

const JsonValue* FindJsonMember(const JsonValue& obj, const std::string& key)
{
  if (!obj.isObject()) return nullptr;
  for (const auto& kv : obj.objectValue) {
    if (kv.first == key) return &kv.second;
  }
  return nullptr;
}

std::string JsonEscape(const std::string& s)
{
  static const char* hex = "0123456789abcdef";

  std::string out;
  out.reserve(s.size() + 2);
  for (unsigned char ch : s) {
    switch (ch) {
    case '\\': out += "\\\\"; break;
    case '"': out += "\\\""; break;
    case '\b': out += "\\b"; break;
    case '\f': out += "\\f"; break;
    case '\n': out += "\\n"; break;
    case '\r': out += "\\r"; break;
    case '\t': out += "\\t"; break;
    default:
      if (ch < 0x20) {
        out += "\\u00";
        out.push_back(hex[(ch >> 4) & 0xF]);
        out.push_back(hex[ch & 0xF]);
      } else {
        out.push_back(static_cast<char>(ch));
      }
      break;
    }
  }
  return out;
}

namespace {

constexpr int kMaxJsonDepth = 64;

void AppendUtf8(std::string& out, unsigned int code)
{
  if (code <= 0x7F) {
    out.push_back(static_cast<char>(code));
  } else if (code <= 0x7FF) {
    out.push_back(static_cast<char>(0xC0 | (code >> 6)));
    out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xE0 | (code >> 12)));
    out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
  }
}

struct Parser {
  const std::string& s;
  std::size_t i = 0;
  int depth = 0;
  std::string err;

  explicit Parser(const std::string& str) : s(str) {}

  void skipWs()
  {
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i])) != 0) ++i;
  }

  char peek() const { return i < s.size() ? s[i] : '\0'; }

  bool consume(char c)
  {
    if (peek() != c) return false;
    ++i;
    return true;
  }

  bool fail(const std::string& msg)
  {
    std::ostringstream oss;
    oss << "JSON parse error @" << i << ": " << msg;
    err = oss.str();
    return false;
  }

  bool parseValue(JsonValue& out)
  {
    skipWs();
    const char c = peek();
    if (c == '\0') return fail("unexpected end of input");

    if (c == 'n') return parseLiteral("null", JsonValue{}, out);
    if (c == 't') return parseLiteral("true", MakeJsonBool(true), out);
    if (c == 'f') return parseLiteral("false", MakeJsonBool(false), out);
    if (c == '"') {
      std::string tmp;
      if (!parseString(tmp)) return false;
      out = MakeJson(JsonValue::Type::String);
      out.stringValue = std::move(tmp);
      return true;
    }
    if (c == '[' || c == '{') {
      if (++depth > kMaxJsonDepth) return fail("nesting too deep");
      const bool ok = (c == '[') ? parseArray(out) : parseObject(out);
      --depth;
      return ok;
    }
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c)) != 0) return parseNumber(out);

    return fail(std::string("unexpected character '") + c + "'");
  }

  bool parseLiteral(const char* word, JsonValue v, JsonValue& out)
  {
    const std::string w(word);
    if (s.compare(i, w.size(), w) != 0) return fail("expected '" + w + "'");
    i += w.size();
    out = std::move(v);
    return true;
  }

  bool parseNumber(JsonValue& out)
  {
    const std::size_t start = i;

    if (peek() == '-') ++i;

    if (peek() == '0') {
      ++i;
    } else {
      if (std::isdigit(static_cast<unsigned char>(peek())) == 0) return fail("expected digit");
      while (std::isdigit(static_cast<unsigned char>(peek())) != 0) ++i;
    }

    if (peek() == '.') {
      ++i;
      if (std::isdigit(static_cast<unsigned char>(peek())) == 0) return fail("expected digit after '.'");
      while (std::isdigit(static_cast<unsigned char>(peek())) != 0) ++i;
    }

    if (peek() == 'e' || peek() == 'E') {
      ++i;
      if (peek() == '+' || peek() == '-') ++i;
      if (std::isdigit(static_cast<unsigned char>(peek())) == 0) return fail("expected exponent digits");
      while (std::isdigit(static_cast<unsigned char>(peek())) != 0) ++i;
    }

    const std::string numStr = s.substr(start, i - start);
    errno = 0;
    char* end = nullptr;
    const double v = std::strtod(numStr.c_str(), &end);
    if (errno != 0 || end == numStr.c_str() || (end && *end != '\0')) return fail("invalid number");

    out = MakeJson(JsonValue::Type::Number);
    out.numberValue = v;
    return true;
  }

  bool parseHex4(unsigned int& code)
  {
    if (i + 4 > s.size()) return fail("invalid \\u escape");
    code = 0;
    for (int k = 0; k < 4; ++k) {
      const char h = s[i++];
      code <<= 4;
      if (h >= '0' && h <= '9') code |= static_cast<unsigned int>(h - '0');
      else if (h >= 'a' && h <= 'f') code |= static_cast<unsigned int>(h - 'a' + 10);
      else if (h >= 'A' && h <= 'F') code |= static_cast<unsigned int>(h - 'A' + 10);
      else return fail("invalid hex digit in \\u escape");
    }
    return true;
  }

  bool parseString(std::string& out)
  {
    skipWs();
    if (!consume('"')) return fail("expected string");

    std::string result;
    while (i < s.size()) {
      const char c = s[i++];
      if (c == '"') {
        out = std::move(result);
        return true;
      }
      if (static_cast<unsigned char>(c) < 0x20) return fail("control character in string");
      if (c != '\\') {
        result.push_back(c);
        continue;
      }

      if (i >= s.size()) return fail("unterminated escape sequence");
      const char e = s[i++];
      switch (e) {
      case '"': result.push_back('"'); break;
      case '\\': result.push_back('\\'); break;
      case '/': result.push_back('/'); break;
      case 'b': result.push_back('\b'); break;
      case 'f': result.push_back('\f'); break;
      case 'n': result.push_back('\n'); break;
      case 'r': result.push_back('\r'); break;
      case 't': result.push_back('\t'); break;
      case 'u': {
        unsigned int code = 0;
        if (!parseHex4(code)) return false;
        // Surrogate pairs are outside what config files need.
        if (code >= 0xD800 && code <= 0xDFFF) return fail("surrogate \\u escapes are not supported");
        AppendUtf8(result, code);
        break;
      }
      default: return fail("unknown escape sequence");
      }
    }

    return fail("unterminated string");
  }

  bool parseArray(JsonValue& out)
  {
    if (!consume('[')) return fail("expected '['");

    JsonValue arr = MakeJson(JsonValue::Type::Array);
    skipWs();
    if (consume(']')) {
      out = std::move(arr);
      return true;
    }

    while (true) {
      JsonValue v;
      if (!parseValue(v)) return false;
      arr.arrayValue.push_back(std::move(v));

      skipWs();
      if (consume(']')) break;
      if (!consume(',')) return fail("expected ',' or ']'");
    }

    out = std::move(arr);
    return true;
  }

  bool parseObject(JsonValue& out)
  {
    if (!consume('{')) return fail("expected '{'");

    JsonValue obj = MakeJson(JsonValue::Type::Object);
    skipWs();
    if (consume('}')) {
      out = std::move(obj);
      return true;
    }

    while (true) {
      std::string key;
      if (!parseString(key)) return false;

      skipWs();
      if (!consume(':')) return fail("expected ':'");

      JsonValue val;
      if (!parseValue(val)) return false;

      obj.objectValue.emplace_back(std::move(key), std::move(val));

      skipWs();
      if (consume('}')) break;
      if (!consume(',')) return fail("expected ',' or '}'");
    }

    out = std::move(obj);
    return true;
  }
};

} // namespace

bool ParseJson(const std::string& text, JsonValue& outValue, std::string& outError)
{
  Parser p(text);
  JsonValue v;
  if (!p.parseValue(v)) {
    outError = p.err;
    return false;
  }
  p.skipWs();
  if (p.i != text.size()) {
    outError = std::string("JSON parse error @") + std::to_string(p.i) + ": trailing characters";
    return false;
  }

  outValue = std::move(v);
  outError.clear();
  return true;
}

// --- JsonWriter ---

JsonWriter::JsonWriter(std::ostream& os, JsonWriteOptions opt) : m_os(&os), m_opt(opt) {}

bool JsonWriter::setError(std::string msg)
{
  if (m_error.empty()) m_error = std::move(msg);
  return false;
}

bool JsonWriter::writeRaw(const std::string& s)
{
  (*m_os) << s;
  if (!(*m_os)) return setError("stream write failed");
  return true;
}

void JsonWriter::indent(std::size_t depth)
{
  if (!m_opt.pretty) return;
  (*m_os) << '\n';
  for (std::size_t d = 0; d < depth * static_cast<std::size_t>(m_opt.indent); ++d) (*m_os) << ' ';
}

bool JsonWriter::prepareValue()
{
  if (!ok()) return false;
  if (m_done) return setError("JsonWriter: value after document end");
  if (m_stack.empty()) return true;

  Frame& f = m_stack.back();
  if (f.kind == Frame::Kind::Object) {
    if (f.expectingKey) return setError("JsonWriter: expected key() before value");
    return true;
  }

  if (!f.first) (*m_os) << ',';
  f.first = false;
  indent(m_stack.size());
  return true;
}

void JsonWriter::finishValue()
{
  if (m_stack.empty()) {
    m_done = true;
    return;
  }
  Frame& f = m_stack.back();
  if (f.kind == Frame::Kind::Object) f.expectingKey = true;
}

bool JsonWriter::beginContainer(Frame::Kind kind, char openChar)
{
  if (!prepareValue()) return false;
  (*m_os) << openChar;
  Frame f;
  f.kind = kind;
  m_stack.push_back(f);
  return ok();
}

bool JsonWriter::endContainer(Frame::Kind kind, char closeChar)
{
  if (!ok()) return false;
  if (m_stack.empty() || m_stack.back().kind != kind) return setError("JsonWriter: mismatched container end");
  const Frame f = m_stack.back();
  if (f.kind == Frame::Kind::Object && !f.expectingKey) return setError("JsonWriter: key without value");

  m_stack.pop_back();
  if (!f.first) indent(m_stack.size());
  (*m_os) << closeChar;
  finishValue();
  return ok();
}

bool JsonWriter::beginObject() { return beginContainer(Frame::Kind::Object, '{'); }
bool JsonWriter::endObject() { return endContainer(Frame::Kind::Object, '}'); }
bool JsonWriter::beginArray() { return beginContainer(Frame::Kind::Array, '['); }
bool JsonWriter::endArray() { return endContainer(Frame::Kind::Array, ']'); }

bool JsonWriter::key(const std::string& k)
{
  if (!ok()) return false;
  if (m_stack.empty() || m_stack.back().kind != Frame::Kind::Object) {
    return setError("JsonWriter: key() outside of object");
  }
  Frame& f = m_stack.back();
  if (!f.expectingKey) return setError("JsonWriter: two keys in a row");

  if (!f.first) (*m_os) << ',';
  f.first = false;
  f.expectingKey = false;
  indent(m_stack.size());
  return writeRaw("\"" + JsonEscape(k) + (m_opt.pretty ? "\": " : "\":"));
}

bool JsonWriter::nullValue()
{
  if (!prepareValue() || !writeRaw("null")) return false;
  finishValue();
  return true;
}

bool JsonWriter::boolValue(bool b)
{
  if (!prepareValue() || !writeRaw(b ? "true" : "false")) return false;
  finishValue();
  return true;
}

bool JsonWriter::numberValue(double n)
{
  if (!std::isfinite(n)) return setError("JsonWriter: non-finite number");
  if (!prepareValue()) return false;
  std::ostringstream oss;
  oss.precision(17);
  oss << n;
  if (!writeRaw(oss.str())) return false;
  finishValue();
  return true;
}

bool JsonWriter::intValue(std::int64_t n)
{
  if (!prepareValue() || !writeRaw(std::to_string(n))) return false;
  finishValue();
  return true;
}

bool JsonWriter::uintValue(std::uint64_t n)
{
  if (!prepareValue() || !writeRaw(std::to_string(n))) return false;
  finishValue();
  return true;
}

bool JsonWriter::stringValue(const std::string& s)
{
  if (!prepareValue() || !writeRaw("\"" + JsonEscape(s) + "\"")) return false;
  finishValue();
  return true;
}

bool JsonWriter::finish()
{
  if (!ok()) return false;
  if (!m_stack.empty()) return setError("JsonWriter: unclosed container");
  if (!m_done) return setError("JsonWriter: empty document");
  return writeRaw("\n");
}

} // namespace rompatch
