#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>
#include <utility>
#include <vector>

namespace rompatch {

// Minimal JSON value + parser, used for diff configuration files.
//
// Notes:
//  - Strict JSON: no comments, no trailing commas.
//  - Numbers are parsed as double.
//  - Objects keep their members in file order.
struct JsonValue {
  enum class Type : std::uint8_t {
    Null,
    Bool,
    Number,
    String,
    Array,
    Object,
  };

  Type type = Type::Null;

  bool boolValue = false;
  double numberValue = 0.0;
  std::string stringValue;
  std::vector<JsonValue> arrayValue;
  std::vector<std::pair<std::string, JsonValue>> objectValue;

  bool isNull() const { return type == Type::Null; }
  bool isBool() const { return type == Type::Bool; }
  bool isNumber() const { return type == Type::Number; }
  bool isString() const { return type == Type::String; }
  bool isArray() const { return type == Type::Array; }
  bool isObject() const { return type == Type::Object; }
};

const JsonValue* FindJsonMember(const JsonValue& obj, const std::string& key);

bool ParseJson(const std::string& text, JsonValue& outValue, std::string& outError);

// Escape a string for use inside a JSON string literal (no surrounding quotes).
std::string JsonEscape(const std::string& s);

struct JsonWriteOptions {
  bool pretty = true;
  int indent = 2;
};

// Streaming JSON writer. Callers control key order, so output is
// deterministic.
//
// On misuse (a value where a key is expected, unbalanced containers, ...) the
// writer records an error and every later call returns false.
class JsonWriter {
public:
  explicit JsonWriter(std::ostream& os, JsonWriteOptions opt = {});

  bool ok() const { return m_error.empty(); }
  const std::string& error() const { return m_error; }

  bool beginObject();
  bool endObject();
  bool beginArray();
  bool endArray();

  bool key(const std::string& k);

  bool nullValue();
  bool boolValue(bool b);
  bool numberValue(double n);
  bool intValue(std::int64_t n);
  bool uintValue(std::uint64_t n);
  bool stringValue(const std::string& s);

  // Finish the document with a trailing newline. Fails if containers are
  // still open.
  bool finish();

private:
  struct Frame {
    enum class Kind : std::uint8_t {
      Object,
      Array,
    };

    Kind kind = Kind::Object;
    bool first = true;
    bool expectingKey = true; // objects only
  };

  bool setError(std::string msg);

  bool writeRaw(const std::string& s);
  void indent(std::size_t depth);

  bool prepareValue();
  void finishValue();

  bool beginContainer(Frame::Kind kind, char openChar);
  bool endContainer(Frame::Kind kind, char closeChar);

  std::ostream* m_os = nullptr;
  JsonWriteOptions m_opt{};
  std::vector<Frame> m_stack;
  bool m_done = false;
  std::string m_error;
};

} // namespace rompatch
