#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>
#include <utility>
#include <vector>

namespace csdat {

// -----------------------------------------------------------------------------------------------
// JSON for sidecars and tool reports
//
// A small tree type plus a strict parser (RFC 8259: no comments, no trailing commas, no
// leading zeros) and a writer. Numbers are doubles. Object members keep insertion order so
// reports diff cleanly between runs. Parse errors name the line and column.
// -----------------------------------------------------------------------------------------------
struct JsonValue {
  enum class Type : std::uint8_t {
    Null,
    Bool,
    Number,
    String,
    Array,
    Object,
  };

  using Member = std::pair<std::string, JsonValue>;

  Type type = Type::Null;

  bool boolValue = false;
  double numberValue = 0.0;
  std::string stringValue;
  std::vector<JsonValue> arrayValue;
  std::vector<Member> objectValue;

  static JsonValue MakeNull();
  static JsonValue MakeBool(bool b);
  static JsonValue MakeNumber(double n);
  static JsonValue MakeString(std::string s);
  static JsonValue MakeArray();
  static JsonValue MakeObject();

  bool isNull() const { return type == Type::Null; }
  bool isBool() const { return type == Type::Bool; }
  bool isNumber() const { return type == Type::Number; }
  bool isString() const { return type == Type::String; }
  bool isArray() const { return type == Type::Array; }
  bool isObject() const { return type == Type::Object; }

  // Objects: replace the member named key, or append it. Ignored for other types.
  void set(const std::string& key, JsonValue v);

  // Arrays: append. Ignored for other types.
  void push(JsonValue v);
};

const JsonValue* FindJsonMember(const JsonValue& obj, const std::string& key);
JsonValue* FindJsonMember(JsonValue& obj, const std::string& key);

// Typed member reads for loaders.
//
// A member that is present with the wrong type (or a non-finite / out-of-range number) is
// always an error. An absent member is an error only when required; otherwise out is left
// untouched.
bool ReadJsonNumber(const JsonValue& obj, const char* key, double& out, bool required, std::string& outError);
bool ReadJsonInt(const JsonValue& obj, const char* key, int& out, bool required, std::string& outError);
bool ReadJsonFloat(const JsonValue& obj, const char* key, float& out, bool required, std::string& outError);
bool ReadJsonBool(const JsonValue& obj, const char* key, bool& out, bool required, std::string& outError);
bool ReadJsonString(const JsonValue& obj, const char* key, std::string& out, bool required, std::string& outError);

bool ParseJson(const std::string& text, JsonValue& outValue, std::string& outError);
bool ReadJsonFile(const std::string& path, JsonValue& outValue, std::string& outError);

// Body of a JSON string literal for s (quotes not included).
std::string JsonEscape(const std::string& s);

struct JsonWriteOptions {
  bool pretty = true;
  int indent = 2;
};

// Fails on NaN / infinity and on stream errors.
bool WriteJson(std::ostream& os, const JsonValue& value, std::string& outError, const JsonWriteOptions& opt = {});
bool WriteJsonFile(const std::string& path, const JsonValue& value, std::string& outError,
                   const JsonWriteOptions& opt = {});

// Empty string if the value cannot be written.
std::string JsonStringify(const JsonValue& value, const JsonWriteOptions& opt = {});

} // namespace csdat
