#include "csdat/Json.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <limits>
#include <locale>
#include <ostream>
#include <sstream>
#include <string_view>

namespace csdat {

JsonValue JsonValue::MakeNull() { return JsonValue{}; }

JsonValue JsonValue::MakeBool(bool b)
{
  JsonValue v;
  v.type = Type::Bool;
  v.boolValue = b;
  return v;
}

JsonValue JsonValue::MakeNumber(double n)
{
  JsonValue v;
  v.type = Type::Number;
  v.numberValue = n;
  return v;
}

JsonValue JsonValue::MakeString(std::string s)
{
  JsonValue v;
  v.type = Type::String;
  v.stringValue = std::move(s);
  return v;
}

JsonValue JsonValue::MakeArray()
{
  JsonValue v;
  v.type = Type::Array;
  return v;
}

JsonValue JsonValue::MakeObject()
{
  JsonValue v;
  v.type = Type::Object;
  return v;
}

void JsonValue::set(const std::string& key, JsonValue v)
{
  if (type != Type::Object) return;
  if (JsonValue* existing = FindJsonMember(*this, key)) {
    *existing = std::move(v);
    return;
  }
  objectValue.emplace_back(key, std::move(v));
}

void JsonValue::push(JsonValue v)
{
  if (type != Type::Array) return;
  arrayValue.push_back(std::move(v));
}

const JsonValue* FindJsonMember(const JsonValue& obj, const std::string& key)
{
  if (!obj.isObject()) return nullptr;
  for (const auto& kv : obj.objectValue) {
    if (kv.first == key) return &kv.second;
  }
  return nullptr;
}

JsonValue* FindJsonMember(JsonValue& obj, const std::string& key)
{
  if (!obj.isObject()) return nullptr;
  for (auto& kv : obj.objectValue) {
    if (kv.first == key) return &kv.second;
  }
  return nullptr;
}

namespace {

// nullptr with outError set when the member is required but absent.
const JsonValue* RequireMember(const JsonValue& obj, const char* key, bool required, std::string& outError)
{
  const JsonValue* v = FindJsonMember(obj, key);
  if (!v && required) outError = std::string("missing '") + key + "'";
  return v;
}

} // namespace

bool ReadJsonNumber(const JsonValue& obj, const char* key, double& out, bool required, std::string& outError)
{
  const JsonValue* v = RequireMember(obj, key, required, outError);
  if (!v) return !required;
  if (!v->isNumber() || !std::isfinite(v->numberValue)) {
    outError = std::string("'") + key + "' is not a finite number";
    return false;
  }
  out = v->numberValue;
  return true;
}

bool ReadJsonInt(const JsonValue& obj, const char* key, int& out, bool required, std::string& outError)
{
  double d = 0.0;
  if (!FindJsonMember(obj, key)) return ReadJsonNumber(obj, key, d, required, outError);
  if (!ReadJsonNumber(obj, key, d, true, outError)) return false;
  if (d < static_cast<double>(std::numeric_limits<int>::min()) ||
      d > static_cast<double>(std::numeric_limits<int>::max()) || std::floor(d) != d) {
    outError = std::string("'") + key + "' must be an integer";
    return false;
  }
  out = static_cast<int>(d);
  return true;
}

bool ReadJsonFloat(const JsonValue& obj, const char* key, float& out, bool required, std::string& outError)
{
  double d = 0.0;
  if (!FindJsonMember(obj, key)) return ReadJsonNumber(obj, key, d, required, outError);
  if (!ReadJsonNumber(obj, key, d, true, outError)) return false;
  if (std::fabs(d) > static_cast<double>(std::numeric_limits<float>::max())) {
    outError = std::string("'") + key + "' is out of float range";
    return false;
  }
  out = static_cast<float>(d);
  return true;
}

bool ReadJsonBool(const JsonValue& obj, const char* key, bool& out, bool required, std::string& outError)
{
  const JsonValue* v = RequireMember(obj, key, required, outError);
  if (!v) return !required;
  if (!v->isBool()) {
    outError = std::string("'") + key + "' is not a boolean";
    return false;
  }
  out = v->boolValue;
  return true;
}

bool ReadJsonString(const JsonValue& obj, const char* key, std::string& out, bool required, std::string& outError)
{
  const JsonValue* v = RequireMember(obj, key, required, outError);
  if (!v) return !required;
  if (!v->isString()) {
    outError = std::string("'") + key + "' is not a string";
    return false;
  }
  out = v->stringValue;
  return true;
}

namespace {

constexpr int kMaxDepth = 64;

class Parser {
public:
  explicit Parser(const std::string& text) : m_s(text) {}

  bool parse(JsonValue& out, std::string& outError)
  {
    skipWs();
    if (!parseValue(out, 0)) {
      outError = m_error;
      return false;
    }
    skipWs();
    if (m_pos != m_s.size()) {
      fail("trailing characters after JSON value");
      outError = m_error;
      return false;
    }
    return true;
  }

private:
  bool fail(const char* msg)
  {
    int line = 1;
    int column = 1;
    const std::size_t end = std::min(m_pos, m_s.size());
    for (std::size_t i = 0; i < end; ++i) {
      if (m_s[i] == '\n') {
        ++line;
        column = 1;
      } else {
        ++column;
      }
    }
    std::ostringstream oss;
    oss << msg << " (line " << line << ", column " << column << ")";
    m_error = oss.str();
    return false;
  }

  void skipWs()
  {
    while (m_pos < m_s.size()) {
      const char c = m_s[m_pos];
      if (c != ' ' && c != '\t' && c != '\n' && c != '\r') break;
      ++m_pos;
    }
  }

  bool consumeLiteral(const char* lit)
  {
    const std::string_view l(lit);
    if (m_s.compare(m_pos, l.size(), l) != 0) return false;
    m_pos += l.size();
    return true;
  }

  bool parseValue(JsonValue& out, int depth)
  {
    if (depth > kMaxDepth) return fail("JSON nesting too deep");
    if (m_pos >= m_s.size()) return fail("unexpected end of input");

    const char c = m_s[m_pos];
    if (c == '{') return parseObject(out, depth);
    if (c == '[') return parseArray(out, depth);
    if (c == '"') {
      out = JsonValue::MakeString({});
      return parseString(out.stringValue);
    }
    if (c == 't') {
      if (!consumeLiteral("true")) return fail("invalid literal");
      out = JsonValue::MakeBool(true);
      return true;
    }
    if (c == 'f') {
      if (!consumeLiteral("false")) return fail("invalid literal");
      out = JsonValue::MakeBool(false);
      return true;
    }
    if (c == 'n') {
      if (!consumeLiteral("null")) return fail("invalid literal");
      out = JsonValue::MakeNull();
      return true;
    }
    if (c == '-' || (c >= '0' && c <= '9')) return parseNumber(out);
    return fail("unexpected character");
  }

  bool parseNumber(JsonValue& out)
  {
    const std::size_t start = m_pos;
    auto digits = [&]() {
      const std::size_t d0 = m_pos;
      while (m_pos < m_s.size() && m_s[m_pos] >= '0' && m_s[m_pos] <= '9') ++m_pos;
      return m_pos > d0;
    };

    if (m_s[m_pos] == '-') ++m_pos;
    if (m_pos < m_s.size() && m_s[m_pos] == '0') {
      ++m_pos;
    } else if (!digits()) {
      return fail("invalid number");
    }
    if (m_pos < m_s.size() && m_s[m_pos] == '.') {
      ++m_pos;
      if (!digits()) return fail("invalid number fraction");
    }
    if (m_pos < m_s.size() && (m_s[m_pos] == 'e' || m_s[m_pos] == 'E')) {
      ++m_pos;
      if (m_pos < m_s.size() && (m_s[m_pos] == '+' || m_s[m_pos] == '-')) ++m_pos;
      if (!digits()) return fail("invalid number exponent");
    }

    const std::string tok = m_s.substr(start, m_pos - start);
    char* end = nullptr;
    const double v = std::strtod(tok.c_str(), &end);
    if (!end || *end != '\0' || !std::isfinite(v)) return fail("number out of range");
    out = JsonValue::MakeNumber(v);
    return true;
  }

  static void AppendUtf8(std::string& out, std::uint32_t cp)
  {
    if (cp < 0x80u) {
      out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800u) {
      out.push_back(static_cast<char>(0xC0u | (cp >> 6)));
      out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
    } else if (cp < 0x10000u) {
      out.push_back(static_cast<char>(0xE0u | (cp >> 12)));
      out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
      out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
    } else {
      out.push_back(static_cast<char>(0xF0u | (cp >> 18)));
      out.push_back(static_cast<char>(0x80u | ((cp >> 12) & 0x3Fu)));
      out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
      out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
    }
  }

  bool parseHex4(std::uint32_t& out)
  {
    if (m_pos + 4 > m_s.size()) return fail("invalid \\u escape");
    std::uint32_t v = 0;
    for (int i = 0; i < 4; ++i) {
      const char h = m_s[m_pos++];
      v <<= 4;
      if (h >= '0' && h <= '9') v |= static_cast<std::uint32_t>(h - '0');
      else if (h >= 'a' && h <= 'f') v |= static_cast<std::uint32_t>(h - 'a' + 10);
      else if (h >= 'A' && h <= 'F') v |= static_cast<std::uint32_t>(h - 'A' + 10);
      else return fail("invalid hex digit in \\u escape");
    }
    out = v;
    return true;
  }

  bool parseString(std::string& out)
  {
    ++m_pos; // opening quote
    out.clear();
    while (m_pos < m_s.size()) {
      const char c = m_s[m_pos++];
      if (c == '"') return true;
      if (static_cast<unsigned char>(c) < 0x20u) return fail("control character in string");
      if (c != '\\') {
        out.push_back(c);
        continue;
      }
      if (m_pos >= m_s.size()) break;
      const char e = m_s[m_pos++];
      switch (e) {
      case '"': out.push_back('"'); break;
      case '\\': out.push_back('\\'); break;
      case '/': out.push_back('/'); break;
      case 'b': out.push_back('\b'); break;
      case 'f': out.push_back('\f'); break;
      case 'n': out.push_back('\n'); break;
      case 'r': out.push_back('\r'); break;
      case 't': out.push_back('\t'); break;
      case 'u': {
        std::uint32_t cp = 0;
        if (!parseHex4(cp)) return false;
        // Combine a surrogate pair when one follows.
        if (cp >= 0xD800u && cp <= 0xDBFFu && m_s.compare(m_pos, 2, "\\u") == 0) {
          m_pos += 2;
          std::uint32_t lo = 0;
          if (!parseHex4(lo)) return false;
          if (lo < 0xDC00u || lo > 0xDFFFu) return fail("invalid surrogate pair");
          cp = 0x10000u + ((cp - 0xD800u) << 10) + (lo - 0xDC00u);
        }
        AppendUtf8(out, cp);
        break;
      }
      default: return fail("invalid escape");
      }
    }
    return fail("unterminated string");
  }

  bool parseArray(JsonValue& out, int depth)
  {
    ++m_pos;
    out = JsonValue::MakeArray();
    skipWs();
    if (m_pos < m_s.size() && m_s[m_pos] == ']') {
      ++m_pos;
      return true;
    }
    for (;;) {
      JsonValue item;
      skipWs();
      if (!parseValue(item, depth + 1)) return false;
      out.arrayValue.push_back(std::move(item));
      skipWs();
      if (m_pos >= m_s.size()) return fail("unterminated array");
      const char c = m_s[m_pos++];
      if (c == ']') return true;
      if (c != ',') return fail("expected ',' or ']'");
    }
  }

  bool parseObject(JsonValue& out, int depth)
  {
    ++m_pos;
    out = JsonValue::MakeObject();
    skipWs();
    if (m_pos < m_s.size() && m_s[m_pos] == '}') {
      ++m_pos;
      return true;
    }
    for (;;) {
      skipWs();
      if (m_pos >= m_s.size() || m_s[m_pos] != '"') return fail("expected object key");
      std::string key;
      if (!parseString(key)) return false;
      skipWs();
      if (m_pos >= m_s.size() || m_s[m_pos] != ':') return fail("expected ':'");
      ++m_pos;
      skipWs();
      JsonValue v;
      if (!parseValue(v, depth + 1)) return false;
      out.objectValue.emplace_back(std::move(key), std::move(v));
      skipWs();
      if (m_pos >= m_s.size()) return fail("unterminated object");
      const char c = m_s[m_pos++];
      if (c == '}') return true;
      if (c != ',') return fail("expected ',' or '}'");
    }
  }

  const std::string& m_s;
  std::size_t m_pos = 0;
  std::string m_error;
};

// Shortest of %.15g / %.17g that reads back to the same double.
std::string FormatNumber(double v)
{
  std::ostringstream oss;
  oss.imbue(std::locale::classic());
  oss << std::setprecision(15) << v;
  if (std::strtod(oss.str().c_str(), nullptr) != v) {
    oss.str({});
    oss << std::setprecision(std::numeric_limits<double>::max_digits10) << v;
  }
  return oss.str();
}

bool WriteValue(std::ostream& os, const JsonValue& v, const JsonWriteOptions& opt, int depth, std::string& outError)
{
  auto newline = [&](int d) {
    if (!opt.pretty) return;
    os << '\n';
    for (int i = 0; i < d * opt.indent; ++i) os << ' ';
  };

  switch (v.type) {
  case JsonValue::Type::Null: os << "null"; break;
  case JsonValue::Type::Bool: os << (v.boolValue ? "true" : "false"); break;
  case JsonValue::Type::Number:
    if (!std::isfinite(v.numberValue)) {
      outError = "cannot serialize non-finite number";
      return false;
    }
    os << FormatNumber(v.numberValue);
    break;
  case JsonValue::Type::String: os << '"' << JsonEscape(v.stringValue) << '"'; break;
  case JsonValue::Type::Array:
    os << '[';
    for (std::size_t i = 0; i < v.arrayValue.size(); ++i) {
      if (i > 0) os << ',';
      newline(depth + 1);
      if (!WriteValue(os, v.arrayValue[i], opt, depth + 1, outError)) return false;
    }
    if (!v.arrayValue.empty()) newline(depth);
    os << ']';
    break;
  case JsonValue::Type::Object:
    os << '{';
    for (std::size_t i = 0; i < v.objectValue.size(); ++i) {
      if (i > 0) os << ',';
      newline(depth + 1);
      os << '"' << JsonEscape(v.objectValue[i].first) << "\":";
      if (opt.pretty) os << ' ';
      if (!WriteValue(os, v.objectValue[i].second, opt, depth + 1, outError)) return false;
    }
    if (!v.objectValue.empty()) newline(depth);
    os << '}';
    break;
  }

  if (!os) {
    outError = "stream write failed";
    return false;
  }
  return true;
}

} // namespace

bool ParseJson(const std::string& text, JsonValue& outValue, std::string& outError)
{
  outError.clear();
  JsonValue v;
  Parser p(text);
  if (!p.parse(v, outError)) return false;
  outValue = std::move(v);
  return true;
}

std::string JsonEscape(const std::string& s)
{
  std::string out;
  out.reserve(s.size() + 8);
  for (const char c : s) {
    switch (c) {
    case '"': out += "\\\""; break;
    case '\\': out += "\\\\"; break;
    case '\b': out += "\\b"; break;
    case '\f': out += "\\f"; break;
    case '\n': out += "\\n"; break;
    case '\r': out += "\\r"; break;
    case '\t': out += "\\t"; break;
    default:
      if (static_cast<unsigned char>(c) < 0x20u) {
        static const char* kHex = "0123456789abcdef";
        out += "\\u00";
        out.push_back(kHex[(static_cast<unsigned char>(c) >> 4) & 0xFu]);
        out.push_back(kHex[static_cast<unsigned char>(c) & 0xFu]);
      } else {
        out.push_back(c);
      }
      break;
    }
  }
  return out;
}

bool WriteJson(std::ostream& os, const JsonValue& value, std::string& outError, const JsonWriteOptions& opt)
{
  outError.clear();
  if (!WriteValue(os, value, opt, 0, outError)) return false;
  if (opt.pretty) os << '\n';
  return static_cast<bool>(os);
}

std::string JsonStringify(const JsonValue& value, const JsonWriteOptions& opt)
{
  std::ostringstream oss;
  std::string err;
  if (!WriteJson(oss, value, err, opt)) return {};
  return oss.str();
}

bool WriteJsonFile(const std::string& path, const JsonValue& value, std::string& outError,
                   const JsonWriteOptions& opt)
{
  std::ofstream f(path, std::ios::binary);
  if (!f) {
    outError = "failed to open file for writing: " + path;
    return false;
  }
  if (!WriteJson(f, value, outError, opt)) return false;
  f.flush();
  if (!f) {
    outError = "failed while writing file: " + path;
    return false;
  }
  return true;
}

bool ReadJsonFile(const std::string& path, JsonValue& outValue, std::string& outError)
{
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    outError = "failed to open file for reading: " + path;
    return false;
  }
  std::ostringstream ss;
  ss << f.rdbuf();
  if (!ParseJson(ss.str(), outValue, outError)) {
    outError = path + ": " + outError;
    return false;
  }
  return true;
}

} // namespace csdat
