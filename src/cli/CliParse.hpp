#pragma once

// Shared CLI parsing and filesystem helpers for the csdat tools.
//
// Every tool uses the same strict rules: whole-string parses only, finite floats, 0|1 style
// booleans and XxY pairs.

#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <filesystem>
#include <limits>
#include <string>
#include <string_view>
#include <system_error>

namespace csdat::cli {

namespace detail {

// Whole-string std::from_chars with an optional leading '+'. No whitespace, no partial reads.
template <typename T>
bool ParseWhole(std::string_view s, T& out)
{
  if (!s.empty() && s.front() == '+') s.remove_prefix(1);
  if (s.empty() || s.front() == '+') return false;

  T v{};
  const char* last = s.data() + s.size();
  const std::from_chars_result r = std::from_chars(s.data(), last, v);
  if (r.ec != std::errc{} || r.ptr != last) return false;
  out = v;
  return true;
}

inline bool EqualsNoCase(std::string_view a, std::string_view b)
{
  if (a.size() != b.size()) return false;
  for (std::size_t i = 0; i < a.size(); ++i) {
    const int ca = std::tolower(static_cast<unsigned char>(a[i]));
    const int cb = std::tolower(static_cast<unsigned char>(b[i]));
    if (ca != cb) return false;
  }
  return true;
}

} // namespace detail

// Creates the directory that will hold file. A bare file name needs nothing.
inline bool EnsureParentDir(const std::filesystem::path& file)
{
  if (file.empty()) return false;
  const std::filesystem::path dir = file.parent_path();
  if (dir.empty()) return true;
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  return !ec;
}

inline bool ParseI32(std::string_view s, int* out)
{
  return out && detail::ParseWhole(s, *out);
}

// Rejects nan/inf and anything that overflows a double.
inline bool ParseF64(std::string_view s, double* out)
{
  double v = 0.0;
  if (!out || !detail::ParseWhole(s, v) || !std::isfinite(v)) return false;
  *out = v;
  return true;
}

inline bool ParseF32(std::string_view s, float* out)
{
  double v = 0.0;
  if (!out || !ParseF64(s, &v)) return false;
  constexpr double kFloatMax = static_cast<double>(std::numeric_limits<float>::max());
  if (v > kFloatMax || v < -kFloatMax) return false;
  *out = static_cast<float>(v);
  return true;
}

// Accepts 0/1, true/false, on/off, yes/no in any letter case.
inline bool ParseBool01(std::string_view s, bool* out)
{
  if (!out) return false;
  static constexpr std::array<std::string_view, 4> kOff{"0", "false", "off", "no"};
  static constexpr std::array<std::string_view, 4> kOn{"1", "true", "on", "yes"};
  for (std::size_t i = 0; i < kOn.size(); ++i) {
    if (detail::EqualsNoCase(s, kOff[i])) {
      *out = false;
      return true;
    }
    if (detail::EqualsNoCase(s, kOn[i])) {
      *out = true;
      return true;
    }
  }
  return false;
}

// "8x8", "12X4". Both parts must be positive.
inline bool ParseWxH(std::string_view s, int* outW, int* outH)
{
  if (!outW || !outH) return false;
  const std::size_t sep = s.find_first_of("xX");
  if (sep == std::string_view::npos) return false;

  int w = 0;
  int h = 0;
  if (!ParseI32(s.substr(0, sep), &w) || !ParseI32(s.substr(sep + 1), &h)) return false;
  if (w < 1 || h < 1) return false;
  *outW = w;
  *outH = h;
  return true;
}

// Sidecar path derived from an image path: "edit/terrain.png" -> "edit/terrain.meta.json".
inline std::filesystem::path MetaPathForImage(const std::filesystem::path& image)
{
  std::filesystem::path p = image;
  p.replace_extension("");
  p += ".meta.json";
  return p;
}

} // namespace csdat::cli
