#pragma once

#include <string>

// Build/version metadata.
//
// CMake defines these macros through csdat_core's PUBLIC compile definitions. The fallbacks keep
// the header usable outside the CMake build.

#ifndef CSDAT_VERSION_MAJOR
#define CSDAT_VERSION_MAJOR 0
#endif

#ifndef CSDAT_VERSION_MINOR
#define CSDAT_VERSION_MINOR 0
#endif

#ifndef CSDAT_VERSION_PATCH
#define CSDAT_VERSION_PATCH 0
#endif

#ifndef CSDAT_VERSION_STRING
#define CSDAT_VERSION_STRING "0.0.0"
#endif

#ifndef CSDAT_GIT_SHA
#define CSDAT_GIT_SHA "unknown"
#endif

namespace csdat {

inline constexpr const char* CsdatVersionString()
{
  return CSDAT_VERSION_STRING;
}

inline std::string CsdatFullVersionString()
{
  std::string s = CsdatVersionString();
  const std::string sha = CSDAT_GIT_SHA;
  if (!sha.empty() && sha != "unknown") s += " (" + sha + ")";
  return s;
}

} // namespace csdat
