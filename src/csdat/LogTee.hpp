#pragma once

#include <filesystem>
#include <memory>
#include <string>

namespace csdat {

// RAII helper that duplicates std::cout / std::cerr into a log file.
//
// Every line written to the file is prefixed with a UTC timestamp and the stream it came from:
//   2026-10-17T08:12:03.417Z [OUT] imported 64/64 sectors
//   2026-10-17T08:12:03.418Z [ERR] sector 3 (sd3.csdat): truncated
// Console output is not modified.
//
// Existing logs are rotated before the file is opened: <log> -> <log>.1 -> ... -> <log>.keepFiles.
struct LogTeeOptions {
  std::filesystem::path path;

  // Rotated backups to keep. 0 truncates the existing file instead.
  int keepFiles = 3;

  bool teeStdout = true;
  bool teeStderr = true;

  bool prefixLines = true;
};

class LogTee {
public:
  LogTee();
  ~LogTee();

  LogTee(const LogTee&) = delete;
  LogTee& operator=(const LogTee&) = delete;

  // Start logging. An active tee is stopped first.
  bool start(const LogTeeOptions& opt, std::string& outError);

  // Restore the original stream buffers and close the file.
  void stop();

  bool active() const;
  const std::filesystem::path& path() const;

  static bool Rotate(const std::filesystem::path& basePath, int keepFiles, std::string& outError);

private:
  struct Impl;
  std::unique_ptr<Impl> m_impl;
};

} // namespace csdat
