#include "csdat/SectorDirectory.hpp"

#include <algorithm>
#include <charconv>
#include <map>
#include <sstream>
#include <system_error>

namespace csdat {

namespace {

constexpr std::string_view kPrefix = "sd";
constexpr std::string_view kSuffix = ".csdat";

} // namespace

const char* DirectoryErrorName(DirectoryError e)
{
  switch (e) {
  case DirectoryError::None: return "none";
  case DirectoryError::NotFound: return "not_found";
  case DirectoryError::Unreadable: return "unreadable";
  case DirectoryError::NoMatches: return "no_matches";
  case DirectoryError::DuplicateIndex: return "duplicate_index";
  default: return "unknown";
  }
}

bool ParseSectorFileName(std::string_view fileName, int* outIndex)
{
  if (!outIndex) return false;
  if (fileName.size() <= kPrefix.size() + kSuffix.size()) return false;
  if (fileName.substr(0, kPrefix.size()) != kPrefix) return false;
  if (fileName.substr(fileName.size() - kSuffix.size()) != kSuffix) return false;

  const std::string_view digits = fileName.substr(kPrefix.size(), fileName.size() - kPrefix.size() - kSuffix.size());
  for (const char c : digits) {
    if (c < '0' || c > '9') return false;
  }

  int v = 0;
  const char* begin = digits.data();
  const char* end = digits.data() + digits.size();
  const auto res = std::from_chars(begin, end, v, 10);
  if (res.ec != std::errc() || res.ptr != end) return false;
  *outIndex = v;
  return true;
}

std::string SectorFileName(int index)
{
  std::string s(kPrefix);
  s += std::to_string(index);
  s += kSuffix;
  return s;
}

DirectoryError ListSectorFiles(const std::filesystem::path& dir, std::vector<SectorFileEntry>& outEntries,
                               std::string& outError, const SectorScanConfig& cfg, SectorScanReport* outReport)
{
  namespace fs = std::filesystem;

  outError.clear();
  outEntries.clear();
  SectorScanReport report;

  std::error_code ec;
  if (!fs::is_directory(dir, ec) || ec) {
    outError = "not a directory: " + dir.string();
    if (outReport) *outReport = report;
    return DirectoryError::NotFound;
  }

  std::vector<fs::path> files;
  fs::directory_iterator it(dir, ec);
  if (ec) {
    outError = "failed to read directory '" + dir.string() + "': " + ec.message();
    if (outReport) *outReport = report;
    return DirectoryError::Unreadable;
  }
  for (; it != fs::directory_iterator(); it.increment(ec)) {
    if (ec) break;
    std::error_code fec;
    if (!it->is_regular_file(fec) || fec) continue;
    files.push_back(it->path());
  }
  if (ec) {
    outError = "failed while reading directory '" + dir.string() + "': " + ec.message();
    if (outReport) *outReport = report;
    return DirectoryError::Unreadable;
  }

  std::sort(files.begin(), files.end(), [](const fs::path& a, const fs::path& b) {
    return a.filename().string() < b.filename().string();
  });

  std::map<int, fs::path> byIndex;
  for (const fs::path& p : files) {
    report.filesSeen++;

    int index = 0;
    if (!ParseSectorFileName(p.filename().string(), &index)) {
      report.skippedNames++;
      continue;
    }

    auto found = byIndex.find(index);
    if (found != byIndex.end()) {
      report.duplicateIndices.push_back(index);
      found->second = p;
      continue;
    }
    byIndex.emplace(index, p);
  }

  std::sort(report.duplicateIndices.begin(), report.duplicateIndices.end());
  report.duplicateIndices.erase(std::unique(report.duplicateIndices.begin(), report.duplicateIndices.end()),
                                report.duplicateIndices.end());

  if (outReport) *outReport = report;

  if (byIndex.empty()) {
    outError = "no sd<index>.csdat files found in " + dir.string();
    return DirectoryError::NoMatches;
  }

  if (cfg.rejectDuplicates && !report.duplicateIndices.empty()) {
    std::ostringstream oss;
    oss << "duplicate sector indices:";
    for (const int idx : report.duplicateIndices) oss << " " << idx;
    outError = oss.str();
    return DirectoryError::DuplicateIndex;
  }

  outEntries.reserve(byIndex.size());
  for (const auto& kv : byIndex) {
    outEntries.push_back(SectorFileEntry{kv.first, kv.second});
  }
  return DirectoryError::None;
}

} // namespace csdat
