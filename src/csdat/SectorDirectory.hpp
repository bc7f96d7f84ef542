#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace csdat {

// -----------------------------------------------------------------------------------------------
// Sector file discovery
//
// Sector files are named sd<index>.csdat, where <index> is the decimal row-major sector index
// (index = sectorRow * sectorsX + sectorCol). Names that do not follow the pattern are skipped.
//
// Candidates are visited in lexicographic filename order so the result never depends on the
// order the OS returns directory entries in. If two names parse to the same index
// (e.g. sd7.csdat and sd07.csdat) the last visited one wins and the index is reported.
// -----------------------------------------------------------------------------------------------

enum class DirectoryError : std::uint8_t {
  None = 0,
  NotFound = 1,       // path does not exist or is not a directory
  Unreadable = 2,     // directory iteration failed
  NoMatches = 3,      // no sd<index>.csdat files found
  DuplicateIndex = 4, // two files map to one index (only with SectorScanConfig::rejectDuplicates)
};

const char* DirectoryErrorName(DirectoryError e);

struct SectorFileEntry {
  int index = 0;
  std::filesystem::path path;
};

struct SectorScanConfig {
  // Fail with DirectoryError::DuplicateIndex instead of keeping the last file.
  bool rejectDuplicates = false;
};

struct SectorScanReport {
  // Regular files seen in the directory.
  int filesSeen = 0;

  // Files whose name does not parse as sd<digits>.csdat.
  int skippedNames = 0;

  // Indices claimed by more than one file (ascending, unique).
  std::vector<int> duplicateIndices;
};

// Parse "sd<digits>.csdat" into an index. Rejects signs, spaces, empty digit runs and overflow.
bool ParseSectorFileName(std::string_view fileName, int* outIndex);

// Canonical file name for an index ("sd12.csdat").
std::string SectorFileName(int index);

// Scan dir for sector files. On success outEntries is sorted by index.
DirectoryError ListSectorFiles(const std::filesystem::path& dir, std::vector<SectorFileEntry>& outEntries,
                               std::string& outError, const SectorScanConfig& cfg = {},
                               SectorScanReport* outReport = nullptr);

} // namespace csdat
