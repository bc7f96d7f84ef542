#pragma once

#include "csdat/HeightField.hpp"
#include "csdat/Mosaic.hpp"
#include "csdat/Normalizer.hpp"
#include "csdat/SectorCodec.hpp"
#include "csdat/SectorDirectory.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace csdat {

// -----------------------------------------------------------------------------------------------
// TerrainSession
//
// Everything an edit session needs between import and export, held by the caller:
//   ImportTerrain: directory scan -> decode every sector -> compose the display mosaic.
//   ExportTerrain: edited display image -> denormalize -> split -> re-read + encode each sector
//                  file -> atomic rewrite.
//
// Per-sector work can run on a worker pool. Workers pull sector slots from an atomic counter and
// write into fixed slots, so results never depend on completion order. Cancellation is checked
// between sectors only.
// -----------------------------------------------------------------------------------------------

struct TerrainSession {
  std::filesystem::path directory;
  SectorLayout layout;

  // Sectors that decoded successfully, in file space.
  SectorGrids sectors;

  // Every sector file found inside the layout at import time, including ones that failed to decode.
  // Only indices present in sectors are ever written back.
  std::map<int, std::filesystem::path> sectorPaths;

  // Display-space mosaic (MosaicWidth(layout) x MosaicHeight(layout)).
  HeightField mosaic;

  bool loaded() const { return !sectors.empty(); }
};

enum class ImportStatus : std::uint8_t {
  Ok = 0,
  InvalidLayout,
  DirectoryNotFound,
  DirectoryUnreadable,
  NoMatches,      // no sd<index>.csdat files at all
  DuplicateIndex, // strict duplicate policy only
  NoValidSectors, // files were found but none decoded
  Cancelled,
};

const char* ImportStatusName(ImportStatus s);

struct SectorIssue {
  int index = 0;
  std::string path;
  SectorError error = SectorError::None;
  std::string message;
};

struct ImportProgress {
  // Sectors finished so far (including this one) and total sectors to load.
  int done = 0;
  int total = 0;

  int index = 0;
  SectorError error = SectorError::None;
};

using ImportProgressFn = std::function<void(const ImportProgress&)>;

struct ImportConfig {
  SectorLayout layout;

  // 1 = single thread. <= 0 uses std::thread::hardware_concurrency().
  int threads = 1;

  SectorScanConfig scan;

  // Optional best-effort cancellation flag, polled between sectors.
  const std::atomic<bool>* cancel = nullptr;

  // Called on the importing thread in sector order.
  ImportProgressFn progress;
};

struct ImportReport {
  SectorScanReport scan;

  int filesMatched = 0;   // sector files inside the layout
  int outOfLayout = 0;    // sector files whose index lies outside the layout (ignored)
  int sectorsLoaded = 0;
  int sectorsFailed = 0;  // truncated / unreadable files, left as zero patches
  int sectorsMissing = 0; // layout slots without a loaded sector

  ElevationRange range;
  std::vector<SectorIssue> issues;
};

// Build a session from a sector directory.
//
// Fatal results leave outSession untouched. Individual sector failures are soft: they are listed
// in the report and the sector becomes a zero patch in the mosaic.
ImportStatus ImportTerrain(const std::filesystem::path& directory, const ImportConfig& cfg, TerrainSession& outSession,
                           std::string& outError, ImportReport* outReport = nullptr);

// Min/max over the currently loaded sectors. Zero patches of missing or failed sectors do not count.
ElevationRange SessionElevationRange(const TerrainSession& session);

// The session mosaic normalized over SessionElevationRange(), the range ExportTerrain maps an
// unedited image back with. Zero patches clamp to 0.
bool SessionToDisplay(const TerrainSession& session, const DisplayOptions& opt, NormalizedImage& outImage,
                      std::string& outError);

struct ExportConfig {
  DisplayOptions display;

  int threads = 1;

  // Encode everything but write nothing.
  bool dryRun = false;

  // Do not rewrite files whose encoded bytes equal the current contents.
  bool skipUnchanged = false;

  // Denormalize with this range instead of SessionElevationRange().
  bool hasRangeOverride = false;
  ElevationRange rangeOverride;

  const std::atomic<bool>* cancel = nullptr;
};

struct ExportReport {
  int written = 0;   // encoded and written (or would be written, in dry-run mode)
  int failed = 0;    // read / encode / write failures
  int skipped = 0;   // sector file no longer exists, or it failed to decode at import
  int unchanged = 0; // identical bytes, not rewritten (skipUnchanged)
  bool cancelled = false;

  ElevationRange rangeUsed;
  std::vector<SectorIssue> issues;
};

// Write an edited display image back into the session's sector files.
//
// Returns false only for problems with the request itself (image size, empty session, bad range).
// Per-sector failures are counted in outReport.
bool ExportTerrain(const TerrainSession& session, const NormalizedImage& image, const ExportConfig& cfg,
                   ExportReport& outReport, std::string& outError);

// Same, for a mosaic that is already in elevation units and display-space orientation (no display
// rotation). cfg.display and the range fields are ignored.
bool ExportTerrainMosaic(const TerrainSession& session, const HeightField& mosaic, const ExportConfig& cfg,
                         ExportReport& outReport, std::string& outError);

} // namespace csdat
