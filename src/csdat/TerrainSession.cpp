#include "csdat/TerrainSession.hpp"

#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <sstream>
#include <system_error>
#include <thread>
#include <utility>

namespace csdat {

namespace {

bool IsCancelled(const std::atomic<bool>* cancel)
{
  return cancel && cancel->load(std::memory_order_relaxed);
}

int ResolveThreads(int requested, int total)
{
  int threads = requested;
  if (threads <= 0) threads = static_cast<int>(std::thread::hardware_concurrency());
  if (threads <= 0) threads = 1;
  return std::max(1, std::min(threads, total));
}

// Run work(i) for every i in [0, total). Each call owns slot i of whatever the caller writes to.
//
// inOrder (optional) runs on the calling thread for each finished slot, in index order, even when
// the work itself completes out of order.
//
// Once cancel is raised no further slots are started. Slots that never ran keep ran[i] == 0.
// Returns true when every slot ran.
template <typename WorkFn>
bool ForEachSlot(int total, int requestedThreads, const std::atomic<bool>* cancel, WorkFn&& work,
                 const std::function<void(int)>& inOrder, std::vector<std::uint8_t>& ran)
{
  ran.assign(static_cast<std::size_t>(std::max(0, total)), 0u);
  if (total <= 0) return true;

  const int threads = ResolveThreads(requestedThreads, total);

  if (threads <= 1) {
    for (int i = 0; i < total; ++i) {
      if (IsCancelled(cancel)) return false;
      work(i);
      ran[static_cast<std::size_t>(i)] = 1u;
      if (inOrder) inOrder(i);
    }
    return true;
  }

  std::atomic<int> nextIndex{0};
  std::mutex readyMutex;
  std::condition_variable readyCv;
  std::vector<std::uint8_t> ready(static_cast<std::size_t>(total), 0u);

  auto worker = [&]() {
    for (;;) {
      const int i = nextIndex.fetch_add(1);
      if (i >= total) break;

      // Claimed slots are still marked ready after cancellation so the ordered loop below ends.
      if (!IsCancelled(cancel)) {
        work(i);
        ran[static_cast<std::size_t>(i)] = 1u;
      }

      {
        std::lock_guard<std::mutex> lock(readyMutex);
        ready[static_cast<std::size_t>(i)] = 1u;
      }
      readyCv.notify_all();
    }
  };

  std::vector<std::thread> pool;
  pool.reserve(static_cast<std::size_t>(threads));
  for (int t = 0; t < threads; ++t) {
    pool.emplace_back(worker);
  }

  if (inOrder) {
    for (int i = 0; i < total; ++i) {
      {
        std::unique_lock<std::mutex> lock(readyMutex);
        readyCv.wait(lock, [&]() { return ready[static_cast<std::size_t>(i)] != 0u; });
      }
      if (ran[static_cast<std::size_t>(i)] != 0u) inOrder(i);
    }
  }

  for (std::thread& th : pool) {
    if (th.joinable()) th.join();
  }

  return std::all_of(ran.begin(), ran.end(), [](std::uint8_t r) { return r != 0u; });
}

ImportStatus StatusFromDirectoryError(DirectoryError e)
{
  switch (e) {
  case DirectoryError::NotFound: return ImportStatus::DirectoryNotFound;
  case DirectoryError::Unreadable: return ImportStatus::DirectoryUnreadable;
  case DirectoryError::NoMatches: return ImportStatus::NoMatches;
  case DirectoryError::DuplicateIndex: return ImportStatus::DuplicateIndex;
  default: return ImportStatus::Ok;
  }
}

enum class SectorWriteOutcome : std::uint8_t { Written, Unchanged, Skipped, Failed };

struct SectorWriteResult {
  SectorWriteOutcome outcome = SectorWriteOutcome::Failed;
  SectorError error = SectorError::None;
  std::string message;
};

SectorWriteResult WriteOneSector(const std::filesystem::path& path, const HeightField& grid, int gridSize,
                                 const ExportConfig& cfg)
{
  SectorWriteResult r;

  std::error_code ec;
  if (!std::filesystem::exists(path, ec) || ec) {
    r.outcome = SectorWriteOutcome::Skipped;
    r.message = "sector file no longer exists";
    return r;
  }

  std::vector<std::uint8_t> original;
  if (!ReadFileBytes(path.string(), original, r.message)) {
    r.error = SectorError::Io;
    return r;
  }

  std::vector<std::uint8_t> encoded;
  r.error = EncodeSector(original, grid, gridSize, encoded, r.message);
  if (r.error != SectorError::None) return r;

  if (cfg.skipUnchanged && encoded == original) {
    r.outcome = SectorWriteOutcome::Unchanged;
    return r;
  }

  if (!cfg.dryRun && !WriteFileBytesAtomic(path.string(), encoded, r.message)) {
    r.error = SectorError::Io;
    return r;
  }

  r.outcome = SectorWriteOutcome::Written;
  return r;
}

} // namespace

const char* ImportStatusName(ImportStatus s)
{
  switch (s) {
  case ImportStatus::Ok: return "ok";
  case ImportStatus::InvalidLayout: return "invalid_layout";
  case ImportStatus::DirectoryNotFound: return "directory_not_found";
  case ImportStatus::DirectoryUnreadable: return "directory_unreadable";
  case ImportStatus::NoMatches: return "no_matches";
  case ImportStatus::DuplicateIndex: return "duplicate_index";
  case ImportStatus::NoValidSectors: return "no_valid_sectors";
  case ImportStatus::Cancelled: return "cancelled";
  default: return "unknown";
  }
}

ImportStatus ImportTerrain(const std::filesystem::path& directory, const ImportConfig& cfg, TerrainSession& outSession,
                           std::string& outError, ImportReport* outReport)
{
  outError.clear();
  ImportReport report;
  auto finish = [&](ImportStatus s) {
    if (outReport) *outReport = report;
    return s;
  };

  if (!ValidateSectorLayout(cfg.layout, outError)) {
    return finish(ImportStatus::InvalidLayout);
  }

  std::vector<SectorFileEntry> entries;
  const DirectoryError dirErr = ListSectorFiles(directory, entries, outError, cfg.scan, &report.scan);
  if (dirErr != DirectoryError::None) {
    return finish(StatusFromDirectoryError(dirErr));
  }

  const int total = SectorCount(cfg.layout);
  std::vector<SectorFileEntry> jobs;
  jobs.reserve(entries.size());
  for (const SectorFileEntry& e : entries) {
    if (e.index >= total) {
      report.outOfLayout++;
      continue;
    }
    jobs.push_back(e);
  }
  report.filesMatched = static_cast<int>(jobs.size());

  const int jobCount = static_cast<int>(jobs.size());
  std::vector<HeightField> grids(jobs.size());
  std::vector<SectorError> errors(jobs.size(), SectorError::None);
  std::vector<std::string> messages(jobs.size());

  auto work = [&](int i) {
    const std::size_t k = static_cast<std::size_t>(i);
    errors[k] = LoadSectorFile(jobs[k].path.string(), cfg.layout.gridSize, grids[k], messages[k]);
  };

  int done = 0;
  std::function<void(int)> onDone;
  if (cfg.progress) {
    onDone = [&](int i) {
      ImportProgress p;
      p.done = ++done;
      p.total = jobCount;
      p.index = jobs[static_cast<std::size_t>(i)].index;
      p.error = errors[static_cast<std::size_t>(i)];
      cfg.progress(p);
    };
  }

  std::vector<std::uint8_t> ran;
  if (!ForEachSlot(jobCount, cfg.threads, cfg.cancel, work, onDone, ran)) {
    outError = "import cancelled";
    return finish(ImportStatus::Cancelled);
  }

  TerrainSession session;
  session.directory = directory;
  session.layout = cfg.layout;

  for (std::size_t k = 0; k < jobs.size(); ++k) {
    session.sectorPaths[jobs[k].index] = jobs[k].path;
    if (errors[k] != SectorError::None) {
      report.sectorsFailed++;
      report.issues.push_back(SectorIssue{jobs[k].index, jobs[k].path.string(), errors[k], messages[k]});
      continue;
    }
    session.sectors[jobs[k].index] = std::move(grids[k]);
  }
  report.sectorsLoaded = static_cast<int>(session.sectors.size());

  if (session.sectors.empty()) {
    std::ostringstream oss;
    oss << "none of the " << jobCount << " sector files in " << directory.string() << " could be decoded";
    outError = oss.str();
    report.sectorsMissing = total;
    return finish(ImportStatus::NoValidSectors);
  }

  MosaicComposeStats st;
  if (!ComposeMosaic(session.sectors, session.layout, session.mosaic, outError, &st)) {
    return finish(ImportStatus::InvalidLayout);
  }
  report.sectorsMissing = st.missing;
  report.range = ComputeElevationRange(session.sectors);

  outSession = std::move(session);
  return finish(ImportStatus::Ok);
}

ElevationRange SessionElevationRange(const TerrainSession& session)
{
  return ComputeElevationRange(session.sectors);
}

bool SessionToDisplay(const TerrainSession& session, const DisplayOptions& opt, NormalizedImage& outImage,
                      std::string& outError)
{
  return ToDisplay(session.mosaic, SessionElevationRange(session), opt, outImage, outError);
}

bool ExportTerrain(const TerrainSession& session, const NormalizedImage& image, const ExportConfig& cfg,
                   ExportReport& outReport, std::string& outError)
{
  outError.clear();
  outReport = ExportReport{};

  if (!ValidateSectorLayout(session.layout, outError)) return false;

  int expectW = 0;
  int expectH = 0;
  DisplayImageDims(MosaicWidth(session.layout), MosaicHeight(session.layout), cfg.display, expectW, expectH);
  if (image.width != expectW || image.height != expectH) {
    std::ostringstream oss;
    oss << "display image is " << image.width << "x" << image.height << ", expected " << expectW << "x" << expectH;
    outError = oss.str();
    return false;
  }

  const ElevationRange range = cfg.hasRangeOverride ? cfg.rangeOverride : SessionElevationRange(session);
  if (!range.valid) {
    outError = "no elevation range: the session has no loaded sectors and no range override was given";
    return false;
  }

  HeightField mosaic;
  if (!FromDisplay(image, range.minValue, range.maxValue, cfg.display, mosaic, outError)) return false;

  if (!ExportTerrainMosaic(session, mosaic, cfg, outReport, outError)) return false;
  outReport.rangeUsed = range;
  return true;
}

bool ExportTerrainMosaic(const TerrainSession& session, const HeightField& mosaic, const ExportConfig& cfg,
                         ExportReport& outReport, std::string& outError)
{
  outError.clear();
  outReport = ExportReport{};

  if (session.sectors.empty()) {
    outError = "session has no loaded sectors";
    return false;
  }

  // A sector that failed to decode at import only has a zero patch in the mosaic. Its file keeps
  // its contents.
  std::vector<int> indices;
  std::vector<std::filesystem::path> paths;
  indices.reserve(session.sectorPaths.size());
  paths.reserve(session.sectorPaths.size());
  int notLoaded = 0;
  for (const auto& kv : session.sectorPaths) {
    if (session.sectors.find(kv.first) == session.sectors.end()) {
      notLoaded++;
      continue;
    }
    indices.push_back(kv.first);
    paths.push_back(kv.second);
  }

  SectorGrids grids;
  if (!SplitMosaic(mosaic, session.layout, grids, outError, &indices)) return false;

  const int total = static_cast<int>(indices.size());
  std::vector<SectorWriteResult> results(indices.size());

  auto work = [&](int i) {
    const std::size_t k = static_cast<std::size_t>(i);
    results[k] = WriteOneSector(paths[k], grids[indices[k]], session.layout.gridSize, cfg);
  };

  std::vector<std::uint8_t> ran;
  outReport.cancelled = !ForEachSlot(total, cfg.threads, cfg.cancel, work, {}, ran);
  outReport.skipped = notLoaded;

  for (std::size_t k = 0; k < results.size(); ++k) {
    if (ran[k] == 0u) continue;
    const SectorWriteResult& r = results[k];
    switch (r.outcome) {
    case SectorWriteOutcome::Written: outReport.written++; break;
    case SectorWriteOutcome::Unchanged: outReport.unchanged++; break;
    case SectorWriteOutcome::Skipped: outReport.skipped++; break;
    case SectorWriteOutcome::Failed:
      outReport.failed++;
      outReport.issues.push_back(SectorIssue{indices[k], paths[k].string(), r.error, r.message});
      break;
    }
  }

  return true;
}

} // namespace csdat
