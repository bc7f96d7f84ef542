#include "csdat/ImageIO.hpp"
#include "csdat/Json.hpp"
#include "csdat/LogTee.hpp"
#include "csdat/MosaicMeta.hpp"
#include "csdat/Normalizer.hpp"
#include "csdat/TerrainSession.hpp"
#include "csdat/Version.hpp"

#include "cli/CliParse.hpp"

#include <iostream>
#include <string>
#include <utility>

namespace {

using namespace csdat;

void PrintHelp()
{
  std::cout
      << "csdat_export (edited display image -> sector files)\n\n"
      << "Reload the sector directory, map an edited display image back to elevations and rewrite each\n"
      << "sd<N>.csdat in place. Only the elevation samples change; every other byte is preserved.\n\n"
      << "Usage:\n"
      << "  csdat_export --image edited.png|.pgm|.ppm [--meta in.json] [--dir <sectors/>]\n"
      << "               [--sectors XxY] [--grid N] [--rotate-display 0|1] [--min F --max F]\n"
      << "               [--threads N] [--dry-run 0|1] [--skip-unchanged 0|1] [--json report.json]\n"
      << "               [--verbose 0|1] [--log file] [--log-keep N]\n\n"
      << "Options:\n"
      << "  --image <path>             Edited display image (default: the image named in --meta).\n"
      << "  --meta <path>              Sidecar written by csdat_import (directory, layout, rotation).\n"
      << "  --dir <path>               Sector directory (overrides the sidecar).\n"
      << "  --sectors <XxY>            Sector grid (overrides the sidecar; default: 8x8).\n"
      << "  --grid <N>                 Samples per sector side (overrides the sidecar; default: 65).\n"
      << "  --rotate-display <0|1>     Image carries the extra display rotation (default: sidecar or 1).\n"
      << "  --min <F> --max <F>        Elevation range to denormalize with. By default the range is\n"
      << "                             recomputed from the sector files currently on disk.\n"
      << "  --threads <N>              Worker threads, <=0 = all cores (default: 1).\n"
      << "  --dry-run <0|1>            Encode everything but write nothing (default: 0).\n"
      << "  --skip-unchanged <0|1>     Do not rewrite byte-identical files (default: 0).\n"
      << "  --json <path>              Write an export report.\n"
      << "  --verbose <0|1>            Print per-sector issues (default: 0).\n"
      << "  --log <path>               Mirror stdout/stderr into a log file.\n"
      << "  --log-keep <N>             Rotated logs to keep (default: 3).\n"
      << "  --version                  Print the version.\n"
      << "  -h, --help                 Show this help.\n\n"
      << "Exit codes: 0 ok, 1 some sectors failed, 2 usage or fatal error.\n";
}

struct Options {
  std::string image;
  std::string meta;
  std::string dir;

  bool haveSectors = false;
  int sectorsX = 0;
  int sectorsY = 0;
  bool haveGrid = false;
  int grid = 0;
  bool haveRotate = false;
  bool rotate = true;

  bool haveMin = false;
  float minValue = 0.0f;
  bool haveMax = false;
  float maxValue = 0.0f;

  int threads = 1;
  bool dryRun = false;
  bool skipUnchanged = false;
  std::string json;
  bool verbose = false;
  std::string log;
  int logKeep = 3;
};

JsonValue ReportJson(const std::string& dir, const ExportReport& rep, bool dryRun)
{
  JsonValue root = JsonValue::MakeObject();
  root.set("tool", JsonValue::MakeString("csdat_export"));
  root.set("version", JsonValue::MakeString(CsdatVersionString()));
  root.set("directory", JsonValue::MakeString(dir));
  root.set("dryRun", JsonValue::MakeBool(dryRun));
  root.set("written", JsonValue::MakeNumber(rep.written));
  root.set("failed", JsonValue::MakeNumber(rep.failed));
  root.set("skipped", JsonValue::MakeNumber(rep.skipped));
  root.set("unchanged", JsonValue::MakeNumber(rep.unchanged));
  root.set("cancelled", JsonValue::MakeBool(rep.cancelled));

  if (rep.rangeUsed.valid) {
    JsonValue r = JsonValue::MakeObject();
    r.set("min", JsonValue::MakeNumber(rep.rangeUsed.minValue));
    r.set("max", JsonValue::MakeNumber(rep.rangeUsed.maxValue));
    root.set("range", std::move(r));
  } else {
    root.set("range", JsonValue::MakeNull());
  }

  JsonValue issues = JsonValue::MakeArray();
  for (const SectorIssue& is : rep.issues) {
    JsonValue o = JsonValue::MakeObject();
    o.set("index", JsonValue::MakeNumber(is.index));
    o.set("path", JsonValue::MakeString(is.path));
    o.set("error", JsonValue::MakeString(SectorErrorName(is.error)));
    o.set("message", JsonValue::MakeString(is.message));
    issues.push(std::move(o));
  }
  root.set("issues", std::move(issues));
  return root;
}

int Run(int argc, char** argv)
{
  Options opt;

  if (argc <= 1) {
    PrintHelp();
    return 0;
  }

  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    auto need = [&](int n) -> bool { return (i + n) < argc; };

    if (a == "--help" || a == "-h") {
      PrintHelp();
      return 0;
    } else if (a == "--version") {
      std::cout << "csdat_export " << CsdatFullVersionString() << "\n";
      return 0;
    } else if (a == "--image") {
      if (!need(1)) {
        std::cerr << "--image requires a value\n";
        return 2;
      }
      opt.image = argv[++i];
    } else if (a == "--meta") {
      if (!need(1)) {
        std::cerr << "--meta requires a value\n";
        return 2;
      }
      opt.meta = argv[++i];
    } else if (a == "--dir") {
      if (!need(1)) {
        std::cerr << "--dir requires a value\n";
        return 2;
      }
      opt.dir = argv[++i];
    } else if (a == "--sectors") {
      if (!need(1)) {
        std::cerr << "--sectors requires a value\n";
        return 2;
      }
      if (!cli::ParseWxH(argv[++i], &opt.sectorsX, &opt.sectorsY)) {
        std::cerr << "Invalid --sectors (expected XxY)\n";
        return 2;
      }
      opt.haveSectors = true;
    } else if (a == "--grid") {
      if (!need(1)) {
        std::cerr << "--grid requires a value\n";
        return 2;
      }
      if (!cli::ParseI32(argv[++i], &opt.grid)) {
        std::cerr << "Invalid --grid\n";
        return 2;
      }
      opt.haveGrid = true;
    } else if (a == "--rotate-display") {
      if (!need(1)) {
        std::cerr << "--rotate-display requires a value 0|1\n";
        return 2;
      }
      if (!cli::ParseBool01(argv[++i], &opt.rotate)) {
        std::cerr << "Invalid --rotate-display (expected 0|1)\n";
        return 2;
      }
      opt.haveRotate = true;
    } else if (a == "--min") {
      if (!need(1)) {
        std::cerr << "--min requires a value\n";
        return 2;
      }
      if (!cli::ParseF32(argv[++i], &opt.minValue)) {
        std::cerr << "Invalid --min\n";
        return 2;
      }
      opt.haveMin = true;
    } else if (a == "--max") {
      if (!need(1)) {
        std::cerr << "--max requires a value\n";
        return 2;
      }
      if (!cli::ParseF32(argv[++i], &opt.maxValue)) {
        std::cerr << "Invalid --max\n";
        return 2;
      }
      opt.haveMax = true;
    } else if (a == "--threads") {
      if (!need(1)) {
        std::cerr << "--threads requires a value\n";
        return 2;
      }
      if (!cli::ParseI32(argv[++i], &opt.threads)) {
        std::cerr << "Invalid --threads\n";
        return 2;
      }
    } else if (a == "--dry-run") {
      if (!need(1)) {
        std::cerr << "--dry-run requires a value 0|1\n";
        return 2;
      }
      if (!cli::ParseBool01(argv[++i], &opt.dryRun)) {
        std::cerr << "Invalid --dry-run (expected 0|1)\n";
        return 2;
      }
    } else if (a == "--skip-unchanged") {
      if (!need(1)) {
        std::cerr << "--skip-unchanged requires a value 0|1\n";
        return 2;
      }
      if (!cli::ParseBool01(argv[++i], &opt.skipUnchanged)) {
        std::cerr << "Invalid --skip-unchanged (expected 0|1)\n";
        return 2;
      }
    } else if (a == "--json") {
      if (!need(1)) {
        std::cerr << "--json requires a value\n";
        return 2;
      }
      opt.json = argv[++i];
    } else if (a == "--verbose") {
      if (!need(1)) {
        std::cerr << "--verbose requires a value 0|1\n";
        return 2;
      }
      if (!cli::ParseBool01(argv[++i], &opt.verbose)) {
        std::cerr << "Invalid --verbose (expected 0|1)\n";
        return 2;
      }
    } else if (a == "--log") {
      if (!need(1)) {
        std::cerr << "--log requires a value\n";
        return 2;
      }
      opt.log = argv[++i];
    } else if (a == "--log-keep") {
      if (!need(1)) {
        std::cerr << "--log-keep requires a value\n";
        return 2;
      }
      if (!cli::ParseI32(argv[++i], &opt.logKeep) || opt.logKeep < 0) {
        std::cerr << "Invalid --log-keep\n";
        return 2;
      }
    } else {
      std::cerr << "Unknown option: " << a << "\n";
      std::cerr << "Run with --help for usage.\n";
      return 2;
    }
  }

  if (opt.haveMin != opt.haveMax) {
    std::cerr << "--min and --max must be given together\n";
    return 2;
  }
  if (opt.haveMin && opt.maxValue < opt.minValue) {
    std::cerr << "--max must not be below --min\n";
    return 2;
  }

  LogTee logTee;
  if (!opt.log.empty()) {
    LogTeeOptions lo;
    lo.path = opt.log;
    lo.keepFiles = opt.logKeep;
    std::string err;
    if (!logTee.start(lo, err)) {
      std::cerr << "Failed to start log: " << err << "\n";
      return 2;
    }
  }

  // Sidecar first, then command line overrides.
  MosaicMeta meta;
  std::string err;
  if (!opt.meta.empty() && !LoadMosaicMeta(opt.meta, meta, err)) {
    std::cerr << "Failed to load sidecar: " << err << "\n";
    return 2;
  }

  const std::string dir = !opt.dir.empty() ? opt.dir : meta.directory;
  const std::string imagePath = !opt.image.empty() ? opt.image : meta.image;
  SectorLayout layout = meta.layout;
  if (opt.haveSectors) {
    layout.sectorsX = opt.sectorsX;
    layout.sectorsY = opt.sectorsY;
  }
  if (opt.haveGrid) layout.gridSize = opt.grid;

  ExportConfig cfg;
  cfg.display.rotateForDisplay = opt.haveRotate ? opt.rotate : meta.rotateForDisplay;
  cfg.threads = opt.threads;
  cfg.dryRun = opt.dryRun;
  cfg.skipUnchanged = opt.skipUnchanged;
  if (opt.haveMin) {
    cfg.hasRangeOverride = true;
    cfg.rangeOverride.minValue = opt.minValue;
    cfg.rangeOverride.maxValue = opt.maxValue;
    cfg.rangeOverride.valid = true;
  }

  if (dir.empty()) {
    std::cerr << "No sector directory: pass --dir or a --meta sidecar\n";
    return 2;
  }
  if (imagePath.empty()) {
    std::cerr << "No image: pass --image or a --meta sidecar that names one\n";
    return 2;
  }

  ImportConfig icfg;
  icfg.layout = layout;
  icfg.threads = opt.threads;

  TerrainSession session;
  ImportReport irep;
  const ImportStatus status = ImportTerrain(dir, icfg, session, err, &irep);
  if (status != ImportStatus::Ok) {
    std::cerr << "Failed to reload sectors (" << ImportStatusName(status) << "): " << err << "\n";
    return 2;
  }

  if (meta.range.valid && !cfg.hasRangeOverride && (meta.range.minValue != irep.range.minValue ||
                                                    meta.range.maxValue != irep.range.maxValue)) {
    std::cerr << "Note: elevation range on disk (" << irep.range.minValue << " .. " << irep.range.maxValue
              << ") differs from the sidecar (" << meta.range.minValue << " .. " << meta.range.maxValue
              << "); using the range on disk\n";
  }

  RasterImage raster;
  NormalizedImage edited;
  if (!ReadImageAuto(imagePath, raster, err) || !DequantizeDisplayImage(raster, edited, err)) {
    std::cerr << "Failed to read " << imagePath << ": " << err << "\n";
    return 2;
  }

  ExportReport rep;
  if (!ExportTerrain(session, edited, cfg, rep, err)) {
    std::cerr << "Export failed: " << err << "\n";
    return 2;
  }

  if (opt.verbose) {
    for (const SectorIssue& is : rep.issues) {
      std::cerr << "sector " << is.index << " (" << is.path << "): " << SectorErrorName(is.error) << ": "
                << is.message << "\n";
    }
  }

  std::cout << (opt.dryRun ? "Dry run: " : "") << "wrote " << rep.written << ", unchanged " << rep.unchanged
            << ", skipped " << rep.skipped << ", failed " << rep.failed << " (range " << rep.rangeUsed.minValue
            << " .. " << rep.rangeUsed.maxValue << ")\n";

  if (!opt.json.empty()) {
    std::string jerr;
    if (!cli::EnsureParentDir(opt.json) || !WriteJsonFile(opt.json, ReportJson(dir, rep, opt.dryRun), jerr)) {
      std::cerr << "Failed to write report " << opt.json << ": " << jerr << "\n";
      return 2;
    }
  }

  return (rep.failed > 0 || rep.cancelled) ? 1 : 0;
}

} // namespace

int main(int argc, char** argv)
{
  return Run(argc, argv);
}
