#include "csdat/Json.hpp"
#include "csdat/LogTee.hpp"
#include "csdat/MosaicMeta.hpp"
#include "csdat/Normalizer.hpp"
#include "csdat/TerrainSession.hpp"
#include "csdat/Version.hpp"

#include "cli/CliParse.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>
#include <utility>

namespace {

using namespace csdat;

void PrintHelp()
{
  std::cout
      << "csdat_import (sector directory -> display image)\n\n"
      << "Decode every sd<N>.csdat file in a directory, assemble the terrain mosaic and write a\n"
      << "normalized display image plus a JSON sidecar for csdat_export.\n\n"
      << "Usage:\n"
      << "  csdat_import --dir <sectors/> [--sectors XxY] [--grid N] [--image out.png|.pgm|.ppm]\n"
      << "               [--depth 8|16] [--channels 1|3|4] [--rotate-display 0|1] [--meta out.json]\n"
      << "               [--json report.json] [--threads N] [--strict-duplicates 0|1]\n"
      << "               [--verbose 0|1] [--log file] [--log-keep N]\n\n"
      << "Options:\n"
      << "  --dir <path>               Directory holding sd<N>.csdat files (required).\n"
      << "  --sectors <XxY>            Sector grid (default: 8x8).\n"
      << "  --grid <N>                 Samples per sector side (default: 65).\n"
      << "  --image <path>             Write the normalized display image.\n"
      << "  --depth <8|16>             Image bit depth (default: 16). An unedited image restores the\n"
      << "                             exact elevations only while max - min <= 511.99 (16-bit)\n"
      << "                             or 1.99 (8-bit).\n"
      << "  --channels <1|3|4>         Gray, RGB or RGBA with opaque alpha (default: 1).\n"
      << "  --rotate-display <0|1>     Extra 90 degree CCW turn for on-screen orientation (default: 1).\n"
      << "  --meta <path>              Sidecar path (default: <image>.meta.json when --image is set).\n"
      << "  --json <path>              Write an import report.\n"
      << "  --threads <N>              Worker threads, <=0 = all cores (default: 1).\n"
      << "  --strict-duplicates <0|1>  Fail when two files map to one sector index (default: 0).\n"
      << "  --verbose <0|1>            Print per-sector issues and skipped names (default: 0).\n"
      << "  --log <path>               Mirror stdout/stderr into a log file.\n"
      << "  --log-keep <N>             Rotated logs to keep (default: 3).\n"
      << "  --version                  Print the version.\n"
      << "  -h, --help                 Show this help.\n\n"
      << "Exit codes: 0 ok, 1 some sectors failed, 2 usage or fatal error.\n";
}

struct Options {
  std::string dir;
  SectorLayout layout;
  std::string image;
  int depth = 16;
  int channels = 1;
  DisplayOptions display;
  std::string meta;
  std::string json;
  int threads = 1;
  bool strictDuplicates = false;
  bool verbose = false;
  std::string log;
  int logKeep = 3;
};

JsonValue RangeJson(const ElevationRange& r)
{
  if (!r.valid) return JsonValue::MakeNull();
  JsonValue o = JsonValue::MakeObject();
  o.set("min", JsonValue::MakeNumber(r.minValue));
  o.set("max", JsonValue::MakeNumber(r.maxValue));
  return o;
}

JsonValue ReportJson(const Options& opt, ImportStatus status, const ImportReport& rep)
{
  JsonValue root = JsonValue::MakeObject();
  root.set("tool", JsonValue::MakeString("csdat_import"));
  root.set("version", JsonValue::MakeString(CsdatVersionString()));
  root.set("status", JsonValue::MakeString(ImportStatusName(status)));
  root.set("directory", JsonValue::MakeString(opt.dir));

  JsonValue layout = JsonValue::MakeObject();
  layout.set("sectorsX", JsonValue::MakeNumber(opt.layout.sectorsX));
  layout.set("sectorsY", JsonValue::MakeNumber(opt.layout.sectorsY));
  layout.set("gridSize", JsonValue::MakeNumber(opt.layout.gridSize));
  root.set("layout", std::move(layout));

  root.set("filesSeen", JsonValue::MakeNumber(rep.scan.filesSeen));
  root.set("skippedNames", JsonValue::MakeNumber(rep.scan.skippedNames));
  root.set("filesMatched", JsonValue::MakeNumber(rep.filesMatched));
  root.set("outOfLayout", JsonValue::MakeNumber(rep.outOfLayout));
  root.set("sectorsLoaded", JsonValue::MakeNumber(rep.sectorsLoaded));
  root.set("sectorsFailed", JsonValue::MakeNumber(rep.sectorsFailed));
  root.set("sectorsMissing", JsonValue::MakeNumber(rep.sectorsMissing));
  root.set("range", RangeJson(rep.range));

  JsonValue dups = JsonValue::MakeArray();
  for (const int idx : rep.scan.duplicateIndices) dups.push(JsonValue::MakeNumber(idx));
  root.set("duplicateIndices", std::move(dups));

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
      std::cout << "csdat_import " << CsdatFullVersionString() << "\n";
      return 0;
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
      if (!cli::ParseWxH(argv[++i], &opt.layout.sectorsX, &opt.layout.sectorsY)) {
        std::cerr << "Invalid --sectors (expected XxY)\n";
        return 2;
      }
    } else if (a == "--grid") {
      if (!need(1)) {
        std::cerr << "--grid requires a value\n";
        return 2;
      }
      if (!cli::ParseI32(argv[++i], &opt.layout.gridSize)) {
        std::cerr << "Invalid --grid\n";
        return 2;
      }
    } else if (a == "--image") {
      if (!need(1)) {
        std::cerr << "--image requires a value\n";
        return 2;
      }
      opt.image = argv[++i];
    } else if (a == "--depth") {
      if (!need(1)) {
        std::cerr << "--depth requires a value\n";
        return 2;
      }
      if (!cli::ParseI32(argv[++i], &opt.depth) || (opt.depth != 8 && opt.depth != 16)) {
        std::cerr << "Invalid --depth (expected 8|16)\n";
        return 2;
      }
    } else if (a == "--channels") {
      if (!need(1)) {
        std::cerr << "--channels requires a value\n";
        return 2;
      }
      if (!cli::ParseI32(argv[++i], &opt.channels) ||
          (opt.channels != 1 && opt.channels != 3 && opt.channels != 4)) {
        std::cerr << "Invalid --channels (expected 1|3|4)\n";
        return 2;
      }
    } else if (a == "--rotate-display") {
      if (!need(1)) {
        std::cerr << "--rotate-display requires a value 0|1\n";
        return 2;
      }
      if (!cli::ParseBool01(argv[++i], &opt.display.rotateForDisplay)) {
        std::cerr << "Invalid --rotate-display (expected 0|1)\n";
        return 2;
      }
    } else if (a == "--meta") {
      if (!need(1)) {
        std::cerr << "--meta requires a value\n";
        return 2;
      }
      opt.meta = argv[++i];
    } else if (a == "--json") {
      if (!need(1)) {
        std::cerr << "--json requires a value\n";
        return 2;
      }
      opt.json = argv[++i];
    } else if (a == "--threads") {
      if (!need(1)) {
        std::cerr << "--threads requires a value\n";
        return 2;
      }
      if (!cli::ParseI32(argv[++i], &opt.threads)) {
        std::cerr << "Invalid --threads\n";
        return 2;
      }
    } else if (a == "--strict-duplicates") {
      if (!need(1)) {
        std::cerr << "--strict-duplicates requires a value 0|1\n";
        return 2;
      }
      if (!cli::ParseBool01(argv[++i], &opt.strictDuplicates)) {
        std::cerr << "Invalid --strict-duplicates (expected 0|1)\n";
        return 2;
      }
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

  if (opt.dir.empty()) {
    std::cerr << "--dir is required\n";
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

  ImportConfig cfg;
  cfg.layout = opt.layout;
  cfg.threads = opt.threads;
  cfg.scan.rejectDuplicates = opt.strictDuplicates;

  TerrainSession session;
  ImportReport rep;
  std::string err;
  const ImportStatus status = ImportTerrain(opt.dir, cfg, session, err, &rep);

  if (!opt.json.empty()) {
    std::string jerr;
    if (!cli::EnsureParentDir(opt.json) || !WriteJsonFile(opt.json, ReportJson(opt, status, rep), jerr)) {
      std::cerr << "Failed to write report " << opt.json << ": " << jerr << "\n";
    }
  }

  if (status != ImportStatus::Ok) {
    std::cerr << "Import failed (" << ImportStatusName(status) << "): " << err << "\n";
    return 2;
  }

  if (opt.verbose && rep.scan.skippedNames > 0) {
    std::cout << "Skipped " << rep.scan.skippedNames << " file(s) not named sd<N>.csdat\n";
  }
  for (const int idx : rep.scan.duplicateIndices) {
    std::cerr << "Warning: several files map to sector " << idx;
    const auto it = session.sectorPaths.find(idx);
    if (it != session.sectorPaths.end()) std::cerr << "; using " << it->second.string();
    std::cerr << "\n";
  }
  if (rep.outOfLayout > 0) {
    std::cerr << "Warning: " << rep.outOfLayout << " sector file(s) lie outside the " << opt.layout.sectorsX << "x"
              << opt.layout.sectorsY << " layout and were ignored\n";
  }
  if (opt.verbose) {
    for (const SectorIssue& is : rep.issues) {
      std::cerr << "sector " << is.index << " (" << is.path << "): " << SectorErrorName(is.error) << ": "
                << is.message << "\n";
    }
  }

  std::cout << "Imported " << rep.sectorsLoaded << "/" << rep.filesMatched << " sector file(s) from " << opt.dir
            << " (" << opt.layout.sectorsX << "x" << opt.layout.sectorsY << ", grid " << opt.layout.gridSize
            << ")\n";
  std::cout << "Mosaic " << session.mosaic.width << "x" << session.mosaic.height << ", elevation "
            << rep.range.minValue << " .. " << rep.range.maxValue << "\n";
  if (rep.sectorsFailed > 0) {
    std::cerr << rep.sectorsFailed << " sector file(s) failed to decode and were left flat\n";
  }

  int imageW = 0;
  int imageH = 0;
  if (!opt.image.empty()) {
    NormalizedImage display;
    RasterImage raster;
    if (!SessionToDisplay(session, opt.display, display, err) ||
        !QuantizeDisplayImage(display, opt.depth, opt.channels, raster, err)) {
      std::cerr << "Failed to build display image: " << err << "\n";
      return 2;
    }
    if (!cli::EnsureParentDir(opt.image) || !WriteImageAuto(opt.image, raster, err)) {
      std::cerr << "Failed to write " << opt.image << ": " << err << "\n";
      return 2;
    }
    imageW = raster.width;
    imageH = raster.height;
    if (rep.range.valid &&
        static_cast<double>(rep.range.maxValue) - rep.range.minValue > LosslessDisplaySpan(opt.depth)) {
      std::cerr << "Warning: elevation span " << rep.range.maxValue - rep.range.minValue << " exceeds "
                << LosslessDisplaySpan(opt.depth) << "; a " << opt.depth
                << "-bit image cannot hold every 1/128 step, so exporting it unedited changes some samples\n";
    }
    std::cout << "Wrote " << opt.image << " (" << imageW << "x" << imageH << ", " << opt.depth << "-bit)\n";
  }

  std::string metaPath = opt.meta;
  if (metaPath.empty() && !opt.image.empty()) metaPath = cli::MetaPathForImage(opt.image).string();
  if (!metaPath.empty()) {
    MosaicMeta meta;
    std::error_code ec;
    const std::filesystem::path absDir = std::filesystem::absolute(opt.dir, ec);
    meta.directory = ec ? opt.dir : absDir.string();
    meta.layout = opt.layout;
    meta.rotateForDisplay = opt.display.rotateForDisplay;
    meta.range = rep.range;
    if (!opt.image.empty()) {
      const std::filesystem::path absImage = std::filesystem::absolute(opt.image, ec);
      meta.image = ec ? opt.image : absImage.string();
    }
    meta.imageWidth = imageW;
    meta.imageHeight = imageH;
    meta.imageBitDepth = opt.depth;
    meta.sectorsLoaded = rep.sectorsLoaded;
    if (!SaveMosaicMeta(metaPath, meta, err)) {
      std::cerr << "Failed to write sidecar " << metaPath << ": " << err << "\n";
      return 2;
    }
    std::cout << "Wrote " << metaPath << "\n";
  }

  return rep.sectorsFailed > 0 ? 1 : 0;
}

} // namespace

int main(int argc, char** argv)
{
  return Run(argc, argv);
}
