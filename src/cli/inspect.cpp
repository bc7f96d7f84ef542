#include "csdat/HeightField.hpp"
#include "csdat/Json.hpp"
#include "csdat/SectorCodec.hpp"
#include "csdat/Version.hpp"

#include "cli/CliParse.hpp"

#include <cstdint>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

namespace {

using namespace csdat;

void PrintHelp()
{
  std::cout
      << "csdat_inspect (single sector file inspector)\n\n"
      << "Usage:\n"
      << "  csdat_inspect --file <sdN.csdat> [--grid N] [--roundtrip 0|1] [--csv out.csv]\n"
      << "                [--json out.json]\n\n"
      << "Options:\n"
      << "  --file <path>        Sector file to decode (a bare positional path also works).\n"
      << "  --grid <N>           Samples per sector side (default: 65).\n"
      << "  --roundtrip <0|1>    Re-encode the decoded grid and compare with the file (default: 1).\n"
      << "  --csv <path>         Write the decoded grid (file order, one row per line).\n"
      << "  --json <path>        Write a JSON summary.\n"
      << "  --version            Print the version.\n"
      << "  -h, --help           Show this help.\n\n"
      << "Exit codes: 0 ok, 1 round-trip mismatch, 2 usage or decode error.\n";
}

struct Options {
  std::string file;
  int grid = kDefaultSectorGridSize;
  bool roundtrip = true;
  std::string csv;
  std::string json;
};

bool WriteCsv(const std::string& path, const HeightField& grid, std::string& outError)
{
  std::ofstream f(path, std::ios::binary);
  if (!f) {
    outError = "failed to open file for writing: " + path;
    return false;
  }
  f << std::setprecision(9);
  for (int y = 0; y < grid.height; ++y) {
    for (int x = 0; x < grid.width; ++x) {
      if (x > 0) f << ',';
      f << grid.at(x, y);
    }
    f << '\n';
  }
  if (!f) {
    outError = "failed while writing file: " + path;
    return false;
  }
  return true;
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
      std::cout << "csdat_inspect " << CsdatFullVersionString() << "\n";
      return 0;
    } else if (a == "--file") {
      if (!need(1)) {
        std::cerr << "--file requires a value\n";
        return 2;
      }
      opt.file = argv[++i];
    } else if (a == "--grid") {
      if (!need(1)) {
        std::cerr << "--grid requires a value\n";
        return 2;
      }
      if (!cli::ParseI32(argv[++i], &opt.grid) || opt.grid < 1) {
        std::cerr << "Invalid --grid\n";
        return 2;
      }
    } else if (a == "--roundtrip") {
      if (!need(1)) {
        std::cerr << "--roundtrip requires a value 0|1\n";
        return 2;
      }
      if (!cli::ParseBool01(argv[++i], &opt.roundtrip)) {
        std::cerr << "Invalid --roundtrip (expected 0|1)\n";
        return 2;
      }
    } else if (a == "--csv") {
      if (!need(1)) {
        std::cerr << "--csv requires a value\n";
        return 2;
      }
      opt.csv = argv[++i];
    } else if (a == "--json") {
      if (!need(1)) {
        std::cerr << "--json requires a value\n";
        return 2;
      }
      opt.json = argv[++i];
    } else if (!a.empty() && a[0] != '-' && opt.file.empty()) {
      opt.file = a;
    } else {
      std::cerr << "Unknown option: " << a << "\n";
      std::cerr << "Run with --help for usage.\n";
      return 2;
    }
  }

  if (opt.file.empty()) {
    std::cerr << "--file is required\n";
    return 2;
  }

  std::string err;
  std::vector<std::uint8_t> bytes;
  if (!ReadFileBytes(opt.file, bytes, err)) {
    std::cerr << err << "\n";
    return 2;
  }

  HeightField grid;
  const SectorError decErr = DecodeSector(bytes, opt.grid, grid, err);
  if (decErr != SectorError::None) {
    std::cerr << "Decode failed (" << SectorErrorName(decErr) << "): " << err << "\n";
    return 2;
  }

  const ElevationRange range = ComputeElevationRange(grid);
  double sum = 0.0;
  for (const float v : grid.values) sum += v;
  const double mean = grid.values.empty() ? 0.0 : sum / static_cast<double>(grid.values.size());

  const std::size_t nominal = SectorNominalFileSize(opt.grid);
  const long long trailer = static_cast<long long>(bytes.size()) - static_cast<long long>(nominal);

  bool roundtripOk = true;
  if (opt.roundtrip) {
    std::vector<std::uint8_t> encoded;
    const SectorError encErr = EncodeSector(bytes, grid, opt.grid, encoded, err);
    roundtripOk = (encErr == SectorError::None) && encoded == bytes;
  }

  std::cout << "File:       " << opt.file << "\n";
  std::cout << "Size:       " << bytes.size() << " bytes (header " << kSectorElevationOffset << ", elevation "
            << opt.grid << "x" << opt.grid << " x " << kSectorCellStride << " bytes, trailer " << trailer << ")\n";
  std::cout << "Elevation:  min " << range.minValue << ", max " << range.maxValue << ", mean " << mean << "\n";
  if (opt.roundtrip) {
    std::cout << "Round-trip: " << (roundtripOk ? "identical" : "MISMATCH") << "\n";
  }

  if (!opt.csv.empty()) {
    if (!cli::EnsureParentDir(opt.csv) || !WriteCsv(opt.csv, grid, err)) {
      std::cerr << "Failed to write CSV: " << err << "\n";
      return 2;
    }
  }

  if (!opt.json.empty()) {
    JsonValue root = JsonValue::MakeObject();
    root.set("file", JsonValue::MakeString(opt.file));
    root.set("bytes", JsonValue::MakeNumber(static_cast<double>(bytes.size())));
    root.set("gridSize", JsonValue::MakeNumber(opt.grid));
    root.set("trailerBytes", JsonValue::MakeNumber(static_cast<double>(trailer)));
    root.set("min", JsonValue::MakeNumber(range.minValue));
    root.set("max", JsonValue::MakeNumber(range.maxValue));
    root.set("mean", JsonValue::MakeNumber(mean));
    if (opt.roundtrip) root.set("roundtripIdentical", JsonValue::MakeBool(roundtripOk));
    if (!cli::EnsureParentDir(opt.json) || !WriteJsonFile(opt.json, root, err)) {
      std::cerr << "Failed to write JSON: " << err << "\n";
      return 2;
    }
  }

  return roundtripOk ? 0 : 1;
}

} // namespace

int main(int argc, char** argv)
{
  return Run(argc, argv);
}
