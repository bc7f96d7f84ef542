#include "csdat/GridTransform.hpp"
#include "csdat/HeightField.hpp"
#include "csdat/ImageIO.hpp"
#include "csdat/Json.hpp"
#include "csdat/LogTee.hpp"
#include "csdat/Mosaic.hpp"
#include "csdat/MosaicMeta.hpp"
#include "csdat/Normalizer.hpp"
#include "csdat/SectorCodec.hpp"
#include "csdat/SectorDirectory.hpp"
#include "csdat/TerrainSession.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <limits>
#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static int g_failures = 0;

#define EXPECT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_TRUE failed: " << #cond << "\n";                          \
    }                                                                                                                \
  } while (0)

#define EXPECT_FALSE(cond) EXPECT_TRUE(!(cond))

#define EXPECT_EQ(a, b)                                                                                              \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    if (!(_a == _b)) {                                                                                               \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_EQ failed: " << #a << " == " << #b << "\n";               \
    }                                                                                                                \
  } while (0)

#define EXPECT_NE(a, b)                                                                                              \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    if ((_a == _b)) {                                                                                                \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_NE failed: " << #a << " != " << #b << "\n";               \
    }                                                                                                                \
  } while (0)

#define EXPECT_NEAR(a, b, eps)                                                                                       \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    const auto _e = (eps);                                                                                           \
    if (std::fabs((_a) - (_b)) > (_e)) {                                                                             \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_NEAR failed: " << #a << " ~= " << #b << " (eps=" << _e   \
                << ")\n";                                                                                            \
    }                                                                                                                \
  } while (0)

#define ASSERT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " ASSERT_TRUE failed: " << #cond << "\n";                          \
      return;                                                                                                        \
    }                                                                                                                \
  } while (0)

namespace {

using namespace csdat;

fs::path MakeTempPath(const std::string& prefix)
{
  static std::uint64_t counter = 0;
  ++counter;

  std::error_code ec;
  fs::path root = fs::temp_directory_path(ec);
  if (ec || root.empty()) root = fs::path(".");

  const auto stamp = static_cast<std::uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count());
  return root / (prefix + "_" + std::to_string(stamp) + "_" + std::to_string(counter));
}

void RemoveTree(const fs::path& p)
{
  std::error_code ec;
  fs::remove_all(p, ec);
}

// Deterministic raw elevation for a cell. Distinct per sector so misplaced sectors show up.
std::uint16_t RawSample(int sector, int x, int y)
{
  return static_cast<std::uint16_t>(1000 + sector * 37 + x * 5 + y * 3);
}

// A sector file with a patterned header/payload/trailer and RawSample() elevations.
std::vector<std::uint8_t> MakeSectorBytes(int gridSize, int sector, std::size_t trailer = 13)
{
  std::vector<std::uint8_t> bytes(SectorNominalFileSize(gridSize) + trailer);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    bytes[i] = static_cast<std::uint8_t>((i * 31u + static_cast<std::size_t>(sector) * 7u) & 0xFFu);
  }
  for (int y = 0; y < gridSize; ++y) {
    for (int x = 0; x < gridSize; ++x) {
      const std::size_t pos = SectorSampleOffset(gridSize, x, y);
      const std::uint16_t raw = RawSample(sector, x, y);
      bytes[pos] = static_cast<std::uint8_t>(raw & 0xFFu);
      bytes[pos + 1] = static_cast<std::uint8_t>(raw >> 8);
    }
  }
  return bytes;
}

std::vector<std::uint8_t> MakeFlatSectorBytes(int gridSize, std::uint16_t raw, int salt)
{
  std::vector<std::uint8_t> bytes = MakeSectorBytes(gridSize, salt);
  for (int y = 0; y < gridSize; ++y) {
    for (int x = 0; x < gridSize; ++x) {
      const std::size_t pos = SectorSampleOffset(gridSize, x, y);
      bytes[pos] = static_cast<std::uint8_t>(raw & 0xFFu);
      bytes[pos + 1] = static_cast<std::uint8_t>(raw >> 8);
    }
  }
  return bytes;
}

bool WriteBytes(const fs::path& path, const std::vector<std::uint8_t>& bytes)
{
  std::ofstream f(path, std::ios::binary | std::ios::trunc);
  if (!f) return false;
  f.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
  return static_cast<bool>(f);
}

std::vector<std::uint8_t> ReadBytes(const fs::path& path)
{
  std::vector<std::uint8_t> bytes;
  std::string err;
  if (!ReadFileBytes(path.string(), bytes, err)) bytes.clear();
  return bytes;
}

// Populate dir with sd<i>.csdat for every layout index not listed in skip.
bool WriteSectorDir(const fs::path& dir, const SectorLayout& layout, const std::set<int>& skip = {})
{
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) return false;
  for (int i = 0; i < SectorCount(layout); ++i) {
    if (skip.count(i) != 0) continue;
    if (!WriteBytes(dir / SectorFileName(i), MakeSectorBytes(layout.gridSize, i))) return false;
  }
  return true;
}

std::vector<std::vector<std::uint8_t>> SnapshotSectorDir(const fs::path& dir, const SectorLayout& layout)
{
  std::vector<std::vector<std::uint8_t>> out;
  for (int i = 0; i < SectorCount(layout); ++i) out.push_back(ReadBytes(dir / SectorFileName(i)));
  return out;
}

// Everything except the elevation bytes must match.
bool SameOutsideElevation(const std::vector<std::uint8_t>& a, const std::vector<std::uint8_t>& b, int gridSize)
{
  if (a.size() != b.size()) return false;
  std::vector<std::uint8_t> mask(a.size(), 1u);
  for (int y = 0; y < gridSize; ++y) {
    for (int x = 0; x < gridSize; ++x) {
      const std::size_t pos = SectorSampleOffset(gridSize, x, y);
      mask[pos] = 0u;
      mask[pos + 1] = 0u;
    }
  }
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (mask[i] && a[i] != b[i]) return false;
  }
  return true;
}

HeightField MakeSectorGrid(int gridSize, int sector)
{
  HeightField g(gridSize, gridSize);
  for (int y = 0; y < gridSize; ++y) {
    for (int x = 0; x < gridSize; ++x) g.at(x, y) = DecodeElevationSample(RawSample(sector, x, y));
  }
  return g;
}

void TestElevationSampleEncoding()
{
  EXPECT_EQ(EncodeElevationSample(1.0), static_cast<std::uint16_t>(128));
  EXPECT_EQ(EncodeElevationSample(0.0), static_cast<std::uint16_t>(0));
  EXPECT_EQ(EncodeElevationSample(-3.0), static_cast<std::uint16_t>(0));
  EXPECT_EQ(EncodeElevationSample(1.0e9), static_cast<std::uint16_t>(65535));
  EXPECT_EQ(EncodeElevationSample(65535.0 / 128.0), static_cast<std::uint16_t>(65535));
  EXPECT_EQ(EncodeElevationSample(std::numeric_limits<double>::quiet_NaN()), static_cast<std::uint16_t>(0));

  // Nearest raw step, halves away from zero.
  EXPECT_EQ(EncodeElevationSample(2.4 / 128.0), static_cast<std::uint16_t>(2));
  EXPECT_EQ(EncodeElevationSample(2.5 / 128.0), static_cast<std::uint16_t>(3));
  EXPECT_EQ(EncodeElevationSample(2.6 / 128.0), static_cast<std::uint16_t>(3));

  EXPECT_EQ(DecodeElevationSample(128), 1.0f);
  EXPECT_EQ(DecodeElevationSample(65535), static_cast<float>(65535.0 / 128.0));
  for (std::uint32_t raw = 0; raw <= 65535u; raw += 251u) {
    const std::uint16_t r = static_cast<std::uint16_t>(raw);
    EXPECT_EQ(EncodeElevationSample(DecodeElevationSample(r)), r);
  }
}

void TestSectorCodecRoundTrip()
{
  const int g = kDefaultSectorGridSize;
  const std::vector<std::uint8_t> bytes = MakeSectorBytes(g, 5, 29);

  HeightField grid;
  std::string err;
  ASSERT_TRUE(DecodeSector(bytes, g, grid, err) == SectorError::None);
  EXPECT_EQ(grid.width, g);
  EXPECT_EQ(grid.height, g);
  EXPECT_EQ(grid.at(0, 0), DecodeElevationSample(RawSample(5, 0, 0)));
  EXPECT_EQ(grid.at(64, 1), DecodeElevationSample(RawSample(5, 64, 1)));
  EXPECT_EQ(grid.at(3, 64), DecodeElevationSample(RawSample(5, 3, 64)));

  std::vector<std::uint8_t> encoded;
  ASSERT_TRUE(EncodeSector(bytes, grid, g, encoded, err) == SectorError::None);
  EXPECT_TRUE(encoded == bytes);

  // One edited cell changes exactly its two elevation bytes.
  grid.at(7, 2) = 300.0f;
  ASSERT_TRUE(EncodeSector(bytes, grid, g, encoded, err) == SectorError::None);
  const std::size_t pos = SectorSampleOffset(g, 7, 2);
  EXPECT_EQ(pos, static_cast<std::size_t>(708 + (2 * g + 7) * 4));
  int changed = 0;
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    if (bytes[i] != encoded[i]) {
      ++changed;
      EXPECT_TRUE(i == pos || i == pos + 1);
    }
  }
  EXPECT_TRUE(changed > 0);
  EXPECT_EQ(static_cast<int>(encoded[pos]) | (static_cast<int>(encoded[pos + 1]) << 8), 300 * 128);
}

void TestSectorCodecSizeErrors()
{
  const int g = 65;
  EXPECT_EQ(SectorMinimumFileSize(g), static_cast<std::size_t>(708 + (g * g - 1) * 4 + 2));
  EXPECT_EQ(SectorNominalFileSize(g), static_cast<std::size_t>(708 + g * g * 4));

  std::string err;
  HeightField grid;

  // 708 header bytes + 100 bytes = 25 cells.
  std::vector<std::uint8_t> truncated(708 + 100, 0x11);
  EXPECT_TRUE(DecodeSector(truncated, g, grid, err) == SectorError::Truncated);
  EXPECT_FALSE(err.empty());

  std::vector<std::uint8_t> minimal = MakeSectorBytes(g, 1, 0);
  minimal.resize(SectorMinimumFileSize(g));
  EXPECT_TRUE(DecodeSector(minimal, g, grid, err) == SectorError::None);
  EXPECT_EQ(grid.at(g - 1, g - 1), DecodeElevationSample(RawSample(1, g - 1, g - 1)));

  std::vector<std::uint8_t> out;
  EXPECT_TRUE(EncodeSector(minimal, grid, g, out, err) == SectorError::None);
  EXPECT_TRUE(out == minimal);

  std::vector<std::uint8_t> tooSmall(minimal.begin(), minimal.end() - 1);
  out.clear();
  EXPECT_TRUE(EncodeSector(tooSmall, grid, g, out, err) == SectorError::TooSmall);
  EXPECT_TRUE(out.empty());

  HeightField wrong(g - 1, g);
  EXPECT_TRUE(EncodeSector(minimal, wrong, g, out, err) == SectorError::GridMismatch);

  const fs::path missing = MakeTempPath("csdat_missing_sector") / "sd0.csdat";
  EXPECT_TRUE(LoadSectorFile(missing.string(), g, grid, err) == SectorError::Io);
}

void TestAtomicWrite()
{
  const fs::path dir = MakeTempPath("csdat_atomic");
  std::error_code ec;
  fs::create_directories(dir, ec);
  ASSERT_TRUE(!ec);

  const fs::path p = dir / "sd0.csdat";
  std::string err;
  EXPECT_TRUE(WriteFileBytesAtomic(p.string(), {1, 2, 3}, err));
  EXPECT_TRUE(WriteFileBytesAtomic(p.string(), {4, 5}, err));
  EXPECT_TRUE(ReadBytes(p) == (std::vector<std::uint8_t>{4, 5}));
  EXPECT_FALSE(fs::exists(dir / "sd0.csdat.tmp"));

  EXPECT_FALSE(WriteFileBytesAtomic((dir / "nope" / "sd1.csdat").string(), {1}, err));
  EXPECT_FALSE(err.empty());

  RemoveTree(dir);
}

void TestSectorFileNames()
{
  int idx = -1;
  EXPECT_TRUE(ParseSectorFileName("sd0.csdat", &idx));
  EXPECT_EQ(idx, 0);
  EXPECT_TRUE(ParseSectorFileName("sd63.csdat", &idx));
  EXPECT_EQ(idx, 63);
  EXPECT_TRUE(ParseSectorFileName("sd007.csdat", &idx));
  EXPECT_EQ(idx, 7);

  EXPECT_FALSE(ParseSectorFileName("sd.csdat", &idx));
  EXPECT_FALSE(ParseSectorFileName("sd-1.csdat", &idx));
  EXPECT_FALSE(ParseSectorFileName("sd+1.csdat", &idx));
  EXPECT_FALSE(ParseSectorFileName("sd 1.csdat", &idx));
  EXPECT_FALSE(ParseSectorFileName("sd1.CSDAT", &idx));
  EXPECT_FALSE(ParseSectorFileName("SD1.csdat", &idx));
  EXPECT_FALSE(ParseSectorFileName("xsd1.csdat", &idx));
  EXPECT_FALSE(ParseSectorFileName("sd1.csdat.bak", &idx));
  EXPECT_FALSE(ParseSectorFileName("sd99999999999.csdat", &idx));

  EXPECT_EQ(SectorFileName(12), std::string("sd12.csdat"));
  EXPECT_TRUE(ParseSectorFileName(SectorFileName(4321), &idx));
  EXPECT_EQ(idx, 4321);
}

void TestListSectorFiles()
{
  std::vector<SectorFileEntry> entries;
  std::string err;

  const fs::path dir = MakeTempPath("csdat_scan");
  EXPECT_TRUE(ListSectorFiles(dir, entries, err) == DirectoryError::NotFound);

  std::error_code ec;
  fs::create_directories(dir, ec);
  ASSERT_TRUE(!ec);
  EXPECT_TRUE(ListSectorFiles(dir, entries, err) == DirectoryError::NoMatches);

  const std::vector<std::uint8_t> blob{1, 2, 3};
  ASSERT_TRUE(WriteBytes(dir / "sd10.csdat", blob));
  ASSERT_TRUE(WriteBytes(dir / "sd2.csdat", blob));
  ASSERT_TRUE(WriteBytes(dir / "sd07.csdat", blob));
  ASSERT_TRUE(WriteBytes(dir / "sd7.csdat", blob));
  ASSERT_TRUE(WriteBytes(dir / "readme.txt", blob));
  fs::create_directories(dir / "sd3.csdat", ec);

  SectorScanReport report;
  ASSERT_TRUE(ListSectorFiles(dir, entries, err, SectorScanConfig{}, &report) == DirectoryError::None);
  ASSERT_TRUE(entries.size() == 3u);
  EXPECT_EQ(entries[0].index, 2);
  EXPECT_EQ(entries[1].index, 7);
  EXPECT_EQ(entries[2].index, 10);

  // "sd07" sorts before "sd7", so sd7.csdat is the one kept.
  EXPECT_EQ(entries[1].path.filename().string(), std::string("sd7.csdat"));

  EXPECT_EQ(report.filesSeen, 5);
  EXPECT_EQ(report.skippedNames, 1);
  ASSERT_TRUE(report.duplicateIndices.size() == 1u);
  EXPECT_EQ(report.duplicateIndices[0], 7);

  SectorScanConfig strict;
  strict.rejectDuplicates = true;
  EXPECT_TRUE(ListSectorFiles(dir, entries, err, strict) == DirectoryError::DuplicateIndex);
  EXPECT_TRUE(entries.empty());
  EXPECT_TRUE(err.find('7') != std::string::npos);

  RemoveTree(dir);
}

void TestGridTransformInverse()
{
  HeightField src(5, 3);
  for (std::size_t i = 0; i < src.values.size(); ++i) src.values[i] = static_cast<float>(i);

  for (int rot = 0; rot < 360; rot += 90) {
    for (int m = 0; m < 4; ++m) {
      const GridTransformConfig cfg{rot, (m & 1) != 0, (m & 2) != 0};
      HeightField fwd;
      HeightField back;
      std::string err;
      ASSERT_TRUE(TransformGrid(src, fwd, cfg, err));
      ASSERT_TRUE(TransformGrid(fwd, back, InverseGridTransform(cfg), err));
      EXPECT_TRUE(back == src);

      int w = 0;
      int h = 0;
      ASSERT_TRUE(ComputeGridTransformDims(cfg, src.width, src.height, w, h, err));
      EXPECT_EQ(fwd.width, w);
      EXPECT_EQ(fwd.height, h);

      for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
          int sx = -1;
          int sy = -1;
          ASSERT_TRUE(MapTransformedToSource(cfg, src.width, src.height, x, y, sx, sy, err));
          EXPECT_EQ(fwd.at(x, y), src.at(sx, sy));
        }
      }
      int sx = 0;
      int sy = 0;
      EXPECT_FALSE(MapTransformedToSource(cfg, src.width, src.height, w, 0, sx, sy, err));
    }
  }

  // 270 clockwise is a quarter turn counter-clockwise: the right column becomes the top row.
  HeightField row(2, 1);
  row.at(0, 0) = 1.0f;
  row.at(1, 0) = 2.0f;
  HeightField ccw;
  std::string err;
  ASSERT_TRUE(TransformGrid(row, ccw, GridTransformConfig{270, false, false}, err));
  EXPECT_EQ(ccw.width, 1);
  EXPECT_EQ(ccw.height, 2);
  EXPECT_EQ(ccw.at(0, 0), 2.0f);
  EXPECT_EQ(ccw.at(0, 1), 1.0f);

  HeightField out;
  EXPECT_FALSE(TransformGrid(row, out, GridTransformConfig{45, false, false}, err));
}

void TestSectorLayoutValidation()
{
  std::string err;
  EXPECT_TRUE(ValidateSectorLayout(SectorLayout{}, err));
  EXPECT_TRUE(ValidateSectorLayout(SectorLayout{1, 100, 2}, err));
  EXPECT_FALSE(ValidateSectorLayout(SectorLayout{0, 8, 65}, err));
  EXPECT_FALSE(ValidateSectorLayout(SectorLayout{8, 101, 65}, err));
  EXPECT_FALSE(ValidateSectorLayout(SectorLayout{8, 8, 1}, err));

  MosaicRect r;
  const SectorLayout layout{3, 2, 4};
  EXPECT_FALSE(SectorDisplayRect(-1, layout, r));
  EXPECT_FALSE(SectorDisplayRect(6, layout, r));
  ASSERT_TRUE(SectorDisplayRect(5, layout, r));
  EXPECT_EQ(r.x, 4);
  EXPECT_EQ(r.y, 0);
  EXPECT_EQ(r.w, 4);
  EXPECT_EQ(r.h, 4);
}

void CheckComposeSplit(const SectorLayout& layout, const std::set<int>& absent)
{
  SectorGrids sectors;
  for (int i = 0; i < SectorCount(layout); ++i) {
    if (absent.count(i) == 0) sectors[i] = MakeSectorGrid(layout.gridSize, i);
  }

  HeightField mosaic;
  MosaicComposeStats st;
  std::string err;
  ASSERT_TRUE(ComposeMosaic(sectors, layout, mosaic, err, &st));
  EXPECT_EQ(mosaic.width, layout.sectorsY * layout.gridSize);
  EXPECT_EQ(mosaic.height, layout.sectorsX * layout.gridSize);
  EXPECT_EQ(st.placed, static_cast<int>(sectors.size()));
  EXPECT_EQ(st.missing, static_cast<int>(absent.size()));

  // Sector cell (x, y) lands at (rect.x + y, rect.y + g-1-x) in the display mosaic.
  const int g = layout.gridSize;
  for (int i = 0; i < SectorCount(layout); ++i) {
    MosaicRect r;
    ASSERT_TRUE(SectorDisplayRect(i, layout, r));
    const auto it = sectors.find(i);
    for (int y = 0; y < g; ++y) {
      for (int x = 0; x < g; ++x) {
        const float expect = (it == sectors.end()) ? 0.0f : it->second.at(x, y);
        EXPECT_EQ(mosaic.at(r.x + y, r.y + g - 1 - x), expect);
      }
    }
  }

  std::vector<int> present;
  for (const auto& kv : sectors) present.push_back(kv.first);

  SectorGrids split;
  ASSERT_TRUE(SplitMosaic(mosaic, layout, split, err, &present));
  EXPECT_TRUE(split == sectors);

  SectorGrids all;
  ASSERT_TRUE(SplitMosaic(mosaic, layout, all, err));
  EXPECT_EQ(static_cast<int>(all.size()), SectorCount(layout));
  for (const int i : absent) {
    EXPECT_TRUE(all[i] == HeightField(g, g, 0.0f));
  }

  HeightField again;
  ASSERT_TRUE(ComposeMosaic(split, layout, again, err));
  EXPECT_TRUE(again == mosaic);
}

void TestComposeSplitLayouts()
{
  CheckComposeSplit(SectorLayout{8, 8, 5}, {});
  CheckComposeSplit(SectorLayout{3, 2, 4}, {1});
  CheckComposeSplit(SectorLayout{2, 5, 3}, {0, 9});
  CheckComposeSplit(SectorLayout{1, 4, 2}, {});
  CheckComposeSplit(SectorLayout{4, 1, 3}, {3});
}

void TestComposeRejectsBadSectors()
{
  const SectorLayout layout{2, 2, 4};
  SectorGrids sectors;
  sectors[0] = MakeSectorGrid(4, 0);
  sectors[9] = MakeSectorGrid(4, 9);

  HeightField mosaic;
  MosaicComposeStats st;
  std::string err;
  EXPECT_TRUE(ComposeMosaic(sectors, layout, mosaic, err, &st));
  EXPECT_EQ(st.outOfLayout, 1);
  EXPECT_EQ(st.placed, 1);
  EXPECT_EQ(st.missing, 3);

  sectors[1] = HeightField(3, 4);
  EXPECT_FALSE(ComposeMosaic(sectors, layout, mosaic, err));
  EXPECT_FALSE(err.empty());

  SectorGrids split;
  EXPECT_FALSE(SplitMosaic(HeightField(8, 7), layout, split, err));
}

void TestMissingSectorIsZeroPatch()
{
  const SectorLayout layout{8, 8, 65};
  const fs::path dir = MakeTempPath("csdat_missing3");
  ASSERT_TRUE(WriteSectorDir(dir, layout, {3}));

  TerrainSession session;
  ImportReport report;
  ImportConfig cfg;
  cfg.layout = layout;
  cfg.threads = 4;
  std::string err;
  ASSERT_TRUE(ImportTerrain(dir, cfg, session, err, &report) == ImportStatus::Ok);
  EXPECT_EQ(report.sectorsLoaded, 63);
  EXPECT_EQ(report.sectorsMissing, 1);
  EXPECT_EQ(report.sectorsFailed, 0);
  EXPECT_EQ(session.mosaic.width, 520);
  EXPECT_EQ(session.mosaic.height, 520);

  MosaicRect r;
  ASSERT_TRUE(SectorDisplayRect(3, layout, r));
  bool allZero = true;
  for (int y = r.y; y < r.y + r.h; ++y) {
    for (int x = r.x; x < r.x + r.w; ++x) allZero = allZero && session.mosaic.at(x, y) == 0.0f;
  }
  EXPECT_TRUE(allZero);

  // Missing sectors take no part in the elevation range.
  EXPECT_TRUE(report.range.valid);
  EXPECT_EQ(report.range.minValue, DecodeElevationSample(RawSample(0, 0, 0)));

  RemoveTree(dir);
}

void TestNormalization()
{
  HeightField mosaic(4, 3);
  for (std::size_t i = 0; i < mosaic.values.size(); ++i) mosaic.values[i] = 10.0f + 0.5f * static_cast<float>(i);

  DisplayOptions plain;
  plain.rotateForDisplay = false;

  NormalizedImage img;
  ElevationRange range;
  std::string err;
  ASSERT_TRUE(ToDisplay(mosaic, plain, img, err, &range));
  EXPECT_TRUE(range.valid);
  EXPECT_EQ(range.minValue, 10.0f);
  EXPECT_EQ(range.maxValue, 15.5f);
  EXPECT_EQ(img.values.front(), 0.0f);
  EXPECT_EQ(img.values.back(), 1.0f);

  HeightField back;
  ASSERT_TRUE(FromDisplay(img, range.minValue, range.maxValue, plain, back, err));
  ASSERT_TRUE(back.width == mosaic.width && back.height == mosaic.height);
  for (std::size_t i = 0; i < mosaic.values.size(); ++i) EXPECT_NEAR(back.values[i], mosaic.values[i], 1e-4f);

  // Out-of-range pixels clamp to the range ends.
  img.values[0] = -0.5f;
  img.values[1] = 1.5f;
  ASSERT_TRUE(FromDisplay(img, range.minValue, range.maxValue, plain, back, err));
  EXPECT_EQ(back.values[0], 10.0f);
  EXPECT_EQ(back.values[1], 15.5f);

  EXPECT_FALSE(FromDisplay(img, 5.0f, 1.0f, plain, back, err));
  EXPECT_FALSE(FromDisplay(img, std::numeric_limits<float>::quiet_NaN(), 1.0f, plain, back, err));
}

void TestFlatNormalization()
{
  const HeightField flat(3, 2, 7.0f);
  DisplayOptions plain;
  plain.rotateForDisplay = false;

  NormalizedImage img;
  ElevationRange range;
  std::string err;
  ASSERT_TRUE(ToDisplay(flat, plain, img, err, &range));
  EXPECT_EQ(range.minValue, 7.0f);
  EXPECT_EQ(range.maxValue, 7.0f);
  for (const float v : img.values) EXPECT_EQ(v, 0.0f);

  HeightField back;
  ASSERT_TRUE(FromDisplay(img, 7.0f, 7.0f, plain, back, err));
  EXPECT_TRUE(back == flat);

  // With a degenerate range a pixel p maps to min + p * max.
  img.values[0] = 0.5f;
  ASSERT_TRUE(FromDisplay(img, 7.0f, 7.0f, plain, back, err));
  EXPECT_EQ(back.values[0], 10.5f);

  NormalizedImage empty;
  ElevationRange emptyRange;
  ASSERT_TRUE(ToDisplay(HeightField{}, plain, empty, err, &emptyRange));
  EXPECT_FALSE(emptyRange.valid);
}

void TestDisplayRotation()
{
  HeightField mosaic(4, 3);
  for (std::size_t i = 0; i < mosaic.values.size(); ++i) mosaic.values[i] = static_cast<float>(i);

  DisplayOptions rotated;
  int w = 0;
  int h = 0;
  DisplayImageDims(4, 3, rotated, w, h);
  EXPECT_EQ(w, 3);
  EXPECT_EQ(h, 4);

  NormalizedImage img;
  std::string err;
  ASSERT_TRUE(ToDisplay(mosaic, rotated, img, err));
  EXPECT_EQ(img.width, 3);
  EXPECT_EQ(img.height, 4);

  // Counter-clockwise: the mosaic's top-right corner is the image's top-left.
  EXPECT_EQ(img.at(0, 0), 3.0f / 11.0f);

  HeightField back;
  ASSERT_TRUE(FromDisplay(img, 0.0f, 11.0f, rotated, back, err));
  ASSERT_TRUE(back.width == 4 && back.height == 3);
  for (std::size_t i = 0; i < mosaic.values.size(); ++i) EXPECT_NEAR(back.values[i], mosaic.values[i], 1e-5f);
}

void TestRgbaPixels()
{
  NormalizedImage img(2, 2);
  img.values = {0.0f, 0.25f, 0.5f, 1.0f};

  const std::vector<float> rgba = ToRgbaPixels(img);
  ASSERT_TRUE(rgba.size() == 16u);
  EXPECT_EQ(rgba[4], 0.25f);
  EXPECT_EQ(rgba[5], 0.25f);
  EXPECT_EQ(rgba[6], 0.25f);
  EXPECT_EQ(rgba[7], 1.0f);

  NormalizedImage back;
  std::string err;
  ASSERT_TRUE(FromRgbaPixels(rgba, 2, 2, back, err));
  EXPECT_TRUE(back == img);
  EXPECT_FALSE(FromRgbaPixels(rgba, 3, 2, back, err));
}

void TestQuantizeDisplayImage()
{
  NormalizedImage img(3, 1);
  img.values = {0.0f, 0.5f, 1.0f};

  RasterImage r;
  std::string err;
  ASSERT_TRUE(QuantizeDisplayImage(img, 8, 4, r, err));
  ASSERT_TRUE(r.samples.size() == 12u);
  EXPECT_EQ(r.samples[4], static_cast<std::uint16_t>(128));
  EXPECT_EQ(r.samples[7], static_cast<std::uint16_t>(255));
  EXPECT_EQ(r.samples[8], static_cast<std::uint16_t>(255));

  ASSERT_TRUE(QuantizeDisplayImage(img, 16, 1, r, err));
  EXPECT_EQ(r.samples[1], static_cast<std::uint16_t>(32768));

  NormalizedImage back;
  ASSERT_TRUE(DequantizeDisplayImage(r, back, err));
  EXPECT_EQ(back.values[0], 0.0f);
  EXPECT_NEAR(back.values[1], 0.5f, 1e-4f);
  EXPECT_EQ(back.values[2], 1.0f);

  EXPECT_FALSE(QuantizeDisplayImage(img, 12, 1, r, err));
  EXPECT_FALSE(QuantizeDisplayImage(img, 8, 2, r, err));
}

void TestImageIo()
{
  const fs::path dir = MakeTempPath("csdat_images");
  std::error_code ec;
  fs::create_directories(dir, ec);
  ASSERT_TRUE(!ec);

  RasterImage gray16;
  gray16.width = 5;
  gray16.height = 3;
  gray16.channels = 1;
  gray16.bitDepth = 16;
  for (int i = 0; i < 15; ++i) gray16.samples.push_back(static_cast<std::uint16_t>(i * 4369 + 1));

  RasterImage rgba8;
  rgba8.width = 2;
  rgba8.height = 2;
  rgba8.channels = 4;
  rgba8.bitDepth = 8;
  rgba8.samples = {0, 1, 2, 255, 10, 20, 30, 255, 100, 110, 120, 255, 253, 254, 255, 255};

  std::string err;
  for (const char* name : {"gray16.png", "gray16.pgm"}) {
    const std::string p = (dir / name).string();
    ASSERT_TRUE(WriteImageAuto(p, gray16, err));
    RasterImage back;
    ASSERT_TRUE(ReadImageAuto(p, back, err));
    EXPECT_EQ(back.width, 5);
    EXPECT_EQ(back.height, 3);
    EXPECT_EQ(back.channels, 1);
    EXPECT_EQ(back.bitDepth, 16);
    EXPECT_TRUE(back.samples == gray16.samples);
  }

  {
    const std::string p = (dir / "rgba8.png").string();
    ASSERT_TRUE(WritePng(p, rgba8, err));
    RasterImage back;
    ASSERT_TRUE(ReadPng(p, back, err));
    EXPECT_EQ(back.channels, 4);
    EXPECT_EQ(back.bitDepth, 8);
    EXPECT_TRUE(back.samples == rgba8.samples);
  }

  {
    // PNM has no alpha: RGBA is written as P6.
    const std::string p = (dir / "rgba8.ppm").string();
    ASSERT_TRUE(WritePnm(p, rgba8, err));
    RasterImage back;
    ASSERT_TRUE(ReadPnm(p, back, err));
    EXPECT_EQ(back.channels, 3);
    ASSERT_TRUE(back.samples.size() == 12u);
    EXPECT_EQ(back.samples[3], static_cast<std::uint16_t>(10));
    EXPECT_EQ(back.samples[11], static_cast<std::uint16_t>(255));
  }

  {
    // No usable extension: the reader probes the magic bytes.
    const fs::path png = dir / "gray16.png";
    const fs::path renamed = dir / "edited.img";
    fs::copy_file(png, renamed, fs::copy_options::overwrite_existing, ec);
    ASSERT_TRUE(!ec);
    RasterImage back;
    EXPECT_TRUE(ReadImageAuto(renamed.string(), back, err));
    EXPECT_TRUE(back.samples == gray16.samples);
  }

  {
    const fs::path junk = dir / "junk.png";
    ASSERT_TRUE(WriteBytes(junk, {1, 2, 3, 4, 5, 6, 7, 8, 9}));
    RasterImage back;
    EXPECT_FALSE(ReadImageAuto(junk.string(), back, err));
    EXPECT_FALSE(err.empty());

    // Flip one byte inside IHDR: the chunk CRC no longer matches.
    std::vector<std::uint8_t> bytes = ReadBytes(dir / "gray16.png");
    ASSERT_TRUE(bytes.size() > 20u);
    bytes[18] ^= 0x01u;
    ASSERT_TRUE(WriteBytes(junk, bytes));
    EXPECT_FALSE(ReadPng(junk.string(), back, err));
  }

  RasterImage bad = gray16;
  bad.samples.pop_back();
  EXPECT_FALSE(ValidateRasterImage(bad, err));
  EXPECT_FALSE(WritePng((dir / "bad.png").string(), bad, err));

  RemoveTree(dir);
}

void TestEndToEndFlatTerrain()
{
  // 8x8 sectors of 65x65 samples, every sample raw 128 (elevation 1.0).
  const SectorLayout layout{8, 8, 65};
  const fs::path dir = MakeTempPath("csdat_flat");
  std::error_code ec;
  fs::create_directories(dir, ec);
  ASSERT_TRUE(!ec);
  for (int i = 0; i < SectorCount(layout); ++i) {
    ASSERT_TRUE(WriteBytes(dir / SectorFileName(i), MakeFlatSectorBytes(layout.gridSize, 128, i)));
  }
  const auto before = SnapshotSectorDir(dir, layout);

  ImportConfig icfg;
  icfg.layout = layout;
  icfg.threads = 0;
  TerrainSession session;
  ImportReport ireport;
  std::string err;
  ASSERT_TRUE(ImportTerrain(dir, icfg, session, err, &ireport) == ImportStatus::Ok);
  EXPECT_EQ(ireport.sectorsLoaded, 64);
  EXPECT_EQ(ireport.range.minValue, 1.0f);
  EXPECT_EQ(ireport.range.maxValue, 1.0f);

  NormalizedImage img;
  ASSERT_TRUE(SessionToDisplay(session, DisplayOptions{}, img, err));
  RasterImage raster;
  ASSERT_TRUE(QuantizeDisplayImage(img, 8, 4, raster, err));
  const fs::path png = dir / "edit" / "terrain.png";
  fs::create_directories(png.parent_path(), ec);
  ASSERT_TRUE(WriteImageAuto(png.string(), raster, err));

  RasterImage edited;
  ASSERT_TRUE(ReadImageAuto(png.string(), edited, err));
  NormalizedImage editedImg;
  ASSERT_TRUE(DequantizeDisplayImage(edited, editedImg, err));

  ExportConfig ecfg;
  ecfg.threads = 4;
  ExportReport ereport;
  ASSERT_TRUE(ExportTerrain(session, editedImg, ecfg, ereport, err));
  EXPECT_EQ(ereport.written, 64);
  EXPECT_EQ(ereport.failed, 0);
  EXPECT_FALSE(ereport.cancelled);

  const auto after = SnapshotSectorDir(dir, layout);
  for (int i = 0; i < SectorCount(layout); ++i) {
    EXPECT_TRUE(after[static_cast<std::size_t>(i)] == before[static_cast<std::size_t>(i)]);
  }

  RemoveTree(dir);
}

void TestEndToEndVariedTerrain()
{
  const SectorLayout layout{3, 2, 9};
  const fs::path dir = MakeTempPath("csdat_varied");
  ASSERT_TRUE(WriteSectorDir(dir, layout));
  const auto before = SnapshotSectorDir(dir, layout);

  ImportConfig icfg;
  icfg.layout = layout;
  TerrainSession session;
  std::string err;
  ASSERT_TRUE(ImportTerrain(dir, icfg, session, err) == ImportStatus::Ok);

  // The span is far below LosslessDisplaySpan(16), so 16-bit grayscale keeps every 1/128 step.
  EXPECT_TRUE(SessionElevationRange(session).maxValue - SessionElevationRange(session).minValue <
              LosslessDisplaySpan(16));
  NormalizedImage img;
  ASSERT_TRUE(SessionToDisplay(session, DisplayOptions{}, img, err));
  RasterImage raster;
  ASSERT_TRUE(QuantizeDisplayImage(img, 16, 1, raster, err));
  const fs::path pgm = dir / "terrain.pgm";
  ASSERT_TRUE(WriteImageAuto(pgm.string(), raster, err));

  RasterImage reread;
  ASSERT_TRUE(ReadImageAuto(pgm.string(), reread, err));
  NormalizedImage editedImg;
  ASSERT_TRUE(DequantizeDisplayImage(reread, editedImg, err));

  ExportConfig ecfg;
  ExportReport ereport;
  ASSERT_TRUE(ExportTerrain(session, editedImg, ecfg, ereport, err));
  EXPECT_EQ(ereport.written, 6);
  EXPECT_TRUE(SnapshotSectorDir(dir, layout) == before);

  // Paint everything black: every sample becomes the imported minimum.
  for (float& v : editedImg.values) v = 0.0f;
  ASSERT_TRUE(ExportTerrain(session, editedImg, ecfg, ereport, err));
  EXPECT_EQ(ereport.written, 6);
  EXPECT_EQ(ereport.rangeUsed.minValue, DecodeElevationSample(RawSample(0, 0, 0)));

  const auto after = SnapshotSectorDir(dir, layout);
  for (int i = 0; i < SectorCount(layout); ++i) {
    const auto& b = before[static_cast<std::size_t>(i)];
    const auto& a = after[static_cast<std::size_t>(i)];
    EXPECT_TRUE(SameOutsideElevation(a, b, layout.gridSize));

    HeightField grid;
    ASSERT_TRUE(DecodeSector(a, layout.gridSize, grid, err) == SectorError::None);
    for (const float v : grid.values) EXPECT_EQ(v, DecodeElevationSample(1000));
  }

  // Wrong image size is a request error.
  EXPECT_FALSE(ExportTerrain(session, NormalizedImage(4, 4), ecfg, ereport, err));

  RemoveTree(dir);
}

void TestImportWithBrokenFiles()
{
  const SectorLayout layout{2, 2, 9};
  const fs::path dir = MakeTempPath("csdat_broken");
  ASSERT_TRUE(WriteSectorDir(dir, layout, {1}));
  ASSERT_TRUE(WriteBytes(dir / "sd1.csdat", std::vector<std::uint8_t>(708 + 10, 0x42)));
  ASSERT_TRUE(WriteBytes(dir / "sd99.csdat", MakeSectorBytes(layout.gridSize, 99)));

  ImportConfig cfg;
  cfg.layout = layout;
  TerrainSession session;
  ImportReport report;
  std::string err;
  ASSERT_TRUE(ImportTerrain(dir, cfg, session, err, &report) == ImportStatus::Ok);
  EXPECT_EQ(report.filesMatched, 4);
  EXPECT_EQ(report.outOfLayout, 1);
  EXPECT_EQ(report.sectorsLoaded, 3);
  EXPECT_EQ(report.sectorsFailed, 1);
  EXPECT_EQ(report.sectorsMissing, 1);
  ASSERT_TRUE(report.issues.size() == 1u);
  EXPECT_EQ(report.issues[0].index, 1);
  EXPECT_TRUE(report.issues[0].error == SectorError::Truncated);
  EXPECT_EQ(session.sectorPaths.size(), static_cast<std::size_t>(4));
  EXPECT_EQ(session.sectors.count(1), static_cast<std::size_t>(0));

  MosaicRect r;
  ASSERT_TRUE(SectorDisplayRect(1, layout, r));
  EXPECT_EQ(session.mosaic.at(r.x, r.y), 0.0f);

  // The truncated sector is not a write target; the others are rewritten.
  NormalizedImage img;
  ASSERT_TRUE(SessionToDisplay(session, DisplayOptions{}, img, err));
  ExportConfig ecfg;
  ExportReport ereport;
  ASSERT_TRUE(ExportTerrain(session, img, ecfg, ereport, err));
  EXPECT_EQ(ereport.written, 3);
  EXPECT_EQ(ereport.skipped, 1);
  EXPECT_EQ(ereport.failed, 0);
  EXPECT_TRUE(ereport.issues.empty());
  EXPECT_EQ(ReadBytes(dir / "sd1.csdat").size(), static_cast<std::size_t>(718));

  // Nothing decodable at all.
  const fs::path bad = MakeTempPath("csdat_all_broken");
  std::error_code ec;
  fs::create_directories(bad, ec);
  ASSERT_TRUE(WriteBytes(bad / "sd0.csdat", std::vector<std::uint8_t>(100, 0)));
  TerrainSession untouched;
  untouched.directory = "keep";
  EXPECT_TRUE(ImportTerrain(bad, cfg, untouched, err, &report) == ImportStatus::NoValidSectors);
  EXPECT_EQ(untouched.directory, fs::path("keep"));
  EXPECT_EQ(report.sectorsFailed, 1);

  ImportConfig badLayout;
  badLayout.layout = SectorLayout{0, 2, 9};
  EXPECT_TRUE(ImportTerrain(dir, badLayout, untouched, err) == ImportStatus::InvalidLayout);
  EXPECT_TRUE(ImportTerrain(dir / "nope", cfg, untouched, err) == ImportStatus::DirectoryNotFound);

  const fs::path empty = MakeTempPath("csdat_empty");
  fs::create_directories(empty, ec);
  EXPECT_TRUE(ImportTerrain(empty, cfg, untouched, err) == ImportStatus::NoMatches);
  EXPECT_EQ(untouched.directory, fs::path("keep"));

  RemoveTree(dir);
  RemoveTree(bad);
  RemoveTree(empty);
}

void TestParallelMatchesSerial()
{
  const SectorLayout layout{4, 4, 9};
  const fs::path dirA = MakeTempPath("csdat_serial");
  const fs::path dirB = MakeTempPath("csdat_parallel");
  ASSERT_TRUE(WriteSectorDir(dirA, layout, {5}));
  ASSERT_TRUE(WriteSectorDir(dirB, layout, {5}));

  std::vector<int> orderA;
  std::vector<int> orderB;
  std::vector<int> doneB;

  ImportConfig cfgA;
  cfgA.layout = layout;
  cfgA.threads = 1;
  cfgA.progress = [&](const ImportProgress& p) { orderA.push_back(p.index); };

  ImportConfig cfgB = cfgA;
  cfgB.threads = 4;
  cfgB.progress = [&](const ImportProgress& p) {
    orderB.push_back(p.index);
    doneB.push_back(p.done);
  };

  TerrainSession a;
  TerrainSession b;
  std::string err;
  ASSERT_TRUE(ImportTerrain(dirA, cfgA, a, err) == ImportStatus::Ok);
  ASSERT_TRUE(ImportTerrain(dirB, cfgB, b, err) == ImportStatus::Ok);

  EXPECT_TRUE(a.mosaic == b.mosaic);
  EXPECT_TRUE(a.sectors == b.sectors);
  EXPECT_TRUE(orderA == orderB);
  EXPECT_EQ(orderB.size(), static_cast<std::size_t>(15));
  for (std::size_t i = 0; i < doneB.size(); ++i) EXPECT_EQ(doneB[i], static_cast<int>(i + 1));
  for (std::size_t i = 1; i < orderB.size(); ++i) EXPECT_TRUE(orderB[i - 1] < orderB[i]);

  NormalizedImage img;
  ASSERT_TRUE(SessionToDisplay(a, DisplayOptions{}, img, err));
  for (std::size_t i = 0; i < img.values.size(); i += 3) img.values[i] = 1.0f - img.values[i];

  ExportConfig ecfgA;
  ecfgA.threads = 1;
  ExportConfig ecfgB;
  ecfgB.threads = 8;
  ExportReport ra;
  ExportReport rb;
  ASSERT_TRUE(ExportTerrain(a, img, ecfgA, ra, err));
  ASSERT_TRUE(ExportTerrain(b, img, ecfgB, rb, err));
  EXPECT_EQ(ra.written, 15);
  EXPECT_EQ(rb.written, 15);
  EXPECT_TRUE(SnapshotSectorDir(dirA, layout) == SnapshotSectorDir(dirB, layout));

  RemoveTree(dirA);
  RemoveTree(dirB);
}

void TestCancellation()
{
  const SectorLayout layout{2, 2, 5};
  const fs::path dir = MakeTempPath("csdat_cancel");
  ASSERT_TRUE(WriteSectorDir(dir, layout));
  const auto before = SnapshotSectorDir(dir, layout);

  std::atomic<bool> cancel{true};
  std::string err;

  for (const int threads : {1, 3}) {
    ImportConfig cfg;
    cfg.layout = layout;
    cfg.threads = threads;
    cfg.cancel = &cancel;
    TerrainSession session;
    EXPECT_TRUE(ImportTerrain(dir, cfg, session, err) == ImportStatus::Cancelled);
    EXPECT_TRUE(session.sectorPaths.empty());
  }

  // Raised from the progress callback after the second sector.
  {
    std::atomic<bool> stop{false};
    int calls = 0;
    ImportConfig cfg;
    cfg.layout = layout;
    cfg.cancel = &stop;
    cfg.progress = [&](const ImportProgress& p) {
      ++calls;
      if (p.done == 2) stop.store(true);
    };
    TerrainSession session;
    EXPECT_TRUE(ImportTerrain(dir, cfg, session, err) == ImportStatus::Cancelled);
    EXPECT_EQ(calls, 2);
  }

  ImportConfig cfg;
  cfg.layout = layout;
  TerrainSession session;
  ASSERT_TRUE(ImportTerrain(dir, cfg, session, err) == ImportStatus::Ok);

  NormalizedImage img;
  ASSERT_TRUE(SessionToDisplay(session, DisplayOptions{}, img, err));
  for (float& v : img.values) v = 0.5f;

  ExportConfig ecfg;
  ecfg.cancel = &cancel;
  ecfg.threads = 2;
  ExportReport report;
  ASSERT_TRUE(ExportTerrain(session, img, ecfg, report, err));
  EXPECT_TRUE(report.cancelled);
  EXPECT_EQ(report.written, 0);
  EXPECT_TRUE(SnapshotSectorDir(dir, layout) == before);

  RemoveTree(dir);
}

void TestUneditedExportAroundFailedSector()
{
  const SectorLayout layout{2, 2, 65};
  const fs::path dir = MakeTempPath("csdat_failed_sector");
  ASSERT_TRUE(WriteSectorDir(dir, layout));
  const auto before = SnapshotSectorDir(dir, layout);

  const std::vector<std::uint8_t> good1 = ReadBytes(dir / "sd1.csdat");
  std::vector<std::uint8_t> cut1(good1.begin(), good1.begin() + 708 + 100);
  ASSERT_TRUE(WriteBytes(dir / "sd1.csdat", cut1));

  ImportConfig icfg;
  icfg.layout = layout;
  TerrainSession session;
  ImportReport ireport;
  std::string err;
  ASSERT_TRUE(ImportTerrain(dir, icfg, session, err, &ireport) == ImportStatus::Ok);
  EXPECT_EQ(ireport.sectorsFailed, 1);

  // The zero patch is below the loaded range and clamps to black.
  NormalizedImage img;
  ASSERT_TRUE(SessionToDisplay(session, DisplayOptions{}, img, err));
  EXPECT_EQ(*std::min_element(img.values.begin(), img.values.end()), 0.0f);
  RasterImage raster;
  ASSERT_TRUE(QuantizeDisplayImage(img, 16, 1, raster, err));
  NormalizedImage reread;
  ASSERT_TRUE(DequantizeDisplayImage(raster, reread, err));

  ExportConfig ecfg;
  ExportReport ereport;
  ASSERT_TRUE(ExportTerrain(session, reread, ecfg, ereport, err));
  EXPECT_EQ(ereport.written, 3);
  EXPECT_EQ(ereport.skipped, 1);
  EXPECT_EQ(ereport.failed, 0);

  auto after = SnapshotSectorDir(dir, layout);
  for (const int i : {0, 2, 3}) {
    EXPECT_TRUE(after[static_cast<std::size_t>(i)] == before[static_cast<std::size_t>(i)]);
  }
  EXPECT_TRUE(ReadBytes(dir / "sd1.csdat") == cut1);

  // A file repaired after import keeps its contents: the session never decoded it.
  ASSERT_TRUE(WriteBytes(dir / "sd1.csdat", good1));
  for (float& v : reread.values) v = 0.25f;
  ASSERT_TRUE(ExportTerrain(session, reread, ecfg, ereport, err));
  EXPECT_EQ(ereport.written, 3);
  EXPECT_EQ(ereport.skipped, 1);
  EXPECT_TRUE(ReadBytes(dir / "sd1.csdat") == good1);

  RemoveTree(dir);
}

void TestLosslessDisplaySpan()
{
  EXPECT_EQ(LosslessDisplaySpan(16), 65535.0 / 128.0);
  EXPECT_EQ(LosslessDisplaySpan(8), 255.0 / 128.0);
  EXPECT_EQ(LosslessDisplaySpan(12), 0.0);

  DisplayOptions plain;
  plain.rotateForDisplay = false;

  // Raw samples 0..levels-1 span exactly the lossless limit; levels+1 samples cannot all survive.
  for (const int depth : {8, 16}) {
    const int levels = (depth == 16) ? 65536 : 256;
    for (const int count : {levels, levels + 1}) {
      if (count > 65536) continue;
      HeightField mosaic(count, 1);
      for (int k = 0; k < count; ++k) mosaic.at(k, 0) = DecodeElevationSample(static_cast<std::uint16_t>(k));

      NormalizedImage img;
      ElevationRange range;
      std::string err;
      ASSERT_TRUE(ToDisplay(mosaic, plain, img, err, &range));
      RasterImage raster;
      ASSERT_TRUE(QuantizeDisplayImage(img, depth, 1, raster, err));
      NormalizedImage reread;
      ASSERT_TRUE(DequantizeDisplayImage(raster, reread, err));
      HeightField back;
      ASSERT_TRUE(FromDisplay(reread, range.minValue, range.maxValue, plain, back, err));

      int mismatches = 0;
      for (int k = 0; k < count; ++k) {
        if (EncodeElevationSample(back.at(k, 0)) != static_cast<std::uint16_t>(k)) ++mismatches;
      }
      if (count == levels) {
        EXPECT_EQ(mismatches, 0);
      } else {
        EXPECT_TRUE(mismatches > 0);
      }
    }
  }
}

void TestExportModes()
{
  const SectorLayout layout{2, 2, 5};
  const fs::path dir = MakeTempPath("csdat_export_modes");
  ASSERT_TRUE(WriteSectorDir(dir, layout));
  const auto before = SnapshotSectorDir(dir, layout);

  ImportConfig icfg;
  icfg.layout = layout;
  TerrainSession session;
  std::string err;
  ASSERT_TRUE(ImportTerrain(dir, icfg, session, err) == ImportStatus::Ok);

  NormalizedImage img;
  ASSERT_TRUE(SessionToDisplay(session, DisplayOptions{}, img, err));

  {
    ExportConfig cfg;
    cfg.skipUnchanged = true;
    ExportReport report;
    ASSERT_TRUE(ExportTerrain(session, img, cfg, report, err));
    EXPECT_EQ(report.unchanged, 4);
    EXPECT_EQ(report.written, 0);
  }

  NormalizedImage edited = img;
  for (float& v : edited.values) v = 1.0f;

  {
    ExportConfig cfg;
    cfg.dryRun = true;
    ExportReport report;
    ASSERT_TRUE(ExportTerrain(session, edited, cfg, report, err));
    EXPECT_EQ(report.written, 4);
    EXPECT_TRUE(SnapshotSectorDir(dir, layout) == before);
  }

  {
    // Explicit range: every sample becomes 20.0.
    ExportConfig cfg;
    cfg.hasRangeOverride = true;
    cfg.rangeOverride = ElevationRange{10.0f, 20.0f, true};
    ExportReport report;
    ASSERT_TRUE(ExportTerrain(session, edited, cfg, report, err));
    EXPECT_EQ(report.written, 4);
    EXPECT_EQ(report.rangeUsed.maxValue, 20.0f);

    HeightField grid;
    ASSERT_TRUE(LoadSectorFile((dir / "sd2.csdat").string(), layout.gridSize, grid, err) == SectorError::None);
    for (const float v : grid.values) EXPECT_EQ(v, 20.0f);
  }

  {
    std::error_code ec;
    fs::remove(dir / "sd3.csdat", ec);
    ExportConfig cfg;
    ExportReport report;
    ASSERT_TRUE(ExportTerrain(session, img, cfg, report, err));
    EXPECT_EQ(report.skipped, 1);
    EXPECT_EQ(report.written, 3);
    EXPECT_FALSE(fs::exists(dir / "sd3.csdat"));
  }

  {
    ExportConfig cfg;
    cfg.hasRangeOverride = true;
    cfg.rangeOverride = ElevationRange{5.0f, 1.0f, true};
    ExportReport report;
    EXPECT_FALSE(ExportTerrain(session, img, cfg, report, err));
  }

  RemoveTree(dir);
}

void TestJson()
{
  JsonValue v;
  std::string err;
  ASSERT_TRUE(ParseJson("{\"a\": [1, 2.5, \"x\\u00e9\\n\"], \"b\": null, \"c\": true, \"d\": {\"e\": -3e2}}", v, err));
  ASSERT_TRUE(v.isObject());

  const JsonValue* a = FindJsonMember(v, "a");
  ASSERT_TRUE(a && a->isArray() && a->arrayValue.size() == 3u);
  EXPECT_EQ(a->arrayValue[1].numberValue, 2.5);
  EXPECT_EQ(a->arrayValue[2].stringValue, std::string("x\xC3\xA9\n"));
  EXPECT_TRUE(FindJsonMember(v, "b")->isNull());
  EXPECT_TRUE(FindJsonMember(v, "c")->boolValue);
  EXPECT_EQ(FindJsonMember(*FindJsonMember(v, "d"), "e")->numberValue, -300.0);
  EXPECT_TRUE(FindJsonMember(v, "zzz") == nullptr);

  // Writer output parses back to the same structure, members in insertion order.
  for (const bool pretty : {true, false}) {
    JsonWriteOptions opt;
    opt.pretty = pretty;
    const std::string text = JsonStringify(v, opt);
    JsonValue again;
    ASSERT_TRUE(ParseJson(text, again, err));
    EXPECT_EQ(JsonStringify(again, opt), text);
    ASSERT_TRUE(again.objectValue.size() == 4u);
    EXPECT_EQ(again.objectValue[0].first, std::string("a"));
    EXPECT_EQ(again.objectValue[3].first, std::string("d"));
  }

  JsonValue obj = JsonValue::MakeObject();
  obj.set("k", JsonValue::MakeNumber(1));
  obj.set("k", JsonValue::MakeNumber(2));
  EXPECT_EQ(obj.objectValue.size(), static_cast<std::size_t>(1));
  EXPECT_EQ(FindJsonMember(obj, "k")->numberValue, 2.0);

  EXPECT_EQ(JsonEscape("a\"b\\c\t"), std::string("a\\\"b\\\\c\\t"));

  EXPECT_FALSE(ParseJson("[1, 2,]", v, err));
  EXPECT_FALSE(ParseJson("{\"a\": 1} x", v, err));
  EXPECT_FALSE(ParseJson("{'a': 1}", v, err));
  EXPECT_FALSE(ParseJson("01", v, err));

  JsonValue nan = JsonValue::MakeNumber(std::numeric_limits<double>::quiet_NaN());
  std::ostringstream oss;
  EXPECT_FALSE(WriteJson(oss, nan, err));
}

void TestMosaicMeta()
{
  const fs::path dir = MakeTempPath("csdat_meta");
  const fs::path path = dir / "edit" / "terrain.meta.json";

  MosaicMeta meta;
  meta.directory = "/data/terrain";
  meta.layout = SectorLayout{12, 4, 33};
  meta.rotateForDisplay = false;
  meta.range = ElevationRange{-0.5f, 511.9921875f, true};
  meta.image = "terrain.png";
  meta.imageWidth = 132;
  meta.imageHeight = 396;
  meta.imageBitDepth = 16;
  meta.sectorsLoaded = 47;

  std::string err;
  ASSERT_TRUE(SaveMosaicMeta(path.string(), meta, err));
  EXPECT_FALSE(fs::exists(path.string() + ".tmp"));

  MosaicMeta back;
  ASSERT_TRUE(LoadMosaicMeta(path.string(), back, err));
  EXPECT_EQ(back.version, kMosaicMetaVersion);
  EXPECT_EQ(back.directory, meta.directory);
  EXPECT_EQ(back.layout.sectorsX, 12);
  EXPECT_EQ(back.layout.sectorsY, 4);
  EXPECT_EQ(back.layout.gridSize, 33);
  EXPECT_FALSE(back.rotateForDisplay);
  EXPECT_TRUE(back.range.valid);
  EXPECT_EQ(back.range.minValue, -0.5f);
  EXPECT_EQ(back.range.maxValue, 511.9921875f);
  EXPECT_EQ(back.image, meta.image);
  EXPECT_EQ(back.imageWidth, 132);
  EXPECT_EQ(back.imageHeight, 396);
  EXPECT_EQ(back.imageBitDepth, 16);
  EXPECT_EQ(back.sectorsLoaded, 47);

  JsonValue root;
  ASSERT_TRUE(ParseJson("{\"version\": 1, \"range\": null}", root, err));
  MosaicMeta partial;
  ASSERT_TRUE(MosaicMetaFromJson(root, partial, err));
  EXPECT_FALSE(partial.range.valid);
  EXPECT_EQ(partial.layout.gridSize, 65);

  ASSERT_TRUE(ParseJson("{\"version\": 2}", root, err));
  EXPECT_FALSE(MosaicMetaFromJson(root, partial, err));
  ASSERT_TRUE(ParseJson("{\"layout\": {\"sectorsX\": 8}}", root, err));
  EXPECT_FALSE(MosaicMetaFromJson(root, partial, err));
  ASSERT_TRUE(ParseJson("{\"version\": 1, \"layout\": {\"gridSize\": 6.5}}", root, err));
  EXPECT_FALSE(MosaicMetaFromJson(root, partial, err));

  EXPECT_FALSE(LoadMosaicMeta((dir / "missing.json").string(), back, err));

  RemoveTree(dir);
}

void TestLogTee()
{
  const fs::path dir = MakeTempPath("csdat_logs");
  std::error_code ec;
  fs::create_directories(dir, ec);
  ASSERT_TRUE(!ec);

  const fs::path log = dir / "tool.log";
  ASSERT_TRUE(WriteBytes(log, {'A'}));
  ASSERT_TRUE(WriteBytes(dir / "tool.log.1", {'B'}));

  std::string err;
  ASSERT_TRUE(LogTee::Rotate(log, 2, err));
  EXPECT_FALSE(fs::exists(log));
  EXPECT_TRUE(ReadBytes(dir / "tool.log.1") == std::vector<std::uint8_t>{'A'});
  EXPECT_TRUE(ReadBytes(dir / "tool.log.2") == std::vector<std::uint8_t>{'B'});

  {
    LogTee tee;
    LogTeeOptions opt;
    opt.path = log;
    opt.keepFiles = 2;
    opt.teeStderr = false;
    ASSERT_TRUE(tee.start(opt, err));
    EXPECT_TRUE(tee.active());
    std::cout << "csdat log tee check\n";
    tee.stop();
    EXPECT_FALSE(tee.active());
  }

  const std::vector<std::uint8_t> bytes = ReadBytes(log);
  const std::string text(bytes.begin(), bytes.end());
  EXPECT_TRUE(text.find("[OUT] csdat log tee check\n") != std::string::npos);

  // 2026-10-17T08:12:03.417Z [OUT] ...
  const std::size_t tag = text.find(" [OUT] ");
  ASSERT_TRUE(tag == 24u);
  for (const std::size_t digit : {0u, 1u, 2u, 3u, 5u, 6u, 8u, 9u, 11u, 12u, 14u, 15u, 17u, 18u, 20u, 21u, 22u}) {
    EXPECT_TRUE(std::isdigit(static_cast<unsigned char>(text[digit])) != 0);
  }
  EXPECT_EQ(text[10], 'T');
  EXPECT_EQ(text[19], '.');
  EXPECT_EQ(text[23], 'Z');
  EXPECT_TRUE(ReadBytes(dir / "tool.log.2") == std::vector<std::uint8_t>{'A'});

  RemoveTree(dir);
}

} // namespace

int main()
{
  TestElevationSampleEncoding();
  TestSectorCodecRoundTrip();
  TestSectorCodecSizeErrors();
  TestAtomicWrite();
  TestSectorFileNames();
  TestListSectorFiles();
  TestGridTransformInverse();
  TestSectorLayoutValidation();
  TestComposeSplitLayouts();
  TestComposeRejectsBadSectors();
  TestMissingSectorIsZeroPatch();
  TestNormalization();
  TestFlatNormalization();
  TestDisplayRotation();
  TestRgbaPixels();
  TestQuantizeDisplayImage();
  TestImageIo();
  TestEndToEndFlatTerrain();
  TestEndToEndVariedTerrain();
  TestImportWithBrokenFiles();
  TestParallelMatchesSerial();
  TestCancellation();
  TestUneditedExportAroundFailedSector();
  TestLosslessDisplaySpan();
  TestExportModes();
  TestJson();
  TestMosaicMeta();
  TestLogTee();

  if (g_failures == 0) {
    std::cout << "csdat_tests: OK\n";
    return 0;
  }

  std::cerr << "csdat_tests: FAILED (" << g_failures << ")\n";
  return 1;
}
