#include "csdat/SectorCodec.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace csdat {

namespace {

inline std::uint16_t ReadU16LE(const std::uint8_t* p)
{
  return static_cast<std::uint16_t>(static_cast<std::uint16_t>(p[0]) | (static_cast<std::uint16_t>(p[1]) << 8));
}

inline void WriteU16LE(std::uint8_t* p, std::uint16_t v)
{
  p[0] = static_cast<std::uint8_t>(v & 0xFFu);
  p[1] = static_cast<std::uint8_t>((v >> 8) & 0xFFu);
}

} // namespace

const char* SectorErrorName(SectorError e)
{
  switch (e) {
  case SectorError::None: return "none";
  case SectorError::Truncated: return "truncated";
  case SectorError::TooSmall: return "too_small";
  case SectorError::GridMismatch: return "grid_mismatch";
  case SectorError::Io: return "io";
  default: return "unknown";
  }
}

std::size_t SectorSampleOffset(int gridSize, int x, int y)
{
  const std::size_t cell = static_cast<std::size_t>(y) * static_cast<std::size_t>(gridSize) + static_cast<std::size_t>(x);
  return kSectorElevationOffset + cell * kSectorCellStride;
}

std::size_t SectorMinimumFileSize(int gridSize)
{
  if (gridSize <= 0) return kSectorElevationOffset;
  return SectorSampleOffset(gridSize, gridSize - 1, gridSize - 1) + kSectorSampleBytes;
}

std::size_t SectorNominalFileSize(int gridSize)
{
  if (gridSize <= 0) return kSectorElevationOffset;
  const std::size_t cells = static_cast<std::size_t>(gridSize) * static_cast<std::size_t>(gridSize);
  return kSectorElevationOffset + cells * kSectorCellStride;
}

float DecodeElevationSample(std::uint16_t raw)
{
  return static_cast<float>(static_cast<double>(raw) / kSectorHeightScale);
}

std::uint16_t EncodeElevationSample(double value)
{
  if (std::isnan(value)) return 0;
  const double scaled = std::round(value * kSectorHeightScale);
  if (scaled <= 0.0) return 0;
  if (scaled >= 65535.0) return 65535;
  return static_cast<std::uint16_t>(scaled);
}

SectorError DecodeSector(const std::vector<std::uint8_t>& bytes, int gridSize, HeightField& outGrid,
                         std::string& outError)
{
  outError.clear();

  if (gridSize <= 0) {
    outError = "invalid grid size";
    return SectorError::GridMismatch;
  }

  HeightField grid(gridSize, gridSize);

  for (int y = 0; y < gridSize; ++y) {
    for (int x = 0; x < gridSize; ++x) {
      const std::size_t pos = SectorSampleOffset(gridSize, x, y);
      if (pos + kSectorSampleBytes > bytes.size()) {
        const std::size_t available =
            static_cast<std::size_t>(y) * static_cast<std::size_t>(gridSize) + static_cast<std::size_t>(x);
        std::ostringstream oss;
        oss << "sector truncated: " << available << " of " << grid.values.size() << " samples present (file "
            << bytes.size() << " bytes, need " << SectorMinimumFileSize(gridSize) << ")";
        outError = oss.str();
        return SectorError::Truncated;
      }
      grid.at(x, y) = DecodeElevationSample(ReadU16LE(bytes.data() + pos));
    }
  }

  outGrid = std::move(grid);
  return SectorError::None;
}

SectorError EncodeSector(const std::vector<std::uint8_t>& originalBytes, const HeightField& grid, int gridSize,
                         std::vector<std::uint8_t>& outBytes, std::string& outError)
{
  outError.clear();

  if (gridSize <= 0 || grid.width != gridSize || grid.height != gridSize ||
      grid.values.size() != static_cast<std::size_t>(gridSize) * static_cast<std::size_t>(gridSize)) {
    std::ostringstream oss;
    oss << "grid is " << grid.width << "x" << grid.height << ", expected " << gridSize << "x" << gridSize;
    outError = oss.str();
    return SectorError::GridMismatch;
  }

  const std::size_t need = SectorMinimumFileSize(gridSize);
  if (originalBytes.size() < need) {
    std::ostringstream oss;
    oss << "sector file too small: " << originalBytes.size() << " bytes, need at least " << need;
    outError = oss.str();
    return SectorError::TooSmall;
  }

  std::vector<std::uint8_t> out = originalBytes;
  for (int y = 0; y < gridSize; ++y) {
    for (int x = 0; x < gridSize; ++x) {
      const std::size_t pos = SectorSampleOffset(gridSize, x, y);
      WriteU16LE(out.data() + pos, EncodeElevationSample(static_cast<double>(grid.at(x, y))));
    }
  }

  outBytes = std::move(out);
  return SectorError::None;
}

bool ReadFileBytes(const std::string& path, std::vector<std::uint8_t>& outBytes, std::string& outError)
{
  outError.clear();
  outBytes.clear();

  std::ifstream f(path, std::ios::binary);
  if (!f) {
    outError = "failed to open file for reading: " + path;
    return false;
  }

  f.seekg(0, std::ios::end);
  const std::streamoff size = f.tellg();
  if (size < 0) {
    outError = "failed to determine file size: " + path;
    return false;
  }
  f.seekg(0, std::ios::beg);

  std::vector<std::uint8_t> bytes(static_cast<std::size_t>(size));
  if (!bytes.empty()) {
    f.read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!f) {
      outError = "failed while reading file: " + path;
      return false;
    }
  }

  outBytes = std::move(bytes);
  return true;
}

bool WriteFileBytesAtomic(const std::string& path, const std::vector<std::uint8_t>& bytes, std::string& outError)
{
  outError.clear();
  namespace fs = std::filesystem;

  const fs::path outPath(path);
  fs::path tmpPath = outPath;
  tmpPath += ".tmp";

  std::error_code ec;
  fs::remove(tmpPath, ec);

  {
    std::ofstream f(tmpPath, std::ios::binary | std::ios::trunc);
    if (!f) {
      outError = "failed to open file for writing: " + tmpPath.string();
      return false;
    }
    if (!bytes.empty()) {
      f.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    }
    f.flush();
    if (!f) {
      outError = "failed while writing file: " + tmpPath.string();
      f.close();
      fs::remove(tmpPath, ec);
      return false;
    }
  }

  fs::rename(tmpPath, outPath, ec);
  if (ec) {
    outError = "failed to replace '" + outPath.string() + "': " + ec.message();
    std::error_code ec2;
    fs::remove(tmpPath, ec2);
    return false;
  }

  return true;
}

SectorError LoadSectorFile(const std::string& path, int gridSize, HeightField& outGrid, std::string& outError)
{
  std::vector<std::uint8_t> bytes;
  if (!ReadFileBytes(path, bytes, outError)) {
    return SectorError::Io;
  }
  return DecodeSector(bytes, gridSize, outGrid, outError);
}

} // namespace csdat
