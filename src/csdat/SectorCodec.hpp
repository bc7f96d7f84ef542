#pragma once

#include "csdat/HeightField.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace csdat {

// -----------------------------------------------------------------------------------------------
// Sector file codec (sd<N>.csdat)
//
// Binary layout of one sector file:
//
//   offset                      size     meaning
//   0 .. 707                    708      opaque header
//   708 + 4*i                   2        elevation sample i (little-endian u16, unit 1/128)
//   708 + 4*i + 2               2        opaque per-cell payload (flags / unknown)
//   708 + 4*gridSize^2 .. EOF            opaque trailer
//
// Sample i is the cell at row y = i / gridSize, column x = i % gridSize (file order).
//
// Everything except the 2 elevation bytes of each cell is preserved byte-for-byte by
// EncodeSector, so decode -> encode without edits reproduces the input exactly.
// -----------------------------------------------------------------------------------------------

inline constexpr std::size_t kSectorElevationOffset = 708;

// One cell = 2 bytes of elevation followed by 2 bytes of opaque payload.
inline constexpr std::size_t kSectorSampleBytes = 2;
inline constexpr std::size_t kSectorCellStride = 4;

// Fixed-point scale: decoded elevation = raw / 128.
inline constexpr double kSectorHeightScale = 128.0;

inline constexpr int kDefaultSectorGridSize = 65;

enum class SectorError : std::uint8_t {
  None = 0,
  Truncated = 1,    // fewer than 2 bytes left for an expected sample while decoding
  TooSmall = 2,     // original bytes too short to hold the elevation region while encoding
  GridMismatch = 3, // grid is not gridSize x gridSize, or gridSize is invalid
  Io = 4,           // file could not be read or written
};

// Stable lowercase name for reports ("none", "truncated", ...).
const char* SectorErrorName(SectorError e);

// Byte offset of the elevation sample of cell (x, y).
std::size_t SectorSampleOffset(int gridSize, int x, int y);

// Smallest buffer that holds every elevation sample (the final cell's payload may be missing).
std::size_t SectorMinimumFileSize(int gridSize);

// Header + full elevation region (no trailer).
std::size_t SectorNominalFileSize(int gridSize);

float DecodeElevationSample(std::uint16_t raw);

// round(value * 128) clamped to [0, 65535]. NaN encodes as 0.
std::uint16_t EncodeElevationSample(double value);

// Decode the elevation region of a sector file.
SectorError DecodeSector(const std::vector<std::uint8_t>& bytes, int gridSize, HeightField& outGrid,
                         std::string& outError);

// Encode grid into a copy of originalBytes, overwriting only the elevation samples.
SectorError EncodeSector(const std::vector<std::uint8_t>& originalBytes, const HeightField& grid, int gridSize,
                         std::vector<std::uint8_t>& outBytes, std::string& outError);

// Whole-file helpers.
bool ReadFileBytes(const std::string& path, std::vector<std::uint8_t>& outBytes, std::string& outError);

// Write to "<path>.tmp" and rename it over path. On failure the original file is left as it was.
bool WriteFileBytesAtomic(const std::string& path, const std::vector<std::uint8_t>& bytes, std::string& outError);

// ReadFileBytes + DecodeSector. An unreadable file yields SectorError::Io.
SectorError LoadSectorFile(const std::string& path, int gridSize, HeightField& outGrid, std::string& outError);

} // namespace csdat
