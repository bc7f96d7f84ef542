#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace csdat {

// -----------------------------------------------------------------------------------------------
// Raster image I/O for display images handed to external editors.
//
// No external image libraries are used. Supported files:
//   - PNG: grayscale / RGB / RGBA, 8 or 16 bits per channel. Written with zlib "stored"
//          blocks; the reader accepts the same subset (stored deflate, filter 0, no interlace).
//   - Netpbm: P5 (gray) and P6 (RGB), maxval 255 or 65535. 16-bit samples are big-endian as
//          the format requires. An alpha channel is dropped when writing PNM.
// -----------------------------------------------------------------------------------------------

struct RasterImage {
  int width = 0;
  int height = 0;

  // 1 = gray, 3 = RGB, 4 = RGBA.
  int channels = 1;

  // 8 or 16. Samples are stored widened to u16 either way (0..255 or 0..65535).
  int bitDepth = 8;

  // Interleaved samples, row-major, size = width * height * channels.
  std::vector<std::uint16_t> samples;

  int maxSample() const { return bitDepth == 16 ? 65535 : 255; }
};

// Validate dimensions, channel count, bit depth and buffer size.
bool ValidateRasterImage(const RasterImage& img, std::string& outError);

bool WritePng(const std::string& path, const RasterImage& img, std::string& outError);
bool ReadPng(const std::string& path, RasterImage& outImg, std::string& outError);

bool WritePnm(const std::string& path, const RasterImage& img, std::string& outError);
bool ReadPnm(const std::string& path, RasterImage& outImg, std::string& outError);

// Dispatch on extension (.png, .ppm, .pgm, .pnm), falling back to probing the file magic on read.
bool ReadImageAuto(const std::string& path, RasterImage& outImg, std::string& outError);
bool WriteImageAuto(const std::string& path, const RasterImage& img, std::string& outError);

} // namespace csdat
