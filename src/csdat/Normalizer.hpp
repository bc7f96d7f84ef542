#pragma once

#include "csdat/GridTransform.hpp"
#include "csdat/HeightField.hpp"
#include "csdat/ImageIO.hpp"

#include <string>
#include <vector>

namespace csdat {

// -----------------------------------------------------------------------------------------------
// Display normalization
//
// An external editor works on a normalized image: the mosaic's minimum maps to 0.0 and its
// maximum to 1.0. When the mosaic is flat (max == min) the image is all zero.
//
// The reverse mapping needs the original range:
//   max > min : value = pixel * (max - min) + min
//   max == min: value = min + pixel * max        (an unedited all-zero image restores the flat level)
//
// An optional display rotation (90 degrees counter-clockwise) is layered on top of the mosaic's
// file->display transform purely for on-screen orientation. FromDisplay undoes it exactly.
// -----------------------------------------------------------------------------------------------

// The luminance plane of a display image, samples in [0, 1].
using NormalizedImage = HeightField;

struct DisplayOptions {
  bool rotateForDisplay = true;
};

inline constexpr GridTransformConfig kDisplayRotation{270, false, false};

// Size of the display image produced from a mosaic of mosaicW x mosaicH.
void DisplayImageDims(int mosaicW, int mosaicH, const DisplayOptions& opt, int& outW, int& outH);

// Normalize a mosaic for display over its own min/max. outRange receives the min/max used
// (valid=false for an empty mosaic). Non-finite samples map to 0.
bool ToDisplay(const HeightField& mosaic, const DisplayOptions& opt, NormalizedImage& outImage, std::string& outError,
               ElevationRange* outRange = nullptr);

// Normalize over a given range, which must be the range FromDisplay is later called with for an
// unedited image to map back to the same elevations. Samples outside it clamp to 0 or 1.
// An invalid range gives an all-zero image.
bool ToDisplay(const HeightField& mosaic, const ElevationRange& range, const DisplayOptions& opt,
               NormalizedImage& outImage, std::string& outError);

// Widest elevation span (max - min) whose 1/128 steps all survive quantization to bitDepth and
// back: 65535/128 for 16-bit, 255/128 for 8-bit. Wider spans round trip lossily. 0 for other depths.
double LosslessDisplaySpan(int bitDepth);

// Map a (possibly edited) display image back to elevations in display-space mosaic orientation.
// Pixels are clamped to [0, 1] first.
bool FromDisplay(const NormalizedImage& image, float originalMin, float originalMax, const DisplayOptions& opt,
                 HeightField& outMosaic, std::string& outError);

// R = G = B = level, A = 1, interleaved.
std::vector<float> ToRgbaPixels(const NormalizedImage& image);

// Takes the red channel of an interleaved RGBA buffer.
bool FromRgbaPixels(const std::vector<float>& rgba, int width, int height, NormalizedImage& outImage,
                    std::string& outError);

// Quantize to a raster image. bitDepth: 8 or 16. channels: 1 (gray), 3 (RGB) or 4 (RGBA, opaque).
bool QuantizeDisplayImage(const NormalizedImage& image, int bitDepth, int channels, RasterImage& outRaster,
                          std::string& outError);

// Back to [0, 1] levels from channel 0.
bool DequantizeDisplayImage(const RasterImage& raster, NormalizedImage& outImage, std::string& outError);

} // namespace csdat
