#include "csdat/Normalizer.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <utility>

namespace csdat {

namespace {

inline float Clamp01(float v)
{
  if (!std::isfinite(v)) return 0.0f;
  return std::clamp(v, 0.0f, 1.0f);
}

} // namespace

void DisplayImageDims(int mosaicW, int mosaicH, const DisplayOptions& opt, int& outW, int& outH)
{
  // A quarter turn swaps the axes.
  if (opt.rotateForDisplay) {
    outW = mosaicH;
    outH = mosaicW;
  } else {
    outW = mosaicW;
    outH = mosaicH;
  }
}

bool ToDisplay(const HeightField& mosaic, const DisplayOptions& opt, NormalizedImage& outImage, std::string& outError,
               ElevationRange* outRange)
{
  const ElevationRange range = ComputeElevationRange(mosaic);
  if (!ToDisplay(mosaic, range, opt, outImage, outError)) return false;
  if (outRange) *outRange = range;
  return true;
}

bool ToDisplay(const HeightField& mosaic, const ElevationRange& range, const DisplayOptions& opt,
               NormalizedImage& outImage, std::string& outError)
{
  outError.clear();

  if (mosaic.values.size() != static_cast<std::size_t>(mosaic.width) * static_cast<std::size_t>(mosaic.height)) {
    outError = "mosaic buffer size does not match its dimensions";
    return false;
  }

  const double lo = range.minValue;
  const double span = static_cast<double>(range.maxValue) - lo;

  NormalizedImage img(mosaic.width, mosaic.height, 0.0f);
  if (range.valid && span > 0.0) {
    for (std::size_t i = 0; i < mosaic.values.size(); ++i) {
      const float v = mosaic.values[i];
      if (!std::isfinite(v)) continue;
      img.values[i] = Clamp01(static_cast<float>((static_cast<double>(v) - lo) / span));
    }
  }

  if (opt.rotateForDisplay && !img.empty()) {
    NormalizedImage rotated;
    if (!TransformGrid(img, rotated, kDisplayRotation, outError)) return false;
    img = std::move(rotated);
  }

  outImage = std::move(img);
  return true;
}

double LosslessDisplaySpan(int bitDepth)
{
  // Samples are multiples of 1/128. The round trip is exact while each quantization step spans at
  // most one of them.
  if (bitDepth == 8) return 255.0 / 128.0;
  if (bitDepth == 16) return 65535.0 / 128.0;
  return 0.0;
}

bool FromDisplay(const NormalizedImage& image, float originalMin, float originalMax, const DisplayOptions& opt,
                 HeightField& outMosaic, std::string& outError)
{
  outError.clear();

  if (image.empty() ||
      image.values.size() != static_cast<std::size_t>(image.width) * static_cast<std::size_t>(image.height)) {
    outError = "invalid display image";
    return false;
  }
  if (!std::isfinite(originalMin) || !std::isfinite(originalMax)) {
    outError = "elevation range must be finite";
    return false;
  }
  if (originalMax < originalMin) {
    std::ostringstream oss;
    oss << "elevation range is inverted (min " << originalMin << " > max " << originalMax << ")";
    outError = oss.str();
    return false;
  }

  const double lo = originalMin;
  const double hi = originalMax;
  const bool flat = !(hi > lo);

  HeightField mosaic(image.width, image.height, 0.0f);
  for (std::size_t i = 0; i < image.values.size(); ++i) {
    const double p = Clamp01(image.values[i]);
    const double v = flat ? (lo + p * hi) : (p * (hi - lo) + lo);
    mosaic.values[i] = static_cast<float>(v);
  }

  if (opt.rotateForDisplay) {
    HeightField unrotated;
    if (!TransformGrid(mosaic, unrotated, InverseGridTransform(kDisplayRotation), outError)) return false;
    mosaic = std::move(unrotated);
  }

  outMosaic = std::move(mosaic);
  return true;
}

std::vector<float> ToRgbaPixels(const NormalizedImage& image)
{
  std::vector<float> rgba;
  rgba.reserve(image.values.size() * 4u);
  for (const float v : image.values) {
    rgba.push_back(v);
    rgba.push_back(v);
    rgba.push_back(v);
    rgba.push_back(1.0f);
  }
  return rgba;
}

bool FromRgbaPixels(const std::vector<float>& rgba, int width, int height, NormalizedImage& outImage,
                    std::string& outError)
{
  outError.clear();
  if (width <= 0 || height <= 0) {
    outError = "invalid image dimensions";
    return false;
  }

  const std::size_t pixels = static_cast<std::size_t>(width) * static_cast<std::size_t>(height);
  if (rgba.size() != pixels * 4u) {
    std::ostringstream oss;
    oss << "RGBA buffer has " << rgba.size() << " floats, expected " << pixels * 4u;
    outError = oss.str();
    return false;
  }

  NormalizedImage img(width, height, 0.0f);
  for (std::size_t i = 0; i < pixels; ++i) {
    img.values[i] = rgba[i * 4u];
  }
  outImage = std::move(img);
  return true;
}

bool QuantizeDisplayImage(const NormalizedImage& image, int bitDepth, int channels, RasterImage& outRaster,
                          std::string& outError)
{
  outError.clear();

  RasterImage r;
  r.width = image.width;
  r.height = image.height;
  r.channels = channels;
  r.bitDepth = bitDepth;
  if (image.empty()) {
    outError = "invalid image dimensions";
    return false;
  }
  if (channels != 1 && channels != 3 && channels != 4) {
    outError = "channels must be 1, 3 or 4";
    return false;
  }
  if (bitDepth != 8 && bitDepth != 16) {
    outError = "bit depth must be 8 or 16";
    return false;
  }

  const int maxS = r.maxSample();
  const int colorChannels = (channels == 4) ? 3 : channels;

  r.samples.resize(image.values.size() * static_cast<std::size_t>(channels));
  std::uint16_t* dst = r.samples.data();
  for (const float v : image.values) {
    const long q = std::lround(static_cast<double>(Clamp01(v)) * maxS);
    const std::uint16_t s = static_cast<std::uint16_t>(std::clamp<long>(q, 0, maxS));
    for (int c = 0; c < colorChannels; ++c) *dst++ = s;
    if (channels == 4) *dst++ = static_cast<std::uint16_t>(maxS);
  }

  outRaster = std::move(r);
  return true;
}

bool DequantizeDisplayImage(const RasterImage& raster, NormalizedImage& outImage, std::string& outError)
{
  if (!ValidateRasterImage(raster, outError)) return false;

  const double maxS = static_cast<double>(raster.maxSample());
  NormalizedImage img(raster.width, raster.height, 0.0f);
  for (std::size_t i = 0; i < img.values.size(); ++i) {
    const std::uint16_t s = raster.samples[i * static_cast<std::size_t>(raster.channels)];
    img.values[i] = static_cast<float>(std::min(1.0, static_cast<double>(s) / maxS));
  }
  outImage = std::move(img);
  return true;
}

} // namespace csdat
