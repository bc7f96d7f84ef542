#include "csdat/GridTransform.hpp"

#include <sstream>
#include <utility>

namespace csdat {

namespace {

// Output cell (x, y) reads source cell
//   sx = x0 + xx * x + xy * y
//   sy = y0 + yx * x + yy * y
// Every supported transform is such an integer affine map, so it is built once per grid.
struct SourceMap {
  int x0 = 0;
  int xx = 1;
  int xy = 0;
  int y0 = 0;
  int yx = 0;
  int yy = 1;

  int srcX(int x, int y) const { return x0 + xx * x + xy * y; }
  int srcY(int x, int y) const { return y0 + yx * x + yy * y; }
};

void OutputDims(const GridTransformConfig& cfg, int srcW, int srcH, int& outW, int& outH)
{
  const bool quarterTurn = (cfg.rotateDeg == 90 || cfg.rotateDeg == 270);
  outW = quarterTurn ? srcH : srcW;
  outH = quarterTurn ? srcW : srcH;
}

SourceMap BuildSourceMap(const GridTransformConfig& cfg, int srcW, int srcH)
{
  SourceMap m;
  switch (cfg.rotateDeg) {
  case 90: m = SourceMap{0, 0, 1, srcH - 1, -1, 0}; break;
  case 180: m = SourceMap{srcW - 1, -1, 0, srcH - 1, 0, -1}; break;
  case 270: m = SourceMap{srcW - 1, 0, -1, 0, 1, 0}; break;
  default: break;
  }

  int outW = 0;
  int outH = 0;
  OutputDims(cfg, srcW, srcH, outW, outH);

  // Mirrors act on the rotated grid: substitute x -> outW-1-x and/or y -> outH-1-y.
  if (cfg.mirrorX) {
    m.x0 += m.xx * (outW - 1);
    m.y0 += m.yx * (outW - 1);
    m.xx = -m.xx;
    m.yx = -m.yx;
  }
  if (cfg.mirrorY) {
    m.x0 += m.xy * (outH - 1);
    m.y0 += m.yy * (outH - 1);
    m.xy = -m.xy;
    m.yy = -m.yy;
  }
  return m;
}

} // namespace

bool ValidateGridTransform(const GridTransformConfig& cfg, int srcW, int srcH, std::string& outError)
{
  outError.clear();

  if (srcW <= 0 || srcH <= 0) {
    std::ostringstream oss;
    oss << "cannot transform a " << srcW << "x" << srcH << " grid";
    outError = oss.str();
    return false;
  }

  switch (cfg.rotateDeg) {
  case 0:
  case 90:
  case 180:
  case 270: return true;
  default: break;
  }

  outError = "rotation must be 0, 90, 180 or 270 degrees (got " + std::to_string(cfg.rotateDeg) + ")";
  return false;
}

bool ComputeGridTransformDims(const GridTransformConfig& cfg, int srcW, int srcH, int& outW, int& outH,
                              std::string& outError)
{
  outW = 0;
  outH = 0;
  if (!ValidateGridTransform(cfg, srcW, srcH, outError)) return false;
  OutputDims(cfg, srcW, srcH, outW, outH);
  return true;
}

bool MapTransformedToSource(const GridTransformConfig& cfg, int srcW, int srcH, int xOut, int yOut, int& outSrcX,
                            int& outSrcY, std::string& outError)
{
  int outW = 0;
  int outH = 0;
  if (!ComputeGridTransformDims(cfg, srcW, srcH, outW, outH, outError)) return false;

  if (xOut < 0 || yOut < 0 || xOut >= outW || yOut >= outH) {
    std::ostringstream oss;
    oss << "cell (" << xOut << ", " << yOut << ") is outside the " << outW << "x" << outH << " output";
    outError = oss.str();
    return false;
  }

  const SourceMap m = BuildSourceMap(cfg, srcW, srcH);
  outSrcX = m.srcX(xOut, yOut);
  outSrcY = m.srcY(xOut, yOut);
  return true;
}

GridTransformConfig InverseGridTransform(const GridTransformConfig& cfg)
{
  GridTransformConfig inv = cfg;
  if (cfg.mirrorX == cfg.mirrorY) {
    inv.rotateDeg = (360 - cfg.rotateDeg) % 360;
  }
  return inv;
}

bool TransformGrid(const HeightField& src, HeightField& out, const GridTransformConfig& cfg, std::string& outError)
{
  int outW = 0;
  int outH = 0;
  if (!ComputeGridTransformDims(cfg, src.width, src.height, outW, outH, outError)) return false;

  const SourceMap m = BuildSourceMap(cfg, src.width, src.height);

  HeightField dst(outW, outH);
  for (int y = 0; y < outH; ++y) {
    for (int x = 0; x < outW; ++x) {
      dst.at(x, y) = src.at(m.srcX(x, y), m.srcY(x, y));
    }
  }

  out = std::move(dst);
  return true;
}

} // namespace csdat
