#include "csdat/HeightField.hpp"

#include <algorithm>
#include <cmath>

namespace csdat {

HeightField::HeightField(int w, int h, float fill)
    : width(std::max(0, w))
    , height(std::max(0, h))
{
  values.assign(static_cast<std::size_t>(width) * static_cast<std::size_t>(height), fill);
}

void ExtendElevationRange(ElevationRange& range, const HeightField& field)
{
  for (const float v : field.values) {
    if (!std::isfinite(v)) continue;
    if (!range.valid) {
      range.minValue = v;
      range.maxValue = v;
      range.valid = true;
      continue;
    }
    range.minValue = std::min(range.minValue, v);
    range.maxValue = std::max(range.maxValue, v);
  }
}

ElevationRange ComputeElevationRange(const HeightField& field)
{
  ElevationRange r;
  ExtendElevationRange(r, field);
  return r;
}

ElevationRange ComputeElevationRange(const SectorGrids& sectors)
{
  ElevationRange r;
  for (const auto& kv : sectors) {
    ExtendElevationRange(r, kv.second);
  }
  return r;
}

HeightField FlipRows(const HeightField& field)
{
  HeightField out(field.width, field.height);
  for (int y = 0; y < field.height; ++y) {
    const int srcY = field.height - 1 - y;
    std::copy_n(field.values.begin() + static_cast<std::ptrdiff_t>(field.index(0, srcY)), field.width,
                out.values.begin() + static_cast<std::ptrdiff_t>(out.index(0, y)));
  }
  return out;
}

HeightField ExtractBlock(const HeightField& src, int x0, int y0, int w, int h)
{
  HeightField out(w, h);
  for (int y = 0; y < h; ++y) {
    std::copy_n(src.values.begin() + static_cast<std::ptrdiff_t>(src.index(x0, y0 + y)), w,
                out.values.begin() + static_cast<std::ptrdiff_t>(out.index(0, y)));
  }
  return out;
}

void PasteBlock(HeightField& dst, const HeightField& block, int x0, int y0)
{
  for (int y = 0; y < block.height; ++y) {
    std::copy_n(block.values.begin() + static_cast<std::ptrdiff_t>(block.index(0, y)), block.width,
                dst.values.begin() + static_cast<std::ptrdiff_t>(dst.index(x0, y0 + y)));
  }
}

} // namespace csdat
