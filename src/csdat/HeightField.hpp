#pragma once

#include <cstddef>
#include <map>
#include <vector>

namespace csdat {

// -----------------------------------------------------------------------------------------------
// HeightField
//
// Row-major 2-D grid of float samples used for every elevation raster in the project:
//  - one decoded sector (square, gridSize x gridSize)
//  - the assembled mosaic
//  - the luminance plane of a normalized display image
//
// Coordinate system:
//  - origin at top-left (row 0, column 0)
//  - x is the column, increasing to the right
//  - y is the row, increasing downward
// -----------------------------------------------------------------------------------------------
struct HeightField {
  int width = 0;
  int height = 0;
  std::vector<float> values;

  HeightField() = default;
  HeightField(int w, int h, float fill = 0.0f);

  bool empty() const { return width <= 0 || height <= 0; }
  bool inBounds(int x, int y) const { return x >= 0 && y >= 0 && x < width && y < height; }

  std::size_t index(int x, int y) const
  {
    return static_cast<std::size_t>(y) * static_cast<std::size_t>(width) + static_cast<std::size_t>(x);
  }

  float& at(int x, int y) { return values[index(x, y)]; }
  const float& at(int x, int y) const { return values[index(x, y)]; }

  bool operator==(const HeightField& o) const
  {
    return width == o.width && height == o.height && values == o.values;
  }
  bool operator!=(const HeightField& o) const { return !(*this == o); }
};

// Sector grids keyed by sector index. std::map keeps iteration in index order.
using SectorGrids = std::map<int, HeightField>;

struct ElevationRange {
  float minValue = 0.0f;
  float maxValue = 0.0f;

  // False until at least one finite sample has been observed.
  bool valid = false;
};

// Min/max over all finite samples. Non-finite samples are ignored.
ElevationRange ComputeElevationRange(const HeightField& field);
ElevationRange ComputeElevationRange(const SectorGrids& sectors);

// Merge the samples of field into an existing range.
void ExtendElevationRange(ElevationRange& range, const HeightField& field);

// Reverse the row order (row y -> height-1-y).
HeightField FlipRows(const HeightField& field);

// Copy a w x h block with its top-left corner at (x0, y0). The block must lie inside src.
HeightField ExtractBlock(const HeightField& src, int x0, int y0, int w, int h);

// Paste block into dst with its top-left corner at (x0, y0). The block must fit.
void PasteBlock(HeightField& dst, const HeightField& block, int x0, int y0);

} // namespace csdat
