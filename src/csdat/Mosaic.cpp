#include "csdat/Mosaic.hpp"

#include <sstream>
#include <utility>

namespace csdat {

namespace {

// Top-left corner of a sector's block in the placement array (before the display transform).
void PlacementOrigin(int sectorIndex, const SectorLayout& layout, int& outX, int& outY)
{
  const int sectorRow = sectorIndex / layout.sectorsX;
  const int sectorCol = sectorIndex % layout.sectorsX;
  const int displayRow = layout.sectorsY - 1 - sectorRow;
  outX = sectorCol * layout.gridSize;
  outY = displayRow * layout.gridSize;
}

} // namespace

bool ValidateSectorLayout(const SectorLayout& layout, std::string& outError)
{
  outError.clear();

  if (layout.sectorsX < 1 || layout.sectorsX > kMaxSectorsPerAxis || layout.sectorsY < 1 ||
      layout.sectorsY > kMaxSectorsPerAxis) {
    std::ostringstream oss;
    oss << "sector counts must be in [1, " << kMaxSectorsPerAxis << "] (got " << layout.sectorsX << "x"
        << layout.sectorsY << ")";
    outError = oss.str();
    return false;
  }

  if (layout.gridSize < kMinSectorGridSize || layout.gridSize > kMaxSectorGridSize) {
    std::ostringstream oss;
    oss << "grid size must be in [" << kMinSectorGridSize << ", " << kMaxSectorGridSize << "] (got "
        << layout.gridSize << ")";
    outError = oss.str();
    return false;
  }

  return true;
}

bool SectorDisplayRect(int sectorIndex, const SectorLayout& layout, MosaicRect& outRect)
{
  if (sectorIndex < 0 || sectorIndex >= SectorCount(layout)) return false;

  // Placement cell (row r, col c) lands at display (x = H-1-r, y = W-1-c) under
  // kFileToDisplayTransform, H/W being the placement height/width.
  const int g = layout.gridSize;
  const int sectorRow = sectorIndex / layout.sectorsX;
  const int sectorCol = sectorIndex % layout.sectorsX;

  outRect.x = sectorRow * g;
  outRect.y = (layout.sectorsX - 1 - sectorCol) * g;
  outRect.w = g;
  outRect.h = g;
  return true;
}

bool ComposeMosaic(const SectorGrids& sectors, const SectorLayout& layout, HeightField& outMosaic,
                   std::string& outError, MosaicComposeStats* outStats)
{
  if (!ValidateSectorLayout(layout, outError)) {
    return false;
  }

  const int g = layout.gridSize;
  const int total = SectorCount(layout);

  MosaicComposeStats st;
  HeightField placement(layout.sectorsX * g, layout.sectorsY * g, 0.0f);

  for (const auto& kv : sectors) {
    if (kv.first < 0 || kv.first >= total) {
      st.outOfLayout++;
      continue;
    }
    if (kv.second.width != g || kv.second.height != g) {
      std::ostringstream oss;
      oss << "sector " << kv.first << " is " << kv.second.width << "x" << kv.second.height << ", expected " << g
          << "x" << g;
      outError = oss.str();
      return false;
    }
  }

  for (int displayRow = 0; displayRow < layout.sectorsY; ++displayRow) {
    for (int col = 0; col < layout.sectorsX; ++col) {
      const int sectorRow = layout.sectorsY - 1 - displayRow;
      const int sectorIndex = sectorRow * layout.sectorsX + col;

      const auto it = sectors.find(sectorIndex);
      if (it == sectors.end()) {
        st.missing++;
        continue;
      }

      int x0 = 0;
      int y0 = 0;
      PlacementOrigin(sectorIndex, layout, x0, y0);
      PasteBlock(placement, FlipRows(it->second), x0, y0);
      st.placed++;
    }
  }

  HeightField display;
  if (!TransformGrid(placement, display, kFileToDisplayTransform, outError)) {
    return false;
  }

  outMosaic = std::move(display);
  if (outStats) *outStats = st;
  return true;
}

bool SplitMosaic(const HeightField& mosaic, const SectorLayout& layout, SectorGrids& outSectors,
                 std::string& outError, const std::vector<int>* onlyIndices)
{
  if (!ValidateSectorLayout(layout, outError)) {
    return false;
  }

  if (mosaic.width != MosaicWidth(layout) || mosaic.height != MosaicHeight(layout)) {
    std::ostringstream oss;
    oss << "mosaic is " << mosaic.width << "x" << mosaic.height << ", layout expects " << MosaicWidth(layout) << "x"
        << MosaicHeight(layout);
    outError = oss.str();
    return false;
  }

  HeightField placement;
  if (!TransformGrid(mosaic, placement, InverseGridTransform(kFileToDisplayTransform), outError)) {
    return false;
  }

  const int g = layout.gridSize;
  const int total = SectorCount(layout);

  auto extract = [&](int sectorIndex) {
    int x0 = 0;
    int y0 = 0;
    PlacementOrigin(sectorIndex, layout, x0, y0);
    return FlipRows(ExtractBlock(placement, x0, y0, g, g));
  };

  SectorGrids out;
  if (onlyIndices) {
    for (const int idx : *onlyIndices) {
      if (idx < 0 || idx >= total) continue;
      out[idx] = extract(idx);
    }
  } else {
    for (int idx = 0; idx < total; ++idx) {
      out[idx] = extract(idx);
    }
  }

  outSectors = std::move(out);
  return true;
}

} // namespace csdat
