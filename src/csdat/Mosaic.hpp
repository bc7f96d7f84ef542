#pragma once

#include "csdat/GridTransform.hpp"
#include "csdat/HeightField.hpp"

#include <string>
#include <vector>

namespace csdat {

// -----------------------------------------------------------------------------------------------
// Sector mosaic assembly
//
// Sectors are indexed row-major in "file space": index = sectorRow * sectorsX + sectorCol.
//
// File space -> display space (ComposeMosaic):
//   1) Placement. Display row dr holds sector row (sectorsY-1-dr). Each sector is flipped
//      vertically and copied into a (sectorsY*g) rows x (sectorsX*g) columns array.
//   2) The whole array is rotated 90 degrees counter-clockwise, then mirrored left-right
//      (kFileToDisplayTransform).
//
// The resulting display mosaic is (sectorsY*g) wide and (sectorsX*g) tall. SplitMosaic undoes
// both stages exactly, so split(compose(s)) == s for every present sector.
// -----------------------------------------------------------------------------------------------

struct SectorLayout {
  int sectorsX = 8;
  int sectorsY = 8;
  int gridSize = 65;
};

inline constexpr int kMaxSectorsPerAxis = 100;
inline constexpr int kMinSectorGridSize = 2;
inline constexpr int kMaxSectorGridSize = 4096;

// Rotate 90 CCW (270 clockwise), then mirror left-right.
inline constexpr GridTransformConfig kFileToDisplayTransform{270, true, false};

bool ValidateSectorLayout(const SectorLayout& layout, std::string& outError);

inline int SectorCount(const SectorLayout& layout) { return layout.sectorsX * layout.sectorsY; }

// Display mosaic dimensions for a layout.
inline int MosaicWidth(const SectorLayout& layout) { return layout.sectorsY * layout.gridSize; }
inline int MosaicHeight(const SectorLayout& layout) { return layout.sectorsX * layout.gridSize; }

struct MosaicRect {
  int x = 0;
  int y = 0;
  int w = 0;
  int h = 0;
};

// Rectangle covered by a sector in the display mosaic. Returns false for out-of-layout indices.
bool SectorDisplayRect(int sectorIndex, const SectorLayout& layout, MosaicRect& outRect);

struct MosaicComposeStats {
  int placed = 0;     // sectors copied into the mosaic
  int missing = 0;    // layout slots without a sector (left as zero)
  int outOfLayout = 0; // input sectors whose index is outside [0, sectorsX*sectorsY)
};

// Assemble sector grids into the display mosaic. Missing sectors become a flat zero patch.
// Fails if a present sector is not gridSize x gridSize.
bool ComposeMosaic(const SectorGrids& sectors, const SectorLayout& layout, HeightField& outMosaic,
                   std::string& outError, MosaicComposeStats* outStats = nullptr);

// Split a display mosaic back into sector grids (file space).
//
// onlyIndices: if non-null, only these sector indices are produced (indices outside the layout are
// ignored). Otherwise every index of the layout is produced.
bool SplitMosaic(const HeightField& mosaic, const SectorLayout& layout, SectorGrids& outSectors,
                 std::string& outError, const std::vector<int>* onlyIndices = nullptr);

} // namespace csdat
