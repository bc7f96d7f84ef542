#pragma once

#include "csdat/HeightField.hpp"

#include <string>

namespace csdat {

// -----------------------------------------------------------------------------------------------
// GridTransform
//
// Rotate/mirror transforms for a whole HeightField.
//
// Semantics:
//   - Rotation is clockwise in grid space. 270 is therefore a 90 degree counter-clockwise turn.
//   - mirrorX/mirrorY are applied AFTER rotation, in the rotated coordinate system.
//     mirrorX flips horizontally (x -> w-1-x).
//     mirrorY flips vertically (y -> h-1-y).
//
// Every config is a member of the dihedral group of the square, so every transform has an exact
// inverse that is again expressible as a GridTransformConfig (see InverseGridTransform).
// -----------------------------------------------------------------------------------------------

struct GridTransformConfig {
  // Clockwise rotation (degrees). Supported: 0, 90, 180, 270.
  int rotateDeg = 0;

  // Optional mirroring after rotation.
  bool mirrorX = false;
  bool mirrorY = false;
};

// Returns true if cfg is valid for a source of srcW x srcH; otherwise sets outError.
bool ValidateGridTransform(const GridTransformConfig& cfg, int srcW, int srcH, std::string& outError);

// Compute output dimensions after applying the transform.
bool ComputeGridTransformDims(const GridTransformConfig& cfg, int srcW, int srcH, int& outW, int& outH,
                              std::string& outError);

// Map an output coordinate back to the source cell it was copied from.
bool MapTransformedToSource(const GridTransformConfig& cfg, int srcW, int srcH, int xOut, int yOut, int& outSrcX,
                            int& outSrcY, std::string& outError);

// The transform that undoes cfg: TransformGrid(TransformGrid(g, cfg), InverseGridTransform(cfg)) == g.
//
// A single mirror combined with any rotation is a reflection and therefore its own inverse.
// Zero or two mirrors leave a pure rotation, inverted by rotating the other way.
GridTransformConfig InverseGridTransform(const GridTransformConfig& cfg);

// Apply the transform to src and write the result to out.
bool TransformGrid(const HeightField& src, HeightField& out, const GridTransformConfig& cfg, std::string& outError);

} // namespace csdat
