#pragma once

#include "csdat/HeightField.hpp"
#include "csdat/Json.hpp"
#include "csdat/Mosaic.hpp"

#include <string>

namespace csdat {

// Version for the mosaic sidecar JSON schema.
//
// csdat_import writes the sidecar next to the display image so that csdat_export can be run with
// only --meta: it records where the sectors live, how they were laid out, which display options
// were used and the elevation range the image was normalized with.
constexpr int kMosaicMetaVersion = 1;

struct MosaicMeta {
  int version = kMosaicMetaVersion;

  std::string directory;
  SectorLayout layout;
  bool rotateForDisplay = true;

  // Range at import time. Export recomputes it from the loaded sectors unless told otherwise.
  ElevationRange range;

  // Display image written by the importer.
  std::string image;
  int imageWidth = 0;
  int imageHeight = 0;
  int imageBitDepth = 8;

  int sectorsLoaded = 0;
};

JsonValue MosaicMetaToJson(const MosaicMeta& meta);

// Missing optional fields keep the defaults in outMeta. Unknown fields are ignored.
bool MosaicMetaFromJson(const JsonValue& root, MosaicMeta& outMeta, std::string& outError);

// Writes "<path>.tmp" and renames it into place.
bool SaveMosaicMeta(const std::string& path, const MosaicMeta& meta, std::string& outError);

bool LoadMosaicMeta(const std::string& path, MosaicMeta& outMeta, std::string& outError);

} // namespace csdat
