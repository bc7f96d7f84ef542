#include "csdat/MosaicMeta.hpp"

#include <filesystem>
#include <system_error>
#include <utility>

namespace csdat {

JsonValue MosaicMetaToJson(const MosaicMeta& meta)
{
  JsonValue root = JsonValue::MakeObject();
  root.set("version", JsonValue::MakeNumber(meta.version));
  root.set("directory", JsonValue::MakeString(meta.directory));

  JsonValue layout = JsonValue::MakeObject();
  layout.set("sectorsX", JsonValue::MakeNumber(meta.layout.sectorsX));
  layout.set("sectorsY", JsonValue::MakeNumber(meta.layout.sectorsY));
  layout.set("gridSize", JsonValue::MakeNumber(meta.layout.gridSize));
  root.set("layout", std::move(layout));

  root.set("rotateForDisplay", JsonValue::MakeBool(meta.rotateForDisplay));

  if (meta.range.valid) {
    JsonValue range = JsonValue::MakeObject();
    range.set("min", JsonValue::MakeNumber(meta.range.minValue));
    range.set("max", JsonValue::MakeNumber(meta.range.maxValue));
    root.set("range", std::move(range));
  } else {
    root.set("range", JsonValue::MakeNull());
  }

  JsonValue image = JsonValue::MakeObject();
  image.set("path", JsonValue::MakeString(meta.image));
  image.set("width", JsonValue::MakeNumber(meta.imageWidth));
  image.set("height", JsonValue::MakeNumber(meta.imageHeight));
  image.set("bitDepth", JsonValue::MakeNumber(meta.imageBitDepth));
  root.set("image", std::move(image));

  root.set("sectorsLoaded", JsonValue::MakeNumber(meta.sectorsLoaded));
  return root;
}

bool MosaicMetaFromJson(const JsonValue& root, MosaicMeta& outMeta, std::string& outError)
{
  outError.clear();
  if (!root.isObject()) {
    outError = "sidecar root is not an object";
    return false;
  }

  MosaicMeta m = outMeta;
  if (!ReadJsonInt(root, "version", m.version, /*required=*/true, outError)) return false;
  if (m.version < 1 || m.version > kMosaicMetaVersion) {
    outError = "unsupported sidecar version " + std::to_string(m.version);
    return false;
  }

  if (!ReadJsonString(root, "directory", m.directory, false, outError)) return false;

  if (const JsonValue* layout = FindJsonMember(root, "layout")) {
    if (!layout->isObject()) {
      outError = "'layout' is not an object";
      return false;
    }
    if (!ReadJsonInt(*layout, "sectorsX", m.layout.sectorsX, false, outError)) return false;
    if (!ReadJsonInt(*layout, "sectorsY", m.layout.sectorsY, false, outError)) return false;
    if (!ReadJsonInt(*layout, "gridSize", m.layout.gridSize, false, outError)) return false;
  }

  if (!ReadJsonBool(root, "rotateForDisplay", m.rotateForDisplay, false, outError)) return false;

  if (const JsonValue* range = FindJsonMember(root, "range")) {
    if (range->isObject()) {
      if (!ReadJsonFloat(*range, "min", m.range.minValue, true, outError)) return false;
      if (!ReadJsonFloat(*range, "max", m.range.maxValue, true, outError)) return false;
      m.range.valid = true;
    } else if (range->isNull()) {
      m.range = ElevationRange{};
    } else {
      outError = "'range' is not an object";
      return false;
    }
  }

  if (const JsonValue* image = FindJsonMember(root, "image")) {
    if (!image->isObject()) {
      outError = "'image' is not an object";
      return false;
    }
    if (!ReadJsonString(*image, "path", m.image, false, outError)) return false;
    if (!ReadJsonInt(*image, "width", m.imageWidth, false, outError)) return false;
    if (!ReadJsonInt(*image, "height", m.imageHeight, false, outError)) return false;
    if (!ReadJsonInt(*image, "bitDepth", m.imageBitDepth, false, outError)) return false;
  }

  if (!ReadJsonInt(root, "sectorsLoaded", m.sectorsLoaded, false, outError)) return false;

  outMeta = std::move(m);
  return true;
}

bool SaveMosaicMeta(const std::string& path, const MosaicMeta& meta, std::string& outError)
{
  outError.clear();
  namespace fs = std::filesystem;

  const fs::path outPath(path);
  fs::path tmpPath = outPath;
  tmpPath += ".tmp";

  std::error_code ec;
  if (outPath.has_parent_path()) {
    fs::create_directories(outPath.parent_path(), ec);
    ec.clear();
  }
  fs::remove(tmpPath, ec);

  if (!WriteJsonFile(tmpPath.string(), MosaicMetaToJson(meta), outError)) {
    fs::remove(tmpPath, ec);
    return false;
  }

  fs::rename(tmpPath, outPath, ec);
  if (ec) {
    outError = "failed to rename '" + tmpPath.string() + "' to '" + outPath.string() + "': " + ec.message();
    std::error_code ec2;
    fs::remove(tmpPath, ec2);
    return false;
  }
  return true;
}

bool LoadMosaicMeta(const std::string& path, MosaicMeta& outMeta, std::string& outError)
{
  JsonValue root;
  if (!ReadJsonFile(path, root, outError)) return false;

  MosaicMeta m;
  if (!MosaicMetaFromJson(root, m, outError)) {
    outError = path + ": " + outError;
    return false;
  }
  outMeta = std::move(m);
  return true;
}

} // namespace csdat
