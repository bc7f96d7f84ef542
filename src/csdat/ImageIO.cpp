#include "csdat/ImageIO.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstddef>
#include <fstream>
#include <iterator>
#include <limits>
#include <sstream>
#include <utility>

namespace csdat {

namespace {

std::string LowerExt(const std::string& path)
{
  const std::size_t slash = path.find_last_of("/\\");
  const std::size_t dot = path.find_last_of('.');
  if (dot == std::string::npos) return {};
  if (slash != std::string::npos && dot < slash) return {};
  std::string ext = path.substr(dot);
  for (char& c : ext) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return ext;
}

bool ReadExact(std::istream& is, void* dst, std::size_t n)
{
  is.read(static_cast<char*>(dst), static_cast<std::streamsize>(n));
  return is.gcount() == static_cast<std::streamsize>(n);
}

bool WriteExact(std::ostream& os, const void* src, std::size_t n)
{
  os.write(static_cast<const char*>(src), static_cast<std::streamsize>(n));
  return !os.fail();
}

bool SlurpFile(const std::string& path, std::vector<std::uint8_t>& out, std::string& outError)
{
  out.clear();
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    outError = "cannot open '" + path + "' for reading";
    return false;
  }
  out.assign(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
  if (f.bad()) {
    outError = "read error on '" + path + "'";
    return false;
  }
  return true;
}

bool DumpFile(const std::string& path, const std::vector<std::uint8_t>& bytes, std::string& outError)
{
  std::ofstream f(path, std::ios::binary | std::ios::trunc);
  if (!f) {
    outError = "cannot open '" + path + "' for writing";
    return false;
  }
  if (!WriteExact(f, bytes.data(), bytes.size()) || !f.flush()) {
    outError = "write error on '" + path + "'";
    return false;
  }
  return true;
}

void PutU16LE(std::vector<std::uint8_t>& out, std::uint16_t v)
{
  out.push_back(static_cast<std::uint8_t>(v & 0xFFu));
  out.push_back(static_cast<std::uint8_t>(v >> 8));
}

void PutU32BE(std::vector<std::uint8_t>& out, std::uint32_t v)
{
  for (int shift = 24; shift >= 0; shift -= 8) out.push_back(static_cast<std::uint8_t>((v >> shift) & 0xFFu));
}

// Bounds-checked forward reader over a byte buffer.
struct ByteCursor {
  const std::uint8_t* data = nullptr;
  std::size_t size = 0;
  std::size_t pos = 0;

  std::size_t left() const { return size - pos; }

  bool skip(std::size_t n, const std::uint8_t** where = nullptr)
  {
    if (left() < n) return false;
    if (where) *where = data + pos;
    pos += n;
    return true;
  }

  bool u8(std::uint8_t& v)
  {
    if (left() < 1) return false;
    v = data[pos++];
    return true;
  }

  bool u16le(std::uint16_t& v)
  {
    if (left() < 2) return false;
    v = static_cast<std::uint16_t>(data[pos] | (data[pos + 1] << 8));
    pos += 2;
    return true;
  }

  bool u32be(std::uint32_t& v)
  {
    if (left() < 4) return false;
    v = 0;
    for (int i = 0; i < 4; ++i) v = (v << 8) | data[pos + static_cast<std::size_t>(i)];
    pos += 4;
    return true;
  }
};

// Reflected CRC-32 (polynomial 0xEDB88320), the checksum of PNG chunks.
std::uint32_t Crc32(const std::uint8_t* data, std::size_t size)
{
  static const std::array<std::uint32_t, 256> kTable = [] {
    std::array<std::uint32_t, 256> t{};
    for (std::uint32_t n = 0; n < t.size(); ++n) {
      std::uint32_t r = n;
      for (int k = 0; k < 8; ++k) r = (r >> 1) ^ ((r & 1u) ? 0xEDB88320u : 0u);
      t[n] = r;
    }
    return t;
  }();

  std::uint32_t crc = ~0u;
  for (std::size_t i = 0; i < size; ++i) crc = kTable[(crc ^ data[i]) & 0xFFu] ^ (crc >> 8);
  return ~crc;
}

// RFC 1950 Adler-32. 5552 is the longest run that cannot overflow before reducing.
std::uint32_t Adler32(const std::uint8_t* data, std::size_t size)
{
  constexpr std::uint32_t kBase = 65521u;
  std::uint32_t lo = 1u;
  std::uint32_t hi = 0u;
  std::size_t i = 0;
  while (i < size) {
    const std::size_t stop = std::min<std::size_t>(size, i + 5552u);
    for (; i < stop; ++i) {
      lo += data[i];
      hi += lo;
    }
    lo %= kBase;
    hi %= kBase;
  }
  return (hi << 16) | lo;
}

constexpr std::array<std::uint8_t, 8> kPngSignature{0x89u, 'P', 'N', 'G', 0x0Du, 0x0Au, 0x1Au, 0x0Au};

bool HasPngSignature(const std::uint8_t* b, std::size_t n)
{
  return b && n >= kPngSignature.size() && std::equal(kPngSignature.begin(), kPngSignature.end(), b);
}

// Length, type, payload, then a CRC over type + payload.
void AppendPngChunk(std::vector<std::uint8_t>& png, const char* type, const std::vector<std::uint8_t>& payload)
{
  PutU32BE(png, static_cast<std::uint32_t>(payload.size()));
  const std::size_t crcFrom = png.size();
  png.insert(png.end(), type, type + 4);
  png.insert(png.end(), payload.begin(), payload.end());
  PutU32BE(png, Crc32(png.data() + crcFrom, png.size() - crcFrom));
}

// zlib container around uncompressed DEFLATE blocks of at most 65535 bytes.
std::vector<std::uint8_t> ZlibStore(const std::vector<std::uint8_t>& raw)
{
  constexpr std::size_t kMaxBlock = 65535u;
  const std::size_t blocks = std::max<std::size_t>(1u, (raw.size() + kMaxBlock - 1) / kMaxBlock);

  std::vector<std::uint8_t> z;
  z.reserve(2 + raw.size() + blocks * 5 + 4);
  z.push_back(0x78u); // deflate, 32K window
  z.push_back(0x01u); // no dictionary, check bits

  for (std::size_t b = 0; b < blocks; ++b) {
    const std::size_t begin = b * kMaxBlock;
    const std::size_t len = std::min(kMaxBlock, raw.size() - begin);
    z.push_back(b + 1 == blocks ? 0x01u : 0x00u);
    PutU16LE(z, static_cast<std::uint16_t>(len));
    PutU16LE(z, static_cast<std::uint16_t>(~len & 0xFFFFu));
    z.insert(z.end(), raw.begin() + static_cast<std::ptrdiff_t>(begin),
             raw.begin() + static_cast<std::ptrdiff_t>(begin + len));
  }

  PutU32BE(z, Adler32(raw.data(), raw.size()));
  return z;
}

// Inverse of ZlibStore. Compressed (fixed or dynamic Huffman) blocks are rejected.
bool ZlibUnstore(const std::vector<std::uint8_t>& z, std::vector<std::uint8_t>& raw, std::string& outError)
{
  raw.clear();
  ByteCursor cur{z.data(), z.size(), 0};

  std::uint8_t cmf = 0;
  std::uint8_t flg = 0;
  if (!cur.u8(cmf) || !cur.u8(flg)) {
    outError = "zlib header missing";
    return false;
  }
  if ((cmf * 256u + flg) % 31u != 0u || (cmf & 0x0Fu) != 8u || (flg & 0x20u) != 0u) {
    outError = "not a plain deflate zlib stream";
    return false;
  }

  bool last = false;
  while (!last) {
    std::uint8_t head = 0;
    if (!cur.u8(head)) {
      outError = "deflate data ends before the final block";
      return false;
    }
    last = (head & 0x01u) != 0u;
    if ((head & 0x06u) != 0u) {
      outError = "compressed deflate block; only uncompressed PNGs can be read (re-save with compression level 0)";
      return false;
    }

    std::uint16_t len = 0;
    std::uint16_t nlen = 0;
    const std::uint8_t* payload = nullptr;
    if (!cur.u16le(len) || !cur.u16le(nlen)) {
      outError = "stored block header cut short";
      return false;
    }
    if (static_cast<std::uint16_t>(~len) != nlen) {
      outError = "stored block length check failed";
      return false;
    }
    if (!cur.skip(len, &payload)) {
      outError = "stored block payload cut short";
      return false;
    }
    raw.insert(raw.end(), payload, payload + len);
  }

  std::uint32_t adler = 0;
  if (!cur.u32be(adler)) {
    outError = "zlib checksum missing";
    return false;
  }
  if (adler != Adler32(raw.data(), raw.size())) {
    std::ostringstream oss;
    oss << "zlib checksum mismatch (stored 0x" << std::hex << adler << ")";
    outError = oss.str();
    return false;
  }
  return true;
}

std::uint8_t PngColorType(int channels)
{
  switch (channels) {
  case 1: return 0u;
  case 3: return 2u;
  case 4: return 6u;
  default: return 0xFFu;
  }
}

int ChannelsForPngColorType(std::uint8_t colorType)
{
  switch (colorType) {
  case 0: return 1;
  case 2: return 3;
  case 6: return 4;
  default: return 0;
  }
}

std::size_t PngRowBytes(const RasterImage& img)
{
  const std::size_t bytesPerSample = (img.bitDepth == 16) ? 2u : 1u;
  return 1u + static_cast<std::size_t>(img.width) * static_cast<std::size_t>(img.channels) * bytesPerSample;
}

bool ReadPnmToken(std::istream& in, std::string& out)
{
  out.clear();

  char c = 0;
  while (in.get(c)) {
    if (std::isspace(static_cast<unsigned char>(c))) continue;
    if (c == '#') {
      std::string comment;
      std::getline(in, comment);
      continue;
    }
    out.push_back(c);
    break;
  }
  if (out.empty()) return false;

  // The single whitespace after maxval is consumed here, so pixel data starts right after.
  while (in.get(c)) {
    if (std::isspace(static_cast<unsigned char>(c))) break;
    out.push_back(c);
  }
  return true;
}

bool ParsePositiveToken(const std::string& tok, int& out)
{
  if (tok.empty() || tok.size() > 9) return false;
  int value = 0;
  for (const char c : tok) {
    if (c < '0' || c > '9') return false;
    value = value * 10 + (c - '0');
  }
  if (value <= 0) return false;
  out = value;
  return true;
}

} // namespace

bool ValidateRasterImage(const RasterImage& img, std::string& outError)
{
  outError.clear();
  if (img.width <= 0 || img.height <= 0) {
    outError = "image has no pixels (" + std::to_string(img.width) + "x" + std::to_string(img.height) + ")";
    return false;
  }
  if (img.channels != 1 && img.channels != 3 && img.channels != 4) {
    outError = "unsupported channel count (expected 1, 3 or 4)";
    return false;
  }
  if (img.bitDepth != 8 && img.bitDepth != 16) {
    outError = "unsupported bit depth (expected 8 or 16)";
    return false;
  }
  const std::size_t expected =
      static_cast<std::size_t>(img.width) * static_cast<std::size_t>(img.height) * static_cast<std::size_t>(img.channels);
  if (img.samples.size() != expected) {
    std::ostringstream oss;
    oss << "sample buffer holds " << img.samples.size() << " values, image needs " << expected;
    outError = oss.str();
    return false;
  }
  return true;
}

bool WritePng(const std::string& path, const RasterImage& img, std::string& outError)
{
  if (!ValidateRasterImage(img, outError)) return false;

  const std::size_t rowSamples = static_cast<std::size_t>(img.width) * static_cast<std::size_t>(img.channels);
  const std::size_t rowBytes = PngRowBytes(img);

  std::vector<std::uint8_t> scanlines;
  scanlines.reserve(rowBytes * static_cast<std::size_t>(img.height));
  for (int y = 0; y < img.height; ++y) {
    scanlines.push_back(0u); // filter: none
    const std::uint16_t* row = img.samples.data() + static_cast<std::size_t>(y) * rowSamples;
    for (std::size_t i = 0; i < rowSamples; ++i) {
      if (img.bitDepth == 16) {
        scanlines.push_back(static_cast<std::uint8_t>(row[i] >> 8));
        scanlines.push_back(static_cast<std::uint8_t>(row[i] & 0xFFu));
      } else {
        scanlines.push_back(static_cast<std::uint8_t>(std::min<std::uint16_t>(row[i], 255u)));
      }
    }
  }

  std::vector<std::uint8_t> ihdr;
  PutU32BE(ihdr, static_cast<std::uint32_t>(img.width));
  PutU32BE(ihdr, static_cast<std::uint32_t>(img.height));
  ihdr.push_back(static_cast<std::uint8_t>(img.bitDepth));
  ihdr.push_back(PngColorType(img.channels));
  ihdr.push_back(0u); // deflate
  ihdr.push_back(0u); // adaptive filtering
  ihdr.push_back(0u); // no interlace

  const std::vector<std::uint8_t> idat = ZlibStore(scanlines);
  if (idat.size() > 0x7FFFFFFFu) {
    outError = "image too large for a single PNG data chunk";
    return false;
  }

  std::vector<std::uint8_t> png(kPngSignature.begin(), kPngSignature.end());
  png.reserve(png.size() + idat.size() + 64);
  AppendPngChunk(png, "IHDR", ihdr);
  AppendPngChunk(png, "IDAT", idat);
  AppendPngChunk(png, "IEND", {});

  return DumpFile(path, png, outError);
}

bool ReadPng(const std::string& path, RasterImage& outImg, std::string& outError)
{
  outError.clear();
  outImg = RasterImage{};

  std::vector<std::uint8_t> file;
  if (!SlurpFile(path, file, outError)) return false;
  if (!HasPngSignature(file.data(), file.size())) {
    outError = "'" + path + "' is not a PNG file";
    return false;
  }

  ByteCursor cur{file.data(), file.size(), kPngSignature.size()};
  RasterImage img;
  bool sawHeader = false;
  bool sawEnd = false;
  std::vector<std::uint8_t> idat;

  while (!sawEnd) {
    std::uint32_t len = 0;
    const std::uint8_t* type = nullptr;
    const std::uint8_t* payload = nullptr;
    std::uint32_t crc = 0;
    if (!cur.u32be(len) || !cur.skip(4, &type) || !cur.skip(len, &payload) || !cur.u32be(crc)) {
      outError = "PNG chunk cut short (no IEND)";
      return false;
    }
    const std::string name(reinterpret_cast<const char*>(type), 4);
    if (crc != Crc32(type, 4u + len)) {
      outError = "PNG chunk " + name + " fails its CRC check";
      return false;
    }

    if (name == "IHDR") {
      ByteCursor hdr{payload, len, 0};
      std::uint32_t w = 0;
      std::uint32_t h = 0;
      std::uint8_t depth = 0;
      std::uint8_t color = 0;
      std::uint8_t compression = 0;
      std::uint8_t filter = 0;
      std::uint8_t interlace = 0;
      if (len != 13u || !hdr.u32be(w) || !hdr.u32be(h) || !hdr.u8(depth) || !hdr.u8(color) ||
          !hdr.u8(compression) || !hdr.u8(filter) || !hdr.u8(interlace)) {
        outError = "malformed PNG header chunk";
        return false;
      }
      constexpr std::uint32_t kMaxDim = static_cast<std::uint32_t>(std::numeric_limits<int>::max());
      if (w == 0 || h == 0 || w > kMaxDim || h > kMaxDim) {
        outError = "PNG header has invalid dimensions";
        return false;
      }
      img.width = static_cast<int>(w);
      img.height = static_cast<int>(h);
      img.bitDepth = depth;
      img.channels = ChannelsForPngColorType(color);
      if ((depth != 8 && depth != 16) || img.channels == 0 || compression != 0u || filter != 0u || interlace != 0u) {
        outError = "unsupported PNG format (expected 8/16-bit gray, RGB or RGBA without interlace)";
        return false;
      }
      sawHeader = true;
    } else if (name == "IDAT") {
      idat.insert(idat.end(), payload, payload + len);
    } else if (name == "IEND") {
      sawEnd = true;
    }
  }

  if (!sawHeader || idat.empty()) {
    outError = sawHeader ? "PNG has no image data" : "PNG has no header chunk";
    return false;
  }

  std::vector<std::uint8_t> scanlines;
  std::string zerr;
  if (!ZlibUnstore(idat, scanlines, zerr)) {
    outError = "PNG image data: " + zerr;
    return false;
  }

  const std::size_t rowBytes = PngRowBytes(img);
  const std::size_t rowSamples = static_cast<std::size_t>(img.width) * static_cast<std::size_t>(img.channels);
  if (scanlines.size() != rowBytes * static_cast<std::size_t>(img.height)) {
    std::ostringstream oss;
    oss << "PNG image data is " << scanlines.size() << " bytes, header implies "
        << rowBytes * static_cast<std::size_t>(img.height);
    outError = oss.str();
    return false;
  }

  img.samples.resize(rowSamples * static_cast<std::size_t>(img.height));
  for (int y = 0; y < img.height; ++y) {
    const std::uint8_t* src = scanlines.data() + static_cast<std::size_t>(y) * rowBytes;
    if (*src++ != 0u) {
      outError = "PNG row " + std::to_string(y) + " uses a filter other than none";
      return false;
    }
    std::uint16_t* dst = img.samples.data() + static_cast<std::size_t>(y) * rowSamples;
    for (std::size_t i = 0; i < rowSamples; ++i) {
      if (img.bitDepth == 16) {
        dst[i] = static_cast<std::uint16_t>((src[0] << 8) | src[1]);
        src += 2;
      } else {
        dst[i] = *src++;
      }
    }
  }

  outImg = std::move(img);
  return true;
}

bool WritePnm(const std::string& path, const RasterImage& img, std::string& outError)
{
  if (!ValidateRasterImage(img, outError)) return false;

  const bool gray = (img.channels == 1);
  const int outChannels = gray ? 1 : 3;
  const std::size_t pixels = static_cast<std::size_t>(img.width) * static_cast<std::size_t>(img.height);
  const std::size_t bytesPerSample = (img.bitDepth == 16) ? 2u : 1u;

  std::vector<std::uint8_t> body;
  body.reserve(pixels * static_cast<std::size_t>(outChannels) * bytesPerSample);
  for (std::size_t p = 0; p < pixels; ++p) {
    const std::uint16_t* px = img.samples.data() + p * static_cast<std::size_t>(img.channels);
    for (int c = 0; c < outChannels; ++c) {
      const std::uint16_t v = px[c];
      if (bytesPerSample == 2u) {
        body.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFFu));
        body.push_back(static_cast<std::uint8_t>(v & 0xFFu));
      } else {
        body.push_back(static_cast<std::uint8_t>(std::min<std::uint16_t>(v, 255u)));
      }
    }
  }

  std::ofstream f(path, std::ios::binary);
  if (!f) {
    outError = "failed to open file for writing: " + path;
    return false;
  }

  f << (gray ? "P5" : "P6") << "\n" << img.width << " " << img.height << "\n" << img.maxSample() << "\n";
  if (!WriteExact(f, body.data(), body.size())) {
    outError = "failed while writing file: " + path;
    return false;
  }
  return true;
}

bool ReadPnm(const std::string& path, RasterImage& outImg, std::string& outError)
{
  outError.clear();
  outImg = RasterImage{};

  std::ifstream f(path, std::ios::binary);
  if (!f) {
    outError = "failed to open file for reading: " + path;
    return false;
  }

  std::string tok;
  if (!ReadPnmToken(f, tok) || (tok != "P5" && tok != "P6")) {
    outError = "invalid PNM magic (expected P5 or P6)";
    return false;
  }
  const int channels = (tok == "P5") ? 1 : 3;

  int w = 0;
  int h = 0;
  int maxv = 0;
  if (!ReadPnmToken(f, tok) || !ParsePositiveToken(tok, w)) {
    outError = "invalid PNM width";
    return false;
  }
  if (!ReadPnmToken(f, tok) || !ParsePositiveToken(tok, h)) {
    outError = "invalid PNM height";
    return false;
  }
  if (!ReadPnmToken(f, tok) || !ParsePositiveToken(tok, maxv) || maxv > 65535) {
    outError = "invalid PNM maxval";
    return false;
  }

  const std::size_t bytesPerSample = (maxv > 255) ? 2u : 1u;
  const std::size_t count = static_cast<std::size_t>(w) * static_cast<std::size_t>(h) * static_cast<std::size_t>(channels);
  std::vector<std::uint8_t> body(count * bytesPerSample);
  if (!ReadExact(f, body.data(), body.size())) {
    outError = "failed while reading pixel data";
    return false;
  }

  RasterImage img;
  img.width = w;
  img.height = h;
  img.channels = channels;
  img.bitDepth = (bytesPerSample == 2u) ? 16 : 8;
  img.samples.resize(count);

  // Rescale odd maxvals (e.g. 1023) to the full 8/16-bit range.
  const int target = img.maxSample();
  for (std::size_t i = 0; i < count; ++i) {
    std::uint32_t v = (bytesPerSample == 2u)
                          ? ((static_cast<std::uint32_t>(body[2 * i]) << 8) | static_cast<std::uint32_t>(body[2 * i + 1]))
                          : static_cast<std::uint32_t>(body[i]);
    v = std::min<std::uint32_t>(v, static_cast<std::uint32_t>(maxv));
    if (maxv != target) {
      v = (v * static_cast<std::uint32_t>(target) + static_cast<std::uint32_t>(maxv) / 2u) /
          static_cast<std::uint32_t>(maxv);
    }
    img.samples[i] = static_cast<std::uint16_t>(v);
  }

  outImg = std::move(img);
  return true;
}

bool ReadImageAuto(const std::string& path, RasterImage& outImg, std::string& outError)
{
  const std::string ext = LowerExt(path);
  if (ext == ".png") return ReadPng(path, outImg, outError);
  if (ext == ".ppm" || ext == ".pgm" || ext == ".pnm") return ReadPnm(path, outImg, outError);

  // Probe magic.
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    outError = "failed to open file for reading: " + path;
    return false;
  }

  std::uint8_t head[8] = {};
  f.read(reinterpret_cast<char*>(head), static_cast<std::streamsize>(sizeof(head)));
  const std::size_t got = static_cast<std::size_t>(f.gcount());
  f.close();

  if (HasPngSignature(head, got)) return ReadPng(path, outImg, outError);
  if (got >= 2 && head[0] == 'P' && (head[1] == '5' || head[1] == '6')) return ReadPnm(path, outImg, outError);

  outError = "unknown image format (expected .png, .pgm or .ppm)";
  return false;
}

bool WriteImageAuto(const std::string& path, const RasterImage& img, std::string& outError)
{
  const std::string ext = LowerExt(path);
  if (ext == ".png") return WritePng(path, img, outError);
  return WritePnm(path, img, outError);
}

} // namespace csdat
