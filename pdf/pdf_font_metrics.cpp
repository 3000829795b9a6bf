#include "pdf_font_metrics.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iterator>
#include <utility>
#include <vector>

namespace label_pdf_internal {

namespace {

// Code points of the WinAnsi 0x80-0x9F block; zero marks an unused slot.
constexpr std::array<uint32_t, 32> kWinAnsiHighBlock = {
    0x20AC, 0,      0x201A, 0x0192, 0x201E, 0x2026, 0x2020, 0x2021,
    0x02C6, 0x2030, 0x0160, 0x2039, 0x0152, 0,      0x017D, 0,
    0,      0x2018, 0x2019, 0x201C, 0x201D, 0x2022, 0x2013, 0x2014,
    0x02DC, 0x2122, 0x0161, 0x203A, 0x0153, 0,      0x017E, 0x0178};

// Standard Helvetica advance widths (1/1000 em) for codes 0x20-0x7E.
constexpr std::array<int, 95> kHelveticaWidths = {
    278, 278, 355, 556, 556, 889, 667, 191, 333, 333, 389, 584, 278, 333,
    278, 278, 556, 556, 556, 556, 556, 556, 556, 556, 556, 556, 278, 278,
    584, 584, 584, 556, 1015, 667, 667, 722, 722, 667, 611, 778, 722, 278,
    500, 667, 556, 833, 722, 778, 667, 778, 722, 667, 611, 722, 667, 944,
    667, 667, 611, 278, 278, 278, 469, 556, 333, 556, 556, 500, 556, 556,
    278, 556, 556, 222, 222, 500, 222, 833, 556, 556, 556, 556, 333, 500,
    278, 556, 500, 722, 500, 500, 500, 334, 260, 334, 584};

constexpr std::array<int, 95> kHelveticaBoldWidths = {
    278, 333, 474, 556, 556, 889, 722, 238, 333, 333, 389, 584, 278, 333,
    278, 278, 556, 556, 556, 556, 556, 556, 556, 556, 556, 556, 333, 333,
    584, 584, 584, 611, 975, 722, 722, 722, 722, 667, 611, 778, 722, 278,
    556, 722, 611, 833, 722, 778, 667, 778, 722, 667, 611, 722, 667, 944,
    667, 667, 611, 333, 278, 333, 584, 556, 333, 556, 611, 556, 611, 556,
    333, 611, 611, 278, 278, 556, 278, 889, 611, 611, 611, 611, 389, 556,
    333, 611, 556, 778, 556, 556, 500, 389, 280, 389, 584};

// Codes outside 0x20-0x7E are mostly accented letters.
constexpr int kHelveticaOtherWidth = 556;

int HelveticaWidth(unsigned char code, bool bold) {
  if (code < 0x20 || code > 0x7E)
    return kHelveticaOtherWidth;
  return bold ? kHelveticaBoldWidths[code - 0x20]
              : kHelveticaWidths[code - 0x20];
}

char WinAnsiFromCodepoint(uint32_t codepoint) {
  if (codepoint < 0x80 || (codepoint >= 0xA0 && codepoint <= 0xFF))
    return static_cast<char>(codepoint);
  for (size_t i = 0; i < kWinAnsiHighBlock.size(); ++i)
    if (kWinAnsiHighBlock[i] == codepoint)
      return static_cast<char>(0x80 + i);
  return '?';
}

// Big-endian reads over a loaded font file. Out of range reads yield zero so
// truncated tables fail the later sanity checks instead of crashing.
class FontBytes {
public:
  explicit FontBytes(const std::string &data) : data_(data) {}

  size_t Size() const { return data_.size(); }
  uint8_t U8(size_t offset) const {
    return offset < data_.size() ? static_cast<uint8_t>(data_[offset]) : 0;
  }
  uint16_t U16(size_t offset) const {
    return static_cast<uint16_t>((U8(offset) << 8) | U8(offset + 1));
  }
  int16_t S16(size_t offset) const {
    return static_cast<int16_t>(U16(offset));
  }
  uint32_t U32(size_t offset) const {
    return (static_cast<uint32_t>(U16(offset)) << 16) | U16(offset + 2);
  }

private:
  const std::string &data_;
};

struct TableRange {
  size_t offset = 0;
  size_t length = 0;
};

constexpr uint32_t Tag(const char (&name)[5]) {
  return (static_cast<uint32_t>(name[0]) << 24) |
         (static_cast<uint32_t>(name[1]) << 16) |
         (static_cast<uint32_t>(name[2]) << 8) |
         static_cast<uint32_t>(name[3]);
}

bool FindTable(const FontBytes &font, uint32_t tag, TableRange &range) {
  const uint16_t numTables = font.U16(4);
  for (uint16_t i = 0; i < numTables; ++i) {
    const size_t record = 12 + static_cast<size_t>(i) * 16;
    if (record + 16 > font.Size())
      return false;
    if (font.U32(record) != tag)
      continue;
    range.offset = font.U32(record + 8);
    range.length = font.U32(record + 12);
    return range.offset + range.length <= font.Size();
  }
  return false;
}

// Offset of the Windows Unicode BMP (format 4) subtable, or 0.
size_t FindUnicodeCmap(const FontBytes &font, const TableRange &cmap) {
  const uint16_t count = font.U16(cmap.offset + 2);
  for (uint16_t i = 0; i < count; ++i) {
    const size_t record = cmap.offset + 4 + static_cast<size_t>(i) * 8;
    if (record + 8 > cmap.offset + cmap.length)
      break;
    const uint16_t platform = font.U16(record);
    const uint16_t encoding = font.U16(record + 2);
    const size_t subtable = cmap.offset + font.U32(record + 4);
    if (platform == 3 && (encoding == 1 || encoding == 0) &&
        font.U16(subtable) == 4)
      return subtable;
  }
  return 0;
}

uint16_t GlyphForCodepoint(const FontBytes &font, size_t subtable,
                           uint16_t code) {
  const uint16_t segCount = font.U16(subtable + 6) / 2;
  const size_t endCodes = subtable + 14;
  const size_t startCodes = endCodes + 2 * segCount + 2;
  const size_t deltas = startCodes + 2 * segCount;
  const size_t rangeOffsets = deltas + 2 * segCount;
  for (uint16_t seg = 0; seg < segCount; ++seg) {
    if (code > font.U16(endCodes + 2 * seg))
      continue;
    const uint16_t start = font.U16(startCodes + 2 * seg);
    if (code < start)
      return 0;
    const uint16_t delta = font.U16(deltas + 2 * seg);
    const uint16_t rangeOffset = font.U16(rangeOffsets + 2 * seg);
    if (rangeOffset == 0)
      return static_cast<uint16_t>(code + delta);
    const size_t glyphAt =
        rangeOffsets + 2 * seg + rangeOffset + 2 * (code - start);
    const uint16_t glyph = font.U16(glyphAt);
    return glyph == 0 ? 0 : static_cast<uint16_t>(glyph + delta);
  }
  return 0;
}

// Unicode code point of a WinAnsi byte, used to look glyphs up in the cmap.
uint16_t CodepointForWinAnsi(size_t code) {
  if (code >= 0x80 && code < 0xA0)
    return static_cast<uint16_t>(kWinAnsiHighBlock[code - 0x80]);
  return static_cast<uint16_t>(code);
}

} // namespace

double PdfFontDefinition::Ascent(double fontSize) const {
  if (embedded && metrics.unitsPerEm > 0 && metrics.ascent > 0)
    return metrics.ascent * fontSize / metrics.unitsPerEm;
  // Helvetica ascender.
  return fontSize * 0.718;
}

const PdfFontDefinition *PdfFontCatalog::Resolve(bool wantBold) const {
  if (wantBold && bold)
    return bold;
  return regular ? regular : bold;
}

std::string EncodeWinAnsi(std::string_view utf8) {
  std::string out;
  out.reserve(utf8.size());
  size_t i = 0;
  while (i < utf8.size()) {
    const unsigned char lead = static_cast<unsigned char>(utf8[i]);
    size_t length = 1;
    uint32_t codepoint = lead;
    if (lead >= 0xF0) {
      length = 4;
      codepoint = lead & 0x07;
    } else if (lead >= 0xE0) {
      length = 3;
      codepoint = lead & 0x0F;
    } else if (lead >= 0xC0) {
      length = 2;
      codepoint = lead & 0x1F;
    } else if (lead >= 0x80) {
      out.push_back('?');
      ++i;
      continue;
    }
    if (i + length > utf8.size()) {
      out.push_back('?');
      break;
    }
    for (size_t k = 1; k < length; ++k)
      codepoint = (codepoint << 6) |
                  (static_cast<unsigned char>(utf8[i + k]) & 0x3F);
    out.push_back(WinAnsiFromCodepoint(codepoint));
    i += length;
  }
  return out;
}

double MeasureTextWidth(std::string_view encoded, double fontSize,
                        const PdfFontDefinition *font) {
  if (!font)
    return static_cast<double>(encoded.size()) * fontSize * 0.6;
  if (!font->embedded || font->metrics.unitsPerEm <= 0) {
    const bool bold = font->baseName.find("Bold") != std::string::npos;
    double units = 0.0;
    for (unsigned char ch : encoded)
      units += HelveticaWidth(ch, bold);
    return units * fontSize / 1000.0;
  }
  double units = 0.0;
  for (unsigned char ch : encoded)
    units += font->metrics.advanceWidths[ch];
  return units * fontSize / font->metrics.unitsPerEm;
}

bool LoadTtfFontMetrics(const std::filesystem::path &path,
                        TtfFontMetrics &metrics) {
  metrics = TtfFontMetrics{};
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open())
    return false;
  std::string data((std::istreambuf_iterator<char>(file)),
                   std::istreambuf_iterator<char>());
  const FontBytes font(data);
  if (font.Size() < 12)
    return false;

  TableRange head, hhea, maxp, hmtx, cmap, os2;
  if (!FindTable(font, Tag("head"), head) || head.length < 54 ||
      !FindTable(font, Tag("hhea"), hhea) || hhea.length < 36 ||
      !FindTable(font, Tag("maxp"), maxp) || maxp.length < 6 ||
      !FindTable(font, Tag("hmtx"), hmtx) ||
      !FindTable(font, Tag("cmap"), cmap))
    return false;

  metrics.unitsPerEm = font.U16(head.offset + 18);
  metrics.xMin = font.S16(head.offset + 36);
  metrics.yMin = font.S16(head.offset + 38);
  metrics.xMax = font.S16(head.offset + 40);
  metrics.yMax = font.S16(head.offset + 42);
  metrics.ascent = font.S16(hhea.offset + 4);
  metrics.descent = font.S16(hhea.offset + 6);
  const uint16_t numHMetrics = font.U16(hhea.offset + 34);
  const uint16_t numGlyphs = font.U16(maxp.offset + 4);
  if (metrics.unitsPerEm == 0 || numHMetrics == 0 || numGlyphs == 0 ||
      static_cast<size_t>(numHMetrics) * 4 > hmtx.length)
    return false;

  if (FindTable(font, Tag("OS/2"), os2) && os2.length >= 90 &&
      font.U16(os2.offset) >= 2)
    metrics.capHeight = font.S16(os2.offset + 88);
  if (metrics.capHeight == 0)
    metrics.capHeight = metrics.ascent;

  const size_t subtable = FindUnicodeCmap(font, cmap);
  if (subtable == 0)
    return false;

  // Glyphs past numHMetrics share the last advance.
  auto advanceOf = [&](uint16_t glyph) -> int {
    const uint16_t index = std::min<uint16_t>(glyph, numHMetrics - 1);
    return font.U16(hmtx.offset + static_cast<size_t>(index) * 4);
  };
  for (size_t code = 0; code < metrics.advanceWidths.size(); ++code) {
    const uint16_t codepoint = CodepointForWinAnsi(code);
    const uint16_t glyph =
        codepoint ? GlyphForCodepoint(font, subtable, codepoint) : 0;
    const int advance = advanceOf(glyph < numGlyphs ? glyph : 0);
    metrics.advanceWidths[code] = advance;
    metrics.widths1000[code] = static_cast<int>(
        std::lround(advance * 1000.0 / metrics.unitsPerEm));
  }

  metrics.data = std::move(data);
  metrics.valid = true;
  return true;
}

std::filesystem::path FindSystemFont(bool bold) {
  struct FontCandidate {
    const char *regularPath;
    const char *boldPath;
  };
  // Liberation Sans shares Helvetica's metrics, so it comes first.
  static const std::vector<FontCandidate> candidates = {
#ifdef _WIN32
      {"C:/Windows/Fonts/arial.ttf", "C:/Windows/Fonts/arialbd.ttf"},
#elif defined(__APPLE__)
      {"/Library/Fonts/Arial.ttf", "/Library/Fonts/Arial Bold.ttf"},
      {"/System/Library/Fonts/Supplemental/Arial.ttf",
       "/System/Library/Fonts/Supplemental/Arial Bold.ttf"},
#else
      {"/usr/share/fonts/truetype/liberation/LiberationSans-Regular.ttf",
       "/usr/share/fonts/truetype/liberation/LiberationSans-Bold.ttf"},
      {"/usr/share/fonts/liberation-sans/LiberationSans-Regular.ttf",
       "/usr/share/fonts/liberation-sans/LiberationSans-Bold.ttf"},
      {"/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
       "/usr/share/fonts/truetype/dejavu/DejaVuSans-Bold.ttf"},
#endif
  };
  for (const auto &candidate : candidates) {
    const char *path = bold ? candidate.boldPath : candidate.regularPath;
    std::error_code ec;
    if (path && std::filesystem::exists(path, ec))
      return std::filesystem::path(path);
  }
  return {};
}

bool LoadPdfFontMetrics(PdfFontDefinition &font, bool bold) {
  const std::filesystem::path path = FindSystemFont(bold);
  if (path.empty())
    return false;
  return LoadTtfFontMetrics(path, font.metrics);
}

} // namespace label_pdf_internal
