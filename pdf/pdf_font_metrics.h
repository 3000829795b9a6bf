#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace label_pdf_internal {

// Horizontal metrics of a TrueType face indexed by WinAnsi code.
struct TtfFontMetrics {
  int unitsPerEm = 1000;
  int ascent = 0;
  int descent = 0;
  int capHeight = 0;
  int xMin = 0;
  int yMin = 0;
  int xMax = 0;
  int yMax = 0;
  std::array<int, 256> advanceWidths{};
  std::array<int, 256> widths1000{};
  std::string data;
  bool valid = false;
};

struct PdfFontDefinition {
  // Resource name used in content streams ("F1", "F2").
  std::string key;
  std::string baseName;
  size_t objectId = 0;
  bool embedded = false;
  TtfFontMetrics metrics;

  // Ascender height for a font size, in points.
  double Ascent(double fontSize) const;
};

struct PdfFontCatalog {
  const PdfFontDefinition *regular = nullptr;
  const PdfFontDefinition *bold = nullptr;

  const PdfFontDefinition *Resolve(bool wantBold) const;
};

std::string EncodeWinAnsi(std::string_view utf8);
// Width of WinAnsi encoded text. Fonts without embedded metrics measure with
// the standard Helvetica (or Helvetica-Bold) widths; without a font every
// glyph is assumed to be 0.6 em wide.
double MeasureTextWidth(std::string_view encoded, double fontSize,
                        const PdfFontDefinition *font);

bool LoadTtfFontMetrics(const std::filesystem::path &path,
                        TtfFontMetrics &metrics);
// Look for a Helvetica compatible sans face installed on the system.
std::filesystem::path FindSystemFont(bool bold);
bool LoadPdfFontMetrics(PdfFontDefinition &font, bool bold);

} // namespace label_pdf_internal
