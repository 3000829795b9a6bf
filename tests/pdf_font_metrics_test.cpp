#include "pdf_font_metrics.h"

#include <cmath>
#include <iostream>

using namespace label_pdf_internal;

int main() {
  const std::string input = "Euro \xE2\x82\xAC \xE2\x80\x94 \xC3\xA9 \xE4\xB8\xAD";
  const std::string encoded = EncodeWinAnsi(input);
  if (encoded.size() != 12) {
    std::cerr << "Unexpected encoded length " << encoded.size() << std::endl;
    return 1;
  }
  if (static_cast<unsigned char>(encoded[5]) != 0x80) {
    std::cerr << "Euro sign was not mapped to WinAnsi 0x80" << std::endl;
    return 1;
  }
  if (static_cast<unsigned char>(encoded[7]) != 0x97 ||
      static_cast<unsigned char>(encoded[9]) != 0xE9 || encoded[11] != '?') {
    std::cerr << "Dash, accent or unmapped character encoded wrongly"
              << std::endl;
    return 1;
  }

  // Without metrics every glyph is 0.6 em.
  if (std::abs(MeasureTextWidth("abcd", 10.0, nullptr) - 24.0) > 1e-9) {
    std::cerr << "Fallback width estimate changed" << std::endl;
    return 1;
  }

  // Type1 fallback faces measure with the Helvetica width tables.
  {
    PdfFontDefinition helvetica;
    helvetica.baseName = "Helvetica";
    PdfFontDefinition helveticaBold;
    helveticaBold.baseName = "Helvetica-Bold";
    if (std::abs(MeasureTextWidth("Wi", 10.0, &helvetica) - 11.66) > 1e-9 ||
        std::abs(MeasureTextWidth("Wi", 10.0, &helveticaBold) - 12.22) > 1e-9 ||
        std::abs(MeasureTextWidth(EncodeWinAnsi("\xC3\xA9"), 10.0,
                                  &helvetica) - 5.56) > 1e-9) {
      std::cerr << "Helvetica width tables changed" << std::endl;
      return 1;
    }
    if (MeasureTextWidth("iiii", 12.0, &helvetica) >=
        MeasureTextWidth("MMMM", 12.0, &helvetica)) {
      std::cerr << "Narrow and wide glyphs measure alike" << std::endl;
      return 1;
    }
  }

  PdfFontDefinition font;
  if (std::abs(font.Ascent(10.0) - 7.18) > 1e-9) {
    std::cerr << "Helvetica ascender fallback changed" << std::endl;
    return 1;
  }

  PdfFontDefinition regular;
  regular.key = "F1";
  PdfFontCatalog catalog;
  catalog.regular = &regular;
  if (catalog.Resolve(true) != &regular || catalog.Resolve(false) != &regular) {
    std::cerr << "Bold request without a bold face must fall back" << std::endl;
    return 1;
  }

  if (LoadPdfFontMetrics(font, false)) {
    font.embedded = true;
    if (font.metrics.unitsPerEm <= 0 || font.metrics.advanceWidths['W'] <= 0 ||
        MeasureTextWidth("WW", 12.0, &font) <= MeasureTextWidth("ii", 12.0, &font)) {
      std::cerr << "System font metrics look wrong" << std::endl;
      return 1;
    }
  }
  return 0;
}
