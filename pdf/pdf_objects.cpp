#include "pdf_objects.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

#include <zlib.h>

namespace label_pdf_internal {

FloatFormatter::FloatFormatter(int precision)
    : precision_(std::clamp(precision, 0, 6)) {}

// Fixed notation without trailing zeros, e.g. 12.5 rather than 12.500.
std::string FloatFormatter::Format(double value) const {
  std::ostringstream ss;
  ss.imbue(std::locale::classic());
  ss << std::fixed << std::setprecision(precision_) << value;
  std::string text = ss.str();
  if (text.find('.') != std::string::npos) {
    while (text.back() == '0')
      text.pop_back();
    if (text.back() == '.')
      text.pop_back();
  }
  if (text == "-0")
    text = "0";
  return text;
}

bool PdfDeflater::Compress(const std::string &input, std::string &output,
                           std::string &error) {
  if (input.empty()) {
    output.clear();
    return true;
  }
  uLongf bound = compressBound(static_cast<uLong>(input.size()));
  std::string compressed;
  compressed.resize(bound);

  int zres = compress2(reinterpret_cast<Bytef *>(compressed.data()), &bound,
                       reinterpret_cast<const Bytef *>(input.data()),
                       static_cast<uLong>(input.size()), Z_BEST_COMPRESSION);
  if (zres != Z_OK) {
    error = "compress2 failed with code " + std::to_string(zres);
    return false;
  }

  compressed.resize(bound);
  output.swap(compressed);
  return true;
}

PdfObject MakeStreamObject(const std::string &data, bool deflated) {
  std::ostringstream body;
  body << "<< /Length " << data.size();
  if (deflated)
    body << " /Filter /FlateDecode";
  body << " >>\nstream\n" << data << "\nendstream";
  return {body.str()};
}

bool AppendEmbeddedFontObjects(std::vector<PdfObject> &objects,
                               PdfFontDefinition &font) {
  const TtfFontMetrics &m = font.metrics;
  if (!m.valid || m.data.empty() || m.unitsPerEm <= 0)
    return false;
  const double scale = 1000.0 / m.unitsPerEm;
  auto scaled = [scale](int value) {
    return static_cast<long>(std::lround(value * scale));
  };

  std::ostringstream fontFile;
  fontFile << "<< /Length " << m.data.size() << " /Length1 " << m.data.size()
           << " >>\nstream\n"
           << m.data << "\nendstream";
  objects.push_back({fontFile.str()});
  const size_t fontFileId = objects.size();

  std::ostringstream descriptor;
  descriptor << "<< /Type /FontDescriptor /FontName /" << font.baseName
             << " /Flags 32 /FontBBox [" << scaled(m.xMin) << ' '
             << scaled(m.yMin) << ' ' << scaled(m.xMax) << ' '
             << scaled(m.yMax) << "] /Ascent " << scaled(m.ascent)
             << " /Descent " << -std::abs(scaled(m.descent)) << " /CapHeight "
             << scaled(m.capHeight) << " /ItalicAngle 0 /StemV 80 /FontFile2 "
             << fontFileId << " 0 R >>";
  objects.push_back({descriptor.str()});
  const size_t descriptorId = objects.size();

  std::ostringstream fontObject;
  fontObject << "<< /Type /Font /Subtype /TrueType /BaseFont /"
             << font.baseName << " /FirstChar 32 /LastChar 255 /Widths [";
  for (int code = 32; code <= 255; ++code)
    fontObject << m.widths1000[code] << (code != 255 ? " " : "");
  fontObject << "] /FontDescriptor " << descriptorId
             << " 0 R /Encoding /WinAnsiEncoding >>";
  objects.push_back({fontObject.str()});

  font.objectId = objects.size();
  font.embedded = true;
  return true;
}

void AppendFallbackType1Font(std::vector<PdfObject> &objects,
                             PdfFontDefinition &font,
                             const std::string &baseFont) {
  objects.push_back({"<< /Type /Font /Subtype /Type1 /BaseFont /" + baseFont +
                     " /Encoding /WinAnsiEncoding >>"});
  font.objectId = objects.size();
  font.embedded = false;
  font.baseName = baseFont;
}

} // namespace label_pdf_internal
