#pragma once

#include "pdf_font_metrics.h"

#include <string>
#include <vector>

namespace label_pdf_internal {

struct PdfObject {
  std::string body;
};

class FloatFormatter {
public:
  explicit FloatFormatter(int precision);
  std::string Format(double value) const;

private:
  int precision_;
};

class PdfDeflater {
public:
  static bool Compress(const std::string &input, std::string &output,
                       std::string &error);
};

// Stream object with an optional Flate filter.
PdfObject MakeStreamObject(const std::string &data, bool deflated);

bool AppendEmbeddedFontObjects(std::vector<PdfObject> &objects,
                               PdfFontDefinition &font);
void AppendFallbackType1Font(std::vector<PdfObject> &objects,
                             PdfFontDefinition &font,
                             const std::string &baseFont);

} // namespace label_pdf_internal
