#pragma once

#include "labeldocument.h"
#include "pdf_font_metrics.h"
#include "pdf_objects.h"

#include <sstream>
#include <string>

namespace label_pdf_internal {

// PDF user space point (origin bottom left, y up).
struct Point {
  double x = 0.0;
  double y = 0.0;
};

// Tracks the current colors and line width of a content stream so repeated
// operators are only written when the value changes.
class GraphicsStateCache {
public:
  void SetStroke(std::ostringstream &out, const LabelColor &color,
                 double width, const FloatFormatter &fmt);
  void SetFill(std::ostringstream &out, const LabelColor &color,
               const FloatFormatter &fmt);

private:
  LabelColor strokeColor_{};
  LabelColor fillColor_{};
  double lineWidth_ = -1.0;
  bool hasStrokeColor_ = false;
  bool hasFillColor_ = false;
};

void AppendLine(std::ostringstream &out, GraphicsStateCache &cache,
                const FloatFormatter &fmt, const Point &a, const Point &b,
                const LabelColor &color, double width);
void AppendFilledRectangle(std::ostringstream &out, GraphicsStateCache &cache,
                           const FloatFormatter &fmt, const Point &origin,
                           double w, double h, const LabelColor &color);
// One line of already WinAnsi encoded text with its baseline at pos.
void AppendTextRun(std::ostringstream &out, GraphicsStateCache &cache,
                   const FloatFormatter &fmt, const Point &pos,
                   const std::string &encoded, double fontSize,
                   const PdfFontDefinition &font, const LabelColor &color);

std::string EscapePdfString(const std::string &encoded);

} // namespace label_pdf_internal
