#include "pdf_draw_commands.h"

#include <cmath>

namespace label_pdf_internal {

namespace {
bool SameColor(const LabelColor &a, const LabelColor &b) {
  return std::abs(a.r - b.r) < 1e-6 && std::abs(a.g - b.g) < 1e-6 &&
         std::abs(a.b - b.b) < 1e-6;
}
} // namespace

void GraphicsStateCache::SetStroke(std::ostringstream &out,
                                   const LabelColor &color, double width,
                                   const FloatFormatter &fmt) {
  if (!hasStrokeColor_ || !SameColor(color, strokeColor_)) {
    out << fmt.Format(color.r) << ' ' << fmt.Format(color.g) << ' '
        << fmt.Format(color.b) << " RG\n";
    strokeColor_ = color;
    hasStrokeColor_ = true;
  }
  if (std::abs(width - lineWidth_) > 1e-6) {
    out << fmt.Format(width) << " w\n";
    lineWidth_ = width;
  }
}

void GraphicsStateCache::SetFill(std::ostringstream &out,
                                 const LabelColor &color,
                                 const FloatFormatter &fmt) {
  if (!hasFillColor_ || !SameColor(color, fillColor_)) {
    out << fmt.Format(color.r) << ' ' << fmt.Format(color.g) << ' '
        << fmt.Format(color.b) << " rg\n";
    fillColor_ = color;
    hasFillColor_ = true;
  }
}

void AppendLine(std::ostringstream &out, GraphicsStateCache &cache,
                const FloatFormatter &fmt, const Point &a, const Point &b,
                const LabelColor &color, double width) {
  if (width <= 0.0)
    return;
  cache.SetStroke(out, color, width, fmt);
  out << fmt.Format(a.x) << ' ' << fmt.Format(a.y) << " m\n"
      << fmt.Format(b.x) << ' ' << fmt.Format(b.y) << " l\nS\n";
}

void AppendFilledRectangle(std::ostringstream &out, GraphicsStateCache &cache,
                           const FloatFormatter &fmt, const Point &origin,
                           double w, double h, const LabelColor &color) {
  cache.SetFill(out, color, fmt);
  out << fmt.Format(origin.x) << ' ' << fmt.Format(origin.y) << ' '
      << fmt.Format(w) << ' ' << fmt.Format(h) << " re\nf\n";
}

std::string EscapePdfString(const std::string &encoded) {
  std::string out;
  out.reserve(encoded.size());
  for (char ch : encoded) {
    if (ch == '(' || ch == ')' || ch == '\\')
      out.push_back('\\');
    if (ch == '\n' || ch == '\r')
      ch = ' ';
    out.push_back(ch);
  }
  return out;
}

void AppendTextRun(std::ostringstream &out, GraphicsStateCache &cache,
                   const FloatFormatter &fmt, const Point &pos,
                   const std::string &encoded, double fontSize,
                   const PdfFontDefinition &font, const LabelColor &color) {
  if (encoded.empty())
    return;
  cache.SetFill(out, color, fmt);
  out << "BT\n/" << font.key << ' ' << fmt.Format(fontSize) << " Tf\n"
      << fmt.Format(pos.x) << ' ' << fmt.Format(pos.y) << " Td\n("
      << EscapePdfString(encoded) << ") Tj\nET\n";
}

} // namespace label_pdf_internal
