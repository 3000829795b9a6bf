/*
 * This file is part of PartsLabel.
 * Copyright (C) 2025 Luisma Peramato
 *
 * PartsLabel is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * PartsLabel is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with PartsLabel. If not, see <https://www.gnu.org/licenses/>.
 */
#include "label_pdf_exporter.h"

#include "logger.h"
#include "pdf_draw_commands.h"
#include "pdf_font_metrics.h"
#include "pdf_objects.h"
#include "pdf_writer.h"
#include "stringutils.h"

#include <algorithm>
#include <sstream>
#include <type_traits>
#include <variant>
#include <vector>

using namespace label_pdf_internal;

namespace {

const LabelColor kTextColor{0.0, 0.0, 0.0};

// A piece of text drawn with a single font and size.
struct Fragment {
  std::string encoded;
  double fontSize = 0.0;
  bool bold = false;
  double width = 0.0;
};

// Fragments between two whitespace gaps. Runs that touch without a space
// (a split part number) form one word.
struct Word {
  std::vector<Fragment> fragments;
  double width = 0.0;
  bool spaceBefore = false;
};

struct TextLine {
  std::vector<Fragment> fragments;
  double width = 0.0;
  double maxFontSize = 0.0;
  bool leadBold = false;

  void Append(Fragment fragment) {
    if (fragments.empty())
      leadBold = fragment.bold;
    width += fragment.width;
    maxFontSize = std::max(maxFontSize, fragment.fontSize);
    fragments.push_back(std::move(fragment));
  }
};

std::vector<Word> SplitWords(const std::vector<TextRun> &runs,
                             const PdfFontCatalog &fonts) {
  std::vector<Word> words;
  Word current;
  bool pendingSpace = false;

  auto flushFragment = [&](std::string &text, const TextRun &run) {
    if (text.empty())
      return;
    Fragment fragment;
    fragment.encoded = EncodeWinAnsi(text);
    fragment.fontSize = run.fontSize;
    fragment.bold = run.bold;
    fragment.width = MeasureTextWidth(fragment.encoded, run.fontSize,
                                      fonts.Resolve(run.bold));
    current.width += fragment.width;
    current.fragments.push_back(std::move(fragment));
    text.clear();
  };

  for (const auto &run : runs) {
    std::string text;
    for (char ch : run.text) {
      if (StringUtils::IsSpace(ch)) {
        flushFragment(text, run);
        if (!current.fragments.empty()) {
          words.push_back(std::move(current));
          current = Word{};
        }
        pendingSpace = true;
        continue;
      }
      if (current.fragments.empty() && text.empty()) {
        current.spaceBefore = pendingSpace && !words.empty();
        pendingSpace = false;
      }
      text.push_back(ch);
    }
    flushFragment(text, run);
  }
  if (!current.fragments.empty())
    words.push_back(std::move(current));
  return words;
}

// Greedy line filling. A word wider than the cell gets a line of its own.
std::vector<TextLine> BreakLines(const std::vector<Word> &words,
                                 double maxWidth, bool wrap,
                                 const PdfFontCatalog &fonts) {
  std::vector<TextLine> lines;
  TextLine line;
  for (const auto &word : words) {
    const Fragment &first = word.fragments.front();
    double space = 0.0;
    if (!line.fragments.empty() && word.spaceBefore)
      space = MeasureTextWidth(" ", first.fontSize, fonts.Resolve(first.bold));
    if (wrap && !line.fragments.empty() &&
        line.width + space + word.width > maxWidth) {
      lines.push_back(std::move(line));
      line = TextLine{};
      space = 0.0;
    }
    if (space > 0.0)
      line.Append({" ", first.fontSize, first.bold, space});
    for (const auto &fragment : word.fragments)
      line.Append(fragment);
  }
  if (!line.fragments.empty())
    lines.push_back(std::move(line));
  return lines;
}

class PageRenderer {
public:
  PageRenderer(const LabelPrintOptions &options, const PdfFontCatalog &fonts)
      : options_(options), fonts_(fonts), fmt_(3) {}

  // Returns false when the blocks run below the bottom margin.
  bool Render(const LabelPage &page) {
    const double frameWidth = options_.pageWidthPt - 2.0 * options_.marginPt;
    double cursor = options_.pageHeightPt - options_.marginPt;
    for (const auto &block : page.blocks) {
      for (const auto &element : block.elements) {
        std::visit(
            [&](auto &&e) {
              using T = std::decay_t<decltype(e)>;
              if constexpr (std::is_same_v<T, LabelTable>) {
                const double width = e.Width() * kPointsPerCm;
                const double x = options_.marginPt + (frameWidth - width) / 2.0;
                DrawTable(e, x, cursor);
                cursor -= e.Height() * kPointsPerCm;
              } else if constexpr (std::is_same_v<T, LabelSpacer>) {
                cursor -= e.height * kPointsPerCm;
              }
            },
            element);
      }
    }
    return cursor >= options_.marginPt - 1e-6;
  }

  std::string Content() const { return out_.str(); }

private:
  void DrawTable(const LabelTable &table, double x, double top) {
    std::vector<double> colX{x};
    for (double w : table.columnWidths)
      colX.push_back(colX.back() + w * kPointsPerCm);
    std::vector<double> rowY{top};
    for (double h : table.rowHeights)
      rowY.push_back(rowY.back() - h * kPointsPerCm);

    const size_t rows = std::min(table.rowHeights.size(), table.cells.size());
    // Backgrounds first so the grid and the text stay on top.
    for (size_t r = 0; r < rows; ++r) {
      const auto &cells = table.cells[r];
      for (size_t c = 0; c < cells.size() && c < table.columnWidths.size();
           ++c) {
        if (cells[c].background)
          AppendFilledRectangle(out_, cache_, fmt_, {colX[c], rowY[r + 1]},
                                colX[c + 1] - colX[c], rowY[r] - rowY[r + 1],
                                *cells[c].background);
      }
    }
    for (size_t r = 0; r < rows; ++r) {
      const auto &cells = table.cells[r];
      for (size_t c = 0; c < cells.size() && c < table.columnWidths.size();
           ++c)
        DrawCellText(cells[c], colX[c], rowY[r], colX[c + 1] - colX[c],
                     rowY[r] - rowY[r + 1]);
    }

    for (double y : rowY)
      AppendLine(out_, cache_, fmt_, {colX.front(), y}, {colX.back(), y},
                 table.gridColor, table.gridWidthPt);
    for (double cx : colX)
      AppendLine(out_, cache_, fmt_, {cx, rowY.front()}, {cx, rowY.back()},
                 table.gridColor, table.gridWidthPt);
  }

  void DrawCellText(const LabelCell &cell, double x, double top, double width,
                    double height) {
    const CellPadding &pad = cell.padding;
    const double innerWidth = width - pad.left - pad.right;
    const auto lines = BreakLines(SplitWords(cell.runs, fonts_), innerWidth,
                                  cell.wrap, fonts_);
    if (lines.empty())
      return;

    const double leading =
        cell.leadingPt > 0.0 ? cell.leadingPt : lines.front().maxFontSize * 1.2;
    const double firstAscent = fonts_.Resolve(lines.front().leadBold)
                                   ->Ascent(lines.front().maxFontSize);
    const double textHeight =
        (lines.size() + std::max(cell.trailingBreaks, 0)) * leading;
    const double contentHeight = std::max(
        textHeight, firstAscent + (lines.size() - 1) * leading);

    const double innerTop = top - pad.top;
    const double innerBottom = top - height + pad.bottom;
    double contentTop = innerTop;
    if (cell.vAlign == VerticalAlign::Middle)
      contentTop = innerBottom + (innerTop - innerBottom + contentHeight) / 2.0;
    else if (cell.vAlign == VerticalAlign::Bottom)
      contentTop = innerBottom + contentHeight;

    double baseline = contentTop - firstAscent;
    for (const auto &line : lines) {
      double lineX = x + pad.left;
      if (cell.hAlign == HorizontalAlign::Center)
        lineX += (innerWidth - line.width) / 2.0;
      else if (cell.hAlign == HorizontalAlign::Right)
        lineX += innerWidth - line.width;
      for (const auto &fragment : line.fragments) {
        AppendTextRun(out_, cache_, fmt_, {lineX, baseline}, fragment.encoded,
                      fragment.fontSize, *fonts_.Resolve(fragment.bold),
                      kTextColor);
        lineX += fragment.width;
      }
      baseline -= leading;
    }
  }

  const LabelPrintOptions &options_;
  const PdfFontCatalog &fonts_;
  FloatFormatter fmt_;
  GraphicsStateCache cache_;
  std::ostringstream out_;
};

} // namespace

LabelExportResult RenderLabelsToPdf(const LabelDocument &document,
                                    const LabelPrintOptions &options,
                                    std::string &pdfBytes) {
  LabelExportResult result;
  if (document.pages.empty()) {
    result.message = "The document has no labels to print.";
    return result;
  }
  if (options.pageWidthPt <= 2.0 * options.marginPt ||
      options.pageHeightPt <= 2.0 * options.marginPt) {
    result.message = "The page margins leave no room for labels.";
    return result;
  }

  std::vector<PdfObject> objects;

  PdfFontDefinition regularFont;
  regularFont.key = "F1";
  regularFont.baseName = "PartsLabelSans";
  PdfFontDefinition boldFont;
  boldFont.key = "F2";
  boldFont.baseName = "PartsLabelSansBold";

  bool regularMetricsLoaded = false;
  bool boldMetricsLoaded = false;
  if (options.embedFonts) {
    regularMetricsLoaded = LoadPdfFontMetrics(regularFont, false);
    boldMetricsLoaded = LoadPdfFontMetrics(boldFont, true);
    if (!boldMetricsLoaded && regularMetricsLoaded) {
      boldFont.metrics = regularFont.metrics;
      boldMetricsLoaded = true;
    }
    if (!regularMetricsLoaded)
      Logger::Instance().Info(
          "No TrueType sans face found, labels use Helvetica");
  }
  if (!regularMetricsLoaded || !AppendEmbeddedFontObjects(objects, regularFont))
    AppendFallbackType1Font(objects, regularFont, "Helvetica");
  if (!boldMetricsLoaded || !AppendEmbeddedFontObjects(objects, boldFont))
    AppendFallbackType1Font(objects, boldFont, "Helvetica-Bold");

  const PdfFontCatalog fonts{&regularFont, &boldFont};
  const std::string resources = "<< /Font << /F1 " +
                                std::to_string(regularFont.objectId) +
                                " 0 R /F2 " +
                                std::to_string(boldFont.objectId) +
                                " 0 R >> >>";

  const size_t pageCount = document.pages.size();
  const size_t firstPageObject = objects.size() + 1;
  const size_t pagesIndex = firstPageObject + 2 * pageCount;
  const size_t catalogIndex = pagesIndex + 1;
  const size_t infoIndex = catalogIndex + 1;
  const FloatFormatter formatter(2);

  std::ostringstream kids;
  bool compressionFailed = false;
  for (size_t i = 0; i < pageCount; ++i) {
    PageRenderer renderer(options, fonts);
    if (!renderer.Render(document.pages[i]))
      Logger::Instance().Warning("Labels on page " + std::to_string(i + 1) +
                                 " run into the bottom margin");
    const std::string content = renderer.Content();

    std::string compressed;
    bool deflated = false;
    if (options.compressStreams && !compressionFailed) {
      std::string error;
      deflated = PdfDeflater::Compress(content, compressed, error);
      if (!deflated) {
        compressionFailed = true;
        Logger::Instance().Warning("PDF compression disabled: " + error);
      }
    }
    objects.push_back(MakeStreamObject(deflated ? compressed : content,
                                       deflated));
    const size_t contentIndex = objects.size();

    std::ostringstream pageObj;
    pageObj << "<< /Type /Page /Parent " << pagesIndex
            << " 0 R /MediaBox [0 0 " << formatter.Format(options.pageWidthPt)
            << ' ' << formatter.Format(options.pageHeightPt) << "] /Contents "
            << contentIndex << " 0 R /Resources " << resources << " >>";
    objects.push_back({pageObj.str()});
    kids << (i ? " " : "") << objects.size() << " 0 R";
  }

  objects.push_back({"<< /Type /Pages /Kids [" + kids.str() + "] /Count " +
                     std::to_string(pageCount) + " >>"});
  objects.push_back({"<< /Type /Catalog /Pages " + std::to_string(pagesIndex) +
                     " 0 R >>"});
  objects.push_back({std::string("<< /Producer (PartsLabel) /Title (") +
                     (document.variant == LabelVariant::MultiplePart
                          ? "Multiple part labels"
                          : "Single part labels") +
                     ") >>"});

  pdfBytes = SerializePdfDocument(objects, catalogIndex, infoIndex);
  result.success = true;
  result.pageCount = pageCount;
  return result;
}

LabelExportResult ExportLabelsToPdf(const LabelDocument &document,
                                    const LabelPrintOptions &options,
                                    const std::filesystem::path &outputPath) {
  std::string bytes;
  LabelExportResult result = RenderLabelsToPdf(document, options, bytes);
  if (!result.success) {
    Logger::Instance().Error("PDF export failed: " + result.message);
    return result;
  }
  std::string error;
  if (!WritePdfFile(outputPath, bytes, error)) {
    result.success = false;
    result.message = error;
    Logger::Instance().Error("PDF export failed: " + error);
    return result;
  }
  result.message = outputPath.string();
  Logger::Instance().Info("Wrote " + std::to_string(result.pageCount) +
                          " page(s) to " + outputPath.string());
  return result;
}

std::string DefaultLabelFileName(LabelVariant variant) {
  return variant == LabelVariant::MultiplePart ? "multiplepart_labels.pdf"
                                               : "singlepart_labels.pdf";
}
