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
#pragma once

#include "labeldocument.h"

#include <filesystem>
#include <string>

// Paper and encoding options for the label PDF. A4 portrait with one inch
// margins is the default.
struct LabelPrintOptions {
  double pageWidthPt = 595.28;  // 210 mm in PostScript points
  double pageHeightPt = 841.89; // 297 mm in PostScript points
  double marginPt = 72.0;
  bool compressStreams = true;
  // Embed a system TrueType face when one is found; Helvetica otherwise.
  bool embedFonts = true;
};

struct LabelExportResult {
  bool success = false;
  std::string message;
  size_t pageCount = 0;
};

constexpr double kPointsPerCm = 72.0 / 2.54;

// Build the PDF bytes of a laid out document. Every page of the document
// becomes one PDF page with its blocks stacked from the top margin down and
// centered horizontally.
LabelExportResult RenderLabelsToPdf(const LabelDocument &document,
                                    const LabelPrintOptions &options,
                                    std::string &pdfBytes);

LabelExportResult ExportLabelsToPdf(const LabelDocument &document,
                                    const LabelPrintOptions &options,
                                    const std::filesystem::path &outputPath);

// Suggested output file name for a label variant.
std::string DefaultLabelFileName(LabelVariant variant);
