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

#include "partrecord.h"

#include <optional>
#include <string>
#include <variant>
#include <vector>

// Render-ready description of a label document. Lengths are centimetres
// unless the member name says otherwise; font sizes are points.

struct LabelColor {
  double r = 0.0;
  double g = 0.0;
  double b = 0.0;
};

enum class HorizontalAlign { Left, Center, Right };
enum class VerticalAlign { Top, Middle, Bottom };

struct TextRun {
  std::string text;
  double fontSize = 10.0;
  bool bold = false;
};

struct CellPadding {
  double left = 6.0;
  double right = 6.0;
  double top = 3.0;
  double bottom = 3.0;
};

// A table cell. Plain cells hold a single run drawn on one line; wrapped
// cells flow their runs across as many lines as the cell width needs.
struct LabelCell {
  std::vector<TextRun> runs;
  double leadingPt = 12.0;
  bool wrap = false;
  // Empty lines appended after the text (part number cells of single part
  // labels reserve room below the number this way).
  int trailingBreaks = 0;
  HorizontalAlign hAlign = HorizontalAlign::Left;
  VerticalAlign vAlign = VerticalAlign::Top;
  CellPadding padding;
  std::optional<LabelColor> background;

  std::string Text() const {
    std::string out;
    for (const auto &run : runs)
      out += run.text;
    return out;
  }
};

struct LabelTable {
  std::vector<double> columnWidths;
  std::vector<double> rowHeights;
  std::vector<std::vector<LabelCell>> cells;
  double gridWidthPt = 1.0;
  LabelColor gridColor{};

  double Width() const {
    double total = 0.0;
    for (double w : columnWidths)
      total += w;
    return total;
  }

  double Height() const {
    double total = 0.0;
    for (double h : rowHeights)
      total += h;
    return total;
  }
};

struct LabelSpacer {
  double height = 0.0;
};

using BlockElement = std::variant<LabelTable, LabelSpacer>;

// One printable unit: the part rows of a location group plus its location
// strip, in drawing order.
struct LabelBlock {
  LabelVariant variant = LabelVariant::MultiplePart;
  std::string locationKey;
  std::vector<PartRecord> parts;
  LocationFields location;
  std::vector<BlockElement> elements;

  double Height() const {
    double total = 0.0;
    for (const auto &element : elements) {
      if (const auto *table = std::get_if<LabelTable>(&element))
        total += table->Height();
      else if (const auto *spacer = std::get_if<LabelSpacer>(&element))
        total += spacer->height;
    }
    return total;
  }
};

struct LabelPage {
  std::vector<LabelBlock> blocks;
};

struct LabelDocument {
  LabelVariant variant = LabelVariant::MultiplePart;
  std::vector<LabelPage> pages;

  size_t BlockCount() const {
    size_t count = 0;
    for (const auto &page : pages)
      count += page.blocks.size();
    return count;
  }
};
