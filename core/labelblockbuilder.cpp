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
#include "labelblockbuilder.h"

#include "typography.h"

namespace {

LabelCell CaptionCell(const std::string &text, double fontSize,
                      const CellPadding &padding, VerticalAlign vAlign) {
  LabelCell cell;
  cell.runs.push_back({text, fontSize, false});
  cell.leadingPt = fontSize * 1.2;
  cell.hAlign = HorizontalAlign::Center;
  cell.vAlign = vAlign;
  cell.padding = padding;
  return cell;
}

LabelCell PartNumberCell(const std::string &partNumber,
                         const LabelStyle &style) {
  const auto directive = Typography::SelectPartNumber(partNumber, style);
  LabelCell cell;
  cell.runs = Typography::PartNumberRuns(directive);
  cell.leadingPt = style.partNumberLeading;
  cell.wrap = true;
  cell.trailingBreaks = style.partNumberTrailingBreaks;
  cell.hAlign = style.partNumberAlign;
  cell.vAlign = style.partNumberVAlign;
  cell.padding = style.partNumberPadding;
  return cell;
}

LabelCell DescriptionCell(const std::string &description,
                          const LabelStyle &style) {
  const auto directive = Typography::SelectDescription(description, style);
  LabelCell cell;
  cell.runs.push_back({directive.text, directive.fontSize, false});
  cell.leadingPt = directive.leading;
  cell.wrap = true;
  cell.hAlign = HorizontalAlign::Left;
  cell.vAlign = VerticalAlign::Middle;
  cell.padding = style.descriptionPadding;
  return cell;
}

} // namespace

namespace LabelBlockBuilder {

LabelTable BuildPartTable(const PartRecord &record, const LabelStyle &style) {
  LabelTable table;
  table.columnWidths = {style.partColumnWidth, style.locationAreaWidth};
  table.rowHeights = {style.partNumberRowHeight, style.descriptionRowHeight};
  table.gridWidthPt = style.gridWidthPt;
  table.cells = {
      {CaptionCell(kPartNumberCaption, style.captionFontSize,
                   style.captionPadding, VerticalAlign::Middle),
       PartNumberCell(record.partNumber, style)},
      {CaptionCell(kDescriptionCaption, style.captionFontSize,
                   style.captionPadding, VerticalAlign::Middle),
       DescriptionCell(record.description, style)},
  };
  return table;
}

LabelTable BuildLocationStrip(const LocationFields &location,
                              const LabelStyle &style) {
  LabelTable table;
  const auto widths = style.LocationColumnWidths();
  table.columnWidths.assign(widths.begin(), widths.end());
  table.rowHeights = {style.locationRowHeight};
  table.gridWidthPt = style.gridWidthPt;

  std::vector<LabelCell> row;
  row.reserve(kLocationFieldCount + 1);
  row.push_back(CaptionCell(kLocationCaption, style.locationCaptionFontSize,
                            style.locationPadding, VerticalAlign::Top));
  for (size_t i = 0; i < location.size(); ++i) {
    LabelCell cell =
        CaptionCell(location[i], style.locationFieldFontSize,
                    style.locationPadding, VerticalAlign::Top);
    // Colors are positional so empty fields keep their segment color.
    cell.background = style.locationPalette[i];
    row.push_back(std::move(cell));
  }
  table.cells.push_back(std::move(row));
  return table;
}

std::optional<LabelBlock> Build(const std::string &locationKey,
                                const std::vector<PartRecord> &records,
                                const LocationFields &location,
                                const LabelStyle &style) {
  if (records.empty())
    return std::nullopt;

  LabelBlock block;
  block.variant = style.variant;
  block.locationKey = locationKey;
  block.location = location;

  if (style.variant == LabelVariant::MultiplePart) {
    block.parts.push_back(records[0]);
    block.parts.push_back(records.size() > 1 ? records[1] : records[0]);
    block.elements.push_back(BuildPartTable(block.parts[0], style));
    block.elements.push_back(LabelSpacer{style.tableGap});
    block.elements.push_back(BuildPartTable(block.parts[1], style));
  } else {
    block.parts.push_back(records[0]);
    block.elements.push_back(BuildPartTable(block.parts[0], style));
    block.elements.push_back(LabelSpacer{style.tableGap});
  }
  block.elements.push_back(BuildLocationStrip(location, style));
  block.elements.push_back(LabelSpacer{style.blockGap});
  return block;
}

} // namespace LabelBlockBuilder
