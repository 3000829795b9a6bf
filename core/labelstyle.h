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
#include "partrecord.h"

#include <array>
#include <optional>
#include <string>

class UserPreferencesStore;

using LocationWeights = std::array<double, kLocationFieldCount>;

// Fonts, sizes and physical dimensions of one label variant. Built once per
// generation run and passed by const reference to everything that lays out
// a label.
struct LabelStyle {
  LabelVariant variant = LabelVariant::MultiplePart;

  // Table geometry (cm).
  double partColumnWidth = 4.0;
  double locationAreaWidth = 11.0;
  double partNumberRowHeight = 1.3;
  double descriptionRowHeight = 0.8;
  double locationRowHeight = 0.8;
  double tableGap = 0.3;
  double blockGap = 0.2;
  double gridWidthPt = 1.0;
  LocationWeights locationWeights{1.8, 2.7, 1.3, 1.3, 1.3, 1.3, 1.3};
  std::array<LabelColor, kLocationFieldCount> locationPalette{};

  // Typography (pt).
  double captionFontSize = 16.0;
  double locationCaptionFontSize = 16.0;
  double locationFieldFontSize = 14.0;
  double partNumberSmallSize = 17.0;
  double partNumberLargeSize = 22.0;
  double partNumberLeading = 20.0;
  int partNumberTrailingBreaks = 0;
  // Length-bucketed description sizes when true, fixed size otherwise.
  bool bucketDescriptions = true;
  double descriptionFontSize = 20.0;
  double descriptionLeading = 16.0;

  // Cell paddings (pt).
  CellPadding captionPadding{5.0, 5.0, 3.0, 3.0};
  CellPadding partNumberPadding{5.0, 5.0, 3.0, 3.0};
  CellPadding descriptionPadding{5.0, 5.0, 3.0, 3.0};
  CellPadding locationPadding{6.0, 6.0, 3.0, 3.0};
  HorizontalAlign partNumberAlign = HorizontalAlign::Left;
  VerticalAlign partNumberVAlign = VerticalAlign::Middle;

  // Built-in defaults of the given variant.
  static LabelStyle Defaults(LabelVariant variant);

  // Defaults with the layout tuning values stored in the preferences
  // applied on top. Invalid stored values are ignored.
  static LabelStyle FromPreferences(const UserPreferencesStore &prefs,
                                    LabelVariant variant);

  // Widths of the "Part Location" caption and the seven field cells.
  std::array<double, kLocationFieldCount + 1> LocationColumnWidths() const;
};

// Background of every location field cell, in field order.
std::array<LabelColor, kLocationFieldCount> DefaultLocationPalette();

LabelColor ColorFromHex(const std::string &hex);

// Parse "1.8,2.7,..." into seven positive weights.
std::optional<LocationWeights> ParseLocationWeights(const std::string &text);
std::string FormatLocationWeights(const LocationWeights &weights);

// Preference keys holding layout tuning values.
namespace LabelStyleKeys {
inline constexpr const char *PartColumnWidth = "part_column_width_cm";
inline constexpr const char *LocationAreaWidth = "location_area_width_cm";
const char *LocationWeights(LabelVariant variant);
} // namespace LabelStyleKeys
