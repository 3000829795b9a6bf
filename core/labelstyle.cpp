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
#include "labelstyle.h"

#include "configservices.h"
#include "stringutils.h"

#include <cmath>
#include <cstdlib>
#include <sstream>

namespace {

constexpr std::array<const char *, kLocationFieldCount> kPaletteHex = {
    "#E9967A", "#ADD8E6", "#90EE90", "#FFD700",
    "#ADD8E6", "#E9967A", "#90EE90"};

int HexDigit(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

} // namespace

LabelColor ColorFromHex(const std::string &hex) {
  std::string digits = hex;
  if (!digits.empty() && digits[0] == '#')
    digits.erase(0, 1);
  if (digits.size() != 6)
    return {};
  double channels[3] = {0.0, 0.0, 0.0};
  for (int i = 0; i < 3; ++i) {
    int hi = HexDigit(digits[i * 2]);
    int lo = HexDigit(digits[i * 2 + 1]);
    if (hi < 0 || lo < 0)
      return {};
    channels[i] = (hi * 16 + lo) / 255.0;
  }
  return {channels[0], channels[1], channels[2]};
}

std::array<LabelColor, kLocationFieldCount> DefaultLocationPalette() {
  std::array<LabelColor, kLocationFieldCount> palette{};
  for (size_t i = 0; i < palette.size(); ++i)
    palette[i] = ColorFromHex(kPaletteHex[i]);
  return palette;
}

std::optional<LocationWeights> ParseLocationWeights(const std::string &text) {
  LocationWeights weights{};
  size_t count = 0;
  std::stringstream ss(text);
  std::string item;
  while (std::getline(ss, item, ',')) {
    std::string trimmed = StringUtils::Trim(item);
    if (trimmed.empty() || count >= weights.size())
      return std::nullopt;
    char *end = nullptr;
    double value = std::strtod(trimmed.c_str(), &end);
    if (end != trimmed.c_str() + trimmed.size() || !std::isfinite(value) ||
        value <= 0.0)
      return std::nullopt;
    weights[count++] = value;
  }
  if (count != weights.size())
    return std::nullopt;
  return weights;
}

std::string FormatLocationWeights(const LocationWeights &weights) {
  std::ostringstream out;
  for (size_t i = 0; i < weights.size(); ++i) {
    if (i > 0)
      out << ',';
    out << weights[i];
  }
  return out.str();
}

const char *LabelStyleKeys::LocationWeights(LabelVariant variant) {
  return variant == LabelVariant::SinglePart ? "v2_location_weights"
                                             : "v1_location_weights";
}

LabelStyle LabelStyle::Defaults(LabelVariant variant) {
  LabelStyle style;
  style.variant = variant;
  style.locationPalette = DefaultLocationPalette();
  if (variant == LabelVariant::MultiplePart)
    return style;

  // Single part labels trade the second part row for a taller one with
  // larger type.
  style.partNumberRowHeight = 1.9;
  style.descriptionRowHeight = 2.1;
  style.locationRowHeight = 0.9;
  style.locationWeights = {1.7, 2.9, 1.3, 1.2, 1.3, 1.3, 1.3};
  style.locationFieldFontSize = 16.0;
  style.partNumberSmallSize = 34.0;
  style.partNumberLargeSize = 40.0;
  style.partNumberLeading = 12.0;
  style.partNumberTrailingBreaks = 2;
  style.bucketDescriptions = false;
  style.partNumberPadding = {5.0, 5.0, 10.0, 5.0};
  style.descriptionPadding = {5.0, 5.0, 3.0, 3.0};
  style.captionPadding = {5.0, 5.0, 3.0, 3.0};
  style.partNumberVAlign = VerticalAlign::Top;
  return style;
}

LabelStyle LabelStyle::FromPreferences(const UserPreferencesStore &prefs,
                                       LabelVariant variant) {
  LabelStyle style = Defaults(variant);
  const float partWidth = prefs.GetFloat(LabelStyleKeys::PartColumnWidth);
  if (partWidth > 0.0f)
    style.partColumnWidth = partWidth;
  const float areaWidth = prefs.GetFloat(LabelStyleKeys::LocationAreaWidth);
  if (areaWidth > 0.0f)
    style.locationAreaWidth = areaWidth;
  if (auto raw = prefs.GetValue(LabelStyleKeys::LocationWeights(variant))) {
    if (auto weights = ParseLocationWeights(*raw))
      style.locationWeights = *weights;
  }
  return style;
}

std::array<double, kLocationFieldCount + 1>
LabelStyle::LocationColumnWidths() const {
  std::array<double, kLocationFieldCount + 1> widths{};
  widths[0] = partColumnWidth;
  double total = 0.0;
  for (double w : locationWeights)
    total += w;
  for (size_t i = 0; i < locationWeights.size(); ++i)
    widths[i + 1] =
        total > 0.0 ? locationWeights[i] * locationAreaWidth / total : 0.0;
  return widths;
}
