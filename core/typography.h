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
#include "labelstyle.h"

#include <string>

// Font size selection for label text. There is no text measurement here:
// sizes come from the text length so long values shrink into their fixed
// cells.
namespace Typography {

// Number of trailing characters of a part number printed large.
inline constexpr size_t kPartNumberSuffixLength = 5;
// Maximum description length kept by the bucketed rule before "..." is
// appended.
inline constexpr size_t kDescriptionMaxLength = 100;
inline constexpr const char *kEllipsis = "...";

struct PartNumberDirective {
  // Empty when the part number is short enough to print in one size.
  std::string prefix;
  std::string suffix;
  double prefixSize = 0.0;
  double suffixSize = 0.0;
  // Character index where the large suffix starts (0 when not split).
  size_t splitPoint = 0;

  bool IsSplit() const { return !prefix.empty(); }
};

struct DescriptionDirective {
  std::string text;
  double fontSize = 0.0;
  double leading = 0.0;
  bool truncated = false;
};

PartNumberDirective SelectPartNumber(const std::string &partNumber,
                                     const LabelStyle &style);

DescriptionDirective SelectDescription(const std::string &description,
                                       const LabelStyle &style);

// Bold runs for a part number cell (prefix small, suffix large).
std::vector<TextRun> PartNumberRuns(const PartNumberDirective &directive);

} // namespace Typography
