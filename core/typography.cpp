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
#include "typography.h"

#include "stringutils.h"

#include <array>

namespace {

struct LengthBucket {
  size_t maxLength;
  double fontSize;
};

// Description sizes of multiple part labels. Longer text falls through to
// kSmallestDescriptionSize.
constexpr std::array<LengthBucket, 4> kDescriptionBuckets = {{
    {30, 15.0},
    {50, 13.0},
    {70, 11.0},
    {90, 10.0},
}};
constexpr double kSmallestDescriptionSize = 9.0;
constexpr double kDescriptionLeadingExtra = 2.0;

} // namespace

namespace Typography {

PartNumberDirective SelectPartNumber(const std::string &partNumber,
                                     const LabelStyle &style) {
  PartNumberDirective directive;
  directive.prefixSize = style.partNumberSmallSize;
  directive.suffixSize = style.partNumberLargeSize;

  const size_t length = StringUtils::Utf8Length(partNumber);
  if (length > kPartNumberSuffixLength) {
    directive.splitPoint = length - kPartNumberSuffixLength;
    directive.prefix = StringUtils::Utf8Substr(partNumber, 0,
                                               directive.splitPoint);
    directive.suffix = StringUtils::Utf8Substr(partNumber,
                                               directive.splitPoint);
  } else {
    // Short numbers print whole at the small size.
    directive.suffix = partNumber;
    directive.suffixSize = style.partNumberSmallSize;
  }
  return directive;
}

DescriptionDirective SelectDescription(const std::string &description,
                                       const LabelStyle &style) {
  DescriptionDirective directive;
  directive.text = description;
  if (!style.bucketDescriptions) {
    directive.fontSize = style.descriptionFontSize;
    directive.leading = style.descriptionLeading;
    return directive;
  }

  const size_t length = StringUtils::Utf8Length(description);
  directive.fontSize = kSmallestDescriptionSize;
  for (const auto &bucket : kDescriptionBuckets) {
    if (length <= bucket.maxLength) {
      directive.fontSize = bucket.fontSize;
      break;
    }
  }
  if (length > kDescriptionMaxLength) {
    directive.text =
        StringUtils::Utf8Substr(description, 0, kDescriptionMaxLength) +
        kEllipsis;
    directive.truncated = true;
  }
  directive.leading = directive.fontSize + kDescriptionLeadingExtra;
  return directive;
}

std::vector<TextRun> PartNumberRuns(const PartNumberDirective &directive) {
  std::vector<TextRun> runs;
  if (directive.IsSplit())
    runs.push_back({directive.prefix, directive.prefixSize, true});
  runs.push_back({directive.suffix, directive.suffixSize, true});
  return runs;
}

} // namespace Typography
