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

#include <string>
#include <vector>

namespace ColumnResolver {

// Indices of the columns holding each label value, plus the upper-cased
// column names the heuristics matched against. Two or all three indices
// may point at the same column when the header gives nothing better.
struct ColumnSelection {
  size_t partNumber = 0;
  size_t description = 0;
  size_t location = 0;
  std::vector<std::string> upperNames;

  // False only when the table has no columns at all.
  bool Valid() const { return !upperNames.empty(); }

  const std::string &PartNumberName() const { return upperNames[partNumber]; }
  const std::string &DescriptionName() const {
    return upperNames[description];
  }
  const std::string &LocationName() const { return upperNames[location]; }

  // "Using columns: Part No: ..., Description: ..., Location: ..."
  std::string Describe() const;
};

// Infer part number, description and location columns from header names.
// Matching is done on upper-cased names; the first match wins and missing
// columns fall back to header position.
ColumnSelection Resolve(const std::vector<std::string> &columns);

} // namespace ColumnResolver
