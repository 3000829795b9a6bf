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
#include "columnresolver.h"

#include "stringutils.h"

#include <functional>
#include <optional>

namespace {

bool Contains(const std::string &haystack, const char *needle) {
  return haystack.find(needle) != std::string::npos;
}

std::optional<size_t>
FindFirst(const std::vector<std::string> &names,
          const std::function<bool(const std::string &)> &match) {
  for (size_t i = 0; i < names.size(); ++i)
    if (match(names[i]))
      return i;
  return std::nullopt;
}

} // namespace

namespace ColumnResolver {

std::string ColumnSelection::Describe() const {
  if (!Valid())
    return "Using columns: none (the file has no header)";
  return "Using columns: Part No: " + PartNumberName() +
         ", Description: " + DescriptionName() +
         ", Location: " + LocationName();
}

ColumnSelection Resolve(const std::vector<std::string> &columns) {
  ColumnSelection selection;
  selection.upperNames.reserve(columns.size());
  for (const auto &name : columns)
    selection.upperNames.push_back(StringUtils::ToUpperCopy(name));
  const auto &names = selection.upperNames;
  if (names.empty())
    return selection;

  auto partNumber = FindFirst(names, [](const std::string &n) {
    return Contains(n, "PART") &&
           (Contains(n, "NO") || Contains(n, "NUM") || Contains(n, "#"));
  });
  if (!partNumber)
    partNumber = FindFirst(names, [](const std::string &n) {
      return n == "PARTNO" || n == "PART";
    });
  selection.partNumber = partNumber.value_or(0);

  auto description = FindFirst(
      names, [](const std::string &n) { return Contains(n, "DESC"); });
  if (description)
    selection.description = *description;
  else
    selection.description = names.size() > 1 ? 1 : selection.partNumber;

  auto location = FindFirst(names, [](const std::string &n) {
    return Contains(n, "LOC") || Contains(n, "POS");
  });
  if (location)
    selection.location = *location;
  else
    selection.location = names.size() > 2 ? 2 : selection.description;

  return selection;
}

} // namespace ColumnResolver
