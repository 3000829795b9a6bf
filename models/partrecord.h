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

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

inline constexpr size_t kLocationFieldCount = 7;

// Positional fields of a location code (site, rack, aisle...). Empty
// strings mark absent fields.
using LocationFields = std::array<std::string, kLocationFieldCount>;

// One inventory row reduced to the three values a label shows.
struct PartRecord {
  std::string partNumber;
  std::string description;
  std::string locationRaw;
};

// Block composition rule set.
//   MultiplePart ("v1"): two part rows share one location strip.
//   SinglePart   ("v2"): one large part row per location strip.
enum class LabelVariant { MultiplePart = 0, SinglePart = 1 };

inline const char *VariantId(LabelVariant variant) {
  return variant == LabelVariant::SinglePart ? "v2" : "v1";
}

inline std::optional<LabelVariant> ParseVariantId(std::string_view id) {
  if (id == "v1")
    return LabelVariant::MultiplePart;
  if (id == "v2")
    return LabelVariant::SinglePart;
  return std::nullopt;
}
