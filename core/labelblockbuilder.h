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

#include <optional>
#include <string>
#include <vector>

namespace LabelBlockBuilder {

inline constexpr const char *kPartNumberCaption = "Part No";
inline constexpr const char *kDescriptionCaption = "Description";
inline constexpr const char *kLocationCaption = "Part Location";

// Build the block of one location group. The variant of the style decides
// the composition:
//   MultiplePart: the first two records (a lone record fills both rows),
//   SinglePart:   the first record only.
// Returns nothing for an empty group.
std::optional<LabelBlock> Build(const std::string &locationKey,
                                const std::vector<PartRecord> &records,
                                const LocationFields &location,
                                const LabelStyle &style);

// "Part No" / "Description" table of one record.
LabelTable BuildPartTable(const PartRecord &record, const LabelStyle &style);

// One-row "Part Location" strip with the seven colored field cells.
LabelTable BuildLocationStrip(const LocationFields &location,
                              const LabelStyle &style);

} // namespace LabelBlockBuilder
