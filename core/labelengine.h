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

#include "columnresolver.h"
#include "labelblockbuilder.h"
#include "labeldocument.h"
#include "labelstyle.h"
#include "tabledata.h"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace LabelEngine {

// Rows sharing one raw location value, in order of appearance.
struct LocationGroup {
  std::string key;
  std::vector<size_t> rows;
};

struct SkippedGroup {
  std::string locationKey;
  std::string reason;
};

// Called before each group with its zero-based index, the number of groups
// and the group's location value.
using ProgressCallback = std::function<void(
    size_t index, size_t total, const std::string &locationKey)>;
// Receives the message of a skipped group, right after that group's
// progress call.
using DiagnosticCallback = std::function<void(const std::string &message)>;

// Builds the block of one group; LabelBlockBuilder::Build by default.
using BlockFactory = std::function<std::optional<LabelBlock>(
    const std::string &locationKey, const std::vector<PartRecord> &records,
    const LocationFields &location, const LabelStyle &style)>;

struct GenerationObserver {
  ProgressCallback progress;
  DiagnosticCallback diagnostic;
};

struct GenerationResult {
  // Absent when no group produced a block.
  std::optional<LabelDocument> document;
  ColumnResolver::ColumnSelection columns;
  size_t groupCount = 0;
  std::vector<SkippedGroup> skipped;

  bool HasDocument() const { return document.has_value(); }
};

// Group rows by exact equality of their location cell. Rows with an empty
// location cell belong to no group.
std::vector<LocationGroup> GroupByLocation(const TableData &table,
                                           size_t locationColumn);

PartRecord MakeRecord(const TableData &table, size_t row,
                      const ColumnResolver::ColumnSelection &columns);

// Lay out labels for every location group of the table. Groups that fail
// to build are skipped and reported; they never abort the run.
GenerationResult Generate(const TableData &table, const LabelStyle &style,
                          const GenerationObserver &observer = {},
                          const BlockFactory &buildBlock =
                              LabelBlockBuilder::Build);

} // namespace LabelEngine
