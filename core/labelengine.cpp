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
#include "labelengine.h"

#include "locationparser.h"
#include "logger.h"
#include "paginator.h"

#include <algorithm>
#include <exception>
#include <unordered_map>

namespace {

// Only the records a block can show are materialized.
size_t RecordsNeeded(LabelVariant variant) {
  return variant == LabelVariant::MultiplePart ? 2 : 1;
}

} // namespace

namespace LabelEngine {

std::vector<LocationGroup> GroupByLocation(const TableData &table,
                                           size_t locationColumn) {
  std::vector<LocationGroup> groups;
  std::unordered_map<std::string, size_t> indexByKey;
  for (size_t row = 0; row < table.RowCount(); ++row) {
    const std::string &key = table.Cell(row, locationColumn);
    if (key.empty())
      continue;
    auto [it, inserted] = indexByKey.emplace(key, groups.size());
    if (inserted)
      groups.push_back({key, {}});
    groups[it->second].rows.push_back(row);
  }
  return groups;
}

PartRecord MakeRecord(const TableData &table, size_t row,
                      const ColumnResolver::ColumnSelection &columns) {
  PartRecord record;
  record.partNumber = table.Cell(row, columns.partNumber);
  record.description = table.Cell(row, columns.description);
  record.locationRaw = table.Cell(row, columns.location);
  return record;
}

GenerationResult Generate(const TableData &table, const LabelStyle &style,
                          const GenerationObserver &observer,
                          const BlockFactory &buildBlock) {
  GenerationResult result;
  result.columns = ColumnResolver::Resolve(table.columns);
  if (!result.columns.Valid()) {
    Logger::Instance().Warning("Label generation: the table has no columns");
    return result;
  }
  Logger::Instance().Info(result.columns.Describe());

  const auto groups = GroupByLocation(table, result.columns.location);
  result.groupCount = groups.size();

  Paginator paginator;
  for (size_t i = 0; i < groups.size(); ++i) {
    const auto &group = groups[i];
    if (observer.progress)
      observer.progress(i, groups.size(), group.key);

    std::optional<LabelBlock> block;
    try {
      std::vector<PartRecord> records;
      const size_t count =
          std::min(group.rows.size(), RecordsNeeded(style.variant));
      records.reserve(count);
      for (size_t r = 0; r < count; ++r)
        records.push_back(MakeRecord(table, group.rows[r], result.columns));

      // Every record of a group shares the raw location, so the first one
      // speaks for the group.
      const LocationFields fields =
          LocationParser::Parse(records.empty() ? group.key
                                                : records.front().locationRaw);
      block = buildBlock(group.key, records, fields, style);
    } catch (const std::exception &ex) {
      const std::string message = "Error processing location " + group.key +
                                  ": " + ex.what();
      Logger::Instance().Warning(message);
      result.skipped.push_back({group.key, ex.what()});
      if (observer.diagnostic)
        observer.diagnostic(message);
      continue;
    }

    if (block)
      paginator.Add(std::move(*block));
  }

  if (paginator.Empty()) {
    Logger::Instance().Warning(
        "No labels were generated. Check that the file has the expected "
        "columns.");
    return result;
  }

  LabelDocument document;
  document.variant = style.variant;
  document.pages = paginator.TakePages();
  Logger::Instance().Info("Laid out " + std::to_string(document.BlockCount()) +
                          " label(s) on " +
                          std::to_string(document.pages.size()) +
                          " page(s), " + std::to_string(result.skipped.size()) +
                          " location(s) skipped");
  result.document = std::move(document);
  return result;
}

} // namespace LabelEngine
