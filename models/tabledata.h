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

// Spreadsheet contents as loaded from a CSV or XLSX file. Column names are
// kept verbatim; every row holds its cells in column order.
struct TableData {
  std::vector<std::string> columns;
  std::vector<std::vector<std::string>> rows;

  // Cell text at the given position. Rows shorter than the header read the
  // missing cells as empty.
  const std::string &Cell(size_t row, size_t column) const {
    static const std::string empty;
    if (row >= rows.size() || column >= rows[row].size())
      return empty;
    return rows[row][column];
  }

  size_t RowCount() const { return rows.size(); }
  size_t ColumnCount() const { return columns.size(); }
};
