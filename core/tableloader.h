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

#include "tabledata.h"

#include <istream>
#include <string>

// Reads part lists from disk. The first row of a file is the header; rows
// with no content at all are skipped. Cell text is kept verbatim, no type
// conversion is applied.
namespace TableLoader {

// Parse comma separated text with RFC 4180 quoting. A UTF-8 byte order
// mark in front of the header is dropped.
bool ParseCsv(std::istream &in, TableData &table, std::string &error);
bool LoadCsv(const std::string &path, TableData &table, std::string &error);

// Read the first worksheet of an Office Open XML workbook.
bool LoadXlsx(const std::string &path, TableData &table, std::string &error);

// Dispatch on the file extension (.csv or .xlsx).
bool LoadFile(const std::string &path, TableData &table, std::string &error);

// Header text used for columns whose header cell is empty.
std::string UnnamedColumn(size_t index);

} // namespace TableLoader
