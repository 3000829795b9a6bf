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
#include "tableloader.h"

#include "logger.h"
#include "stringutils.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

// TinyXML2
#include <tinyxml2.h>

// wxWidgets zip support
#include <wx/log.h>
#include <wx/wfstream.h>
class wxZipStreamLink;
#include <wx/zipstrm.h>

namespace fs = std::filesystem;

namespace {

using Row = std::vector<std::string>;

bool IsBlankRow(const Row &row) {
  return std::all_of(row.begin(), row.end(),
                     [](const std::string &cell) { return cell.empty(); });
}

// Header row plus data rows into a table. Empty header cells get a
// generated name; cells past the header width are dropped.
void BuildTable(std::vector<Row> rows, TableData &table) {
  table = TableData{};
  auto firstRow = std::find_if(rows.begin(), rows.end(),
                               [](const Row &row) { return !IsBlankRow(row); });
  if (firstRow == rows.end())
    return;

  table.columns = *firstRow;
  while (!table.columns.empty() && table.columns.back().empty())
    table.columns.pop_back();
  for (size_t i = 0; i < table.columns.size(); ++i)
    if (table.columns[i].empty())
      table.columns[i] = TableLoader::UnnamedColumn(i);

  for (auto it = firstRow + 1; it != rows.end(); ++it) {
    if (IsBlankRow(*it))
      continue;
    Row row = std::move(*it);
    row.resize(table.columns.size());
    table.rows.push_back(std::move(row));
  }
}

std::string LowerExtension(const std::string &path) {
  std::string ext = fs::path(path).extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return ext;
}

// --- XLSX helpers ---

bool ReadZipEntries(const std::string &path,
                    std::unordered_map<std::string, std::string> &entries,
                    std::string &error) {
  wxLogNull logNo;
  wxFileInputStream input(wxString::FromUTF8(path.c_str()));
  if (!input.IsOk()) {
    error = "Unable to open " + path;
    return false;
  }
  wxZipInputStream zipStream(input);
  if (!zipStream.IsOk()) {
    error = "The file is not a valid XLSX workbook.";
    return false;
  }
  std::unique_ptr<wxZipEntry> entry;
  while ((entry.reset(zipStream.GetNextEntry())), entry) {
    if (entry->IsDir())
      continue;
    std::string name = entry->GetName(wxPATH_UNIX).ToStdString();
    if (name.rfind("xl/", 0) != 0)
      continue;
    std::string data;
    char buffer[4096];
    while (true) {
      zipStream.Read(buffer, sizeof(buffer));
      size_t bytes = zipStream.LastRead();
      if (bytes == 0)
        break;
      data.append(buffer, bytes);
    }
    entries[name] = std::move(data);
  }
  if (entries.empty()) {
    error = "The file is not a valid XLSX workbook.";
    return false;
  }
  return true;
}

const char *NamespacedAttribute(const tinyxml2::XMLElement *element,
                                const char *localName) {
  const std::string suffix = std::string(":") + localName;
  for (const tinyxml2::XMLAttribute *attr = element->FirstAttribute(); attr;
       attr = attr->Next()) {
    std::string name = attr->Name();
    if (name.size() > suffix.size() &&
        name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0)
      return attr->Value();
  }
  return nullptr;
}

// Concatenated <t> text of a string item, skipping phonetic runs.
std::string CollectText(const tinyxml2::XMLElement *element) {
  std::string text;
  for (const tinyxml2::XMLElement *child = element->FirstChildElement(); child;
       child = child->NextSiblingElement()) {
    const std::string name = child->Name();
    if (name == "t") {
      if (const char *value = child->GetText())
        text += value;
    } else if (name == "r") {
      text += CollectText(child);
    }
  }
  return text;
}

std::vector<std::string> ParseSharedStrings(const std::string &xml) {
  std::vector<std::string> strings;
  tinyxml2::XMLDocument doc;
  if (doc.Parse(xml.data(), xml.size()) != tinyxml2::XML_SUCCESS)
    return strings;
  const tinyxml2::XMLElement *sst = doc.FirstChildElement("sst");
  if (!sst)
    return strings;
  for (const tinyxml2::XMLElement *si = sst->FirstChildElement("si"); si;
       si = si->NextSiblingElement("si"))
    strings.push_back(CollectText(si));
  return strings;
}

// Path inside the archive of the first worksheet listed in the workbook.
std::string FirstSheetPath(
    const std::unordered_map<std::string, std::string> &entries) {
  const std::string fallback = "xl/worksheets/sheet1.xml";
  auto workbookIt = entries.find("xl/workbook.xml");
  auto relsIt = entries.find("xl/_rels/workbook.xml.rels");
  if (workbookIt == entries.end() || relsIt == entries.end())
    return fallback;

  tinyxml2::XMLDocument workbook;
  if (workbook.Parse(workbookIt->second.data(), workbookIt->second.size()) !=
      tinyxml2::XML_SUCCESS)
    return fallback;
  const tinyxml2::XMLElement *root = workbook.FirstChildElement("workbook");
  const tinyxml2::XMLElement *sheets =
      root ? root->FirstChildElement("sheets") : nullptr;
  const tinyxml2::XMLElement *sheet =
      sheets ? sheets->FirstChildElement("sheet") : nullptr;
  const char *relId = sheet ? NamespacedAttribute(sheet, "id") : nullptr;
  if (!relId)
    return fallback;

  tinyxml2::XMLDocument rels;
  if (rels.Parse(relsIt->second.data(), relsIt->second.size()) !=
      tinyxml2::XML_SUCCESS)
    return fallback;
  const tinyxml2::XMLElement *relRoot =
      rels.FirstChildElement("Relationships");
  if (!relRoot)
    return fallback;
  for (const tinyxml2::XMLElement *rel =
           relRoot->FirstChildElement("Relationship");
       rel; rel = rel->NextSiblingElement("Relationship")) {
    const char *id = rel->Attribute("Id");
    const char *target = rel->Attribute("Target");
    if (!id || !target || std::string(id) != relId)
      continue;
    std::string path = target;
    if (!path.empty() && path[0] == '/')
      return path.substr(1);
    return "xl/" + path;
  }
  return fallback;
}

// Worksheets end at column XFD.
constexpr size_t kMaxColumns = 16384;

// Zero-based column of a cell reference such as "AB12". References past the
// last worksheet column come back as kMaxColumns.
std::optional<size_t> ColumnFromReference(const char *ref) {
  if (!ref)
    return std::nullopt;
  size_t column = 0;
  bool any = false;
  for (const char *p = ref; *p && std::isalpha(static_cast<unsigned char>(*p));
       ++p) {
    column = column * 26 +
             (std::toupper(static_cast<unsigned char>(*p)) - 'A' + 1);
    any = true;
    if (column > kMaxColumns)
      return kMaxColumns;
  }
  if (!any)
    return std::nullopt;
  return column - 1;
}

std::string CellText(const tinyxml2::XMLElement *cell,
                     const std::vector<std::string> &sharedStrings) {
  const char *typeAttr = cell->Attribute("t");
  const std::string type = typeAttr ? typeAttr : "n";
  if (type == "inlineStr") {
    const tinyxml2::XMLElement *is = cell->FirstChildElement("is");
    return is ? CollectText(is) : std::string();
  }
  const tinyxml2::XMLElement *v = cell->FirstChildElement("v");
  const char *raw = v ? v->GetText() : nullptr;
  if (!raw)
    return {};
  if (type == "s") {
    char *end = nullptr;
    unsigned long index = std::strtoul(raw, &end, 10);
    if (end == raw || index >= sharedStrings.size())
      return {};
    return sharedStrings[index];
  }
  if (type == "b")
    return std::string(raw) == "1" ? "True" : "False";
  return raw;
}

} // namespace

namespace TableLoader {

std::string UnnamedColumn(size_t index) {
  return "Unnamed: " + std::to_string(index);
}

bool ParseCsv(std::istream &in, TableData &table, std::string &error) {
  std::string data((std::istreambuf_iterator<char>(in)),
                   std::istreambuf_iterator<char>());
  if (data.compare(0, 3, "\xEF\xBB\xBF") == 0)
    data.erase(0, 3);

  std::vector<Row> rows;
  Row row;
  std::string cell;
  bool inQuotes = false;
  bool cellQuoted = false;
  size_t line = 1;
  size_t quoteLine = 0;

  auto endCell = [&]() {
    row.push_back(cell);
    cell.clear();
    cellQuoted = false;
  };
  auto endRow = [&]() {
    endCell();
    rows.push_back(std::move(row));
    row.clear();
  };

  for (size_t i = 0; i < data.size(); ++i) {
    const char c = data[i];
    if (inQuotes) {
      if (c == '"') {
        if (i + 1 < data.size() && data[i + 1] == '"') {
          cell.push_back('"');
          ++i;
        } else {
          inQuotes = false;
        }
      } else {
        if (c == '\n')
          ++line;
        cell.push_back(c);
      }
      continue;
    }
    switch (c) {
    case '"':
      if (StringUtils::Trim(cell).empty()) {
        cell.clear();
        inQuotes = true;
        cellQuoted = true;
        quoteLine = line;
      } else {
        cell.push_back(c);
      }
      break;
    case ',':
      endCell();
      break;
    case '\r':
      if (i + 1 < data.size() && data[i + 1] == '\n')
        ++i;
      endRow();
      ++line;
      break;
    case '\n':
      endRow();
      ++line;
      break;
    default:
      cell.push_back(c);
      break;
    }
  }
  if (inQuotes) {
    error = "Unterminated quoted field starting on line " +
            std::to_string(quoteLine) + ".";
    return false;
  }
  if (!cell.empty() || cellQuoted || !row.empty())
    endRow();

  BuildTable(std::move(rows), table);
  if (table.columns.empty()) {
    error = "The file has no header row.";
    return false;
  }
  return true;
}

bool LoadCsv(const std::string &path, TableData &table, std::string &error) {
  std::ifstream file(fs::u8path(path), std::ios::binary);
  if (!file.is_open()) {
    error = "Unable to open " + path;
    return false;
  }
  return ParseCsv(file, table, error);
}

bool LoadXlsx(const std::string &path, TableData &table, std::string &error) {
  std::unordered_map<std::string, std::string> entries;
  if (!ReadZipEntries(path, entries, error))
    return false;

  std::vector<std::string> sharedStrings;
  auto sstIt = entries.find("xl/sharedStrings.xml");
  if (sstIt != entries.end())
    sharedStrings = ParseSharedStrings(sstIt->second);

  const std::string sheetPath = FirstSheetPath(entries);
  auto sheetIt = entries.find(sheetPath);
  if (sheetIt == entries.end()) {
    error = "The workbook has no worksheet (" + sheetPath + " missing).";
    return false;
  }

  tinyxml2::XMLDocument doc;
  if (doc.Parse(sheetIt->second.data(), sheetIt->second.size()) !=
      tinyxml2::XML_SUCCESS) {
    error = std::string("Failed to parse worksheet: ") + doc.ErrorStr();
    return false;
  }
  const tinyxml2::XMLElement *worksheet = doc.FirstChildElement("worksheet");
  const tinyxml2::XMLElement *sheetData =
      worksheet ? worksheet->FirstChildElement("sheetData") : nullptr;
  if (!sheetData) {
    error = "The worksheet has no data.";
    return false;
  }

  // Rows keyed by their 1-based number so gaps in the sheet are kept in
  // order; blank rows are dropped later anyway.
  std::map<long, Row> sheetRows;
  long nextRow = 1;
  for (const tinyxml2::XMLElement *rowElem =
           sheetData->FirstChildElement("row");
       rowElem; rowElem = rowElem->NextSiblingElement("row")) {
    long rowNumber = rowElem->IntAttribute("r", static_cast<int>(nextRow));
    nextRow = rowNumber + 1;
    Row &row = sheetRows[rowNumber];
    size_t nextColumn = 0;
    for (const tinyxml2::XMLElement *cell = rowElem->FirstChildElement("c");
         cell; cell = cell->NextSiblingElement("c")) {
      size_t column =
          ColumnFromReference(cell->Attribute("r")).value_or(nextColumn);
      if (column >= kMaxColumns) {
        const char *ref = cell->Attribute("r");
        error = "Cell " + std::string(ref ? ref : "without reference") +
                " lies beyond the last worksheet column (XFD).";
        return false;
      }
      nextColumn = column + 1;
      if (row.size() <= column)
        row.resize(column + 1);
      row[column] = CellText(cell, sharedStrings);
    }
  }

  std::vector<Row> rows;
  rows.reserve(sheetRows.size());
  for (auto &entry : sheetRows)
    rows.push_back(std::move(entry.second));
  BuildTable(std::move(rows), table);
  if (table.columns.empty()) {
    error = "The worksheet has no header row.";
    return false;
  }
  return true;
}

bool LoadFile(const std::string &path, TableData &table, std::string &error) {
  const std::string ext = LowerExtension(path);
  bool ok = false;
  if (ext == ".csv") {
    ok = LoadCsv(path, table, error);
  } else if (ext == ".xlsx" || ext == ".xlsm") {
    ok = LoadXlsx(path, table, error);
  } else if (ext == ".xls") {
    error = "Legacy .xls workbooks are not supported; save the file as .xlsx "
            "or .csv.";
  } else {
    error = "Unsupported file type: " + (ext.empty() ? path : ext);
  }
  if (ok)
    Logger::Instance().Info("Loaded " + path + ": " +
                            std::to_string(table.RowCount()) + " rows, " +
                            std::to_string(table.ColumnCount()) + " columns");
  else
    Logger::Instance().Error("Failed to load " + path + ": " + error);
  return ok;
}

} // namespace TableLoader
