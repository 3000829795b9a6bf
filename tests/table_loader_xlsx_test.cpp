#include <cassert>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include <wx/init.h>
#include <wx/wfstream.h>
#include <wx/zipstrm.h>

#include "logger.h"
#include "tableloader.h"

namespace fs = std::filesystem;

namespace {

const char *kWorkbook =
    R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>
<workbook xmlns="http://schemas.openxmlformats.org/spreadsheetml/2006/main"
 xmlns:r="http://schemas.openxmlformats.org/officeDocument/2006/relationships">
 <sheets>
  <sheet name="Parts" sheetId="1" r:id="rId7"/>
  <sheet name="Other" sheetId="2" r:id="rId1"/>
 </sheets>
</workbook>)";

const char *kWorkbookRels =
    R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>
<Relationships xmlns="http://schemas.openxmlformats.org/package/2006/relationships">
 <Relationship Id="rId1" Type="http://schemas.openxmlformats.org/officeDocument/2006/relationships/worksheet" Target="worksheets/sheet1.xml"/>
 <Relationship Id="rId7" Type="http://schemas.openxmlformats.org/officeDocument/2006/relationships/worksheet" Target="worksheets/parts.xml"/>
</Relationships>)";

const char *kSharedStrings =
    R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>
<sst xmlns="http://schemas.openxmlformats.org/spreadsheetml/2006/main" count="6" uniqueCount="6">
 <si><t>Part No</t></si>
 <si><t>Description</t></si>
 <si><t>Location</t></si>
 <si><r><t>Hex </t></r><r><rPr><b/></rPr><t>bolt</t></r></si>
 <si><t>A1_B2 C3</t></si>
 <si><t xml:space="preserve"> padded </t></si>
</sst>)";

const char *kPartsSheet =
    R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>
<worksheet xmlns="http://schemas.openxmlformats.org/spreadsheetml/2006/main">
 <sheetData>
  <row r="1"><c r="A1" t="s"><v>0</v></c><c r="B1" t="s"><v>1</v></c><c r="C1" t="s"><v>2</v></c></row>
  <row r="2"><c r="A2" t="inlineStr"><is><t>AB12345</t></is></c><c r="B2" t="s"><v>3</v></c><c r="C2" t="s"><v>4</v></c></row>
  <row r="4"><c r="A4"><v>4711</v></c><c r="C4" t="s"><v>5</v></c></row>
  <row r="5"><c r="A5" t="b"><v>1</v></c><c r="B5" t="str"><v>formula text</v></c><c r="C5" t="s"><v>4</v></c></row>
 </sheetData>
</worksheet>)";

const char *kOtherSheet =
    R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>
<worksheet xmlns="http://schemas.openxmlformats.org/spreadsheetml/2006/main">
 <sheetData><row r="1"><c r="A1" t="inlineStr"><is><t>Wrong sheet</t></is></c></row></sheetData>
</worksheet>)";

const char *kFarColumnSheet =
    R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>
<worksheet xmlns="http://schemas.openxmlformats.org/spreadsheetml/2006/main">
 <sheetData><row r="1"><c r="A1" t="inlineStr"><is><t>Part No</t></is></c><c r="ZZZZZZZ1" t="inlineStr"><is><t>far</t></is></c></row></sheetData>
</worksheet>)";

const char *kLastColumnSheet =
    R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>
<worksheet xmlns="http://schemas.openxmlformats.org/spreadsheetml/2006/main">
 <sheetData><row r="1"><c r="A1" t="inlineStr"><is><t>Part No</t></is></c><c r="XFD1" t="inlineStr"><is><t>Last</t></is></c></row></sheetData>
</worksheet>)";

bool WriteWorkbook(const fs::path &path,
                   const std::vector<std::pair<std::string, std::string>> &files) {
  wxFileOutputStream output(wxString::FromUTF8(path.string().c_str()));
  if (!output.IsOk())
    return false;
  wxZipOutputStream zip(output);
  for (const auto &[name, data] : files) {
    auto *entry = new wxZipEntry(name);
    entry->SetMethod(wxZIP_METHOD_DEFLATE);
    zip.PutNextEntry(entry);
    zip.Write(data.c_str(), data.size());
    zip.CloseEntry();
  }
  return zip.Close() && output.Close();
}

} // namespace

int main() {
  wxInitializer initializer;
  assert(initializer.IsOk());
  Logger::Instance().SetEchoToStderr(false);

  const fs::path path = fs::temp_directory_path() / "partslabel_loader_test.xlsx";
  assert(WriteWorkbook(path, {{"xl/workbook.xml", kWorkbook},
                              {"xl/_rels/workbook.xml.rels", kWorkbookRels},
                              {"xl/sharedStrings.xml", kSharedStrings},
                              {"xl/worksheets/parts.xml", kPartsSheet},
                              {"xl/worksheets/sheet1.xml", kOtherSheet}}));

  TableData table;
  std::string error;
  assert(TableLoader::LoadFile(path.string(), table, error));
  assert(table.columns.size() == 3);
  assert(table.columns[0] == "Part No");
  assert(table.columns[2] == "Location");
  assert(table.RowCount() == 3);

  assert(table.Cell(0, 0) == "AB12345");
  assert(table.Cell(0, 1) == "Hex bolt");
  assert(table.Cell(0, 2) == "A1_B2 C3");

  // Missing B4 stays empty, numbers keep their stored text.
  assert(table.Cell(1, 0) == "4711");
  assert(table.Cell(1, 1).empty());
  assert(table.Cell(1, 2) == " padded ");

  assert(table.Cell(2, 0) == "True");
  assert(table.Cell(2, 1) == "formula text");

  // Without workbook metadata the first worksheet file is used.
  assert(WriteWorkbook(path, {{"xl/worksheets/sheet1.xml", kOtherSheet}}));
  assert(TableLoader::LoadXlsx(path.string(), table, error));
  assert(table.columns.size() == 1 && table.columns[0] == "Wrong sheet");
  assert(table.RowCount() == 0);

  // Column XFD is the last one a worksheet can hold; anything past it is an
  // error, not an allocation of billions of cells.
  assert(WriteWorkbook(path, {{"xl/worksheets/sheet1.xml", kLastColumnSheet}}));
  assert(TableLoader::LoadXlsx(path.string(), table, error));
  assert(table.columns.size() == 16384);
  assert(table.columns[16383] == "Last");
  assert(table.columns[1] == "Unnamed: 1");

  error.clear();
  assert(WriteWorkbook(path, {{"xl/worksheets/sheet1.xml", kFarColumnSheet}}));
  assert(!TableLoader::LoadFile(path.string(), table, error));
  assert(error.find("ZZZZZZZ1") != std::string::npos);

  // A zip without a worksheet is rejected.
  assert(WriteWorkbook(path, {{"xl/styles.xml", "<styleSheet/>"}}));
  assert(!TableLoader::LoadXlsx(path.string(), table, error));
  assert(!error.empty());

  std::error_code ec;
  fs::remove(path, ec);
  return 0;
}
