#include "logger.h"
#include "tableloader.h"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

int main() {
  Logger::Instance().SetEchoToStderr(false);

  {
    std::istringstream in("\xEF\xBB\xBFPart No,Description,Location\r\n"
                          "AB12345,\"Bolt, hex \"\"M8\"\"\",A1_B2\r\n"
                          "\r\n"
                          ",,\n"
                          "CD9,\"two\nlines\",C3\n"
                          "EF1,short\n");
    TableData table;
    std::string error;
    if (!TableLoader::ParseCsv(in, table, error)) {
      std::cerr << "ParseCsv failed: " << error << "\n";
      return 1;
    }
    if (table.columns.size() != 3 || table.columns[0] != "Part No" ||
        table.columns[2] != "Location") {
      std::cerr << "Header was not read correctly\n";
      return 1;
    }
    if (table.RowCount() != 3) {
      std::cerr << "Expected 3 data rows, got " << table.RowCount() << "\n";
      return 1;
    }
    if (table.Cell(0, 1) != "Bolt, hex \"M8\"" || table.Cell(0, 2) != "A1_B2" ||
        table.Cell(1, 1) != "two\nlines" || table.Cell(2, 1) != "short" ||
        !table.Cell(2, 2).empty()) {
      std::cerr << "Cell values are wrong\n";
      return 1;
    }
  }

  // Empty header cells get generated names.
  {
    std::istringstream in("Part,,Loc\n1,2,3\n");
    TableData table;
    std::string error;
    if (!TableLoader::ParseCsv(in, table, error) ||
        table.columns[1] != TableLoader::UnnamedColumn(1) ||
        table.columns[1] != "Unnamed: 1") {
      std::cerr << "Unnamed column handling failed\n";
      return 1;
    }
  }

  {
    std::istringstream in("a,b\n\"open,2\n");
    TableData table;
    std::string error;
    if (TableLoader::ParseCsv(in, table, error) || error.empty()) {
      std::cerr << "Unterminated quote was accepted\n";
      return 1;
    }
  }

  {
    std::istringstream in("");
    TableData table;
    std::string error;
    if (TableLoader::ParseCsv(in, table, error)) {
      std::cerr << "Empty input was accepted\n";
      return 1;
    }
  }

  // File dispatch.
  {
    const std::filesystem::path csvPath =
        std::filesystem::temp_directory_path() / "partslabel_loader_test.csv";
    {
      std::ofstream out(csvPath, std::ios::binary);
      out << "Part No,Description,Location\nX1,Y,Z\n";
    }
    TableData table;
    std::string error;
    if (!TableLoader::LoadFile(csvPath.string(), table, error) ||
        table.RowCount() != 1 || table.Cell(0, 0) != "X1") {
      std::cerr << "LoadFile failed for CSV: " << error << "\n";
      return 1;
    }
    std::error_code ec;
    std::filesystem::remove(csvPath, ec);

    if (TableLoader::LoadFile("parts.xls", table, error) ||
        error.find(".xls") == std::string::npos) {
      std::cerr << "Legacy .xls was not rejected\n";
      return 1;
    }
    if (TableLoader::LoadFile("missing_file.csv", table, error)) {
      std::cerr << "Missing file was accepted\n";
      return 1;
    }
  }

  return 0;
}
