#include "label_pdf_exporter.h"
#include "labelengine.h"
#include "logger.h"

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

TableData MakeTable(size_t groups) {
  TableData table;
  table.columns = {"Part No", "Description", "Location"};
  for (size_t i = 0; i < groups; ++i) {
    const std::string loc = "L" + std::to_string(i) + "_B C";
    table.rows.push_back({"PN" + std::to_string(i) + "0001", "First", loc});
    table.rows.push_back({"PN" + std::to_string(i) + "0002", "Second", loc});
  }
  return table;
}

} // namespace

int main() {
  Logger::Instance().SetEchoToStderr(false);

  const LabelStyle v1 = LabelStyle::Defaults(LabelVariant::MultiplePart);
  const LabelStyle v2 = LabelStyle::Defaults(LabelVariant::SinglePart);

  // Groups follow the first appearance of each location; empty locations
  // are left out.
  {
    TableData table;
    table.columns = {"Part No", "Description", "Location"};
    table.rows = {{"P1", "d", "Z9"},
                  {"P2", "d", "A1"},
                  {"P3", "d", ""},
                  {"P4", "d", "Z9"}};
    const auto groups = LabelEngine::GroupByLocation(table, 2);
    if (groups.size() != 2 || groups[0].key != "Z9" || groups[1].key != "A1" ||
        groups[0].rows != std::vector<size_t>{0, 3}) {
      std::cerr << "GroupByLocation produced unexpected groups\n";
      return 1;
    }
  }

  // Nine groups paginate as 4, 4, 1 and report progress for each group.
  {
    std::vector<std::string> seen;
    size_t lastTotal = 0;
    LabelEngine::GenerationObserver observer;
    observer.progress = [&](size_t index, size_t total,
                            const std::string &key) {
      if (index != seen.size())
        throw std::logic_error("progress index out of order");
      seen.push_back(key);
      lastTotal = total;
    };
    const auto result = LabelEngine::Generate(MakeTable(9), v1, observer);
    if (!result.HasDocument() || result.groupCount != 9 ||
        !result.skipped.empty()) {
      std::cerr << "Generation of nine groups failed\n";
      return 1;
    }
    const auto &pages = result.document->pages;
    if (pages.size() != 3 || pages[0].blocks.size() != 4 ||
        pages[1].blocks.size() != 4 || pages[2].blocks.size() != 1) {
      std::cerr << "Unexpected page layout\n";
      return 1;
    }
    if (seen.size() != 9 || lastTotal != 9 || seen[0] != "L0_B C" ||
        pages[0].blocks[0].locationKey != "L0_B C" ||
        pages[2].blocks[0].locationKey != "L8_B C") {
      std::cerr << "Progress or block order is wrong\n";
      return 1;
    }
    const auto &first = pages[0].blocks[0];
    if (first.parts.size() != 2 || first.parts[1].partNumber != "PN00002" ||
        first.location[0] != "L0" || first.location[1] != "B" ||
        first.location[2] != "C") {
      std::cerr << "First block content is wrong\n";
      return 1;
    }
  }

  // Single part labels use only the first record of a group.
  {
    const auto result = LabelEngine::Generate(MakeTable(2), v2);
    if (!result.HasDocument() || result.document->BlockCount() != 2 ||
        result.document->pages[0].blocks[0].parts.size() != 1 ||
        result.document->pages[0].blocks[0].parts[0].partNumber != "PN00001") {
      std::cerr << "Single part generation is wrong\n";
      return 1;
    }
  }

  // No rows: no document.
  {
    TableData table;
    table.columns = {"Part No", "Description", "Location"};
    const auto result = LabelEngine::Generate(table, v1);
    if (result.HasDocument() || result.groupCount != 0) {
      std::cerr << "Empty input produced a document\n";
      return 1;
    }
  }

  // No columns at all: no document either.
  {
    const auto result = LabelEngine::Generate(TableData{}, v1);
    if (result.HasDocument()) {
      std::cerr << "Header-less input produced a document\n";
      return 1;
    }
  }

  // A failing group is skipped, reported, and the run carries on.
  {
    std::vector<std::string> diagnostics;
    std::vector<std::string> events;
    LabelEngine::GenerationObserver observer;
    observer.progress = [&](size_t, size_t, const std::string &key) {
      events.push_back("progress " + key);
    };
    observer.diagnostic = [&](const std::string &message) {
      diagnostics.push_back(message);
      events.push_back("diagnostic");
    };
    auto failing = [](const std::string &key,
                      const std::vector<PartRecord> &records,
                      const LocationFields &location,
                      const LabelStyle &style) -> std::optional<LabelBlock> {
      if (key == "L1_B C")
        throw std::runtime_error("bad cell");
      return LabelBlockBuilder::Build(key, records, location, style);
    };
    const auto result =
        LabelEngine::Generate(MakeTable(3), v1, observer, failing);
    if (!result.HasDocument() || result.document->BlockCount() != 2 ||
        result.skipped.size() != 1 || result.skipped[0].locationKey != "L1_B C" ||
        result.skipped[0].reason != "bad cell" || diagnostics.size() != 1 ||
        diagnostics[0].find("L1_B C") == std::string::npos) {
      std::cerr << "Failing group was not skipped correctly\n";
      return 1;
    }
    // The skip message follows the failing group's progress call.
    const std::vector<std::string> expected = {
        "progress L0_B C", "progress L1_B C", "diagnostic",
        "progress L2_B C"};
    if (events != expected) {
      std::cerr << "Progress and diagnostics arrived out of order\n";
      return 1;
    }
  }

  // Every group failing leaves no document.
  {
    auto alwaysFails = [](const std::string &, const std::vector<PartRecord> &,
                          const LocationFields &,
                          const LabelStyle &) -> std::optional<LabelBlock> {
      throw std::runtime_error("broken");
    };
    const auto result =
        LabelEngine::Generate(MakeTable(2), v1, {}, alwaysFails);
    if (result.HasDocument() || result.skipped.size() != 2) {
      std::cerr << "All-failing run produced a document\n";
      return 1;
    }
  }

  // Same input, same bytes.
  {
    LabelPrintOptions options;
    options.compressStreams = false;
    const TableData table = MakeTable(5);
    std::string first, second;
    const auto a = LabelEngine::Generate(table, v1);
    const auto b = LabelEngine::Generate(table, v1);
    if (!a.HasDocument() || !b.HasDocument() ||
        !RenderLabelsToPdf(*a.document, options, first).success ||
        !RenderLabelsToPdf(*b.document, options, second).success ||
        first != second) {
      std::cerr << "Generation is not repeatable\n";
      return 1;
    }
  }

  return 0;
}
