#pragma once

#include "pdf_objects.h"

#include <filesystem>
#include <string>
#include <vector>

namespace label_pdf_internal {

// Serialize numbered objects (1-based, in vector order) with a cross
// reference table. infoObjectIndex may be 0 when there is no /Info entry.
std::string SerializePdfDocument(const std::vector<PdfObject> &objects,
                                 size_t catalogObjectIndex,
                                 size_t infoObjectIndex = 0);

bool WritePdfFile(const std::filesystem::path &outputPath,
                  const std::string &bytes, std::string &error);

} // namespace label_pdf_internal
