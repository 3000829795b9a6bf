#include "pdf_writer.h"

#include <fstream>
#include <iomanip>
#include <sstream>

namespace label_pdf_internal {

std::string SerializePdfDocument(const std::vector<PdfObject> &objects,
                                 size_t catalogObjectIndex,
                                 size_t infoObjectIndex) {
  std::ostringstream out;
  // The comment line after the header marks the file as binary.
  out << "%PDF-1.4\n%\xE2\xE3\xCF\xD3\n";
  std::vector<std::streamoff> offsets;
  offsets.reserve(objects.size());
  for (size_t i = 0; i < objects.size(); ++i) {
    offsets.push_back(static_cast<std::streamoff>(out.tellp()));
    out << (i + 1) << " 0 obj\n" << objects[i].body << "\nendobj\n";
  }

  const std::streamoff xrefPos = static_cast<std::streamoff>(out.tellp());
  out << "xref\n0 " << (objects.size() + 1) << "\n0000000000 65535 f \n";
  for (std::streamoff off : offsets)
    out << std::setw(10) << std::setfill('0') << off << " 00000 n \n";

  out << "trailer\n<< /Size " << (objects.size() + 1) << " /Root "
      << catalogObjectIndex << " 0 R";
  if (infoObjectIndex != 0)
    out << " /Info " << infoObjectIndex << " 0 R";
  out << " >>\nstartxref\n" << xrefPos << "\n%%EOF\n";
  return out.str();
}

bool WritePdfFile(const std::filesystem::path &outputPath,
                  const std::string &bytes, std::string &error) {
  std::ofstream file(outputPath, std::ios::binary | std::ios::trunc);
  if (!file.is_open()) {
    error = "Unable to open the destination file for writing.";
    return false;
  }
  file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  file.close();
  if (!file) {
    error = "Failed to write " + outputPath.string();
    return false;
  }
  return true;
}

} // namespace label_pdf_internal
