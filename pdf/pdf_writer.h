#pragma once

#include "conversionerror.h"
#include "pdf_objects.h"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace svgpdf {

// Serialized file plus the positions recorded in its cross-reference table.
struct SerializedPdf {
  std::string bytes;
  std::vector<size_t> objectOffsets; // index i holds object i + 1
  size_t xrefOffset = 0;
};

// Renders the table to the PDF 1.4 byte grammar: header, objects, xref
// table and trailer, joined by '\n' with no newline after %%EOF.
SerializedPdf SerializePdf(const PdfObjectTable &table);

// Builds the object table of a finalized document and serializes it.
ConversionResult SerializeDocument(const Document &document, SerializedPdf &out);

// Writes bytes to a temporary sibling of outputPath and renames it into
// place, so a failed write never replaces an existing file.
ConversionResult WritePdfDocument(const std::filesystem::path &outputPath,
                                  const std::string &bytes);

} // namespace svgpdf
