#pragma once

#include "ConversionSettings.h"
#include "conversionerror.h"
#include "pdf_document.h"
#include "svgdocument.h"

#include <filesystem>

namespace svgpdf {

DocumentOptions MakeDocumentOptions(const print::ConversionSettings &settings);

// Drives one conversion run. Every converted SVG becomes one page of the
// same document; Save() finalizes it and writes the file once.
class SvgPdfConverter {
public:
  explicit SvgPdfConverter(const print::ConversionSettings &settings);

  // Decodes the SVG file and appends it as a new page.
  ConversionResult ConvertFile(const std::filesystem::path &svgPath);

  // Appends an already decoded SVG as a new page: gradients first, then
  // rectangles, then texts. Paths are skipped.
  ConversionResult ConvertDocument(const SvgDocument &svg);

  // Finalizes the document, serializes it and writes it to pdfPath.
  ConversionResult Save(const std::filesystem::path &pdfPath);

  const Document &GetDocument() const { return document_; }

private:
  ConversionResult Report(ConversionResult result) const;

  Document document_;
};

// Convenience wrapper for the single-file case.
ConversionResult ConvertSvgToPdf(const std::filesystem::path &svgPath,
                                 const std::filesystem::path &pdfPath,
                                 const print::ConversionSettings &settings);

} // namespace svgpdf
