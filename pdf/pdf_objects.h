#pragma once

#include "conversionerror.h"

#include <cstddef>
#include <string>
#include <vector>

namespace svgpdf {

class Document;

enum class PdfObjectKind { Catalog, Pages, Font, Page, Contents, Outlines, Info };

struct PdfObject {
  PdfObjectKind kind = PdfObjectKind::Catalog;
  size_t pageIndex = 0; // Page and Contents only
  int number = 0;
  std::string body;
};

// Objects of one document in emission order. Numbers are assigned from the
// position in the table, so they are contiguous from 1:
//
//   1 Catalog, 2 Pages, 3 Font,
//   4 + 2i Page i, 5 + 2i Contents i,
//   4 + 2N Outlines, 5 + 2N Info
//
// giving 5 + 2N objects and 5 + 2N + 1 cross-reference entries.
class PdfObjectTable {
public:
  const std::vector<PdfObject> &Objects() const { return objects_; }
  size_t Size() const { return objects_.size(); }
  size_t XrefEntryCount() const { return objects_.size() + 1; }

  // Number of the object of that kind (and page), 0 if absent
  int NumberOf(PdfObjectKind kind, size_t pageIndex = 0) const;
  const PdfObject *Find(PdfObjectKind kind, size_t pageIndex = 0) const;

private:
  friend ConversionResult BuildObjectTable(const Document &document,
                                           PdfObjectTable &table);

  void Add(PdfObjectKind kind, size_t pageIndex = 0);
  void AssignNumbers();

  std::vector<PdfObject> objects_;
};

// Lays out, numbers and fills every object of a finalized document.
// Fails with DocumentFinalized when the document is still open.
ConversionResult BuildObjectTable(const Document &document,
                                  PdfObjectTable &table);

} // namespace svgpdf
