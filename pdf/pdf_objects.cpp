#include "pdf_objects.h"

#include "pdf_document.h"
#include "pdf_graphics_encoder.h"

#include <sstream>

namespace svgpdf {

namespace {

constexpr const char *BUILTIN_FONT = "Helvetica";
constexpr const char *PRODUCER = "SvgPdf";

std::string CatalogBody(const PdfObjectTable &table) {
  std::ostringstream body;
  body << "<<\n/Type /Catalog\n/Pages " << table.NumberOf(PdfObjectKind::Pages)
       << " 0 R\n/Outlines " << table.NumberOf(PdfObjectKind::Outlines)
       << " 0 R\n>>";
  return body.str();
}

std::string PagesBody(const PdfObjectTable &table, size_t pageCount) {
  std::ostringstream body;
  body << "<<\n/Type /Pages\n/Count " << pageCount << "\n/Kids [\n";
  for (size_t i = 0; i < pageCount; ++i)
    body << table.NumberOf(PdfObjectKind::Page, i) << " 0 R\n";
  body << "]\n>>";
  return body.str();
}

std::string FontBody() {
  return std::string("<<\n/Type /Font\n/Subtype /Type1\n/BaseFont /") +
         BUILTIN_FONT + "\n/Name /" + kFontResourceName + "\n>>";
}

std::string PageBody(const PdfObjectTable &table, const Document &document,
                     size_t pageIndex) {
  FloatFormatter fmt(2);
  std::ostringstream body;
  body << "<<\n/Type /Page\n/Parent " << table.NumberOf(PdfObjectKind::Pages)
       << " 0 R\n/MediaBox [0 0 " << fmt.Format(document.PageWidth()) << ' '
       << fmt.Format(document.PageHeight()) << "]\n/Resources <<\n/Font <<\n/"
       << kFontResourceName << ' ' << table.NumberOf(PdfObjectKind::Font)
       << " 0 R\n>>\n>>\n/Contents "
       << table.NumberOf(PdfObjectKind::Contents, pageIndex) << " 0 R\n>>";
  return body.str();
}

// Length counts the bytes of the content only; the end-of-line before
// "endstream" is not part of the stream data.
std::string ContentsBody(const Page &page) {
  const std::string content = page.Content();
  std::ostringstream body;
  body << "<<\n/Length " << content.size() << "\n>>\nstream\n" << content
       << "\nendstream";
  return body.str();
}

std::string OutlinesBody() { return "<<\n/Type /Outlines\n/Count 0\n>>"; }

std::string InfoBody(const Document &document) {
  std::string body = std::string("<<\n/Producer (") + PRODUCER + ")\n";
  if (document.Title())
    body += "/Title (" + EscapePdfString(*document.Title()) + ")\n";
  body += ">>";
  return body;
}

} // namespace

int PdfObjectTable::NumberOf(PdfObjectKind kind, size_t pageIndex) const {
  const PdfObject *object = Find(kind, pageIndex);
  return object ? object->number : 0;
}

const PdfObject *PdfObjectTable::Find(PdfObjectKind kind,
                                      size_t pageIndex) const {
  const bool perPage =
      kind == PdfObjectKind::Page || kind == PdfObjectKind::Contents;
  for (const auto &object : objects_) {
    if (object.kind == kind && (!perPage || object.pageIndex == pageIndex))
      return &object;
  }
  return nullptr;
}

void PdfObjectTable::Add(PdfObjectKind kind, size_t pageIndex) {
  PdfObject object;
  object.kind = kind;
  object.pageIndex = pageIndex;
  objects_.push_back(std::move(object));
}

void PdfObjectTable::AssignNumbers() {
  for (size_t i = 0; i < objects_.size(); ++i)
    objects_[i].number = static_cast<int>(i) + 1;
}

ConversionResult BuildObjectTable(const Document &document,
                                  PdfObjectTable &table) {
  if (!document.IsFinalized())
    return ConversionResult::Fail(
        ConversionError::DocumentFinalized,
        "document must be finalized before it is serialized");

  PdfObjectTable built;
  const size_t pageCount = document.PageCount();

  // Emission order defines the numbering.
  built.Add(PdfObjectKind::Catalog);
  built.Add(PdfObjectKind::Pages);
  built.Add(PdfObjectKind::Font);
  for (size_t i = 0; i < pageCount; ++i) {
    built.Add(PdfObjectKind::Page, i);
    built.Add(PdfObjectKind::Contents, i);
  }
  built.Add(PdfObjectKind::Outlines);
  built.Add(PdfObjectKind::Info);
  built.AssignNumbers();

  for (auto &object : built.objects_) {
    switch (object.kind) {
    case PdfObjectKind::Catalog:
      object.body = CatalogBody(built);
      break;
    case PdfObjectKind::Pages:
      object.body = PagesBody(built, pageCount);
      break;
    case PdfObjectKind::Font:
      object.body = FontBody();
      break;
    case PdfObjectKind::Page:
      object.body = PageBody(built, document, object.pageIndex);
      break;
    case PdfObjectKind::Contents:
      object.body = ContentsBody(document.Pages()[object.pageIndex]);
      break;
    case PdfObjectKind::Outlines:
      object.body = OutlinesBody();
      break;
    case PdfObjectKind::Info:
      object.body = InfoBody(document);
      break;
    }
  }

  table = std::move(built);
  return ConversionResult::Ok();
}

} // namespace svgpdf
