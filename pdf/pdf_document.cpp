#include "pdf_document.h"

namespace svgpdf {

std::string Page::Content() const {
  std::string content;
  for (size_t i = 0; i < lines.size(); ++i) {
    if (i > 0)
      content += '\n';
    content += lines[i];
  }
  return content;
}

Document::Document(const DocumentOptions &options)
    : mapping_(MakeMapping(options.pageWidth, options.pageHeight,
                           kDefaultSvgWidth, kDefaultSvgHeight)),
      layout_(options.pageWidth, options.maxColumns, options.maxRows),
      fontName_(options.fontName), fontSize_(options.fontSize) {}

void Document::SetSourceSize(double svgWidth, double svgHeight) {
  mapping_ = MakeMapping(mapping_.pageWidth, mapping_.pageHeight, svgWidth,
                         svgHeight);
}

ConversionResult Document::AddPage() {
  if (state_ == DocumentState::Finalized)
    return ConversionResult::Fail(ConversionError::DocumentFinalized,
                                  "cannot add a page to a finalized document");
  Page page;
  page.number = static_cast<int>(pages_.size()) + 1;
  pages_.push_back(std::move(page));
  state_ = DocumentState::HasPages;
  return ConversionResult::Ok();
}

ConversionResult Document::CheckAppend(const char *what) const {
  if (state_ == DocumentState::Finalized)
    return ConversionResult::Fail(ConversionError::DocumentFinalized,
                                  std::string("cannot append ") + what +
                                      " to a finalized document");
  if (pages_.empty())
    return ConversionResult::Fail(ConversionError::NoActivePage,
                                  std::string("cannot append ") + what +
                                      ": no page has been started");
  return ConversionResult::Ok();
}

ConversionResult Document::AppendRectangle(const SvgRect &rect) {
  ConversionResult check = CheckAppend("a rectangle");
  if (!check.success)
    return check;
  layout_.AddColumn();
  svgpdf::AppendRectangle(pages_.back().lines, fmt_, mapping_, rect);
  return check;
}

ConversionResult Document::AppendText(const SvgText &text) {
  ConversionResult check = CheckAppend("text");
  if (!check.success)
    return check;
  layout_.AddColumn();
  svgpdf::AppendText(pages_.back().lines, fmt_, mapping_, text, fontSize_);
  return check;
}

ConversionResult Document::AppendGradient(const SvgLinearGradient &) {
  ConversionResult check = CheckAppend("a gradient");
  if (!check.success)
    return check;
  AppendGradientPlaceholder(pages_.back().lines, fmt_);
  return check;
}

void Document::Finalize() { state_ = DocumentState::Finalized; }

} // namespace svgpdf
