#pragma once

#include "conversionerror.h"
#include "geometry.h"
#include "layout_tracker.h"
#include "pdf_graphics_encoder.h"
#include "svgdocument.h"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace svgpdf {

enum class DocumentState { Empty, HasPages, Finalized };

// One page of output: the operator lines of its content stream.
struct Page {
  int number = 0;
  std::vector<std::string> lines;

  // Content stream body, lines joined by '\n'
  std::string Content() const;
};

struct DocumentOptions {
  double pageWidth = 595.0;
  double pageHeight = 842.0;
  int maxColumns = 3;
  int maxRows = 10;
  std::string fontName = "Helvetica";
  double fontSize = 12.0;
};

// In-memory PDF being built for one conversion run.
//
// Empty -> HasPages -> Finalized. Elements always go to the last page and
// require one to exist; nothing can be added once finalized.
class Document {
public:
  explicit Document(const DocumentOptions &options = {});

  // Derives the scale factors from the source canvas size.
  void SetSourceSize(double svgWidth, double svgHeight);

  ConversionResult AddPage();
  ConversionResult AppendRectangle(const SvgRect &rect);
  ConversionResult AppendText(const SvgText &text);
  ConversionResult AppendGradient(const SvgLinearGradient &gradient);

  // Closes the document for mutation. Calling it again has no effect.
  void Finalize();

  DocumentState State() const { return state_; }
  bool IsFinalized() const { return state_ == DocumentState::Finalized; }

  const std::vector<Page> &Pages() const { return pages_; }
  size_t PageCount() const { return pages_.size(); }

  const Mapping &GetMapping() const { return mapping_; }
  double PageWidth() const { return mapping_.pageWidth; }
  double PageHeight() const { return mapping_.pageHeight; }
  double ScaleX() const { return mapping_.scaleX; }
  double ScaleY() const { return mapping_.scaleY; }

  const LayoutTracker &Layout() const { return layout_; }
  const std::string &FontName() const { return fontName_; }
  double FontSize() const { return fontSize_; }

  void SetTitle(std::string title) { title_ = std::move(title); }
  const std::optional<std::string> &Title() const { return title_; }

private:
  ConversionResult CheckAppend(const char *what) const;

  Mapping mapping_;
  LayoutTracker layout_;
  FloatFormatter fmt_{2};
  std::string fontName_;
  double fontSize_;
  std::optional<std::string> title_;
  std::vector<Page> pages_;
  DocumentState state_ = DocumentState::Empty;
};

} // namespace svgpdf
