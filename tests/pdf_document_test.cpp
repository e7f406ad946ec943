#include "pdf_document.h"
#include "pdf_objects.h"

#include <cassert>

using namespace svgpdf;

int main() {
  Document doc;
  assert(doc.State() == DocumentState::Empty);
  assert(doc.PageCount() == 0);
  assert(doc.ScaleX() == 595.0 / 400.0);
  assert(doc.ScaleY() == 842.0 / 150.0);

  // Elements need a page.
  ConversionResult r = doc.AppendRectangle(SvgRect{0, 0, 10, 10});
  assert(!r.success && r.error == ConversionError::NoActivePage);
  r = doc.AppendText(SvgText{0, 0, "x"});
  assert(!r.success && r.error == ConversionError::NoActivePage);
  r = doc.AppendGradient(SvgLinearGradient{});
  assert(!r.success && r.error == ConversionError::NoActivePage);
  assert(doc.Layout().CurrentX() == 0.0);

  assert(doc.AddPage().success);
  assert(doc.State() == DocumentState::HasPages);
  assert(doc.Pages()[0].number == 1);
  assert(doc.Pages()[0].lines.empty());
  assert(doc.Pages()[0].Content().empty());

  assert(doc.AppendGradient(SvgLinearGradient{}).success);
  assert(doc.AppendRectangle(SvgRect{0, 0, 10, 10}).success);
  assert(doc.Layout().CurrentX() == 150.0);
  assert(doc.Pages()[0].lines.size() == 3 + 7);

  // Elements go to the last page only.
  assert(doc.AddPage().success);
  assert(doc.Pages()[1].number == 2);
  assert(doc.AppendText(SvgText{1, 1, "hello"}).success);
  assert(doc.Pages()[0].lines.size() == 10);
  assert(doc.Pages()[1].lines.size() == 5);
  assert(doc.Pages()[1].Content() ==
         doc.Pages()[1].lines[0] + "\n" + doc.Pages()[1].lines[1] + "\n" +
             doc.Pages()[1].lines[2] + "\n" + doc.Pages()[1].lines[3] +
             "\n" + doc.Pages()[1].lines[4]);

  // Serialization requires a finalized document.
  PdfObjectTable table;
  r = BuildObjectTable(doc, table);
  assert(!r.success && r.error == ConversionError::DocumentFinalized);

  doc.Finalize();
  doc.Finalize();
  assert(doc.State() == DocumentState::Finalized);

  r = doc.AddPage();
  assert(!r.success && r.error == ConversionError::DocumentFinalized);
  r = doc.AppendRectangle(SvgRect{});
  assert(!r.success && r.error == ConversionError::DocumentFinalized);
  r = doc.AppendText(SvgText{});
  assert(!r.success && r.error == ConversionError::DocumentFinalized);
  r = doc.AppendGradient(SvgLinearGradient{});
  assert(!r.success && r.error == ConversionError::DocumentFinalized);
  assert(doc.PageCount() == 2);

  assert(BuildObjectTable(doc, table).success);

  // An empty document can be finalized too.
  Document empty;
  empty.Finalize();
  assert(BuildObjectTable(empty, table).success);
  assert(table.Size() == 5);

  // Configured font size reaches the text operator.
  DocumentOptions options;
  options.fontSize = 9.5;
  Document sized(options);
  assert(sized.AddPage().success);
  assert(sized.AppendText(SvgText{0, 0, "t"}).success);
  assert(sized.Pages()[0].lines[1] == "/F1 9.50 Tf");

  return 0;
}
