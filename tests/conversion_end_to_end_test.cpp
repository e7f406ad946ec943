#include "ConversionSettings.h"
#include "logger.h"
#include "svg_pdf_converter.h"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

using namespace svgpdf;
namespace fs = std::filesystem;

static std::string ReadAll(const fs::path &path) {
  std::ifstream in(path, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(in)),
                     std::istreambuf_iterator<char>());
}

static size_t CountOccurrences(const std::string &haystack,
                               const std::string &needle) {
  size_t count = 0;
  for (size_t pos = haystack.find(needle); pos != std::string::npos;
       pos = haystack.find(needle, pos + needle.size()))
    ++count;
  return count;
}

static void WriteFile(const fs::path &path, const std::string &text) {
  std::ofstream out(path, std::ios::binary);
  out << text;
}

int main() {
  Logger::Instance().SetEchoToStderr(false);

  const fs::path dir = fs::temp_directory_path() / "svgpdf_end_to_end_test";
  std::error_code ec;
  fs::remove_all(dir, ec);
  fs::create_directories(dir);

  print::ConversionSettings settings;

  // One rectangle and one text on a 400x150 canvas.
  {
    const fs::path svg = dir / "scene.svg";
    const fs::path pdf = dir / "scene.pdf";
    WriteFile(svg, R"(<svg xmlns="http://www.w3.org/2000/svg" width="400" height="150">
  <rect x="0" y="0" width="100" height="50"/>
  <text x="10" y="10">Hi(there)</text>
</svg>)");

    ConversionResult r = ConvertSvgToPdf(svg, pdf, settings);
    assert(r.success);
    const std::string bytes = ReadAll(pdf);

    assert(bytes.find("/Count 1\n") != std::string::npos);
    assert(CountOccurrences(bytes, "/Type /Page\n") == 1);

    // The rectangle hugs the top edge after the flip.
    assert(bytes.find("0.00 842.00 m\n148.75 842.00 l\n148.75 561.33 l\n"
                      "0.00 561.33 l\nh\n0 0 0 RG\nS") != std::string::npos);
    assert(CountOccurrences(bytes, "\nS\n") == 1);

    assert(CountOccurrences(bytes, "\nBT\n") == 1);
    assert(CountOccurrences(bytes, "(Hi\\(there\\)) Tj") == 1);
    assert(bytes.find("/F1 12.00 Tf") != std::string::npos);

    assert(bytes.find("xref\n0 8\n") != std::string::npos);
    assert(bytes.find("/Size 8\n") != std::string::npos);
    assert(CountOccurrences(bytes, " 00000 n \n") == 7);
    assert(bytes.find("0000000000 65535 f \n") != std::string::npos);
    assert(bytes.size() >= 5 && bytes.compare(bytes.size() - 5, 5, "%%EOF") == 0);
    assert(!fs::exists(dir / "scene.pdf.tmp"));
  }

  // Without a declared size the default canvas sets the scale.
  {
    SvgPdfConverter converter(settings);
    SvgDocument svg;
    assert(converter.ConvertDocument(svg).success);
    assert(converter.GetDocument().ScaleX() == 595.0 / 400.0);
    assert(converter.GetDocument().ScaleY() == 842.0 / 150.0);

    SvgDocument sized;
    sized.width = "595";
    sized.height = "842";
    assert(converter.ConvertDocument(sized).success);
    assert(converter.GetDocument().ScaleX() == 1.0);
    assert(converter.GetDocument().ScaleY() == 1.0);
    assert(converter.GetDocument().PageCount() == 2);

    SvgDocument odd;
    odd.width = "wide";
    odd.height = "120";
    assert(converter.ConvertDocument(odd).success);
    assert(converter.GetDocument().ScaleX() == 595.0 / 400.0);
    assert(converter.GetDocument().ScaleY() == 842.0 / 120.0);

    SvgDocument widthOnly;
    widthOnly.width = "200";
    assert(converter.ConvertDocument(widthOnly).success);
    assert(converter.GetDocument().ScaleX() == 595.0 / 400.0);
    assert(converter.GetDocument().ScaleY() == 842.0 / 150.0);

    SvgDocument heightOnly;
    heightOnly.height = "300";
    assert(converter.ConvertDocument(heightOnly).success);
    assert(converter.GetDocument().ScaleX() == 595.0 / 400.0);
    assert(converter.GetDocument().ScaleY() == 842.0 / 150.0);
    assert(converter.GetDocument().PageCount() == 5);
  }

  // Gradients come first, then rectangles, then texts; paths draw nothing.
  {
    SvgDocument svg;
    svg.width = "595";
    svg.height = "842";
    svg.texts.push_back(SvgText{0, 0, "first text"});
    svg.rects.push_back(SvgRect{1, 1, 2, 2});
    svg.paths.push_back(SvgPath{"M0 0 L 5 5"});
    svg.gradients.push_back(SvgLinearGradient{});
    svg.rects.push_back(SvgRect{3, 3, 4, 4});

    SvgPdfConverter converter(settings);
    assert(converter.ConvertDocument(svg).success);
    const auto &lines = converter.GetDocument().Pages()[0].lines;
    assert(lines.size() == 3 + 7 + 7 + 5);
    assert(lines[0] == "100.00 100.00 200.00 50.00 re");
    assert(lines[3] == "1.00 841.00 m");
    assert(lines[10] == "3.00 839.00 m");
    assert(lines[17] == "BT");
    assert(lines[20] == "(first text) Tj");
    // Two rectangles and one text advanced the grid cursor.
    assert(converter.GetDocument().Layout().CurrentY() == 50.0);
  }

  // Several sources become consecutive pages of one file.
  {
    const fs::path a = dir / "a.svg";
    const fs::path b = dir / "b.svg";
    const fs::path pdf = dir / "pages.pdf";
    WriteFile(a, "<svg><title>Pages</title><rect width=\"10\" height=\"10\"/></svg>");
    WriteFile(b, "<svg><text>b</text></svg>");

    SvgPdfConverter converter(settings);
    assert(converter.ConvertFile(a).success);
    assert(converter.ConvertFile(b).success);
    assert(converter.Save(pdf).success);

    const std::string bytes = ReadAll(pdf);
    assert(bytes.find("/Kids [\n4 0 R\n6 0 R\n]") != std::string::npos);
    assert(bytes.find("/Size 10\n") != std::string::npos);
    assert(bytes.find("/Title (Pages)") != std::string::npos);

    // Nothing can be added once saved.
    ConversionResult r = converter.ConvertFile(a);
    assert(!r.success && r.error == ConversionError::DocumentFinalized);
  }

  // Failures name the stage and leave earlier output alone.
  {
    const fs::path pdf = dir / "keep.pdf";
    WriteFile(pdf, "previous");

    ConversionResult r = ConvertSvgToPdf(dir / "absent.svg", pdf, settings);
    assert(!r.success && r.error == ConversionError::SourceOpenError);
    assert(ReadAll(pdf) == "previous");

    const fs::path broken = dir / "broken.svg";
    WriteFile(broken, "<svg><rect");
    r = ConvertSvgToPdf(broken, pdf, settings);
    assert(!r.success && r.error == ConversionError::DecodeError);
    assert(ReadAll(pdf) == "previous");

    const fs::path good = dir / "good.svg";
    WriteFile(good, "<svg/>");
    r = ConvertSvgToPdf(good, dir / "missing" / "out.pdf", settings);
    assert(!r.success && r.error == ConversionError::DestinationWriteError);
  }

  fs::remove_all(dir, ec);
  Logger::Instance().Flush();
  return 0;
}
