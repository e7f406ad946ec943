#include "svg_pdf_converter.h"

#include "logger.h"
#include "pdf_writer.h"
#include "svgloader.h"

#include <sstream>

namespace fs = std::filesystem;

namespace svgpdf {

namespace {

double ResolveDimension(const std::optional<std::string> &declared,
                        double fallback, const char *name) {
  bool usedDefault = false;
  double value = ResolveSvgDimension(declared, fallback, &usedDefault);
  if (usedDefault && declared)
    Logger::Instance().Debug(std::string("SVG ") + name + " '" + *declared +
                             "' is not a usable number, using default " +
                             std::to_string(fallback));
  return value;
}

} // namespace

DocumentOptions MakeDocumentOptions(const print::ConversionSettings &settings) {
  DocumentOptions options;
  options.pageWidth = settings.PageWidthPt();
  options.pageHeight = settings.PageHeightPt();
  options.maxColumns = settings.gridColumns;
  options.maxRows = settings.gridRows;
  options.fontName = settings.fontName;
  options.fontSize = settings.fontSize;
  return options;
}

SvgPdfConverter::SvgPdfConverter(const print::ConversionSettings &settings)
    : document_(MakeDocumentOptions(settings)) {
  if (document_.FontName() != "Helvetica")
    Logger::Instance().Log("Font '" + document_.FontName() +
                           "' requested; text is rendered with the built-in "
                           "Helvetica");
}

ConversionResult SvgPdfConverter::Report(ConversionResult result) const {
  if (!result.success)
    Logger::Instance().Error(std::string(ToString(result.error)) + ": " +
                             result.message);
  return result;
}

ConversionResult SvgPdfConverter::ConvertFile(const fs::path &svgPath) {
  Logger::Instance().Log("Converting " + svgPath.string());
  SvgDocument svg;
  SvgLoader loader;
  ConversionResult loaded = loader.LoadFromFile(svgPath, svg);
  if (!loaded.success)
    return Report(loaded);
  return ConvertDocument(svg);
}

ConversionResult SvgPdfConverter::ConvertDocument(const SvgDocument &svg) {
  auto &log = Logger::Instance();

  ConversionResult result = document_.AddPage();
  if (!result.success)
    return Report(result);

  // A declared size is only honoured when both dimensions are present.
  double svgWidth = kDefaultSvgWidth;
  double svgHeight = kDefaultSvgHeight;
  if (svg.width && svg.height) {
    svgWidth = ResolveDimension(svg.width, kDefaultSvgWidth, "width");
    svgHeight = ResolveDimension(svg.height, kDefaultSvgHeight, "height");
  } else if (svg.width || svg.height) {
    log.Debug("SVG declares only one of width/height, using the default "
              "canvas");
  }
  document_.SetSourceSize(svgWidth, svgHeight);
  {
    std::ostringstream ss;
    ss << "Scaling " << svgWidth << "x" << svgHeight << " SVG units by ("
       << document_.ScaleX() << ", " << document_.ScaleY() << ")";
    log.Debug(ss.str());
  }

  if (svg.title && !document_.Title())
    document_.SetTitle(*svg.title);

  for (const auto &gradient : svg.gradients) {
    log.Debug("Approximating gradient '" + gradient.id + "' (" +
              std::to_string(gradient.stops.size()) +
              " stops) with a flat outline");
    result = document_.AppendGradient(gradient);
    if (!result.success)
      return Report(result);
  }

  bool overflowReported = false;
  auto checkOverflow = [&]() {
    if (!overflowReported && document_.Layout().IsOverflowing()) {
      log.Warn("Layout grid exceeded " +
               std::to_string(document_.Layout().MaxRows()) + " rows");
      overflowReported = true;
    }
  };

  for (const auto &rect : svg.rects) {
    result = document_.AppendRectangle(rect);
    if (!result.success)
      return Report(result);
    checkOverflow();
  }

  for (const auto &text : svg.texts) {
    result = document_.AppendText(text);
    if (!result.success)
      return Report(result);
    checkOverflow();
  }

  if (!svg.paths.empty())
    log.Debug("Skipping " + std::to_string(svg.paths.size()) +
              " path(s); path data is not rendered");

  log.Debug("Page " + std::to_string(document_.PageCount()) + " holds " +
            std::to_string(document_.Pages().back().lines.size()) +
            " content line(s)");
  return ConversionResult::Ok();
}

ConversionResult SvgPdfConverter::Save(const fs::path &pdfPath) {
  document_.Finalize();

  SerializedPdf serialized;
  ConversionResult result = SerializeDocument(document_, serialized);
  if (!result.success)
    return Report(result);

  result = WritePdfDocument(pdfPath, serialized.bytes);
  if (!result.success)
    return Report(result);

  Logger::Instance().Log("Wrote " + std::to_string(document_.PageCount()) +
                         " page(s) to " + pdfPath.string());
  return result;
}

ConversionResult ConvertSvgToPdf(const fs::path &svgPath,
                                 const fs::path &pdfPath,
                                 const print::ConversionSettings &settings) {
  SvgPdfConverter converter(settings);
  ConversionResult result = converter.ConvertFile(svgPath);
  if (!result.success)
    return result;
  return converter.Save(pdfPath);
}

} // namespace svgpdf
