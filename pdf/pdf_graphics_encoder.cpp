#include "pdf_graphics_encoder.h"

#include "stringutils.h"

#include <algorithm>
#include <array>
#include <iomanip>
#include <sstream>

namespace svgpdf {

namespace {

// Page rectangle used for every gradient placeholder, in points.
constexpr double GRADIENT_X = 100.0;
constexpr double GRADIENT_Y = 100.0;
constexpr double GRADIENT_W = 200.0;
constexpr double GRADIENT_H = 50.0;

std::string FormatPoint(const FloatFormatter &fmt, const Point &p,
                        const char *op) {
  return fmt.Format(p.x) + ' ' + fmt.Format(p.y) + ' ' + op;
}

} // namespace

FloatFormatter::FloatFormatter(int precision)
    : precision_(std::clamp(precision, 0, 6)) {}

std::string FloatFormatter::Format(double value) const {
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(precision_) << value;
  return ss.str();
}

std::string EscapePdfString(std::string_view text) {
  std::string escaped = StringUtils::ReplaceAll(std::string(text), "\\", "\\\\");
  escaped = StringUtils::ReplaceAll(std::move(escaped), "(", "\\(");
  return StringUtils::ReplaceAll(std::move(escaped), ")", "\\)");
}

void AppendRectangle(std::vector<std::string> &lines, const FloatFormatter &fmt,
                     const Mapping &mapping, const SvgRect &rect) {
  const std::array<Point, 4> corners = {
      MapToPage(mapping, rect.x, rect.y),
      MapToPage(mapping, rect.x + rect.width, rect.y),
      MapToPage(mapping, rect.x + rect.width, rect.y + rect.height),
      MapToPage(mapping, rect.x, rect.y + rect.height)};

  lines.push_back(FormatPoint(fmt, corners[0], "m"));
  for (size_t i = 1; i < corners.size(); ++i)
    lines.push_back(FormatPoint(fmt, corners[i], "l"));
  lines.push_back("h");
  lines.push_back("0 0 0 RG");
  lines.push_back("S");
}

void AppendText(std::vector<std::string> &lines, const FloatFormatter &fmt,
                const Mapping &mapping, const SvgText &text, double fontSize) {
  Point anchor = MapToPage(mapping, text.x, text.y);
  anchor = ApplyTransformation(anchor, "rotate", mapping.pageWidth);

  lines.push_back("BT");
  lines.push_back(std::string("/") + kFontResourceName + ' ' +
                  fmt.Format(fontSize) + " Tf");
  lines.push_back(FormatPoint(fmt, anchor, "Td"));
  lines.push_back("(" + EscapePdfString(text.content) + ") Tj");
  lines.push_back("ET");
}

void AppendGradientPlaceholder(std::vector<std::string> &lines,
                               const FloatFormatter &fmt) {
  lines.push_back(fmt.Format(GRADIENT_X) + ' ' + fmt.Format(GRADIENT_Y) + ' ' +
                  fmt.Format(GRADIENT_W) + ' ' + fmt.Format(GRADIENT_H) +
                  " re");
  lines.push_back("0 0 1 RG");
  lines.push_back("S");
}

} // namespace svgpdf
