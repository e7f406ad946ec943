#pragma once

#include "geometry.h"
#include "svgdocument.h"

#include <string>
#include <string_view>
#include <vector>

namespace svgpdf {

// Resource name under which every page references the shared font.
inline constexpr const char *kFontResourceName = "F1";

class FloatFormatter {
public:
  explicit FloatFormatter(int precision);
  std::string Format(double value) const;

private:
  int precision_;
};

// Escapes the characters that are significant inside a PDF literal string:
// backslash first, then both parentheses.
std::string EscapePdfString(std::string_view text);

// Each Append* function adds one operator per line to a page content buffer.

// Stroked outline through the four mapped corners, black, no fill.
void AppendRectangle(std::vector<std::string> &lines, const FloatFormatter &fmt,
                     const Mapping &mapping, const SvgRect &rect);

// Text object at the mapped anchor after the "rotate" transform.
void AppendText(std::vector<std::string> &lines, const FloatFormatter &fmt,
                const Mapping &mapping, const SvgText &text, double fontSize);

// Flat stand-in for a gradient: a fixed blue outline. Stops are ignored.
void AppendGradientPlaceholder(std::vector<std::string> &lines,
                               const FloatFormatter &fmt);

} // namespace svgpdf
