#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace svgpdf {

// Source canvas size assumed when the SVG root declares no usable size.
inline constexpr double kDefaultSvgWidth = 400.0;
inline constexpr double kDefaultSvgHeight = 150.0;

struct Point {
  double x = 0.0;
  double y = 0.0;
};

// Maps SVG user space (top-left origin, y down) onto PDF page space
// (bottom-left origin, y up).
struct Mapping {
  double pageWidth = 0.0;
  double pageHeight = 0.0;
  double scaleX = 1.0;
  double scaleY = 1.0;
};

// Resolves one declared root dimension. Absent, non-numeric or non-positive
// values fall back to the default. usedDefault reports whether it did.
double ResolveSvgDimension(const std::optional<std::string> &declared,
                           double fallback, bool *usedDefault = nullptr);

Mapping MakeMapping(double pageWidth, double pageHeight, double svgWidth,
                    double svgHeight);

// x' = x * scaleX, y' = pageHeight - y * scaleY
Point MapToPage(const Mapping &mapping, double x, double y);

// Applies a named transform to an already mapped point. Only "rotate" is
// known: (x, y) -> (y, pageWidth - x). Other names leave the point as is.
Point ApplyTransformation(const Point &p, std::string_view transform,
                          double pageWidth);

} // namespace svgpdf
