#include "geometry.h"

#include "stringutils.h"

#include <cmath>

namespace svgpdf {

double ResolveSvgDimension(const std::optional<std::string> &declared,
                           double fallback, bool *usedDefault) {
  double value = 0.0;
  const bool ok = declared && StringUtils::TryParseDouble(*declared, value) &&
                  std::isfinite(value) && value > 0.0;
  if (usedDefault)
    *usedDefault = !ok;
  return ok ? value : fallback;
}

Mapping MakeMapping(double pageWidth, double pageHeight, double svgWidth,
                    double svgHeight) {
  Mapping mapping;
  mapping.pageWidth = pageWidth;
  mapping.pageHeight = pageHeight;
  mapping.scaleX = pageWidth / svgWidth;
  mapping.scaleY = pageHeight / svgHeight;
  return mapping;
}

Point MapToPage(const Mapping &mapping, double x, double y) {
  return {x * mapping.scaleX, mapping.pageHeight - y * mapping.scaleY};
}

Point ApplyTransformation(const Point &p, std::string_view transform,
                          double pageWidth) {
  if (transform == "rotate")
    return {p.y, pageWidth - p.x};
  return p;
}

} // namespace svgpdf
