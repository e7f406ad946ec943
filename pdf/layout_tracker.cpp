#include "layout_tracker.h"

#include <cmath>

namespace svgpdf {

LayoutTracker::LayoutTracker(double pageWidth, int maxColumns, int maxRows,
                             double columnWidth, double rowHeight)
    : pageWidth_(pageWidth), columnWidth_(columnWidth), rowHeight_(rowHeight),
      maxColumns_(maxColumns), maxRows_(maxRows) {}

void LayoutTracker::AddRow() {
  currentY_ += rowHeight_;
  currentX_ = 0.0;
}

void LayoutTracker::AddColumn() {
  currentX_ += columnWidth_;
  if (currentX_ + columnWidth_ > pageWidth_)
    AddRow();
}

GridCell LayoutTracker::Cell() const {
  GridCell cell;
  if (rowHeight_ > 0.0)
    cell.row = static_cast<int>(std::floor(currentY_ / rowHeight_));
  if (columnWidth_ > 0.0)
    cell.column = static_cast<int>(std::floor(currentX_ / columnWidth_));
  return cell;
}

bool LayoutTracker::IsOverflowing() const {
  return maxRows_ > 0 && Cell().row >= maxRows_;
}

} // namespace svgpdf
