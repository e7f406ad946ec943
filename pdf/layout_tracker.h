#pragma once

namespace svgpdf {

struct GridCell {
  int row = 0;
  int column = 0;
};

// Grid cursor advanced as elements are placed. It is bookkeeping only:
// rendered coordinates always come from the geometry mapping.
class LayoutTracker {
public:
  static constexpr double kDefaultColumnWidth = 150.0;
  static constexpr double kDefaultRowHeight = 50.0;

  LayoutTracker(double pageWidth, int maxColumns, int maxRows,
                double columnWidth = kDefaultColumnWidth,
                double rowHeight = kDefaultRowHeight);

  // Moves one column right, wrapping to a new row when the next column
  // would not fit on the page.
  void AddColumn();
  // Starts a new row at the left edge.
  void AddRow();

  GridCell Cell() const;
  bool IsOverflowing() const;

  double CurrentX() const { return currentX_; }
  double CurrentY() const { return currentY_; }
  double ColumnWidth() const { return columnWidth_; }
  double RowHeight() const { return rowHeight_; }
  int MaxColumns() const { return maxColumns_; }
  int MaxRows() const { return maxRows_; }

private:
  double pageWidth_;
  double columnWidth_;
  double rowHeight_;
  int maxColumns_;
  int maxRows_;
  double currentX_ = 0.0;
  double currentY_ = 0.0;
};

} // namespace svgpdf
