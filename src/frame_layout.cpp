#include "frame_layout.hpp"
#include <algorithm>
#include <cmath>

FrameRects compute_frame(int rows, int cols, int header_rows, int footer_rows) {
  rows = std::max(0, rows);
  cols = std::max(0, cols);
  int header_h = std::clamp(header_rows, 0, rows);
  int footer_h = std::clamp(footer_rows, 0, rows - header_h);
  int view_h = rows - header_h - footer_h;
  FrameRects f;
  f.header = Rect{0, 0, header_h, cols};
  f.viewport = Rect{header_h, 0, view_h, cols};
  f.footer = Rect{header_h + view_h, 0, footer_h, cols};
  return f;
}

Rect fit_letterbox(int image_width, int image_height, const Rect& area, const CellGeometry& cell) {
  if (area.empty() || image_width <= 0 || image_height <= 0) return Rect{area.row, area.col, 0, 0};
  CellGeometry c = cell;
  if (c.width_px <= 0 || c.height_px <= 0) c = CellGeometry{};
  double avail_w = static_cast<double>(area.width) * c.width_px;
  double avail_h = static_cast<double>(area.height) * c.height_px;
  double scale = std::min(avail_w / image_width, avail_h / image_height);
  int cols = static_cast<int>(std::lround(image_width * scale / c.width_px));
  int rows = static_cast<int>(std::lround(image_height * scale / c.height_px));
  cols = std::clamp(cols, 1, area.width);
  rows = std::clamp(rows, 1, area.height);
  return Rect{area.row + (area.height - rows) / 2, area.col + (area.width - cols) / 2, rows, cols};
}
