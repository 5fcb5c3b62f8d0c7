#pragma once
/*
 * FrameLayout
 *
 * Purpose: split the screen into header / viewport / footer and fit an image
 * into a cell rectangle without distorting it (letterboxing).
 */
#include "config.hpp"
#include "types.hpp"

struct Rect {
  int row = 0;
  int col = 0;
  int height = 0;
  int width = 0;

  bool empty() const { return height <= 0 || width <= 0; }
  bool contains(const Rect& o) const {
    return o.row >= row && o.col >= col &&
           o.row + o.height <= row + height && o.col + o.width <= col + width;
  }
};

struct FrameRects {
  Rect header;
  Rect viewport;
  Rect footer;
};

FrameRects compute_frame(int rows, int cols, int header_rows = TV_HEADER_ROWS, int footer_rows = TV_FOOTER_ROWS);

// largest rectangle inside area with the image's aspect ratio, centred
Rect fit_letterbox(int image_width, int image_height, const Rect& area, const CellGeometry& cell);
