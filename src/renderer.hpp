#pragma once
/*
 * Renderer
 *
 * Purpose: turn a decoded page into positioned terminal writes for the chosen RenderMode.
 * Contract: every RenderOp lies inside the viewport it was given; the picture keeps its
 * aspect ratio and the leftover area is blanked (letterboxing).
 * Constraint: stateless; the frame driver decides when the output is written.
 */
#include <string>
#include <vector>
#include "frame_layout.hpp"
#include "image.hpp"
#include "types.hpp"

struct RenderOp {
  int row = 0;
  int col = 0;
  int height = 0; // cells covered; 0x0 for pure control sequences
  int width = 0;
  std::string bytes;
};

struct RenderOutput {
  Rect image_area;
  std::vector<RenderOp> ops;
};

class Renderer {
public:
  explicit Renderer(CellGeometry cell = CellGeometry{});
  RenderOutput render(const PixelGrid& image, RenderMode mode, const Rect& viewport) const;
  // bytes that remove whatever the mode leaves behind on exit
  std::string teardown(RenderMode mode) const;

private:
  void render_blocks(const PixelGrid& image, const Rect& viewport, const Rect& fit, RenderOutput& out) const;
  bool encode_picture(const PixelGrid& image, RenderMode mode, const Rect& fit, std::string& bytes) const;
  CellGeometry cell_;
};

// one string per cell row; each cell is an upper-half block over two source pixels
std::vector<std::string> half_block_rows(const PixelGrid& image, int cols, int rows);
