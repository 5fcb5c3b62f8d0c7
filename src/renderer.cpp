#include "renderer.hpp"
#include "graphics_protocols.hpp"
#include "png_codec.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

static const char* kUpperHalf = "\xE2\x96\x80"; // U+2580

static void append_sgr_colour(std::string& out, bool background, Rgb c) {
  out += background ? "\033[48;2;" : "\033[38;2;";
  out += std::to_string(c.r);
  out += ';';
  out += std::to_string(c.g);
  out += ';';
  out += std::to_string(c.b);
  out += 'm';
}

std::vector<std::string> half_block_rows(const PixelGrid& image, int cols, int rows) {
  std::vector<std::string> lines;
  if (cols <= 0 || rows <= 0 || image.empty()) return lines;
  PixelGrid small = resample(image, cols, rows * 2);
  lines.reserve(rows);
  for (int r = 0; r < rows; ++r) {
    std::string line;
    bool have_prev = false;
    Rgb prev_fg, prev_bg;
    for (int c = 0; c < cols; ++c) {
      Rgb fg = small.at(c, r * 2);
      Rgb bg = small.at(c, r * 2 + 1);
      if (!have_prev || fg.r != prev_fg.r || fg.g != prev_fg.g || fg.b != prev_fg.b) append_sgr_colour(line, false, fg);
      if (!have_prev || bg.r != prev_bg.r || bg.g != prev_bg.g || bg.b != prev_bg.b) append_sgr_colour(line, true, bg);
      line += kUpperHalf;
      prev_fg = fg;
      prev_bg = bg;
      have_prev = true;
    }
    line += "\033[0m";
    lines.push_back(std::move(line));
  }
  return lines;
}

Renderer::Renderer(CellGeometry cell) : cell_(cell) {
  if (cell_.width_px <= 0 || cell_.height_px <= 0) cell_ = CellGeometry{};
}

void Renderer::render_blocks(const PixelGrid& image, const Rect& viewport, const Rect& fit, RenderOutput& out) const {
  std::vector<std::string> lines = half_block_rows(image, fit.width, fit.height);
  int left = fit.col - viewport.col;
  int right = viewport.width - left - fit.width;
  for (int r = 0; r < viewport.height; ++r) {
    int row = viewport.row + r;
    std::string bytes;
    int line_idx = row - fit.row;
    if (line_idx >= 0 && line_idx < static_cast<int>(lines.size())) {
      bytes.append(static_cast<size_t>(left), ' ');
      bytes += lines[line_idx];
      bytes.append(static_cast<size_t>(right), ' ');
    } else {
      bytes.assign(static_cast<size_t>(viewport.width), ' ');
    }
    out.ops.push_back(RenderOp{row, viewport.col, 1, viewport.width, std::move(bytes)});
  }
}

bool Renderer::encode_picture(const PixelGrid& image, RenderMode mode, const Rect& fit, std::string& bytes) const {
  const int target_w = fit.width * cell_.width_px;
  const int target_h = fit.height * cell_.height_px;
  if (mode == RenderMode::PixelApproximation) {
    bytes = encode_sixel(resample(image, target_w, target_h));
    return !bytes.empty();
  }
  // the terminal scales inline/kitty images itself; only shrink oversized sources
  std::string png, msg;
  bool ok = (target_w < image.width && target_h < image.height)
                ? encode_png(resample(image, target_w, target_h), png, msg)
                : encode_png(image, png, msg);
  if (!ok) {
    spdlog::error("renderer: {}", msg);
    return false;
  }
  bytes = mode == RenderMode::InlineProtocol ? encode_iterm2_inline(png, fit.width, fit.height)
                                             : encode_kitty_png(png, fit.width, fit.height);
  return true;
}

RenderOutput Renderer::render(const PixelGrid& image, RenderMode mode, const Rect& viewport) const {
  RenderOutput out;
  if (viewport.empty() || image.empty()) return out;
  out.image_area = fit_letterbox(image.width, image.height, viewport, cell_);

  if (mode == RenderMode::BlockFallback) {
    render_blocks(image, viewport, out.image_area, out);
    return out;
  }
  if (mode == RenderMode::CellGraphicsProtocol) {
    out.ops.push_back(RenderOp{viewport.row, viewport.col, 0, 0, kitty_delete_all()});
  }
  std::string blank(static_cast<size_t>(viewport.width), ' ');
  for (int r = 0; r < viewport.height; ++r) {
    out.ops.push_back(RenderOp{viewport.row + r, viewport.col, 1, viewport.width, blank});
  }
  std::string bytes;
  if (!encode_picture(image, mode, out.image_area, bytes)) return out;
  const Rect& fit = out.image_area;
  out.ops.push_back(RenderOp{fit.row, fit.col, fit.height, fit.width, std::move(bytes)});
  return out;
}

std::string Renderer::teardown(RenderMode mode) const {
  return mode == RenderMode::CellGraphicsProtocol ? kitty_delete_all() : std::string();
}
