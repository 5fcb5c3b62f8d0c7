#pragma once
/*
 * PixelGrid
 *
 * Purpose: decoded page image, row-major RGB, 3 bytes per pixel.
 */
#include <cstddef>
#include <cstdint>
#include <vector>

struct Rgb { uint8_t r = 0; uint8_t g = 0; uint8_t b = 0; };

struct PixelGrid {
  int width = 0;
  int height = 0;
  std::vector<uint8_t> rgb;

  PixelGrid() = default;
  PixelGrid(int w, int h) : width(w), height(h), rgb(static_cast<size_t>(w) * h * 3, 0) {}

  bool empty() const { return width <= 0 || height <= 0; }
  Rgb at(int x, int y) const {
    const uint8_t* p = &rgb[(static_cast<size_t>(y) * width + x) * 3];
    return {p[0], p[1], p[2]};
  }
  void set(int x, int y, Rgb c) {
    uint8_t* p = &rgb[(static_cast<size_t>(y) * width + x) * 3];
    p[0] = c.r; p[1] = c.g; p[2] = c.b;
  }
};
