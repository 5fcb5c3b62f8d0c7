#pragma once
/*
 * GraphicsProtocols
 *
 * Purpose: wire encoders for terminal image protocols (iTerm2 inline, Kitty, Sixel)
 * plus the pixel helpers they share. Output is raw bytes to be written at the cursor.
 */
#include <string>
#include "image.hpp"

std::string base64_encode(const std::string& data);

// box-filter downscale, nearest-neighbour upscale
PixelGrid resample(const PixelGrid& src, int width, int height);

std::string encode_iterm2_inline(const std::string& png, int cols, int rows);
std::string encode_kitty_png(const std::string& png, int cols, int rows);
std::string kitty_delete_all();
std::string encode_sixel(const PixelGrid& image);
