#pragma once
/*
 * PngCodec
 *
 * Purpose: PNG <-> PixelGrid through libpng's simplified png_image API.
 * Usage: decode_png(bytes, out, msg); returns false with msg on failure.
 */
#include <string>
#include "image.hpp"

bool decode_png(const std::string& bytes, PixelGrid& out, std::string& msg);
bool encode_png(const PixelGrid& image, std::string& out, std::string& msg);
