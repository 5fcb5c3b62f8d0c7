#include "graphics_protocols.hpp"
#include <algorithm>
#include <cstdint>
#include <vector>

static constexpr size_t kKittyChunk = 4096;

std::string base64_encode(const std::string& data) {
  static const char* alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
  std::string out;
  out.reserve((data.size() + 2) / 3 * 4);
  size_t i = 0;
  const auto* p = reinterpret_cast<const unsigned char*>(data.data());
  for (; i + 2 < data.size(); i += 3) {
    uint32_t v = (p[i] << 16) | (p[i + 1] << 8) | p[i + 2];
    out += alphabet[(v >> 18) & 0x3f];
    out += alphabet[(v >> 12) & 0x3f];
    out += alphabet[(v >> 6) & 0x3f];
    out += alphabet[v & 0x3f];
  }
  size_t rest = data.size() - i;
  if (rest == 1) {
    uint32_t v = p[i] << 16;
    out += alphabet[(v >> 18) & 0x3f];
    out += alphabet[(v >> 12) & 0x3f];
    out += "==";
  } else if (rest == 2) {
    uint32_t v = (p[i] << 16) | (p[i + 1] << 8);
    out += alphabet[(v >> 18) & 0x3f];
    out += alphabet[(v >> 12) & 0x3f];
    out += alphabet[(v >> 6) & 0x3f];
    out += '=';
  }
  return out;
}

PixelGrid resample(const PixelGrid& src, int width, int height) {
  PixelGrid dst(std::max(0, width), std::max(0, height));
  if (src.empty() || dst.empty()) return dst;
  for (int dy = 0; dy < dst.height; ++dy) {
    int y0 = static_cast<int>(static_cast<int64_t>(dy) * src.height / dst.height);
    int y1 = static_cast<int>(static_cast<int64_t>(dy + 1) * src.height / dst.height);
    y1 = std::max(y1, y0 + 1);
    for (int dx = 0; dx < dst.width; ++dx) {
      int x0 = static_cast<int>(static_cast<int64_t>(dx) * src.width / dst.width);
      int x1 = static_cast<int>(static_cast<int64_t>(dx + 1) * src.width / dst.width);
      x1 = std::max(x1, x0 + 1);
      uint32_t r = 0, g = 0, b = 0, n = 0;
      for (int y = y0; y < y1; ++y) {
        for (int x = x0; x < x1; ++x) {
          Rgb c = src.at(x, y);
          r += c.r; g += c.g; b += c.b; ++n;
        }
      }
      dst.set(dx, dy, Rgb{static_cast<uint8_t>(r / n), static_cast<uint8_t>(g / n), static_cast<uint8_t>(b / n)});
    }
  }
  return dst;
}

std::string encode_iterm2_inline(const std::string& png, int cols, int rows) {
  std::string out = "\033]1337;File=inline=1;size=" + std::to_string(png.size()) +
                    ";width=" + std::to_string(cols) + ";height=" + std::to_string(rows) +
                    ";preserveAspectRatio=0:";
  out += base64_encode(png);
  out += '\a';
  return out;
}

std::string encode_kitty_png(const std::string& png, int cols, int rows) {
  std::string b64 = base64_encode(png);
  std::string out;
  out.reserve(b64.size() + (b64.size() / kKittyChunk + 1) * 16 + 64);
  size_t pos = 0;
  bool first = true;
  do {
    size_t n = std::min(kKittyChunk, b64.size() - pos);
    bool more = pos + n < b64.size();
    out += "\033_G";
    if (first) {
      // C=1 keeps the cursor still, q=2 silences replies
      out += "a=T,f=100,q=2,C=1,c=" + std::to_string(cols) + ",r=" + std::to_string(rows) + ",";
    }
    out += more ? "m=1;" : "m=0;";
    out.append(b64, pos, n);
    out += "\033\\";
    pos += n;
    first = false;
  } while (pos < b64.size());
  return out;
}

std::string kitty_delete_all() { return "\033_Ga=d,d=A,q=2\033\\"; }

static int cube_level(uint8_t v) { return (v * 5 + 127) / 255; }

static void flush_run(std::string& out, char ch, int run) {
  if (run <= 0) return;
  if (run > 3) {
    out += '!';
    out += std::to_string(run);
    out += ch;
  } else {
    out.append(static_cast<size_t>(run), ch);
  }
}

std::string encode_sixel(const PixelGrid& image) {
  if (image.empty()) return "";
  const int w = image.width, h = image.height;
  std::vector<uint8_t> idx(static_cast<size_t>(w) * h);
  std::vector<bool> used(216, false);
  for (int y = 0; y < h; ++y) {
    for (int x = 0; x < w; ++x) {
      Rgb c = image.at(x, y);
      int i = cube_level(c.r) * 36 + cube_level(c.g) * 6 + cube_level(c.b);
      idx[static_cast<size_t>(y) * w + x] = static_cast<uint8_t>(i);
      used[i] = true;
    }
  }
  std::string out = "\033Pq\"1;1;" + std::to_string(w) + ";" + std::to_string(h);
  for (int i = 0; i < 216; ++i) {
    if (!used[i]) continue;
    // sixel colour registers take percentages
    out += "#" + std::to_string(i) + ";2;" + std::to_string(i / 36 * 20) + ";" +
           std::to_string(i / 6 % 6 * 20) + ";" + std::to_string(i % 6 * 20);
  }
  for (int y0 = 0; y0 < h; y0 += 6) {
    int band_h = std::min(6, h - y0);
    std::vector<int> colours;
    std::vector<bool> seen(216, false);
    for (int dy = 0; dy < band_h; ++dy) {
      for (int x = 0; x < w; ++x) {
        int c = idx[static_cast<size_t>(y0 + dy) * w + x];
        if (!seen[c]) { seen[c] = true; colours.push_back(c); }
      }
    }
    for (size_t k = 0; k < colours.size(); ++k) {
      int colour = colours[k];
      if (k > 0) out += '$';
      out += "#" + std::to_string(colour);
      char prev = 0;
      int run = 0;
      for (int x = 0; x < w; ++x) {
        int mask = 0;
        for (int dy = 0; dy < band_h; ++dy) {
          if (idx[static_cast<size_t>(y0 + dy) * w + x] == colour) mask |= 1 << dy;
        }
        char ch = static_cast<char>(63 + mask);
        if (ch == prev) { ++run; continue; }
        flush_run(out, prev, run);
        prev = ch;
        run = 1;
      }
      flush_run(out, prev, run);
    }
    if (y0 + 6 < h) out += '-';
  }
  out += "\033\\";
  return out;
}
