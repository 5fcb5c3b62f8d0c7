#pragma once
/*
 * ITerminal
 *
 * Purpose: abstract terminal backend (size, text cells, raw image bytes, key polling).
 * Goal: decouple from concrete impls (ncurses/headless), enable testing of whole frames.
 */
#include <string>

struct TermSize { int rows; int cols; };

// colour pairs understood by every backend
constexpr int kPairText = 1;
constexpr int kPairBar = 2;
constexpr int kPairAlert = 3;

constexpr int kNoKey = -1;

class ITerminal {
public:
  virtual ~ITerminal() = default;
  virtual TermSize getSize() const = 0;
  virtual void clear() = 0;
  virtual void draw_text(int row, int col, const std::string& text) = 0;
  virtual void draw_colored(int row, int col, const std::string& text, int color_pair_id) = 0;
  virtual void refresh() = 0;
  // bytes go out untouched with the cursor parked at (row, col); call after refresh()
  virtual void write_raw(int row, int col, const std::string& bytes) = 0;
  // next key code, or kNoKey once timeout_ms passes
  virtual int poll_key(int timeout_ms) = 0;
};
