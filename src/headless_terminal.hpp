#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: in-memory ITerminal for tests; keeps a character grid, the raw writes of the
 * current frame and a queue of scripted keys.
 */
#include <deque>
#include <string>
#include <vector>
#include "iterminal.hpp"

class HeadlessTerminal : public ITerminal {
public:
  struct RawWrite { int row; int col; std::string bytes; };

  HeadlessTerminal(int rows, int cols);
  TermSize getSize() const override { return {rows_, cols_}; }
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_colored(int row, int col, const std::string& text, int color_pair_id) override;
  void refresh() override { ++frames_; }
  void write_raw(int row, int col, const std::string& bytes) override;
  int poll_key(int timeout_ms) override;

  void push_key(int ch) { keys_.push_back(ch); }
  void resize(int rows, int cols);
  const std::string& line(int row) const { return grid_[row]; }
  const std::vector<RawWrite>& raw_writes() const { return raw_; }
  std::vector<RawWrite> take_raw_writes();
  int frames() const { return frames_; }

private:
  int rows_;
  int cols_;
  int frames_ = 0;
  std::vector<std::string> grid_;
  std::vector<RawWrite> raw_;
  std::deque<int> keys_;
};
