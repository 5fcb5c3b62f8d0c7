#include "headless_terminal.hpp"
#include <utility>

HeadlessTerminal::HeadlessTerminal(int rows, int cols) : rows_(rows), cols_(cols) {
  clear();
}

void HeadlessTerminal::clear() {
  grid_.assign(static_cast<size_t>(rows_), std::string(static_cast<size_t>(cols_), ' '));
}

void HeadlessTerminal::draw_text(int row, int col, const std::string& text) {
  if (row < 0 || row >= rows_) return;
  for (size_t i = 0; i < text.size(); ++i) {
    int c = col + static_cast<int>(i);
    if (c < 0) continue;
    if (c >= cols_) break;
    grid_[row][c] = text[i];
  }
}

void HeadlessTerminal::draw_colored(int row, int col, const std::string& text, int) {
  draw_text(row, col, text);
}

void HeadlessTerminal::write_raw(int row, int col, const std::string& bytes) {
  raw_.push_back(RawWrite{row, col, bytes});
}

int HeadlessTerminal::poll_key(int) {
  if (keys_.empty()) return kNoKey;
  int ch = keys_.front();
  keys_.pop_front();
  return ch;
}

void HeadlessTerminal::resize(int rows, int cols) {
  rows_ = rows;
  cols_ = cols;
  clear();
}

std::vector<HeadlessTerminal::RawWrite> HeadlessTerminal::take_raw_writes() {
  std::vector<RawWrite> out;
  out.swap(raw_);
  return out;
}
