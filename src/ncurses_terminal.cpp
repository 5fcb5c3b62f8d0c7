#include "ncurses_terminal.hpp"
#include <algorithm>
#include <cstdio>

NcursesTerminal::NcursesTerminal() {
  if (has_colors()) {
    start_color();
    if (use_default_colors() == OK) {
      init_pair(kPairText, -1, -1);
      init_pair(kPairAlert, COLOR_YELLOW, -1);
    } else {
      init_pair(kPairText, COLOR_WHITE, COLOR_BLACK); // fallback
      init_pair(kPairAlert, COLOR_YELLOW, COLOR_BLACK);
    }
    init_pair(kPairBar, COLOR_WHITE, COLOR_BLUE);
  }
}

TermSize NcursesTerminal::getSize() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

void NcursesTerminal::clear() { erase(); }

void NcursesTerminal::draw_text(int row, int col, const std::string& text) {
  draw_colored(row, col, text, kPairText);
}

void NcursesTerminal::draw_colored(int row, int col, const std::string& text, int color_pair_id) {
  int cols = getSize().cols;
  int n = std::min(static_cast<int>(text.size()), cols - col);
  if (n <= 0) return;
  if (has_colors()) attron(COLOR_PAIR(color_pair_id));
  else if (color_pair_id == kPairBar) attron(A_REVERSE);
  mvaddnstr(row, col, text.c_str(), n);
  if (has_colors()) attroff(COLOR_PAIR(color_pair_id));
  else if (color_pair_id == kPairBar) attroff(A_REVERSE);
}

void NcursesTerminal::refresh() { ::refresh(); }

void NcursesTerminal::write_raw(int row, int col, const std::string& bytes) {
  // DECSC/DECRC keep the cursor and attributes where ncurses believes they are
  std::string seq = "\0337\033[" + std::to_string(row + 1) + ";" + std::to_string(col + 1) + "H";
  seq += bytes;
  seq += "\0338";
  std::fwrite(seq.data(), 1, seq.size(), stdout);
  std::fflush(stdout);
}

int NcursesTerminal::poll_key(int timeout_ms) {
  timeout(timeout_ms);
  int ch = getch();
  return ch == ERR ? kNoKey : ch;
}
