#include "terminal.hpp"
#include <locale.h>
#include <stdexcept>
#include <unistd.h>

Terminal::Terminal() {
  if (!isatty(STDIN_FILENO) || !isatty(STDOUT_FILENO)) {
    throw std::runtime_error("stdin/stdout is not a terminal");
  }
  setlocale(LC_ALL, "");
  screen_ = newterm(nullptr, stdout, stdin);
  if (!screen_) throw std::runtime_error("cannot initialize terminal (check TERM)");
  set_term(screen_);
  raw();
  noecho();
  keypad(stdscr, TRUE);
  curs_set(0);
  ESCDELAY = 25;
}

Terminal::~Terminal() {
  endwin();
  delscreen(screen_);
}
