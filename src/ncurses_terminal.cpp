#include "ncurses_terminal.hpp"
// NCURSES_NOMACROS keeps clear()/refresh()/move() as real functions
#include <ncurses.h>

NcursesTerminal::NcursesTerminal() {
  if (has_colors()) {
    start_color();
    if (use_default_colors() == OK) init_pair(1, -1, -1);
    else init_pair(1, COLOR_WHITE, COLOR_BLACK);
    wbkgd(stdscr, COLOR_PAIR(1));
  }
}

TermSize NcursesTerminal::get_size() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

void NcursesTerminal::clear() { ::erase(); }

void NcursesTerminal::draw_text(int row, int col, const std::string& text) {
  ::mvaddnstr(row, col, text.c_str(), static_cast<int>(text.size()));
}

void NcursesTerminal::draw_reverse(int row, int col, const std::string& text) {
  ::attron(A_REVERSE);
  ::mvaddnstr(row, col, text.c_str(), static_cast<int>(text.size()));
  ::attroff(A_REVERSE);
}

void NcursesTerminal::clear_to_eol(int row, int col) {
  ::move(row, col);
  ::clrtoeol();
}

void NcursesTerminal::move_cursor(int row, int col) { ::move(row, col); }

void NcursesTerminal::refresh() { ::refresh(); }

int NcursesTerminal::read_key() {
  int ch = ::getch();
  return ch == ERR ? -1 : ch;
}
