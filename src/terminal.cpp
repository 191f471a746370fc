#include "terminal.hpp"
#include <ncurses.h>
#include <locale.h>
#include <plog/Log.h>

TerminalSession::TerminalSession() {
  setlocale(LC_ALL, "");
  initscr();
  raw();
  noecho();
  nonl();
  keypad(stdscr, TRUE);
  ESCDELAY = 25;
  PLOGD << "terminal session started " << COLS << "x" << LINES;
}

TerminalSession::~TerminalSession() {
  endwin();
}
