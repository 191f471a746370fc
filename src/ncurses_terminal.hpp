#pragma once
/*
 * NcursesTerminal
 *
 * Purpose: ITerminal implementation drawing on stdscr.
 * Note: initialization/teardown is managed by TerminalSession.
 */
#include "iterminal.hpp"

class NcursesTerminal : public ITerminal {
public:
  NcursesTerminal();
  TermSize get_size() const override;
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_reverse(int row, int col, const std::string& text) override;
  void clear_to_eol(int row, int col) override;
  void move_cursor(int row, int col) override;
  void refresh() override;
  int read_key() override;
};
