#pragma once
/*
 * ITerminal
 *
 * Purpose: abstract terminal backend (size, draw, cursor, refresh, keys).
 * Goal: decouple Editor/Renderer from ncurses so both run headless in tests.
 */
#include <string>

struct TermSize { int rows; int cols; };

class ITerminal {
public:
  virtual ~ITerminal() = default;
  virtual TermSize get_size() const = 0;
  virtual void clear() = 0;
  virtual void draw_text(int row, int col, const std::string& text) = 0;
  virtual void draw_reverse(int row, int col, const std::string& text) = 0;
  virtual void clear_to_eol(int row, int col) = 0;
  virtual void move_cursor(int row, int col) = 0;
  virtual void refresh() = 0;
  // blocking; negative when no key is available
  virtual int read_key() = 0;
};
