#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: in-memory ITerminal for tests: a character grid that records what
 * was drawn, plus a queue of scripted keys.
 */
#include <deque>
#include <string>
#include <vector>
#include "iterminal.hpp"

class HeadlessTerminal : public ITerminal {
public:
  HeadlessTerminal(int rows, int cols);

  TermSize get_size() const override { return {rows_, cols_}; }
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_reverse(int row, int col, const std::string& text) override;
  void clear_to_eol(int row, int col) override;
  void move_cursor(int row, int col) override { cursor_row_ = row; cursor_col_ = col; }
  void refresh() override { ++refresh_count_; }
  int read_key() override;

  void push_keys(const std::string& keys);
  void push_key(int key) { keys_.push_back(key); }

  const std::string& row_text(int row) const { return grid_[static_cast<size_t>(row)]; }
  int cursor_row() const { return cursor_row_; }
  int cursor_col() const { return cursor_col_; }
  int refresh_count() const { return refresh_count_; }

private:
  int rows_;
  int cols_;
  std::vector<std::string> grid_;
  std::deque<int> keys_;
  int cursor_row_ = 0;
  int cursor_col_ = 0;
  int refresh_count_ = 0;
};
