#include "headless_terminal.hpp"

HeadlessTerminal::HeadlessTerminal(int rows, int cols)
  : rows_(rows), cols_(cols), grid_(static_cast<size_t>(rows), std::string(static_cast<size_t>(cols), ' ')) {}

void HeadlessTerminal::clear() {
  for (auto& r : grid_) r.assign(static_cast<size_t>(cols_), ' ');
}

void HeadlessTerminal::draw_text(int row, int col, const std::string& text) {
  if (row < 0 || row >= rows_) return;
  std::string& line = grid_[static_cast<size_t>(row)];
  for (size_t i = 0; i < text.size(); ++i) {
    int c = col + static_cast<int>(i);
    if (c < 0) continue;
    if (c >= cols_) break;
    line[static_cast<size_t>(c)] = text[i];
  }
}

void HeadlessTerminal::draw_reverse(int row, int col, const std::string& text) {
  draw_text(row, col, text);
}

void HeadlessTerminal::clear_to_eol(int row, int col) {
  if (row < 0 || row >= rows_ || col >= cols_) return;
  if (col < 0) col = 0;
  std::string& line = grid_[static_cast<size_t>(row)];
  for (int c = col; c < cols_; ++c) line[static_cast<size_t>(c)] = ' ';
}

int HeadlessTerminal::read_key() {
  if (keys_.empty()) return -1;
  int k = keys_.front();
  keys_.pop_front();
  return k;
}

void HeadlessTerminal::push_keys(const std::string& keys) {
  for (unsigned char c : keys) keys_.push_back(c);
}
