#include "renderer.hpp"
#include <algorithm>

std::string expand_tabs(const std::string& s, int tab_width) {
  int tw = std::max(1, tab_width);
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    if (c == '\t') {
      int pad = tw - static_cast<int>(out.size()) % tw;
      out.append(static_cast<size_t>(pad), ' ');
    } else {
      out.push_back(c);
    }
  }
  return out;
}

int display_col(const std::string& s, int col, int tab_width) {
  int tw = std::max(1, tab_width);
  int dc = 0;
  int n = std::min(col, static_cast<int>(s.size()));
  for (int i = 0; i < n; ++i) {
    if (s[static_cast<size_t>(i)] == '\t') dc += tw - dc % tw;
    else dc++;
  }
  return dc;
}

static int digits_of(int n) {
  int d = 1;
  while (n >= 10) { n /= 10; d++; }
  return d;
}

void Renderer::render(ITerminal& term, const RenderState& st) {
  TermSize sz = term.get_size();
  int rows = sz.rows, cols = sz.cols;
  term.clear();
  if (rows <= 0 || cols <= 0 || !st.buf || !st.vp) { term.refresh(); return; }
  const TextBuffer& buf = *st.buf;
  Viewport& vp = *st.vp;
  int max_text_rows = std::max(0, rows - 1);

  int gutter = 0;
  int ln_width = 0;
  if (st.view.show_line_numbers) {
    ln_width = digits_of(std::max(1, buf.line_count()));
    gutter = ln_width + 1;
  }
  int width = std::max(1, std::min(st.view.text_width, cols - gutter));
  int margin = std::max(0, (cols - gutter - width) / 2);
  int text_col0 = margin + gutter;

  Cursor cur = buf.cursor_position();
  std::string cur_line = buf.line(cur.row);
  int cur_dcol = display_col(cur_line, cur.col, st.view.tab_width);
  if (cur.row < vp.top_line) vp.top_line = cur.row;
  if (max_text_rows > 0 && cur.row >= vp.top_line + max_text_rows) vp.top_line = cur.row - max_text_rows + 1;
  if (cur_dcol < vp.left_col) vp.left_col = cur_dcol;
  else if (cur_dcol >= vp.left_col + width) vp.left_col = cur_dcol - width + 1;
  if (vp.left_col < 0) vp.left_col = 0;

  for (int i = 0; i < max_text_rows; ++i) {
    int line_idx = vp.top_line + i;
    if (line_idx >= buf.line_count()) break;
    if (st.view.show_line_numbers) {
      std::string num = std::to_string(line_idx + 1);
      std::string pad(static_cast<size_t>(std::max(0, ln_width - static_cast<int>(num.size()))), ' ');
      term.draw_text(i, margin, pad + num + " ");
    }
    std::string shown = expand_tabs(buf.line(line_idx), st.view.tab_width);
    int s_len = static_cast<int>(shown.size());
    int start = std::min(vp.left_col, s_len);
    int end = std::min(s_len, start + width);
    term.draw_text(i, text_col0, shown.substr(static_cast<size_t>(start), static_cast<size_t>(end - start)));
  }

  if (st.prompt_active) {
    term.draw_reverse(rows - 1, 0, st.prompt);
    term.clear_to_eol(rows - 1, static_cast<int>(st.prompt.size()));
    term.move_cursor(rows - 1, std::min(cols - 1, static_cast<int>(st.prompt.size())));
  } else {
    term.draw_text(rows - 1, 0, st.status.substr(0, static_cast<size_t>(cols)));
    int screen_row = cur.row - vp.top_line;
    int screen_col = text_col0 + (cur_dcol - vp.left_col);
    if (screen_row >= 0 && screen_row < max_text_rows) {
      term.move_cursor(screen_row, std::min(screen_col, cols - 1));
    } else {
      term.move_cursor(rows - 1, 0);
    }
  }
  term.refresh();
}
