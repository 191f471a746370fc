#include <ncurses.h>
#include "editor.hpp"
#include <algorithm>
#include <cstdlib>
#include <plog/Log.h>

static constexpr int ESC = 27;

static inline bool is_enter(int ch) { return ch == '\n' || ch == '\r' || ch == KEY_ENTER; }
static inline bool is_backspace(int ch) { return ch == KEY_BACKSPACE || ch == 127 || ch == 8; }

Editor::Editor(ITerminal& t,
               const std::vector<std::filesystem::path>& files,
               const std::optional<std::filesystem::path>& rc_file)
  : term(t), keymap(Keymap::defaults()) {
  register_commands();
  bool all_opened = true;
  for (const auto& f : files) {
    if (!open_into_new_buffer(f)) all_opened = false;
  }
  if (docs.empty()) new_buffer();
  current = 0;
  // rc commands may touch the current buffer, so they run after it exists
  if (rc_file) {
    std::string opened = message;
    load_rc(*rc_file);
    message = opened;
  }
  if (all_opened) message = "Welcome to wroom, press F1 for help";
}

Document& Editor::doc() { return *docs[static_cast<size_t>(current)].doc; }
const Document& Editor::doc() const { return *docs[static_cast<size_t>(current)].doc; }

void Editor::run() {
  while (!quit_requested) {
    render();
    int ch = term.read_key();
    if (ch < 0) continue;
    handle_key(ch);
  }
}

void Editor::render() {
  RenderState st;
  st.buf = &doc().buf;
  st.vp = &docs[static_cast<size_t>(current)].vp;
  st.view = view;
  st.status = message;
  st.prompt_active = (mode == Mode::Prompt);
  st.prompt = prompt_label + prompt_input;
  renderer.render(term, st);
}

void Editor::handle_key(int ch) {
  if (ch < 0 || ch == KEY_RESIZE) return;
  if (mode == Mode::Prompt) { handle_prompt_key(ch); return; }
  if (const std::string* cmd = keymap.lookup(ch)) {
    execute_command(*cmd);
    return;
  }
  handle_edit_key(ch);
}

Document& Editor::new_buffer() {
  Buffer b;
  b.doc = std::make_shared<Document>();
  int idx = docs.empty() ? 0 : current + 1;
  docs.insert(docs.begin() + idx, std::move(b));
  PLOGI << "new buffer " << idx + 1 << " of " << docs.size();
  set_buffer(idx);
  return doc();
}

bool Editor::open_into_new_buffer(const std::filesystem::path& path) {
  Document& d = new_buffer();
  return d.open(path, message);
}

void Editor::close_buffer() {
  if (docs.size() > 1) {
    PLOGI << "closing buffer " << current + 1 << " (" << doc().display_name() << ")";
    docs.erase(docs.begin() + current);
    current = std::min(static_cast<int>(docs.size()) - 1, current);
    set_buffer(current);
  } else {
    quit_requested = true;
  }
}

void Editor::set_buffer(int index) {
  if (index < 0 || index >= static_cast<int>(docs.size())) return;
  current = index;
  message = "Switching to buffer " + std::to_string(current + 1) + " (" + doc().display_name() + ")";
}

void Editor::next_buffer() {
  set_buffer(current < static_cast<int>(docs.size()) - 1 ? current + 1 : 0);
}

void Editor::prev_buffer() {
  set_buffer(current > 0 ? current - 1 : static_cast<int>(docs.size()) - 1);
}

void Editor::request_close() {
  if (doc().modified()) {
    start_prompt(PromptKind::ConfirmClose, "Save changes to " + doc().display_name() + "? (y/n/c) ", "");
    return;
  }
  close_buffer();
}

void Editor::request_quit() {
  bool any = std::any_of(docs.begin(), docs.end(), [](const Buffer& b) { return b.doc->modified(); });
  if (any) {
    start_prompt(PromptKind::ConfirmQuit, "Save modified buffers before quitting? (y/n/c) ", "");
    return;
  }
  quit_requested = true;
}

// saves every modified buffer; stops at the first unnamed one (prompting for
// a path) or at the first failure
bool Editor::save_modified_buffers() {
  for (int i = 0; i < static_cast<int>(docs.size()); ++i) {
    Document& d = *docs[static_cast<size_t>(i)].doc;
    if (!d.modified()) continue;
    if (!d.file_path) {
      set_buffer(i);
      quit_after_save = true;
      start_prompt(PromptKind::SaveAsPath, "Save as: ", likely_directory());
      return false;
    }
    if (!d.save(message)) {
      set_buffer(i);
      std::string m = message;
      message = m + ", quit cancelled";
      return false;
    }
  }
  return true;
}

// directory of the nearest named buffer, searching backwards first
std::string Editor::likely_directory() const {
  auto dir_of = [](const Document& d) {
    std::error_code ec;
    auto abs = std::filesystem::absolute(*d.file_path, ec);
    if (ec) return std::string();
    return abs.parent_path().string() + "/";
  };
  for (int i = current; i >= 0; --i) {
    const Document& d = *docs[static_cast<size_t>(i)].doc;
    if (d.file_path) return dir_of(d);
  }
  for (int i = current + 1; i < static_cast<int>(docs.size()); ++i) {
    const Document& d = *docs[static_cast<size_t>(i)].doc;
    if (d.file_path) return dir_of(d);
  }
  return std::string();
}

void Editor::start_prompt(PromptKind kind, const std::string& label, const std::string& initial) {
  mode = Mode::Prompt;
  prompt_kind = kind;
  prompt_label = label;
  prompt_input = initial;
}

void Editor::end_prompt() {
  mode = Mode::Edit;
  prompt_kind = PromptKind::None;
  prompt_label.clear();
  prompt_input.clear();
}

void Editor::handle_prompt_key(int ch) {
  if (prompt_kind == PromptKind::ConfirmClose || prompt_kind == PromptKind::ConfirmQuit) {
    confirm_choice(ch);
    return;
  }
  if (ch == ESC) {
    end_prompt();
    close_after_save = quit_after_save = false;
    message = "Closed, no files selected";
    return;
  }
  if (is_backspace(ch)) { if (!prompt_input.empty()) prompt_input.pop_back(); return; }
  if (is_enter(ch)) { confirm_path_prompt(); return; }
  if (ch >= 32 && ch <= 126) prompt_input.push_back(static_cast<char>(ch));
}

void Editor::confirm_path_prompt() {
  PromptKind kind = prompt_kind;
  std::string input = prompt_input;
  end_prompt();
  if (input.empty() || input.back() == '/') {
    close_after_save = quit_after_save = false;
    message = "Closed, no files selected";
    return;
  }
  std::filesystem::path path(input);
  if (kind == PromptKind::OpenPath) {
    open_into_new_buffer(path);
    return;
  }
  if (!doc().save_as(path, message)) {
    close_after_save = quit_after_save = false;
    return;
  }
  if (close_after_save) {
    close_after_save = false;
    close_buffer();
  } else if (quit_after_save) {
    quit_after_save = false;
    if (save_modified_buffers()) quit_requested = true;
  }
}

void Editor::confirm_choice(int ch) {
  PromptKind kind = prompt_kind;
  switch (ch) {
    case 'y': case 'Y':
      end_prompt();
      if (kind == PromptKind::ConfirmClose) {
        if (!doc().file_path) {
          close_after_save = true;
          start_prompt(PromptKind::SaveAsPath, "Save as: ", likely_directory());
        } else if (doc().save(message)) {
          close_buffer();
        }
      } else if (save_modified_buffers()) {
        quit_requested = true;
      }
      break;
    case 'n': case 'N':
      end_prompt();
      if (kind == PromptKind::ConfirmClose) close_buffer();
      else quit_requested = true;
      break;
    case 'c': case 'C': case ESC:
      end_prompt();
      message = "Cancelled";
      break;
    default:
      break;
  }
}

void Editor::handle_edit_key(int ch) {
  Buffer& b = docs[static_cast<size_t>(current)];
  if (ch != KEY_UP && ch != KEY_DOWN) b.goal_col = -1;
  switch (ch) {
    case KEY_LEFT: move_horizontal(-1); return;
    case KEY_RIGHT: move_horizontal(1); return;
    case KEY_UP: move_vertical(-1); return;
    case KEY_DOWN: move_vertical(1); return;
    case KEY_HOME: move_to_line_edge(false); return;
    case KEY_END: move_to_line_edge(true); return;
    case KEY_DC: message.clear(); delete_forward(); return;
    case ESC: return;
    default: break;
  }
  if (is_backspace(ch)) { message.clear(); backspace(); return; }
  if (is_enter(ch)) { message.clear(); insert_text("\n"); return; }
  if (ch == '\t' || (ch >= 32 && ch <= 126)) {
    message.clear();
    insert_text(std::string(1, static_cast<char>(ch)));
  }
}

void Editor::insert_text(const std::string& s) {
  TextBuffer& buf = doc().buf;
  buf.insert(buf.cursor(), s);
}

void Editor::backspace() {
  TextBuffer& buf = doc().buf;
  size_t c = buf.cursor();
  if (c > 0) buf.erase(c - 1, c);
}

void Editor::delete_forward() {
  TextBuffer& buf = doc().buf;
  size_t c = buf.cursor();
  if (c < buf.size()) buf.erase(c, c + 1);
}

void Editor::move_horizontal(int delta) {
  TextBuffer& buf = doc().buf;
  size_t c = buf.cursor();
  if (delta < 0 && c > 0) buf.place_cursor(c - 1);
  else if (delta > 0 && c < buf.size()) buf.place_cursor(c + 1);
}

void Editor::move_vertical(int delta) {
  Buffer& b = docs[static_cast<size_t>(current)];
  TextBuffer& buf = b.doc->buf;
  Cursor cur = buf.cursor_position();
  if (b.goal_col < 0) b.goal_col = cur.col;
  int row = cur.row + delta;
  if (row < 0 || row >= buf.line_count()) return;
  buf.place_cursor(buf.offset_at(row, b.goal_col));
}

void Editor::move_to_line_edge(bool end) {
  TextBuffer& buf = doc().buf;
  int row = buf.cursor_position().row;
  buf.place_cursor(buf.line_start(row) + (end ? buf.line_length(row) : 0));
}

std::optional<std::filesystem::path> Editor::default_rc_path() {
  const char* home = std::getenv("HOME");
  if (!home) return std::nullopt;
  return std::filesystem::path(home) / WR_RC_FILE_NAME;
}
