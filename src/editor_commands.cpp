#include "editor.hpp"
#include "file_io.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <system_error>
#include <string>
#include <plog/Log.h>

static bool parse_positive(const std::string& s, int& out) {
  if (s.empty() || s.size() > 6) return false;
  if (!std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) return false;
  out = std::stoi(s);
  return out >= 1;
}

static std::string trim(const std::string& s) {
  auto isspace_fn = [](unsigned char c) { return std::isspace(c) != 0; };
  size_t i = 0; while (i < s.size() && isspace_fn(static_cast<unsigned char>(s[i]))) i++;
  size_t j = s.size(); while (j > i && isspace_fn(static_cast<unsigned char>(s[j - 1]))) j--;
  return s.substr(i, j - i);
}

void Editor::register_commands() {
  registry.register_command("undo", [this](const std::vector<std::string>&) {
    std::string m;
    doc().um.undo(m);
    message = m;
  });
  registry.register_command("redo", [this](const std::vector<std::string>&) {
    std::string m;
    doc().um.redo(m);
    message = m;
  });
  registry.register_command("new", [this](const std::vector<std::string>&) { new_buffer(); });
  registry.register_command("open", [this](const std::vector<std::string>& args) {
    if (!args.empty()) { open_into_new_buffer(args[0]); return; }
    start_prompt(PromptKind::OpenPath, "Open file: ", likely_directory());
  });
  registry.register_command("save", [this](const std::vector<std::string>&) {
    if (!doc().file_path) {
      start_prompt(PromptKind::SaveAsPath, "Save as: ", likely_directory());
      return;
    }
    doc().save(message);
  });
  registry.register_command("saveas", [this](const std::vector<std::string>& args) {
    if (!args.empty()) { doc().save_as(args[0], message); return; }
    std::string initial = doc().file_path ? doc().file_path->string() : likely_directory();
    start_prompt(PromptKind::SaveAsPath, "Save as: ", initial);
  });
  registry.register_command("close", [this](const std::vector<std::string>&) { request_close(); });
  registry.register_command("quit", [this](const std::vector<std::string>&) { request_quit(); });
  registry.register_command("help", [this](const std::vector<std::string>&) {
    Document& d = new_buffer();
    d.load_text(help_text(keymap));
    message = "Displaying help. Press " + Keymap::key_name(ctrl_key('w')) +
              " to exit and continue editing your document.";
  });
  registry.register_command("info", [this](const std::vector<std::string>&) {
    message = doc().info(current);
  });
  registry.register_command("number", [this](const std::vector<std::string>&) {
    view.show_line_numbers = !view.show_line_numbers;
    message = view.show_line_numbers ? "line numbers on" : "line numbers off";
  });
  registry.register_command("next", [this](const std::vector<std::string>&) { next_buffer(); });
  registry.register_command("prev", [this](const std::vector<std::string>&) { prev_buffer(); });

  registry.register_command("set number", [this](const std::vector<std::string>& args) {
    if (args.empty()) { view.show_line_numbers = !view.show_line_numbers; }
    else if (args[0] == "on") { view.show_line_numbers = true; }
    else if (args[0] == "off") { view.show_line_numbers = false; }
    else { message = "set number: use set number on|off"; return; }
    message = view.show_line_numbers ? "line numbers on" : "line numbers off";
  });
  registry.register_command("set textwidth", [this](const std::vector<std::string>& args) {
    int w = 0;
    if (args.empty() || !parse_positive(args[0], w)) { message = "set textwidth: width must be a number >= 1"; return; }
    view.text_width = w;
    message = "textwidth=" + std::to_string(w);
  });
  registry.register_command("set tabwidth", [this](const std::vector<std::string>& args) {
    int w = 0;
    if (args.empty() || !parse_positive(args[0], w)) { message = "set tabwidth: width must be a number >= 1"; return; }
    view.tab_width = w;
    message = "tabwidth=" + std::to_string(w);
  });
}

bool Editor::execute_command(const std::string& line) {
  std::string err;
  if (registry.execute_line(line, err)) return true;
  message = err;
  return false;
}

void Editor::load_rc(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) return;
  std::vector<std::string> lines; std::string msg;
  if (!read_file_lines(path, lines, msg)) {
    PLOGW << "rc: " << msg;
    message = msg;
    return;
  }
  for (const std::string& raw : lines) {
    std::string s = trim(raw);
    if (s.empty()) continue;
    if (s[0] == '#' || s[0] == '"') continue;
    if (s.size() >= 2 && s[0] == '/' && s[1] == '/') continue;
    if (s[0] == ':') s.erase(s.begin());
    if (!execute_command(s)) PLOGW << "rc: " << path.string() << ": " << message;
  }
  PLOGI << "rc: loaded " << path.string();
}

std::string Editor::help_text(const Keymap& km) {
  std::ostringstream oss;
  oss << "wroom - distraction free writing\n"
      << "\n"
      << "To hide this help buffer, press " << Keymap::key_name(ctrl_key('w')) << ".\n"
      << "\n"
      << "There are no menus and no buttons, only your text and a handful of\n"
      << "keyboard shortcuts. Each buffer keeps its own undo history; typing is\n"
      << "undone a word at a time.\n"
      << "\n"
      << "Commands:\n"
      << "---------\n";
  for (const KeyBinding& b : km.bindings()) {
    oss << Keymap::key_name(b.key) << ": " << b.help << "\n";
  }
  return oss.str();
}
