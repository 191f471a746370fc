#pragma once
/*
 * Editor
 *
 * Purpose: the application shell. Owns the ordered buffer list, routes keys
 * to commands or text edits, runs prompts on the status line and renders.
 * Note: every buffer keeps its own undo history; the shell only calls into it.
 */
#include <optional>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "types.hpp"
#include "document.hpp"
#include "keymap.hpp"
#include "cmd_registry.hpp"
#include "renderer.hpp"
#include "iterminal.hpp"

class Editor {
public:
  Editor(ITerminal& term,
         const std::vector<std::filesystem::path>& files,
         const std::optional<std::filesystem::path>& rc_file = std::nullopt);
  void run();
  void render();
  void handle_key(int ch);
  bool execute_command(const std::string& line);
  void load_rc(const std::filesystem::path& path);
  static std::optional<std::filesystem::path> default_rc_path();
  static std::string help_text(const Keymap& km);

  bool should_quit() const { return quit_requested; }
  int buffer_count() const { return static_cast<int>(docs.size()); }
  int current_index() const { return current; }
  Document& doc();
  const Document& doc() const;
  const std::string& status_message() const { return message; }
  Mode current_mode() const { return mode; }
  PromptKind current_prompt() const { return prompt_kind; }
  const ViewOptions& view_options() const { return view; }

private:
  struct Buffer {
    std::shared_ptr<Document> doc;
    Viewport vp;
    int goal_col = -1;
  };

  Document& new_buffer();
  bool open_into_new_buffer(const std::filesystem::path& path);
  void close_buffer();
  void set_buffer(int index);
  void next_buffer();
  void prev_buffer();
  void request_close();
  void request_quit();
  bool save_modified_buffers();
  std::string likely_directory() const;

  void start_prompt(PromptKind kind, const std::string& label, const std::string& initial);
  void end_prompt();
  void handle_prompt_key(int ch);
  void confirm_path_prompt();
  void confirm_choice(int ch);

  void handle_edit_key(int ch);
  void insert_text(const std::string& s);
  void backspace();
  void delete_forward();
  void move_horizontal(int delta);
  void move_vertical(int delta);
  void move_to_line_edge(bool end);

  void register_commands();

  ITerminal& term;
  Renderer renderer;
  Keymap keymap;
  CommandRegistry registry;
  std::vector<Buffer> docs;
  int current = 0;
  ViewOptions view;
  Mode mode = Mode::Edit;
  PromptKind prompt_kind = PromptKind::None;
  std::string prompt_label;
  std::string prompt_input;
  bool close_after_save = false;
  bool quit_after_save = false;
  bool quit_requested = false;
  std::string message;
};
