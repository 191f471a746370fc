#pragma once
/*
 * Document
 *
 * Purpose: one open buffer of the editor: text, its undo history and the
 * file it is bound to. Loading replaces the text without recording it.
 * Note: not movable; UndoManager keeps a reference to `buf`.
 */
#include <optional>
#include <filesystem>
#include <string>
#include "text_buffer.hpp"
#include "undo_manager.hpp"

class Document {
public:
  Document();
  Document(const Document&) = delete;
  Document& operator=(const Document&) = delete;

  TextBuffer buf;
  UndoManager um;
  std::optional<std::filesystem::path> file_path;

  void load_text(std::string_view text);
  bool open(const std::filesystem::path& path, std::string& msg);
  bool save(std::string& msg);
  bool save_as(const std::filesystem::path& path, std::string& msg);

  bool modified() const { return um.modified(); }
  std::string display_name() const;
  size_t word_count() const;
  std::string info(int index) const;
};
