#include "document.hpp"
#include "file_io.hpp"
#include "config.hpp"
#include <cctype>
#include <sstream>
#include <system_error>
#include <plog/Log.h>

static bool is_word_unit(unsigned char c) {
  return std::isalnum(c) != 0 || c == '_' || c == '\'' || c >= 0x80;
}

Document::Document() : um(buf) {}

void Document::load_text(std::string_view text) {
  {
    NotUndoableScope scope(um);
    buf.set_text(text);
  }
  buf.place_cursor(0);
  um.set_modified(false);
}

bool Document::open(const std::filesystem::path& path, std::string& msg) {
  std::string text;
  if (!read_file_text(path, text, msg)) {
    PLOGW << msg;
    // a path that does not exist yet stays bound, so the first save creates it
    std::error_code ec;
    if (std::filesystem::status(path, ec).type() == std::filesystem::file_type::not_found) file_path = path;
    else file_path.reset();
    load_text("");
    return false;
  }
  file_path = path;
  load_text(text);
  PLOGI << "opened " << path.string() << " (" << text.size() << " bytes)";
  return true;
}

bool Document::save(std::string& msg) {
  if (!file_path) { msg = "no file name, use save as"; return false; }
  if (!write_file_text(*file_path, buf.text(), msg)) {
    PLOGW << msg;
    return false;
  }
  um.set_modified(false);
  PLOGI << "saved " << file_path->string();
  return true;
}

bool Document::save_as(const std::filesystem::path& path, std::string& msg) {
  std::optional<std::filesystem::path> old = file_path;
  file_path = path;
  if (!save(msg)) { file_path = old; return false; }
  return true;
}

std::string Document::display_name() const {
  return file_path ? file_path->string() : std::string(WR_UNNAMED_NAME);
}

size_t Document::word_count() const {
  size_t count = 0;
  bool in_word = false;
  for (char c : buf.text()) {
    bool w = is_word_unit(static_cast<unsigned char>(c));
    if (w && !in_word) ++count;
    in_word = w;
  }
  return count;
}

std::string Document::info(int index) const {
  std::ostringstream oss;
  oss << "Buffer " << index + 1 << ": " << display_name()
      << (modified() ? " (modified)" : "")
      << ", " << buf.size() << " byte(s)"
      << ", " << word_count() << " word(s)"
      << ", " << buf.line_count() << " line(s)";
  return oss.str();
}
