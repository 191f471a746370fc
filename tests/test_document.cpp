#include "document.hpp"
#include "file_io.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <unistd.h>

namespace fs = std::filesystem;

static fs::path scratch_dir() {
  fs::path dir = fs::temp_directory_path() / ("wroom_doc_" + std::to_string(::getpid()));
  fs::create_directories(dir);
  return dir;
}

static std::string slurp(const fs::path& p) {
  std::ifstream in(p, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

static void test_load_is_not_undoable() {
  Document d;
  d.load_text("some loaded text");
  assert(d.buf.text() == "some loaded text");
  assert(d.buf.cursor() == 0);
  assert(!d.modified());
  assert(!d.um.can_undo());
  d.buf.insert(0, "x");
  assert(d.modified());
  assert(d.um.can_undo());
}

static void test_word_count_and_info() {
  Document d;
  assert(d.word_count() == 0);
  assert(d.info(0) == "Buffer 1: * Unnamed *, 0 byte(s), 0 word(s), 1 line(s)");
  d.load_text("don't  stop_me\nnow, 42 times\n");
  assert(d.word_count() == 5);
  assert(d.display_name() == "* Unnamed *");
  d.buf.insert(0, "a ");
  assert(d.info(2) == "Buffer 3: * Unnamed * (modified), 31 byte(s), 6 word(s), 3 line(s)");
}

static void test_open_missing_file() {
  fs::path dir = scratch_dir();
  Document d;
  d.buf.insert(0, "old");
  std::string msg;
  fs::path missing = dir / "missing.txt";
  assert(!d.open(missing, msg));
  assert(msg == "Unable to open " + missing.string() + ". The file does not exist.");
  // still bound to the path: the first save creates the file
  assert(d.file_path && *d.file_path == missing);
  assert(d.display_name() == missing.string());
  assert(d.buf.empty());
  assert(!d.modified());
  d.buf.insert(0, "new");
  assert(d.save(msg));
  assert(fs::exists(missing));
  assert(slurp(missing) == "new");
  fs::remove_all(dir);
}

static void test_open_directory_unbinds() {
  fs::path dir = scratch_dir();
  Document d;
  d.file_path = dir / "previous.txt";
  std::string msg;
  assert(!d.open(dir, msg));
  assert(msg == "Unable to open " + dir.string() + ". It is a directory.");
  assert(!d.file_path);
  assert(d.buf.empty());
  fs::remove_all(dir);
}

static void test_save_requires_a_name() {
  Document d;
  d.buf.insert(0, "x");
  std::string msg;
  assert(!d.save(msg));
  assert(msg == "no file name, use save as");
  assert(d.modified());
}

static void test_save_as_then_open_round_trip() {
  fs::path dir = scratch_dir();
  fs::path p = dir / "note.txt";
  Document d;
  for (char c : std::string("first line\nsecond")) d.buf.insert(d.buf.cursor(), std::string(1, c));
  assert(d.modified());
  std::string msg;
  assert(d.save_as(p, msg));
  assert(msg == "File " + p.string() + " saved");
  assert(!d.modified());
  assert(d.file_path && *d.file_path == p);
  assert(d.display_name() == p.string());
  assert(slurp(p) == "first line\nsecond");
  assert(!fs::exists(p.string() + ".tmp"));
  // undo history survives a save
  assert(d.um.can_undo());

  Document e;
  assert(e.open(p, msg));
  assert(msg == "File " + p.string() + " open");
  assert(e.buf.text() == "first line\nsecond");
  assert(e.buf.line_count() == 2);
  assert(!e.modified());
  assert(!e.um.can_undo());
  fs::remove_all(dir);
}

static void test_save_as_failure_keeps_old_name() {
  fs::path dir = scratch_dir();
  fs::path good = dir / "good.txt";
  Document d;
  d.buf.insert(0, "text");
  std::string msg;
  assert(d.save_as(good, msg));
  d.buf.insert(4, "!");
  fs::path bad = dir / "no_such_dir" / "bad.txt";
  assert(!d.save_as(bad, msg));
  assert(msg == "Unable to save " + bad.string());
  assert(d.file_path && *d.file_path == good);
  assert(d.modified());
  fs::remove_all(dir);
}

static void test_crlf_is_normalised() {
  fs::path dir = scratch_dir();
  fs::path p = dir / "dos.txt";
  {
    std::ofstream out(p, std::ios::binary);
    out << "one\r\ntwo\r\n";
  }
  std::string text, msg;
  assert(read_file_text(p, text, msg));
  assert(text == "one\ntwo\n");
  std::vector<std::string> lines;
  assert(read_file_lines(p, lines, msg));
  assert(lines.size() == 3);
  assert(lines[0] == "one" && lines[1] == "two" && lines[2].empty());
  fs::remove_all(dir);
}

int main() {
  test_load_is_not_undoable();
  test_word_count_and_info();
  test_open_missing_file();
  test_open_directory_unbinds();
  test_save_requires_a_name();
  test_save_as_then_open_round_trip();
  test_save_as_failure_keeps_old_name();
  test_crlf_is_normalised();
  return 0;
}
