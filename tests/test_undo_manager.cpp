#include "undo_manager.hpp"
#include <cassert>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

static void type(TextBuffer& b, const std::string& s) {
  for (char c : s) b.insert(b.cursor(), std::string(1, c));
}

static void backspace(TextBuffer& b, int n) {
  for (int i = 0; i < n; ++i) b.erase(b.cursor() - 1, b.cursor());
}

static void del(TextBuffer& b, int n) {
  for (int i = 0; i < n; ++i) b.erase(b.cursor(), b.cursor() + 1);
}

static void load(UndoManager& um, TextBuffer& b, const std::string& text) {
  NotUndoableScope scope(um);
  b.set_text(text);
}

static void test_undo_all_restores_text_and_cursor() {
  TextBuffer b;
  UndoManager um(b);
  load(um, b, "hello ");
  assert(b.cursor() == 6);
  type(b, "cat dog");
  assert(um.undo_size() == 3);
  std::string msg;
  for (int i = 0; i < 3; ++i) um.undo(msg);
  assert(msg.empty());
  assert(b.text() == "hello ");
  assert(b.cursor() == 6);
  assert(!um.can_undo());
  assert(um.redo_size() == 3);
}

static void test_undo_then_redo_restores_state() {
  TextBuffer b;
  UndoManager um(b);
  type(b, "cat dog");
  std::string before = b.text();
  size_t cursor_before = b.cursor();
  std::string msg;
  um.undo(msg);
  assert(b.text() == "cat ");
  assert(b.cursor() == 4);
  um.redo(msg);
  assert(b.text() == before);
  assert(b.cursor() == cursor_before);
  assert(um.undo_size() == 3);
  assert(um.redo_size() == 0);
}

static void test_undo_on_empty_stack_changes_nothing() {
  TextBuffer b;
  UndoManager um(b);
  load(um, b, "keep");
  std::string msg;
  um.undo(msg);
  assert(msg == "nothing to undo");
  assert(b.text() == "keep");
  assert(!um.modified());
  assert(um.undo_size() == 0 && um.redo_size() == 0);
  msg.clear();
  um.redo(msg);
  assert(msg == "nothing to redo");
  assert(!um.modified());
}

static void test_one_undo_removes_a_typed_word() {
  TextBuffer b;
  UndoManager um(b);
  type(b, "cat");
  assert(um.undo_size() == 1);
  std::string msg;
  um.undo(msg);
  assert(b.empty());
  assert(b.cursor() == 0);
}

static void test_backspace_run_undo_places_cursor_at_end() {
  TextBuffer b;
  UndoManager um(b);
  load(um, b, "cat");
  backspace(b, 3);
  assert(um.undo_size() == 1);
  std::string msg;
  um.undo(msg);
  assert(b.text() == "cat");
  assert(b.cursor() == 3);
  um.redo(msg);
  assert(b.empty());
  assert(b.cursor() == 0);
}

static void test_delete_run_undo_places_cursor_at_start() {
  TextBuffer b;
  UndoManager um(b);
  load(um, b, "xcat");
  b.place_cursor(1);
  del(b, 3);
  assert(b.text() == "x");
  assert(um.undo_size() == 1);
  std::string msg;
  um.undo(msg);
  assert(b.text() == "xcat");
  assert(b.cursor() == 1);
}

static void test_suppressed_bulk_load_is_not_undoable() {
  TextBuffer b;
  UndoManager um(b);
  load(um, b, std::string(10000, 'a'));
  assert(b.size() == 10000);
  assert(!um.can_undo());
  assert(!um.modified());
  assert(!um.history().suppress_recording);
}

static void test_new_edit_after_undo_clears_redo() {
  TextBuffer b;
  UndoManager um(b);
  type(b, "cat");
  std::string msg;
  um.undo(msg);
  assert(um.can_redo());
  type(b, "x");
  assert(!um.can_redo());
  um.redo(msg);
  assert(msg == "nothing to redo");
  assert(b.text() == "x");
}

static void test_replay_does_not_record() {
  TextBuffer b;
  UndoManager um(b);
  type(b, "ab cd");
  std::string msg;
  um.undo(msg);
  um.undo(msg);
  assert(um.undo_size() == 1);
  assert(um.redo_size() == 2);
  um.redo(msg);
  assert(um.undo_size() == 2);
  assert(um.redo_size() == 1);
  assert(!um.history().replaying);
  assert(!um.history().suppress_recording);
}

static void test_modified_tracking() {
  TextBuffer b;
  UndoManager um(b);
  assert(!um.modified());
  type(b, "a");
  assert(um.modified());
  um.set_modified(false);
  std::string msg;
  um.undo(msg);
  assert(um.modified());
  um.set_modified(false);
  um.redo(msg);
  assert(um.modified());
}

static void test_nested_not_undoable_scopes() {
  TextBuffer b;
  UndoManager um(b);
  {
    NotUndoableScope outer(um);
    {
      NotUndoableScope inner(um);
      b.insert(0, "one");
    }
    assert(um.history().suppress_recording);
    b.insert(3, "two");
  }
  assert(!um.history().suppress_recording);
  assert(!um.can_undo());
  type(b, "x");
  assert(um.can_undo());
}

static void test_stale_record_throws_and_restores_flags() {
  TextBuffer b;
  UndoManager um(b);
  type(b, "abc");
  load(um, b, "");
  std::string msg;
  bool threw = false;
  try { um.undo(msg); } catch (const std::out_of_range&) { threw = true; }
  assert(threw);
  assert(!um.history().replaying);
  assert(!um.history().suppress_recording);
}

static void test_detaches_on_destruction() {
  TextBuffer b;
  {
    UndoManager um(b);
    assert(b.observer() != nullptr);
  }
  assert(b.observer() == nullptr);
  b.insert(0, "still editable");
}

static void test_random_session_round_trips() {
  TextBuffer b;
  UndoManager um(b);
  load(um, b, "the quick brown fox\njumps over\tthe lazy dog\n");
  b.place_cursor(4);
  const std::string initial = b.text();
  const size_t initial_cursor = b.cursor();
  std::mt19937 rng(1234);
  const std::string alphabet = "abc \t\nxyz";
  // the first recorded edit happens at the starting cursor
  type(b, "q");
  for (int step = 0; step < 2000; ++step) {
    int op = static_cast<int>(rng() % 10);
    if (op < 2) {
      b.place_cursor(rng() % (b.size() + 1));
    } else if (op < 7) {
      type(b, std::string(1, alphabet[rng() % alphabet.size()]));
    } else if (op < 9) {
      if (b.cursor() > 0) backspace(b, 1);
    } else {
      if (b.cursor() < b.size()) del(b, 1);
    }
  }
  const std::string final_text = b.text();
  std::string msg;
  while (um.can_undo()) um.undo(msg);
  assert(b.text() == initial);
  assert(b.cursor() == initial_cursor);
  while (um.can_redo()) um.redo(msg);
  assert(b.text() == final_text);
}

int main() {
  test_undo_all_restores_text_and_cursor();
  test_undo_then_redo_restores_state();
  test_undo_on_empty_stack_changes_nothing();
  test_one_undo_removes_a_typed_word();
  test_backspace_run_undo_places_cursor_at_end();
  test_delete_run_undo_places_cursor_at_start();
  test_suppressed_bulk_load_is_not_undoable();
  test_new_edit_after_undo_clears_redo();
  test_replay_does_not_record();
  test_modified_tracking();
  test_nested_not_undoable_scopes();
  test_stale_record_throws_and_restores_flags();
  test_detaches_on_destruction();
  test_random_session_round_trips();
  return 0;
}
