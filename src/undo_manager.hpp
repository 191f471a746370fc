#pragma once
/*
 * UndoManager
 *
 * Purpose: per-buffer undo/redo engine. Owns the history and the recorder
 * that feeds it, and replays records against the attached TextBuffer.
 * Replay runs with recording suppressed and the redo stack preserved; both
 * flags are restored before undo()/redo() return.
 */
#include <string>
#include "edit_record.hpp"
#include "mutation_recorder.hpp"
#include "text_buffer.hpp"

class UndoManager {
public:
  explicit UndoManager(TextBuffer& buf);
  ~UndoManager();
  UndoManager(const UndoManager&) = delete;
  UndoManager& operator=(const UndoManager&) = delete;

  bool can_undo() const;
  bool can_redo() const;
  // empty stack: no mutation, msg explains why
  void undo(std::string& msg);
  void redo(std::string& msg);

  void begin_not_undoable();
  void end_not_undoable();

  bool modified() const { return history_.modified; }
  void set_modified(bool m) { history_.modified = m; }

  const UndoHistory& history() const { return history_; }
  size_t undo_size() const { return history_.undo_stack.size(); }
  size_t redo_size() const { return history_.redo_stack.size(); }

private:
  void replay_backward(const EditRecord& rec);
  void replay_forward(const EditRecord& rec);

  TextBuffer& buf_;
  UndoHistory history_;
  MutationRecorder recorder_;
  int not_undoable_depth_ = 0;
};

/*
 * NotUndoableScope
 *
 * RAII guard around begin_not_undoable()/end_not_undoable(), for bulk loads
 * (opening a file, filling the help buffer). Nested guards are fine.
 */
class NotUndoableScope {
public:
  explicit NotUndoableScope(UndoManager& um) : um_(um) { um_.begin_not_undoable(); }
  ~NotUndoableScope() { um_.end_not_undoable(); }
  NotUndoableScope(const NotUndoableScope&) = delete;
  NotUndoableScope& operator=(const NotUndoableScope&) = delete;
private:
  UndoManager& um_;
};
