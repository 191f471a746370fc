#include "undo_manager.hpp"
#include <utility>
#include <plog/Log.h>

namespace {
// suppress + replaying for the duration of one replay, restored on any exit
class ReplayScope {
public:
  explicit ReplayScope(UndoHistory& h)
    : h_(h), old_suppress_(h.suppress_recording), old_replaying_(h.replaying) {
    h_.suppress_recording = true;
    h_.replaying = true;
  }
  ~ReplayScope() {
    h_.suppress_recording = old_suppress_;
    h_.replaying = old_replaying_;
  }
  ReplayScope(const ReplayScope&) = delete;
  ReplayScope& operator=(const ReplayScope&) = delete;
private:
  UndoHistory& h_;
  bool old_suppress_;
  bool old_replaying_;
};
}

UndoManager::UndoManager(TextBuffer& buf) : buf_(buf), recorder_(history_) {
  buf_.set_observer(&recorder_);
}

UndoManager::~UndoManager() {
  if (buf_.observer() == &recorder_) buf_.set_observer(nullptr);
}

bool UndoManager::can_undo() const { return !history_.undo_stack.empty(); }
bool UndoManager::can_redo() const { return !history_.redo_stack.empty(); }

void UndoManager::undo(std::string& msg) {
  if (history_.undo_stack.empty()) { msg = "nothing to undo"; return; }
  ReplayScope scope(history_);
  EditRecord rec = std::move(history_.undo_stack.back());
  history_.undo_stack.pop_back();
  history_.redo_stack.push_back(rec);
  replay_backward(rec);
  history_.modified = true;
}

void UndoManager::redo(std::string& msg) {
  if (history_.redo_stack.empty()) { msg = "nothing to redo"; return; }
  ReplayScope scope(history_);
  EditRecord rec = std::move(history_.redo_stack.back());
  history_.redo_stack.pop_back();
  history_.undo_stack.push_back(rec);
  replay_forward(rec);
  history_.modified = true;
}

void UndoManager::replay_backward(const EditRecord& rec) {
  if (const auto* ins = std::get_if<InsertRecord>(&rec)) {
    PLOGD << "undo: remove [" << ins->offset << "," << ins->offset + ins->length << ")";
    buf_.erase(ins->offset, ins->offset + ins->length);
    buf_.place_cursor(ins->offset);
  } else if (const auto* del = std::get_if<DeleteRecord>(&rec)) {
    PLOGD << "undo: restore " << del->deleted_text.size() << " byte(s) at " << del->start;
    buf_.insert(del->start, del->deleted_text);
    buf_.place_cursor(del->delete_key_used ? del->start : del->end);
  }
}

void UndoManager::replay_forward(const EditRecord& rec) {
  if (const auto* ins = std::get_if<InsertRecord>(&rec)) {
    PLOGD << "redo: insert " << ins->length << " byte(s) at " << ins->offset;
    buf_.insert(ins->offset, ins->text);
    buf_.place_cursor(ins->offset + ins->length);
  } else if (const auto* del = std::get_if<DeleteRecord>(&rec)) {
    PLOGD << "redo: remove [" << del->start << "," << del->end << ")";
    buf_.erase(del->start, del->end);
    buf_.place_cursor(del->start);
  }
}

void UndoManager::begin_not_undoable() {
  ++not_undoable_depth_;
  history_.suppress_recording = true;
}

void UndoManager::end_not_undoable() {
  if (not_undoable_depth_ > 0) --not_undoable_depth_;
  if (not_undoable_depth_ == 0) history_.suppress_recording = false;
}
