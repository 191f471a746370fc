#include "mutation_recorder.hpp"
#include <plog/Log.h>

static bool same_class(std::string_view a, std::string_view b) {
  return is_whitespace_run(a) == is_whitespace_run(b);
}

bool can_merge_insert(const InsertRecord& prev, const InsertRecord& cur) {
  if (!prev.mergeable || !cur.mergeable) return false;
  // typing elsewhere starts a new step
  if (cur.offset != prev.offset + prev.length) return false;
  return same_class(prev.text, cur.text);
}

bool can_merge_delete(const DeleteRecord& prev, const DeleteRecord& cur) {
  if (!prev.mergeable || !cur.mergeable) return false;
  if (prev.delete_key_used != cur.delete_key_used) return false;
  if (prev.start != cur.start && prev.start != cur.end) return false;
  return same_class(prev.deleted_text, cur.deleted_text);
}

void merge_insert(InsertRecord& prev, const InsertRecord& cur) {
  prev.text += cur.text;
  prev.length += cur.length;
}

void merge_delete(DeleteRecord& prev, const DeleteRecord& cur) {
  if (prev.start == cur.start) {
    // delete key: the text to the right keeps sliding into `start`
    prev.deleted_text += cur.deleted_text;
    prev.end += cur.end - cur.start;
  } else {
    // backspace: the run grows to the left
    prev.deleted_text = cur.deleted_text + prev.deleted_text;
    prev.start = cur.start;
  }
}

// returns false when the mutation must not be recorded
bool MutationRecorder::begin_record() {
  if (!history_.replaying) history_.redo_stack.clear();
  return !history_.suppress_recording;
}

void MutationRecorder::on_insert(size_t offset, std::string_view text) {
  if (!begin_record()) return;
  InsertRecord rec = make_insert_record(offset, text);
  auto& stack = history_.undo_stack;
  InsertRecord* prev = stack.empty() ? nullptr : std::get_if<InsertRecord>(&stack.back());
  if (prev && can_merge_insert(*prev, rec)) {
    merge_insert(*prev, rec);
    PLOGV << "undo: merged insert at " << offset << " -> run of " << prev->length;
  } else {
    stack.emplace_back(std::move(rec));
  }
  history_.modified = true;
}

void MutationRecorder::on_delete(size_t start, size_t end, std::string_view deleted, size_t cursor) {
  if (!begin_record()) return;
  DeleteRecord rec = make_delete_record(start, end, deleted, cursor);
  auto& stack = history_.undo_stack;
  DeleteRecord* prev = stack.empty() ? nullptr : std::get_if<DeleteRecord>(&stack.back());
  if (prev && can_merge_delete(*prev, rec)) {
    merge_delete(*prev, rec);
    PLOGV << "undo: merged delete [" << prev->start << "," << prev->end << ")";
  } else {
    stack.emplace_back(std::move(rec));
  }
  history_.modified = true;
}
