#pragma once
/*
 * MutationRecorder
 *
 * Purpose: turn buffer insert/delete notifications into undo records.
 * Merging: consecutive single-unit edits of the same whitespace class fold
 * into the top record so a typed word or a held backspace undoes as one step.
 * Only the top of the undo stack is ever inspected.
 */
#include <vector>
#include "edit_record.hpp"
#include "i_buffer_observer.hpp"

struct UndoHistory {
  std::vector<EditRecord> undo_stack;
  std::vector<EditRecord> redo_stack;
  bool modified = false;
  bool suppress_recording = false;
  bool replaying = false;
};

bool can_merge_insert(const InsertRecord& prev, const InsertRecord& cur);
bool can_merge_delete(const DeleteRecord& prev, const DeleteRecord& cur);
void merge_insert(InsertRecord& prev, const InsertRecord& cur);
void merge_delete(DeleteRecord& prev, const DeleteRecord& cur);

class MutationRecorder : public IBufferObserver {
public:
  explicit MutationRecorder(UndoHistory& history) : history_(history) {}

  void on_insert(size_t offset, std::string_view text) override;
  void on_delete(size_t start, size_t end, std::string_view deleted, size_t cursor) override;

private:
  bool begin_record();
  UndoHistory& history_;
};
