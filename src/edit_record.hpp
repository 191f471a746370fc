#pragma once
/*
 * EditRecord
 *
 * Purpose: one recorded mutation, either an insertion or a deletion.
 * Invariant: `mergeable` is fixed at construction; only a merge may extend
 * a record after it has been pushed.
 */
#include <string>
#include <string_view>
#include <variant>
#include <cstddef>

struct InsertRecord {
  size_t offset = 0;
  std::string text;
  size_t length = 0;
  bool mergeable = false;
};

struct DeleteRecord {
  std::string deleted_text;
  size_t start = 0;
  size_t end = 0;
  bool delete_key_used = false;
  bool mergeable = false;
};

using EditRecord = std::variant<InsertRecord, DeleteRecord>;

InsertRecord make_insert_record(size_t offset, std::string_view text);
// cursor is the cursor offset just before the deletion happened
DeleteRecord make_delete_record(size_t start, size_t end, std::string_view deleted, size_t cursor);

// "\r", "\n" and a lone space always end a merge run
bool is_run_breaker(std::string_view text);
// non-empty and made only of spaces/tabs
bool is_whitespace_run(std::string_view text);
