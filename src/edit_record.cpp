#include "edit_record.hpp"
#include <algorithm>

bool is_run_breaker(std::string_view text) {
  return text == "\r" || text == "\n" || text == " ";
}

bool is_whitespace_run(std::string_view text) {
  if (text.empty()) return false;
  return std::all_of(text.begin(), text.end(), [](char c) { return c == ' ' || c == '\t'; });
}

InsertRecord make_insert_record(size_t offset, std::string_view text) {
  InsertRecord r;
  r.offset = offset;
  r.text = std::string(text);
  r.length = text.size();
  r.mergeable = !(r.length > 1 || is_run_breaker(text));
  return r;
}

DeleteRecord make_delete_record(size_t start, size_t end, std::string_view deleted, size_t cursor) {
  DeleteRecord r;
  r.deleted_text = std::string(deleted);
  r.start = start;
  r.end = end;
  r.delete_key_used = cursor <= start;
  r.mergeable = !(end - start > 1 || is_run_breaker(deleted));
  return r;
}
