#pragma once
/*
 * IBufferObserver
 *
 * Purpose: mutation hooks a TextBuffer fires before applying an edit.
 * Contract: on_delete carries the text about to be removed and the cursor
 * offset as it was before the deletion.
 */
#include <cstddef>
#include <string_view>

class IBufferObserver {
public:
  virtual ~IBufferObserver() = default;
  virtual void on_insert(size_t offset, std::string_view text) = 0;
  virtual void on_delete(size_t start, size_t end, std::string_view deleted, size_t cursor) = 0;
};
