#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs/enums (Mode/Cursor/Viewport/ViewOptions).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */
#include "config.hpp"

enum class Mode { Edit, Prompt };

enum class PromptKind { None, OpenPath, SaveAsPath, ConfirmClose, ConfirmQuit };

struct Cursor { int row = 0; int col = 0; };
struct Viewport { int top_line = 0; int left_col = 0; };

struct ViewOptions {
  bool show_line_numbers = false;
  int text_width = WR_DEFAULT_TEXT_WIDTH;
  int tab_width = WR_DEFAULT_TAB_WIDTH;
};
