#pragma once
/*
 * Renderer
 *
 * Purpose: draw the active buffer as a centred text column, plus the status
 * line (or the open prompt) on the last row.
 * Dependency: draws via ITerminal to allow backend replacement.
 * Constraint: stateless apart from the viewport it is handed.
 */
#include <string>
#include "text_buffer.hpp"
#include "types.hpp"
#include "iterminal.hpp"

struct RenderState {
  const TextBuffer* buf = nullptr;
  Viewport* vp = nullptr;
  ViewOptions view{};
  std::string status;
  bool prompt_active = false;
  std::string prompt;
};

std::string expand_tabs(const std::string& s, int tab_width);
// display column of byte column `col` once tabs are expanded
int display_col(const std::string& s, int col, int tab_width);

class Renderer {
public:
  void render(ITerminal& term, const RenderState& st);
};
