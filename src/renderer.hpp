#pragma once
/*
 * Renderer
 *
 * Purpose: paint the visible window of a buffer and the status line.
 * Dependency: draws via ITerminal to allow backend replacement.
 * Constraint: stateless; reads buffer state, never scrolls it.
 */
#include <string>
#include "text_buffer.hpp"
#include "status_line.hpp"
#include "iterminal.hpp"

class Renderer {
public:
  void render(ITerminal& term,
              const TextBuffer& buf,
              const StatusLine* status,
              const StatusInfo& info,
              bool enable_color);

  // Visible part of one buffer line: starts at offset_x, at most width cells,
  // newline dropped, tabs and control characters shown as one blank each.
  static std::string visible_slice(const TextBuffer& buf, size_t row);
};
