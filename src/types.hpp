#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs (LineSpan/Viewport/ScreenPos).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */
#include <cstddef>

// Inclusive [start, end] range of one logical line, newline included.
// The final span is degenerate (start == end == data length) when the text
// is empty or ends with '\n'; it covers no characters.
struct LineSpan { size_t start = 0; size_t end = 0; };

// Screen rectangle of a buffer plus how far its content is scrolled.
struct Viewport {
  int x = 0;
  int y = 0;
  int width = 0;
  int height = 0;
  size_t offset_y = 0;
  size_t offset_x = 0;
};

struct ScreenPos { long x = 0; long y = 0; };

// Terminal-independent key event; backends translate their own codes into it.
enum class Key { None, Char, Left, Right, Up, Down, Enter, Backspace, Delete, Resize, Closed };
struct KeyEvent { Key key = Key::None; char32_t ch = 0; };
