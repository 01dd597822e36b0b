#pragma once
/*
 * Input
 *
 * Purpose: map one key event to one editor command.
 * Bindings: Ctrl-Q quit, Ctrl-S save, arrows move, Enter newline,
 *           Backspace/DEL/Ctrl-H delete back, Delete forward, printable insert.
 * A failed read on the terminal closes the session unless it was interrupted.
 */
#include "types.hpp"

enum class CommandType {
  None,
  Quit,
  Save,
  MoveLeft,
  MoveRight,
  MoveUp,
  MoveDown,
  InsertChar,
  InsertNewline,
  Backspace,
  DeleteForward,
  Resize,
};

struct Command {
  CommandType type = CommandType::None;
  char32_t ch = 0; // valid for InsertChar
};

inline constexpr char32_t ctrl_key(char c) { return static_cast<char32_t>(c & 0x1f); }

Command decode_key(const KeyEvent& ev);
bool is_insertable(char32_t ch);
// key for a read that returned no input; err is the errno seen by the read
KeyEvent key_from_read_error(int err);
