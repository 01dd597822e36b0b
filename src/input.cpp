#include "input.hpp"
#include <cerrno>

static constexpr char32_t DEL = 127;

bool is_insertable(char32_t ch) {
  if (ch == U'\t') return true;
  if (ch < 0x20 || ch == DEL) return false;
  if (ch >= 0x80 && ch < 0xA0) return false; // C1 controls
  if (ch >= 0xD800 && ch <= 0xDFFF) return false;
  return ch <= 0x10FFFF;
}

Command decode_key(const KeyEvent& ev) {
  switch (ev.key) {
    case Key::Left: return {CommandType::MoveLeft};
    case Key::Right: return {CommandType::MoveRight};
    case Key::Up: return {CommandType::MoveUp};
    case Key::Down: return {CommandType::MoveDown};
    case Key::Enter: return {CommandType::InsertNewline};
    case Key::Backspace: return {CommandType::Backspace};
    case Key::Delete: return {CommandType::DeleteForward};
    case Key::Resize: return {CommandType::Resize};
    case Key::Closed: return {CommandType::Quit};
    case Key::None: return {};
    case Key::Char: break;
  }
  char32_t ch = ev.ch;
  if (ch == ctrl_key('q')) return {CommandType::Quit};
  if (ch == ctrl_key('s')) return {CommandType::Save};
  if (ch == U'\r' || ch == U'\n') return {CommandType::InsertNewline};
  if (ch == DEL || ch == ctrl_key('h')) return {CommandType::Backspace};
  if (is_insertable(ch)) return {CommandType::InsertChar, ch};
  return {};
}

KeyEvent key_from_read_error(int err) {
  if (err == EINTR) return KeyEvent{};
  return KeyEvent{Key::Closed, 0};
}
