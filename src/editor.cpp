#include "editor.hpp"

Editor::Editor(ITerminal& term, const std::optional<std::filesystem::path>& file, Settings settings)
    : term_(term), settings_(settings) {
  if (file) {
    bool ok = true;
    buf_ = TextBuffer::from_file(*file, message_, ok);
    status_.set_filename(file->string());
  }
  layout();
}

void Editor::layout() {
  TermSize sz = term_.get_size();
  int status_rows = (settings_.status_line && sz.rows > 1) ? 1 : 0;
  buf_.move_to(0, 0);
  buf_.resize(sz.cols, sz.rows - status_rows);
  status_.move_to(0, sz.rows - 1);
  status_.resize(status_rows ? sz.cols : 0);
  buf_.scroll();
}

void Editor::run() {
  while (!should_quit_) {
    render();
    handle_key(term_.read_key());
  }
}

void Editor::handle_key(const KeyEvent& ev) {
  handle_command(decode_key(ev));
}

void Editor::handle_command(const Command& cmd) {
  switch (cmd.type) {
    case CommandType::None: return;
    case CommandType::Quit: should_quit_ = true; return;
    case CommandType::Save: save(); return;
    case CommandType::Resize: layout(); return;
    case CommandType::MoveLeft: buf_.move_left(); break;
    case CommandType::MoveRight: buf_.move_right(); break;
    case CommandType::MoveUp: buf_.move_up(); break;
    case CommandType::MoveDown: buf_.move_down(); break;
    case CommandType::InsertChar: buf_.insert_char(cmd.ch); message_.clear(); break;
    case CommandType::InsertNewline: buf_.insert_newline(); message_.clear(); break;
    case CommandType::Backspace: if (buf_.backspace()) message_.clear(); break;
    case CommandType::DeleteForward: if (buf_.delete_forward()) message_.clear(); break;
  }
  buf_.scroll();
}

void Editor::save() {
  std::string msg;
  // a failed save keeps the session and the modified flag
  bool ok = buf_.save(msg);
  message_ = ok ? msg : "E: " + msg;
}

StatusInfo Editor::status_info() const {
  StatusInfo info;
  info.modified = buf_.modified();
  info.line = buf_.current_line();
  info.column = buf_.current_column();
  info.message = message_;
  return info;
}

void Editor::render() {
  renderer_.render(term_, buf_, settings_.status_line ? &status_ : nullptr, status_info(), settings_.color);
}
