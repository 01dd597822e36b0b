#pragma once
/*
 * Editor
 *
 * Purpose: one editing session over one buffer: reads a key, applies the
 *          command, rescrolls, repaints. Owns all session state.
 */
#include <optional>
#include <filesystem>
#include <string>
#include "text_buffer.hpp"
#include "status_line.hpp"
#include "renderer.hpp"
#include "iterminal.hpp"
#include "input.hpp"
#include "settings.hpp"

class Editor {
public:
  Editor(ITerminal& term, const std::optional<std::filesystem::path>& file,
         Settings settings = Settings());
  void run();
  void handle_key(const KeyEvent& ev);
  void handle_command(const Command& cmd);
  void render();

  bool should_quit() const { return should_quit_; }
  const TextBuffer& buffer() const { return buf_; }
  const StatusLine& status_line() const { return status_; }
  const std::string& message() const { return message_; }
  void set_message(std::string m) { message_ = std::move(m); }

private:
  void layout();
  void save();
  StatusInfo status_info() const;

  ITerminal& term_;
  Settings settings_;
  TextBuffer buf_;
  StatusLine status_;
  Renderer renderer_;
  std::string message_;
  bool should_quit_ = false;
};
