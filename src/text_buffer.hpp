#pragma once
/*
 * TextBuffer
 *
 * Purpose: flat character store with derived line index, single cursor with
 *          sticky-column memory, and the scroll offsets of its viewport.
 * Feature: safe writes (write .tmp → fdatasync → atomic rename).
 * Note: every mutation rebuilds the line index before returning.
 */
#include <string>
#include <optional>
#include <filesystem>
#include "types.hpp"
#include "line_index.hpp"

class TextBuffer {
public:
  TextBuffer();
  TextBuffer(int x, int y, int width, int height);

  const std::u32string& data() const { return data_; }
  const LineIndex& lines() const { return lines_; }
  const Viewport& viewport() const { return vp_; }
  size_t cursor_pos() const { return cursor_pos_; }
  std::optional<size_t> sticky_column() const { return sticky_column_; }
  size_t size() const { return data_.size(); }
  bool modified() const { return modified_; }
  const std::optional<std::filesystem::path>& file_path() const { return file_path_; }

  void set_text(std::u32string text);
  void set_cursor(size_t pos);
  void set_file_path(const std::filesystem::path& path) { file_path_ = path; }

  /* cursor */
  size_t current_line() const;
  size_t current_column() const;
  void move_left(size_t n = 1);
  void move_right(size_t n = 1);
  void move_up(size_t n = 1);
  void move_down(size_t n = 1);

  /* viewport */
  void move_to(int x, int y);
  void resize(int width, int height);
  ScreenPos cursor_screen_xy() const;
  void scroll();

  /* edits */
  void insert_char(char32_t ch);
  void insert_newline() { insert_char(U'\n'); }
  bool delete_forward();
  bool backspace();

  static TextBuffer from_file(const std::filesystem::path& path, std::string& msg, bool& ok);
  bool write_file(const std::filesystem::path& path, std::string& msg) const;
  bool save(std::string& msg);

private:
  enum class Direction { Backward, Forward };
  void move_horizontal(size_t n, Direction dir);
  void move_vertical(size_t n, Direction dir);
  void after_edit();

  std::u32string data_;
  LineIndex lines_;
  size_t cursor_pos_ = 0;
  std::optional<size_t> sticky_column_;
  Viewport vp_;
  std::optional<std::filesystem::path> file_path_;
  bool modified_ = false;
};
