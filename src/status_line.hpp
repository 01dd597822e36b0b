#pragma once
/*
 * StatusLine
 *
 * Purpose: compose the one-row bar under the buffer: file name, modified
 *          marker and last message on the left, line:col on the right.
 */
#include <string>
#include <cstddef>

struct StatusInfo {
  bool modified = false;
  size_t line = 0;   // zero-based
  size_t column = 0; // zero-based
  std::string message;
};

class StatusLine {
public:
  StatusLine() = default;
  StatusLine(int x, int y, int width, std::string filename);

  void move_to(int x, int y) { x_ = x; y_ = y; }
  void resize(int width) { width_ = width < 0 ? 0 : width; }
  void set_filename(std::string name) { filename_ = std::move(name); }

  int x() const { return x_; }
  int y() const { return y_; }
  int width() const { return width_; }
  const std::string& filename() const { return filename_; }

  // Exactly width() cells, UTF-8 encoded.
  std::string text(const StatusInfo& info) const;

private:
  int x_ = 0;
  int y_ = 0;
  int width_ = 0;
  std::string filename_;
};
