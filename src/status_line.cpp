#include "status_line.hpp"
#include "utf8.hpp"

StatusLine::StatusLine(int x, int y, int width, std::string filename)
    : x_(x), y_(y), width_(width < 0 ? 0 : width), filename_(std::move(filename)) {}

std::string StatusLine::text(const StatusInfo& info) const {
  size_t w = static_cast<size_t>(width_);
  std::u32string left = U" " + utf8_decode(filename_.empty() ? "[no file]" : filename_);
  if (info.modified) left += U" [+]";
  if (!info.message.empty()) left += U"  " + utf8_decode(info.message);
  std::string pos = std::to_string(info.line + 1) + ":" + std::to_string(info.column + 1) + " ";
  std::u32string right = utf8_decode(pos);

  std::u32string line;
  if (left.size() + 1 + right.size() <= w) {
    line = left + std::u32string(w - left.size() - right.size(), U' ') + right;
  } else if (right.size() < w) {
    // position wins; the left part is cut
    left.resize(w - right.size() - 1);
    line = left + U" " + right;
  } else {
    line = left.substr(0, w);
  }
  line.resize(w, U' ');
  return utf8_encode(line);
}
