#include "renderer.hpp"
#include <algorithm>
#include "ncurses_terminal.hpp"
#include "utf8.hpp"

std::string Renderer::visible_slice(const TextBuffer& buf, size_t row) {
  const Viewport& vp = buf.viewport();
  const LineIndex& li = buf.lines();
  size_t len = li.line_length(row);
  if (len == 0 || vp.width <= 0 || vp.offset_x >= len) return std::string();
  size_t first = li.span(row).start + vp.offset_x;
  size_t count = std::min(len - vp.offset_x, static_cast<size_t>(vp.width));
  std::u32string vis = buf.data().substr(first, count);
  if (!vis.empty() && vis.back() == U'\n') vis.pop_back();
  for (char32_t& c : vis) {
    if (c < 0x20 || c == 0x7f) c = U' ';
  }
  return utf8_encode(vis);
}

void Renderer::render(ITerminal& term,
                      const TextBuffer& buf,
                      const StatusLine* status,
                      const StatusInfo& info,
                      bool enable_color) {
  term.clear();
  const Viewport& vp = buf.viewport();
  size_t count = buf.lines().line_count();
  for (int i = 0; i < vp.height; ++i) {
    size_t line_idx = vp.offset_y + static_cast<size_t>(i);
    if (line_idx >= count) break;
    std::string vis = visible_slice(buf, line_idx);
    term.draw_text(vp.y + i, vp.x, vis);
  }
  if (status && status->width() > 0) {
    std::string bar = status->text(info);
    if (enable_color) term.draw_colored(status->y(), status->x(), bar, kStatusLinePair);
    else term.draw_highlighted(status->y(), status->x(), bar);
  }
  ScreenPos p = buf.cursor_screen_xy();
  bool inside = p.x >= vp.x && p.x < static_cast<long>(vp.x) + vp.width &&
                p.y >= vp.y && p.y < static_cast<long>(vp.y) + vp.height;
  if (inside) {
    term.move_cursor(static_cast<int>(p.y), static_cast<int>(p.x));
    term.set_cursor_visible(true);
  } else {
    term.set_cursor_visible(false);
  }
  term.refresh();
}
