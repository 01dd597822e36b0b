#include "text_buffer.hpp"
#include <cassert>
#include <string>

static TextBuffer make(const std::u32string& text, size_t pos) {
  TextBuffer b(0, 0, 80, 24);
  b.set_text(text);
  b.set_cursor(pos);
  return b;
}

static void test_insert_advances_and_reindexes() {
  TextBuffer b;
  assert(!b.modified());
  b.insert_char(U'a');
  b.insert_char(U'b');
  assert(b.data() == U"ab");
  assert(b.cursor_pos() == 2);
  assert(b.modified());
  b.insert_newline();
  assert(b.lines().line_count() == 2);
  assert(b.current_line() == 1);
  b.insert_char(U'c');
  assert(b.data() == U"ab\nc");
  assert(b.lines().span(1).start == 3 && b.lines().span(1).end == 3);
}

static void test_insert_in_middle() {
  TextBuffer b = make(U"ac", 1);
  b.insert_char(U'b');
  assert(b.data() == U"abc");
  assert(b.cursor_pos() == 2);
}

static void test_delete_forward() {
  TextBuffer b = make(U"ab\ncd", 2);
  assert(b.delete_forward());
  assert(b.data() == U"abcd");
  assert(b.cursor_pos() == 2);
  assert(b.lines().line_count() == 1);
  b.set_cursor(4);
  assert(!b.delete_forward());
  assert(b.data() == U"abcd");
}

static void test_backspace() {
  TextBuffer b = make(U"ab\ncd", 3);
  assert(b.backspace());
  assert(b.data() == U"abcd");
  assert(b.cursor_pos() == 2);
  b.set_cursor(0);
  assert(!b.backspace());
  assert(b.cursor_pos() == 0);
  assert(b.data() == U"abcd");
}

static void test_boundary_noops_on_empty() {
  TextBuffer b;
  assert(!b.backspace());
  assert(!b.delete_forward());
  assert(b.data().empty());
  assert(b.lines().line_count() == 1);
  assert(!b.modified());
}

static void test_insert_then_undo_by_hand() {
  const std::u32string d = U"hello\nworld\n";
  for (size_t p = 0; p <= d.size(); ++p) {
    TextBuffer b = make(d, p);
    b.insert_char(U'Z');
    assert(b.backspace());
    assert(b.data() == d);
    assert(b.cursor_pos() == p);

    b.insert_char(U'\n');
    b.move_left();
    assert(b.delete_forward());
    assert(b.data() == d);
    assert(b.cursor_pos() == p);
    assert(b.lines().line_count() == 3);
  }
}

static void test_delete_everything() {
  TextBuffer b = make(U"a\nb", 3);
  while (b.backspace()) {}
  assert(b.data().empty());
  assert(b.cursor_pos() == 0);
  assert(b.lines().line_count() == 1);
  assert(b.current_line() == 0);
}

int main() {
  test_insert_advances_and_reindexes();
  test_insert_in_middle();
  test_delete_forward();
  test_backspace();
  test_boundary_noops_on_empty();
  test_insert_then_undo_by_hand();
  test_delete_everything();
  return 0;
}
