#include "text_buffer.hpp"
#include "file_reader.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <unistd.h>

namespace fs = std::filesystem;

static fs::path make_temp_dir() {
  fs::path dir = fs::temp_directory_path() / ("ted_test_file_io_" + std::to_string(::getpid()));
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

static void write_raw(const fs::path& p, const std::string& bytes) {
  std::ofstream out(p, std::ios::binary);
  out << bytes;
}

static std::string read_raw(const fs::path& p) {
  std::ifstream in(p, std::ios::binary);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

static void test_load_strips_cr(const fs::path& dir) {
  fs::path p = dir / "crlf.txt";
  write_raw(p, "ab\r\ncd\r\n");
  std::string msg; bool ok = false;
  TextBuffer b = TextBuffer::from_file(p, msg, ok);
  assert(ok);
  assert(b.data() == U"ab\ncd\n");
  assert(b.lines().line_count() == 3);
  assert(b.file_path() && *b.file_path() == p);
  assert(!b.modified());
  assert(b.cursor_pos() == 0);
}

static void test_missing_file_is_empty(const fs::path& dir) {
  fs::path p = dir / "new.txt";
  std::string msg; bool ok = true;
  TextBuffer b = TextBuffer::from_file(p, msg, ok);
  assert(!ok);
  assert(b.data().empty());
  assert(b.lines().line_count() == 1);
  assert(b.file_path() && *b.file_path() == p);
  // saving creates it
  b.insert_char(U'x');
  assert(b.save(msg));
  assert(!b.modified());
  assert(read_raw(p) == "x");
  assert(!fs::exists(dir / "new.txt.tmp"));
}

static void test_save_is_verbatim(const fs::path& dir) {
  fs::path p = dir / "utf8.txt";
  write_raw(p, "h\xc3\xa9llo\nno newline");
  std::string msg; bool ok = false;
  TextBuffer b = TextBuffer::from_file(p, msg, ok);
  assert(ok);
  assert(b.data() == U"héllo\nno newline");
  b.set_cursor(b.size());
  b.insert_char(U'!');
  assert(b.save(msg));
  assert(msg.find("saved file") != std::string::npos);
  assert(read_raw(p) == "h\xc3\xa9llo\nno newline!");
}

static void test_save_without_path_is_noop() {
  TextBuffer b;
  b.insert_char(U'a');
  std::string msg;
  assert(b.save(msg));
  assert(b.modified());
  assert(!msg.empty());
}

static void test_save_failure_is_reported(const fs::path& dir) {
  fs::path p = dir / "no_such_dir" / "f.txt";
  TextBuffer b;
  b.set_file_path(p);
  b.insert_char(U'a');
  std::string msg;
  assert(!b.save(msg));
  assert(msg.find("write file failed") != std::string::npos);
  assert(b.modified());
}

static void test_failed_rename_leaves_no_temp(const fs::path& dir) {
  // a non-empty directory cannot be replaced by a regular file
  fs::path p = dir / "occupied";
  fs::create_directories(p / "child");
  TextBuffer b;
  b.set_file_path(p);
  b.insert_char(U'a');
  std::string msg;
  assert(!b.save(msg));
  assert(msg.find("write file failed") != std::string::npos);
  assert(!fs::exists(dir / "occupied.tmp"));
  assert(fs::is_directory(p));
  assert(b.modified());
}

static void test_large_file_round_trip(const fs::path& dir) {
  // bigger than one write chunk
  std::string text;
  for (int i = 0; i < 20000; ++i) text += "line " + std::to_string(i) + " \xe2\x82\xac\n";
  fs::path p = dir / "big.txt";
  write_raw(p, text);
  std::string msg; bool ok = false;
  TextBuffer b = TextBuffer::from_file(p, msg, ok);
  assert(ok);
  assert(b.lines().line_count() == 20001);
  assert(b.write_file(p, msg));
  assert(read_raw(p) == text);
}

static void test_read_lines(const fs::path& dir) {
  fs::path p = dir / "rc";
  write_raw(p, "set color off\r\n\nset statusline on");
  std::vector<std::string> lines; std::string msg;
  assert(mmap_read_lines(p, lines, msg));
  assert(lines.size() == 3);
  assert(lines[0] == "set color off");
  assert(lines[1].empty());
  assert(lines[2] == "set statusline on");
  assert(!mmap_read_lines(dir / "absent", lines, msg));
  assert(msg.find("can not open file") != std::string::npos);
}

int main() {
  fs::path dir = make_temp_dir();
  test_load_strips_cr(dir);
  test_missing_file_is_empty(dir);
  test_save_is_verbatim(dir);
  test_save_without_path_is_noop();
  test_save_failure_is_reported(dir);
  test_failed_rename_leaves_no_temp(dir);
  test_large_file_round_trip(dir);
  test_read_lines(dir);
  fs::remove_all(dir);
  return 0;
}
