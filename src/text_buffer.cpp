#include "text_buffer.hpp"
#include <algorithm>
#include <vector>
#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>
#include "posix_fd.hpp"
#include "file_reader.hpp"
#include "utf8.hpp"
#include "config.hpp"
#include "log.hpp"

TextBuffer::TextBuffer() { lines_.build_from_text(data_); }

TextBuffer::TextBuffer(int x, int y, int width, int height) {
  vp_.x = x; vp_.y = y;
  vp_.width = std::max(0, width);
  vp_.height = std::max(0, height);
  lines_.build_from_text(data_);
}

void TextBuffer::set_text(std::u32string text) {
  data_ = std::move(text);
  lines_.build_from_text(data_);
  cursor_pos_ = std::min(cursor_pos_, data_.size());
  sticky_column_.reset();
}

void TextBuffer::set_cursor(size_t pos) {
  cursor_pos_ = std::min(pos, data_.size());
  sticky_column_.reset();
}

void TextBuffer::after_edit() {
  lines_.build_from_text(data_);
  sticky_column_.reset();
  modified_ = true;
}

void TextBuffer::insert_char(char32_t ch) {
  data_.insert(data_.begin() + static_cast<std::ptrdiff_t>(cursor_pos_), ch);
  cursor_pos_++;
  after_edit();
}

bool TextBuffer::delete_forward() {
  if (cursor_pos_ >= data_.size()) return false;
  data_.erase(cursor_pos_, 1);
  after_edit();
  return true;
}

bool TextBuffer::backspace() {
  if (cursor_pos_ == 0) return false;
  cursor_pos_--;
  data_.erase(cursor_pos_, 1);
  after_edit();
  return true;
}

TextBuffer TextBuffer::from_file(const std::filesystem::path& path, std::string& msg, bool& ok) {
  TextBuffer b;
  b.file_path_ = path;
  std::u32string text;
  ok = mmap_read_text(path, text, msg);
  if (!ok) {
    // Treated as a new file: saving creates it.
    TED_INFO("%s, starting empty", msg.c_str());
    msg = std::string("new file: ") + path.string();
    return b;
  }
  b.set_text(std::move(text));
  return b;
}

bool TextBuffer::write_file(const std::filesystem::path& path, std::string& msg) const {
  std::filesystem::path tmp = path;
  tmp += ".tmp";
  UniqueFd ufd(::open(tmp.string().c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644));
  if (!ufd.valid()) {
    msg = std::string("write file failed: ") + tmp.string();
    return false;
  }
  std::vector<char> buf(static_cast<size_t>(TED_WRITE_CHUNK_SIZE));
  size_t used = 0;
  auto flush_buf = [&](int fd) -> bool {
    const char* p = buf.data();
    size_t remain = used;
    while (remain > 0) {
      ssize_t w = ::write(fd, p, remain);
      if (w < 0) { msg = std::string("write file failed: ") + tmp.string(); return false; }
      p += w;
      remain -= static_cast<size_t>(w);
    }
    used = 0;
    return true;
  };
  char enc[4];
  for (char32_t cp : data_) {
    size_t n = utf8_encode(cp, enc);
    if (buf.size() - used < n) {
      if (!flush_buf(ufd.get())) { ::unlink(tmp.string().c_str()); return false; }
    }
    std::copy(enc, enc + n, buf.data() + used);
    used += n;
  }
  if (used > 0) {
    if (!flush_buf(ufd.get())) { ::unlink(tmp.string().c_str()); return false; }
  }
#if defined(__APPLE__)
  if (::fsync(ufd.get()) != 0) { msg = std::string("write file failed: ") + tmp.string(); ::unlink(tmp.string().c_str()); return false; }
#else
  if (::fdatasync(ufd.get()) != 0) { msg = std::string("write file failed: ") + tmp.string(); ::unlink(tmp.string().c_str()); return false; }
#endif
  ufd.reset();
  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if (ec) { msg = std::string("write file failed: ") + path.string(); ::unlink(tmp.string().c_str()); return false; }
  msg = std::string("saved file: ") + path.string();
  return true;
}

bool TextBuffer::save(std::string& msg) {
  if (!file_path_) { msg = "no file name, nothing saved"; return true; }
  if (!write_file(*file_path_, msg)) {
    TED_ERR("%s", msg.c_str());
    return false;
  }
  modified_ = false;
  TED_INFO("%s", msg.c_str());
  return true;
}
