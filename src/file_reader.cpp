#include "file_reader.hpp"
#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <string_view>
#include "posix_fd.hpp"
#include "utf8.hpp"
#include "log.hpp"

namespace {

class MappedFile {
public:
  MappedFile() = default;
  MappedFile(const MappedFile&) = delete;
  MappedFile& operator=(const MappedFile&) = delete;
  ~MappedFile() { if (mem_ != nullptr) ::munmap(mem_, size_); }

  bool open(const std::filesystem::path& path, std::string& msg) {
    UniqueFd fd(::open(path.string().c_str(), O_RDONLY));
    if (!fd.valid()) { msg = std::string("can not open file: ") + path.string(); return false; }
    struct stat st{};
    if (::fstat(fd.get(), &st) != 0) { msg = std::string("can not read file stat: ") + path.string(); return false; }
    if (!S_ISREG(st.st_mode)) { msg = std::string("not a regular file: ") + path.string(); return false; }
    size_ = static_cast<size_t>(st.st_size);
    if (size_ == 0) return true;
    void* mem = ::mmap(nullptr, size_, PROT_READ, MAP_PRIVATE, fd.get(), 0);
    if (mem == MAP_FAILED) { size_ = 0; msg = std::string("can not mmap file: ") + path.string(); return false; }
    mem_ = mem;
    (void)::madvise(mem_, size_, MADV_SEQUENTIAL);
    return true;
  }

  std::string_view bytes() const {
    if (mem_ == nullptr) return std::string_view();
    return std::string_view(static_cast<const char*>(mem_), size_);
  }

private:
  void* mem_ = nullptr;
  size_t size_ = 0;
};

// Feeds the CR-free runs of `data` to `fn`.
template <typename Fn>
void for_each_cr_free_run(std::string_view data, Fn fn) {
  size_t start = 0;
  for (size_t i = 0; i < data.size(); ++i) {
    if (data[i] == '\r') {
      if (i > start) fn(data.substr(start, i - start));
      start = i + 1;
    }
  }
  if (start < data.size()) fn(data.substr(start));
}

}  // namespace

bool mmap_read_text(const std::filesystem::path& path,
                    std::u32string& out,
                    std::string& msg) {
  out.clear();
  MappedFile mf;
  if (!mf.open(path, msg)) return false;
  std::string_view data = mf.bytes();
  out.reserve(data.size());
  // A CR never splits a multibyte sequence in valid UTF-8, so runs decode independently.
  for_each_cr_free_run(data, [&](std::string_view run) { utf8_decode_append(run, out); });
  TED_DBG("read %zu bytes (%zu chars) from %s", data.size(), out.size(), path.string().c_str());
  msg = std::string("opened file: ") + path.string();
  return true;
}

bool mmap_read_lines(const std::filesystem::path& path,
                     std::vector<std::string>& out_lines,
                     std::string& msg) {
  out_lines.clear();
  MappedFile mf;
  if (!mf.open(path, msg)) return false;
  std::string_view data = mf.bytes();
  std::string cur;
  for (char c : data) {
    if (c == '\r') continue;
    if (c == '\n') { out_lines.push_back(std::move(cur)); cur.clear(); continue; }
    cur.push_back(c);
  }
  if (!cur.empty() || out_lines.empty()) out_lines.push_back(std::move(cur));
  msg = std::string("opened file: ") + path.string();
  return true;
}
