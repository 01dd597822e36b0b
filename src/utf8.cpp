#include "utf8.hpp"

static bool is_cont(unsigned char c) { return (c & 0xC0) == 0x80; }

void utf8_decode_append(std::string_view bytes, std::u32string& out) {
  const unsigned char* p = reinterpret_cast<const unsigned char*>(bytes.data());
  size_t n = bytes.size();
  size_t i = 0;
  while (i < n) {
    unsigned char c = p[i];
    if (c < 0x80) { out.push_back(c); ++i; continue; }
    size_t need = 0;
    char32_t cp = 0;
    char32_t min = 0;
    if ((c & 0xE0) == 0xC0) { need = 1; cp = c & 0x1F; min = 0x80; }
    else if ((c & 0xF0) == 0xE0) { need = 2; cp = c & 0x0F; min = 0x800; }
    else if ((c & 0xF8) == 0xF0) { need = 3; cp = c & 0x07; min = 0x10000; }
    else { out.push_back(kReplacementChar); ++i; continue; }
    size_t k = 1;
    for (; k <= need && i + k < n && is_cont(p[i + k]); ++k) cp = (cp << 6) | (p[i + k] & 0x3F);
    if (k <= need) {
      // truncated: consume only the bytes that looked valid
      out.push_back(kReplacementChar);
      i += k;
      continue;
    }
    if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) cp = kReplacementChar;
    out.push_back(cp);
    i += need + 1;
  }
}

std::u32string utf8_decode(std::string_view bytes) {
  std::u32string out;
  out.reserve(bytes.size());
  utf8_decode_append(bytes, out);
  return out;
}

size_t utf8_encode(char32_t cp, char out[4]) {
  if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) cp = kReplacementChar;
  if (cp <= 0x7F) {
    out[0] = static_cast<char>(cp);
    return 1;
  }
  if (cp <= 0x7FF) {
    out[0] = static_cast<char>(0xC0 | ((cp >> 6) & 0x1F));
    out[1] = static_cast<char>(0x80 | (cp & 0x3F));
    return 2;
  }
  if (cp <= 0xFFFF) {
    out[0] = static_cast<char>(0xE0 | ((cp >> 12) & 0x0F));
    out[1] = static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out[2] = static_cast<char>(0x80 | (cp & 0x3F));
    return 3;
  }
  out[0] = static_cast<char>(0xF0 | ((cp >> 18) & 0x07));
  out[1] = static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
  out[2] = static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
  out[3] = static_cast<char>(0x80 | (cp & 0x3F));
  return 4;
}

void utf8_encode_append(std::u32string_view text, std::string& out) {
  char tmp[4];
  for (char32_t cp : text) {
    size_t n = utf8_encode(cp, tmp);
    out.append(tmp, n);
  }
}

std::string utf8_encode(std::u32string_view text) {
  std::string out;
  out.reserve(text.size());
  utf8_encode_append(text, out);
  return out;
}
