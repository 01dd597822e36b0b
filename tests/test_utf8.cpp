#include "utf8.hpp"
#include <cassert>
#include <string>

int main() {
  assert(utf8_decode("abc") == U"abc");
  assert(utf8_decode("w\xc3\xb6rld") == U"wörld");
  assert(utf8_decode("\xe4\xb8\xad") == U"中");
  assert(utf8_decode("\xf0\x9f\x98\x80") == U"\U0001F600");

  // stray continuation byte, bad lead byte, truncated tail
  assert(utf8_decode("a\x80" "b") == std::u32string(U"a�b"));
  assert(utf8_decode("\xff") == std::u32string(1, kReplacementChar));
  assert(utf8_decode("x\xe4\xb8") == std::u32string(U"x�"));
  // truncated sequence followed by ASCII keeps the ASCII
  assert(utf8_decode("\xe4" "a") == std::u32string(U"�a"));
  // overlong encoding of '/'
  assert(utf8_decode("\xc0\xaf") == std::u32string(1, kReplacementChar));
  // encoded surrogate
  assert(utf8_decode("\xed\xa0\x80") == std::u32string(1, kReplacementChar));

  assert(utf8_encode(U"abc") == "abc");
  assert(utf8_encode(U"wörld 中\U0001F600") == "w\xc3\xb6rld \xe4\xb8\xad\xf0\x9f\x98\x80");

  char buf[4];
  assert(utf8_encode(U'\n', buf) == 1 && buf[0] == '\n');
  assert(utf8_encode(static_cast<char32_t>(0x110000), buf) == 3); // becomes U+FFFD

  std::string mixed = "line one\nl\xc3\xadnea dos\n\xe7\xac\xac\xe4\xb8\x89";
  assert(utf8_encode(utf8_decode(mixed)) == mixed);
  return 0;
}
