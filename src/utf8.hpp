#pragma once
/*
 * UTF-8
 *
 * Purpose: convert between file bytes and the buffer's Unicode scalar values.
 * Note: malformed or truncated sequences decode to U+FFFD.
 */
#include <string>
#include <string_view>

inline constexpr char32_t kReplacementChar = 0xFFFD;

void utf8_decode_append(std::string_view bytes, std::u32string& out);
std::u32string utf8_decode(std::string_view bytes);
size_t utf8_encode(char32_t cp, char out[4]);
void utf8_encode_append(std::u32string_view text, std::string& out);
std::string utf8_encode(std::u32string_view text);
