// recload/cpp/common/text_common.h
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

// Length of the well-formed UTF-8 sequence starting at s[i], or 0 if it is malformed
// (bad lead byte, truncated, bad continuation, overlong, surrogate, > U+10FFFF).
size_t utf8_sequence_len(std::string_view s, size_t i);

bool utf8_is_valid(std::string_view s);

void append_utf8(uint32_t cp, std::string& out);

// CP1251 -> Unicode codepoint. ASCII passthrough, 0 for the one unmapped byte (0x98).
uint16_t cp1251_to_unicode(unsigned char c);

std::string to_lower_copy(std::string s);
std::string to_upper_copy(std::string s);
