#pragma once
#include <string>
#include <string_view>

// Malformed or truncated sequences decode to U+FFFD.
std::u32string decode_utf8(std::string_view s);
std::string encode_utf8(char32_t cp);
// Expected length of a sequence from its lead byte; 0 for continuation/invalid bytes.
int utf8_sequence_length(unsigned char lead);
