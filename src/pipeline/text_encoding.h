#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace csvsentry::pipeline::text {

enum class Encoding {
    Utf8,
    Latin1
};

auto EncodingName(Encoding encoding) -> const char*;

// Rejects overlong forms, surrogates and code points above U+10FFFF. On failure
// the offset of the first bad byte is written to error_offset when given.
auto IsValidUtf8(std::string_view bytes, size_t* error_offset = nullptr) -> bool;

// Every byte maps to the code point of the same value.
auto Latin1ToUtf8(std::string_view bytes) -> std::string;

// Length of the UTF-8 sequence starting at pos, 1 for a stray byte.
auto Utf8SequenceLength(std::string_view text, size_t pos) -> size_t;

// Code point at pos; a stray or truncated byte decodes to U+FFFD with length 1.
auto DecodeUtf8(std::string_view text, size_t pos, size_t* length) -> char32_t;

// Letters and numbers of the common scripts, matching what a Unicode-aware
// regex treats as \w outside ASCII. Combining marks are not included.
auto IsWordCodePoint(char32_t cp) -> bool;

auto IsSpaceCodePoint(char32_t cp) -> bool;

// Longest prefix holding at most max_code_points whole characters.
auto TruncateCodePoints(const std::string& text, size_t max_code_points) -> std::string;

auto StripUtf8Bom(std::string_view bytes) -> std::string_view;

} // namespace csvsentry::pipeline::text
