#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace promptspan::util {

// ASCII-only lowering keeps byte offsets identical between input and lowered copy.
std::string to_lower_ascii(std::string_view text);

inline bool is_ascii_alnum(unsigned char c) noexcept {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

inline bool is_space(unsigned char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

// Decodes the code point at `pos` and stores its byte length in `length`.
// Malformed or truncated sequences decode as U+FFFD with length 1.
char32_t decode_utf8_at(std::string_view text, size_t pos, size_t& length) noexcept;

// Offset of the code point that ends at `pos`.
size_t prev_char_start(std::string_view text, size_t pos) noexcept;

// ASCII whitespace plus the Unicode space separators (U+00A0, U+2000-U+200A, U+3000, ...).
bool is_space_codepoint(char32_t cp) noexcept;

// Letters and digits. ASCII punctuation, Unicode spaces, Latin-1 symbols, general and
// CJK punctuation are not word characters; every other non-ASCII code point is.
bool is_word_codepoint(char32_t cp) noexcept;

// Byte length of the word character starting at `pos`, 0 when it is not one.
size_t word_char_at(std::string_view text, size_t pos) noexcept;

// Byte length of the word character ending at `pos`, 0 when it is not one.
size_t word_char_before(std::string_view text, size_t pos) noexcept;

// Shrinks [start, end) past surrounding whitespace. Returns {start, start} when blank.
std::pair<size_t, size_t> trim_range(std::string_view text, size_t start, size_t end);

std::string trim(std::string_view text);

struct Token {
    std::string text;
    std::string lower;
    size_t start = 0;
    size_t end = 0;
    bool is_word = false;
};

/**
 * Splits text into word and punctuation tokens with byte offsets.
 *
 * A word is a run of word characters, with inner apostrophes and hyphens kept
 * ("it's", "low-key"). Every other non-space character is a punctuation token
 * covering its whole UTF-8 sequence, so clause boundaries stay visible to the
 * phrase scanners.
 */
std::vector<Token> tokenize(std::string_view text);

// Whitespace-separated word count, used by the coverage metrics. U+00A0 and the
// other Unicode spaces separate words.
size_t count_words(std::string_view text);

std::vector<std::string> split_whitespace(std::string_view text);

// Whole file contents. Throws IOError when the file cannot be opened.
std::string read_file(const std::string& path);

} // namespace promptspan::util
