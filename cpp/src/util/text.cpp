#include "promptspan/util/text.hpp"
#include "promptspan/error.hpp"

#include <fstream>
#include <sstream>

namespace promptspan::util {

std::string to_lower_ascii(std::string_view text) {
    std::string out(text);
    for (char& c : out) {
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c - 'A' + 'a');
        }
    }
    return out;
}

char32_t decode_utf8_at(std::string_view text, size_t pos, size_t& length) noexcept {
    const size_t n = text.size();
    unsigned char b0 = static_cast<unsigned char>(text[pos]);
    length = 1;
    if (b0 < 0x80) return b0;

    size_t need;
    char32_t cp;
    char32_t min;
    if ((b0 & 0xE0) == 0xC0) { need = 1; cp = b0 & 0x1F; min = 0x80; }
    else if ((b0 & 0xF0) == 0xE0) { need = 2; cp = b0 & 0x0F; min = 0x800; }
    else if ((b0 & 0xF8) == 0xF0) { need = 3; cp = b0 & 0x07; min = 0x10000; }
    else return 0xFFFD;

    if (pos + need >= n) return 0xFFFD;
    for (size_t k = 1; k <= need; ++k) {
        unsigned char b = static_cast<unsigned char>(text[pos + k]);
        if ((b & 0xC0) != 0x80) return 0xFFFD;
        cp = (cp << 6) | (b & 0x3F);
    }
    // Overlong forms, surrogates and out-of-range values
    if (cp < min || (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) return 0xFFFD;
    length = need + 1;
    return cp;
}

size_t prev_char_start(std::string_view text, size_t pos) noexcept {
    if (pos == 0) return 0;
    size_t start = pos - 1;
    size_t back = 0;
    while (start > 0 && back < 3 &&
           (static_cast<unsigned char>(text[start]) & 0xC0) == 0x80) {
        --start;
        ++back;
    }
    size_t length = 0;
    decode_utf8_at(text, start, length);
    return start + length == pos ? start : pos - 1;
}

bool is_space_codepoint(char32_t cp) noexcept {
    if (cp < 0x80) return is_space(static_cast<unsigned char>(cp));
    return cp == 0x85 || cp == 0xA0 || cp == 0x1680 || (cp >= 0x2000 && cp <= 0x200A) ||
           cp == 0x2028 || cp == 0x2029 || cp == 0x202F || cp == 0x205F || cp == 0x3000;
}

bool is_word_codepoint(char32_t cp) noexcept {
    if (cp < 0x80) return is_ascii_alnum(static_cast<unsigned char>(cp));
    if (cp < 0xA0) return false;
    if (cp <= 0xBF) {
        // ª ² ³ µ ¹ º ¼ ½ ¾
        return cp == 0xAA || cp == 0xB2 || cp == 0xB3 || cp == 0xB5 || cp == 0xB9 ||
               cp == 0xBA || (cp >= 0xBC && cp <= 0xBE);
    }
    if (cp == 0xD7 || cp == 0xF7) return false;
    if (cp == 0x1680 || (cp >= 0x2000 && cp <= 0x206F)) return false;  // general punctuation
    if (cp >= 0x20A0 && cp <= 0x20CF) return false;                     // currency
    if (cp >= 0x2190 && cp <= 0x21FF) return false;                     // arrows
    if (cp >= 0x3000 && cp <= 0x303F) return false;                     // CJK punctuation
    if (cp >= 0xFE30 && cp <= 0xFE4F) return false;
    if ((cp >= 0xFF01 && cp <= 0xFF0F) || (cp >= 0xFF1A && cp <= 0xFF20)) return false;
    if (cp == 0xFEFF) return false;
    return true;
}

size_t word_char_at(std::string_view text, size_t pos) noexcept {
    if (pos >= text.size()) return 0;
    size_t length = 0;
    char32_t cp = decode_utf8_at(text, pos, length);
    return is_word_codepoint(cp) ? length : 0;
}

size_t word_char_before(std::string_view text, size_t pos) noexcept {
    if (pos == 0 || pos > text.size()) return 0;
    size_t start = prev_char_start(text, pos);
    size_t length = word_char_at(text, start);
    return start + length == pos ? length : 0;
}

std::pair<size_t, size_t> trim_range(std::string_view text, size_t start, size_t end) {
    if (end > text.size()) end = text.size();
    while (start < end && is_space(static_cast<unsigned char>(text[start]))) ++start;
    while (end > start && is_space(static_cast<unsigned char>(text[end - 1]))) --end;
    return {start, end};
}

std::string trim(std::string_view text) {
    auto [s, e] = trim_range(text, 0, text.size());
    return std::string(text.substr(s, e - s));
}

namespace {

// Byte length of an apostrophe or hyphen at `pos` that joins two word characters.
size_t inner_joiner_at(std::string_view text, size_t pos) {
    size_t length = 0;
    char32_t cp = decode_utf8_at(text, pos, length);
    bool joiner = cp == '\'' || cp == '-' || cp == 0x2019;
    return joiner && word_char_at(text, pos + length) ? length : 0;
}

size_t space_at(std::string_view text, size_t pos) {
    size_t length = 0;
    char32_t cp = decode_utf8_at(text, pos, length);
    return is_space_codepoint(cp) ? length : 0;
}

} // namespace

std::vector<Token> tokenize(std::string_view text) {
    std::vector<Token> tokens;
    const size_t n = text.size();
    size_t i = 0;

    while (i < n) {
        if (size_t skip = space_at(text, i)) {
            i += skip;
            continue;
        }

        if (size_t first = word_char_at(text, i)) {
            size_t start = i;
            i += first;
            while (i < n) {
                if (size_t step = word_char_at(text, i)) {
                    i += step;
                } else if (size_t joiner = inner_joiner_at(text, i)) {
                    i += joiner;
                } else {
                    break;
                }
            }
            Token tok;
            tok.text = std::string(text.substr(start, i - start));
            tok.lower = to_lower_ascii(tok.text);
            tok.start = start;
            tok.end = i;
            tok.is_word = true;
            tokens.push_back(std::move(tok));
            continue;
        }

        size_t length = 0;
        decode_utf8_at(text, i, length);
        Token tok;
        tok.text = std::string(text.substr(i, length));
        tok.lower = tok.text;
        tok.start = i;
        tok.end = i + length;
        tok.is_word = false;
        tokens.push_back(std::move(tok));
        i += length;
    }

    return tokens;
}

size_t count_words(std::string_view text) {
    size_t count = 0;
    bool in_word = false;
    size_t i = 0;
    while (i < text.size()) {
        size_t length = 0;
        bool space = is_space_codepoint(decode_utf8_at(text, i, length));
        if (!space && !in_word) ++count;
        in_word = !space;
        i += length;
    }
    return count;
}

std::vector<std::string> split_whitespace(std::string_view text) {
    std::vector<std::string> words;
    const size_t n = text.size();
    size_t i = 0;
    while (i < n) {
        while (i < n) {
            size_t skip = space_at(text, i);
            if (!skip) break;
            i += skip;
        }
        size_t start = i;
        while (i < n && !space_at(text, i)) {
            size_t length = 0;
            decode_utf8_at(text, i, length);
            i += length;
        }
        if (i > start) words.emplace_back(text.substr(start, i - start));
    }
    return words;
}

std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw IOError("cannot open file", path, "Check the configured path");
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

} // namespace promptspan::util
