#include "util/text_utils.hpp"
#include <algorithm>
#include <sstream>

namespace cg {

namespace {

const char* REPLACEMENT_CHARACTER = "\xEF\xBF\xBD";

bool is_continuation(const std::string& text, size_t pos, unsigned char low = 0x80, unsigned char high = 0xBF) {
    if (pos >= text.size()) return false;
    unsigned char c = static_cast<unsigned char>(text[pos]);
    return c >= low && c <= high;
}

/**
 * @brief Decode the code point starting at @p pos (RFC 3629)
 *
 * @return Sequence length in bytes, 0 if the bytes are not valid UTF-8
 */
size_t decode_utf8(const std::string& text, size_t pos, char32_t& code_point) {
    unsigned char c = static_cast<unsigned char>(text[pos]);

    if (c < 0x80) {
        code_point = c;
        return 1;
    }
    if (c >= 0xC2 && c <= 0xDF) {
        if (!is_continuation(text, pos + 1)) return 0;
        code_point = ((c & 0x1Fu) << 6) | (text[pos + 1] & 0x3Fu);
        return 2;
    }
    if (c >= 0xE0 && c <= 0xEF) {
        unsigned char low = (c == 0xE0) ? 0xA0 : 0x80;
        unsigned char high = (c == 0xED) ? 0x9F : 0xBF;
        if (!is_continuation(text, pos + 1, low, high) || !is_continuation(text, pos + 2)) return 0;
        code_point = ((c & 0x0Fu) << 12) | ((text[pos + 1] & 0x3Fu) << 6) | (text[pos + 2] & 0x3Fu);
        return 3;
    }
    if (c >= 0xF0 && c <= 0xF4) {
        unsigned char low = (c == 0xF0) ? 0x90 : 0x80;
        unsigned char high = (c == 0xF4) ? 0x8F : 0xBF;
        if (!is_continuation(text, pos + 1, low, high) ||
            !is_continuation(text, pos + 2) || !is_continuation(text, pos + 3)) return 0;
        code_point = ((c & 0x07u) << 18) | ((text[pos + 1] & 0x3Fu) << 12) |
                     ((text[pos + 2] & 0x3Fu) << 6) | (text[pos + 3] & 0x3Fu);
        return 4;
    }
    return 0;
}

void append_utf8(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

// Simple case mapping for ASCII, Latin-1, Latin Extended-A, Greek and Cyrillic
char32_t lower_code_point(char32_t cp) {
    if (cp >= 'A' && cp <= 'Z') return cp + 0x20;
    if (cp < 0x80) return cp;

    if (cp >= 0x00C0 && cp <= 0x00DE && cp != 0x00D7) return cp + 0x20;

    if ((cp >= 0x0100 && cp <= 0x012F) || (cp >= 0x0132 && cp <= 0x0137) ||
        (cp >= 0x014A && cp <= 0x0177)) {
        return (cp % 2 == 0) ? cp + 1 : cp;
    }
    if ((cp >= 0x0139 && cp <= 0x0148) || (cp >= 0x0179 && cp <= 0x017E)) {
        return (cp % 2 == 1) ? cp + 1 : cp;
    }
    if (cp == 0x0178) return 0x00FF;

    if (cp >= 0x0391 && cp <= 0x03A9 && cp != 0x03A2) return cp + 0x20;

    if (cp >= 0x0410 && cp <= 0x042F) return cp + 0x20;
    if (cp >= 0x0400 && cp <= 0x040F) return cp + 0x50;

    return cp;
}

} // anonymous namespace

std::string to_lower(std::string text) {
    std::string result;
    result.reserve(text.size());

    size_t pos = 0;
    while (pos < text.size()) {
        char32_t cp = 0;
        size_t len = decode_utf8(text, pos, cp);
        if (len == 0) {
            result += text[pos++];
            continue;
        }
        append_utf8(result, lower_code_point(cp));
        pos += len;
    }
    return result;
}

std::string sanitize_utf8(const std::string& text) {
    std::string result;
    result.reserve(text.size());

    size_t pos = 0;
    while (pos < text.size()) {
        char32_t cp = 0;
        size_t len = decode_utf8(text, pos, cp);
        if (len == 0) {
            result += REPLACEMENT_CHARACTER;
            ++pos;
            continue;
        }
        result.append(text, pos, len);
        pos += len;
    }
    return result;
}

std::string trim(const std::string& text) {
    size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

bool contains_ignore_case(const std::string& haystack, const std::string& needle) {
    if (needle.empty()) return true;
    return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

std::string utf8_prefix(const std::string& text, size_t max_chars) {
    size_t chars = 0;
    size_t pos = 0;
    while (pos < text.size() && chars < max_chars) {
        char32_t cp = 0;
        size_t len = decode_utf8(text, pos, cp);
        pos += (len == 0) ? 1 : len;
        chars++;
    }
    return text.substr(0, pos);
}

std::vector<std::string> split_list(const std::string& text, char delim) {
    std::vector<std::string> result;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, delim)) {
        item = trim(item);
        if (!item.empty()) result.push_back(item);
    }
    return result;
}

} // namespace cg
