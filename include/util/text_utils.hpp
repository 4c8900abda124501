#ifndef TEXT_UTILS_HPP
#define TEXT_UTILS_HPP

#include <string>
#include <vector>

namespace cg {

/**
 * @brief Lowercase ASCII, Latin-1, Latin Extended-A, Greek and Cyrillic letters
 *
 * Other code points and invalid bytes are copied unchanged.
 */
std::string to_lower(std::string text);

/**
 * @brief Replace every invalid UTF-8 byte with U+FFFD
 */
std::string sanitize_utf8(const std::string& text);

/**
 * @brief Strip leading and trailing whitespace
 */
std::string trim(const std::string& text);

/**
 * @brief Case-insensitive substring test; an empty needle always matches
 */
bool contains_ignore_case(const std::string& haystack, const std::string& needle);

/**
 * @brief First @p max_chars code points of a UTF-8 string
 *
 * Never splits a valid multi-byte sequence; an invalid byte counts as
 * one character.
 */
std::string utf8_prefix(const std::string& text, size_t max_chars);

/**
 * @brief Split on @p delim, trimming entries and dropping empty ones
 */
std::vector<std::string> split_list(const std::string& text, char delim = ',');

} // namespace cg

#endif // TEXT_UTILS_HPP
