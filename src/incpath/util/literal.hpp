#pragma once

#include <string>
#include <string_view>

namespace incpath {

/**
 * @brief Error object: A string could not be decoded as a double-quoted string literal body.
 */
struct e_bad_literal {
    std::string value;
};

/**
 * @brief The literal body being decoded when an e_bad_literal was raised.
 */
struct e_literal_string {
    std::string value;
};

/**
 * @brief Escape a string for embedding between double-quotes in generated configuration text.
 *
 * Backslashes and double-quotes are backslash-escaped. Newline, carriage-return and tab characters
 * are written as \n, \r and \t.
 */
[[nodiscard]] std::string escape_literal(std::string_view s);

/**
 * @brief Decode the body of a double-quoted string literal, the inverse of escape_literal().
 *
 * Throws with an e_bad_literal on a dangling backslash or an unknown escape sequence.
 */
[[nodiscard]] std::string unescape_literal(std::string_view s);

}  // namespace incpath
