#pragma once

#include <string>

namespace incpath {

/**
 * @brief Error object: A marker bounding the search-list block was not found in compiler output.
 *
 * The value is the text of the missing marker.
 */
struct e_delimiter_not_found {
    std::string value;
};

}  // namespace incpath
