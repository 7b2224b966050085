#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace incpath {

/**
 * @brief The pair of lines in compiler diagnostic output that bound the list of default #include <>
 * directories. The defaults are the sentinels printed by GCC and Clang for `-v`.
 */
struct search_list_markers {
    std::string start = "#include <...> search starts here:";
    std::string end   = "End of search list.";
};

/**
 * @brief Extract the raw include directory entries from compiler diagnostic output.
 *
 * Returns the trimmed, non-blank lines between the start and end markers, in the order they
 * appear. Throws with an e_delimiter_not_found and the full text as e_probe_output if either
 * marker is missing.
 */
[[nodiscard]] std::vector<std::string> extract_search_dirs(std::string_view           output,
                                                           const search_list_markers& markers);

[[nodiscard]] inline std::vector<std::string> extract_search_dirs(std::string_view output) {
    return extract_search_dirs(output, search_list_markers{});
}

}  // namespace incpath
