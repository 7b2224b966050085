#pragma once

#include <incpath/search/include_dir.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace incpath {

/**
 * @brief Render the directories as a list-valued field of generated configuration text.
 *
 * Each directory appears as a double-quoted, escaped string on its own line:
 *
 *     cxx_builtin_include_directories = [
 *         "/usr/include",
 *     ]
 *
 * An empty sequence renders as `<name> = []`.
 */
[[nodiscard]] std::string render_list_field(std::string_view                      name,
                                            const std::vector<include_directory>& dirs);

}  // namespace incpath
