#pragma once

#include "./include_dir.hpp"

#include <filesystem>
#include <optional>
#include <string_view>

namespace incpath {

struct normalize_options {
    /// The directory from which the build runs the compiler. Paths beneath it become relative.
    std::optional<std::filesystem::path> exec_root = std::nullopt;
};

/**
 * @brief Convert a raw include directory entry into its canonical form.
 *
 * - Surrounding whitespace and any " (framework directory)" annotation are removed.
 * - The path is made lexically normal, without redundant dots or trailing separators.
 * - An absolute path beneath `opts.exec_root` is rewritten relative to it (the root itself
 *   becomes "."). Other paths are unchanged.
 *
 * normalize_include_dir(normalize_include_dir(s, o).path(), o) == normalize_include_dir(s, o)
 */
[[nodiscard]] include_directory normalize_include_dir(std::string_view         raw,
                                                      const normalize_options& opts = {});

}  // namespace incpath
