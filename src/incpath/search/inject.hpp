#pragma once

#include "./include_dir.hpp"
#include "./normalize.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace incpath {

/**
 * @brief Append the include directory of each dependency install prefix to a search path.
 *
 * `prefixes` is a colon-separated list of install prefixes. For each prefix, in order,
 * `<prefix>/include` is normalized with `opts` and appended to `dirs`. Empty segments are skipped,
 * and an absent or empty list returns `dirs` unchanged. The directories are not checked for
 * existence.
 */
[[nodiscard]] std::vector<include_directory>
inject_dependency_dirs(std::vector<include_directory>  dirs,
                       std::optional<std::string_view> prefixes,
                       const normalize_options&        opts = {});

/**
 * @brief Read the dependency prefix list from the environment variable named by
 * config::dependency_prefix_var()
 */
[[nodiscard]] std::optional<std::string> dependency_prefixes_from_env();

/// Read the dependency prefix list from the given environment variable
[[nodiscard]] std::optional<std::string> dependency_prefixes_from_env(const std::string& varname);

}  // namespace incpath
