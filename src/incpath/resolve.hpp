#pragma once

#include <incpath/probe/probe.hpp>
#include <incpath/search/extract.hpp>
#include <incpath/search/include_dir.hpp>
#include <incpath/search/normalize.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace incpath {

/**
 * @brief Parameters for one include search path resolution
 */
struct resolve_params {
    /// The compiler executable to probe
    std::filesystem::path compiler;
    /// Flags that affect the search path (e.g. --sysroot, -stdlib=), passed on every probe
    std::vector<std::string> base_flags = {};
    /// The languages to probe, in order. Their search lists are concatenated.
    std::vector<probe_language> languages = {probe_language::cxx};
    /// Options used to normalize every directory, both compiler defaults and dependency dirs
    normalize_options normalize = {};
    /// Colon-separated list of dependency install prefixes. See dependency_prefixes_from_env()
    std::optional<std::string> dependency_prefixes = std::nullopt;
    /// The markers that bound the search list in the compiler's output
    search_list_markers markers = {};
    /// If true, later occurrences of a directory are removed
    bool deduplicate = true;
};

/**
 * @brief Resolve the ordered include search path for a compiler.
 *
 * The compiler's default directories come first, in the order it reports them, followed by the
 * `include/` directory of each dependency prefix. Errors from probing and parsing propagate, with
 * the compiler path and language attached as e_compiler_path and e_probe_language.
 */
[[nodiscard]] std::vector<include_directory> resolve_include_dirs(const resolve_params& params,
                                                                  compiler_prober&      prober);

/**
 * @brief Remove every directory that also appears earlier in the sequence.
 */
void remove_later_duplicates(std::vector<include_directory>& dirs);

}  // namespace incpath
