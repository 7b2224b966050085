#include "./resolve.hpp"

#include <incpath/error/errors.hpp>
#include <incpath/error/on_error.hpp>
#include <incpath/search/inject.hpp>
#include <incpath/util/log.hpp>

#include <set>

using namespace incpath;

void incpath::remove_later_duplicates(std::vector<include_directory>& dirs) {
    std::set<std::string>          seen;
    std::vector<include_directory> kept;
    kept.reserve(dirs.size());
    for (auto& dir : dirs) {
        if (!seen.insert(dir.path()).second) {
            incpath_log(trace, "Dropping duplicate include directory [{}]", dir.path());
            continue;
        }
        kept.push_back(std::move(dir));
    }
    dirs = std::move(kept);
}

std::vector<include_directory> incpath::resolve_include_dirs(const resolve_params& params,
                                                             compiler_prober&      prober) {
    INCPATH_E_SCOPE(e_compiler_path{params.compiler});
    incpath_log(debug, "Resolving include search path for [{}]", params.compiler.string());

    std::vector<include_directory> dirs;
    for (auto lang : params.languages) {
        INCPATH_E_SCOPE(e_probe_language{std::string(to_string(lang))});
        auto output = prober.probe(params.compiler, probe_flags_for(lang, params.base_flags));
        for (auto& raw : extract_search_dirs(output, params.markers)) {
            dirs.push_back(normalize_include_dir(raw, params.normalize));
        }
    }
    incpath_log(debug,
                "Compiler [{}] reports {} include directories",
                params.compiler.string(),
                dirs.size());

    dirs = inject_dependency_dirs(std::move(dirs), params.dependency_prefixes, params.normalize);

    if (params.deduplicate) {
        remove_later_duplicates(dirs);
    }

    for (auto& dir : dirs) {
        incpath_log(trace, "  - search: {}", dir.path());
    }
    return dirs;
}
