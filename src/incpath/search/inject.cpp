#include "./inject.hpp"

#include <incpath/config.hpp>
#include <incpath/util/env.hpp>
#include <incpath/util/log.hpp>
#include <incpath/util/string.hpp>

#include <filesystem>

using namespace incpath;

std::vector<include_directory>
incpath::inject_dependency_dirs(std::vector<include_directory>  dirs,
                                std::optional<std::string_view> prefixes,
                                const normalize_options&        opts) {
    if (!prefixes || prefixes->empty()) {
        return dirs;
    }
    for (auto& prefix : split(*prefixes, ":")) {
        if (trim_view(prefix).empty()) {
            incpath_log(trace, "Skipping empty segment in dependency prefix list '{}'", *prefixes);
            continue;
        }
        auto inc = (std::filesystem::path(prefix) / "include").generic_string();
        auto dir = normalize_include_dir(inc, opts);
        incpath_log(debug, "Adding dependency include directory [{}]", dir.path());
        dirs.push_back(std::move(dir));
    }
    return dirs;
}

std::optional<std::string> incpath::dependency_prefixes_from_env() {
    return dependency_prefixes_from_env(config::dependency_prefix_var());
}

std::optional<std::string> incpath::dependency_prefixes_from_env(const std::string& varname) {
    auto val = incpath::getenv(varname);
    if (val) {
        incpath_log(debug, "Dependency prefixes from ${}: {}", varname, *val);
    }
    return val;
}
