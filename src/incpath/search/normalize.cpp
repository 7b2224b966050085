#include "./normalize.hpp"

#include <incpath/util/log.hpp>
#include <incpath/util/string.hpp>

using namespace incpath;
namespace fs = std::filesystem;

namespace {

constexpr std::string_view FRAMEWORK_SUFFIX = "(framework directory)";

std::string_view strip_annotations(std::string_view s) {
    s = trim_view(s);
    while (s.ends_with(FRAMEWORK_SUFFIX)) {
        s.remove_suffix(FRAMEWORK_SUFFIX.size());
        s = trim_view(s);
    }
    return s;
}

fs::path lexical_normal(const fs::path& p_) {
    auto p = p_.lexically_normal();
    while (p.has_relative_path() && p.filename().empty()) {
        p = p.parent_path();
    }
    return p;
}

/// Strip and normalize until neither step changes the text. Removing a trailing separator can
/// expose whitespace or an annotation that the previous strip could not see.
std::string canonical_text(std::string_view raw) {
    std::string cur{strip_annotations(raw)};
    while (!cur.empty()) {
        auto normal = lexical_normal(fs::path(cur)).generic_string();
        auto next   = std::string(strip_annotations(normal));
        if (next == cur) {
            break;
        }
        cur = std::move(next);
    }
    return cur;
}

}  // namespace

include_directory incpath::normalize_include_dir(std::string_view         raw,
                                                 const normalize_options& opts) {
    auto plain = canonical_text(raw);
    if (plain.empty()) {
        return include_directory{};
    }
    auto path = fs::path(plain);

    if (opts.exec_root && path.is_absolute()) {
        auto root = lexical_normal(*opts.exec_root);
        auto rel  = path.lexically_relative(root);
        if (!rel.empty() && *rel.begin() != "..") {
            incpath_log(trace,
                        "Include directory [{}] is within the execution root, using [{}]",
                        path.string(),
                        rel.string());
            path = rel;
        }
    }
    return include_directory{path.generic_string()};
}
