#include "./extract.hpp"

#include "./errors.hpp"

#include <incpath/error/errors.hpp>
#include <incpath/error/on_error.hpp>
#include <incpath/util/log.hpp>
#include <incpath/util/string.hpp>

#include <boost/leaf/exception.hpp>

using namespace incpath;

std::vector<std::string> incpath::extract_search_dirs(std::string_view           output,
                                                      const search_list_markers& markers) {
    INCPATH_E_SCOPE(e_probe_output{std::string(output)});

    auto start_pos = output.find(markers.start);
    if (start_pos == output.npos) {
        incpath_log(error, "Compiler output does not contain the line '{}'", markers.start);
        BOOST_LEAF_THROW_EXCEPTION(e_delimiter_not_found{markers.start});
    }
    // The listing begins on the line following the start marker
    auto body = output.substr(start_pos + markers.start.size());
    auto nl   = body.find('\n');
    body      = nl == body.npos ? body.substr(body.size()) : body.substr(nl + 1);

    auto end_pos = body.find(markers.end);
    if (end_pos == body.npos) {
        incpath_log(error, "Compiler output does not contain the line '{}'", markers.end);
        BOOST_LEAF_THROW_EXCEPTION(e_delimiter_not_found{markers.end});
    }
    body = body.substr(0, end_pos);

    std::vector<std::string> dirs;
    for (auto line : split_lines(body)) {
        auto entry = trim_view(line);
        if (entry.empty()) {
            continue;
        }
        incpath_log(trace, "  - found search directory: {}", entry);
        dirs.emplace_back(entry);
    }
    return dirs;
}
