#pragma once

#include <neo/fwd.hpp>

#include <functional>
#include <string_view>

namespace boost::leaf {

class verbose_diagnostic_info;

}  // namespace boost::leaf

namespace incpath {

void leaf_handle_unknown_void(std::string_view message,
                              const boost::leaf::verbose_diagnostic_info&);

template <typename T>
auto leaf_handle_unknown(std::string_view message, T&& val) {
    return [val = NEO_FWD(val), message](const boost::leaf::verbose_diagnostic_info& info) {
        leaf_handle_unknown_void(message, info);
        return val;
    };
}

/**
 * @brief Run an include search path resolution, reporting any failure.
 *
 * Returns the result of `fn` if it succeeds. If it fails, the error and any captured compiler
 * output are written to the log and the return value is 1.
 */
int handle_resolve_errors(const std::function<int()>& fn);

}  // namespace incpath
