#include "./handle.hpp"

#include <incpath/error/errors.hpp>
#include <incpath/probe/errors.hpp>
#include <incpath/search/errors.hpp>
#include <incpath/util/literal.hpp>
#include <incpath/util/log.hpp>
#include <incpath/util/proc.hpp>

#include <boost/leaf.hpp>
#include <fmt/ostream.h>

#include <system_error>

using namespace incpath;

void incpath::leaf_handle_unknown_void(std::string_view                            message,
                                       const boost::leaf::verbose_diagnostic_info& info) {
    incpath_log(warn, "{}", message);
    incpath_log(warn, "An unhandled error occurred:\n{}", fmt::streamed(info));
}

namespace {

std::string_view language_of(const e_probe_language* lang) {
    return lang ? std::string_view(lang->value) : std::string_view("<unknown>");
}

std::string compiler_of(const e_compiler_path* cc) {
    return cc ? cc->value.string() : std::string("<unknown>");
}

auto handlers = std::tuple(  //
    [](const e_toolchain_probe_failed& fail,
       const e_probe_output&           output,
       const e_compiler_path*          cc,
       const e_probe_language*         lang) {
        incpath_log(error,
                    "Failed to probe the {} include search path of compiler [{}]",
                    language_of(lang),
                    compiler_of(cc));
        incpath_log(error, "  Command: {}", quote_command(fail.command));
        if (fail.timed_out) {
            incpath_log(error, "  The compiler did not finish before the timeout expired");
        } else if (fail.signal) {
            incpath_log(error, "  The compiler was killed by signal {}", fail.signal);
        } else {
            incpath_log(error, "  The compiler exited with code {}", fail.retc);
        }
        incpath_log(error, "  Compiler output:\n{}", output.value);
        return 1;
    },
    [](const e_delimiter_not_found& missing,
       const e_probe_output&        output,
       const e_compiler_path*       cc,
       const e_probe_language*      lang) {
        incpath_log(error,
                    "The {} diagnostic output of compiler [{}] has no line '{}'",
                    language_of(lang),
                    compiler_of(cc),
                    missing.value);
        incpath_log(error,
                    "  (The compiler may be of an unsupported kind or version, or its output may "
                    "be localized)");
        incpath_log(error, "  Compiler output:\n{}", output.value);
        return 1;
    },
    [](const e_bad_literal& bad, const e_literal_string* str) {
        incpath_log(error, "Invalid string literal: {}", bad.value);
        if (str) {
            incpath_log(error, "  (While decoding \"{}\")", str->value);
        }
        return 1;
    },
    [](const std::system_error& exc, const e_compiler_path* cc) {
        incpath_log(error,
                    "Failed to run compiler [{}]: {}",
                    compiler_of(cc),
                    exc.what());
        return 1;
    },
    leaf_handle_unknown("Include search path resolution failed", 1));

}  // namespace

int incpath::handle_resolve_errors(const std::function<int()>& fn) {
    return boost::leaf::try_catch(fn, handlers);
}
