#include "./probe.hpp"

#include "./errors.hpp"

#include <incpath/config.hpp>
#include <incpath/error/errors.hpp>
#include <incpath/error/on_error.hpp>
#include <incpath/util/log.hpp>
#include <incpath/util/proc.hpp>

#include <boost/leaf/exception.hpp>
#include <neo/assert.hpp>

using namespace incpath;

std::string_view incpath::to_string(probe_language lang) noexcept {
    switch (lang) {
    case probe_language::c:
        return "c";
    case probe_language::cxx:
        return "c++";
    }
    neo_assert_always(invariant, false, "Invalid probe_language value", int(lang));
}

std::vector<std::string> incpath::probe_flags_for(probe_language                  lang,
                                                  const std::vector<std::string>& base_flags) {
    auto flags = base_flags;
    flags.emplace_back("-x");
    flags.emplace_back(to_string(lang));
    return flags;
}

std::string compiler_prober::probe(const std::filesystem::path&    compiler,
                                   const std::vector<std::string>& flags) {
    INCPATH_E_SCOPE(e_compiler_path{compiler});
    incpath_log(debug, "Probing include search path of [{}]", compiler.string());
    auto output = do_probe(compiler, flags);
    incpath_log(trace, "Compiler probe output:\n{}", output);
    return output;
}

subprocess_prober::subprocess_prober()
    : _timeout(config::probe_timeout()) {}

std::vector<std::string> subprocess_prober::probe_command(const std::filesystem::path&    compiler,
                                                          const std::vector<std::string>& flags) {
    std::vector<std::string> cmd;
    cmd.reserve(flags.size() + 4);
    cmd.push_back(compiler.string());
    cmd.insert(cmd.end(), flags.begin(), flags.end());
    cmd.push_back("-E");
    cmd.push_back("-");
    cmd.push_back("-v");
    return cmd;
}

std::string subprocess_prober::do_probe(const std::filesystem::path&    compiler,
                                        const std::vector<std::string>& flags) {
    auto cmd = probe_command(compiler, flags);
    auto res = run_proc(proc_options{
        .command = cmd,
        .stdin_  = "",
        .timeout = _timeout,
    });

    if (res.okay()) {
        return std::move(res.output);
    }

    if (res.timed_out) {
        incpath_log(error,
                    "Compiler probe [{}] did not finish within {}ms",
                    quote_command(cmd),
                    _timeout.count());
    } else if (res.signal) {
        incpath_log(error,
                    "Compiler probe [{}] was terminated by signal {}",
                    quote_command(cmd),
                    res.signal);
    } else {
        incpath_log(error,
                    "Compiler probe [{}] exited with code {}",
                    quote_command(cmd),
                    res.retc);
    }
    incpath_log(debug, "Output from the failed compiler probe:\n{}", res.output);
    BOOST_LEAF_THROW_EXCEPTION(e_toolchain_probe_failed{.command   = cmd,
                                                        .retc      = res.retc,
                                                        .signal    = res.signal,
                                                        .timed_out = res.timed_out},
                               e_probe_output{std::move(res.output)});
}
