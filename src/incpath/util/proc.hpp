#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace incpath {

bool needs_quoting(std::string_view);

std::string quote_argument(std::string_view);

template <typename Container>
std::string quote_command(const Container& c) {
    std::string acc;
    for (const auto& arg : c) {
        acc += quote_argument(arg) + " ";
    }
    if (!acc.empty()) {
        acc.pop_back();
    }
    return acc;
}

struct proc_result {
    int         signal    = 0;
    int         retc      = 0;
    bool        timed_out = false;
    std::string output;

    bool okay() const noexcept { return retc == 0 && signal == 0 && !timed_out; }
};

struct proc_options {
    std::vector<std::string> command;

    /// Text written to the standard input of the subprocess. The pipe is closed once written.
    std::string stdin_ = "";

    /**
     * Timeout for the subprocess, in milliseconds. If unset, will wait forever. When the timeout
     * expires the subprocess and everything it started are killed, and output collected so far is
     * returned.
     */
    std::optional<std::chrono::milliseconds> timeout = std::nullopt;
};

/**
 * @brief Spawn a subprocess and wait for it to exit, collecting its stdout and stderr together.
 *
 * Failure to create the process plumbing throws std::system_error. A command that cannot be
 * executed is reported as an exit code of 255 and an explanation in the output.
 *
 * The subprocess runs in its own process group and inherits no descriptors other than its stdio.
 * The SIGPIPE disposition of the calling process is left unchanged.
 */
proc_result run_proc(const proc_options& opts);

inline proc_result run_proc(std::vector<std::string> args) {
    return run_proc(proc_options{.command = std::move(args)});
}

}  // namespace incpath
