#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace incpath {

/// The source language the compiler is told to preprocess while probing
enum class probe_language {
    c,
    cxx,
};

/// Get the spelling of the language as passed to '-x' ("c" or "c++")
std::string_view to_string(probe_language) noexcept;

/**
 * @brief Build the probing flags for the given language: the base flags followed by "-x <lang>"
 */
[[nodiscard]] std::vector<std::string> probe_flags_for(probe_language                  lang,
                                                       const std::vector<std::string>& base_flags);

/**
 * @brief Obtains the diagnostic output of a compiler that lists its default include directories.
 */
class compiler_prober {
    virtual std::string do_probe(const std::filesystem::path&    compiler,
                                 const std::vector<std::string>& flags)
        = 0;

public:
    virtual ~compiler_prober() = default;

    /**
     * @brief Invoke the compiler with the given flags and return its diagnostic text.
     *
     * Errors raised by the implementation are annotated with an e_compiler_path.
     */
    std::string probe(const std::filesystem::path& compiler, const std::vector<std::string>& flags);
};

/**
 * @brief A compiler_prober that spawns the compiler as a subprocess.
 *
 * The compiler is run as `<compiler> <flags...> -E - -v` with an empty stdin. An exit code of zero
 * is success regardless of any warnings it prints. A non-zero exit, death by signal, or expiry of
 * the timeout throws an e_toolchain_probe_failed with the captured output as e_probe_output.
 */
class subprocess_prober : public compiler_prober {
    std::chrono::milliseconds _timeout;

    std::string do_probe(const std::filesystem::path&    compiler,
                         const std::vector<std::string>& flags) override;

public:
    /// Use the timeout from config::probe_timeout()
    subprocess_prober();

    explicit subprocess_prober(std::chrono::milliseconds timeout) noexcept
        : _timeout(timeout) {}

    [[nodiscard]] std::chrono::milliseconds timeout() const noexcept { return _timeout; }

    /// The full command line run for a probe
    [[nodiscard]] static std::vector<std::string>
    probe_command(const std::filesystem::path& compiler, const std::vector<std::string>& flags);
};

}  // namespace incpath
