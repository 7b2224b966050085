#pragma once

#include <filesystem>
#include <string>

namespace incpath {

/// The compiler executable involved in a failed operation
struct e_compiler_path {
    std::filesystem::path value;
};

/// The language ("c" or "c++") that was being probed when an error occurred
struct e_probe_language {
    std::string value;
};

/// The complete captured output of a compiler probe
struct e_probe_output {
    std::string value;
};

}  // namespace incpath
