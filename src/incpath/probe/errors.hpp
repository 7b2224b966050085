#pragma once

#include <string>
#include <vector>

namespace incpath {

/**
 * @brief Error object: The compiler probe did not complete successfully.
 *
 * The captured output is attached separately as an e_probe_output.
 */
struct e_toolchain_probe_failed {
    std::vector<std::string> command;

    int  retc      = 0;
    int  signal    = 0;
    bool timed_out = false;
};

}  // namespace incpath
