#pragma once

#include <incpath/util/log.hpp>

#include <chrono>
#include <string>

namespace incpath::config {

namespace defaults {

/**
 * @brief The upper bound on a single compiler probe. Reads INCPATH_PROBE_TIMEOUT_MS as a count of
 * milliseconds, defaulting to thirty seconds if unset or unparseable.
 */
std::chrono::milliseconds probe_timeout();

/**
 * @brief The name of the environment variable holding the colon-separated list of dependency
 * install prefixes. INCPATH_DEP_PREFIX_VAR may rename it; the default is INCPATH_DEP_PREFIXES.
 */
std::string dependency_prefix_var();

/**
 * @brief The log level requested by INCPATH_LOG_LEVEL (one of trace, debug, info, warn, error,
 * critical, silent). Defaults to 'info'.
 */
log::level log_level();

}  // namespace defaults

using namespace defaults;

}  // namespace incpath::config
