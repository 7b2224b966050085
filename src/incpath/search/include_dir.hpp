#pragma once

#include <incpath/util/literal.hpp>

#include <ostream>
#include <string>
#include <utility>

namespace incpath {

/**
 * @brief A directory in an include search path.
 *
 * Holds the canonical path produced by normalize_include_dir(). The escaped() form is safe to place
 * between double-quotes in generated configuration text. A sequence of these is ordered by search
 * precedence.
 */
class include_directory {
    std::string _path;

public:
    include_directory() = default;

    explicit include_directory(std::string canonical)
        : _path(std::move(canonical)) {}

    [[nodiscard]] const std::string& path() const noexcept { return _path; }
    [[nodiscard]] std::string        escaped() const { return escape_literal(_path); }

    friend bool operator==(const include_directory&, const include_directory&) = default;

    friend std::ostream& operator<<(std::ostream& out, const include_directory& self) {
        return out << "include_directory{\"" << self.escaped() << "\"}";
    }
};

}  // namespace incpath
