#include "./emit.hpp"

#include <fmt/core.h>

std::string incpath::render_list_field(std::string_view                      name,
                                       const std::vector<include_directory>& dirs) {
    if (dirs.empty()) {
        return fmt::format("{} = []", name);
    }
    auto out = fmt::format("{} = [\n", name);
    for (auto& dir : dirs) {
        out += fmt::format("    \"{}\",\n", dir.escaped());
    }
    out += "]";
    return out;
}
