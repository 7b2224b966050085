#pragma once

#include <cctype>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

namespace incpath {

inline namespace string_utils {

inline std::string_view sview(std::string_view::const_iterator beg,
                              std::string_view::const_iterator end) {
    return std::string_view(&*beg, static_cast<std::size_t>(std::distance(beg, end)));
}

inline std::string_view trim_view(std::string_view s) {
    auto iter = s.begin();
    auto end  = s.end();
    while (iter != end && std::isspace(static_cast<unsigned char>(*iter))) {
        ++iter;
    }
    auto riter = s.rbegin();
    auto rend  = std::make_reverse_iterator(iter);
    while (riter != rend && std::isspace(static_cast<unsigned char>(*riter))) {
        ++riter;
    }
    auto new_end = riter.base();
    if (iter == new_end) {
        return {};
    }
    return sview(iter, new_end);
}

inline std::vector<std::string> split(std::string_view str, std::string_view sep) {
    std::vector<std::string>    ret;
    std::string_view::size_type prev_pos = 0;
    auto                        pos      = prev_pos;
    while ((pos = str.find(sep, prev_pos)) != str.npos) {
        ret.emplace_back(str.substr(prev_pos, pos - prev_pos));
        prev_pos = pos + sep.length();
    }
    ret.emplace_back(str.substr(prev_pos));
    return ret;
}

/**
 * @brief Split the given text into lines. Accepts both '\n' and "\r\n" line endings.
 */
inline std::vector<std::string_view> split_lines(std::string_view str) {
    std::vector<std::string_view> ret;
    while (!str.empty()) {
        auto nl   = str.find('\n');
        auto line = str.substr(0, nl);
        if (line.ends_with('\r')) {
            line.remove_suffix(1);
        }
        ret.push_back(line);
        if (nl == str.npos) {
            break;
        }
        str.remove_prefix(nl + 1);
    }
    return ret;
}

inline std::string replace(std::string_view str, std::string_view key, std::string_view repl) {
    std::string                 ret;
    std::string_view::size_type pos      = 0;
    std::string_view::size_type prev_pos = 0;
    while (pos = str.find(key, pos), pos != key.npos) {
        ret.append(str.begin() + prev_pos, str.begin() + pos);
        ret.append(repl);
        prev_pos = pos += key.size();
    }
    ret.append(str.begin() + prev_pos, str.end());
    return ret;
}

}  // namespace string_utils

}  // namespace incpath
