#include "./literal.hpp"

#include <incpath/error/on_error.hpp>

#include <boost/leaf/exception.hpp>
#include <fmt/core.h>

using namespace incpath;

std::string incpath::escape_literal(std::string_view s) {
    std::string ret;
    ret.reserve(s.size());
    for (char c : s) {
        switch (c) {
        case '\\':
            ret.append("\\\\");
            break;
        case '"':
            ret.append("\\\"");
            break;
        case '\n':
            ret.append("\\n");
            break;
        case '\r':
            ret.append("\\r");
            break;
        case '\t':
            ret.append("\\t");
            break;
        default:
            ret.push_back(c);
        }
    }
    return ret;
}

std::string incpath::unescape_literal(std::string_view s) {
    INCPATH_E_SCOPE(e_literal_string{std::string(s)});
    std::string ret;
    ret.reserve(s.size());
    for (auto it = s.begin(); it != s.end(); ++it) {
        if (*it == '"') {
            BOOST_LEAF_THROW_EXCEPTION(e_bad_literal{"Unescaped double-quote in string literal"});
        }
        if (*it != '\\') {
            ret.push_back(*it);
            continue;
        }
        if (++it == s.end()) {
            BOOST_LEAF_THROW_EXCEPTION(e_bad_literal{"Dangling backslash at end of string literal"});
        }
        switch (*it) {
        case '\\':
        case '"':
        case '\'':
            ret.push_back(*it);
            break;
        case 'n':
            ret.push_back('\n');
            break;
        case 'r':
            ret.push_back('\r');
            break;
        case 't':
            ret.push_back('\t');
            break;
        default:
            BOOST_LEAF_THROW_EXCEPTION(
                e_bad_literal{fmt::format("Unknown escape sequence '\\{}' in string literal", *it)});
        }
    }
    return ret;
}
