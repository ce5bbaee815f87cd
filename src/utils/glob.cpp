#include "utils/glob.hpp"

namespace rampart::utils {

std::string GlobToRegexSource(const std::string& glob) {
    std::string out = "^";
    const auto size = glob.size();
    for (std::size_t i = 0; i < size; ++i) {
        const char ch = glob[i];
        if (ch == '*') {
            const bool double_star = i + 1 < size && glob[i + 1] == '*';
            if (!double_star) {
                out += "[^/]*";
                continue;
            }
            const bool at_start = i == 0 || glob[i - 1] == '/';
            const bool followed_by_slash = i + 2 < size && glob[i + 2] == '/';
            if (at_start && followed_by_slash) {
                out += "(?:.*/)?";
                i += 2;
            } else {
                out += ".*";
                i += 1;
            }
            continue;
        }
        if (ch == '/' && i + 3 == size && glob.compare(i, 3, "/**") == 0) {
            out += "(?:/.*)?";
            break;
        }
        if (ch == '?') {
            out += "[^/]";
            continue;
        }
        if (ch == '[') {
            const auto close = glob.find(']', i + 1);
            if (close != std::string::npos) {
                std::string body = glob.substr(i + 1, close - i - 1);
                if (!body.empty() && body[0] == '!') {
                    body[0] = '^';
                }
                out += "[" + body + "]";
                i = close;
                continue;
            }
        }
        switch (ch) {
            case '.': case '+': case '^': case '$': case '{': case '}':
            case '(': case ')': case '|': case '[': case ']': case '\\':
                out.push_back('\\');
                out.push_back(ch);
                break;
            default:
                out.push_back(ch);
        }
    }
    out += "$";
    return out;
}

std::regex GlobToRegex(const std::string& glob, bool case_insensitive) {
    auto flags = std::regex::ECMAScript;
    if (case_insensitive) {
        flags |= std::regex::icase;
    }
    return std::regex(GlobToRegexSource(glob), flags);
}

bool GlobMatch(const std::string& glob, const std::string& path, bool case_insensitive) {
    return std::regex_match(path, GlobToRegex(glob, case_insensitive));
}

bool HasGlobMeta(const std::string& value) {
    return value.find_first_of("*?[") != std::string::npos;
}

}  // namespace rampart::utils
