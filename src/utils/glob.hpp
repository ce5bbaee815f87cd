#pragma once

#include <regex>
#include <string>

namespace rampart::utils {

// Translates a shell-style glob into an anchored ECMAScript regex.
//   "**/"  matches zero or more leading directories
//   "/**"  at the end matches the directory itself and everything beneath it
//   "**"   matches anything, "*" anything except '/', "?" one character
// Bracket expressions are passed through.
std::string GlobToRegexSource(const std::string& glob);

std::regex GlobToRegex(const std::string& glob, bool case_insensitive = false);

bool GlobMatch(const std::string& glob, const std::string& path, bool case_insensitive = false);

bool HasGlobMeta(const std::string& value);

}  // namespace rampart::utils
