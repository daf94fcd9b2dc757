#pragma once

#include <mcp_bridge/core/result.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace mcp_bridge {

// Split a command line the way a POSIX shell splits words: whitespace
// separates words, single quotes are literal, double quotes allow \" \\ \$
// and \` escapes, and a backslash outside quotes escapes the next character.
// No expansion of variables, globs or substitutions is performed.
//
// Errors: unterminated quote, trailing backslash.
Result<std::vector<std::string>, std::string> SplitCommandLine(std::string_view line);

// Inverse for display/logging: quote each word that needs it.
std::string JoinCommandLine(const std::vector<std::string>& words);

} // namespace mcp_bridge
