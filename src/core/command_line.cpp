#include <mcp_bridge/core/command_line.hpp>

namespace mcp_bridge {

namespace {

bool IsShellSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

bool NeedsQuoting(const std::string& word) {
    if (word.empty()) return true;
    for (char c : word) {
        if (IsShellSpace(c) || c == '\'' || c == '"' || c == '\\' || c == '$' ||
            c == '`' || c == '*' || c == '?' || c == ';' || c == '&' ||
            c == '|' || c == '<' || c == '>' || c == '(' || c == ')') {
            return true;
        }
    }
    return false;
}

} // anonymous namespace

Result<std::vector<std::string>, std::string> SplitCommandLine(std::string_view line) {
    using R = Result<std::vector<std::string>, std::string>;

    enum class Mode { Normal, Single, Double };

    std::vector<std::string> words;
    std::string current;
    bool in_word = false;
    Mode mode = Mode::Normal;

    for (size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        switch (mode) {
            case Mode::Normal:
                if (IsShellSpace(c)) {
                    if (in_word) {
                        words.push_back(std::move(current));
                        current.clear();
                        in_word = false;
                    }
                } else if (c == '\'') {
                    mode = Mode::Single;
                    in_word = true;
                } else if (c == '"') {
                    mode = Mode::Double;
                    in_word = true;
                } else if (c == '\\') {
                    if (i + 1 >= line.size()) {
                        return R::Err("Trailing backslash in command line");
                    }
                    current += line[++i];
                    in_word = true;
                } else {
                    current += c;
                    in_word = true;
                }
                break;
            case Mode::Single:
                if (c == '\'') {
                    mode = Mode::Normal;
                } else {
                    current += c;
                }
                break;
            case Mode::Double:
                if (c == '"') {
                    mode = Mode::Normal;
                } else if (c == '\\' && i + 1 < line.size() &&
                           (line[i + 1] == '"' || line[i + 1] == '\\' ||
                            line[i + 1] == '$' || line[i + 1] == '`')) {
                    current += line[++i];
                } else {
                    current += c;
                }
                break;
        }
    }

    if (mode != Mode::Normal) {
        return R::Err(mode == Mode::Single ? "Unterminated single quote in command line"
                                           : "Unterminated double quote in command line");
    }
    if (in_word) {
        words.push_back(std::move(current));
    }
    return R::Ok(std::move(words));
}

std::string JoinCommandLine(const std::vector<std::string>& words) {
    std::string out;
    for (const auto& word : words) {
        if (!out.empty()) out += ' ';
        if (!NeedsQuoting(word)) {
            out += word;
            continue;
        }
        out += '\'';
        for (char c : word) {
            if (c == '\'') {
                out += "'\\''";
            } else {
                out += c;
            }
        }
        out += '\'';
    }
    return out;
}

} // namespace mcp_bridge
