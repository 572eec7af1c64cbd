#include "fixbench/code_extract.hpp"

#include <cctype>
#include <functional>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

constexpr std::string_view kFence = "```";
constexpr std::string_view kWhitespace = " \t\n\r\f\v";

using Strategy = std::function<std::optional<std::string>(std::string_view)>;

std::string trim_copy(std::string_view input) {
    const auto begin = input.find_first_not_of(kWhitespace);
    if (begin == std::string_view::npos) {
        return {};
    }
    const auto end = input.find_last_not_of(kWhitespace);
    return std::string{input.substr(begin, end - begin + 1)};
}

bool is_word(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// `def`, whitespace, identifier character.
bool starts_with_def(std::string_view s) {
    if (s.substr(0, 3) != "def") return false;
    std::size_t i = 3;
    if (i >= s.size() || !is_space(s[i])) return false;
    while (i < s.size() && is_space(s[i])) ++i;
    return i < s.size() && is_word(s[i]);
}

// `def name(args):`, with no `)` inside the argument list.
bool starts_with_def_signature(std::string_view s) {
    if (s.substr(0, 4) != "def ") return false;
    std::size_t i = 4;
    const std::size_t name_start = i;
    while (i < s.size() && is_word(s[i])) ++i;
    if (i == name_start || i >= s.size() || s[i] != '(') return false;
    const auto close = s.find(')', i);
    if (close == std::string_view::npos) return false;
    return close + 1 < s.size() && s[close + 1] == ':';
}

std::size_t skip_space(std::string_view s, std::size_t i) {
    while (i < s.size() && is_space(s[i])) ++i;
    return i;
}

std::vector<std::string_view> split_lines(std::string_view text) {
    std::vector<std::string_view> lines;
    std::size_t start = 0;
    for (;;) {
        const auto nl = text.find('\n', start);
        if (nl == std::string_view::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

std::string join_lines(const std::vector<std::string_view>& lines) {
    std::string out;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) out.push_back('\n');
        out.append(lines[i]);
    }
    return out;
}

std::size_t indent_of(std::string_view line) {
    const auto pos = line.find_first_not_of(kWhitespace);
    return pos == std::string_view::npos ? line.size() : pos;
}

std::string replace_all(std::string text, std::string_view from, std::string_view to) {
    std::size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
    return text;
}

std::string to_lower_copy(std::string_view input) {
    std::string result;
    result.reserve(input.size());
    for (unsigned char ch : input) {
        result.push_back(static_cast<char>(std::tolower(ch)));
    }
    return result;
}

// Start offsets of lines in `text`.
std::vector<std::size_t> line_starts(std::string_view text) {
    std::vector<std::size_t> starts{0};
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\n') starts.push_back(i + 1);
    }
    return starts;
}

// ---------- primary grammar ------------------------------------------------

std::optional<std::string> fenced_def(std::string_view text) {
    for (auto pos = text.find(kFence); pos != std::string_view::npos; pos = text.find(kFence, pos + 1)) {
        const auto body = skip_space(text, pos + kFence.size());
        if (!starts_with_def(text.substr(body))) continue;
        const auto close = text.find(kFence, body);
        if (close == std::string_view::npos) return std::nullopt;
        return trim_copy(text.substr(body, close - body));
    }
    return std::nullopt;
}

std::optional<std::string> unterminated_fence_def(std::string_view text) {
    for (auto pos = text.find(kFence); pos != std::string_view::npos; pos = text.find(kFence, pos + 1)) {
        const auto body = skip_space(text, pos + kFence.size());
        if (!starts_with_def(text.substr(body))) continue;
        if (text.find(kFence, body) != std::string_view::npos) return std::nullopt;
        return trim_copy(text.substr(body));
    }
    return std::nullopt;
}

std::optional<std::string> leading_def(std::string_view text) {
    for (const auto start : line_starts(text)) {
        if (!starts_with_def(text.substr(start))) continue;
        const auto close = text.find("\n```", start);
        return trim_copy(text.substr(start, close == std::string_view::npos ? std::string_view::npos : close - start));
    }
    return std::nullopt;
}

std::optional<std::string> dedent_scan(std::string_view text) {
    std::vector<std::string_view> lines;
    bool in_function = false;
    std::size_t def_indent = 0;

    for (const auto line : split_lines(text)) {
        const auto stripped = trim_copy(line);
        if (!in_function && stripped.rfind("def ", 0) == 0) {
            in_function = true;
            def_indent = indent_of(line);
            lines.push_back(line);
        } else if (in_function) {
            if (!stripped.empty() && stripped.front() != '#' && indent_of(line) <= def_indent) {
                break;
            }
            lines.push_back(line);
            if (stripped.empty() && lines.size() > 5) {
                break;
            }
        }
    }
    if (lines.empty()) return std::nullopt;
    return trim_copy(join_lines(lines));
}

// ---------- secondary grammar ----------------------------------------------

std::string strip_trailing_fences(std::string code) {
    code = trim_copy(code);
    while (code.size() >= kFence.size() && code.compare(code.size() - kFence.size(), kFence.size(), kFence) == 0) {
        code = trim_copy(std::string_view{code}.substr(0, code.size() - kFence.size()));
    }
    return code;
}

std::optional<std::string> opener_block(std::string_view text, std::string_view opener, bool ignore_case) {
    const std::string haystack = ignore_case ? to_lower_copy(text) : std::string{text};
    const std::string needle = ignore_case ? to_lower_copy(opener) : std::string{opener};
    for (auto pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + 1)) {
        const auto body = pos + needle.size();
        if (text.substr(body, 4) != "def ") continue;
        const auto close = text.find(kFence, body);
        if (close == std::string_view::npos) continue;
        return std::string{text.substr(body, close - body)};
    }
    return std::nullopt;
}

std::optional<std::string> python_fence(std::string_view text) {
    return opener_block(text, "```python\n", true);
}

std::optional<std::string> bare_fence(std::string_view text) {
    return opener_block(text, "```\n", false);
}

std::optional<std::string> bare_signature(std::string_view text) {
    for (auto pos = text.find("def "); pos != std::string_view::npos; pos = text.find("def ", pos + 1)) {
        if (!starts_with_def_signature(text.substr(pos))) continue;
        std::size_t end = text.size();
        for (const std::string_view stop : {std::string_view{"\n```"}, std::string_view{"\n\n"}}) {
            const auto at = text.find(stop, pos);
            if (at != std::string_view::npos && at < end) end = at;
        }
        return std::string{text.substr(pos, end - pos)};
    }
    return std::nullopt;
}

std::optional<std::string> fence_skipping_scan(std::string_view text) {
    std::vector<std::string_view> lines;
    bool capturing = false;
    for (const auto line : split_lines(text)) {
        const auto stripped = trim_copy(line);
        if (stripped.rfind("def ", 0) == 0) {
            capturing = true;
            lines.push_back(line);
        } else if (capturing) {
            if (!stripped.empty() && stripped.rfind("```", 0) != 0) {
                lines.push_back(line);
            } else if (stripped.empty() && lines.size() > 3) {
                break;
            }
        }
    }
    if (lines.empty()) return std::nullopt;
    return trim_copy(join_lines(lines));
}

}  // namespace

namespace fixbench::extract {

bool is_valid_function(std::string_view code) {
    const auto trimmed = trim_copy(code);
    if (trimmed.rfind("def ", 0) != 0) {
        return false;
    }
    const auto nl = trimmed.find('\n');
    if (nl == std::string::npos) {
        return false;
    }
    return trimmed.substr(0, nl).find(':') != std::string::npos;
}

std::string primary(std::string_view text, std::string_view original) {
    std::string normalised = replace_all(std::string{text}, "```python", "```");
    normalised = replace_all(std::move(normalised), "```Python", "```");

    const std::vector<Strategy> strategies = {fenced_def, unterminated_fence_def, leading_def, dedent_scan};
    for (const auto& strategy : strategies) {
        if (auto code = strategy(normalised); code && is_valid_function(*code)) {
            return *code;
        }
    }
    return std::string{original};
}

std::string secondary(std::string_view text, std::string_view original) {
    const std::vector<Strategy> patterns = {python_fence, bare_fence, bare_signature};
    for (const auto& pattern : patterns) {
        if (auto match = pattern(text)) {
            auto code = strip_trailing_fences(*match);
            if (code.rfind("def ", 0) == 0) {
                return code;
            }
        }
    }
    if (auto code = fence_skipping_scan(text)) {
        return *code;
    }
    return std::string{original};
}

}  // namespace fixbench::extract
