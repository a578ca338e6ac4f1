#include "LyricsText.hpp"
#include <algorithm>
#include <cctype>

namespace cal::lyrics::text {

namespace {

bool isBlank(std::string_view s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isspace(c) != 0;
    });
}

char lower(char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

} // namespace

std::vector<std::string> splitLines(std::string_view text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start <= text.size()) {
        size_t nl = text.find('\n', start);
        if (nl == std::string_view::npos)
            nl = text.size();
        std::string line(text.substr(start, nl - start));
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        lines.push_back(std::move(line));
        start = nl + 1;
    }
    while (!lines.empty() && isBlank(lines.back()))
        lines.pop_back();
    return lines;
}

std::string joinLines(const std::vector<std::string>& lines) {
    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0)
            out += '\n';
        out += lines[i];
    }
    return out;
}

bool isSectionHeader(std::string_view line) {
    std::string t = trim(line);
    return t.size() >= 2 && t.front() == '[' && t.back() == ']' &&
           t.find(']') == t.size() - 1;
}

std::vector<std::string> clearHeaders(const std::vector<std::string>& lines) {
    std::vector<std::string> out;
    out.reserve(lines.size());
    for (const auto& line : lines) {
        if (!isSectionHeader(line))
            out.push_back(line);
    }
    return out;
}

std::string trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return std::string(s.substr(b, e - b));
}

std::string trimLeadingBlankLines(std::string_view text) {
    size_t lineStart = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '\n') {
            lineStart = i + 1;
        } else if (!std::isspace(static_cast<unsigned char>(c))) {
            return std::string(text.substr(lineStart));
        }
    }
    return {};
}

std::string normalizeForUrl(std::string_view s) {
    std::string out;
    for (char c : s) {
        if (std::isalnum(static_cast<unsigned char>(c)) &&
            static_cast<unsigned char>(c) < 0x80)
            out += lower(c);
    }
    return out;
}

bool containsIgnoreCase(std::string_view haystack, std::string_view needle) {
    auto it = std::search(haystack.begin(),
                          haystack.end(),
                          needle.begin(),
                          needle.end(),
                          [](char a, char b) { return lower(a) == lower(b); });
    return it != haystack.end() || needle.empty();
}

} // namespace cal::lyrics::text
