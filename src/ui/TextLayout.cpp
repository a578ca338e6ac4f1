#include "TextLayout.hpp"
#include <wchar.h>

namespace cal::layout {

namespace {

struct Glyph {
    char32_t codePoint;
    usize bytes;
};

constexpr char32_t kReplacement = 0xFFFD;

Glyph decodeAt(std::string_view s, usize pos) {
    auto lead = static_cast<unsigned char>(s[pos]);
    usize len = lead < 0x80           ? 1
                : (lead >> 5) == 0x06 ? 2
                : (lead >> 4) == 0x0E ? 3
                : (lead >> 3) == 0x1E ? 4
                                      : 0;
    if (len == 0 || pos + len > s.size())
        return {kReplacement, 1};

    char32_t cp = len == 1 ? lead : lead & (0x7Fu >> len);
    for (usize i = 1; i < len; ++i) {
        auto c = static_cast<unsigned char>(s[pos + i]);
        if ((c & 0xC0) != 0x80)
            return {kReplacement, 1};
        cp = (cp << 6) | (c & 0x3Fu);
    }
    return {cp, len};
}

usize columns(char32_t cp) {
    if (cp < 0x80)
        return 1;
    int w = ::wcwidth(static_cast<wchar_t>(cp));
    return w < 0 ? 1 : static_cast<usize>(w);
}

} // namespace

usize displayWidth(std::string_view text) {
    usize cols = 0;
    for (usize pos = 0; pos < text.size();) {
        auto g = decodeAt(text, pos);
        cols += columns(g.codePoint);
        pos += g.bytes;
    }
    return cols;
}

usize fitColumns(std::string_view text, usize maxColumns) {
    usize cols = 0;
    usize pos = 0;
    while (pos < text.size()) {
        auto g = decodeAt(text, pos);
        usize w = columns(g.codePoint);
        if (cols + w > maxColumns)
            break;
        cols += w;
        pos += g.bytes;
    }
    return pos;
}

std::vector<std::string> wrapLine(std::string_view line, usize width) {
    std::vector<std::string> out;
    if (width < 2) {
        out.emplace_back(line);
        return out;
    }

    const usize limit = width - 1;
    while (displayWidth(line) > limit) {
        usize fit = fitColumns(line, limit);
        auto sp = line.substr(0, fit).rfind(' ');
        if (sp != std::string_view::npos && sp > 0) {
            out.emplace_back(line.substr(0, sp));
            line.remove_prefix(sp + 1);
        } else {
            // A glyph wider than the window still takes a row of its own
            if (fit == 0)
                fit = decodeAt(line, 0).bytes;
            out.emplace_back(line.substr(0, fit));
            line.remove_prefix(fit);
        }
    }
    out.emplace_back(line);
    return out;
}

std::string centerText(std::string_view text, usize width) {
    usize cols = displayWidth(text);
    if (cols >= width)
        return std::string(text);
    usize pad = (width - cols) / 2;
    return std::string(pad, ' ') + std::string(text);
}

usize windowTop(usize offset, usize rows) {
    usize half = rows / 2;
    return offset > half ? offset - half : 0;
}

Band visibleBand(usize terminalRows, usize limitHeight) {
    if (limitHeight == 0 || limitHeight >= terminalRows)
        return {0, terminalRows};
    return {(terminalRows - limitHeight) / 2, limitHeight};
}

std::vector<Row> layoutLines(const std::vector<std::string>& lines,
                             usize offset,
                             usize width,
                             usize rows,
                             bool center) {
    std::vector<Row> out;
    if (rows == 0)
        return out;

    for (usize i = windowTop(offset, rows); i < lines.size(); ++i) {
        for (auto& piece : wrapLine(lines[i], width)) {
            if (out.size() >= rows)
                return out;
            out.push_back({center ? centerText(piece, width) : std::move(piece),
                           i == offset});
        }
    }
    return out;
}

} // namespace cal::layout
