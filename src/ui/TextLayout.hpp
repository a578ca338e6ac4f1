#pragma once
// TextLayout.hpp - Terminal-independent placement of lyrics lines

#include <string>
#include <string_view>
#include <vector>
#include "util/Types.hpp"

namespace cal::layout {

struct Band {
    usize firstRow{0};
    usize rows{0};
};

struct Row {
    std::string text;
    bool current{false};
};

// Terminal columns of a UTF-8 string, per wcwidth() in the current locale.
// Unprintable code points and broken sequences count as one column.
usize displayWidth(std::string_view text);

// Byte length of the longest prefix that fits in columns
usize fitColumns(std::string_view text, usize maxColumns);

// Breaks at the last space that keeps each piece narrower than width
// columns; hard-breaks words longer than the window
std::vector<std::string> wrapLine(std::string_view line, usize width);

std::string centerText(std::string_view text, usize width);

// First line to draw so that offset sits in the middle of the band
usize windowTop(usize offset, usize rows);

// limitHeight 0 or >= terminal height means the whole terminal
Band visibleBand(usize terminalRows, usize limitHeight);

// Rows to paint, top to bottom, at most band rows; the line at offset is
// flagged current
std::vector<Row> layoutLines(const std::vector<std::string>& lines,
                             usize offset,
                             usize width,
                             usize rows,
                             bool center);

} // namespace cal::layout
