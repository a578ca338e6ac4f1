#pragma once
// LyricsText.hpp - Plain-text helpers for lyrics bodies

#include <string>
#include <string_view>
#include <vector>

namespace cal::lyrics::text {

// Splits on '\n', drops '\r' and trailing blank lines
std::vector<std::string> splitLines(std::string_view text);
std::string joinLines(const std::vector<std::string>& lines);

// A line consisting solely of a bracketed label, e.g. "[Chorus]"
bool isSectionHeader(std::string_view line);
std::vector<std::string> clearHeaders(const std::vector<std::string>& lines);

std::string trim(std::string_view s);
std::string trimLeadingBlankLines(std::string_view text);

// Lowercase ASCII alphanumerics only: "AC/DC" -> "acdc"
std::string normalizeForUrl(std::string_view s);

bool containsIgnoreCase(std::string_view haystack, std::string_view needle);

} // namespace cal::lyrics::text
