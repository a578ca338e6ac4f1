#pragma once
// HtmlText.hpp - Text extraction from scraped lyrics pages (libxml2)

#include <string>
#include <string_view>
#include <vector>

namespace cal::lyrics::html {

// Text of every element matching xpath, in document order. Elements matching
// exclude are removed from the page first. <br> becomes a line break,
// entities are decoded and each line is trimmed. Empty if the page does not
// parse.
std::vector<std::string> selectText(std::string_view page,
                                    const std::string& xpath,
                                    const std::string& exclude = {});

// Text of an HTML fragment, same rules as selectText
std::string toText(std::string_view fragment);

} // namespace cal::lyrics::html
