#pragma once

#include <string>

namespace intent {

// JSON string body: quotes, backslashes and control characters escaped.
std::string EscapeJsonString(const std::string &value);

// Markdown table cell: pipes escaped, line breaks rendered as <br>.
std::string EscapeMarkdownCell(const std::string &value);

} // namespace intent
