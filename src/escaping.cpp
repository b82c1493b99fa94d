#include <intent/escaping.h>

#include <cstdio>
#include <unordered_map>

namespace intent {

std::string EscapeJsonString(const std::string &value) {
  static const std::unordered_map<char, std::string> replacements{
      {'"', "\\\""}, {'\\', "\\\\"}, {'\n', "\\n"},
      {'\r', "\\r"}, {'\t', "\\t"},  {'\b', "\\b"},
      {'\f', "\\f"}};

  std::string escaped;
  escaped.reserve(value.size());
  for (const auto character : value) {
    const auto replacement = replacements.find(character);
    if (replacement != replacements.end()) {
      escaped.append(replacement->second);
      continue;
    }
    if (static_cast<unsigned char>(character) < 0x20) {
      char buffer[8];
      std::snprintf(buffer, sizeof(buffer), "\\u%04x",
                    static_cast<unsigned>(static_cast<unsigned char>(character)));
      escaped.append(buffer);
      continue;
    }
    escaped.push_back(character);
  }
  return escaped;
}

std::string EscapeMarkdownCell(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size());
  for (std::size_t i = 0; i < value.size(); ++i) {
    const auto character = value[i];
    if (character == '|') {
      escaped.append("\\|");
      continue;
    }
    if (character == '\r') {
      continue;
    }
    if (character == '\n') {
      escaped.append("<br>");
      continue;
    }
    escaped.push_back(character);
  }
  return escaped;
}

} // namespace intent
