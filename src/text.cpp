#include <intent/text.h>

#include <algorithm>
#include <cctype>

namespace intent {

std::string ToLower(std::string value) {
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::string Trim(std::string value) {
  const auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
  value.erase(value.begin(),
              std::find_if(value.begin(), value.end(),
                           [&](unsigned char ch) { return !is_space(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
                           [&](unsigned char ch) { return !is_space(ch); })
                  .base(),
              value.end());
  return value;
}

bool Contains(std::string_view haystack, std::string_view needle) {
  return haystack.find(needle) != std::string_view::npos;
}

bool StartsWith(std::string_view value, std::string_view prefix) {
  return value.substr(0, prefix.size()) == prefix;
}

bool ContainsAny(std::string_view haystack,
                 const std::vector<std::string> &needles, bool ignore_case) {
  if (!ignore_case) {
    return std::any_of(needles.begin(), needles.end(),
                       [&](const auto &needle) {
                         return Contains(haystack, needle);
                       });
  }
  const auto lowered = ToLower(std::string(haystack));
  return std::any_of(needles.begin(), needles.end(), [&](const auto &needle) {
    return Contains(lowered, ToLower(needle));
  });
}

bool IsOneOf(std::string_view value, const std::vector<std::string> &values) {
  return std::find(values.begin(), values.end(), value) != values.end();
}

void AppendUnique(std::vector<std::string> &values, const std::string &value) {
  if (!IsOneOf(value, values)) {
    values.push_back(value);
  }
}

} // namespace intent
