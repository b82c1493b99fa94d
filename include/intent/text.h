#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace intent {

std::string ToLower(std::string value);
std::string Trim(std::string value);

bool Contains(std::string_view haystack, std::string_view needle);
bool StartsWith(std::string_view value, std::string_view prefix);

// True when `haystack` contains any of `needles`; with `ignore_case` both
// sides are compared lowercased.
bool ContainsAny(std::string_view haystack,
                 const std::vector<std::string> &needles,
                 bool ignore_case = false);

bool IsOneOf(std::string_view value, const std::vector<std::string> &values);

// Appends `value` unless it is already present.
void AppendUnique(std::vector<std::string> &values, const std::string &value);

} // namespace intent
