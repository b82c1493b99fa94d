#pragma once

#include <intent/models.h>

#include <string>

namespace intent {

// Single-line JSON object with snake_case keys; optional values absent from
// the record are written as null.
std::string SerializeIntent(const CodeIntent &intent);

// Inverse of SerializeIntent. Throws std::invalid_argument for malformed
// documents, unknown enum names or a missing purpose/category.
CodeIntent DeserializeIntent(const std::string &json);

std::string SerializeSideEffect(const SideEffect &effect);

} // namespace intent
