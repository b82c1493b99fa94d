#pragma once

#include <intent/models.h>

namespace intent {

enum class IntentSeverity { kClean, kFlagged };

// Flagged when the unit has anti-patterns or a high-risk side effect.
IntentSeverity ClassifyIntent(const CodeIntent &intent);

// 0 for a clean unit, 2 for a flagged one. Errors exit with 1.
int IntentExitCode(const CodeIntent &intent);

} // namespace intent
