#include <intent/cli_exit_codes.h>

#include <algorithm>

namespace intent {

IntentSeverity ClassifyIntent(const CodeIntent &intent) {
  const auto risky = std::any_of(
      intent.side_effects.begin(), intent.side_effects.end(),
      [](const SideEffect &effect) { return effect.risk == Risk::kHigh; });
  if (!intent.anti_patterns.empty() || risky) {
    return IntentSeverity::kFlagged;
  }
  return IntentSeverity::kClean;
}

int IntentExitCode(const CodeIntent &intent) {
  switch (ClassifyIntent(intent)) {
  case IntentSeverity::kClean:
    return 0;
  case IntentSeverity::kFlagged:
    return 2;
  }
  return 1;
}

} // namespace intent
