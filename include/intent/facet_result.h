#pragma once

#include <intent/errors.h>
#include <intent/models.h>

#include <exception>
#include <optional>
#include <string>
#include <utility>

namespace intent {

// Outcome of one extractor: its value, or the fallback value together with
// the error diagnostic explaining why the facet degraded.
template <typename T> struct FacetResult {
  T value;
  std::optional<Diagnostic> diagnostic;

  bool ok() const { return !diagnostic.has_value(); }
};

inline Diagnostic MakeFacetDiagnostic(std::string facet, std::string message) {
  Diagnostic diagnostic;
  diagnostic.facet = std::move(facet);
  diagnostic.severity = DiagnosticSeverity::kError;
  diagnostic.message = std::move(message);
  return diagnostic;
}

// Runs `extract`, turning any std::exception it throws into a degraded
// result. ParseError is rethrown: it is never a per-facet failure.
template <typename T, typename Extract>
FacetResult<T> RunFacet(const std::string &facet, T fallback,
                        Extract &&extract) {
  try {
    return FacetResult<T>{extract(), std::nullopt};
  } catch (const ParseError &) {
    throw;
  } catch (const ExtractorError &error) {
    return FacetResult<T>{std::move(fallback),
                          MakeFacetDiagnostic(error.facet(), error.what())};
  } catch (const std::exception &error) {
    return FacetResult<T>{std::move(fallback),
                          MakeFacetDiagnostic(facet, error.what())};
  }
}

} // namespace intent
