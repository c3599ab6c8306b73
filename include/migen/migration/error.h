#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace migen::migration {

enum class ErrorKind {
  kNamingConflict,        // same name suffix already on disk; recover with an explicit identifier
  kInvalidInvocation,     // missing/multiple names, empty slug, malformed configuration
  kDirectoryUnavailable,  // migrations directory cannot be listed, created or written
};

// Error is the single failure type returned by migration operations.
// conflicting_paths is populated only for kNamingConflict.
struct Error {
  ErrorKind kind{ErrorKind::kInvalidInvocation};  // NOLINT(readability-identifier-naming)
  std::string message;                            // NOLINT(readability-identifier-naming)
  std::vector<std::string> conflicting_paths;     // NOLINT(readability-identifier-naming)
};

[[nodiscard]] inline std::string_view to_string(const ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kNamingConflict:
      return "naming_conflict";
    case ErrorKind::kInvalidInvocation:
      return "invalid_invocation";
    case ErrorKind::kDirectoryUnavailable:
      return "directory_unavailable";
  }
  return "unknown";
}

}  // namespace migen::migration
