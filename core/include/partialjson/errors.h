#pragma once

#include <stdexcept>

namespace partialjson {

/// Raised when a component is wired with missing or invalid settings.
/// MUST be thrown at construction time, never for malformed selector input.
struct ConfigurationError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

}  // namespace partialjson
