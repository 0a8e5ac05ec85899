#include "core/model/types.hpp"

namespace permaweb {

std::string to_string(ParseError error) {
  switch (error) {
    case ParseError::InvalidVersion:
      return "InvalidVersion";
    case ParseError::EmptyIdentifier:
      return "EmptyIdentifier";
    case ParseError::UnsupportedScheme:
      return "UnsupportedScheme";
  }
  return "Unknown";
}

std::string to_string(ResolveError error) {
  switch (error) {
    case ResolveError::NotFound:
      return "NotFound";
    case ResolveError::Unavailable:
      return "Unavailable";
    case ResolveError::InvalidVersion:
      return "InvalidVersion";
  }
  return "Unknown";
}

std::string to_string(NavigationState state) {
  switch (state) {
    case NavigationState::Idle:
      return "Idle";
    case NavigationState::Resolving:
      return "Resolving";
    case NavigationState::Loaded:
      return "Loaded";
    case NavigationState::Failed:
      return "Failed";
  }
  return "Unknown";
}

bool is_retryable(ResolveError error) {
  return error == ResolveError::Unavailable;
}

}  // namespace permaweb
