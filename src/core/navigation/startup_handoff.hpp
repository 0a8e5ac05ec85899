#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "core/model/types.hpp"
#include "core/navigation/navigation_session.hpp"

namespace permaweb {

// Delivers the launch address to the session exactly once.
class StartupHandoff {
public:
  explicit StartupHandoff(NavigationSession& session);

  std::optional<ResolveTicket> take_initial(const std::optional<std::string>& address,
                                            std::optional<std::uint32_t> version);

  [[nodiscard]] bool consumed() const { return consumed_; }

private:
  NavigationSession& session_;
  bool consumed_ = false;
};

}  // namespace permaweb
