#include "core/navigation/startup_handoff.hpp"

#include <spdlog/spdlog.h>

namespace permaweb {

StartupHandoff::StartupHandoff(NavigationSession& session) : session_(session) {}

std::optional<ResolveTicket> StartupHandoff::take_initial(const std::optional<std::string>& address,
                                                          std::optional<std::uint32_t> version) {
  if (consumed_) {
    spdlog::debug("Launch arguments already consumed");
    return std::nullopt;
  }
  consumed_ = true;

  if (!address.has_value() || address->empty()) {
    return std::nullopt;
  }
  spdlog::info("Opening launch address {}", *address);
  return session_.navigate(*address, version.value_or(0));
}

}  // namespace permaweb
