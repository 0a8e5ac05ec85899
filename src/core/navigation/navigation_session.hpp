#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "core/model/types.hpp"
#include "core/viewer/content_viewer.hpp"

namespace permaweb {

// Owns the one logical "current page". Mutated only from the control thread;
// resolver work is handed out as tickets and comes back via resolve_complete().
class NavigationSession {
public:
  explicit NavigationSession(IContentViewer& viewer);

  // requested_version 0 means latest. A v= parameter in raw_address takes precedence.
  std::optional<ResolveTicket> navigate(std::string_view raw_address, std::uint32_t requested_version);
  std::optional<ResolveTicket> version_field_submitted(std::uint32_t version);

  // Returns false when the completion was stale and dropped.
  bool resolve_complete(std::uint64_t request_id, const ResolveResult& result);
  void viewer_reported_loaded();

  // Upper-bounds version field input by the known maximum; never raises it.
  [[nodiscard]] std::uint32_t clamp_version_input(std::uint32_t version) const;

  [[nodiscard]] const NavigationStatus& status() const { return status_; }
  [[nodiscard]] NavigationState state() const { return status_.state; }
  [[nodiscard]] const std::optional<Address>& address() const { return address_; }
  [[nodiscard]] std::uint32_t requested_version() const { return requested_version_; }
  [[nodiscard]] std::uint32_t resolved_version() const { return resolved_version_; }
  [[nodiscard]] std::uint32_t max_version() const { return max_version_; }
  [[nodiscard]] std::uint64_t request_id() const { return request_id_; }
  [[nodiscard]] bool viewer_ready() const { return viewer_ready_; }
  [[nodiscard]] std::uint64_t stale_drop_count() const { return stale_drop_count_; }

  [[nodiscard]] std::string address_text() const;
  [[nodiscard]] ViewState view_state() const;

private:
  ResolveTicket issue(Address address, std::uint32_t requested_version);
  void fail_parse(std::string_view raw_address, const AddressParseResult& parsed);

  IContentViewer& viewer_;

  std::optional<Address> address_;
  std::uint32_t requested_version_ = 0;
  std::uint32_t resolved_version_ = 0;
  std::uint32_t max_version_ = 0;
  std::uint64_t request_id_ = 0;
  NavigationStatus status_;
  bool viewer_ready_ = false;
  std::optional<Address> loaded_address_;
  // Text of the last rejected address, shown while the session is Failed(Parse).
  std::string rejected_text_;
  std::uint64_t stale_drop_count_ = 0;
};

}  // namespace permaweb
