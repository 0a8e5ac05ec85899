#include "core/navigation/navigation_session.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "core/address/address_parser.hpp"

namespace permaweb {

NavigationSession::NavigationSession(IContentViewer& viewer) : viewer_(viewer) {}

std::optional<ResolveTicket> NavigationSession::navigate(std::string_view raw_address,
                                                         std::uint32_t requested_version) {
  AddressParseResult parsed = parse_address(raw_address);
  if (!parsed.ok) {
    fail_parse(raw_address, parsed);
    return std::nullopt;
  }

  const std::uint32_t effective = parsed.address.requested_version.value_or(requested_version);
  return issue(std::move(parsed.address), effective);
}

std::optional<ResolveTicket> NavigationSession::version_field_submitted(std::uint32_t version) {
  if (!address_.has_value()) {
    spdlog::debug("Version {} submitted with no address; ignored", version);
    return std::nullopt;
  }
  return issue(*address_, version);
}

ResolveTicket NavigationSession::issue(Address address, std::uint32_t requested_version) {
  const std::optional<std::uint32_t> version =
      requested_version == 0 ? std::nullopt : std::optional<std::uint32_t>{requested_version};

  ++request_id_;
  address.requested_version = version;
  address_ = std::move(address);
  requested_version_ = requested_version;
  viewer_ready_ = false;
  status_ = {.state = NavigationState::Resolving, .request_id = request_id_, .failure = {}};

  spdlog::debug("Request {} resolving {}", request_id_, format_address(*address_));
  return ResolveTicket{.request_id = request_id_, .identifier = address_->identifier, .requested_version = version};
}

void NavigationSession::fail_parse(std::string_view raw_address, const AddressParseResult& parsed) {
  rejected_text_ = std::string{raw_address};
  status_.state = NavigationState::Failed;
  status_.failure = {
      .source = FailureSource::Parse,
      .parse_error = parsed.error,
      .resolve_error = ResolveError::NotFound,
      .message = parsed.message,
  };
  spdlog::info("Address rejected ({}): {}", to_string(parsed.error), parsed.message);
}

bool NavigationSession::resolve_complete(std::uint64_t request_id, const ResolveResult& result) {
  if (status_.state != NavigationState::Resolving || request_id != request_id_) {
    ++stale_drop_count_;
    spdlog::debug("Dropped completion for request {} (current {})", request_id, request_id_);
    return false;
  }

  if (!result.ok) {
    status_.state = NavigationState::Failed;
    status_.failure = {
        .source = FailureSource::Resolve,
        .parse_error = ParseError::EmptyIdentifier,
        .resolve_error = result.error,
        .message = result.message,
    };
    spdlog::info("Request {} failed ({}): {}", request_id, to_string(result.error), result.message);
    return true;
  }

  resolved_version_ = result.snapshot.version;
  max_version_ = result.bounds.max_version;
  loaded_address_ = *address_;
  loaded_address_->requested_version = resolved_version_;
  status_.state = NavigationState::Loaded;
  status_.failure = {};

  const std::string canonical = canonical_address(*address_, resolved_version_);
  spdlog::info("Request {} loaded {} (latest {})", request_id, canonical, max_version_);
  viewer_.display(result.snapshot.content_root, canonical);
  return true;
}

void NavigationSession::viewer_reported_loaded() {
  if (status_.state != NavigationState::Loaded) {
    spdlog::debug("Viewer load event while {}; ignored", to_string(status_.state));
    return;
  }
  viewer_ready_ = true;
}

std::uint32_t NavigationSession::clamp_version_input(std::uint32_t version) const {
  if (max_version_ > 0) {
    return std::min(version, max_version_);
  }
  return version;
}

std::string NavigationSession::address_text() const {
  if (status_.state == NavigationState::Failed && status_.failure.source == FailureSource::Parse) {
    return rejected_text_;
  }
  if (!address_.has_value()) {
    return {};
  }
  if (status_.state == NavigationState::Loaded && loaded_address_.has_value()) {
    return format_address(*loaded_address_);
  }
  return format_address(*address_);
}

ViewState NavigationSession::view_state() const {
  ViewState view;
  view.address_text = address_text();
  view.version_value = viewer_ready_ ? resolved_version_ : requested_version_;
  view.version_max = max_version_;
  view.version_enabled = viewer_ready_;
  view.state = status_.state;

  switch (status_.state) {
    case NavigationState::Idle:
      view.status_text = "Enter an awx:// address or a history identifier.";
      break;
    case NavigationState::Resolving:
      view.status_text = "Resolving " + view.address_text + " ...";
      break;
    case NavigationState::Loaded:
      view.status_text = "Version " + std::to_string(resolved_version_) + " of " + std::to_string(max_version_);
      break;
    case NavigationState::Failed:
      if (status_.failure.source == FailureSource::Parse) {
        view.status_text = "Invalid address (" + to_string(status_.failure.parse_error) + "): " +
                           status_.failure.message;
      } else {
        view.status_text = to_string(status_.failure.resolve_error) + ": " + status_.failure.message;
        if (is_retryable(status_.failure.resolve_error)) {
          view.status_text += " Try again.";
        }
      }
      break;
  }
  return view;
}

}  // namespace permaweb
