#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/history/history_resolver.hpp"
#include "core/history/local_history_store.hpp"
#include "core/model/types.hpp"
#include "core/navigation/navigation_session.hpp"
#include "core/navigation/resolve_worker.hpp"
#include "core/navigation/startup_handoff.hpp"
#include "core/viewer/content_viewer.hpp"

namespace permaweb {

struct BrowserStatusReport {
  NavigationStatus navigation;
  std::string data_dir;
  bool local_network = false;
  bool network_compatible = false;
  std::size_t histories = 0;
  std::size_t cached_snapshots = 0;
  std::uint64_t snapshot_fetches = 0;
  std::size_t resolves_in_flight = 0;
  std::uint64_t stale_completions = 0;
};

class BrowserService {
public:
  BrowserService() = default;
  ~BrowserService();

  BrowserService(const BrowserService&) = delete;
  BrowserService& operator=(const BrowserService&) = delete;

  Result init(const InitConfig& config, IContentViewer& viewer);

  Result take_initial(const std::optional<std::string>& address, std::optional<std::uint32_t> version);
  // Result::data carries the request id.
  Result navigate(std::string_view raw_address, std::uint32_t requested_version);
  Result submit_version(std::uint32_t version);

  // Applies finished resolutions to the session; returns how many were current.
  std::size_t tick();
  // Waits up to wait_ms for a resolution to finish, then ticks.
  std::size_t wait_and_tick(std::int64_t wait_ms);

  void viewer_loaded();

  ViewState view_state() const;
  NavigationStatus navigation_status() const;
  std::uint32_t clamp_version_input(std::uint32_t version) const;
  BrowserStatusReport status_report() const;

  std::vector<ExampleSite> examples() const;
  bool network_compatible();

  Result create_history();
  Result publish_site(std::string_view identifier, const std::vector<SiteFile>& files);
  // Result::data carries the file content for resource_path inside the snapshot.
  Result load_resource(std::string_view content_root, std::string_view resource_path) const;
  void set_store_offline(bool offline);

private:
  Result require_init(std::string_view operation) const;
  Result dispatch(const std::optional<ResolveTicket>& ticket);
  Result seed_local_network();
  std::string history_type_marker() const;

  InitConfig config_;
  bool initialized_ = false;
  bool network_compatible_ = false;

  LocalHistoryStore store_;
  std::unique_ptr<HistoryResolver> resolver_;
  std::unique_ptr<ResolveWorker> worker_;
  std::unique_ptr<NavigationSession> session_;
  std::unique_ptr<StartupHandoff> handoff_;
};

}  // namespace permaweb
