#include "core/service/browser_service.hpp"

#include <filesystem>
#include <system_error>

#include <spdlog/spdlog.h>

#include "core/catalog/example_catalog.hpp"
#include "core/model/app_meta.hpp"
#include "core/site/site_map.hpp"
#include "core/util/hash.hpp"

namespace permaweb {
namespace {

std::vector<SiteFile> welcome_site_v1() {
  return {
      {.path = "/index.html",
       .content = "<html><head><title>Welcome</title></head><body>\n"
                  "<h1>Welcome to the local network</h1>\n"
                  "<p>This is version 1 of a versioned website. Every published version stays readable.</p>\n"
                  "</body></html>\n"},
  };
}

std::vector<SiteFile> welcome_site_v2() {
  return {
      {.path = "/index.html",
       .content = "<html><head><title>Welcome</title></head><body>\n"
                  "<h1>Welcome to the local network</h1>\n"
                  "<p>This is version 2. Use the version field to step back to version 1.</p>\n"
                  "<p><a href=\"changes.html\">What changed</a></p>\n"
                  "</body></html>\n"},
      {.path = "/changes.html",
       .content = "<html><body><h1>Changes</h1><ul><li>v2: added this page</li>"
                  "<li>v1: first publish</li></ul></body></html>\n"},
  };
}

}  // namespace

BrowserService::~BrowserService() {
  if (worker_) {
    worker_->stop();
  }
}

Result BrowserService::init(const InitConfig& config, IContentViewer& viewer) {
  if (initialized_) {
    return Result::failure("Init failed: browser already initialized.");
  }

  config_ = config;
  if (config_.app_data_dir.empty()) {
    return Result::failure("Init failed: app_data_dir is required.");
  }
  if (config_.resolve_threads == 0) {
    config_.resolve_threads = 2;
  }

  std::error_code ec;
  std::filesystem::create_directories(config_.app_data_dir, ec);
  if (ec) {
    return Result::failure("Init failed: unable to create app_data_dir: " + ec.message());
  }

  const Result opened = store_.open(config_.app_data_dir);
  if (!opened.ok) {
    return opened;
  }

  if (config_.local_network && config_.seed_local_network) {
    const Result seeded = seed_local_network();
    if (!seeded.ok) {
      return seeded;
    }
  }

  resolver_ = std::make_unique<HistoryResolver>(store_);
  worker_ = std::make_unique<ResolveWorker>(*resolver_, config_.resolve_threads, config_.resolve_timeout_ms);
  session_ = std::make_unique<NavigationSession>(viewer);
  handoff_ = std::make_unique<StartupHandoff>(*session_);
  initialized_ = true;
  network_compatible_ = network_compatible();

  spdlog::info("{} {} ready on the {} network", kAppDisplayName, kAppVersion,
               config_.local_network ? "local" : "public");
  return Result::success("Browser initialized.");
}

std::string BrowserService::history_type_marker() const {
  if (config_.local_network) {
    return util::well_known_identifier(kLocalHistoryTypeName);
  }
  return std::string{kHistoryTypeMarkerPublic};
}

Result BrowserService::seed_local_network() {
  const Result marker = store_.register_history(history_type_marker());
  if (!marker.ok) {
    return marker;
  }
  const std::string welcome_id = local_welcome_identifier();
  const Result welcome = store_.register_history(welcome_id);
  if (!welcome.ok) {
    return welcome;
  }

  const BoundsResult bounds = store_.lookup_bounds(welcome_id);
  if (bounds.ok && bounds.bounds.max_version > 0) {
    return Result::success("Local network already seeded.");
  }

  for (const auto& files : {welcome_site_v1(), welcome_site_v2()}) {
    const Result published = store_.publish_site(welcome_id, files);
    if (!published.ok) {
      return published;
    }
  }
  spdlog::info("Seeded local welcome site awx://{}", welcome_id);
  return Result::success("Local network seeded.");
}

Result BrowserService::require_init(std::string_view operation) const {
  if (!initialized_) {
    return Result::failure(std::string{operation} + " failed: browser is not initialized.");
  }
  return Result::success();
}

Result BrowserService::dispatch(const std::optional<ResolveTicket>& ticket) {
  const std::uint64_t id = ticket->request_id;
  worker_->submit(*ticket);
  return Result::success("Resolving.", std::to_string(id));
}

Result BrowserService::take_initial(const std::optional<std::string>& address,
                                    std::optional<std::uint32_t> version) {
  if (const Result ready = require_init("take_initial"); !ready.ok) {
    return ready;
  }
  if (handoff_->consumed()) {
    return Result::success("Launch arguments already consumed.");
  }

  const auto ticket = handoff_->take_initial(address, version);
  if (ticket.has_value()) {
    return dispatch(ticket);
  }
  if (session_->state() == NavigationState::Failed) {
    return Result::failure(session_->status().failure.message);
  }
  return Result::success("No launch address.");
}

Result BrowserService::navigate(std::string_view raw_address, std::uint32_t requested_version) {
  if (const Result ready = require_init("navigate"); !ready.ok) {
    return ready;
  }

  const auto ticket = session_->navigate(raw_address, requested_version);
  if (!ticket.has_value()) {
    return Result::failure(session_->status().failure.message);
  }
  return dispatch(ticket);
}

Result BrowserService::submit_version(std::uint32_t version) {
  if (const Result ready = require_init("submit_version"); !ready.ok) {
    return ready;
  }

  const auto ticket = session_->version_field_submitted(version);
  if (!ticket.has_value()) {
    return Result::failure("Enter an address before choosing a version.");
  }
  return dispatch(ticket);
}

std::size_t BrowserService::tick() {
  if (!initialized_) {
    return 0;
  }

  std::size_t applied = 0;
  for (const auto& completion : worker_->drain()) {
    if (session_->resolve_complete(completion.request_id, completion.result)) {
      ++applied;
    }
  }
  return applied;
}

std::size_t BrowserService::wait_and_tick(std::int64_t wait_ms) {
  if (!initialized_) {
    return 0;
  }
  static_cast<void>(worker_->wait_for_completion(wait_ms));
  return tick();
}

void BrowserService::viewer_loaded() {
  if (initialized_) {
    session_->viewer_reported_loaded();
  }
}

ViewState BrowserService::view_state() const {
  if (!initialized_) {
    return {};
  }
  return session_->view_state();
}

NavigationStatus BrowserService::navigation_status() const {
  if (!initialized_) {
    return {};
  }
  return session_->status();
}

std::uint32_t BrowserService::clamp_version_input(std::uint32_t version) const {
  if (!initialized_) {
    return version;
  }
  return session_->clamp_version_input(version);
}

BrowserStatusReport BrowserService::status_report() const {
  BrowserStatusReport report;
  report.data_dir = config_.app_data_dir;
  report.local_network = config_.local_network;
  if (!initialized_) {
    return report;
  }

  report.navigation = session_->status();
  report.network_compatible = network_compatible_;
  report.histories = store_.history_count();
  report.cached_snapshots = resolver_->cached_snapshots();
  report.snapshot_fetches = resolver_->fetch_count();
  report.resolves_in_flight = worker_->in_flight();
  report.stale_completions = session_->stale_drop_count();
  return report;
}

std::vector<ExampleSite> BrowserService::examples() const {
  std::vector<ExampleSite> sites = example_sites(config_.local_network);
  sites.insert(sites.end(), config_.examples.begin(), config_.examples.end());
  return sites;
}

bool BrowserService::network_compatible() {
  if (!initialized_) {
    return false;
  }
  const std::string marker = history_type_marker();
  network_compatible_ = resolver_->network_compatible(marker);
  if (!network_compatible_) {
    spdlog::warn("History type marker {} not found; this network may be incompatible", marker);
  }
  return network_compatible_;
}

Result BrowserService::create_history() {
  if (const Result ready = require_init("create_history"); !ready.ok) {
    return ready;
  }
  return store_.create_history();
}

Result BrowserService::publish_site(std::string_view identifier, const std::vector<SiteFile>& files) {
  if (const Result ready = require_init("publish_site"); !ready.ok) {
    return ready;
  }
  return store_.publish_site(identifier, files);
}

Result BrowserService::load_resource(std::string_view content_root, std::string_view resource_path) const {
  if (const Result ready = require_init("load_resource"); !ready.ok) {
    return ready;
  }

  const Result map_blob = store_.read_blob(content_root);
  if (!map_blob.ok) {
    return map_blob;
  }
  const auto site_map = SiteMap::parse(map_blob.data);
  if (!site_map.has_value()) {
    return Result::failure("Snapshot " + std::string{content_root} + " does not hold a site map.");
  }

  const auto file_hash = site_map->lookup(resource_path);
  if (!file_hash.has_value()) {
    return Result::failure("No file at " + std::string{resource_path});
  }
  return store_.read_blob(*file_hash);
}

void BrowserService::set_store_offline(bool offline) {
  store_.set_offline(offline);
}

}  // namespace permaweb
