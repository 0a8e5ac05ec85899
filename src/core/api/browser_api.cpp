#include "core/api/browser_api.hpp"

namespace permaweb {

Result BrowserApi::init(const InitConfig& config, IContentViewer& viewer) {
  return service_.init(config, viewer);
}

Result BrowserApi::take_initial(const std::optional<std::string>& address, std::optional<std::uint32_t> version) {
  return service_.take_initial(address, version);
}

Result BrowserApi::navigate(std::string_view raw_address, std::uint32_t requested_version) {
  return service_.navigate(raw_address, requested_version);
}

Result BrowserApi::submit_version(std::uint32_t version) {
  return service_.submit_version(version);
}

std::size_t BrowserApi::tick() {
  return service_.tick();
}

std::size_t BrowserApi::wait_and_tick(std::int64_t wait_ms) {
  return service_.wait_and_tick(wait_ms);
}

void BrowserApi::viewer_loaded() {
  service_.viewer_loaded();
}

ViewState BrowserApi::view_state() const {
  return service_.view_state();
}

NavigationStatus BrowserApi::navigation_status() const {
  return service_.navigation_status();
}

std::uint32_t BrowserApi::clamp_version_input(std::uint32_t version) const {
  return service_.clamp_version_input(version);
}

BrowserStatusReport BrowserApi::status_report() const {
  return service_.status_report();
}

std::vector<ExampleSite> BrowserApi::examples() const {
  return service_.examples();
}

bool BrowserApi::network_compatible() {
  return service_.network_compatible();
}

Result BrowserApi::create_history() {
  return service_.create_history();
}

Result BrowserApi::publish_site(std::string_view identifier, const std::vector<SiteFile>& files) {
  return service_.publish_site(identifier, files);
}

Result BrowserApi::load_resource(std::string_view content_root, std::string_view resource_path) const {
  return service_.load_resource(content_root, resource_path);
}

void BrowserApi::set_store_offline(bool offline) {
  service_.set_store_offline(offline);
}

}  // namespace permaweb
