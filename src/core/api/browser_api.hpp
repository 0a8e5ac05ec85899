#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/model/types.hpp"
#include "core/service/browser_service.hpp"
#include "core/viewer/content_viewer.hpp"

namespace permaweb {

class BrowserApi {
public:
  Result init(const InitConfig& config, IContentViewer& viewer);

  Result take_initial(const std::optional<std::string>& address, std::optional<std::uint32_t> version);
  Result navigate(std::string_view raw_address, std::uint32_t requested_version);
  Result submit_version(std::uint32_t version);
  std::size_t tick();
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
  Result load_resource(std::string_view content_root, std::string_view resource_path) const;
  void set_store_offline(bool offline);

private:
  BrowserService service_;
};

}  // namespace permaweb
