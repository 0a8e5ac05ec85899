#include "core/catalog/example_catalog.hpp"

#include "core/model/app_meta.hpp"
#include "core/util/hash.hpp"

namespace permaweb {

std::string local_welcome_identifier() {
  return util::well_known_identifier(kLocalWelcomeSiteName);
}

std::vector<ExampleSite> example_sites(bool local_network) {
  if (!local_network) {
    return {};
  }

  const std::string welcome = "awx://" + local_welcome_identifier();
  return {
      {.title = "Welcome (latest)", .address = welcome},
      {.title = "Welcome (first version)", .address = welcome + "?v=1"},
      {.title = "Welcome changelog", .address = welcome + "/changes.html"},
  };
}

}  // namespace permaweb
