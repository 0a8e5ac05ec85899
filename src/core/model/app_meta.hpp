#pragma once

#include <string_view>

#ifndef PERMAWEB_APP_VERSION
#define PERMAWEB_APP_VERSION "0.3.0"
#endif

#ifndef PERMAWEB_BUILD_RELEASE
#define PERMAWEB_BUILD_RELEASE "Versioned browse core"
#endif

#ifndef PERMAWEB_AUTHOR_LIST
#define PERMAWEB_AUTHOR_LIST "permaweb contributors"
#endif

namespace permaweb {

inline constexpr std::string_view kAppDisplayName = "permaweb::Perpetual Web Browser";
inline constexpr std::string_view kAppId = "local.permaweb.browser";
inline constexpr std::string_view kAppVersion = PERMAWEB_APP_VERSION;
inline constexpr std::string_view kBuildRelease = PERMAWEB_BUILD_RELEASE;
inline constexpr std::string_view kAuthorList = PERMAWEB_AUTHOR_LIST;

// First history published on each network; probing it tells whether this build
// matches the network it is connected to.
inline constexpr std::string_view kHistoryTypeMarkerPublic =
    "5ebbbc4f061702c875b6cacb76e537eb482713c458b9d83c2f1e86ea9e0d0d0f";

// The local network has no published marker. Its well-known histories are named, and
// their identifiers are the content hashes of these names.
inline constexpr std::string_view kLocalHistoryTypeName = "permaweb/history-type/website-versions";
inline constexpr std::string_view kLocalWelcomeSiteName = "permaweb/local/welcome";

}  // namespace permaweb
