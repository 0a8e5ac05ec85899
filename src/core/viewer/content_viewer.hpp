#pragma once

#include <string_view>

namespace permaweb {

// Embedded viewer seam. display() is fire-and-forget; the viewer later reports its
// own load completion through NavigationSession::viewer_reported_loaded().
class IContentViewer {
public:
  virtual ~IContentViewer() = default;

  virtual void display(std::string_view content_root, std::string_view canonical_address) = 0;
};

}  // namespace permaweb
