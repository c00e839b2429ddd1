#pragma once

#include "packguard/result.hpp"

#include <string>
#include <string_view>

namespace packguard {

// On-disk layout under the sounds directory:
//   <root>/<pack-id>/<event>/<file>   live packs
//   <root>/.staging/                  scratch directories (same volume)
//   <root>/.locks/<pack-id>.lock      publish locks
//   <root>/.active-pack               active pack marker
class PackLayout {
  public:
    explicit PackLayout(std::string root) : root_(std::move(root)) {}

    const std::string& Root() const { return root_; }
    std::string StagingRoot() const { return root_ + "/.staging"; }
    std::string LockRoot() const { return root_ + "/.locks"; }
    std::string ActiveMarker() const { return root_ + "/.active-pack"; }

    // Validates the id before joining it onto the root.
    Result LiveDir(std::string_view pack_id, std::string& out) const;

    // Creates root, staging and lock directories if missing.
    Result EnsureCreated() const;

  private:
    std::string root_;
};

} // namespace packguard
