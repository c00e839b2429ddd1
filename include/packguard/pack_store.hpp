#pragma once

#include "packguard/fd.hpp"
#include "packguard/pack_layout.hpp"
#include "packguard/pack_lock.hpp"
#include "packguard/pack_publisher.hpp"
#include "packguard/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace packguard {

// Read handle bound to the pack directory that was live when it was opened.
// Everything goes through openat() on the held descriptor, so a publish that
// swaps the live directory afterwards is never observed as a mix of versions.
class PackSnapshot {
  public:
    PackSnapshot() = default;

    const std::string& PackId() const { return pack_id_; }
    bool Valid() const { return dir_.Valid(); }

    // Sorted "<event>/<file>" paths of allow-listed regular files.
    Result Files(std::vector<std::string>& out) const;

    // rel_path must be "<event>/<file>" as returned by Files().
    Result ReadFile(std::string_view rel_path, std::vector<std::uint8_t>& out) const;

  private:
    friend class PackStore;

    std::string pack_id_;
    Fd dir_;
};

class PackStore {
  public:
    explicit PackStore(PackLayout layout);
    PackStore(PackLayout layout, PackPublisher publisher);

    const PackLayout& Layout() const { return layout_; }

    // Sorted ids of live pack directories.
    std::vector<std::string> InstalledPackIds() const;

    Result OpenSnapshot(std::string_view pack_id, PackSnapshot& out) const;
    Result PickRandomSound(const PackSnapshot& snapshot, std::string& out_rel_path) const;
    Result SoundFiles(std::string_view pack_id, std::string_view event,
                      std::vector<std::string>& out) const;

    // Publishes an empty pack with every event directory.
    Result CreatePack(std::string_view pack_id) const;
    Result UninstallPack(std::string_view pack_id) const;

    std::optional<std::string> ActivePackId() const;
    Result SetActivePack(std::string_view pack_id) const;
    // Selects the first installed pack when no valid active pack is set.
    // out_id is left empty when nothing is installed.
    Result EnsureActivePack(std::string& out_id) const;

    Result AddSound(std::string_view pack_id, std::string_view event,
                    const std::string& source_path) const;
    Result RemoveSound(std::string_view pack_id, std::string_view event,
                       std::string_view filename) const;

  private:
    Result RequireInstalled(std::string_view pack_id, std::string& out_live_dir) const;
    // Takes the pack's publish lock, then re-checks that it is installed.
    Result LockInstalled(std::string_view pack_id, PackLock& lock, std::string& out_live_dir) const;
    Result ClearActiveIf(std::string_view pack_id) const;

    PackLayout layout_;
    PackPublisher publisher_;
};

} // namespace packguard
