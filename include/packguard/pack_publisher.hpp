#pragma once

#include "packguard/result.hpp"

#include <memory>
#include <string>

namespace packguard {

// Publishes a staged pack directory into its live location by rename only.
// Readers see either the previous directory or the new one, never a mix.
class PackPublisher {
  public:
    class ISystemOps {
      public:
        virtual ~ISystemOps() = default;
        virtual bool Exists(const std::string& path) const = 0;
        // Atomically swap two existing paths.
        virtual Result Exchange(const std::string& a, const std::string& b) const = 0;
        // Fails with EEXIST if `to` exists.
        virtual Result RenameNoReplace(const std::string& from, const std::string& to) const = 0;
        virtual Result Rename(const std::string& from, const std::string& to) const = 0;
    };

    PackPublisher();
    explicit PackPublisher(std::shared_ptr<const ISystemOps> system_ops);

    // On success staged_dir no longer exists, or (when live_dir existed)
    // holds the previous live contents for the caller to discard. On failure
    // live_dir is exactly as before.
    Result Publish(const std::string& staged_dir, const std::string& live_dir) const;

  private:
    Result ReplaceInTwoSteps(const std::string& staged_dir, const std::string& live_dir) const;

    static std::shared_ptr<const ISystemOps> DefaultSystemOps();

    std::shared_ptr<const ISystemOps> system_ops_;
};

} // namespace packguard
