#pragma once

#include "packguard/fd.hpp"
#include "packguard/result.hpp"

#include <string_view>

namespace packguard {

// Exclusive advisory lock serializing publishes of one pack id, across
// threads and processes. Released on destruction.
class PackLock {
  public:
    static Result Acquire(std::string_view lock_dir, std::string_view pack_id, PackLock& out);

    bool Held() const { return fd_.Valid(); }
    void Release();

  private:
    Fd fd_;
};

} // namespace packguard
