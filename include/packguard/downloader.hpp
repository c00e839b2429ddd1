#pragma once

#include "packguard/progress.hpp"
#include "packguard/result.hpp"
#include "packguard/temp_file.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace packguard {

struct DownloadOptions {
    long connect_timeout_sec = 30;
    long transfer_timeout_sec = 300;
    // Refuse bodies larger than this (0 disables).
    std::uint64_t max_body_bytes = 0;
};

// One transfer running on its own worker thread. Destroying a task that is
// still running cancels it and waits for the worker.
class DownloadTask {
  public:
    DownloadTask(const DownloadTask&) = delete;
    DownloadTask& operator=(const DownloadTask&) = delete;
    ~DownloadTask();

    void Cancel();

    // Blocks until the transfer ends. Succeeds only for an HTTP 2xx (or a
    // file:// read) with a complete body; otherwise the temp file is removed.
    Result Wait();

    // After a successful Wait(): hands over the downloaded file.
    Result TakeFile(TempFile& out);

  private:
    friend class Downloader;
    friend struct DownloadCallbacks;
    DownloadTask(std::string url, DownloadOptions opt, IProgress* progress, TempFile file);

    void Run();

    std::string url_;
    DownloadOptions opt_;
    IProgress* progress_ = nullptr;
    TempFile file_;

    std::atomic_bool cancel_{false};
    std::uint64_t written_ = 0;
    Result write_result_;
    Result result_;
    bool joined_ = false;
    std::mutex join_mu_;
    std::thread worker_;
};

class Downloader {
  public:
    Downloader() = default;
    explicit Downloader(const DownloadOptions& opt) : opt_(opt) {}

    // Creates the destination file under dest_dir and starts the worker.
    Result Start(const std::string& url,
                 const std::string& dest_dir,
                 IProgress* progress,
                 std::unique_ptr<DownloadTask>& out) const;

    // Start() + Wait() + TakeFile().
    Result Fetch(const std::string& url,
                 const std::string& dest_dir,
                 IProgress* progress,
                 TempFile& out) const;

    // Small bodies (registry documents) straight into memory.
    Result FetchToString(const std::string& url, std::string& out) const;

  private:
    DownloadOptions opt_{};
};

} // namespace packguard
