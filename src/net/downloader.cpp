#include "packguard/downloader.hpp"

#include "packguard/logger.hpp"
#include "packguard/signals.hpp"

#include <curl/curl.h>

#include <cerrno>
#include <cstring>
#include <unistd.h>

namespace packguard {

namespace {

constexpr std::uint64_t kMaxInMemoryBody = 8ULL * 1024 * 1024;

class CurlHandle {
  public:
    CurlHandle() : handle_(curl_easy_init()) {}
    ~CurlHandle() {
        if (handle_) curl_easy_cleanup(handle_);
    }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;

    CURL* get() { return handle_; }
    explicit operator bool() const { return handle_ != nullptr; }

  private:
    CURL* handle_;
};

class CurlGlobalInit {
  public:
    CurlGlobalInit() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlGlobalInit() { curl_global_cleanup(); }
};

void EnsureCurlGlobalInit() {
    static CurlGlobalInit init;
}

bool IsFileUrl(const std::string& url) {
    return url.rfind("file://", 0) == 0;
}

void ApplyCommonOptions(CURL* curl, const std::string& url, const DownloadOptions& opt, char* errbuf) {
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 0L);

    curl_easy_setopt(curl, CURLOPT_PROTOCOLS_STR, "http,https,file");
    curl_easy_setopt(curl, CURLOPT_REDIR_PROTOCOLS_STR, "http,https");
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);

    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);

    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, opt.connect_timeout_sec);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, opt.transfer_timeout_sec);

    curl_easy_setopt(curl, CURLOPT_USERAGENT, "packguard/1.0");
}

// Shared end-of-transfer classification.
Result CheckTransfer(CURL* curl, CURLcode res, const std::string& url, const char* errbuf) {
    if (res == CURLE_ABORTED_BY_CALLBACK)
        return Result::Fail(ErrorKind::kCancelled, "download cancelled: " + url);
    if (res != CURLE_OK) {
        return Result::Fail(ErrorKind::kDownloadFailed,
                            "download failed: " + url + ": " +
                                (errbuf[0] ? errbuf : curl_easy_strerror(res)));
    }

    if (IsFileUrl(url)) return Result::Ok();

    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    if (status < 200 || status > 299) {
        return Result::Fail(ErrorKind::kDownloadFailed,
                            "download failed: " + url + ": HTTP " + std::to_string(status));
    }
    return Result::Ok();
}

struct StringSink {
    std::string* out;
    bool overflow = false;
};

std::size_t OnWriteString(char* ptr, std::size_t size, std::size_t nmemb, void* user) {
    auto* sink = static_cast<StringSink*>(user);
    const std::size_t n = size * nmemb;
    if (sink->out->size() + n > kMaxInMemoryBody) {
        sink->overflow = true;
        return 0;
    }
    sink->out->append(ptr, n);
    return n;
}

int OnTransferInfoCancelOnly(void*, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    return g_cancel.load() ? 1 : 0;
}

} // namespace

DownloadTask::DownloadTask(std::string url, DownloadOptions opt, IProgress* progress, TempFile file)
    : url_(std::move(url)), opt_(opt), progress_(progress), file_(std::move(file)) {}

DownloadTask::~DownloadTask() {
    Cancel();
    (void)Wait();
}

void DownloadTask::Cancel() { cancel_.store(true); }

Result DownloadTask::Wait() {
    std::lock_guard<std::mutex> lk(join_mu_);
    if (!joined_) {
        if (worker_.joinable()) worker_.join();
        joined_ = true;
        if (!result_.is_ok()) {
            // Drops the partial body.
            file_ = TempFile{};
        }
    }
    return result_;
}

Result DownloadTask::TakeFile(TempFile& out) {
    auto r = Wait();
    if (!r.is_ok()) return r;
    if (file_.Path().empty())
        return Result::Fail(ErrorKind::kDownloadFailed, "download result already taken");
    out = std::move(file_);
    return Result::Ok();
}

struct DownloadCallbacks {
    static std::size_t OnWrite(char* ptr, std::size_t size, std::size_t nmemb, void* user) {
        auto* self = static_cast<DownloadTask*>(user);
        const std::size_t n = size * nmemb;
        if (self->opt_.max_body_bytes != 0 && self->written_ + n > self->opt_.max_body_bytes) {
            self->write_result_ = Result::Fail(ErrorKind::kDownloadFailed, "download exceeds size limit");
            return 0;
        }
        auto r = WriteAllToFd(self->file_.GetFd(), ptr, n);
        if (!r.is_ok()) {
            self->write_result_ = r.As(ErrorKind::kDownloadFailed);
            return 0;
        }
        self->written_ += n;
        return n;
    }

    static int OnTransferInfo(void* user, curl_off_t dltotal, curl_off_t dlnow, curl_off_t, curl_off_t) {
        auto* self = static_cast<DownloadTask*>(user);
        if (self->cancel_.load() || g_cancel.load()) return 1;
        if (self->progress_) {
            ProgressEvent ev;
            ev.label = "download";
            ev.done = dlnow > 0 ? static_cast<std::uint64_t>(dlnow) : 0;
            ev.total = dltotal > 0 ? static_cast<std::uint64_t>(dltotal) : 0;
            self->progress_->OnProgress(ev);
        }
        return 0;
    }
};

void DownloadTask::Run() {
    CurlHandle curl;
    if (!curl) {
        result_ = Result::Fail(ErrorKind::kDownloadFailed, "failed to initialize CURL");
        return;
    }

    char errbuf[CURL_ERROR_SIZE] = {0};
    ApplyCommonOptions(curl.get(), url_, opt_, errbuf);

    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &DownloadCallbacks::OnWrite);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, this);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, &DownloadCallbacks::OnTransferInfo);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, this);

    LogDebug("Downloading %s -> %s", url_.c_str(), file_.Path().c_str());
    const CURLcode res = curl_easy_perform(curl.get());

    if (res == CURLE_WRITE_ERROR && !write_result_.is_ok()) {
        result_ = write_result_;
        return;
    }
    result_ = CheckTransfer(curl.get(), res, url_, errbuf);
    if (!result_.is_ok()) return;

    if (::fsync(file_.GetFd()) != 0) {
        result_ = Result::Fail(ErrorKind::kDownloadFailed,
                               std::string("fsync failed: ") + std::strerror(errno), errno);
        return;
    }
    if (progress_) {
        ProgressEvent ev;
        ev.label = "download";
        ev.done = written_;
        ev.total = written_;
        progress_->OnProgress(ev);
    }
    LogInfo("Downloaded %llu bytes from %s", static_cast<unsigned long long>(written_), url_.c_str());
}

Result Downloader::Start(const std::string& url,
                         const std::string& dest_dir,
                         IProgress* progress,
                         std::unique_ptr<DownloadTask>& out) const {
    if (url.empty()) return Result::Fail(ErrorKind::kDownloadFailed, "empty URL");
    EnsureCurlGlobalInit();

    TempFile file;
    auto r = TempFile::Create(dest_dir, "download-", file);
    if (!r.is_ok()) return r.As(ErrorKind::kDownloadFailed);

    std::unique_ptr<DownloadTask> task(new DownloadTask(url, opt_, progress, std::move(file)));
    DownloadTask* raw = task.get();
    task->worker_ = std::thread([raw] { raw->Run(); });
    out = std::move(task);
    return Result::Ok();
}

Result Downloader::Fetch(const std::string& url,
                         const std::string& dest_dir,
                         IProgress* progress,
                         TempFile& out) const {
    std::unique_ptr<DownloadTask> task;
    auto r = Start(url, dest_dir, progress, task);
    if (!r.is_ok()) return r;
    return task->TakeFile(out);
}

Result Downloader::FetchToString(const std::string& url, std::string& out) const {
    if (url.empty()) return Result::Fail(ErrorKind::kDownloadFailed, "empty URL");
    EnsureCurlGlobalInit();

    CurlHandle curl;
    if (!curl) return Result::Fail(ErrorKind::kDownloadFailed, "failed to initialize CURL");

    out.clear();
    StringSink sink{&out};
    char errbuf[CURL_ERROR_SIZE] = {0};
    ApplyCommonOptions(curl.get(), url, opt_, errbuf);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &OnWriteString);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &sink);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, &OnTransferInfoCancelOnly);

    const CURLcode res = curl_easy_perform(curl.get());
    if (sink.overflow) {
        out.clear();
        return Result::Fail(ErrorKind::kDownloadFailed, "response too large: " + url);
    }
    auto r = CheckTransfer(curl.get(), res, url, errbuf);
    if (!r.is_ok()) out.clear();
    return r;
}

} // namespace packguard
