#pragma once

#include "export.hpp"
#include "media_downloader.hpp"
#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <string>

namespace mediafetch {

    struct DownloadJob {
        std::string url;
        std::string output_dir = "dump";
        std::string headers_file;
        std::string cookies_file;
        bool no_auth = false;
    };

    /**
     * @brief Runs one MediaDownloader::download on a worker thread
     *
     * The consumer talks to the running download only through the sink given
     * at construction and through cancel(); a second start() is refused while
     * the first one runs.
     */
    class MEDIAFETCH_API DownloadTask {
    public:
        DownloadTask(HttpClient& client, DefaultProfile profile, ProgressSink& sink,
                     MediaDownloaderOptions options = MediaDownloaderOptions(),
                     PostProcessor* post_processor = nullptr);
        ~DownloadTask();

        DownloadTask(const DownloadTask&) = delete;
        DownloadTask& operator=(const DownloadTask&) = delete;

        // Start the download (non-blocking); false if one is already running
        bool start(const DownloadJob& job);

        // Request cancellation; honoured at the next chunk boundary
        bool cancel();

        bool isRunning() const;

        // "idle", "downloading", "completed", "failed", "cancelled"
        std::string status() const;

        // Block until the running download finishes and return its result
        DownloadResult wait();

        // Wait up to timeout; false if still running
        bool waitFor(std::chrono::milliseconds timeout);

        // Result of the last finished download
        DownloadResult result() const;

    private:
        DownloadResult run(DownloadJob job);

        HttpClient& client_;
        DefaultProfile profile_;
        ProgressSink& sink_;
        MediaDownloaderOptions options_;
        PostProcessor* post_processor_;

        std::atomic<bool> cancelled_{false};
#pragma warning(push)
#pragma warning(disable: 4251)
        std::shared_future<DownloadResult> future_;
        std::string status_ = "idle";
        DownloadResult result_;
#pragma warning(pop)
        mutable std::mutex mutex_;
    };

} // namespace mediafetch
