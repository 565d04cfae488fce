#pragma once

#include "export.hpp"
#include "chunked_downloader.hpp"
#include "download_profile.hpp"
#include "download_utils.hpp"
#include "http_client.hpp"
#include "post_processor.hpp"
#include "progress_sink.hpp"
#include <string>

namespace mediafetch {

    // Download result structure
    struct DownloadResult {
        bool success;
        std::string message;
        std::string local_path;   // Empty on failure
        size_t total_bytes;

        DownloadResult() : success(false), total_bytes(0) {}
        DownloadResult(bool success, const std::string& path, const std::string& message, size_t bytes = 0)
            : success(success), message(message), local_path(path), total_bytes(bytes) {}
    };

    struct MediaDownloaderOptions {
        DownloaderOptions fetch;
        size_t chunk_size = DEFAULT_CHUNK_SIZE;
        bool timestamped_names = true;
    };

    /**
     * @brief Entry point used by the CLI and by hosts embedding the downloader
     *
     * Resolves headers and cookies, names the output file, runs the resumable
     * download and optionally remuxes finished videos. Every failure is
     * returned in the DownloadResult; nothing is thrown.
     */
    class MEDIAFETCH_API MediaDownloader {
    public:
        MediaDownloader(HttpClient& client, DefaultProfile profile, ProgressSink* sink = nullptr,
                        MediaDownloaderOptions options = MediaDownloaderOptions());

        // Not owned; nullptr skips post-processing
        void setPostProcessor(PostProcessor* processor) { post_processor_ = processor; }

        /**
         * @param url Source URL
         * @param output_dir Directory receiving the file (created if missing)
         * @param headers_file Optional JSON object merged over the profile headers
         * @param cookies_file Optional JSON object merged over the profile cookies
         * @param no_auth Replace the profile with a minimal User-Agent and no cookies
         */
        DownloadResult download(const std::string& url, const std::string& output_dir,
                                const std::string& headers_file = "", const std::string& cookies_file = "",
                                bool no_auth = false);

    private:
        DownloadResult fail(const std::string& message);

        HttpClient& client_;
        DefaultProfile profile_;
        ProgressSink& sink_;
        MediaDownloaderOptions options_;
        PostProcessor* post_processor_ = nullptr;
    };

} // namespace mediafetch
