#pragma once

#include "export.hpp"
#include "http_client.hpp"
#include "progress_sink.hpp"
#include <atomic>
#include <chrono>
#include <cstddef>
#include <string>

namespace mediafetch {

    constexpr size_t DEFAULT_CHUNK_SIZE = 8 * 1024 * 1024;
    constexpr size_t DEFAULT_READ_BUFFER_SIZE = 512 * 1024;
    constexpr size_t DEFAULT_FALLBACK_BUFFER_SIZE = 64 * 1024;

    // Immutable once the download starts
    struct DownloadRequest {
        std::string url;
        std::string destination;
        HeaderMap headers;
        CookieMap cookies;
        size_t chunk_size = DEFAULT_CHUNK_SIZE;
    };

    // Inclusive byte span of one ranged request
    struct MEDIAFETCH_API ChunkRange {
        size_t start = 0;
        size_t end = 0;

        size_t length() const { return end - start + 1; }

        // "bytes=start-end"
        std::string headerValue() const;
    };

    struct DownloaderOptions {
        size_t read_buffer_size = DEFAULT_READ_BUFFER_SIZE;
        size_t fallback_buffer_size = DEFAULT_FALLBACK_BUFFER_SIZE;
        long connect_timeout_seconds = 30;
        long stall_timeout_seconds = 30;

        // Consecutive 403 retries allowed on one range before giving up; 0 retries forever
        unsigned max_forbidden_retries = 10;
        std::chrono::milliseconds forbidden_retry_delay{1000};

        // Run the fallback path after an unexpected HTTP status as well
        bool fallback_on_http_error = false;

        // Checked once per chunk, never mid-chunk
        const std::atomic<bool>* cancelled = nullptr;
    };

    enum class FetchStatus {
        Complete,          // Ranged download finished (or file was already complete)
        CompleteFallback,  // Finished through the single-pass fallback
        Failed,
        Cancelled          // Stopped at a chunk boundary; partial file is resumable
    };

    /**
     * @brief Next span to request: [downloaded, min(downloaded + chunk_size - 1, total - 1)]
     * @pre downloaded < total and chunk_size > 0
     */
    MEDIAFETCH_API ChunkRange next_chunk_range(size_t downloaded, size_t chunk_size, size_t total);

    /**
     * @brief Bytes already present at path, 0 when the file does not exist
     */
    MEDIAFETCH_API size_t bytes_on_disk(const std::string& path);

    /**
     * @brief Total length from a Content-Range value ("bytes 0-99/12345")
     * @throws SizeUnknownError when the value has no numeric total
     */
    MEDIAFETCH_API size_t parse_content_range_total(const std::string& value);

    // "10,485,760"
    MEDIAFETCH_API std::string format_byte_count(size_t bytes);

    /**
     * @brief Check that a response to a ranged GET carries the requested span
     *
     * A 200 is only usable for a span starting at byte 0, and a 206 must start
     * its Content-Range at range.start; anything else would put bytes at the
     * wrong offset.
     * @throws TransientHttpError on 403
     * @throws FatalHttpError on any other non-2xx status
     * @throws NetworkError when the server ignored or misplaced the range
     */
    MEDIAFETCH_API void check_range_response(const HttpResponse& response, const ChunkRange& range);

    /**
     * @brief Resumable range-based downloader for a single file
     *
     * Probes the total size, resumes from whatever is already on disk and
     * fetches the remainder in chunk_size spans, flushing each span before the
     * next request. When ranged fetching cannot be established it falls back
     * to one unranged GET that rewrites the file.
     */
    class MEDIAFETCH_API ChunkedDownloader {
    public:
        ChunkedDownloader(HttpClient& client, ProgressSink* sink = nullptr,
                          DownloaderOptions options = DownloaderOptions());

        /**
         * @brief Determine the total length with a "Range: bytes=0-" request
         * @throws SizeUnknownError when neither Content-Range nor Content-Length is usable
         * @throws NetworkError on transport failures
         */
        size_t probeTotalSize(const DownloadRequest& request);

        /**
         * @brief Fetch [bytes_on_disk, total) in chunk_size spans, appending to the destination
         * @return Bytes on disk afterwards (== total)
         * @throws FatalHttpError on unexpected status or exhausted 403 retries
         * @throws NetworkError when a response does not start at the requested offset
         * @throws FileIoError, DownloadCancelledError
         */
        size_t fetchChunks(const DownloadRequest& request, size_t total);

        /**
         * @brief Single unranged GET that truncates and rewrites the destination
         * @return Bytes written
         */
        size_t fetchFallback(const DownloadRequest& request);

        /**
         * @brief Probe, resume and fetch; falls back on failure. Never throws.
         */
        FetchStatus downloadWithResume(const DownloadRequest& request);

        // Human readable reason of the last Failed/Cancelled outcome
        const std::string& lastError() const { return last_error_; }

        const DownloaderOptions& options() const { return options_; }

    private:
        HttpRequest makeRequest(const DownloadRequest& request) const;
        bool cancelRequested() const;

        HttpClient& client_;
        ProgressSink& sink_;
        DownloaderOptions options_;
        std::string last_error_;
    };

} // namespace mediafetch
