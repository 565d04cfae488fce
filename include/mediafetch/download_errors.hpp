#pragma once

#include <stdexcept>
#include <string>

namespace mediafetch {

    // Base class for everything the download path throws
    class DownloadError : public std::runtime_error {
    public:
        explicit DownloadError(const std::string& message) : std::runtime_error(message) {}
    };

    // The size probe could not determine the total length; triggers the fallback path
    class SizeUnknownError : public DownloadError {
    public:
        explicit SizeUnknownError(const std::string& message) : DownloadError(message) {}
    };

    // HTTP status level failures carry the status code that caused them
    class HttpStatusError : public DownloadError {
    public:
        HttpStatusError(const std::string& message, long status)
            : DownloadError(message), status_(status) {}

        long status() const { return status_; }

    private:
        long status_;
    };

    // 403 on a ranged request; retried in place
    class TransientHttpError : public HttpStatusError {
    public:
        TransientHttpError(const std::string& message, long status) : HttpStatusError(message, status) {}
    };

    // Any other unexpected status, or 403 retries exhausted
    class FatalHttpError : public HttpStatusError {
    public:
        FatalHttpError(const std::string& message, long status) : HttpStatusError(message, status) {}
    };

    // Local disk failures (open, write, flush)
    class FileIoError : public DownloadError {
    public:
        explicit FileIoError(const std::string& message) : DownloadError(message) {}
    };

    // Transport failures: connection reset, DNS, timeouts
    class NetworkError : public DownloadError {
    public:
        explicit NetworkError(const std::string& message) : DownloadError(message) {}
    };

    // Cancellation observed at a chunk boundary; the partial file stays resumable
    class DownloadCancelledError : public DownloadError {
    public:
        explicit DownloadCancelledError(const std::string& message) : DownloadError(message) {}
    };

} // namespace mediafetch
