#include "mediafetch/chunked_downloader.hpp"
#include "mediafetch/download_errors.hpp"
#include "mediafetch/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <thread>

namespace mediafetch
{
    namespace
    {
        bool is_success_status(long status)
        {
            return status == 200 || status == 206;
        }

        size_t parse_length(const std::string &text)
        {
            if (text.empty() || !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); }))
            {
                throw SizeUnknownError("Invalid length value: '" + text + "'");
            }
            try
            {
                return static_cast<size_t>(std::stoull(text));
            }
            catch (const std::exception &)
            {
                throw SizeUnknownError("Length value out of range: '" + text + "'");
            }
        }
    } // namespace

    std::string ChunkRange::headerValue() const
    {
        return "bytes=" + std::to_string(start) + "-" + std::to_string(end);
    }

    ChunkRange next_chunk_range(size_t downloaded, size_t chunk_size, size_t total)
    {
        if (chunk_size == 0 || downloaded >= total)
        {
            throw std::invalid_argument("No chunk left: downloaded=" + std::to_string(downloaded) +
                                        " total=" + std::to_string(total));
        }
        ChunkRange range;
        range.start = downloaded;
        range.end = std::min(downloaded + chunk_size - 1, total - 1);
        return range;
    }

    size_t bytes_on_disk(const std::string &path)
    {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec))
        {
            return 0;
        }
        auto size = std::filesystem::file_size(path, ec);
        if (ec)
        {
            throw FileIoError("Cannot read size of " + path + ": " + ec.message());
        }
        return static_cast<size_t>(size);
    }

    size_t parse_content_range_total(const std::string &value)
    {
        size_t slash = value.find_last_of('/');
        if (slash == std::string::npos)
        {
            throw SizeUnknownError("Malformed Content-Range: '" + value + "'");
        }
        std::string total = value.substr(slash + 1);
        total.erase(std::remove_if(total.begin(), total.end(), [](unsigned char c) { return std::isspace(c); }), total.end());
        return parse_length(total);
    }

    void check_range_response(const HttpResponse &response, const ChunkRange &range)
    {
        if (response.status == 403)
        {
            throw TransientHttpError("Access forbidden (403)", 403);
        }
        if (!is_success_status(response.status))
        {
            throw FatalHttpError("Failed with status " + std::to_string(response.status), response.status);
        }

        if (response.status == 200)
        {
            if (range.start > 0)
            {
                throw NetworkError("Server ignored " + range.headerValue() + " and sent the whole file");
            }
            return;
        }

        // 206 without Content-Range is taken at its word
        if (!response.hasHeader("content-range"))
        {
            return;
        }
        std::string value = response.header("content-range");
        size_t begin = value.find_first_of("0123456789");
        size_t dash = value.find('-', begin == std::string::npos ? 0 : begin);
        if (begin == std::string::npos || dash == std::string::npos)
        {
            throw NetworkError("Malformed Content-Range for " + range.headerValue() + ": '" + value + "'");
        }
        std::string start = value.substr(begin, dash - begin);
        bool numeric = !start.empty() && start.size() <= 19 &&
                       std::all_of(start.begin(), start.end(), [](unsigned char c) { return std::isdigit(c); });
        if (!numeric || std::stoull(start) != range.start)
        {
            throw NetworkError("Server answered " + range.headerValue() + " with Content-Range '" + value + "'");
        }
    }

    std::string format_byte_count(size_t bytes)
    {
        std::string digits = std::to_string(bytes);
        std::string result;
        int count = 0;
        for (auto it = digits.rbegin(); it != digits.rend(); ++it)
        {
            if (count > 0 && count % 3 == 0)
            {
                result.insert(result.begin(), ',');
            }
            result.insert(result.begin(), *it);
            ++count;
        }
        return result;
    }

    ChunkedDownloader::ChunkedDownloader(HttpClient &client, ProgressSink *sink, DownloaderOptions options)
        : client_(client), sink_(sink ? *sink : default_progress_sink()), options_(options)
    {
    }

    HttpRequest ChunkedDownloader::makeRequest(const DownloadRequest &request) const
    {
        HttpRequest http;
        http.url = request.url;
        http.headers = request.headers;
        http.cookies = request.cookies;
        http.buffer_size = options_.read_buffer_size;
        http.connect_timeout_seconds = options_.connect_timeout_seconds;
        http.stall_timeout_seconds = options_.stall_timeout_seconds;
        return http;
    }

    bool ChunkedDownloader::cancelRequested() const
    {
        return options_.cancelled && options_.cancelled->load();
    }

    size_t ChunkedDownloader::probeTotalSize(const DownloadRequest &request)
    {
        HttpRequest http = makeRequest(request);
        http.headers["Range"] = "bytes=0-";
        http.headers_only = true;

        HttpResponse response = client_.get(http, nullptr);
        Logger::logDebug("Size probe status: %ld", response.status);

        if (is_success_status(response.status))
        {
            if (response.hasHeader("content-range"))
            {
                return parse_content_range_total(response.header("content-range"));
            }
            if (response.hasHeader("content-length"))
            {
                return parse_length(response.header("content-length"));
            }
        }

        throw SizeUnknownError("Could not determine file size (status " + std::to_string(response.status) + ")");
    }

    size_t ChunkedDownloader::fetchChunks(const DownloadRequest &request, size_t total)
    {
        if (request.chunk_size == 0)
        {
            throw std::invalid_argument("Chunk size must be positive");
        }

        size_t downloaded = bytes_on_disk(request.destination);
        if (downloaded > total)
        {
            throw FileIoError("Local file is larger than expected (" + format_byte_count(downloaded) + " > " +
                              format_byte_count(total) + " bytes), refusing to resume");
        }
        if (downloaded == total)
        {
            sink_.log(LogLevel::FETCH_INFO, "File already fully downloaded: " + format_byte_count(downloaded) + " bytes");
            return downloaded;
        }
        if (downloaded > 0)
        {
            sink_.log(LogLevel::FETCH_INFO, "Resuming from " + format_byte_count(downloaded) + " bytes");
        }

        std::ofstream file(request.destination,
                           downloaded > 0 ? std::ios::binary | std::ios::app : std::ios::binary | std::ios::trunc);
        if (!file.is_open())
        {
            throw FileIoError("Failed to open output file: " + request.destination);
        }

        unsigned forbidden_count = 0;
        while (downloaded < total)
        {
            if (cancelRequested())
            {
                throw DownloadCancelledError("Download cancelled at byte " + format_byte_count(downloaded));
            }

            ChunkRange range = next_chunk_range(downloaded, request.chunk_size, total);
            HttpRequest http = makeRequest(request);
            http.headers["Range"] = range.headerValue();
            Logger::logDebug("Requesting range %zu-%zu", range.start, range.end);

            size_t written = 0;
            bool write_failed = false;
            BodySink body = [&](const char *data, size_t size) -> size_t
            {
                // Never write past the requested span, whatever the server sends
                size_t take = std::min(size, range.length() - written);
                file.write(data, static_cast<std::streamsize>(take));
                if (!file)
                {
                    write_failed = true;
                    return 0;
                }
                written += take;
                return take;
            };

            // A misplaced body is refused before any of it reaches the file
            std::exception_ptr refused;
            http.accept_response = [&](const HttpResponse &head) -> bool
            {
                try
                {
                    check_range_response(head, range);
                    return true;
                }
                catch (const DownloadError &)
                {
                    refused = std::current_exception();
                    return false;
                }
            };

            auto started = std::chrono::steady_clock::now();
            HttpResponse response = client_.get(http, body);

            if (write_failed)
            {
                throw FileIoError("Failed writing to " + request.destination);
            }
            if (refused)
            {
                std::rethrow_exception(refused);
            }

            try
            {
                check_range_response(response, range);
            }
            catch (const TransientHttpError &)
            {
                ++forbidden_count;
                if (options_.max_forbidden_retries > 0 && forbidden_count > options_.max_forbidden_retries)
                {
                    throw FatalHttpError("Access forbidden (403) for " + range.headerValue() + " after " +
                                             std::to_string(options_.max_forbidden_retries) + " retries",
                                         403);
                }
                sink_.log(LogLevel::FETCH_WARNING, "Access forbidden (403). Retrying " + range.headerValue() + "...");
                if (options_.forbidden_retry_delay.count() > 0)
                {
                    std::this_thread::sleep_for(options_.forbidden_retry_delay);
                }
                continue;
            }

            file.flush();
            if (!file)
            {
                throw FileIoError("Failed flushing " + request.destination);
            }
            if (written == 0)
            {
                throw NetworkError("Empty response body for range " + range.headerValue());
            }
            if (written < range.length())
            {
                sink_.log(LogLevel::FETCH_WARNING, "Short read for " + range.headerValue() + ": got " +
                                                       format_byte_count(written) + " bytes, continuing from there");
            }

            downloaded = range.start + written;
            forbidden_count = 0;

            double seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
            double speed_mb = seconds > 0.0 ? (static_cast<double>(written) / 1024.0 / 1024.0) / seconds : 0.0;

            ProgressEvent event;
            event.stage = "download";
            event.current = downloaded;
            event.total = total;

            char message[160];
            std::snprintf(message, sizeof(message), "Downloaded %s/%s bytes (%.1f%%) - %.1f MB/s",
                          format_byte_count(downloaded).c_str(), format_byte_count(total).c_str(),
                          event.percent(), speed_mb);
            event.message = message;
            sink_.progress(event);
        }

        return downloaded;
    }

    size_t ChunkedDownloader::fetchFallback(const DownloadRequest &request)
    {
        sink_.log(LogLevel::FETCH_INFO, "Using fallback download method (no resume support)");

        std::ofstream file(request.destination, std::ios::binary | std::ios::trunc);
        if (!file.is_open())
        {
            throw FileIoError("Failed to open output file: " + request.destination);
        }

        HttpRequest http = makeRequest(request);
        http.headers.erase("Range");
        http.buffer_size = options_.fallback_buffer_size;

        size_t written = 0;
        bool write_failed = false;
        BodySink body = [&](const char *data, size_t size) -> size_t
        {
            file.write(data, static_cast<std::streamsize>(size));
            if (!file)
            {
                write_failed = true;
                return 0;
            }
            written += size;
            return size;
        };

        HttpResponse response = client_.get(http, body);
        if (write_failed)
        {
            throw FileIoError("Failed writing to " + request.destination);
        }
        if (response.status < 200 || response.status >= 300)
        {
            throw FatalHttpError("Fallback request failed with status " + std::to_string(response.status),
                                 response.status);
        }

        file.flush();
        if (!file)
        {
            throw FileIoError("Failed flushing " + request.destination);
        }

        sink_.log(LogLevel::FETCH_INFO, "Download complete (fallback mode): " + format_byte_count(written) + " bytes");
        return written;
    }

    FetchStatus ChunkedDownloader::downloadWithResume(const DownloadRequest &request)
    {
        last_error_.clear();

        try
        {
            size_t total = probeTotalSize(request);
            if (total == 0)
            {
                throw SizeUnknownError("Server reported a zero length");
            }

            char message[128];
            std::snprintf(message, sizeof(message), "File size: %s bytes (%.2f MB)",
                          format_byte_count(total).c_str(), static_cast<double>(total) / 1024.0 / 1024.0);
            sink_.log(LogLevel::FETCH_INFO, message);

            fetchChunks(request, total);
            sink_.log(LogLevel::FETCH_INFO, "Download complete");
            return FetchStatus::Complete;
        }
        catch (const DownloadCancelledError &ex)
        {
            last_error_ = ex.what();
            sink_.log(LogLevel::FETCH_WARNING, last_error_);
            return FetchStatus::Cancelled;
        }
        catch (const FatalHttpError &ex)
        {
            last_error_ = ex.what();
            sink_.log(LogLevel::FETCH_ERROR, last_error_);
            if (!options_.fallback_on_http_error)
            {
                return FetchStatus::Failed;
            }
            sink_.log(LogLevel::FETCH_WARNING, "Trying fallback method...");
        }
        catch (const std::exception &ex)
        {
            sink_.log(LogLevel::FETCH_WARNING, std::string("Resume download failed: ") + ex.what() +
                                                   ". Trying fallback method...");
        }

        if (cancelRequested())
        {
            last_error_ = "Download cancelled before fallback";
            sink_.log(LogLevel::FETCH_WARNING, last_error_);
            return FetchStatus::Cancelled;
        }

        try
        {
            fetchFallback(request);
            last_error_.clear();
            return FetchStatus::CompleteFallback;
        }
        catch (const std::exception &ex)
        {
            last_error_ = std::string("Fallback download failed: ") + ex.what();
            sink_.log(LogLevel::FETCH_ERROR, last_error_);
            return FetchStatus::Failed;
        }
    }

} // namespace mediafetch
