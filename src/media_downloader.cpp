#include "mediafetch/media_downloader.hpp"
#include "mediafetch/logger.hpp"
#include <exception>

namespace mediafetch
{

    MediaDownloader::MediaDownloader(HttpClient &client, DefaultProfile profile, ProgressSink *sink,
                                     MediaDownloaderOptions options)
        : client_(client), profile_(std::move(profile)), sink_(sink ? *sink : default_progress_sink()),
          options_(options)
    {
    }

    DownloadResult MediaDownloader::fail(const std::string &message)
    {
        sink_.log(LogLevel::FETCH_ERROR, message);
        sink_.complete(false, message);
        return DownloadResult(false, "", message);
    }

    DownloadResult MediaDownloader::download(const std::string &url, const std::string &output_dir,
                                             const std::string &headers_file, const std::string &cookies_file,
                                             bool no_auth)
    {
        try
        {
            std::string error;
            if (!validate_url(url, error))
            {
                return fail(error);
            }
            if (!validate_directory(output_dir, error))
            {
                return fail(error);
            }

            DefaultProfile profile;
            if (no_auth)
            {
                profile = DefaultProfile::minimal();
                sink_.log(LogLevel::FETCH_INFO, "Using minimal headers (no authentication)");
            }
            else
            {
                profile = profile_;
                if (!headers_file.empty())
                {
                    auto overrides = load_string_map_file(headers_file);
                    profile.mergeHeaders(HeaderMap(overrides.begin(), overrides.end()));
                    sink_.log(LogLevel::FETCH_INFO, "Loaded custom headers from " + headers_file);
                }
                if (!cookies_file.empty())
                {
                    profile.mergeCookies(load_string_map_file(cookies_file));
                    sink_.log(LogLevel::FETCH_INFO, "Loaded custom cookies from " + cookies_file);
                }
            }

            MediaType type = classify_media_type(url);
            sink_.log(LogLevel::FETCH_INFO, std::string("Detected file type: ") + media_type_name(type));

            DownloadRequest request;
            request.url = url;
            request.destination = generate_output_path(url, type, output_dir, options_.timestamped_names);
            request.headers = profile.headers;
            request.cookies = profile.cookies;
            request.chunk_size = options_.chunk_size;
            sink_.log(LogLevel::FETCH_INFO, "Output file: " + request.destination);

            ChunkedDownloader downloader(client_, &sink_, options_.fetch);
            FetchStatus status = downloader.downloadWithResume(request);

            if (status == FetchStatus::Cancelled)
            {
                return fail("Download cancelled: " + downloader.lastError());
            }
            if (status == FetchStatus::Failed)
            {
                return fail(downloader.lastError().empty() ? "Download failed" : "Download failed: " + downloader.lastError());
            }

            size_t total_bytes = bytes_on_disk(request.destination);
            DownloadResult result(true, request.destination, "Download complete", total_bytes);

            if (type == MediaType::Video && post_processor_)
            {
                sink_.log(LogLevel::FETCH_INFO, "Optimizing video for seeking...");
                std::string fixed = post_processor_->outputPathFor(request.destination);
                std::string pp_error;
                if (post_processor_->process(request.destination, fixed, pp_error))
                {
                    sink_.log(LogLevel::FETCH_INFO, "Video optimized: " + fixed);
                    result.local_path = fixed;
                    result.total_bytes = bytes_on_disk(fixed);
                    result.message = "Download and optimization complete";
                }
                else
                {
                    sink_.log(LogLevel::FETCH_WARNING, pp_error);
                    sink_.log(LogLevel::FETCH_WARNING, "Video optimization failed, using original file");
                    result.message = "Download complete (optimization failed)";
                }
            }
            else if (type == MediaType::Audio)
            {
                sink_.log(LogLevel::FETCH_INFO, "Audio file ready: " + request.destination);
            }

            sink_.complete(true, result.message);
            return result;
        }
        catch (const std::exception &ex)
        {
            return fail(std::string("Download error: ") + ex.what());
        }
        catch (...)
        {
            return fail("Download error: unknown exception");
        }
    }

} // namespace mediafetch
