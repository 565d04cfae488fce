#include "mediafetch/download_task.hpp"
#include "mediafetch/logger.hpp"

namespace mediafetch
{

    DownloadTask::DownloadTask(HttpClient &client, DefaultProfile profile, ProgressSink &sink,
                               MediaDownloaderOptions options, PostProcessor *post_processor)
        : client_(client), profile_(std::move(profile)), sink_(sink), options_(options),
          post_processor_(post_processor)
    {
    }

    DownloadTask::~DownloadTask()
    {
        cancel();
        std::shared_future<DownloadResult> pending;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            pending = future_;
        }
        if (pending.valid())
        {
            pending.wait();
        }
    }

    bool DownloadTask::start(const DownloadJob &job)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (status_ == "downloading")
        {
            Logger::logWarning("Download already in progress: %s", job.url.c_str());
            return false;
        }

        // Collect the previous run before starting over
        if (future_.valid())
        {
            future_.wait();
        }

        cancelled_ = false;
        status_ = "downloading";
        future_ = std::async(std::launch::async, [this, job]()
                             { return run(job); })
                      .share();

        Logger::logInfo("Started download for %s", job.url.c_str());
        return true;
    }

    DownloadResult DownloadTask::run(DownloadJob job)
    {
        MediaDownloaderOptions options = options_;
        options.fetch.cancelled = &cancelled_;

        MediaDownloader downloader(client_, profile_, &sink_, options);
        downloader.setPostProcessor(post_processor_);

        DownloadResult result = downloader.download(job.url, job.output_dir, job.headers_file, job.cookies_file,
                                                    job.no_auth);

        std::lock_guard<std::mutex> lock(mutex_);
        result_ = result;
        if (result.success)
            status_ = "completed";
        else if (cancelled_)
            status_ = "cancelled";
        else
            status_ = "failed";
        return result;
    }

    bool DownloadTask::cancel()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (status_ != "downloading")
        {
            return false;
        }
        cancelled_ = true;
        Logger::logInfo("Cancellation requested");
        return true;
    }

    bool DownloadTask::isRunning() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return status_ == "downloading";
    }

    std::string DownloadTask::status() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return status_;
    }

    DownloadResult DownloadTask::wait()
    {
        std::shared_future<DownloadResult> pending;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!future_.valid())
            {
                return result_;
            }
            pending = future_;
        }
        return pending.get();
    }

    bool DownloadTask::waitFor(std::chrono::milliseconds timeout)
    {
        std::shared_future<DownloadResult> pending;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!future_.valid())
            {
                return true;
            }
            pending = future_;
        }
        return pending.wait_for(timeout) == std::future_status::ready;
    }

    DownloadResult DownloadTask::result() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return result_;
    }

} // namespace mediafetch
