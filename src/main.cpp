#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include "mediafetch/download_task.hpp"
#include "mediafetch/fetch_config.hpp"
#include "mediafetch/http_client.hpp"
#include "mediafetch/logger.hpp"
#include "mediafetch/post_processor.hpp"

using namespace mediafetch;

// Set from the signal handler, polled by the main thread
std::atomic<bool> interrupted{false};

void signalHandler(int)
{
    interrupted = true;
}

int main(int argc, char *argv[])
{
    FetchConfig config;
    if (!config.loadFromArgs(argc, argv))
    {
        std::cerr << "Run with --help for usage." << std::endl;
        return 2;
    }
    if (config.helpOrVersionShown)
    {
        return 0;
    }
    if (!config.applyLogging())
    {
        std::cerr << "Invalid logging configuration" << std::endl;
        return 2;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    config.printSummary();

    CurlHttpClient client;
    std::unique_ptr<PostProcessor> post_processor;
    if (config.optimizeVideo)
    {
        post_processor = std::make_unique<FfmpegFaststart>(config.ffmpegPath);
    }

    DownloadTask task(client, config.buildProfile(), default_progress_sink(), config.toDownloaderOptions(),
                      post_processor.get());

    DownloadJob job;
    job.url = config.url;
    job.output_dir = config.outputDir;
    job.headers_file = config.headersFile;
    job.cookies_file = config.cookiesFile;
    job.no_auth = config.noAuth;

    if (!task.start(job))
    {
        return 1;
    }

    bool cancel_sent = false;
    while (!task.waitFor(std::chrono::milliseconds(200)))
    {
        if (interrupted && !cancel_sent)
        {
            Logger::logWarning("Interrupted, stopping after the current chunk...");
            task.cancel();
            cancel_sent = true;
        }
    }

    DownloadResult result = task.wait();
    if (result.success)
    {
        Logger::logInfo("%s: %s", result.message.c_str(), result.local_path.c_str());
        return 0;
    }

    if (task.status() == "cancelled")
    {
        Logger::logWarning("Download interrupted; the partial file is kept for resuming");
        return 130;
    }
    return 1;
}
