#pragma once

#include "export.hpp"
#include "chunked_downloader.hpp"
#include "download_profile.hpp"
#include "media_downloader.hpp"
#include <chrono>
#include <string>

namespace mediafetch {

/**
 * @brief Command line and YAML configuration of the media_fetch tool
 */
struct MEDIAFETCH_API FetchConfig {
#pragma warning(push)
#pragma warning(disable: 4251)
    // What to download
    std::string url;
    std::string outputDir = "dump";
    std::string headersFile;          // JSON object merged over the profile headers
    std::string cookiesFile;          // JSON object merged over the profile cookies
    bool noAuth = false;              // Minimal User-Agent, no cookies
    bool timestampedNames = true;     // false: rerunning the same URL resumes the previous file

    // Transfer settings
    size_t chunkSize = DEFAULT_CHUNK_SIZE;
    size_t readBufferSize = DEFAULT_READ_BUFFER_SIZE;
    long connectTimeout = 30;         // Seconds
    long stallTimeout = 30;           // Seconds without data before a request is aborted
    unsigned maxForbiddenRetries = 10; // 0 retries 403 forever
    std::chrono::milliseconds forbiddenRetryDelay{1000};
    bool fallbackOnHttpError = false;

    // Post processing
    bool optimizeVideo = true;
    std::string ffmpegPath = "ffmpeg";

    // Logging configuration
    std::string logLevel = "INFO";    // DEBUG, INFO, WARN, ERROR
    std::string logFile = "";         // Empty means console only
    bool quietMode = false;           // Hide the per-chunk progress line

    // Request profile from the config file
    bool replaceDefaultProfile = false;
    HeaderMap profileHeaders;
    CookieMap profileCookies;

    std::string currentConfigFilePath;
#pragma warning(pop)

    // Internal flags
    bool helpOrVersionShown = false;

    FetchConfig() = default;

    /**
     * @brief Load configuration from command line arguments
     *
     * A --config file is read first so that the remaining options override it.
     * @return True if configuration was loaded successfully
     */
    bool loadFromArgs(int argc, char* argv[]);

    /**
     * @brief Load configuration from YAML file
     * @param configFile Path to configuration file
     * @return True if configuration was loaded successfully
     */
    bool loadFromFile(const std::string& configFile);

    /**
     * @brief Validate the configuration
     * @return True if configuration is valid
     */
    bool validate() const;

    /**
     * @brief Apply level, file and quiet mode to the Logger
     * @return False if the log level or log file is unusable
     */
    bool applyLogging() const;

    // Built-in browser profile (or an empty one) with the config's entries merged over it
    DefaultProfile buildProfile() const;

    MediaDownloaderOptions toDownloaderOptions() const;

    void printSummary() const;
    static void printHelp();
    static void printVersion();
};

} // namespace mediafetch
