#include "mediafetch/fetch_config.hpp"
#include "mediafetch/download_utils.hpp"
#include "mediafetch/logger.hpp"
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace mediafetch
{
    namespace
    {
        const char *VERSION = "1.0.0";

        size_t parse_size(const std::string &option, const std::string &value)
        {
            try
            {
                size_t pos = 0;
                unsigned long long parsed = std::stoull(value, &pos);
                if (pos != value.size() || value[0] == '-')
                {
                    throw std::invalid_argument(value);
                }
                return static_cast<size_t>(parsed);
            }
            catch (const std::exception &)
            {
                throw std::invalid_argument("Invalid value for " + option + ": " + value);
            }
        }

        template <typename Map>
        void load_string_map(const YAML::Node &node, Map &target)
        {
            if (!node.IsMap())
            {
                throw std::runtime_error("expected a mapping of strings");
            }
            for (const auto &entry : node)
            {
                target[entry.first.as<std::string>()] = entry.second.as<std::string>();
            }
        }
    } // namespace

    bool FetchConfig::loadFromArgs(int argc, char *argv[])
    {
        // Config file first so the command line overrides it
        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];
            if ((arg == "--config" || arg == "-c") && i + 1 < argc)
            {
                if (!loadFromFile(argv[i + 1]))
                {
                    std::cerr << "Failed to load configuration file: " << argv[i + 1] << std::endl;
                    return false;
                }
                break;
            }
        }

        try
        {
            for (int i = 1; i < argc; ++i)
            {
                std::string arg = argv[i];
                auto next = [&](void) -> std::string
                {
                    if (i + 1 >= argc)
                    {
                        throw std::invalid_argument("Missing value for " + arg);
                    }
                    return argv[++i];
                };

                if (arg == "--help" || arg == "-h")
                {
                    printHelp();
                    helpOrVersionShown = true;
                    return true;
                }
                else if (arg == "--version" || arg == "-v")
                {
                    printVersion();
                    helpOrVersionShown = true;
                    return true;
                }
                else if (arg == "--config" || arg == "-c")
                {
                    next(); // Already loaded
                }
                else if (arg == "--output-dir" || arg == "-o")
                {
                    outputDir = next();
                }
                else if (arg == "--headers-file")
                {
                    headersFile = next();
                }
                else if (arg == "--cookies-file")
                {
                    cookiesFile = next();
                }
                else if (arg == "--no-auth")
                {
                    noAuth = true;
                }
                else if (arg == "--keep-name")
                {
                    timestampedNames = false;
                }
                else if (arg == "--chunk-size")
                {
                    chunkSize = parse_size(arg, next());
                }
                else if (arg == "--buffer-size")
                {
                    readBufferSize = parse_size(arg, next());
                }
                else if (arg == "--max-403-retries")
                {
                    maxForbiddenRetries = static_cast<unsigned>(parse_size(arg, next()));
                }
                else if (arg == "--retry-delay")
                {
                    forbiddenRetryDelay = std::chrono::milliseconds(parse_size(arg, next()));
                }
                else if (arg == "--connect-timeout")
                {
                    connectTimeout = static_cast<long>(parse_size(arg, next()));
                }
                else if (arg == "--stall-timeout")
                {
                    stallTimeout = static_cast<long>(parse_size(arg, next()));
                }
                else if (arg == "--fallback-on-http-error")
                {
                    fallbackOnHttpError = true;
                }
                else if (arg == "--no-optimize")
                {
                    optimizeVideo = false;
                }
                else if (arg == "--ffmpeg")
                {
                    ffmpegPath = next();
                }
                else if (arg == "--log-level")
                {
                    logLevel = next();
                }
                else if (arg == "--log-file")
                {
                    logFile = next();
                }
                else if (arg == "--quiet" || arg == "-q")
                {
                    quietMode = true;
                }
                else if (!arg.empty() && arg[0] == '-')
                {
                    std::cerr << "Unknown option: " << arg << std::endl;
                    return false;
                }
                else if (url.empty())
                {
                    url = arg;
                }
                else
                {
                    std::cerr << "Unexpected argument: " << arg << std::endl;
                    return false;
                }
            }
        }
        catch (const std::exception &ex)
        {
            std::cerr << ex.what() << std::endl;
            return false;
        }

        return validate();
    }

    bool FetchConfig::loadFromFile(const std::string &configFile)
    {
        try
        {
            YAML::Node config = YAML::LoadFile(configFile);

            if (config["download"])
            {
                auto download = config["download"];
                if (download["url"])
                    url = download["url"].as<std::string>();
                if (download["output_dir"])
                    outputDir = download["output_dir"].as<std::string>();
                if (download["chunk_size"])
                    chunkSize = download["chunk_size"].as<size_t>();
                if (download["buffer_size"])
                    readBufferSize = download["buffer_size"].as<size_t>();
                if (download["timestamped_names"])
                    timestampedNames = download["timestamped_names"].as<bool>();
                if (download["fallback_on_http_error"])
                    fallbackOnHttpError = download["fallback_on_http_error"].as<bool>();
            }

            if (config["network"])
            {
                auto network = config["network"];
                if (network["connect_timeout"])
                    connectTimeout = network["connect_timeout"].as<long>();
                if (network["stall_timeout"])
                    stallTimeout = network["stall_timeout"].as<long>();
                if (network["max_403_retries"])
                    maxForbiddenRetries = network["max_403_retries"].as<unsigned>();
                if (network["retry_delay_ms"])
                    forbiddenRetryDelay = std::chrono::milliseconds(network["retry_delay_ms"].as<long>());
            }

            if (config["logging"])
            {
                auto logging = config["logging"];
                if (logging["level"])
                    logLevel = logging["level"].as<std::string>();
                if (logging["file"])
                    logFile = logging["file"].as<std::string>();
                if (logging["quiet_mode"])
                    quietMode = logging["quiet_mode"].as<bool>();
            }

            if (config["post_processing"])
            {
                auto post = config["post_processing"];
                if (post["enabled"])
                    optimizeVideo = post["enabled"].as<bool>();
                if (post["ffmpeg"])
                    ffmpegPath = post["ffmpeg"].as<std::string>();
            }

            if (config["profile"])
            {
                auto profile = config["profile"];
                if (profile["no_auth"])
                    noAuth = profile["no_auth"].as<bool>();
                if (profile["replace_defaults"])
                    replaceDefaultProfile = profile["replace_defaults"].as<bool>();
                if (profile["headers"])
                    load_string_map(profile["headers"], profileHeaders);
                if (profile["cookies"])
                    load_string_map(profile["cookies"], profileCookies);
                if (profile["headers_file"])
                    headersFile = profile["headers_file"].as<std::string>();
                if (profile["cookies_file"])
                    cookiesFile = profile["cookies_file"].as<std::string>();
            }

            currentConfigFilePath = std::filesystem::absolute(configFile).string();
            return true;
        }
        catch (const YAML::Exception &ex)
        {
            std::cerr << "Error parsing config file " << configFile << ": " << ex.what() << std::endl;
            return false;
        }
        catch (const std::exception &ex)
        {
            std::cerr << "Error loading config file " << configFile << ": " << ex.what() << std::endl;
            return false;
        }
    }

    bool FetchConfig::validate() const
    {
        if (helpOrVersionShown)
        {
            return true;
        }

        std::string error;
        if (!validate_url(url, error))
        {
            std::cerr << "Error: " << error << std::endl;
            return false;
        }

        if (chunkSize == 0)
        {
            std::cerr << "Error: chunk size must be positive" << std::endl;
            return false;
        }

        if (readBufferSize == 0 || readBufferSize > chunkSize)
        {
            std::cerr << "Error: buffer size must be between 1 and the chunk size" << std::endl;
            return false;
        }

        if (connectTimeout <= 0 || stallTimeout <= 0)
        {
            std::cerr << "Error: timeouts must be positive" << std::endl;
            return false;
        }

        if (outputDir.empty())
        {
            std::cerr << "Error: output directory cannot be empty" << std::endl;
            return false;
        }

        for (const std::string *file : {&headersFile, &cookiesFile})
        {
            if (!file->empty() && !validate_file_exists(*file, error))
            {
                std::cerr << "Error: " << error << std::endl;
                return false;
            }
        }

        LogLevel parsed;
        if (!Logger::parseLevel(logLevel, parsed))
        {
            std::cerr << "Error: invalid log level '" << logLevel << "'" << std::endl;
            return false;
        }

        return true;
    }

    bool FetchConfig::applyLogging() const
    {
        auto &logger = Logger::instance();

        LogLevel level;
        if (!Logger::parseLevel(logLevel, level))
        {
            return false;
        }
        logger.setLevel(level);
        logger.setQuietMode(quietMode);

        if (!logFile.empty() && !logger.setLogFile(logFile))
        {
            return false;
        }
        return true;
    }

    DefaultProfile FetchConfig::buildProfile() const
    {
        DefaultProfile profile = replaceDefaultProfile ? DefaultProfile() : DefaultProfile::browser();
        profile.mergeHeaders(profileHeaders);
        profile.mergeCookies(profileCookies);
        return profile;
    }

    MediaDownloaderOptions FetchConfig::toDownloaderOptions() const
    {
        MediaDownloaderOptions options;
        options.chunk_size = chunkSize;
        options.timestamped_names = timestampedNames;
        options.fetch.read_buffer_size = readBufferSize;
        options.fetch.connect_timeout_seconds = connectTimeout;
        options.fetch.stall_timeout_seconds = stallTimeout;
        options.fetch.max_forbidden_retries = maxForbiddenRetries;
        options.fetch.forbidden_retry_delay = forbiddenRetryDelay;
        options.fetch.fallback_on_http_error = fallbackOnHttpError;
        return options;
    }

    void FetchConfig::printSummary() const
    {
        auto &logger = Logger::instance();
        logger.info("URL: %s", url.c_str());
        logger.info("Output directory: %s", outputDir.c_str());
        logger.info("Chunk size: %zu bytes, read buffer: %zu bytes", chunkSize, readBufferSize);
        logger.info("403 retries: %s, delay %lld ms",
                    maxForbiddenRetries == 0 ? "unbounded" : std::to_string(maxForbiddenRetries).c_str(),
                    static_cast<long long>(forbiddenRetryDelay.count()));
        logger.info("Authentication profile: %s", noAuth ? "minimal (no auth)" : "default");
        if (!currentConfigFilePath.empty())
        {
            logger.info("Config file: %s", currentConfigFilePath.c_str());
        }
    }

    void FetchConfig::printHelp()
    {
        std::cout << "Usage: media_fetch <url> [options]\n\n"
                  << "Download a media file with resumable ranged requests.\n\n"
                  << "Options:\n"
                  << "  -o, --output-dir DIR        Output directory (default: dump)\n"
                  << "      --headers-file FILE     JSON file with custom headers\n"
                  << "      --cookies-file FILE     JSON file with custom cookies\n"
                  << "      --no-auth               Minimal User-Agent, no cookies (public URLs)\n"
                  << "      --keep-name             No timestamp in the file name; rerun to resume\n"
                  << "      --chunk-size BYTES      Bytes per ranged request (default: 8388608)\n"
                  << "      --buffer-size BYTES     Receive buffer size (default: 524288)\n"
                  << "      --max-403-retries N     Retries per range on 403, 0 = unbounded (default: 10)\n"
                  << "      --retry-delay MS        Pause between 403 retries (default: 1000)\n"
                  << "      --connect-timeout S     Connect timeout per request (default: 30)\n"
                  << "      --stall-timeout S       Abort a request after S seconds without data (default: 30)\n"
                  << "      --fallback-on-http-error  Use the single-pass fallback after HTTP errors too\n"
                  << "      --no-optimize           Skip the ffmpeg faststart remux of videos\n"
                  << "      --ffmpeg PATH           ffmpeg executable (default: ffmpeg)\n"
                  << "  -c, --config FILE           YAML configuration file\n"
                  << "      --log-level LEVEL       DEBUG, INFO, WARN or ERROR (default: INFO)\n"
                  << "      --log-file FILE         Also append log lines to FILE\n"
                  << "  -q, --quiet                 Hide the per-chunk progress line\n"
                  << "  -h, --help                  Show this help\n"
                  << "  -v, --version               Show version\n"
                  << std::endl;
    }

    void FetchConfig::printVersion()
    {
        std::cout << "media_fetch " << VERSION << std::endl;
    }

} // namespace mediafetch
