#include "mediafetch/download_utils.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <filesystem>
#include <regex>
#include <unistd.h>

namespace mediafetch
{
    namespace
    {
        std::string strip_query(const std::string &url)
        {
            size_t cut = url.find_first_of("?#");
            return cut == std::string::npos ? url : url.substr(0, cut);
        }

        bool ends_with(const std::string &text, const std::string &suffix)
        {
            return text.size() >= suffix.size() &&
                   text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
        }

        std::string trim(const std::string &text)
        {
            size_t begin = text.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos)
            {
                return "";
            }
            size_t end = text.find_last_not_of(" \t\r\n");
            return text.substr(begin, end - begin + 1);
        }

        int hex_value(char c)
        {
            if (c >= '0' && c <= '9')
                return c - '0';
            if (c >= 'a' && c <= 'f')
                return c - 'a' + 10;
            if (c >= 'A' && c <= 'F')
                return c - 'A' + 10;
            return -1;
        }
    } // namespace

    bool is_valid_url(const std::string &url)
    {
        // Simple regex to check for HTTP/HTTPS URLs
        std::regex url_regex(R"(^https?:\/\/[^\s\/$.?#].[^\s]*$)", std::regex_constants::icase);
        return std::regex_match(url, url_regex);
    }

    bool validate_url(const std::string &url, std::string &error)
    {
        std::string trimmed = trim(url);
        if (trimmed.empty())
        {
            error = "URL cannot be empty";
            return false;
        }

        size_t scheme_end = trimmed.find("://");
        if (scheme_end == std::string::npos || scheme_end == 0 || scheme_end + 3 >= trimmed.size())
        {
            error = "Invalid URL format. Must include protocol (http:// or https://)";
            return false;
        }

        std::string scheme = trimmed.substr(0, scheme_end);
        std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (scheme != "http" && scheme != "https")
        {
            error = "URL must use HTTP or HTTPS protocol";
            return false;
        }

        if (!is_valid_url(trimmed))
        {
            error = "Invalid URL: " + trimmed;
            return false;
        }

        error.clear();
        return true;
    }

    bool validate_directory(const std::string &path, std::string &error, bool check_writable)
    {
        std::string trimmed = trim(path);
        if (trimmed.empty())
        {
            error = "Directory path cannot be empty";
            return false;
        }

        std::error_code ec;
        if (!std::filesystem::exists(trimmed, ec))
        {
            std::filesystem::create_directories(trimmed, ec);
            if (ec)
            {
                error = "Cannot create directory: " + ec.message();
                return false;
            }
            error.clear();
            return true;
        }

        if (!std::filesystem::is_directory(trimmed, ec))
        {
            error = "Path is not a directory: " + trimmed;
            return false;
        }

        if (check_writable && access(trimmed.c_str(), W_OK) != 0)
        {
            error = "Directory is not writable: " + trimmed;
            return false;
        }

        error.clear();
        return true;
    }

    bool validate_file_exists(const std::string &path, std::string &error)
    {
        std::string trimmed = trim(path);
        if (trimmed.empty())
        {
            error = "File path cannot be empty";
            return false;
        }

        std::error_code ec;
        if (!std::filesystem::exists(trimmed, ec))
        {
            error = "File not found: " + trimmed;
            return false;
        }
        if (!std::filesystem::is_regular_file(trimmed, ec))
        {
            error = "Path is not a file: " + trimmed;
            return false;
        }
        if (access(trimmed.c_str(), R_OK) != 0)
        {
            error = "File is not readable: " + trimmed;
            return false;
        }

        error.clear();
        return true;
    }

    MediaType classify_media_type(const std::string &url)
    {
        std::string path = strip_query(url);
        std::transform(path.begin(), path.end(), path.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        static const char *audio_extensions[] = {".mp3", ".m4a", ".wav", ".aac", ".flac", ".ogg"};
        for (const char *ext : audio_extensions)
        {
            if (ends_with(path, ext))
            {
                return MediaType::Audio;
            }
        }
        // .mp4 .avi .mkv .mov .webm .flv and anything unknown
        return MediaType::Video;
    }

    const char *media_type_name(MediaType type)
    {
        return type == MediaType::Audio ? "audio" : "video";
    }

    std::string url_decode(const std::string &text)
    {
        std::string result;
        result.reserve(text.size());
        for (size_t i = 0; i < text.size(); ++i)
        {
            if (text[i] == '%' && i + 2 < text.size())
            {
                int high = hex_value(text[i + 1]);
                int low = hex_value(text[i + 2]);
                if (high >= 0 && low >= 0)
                {
                    result.push_back(static_cast<char>(high * 16 + low));
                    i += 2;
                    continue;
                }
            }
            result.push_back(text[i]);
        }
        return result;
    }

    std::string extract_filename_from_url(const std::string &url)
    {
        std::string path = strip_query(url);

        // Skip past scheme and authority so a bare host yields no name
        size_t scheme_end = path.find("://");
        size_t path_start = path.find('/', scheme_end == std::string::npos ? 0 : scheme_end + 3);
        if (path_start == std::string::npos)
        {
            return "";
        }
        path = path.substr(path_start);

        size_t last_slash = path.find_last_of('/');
        std::string filename = url_decode(path.substr(last_slash + 1));

        // A decoded name must not escape the output directory
        if (filename == "." || filename == ".." || filename.find('/') != std::string::npos)
        {
            return "";
        }
        return filename;
    }

    std::string generate_output_path(const std::string &url, MediaType type, const std::string &output_dir,
                                     bool timestamped, std::chrono::system_clock::time_point now)
    {
        std::string suffix;
        if (timestamped)
        {
            std::time_t time = std::chrono::system_clock::to_time_t(now);
            std::tm local_tm{};
            localtime_r(&time, &local_tm);
            char timestamp[32];
            std::strftime(timestamp, sizeof(timestamp), "_%Y%m%d_%H%M%S", &local_tm);
            suffix = timestamp;
        }

        std::string original = extract_filename_from_url(url);
        std::string filename;
        if (!original.empty())
        {
            std::filesystem::path name(original);
            filename = name.stem().string() + suffix + name.extension().string();
        }
        else if (type == MediaType::Audio)
        {
            filename = "audio" + suffix + ".mp3";
        }
        else
        {
            filename = "video" + suffix + ".mp4";
        }

        std::filesystem::create_directories(output_dir);
        return (std::filesystem::path(output_dir) / filename).string();
    }

} // namespace mediafetch
