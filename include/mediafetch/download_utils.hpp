#pragma once

#include "export.hpp"
#include <chrono>
#include <string>

namespace mediafetch {

    enum class MediaType {
        Audio,
        Video
    };

    /**
     * Check if a string is a valid HTTP/HTTPS URL
     * @param url The URL string to validate
     * @return true if the string is a valid HTTP/HTTPS URL
     */
    MEDIAFETCH_API bool is_valid_url(const std::string& url);

    /**
     * Validate a user supplied URL
     * @param url The URL to check (surrounding whitespace is ignored)
     * @param error Receives a human readable reason when invalid
     * @return true if the URL can be downloaded
     */
    MEDIAFETCH_API bool validate_url(const std::string& url, std::string& error);

    /**
     * Check that a directory exists (creating it if missing) and is writable
     */
    MEDIAFETCH_API bool validate_directory(const std::string& path, std::string& error, bool check_writable = true);

    /**
     * Check that a path names a readable regular file
     */
    MEDIAFETCH_API bool validate_file_exists(const std::string& path, std::string& error);

    // Audio for .mp3 .m4a .wav .aac .flac .ogg, video otherwise
    MEDIAFETCH_API MediaType classify_media_type(const std::string& url);

    MEDIAFETCH_API const char* media_type_name(MediaType type);

    // Decode %XX escapes; '+' is left alone since it is legal in paths
    MEDIAFETCH_API std::string url_decode(const std::string& text);

    /**
     * Extract filename from URL
     * @param url The URL to extract filename from
     * @return The decoded last path segment, or empty when the path has none
     */
    MEDIAFETCH_API std::string extract_filename_from_url(const std::string& url);

    /**
     * Generate the output path for a URL
     * @param url The URL being downloaded
     * @param type Media type, used for the name when the URL has none
     * @param output_dir Directory for the file (created if missing)
     * @param timestamped Append _YYYYmmdd_HHMMSS so every run gets a fresh file;
     *                    without it a rerun finds and resumes the previous partial file
     * @param now Timestamp to use
     * @return output_dir/<name>[_<timestamp>]<ext>
     */
    MEDIAFETCH_API std::string generate_output_path(
        const std::string& url,
        MediaType type,
        const std::string& output_dir,
        bool timestamped = true,
        std::chrono::system_clock::time_point now = std::chrono::system_clock::now()
    );

} // namespace mediafetch
