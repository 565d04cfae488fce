#pragma once

#include "export.hpp"
#include "http_client.hpp"
#include <string>

namespace mediafetch {

    /**
     * @brief Headers and cookies sent with every request of a download
     *
     * Built once by the caller and passed into the downloader; nothing in the
     * library keeps a process-wide copy.
     */
    struct MEDIAFETCH_API DefaultProfile {
        HeaderMap headers;
        CookieMap cookies;

        /**
         * @brief Browser-like profile for media hosts that check the referer and fetch metadata
         */
        static DefaultProfile browser();

        /**
         * @brief Single minimal User-Agent and no cookies, for public resources
         *        that reject browser-mimicking requests
         */
        static DefaultProfile minimal();

        // Entries of other win over ours; header names match case-insensitively
        void mergeHeaders(const HeaderMap& other);
        void mergeCookies(const CookieMap& other);
    };

    /**
     * @brief Load a flat JSON object of string values
     * @param path File holding e.g. {"referer": "https://example.org/"}
     * @return The parsed mapping
     * @throws std::runtime_error when the file cannot be read or is not a flat string object
     */
    MEDIAFETCH_API std::map<std::string, std::string> load_string_map_file(const std::string& path);

} // namespace mediafetch
