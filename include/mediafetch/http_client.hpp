#pragma once

#include "export.hpp"
#include <algorithm>
#include <cctype>
#include <cstddef>
#include <functional>
#include <map>
#include <string>

namespace mediafetch {

    // Header names compare case-insensitively, so "User-Agent" and "user-agent" are one entry
    struct HeaderNameLess {
        bool operator()(const std::string& a, const std::string& b) const {
            return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(),
                [](unsigned char x, unsigned char y) { return std::tolower(x) < std::tolower(y); });
        }
    };

    using HeaderMap = std::map<std::string, std::string, HeaderNameLess>;
    using CookieMap = std::map<std::string, std::string>;

    struct HttpResponse;

    // Sees status and headers before the first body byte; false refuses the body
    using ResponseCheck = std::function<bool(const HttpResponse& head)>;

    /**
     * @brief One outgoing GET request
     */
    struct HttpRequest {
        std::string url;
        HeaderMap headers;
        CookieMap cookies;
        bool headers_only = false;            // Stop the transfer once the first body byte arrives
        size_t buffer_size = 512 * 1024;      // Receive buffer handed to the body sink
        long connect_timeout_seconds = 30;
        long stall_timeout_seconds = 30;      // Abort when no bytes arrive for this long
        ResponseCheck accept_response;        // Optional, only consulted for 2xx bodies
    };

    /**
     * @brief Status and headers of the final response (after redirects)
     */
    struct MEDIAFETCH_API HttpResponse {
        long status = 0;
        HeaderMap headers;        // Names are lower-cased
        size_t body_bytes = 0;    // Bytes accepted by the body sink
        bool stopped = false;     // Transfer ended early (headers_only, refused response or sink refused data)

        bool hasHeader(const std::string& name) const;
        std::string header(const std::string& name) const;
    };

    // Receives body bytes of 2xx responses. Returning less than size stops the transfer.
    using BodySink = std::function<size_t(const char* data, size_t size)>;

    /**
     * @brief Blocking HTTP GET transport
     *
     * Implementations throw NetworkError when the transfer fails below the
     * HTTP layer (DNS, connect, reset, timeout). Bodies of non-2xx responses
     * are discarded and never reach the sink. When the request carries an
     * accept_response check it runs once before the first body byte of a 2xx
     * response; a refusal ends the transfer with stopped set and nothing
     * passed to the sink.
     */
    class MEDIAFETCH_API HttpClient {
    public:
        virtual ~HttpClient() = default;

        virtual HttpResponse get(const HttpRequest& request, const BodySink& sink) = 0;
    };

    /**
     * @brief libcurl easy-handle implementation of HttpClient
     */
    class MEDIAFETCH_API CurlHttpClient : public HttpClient {
    public:
        CurlHttpClient();

        HttpResponse get(const HttpRequest& request, const BodySink& sink) override;
    };

    // "a=1; b=2" form used by the Cookie header
    MEDIAFETCH_API std::string format_cookie_header(const CookieMap& cookies);

    MEDIAFETCH_API std::string to_lower(const std::string& text);

} // namespace mediafetch
