#include "mediafetch/http_client.hpp"
#include "mediafetch/download_errors.hpp"
#include "mediafetch/logger.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <memory>

namespace mediafetch
{
    namespace
    {
        // curl_global_init is not thread-safe; run it once per process
        struct CurlGlobal
        {
            CurlGlobal() { curl_global_init(CURL_GLOBAL_DEFAULT); }
            ~CurlGlobal() { curl_global_cleanup(); }
        };

        void ensure_curl_global()
        {
            static CurlGlobal global;
            (void)global;
        }

        struct EasyDeleter
        {
            void operator()(CURL *curl) const { curl_easy_cleanup(curl); }
        };

        struct SlistDeleter
        {
            void operator()(curl_slist *list) const { curl_slist_free_all(list); }
        };

        struct TransferState
        {
            CURL *curl = nullptr;
            const HttpRequest *request = nullptr;
            const BodySink *sink = nullptr;
            bool checked = false;
            HttpResponse response;
        };

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

        size_t header_callback(char *buffer, size_t size, size_t nitems, void *userdata)
        {
            TransferState *state = static_cast<TransferState *>(userdata);
            size_t total_size = size * nitems;
            std::string line(buffer, total_size);

            // A new status line starts a new response (redirect hop or 1xx)
            if (line.compare(0, 5, "HTTP/") == 0)
            {
                state->response.headers.clear();
                return total_size;
            }

            size_t colon = line.find(':');
            if (colon != std::string::npos)
            {
                std::string name = to_lower(trim(line.substr(0, colon)));
                std::string value = trim(line.substr(colon + 1));
                state->response.headers[name] = value;
            }
            return total_size;
        }

        size_t write_callback(char *contents, size_t size, size_t nmemb, void *userdata)
        {
            TransferState *state = static_cast<TransferState *>(userdata);
            size_t total_size = size * nmemb;

            if (state->request->headers_only)
            {
                state->response.stopped = true;
                return 0; // Abort the transfer, headers are all we wanted
            }

            long status = 0;
            curl_easy_getinfo(state->curl, CURLINFO_RESPONSE_CODE, &status);
            if (status < 200 || status >= 300 || !state->sink || !*state->sink)
            {
                return total_size; // Discard error bodies
            }

            if (!state->checked)
            {
                state->checked = true;
                state->response.status = status;
                if (state->request->accept_response && !state->request->accept_response(state->response))
                {
                    state->response.stopped = true;
                    return 0;
                }
            }

            size_t accepted = (*state->sink)(contents, total_size);
            state->response.body_bytes += accepted;
            if (accepted < total_size)
            {
                state->response.stopped = true;
                return 0;
            }
            return total_size;
        }
    } // namespace

    bool HttpResponse::hasHeader(const std::string &name) const
    {
        return headers.find(to_lower(name)) != headers.end();
    }

    std::string HttpResponse::header(const std::string &name) const
    {
        auto it = headers.find(to_lower(name));
        return it != headers.end() ? it->second : std::string();
    }

    std::string to_lower(const std::string &text)
    {
        std::string lower = text;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return lower;
    }

    std::string format_cookie_header(const CookieMap &cookies)
    {
        std::string result;
        for (const auto &[name, value] : cookies)
        {
            if (!result.empty())
            {
                result += "; ";
            }
            result += name + "=" + value;
        }
        return result;
    }

    CurlHttpClient::CurlHttpClient()
    {
        ensure_curl_global();
    }

    HttpResponse CurlHttpClient::get(const HttpRequest &request, const BodySink &sink)
    {
        std::unique_ptr<CURL, EasyDeleter> curl(curl_easy_init());
        if (!curl)
        {
            throw NetworkError("Failed to initialize CURL");
        }

        TransferState state;
        state.curl = curl.get();
        state.request = &request;
        state.sink = &sink;

        // Build the header list; a User-Agent from the profile wins over ours
        std::unique_ptr<curl_slist, SlistDeleter> header_list;
        bool has_user_agent = false;
        for (const auto &[name, value] : request.headers)
        {
            if (to_lower(name) == "user-agent")
            {
                has_user_agent = true;
            }
            std::string line = name + ": " + value;
            curl_slist *appended = curl_slist_append(header_list.get(), line.c_str());
            if (!appended)
            {
                throw NetworkError("Failed to build request headers");
            }
            header_list.release();
            header_list.reset(appended);
        }

        std::string cookie_header = format_cookie_header(request.cookies);

        curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 2L);
        curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
        if (!has_user_agent)
        {
            curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "media-fetch/1.0");
        }
        if (header_list)
        {
            curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
        }
        if (!cookie_header.empty())
        {
            curl_easy_setopt(curl.get(), CURLOPT_COOKIE, cookie_header.c_str());
        }

        curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &state);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &state);
        curl_easy_setopt(curl.get(), CURLOPT_BUFFERSIZE, static_cast<long>(request.buffer_size));

        // Set timeouts to prevent hanging
        curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, request.connect_timeout_seconds);
        curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME, request.stall_timeout_seconds);

        CURLcode res = curl_easy_perform(curl.get());

        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &state.response.status);

        if (res == CURLE_WRITE_ERROR && state.response.stopped)
        {
            return state.response;
        }

        if (res != CURLE_OK)
        {
            std::string error = "Request to " + request.url + " failed: " + curl_easy_strerror(res);
            Logger::logDebug("%s", error.c_str());
            throw NetworkError(error);
        }

        return state.response;
    }

} // namespace mediafetch
