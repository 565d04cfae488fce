#include "mediafetch/download_profile.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace mediafetch
{

    DefaultProfile DefaultProfile::browser()
    {
        DefaultProfile profile;
        profile.headers = {
            {"accept", "*/*"},
            {"accept-encoding", "identity;q=1, *;q=0"},
            {"accept-language", "en-GB,en;q=0.9"},
            {"sec-ch-ua", "\"Not;A=Brand\";v=\"99\", \"Google Chrome\";v=\"139\", \"Chromium\";v=\"139\""},
            {"sec-ch-ua-mobile", "?0"},
            {"sec-ch-ua-platform", "\"Windows\""},
            {"sec-fetch-dest", "video"},
            {"sec-fetch-mode", "no-cors"},
            {"sec-fetch-site", "same-site"},
            {"user-agent", "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/139.0.0.0 Safari/537.36"},
        };
        return profile;
    }

    DefaultProfile DefaultProfile::minimal()
    {
        DefaultProfile profile;
        profile.headers = {{"User-Agent", "Mozilla/5.0"}};
        return profile;
    }

    void DefaultProfile::mergeHeaders(const HeaderMap &other)
    {
        for (const auto &[name, value] : other)
        {
            // Replace whatever spelling of the name we had with the override's
            headers.erase(name);
            headers.emplace(name, value);
        }
    }

    void DefaultProfile::mergeCookies(const CookieMap &other)
    {
        for (const auto &[name, value] : other)
        {
            cookies[name] = value;
        }
    }

    std::map<std::string, std::string> load_string_map_file(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            throw std::runtime_error("Cannot open " + path);
        }

        json j;
        try
        {
            file >> j;
        }
        catch (const json::parse_error &ex)
        {
            throw std::runtime_error("Invalid JSON in " + path + ": " + ex.what());
        }

        if (!j.is_object())
        {
            throw std::runtime_error(path + " must contain a JSON object");
        }

        std::map<std::string, std::string> result;
        for (auto it = j.begin(); it != j.end(); ++it)
        {
            if (!it.value().is_string())
            {
                throw std::runtime_error("Value of '" + it.key() + "' in " + path + " must be a string");
            }
            result[it.key()] = it.value().get<std::string>();
        }
        return result;
    }

} // namespace mediafetch
