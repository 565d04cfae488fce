#include "mediafetch/post_processor.hpp"
#include "mediafetch/logger.hpp"
#include <array>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <sys/wait.h>

namespace mediafetch
{

    std::string shell_quote(const std::string &text)
    {
        std::string quoted = "'";
        for (char c : text)
        {
            if (c == '\'')
            {
                quoted += "'\\''";
            }
            else
            {
                quoted += c;
            }
        }
        quoted += "'";
        return quoted;
    }

    FfmpegFaststart::FfmpegFaststart(std::string ffmpeg_path) : ffmpeg_path_(std::move(ffmpeg_path))
    {
    }

    std::string FfmpegFaststart::outputPathFor(const std::string &input) const
    {
        std::filesystem::path path(input);
        std::filesystem::path fixed = path.parent_path() / (path.stem().string() + "_fixed.mp4");
        return fixed.string();
    }

    std::string FfmpegFaststart::buildCommand(const std::string &input, const std::string &output) const
    {
        return shell_quote(ffmpeg_path_) + " -y -i " + shell_quote(input) +
               " -c copy -movflags faststart " + shell_quote(output) + " 2>&1";
    }

    bool FfmpegFaststart::process(const std::string &input, const std::string &output, std::string &error)
    {
        std::string command = buildCommand(input, output);
        Logger::logDebug("Running: %s", command.c_str());

        FILE *raw = popen(command.c_str(), "r");
        if (!raw)
        {
            error = "Failed to start " + ffmpeg_path_;
            return false;
        }

        std::array<char, 256> buffer;
        std::string captured;
        while (fgets(buffer.data(), static_cast<int>(buffer.size()), raw) != nullptr)
        {
            captured += buffer.data();
        }
        int status = pclose(raw);

        if (status == -1 || !WIFEXITED(status))
        {
            error = "FFmpeg terminated abnormally";
            return false;
        }

        int exit_code = WEXITSTATUS(status);
        if (exit_code == 127)
        {
            error = "FFmpeg not found. Install FFmpeg to enable video optimization.";
            return false;
        }
        if (exit_code != 0)
        {
            // The tail of ffmpeg's output holds the actual error
            const size_t keep = 1024;
            error = "FFmpeg error (exit " + std::to_string(exit_code) + "): " +
                    (captured.size() > keep ? captured.substr(captured.size() - keep) : captured);
            return false;
        }

        std::error_code ec;
        if (!std::filesystem::exists(output, ec))
        {
            error = "FFmpeg reported success but " + output + " is missing";
            return false;
        }

        error.clear();
        return true;
    }

} // namespace mediafetch
