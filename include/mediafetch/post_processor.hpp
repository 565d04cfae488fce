#pragma once

#include "export.hpp"
#include <string>

namespace mediafetch {

    /**
     * @brief Step run on a finished video download
     */
    class MEDIAFETCH_API PostProcessor {
    public:
        virtual ~PostProcessor() = default;

        // Path the processed file will be written to
        virtual std::string outputPathFor(const std::string& input) const = 0;

        /**
         * @param input Finished download
         * @param output Destination, normally outputPathFor(input)
         * @param error Receives the tool's diagnostics on failure
         * @return true when output was produced
         */
        virtual bool process(const std::string& input, const std::string& output, std::string& error) = 0;
    };

    /**
     * @brief Remux an MP4 with the moov atom up front ("-movflags faststart") so it seeks
     *        before being fully read; streams are copied, not re-encoded
     */
    class MEDIAFETCH_API FfmpegFaststart : public PostProcessor {
    public:
        explicit FfmpegFaststart(std::string ffmpeg_path = "ffmpeg");

        // <base>_fixed.mp4 beside the input
        std::string outputPathFor(const std::string& input) const override;

        bool process(const std::string& input, const std::string& output, std::string& error) override;

        // Command line that process() runs
        std::string buildCommand(const std::string& input, const std::string& output) const;

    private:
        std::string ffmpeg_path_;
    };

    // Single-quote a string for /bin/sh
    MEDIAFETCH_API std::string shell_quote(const std::string& text);

} // namespace mediafetch
