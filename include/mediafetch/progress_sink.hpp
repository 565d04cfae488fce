#pragma once

#include "export.hpp"
#include "logger.hpp"
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace mediafetch {

    // One per successfully written chunk
    struct MEDIAFETCH_API ProgressEvent {
        std::string stage = "download";
        size_t current = 0;
        size_t total = 0;
        std::string message;

        double percent() const;
    };

    /**
     * @brief Receiver of download events
     *
     * Calls are made synchronously from the thread running the download and in
     * the order the bytes were written. Implementations that hand events to
     * another thread do so themselves.
     */
    class MEDIAFETCH_API ProgressSink {
    public:
        virtual ~ProgressSink() = default;

        virtual void progress(const ProgressEvent& event) = 0;
        virtual void log(LogLevel level, const std::string& message) = 0;
        virtual void complete(bool success, const std::string& message) = 0;
    };

    /**
     * @brief Headless sink: progress line on stdout, messages through Logger
     */
    class MEDIAFETCH_API ConsoleProgressSink : public ProgressSink {
    public:
        void progress(const ProgressEvent& event) override;
        void log(LogLevel level, const std::string& message) override;
        void complete(bool success, const std::string& message) override;

    private:
        bool line_open_ = false;
    };

    // Shared console sink used wherever a caller passes no sink
    MEDIAFETCH_API ProgressSink& default_progress_sink();

    struct MEDIAFETCH_API SinkMessage {
        enum class Type { Progress, Log, Complete };

        Type type = Type::Log;
        ProgressEvent event;              // Progress
        LogLevel level = LogLevel::FETCH_INFO; // Log
        std::string message;              // Log, Complete
        bool success = false;             // Complete
    };

    /**
     * @brief Thread-safe sink that queues events for a consumer thread (e.g. a UI loop)
     */
    class MEDIAFETCH_API QueueProgressSink : public ProgressSink {
    public:
        void progress(const ProgressEvent& event) override;
        void log(LogLevel level, const std::string& message) override;
        void complete(bool success, const std::string& message) override;

        // Next queued message without blocking
        std::optional<SinkMessage> poll();

        // Next queued message, waiting up to timeout
        std::optional<SinkMessage> waitNext(std::chrono::milliseconds timeout);

        size_t pending() const;

    private:
        void push(SinkMessage message);

#pragma warning(push)
#pragma warning(disable: 4251)
        std::deque<SinkMessage> queue_;
#pragma warning(pop)
        mutable std::mutex mutex_;
        std::condition_variable cv_;
    };

} // namespace mediafetch
