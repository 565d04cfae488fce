#include "mediafetch/progress_sink.hpp"
#include <iostream>

namespace mediafetch
{

    double ProgressEvent::percent() const
    {
        if (total == 0)
        {
            return 0.0;
        }
        double value = static_cast<double>(current) / static_cast<double>(total) * 100.0;
        return value > 100.0 ? 100.0 : value;
    }

    void ConsoleProgressSink::progress(const ProgressEvent &event)
    {
        if (Logger::instance().isQuietMode())
        {
            return;
        }
        std::cout << "\r" << event.message << std::flush;
        line_open_ = event.current < event.total;
        if (!line_open_)
        {
            std::cout << std::endl;
        }
    }

    void ConsoleProgressSink::log(LogLevel level, const std::string &message)
    {
        if (line_open_)
        {
            std::cout << std::endl;
            line_open_ = false;
        }
        Logger::instance().write(level, message);
    }

    void ConsoleProgressSink::complete(bool success, const std::string &message)
    {
        log(success ? LogLevel::FETCH_INFO : LogLevel::FETCH_ERROR, message);
    }

    ProgressSink &default_progress_sink()
    {
        static ConsoleProgressSink sink;
        return sink;
    }

    void QueueProgressSink::progress(const ProgressEvent &event)
    {
        SinkMessage message;
        message.type = SinkMessage::Type::Progress;
        message.event = event;
        message.message = event.message;
        push(std::move(message));
    }

    void QueueProgressSink::log(LogLevel level, const std::string &text)
    {
        SinkMessage message;
        message.type = SinkMessage::Type::Log;
        message.level = level;
        message.message = text;
        push(std::move(message));
    }

    void QueueProgressSink::complete(bool success, const std::string &text)
    {
        SinkMessage message;
        message.type = SinkMessage::Type::Complete;
        message.success = success;
        message.message = text;
        push(std::move(message));
    }

    std::optional<SinkMessage> QueueProgressSink::poll()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty())
        {
            return std::nullopt;
        }
        SinkMessage message = std::move(queue_.front());
        queue_.pop_front();
        return message;
    }

    std::optional<SinkMessage> QueueProgressSink::waitNext(std::chrono::milliseconds timeout)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [this]() { return !queue_.empty(); }))
        {
            return std::nullopt;
        }
        SinkMessage message = std::move(queue_.front());
        queue_.pop_front();
        return message;
    }

    size_t QueueProgressSink::pending() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    void QueueProgressSink::push(SinkMessage message)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            queue_.push_back(std::move(message));
        }
        cv_.notify_one();
    }

} // namespace mediafetch
