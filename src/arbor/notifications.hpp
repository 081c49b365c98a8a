#pragma once

#include "host.hpp"
#include "result.hpp"
#include <chrono>
#include <ctime>
#include <deque>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace arbor {

// Bounded history of user notifications.
// Every entry is logged through spdlog and forwarded to the host.
class NotificationBuffer {
public:
    struct NotificationEntry {
        spdlog::level::level_enum level;
        std::string message;
        std::string timestamp;
    };

    explicit NotificationBuffer(std::shared_ptr<Host> host, size_t max_size = 200)
        : _host(std::move(host)), _max_size(max_size) {}

    void notify(spdlog::level::level_enum level, const std::string& message) {
        spdlog::log(level, "{}", message);

        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        std::tm tm_buf;
        localtime_r(&time_t, &tm_buf);
        char timestamp[32];
        std::strftime(timestamp, sizeof(timestamp), "%H:%M:%S", &tm_buf);

        _entries.push_back({level, message, timestamp});
        while (_entries.size() > _max_size) {
            _entries.pop_front();
        }

        if (_host) {
            _host->notify(level, message);
        }
    }

    void info(const std::string& message) { notify(spdlog::level::info, message); }
    void warn(const std::string& message) { notify(spdlog::level::warn, message); }
    void error(const std::string& message) { notify(spdlog::level::err, message); }

    // Report a failed Result; the innermost message is shown to the user,
    // the full chain goes to the log
    template<typename T>
    void error_from_result(const std::string& context, const Result<T>& result) {
        if (result.has_value()) {
            return;
        }
        spdlog::debug("{}: {}", context, result.error().to_string());
        error(context + ": " + result.error().root_message());
    }

    [[nodiscard]] const std::deque<NotificationEntry>& entries() const {
        return _entries;
    }

    [[nodiscard]] size_t size() const {
        return _entries.size();
    }

    void clear() {
        _entries.clear();
    }

    static const char* level_to_string(spdlog::level::level_enum level) {
        switch (level) {
            case spdlog::level::trace: return "TRACE";
            case spdlog::level::debug: return "DEBUG";
            case spdlog::level::info: return "INFO";
            case spdlog::level::warn: return "WARN";
            case spdlog::level::err: return "ERROR";
            case spdlog::level::critical: return "CRITICAL";
            default: return "UNKNOWN";
        }
    }

private:
    std::shared_ptr<Host> _host;
    std::deque<NotificationEntry> _entries;
    size_t _max_size;
};

using NotificationBufferPtr = std::shared_ptr<NotificationBuffer>;

} // namespace arbor
