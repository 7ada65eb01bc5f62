#pragma once

#include "common.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <functional>
#include <mutex>
#include <string>
#include <utility>

namespace realmsim
{
    enum class LogLevel : std::uint8_t
    {
        Error = 0,
        Warn = 1,
        Info = 2,
        Debug = 3,
        Trace = 4,
        Off = 255,
    };

    inline const char *log_level_name(LogLevel lvl) noexcept
    {
        switch (lvl)
        {
        case LogLevel::Error:
            return "ERROR";
        case LogLevel::Warn:
            return "WARN";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Trace:
            return "TRACE";
        case LogLevel::Off:
            return "OFF";
        }
        return "UNKNOWN";
    }

    // Accepts the names printed by log_level_name (case-insensitive). Returns false on
    // anything else and leaves `out` untouched.
    inline bool parse_log_level(std::string_view s, LogLevel &out)
    {
        const std::string v = to_lower(trim(s));
        if (v == "error")
            out = LogLevel::Error;
        else if (v == "warn")
            out = LogLevel::Warn;
        else if (v == "info")
            out = LogLevel::Info;
        else if (v == "debug")
            out = LogLevel::Debug;
        else if (v == "trace")
            out = LogLevel::Trace;
        else if (v == "off")
            out = LogLevel::Off;
        else
            return false;
        return true;
    }

    inline bool log_enabled(LogLevel configured, LogLevel msg) noexcept
    {
        if (configured == LogLevel::Off)
        {
            return false;
        }
        return static_cast<std::uint8_t>(msg) <= static_cast<std::uint8_t>(configured);
    }

    // One formatted log record, as handed to a sink.
    struct LogRecord
    {
        LogLevel level = LogLevel::Info;
        TimePoint at{};
        EntityId who = NoEntity;
        std::string message;
    };

    inline std::string format_log_record(const LogRecord &r)
    {
        char head[96];
        std::snprintf(head, sizeof(head), "[%s][t=%.3f][id=%llu] ",
                      log_level_name(r.level),
                      to_seconds(r.at),
                      static_cast<unsigned long long>(r.who));
        return std::string(head) + r.message;
    }

    // Process-wide logger. Lines go to stderr unless a sink is installed; the sink is
    // called under the logger's lock, one record at a time.
    class Logger
    {
    public:
        using Sink = std::function<void(const LogRecord &)>;

        static Logger &instance()
        {
            static Logger g;
            return g;
        }

        void set_level(LogLevel lvl) { m_level.store(lvl); }

        LogLevel level() const noexcept { return m_level.load(); }

        bool enabled(LogLevel lvl) const noexcept { return log_enabled(m_level.load(), lvl); }

        // An empty sink restores the stderr writer. Returns the previous sink.
        Sink set_sink(Sink sink)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            std::swap(m_sink, sink);
            return sink;
        }

        // `who` is the entity or participant the line is about (0 for engine-wide lines).
        void logf(LogLevel lvl, TimePoint now, EntityId who, const char *fmt, ...)
        {
            if (!enabled(lvl))
            {
                return;
            }

            char buf[1024];
            va_list args;
            va_start(args, fmt);
            std::vsnprintf(buf, sizeof(buf), fmt, args);
            va_end(args);

            LogRecord rec{lvl, now, who, buf};

            std::lock_guard<std::mutex> lk(m_mu);
            if (m_sink)
            {
                m_sink(rec);
                return;
            }
            const std::string line = format_log_record(rec);
            std::fprintf(stderr, "%s\n", line.c_str());
            std::fflush(stderr);
        }

    private:
        Logger() = default;

        mutable std::mutex m_mu;
        std::atomic<LogLevel> m_level{LogLevel::Off};
        Sink m_sink;
    };
}
