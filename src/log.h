// Diagnostic logging
// The pipeline never writes to a global log; a Logger is handed in by the host.

#ifndef VOXPIPE_LOG_H
#define VOXPIPE_LOG_H

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace voxpipe {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3,
};

const char* log_level_name(LogLevel level);

class Logger {
public:
    virtual ~Logger() = default;

    virtual void log(LogLevel level, const std::string& tag, const std::string& message) = 0;

    void debug(const std::string& tag, const std::string& message) { log(LogLevel::Debug, tag, message); }
    void info(const std::string& tag, const std::string& message) { log(LogLevel::Info, tag, message); }
    void warn(const std::string& tag, const std::string& message) { log(LogLevel::Warning, tag, message); }
    void error(const std::string& tag, const std::string& message) { log(LogLevel::Error, tag, message); }
};

// "[tag] message" lines on stderr
class StderrLogger : public Logger {
public:
    explicit StderrLogger(LogLevel min_level = LogLevel::Info) : min_level_(min_level) {}

    void log(LogLevel level, const std::string& tag, const std::string& message) override;

    void set_min_level(LogLevel level) { min_level_ = level; }
    LogLevel min_level() const { return min_level_; }

private:
    LogLevel min_level_;
};

/**
 * In-memory transcript for log display panels and tests.
 *
 * Every entry is kept regardless of level. When a downstream logger is
 * given, entries are forwarded to it as well.
 */
class BufferLogger : public Logger {
public:
    struct Entry {
        LogLevel level;
        std::string tag;
        std::string message;
    };

    BufferLogger() = default;
    explicit BufferLogger(std::shared_ptr<Logger> downstream) : downstream_(std::move(downstream)) {}

    void log(LogLevel level, const std::string& tag, const std::string& message) override;

    std::vector<Entry> entries() const;
    size_t count(LogLevel level) const;
    bool contains(const std::string& needle) const;

    // Whole transcript, one "[tag] message" per line
    std::string text() const;

    void clear();

private:
    mutable std::mutex mutex_;
    std::vector<Entry> entries_;
    std::shared_ptr<Logger> downstream_;
};

class NullLogger : public Logger {
public:
    void log(LogLevel, const std::string&, const std::string&) override {}
};

} // namespace voxpipe

#endif // VOXPIPE_LOG_H
