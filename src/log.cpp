#include "log.h"

#include <iostream>
#include <sstream>

namespace voxpipe {

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "debug";
        case LogLevel::Info:    return "info";
        case LogLevel::Warning: return "warning";
        case LogLevel::Error:   return "error";
    }
    return "unknown";
}

void StderrLogger::log(LogLevel level, const std::string& tag, const std::string& message) {
    if (static_cast<int>(level) < static_cast<int>(min_level_)) {
        return;
    }
    if (level >= LogLevel::Warning) {
        std::cerr << "[" << tag << "] " << log_level_name(level) << ": " << message << std::endl;
    } else {
        std::cerr << "[" << tag << "] " << message << std::endl;
    }
}

void BufferLogger::log(LogLevel level, const std::string& tag, const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.push_back({level, tag, message});
    }
    if (downstream_) {
        downstream_->log(level, tag, message);
    }
}

std::vector<BufferLogger::Entry> BufferLogger::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

size_t BufferLogger::count(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = 0;
    for (const auto& e : entries_) {
        if (e.level == level) ++n;
    }
    return n;
}

bool BufferLogger::contains(const std::string& needle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& e : entries_) {
        if (e.message.find(needle) != std::string::npos) return true;
    }
    return false;
}

std::string BufferLogger::text() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream out;
    for (const auto& e : entries_) {
        out << "[" << e.tag << "] " << e.message << "\n";
    }
    return out.str();
}

void BufferLogger::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

} // namespace voxpipe
