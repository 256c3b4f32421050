#pragma once

#include "config.hpp"

#include <cstdarg>
#include <mutex>

namespace core {

class Logger {
public:
    static Logger& instance();

    // Applies logging settings (level, optional file sink).
    void init(const LoggingConfig& cfg);
    void shutdown();

    // Short tag printed with every line emitted from the calling thread
    // ("main", "net", ...).
    static void set_thread_tag(const char* tag);

private:
    Logger() = default;

    void* file_{nullptr};
    bool callback_installed_{false};
    std::mutex sink_mutex_;

    static void trace_callback(int logLevel, const char* text, va_list args);
};

} // namespace core
