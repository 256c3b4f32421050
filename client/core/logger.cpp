#include "logger.hpp"

#include <chrono>
#include <cstdio>

#include <raylib.h>

namespace core {

namespace {

Logger* g_logger = nullptr;

thread_local const char* t_thread_tag = "main";

const auto g_start = std::chrono::steady_clock::now();

double elapsed_seconds() {
    const auto d = std::chrono::steady_clock::now() - g_start;
    return std::chrono::duration<double>(d).count();
}

const char* level_name(int logLevel) {
    switch (logLevel) {
        case LOG_ALL: return "ALL";
        case LOG_TRACE: return "TRACE";
        case LOG_DEBUG: return "DEBUG";
        case LOG_INFO: return "INFO";
        case LOG_WARNING: return "WARN";
        case LOG_ERROR: return "ERROR";
        case LOG_FATAL: return "FATAL";
        case LOG_NONE: return "NONE";
        default: return "INFO";
    }
}

void write_line(FILE* sink, double t, const char* level, const char* text, va_list args) {
    std::fprintf(sink, "[%.3f][%s][%s] ", t, level, t_thread_tag);
    std::vfprintf(sink, text, args);
    std::fputc('\n', sink);
}

} // namespace

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

void Logger::set_thread_tag(const char* tag) {
    t_thread_tag = tag ? tag : "?";
}

void Logger::init(const LoggingConfig& cfg) {
    g_logger = this;

    shutdown();

    if (!cfg.enabled) {
        SetTraceLogLevel(LOG_NONE);
        return;
    }

    SetTraceLogLevel(cfg.level);

    if (!cfg.file.empty()) {
        file_ = std::fopen(cfg.file.c_str(), "a");
        if (!file_) {
            TraceLog(LOG_WARNING, "[log] cannot open log file '%s', logging to stderr only", cfg.file.c_str());
        }
    }

    // Always installed: the receiver thread logs concurrently with the tick
    // loop and lines must not interleave.
    SetTraceLogCallback(&Logger::trace_callback);
    callback_installed_ = true;
}

void Logger::shutdown() {
    if (callback_installed_) {
        SetTraceLogCallback(nullptr);
    }

    std::lock_guard<std::mutex> lock(sink_mutex_);
    if (file_) {
        std::fclose(static_cast<FILE*>(file_));
        file_ = nullptr;
    }

    callback_installed_ = false;
}

void Logger::trace_callback(int logLevel, const char* text, va_list args) {
    const char* level_str = level_name(logLevel);
    const double t = elapsed_seconds();

    if (!g_logger) {
        write_line(stderr, t, level_str, text, args);
        return;
    }

    std::lock_guard<std::mutex> lock(g_logger->sink_mutex_);

    FILE* sink = static_cast<FILE*>(g_logger->file_);
    if (sink) {
        va_list args_copy;
        va_copy(args_copy, args);

        write_line(sink, t, level_str, text, args);
        std::fflush(sink);

        write_line(stderr, t, level_str, text, args_copy);

        va_end(args_copy);
    } else {
        write_line(stderr, t, level_str, text, args);
    }
}

} // namespace core
