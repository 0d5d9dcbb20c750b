#include "logger.hpp"

#include <chrono>
#include <cstdio>

#include <raylib.h>

namespace storyflow::core {

static Logger* g_logger = nullptr;

// Timestamps are seconds since the first Logger::init (no window, so no GetTime()).
static const auto g_startTime = std::chrono::steady_clock::now();

static double elapsed_seconds() {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - g_startTime).count();
}

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

void Logger::init(const LoggingConfig& cfg) {
    g_logger = this;

    shutdown();

    if (!cfg.enabled) {
        SetTraceLogLevel(LOG_NONE);
        return;
    }

    SetTraceLogLevel(cfg.level);

    // stdout belongs to the resolved text; every log line goes to stderr.
    SetTraceLogCallback(&Logger::trace_callback);
    callback_installed_ = true;

    if (!cfg.file.empty()) {
        file_ = std::fopen(cfg.file.c_str(), "a");
        if (!file_) {
            TraceLog(LOG_WARNING, "[log] Cannot open log file '%s', logging to stderr only", cfg.file.c_str());
        }
    }
}

void Logger::shutdown() {
    if (callback_installed_) {
        SetTraceLogCallback(nullptr);
    }

    if (file_) {
        std::fclose(static_cast<FILE*>(file_));
        file_ = nullptr;
    }

    callback_installed_ = false;
}

void Logger::trace_callback(int logLevel, const char* text, va_list args) {

    const char* level_str = "INFO";
    switch (logLevel) {
        case LOG_ALL: level_str = "ALL"; break;
        case LOG_TRACE: level_str = "TRACE"; break;
        case LOG_DEBUG: level_str = "DEBUG"; break;
        case LOG_INFO: level_str = "INFO"; break;
        case LOG_WARNING: level_str = "WARN"; break;
        case LOG_ERROR: level_str = "ERROR"; break;
        case LOG_FATAL: level_str = "FATAL"; break;
        case LOG_NONE: level_str = "NONE"; break;
        default: level_str = "INFO"; break;
    }

    const double t = elapsed_seconds();

    FILE* sink = g_logger ? static_cast<FILE*>(g_logger->file_) : nullptr;
    if (sink) {
        va_list args_copy;
        va_copy(args_copy, args);

        std::fprintf(sink, "[%.3f][%s] ", t, level_str);
        std::vfprintf(sink, text, args);
        std::fputc('\n', sink);
        std::fflush(sink);

        std::fprintf(stderr, "[%.3f][%s] ", t, level_str);
        std::vfprintf(stderr, text, args_copy);
        std::fputc('\n', stderr);

        va_end(args_copy);
    } else {
        std::fprintf(stderr, "[%.3f][%s] ", t, level_str);
        std::vfprintf(stderr, text, args);
        std::fputc('\n', stderr);
    }
}

} // namespace storyflow::core
