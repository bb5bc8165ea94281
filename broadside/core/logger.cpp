#include "logger.hpp"

#include <cstdarg>
#include <cstdio>

#include <raylib.h>

namespace broadside::core {

static Logger* g_logger = nullptr;

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

    if (!cfg.file.empty()) {
        file_ = std::fopen(cfg.file.c_str(), "a");
        if (!file_) {
            std::fprintf(stderr, "[sim][%llu][WARN] cannot open log file %s\n",
                         static_cast<unsigned long long>(tick_), cfg.file.c_str());
        }
    }

    SetTraceLogCallback(&Logger::trace_callback);
    callback_installed_ = true;
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

namespace {

const char* level_name(int level) {
    switch (level) {
        case LOG_TRACE: return "TRACE";
        case LOG_DEBUG: return "DEBUG";
        case LOG_WARNING: return "WARN";
        case LOG_ERROR: return "ERROR";
        case LOG_FATAL: return "FATAL";
        default: return "INFO";
    }
}

void write_line(FILE* sink, unsigned long long tick, const char* level, const char* text, va_list args) {
    std::fprintf(sink, "[sim][%llu][%s] ", tick, level);
    std::vfprintf(sink, text, args);
    std::fputc('\n', sink);
}

} // namespace

void Logger::trace_callback(int logLevel, const char* text, va_list args) {
    const char* level = level_name(logLevel);
    const unsigned long long tick = g_logger ? static_cast<unsigned long long>(g_logger->tick_) : 0ULL;

    // A va_list is consumed by one vfprintf
    if (FILE* file = g_logger ? static_cast<FILE*>(g_logger->file_) : nullptr) {
        va_list file_args;
        va_copy(file_args, args);
        write_line(file, tick, level, text, file_args);
        va_end(file_args);
        std::fflush(file);
    }

    write_line(stderr, tick, level, text, args);
}

} // namespace broadside::core
