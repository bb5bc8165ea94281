#pragma once

#include "config.hpp"

#include <cstdarg>

namespace broadside::core {

class Logger {
public:
    static Logger& instance();

    // Applies logging settings (level, optional file sink).
    void init(const LoggingConfig& cfg);
    void shutdown();

    // Simulation tick shown in every line.
    void set_tick(Tick tick) { tick_ = tick; }

private:
    Logger() = default;

    void* file_{nullptr};
    bool callback_installed_{false};
    Tick tick_{0};

    static void trace_callback(int logLevel, const char* text, va_list args);
};

} // namespace broadside::core
