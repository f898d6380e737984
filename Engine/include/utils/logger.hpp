#pragma once

#include <iostream>
#include <string>
#include <mutex>

namespace Runestream {

/**
 * @brief Thread-safe logging utility for the Runestream tools.
 *
 * Writes to stderr so that stdout stays reserved for assembled text.
 */
class Logger {
public:
    enum class Level {
        Info,
        Step,
        Success,
        Warning,
        Error
    };

    static void log(Level level, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex());

        const char* color = "";
        const char* prefix = "";

        switch (level) {
            case Level::Info:    color = "\033[0;36m"; prefix = "=== "; break; // Cyan
            case Level::Step:    color = "\033[1;33m"; prefix = ">>> "; break; // Yellow
            case Level::Success: color = "\033[0;32m"; prefix = "✓ ";   break; // Green
            case Level::Warning: color = "\033[1;33m"; prefix = "⚠ ";   break; // Yellow
            case Level::Error:   color = "\033[0;31m"; prefix = "✗ ";   break; // Red
        }

        if (colors_enabled()) {
            std::cerr << color << prefix << message << "\033[0m" << std::endl;
        } else {
            std::cerr << prefix << message << std::endl;
        }
    }

    /**
     * @brief Disable ANSI colors, e.g. when stderr is not a terminal.
     */
    static void set_colors(bool enabled) {
        std::lock_guard<std::mutex> lock(mutex());
        colors_enabled() = enabled;
    }

    static void info(const std::string& msg)    { log(Level::Info, msg); }
    static void step(const std::string& msg)    { log(Level::Step, msg); }
    static void success(const std::string& msg) { log(Level::Success, msg); }
    static void warn(const std::string& msg)    { log(Level::Warning, msg); }
    static void error(const std::string& msg)   { log(Level::Error, msg); }

private:
    static std::mutex& mutex() {
        static std::mutex m;
        return m;
    }

    static bool& colors_enabled() {
        static bool enabled = true;
        return enabled;
    }
};

} // namespace Runestream
