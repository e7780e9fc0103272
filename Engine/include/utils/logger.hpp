#pragma once

#include <atomic>
#include <iostream>
#include <string>
#include <mutex>

namespace Omnidb {

/**
 * @brief Thread-safe logging utility for the engine.
 *
 * Lines below the minimum level are dropped. Warnings and errors go to
 * stderr, everything else to stdout.
 */
class Logger {
public:
    enum class Level {
        Debug = 0,
        Info,
        Step,
        Success,
        Warning,
        Error,
        Off
    };

    static void set_level(Level level) {
        min_level().store(level, std::memory_order_relaxed);
    }

    static Level level() {
        return min_level().load(std::memory_order_relaxed);
    }

    static bool enabled(Level level) {
        return static_cast<int>(level) >= static_cast<int>(Logger::level());
    }

    /**
     * @brief Parse "debug", "info", "warn", "error" or "off".
     * Unknown names fall back to Info.
     */
    static Level parse_level(const std::string& name) {
        if (name == "debug") return Level::Debug;
        if (name == "warn" || name == "warning") return Level::Warning;
        if (name == "error") return Level::Error;
        if (name == "off" || name == "none") return Level::Off;
        return Level::Info;
    }

    static void log(Level level, const std::string& message) {
        if (level == Level::Off || !enabled(level)) return;

        static std::mutex mutex;
        std::lock_guard<std::mutex> lock(mutex);

        const char* color = "";
        const char* prefix = "";

        switch (level) {
            case Level::Debug:   color = "\033[0;37m"; prefix = "... "; break; // Grey
            case Level::Info:    color = "\033[0;36m"; prefix = "=== "; break; // Cyan
            case Level::Step:    color = "\033[1;33m"; prefix = ">>> "; break; // Yellow
            case Level::Success: color = "\033[0;32m"; prefix = "✓ ";   break; // Green
            case Level::Warning: color = "\033[1;33m"; prefix = "⚠ ";   break; // Yellow
            case Level::Error:   color = "\033[0;31m"; prefix = "✗ ";   break; // Red
            case Level::Off:     break;
        }

        std::ostream& out = (level == Level::Warning || level == Level::Error) ? std::cerr : std::cout;
        out << color << prefix << message << "\033[0m" << std::endl;
    }

    static void debug(const std::string& msg)   { log(Level::Debug, msg); }
    static void info(const std::string& msg)    { log(Level::Info, msg); }
    static void step(const std::string& msg)    { log(Level::Step, msg); }
    static void success(const std::string& msg) { log(Level::Success, msg); }
    static void warn(const std::string& msg)    { log(Level::Warning, msg); }
    static void error(const std::string& msg)   { log(Level::Error, msg); }

private:
    static std::atomic<Level>& min_level() {
        static std::atomic<Level> level{Level::Info};
        return level;
    }
};

} // namespace Omnidb
