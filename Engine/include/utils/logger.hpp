#pragma once

#include <atomic>
#include <iostream>
#include <mutex>
#include <string>

namespace Terrasplit {

/**
 * @brief Thread-safe console logger shared by the engine and the CLI.
 *
 * Debug lines are dropped unless verbose mode is enabled. The sink defaults to
 * std::cout; the CLI moves it to std::cerr when stdout carries a JSON report.
 */
class Logger {
public:
    enum class Level {
        Debug,
        Info,
        Step,
        Success,
        Warning,
        Error
    };

    static void log(Level level, const std::string& message) {
        if (level == Level::Debug && !verbose_.load()) return;

        std::lock_guard<std::mutex> lock(mutex_);

        const char* color = "";
        const char* prefix = "";

        switch (level) {
            case Level::Debug:   color = "\033[0;90m"; prefix = "... "; break; // Grey
            case Level::Info:    color = "\033[0;36m"; prefix = "=== "; break; // Cyan
            case Level::Step:    color = "\033[1;33m"; prefix = ">>> "; break; // Yellow
            case Level::Success: color = "\033[0;32m"; prefix = "✓ ";   break; // Green
            case Level::Warning: color = "\033[1;33m"; prefix = "⚠ ";   break; // Yellow
            case Level::Error:   color = "\033[0;31m"; prefix = "✗ ";   break; // Red
        }

        std::ostream& out = *stream_;
        if (color_.load()) {
            out << color << prefix << message << "\033[0m" << std::endl;
        } else {
            out << prefix << message << std::endl;
        }
    }

    static void debug(const std::string& msg)   { log(Level::Debug, msg); }
    static void info(const std::string& msg)    { log(Level::Info, msg); }
    static void step(const std::string& msg)    { log(Level::Step, msg); }
    static void success(const std::string& msg) { log(Level::Success, msg); }
    static void warn(const std::string& msg)    { log(Level::Warning, msg); }
    static void error(const std::string& msg)   { log(Level::Error, msg); }

    static void set_verbose(bool verbose) { verbose_.store(verbose); }
    static bool verbose() { return verbose_.load(); }

    static void set_color(bool enabled) { color_.store(enabled); }

    /**
     * @brief Redirect output. The stream must outlive every later log call.
     */
    static void set_stream(std::ostream& stream) {
        std::lock_guard<std::mutex> lock(mutex_);
        stream_ = &stream;
    }

private:
    static inline std::mutex mutex_;
    static inline std::atomic<bool> verbose_{false};
    static inline std::atomic<bool> color_{true};
    static inline std::ostream* stream_ = &std::cout;
};

} // namespace Terrasplit
