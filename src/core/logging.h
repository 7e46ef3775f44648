#pragma once
// Copyright (c) 2024-2026 The Bytewire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BYTEWIRE_CORE_LOGGING_H
#define BYTEWIRE_CORE_LOGGING_H

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace core {

// ---------------------------------------------------------------------------
// LogLevel: severity levels for log messages
// ---------------------------------------------------------------------------
enum class LogLevel : int {
    TRACE   = 0,
    DEBUG   = 1,
    INFO    = 2,
    WARN    = 3,
    ERR     = 4,  // "ERROR" conflicts with Windows <windows.h> macro
    FATAL   = 5,
    OFF     = 6,
};

// ---------------------------------------------------------------------------
// LogCategory: bitmask categories for filtering log output
// ---------------------------------------------------------------------------
enum class LogCategory : uint32_t {
    NONE   = 0,
    CODEC  = 1u << 0,
    STREAM = 1u << 1,
    LAYOUT = 1u << 2,
    CONFIG = 1u << 3,
    CLI    = 1u << 4,
    ALL    = 0xFFFFFFFF,
};

inline constexpr LogCategory operator|(LogCategory a, LogCategory b) noexcept {
    return static_cast<LogCategory>(
        static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

inline constexpr LogCategory operator&(LogCategory a, LogCategory b) noexcept {
    return static_cast<LogCategory>(
        static_cast<uint32_t>(a) & static_cast<uint32_t>(b));
}

inline constexpr LogCategory& operator|=(LogCategory& a,
                                          LogCategory b) noexcept {
    a = a | b;
    return a;
}

// ---------------------------------------------------------------------------
// Conversion helpers
// ---------------------------------------------------------------------------

/// Returns the short string name for a log level (e.g. "INFO", "WARN").
[[nodiscard]] std::string_view log_level_string(LogLevel level) noexcept;

/// Returns the name of the lowest set bit of @p cat, "NONE" for zero and
/// "ALL" for the full mask.
[[nodiscard]] std::string_view log_category_string(
    LogCategory cat) noexcept;

/// Parse a level name ("trace", "debug", "info", "warn", "error", "fatal",
/// "off"; case-insensitive). Returns nullopt for anything else.
[[nodiscard]] std::optional<LogLevel> parse_log_level(
    std::string_view name) noexcept;

/// Parse a comma-separated list of category names into a bitmask.
/// Unknown names are ignored. "all" and "none" are accepted.
[[nodiscard]] LogCategory parse_log_categories(std::string_view list);

// ---------------------------------------------------------------------------
// Logger: thread-safe singleton logger
// ---------------------------------------------------------------------------
class Logger {
public:
    static Logger& instance();

    // -- configuration (all thread-safe) ------------------------------------

    /// Sets the minimum severity level. Messages below this are discarded.
    void set_level(LogLevel level);

    /// Replaces the enabled category mask.
    void set_categories(LogCategory cats);

    [[nodiscard]] LogLevel level() const noexcept;
    [[nodiscard]] LogCategory enabled_categories() const noexcept;

    /// Lockless check: true if a message at the given level and category
    /// would actually be written.
    [[nodiscard]] bool will_log(LogLevel level,
                                LogCategory cat) const noexcept;

    /// Console output goes to stderr. With the console off and no log
    /// file open, will_log() is false for everything.
    void set_print_to_console(bool enable);

    /// Opens (or replaces) the output log file in append mode. An empty
    /// path closes the current file. Returns false if the file could not
    /// be opened; file logging is then disabled.
    bool set_log_file(const std::filesystem::path& path);

    /// Flushes all buffered output to console and file sinks.
    void flush();

    // -- logging entry point ------------------------------------------------

    /// Writes a fully formatted log line. Callers go through the LOG_*
    /// macros, which perform the will_log() check first.
    void write(LogLevel level, LogCategory cat,
               std::string_view message);

    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&)                 = delete;
    Logger& operator=(Logger&&)      = delete;

private:
    Logger();
    ~Logger();

    /// "2026-02-03 12:00:00.123"
    static std::string format_timestamp();

    /// Must be called with write_mutex_ held.
    void write_line_locked(std::string_view line);
    void flush_file_locked();

    std::atomic<int>      level_{static_cast<int>(LogLevel::INFO)};
    std::atomic<uint32_t> enabled_categories_{
        static_cast<uint32_t>(LogCategory::ALL)};
    std::atomic<bool>     print_to_console_{true};
    std::atomic<bool>     print_to_file_{false};

    mutable std::mutex    write_mutex_;
    std::ofstream         file_stream_;
    std::string           buffer_;

    static constexpr std::size_t BUFFER_FLUSH_THRESHOLD = 8192;
};

} // namespace core

// ---------------------------------------------------------------------------
// Convenience macros
// ---------------------------------------------------------------------------
// The will_log() check runs before the message expression is evaluated, so
// disabled paths cost one atomic load.
//
// Usage:
//   LOG_DEBUG(core::LogCategory::STREAM, "fault at offset " + std::to_string(off));
// ---------------------------------------------------------------------------

#define BYTEWIRE_LOG(lvl, cat, msg)                                       \
    do {                                                                  \
        if (core::Logger::instance().will_log((lvl), (cat))) {            \
            core::Logger::instance().write((lvl), (cat),                  \
                                           std::string(msg));             \
        }                                                                 \
    } while (0)

#define LOG_TRACE(cat, msg) BYTEWIRE_LOG(core::LogLevel::TRACE, cat, msg)
#define LOG_DEBUG(cat, msg) BYTEWIRE_LOG(core::LogLevel::DEBUG, cat, msg)
#define LOG_INFO(cat, msg)  BYTEWIRE_LOG(core::LogLevel::INFO, cat, msg)
#define LOG_WARN(cat, msg)  BYTEWIRE_LOG(core::LogLevel::WARN, cat, msg)
#define LOG_ERROR(cat, msg) BYTEWIRE_LOG(core::LogLevel::ERR, cat, msg)
#define LOG_FATAL(cat, msg) BYTEWIRE_LOG(core::LogLevel::FATAL, cat, msg)

#endif // BYTEWIRE_CORE_LOGGING_H
