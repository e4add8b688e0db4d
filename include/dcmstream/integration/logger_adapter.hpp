/**
 * @file logger_adapter.hpp
 * @brief Logging facade over logger_system
 *
 * The element streams log through this adapter. Until initialize() is
 * called every logging call is a no-op, so the library can be used without
 * any logging setup.
 */

#pragma once

#include <cstdint>
#include <dcmstream/compat/format.hpp>
#include <filesystem>
#include <memory>
#include <string>

namespace dcmstream::integration {

/**
 * @enum log_level
 * @brief Log severity levels
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5,
    off = 6
};

// ─────────────────────────────────────────────────────
// Configuration
// ─────────────────────────────────────────────────────

/**
 * @struct logger_config
 * @brief Configuration options for the logger adapter
 */
struct logger_config {
    /// Directory for log files
    std::filesystem::path log_directory{"logs"};

    /// Name of the log file inside log_directory
    std::string file_name{"dcmstream.log"};

    /// Minimum log level to output
    log_level min_level{log_level::info};

    /// Enable console output
    bool enable_console{true};

    /// Enable file output
    bool enable_file{false};

    /// Maximum log file size in megabytes before rotation
    std::size_t max_file_size_mb{100};

    /// Maximum number of rotated log files to keep
    std::size_t max_files{10};

    /// Use asynchronous logging
    bool async_mode{false};

    /// Buffer size for async logging
    std::size_t buffer_size{8192};
};

// ─────────────────────────────────────────────────────
// Logger Adapter Class
// ─────────────────────────────────────────────────────

/**
 * @class logger_adapter
 * @brief Static logging interface backed by kcenon::logger::logger
 *
 * Thread Safety: All methods are thread-safe.
 *
 * @code
 * logger_config config;
 * config.min_level = log_level::debug;
 * logger_adapter::initialize(config);
 *
 * logger_adapter::info("Walking {} bytes", size);
 *
 * logger_adapter::shutdown();
 * @endcode
 */
class logger_adapter {
public:
    // ─────────────────────────────────────────────────────
    // Initialization
    // ─────────────────────────────────────────────────────

    /**
     * @brief Initialize the logger with configuration
     *
     * Sets up console and file writers. Calling it again while initialized
     * has no effect.
     */
    static void initialize(const logger_config& config);

    /**
     * @brief Flush pending messages and release the logger
     */
    static void shutdown();

    [[nodiscard]] static auto is_initialized() noexcept -> bool;

    // ─────────────────────────────────────────────────────
    // Standard Logging
    // ─────────────────────────────────────────────────────

    template <typename... Args>
    static void trace(dcmstream::compat::format_string<Args...> fmt, Args&&... args) {
        if (is_level_enabled(log_level::trace)) {
            log(log_level::trace, dcmstream::compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    static void debug(dcmstream::compat::format_string<Args...> fmt, Args&&... args) {
        if (is_level_enabled(log_level::debug)) {
            log(log_level::debug, dcmstream::compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    static void info(dcmstream::compat::format_string<Args...> fmt, Args&&... args) {
        if (is_level_enabled(log_level::info)) {
            log(log_level::info, dcmstream::compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    static void warn(dcmstream::compat::format_string<Args...> fmt, Args&&... args) {
        if (is_level_enabled(log_level::warn)) {
            log(log_level::warn, dcmstream::compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    static void error(dcmstream::compat::format_string<Args...> fmt, Args&&... args) {
        if (is_level_enabled(log_level::error)) {
            log(log_level::error, dcmstream::compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    static void fatal(dcmstream::compat::format_string<Args...> fmt, Args&&... args) {
        if (is_level_enabled(log_level::fatal)) {
            log(log_level::fatal, dcmstream::compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    /**
     * @brief Log a message at the specified level
     */
    static void log(log_level level, const std::string& message);

    /**
     * @brief Check if a log level is enabled
     * @return false while the adapter is not initialized
     */
    [[nodiscard]] static auto is_level_enabled(log_level level) noexcept -> bool;

    static void flush();

    // ─────────────────────────────────────────────────────
    // Configuration
    // ─────────────────────────────────────────────────────

    static void set_min_level(log_level level);

    [[nodiscard]] static auto get_min_level() noexcept -> log_level;

    [[nodiscard]] static auto get_config() -> const logger_config&;

    [[nodiscard]] static auto log_level_to_string(log_level level) -> std::string;

private:
    class impl;
    static std::unique_ptr<impl> pimpl_;
};

}  // namespace dcmstream::integration
