/**
 * @file logger.hpp
 * @brief Structured logging for projection runs with JSON output
 *
 * The Logger provides structured logging capabilities with:
 * - Multiple log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON-formatted output for easy parsing
 * - Run context tracking (run ID, operation)
 * - Projection and comparison metrics (years, milestones, elapsed time)
 *
 * The numeric models never log; the dispatcher and the CLI do.
 *
 * Design Pattern: Singleton logger with structured event emission
 */

#ifndef LIFEPLAN_LOGGER_HPP
#define LIFEPLAN_LOGGER_HPP

#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace lifeplan {

struct Trajectory;
struct Comparison;

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Per-year detail, table resolution
    INFO,    ///< Run start and completion
    WARN,    ///< Non-fatal issues (e.g. trajectories of different length)
    ERROR    ///< Failed runs
};

/**
 * @brief Convert log level to string
 */
inline std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Parse log level from string (case-sensitive, INFO on unknown input)
 */
inline LogLevel string_to_level(const std::string& level_str) {
    if (level_str == "DEBUG") return LogLevel::DEBUG;
    if (level_str == "INFO") return LogLevel::INFO;
    if (level_str == "WARN") return LogLevel::WARN;
    if (level_str == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;
}

/**
 * @brief Context attached to every event of one run
 */
struct RunContext {
    std::string run_id;              ///< Caller-chosen identifier (profile id, request number)
    std::string operation;           ///< generate, generate_quick, compare

    RunContext() = default;

    RunContext(const std::string& id, const std::string& op)
        : run_id(id), operation(op) {}
};

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
    LogLevel min_level;              ///< Minimum log level to output
    bool enable_console;             ///< Log to console (stderr)
    bool enable_file;                ///< Log to file
    std::string log_file_path;       ///< File path for logs
    bool enable_json;                ///< Output as JSON (vs. plain text)

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("lifeplan.log"),
          enable_json(true) {}
};

/**
 * @brief Structured logger with JSON output
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *   config.enable_file = true;
 *   config.log_file_path = "lifeplan.log";
 *
 *   Logger& logger = Logger::get_instance();
 *   logger.configure(config);
 *
 *   RunContext ctx("profile-1", "generate");
 *   logger.log_run_start(ctx, "profile-1", 55);
 *   logger.log_projection_complete(ctx, trajectory, 3.2);
 *   @endcode
 *
 * All methods are safe to call from the projection worker thread.
 */
class Logger {
public:
    /**
     * @brief Get singleton logger instance
     */
    static Logger& get_instance();

    /**
     * @brief Configure logger with new settings
     */
    void configure(const LoggerConfig& config);

    /**
     * @brief Log the start of a projection or comparison
     *
     * @param ctx Run context
     * @param profile_id Profile being projected (baseline profile for comparisons)
     * @param years Number of years requested
     */
    void log_run_start(const RunContext& ctx, const std::string& profile_id, int years);

    /**
     * @brief Log a finished projection with its headline numbers
     */
    void log_projection_complete(const RunContext& ctx, const Trajectory& trajectory, double elapsed_ms);

    /**
     * @brief Log a finished comparison with its summary
     */
    void log_comparison_complete(const RunContext& ctx, const Comparison& comparison, double elapsed_ms);

    /**
     * @brief Log tax tables loaded from a file
     *
     * @param source File path
     * @param entries Tax years or state codes loaded
     */
    void log_tables_loaded(const RunContext& ctx, const std::string& source, size_t entries);

    /**
     * @brief Log error with context
     */
    void log_error(const RunContext& ctx, const std::string& error_message);

    /**
     * @brief Log warning message
     */
    void log_warning(const RunContext& ctx, const std::string& warning_message);

    /**
     * @brief Flush all log outputs
     */
    void flush();

    void set_min_level(LogLevel level);
    LogLevel get_min_level() const;

private:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;
    mutable std::mutex mutex_;

    void log(LogLevel level, const std::string& message, const std::map<std::string, std::string>& fields);
    std::string get_timestamp() const;
    std::string format_json(const std::map<std::string, std::string>& fields) const;
    std::string escape_json_string(const std::string& str) const;
    void write_output(const std::string& output);
};

} // namespace lifeplan

#endif // LIFEPLAN_LOGGER_HPP
