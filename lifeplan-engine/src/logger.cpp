/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logger.hpp"
#include "comparison.hpp"
#include "trajectory.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace lifeplan {

namespace {

std::string format_ms(double ms) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3) << ms;
    return oss.str();
}

} // anonymous namespace

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    config_ = LoggerConfig();
}

Logger::~Logger() {
    flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
}

void Logger::configure(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    file_stream_.reset();

    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.min_level = level;
}

LogLevel Logger::get_min_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.min_level;
}

void Logger::log_run_start(const RunContext& ctx, const std::string& profile_id, int years) {
    std::map<std::string, std::string> fields;
    fields["event"] = "run_start";
    fields["run_id"] = ctx.run_id;
    fields["operation"] = ctx.operation;
    fields["profile_id"] = profile_id;
    fields["years"] = std::to_string(years);

    log(LogLevel::INFO, "Starting run", fields);
}

void Logger::log_projection_complete(const RunContext& ctx, const Trajectory& trajectory, double elapsed_ms) {
    std::map<std::string, std::string> fields;
    fields["event"] = "projection_complete";
    fields["run_id"] = ctx.run_id;
    fields["operation"] = ctx.operation;
    fields["profile_id"] = trajectory.profile_id;
    fields["years"] = std::to_string(trajectory.years.size());
    fields["milestones"] = std::to_string(trajectory.milestones.size());
    fields["net_worth_at_end"] = std::to_string(trajectory.summary.net_worth_at_end);
    fields["retirement_year"] = trajectory.summary.retirement_year
        ? std::to_string(*trajectory.summary.retirement_year)
        : "none";
    fields["elapsed_ms"] = format_ms(elapsed_ms);

    log(LogLevel::INFO, "Projection completed", fields);
}

void Logger::log_comparison_complete(const RunContext& ctx, const Comparison& comparison, double elapsed_ms) {
    std::map<std::string, std::string> fields;
    fields["event"] = "comparison_complete";
    fields["run_id"] = ctx.run_id;
    fields["operation"] = ctx.operation;
    fields["name"] = comparison.name;
    fields["changes"] = std::to_string(comparison.changes.size());
    fields["matched_years"] = std::to_string(comparison.deltas.size());
    fields["net_worth_at_end_delta"] = std::to_string(comparison.summary.net_worth_at_end_delta);
    fields["key_insight"] = comparison.summary.key_insight;
    fields["elapsed_ms"] = format_ms(elapsed_ms);

    log(LogLevel::INFO, "Comparison completed", fields);
}

void Logger::log_tables_loaded(const RunContext& ctx, const std::string& source, size_t entries) {
    std::map<std::string, std::string> fields;
    fields["event"] = "tables_loaded";
    fields["run_id"] = ctx.run_id;
    fields["source"] = source;
    fields["entries"] = std::to_string(entries);

    log(LogLevel::DEBUG, "Loaded tax tables", fields);
}

void Logger::log_error(const RunContext& ctx, const std::string& error_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "error";
    fields["run_id"] = ctx.run_id;
    fields["operation"] = ctx.operation;
    fields["error_message"] = error_message;

    log(LogLevel::ERROR, "Run failed", fields);
}

void Logger::log_warning(const RunContext& ctx, const std::string& warning_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "warning";
    fields["run_id"] = ctx.run_id;
    fields["operation"] = ctx.operation;
    fields["warning"] = warning_message;

    log(LogLevel::WARN, warning_message, fields);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::log(
    LogLevel level,
    const std::string& message,
    const std::map<std::string, std::string>& fields
) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (level < config_.min_level) {
        return;
    }

    std::string output;

    if (config_.enable_json) {
        std::map<std::string, std::string> json_fields = fields;
        json_fields["timestamp"] = get_timestamp();
        json_fields["level"] = level_to_string(level);
        json_fields["message"] = message;
        output = format_json(json_fields);
    } else {
        std::ostringstream oss;
        oss << get_timestamp() << " [" << level_to_string(level) << "] " << message;

        if (!fields.empty()) {
            oss << " {";
            bool first = true;
            for (const auto& [key, value] : fields) {
                if (!first) oss << ", ";
                oss << key << "=" << value;
                first = false;
            }
            oss << "}";
        }

        output = oss.str();
    }

    write_output(output);
}

std::string Logger::get_timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

std::string Logger::format_json(const std::map<std::string, std::string>& fields) const {
    std::ostringstream oss;
    oss << "{";

    bool first = true;
    for (const auto& [key, value] : fields) {
        if (!first) oss << ",";
        oss << "\"" << escape_json_string(key) << "\":\"" << escape_json_string(value) << "\"";
        first = false;
    }

    oss << "}";
    return oss.str();
}

std::string Logger::escape_json_string(const std::string& str) const {
    std::ostringstream oss;
    for (char c : str) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (c >= 0 && c < 32) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c);
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

void Logger::write_output(const std::string& output) {
    if (config_.enable_console) {
        std::cerr << output << std::endl;
    }

    if (config_.enable_file && file_stream_ && file_stream_->is_open()) {
        *file_stream_ << output << std::endl;
    }
}

} // namespace lifeplan
