#ifndef TUNSTACK_ERROR_REPORTER_H
#define TUNSTACK_ERROR_REPORTER_H

#include <tunstack/config.h>
#include <tunstack/error.h>
#include <tunstack/result.h>
#include <tunstack/types.h>
#include <string>
#include <vector>
#include <memory>
#include <chrono>
#include <functional>
#include <unordered_map>
#include <atomic>
#include <mutex>

namespace tunstack {
namespace core {

/**
 * ErrorReporter is the logging facility of the library.
 *
 * 1. Never logs payload bytes flowing through a connection
 * 2. Only logs endpoint addresses when explicitly enabled
 * 3. Human readable or JSON output on stderr
 * 4. Rate limiting to keep a flood of failing flows from drowning the log
 * 5. Custom callbacks so embedders (and tests) can route reports elsewhere
 */
class TUNSTACK_API ErrorReporter {
public:
    enum class LogLevel {
        DEBUG,      // Per-callback tracing
        INFO,       // Connection lifecycle events
        WARNING,    // Recoverable failures scoped to one connection
        ERROR,      // Native stack failures
        CRITICAL    // Invariant violations
    };

    enum class OutputFormat {
        HUMAN_READABLE,
        JSON
    };

    struct ReportingConfig {
        LogLevel minimum_level = LogLevel::WARNING;
        OutputFormat format = OutputFormat::HUMAN_READABLE;

        // Endpoint addresses identify the tunnelled user
        bool log_network_addresses = false;

        // Rate limiting
        uint32_t max_reports_per_second = 100;
        uint32_t max_reports_per_minute = 1000;
        size_t max_log_entry_size = 4096;

        bool write_to_stderr = true;
    };

    struct ErrorReport {
        LogLevel level;
        TunError error_code;
        int native_code = 0;
        std::string category;                     // e.g. "tcp_conn", "registry"
        std::string message;
        std::chrono::system_clock::time_point timestamp;
        std::string component;
        std::string connection_context;           // "local->remote" when enabled
        std::unordered_map<std::string, std::string> metadata;

        ErrorReport(LogLevel lvl, TunError error, const std::string& msg)
            : level(lvl)
            , error_code(error)
            , message(msg)
            , timestamp(std::chrono::system_clock::now()) {}
    };

    using ReporterCallback = std::function<void(const ErrorReport&)>;

    ErrorReporter();
    explicit ErrorReporter(const ReportingConfig& config);
    ~ErrorReporter();

    ErrorReporter(const ErrorReporter&) = delete;
    ErrorReporter& operator=(const ErrorReporter&) = delete;

    /**
     * Report an event
     * @param level Log level for the report
     * @param error Error code, SUCCESS for informational events
     * @param category Report category
     * @param message Descriptive message
     * @return RATE_LIMITED when dropped by the limiter
     */
    Result<void> report_error(LogLevel level,
                              TunError error,
                              const std::string& category,
                              const std::string& message);

    class ReportBuilder;
    ReportBuilder create_report(LogLevel level, TunError error);

    Result<void> submit_report(const ErrorReport& report);

    Result<void> update_configuration(const ReportingConfig& config);
    ReportingConfig get_configuration() const;

    bool is_enabled(LogLevel level) const;

    void add_reporter_callback(ReporterCallback callback);
    void clear_reporter_callbacks();

    struct ReportingStatistics {
        std::atomic<uint64_t> total_reports{0};
        std::atomic<uint64_t> reports_by_level[5]{};
        std::atomic<uint64_t> rate_limited_reports{0};
        std::atomic<uint64_t> bytes_logged{0};
    };

    const ReportingStatistics& get_statistics() const { return stats_; }
    void reset_statistics();

    static std::string log_level_to_string(LogLevel level);

    /**
     * Process-wide reporter used by connections that were not given one.
     * Never null.
     */
    static std::shared_ptr<ErrorReporter> default_reporter();
    static void set_default_reporter(std::shared_ptr<ErrorReporter> reporter);

private:
    ReportingConfig config_;
    mutable std::mutex config_mutex_;

    mutable std::mutex output_mutex_;

    std::vector<ReporterCallback> custom_reporters_;
    mutable std::mutex reporters_mutex_;

    mutable ReportingStatistics stats_;

    struct RateLimitState {
        uint32_t reports_this_second{0};
        uint32_t reports_this_minute{0};
        std::chrono::steady_clock::time_point second_start;
        std::chrono::steady_clock::time_point minute_start;
        std::mutex reset_mutex;
    };
    mutable RateLimitState rate_limit_;

    bool consume_rate_budget();
    Result<void> write_report(const ErrorReport& report);
    std::string format_report(const ErrorReport& report, OutputFormat format) const;
};

/**
 * ReportBuilder provides fluent interface for constructing detailed reports
 */
class TUNSTACK_API ErrorReporter::ReportBuilder {
public:
    ReportBuilder(ErrorReporter& reporter, LogLevel level, TunError error);

    ReportBuilder& category(const std::string& cat);
    ReportBuilder& message(const std::string& msg);
    ReportBuilder& component(const std::string& comp);
    ReportBuilder& native_code(int code);
    ReportBuilder& connection(const NetworkAddress& local, const NetworkAddress& remote);
    ReportBuilder& metadata(const std::string& key, const std::string& value);

    Result<void> submit();

private:
    ErrorReporter& reporter_;
    ErrorReport report_;
};

// Convenience macros for common reporting patterns
#define TUNSTACK_REPORT(reporter, level, error, message) \
    do { \
        if ((reporter) && (reporter)->is_enabled(level)) { \
            (void)(reporter)->report_error((level), (error), __FUNCTION__, (message)); \
        } \
    } while (0)

#define TUNSTACK_REPORT_DEBUG(reporter, message) \
    TUNSTACK_REPORT(reporter, ::tunstack::core::ErrorReporter::LogLevel::DEBUG, \
                    ::tunstack::core::TunError::SUCCESS, message)

#define TUNSTACK_REPORT_INFO(reporter, message) \
    TUNSTACK_REPORT(reporter, ::tunstack::core::ErrorReporter::LogLevel::INFO, \
                    ::tunstack::core::TunError::SUCCESS, message)

#define TUNSTACK_REPORT_WARNING(reporter, error, message) \
    TUNSTACK_REPORT(reporter, ::tunstack::core::ErrorReporter::LogLevel::WARNING, error, message)

#define TUNSTACK_REPORT_ERROR(reporter, error, message) \
    TUNSTACK_REPORT(reporter, ::tunstack::core::ErrorReporter::LogLevel::ERROR, error, message)

} // namespace core
} // namespace tunstack

#endif // TUNSTACK_ERROR_REPORTER_H
