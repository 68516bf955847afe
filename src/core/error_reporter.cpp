#include <tunstack/error_reporter.h>
#include <iostream>
#include <chrono>
#include <sstream>

namespace tunstack {
namespace core {

namespace {

std::mutex g_default_reporter_mutex;
std::shared_ptr<ErrorReporter> g_default_reporter;

std::string json_escape(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    for (char c : input) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            default: out += c; break;
        }
    }
    return out;
}

} // namespace

ErrorReporter::ErrorReporter() : config_{} {
    rate_limit_.second_start = std::chrono::steady_clock::now();
    rate_limit_.minute_start = rate_limit_.second_start;
}

ErrorReporter::ErrorReporter(const ReportingConfig& config) : config_(config) {
    rate_limit_.second_start = std::chrono::steady_clock::now();
    rate_limit_.minute_start = rate_limit_.second_start;
}

ErrorReporter::~ErrorReporter() = default;

Result<void> ErrorReporter::report_error(LogLevel level,
                                         TunError error,
                                         const std::string& category,
                                         const std::string& message) {
    ErrorReport report(level, error, message);
    report.category = category;
    return submit_report(report);
}

ErrorReporter::ReportBuilder ErrorReporter::create_report(LogLevel level, TunError error) {
    return ReportBuilder(*this, level, error);
}

Result<void> ErrorReporter::submit_report(const ErrorReport& report) {
    if (!is_enabled(report.level)) {
        return make_result();
    }

    if (!consume_rate_budget()) {
        stats_.rate_limited_reports++;
        return make_error<void>(TunError::RATE_LIMITED);
    }

    size_t level_index = static_cast<size_t>(report.level);
    if (level_index < 5) {
        stats_.reports_by_level[level_index]++;
    }

    auto result = write_report(report);
    if (result.is_success()) {
        stats_.total_reports++;
    }
    return result;
}

Result<void> ErrorReporter::update_configuration(const ReportingConfig& config) {
    if (config.max_reports_per_second == 0 || config.max_reports_per_minute == 0) {
        return make_error<void>(TunError::INVALID_CONFIGURATION,
                                "rate limits must be positive");
    }
    std::lock_guard<std::mutex> lock(config_mutex_);
    config_ = config;
    return make_result();
}

ErrorReporter::ReportingConfig ErrorReporter::get_configuration() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_;
}

bool ErrorReporter::is_enabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return level >= config_.minimum_level;
}

void ErrorReporter::add_reporter_callback(ReporterCallback callback) {
    std::lock_guard<std::mutex> lock(reporters_mutex_);
    custom_reporters_.push_back(std::move(callback));
}

void ErrorReporter::clear_reporter_callbacks() {
    std::lock_guard<std::mutex> lock(reporters_mutex_);
    custom_reporters_.clear();
}

void ErrorReporter::reset_statistics() {
    stats_.total_reports = 0;
    for (auto& counter : stats_.reports_by_level) {
        counter = 0;
    }
    stats_.rate_limited_reports = 0;
    stats_.bytes_logged = 0;
}

std::string ErrorReporter::log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::CRITICAL: return "CRITICAL";
        default: return "UNKNOWN";
    }
}

std::shared_ptr<ErrorReporter> ErrorReporter::default_reporter() {
    std::lock_guard<std::mutex> lock(g_default_reporter_mutex);
    if (!g_default_reporter) {
        g_default_reporter = std::make_shared<ErrorReporter>();
    }
    return g_default_reporter;
}

void ErrorReporter::set_default_reporter(std::shared_ptr<ErrorReporter> reporter) {
    std::lock_guard<std::mutex> lock(g_default_reporter_mutex);
    g_default_reporter = std::move(reporter);
}

// Private method implementations

bool ErrorReporter::consume_rate_budget() {
    uint32_t max_per_second, max_per_minute;
    {
        std::lock_guard<std::mutex> config_lock(config_mutex_);
        max_per_second = config_.max_reports_per_second;
        max_per_minute = config_.max_reports_per_minute;
    }

    std::lock_guard<std::mutex> lock(rate_limit_.reset_mutex);
    auto now = std::chrono::steady_clock::now();

    // Reset counters if time window has passed
    if (now - rate_limit_.second_start >= std::chrono::seconds(1)) {
        rate_limit_.reports_this_second = 0;
        rate_limit_.second_start = now;
    }
    if (now - rate_limit_.minute_start >= std::chrono::minutes(1)) {
        rate_limit_.reports_this_minute = 0;
        rate_limit_.minute_start = now;
    }

    // Check limits BEFORE incrementing
    if (rate_limit_.reports_this_second >= max_per_second ||
        rate_limit_.reports_this_minute >= max_per_minute) {
        return false;
    }

    rate_limit_.reports_this_second++;
    rate_limit_.reports_this_minute++;
    return true;
}

Result<void> ErrorReporter::write_report(const ErrorReport& report) {
    ReportingConfig config = get_configuration();

    ErrorReport filtered = report;
    if (!config.log_network_addresses) {
        filtered.connection_context.clear();
    }
    if (filtered.message.size() > config.max_log_entry_size) {
        filtered.message.resize(config.max_log_entry_size);
    }

    std::vector<ReporterCallback> reporters;
    {
        std::lock_guard<std::mutex> lock(reporters_mutex_);
        reporters = custom_reporters_;
    }
    for (const auto& reporter : reporters) {
        reporter(filtered);
    }

    if (config.write_to_stderr) {
        std::string formatted = format_report(filtered, config.format);
        std::lock_guard<std::mutex> lock(output_mutex_);
        std::cerr << formatted << std::endl;
        stats_.bytes_logged += formatted.length();
    }
    return make_result();
}

std::string ErrorReporter::format_report(const ErrorReport& report, OutputFormat format) const {
    std::ostringstream oss;

    if (format == OutputFormat::JSON) {
        oss << "{\"level\":\"" << log_level_to_string(report.level) << "\""
            << ",\"error\":" << static_cast<int>(report.error_code)
            << ",\"category\":\"" << json_escape(report.category) << "\""
            << ",\"message\":\"" << json_escape(report.message) << "\"";
        if (report.native_code != 0) {
            oss << ",\"native_code\":" << report.native_code;
        }
        if (!report.connection_context.empty()) {
            oss << ",\"connection\":\"" << json_escape(report.connection_context) << "\"";
        }
        for (const auto& kv : report.metadata) {
            oss << ",\"" << json_escape(kv.first) << "\":\"" << json_escape(kv.second) << "\"";
        }
        oss << "}";
    } else {
        oss << "[" << log_level_to_string(report.level) << "] [" << report.category << "]";
        if (report.error_code != TunError::SUCCESS) {
            oss << " Error " << static_cast<int>(report.error_code);
        }
        oss << ": " << report.message;
        if (report.native_code != 0) {
            oss << " (native code " << report.native_code << ")";
        }
        if (!report.connection_context.empty()) {
            oss << " [" << report.connection_context << "]";
        }
    }

    return oss.str();
}

// ReportBuilder

ErrorReporter::ReportBuilder::ReportBuilder(ErrorReporter& reporter, LogLevel level, TunError error)
    : reporter_(reporter)
    , report_(level, error, "") {}

ErrorReporter::ReportBuilder& ErrorReporter::ReportBuilder::category(const std::string& cat) {
    report_.category = cat;
    return *this;
}

ErrorReporter::ReportBuilder& ErrorReporter::ReportBuilder::message(const std::string& msg) {
    report_.message = msg;
    return *this;
}

ErrorReporter::ReportBuilder& ErrorReporter::ReportBuilder::component(const std::string& comp) {
    report_.component = comp;
    return *this;
}

ErrorReporter::ReportBuilder& ErrorReporter::ReportBuilder::native_code(int code) {
    report_.native_code = code;
    return *this;
}

ErrorReporter::ReportBuilder& ErrorReporter::ReportBuilder::connection(const NetworkAddress& local,
                                                                        const NetworkAddress& remote) {
    report_.connection_context = to_string(local) + "->" + to_string(remote);
    return *this;
}

ErrorReporter::ReportBuilder& ErrorReporter::ReportBuilder::metadata(const std::string& key,
                                                                      const std::string& value) {
    report_.metadata[key] = value;
    return *this;
}

Result<void> ErrorReporter::ReportBuilder::submit() {
    return reporter_.submit_report(report_);
}

} // namespace core
} // namespace tunstack
