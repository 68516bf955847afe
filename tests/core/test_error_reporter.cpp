#include <gtest/gtest.h>
#include <tunstack/error_reporter.h>
#include <memory>
#include <string>
#include <vector>

using namespace tunstack::core;

class ErrorReporterTest : public ::testing::Test {
protected:
    void SetUp() override {
        ErrorReporter::ReportingConfig config;
        config.minimum_level = ErrorReporter::LogLevel::DEBUG;
        config.write_to_stderr = false;
        reporter_ = std::make_shared<ErrorReporter>(config);
        reporter_->add_reporter_callback([this](const ErrorReporter::ErrorReport& report) {
            captured_.push_back(report);
        });
    }

    std::shared_ptr<ErrorReporter> reporter_;
    std::vector<ErrorReporter::ErrorReport> captured_;
};

TEST_F(ErrorReporterTest, ReportReachesCallback) {
    auto result = reporter_->report_error(ErrorReporter::LogLevel::WARNING,
                                          TunError::HANDLER_FORWARD_FAILED,
                                          "tcp_conn", "handler did not take data");
    EXPECT_TRUE(result);
    ASSERT_EQ(captured_.size(), 1u);
    EXPECT_EQ(captured_[0].error_code, TunError::HANDLER_FORWARD_FAILED);
    EXPECT_EQ(captured_[0].category, "tcp_conn");
    EXPECT_EQ(reporter_->get_statistics().total_reports.load(), 1u);
}

TEST_F(ErrorReporterTest, MinimumLevelFilters) {
    auto config = reporter_->get_configuration();
    config.minimum_level = ErrorReporter::LogLevel::ERROR;
    ASSERT_TRUE(reporter_->update_configuration(config));

    EXPECT_FALSE(reporter_->is_enabled(ErrorReporter::LogLevel::WARNING));
    EXPECT_TRUE(reporter_->is_enabled(ErrorReporter::LogLevel::CRITICAL));

    (void)reporter_->report_error(ErrorReporter::LogLevel::INFO, TunError::SUCCESS, "x", "dropped");
    EXPECT_TRUE(captured_.empty());
}

// Endpoints identify the tunnelled user and stay out of logs by default
TEST_F(ErrorReporterTest, AddressesOmittedUnlessEnabled) {
    auto local = NetworkAddress::from_ipv4(0x0A000002, 5000);
    auto remote = NetworkAddress::from_ipv4(0x01010101, 443);

    (void)reporter_->create_report(ErrorReporter::LogLevel::INFO, TunError::SUCCESS)
        .category("tcp_conn")
        .message("connection accepted")
        .connection(local, remote)
        .submit();
    ASSERT_EQ(captured_.size(), 1u);
    EXPECT_TRUE(captured_[0].connection_context.empty());

    auto config = reporter_->get_configuration();
    config.log_network_addresses = true;
    ASSERT_TRUE(reporter_->update_configuration(config));

    (void)reporter_->create_report(ErrorReporter::LogLevel::INFO, TunError::SUCCESS)
        .message("connection accepted")
        .connection(local, remote)
        .submit();
    ASSERT_EQ(captured_.size(), 2u);
    EXPECT_EQ(captured_[1].connection_context, "10.0.0.2:5000->1.1.1.1:443");
}

TEST_F(ErrorReporterTest, BuilderFields) {
    (void)reporter_->create_report(ErrorReporter::LogLevel::ERROR, TunError::STACK_CLOSE_FAILED)
        .category("tcp_conn")
        .component("TcpConnection")
        .message("tcp_close failed")
        .native_code(-1)
        .metadata("key", "42")
        .submit();

    ASSERT_EQ(captured_.size(), 1u);
    const auto& report = captured_[0];
    EXPECT_EQ(report.level, ErrorReporter::LogLevel::ERROR);
    EXPECT_EQ(report.native_code, -1);
    EXPECT_EQ(report.component, "TcpConnection");
    EXPECT_EQ(report.metadata.at("key"), "42");
}

TEST_F(ErrorReporterTest, MessageTruncated) {
    auto config = reporter_->get_configuration();
    config.max_log_entry_size = 8;
    ASSERT_TRUE(reporter_->update_configuration(config));

    (void)reporter_->report_error(ErrorReporter::LogLevel::WARNING, TunError::INTERNAL_ERROR,
                                  "x", "0123456789abcdef");
    ASSERT_EQ(captured_.size(), 1u);
    EXPECT_EQ(captured_[0].message, "01234567");
}

TEST_F(ErrorReporterTest, RateLimited) {
    auto config = reporter_->get_configuration();
    config.max_reports_per_second = 3;
    ASSERT_TRUE(reporter_->update_configuration(config));

    int limited = 0;
    for (int i = 0; i < 5; ++i) {
        auto result = reporter_->report_error(ErrorReporter::LogLevel::WARNING,
                                              TunError::CONNECTION_RESET, "x", "reset");
        if (result.error() == TunError::RATE_LIMITED) {
            limited++;
        }
    }
    EXPECT_EQ(captured_.size(), 3u);
    EXPECT_EQ(limited, 2);
    EXPECT_EQ(reporter_->get_statistics().rate_limited_reports.load(), 2u);
}

TEST_F(ErrorReporterTest, InvalidConfigurationRejected) {
    auto config = reporter_->get_configuration();
    config.max_reports_per_minute = 0;
    auto result = reporter_->update_configuration(config);
    EXPECT_EQ(result.error(), TunError::INVALID_CONFIGURATION);
}

TEST_F(ErrorReporterTest, DefaultReporterReplaceable) {
    auto previous = ErrorReporter::default_reporter();
    ASSERT_NE(previous, nullptr);

    ErrorReporter::set_default_reporter(reporter_);
    EXPECT_EQ(ErrorReporter::default_reporter(), reporter_);

    TUNSTACK_REPORT_WARNING(ErrorReporter::default_reporter(), TunError::CONNECTION_RESET,
                            "reset by peer");
    ASSERT_EQ(captured_.size(), 1u);
    EXPECT_EQ(captured_[0].message, "reset by peer");

    ErrorReporter::set_default_reporter(previous);
}

TEST_F(ErrorReporterTest, LevelNames) {
    EXPECT_EQ(ErrorReporter::log_level_to_string(ErrorReporter::LogLevel::DEBUG), "DEBUG");
    EXPECT_EQ(ErrorReporter::log_level_to_string(ErrorReporter::LogLevel::CRITICAL), "CRITICAL");
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
