#include <gtest/gtest.h>
#include "binform/Errors.hpp"
#include "binform/Logging.hpp"
#include "utils/Logging.hpp"

using namespace binform;

namespace
{
    // Restores the process-wide level when a test ends.
    class LogLevelGuard
    {
    public:
        LogLevelGuard() : m_saved(logLevel()) {}
        ~LogLevelGuard() { setLogLevel(m_saved); }

    private:
        LogLevel m_saved;
    };
}

TEST(Logging, ParseLevelNames) {
    EXPECT_EQ(parseLogLevel("trace"), LogLevel::Trace);
    EXPECT_EQ(parseLogLevel("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(parseLogLevel("warning"), LogLevel::Warn);
    EXPECT_EQ(parseLogLevel("off"), LogLevel::Off);
    EXPECT_THROW(parseLogLevel("verbose"), InvalidConfiguration);
    EXPECT_EQ(toString(LogLevel::Error), "error");
}

TEST(Logging, ThresholdFiltersLevels) {
    LogLevelGuard guard;

    setLogLevel(LogLevel::Info);
    EXPECT_FALSE(shouldLog(LogLevel::Debug));
    EXPECT_TRUE(shouldLog(LogLevel::Info));
    EXPECT_TRUE(shouldLog(LogLevel::Error));

    setLogLevel(LogLevel::Off);
    EXPECT_FALSE(shouldLog(LogLevel::Error));
    EXPECT_FALSE(shouldLog(LogLevel::Off));
}

TEST(Logging, MessagesGoToStderr) {
    LogLevelGuard guard;
    setLogLevel(LogLevel::Trace);

    testing::internal::CaptureStderr();
    BINFORM_LOG_INFO("hello {}", 42);
    std::string output = testing::internal::GetCapturedStderr();

    EXPECT_NE(output.find("[binform] [info] hello 42"), std::string::npos);
}

TEST(Logging, DisabledLevelsDoNotFormat) {
    LogLevelGuard guard;
    setLogLevel(LogLevel::Error);

    int evaluated = 0;
    auto count = [&]() { return ++evaluated; };

    testing::internal::CaptureStderr();
    BINFORM_LOG_DEBUG("value {}", count());
    std::string output = testing::internal::GetCapturedStderr();

    EXPECT_EQ(evaluated, 0);
    EXPECT_TRUE(output.empty());
}
