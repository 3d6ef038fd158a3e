#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include "identifier/errors.hpp"
#include "identifier/uuid.hpp"
#include "testing_utils.hpp"
#include "utils/logger.hpp"

namespace ident::tests {

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        logFile = std::filesystem::temp_directory_path()
            / ("ident_log_" + std::to_string(getRandomInt(0, 1000000))) / "ident.log";
    }

    void TearDown() override
    {
        utils::Logger::getInstance().disable();
        std::error_code ec;
        std::filesystem::remove_all(logFile.parent_path(), ec);
    }

    std::string readLog() const
    {
        std::ifstream stream(logFile);
        std::ostringstream content;
        content << stream.rdbuf();
        return content.str();
    }

    std::filesystem::path logFile;
};

// Разбор имени уровня логирования
TEST_F(LoggerTest, ParseLogLevel)
{
    EXPECT_EQ(utils::LogLevel::TRACE, utils::parseLogLevel("trace"));
    EXPECT_EQ(utils::LogLevel::DEBUG, utils::parseLogLevel("DEBUG"));
    EXPECT_EQ(utils::LogLevel::WARNING, utils::parseLogLevel("Warn"));
    EXPECT_EQ(utils::LogLevel::CRITICAL, utils::parseLogLevel("critical"));
    EXPECT_FALSE(utils::parseLogLevel("verbose").has_value());
    EXPECT_FALSE(utils::parseLogLevel("").has_value());
}

// Причина отказа при разборе пишется в лог на уровне DEBUG
TEST_F(LoggerTest, ParseFailureIsLogged)
{
    utils::LoggerOptions options;
    options.logToConsole = false;
    options.logFile = logFile;
    options.minLevel = utils::LogLevel::DEBUG;
    utils::Logger::getInstance().enable(options);

    EXPECT_THROW(Uuid::parseAny("foobar"), InvalidArgument);

    const auto content = readLog();
    EXPECT_NE(std::string::npos, content.find("[DEBUG]"));
    EXPECT_NE(std::string::npos, content.find("Некорректный UUID: \"foobar\""));
}

// Сообщения ниже минимального уровня отбрасываются
TEST_F(LoggerTest, MinimumLevelFilters)
{
    utils::LoggerOptions options;
    options.logToConsole = false;
    options.logFile = logFile;
    options.minLevel = utils::LogLevel::ERROR;
    utils::Logger::getInstance().enable(options);

    EXPECT_FALSE(utils::Logger::getInstance().shouldLog(utils::LogLevel::DEBUG));
    EXPECT_TRUE(utils::Logger::getInstance().shouldLog(utils::LogLevel::CRITICAL));

    EXPECT_THROW(Uuid::parseAny("foobar"), InvalidArgument);
    LOG_ERROR << "Сообщение уровня ERROR";

    const auto content = readLog();
    EXPECT_EQ(std::string::npos, content.find("foobar"));
    EXPECT_NE(std::string::npos, content.find("Сообщение уровня ERROR"));

    utils::Logger::getInstance().disable();
    EXPECT_FALSE(utils::Logger::getInstance().shouldLog(utils::LogLevel::CRITICAL));
}
} // namespace ident::tests
