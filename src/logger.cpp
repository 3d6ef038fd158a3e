#include "utils/logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>

#if defined(IDENT_PLATFORM_WINDOWS)
#include <windows.h>
#endif

namespace {
/**
 * @brief Получение текущего времени в формате для лога
 * @return Строка с текущим временем в формате "YYYY-MM-DD HH:MM:SS.mmm"
 */
std::string getCurrentTimeFormatted()
{
    const auto now = std::chrono::system_clock::now();
    const auto timeNow = std::chrono::system_clock::to_time_t(now);
    const auto ms
        = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm localTime{};
#if defined(IDENT_PLATFORM_WINDOWS)
    localtime_s(&localTime, &timeNow);
#else
    localtime_r(&timeNow, &localTime);
#endif

    std::ostringstream oss;
    oss << std::put_time(&localTime, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0')
        << std::setw(3) << ms.count();
    return oss.str();
}

// Только имя файла без пути
std::string extractFileName(const std::string_view fullPath)
{
    const auto pos = fullPath.find_last_of("/\\");
    if (pos != std::string_view::npos) {
        return std::string(fullPath.substr(pos + 1));
    }
    return std::string(fullPath);
}
} // namespace

/**
 * ANSI коды цветов для консольного вывода
 */
namespace ConsoleColor {
constexpr const char *RESET = "\033[0m";
constexpr const char *RED = "\033[31m";
constexpr const char *GREEN = "\033[32m";
constexpr const char *YELLOW = "\033[33m";
constexpr const char *BLUE = "\033[34m";
constexpr const char *MAGENTA = "\033[35m";
constexpr const char *CYAN = "\033[36m";
} // namespace ConsoleColor

namespace ident::utils {
std::optional<LogLevel> parseLogLevel(std::string_view name)
{
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "trace")
        return LogLevel::TRACE;
    if (lowered == "debug")
        return LogLevel::DEBUG;
    if (lowered == "info")
        return LogLevel::INFO;
    if (lowered == "warning" || lowered == "warn")
        return LogLevel::WARNING;
    if (lowered == "error")
        return LogLevel::ERROR;
    if (lowered == "critical")
        return LogLevel::CRITICAL;
    return std::nullopt;
}

Logger &Logger::getInstance()
{
    static Logger instance;
    return instance;
}

Logger::Logger()
    : enabled_(false)
    , consoleOutput_(false)
    , colorOutput_(false)
    , logFilePath_(std::nullopt)
    , minimumLevel_(LogLevel::WARNING)
{
}

void Logger::enable(const LoggerOptions &options)
{
    bool needColorWarning = false;
    std::ostringstream configMsg;

    {
        std::lock_guard<std::mutex> lock(logMutex_);

        enabled_ = true;
        consoleOutput_ = options.logToConsole;
        logFilePath_ = options.logFile;
        minimumLevel_ = options.minLevel;

        const auto isColorSupported = isColorSupportedByTerminal();
        needColorWarning = options.useColors && !isColorSupported;
        colorOutput_ = options.useColors && isColorSupported;

        if (logFilePath_.has_value()) {
            // Создаем директорию для лог-файла, если она не существует
            const auto dir = logFilePath_->parent_path();
            std::error_code ec;
            if (!dir.empty() && !std::filesystem::create_directories(dir, ec) && ec) {
                std::cerr << "IDENT: Не удалось создать директорию для лога: " << dir << " ("
                          << ec.message() << ")" << std::endl;
            }

            std::ofstream file(*logFilePath_, std::ios::out | std::ios::app);
            if (file) {
                file << "--- IDENT логирование начато в " << getCurrentTimeFormatted() << " ---"
                     << std::endl;
            }
        }

        configMsg << "Логирование включено (минимальный уровень: " << levelToString(minimumLevel_)
                  << ", вывод в консоль: " << (consoleOutput_ ? "да" : "нет")
                  << ", цветной вывод: " << (colorOutput_ ? "да" : "нет") << ")";
    }

    if (needColorWarning) {
        log(LogLevel::WARNING, "Запрошен цветной вывод, однако консоль не поддерживает ANSI цвета",
            __FILE__, __LINE__);
    }
    log(LogLevel::INFO, configMsg.str(), __FILE__, __LINE__);
}

void Logger::disable()
{
    log(LogLevel::INFO, "Логирование отключено", __FILE__, __LINE__);
    std::lock_guard<std::mutex> lock(logMutex_);
    enabled_ = false;
}

bool Logger::isEnabled() const
{
    std::lock_guard<std::mutex> lock(logMutex_);
    return enabled_;
}

void Logger::setMinLogLevel(LogLevel level)
{
    {
        std::lock_guard<std::mutex> lock(logMutex_);
        minimumLevel_ = level;
    }
    log(LogLevel::INFO, "Минимальный уровень логирования установлен на " + levelToString(level),
        __FILE__, __LINE__);
}

LogLevel Logger::getMinLogLevel() const
{
    std::lock_guard<std::mutex> lock(logMutex_);
    return minimumLevel_;
}

bool Logger::shouldLog(LogLevel level) const
{
    std::lock_guard<std::mutex> lock(logMutex_);
    return enabled_ && level >= minimumLevel_;
}

void Logger::log(LogLevel level, const std::string &message, const std::string_view file, int line)
{
    std::lock_guard<std::mutex> lock(logMutex_);
    if (!enabled_ || level < minimumLevel_) {
        return;
    }

    const auto formattedMessage = formatLogMessage(level, message, file, line);

    if (consoleOutput_) {
        writeToConsole(formattedMessage, level);
    }

    if (logFilePath_.has_value()) {
        writeToFile(formattedMessage);
    }
}

std::string Logger::levelToString(LogLevel level)
{
    switch (level) {
    case LogLevel::TRACE:
        return "TRACE";
    case LogLevel::DEBUG:
        return "DEBUG";
    case LogLevel::INFO:
        return "INFO";
    case LogLevel::WARNING:
        return "WARNING";
    case LogLevel::ERROR:
        return "ERROR";
    case LogLevel::CRITICAL:
        return "CRITICAL";
    }
    return "UNKNOWN";
}

std::string Logger::formatLogMessage(LogLevel level, const std::string &message,
                                     const std::string_view file, int line) const
{
    std::ostringstream oss;

    // Формат: [ВРЕМЯ] [УРОВЕНЬ] [ФАЙЛ:СТРОКА] Сообщение
    oss << "[" << getCurrentTimeFormatted() << "] "
        << "[" << levelToString(level) << "] ";

    if (!file.empty()) {
        oss << "[" << extractFileName(file) << ":" << line << "] ";
    }

    oss << message;
    return oss.str();
}

bool Logger::writeToFile(const std::string &formattedMessage)
{
    std::ofstream file(*logFilePath_, std::ios::out | std::ios::app);
    if (!file) {
        std::cerr << "IDENT: Не удалось открыть файл для записи: " << *logFilePath_ << std::endl;
        return false;
    }

    file << formattedMessage << std::endl;
    return true;
}

void Logger::writeToConsole(const std::string &formattedMessage, LogLevel level)
{
    constexpr char prefix[] = "IDENT: ";

    if (!colorOutput_) {
        std::cerr << prefix << formattedMessage << std::endl;
        return;
    }

    const char *colorCode = ConsoleColor::RESET;
    switch (level) {
    case LogLevel::TRACE:
        colorCode = ConsoleColor::CYAN;
        break;
    case LogLevel::DEBUG:
        colorCode = ConsoleColor::BLUE;
        break;
    case LogLevel::INFO:
        colorCode = ConsoleColor::GREEN;
        break;
    case LogLevel::WARNING:
        colorCode = ConsoleColor::YELLOW;
        break;
    case LogLevel::ERROR:
        colorCode = ConsoleColor::RED;
        break;
    case LogLevel::CRITICAL:
        colorCode = ConsoleColor::MAGENTA;
        break;
    }

    std::cerr << colorCode << prefix << formattedMessage << ConsoleColor::RESET << std::endl;
}

bool Logger::isColorSupportedByTerminal() const
{
#if defined(IDENT_PLATFORM_UNIX)
    const char *term = std::getenv("TERM");
    if (term == nullptr) {
        return false;
    }
    return std::string(term) != "dumb" && std::string(term) != "unknown";
#elif defined(IDENT_PLATFORM_WINDOWS)
    HANDLE hOut = GetStdHandle(STD_ERROR_HANDLE);
    if (hOut == INVALID_HANDLE_VALUE) {
        return false;
    }

    DWORD dwMode = 0;
    if (!GetConsoleMode(hOut, &dwMode)) {
        return false;
    }
    return (dwMode & ENABLE_VIRTUAL_TERMINAL_PROCESSING) != 0;
#else
    return false;
#endif
}

LogStream::LogStream(LogLevel level, const std::string_view file, int line)
    : level_(level)
    , file_(file)
    , line_(line)
{
}

LogStream::~LogStream()
{
    Logger::getInstance().log(level_, stream_.str(), file_, line_);
}

} // namespace ident::utils
