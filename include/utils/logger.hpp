#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace ident::utils {
/**
 * @enum LogLevel
 * @brief Уровни логирования, определяющие важность сообщения
 */
enum class LogLevel {
    TRACE, // Детальная трассировка разбора представлений
    DEBUG, // Причины отказа при разборе и валидации
    INFO, // Информационные сообщения
    WARNING, // Предупреждения, не являющиеся ошибками
    ERROR, // Ошибки выполнения команд
    CRITICAL // Критические ошибки, прерывающие работу программы
};

/**
 * @brief Преобразует текстовое имя уровня ("debug", "WARNING", ...) в LogLevel
 * @param name Имя уровня в любом регистре
 * @return Уровень логирования или std::nullopt для неизвестного имени
 */
std::optional<LogLevel> parseLogLevel(std::string_view name);

/**
 * @struct LoggerOptions
 * @brief Параметры, с которыми включается логирование
 */
struct LoggerOptions {
    bool logToConsole = true; // Вывод в stderr
    std::optional<std::filesystem::path> logFile; // Файл для дозаписи сообщений
    LogLevel minLevel = LogLevel::WARNING; // Минимальный уровень
    bool useColors = true; // Цветной вывод, если терминал его поддерживает
};

/**
 * @class Logger
 * @brief Потокобезопасный логгер библиотеки идентификаторов
 *
 * Logger является синглтоном. По умолчанию логирование отключено: библиотека
 * ничего не пишет, пока приложение явно не вызовет enable().
 */
class Logger {
public:
    /**
     * @brief Получение единственного экземпляра логгера
     * @return Ссылка на экземпляр логгера
     */
    static Logger &getInstance();

    /**
     * @brief Включает логирование с указанными параметрами
     * @param options Параметры вывода
     */
    void enable(const LoggerOptions &options = {});

    /**
     * @brief Отключает логирование
     */
    void disable();

    bool isEnabled() const;

    /**
     * @brief Установка минимального уровня логирования
     * @param level Минимальный уровень сообщений
     */
    void setMinLogLevel(LogLevel level);

    LogLevel getMinLogLevel() const;

    /**
     * @brief Проверяет, будет ли записано сообщение указанного уровня
     * @param level Уровень сообщения
     */
    bool shouldLog(LogLevel level) const;

    /**
     * @brief Логирование сообщения с указанным уровнем
     * @param level Уровень сообщения
     * @param message Текст сообщения
     * @param file Имя файла, из которого вызвана функция логирования
     * @param line Номер строки, из которой вызвана функция логирования
     */
    void log(LogLevel level, const std::string &message, const std::string_view file = {},
             int line = 0);

    /**
     * @brief Текстовое имя уровня логирования
     */
    static std::string levelToString(LogLevel level);

private:
    Logger();
    ~Logger() = default;
    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    Logger(Logger &&) = delete;
    Logger &operator=(Logger &&) = delete;

    bool enabled_;
    bool consoleOutput_;
    bool colorOutput_;
    std::optional<std::filesystem::path> logFilePath_;
    LogLevel minimumLevel_;
    mutable std::mutex logMutex_;

    std::string formatLogMessage(LogLevel level, const std::string &message,
                                 const std::string_view file, int line) const;

    /**
     * @brief Дописывает сообщение в файл лога
     * @return true, если запись выполнена успешно
     */
    bool writeToFile(const std::string &formattedMessage);

    void writeToConsole(const std::string &formattedMessage, LogLevel level);

    /**
     * @brief Проверяет, поддерживает ли консоль ANSI цвета
     */
    bool isColorSupportedByTerminal() const;
};

/**
 * @brief Вспомогательный класс для логирования с использованием потокового синтаксиса
 *
 * Сообщение собирается во внутренний поток и передаётся в Logger в деструкторе.
 */
class LogStream {
public:
    LogStream(LogLevel level, const std::string_view file, int line);
    ~LogStream();

    template <typename T> LogStream &operator<<(const T &val)
    {
        stream_ << val;
        return *this;
    }

private:
    LogLevel level_;
    std::ostringstream stream_;
    std::string_view file_;
    int line_;
};

} // namespace ident::utils

#define IDENT_LOG_ENABLED(level) (ident::utils::Logger::getInstance().shouldLog(level))

// Макросы для логирования с автоматическим указанием файла и строки
#define LOG_TRACE                                                                                  \
    if (IDENT_LOG_ENABLED(ident::utils::LogLevel::TRACE))                                          \
    ident::utils::LogStream(ident::utils::LogLevel::TRACE, __FILE__, __LINE__)
#define LOG_DEBUG                                                                                  \
    if (IDENT_LOG_ENABLED(ident::utils::LogLevel::DEBUG))                                          \
    ident::utils::LogStream(ident::utils::LogLevel::DEBUG, __FILE__, __LINE__)
#define LOG_INFO                                                                                   \
    if (IDENT_LOG_ENABLED(ident::utils::LogLevel::INFO))                                           \
    ident::utils::LogStream(ident::utils::LogLevel::INFO, __FILE__, __LINE__)
#define LOG_WARNING                                                                                \
    if (IDENT_LOG_ENABLED(ident::utils::LogLevel::WARNING))                                        \
    ident::utils::LogStream(ident::utils::LogLevel::WARNING, __FILE__, __LINE__)
#define LOG_ERROR                                                                                  \
    if (IDENT_LOG_ENABLED(ident::utils::LogLevel::ERROR))                                          \
    ident::utils::LogStream(ident::utils::LogLevel::ERROR, __FILE__, __LINE__)
#define LOG_CRITICAL                                                                               \
    if (IDENT_LOG_ENABLED(ident::utils::LogLevel::CRITICAL))                                       \
    ident::utils::LogStream(ident::utils::LogLevel::CRITICAL, __FILE__, __LINE__)
