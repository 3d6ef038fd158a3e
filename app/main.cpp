#include <algorithm>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "cli/commands.hpp"
#include "identifier/errors.hpp"
#include "utils/logger.hpp"

// Вывод справки
void printHelp(const char *executable)
{
    std::cout
        << "Использование:\n"
        << "  " << executable << " [ОПЦИИ] <КОМАНДА> [АРГУМЕНТЫ]\n"
        << "  " << executable << " --interactive [ОПЦИИ]\n\n"

        << "Описание:\n"
        << "  Разбор, проверка, преобразование, сравнение и генерация UUID\n"
        << "  (версии 1-8, Nil, Max и Microsoft GUID).\n\n"

        << "Общие опции:\n"
        << "  --log-level=УРОВЕНЬ   trace, debug, info, warning, error или critical\n"
        << "                        (по умолчанию: warning)\n"
        << "  --log-file=ПУТЬ       Дополнительно записывать сообщения в файл\n"
        << "  --no-colors           Отключить цветной вывод сообщений\n"
        << "  --interactive         Читать команды построчно из стандартного ввода\n"
        << "  --help                Показать справку\n\n"

        << "Параметры генерации:\n"
        << "  --node=ЗНАЧЕНИЕ       Идентификатор узла: 12 hex-цифр (MAC-адрес) или\n"
        << "                        десятичное число (по умолчанию: MAC-адрес системы)\n"
        << "  --clock-seq=ЧИСЛО     Последовательность часов [0, 16383]\n"
        << "                        (по умолчанию: случайная)\n\n"

        << "Команды:\n"
        << "  inspect <ЗНАЧЕНИЕ>               Показать тип, представления и поля UUID\n"
        << "  convert <ФОРМАТ> <ЗНАЧЕНИЕ>      Перевести UUID в формат string, hex, integer,\n"
        << "                                   urn или bytes\n"
        << "  integer <ЧИСЛО>                  Показать UUID по его целочисленному представлению\n"
        << "  compare <A> <B>                  Сравнить два значения (-1, 0 или 1)\n"
        << "  guid <ЗНАЧЕНИЕ>                  Преобразовать UUID в Microsoft GUID\n"
        << "  generate <v1|v2|v4|v6|v7|guid>   Сгенерировать новое значение\n"
        << "           [person|group|org]      (для v2 - локальный домен)\n"
        << "  exit                             Выход (только в интерактивном режиме)\n"
        << "  help                             Показать список команд\n";
}

// Получение значения опции из аргументов командной строки
std::optional<std::string> getOptionValue(const std::string &option, std::vector<std::string> &args)
{
    for (size_t i = 0; i < args.size(); ++i) {
        const auto &arg = args[i];
        // Проверка формата `--option=value`
        size_t pos = arg.find('=');
        if (pos != std::string::npos && arg.substr(0, pos) == option) {
            const std::string value = arg.substr(pos + 1);
            // Удаляем строку из вектора
            args.erase(args.begin() + i);
            return value;
        }
        // Проверка формата `--option value`
        if (arg == option && i + 1 < args.size()) {
            const std::string value = args[i + 1];
            // Удаляем строку с параметром и строку со значением из вектора
            args.erase(args.begin() + i, args.begin() + i + 2);
            return value;
        }
    }
    return std::nullopt;
}

// Проверка наличия флага в аргументах командной строки
bool hasFlag(const std::string &flag, std::vector<std::string> &args)
{
    auto it = std::find(args.begin(), args.end(), flag);
    if (it != args.end()) {
        // Удаляем найденный флаг из вектора
        args.erase(it);
        return true;
    }
    return false;
}

// Проверка оставшихся флагов: если флаги остались, то это ошибка
bool checkLastArgs(const std::vector<std::string> &args)
{
    if (args.empty()) {
        return true;
    }

    LOG_ERROR << "Ошибка: неизвестные аргументы:";
    for (const auto &arg : args) {
        LOG_ERROR << "\t" << arg;
    }
    return false;
}

// Неразобранные опции вида --xxx до команды являются ошибкой
bool checkUnknownOptions(const std::vector<std::string> &args)
{
    const auto unknown = std::find_if(args.begin(), args.end(), [](const std::string &arg) {
        return arg.rfind("--", 0) == 0;
    });
    if (unknown == args.end()) {
        return true;
    }
    LOG_ERROR << "Ошибка: неизвестная опция: " << *unknown;
    return false;
}

int main(int argc, char *argv[])
{
    // Получение команды запуска
    auto executable = (argc > 0) ? argv[0] : "";
    // Преобразование аргументов в вектор строк для удобства работы
    std::vector<std::string> args(argv + 1, argv + argc);

    // Проверка на --help
    if (args.empty() || hasFlag("--help", args)) {
        printHelp(executable);
        return 0;
    }

    // Параметры логирования
    ident::utils::LoggerOptions loggerOptions;
    loggerOptions.useColors = !hasFlag("--no-colors", args);
    loggerOptions.logFile = getOptionValue("--log-file", args);

    const auto levelOption = getOptionValue("--log-level", args);
    if (levelOption.has_value()) {
        const auto level = ident::utils::parseLogLevel(*levelOption);
        if (!level.has_value()) {
            ident::utils::Logger::getInstance().enable(loggerOptions);
            LOG_ERROR << "Ошибка: некорректное значение для --log-level: " << *levelOption;
            return 1;
        }
        loggerOptions.minLevel = *level;
    }

    // Инициализация логгера
    ident::utils::Logger::getInstance().enable(loggerOptions);

    // Получение параметров
    const auto interactiveMode = hasFlag("--interactive", args);
    ident::cli::GenerationOptions generationOptions;

    const auto nodeOption = getOptionValue("--node", args);
    if (nodeOption.has_value()) {
        try {
            generationOptions.node = ident::StaticNodeService::fromString(*nodeOption).address();
        }
        catch (const ident::InvalidArgument &e) {
            LOG_ERROR << "Ошибка: некорректное значение для --node: " << e.what();
            return 1;
        }
    }

    const auto clockSeqOption = getOptionValue("--clock-seq", args);
    if (clockSeqOption.has_value()) {
        try {
            const auto value = std::stoul(*clockSeqOption);
            generationOptions.clockSequence = ident::StaticClockSequenceService(
                                                  static_cast<uint32_t>(std::min<unsigned long>(
                                                      value, ident::MAX_CLOCK_SEQUENCE + 1)))
                                                  .next();
        }
        catch (const std::exception &e) {
            LOG_ERROR << "Ошибка: некорректное значение для --clock-seq: " << e.what();
            return 1;
        }
    }

    // Для интерактивного режима не должно остаться аргументов
    if (interactiveMode && !checkLastArgs(args)) {
        return 1;
    }
    if (!checkUnknownOptions(args)) {
        return 1;
    }

    try {
        ident::UuidFactory factory;

        // Запуск в интерактивном режиме
        if (interactiveMode) {
            return ident::cli::CommandProcessor::runInteractiveMode(factory,
                                                                    std::move(generationOptions));
        }

        // Запуск в режиме однократного выполнения команды
        const auto result = ident::cli::CommandProcessor::executeShot(
            factory, std::move(generationOptions), std::move(args));
        return result == ident::cli::CommandResult::SUCCESS ? 0 : 1;
    }
    catch (const ident::RandomSourceNotFound &e) {
        LOG_CRITICAL << "Ошибка инициализации: " << e.what();
        return 1;
    }
}
