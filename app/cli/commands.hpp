#pragma once

#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "services/uuid_factory.hpp"

namespace ident::cli {
/**
 * @enum CommandResult
 * @brief Тип результата выполнения команды
 */
enum class CommandResult : int {
    SUCCESS, // Успешное выполнение
    FAILURE, // Ошибка выполнения
    EXIT, // Выход из интерактивного режима
};

/**
 * @struct Command
 * @brief Структура команды
 */
struct Command {
    // Минимальное и максимальное количество принимаемых аргументов
    uint8_t minArgsCount;
    uint8_t maxArgsCount;
    // Команда только для интерактивного режима
    bool onlyForInteractive;
    // Функция выполнения команды
    std::function<CommandResult(const std::vector<std::string> &, std::ostream &)> execute;
};

/**
 * @struct GenerationOptions
 * @brief Входные данные генерации, заданные в командной строке
 */
struct GenerationOptions {
    std::optional<uint64_t> node;
    std::optional<uint32_t> clockSequence;
};

/**
 * @class CommandProcessor
 * @brief Управляет выполнением команд
 */
class CommandProcessor {
public:
    /**
     * @brief Конструктор с указанием фабрики
     * @param factory Фабрика для команд generate и guid
     * @param options Параметры генерации из командной строки
     * @param singleShotMode Процессор создается для однократного выполнения команды
     */
    CommandProcessor(UuidFactory &factory, GenerationOptions options, bool singleShotMode);

    /**
     * @brief Одноразовое выполнение команды
     * @param factory Ссылка на фабрику
     * @param options Параметры генерации
     * @param args Аргументы командной строки (команда и ее аргументы)
     */
    static CommandResult executeShot(UuidFactory &factory, GenerationOptions options,
                                     std::vector<std::string> args);

    /**
     * @brief Запуск интерактивного режима
     * @param factory Ссылка на фабрику
     * @param options Параметры генерации
     * @param in Поток ввода команд
     * @param out Поток вывода результатов
     * @return Код завершения
     */
    static int runInteractiveMode(UuidFactory &factory, GenerationOptions options,
                                  std::istream &in = std::cin, std::ostream &out = std::cout);

    /**
     * @brief Выполнение команды
     * @param command Имя команды
     * @param args Аргументы команды
     * @param out Поток вывода результата выполнения команды
     */
    CommandResult execute(const std::string &command, const std::vector<std::string> &args,
                          std::ostream &out = std::cout) const;

private:
    UuidFactory &factory_;
    GenerationOptions options_;
    std::unordered_map<std::string, Command> commands_; // Зарегистрированные команды
    bool singleShotMode_ = false;
};
} // namespace ident::cli
