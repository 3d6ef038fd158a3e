#include "cli/commands.hpp"

#include <algorithm>

#include "identifier/classifier.hpp"
#include "identifier/errors.hpp"
#include "utils/compiler.hpp"
#include "utils/logger.hpp"

namespace {
// Множество пробельных символов (аналогично std::isspace())
constexpr char SPACES[] = " \t\n\r\f\v";

/**
 * @brief Извлечение первого слова из строки с удалением незначащих пробелов до следующего слова
 * @param input Ссылка на исходную строку
 * @return Строка со словом (если слова нет - std::nullopt)
 */
std::optional<std::string> extractFirstWord(std::string &input)
{
    // Поиск начала слова (пропускаем все ведущие пробелы)
    const auto start = input.find_first_not_of(SPACES);
    if (start == std::string::npos) {
        input.clear();
        return std::nullopt;
    }

    // Поиск конца слова (первый пробельный символ после start)
    const auto end = input.find_first_of(SPACES, start);
    const auto word = input.substr(start, (end == std::string::npos ? input.size() : end) - start);

    // Обрезаем строку до первого значащего символа
    const auto next
        = (end == std::string::npos) ? std::string::npos : input.find_first_not_of(SPACES, end);
    if (next == std::string::npos) {
        input.clear();
    }
    else {
        input.erase(0, next);
    }

    return word;
}

/**
 * @brief Разбор входной строки интерактивного режима
 * @param input Входная строка
 * @return Команда + аргументы (если строка пустая - std::nullopt)
 */
std::optional<std::pair<std::string, std::vector<std::string>>> parseInput(std::string input)
{
    const auto command = extractFirstWord(input);
    if (!command.has_value()) {
        // Строка состояла только из пробелов
        return std::nullopt;
    }

    std::vector<std::string> args;
    while (auto word = extractFirstWord(input)) {
        args.push_back(std::move(*word));
    }
    return std::make_pair(*command, std::move(args));
}

bool isDecimal(const std::string &text)
{
    return !text.empty()
        && std::all_of(text.begin(), text.end(), [](char c) { return c >= '0' && c <= '9'; });
}

/**
 * Строка из цифр читается как целочисленное представление, если её длина не
 * совпадает с длиной строкового или шестнадцатеричного представления.
 */
bool looksLikeInteger(const std::string &text)
{
    return isDecimal(text) && text.size() != ident::STRING_LENGTH
        && text.size() != ident::HEX_LENGTH;
}

/**
 * @brief Значение из аргумента командной строки
 * @throw InvalidArgument, если аргумент не является UUID
 */
ident::Uuid parseArgument(const std::string &text)
{
    if (!looksLikeInteger(text)) {
        return ident::Uuid::parseAny(text);
    }

    const auto bytes = ident::codec::parse(text, ident::Format::INTEGER);
    const auto kind = ident::classify(bytes);
    if (!kind.has_value()) {
        throw ident::InvalidArgument("Число " + text + " не является UUID известного типа");
    }
    return ident::Uuid::fromCanonicalBytes(bytes, *kind);
}

// Операнд сравнения из аргумента командной строки
ident::Operand operandFromArgument(const std::string &text)
{
    if (text == "null") {
        return ident::Operand(nullptr);
    }
    if (text == "true" || text == "false") {
        return ident::Operand(text == "true");
    }
    if (looksLikeInteger(text)) {
        return ident::Operand::integer(text);
    }
    return ident::Operand(text);
}

// Запись байт в виде \xNN
std::string escapeBytes(const ident::Bytes &bytes)
{
    const auto hex = ident::codec::toHex(bytes.data(), bytes.size());
    std::string result;
    result.reserve(bytes.size() * 4);
    for (size_t i = 0; i < hex.size(); i += 2) {
        result += "\\x";
        result += hex.substr(i, 2);
    }
    return result;
}

std::optional<ident::DceDomain> parseDomain(const std::string &name)
{
    if (name == "person") {
        return ident::DceDomain::PERSON;
    }
    if (name == "group") {
        return ident::DceDomain::GROUP;
    }
    if (name == "org") {
        return ident::DceDomain::ORG;
    }
    return std::nullopt;
}

void printFields(const ident::Uuid &uuid, std::ostream &out)
{
    const auto fields = uuid.decodedFields();
    if (fields.timestamp.has_value()) {
        out << "Временная метка:          " << *fields.timestamp << "\n";
    }
    if (fields.dateTime.has_value()) {
        out << "Дата и время (UTC):       " << ident::fields::formatDateTime(*fields.dateTime)
            << "\n";
    }
    if (fields.clockSequence.has_value()) {
        out << "Последовательность часов: " << *fields.clockSequence << "\n";
    }
    if (fields.node.has_value()) {
        out << "Узел:                     " << *fields.node << "\n";
    }
    if (fields.localIdentifier.has_value()) {
        out << "Локальный идентификатор:  " << *fields.localIdentifier << "\n";
    }
    if (fields.localDomain.has_value()) {
        const auto domain = ident::fields::toDceDomain(*fields.localDomain);
        out << "Локальный домен:          "
            << (domain.has_value() ? ident::fields::dceDomainToString(*domain)
                                   : std::to_string(*fields.localDomain))
            << "\n";
    }
    if (fields.customFieldA.has_value()) {
        out << "Поле A:                   " << *fields.customFieldA << "\n";
        out << "Поле B:                   " << *fields.customFieldB << "\n";
        out << "Поле C:                   " << *fields.customFieldC << "\n";
    }
}

void printHelp(std::ostream &out)
{
    out << "Доступные команды:\n"
        << "  inspect <ЗНАЧЕНИЕ>               Показать тип, представления и поля UUID\n"
        << "  convert <ФОРМАТ> <ЗНАЧЕНИЕ>      Перевести UUID в формат string, hex, integer,\n"
        << "                                   urn или bytes\n"
        << "  integer <ЧИСЛО>                  Показать UUID по его целочисленному представлению\n"
        << "  compare <A> <B>                  Сравнить два значения (-1, 0 или 1)\n"
        << "  guid <ЗНАЧЕНИЕ>                  Преобразовать UUID в Microsoft GUID\n"
        << "  generate <v1|v2|v4|v6|v7|guid>   Сгенерировать новое значение\n"
        << "           [person|group|org]      (для v2 - локальный домен)\n"
        << "  exit                             Выход из интерактивного режима\n"
        << "  help                             Показать справку по доступным командам\n\n"

        << "  <ЗНАЧЕНИЕ> может быть задано строкой (36 символов), шестнадцатеричной\n"
        << "  записью (32 символа) или десятичным числом.\n";
}
} // namespace

namespace ident::cli {
CommandProcessor::CommandProcessor(UuidFactory &factory, GenerationOptions options,
                                   bool singleShotMode)
    : factory_(factory)
    , options_(std::move(options))
    , singleShotMode_(singleShotMode)
{
    // Регистрация всех доступных команд

    // Разбор значения и вывод всех его представлений и полей
    commands_["inspect"] = {
        1, 1, false,
        [](const std::vector<std::string> &args, std::ostream &out) -> CommandResult {
            const auto uuid = parseArgument(args[0]);
            out << "Тип:                      " << kindToString(uuid.kind()) << "\n"
                << "Вариант:                  " << variantToString(uuid.variant()) << "\n";
            if (uuid.kind() != Kind::NIL && uuid.kind() != Kind::MAX) {
                out << "Версия:                   " << static_cast<int>(uuid.version()) << "\n";
            }
            out << "Строка:                   " << uuid.toString() << "\n"
                << "Hex:                      " << uuid.toHexadecimal() << "\n"
                << "Целое число:              " << uuid.toInteger() << "\n"
                << "URN:                      " << uuid.toUrn() << "\n"
                << "Байты:                    " << escapeBytes(uuid.toBytes()) << "\n";
            printFields(uuid, out);
            return CommandResult::SUCCESS;
        }
    };

    // Перевод значения в указанный формат
    commands_["convert"] = {
        2, 2, false,
        [](const std::vector<std::string> &args, std::ostream &out) -> CommandResult {
            const auto uuid = parseArgument(args[1]);
            if (args[0] == "urn") {
                out << uuid.toUrn() << "\n";
                return CommandResult::SUCCESS;
            }

            const auto format = parseFormatName(args[0]);
            if (!format.has_value()) {
                LOG_ERROR << "Ошибка: неизвестный формат: " << args[0];
                return CommandResult::FAILURE;
            }
            switch (*format) {
            case Format::STRING:
                out << uuid.toString() << "\n";
                break;
            case Format::HEXADECIMAL:
                out << uuid.toHexadecimal() << "\n";
                break;
            case Format::INTEGER:
                out << uuid.toInteger() << "\n";
                break;
            case Format::BYTES:
                out << escapeBytes(uuid.toBytes()) << "\n";
                break;
            }
            return CommandResult::SUCCESS;
        }
    };

    // Значение по целочисленному представлению
    commands_["integer"]
        = { 1, 1, false,
            [](const std::vector<std::string> &args, std::ostream &out) -> CommandResult {
                if (!isDecimal(args[0])) {
                    LOG_ERROR << "Ошибка: ожидалось десятичное число: " << args[0];
                    return CommandResult::FAILURE;
                }
                const auto bytes = codec::parse(args[0], Format::INTEGER);
                const auto kind = classify(bytes);
                out << codec::render(bytes, Format::STRING) << "\n"
                    << (kind.has_value() ? kindToString(*kind) : "неизвестный тип") << "\n";
                return CommandResult::SUCCESS;
            } };

    // Сравнение двух значений в любых представлениях
    commands_["compare"]
        = { 2, 2, false,
            [](const std::vector<std::string> &args, std::ostream &out) -> CommandResult {
                const auto result
                    = compare(operandFromArgument(args[0]), operandFromArgument(args[1]));
                out << result << "\n";
                return CommandResult::SUCCESS;
            } };

    // Преобразование UUID варианта RFC в Microsoft GUID
    commands_["guid"]
        = { 1, 1, false,
            [this](const std::vector<std::string> &args, std::ostream &out) -> CommandResult {
                const auto guid = factory_.microsoftGuidFromRfc4122(parseArgument(args[0]));
                out << guid.toString() << "\n" << escapeBytes(guid.toBytes()) << "\n";
                return CommandResult::SUCCESS;
            } };

    // Генерация нового значения
    commands_["generate"] = {
        1, 2, false,
        [this](const std::vector<std::string> &args, std::ostream &out) -> CommandResult {
            const auto &version = args[0];
            if (version != "v2" && args.size() > 1) {
                LOG_ERROR << "Ошибка: локальный домен указывается только для v2";
                return CommandResult::FAILURE;
            }

            if (version == "v1") {
                out << factory_.createV1(options_.node, std::nullopt, options_.clockSequence);
            }
            else if (version == "v2") {
                const auto domain = args.size() > 1 ? parseDomain(args[1]) : DceDomain::PERSON;
                if (!domain.has_value()) {
                    LOG_ERROR << "Ошибка: неизвестный локальный домен: " << args[1];
                    return CommandResult::FAILURE;
                }
                out << factory_.createV2(*domain, std::nullopt, options_.node,
                                         options_.clockSequence);
            }
            else if (version == "v4") {
                out << factory_.createV4();
            }
            else if (version == "v6") {
                out << factory_.createV6(options_.node, std::nullopt, options_.clockSequence);
            }
            else if (version == "v7") {
                out << factory_.createV7();
            }
            else if (version == "guid") {
                out << factory_.createMicrosoftGuid();
            }
            else {
                LOG_ERROR << "Ошибка: генерация не поддерживается для " << version;
                return CommandResult::FAILURE;
            }
            out << "\n";
            return CommandResult::SUCCESS;
        }
    };

    // Команда выхода
    commands_["exit"] = { 0, 0, true, [](const std::vector<std::string> &, std::ostream &) {
                             return CommandResult::EXIT;
                         } };

    // Команда вывода справки
    commands_["help"]
        = { 0, 0, false, [](const std::vector<std::string> &, std::ostream &out) {
               printHelp(out);
               return CommandResult::SUCCESS;
           } };
}

CommandResult CommandProcessor::execute(const std::string &command,
                                        const std::vector<std::string> &args,
                                        std::ostream &out) const
{
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        LOG_ERROR << "Ошибка: неизвестная команда: " << command << ".\n"
                  << "Введите `help` для получения списка доступных команд";
        return CommandResult::FAILURE;
    }

    const auto &cmd = it->second;
    // Проверка количества аргументов
    if (args.size() < cmd.minArgsCount || args.size() > cmd.maxArgsCount) {
        LOG_ERROR << "Ошибка: неправильное использование команды " << command << ".\n"
                  << "Введите `help` для получения информации об использовании команд";
        return CommandResult::FAILURE;
    }

    // Проверка возможности выполнения команды
    if (singleShotMode_ && cmd.onlyForInteractive) {
        LOG_ERROR << "Ошибка: команда " << command << " доступна только в интерактивном режиме.\n"
                  << "Введите `help` для получения информации об использовании команд";
        return CommandResult::FAILURE;
    }

    // Ошибки разбора и генерации сообщаются пользователю, команда завершается неудачей
    try {
        return cmd.execute(args, out);
    }
    catch (const std::invalid_argument &e) {
        LOG_ERROR << "Ошибка: " << e.what();
    }
    catch (const std::runtime_error &e) {
        LOG_ERROR << "Ошибка генерации: " << e.what();
    }
    catch (const std::exception &e) {
        LOG_ERROR << "Ошибка выполнения команды: " << e.what();
    }
    return CommandResult::FAILURE;
}

CommandResult CommandProcessor::executeShot(UuidFactory &factory, GenerationOptions options,
                                            std::vector<std::string> args)
{
    if (args.empty()) {
        LOG_ERROR << "Ошибка: необходимо указать команду для выполнения.\n"
                  << "Введите `help` для получения списка доступных команд";
        return CommandResult::FAILURE;
    }

    // Достаем команду из аргументов
    const auto command = std::move(args.front());
    args.erase(args.begin());

    const auto processor = CommandProcessor(factory, std::move(options), true);
    return processor.execute(command, args);
}

int CommandProcessor::runInteractiveMode(UuidFactory &factory, GenerationOptions options,
                                         std::istream &in, std::ostream &out)
{
    const auto processor = CommandProcessor(factory, std::move(options), false);

    constexpr char PROMPT[] = "ident> ";
    std::string input;

    // Приветственное сообщение
    out << "ident - интерактивный режим\n"
        << "Введите команду или 'help' для получения справки, 'exit' для выхода\n";

    while (true) {
        // Вывод приглашения и получение ввода
        out << PROMPT;
        std::getline(in, input);

        // Конец ввода завершает сеанс так же, как команда exit
        if (in.eof() && input.empty()) {
            out << "\n";
            return 0;
        }
        if (!in) {
            LOG_ERROR << "Ошибка ввода. Завершение работы.";
            return 1;
        }

        const auto parsedData = parseInput(std::move(input));
        if (!parsedData.has_value()) {
            continue;
        }
        const auto &[command, args] = *parsedData;

        if (processor.execute(command, args, out) == CommandResult::EXIT) {
            out << "Выход из интерактивного режима\n";
            return 0;
        }
    }
    UNREACHABLE("Exit from the loop can only be done manually");
}
} // namespace ident::cli
