#include "services/node.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <fstream>
#include <string>
#include <system_error>

#include "identifier/codec.hpp"
#include "identifier/errors.hpp"
#include "utils/logger.hpp"

namespace {
uint64_t checkedNode(uint64_t node)
{
    if (node > ident::MAX_NODE) {
        LOG_DEBUG << "Идентификатор узла не помещается в 48 бит: " << node;
        throw ident::InvalidArgument("Идентификатор узла должен быть в диапазоне [0, 2^48 - 1]: "
                                     + std::to_string(node));
    }
    return node;
}

std::optional<uint64_t> parseDecimal(std::string_view text)
{
    if (text.empty() || text.size() > 20
        || !std::all_of(text.begin(), text.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        return std::nullopt;
    }

    uint64_t value = 0;
    for (const auto digit : text) {
        const auto digitValue = static_cast<uint64_t>(digit - '0');
        if (value > (std::numeric_limits<uint64_t>::max() - digitValue) / 10) {
            return std::nullopt;
        }
        value = value * 10 + digitValue;
    }
    return value;
}

// Первая строка файла без завершающих пробельных символов
std::optional<std::string> readFirstLine(const std::filesystem::path &file)
{
    std::ifstream stream(file);
    if (!stream.is_open()) {
        return std::nullopt;
    }

    std::string line;
    std::getline(stream, line);
    while (!line.empty() && std::isspace(static_cast<unsigned char>(line.back()))) {
        line.pop_back();
    }
    return line;
}
} // namespace

namespace ident {
std::optional<uint64_t> parseNode(std::string_view text)
{
    std::string digits;
    digits.reserve(text.size());
    for (const auto symbol : text) {
        if (symbol == ':' || symbol == '-') {
            continue;
        }
        if (codec::hexDigitValue(symbol) < 0) {
            return std::nullopt;
        }
        digits.push_back(symbol);
    }
    if (digits.size() != 12) {
        return std::nullopt;
    }

    uint64_t value = 0;
    for (const auto symbol : digits) {
        value = (value << 4) | static_cast<uint64_t>(codec::hexDigitValue(symbol));
    }
    return value;
}

StaticNodeService::StaticNodeService(uint64_t node)
    : node_(checkedNode(node))
{
}

StaticNodeService StaticNodeService::fromString(std::string_view node)
{
    if (const auto hex = parseNode(node)) {
        return StaticNodeService(*hex);
    }
    if (const auto decimal = parseDecimal(node)) {
        return StaticNodeService(*decimal);
    }

    LOG_DEBUG << "Некорректный идентификатор узла: \"" << codec::printable(node) << "\"";
    throw InvalidArgument("Некорректный идентификатор узла: \"" + codec::printable(node) + "\"");
}

uint64_t StaticNodeService::address()
{
    return node_;
}

RandomNodeService::RandomNodeService(std::shared_ptr<RandomGenerator> randomGenerator)
    : randomGenerator_(std::move(randomGenerator))
{
    if (!randomGenerator_) {
        throw InvalidArgument("Не задан генератор случайных чисел");
    }
}

uint64_t RandomNodeService::address()
{
    const auto random = randomGenerator_->bytes(6);
    uint64_t node = 0;
    for (const auto byte : random) {
        node = (node << 8) | byte;
    }
    return (node & MAX_NODE) | MULTICAST_BIT;
}

SystemNodeService::SystemNodeService(std::filesystem::path netDirectory)
    : netDirectory_(std::move(netDirectory))
{
}

uint64_t SystemNodeService::address()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!cached_.has_value()) {
        cached_ = findAddress();
    }
    if (!cached_.has_value()) {
        throw NodeNotFound("Не удалось получить MAC-адрес из " + netDirectory_.string());
    }
    return *cached_;
}

std::optional<uint64_t> SystemNodeService::findAddress() const
{
    std::error_code ec;
    if (!std::filesystem::is_directory(netDirectory_, ec)) {
        LOG_DEBUG << "Директория сетевых интерфейсов недоступна: " << netDirectory_.string();
        return std::nullopt;
    }

    // Порядок обхода директории не определён, сортируем для воспроизводимости
    std::vector<std::filesystem::path> interfaces;
    try {
        for (const auto &entry : std::filesystem::directory_iterator(netDirectory_)) {
            interfaces.push_back(entry.path());
        }
    }
    catch (const std::filesystem::filesystem_error &e) {
        LOG_DEBUG << "Ошибка при обходе " << netDirectory_.string() << ": " << e.what();
        return std::nullopt;
    }
    std::sort(interfaces.begin(), interfaces.end());

    for (const auto &iface : interfaces) {
        const auto line = readFirstLine(iface / "address");
        if (!line.has_value()) {
            continue;
        }
        const auto node = parseNode(*line);
        if (!node.has_value() || *node == 0 || *node == MAX_NODE) {
            LOG_TRACE << "Интерфейс " << iface.filename().string() << " пропущен";
            continue;
        }
        LOG_DEBUG << "Используется MAC-адрес интерфейса " << iface.filename().string();
        return node;
    }
    return std::nullopt;
}

FallbackNodeService::FallbackNodeService(std::vector<std::shared_ptr<NodeService>> services)
    : services_(std::move(services))
{
}

uint64_t FallbackNodeService::address()
{
    for (const auto &service : services_) {
        try {
            return service->address();
        }
        catch (const NodeNotFound &e) {
            LOG_DEBUG << "Источник идентификатора узла недоступен: " << e.what();
        }
    }
    throw NodeNotFound("Ни один источник не вернул идентификатор узла");
}
} // namespace ident
