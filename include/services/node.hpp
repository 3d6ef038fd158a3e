#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

#include "services/random_generator.hpp"

namespace ident {
// Наибольшее значение 48-битного идентификатора узла
static constexpr uint64_t MAX_NODE = (1ULL << 48) - 1;

// Бит групповой (multicast) рассылки в первом октете MAC-адреса
static constexpr uint64_t MULTICAST_BIT = 0x010000000000ULL;

/**
 * @class NodeService
 * @brief Источник 48-битного идентификатора узла (обычно MAC-адреса)
 */
class NodeService {
public:
    virtual ~NodeService() = default;

    /**
     * @brief Идентификатор узла
     * @throw NodeNotFound, если получить значение не удалось
     */
    virtual uint64_t address() = 0;
};

/**
 * @class StaticNodeService
 * @brief Заранее заданный идентификатор узла
 */
class StaticNodeService : public NodeService {
public:
    /**
     * @param node Значение в диапазоне [0, 2^48 - 1]
     * @throw InvalidArgument, если значение не помещается в 48 бит
     */
    explicit StaticNodeService(uint64_t node);

    /**
     * @brief Разбор идентификатора узла из командной строки
     *
     * Ровно 12 шестнадцатеричных цифр (возможно, с разделителями ':' или '-')
     * читаются как MAC-адрес, любая другая строка из десятичных цифр - как
     * десятичное число.
     *
     * @throw InvalidArgument при некорректной записи
     */
    static StaticNodeService fromString(std::string_view node);

    uint64_t address() override;

private:
    const uint64_t node_;
};

/**
 * @class RandomNodeService
 * @brief Случайный идентификатор узла с установленным битом multicast
 *
 * Установленный бит multicast гарантирует, что значение не совпадёт с адресом
 * реальной сетевой карты.
 */
class RandomNodeService : public NodeService {
public:
    explicit RandomNodeService(std::shared_ptr<RandomGenerator> randomGenerator);

    uint64_t address() override;

private:
    std::shared_ptr<RandomGenerator> randomGenerator_;
};

/**
 * @class SystemNodeService
 * @brief MAC-адрес первой подходящей сетевой карты системы
 *
 * На Linux адреса читаются из /sys/class/net/<iface>/address. Нулевые и
 * широковещательные адреса пропускаются. Найденное значение кешируется.
 */
class SystemNodeService : public NodeService {
public:
    explicit SystemNodeService(std::filesystem::path netDirectory = "/sys/class/net");

    uint64_t address() override;

private:
    std::optional<uint64_t> findAddress() const;

    const std::filesystem::path netDirectory_;

    std::mutex mutex_;
    std::optional<uint64_t> cached_;
};

/**
 * @class FallbackNodeService
 * @brief Опрашивает несколько источников по порядку до первого успешного
 */
class FallbackNodeService : public NodeService {
public:
    explicit FallbackNodeService(std::vector<std::shared_ptr<NodeService>> services);

    /**
     * @throw NodeNotFound, если ни один источник не вернул значение
     */
    uint64_t address() override;

private:
    std::vector<std::shared_ptr<NodeService>> services_;
};

/**
 * @brief Разбор записи MAC-адреса ("aa:bb:cc:dd:ee:ff", "aa-bb-...", "aabbccddeeff")
 * @return 48-битное значение или std::nullopt при некорректной записи
 */
std::optional<uint64_t> parseNode(std::string_view text);
} // namespace ident
