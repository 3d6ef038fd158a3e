#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <random>
#include <vector>

#include "identifier/layout.hpp"

namespace ident {
/**
 * @class RandomGenerator
 * @brief Источник случайных байт
 */
class RandomGenerator {
public:
    virtual ~RandomGenerator() = default;

    /**
     * @brief Генерирует указанное количество случайных байт
     * @throw RandomSourceNotFound, если источник случайности недоступен
     */
    virtual std::vector<uint8_t> bytes(size_t count) = 0;

    // 16 случайных байт
    Bytes randomBytes();

    /**
     * @brief Случайное число в диапазоне [0, max]
     * @throw RandomSourceNotFound, если источник случайности недоступен
     */
    uint64_t uniform(uint64_t max);
};

/**
 * @class MersenneRandomGenerator
 * @brief Генератор на основе std::mt19937_64, инициализированный из std::random_device
 *
 * Доступ к внутреннему состоянию генератора синхронизирован, поэтому один
 * экземпляр можно разделять между потоками.
 */
class MersenneRandomGenerator : public RandomGenerator {
public:
    /**
     * @brief Инициализирует генератор
     * @throw RandomSourceNotFound, если std::random_device недоступен
     */
    MersenneRandomGenerator();

    // Детерминированный генератор с заданным зерном
    explicit MersenneRandomGenerator(uint64_t seed);

    std::vector<uint8_t> bytes(size_t count) override;

private:
    std::mutex mutex_;
    std::mt19937_64 rng_;
};
} // namespace ident
