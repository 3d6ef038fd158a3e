#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>

#include "services/random_generator.hpp"

namespace ident {
// Наибольшее значение 14-битной последовательности часов
static constexpr uint16_t MAX_CLOCK_SEQUENCE = 0x3FFF;

/**
 * @class ClockSequenceService
 * @brief Источник последовательности часов для UUID версий 1, 2 и 6
 */
class ClockSequenceService {
public:
    virtual ~ClockSequenceService() = default;

    // Очередное 14-битное значение
    virtual uint16_t next() = 0;
};

/**
 * @class RandomClockSequenceService
 * @brief Случайная последовательность часов, не повторяющая предыдущее значение
 *
 * Последнее выданное значение принадлежит экземпляру и защищено мьютексом:
 * при совместном использовании из нескольких потоков два подряд выданных
 * значения всегда различаются.
 */
class RandomClockSequenceService : public ClockSequenceService {
public:
    explicit RandomClockSequenceService(std::shared_ptr<RandomGenerator> randomGenerator);

    /**
     * @brief Очередное случайное значение, отличное от предыдущего
     * @throw RandomSourceNotFound, если источник случайности недоступен
     */
    uint16_t next() override;

private:
    std::shared_ptr<RandomGenerator> randomGenerator_;

    std::mutex mutex_;
    std::optional<uint16_t> last_;
};

/**
 * @class StaticClockSequenceService
 * @brief Заранее заданная последовательность часов
 */
class StaticClockSequenceService : public ClockSequenceService {
public:
    /**
     * @param clockSequence Значение в диапазоне [0, 0x3fff]
     * @throw InvalidArgument, если значение не помещается в 14 бит
     */
    explicit StaticClockSequenceService(uint32_t clockSequence);

    uint16_t next() override;

private:
    const uint16_t clockSequence_;
};
} // namespace ident
