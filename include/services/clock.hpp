#pragma once

#include "identifier/fields.hpp"

namespace ident {
/**
 * @class ClockService
 * @brief Источник текущих даты и времени для генерации UUID
 */
class ClockService {
public:
    virtual ~ClockService() = default;

    // Текущие дата и время UTC
    virtual DateTime now() = 0;
};

/**
 * @class SystemClock
 * @brief Системные часы с точностью до микросекунды
 */
class SystemClock : public ClockService {
public:
    DateTime now() override;
};

/**
 * @class FrozenClock
 * @brief Часы, всегда возвращающие одно и то же значение (для тестов и CLI)
 */
class FrozenClock : public ClockService {
public:
    explicit FrozenClock(const DateTime &dateTime);

    DateTime now() override;

private:
    const DateTime dateTime_;
};
} // namespace ident
