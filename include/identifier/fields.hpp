#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <boost/date_time/posix_time/posix_time_types.hpp>

#include "identifier/layout.hpp"

namespace ident {
// Дата и время с точностью до микросекунды (UTC)
using DateTime = boost::posix_time::ptime;
} // namespace ident

namespace ident::fields {
// Количество 100-наносекундных интервалов между 1582-10-15 и 1970-01-01
static constexpr uint64_t GREGORIAN_TO_UNIX_TICKS = 0x01B21DD213814000ULL;

// Наибольшее значение 60-битной григорианской временной метки
static constexpr uint64_t MAX_GREGORIAN_TICKS = (1ULL << 60) - 1;

// Наибольшее значение 48-битной временной метки Unix в миллисекундах
static constexpr uint64_t MAX_UNIX_MILLISECONDS = (1ULL << 48) - 1;

/**
 * @brief Начало григорианской эпохи UUID: 1582-10-15 00:00:00 UTC
 */
DateTime gregorianEpoch();

/**
 * @brief Начало эпохи Unix: 1970-01-01 00:00:00 UTC
 */
DateTime unixEpoch();

/**
 * @brief Извлекает 60-битную временную метку (100-нс интервалы от григорианской эпохи)
 *
 * - v1: time_hi (12 бит) | time_mid | time_low, собирается из байт 6-7, 4-5 и 0-3;
 * - v2: как v1, но младшие 32 бита заменены локальным идентификатором и равны нулю;
 * - v6: 48 бит байт 0-5 и 12 младших бит байт 6-7, без перестановки.
 *
 * @param bytes Канонические байты
 * @param encoding Способ размещения метки (только григорианские варианты)
 * @return Количество 100-нс интервалов
 */
uint64_t gregorianTicks(const Bytes &bytes, TimestampEncoding encoding);

// Миллисекунды от эпохи Unix из байт 0-5 (v7)
uint64_t unixMilliseconds(const Bytes &bytes);

/**
 * @brief Перевод 100-нс интервалов в дату и время
 *
 * Доли меньше микросекунды отбрасываются (округление вниз).
 */
DateTime gregorianTicksToDateTime(uint64_t ticks);

/**
 * @brief Перевод миллисекунд от эпохи Unix в дату и время
 * @throw InvalidArgument, если дата позже 9999-12-31 23:59:59.999
 */
DateTime unixMillisecondsToDateTime(uint64_t milliseconds);

// Помещается ли метка в диапазон дат Boost.DateTime (до 9999 года включительно)
bool isRepresentableUnixMilliseconds(uint64_t milliseconds);

/**
 * @brief Перевод даты и времени в 100-нс интервалы от григорианской эпохи
 * @throw InvalidArgument, если дата раньше 1582-10-15 или не помещается в 60 бит
 */
uint64_t dateTimeToGregorianTicks(const DateTime &dateTime);

/**
 * @brief Перевод даты и времени в миллисекунды от эпохи Unix
 * @throw InvalidArgument, если дата раньше 1970-01-01 или не помещается в 48 бит
 */
uint64_t dateTimeToUnixMilliseconds(const DateTime &dateTime);

/**
 * @brief Запись даты и времени в виде "YYYY-MM-DD HH:MM:SS.ffffff"
 */
std::string formatDateTime(const DateTime &dateTime);

/**
 * @brief Последовательность часов
 * @param bytes Канонические байты
 * @param bits 14 (v1, v6) или 6 (v2)
 */
uint16_t clockSequence(const Bytes &bytes, uint8_t bits);

// 48-битный идентификатор узла из байт 10-15
uint64_t node(const Bytes &bytes);

// Идентификатор узла в виде 12 шестнадцатеричных символов
std::string nodeHex(const Bytes &bytes);

// Локальный идентификатор DCE из байт 0-3 (v2)
uint32_t localIdentifier(const Bytes &bytes);

// Сырое значение локального домена DCE из байта 9 (v2)
uint8_t localDomainValue(const Bytes &bytes);

// Известный домен DCE или std::nullopt
std::optional<DceDomain> toDceDomain(uint8_t value);

std::string dceDomainToString(DceDomain domain);

/**
 * @brief Пользовательские поля UUID версии 8
 *
 * A - 48 бит (байты 0-5), B - 12 бит после полубайта версии, C - 62 бита после
 * битов варианта. Смысл полей не декодируется, они возвращаются как hex.
 */
std::string customFieldA(const Bytes &bytes);
std::string customFieldB(const Bytes &bytes);
std::string customFieldC(const Bytes &bytes);

/**
 * @struct DecodedFields
 * @brief Все поля, которые несёт раскладка версии
 *
 * Заполняются только поля, определённые для версии.
 */
struct DecodedFields {
    std::optional<uint64_t> timestamp; // 100-нс интервалы или миллисекунды (v7)
    std::optional<DateTime> dateTime;
    std::optional<uint16_t> clockSequence;
    std::optional<std::string> node;
    std::optional<uint32_t> localIdentifier;
    std::optional<uint8_t> localDomain;
    std::optional<std::string> customFieldA;
    std::optional<std::string> customFieldB;
    std::optional<std::string> customFieldC;
};

/**
 * @brief Декодирует все поля версии
 * @param bytes Канонические байты
 * @param version Версия, определяющая раскладку
 */
DecodedFields decode(const Bytes &bytes, Version version);
} // namespace ident::fields
