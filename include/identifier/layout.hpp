#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace ident {
// Каноническое представление идентификатора: 16 байт в порядке RFC (big-endian)
using Bytes = std::array<uint8_t, 16>;

static constexpr size_t BYTES_LENGTH = 16;
static constexpr size_t HEX_LENGTH = 32;
static constexpr size_t STRING_LENGTH = 36;

// Позиции дефисов в строковом представлении 8-4-4-4-12
static constexpr std::array<size_t, 4> DASH_POSITIONS = { 8, 13, 18, 23 };

// Префикс URN-представления
static constexpr char URN_PREFIX[] = "urn:uuid:";

/**
 * @enum Variant
 * @brief Вариант UUID, определяемый старшими битами байта 8
 */
enum class Variant {
    RESERVED_NCS, // 0xxx: обратная совместимость с NCS
    RFC_4122, // 10xx: раскладка RFC 4122 / RFC 9562
    RESERVED_MICROSOFT, // 110x: обратная совместимость с Microsoft
    RESERVED_FUTURE, // 111x: зарезервировано
};

/**
 * @enum Version
 * @brief Версия UUID (старший полубайт байта 6)
 */
enum class Version : uint8_t {
    GREGORIAN_TIME = 1,
    DCE_SECURITY = 2,
    NAME_BASED_MD5 = 3,
    RANDOM = 4,
    NAME_BASED_SHA1 = 5,
    REORDERED_GREGORIAN_TIME = 6,
    UNIX_TIME = 7,
    CUSTOM = 8,
};

/**
 * @enum Format
 * @brief Взаимозаменяемые представления одного и того же идентификатора
 */
enum class Format {
    STRING, // xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx
    HEXADECIMAL, // 32 шестнадцатеричных символа без разделителей
    BYTES, // 16 байт
    INTEGER, // беззнаковое десятичное 128-битное число
};

/**
 * @enum DceDomain
 * @brief Локальный домен DCE Security (UUID версии 2)
 */
enum class DceDomain : uint8_t {
    PERSON = 0,
    GROUP = 1,
    ORG = 2,
};

/**
 * @enum Kind
 * @brief Тип, которым было объявлено значение при создании
 *
 * Для версионных типов соответствие проверяется по битам варианта и версии,
 * для Nil/Max - точным сравнением всех 128 бит.
 */
enum class Kind : uint8_t {
    NIL,
    MAX,
    V1,
    V2,
    V3,
    V4,
    V5,
    V6,
    V7,
    V8,
    MICROSOFT_GUID,
};

/**
 * @enum TimestampEncoding
 * @brief Способ размещения временной метки внутри 16 байт
 */
enum class TimestampEncoding {
    NONE,
    GREGORIAN_LOW_MID_HIGH, // v1: time_low | time_mid | time_hi
    GREGORIAN_DCE_MID_HIGH, // v2: младшие 32 бита заменены локальным идентификатором
    GREGORIAN_HIGH_MID_LOW, // v6: 60 бит подряд от старших к младшим
    UNIX_MILLISECONDS, // v7: 48 бит миллисекунд от эпохи Unix
};

/**
 * @struct VersionLayout
 * @brief Описание раскладки полей для конкретной версии
 */
struct VersionLayout {
    Version version;
    const char *name;
    TimestampEncoding timestamp;
    uint8_t clockSequenceBits; // 0, 6 (DCE) или 14
    bool hasNode;
    bool hasDceFields;
    bool hasCustomFields;
};

/**
 * @struct FormatLayout
 * @brief Смещения служебных полей внутри конкретного представления
 *
 * Для текстовых форматов смещения указывают на шестнадцатеричный символ,
 * для бинарного - на байт.
 */
struct FormatLayout {
    Format format;
    size_t length;
    size_t versionOffset;
    size_t variantOffset;
    size_t domainOffset;
};

/**
 * @brief Раскладка полей для версии
 * @param version Версия UUID
 * @return Ссылка на статическое описание раскладки
 */
const VersionLayout &layoutFor(Version version);

/**
 * @brief Раскладка по значению полубайта версии
 * @param nibble Значение старшего полубайта байта 6
 * @return Описание раскладки или std::nullopt, если версия не определена стандартом
 */
std::optional<VersionLayout> layoutForNibble(uint8_t nibble);

/**
 * @brief Смещения служебных полей для текстового или бинарного формата
 *
 * Для Format::INTEGER смещения не определены, возвращается std::nullopt.
 */
std::optional<FormatLayout> formatLayoutFor(Format format);

// Версия, которую несёт тип; для NIL, MAX и MICROSOFT_GUID - std::nullopt
std::optional<Version> versionForKind(Kind kind);

// Версионный тип для версии
Kind kindForVersion(Version version);

std::string variantToString(Variant variant);
std::string formatToString(Format format);
std::string kindToString(Kind kind);

/**
 * @brief Разбор имени формата из командной строки ("string", "hex", "bytes", "integer")
 */
std::optional<Format> parseFormatName(const std::string &name);
} // namespace ident
