#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include "identifier/codec.hpp"
#include "identifier/comparator.hpp"
#include "identifier/fields.hpp"
#include "identifier/layout.hpp"

namespace ident {
/**
 * @class Uuid
 * @brief Неизменяемый 128-битный идентификатор семейства UUID
 *
 * Хранит канонические байты в порядке RFC и тип (Kind), которым значение было
 * объявлено при создании. Вариант, версия и поля версии вычисляются из байт по
 * требованию. Для Microsoft GUID бинарное представление (toBytes()) использует
 * смешанную раскладку, а строковое, шестнадцатеричное и целочисленное - порядок RFC.
 */
class Uuid {
public:
    /**
     * @brief Nil UUID
     */
    Uuid();

    /**
     * @brief Создание из строкового, шестнадцатеричного или байтового представления
     *
     * Формат определяется по длине. Байтовое представление Microsoft GUID
     * ожидается в смешанной раскладке.
     *
     * @param representation Представление значения
     * @param kind Ожидаемый тип
     * @throw InvalidArgument, если представление некорректно или не соответствует типу
     */
    Uuid(std::string_view representation, Kind kind);

    static Uuid nil();
    static Uuid max();

    /**
     * @brief Создание из представления в явно указанном формате
     * @throw InvalidArgument, если представление некорректно или не соответствует типу
     */
    static Uuid fromRepresentation(std::string_view input, Format format, Kind kind);

    static Uuid fromString(std::string_view input, Kind kind);
    static Uuid fromHexadecimal(std::string_view input, Kind kind);
    static Uuid fromBytes(std::string_view input, Kind kind);

    /**
     * @brief Создание из 16 байт
     *
     * Для MICROSOFT_GUID байты ожидаются в смешанной раскладке.
     */
    static Uuid fromBytes(const Bytes &bytes, Kind kind);

    // Создание из десятичной записи беззнакового 128-битного числа
    static Uuid fromInteger(std::string_view decimal, Kind kind);
    static Uuid fromInteger(const UInt128 &value, Kind kind);

    /**
     * @brief Создание из канонических байт (порядок RFC для любого типа)
     * @throw InvalidArgument, если байты не соответствуют типу
     */
    static Uuid fromCanonicalBytes(const Bytes &bytes, Kind kind);

    /**
     * @brief Вариант конструирования, не бросающий исключений
     * @return Значение или std::nullopt, если представление некорректно или не соответствует типу
     */
    static std::optional<Uuid> tryParse(std::string_view input, Format format, Kind kind);

    /**
     * @brief Разбор представления без заранее известного типа
     *
     * Формат определяется по длине, тип - по битам (Nil/Max, затем версии 1..8
     * варианта RFC, затем вариант Microsoft). Байтовое представление всегда
     * читается в порядке RFC.
     *
     * @throw InvalidArgument, если представление некорректно или не относится ни к одному типу
     */
    static Uuid parseAny(std::string_view input);

    // Вариант parseAny(), не бросающий исключений
    static std::optional<Uuid> tryParseAny(std::string_view input);

    Kind kind() const;
    Variant variant() const;

    /**
     * @brief Версия UUID
     * @throw BadMethodCall для Nil и Max UUID
     */
    uint8_t version() const;

    // Канонические байты в порядке RFC
    const Bytes &canonicalBytes() const;

    std::string toString() const;
    std::string toHexadecimal() const;

    /**
     * @brief Бинарное представление
     *
     * Для Microsoft GUID - смешанная раскладка, для остальных - порядок RFC.
     */
    Bytes toBytes() const;

    // Бинарное представление в виде строки из 16 байт
    std::string toBytesString() const;

    // Десятичная запись без ведущих нулей
    std::string toInteger() const;
    UInt128 toUInt128() const;

    std::string toUrn() const;

    /**
     * @brief Временная метка
     *
     * 100-нс интервалы от 1582-10-15 для версий 1, 2 и 6 и миллисекунды от
     * эпохи Unix для версии 7.
     * @throw BadMethodCall, если раскладка не содержит временной метки
     */
    uint64_t timestamp() const;

    // Временная метка в виде даты и времени UTC
    DateTime dateTime() const;

    /**
     * @brief Последовательность часов (14 бит, для версии 2 - 6 бит)
     * @throw BadMethodCall, если раскладка не содержит последовательности часов
     */
    uint16_t clockSequence() const;

    /**
     * @brief Идентификатор узла в виде 12 шестнадцатеричных символов
     * @throw BadMethodCall, если раскладка не содержит узла
     */
    std::string node() const;

    // Идентификатор узла в виде 48-битного числа
    uint64_t nodeValue() const;

    /**
     * @brief Поля DCE Security (только версия 2)
     * @throw BadMethodCall для остальных версий
     */
    uint32_t localIdentifier() const;
    std::optional<DceDomain> localDomain() const;
    uint8_t localDomainValue() const;

    /**
     * @brief Пользовательские поля (только версия 8)
     * @throw BadMethodCall для остальных версий
     */
    std::string customFieldA() const;
    std::string customFieldB() const;
    std::string customFieldC() const;

    /**
     * @brief Все поля раскладки версии
     *
     * Для Nil/Max и версий без полей (3, 4, 5) возвращается пустая структура.
     */
    fields::DecodedFields decodedFields() const;

    /**
     * @brief Сравнение с произвольным операндом
     * @return Отрицательное число, 0 или положительное число
     * @throw NotComparable, если операнд не поддерживается
     */
    int compareTo(const Operand &other) const;

    // Равенство с произвольным операндом (неподдерживаемый операнд не равен)
    bool equals(const Operand &other) const;

    // Сравнение двух значений выполняется по каноническим байтам, тип не учитывается
    bool operator==(const Uuid &other) const;
    bool operator!=(const Uuid &other) const;
    bool operator<(const Uuid &other) const;
    bool operator<=(const Uuid &other) const;
    bool operator>(const Uuid &other) const;
    bool operator>=(const Uuid &other) const;

private:
    Uuid(const Bytes &bytes, Kind kind);

    // Раскладка версии для полей; для Nil/Max - std::nullopt
    std::optional<VersionLayout> fieldLayout() const;
    const VersionLayout &requireLayout(const char *field) const;

    Bytes bytes_;
    Kind kind_;
};

/**
 * @brief Записывает полубайт версии в байт 6 и биты варианта в байт 8
 *
 * Остальные биты байт 6 и 8 сохраняются в той мере, в какой их не занимают
 * служебные поля.
 */
Bytes applyVersionAndVariant(Bytes bytes, Version version, Variant variant = Variant::RFC_4122);

std::ostream &operator<<(std::ostream &os, const Uuid &uuid);
} // namespace ident

namespace std {
template <> struct hash<ident::Uuid> {
    size_t operator()(const ident::Uuid &uuid) const noexcept;
};
} // namespace std
