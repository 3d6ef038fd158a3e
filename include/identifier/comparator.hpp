#pragma once

#include <any>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

#include "identifier/codec.hpp"
#include "identifier/layout.hpp"

namespace ident {
class Uuid;

/**
 * @class BinaryIdentifier
 * @brief Внешний идентификатор, предоставляющий 16 байт
 *
 * Любой тип, реализующий этот интерфейс, может участвовать в сравнении с UUID
 * (например, ULID или идентификатор из другой библиотеки).
 */
class BinaryIdentifier {
public:
    virtual ~BinaryIdentifier() = default;

    /**
     * @brief Бинарное представление идентификатора
     * @return 16 байт в порядке RFC или в раскладке Microsoft (см. usesVendorLayout())
     */
    virtual Bytes toBytes() const = 0;

    /**
     * @brief Хранятся ли байты в смешанной раскладке Microsoft GUID
     */
    virtual bool usesVendorLayout() const { return false; }
};

/**
 * @class Operand
 * @brief Операнд сравнения
 *
 * Неявно создаётся из UUID, BinaryIdentifier, строк и целых чисел, так что
 * uuid.compareTo("...") и compare(uuid, 42) записываются напрямую. Значения
 * null и bool поддерживаются ради совместимости со старыми правилами
 * сравнения и всегда меньше любого идентификатора.
 */
class Operand {
public:
    /**
     * @enum Type
     * @brief Категория операнда
     */
    enum class Type {
        NONE, // отсутствующее значение (nullptr)
        BOOLEAN,
        IDENTIFIER, // UUID, BinaryIdentifier или целое число
        TEXT, // строка, распознанная или нет как представление UUID
        UNSUPPORTED, // тип без канонического байтового представления
    };

    Operand(std::nullptr_t);
    Operand(bool value);
    Operand(const Uuid &uuid);
    Operand(const BinaryIdentifier &identifier);
    Operand(const char *text);
    Operand(const std::string &text);
    Operand(std::string_view text);
    Operand(const UInt128 &value);

    /**
     * @brief Целые числа сравниваются как целочисленное представление UUID
     *
     * Отрицательные значения не имеют такого представления и дают
     * неподдерживаемый операнд.
     */
    template <typename T,
              std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>, int> = 0>
    Operand(T value)
        : Operand(fromIntegral(isNegative(value), static_cast<unsigned long long>(value)))
    {
    }

    /**
     * @brief Операнд из десятичной записи 128-битного числа
     * @throw InvalidArgument, если запись некорректна или вне диапазона
     */
    static Operand integer(std::string_view decimal);

    /**
     * @brief Операнд типа, не имеющего канонического представления
     * @param typeName Имя типа для сообщения об ошибке
     */
    static Operand unsupported(std::string typeName);

    /**
     * @brief Операнд из значения, тип которого известен только во время выполнения
     *
     * Распознаются пустой std::any, nullptr, bool, строки, целые числа, UInt128 и
     * Uuid; всё остальное - неподдерживаемый операнд с именем типа.
     */
    static Operand fromAny(const std::any &value);

    Type type() const;

    // Канонические байты (для идентификаторов и распознанных представлений)
    const std::optional<Bytes> &bytes() const;

    /**
     * @brief Ключ для лексического сравнения
     *
     * Для распознанных операндов - строковое представление, для прочих строк -
     * сама строка, для неподдерживаемых - имя типа.
     */
    std::string sortKey() const;

    bool booleanValue() const;

    /**
     * @brief Имя типа операнда (для сообщений об ошибках)
     */
    const std::string &typeName() const;

private:
    Operand(Type type, std::optional<Bytes> bytes, std::string text, bool boolean);

    static Operand fromIntegral(bool negative, unsigned long long magnitude);

    template <typename T> static constexpr bool isNegative(T value)
    {
        if constexpr (std::is_signed_v<T>) {
            return value < 0;
        }
        else {
            return false;
        }
    }

    Type type_;
    std::optional<Bytes> bytes_;
    std::string text_; // исходная строка или имя неподдерживаемого типа
    bool boolean_;
};

/**
 * @brief Сравнение двух операндов
 *
 * Идентификаторы и распознанные представления сравниваются как беззнаковые
 * big-endian 16 байт. Нераспознанные строки сравниваются лексически без учёта
 * регистра со строковым представлением другого операнда. null < false < true <
 * любой идентификатор или строка.
 *
 * @return Отрицательное число, 0 или положительное число
 * @throw NotComparable, если один из операндов не поддерживается
 */
int compare(const Operand &left, const Operand &right);

/**
 * @brief Равенство операндов
 *
 * В отличие от compare() не бросает NotComparable: неподдерживаемый операнд
 * не равен ничему.
 */
bool equals(const Operand &left, const Operand &right);
} // namespace ident
