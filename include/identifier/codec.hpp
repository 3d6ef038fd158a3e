#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <boost/multiprecision/cpp_int.hpp>

#include "identifier/layout.hpp"

namespace ident {
// Беззнаковое 128-битное число для целочисленного представления
using UInt128 = boost::multiprecision::uint128_t;
} // namespace ident

namespace ident::codec {
/**
 * @brief Определяет формат представления по его длине
 *
 * 36 символов - строка, 32 - шестнадцатеричное представление, 16 - байты.
 * Целочисленный формат никогда не определяется автоматически.
 *
 * @param input Проверяемое представление
 * @return Формат или std::nullopt, если длина не подходит ни одному формату
 */
std::optional<Format> detectFormat(std::string_view input);

/**
 * @brief Проверяет, что представление корректно как формат (без проверки версии/варианта)
 * @param input Представление
 * @param format Ожидаемый формат
 * @return true, если длина, символы и позиции дефисов корректны
 */
bool hasValidFormat(std::string_view input, Format format);

/**
 * @brief Преобразует представление в канонические байты
 * @param input Представление в указанном формате
 * @param format Формат представления
 * @return Канонические 16 байт
 * @throw InvalidArgument при некорректном представлении
 */
Bytes parse(std::string_view input, Format format);

/**
 * @brief Вариант parse(), не бросающий исключений
 * @return Канонические байты или std::nullopt
 */
std::optional<Bytes> tryParse(std::string_view input, Format format);

/**
 * @brief Разбор с автоматическим определением формата (строка, hex или байты)
 * @return Канонические байты или std::nullopt
 */
std::optional<Bytes> tryParse(std::string_view input);

/**
 * @brief Канонические байты из 128-битного числа (старший байт первым)
 */
Bytes fromInteger(const UInt128 &value);

/**
 * @brief Беззнаковое big-endian прочтение канонических байт
 */
UInt128 toInteger(const Bytes &bytes);

/**
 * @brief Формирует представление в указанном формате
 *
 * Строковое и шестнадцатеричное представления всегда в нижнем регистре,
 * целочисленное - без ведущих нулей, байтовое - 16 сырых байт в std::string.
 */
std::string render(const Bytes &bytes, Format format);

// "urn:uuid:" + строковое представление
std::string renderUrn(const Bytes &bytes);

/**
 * @brief Шестнадцатеричная запись произвольного диапазона байт в нижнем регистре
 */
std::string toHex(const uint8_t *data, size_t size);

/**
 * @brief Значение шестнадцатеричной цифры
 * @return 0..15 или -1 для символа, не являющегося шестнадцатеричной цифрой
 */
int hexDigitValue(char symbol);

/**
 * @brief Безопасная для вывода в лог и сообщения об ошибках запись входных данных
 *
 * Печатаемые ASCII-строки возвращаются как есть, остальные записываются
 * побайтно в виде \xNN.
 */
std::string printable(std::string_view input);
} // namespace ident::codec
