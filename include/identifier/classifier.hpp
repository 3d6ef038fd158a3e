#pragma once

#include <optional>
#include <string_view>

#include "identifier/layout.hpp"

namespace ident {
/**
 * @brief Определение варианта по старшим битам байта 8
 *
 * Проверки выполняются в порядке 111x, 110x, 10xx; всё остальное - NCS.
 */
Variant variantOf(const Bytes &bytes);

// Значение старшего полубайта байта 6
uint8_t versionOf(const Bytes &bytes);

// Вариант RFC 4122 и полубайт версии равен ожидаемому
bool isValidFor(const Bytes &bytes, Version expected);

bool isNil(const Bytes &bytes);
bool isMax(const Bytes &bytes);

/**
 * @brief Проверяет, что байты являются корректным значением указанного типа
 *
 * Nil и Max проверяются точным сравнением всех бит, версионные типы - по
 * варианту и версии. Для MICROSOFT_GUID байты должны быть в порядке RFC,
 * допускаются варианты RFC 4122 и Microsoft с версией 1..8.
 */
bool isValidForKind(const Bytes &bytes, Kind kind);

/**
 * @brief Тип, к которому относится значение, без заранее известного ожидания
 *
 * Nil/Max, затем RFC-вариант с версией 1..8, затем вариант Microsoft.
 * @return Тип или std::nullopt, если байты не подходят ни одному типу
 */
std::optional<Kind> classify(const Bytes &bytes);

/**
 * @brief Определение варианта прямо по представлению без полного разбора
 *
 * Читается один шестнадцатеричный символ (строка, hex) или байт (bytes)
 * по смещению из FormatLayout.
 * @return Вариант или std::nullopt, если формат некорректен
 */
std::optional<Variant> variantOf(std::string_view input, Format format);

/**
 * @brief Определение полубайта версии прямо по представлению без полного разбора
 * @return Полубайт версии или std::nullopt, если формат некорректен
 */
std::optional<uint8_t> versionOf(std::string_view input, Format format);
} // namespace ident
