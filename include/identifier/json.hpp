#pragma once

#include <nlohmann/json.hpp>

#include "identifier/comparator.hpp"
#include "identifier/errors.hpp"
#include "identifier/uuid.hpp"

namespace ident {
// Значение записывается строковым представлением
inline void to_json(nlohmann::json &json, const Uuid &uuid)
{
    json = uuid.toString();
}

/**
 * @brief Чтение значения из JSON-строки в строковом или шестнадцатеричном формате
 *
 * Тип определяется по битам, как в Uuid::parseAny().
 * @throw InvalidArgument, если значение не строка или не является UUID
 */
inline void from_json(const nlohmann::json &json, Uuid &uuid)
{
    if (!json.is_string()) {
        throw InvalidArgument(std::string("Ожидалась строка с UUID, получено значение типа \"")
                              + json.type_name() + "\"");
    }
    uuid = Uuid::parseAny(json.get_ref<const std::string &>());
}

/**
 * @brief Операнд сравнения из значения JSON
 *
 * null, bool, строки и неотрицательные целые поддерживаются; массивы, объекты,
 * числа с плавающей точкой, отрицательные целые и бинарные значения дают
 * неподдерживаемый операнд.
 */
inline Operand operandFromJson(const nlohmann::json &json)
{
    switch (json.type()) {
    case nlohmann::json::value_t::null:
        return Operand(nullptr);
    case nlohmann::json::value_t::boolean:
        return Operand(json.get<bool>());
    case nlohmann::json::value_t::string:
        return Operand(json.get_ref<const std::string &>());
    case nlohmann::json::value_t::number_unsigned:
        return Operand(json.get<uint64_t>());
    case nlohmann::json::value_t::number_integer: {
        // Положительные значения, заданные из C++ как int, тоже попадают сюда
        const auto value = json.get<int64_t>();
        if (value < 0) {
            return Operand::unsupported("integer");
        }
        return Operand(static_cast<uint64_t>(value));
    }
    case nlohmann::json::value_t::number_float:
        return Operand::unsupported("float");
    case nlohmann::json::value_t::array:
        return Operand::unsupported("array");
    case nlohmann::json::value_t::object:
        return Operand::unsupported("object");
    case nlohmann::json::value_t::binary:
        return Operand::unsupported("binary");
    case nlohmann::json::value_t::discarded:
        break;
    }
    return Operand::unsupported(json.type_name());
}
} // namespace ident
