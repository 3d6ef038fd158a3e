#pragma once

#include <stdexcept>
#include <string>

namespace ident {
/**
 * @class InvalidArgument
 * @brief Некорректное представление или несоответствие версии/варианта
 *
 * С точки зрения вызывающего кода оба случая означают одно: переданное
 * значение не является корректным идентификатором запрошенного типа.
 */
class InvalidArgument : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/**
 * @class NotComparable
 * @brief Операнд сравнения не имеет канонического байтового представления
 */
class NotComparable : public std::invalid_argument {
public:
    explicit NotComparable(const std::string &typeName)
        : std::invalid_argument("Сравнение со значениями типа \"" + typeName
                                + "\" не поддерживается")
        , typeName_(typeName)
    {
    }

    // Имя типа операнда, вызвавшего ошибку
    const std::string &typeName() const { return typeName_; }

private:
    std::string typeName_;
};

/**
 * @class BadMethodCall
 * @brief Ошибка программиста: операция не определена для данного значения
 *
 * Например, запрос версии у Nil/Max UUID или запрос узла у UUID версии 4.
 */
class BadMethodCall : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

// Ошибки внешних сервисов, поставляющих данные для генерации

class NodeNotFound : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class DceIdentifierNotFound : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class RandomSourceNotFound : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};
} // namespace ident
