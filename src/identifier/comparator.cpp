#include "identifier/comparator.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>

#include <boost/core/demangle.hpp>

#include "identifier/byte_swap.hpp"
#include "identifier/errors.hpp"
#include "identifier/uuid.hpp"
#include "utils/logger.hpp"

namespace {
/**
 * Порядок категорий: null < false < true < идентификаторы и строки.
 * Неподдерживаемые операнды до сравнения категорий не доходят.
 */
int rankOf(const ident::Operand &operand)
{
    switch (operand.type()) {
    case ident::Operand::Type::NONE:
        return 0;
    case ident::Operand::Type::BOOLEAN:
        return operand.booleanValue() ? 2 : 1;
    default:
        return 3;
    }
}

int sign(int value)
{
    return (value > 0) - (value < 0);
}

// Лексическое сравнение без учёта регистра (аналог strcasecmp)
int compareCaseInsensitive(const std::string &left, const std::string &right)
{
    const auto length = std::min(left.size(), right.size());
    for (size_t i = 0; i < length; i++) {
        const auto l = std::tolower(static_cast<unsigned char>(left[i]));
        const auto r = std::tolower(static_cast<unsigned char>(right[i]));
        if (l != r) {
            return l < r ? -1 : 1;
        }
    }
    if (left.size() == right.size()) {
        return 0;
    }
    return left.size() < right.size() ? -1 : 1;
}

// Текст распознаётся как строковое, шестнадцатеричное или байтовое представление
std::optional<ident::Bytes> recognize(std::string_view text)
{
    return ident::codec::tryParse(text);
}

template <typename T> bool holds(const std::any &value)
{
    return value.type() == typeid(T);
}
} // namespace

namespace ident {
Operand::Operand(Type type, std::optional<Bytes> bytes, std::string text, bool boolean)
    : type_(type)
    , bytes_(std::move(bytes))
    , text_(std::move(text))
    , boolean_(boolean)
{
}

Operand::Operand(std::nullptr_t)
    : Operand(Type::NONE, std::nullopt, "null", false)
{
}

Operand::Operand(bool value)
    : Operand(Type::BOOLEAN, std::nullopt, "bool", value)
{
}

Operand::Operand(const Uuid &uuid)
    : Operand(Type::IDENTIFIER, uuid.canonicalBytes(), "ident::Uuid", false)
{
}

Operand::Operand(const BinaryIdentifier &identifier)
    : Operand(Type::IDENTIFIER,
              identifier.usesVendorLayout() ? toRfcLayout(identifier.toBytes())
                                            : identifier.toBytes(),
              boost::core::demangle(typeid(identifier).name()), false)
{
}

Operand::Operand(const char *text)
    : Operand(text == nullptr ? Operand(nullptr) : Operand(std::string_view(text)))
{
}

Operand::Operand(const std::string &text)
    : Operand(std::string_view(text))
{
}

Operand::Operand(std::string_view text)
    : Operand(Type::TEXT, recognize(text), std::string(text), false)
{
}

Operand::Operand(const UInt128 &value)
    : Operand(Type::IDENTIFIER, codec::fromInteger(value), "integer", false)
{
}

Operand Operand::integer(std::string_view decimal)
{
    return Operand(Type::IDENTIFIER, codec::parse(decimal, Format::INTEGER), "integer", false);
}

Operand Operand::unsupported(std::string typeName)
{
    return Operand(Type::UNSUPPORTED, std::nullopt, std::move(typeName), false);
}

Operand Operand::fromIntegral(bool negative, unsigned long long magnitude)
{
    if (negative) {
        return unsupported("negative integer");
    }
    return Operand(UInt128(magnitude));
}

Operand Operand::fromAny(const std::any &value)
{
    if (!value.has_value() || holds<std::nullptr_t>(value)) {
        return Operand(nullptr);
    }
    if (holds<bool>(value)) {
        return Operand(std::any_cast<bool>(value));
    }
    if (holds<std::string>(value)) {
        return Operand(std::any_cast<const std::string &>(value));
    }
    if (holds<std::string_view>(value)) {
        return Operand(std::any_cast<std::string_view>(value));
    }
    if (holds<const char *>(value)) {
        return Operand(std::any_cast<const char *>(value));
    }
    if (holds<Uuid>(value)) {
        return Operand(std::any_cast<const Uuid &>(value));
    }
    if (holds<UInt128>(value)) {
        return Operand(std::any_cast<const UInt128 &>(value));
    }
    if (holds<int>(value)) {
        return Operand(std::any_cast<int>(value));
    }
    if (holds<long>(value)) {
        return Operand(std::any_cast<long>(value));
    }
    if (holds<long long>(value)) {
        return Operand(std::any_cast<long long>(value));
    }
    if (holds<unsigned>(value)) {
        return Operand(std::any_cast<unsigned>(value));
    }
    if (holds<unsigned long>(value)) {
        return Operand(std::any_cast<unsigned long>(value));
    }
    if (holds<unsigned long long>(value)) {
        return Operand(std::any_cast<unsigned long long>(value));
    }
    return unsupported(boost::core::demangle(value.type().name()));
}

Operand::Type Operand::type() const
{
    return type_;
}

const std::optional<Bytes> &Operand::bytes() const
{
    return bytes_;
}

std::string Operand::sortKey() const
{
    if (bytes_.has_value()) {
        return codec::render(*bytes_, Format::STRING);
    }
    return text_;
}

bool Operand::booleanValue() const
{
    return boolean_;
}

const std::string &Operand::typeName() const
{
    return text_;
}

int compare(const Operand &left, const Operand &right)
{
    for (const auto *operand : { &left, &right }) {
        if (operand->type() == Operand::Type::UNSUPPORTED) {
            LOG_DEBUG << "Попытка сравнения с неподдерживаемым типом " << operand->typeName();
            throw NotComparable(operand->typeName());
        }
    }

    const auto leftRank = rankOf(left);
    const auto rightRank = rankOf(right);
    if (leftRank != rightRank) {
        return leftRank < rightRank ? -1 : 1;
    }
    if (leftRank < 3) {
        return 0;
    }

    // Оба операнда приведены к каноническим байтам
    if (left.bytes().has_value() && right.bytes().has_value()) {
        return sign(std::memcmp(left.bytes()->data(), right.bytes()->data(), BYTES_LENGTH));
    }

    // Строковое представление в нижнем регистре упорядочено так же, как байты,
    // поэтому смешанное сравнение остаётся согласованным
    return compareCaseInsensitive(left.sortKey(), right.sortKey());
}

bool equals(const Operand &left, const Operand &right)
{
    try {
        return compare(left, right) == 0;
    }
    catch (const NotComparable &e) {
        LOG_TRACE << "equals: " << e.what();
        return false;
    }
}
} // namespace ident
