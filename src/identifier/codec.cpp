#include "identifier/codec.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <vector>

#include "identifier/errors.hpp"
#include "utils/compiler.hpp"
#include "utils/logger.hpp"

namespace {
constexpr char HEX_DIGITS[] = "0123456789abcdef";

// Максимальное количество десятичных цифр в 2^128 - 1
constexpr size_t MAX_DECIMAL_DIGITS = 39;

bool isDashPosition(size_t index)
{
    return std::find(ident::DASH_POSITIONS.begin(), ident::DASH_POSITIONS.end(), index)
        != ident::DASH_POSITIONS.end();
}

bool isValidStringLayout(std::string_view input)
{
    if (input.size() != ident::STRING_LENGTH) {
        return false;
    }

    for (size_t i = 0; i < input.size(); i++) {
        if (isDashPosition(i)) {
            if (input[i] != '-') {
                return false;
            }
        }
        else if (ident::codec::hexDigitValue(input[i]) < 0) {
            return false;
        }
    }
    return true;
}

bool isValidHexLayout(std::string_view input)
{
    return input.size() == ident::HEX_LENGTH
        && std::all_of(input.begin(), input.end(),
                       [](char c) { return ident::codec::hexDigitValue(c) >= 0; });
}

bool isValidDecimal(std::string_view input)
{
    return !input.empty()
        && std::all_of(input.begin(), input.end(), [](char c) { return c >= '0' && c <= '9'; });
}

// Перевод 32 шестнадцатеричных цифр (дефисы уже пропущены) в байты
ident::Bytes hexDigitsToBytes(std::string_view input)
{
    ident::Bytes bytes{};
    size_t nibble = 0;
    for (const auto symbol : input) {
        if (symbol == '-') {
            continue;
        }
        const auto value = static_cast<uint8_t>(ident::codec::hexDigitValue(symbol));
        auto &target = bytes[nibble / 2];
        target = (nibble % 2 == 0) ? static_cast<uint8_t>(value << 4)
                                   : static_cast<uint8_t>(target | value);
        nibble++;
    }
    return bytes;
}

ident::Bytes decimalToBytes(std::string_view input)
{
    // Ведущие нули не влияют на значение
    const auto firstSignificant = input.find_first_not_of('0');
    const auto digits
        = firstSignificant == std::string_view::npos ? std::string_view{} : input.substr(firstSignificant);
    if (digits.size() > MAX_DECIMAL_DIGITS) {
        throw ident::InvalidArgument("Целое число вне диапазона [0, 2^128 - 1]: \""
                                     + std::string(input) + "\"");
    }

    // checked_uint128_t бросает std::overflow_error при выходе за 128 бит
    boost::multiprecision::checked_uint128_t value = 0;
    try {
        for (const auto digit : digits) {
            value = value * 10u + static_cast<unsigned>(digit - '0');
        }
    }
    catch (const std::overflow_error &) {
        throw ident::InvalidArgument("Целое число вне диапазона [0, 2^128 - 1]: \""
                                     + std::string(input) + "\"");
    }

    return ident::codec::fromInteger(static_cast<ident::UInt128>(value));
}
} // namespace

namespace ident::codec {
int hexDigitValue(char symbol)
{
    if (symbol >= '0' && symbol <= '9') {
        return symbol - '0';
    }
    if (symbol >= 'a' && symbol <= 'f') {
        return symbol - 'a' + 10;
    }
    if (symbol >= 'A' && symbol <= 'F') {
        return symbol - 'A' + 10;
    }
    return -1;
}

std::optional<Format> detectFormat(std::string_view input)
{
    switch (input.size()) {
    case STRING_LENGTH:
        return Format::STRING;
    case HEX_LENGTH:
        return Format::HEXADECIMAL;
    case BYTES_LENGTH:
        return Format::BYTES;
    default:
        return std::nullopt;
    }
}

bool hasValidFormat(std::string_view input, Format format)
{
    switch (format) {
    case Format::STRING:
        return isValidStringLayout(input);
    case Format::HEXADECIMAL:
        return isValidHexLayout(input);
    case Format::BYTES:
        // Любые 16 байт корректны как формат, содержимое проверяется классификатором
        return input.size() == BYTES_LENGTH;
    case Format::INTEGER:
        return isValidDecimal(input);
    }
    UNREACHABLE("Unsupported Format");
}

Bytes parse(std::string_view input, Format format)
{
    if (!hasValidFormat(input, format)) {
        LOG_DEBUG << "Некорректное представление формата " << formatToString(format) << ": \""
                  << printable(input) << "\"";
        throw InvalidArgument("Некорректное представление формата " + formatToString(format)
                              + ": \"" + printable(input) + "\"");
    }

    switch (format) {
    case Format::STRING:
    case Format::HEXADECIMAL:
        return hexDigitsToBytes(input);
    case Format::BYTES: {
        Bytes bytes{};
        std::transform(input.begin(), input.end(), bytes.begin(),
                       [](char c) { return static_cast<uint8_t>(c); });
        return bytes;
    }
    case Format::INTEGER:
        return decimalToBytes(input);
    }
    UNREACHABLE("Unsupported Format");
}

std::optional<Bytes> tryParse(std::string_view input, Format format)
{
    try {
        return parse(input, format);
    }
    catch (const InvalidArgument &e) {
        LOG_TRACE << "tryParse: " << e.what();
        return std::nullopt;
    }
}

std::optional<Bytes> tryParse(std::string_view input)
{
    const auto format = detectFormat(input);
    if (!format.has_value()) {
        LOG_TRACE << "Не удалось определить формат представления длины " << input.size();
        return std::nullopt;
    }
    return tryParse(input, *format);
}

Bytes fromInteger(const UInt128 &value)
{
    std::vector<uint8_t> significant;
    boost::multiprecision::export_bits(value, std::back_inserter(significant), 8);

    // Дополняем нулями слева до 16 байт
    Bytes bytes{};
    std::copy(significant.begin(), significant.end(),
              bytes.begin() + (BYTES_LENGTH - significant.size()));
    return bytes;
}

UInt128 toInteger(const Bytes &bytes)
{
    UInt128 value;
    boost::multiprecision::import_bits(value, bytes.begin(), bytes.end());
    return value;
}

std::string toHex(const uint8_t *data, size_t size)
{
    std::string result;
    result.reserve(size * 2);
    for (size_t i = 0; i < size; i++) {
        result.push_back(HEX_DIGITS[data[i] >> 4]);
        result.push_back(HEX_DIGITS[data[i] & 0x0F]);
    }
    return result;
}

std::string render(const Bytes &bytes, Format format)
{
    switch (format) {
    case Format::STRING: {
        std::string result;
        result.reserve(STRING_LENGTH);
        for (size_t i = 0; i < bytes.size(); i++) {
            // Дефисы стоят перед байтами 4, 6, 8 и 10
            if (i == 4 || i == 6 || i == 8 || i == 10) {
                result.push_back('-');
            }
            result.push_back(HEX_DIGITS[bytes[i] >> 4]);
            result.push_back(HEX_DIGITS[bytes[i] & 0x0F]);
        }
        return result;
    }
    case Format::HEXADECIMAL:
        return toHex(bytes.data(), bytes.size());
    case Format::BYTES:
        return std::string(reinterpret_cast<const char *>(bytes.data()), bytes.size());
    case Format::INTEGER:
        return toInteger(bytes).str();
    }
    UNREACHABLE("Unsupported Format");
}

std::string renderUrn(const Bytes &bytes)
{
    return std::string(URN_PREFIX) + render(bytes, Format::STRING);
}

std::string printable(std::string_view input)
{
    const auto isPrintable = std::all_of(input.begin(), input.end(), [](char c) {
        const auto code = static_cast<unsigned char>(c);
        return code >= 0x20 && code < 0x7F;
    });
    if (isPrintable) {
        return std::string(input);
    }

    std::string result;
    result.reserve(input.size() * 4);
    for (const auto symbol : input) {
        const auto code = static_cast<uint8_t>(symbol);
        result += "\\x";
        result.push_back(HEX_DIGITS[code >> 4]);
        result.push_back(HEX_DIGITS[code & 0x0F]);
    }
    return result;
}
} // namespace ident::codec
