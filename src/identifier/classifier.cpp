#include "identifier/classifier.hpp"

#include <algorithm>

#include "identifier/codec.hpp"
#include "utils/logger.hpp"

namespace {
constexpr size_t VERSION_BYTE = 6;
constexpr size_t VARIANT_BYTE = 8;

/**
 * @brief Вариант по старшему полубайту байта 8
 * @param nibble Значение 0..15
 */
ident::Variant variantFromNibble(uint8_t nibble)
{
    if ((nibble >> 1) == 0b111) {
        return ident::Variant::RESERVED_FUTURE;
    }
    if ((nibble >> 1) == 0b110) {
        return ident::Variant::RESERVED_MICROSOFT;
    }
    if ((nibble >> 2) == 0b10) {
        return ident::Variant::RFC_4122;
    }
    return ident::Variant::RESERVED_NCS;
}

/**
 * @brief Полубайт, расположенный по смещению offset в представлении
 *
 * Для текстовых форматов - значение шестнадцатеричного символа, для байтового -
 * старший полубайт байта.
 */
std::optional<uint8_t> nibbleAt(std::string_view input, ident::Format format, size_t offset)
{
    if (!ident::codec::hasValidFormat(input, format)) {
        return std::nullopt;
    }
    if (format == ident::Format::BYTES) {
        return static_cast<uint8_t>(static_cast<uint8_t>(input[offset]) >> 4);
    }
    return static_cast<uint8_t>(ident::codec::hexDigitValue(input[offset]));
}
} // namespace

namespace ident {
Variant variantOf(const Bytes &bytes)
{
    return variantFromNibble(static_cast<uint8_t>(bytes[VARIANT_BYTE] >> 4));
}

uint8_t versionOf(const Bytes &bytes)
{
    return static_cast<uint8_t>(bytes[VERSION_BYTE] >> 4);
}

bool isValidFor(const Bytes &bytes, Version expected)
{
    return variantOf(bytes) == Variant::RFC_4122
        && versionOf(bytes) == static_cast<uint8_t>(expected);
}

bool isNil(const Bytes &bytes)
{
    return std::all_of(bytes.begin(), bytes.end(), [](uint8_t b) { return b == 0x00; });
}

bool isMax(const Bytes &bytes)
{
    return std::all_of(bytes.begin(), bytes.end(), [](uint8_t b) { return b == 0xFF; });
}

bool isValidForKind(const Bytes &bytes, Kind kind)
{
    switch (kind) {
    case Kind::NIL:
        return isNil(bytes);
    case Kind::MAX:
        return isMax(bytes);
    case Kind::MICROSOFT_GUID: {
        const auto variant = variantOf(bytes);
        return (variant == Variant::RFC_4122 || variant == Variant::RESERVED_MICROSOFT)
            && layoutForNibble(versionOf(bytes)).has_value();
    }
    default:
        break;
    }

    const auto version = versionForKind(kind);
    return version.has_value() && isValidFor(bytes, *version);
}

std::optional<Kind> classify(const Bytes &bytes)
{
    if (isNil(bytes)) {
        return Kind::NIL;
    }
    if (isMax(bytes)) {
        return Kind::MAX;
    }

    const auto layout = layoutForNibble(versionOf(bytes));
    if (!layout.has_value()) {
        LOG_TRACE << "Полубайт версии " << static_cast<int>(versionOf(bytes))
                  << " не соответствует ни одной версии";
        return std::nullopt;
    }

    switch (variantOf(bytes)) {
    case Variant::RFC_4122:
        return kindForVersion(layout->version);
    case Variant::RESERVED_MICROSOFT:
        return Kind::MICROSOFT_GUID;
    default:
        LOG_TRACE << "Вариант " << variantToString(variantOf(bytes)) << " не поддерживается";
        return std::nullopt;
    }
}

std::optional<Variant> variantOf(std::string_view input, Format format)
{
    const auto layout = formatLayoutFor(format);
    if (!layout.has_value()) {
        return std::nullopt;
    }
    const auto nibble = nibbleAt(input, format, layout->variantOffset);
    if (!nibble.has_value()) {
        return std::nullopt;
    }
    return variantFromNibble(*nibble);
}

std::optional<uint8_t> versionOf(std::string_view input, Format format)
{
    const auto layout = formatLayoutFor(format);
    if (!layout.has_value()) {
        return std::nullopt;
    }
    return nibbleAt(input, format, layout->versionOffset);
}
} // namespace ident
