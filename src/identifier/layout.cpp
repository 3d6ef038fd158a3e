#include "identifier/layout.hpp"

#include "utils/compiler.hpp"

namespace {
using ident::TimestampEncoding;
using ident::Version;
using ident::VersionLayout;

// Таблица раскладок, индекс = номер версии - 1
constexpr std::array<VersionLayout, 8> VERSION_LAYOUTS = { {
    { Version::GREGORIAN_TIME, "Gregorian time", TimestampEncoding::GREGORIAN_LOW_MID_HIGH, 14,
      true, false, false },
    { Version::DCE_SECURITY, "DCE Security", TimestampEncoding::GREGORIAN_DCE_MID_HIGH, 6, true,
      true, false },
    { Version::NAME_BASED_MD5, "name-based (MD5)", TimestampEncoding::NONE, 0, false, false,
      false },
    { Version::RANDOM, "random", TimestampEncoding::NONE, 0, false, false, false },
    { Version::NAME_BASED_SHA1, "name-based (SHA-1)", TimestampEncoding::NONE, 0, false, false,
      false },
    { Version::REORDERED_GREGORIAN_TIME, "reordered Gregorian time",
      TimestampEncoding::GREGORIAN_HIGH_MID_LOW, 14, true, false, false },
    { Version::UNIX_TIME, "Unix Epoch time", TimestampEncoding::UNIX_MILLISECONDS, 0, false, false,
      false },
    { Version::CUSTOM, "custom", TimestampEncoding::NONE, 0, false, false, true },
} };
} // namespace

namespace ident {
const VersionLayout &layoutFor(Version version)
{
    return VERSION_LAYOUTS[static_cast<size_t>(version) - 1];
}

std::optional<VersionLayout> layoutForNibble(uint8_t nibble)
{
    if (nibble < 1 || nibble > VERSION_LAYOUTS.size()) {
        return std::nullopt;
    }
    return VERSION_LAYOUTS[nibble - 1];
}

std::optional<FormatLayout> formatLayoutFor(Format format)
{
    switch (format) {
    case Format::STRING:
        return FormatLayout{ Format::STRING, STRING_LENGTH, 14, 19, 21 };
    case Format::HEXADECIMAL:
        return FormatLayout{ Format::HEXADECIMAL, HEX_LENGTH, 12, 16, 18 };
    case Format::BYTES:
        return FormatLayout{ Format::BYTES, BYTES_LENGTH, 6, 8, 9 };
    case Format::INTEGER:
        return std::nullopt;
    }
    UNREACHABLE("Unsupported Format");
}

std::optional<Version> versionForKind(Kind kind)
{
    switch (kind) {
    case Kind::V1:
        return Version::GREGORIAN_TIME;
    case Kind::V2:
        return Version::DCE_SECURITY;
    case Kind::V3:
        return Version::NAME_BASED_MD5;
    case Kind::V4:
        return Version::RANDOM;
    case Kind::V5:
        return Version::NAME_BASED_SHA1;
    case Kind::V6:
        return Version::REORDERED_GREGORIAN_TIME;
    case Kind::V7:
        return Version::UNIX_TIME;
    case Kind::V8:
        return Version::CUSTOM;
    case Kind::NIL:
    case Kind::MAX:
    case Kind::MICROSOFT_GUID:
        return std::nullopt;
    }
    UNREACHABLE("Unsupported Kind");
}

Kind kindForVersion(Version version)
{
    // Версионные значения Kind идут подряд, начиная с V1
    return static_cast<Kind>(static_cast<uint8_t>(Kind::V1) + static_cast<uint8_t>(version) - 1);
}

std::string variantToString(Variant variant)
{
    switch (variant) {
    case Variant::RESERVED_NCS:
        return "reserved NCS";
    case Variant::RFC_4122:
        return "RFC 4122";
    case Variant::RESERVED_MICROSOFT:
        return "reserved Microsoft";
    case Variant::RESERVED_FUTURE:
        return "reserved future";
    }
    UNREACHABLE("Unsupported Variant");
}

std::string formatToString(Format format)
{
    switch (format) {
    case Format::STRING:
        return "string";
    case Format::HEXADECIMAL:
        return "hex";
    case Format::BYTES:
        return "bytes";
    case Format::INTEGER:
        return "integer";
    }
    UNREACHABLE("Unsupported Format");
}

std::string kindToString(Kind kind)
{
    switch (kind) {
    case Kind::NIL:
        return "Nil UUID";
    case Kind::MAX:
        return "Max UUID";
    case Kind::MICROSOFT_GUID:
        return "Microsoft GUID";
    default:
        break;
    }
    return "UUID версии " + std::to_string(static_cast<int>(*versionForKind(kind)));
}

std::optional<Format> parseFormatName(const std::string &name)
{
    if (name == "string")
        return Format::STRING;
    if (name == "hex" || name == "hexadecimal")
        return Format::HEXADECIMAL;
    if (name == "bytes")
        return Format::BYTES;
    if (name == "integer" || name == "int")
        return Format::INTEGER;
    return std::nullopt;
}
} // namespace ident
