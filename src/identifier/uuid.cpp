#include "identifier/uuid.hpp"

#include <boost/container_hash/hash.hpp>

#include "identifier/byte_swap.hpp"
#include "identifier/classifier.hpp"
#include "identifier/errors.hpp"
#include "utils/compiler.hpp"
#include "utils/logger.hpp"

namespace {
std::string invalidValueMessage(ident::Kind kind, std::string_view input)
{
    return "Некорректный " + ident::kindToString(kind) + ": \"" + ident::codec::printable(input)
        + "\"";
}

[[noreturn]] void throwInvalid(ident::Kind kind, std::string_view input)
{
    const auto message = invalidValueMessage(kind, input);
    LOG_DEBUG << message;
    throw ident::InvalidArgument(message);
}
} // namespace

namespace ident {
Uuid::Uuid()
    : bytes_{}
    , kind_(Kind::NIL)
{
}

Uuid::Uuid(const Bytes &bytes, Kind kind)
    : bytes_(bytes)
    , kind_(kind)
{
}

Uuid::Uuid(std::string_view representation, Kind kind)
    : Uuid()
{
    const auto format = codec::detectFormat(representation);
    if (!format.has_value()) {
        throwInvalid(kind, representation);
    }
    *this = fromRepresentation(representation, *format, kind);
}

Uuid Uuid::nil()
{
    return Uuid();
}

Uuid Uuid::max()
{
    Bytes bytes;
    bytes.fill(0xFF);
    return Uuid(bytes, Kind::MAX);
}

Uuid Uuid::fromRepresentation(std::string_view input, Format format, Kind kind)
{
    auto bytes = codec::tryParse(input, format);
    if (!bytes.has_value()) {
        throwInvalid(kind, input);
    }

    // Бинарное представление GUID хранится в смешанной раскладке
    if (format == Format::BYTES && kind == Kind::MICROSOFT_GUID) {
        bytes = toRfcLayout(*bytes);
    }

    if (!isValidForKind(*bytes, kind)) {
        throwInvalid(kind, input);
    }
    return Uuid(*bytes, kind);
}

Uuid Uuid::fromString(std::string_view input, Kind kind)
{
    return fromRepresentation(input, Format::STRING, kind);
}

Uuid Uuid::fromHexadecimal(std::string_view input, Kind kind)
{
    return fromRepresentation(input, Format::HEXADECIMAL, kind);
}

Uuid Uuid::fromBytes(std::string_view input, Kind kind)
{
    return fromRepresentation(input, Format::BYTES, kind);
}

Uuid Uuid::fromBytes(const Bytes &bytes, Kind kind)
{
    return fromCanonicalBytes(kind == Kind::MICROSOFT_GUID ? toRfcLayout(bytes) : bytes, kind);
}

Uuid Uuid::fromInteger(std::string_view decimal, Kind kind)
{
    return fromRepresentation(decimal, Format::INTEGER, kind);
}

Uuid Uuid::fromInteger(const UInt128 &value, Kind kind)
{
    return fromCanonicalBytes(codec::fromInteger(value), kind);
}

Uuid Uuid::fromCanonicalBytes(const Bytes &bytes, Kind kind)
{
    if (!isValidForKind(bytes, kind)) {
        throwInvalid(kind, codec::render(bytes, Format::STRING));
    }
    return Uuid(bytes, kind);
}

std::optional<Uuid> Uuid::tryParse(std::string_view input, Format format, Kind kind)
{
    try {
        return fromRepresentation(input, format, kind);
    }
    catch (const InvalidArgument &e) {
        LOG_TRACE << "tryParse: " << e.what();
        return std::nullopt;
    }
}

Uuid Uuid::parseAny(std::string_view input)
{
    const auto bytes = codec::tryParse(input);
    const auto kind = bytes.has_value() ? classify(*bytes) : std::nullopt;
    if (!kind.has_value()) {
        const auto message = "Некорректный UUID: \"" + codec::printable(input) + "\"";
        LOG_DEBUG << message;
        throw InvalidArgument(message);
    }
    return Uuid(*bytes, *kind);
}

std::optional<Uuid> Uuid::tryParseAny(std::string_view input)
{
    const auto bytes = codec::tryParse(input);
    if (!bytes.has_value()) {
        return std::nullopt;
    }
    const auto kind = classify(*bytes);
    if (!kind.has_value()) {
        return std::nullopt;
    }
    return Uuid(*bytes, *kind);
}

Kind Uuid::kind() const
{
    return kind_;
}

Variant Uuid::variant() const
{
    // Nil и Max по соглашению относятся к варианту RFC
    if (kind_ == Kind::NIL || kind_ == Kind::MAX) {
        return Variant::RFC_4122;
    }
    return variantOf(bytes_);
}

uint8_t Uuid::version() const
{
    if (kind_ == Kind::NIL || kind_ == Kind::MAX) {
        throw BadMethodCall(kindToString(kind_) + " не имеет поля версии");
    }
    return versionOf(bytes_);
}

const Bytes &Uuid::canonicalBytes() const
{
    return bytes_;
}

std::string Uuid::toString() const
{
    return codec::render(bytes_, Format::STRING);
}

std::string Uuid::toHexadecimal() const
{
    return codec::render(bytes_, Format::HEXADECIMAL);
}

Bytes Uuid::toBytes() const
{
    return kind_ == Kind::MICROSOFT_GUID ? toVendorLayout(bytes_) : bytes_;
}

std::string Uuid::toBytesString() const
{
    return codec::render(toBytes(), Format::BYTES);
}

std::string Uuid::toInteger() const
{
    return codec::render(bytes_, Format::INTEGER);
}

UInt128 Uuid::toUInt128() const
{
    return codec::toInteger(bytes_);
}

std::string Uuid::toUrn() const
{
    return codec::renderUrn(bytes_);
}

std::optional<VersionLayout> Uuid::fieldLayout() const
{
    if (kind_ == Kind::NIL || kind_ == Kind::MAX) {
        return std::nullopt;
    }
    return layoutForNibble(versionOf(bytes_));
}

const VersionLayout &Uuid::requireLayout(const char *field) const
{
    const auto layout = fieldLayout();
    if (!layout.has_value()) {
        throw BadMethodCall(kindToString(kind_) + " не содержит поля \"" + field + "\"");
    }
    return layoutFor(layout->version);
}

uint64_t Uuid::timestamp() const
{
    const auto &layout = requireLayout("timestamp");
    switch (layout.timestamp) {
    case TimestampEncoding::GREGORIAN_LOW_MID_HIGH:
    case TimestampEncoding::GREGORIAN_DCE_MID_HIGH:
    case TimestampEncoding::GREGORIAN_HIGH_MID_LOW:
        return fields::gregorianTicks(bytes_, layout.timestamp);
    case TimestampEncoding::UNIX_MILLISECONDS:
        return fields::unixMilliseconds(bytes_);
    case TimestampEncoding::NONE:
        break;
    }
    throw BadMethodCall(kindToString(kindForVersion(layout.version))
                        + " не содержит временной метки");
}

DateTime Uuid::dateTime() const
{
    const auto &layout = requireLayout("dateTime");
    if (layout.timestamp == TimestampEncoding::UNIX_MILLISECONDS) {
        return fields::unixMillisecondsToDateTime(timestamp());
    }
    return fields::gregorianTicksToDateTime(timestamp());
}

uint16_t Uuid::clockSequence() const
{
    const auto &layout = requireLayout("clockSequence");
    if (layout.clockSequenceBits == 0) {
        throw BadMethodCall(kindToString(kindForVersion(layout.version))
                            + " не содержит последовательности часов");
    }
    return fields::clockSequence(bytes_, layout.clockSequenceBits);
}

std::string Uuid::node() const
{
    const auto &layout = requireLayout("node");
    if (!layout.hasNode) {
        throw BadMethodCall(kindToString(kindForVersion(layout.version))
                            + " не содержит идентификатора узла");
    }
    return fields::nodeHex(bytes_);
}

uint64_t Uuid::nodeValue() const
{
    const auto &layout = requireLayout("node");
    if (!layout.hasNode) {
        throw BadMethodCall(kindToString(kindForVersion(layout.version))
                            + " не содержит идентификатора узла");
    }
    return fields::node(bytes_);
}

uint32_t Uuid::localIdentifier() const
{
    if (!requireLayout("localIdentifier").hasDceFields) {
        throw BadMethodCall("Локальный идентификатор есть только у UUID версии 2");
    }
    return fields::localIdentifier(bytes_);
}

std::optional<DceDomain> Uuid::localDomain() const
{
    return fields::toDceDomain(localDomainValue());
}

uint8_t Uuid::localDomainValue() const
{
    if (!requireLayout("localDomain").hasDceFields) {
        throw BadMethodCall("Локальный домен есть только у UUID версии 2");
    }
    return fields::localDomainValue(bytes_);
}

std::string Uuid::customFieldA() const
{
    if (!requireLayout("customFieldA").hasCustomFields) {
        throw BadMethodCall("Пользовательские поля есть только у UUID версии 8");
    }
    return fields::customFieldA(bytes_);
}

std::string Uuid::customFieldB() const
{
    if (!requireLayout("customFieldB").hasCustomFields) {
        throw BadMethodCall("Пользовательские поля есть только у UUID версии 8");
    }
    return fields::customFieldB(bytes_);
}

std::string Uuid::customFieldC() const
{
    if (!requireLayout("customFieldC").hasCustomFields) {
        throw BadMethodCall("Пользовательские поля есть только у UUID версии 8");
    }
    return fields::customFieldC(bytes_);
}

fields::DecodedFields Uuid::decodedFields() const
{
    const auto layout = fieldLayout();
    if (!layout.has_value()) {
        return {};
    }
    return fields::decode(bytes_, layout->version);
}

int Uuid::compareTo(const Operand &other) const
{
    return compare(*this, other);
}

bool Uuid::equals(const Operand &other) const
{
    return ident::equals(*this, other);
}

bool Uuid::operator==(const Uuid &other) const
{
    return bytes_ == other.bytes_;
}

bool Uuid::operator!=(const Uuid &other) const
{
    return !(*this == other);
}

bool Uuid::operator<(const Uuid &other) const
{
    return bytes_ < other.bytes_;
}

bool Uuid::operator<=(const Uuid &other) const
{
    return !(other < *this);
}

bool Uuid::operator>(const Uuid &other) const
{
    return other < *this;
}

bool Uuid::operator>=(const Uuid &other) const
{
    return !(*this < other);
}

Bytes applyVersionAndVariant(Bytes bytes, Version version, Variant variant)
{
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | (static_cast<uint8_t>(version) << 4));

    switch (variant) {
    case Variant::RESERVED_NCS:
        bytes[8] = static_cast<uint8_t>(bytes[8] & 0x7F);
        return bytes;
    case Variant::RFC_4122:
        bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);
        return bytes;
    case Variant::RESERVED_MICROSOFT:
        bytes[8] = static_cast<uint8_t>((bytes[8] & 0x1F) | 0xC0);
        return bytes;
    case Variant::RESERVED_FUTURE:
        bytes[8] = static_cast<uint8_t>((bytes[8] & 0x1F) | 0xE0);
        return bytes;
    }
    UNREACHABLE("Unsupported Variant");
}

std::ostream &operator<<(std::ostream &os, const Uuid &uuid)
{
    return os << uuid.toString();
}
} // namespace ident

namespace std {
size_t hash<ident::Uuid>::operator()(const ident::Uuid &uuid) const noexcept
{
    const auto &bytes = uuid.canonicalBytes();
    return boost::hash_range(bytes.begin(), bytes.end());
}
} // namespace std
