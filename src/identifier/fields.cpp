#include "identifier/fields.hpp"

#include <iomanip>
#include <sstream>
#include <string>

#include <boost/date_time/posix_time/posix_time.hpp>

#include "identifier/codec.hpp"
#include "identifier/errors.hpp"
#include "utils/compiler.hpp"
#include "utils/logger.hpp"

namespace {
constexpr uint64_t TICKS_PER_MICROSECOND = 10;

// Чтение size байт начиная с offset как беззнакового big-endian числа
uint64_t readBigEndian(const ident::Bytes &bytes, size_t offset, size_t size)
{
    uint64_t value = 0;
    for (size_t i = offset; i < offset + size; i++) {
        value = (value << 8) | bytes[i];
    }
    return value;
}

// time_hi без полубайта версии
uint64_t timeHigh(const ident::Bytes &bytes)
{
    return readBigEndian(bytes, 6, 2) & 0x0FFF;
}
} // namespace

namespace ident::fields {
DateTime gregorianEpoch()
{
    return DateTime(boost::gregorian::date(1582, boost::gregorian::Oct, 15));
}

DateTime unixEpoch()
{
    return gregorianTicksToDateTime(GREGORIAN_TO_UNIX_TICKS);
}

uint64_t gregorianTicks(const Bytes &bytes, TimestampEncoding encoding)
{
    switch (encoding) {
    case TimestampEncoding::GREGORIAN_LOW_MID_HIGH:
        return (timeHigh(bytes) << 48) | (readBigEndian(bytes, 4, 2) << 32)
            | readBigEndian(bytes, 0, 4);
    case TimestampEncoding::GREGORIAN_DCE_MID_HIGH:
        // Младшие 32 бита заняты локальным идентификатором
        return (timeHigh(bytes) << 48) | (readBigEndian(bytes, 4, 2) << 32);
    case TimestampEncoding::GREGORIAN_HIGH_MID_LOW:
        return (readBigEndian(bytes, 0, 6) << 12) | timeHigh(bytes);
    case TimestampEncoding::UNIX_MILLISECONDS:
    case TimestampEncoding::NONE:
        break;
    }
    throw BadMethodCall("Раскладка не содержит григорианской временной метки");
}

uint64_t unixMilliseconds(const Bytes &bytes)
{
    return readBigEndian(bytes, 0, 6);
}

DateTime gregorianTicksToDateTime(uint64_t ticks)
{
    // Целочисленное деление отбрасывает доли микросекунды
    return gregorianEpoch()
        + boost::posix_time::microseconds(static_cast<int64_t>(ticks / TICKS_PER_MICROSECOND));
}

bool isRepresentableUnixMilliseconds(uint64_t milliseconds)
{
    static const auto lastMoment = DateTime(boost::gregorian::date(9999, boost::gregorian::Dec, 31),
                                            boost::posix_time::hours(23) + boost::posix_time::minutes(59)
                                                + boost::posix_time::seconds(59)
                                                + boost::posix_time::milliseconds(999));
    static const auto limit = static_cast<uint64_t>((lastMoment - unixEpoch()).total_milliseconds());
    return milliseconds <= limit;
}

DateTime unixMillisecondsToDateTime(uint64_t milliseconds)
{
    if (!isRepresentableUnixMilliseconds(milliseconds)) {
        LOG_DEBUG << "Временная метка Unix " << milliseconds << " мс не переводится в дату";
        throw InvalidArgument("Временная метка Unix " + std::to_string(milliseconds)
                              + " мс соответствует дате позже 9999 года");
    }
    return unixEpoch() + boost::posix_time::milliseconds(static_cast<int64_t>(milliseconds));
}

uint64_t dateTimeToGregorianTicks(const DateTime &dateTime)
{
    if (dateTime.is_special()) {
        throw InvalidArgument("Некорректная дата для григорианской временной метки");
    }

    const auto elapsed = (dateTime - gregorianEpoch()).total_microseconds();
    if (elapsed < 0
        || static_cast<uint64_t>(elapsed) > MAX_GREGORIAN_TICKS / TICKS_PER_MICROSECOND) {
        throw InvalidArgument("Дата " + formatDateTime(dateTime)
                              + " вне диапазона григорианской временной метки UUID");
    }
    return static_cast<uint64_t>(elapsed) * TICKS_PER_MICROSECOND;
}

uint64_t dateTimeToUnixMilliseconds(const DateTime &dateTime)
{
    if (dateTime.is_special()) {
        throw InvalidArgument("Некорректная дата для временной метки Unix");
    }

    const auto elapsed = (dateTime - unixEpoch()).total_milliseconds();
    if (elapsed < 0 || static_cast<uint64_t>(elapsed) > MAX_UNIX_MILLISECONDS) {
        throw InvalidArgument("Дата " + formatDateTime(dateTime)
                              + " вне диапазона 48-битной временной метки Unix");
    }
    return static_cast<uint64_t>(elapsed);
}

std::string formatDateTime(const DateTime &dateTime)
{
    if (dateTime.is_special()) {
        return boost::posix_time::to_simple_string(dateTime);
    }

    const auto date = dateTime.date();
    const auto time = dateTime.time_of_day();

    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(4) << static_cast<int>(date.year()) << '-'
        << std::setw(2) << date.month().as_number() << '-' << std::setw(2)
        << date.day().as_number() << ' ' << std::setw(2) << time.hours() << ':' << std::setw(2)
        << time.minutes() << ':' << std::setw(2) << time.seconds() << '.' << std::setw(6)
        << (time.total_microseconds() % 1000000);
    return oss.str();
}

uint16_t clockSequence(const Bytes &bytes, uint8_t bits)
{
    switch (bits) {
    case 14:
        return static_cast<uint16_t>(((bytes[8] & 0x3F) << 8) | bytes[9]);
    case 6:
        return static_cast<uint16_t>(bytes[8] & 0x3F);
    default:
        break;
    }
    throw BadMethodCall("Раскладка не содержит последовательности часов");
}

uint64_t node(const Bytes &bytes)
{
    return readBigEndian(bytes, 10, 6);
}

std::string nodeHex(const Bytes &bytes)
{
    return codec::toHex(bytes.data() + 10, 6);
}

uint32_t localIdentifier(const Bytes &bytes)
{
    return static_cast<uint32_t>(readBigEndian(bytes, 0, 4));
}

uint8_t localDomainValue(const Bytes &bytes)
{
    return bytes[9];
}

std::optional<DceDomain> toDceDomain(uint8_t value)
{
    switch (value) {
    case 0:
        return DceDomain::PERSON;
    case 1:
        return DceDomain::GROUP;
    case 2:
        return DceDomain::ORG;
    default:
        return std::nullopt;
    }
}

std::string dceDomainToString(DceDomain domain)
{
    switch (domain) {
    case DceDomain::PERSON:
        return "person";
    case DceDomain::GROUP:
        return "group";
    case DceDomain::ORG:
        return "org";
    }
    UNREACHABLE("Unsupported DceDomain");
}

std::string customFieldA(const Bytes &bytes)
{
    return codec::toHex(bytes.data(), 6);
}

std::string customFieldB(const Bytes &bytes)
{
    // Первый символ hex от (байт 6) - это полубайт версии, его пропускаем
    return codec::toHex(bytes.data() + 6, 2).substr(1);
}

std::string customFieldC(const Bytes &bytes)
{
    auto tail = bytes;
    tail[8] &= 0x3F;
    return codec::toHex(tail.data() + 8, 8);
}

DecodedFields decode(const Bytes &bytes, Version version)
{
    const auto &layout = layoutFor(version);
    DecodedFields result;

    switch (layout.timestamp) {
    case TimestampEncoding::GREGORIAN_LOW_MID_HIGH:
    case TimestampEncoding::GREGORIAN_DCE_MID_HIGH:
    case TimestampEncoding::GREGORIAN_HIGH_MID_LOW:
        result.timestamp = gregorianTicks(bytes, layout.timestamp);
        result.dateTime = gregorianTicksToDateTime(*result.timestamp);
        break;
    case TimestampEncoding::UNIX_MILLISECONDS:
        result.timestamp = unixMilliseconds(bytes);
        if (isRepresentableUnixMilliseconds(*result.timestamp)) {
            result.dateTime = unixMillisecondsToDateTime(*result.timestamp);
        }
        break;
    case TimestampEncoding::NONE:
        break;
    }

    if (layout.clockSequenceBits != 0) {
        result.clockSequence = clockSequence(bytes, layout.clockSequenceBits);
    }
    if (layout.hasNode) {
        result.node = nodeHex(bytes);
    }
    if (layout.hasDceFields) {
        result.localIdentifier = localIdentifier(bytes);
        result.localDomain = localDomainValue(bytes);
    }
    if (layout.hasCustomFields) {
        result.customFieldA = customFieldA(bytes);
        result.customFieldB = customFieldB(bytes);
        result.customFieldC = customFieldC(bytes);
    }
    return result;
}
} // namespace ident::fields
