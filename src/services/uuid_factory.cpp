#include "services/uuid_factory.hpp"

#include "identifier/errors.hpp"
#include "utils/logger.hpp"

namespace {
// Запись младших size байт значения в порядке big-endian начиная с offset
void writeBigEndian(ident::Bytes &bytes, size_t offset, size_t size, uint64_t value)
{
    for (size_t i = 0; i < size; i++) {
        bytes[offset + size - 1 - i] = static_cast<uint8_t>(value & 0xFF);
        value >>= 8;
    }
}
} // namespace

namespace ident {
UuidFactory::UuidFactory()
    : UuidFactory(FactoryServices{})
{
}

UuidFactory::UuidFactory(FactoryServices services)
    : services_(std::move(services))
{
    if (!services_.clock) {
        services_.clock = std::make_shared<SystemClock>();
    }
    if (!services_.randomGenerator) {
        services_.randomGenerator = std::make_shared<MersenneRandomGenerator>();
    }
    if (!services_.clockSequence) {
        services_.clockSequence
            = std::make_shared<RandomClockSequenceService>(services_.randomGenerator);
    }
    if (!services_.node) {
        services_.node = std::make_shared<FallbackNodeService>(
            std::vector<std::shared_ptr<NodeService>>{
                std::make_shared<SystemNodeService>(),
                std::make_shared<RandomNodeService>(services_.randomGenerator) });
    }
    if (!services_.dce) {
        services_.dce = std::make_shared<SystemDceService>();
    }
}

UuidFactory::TimeInputs UuidFactory::resolveTimeInputs(std::optional<uint64_t> node,
                                                       std::optional<DateTime> dateTime,
                                                       std::optional<uint32_t> clockSequence)
{
    TimeInputs inputs{};
    inputs.node = node.has_value() ? StaticNodeService(*node).address() : services_.node->address();
    inputs.ticks = fields::dateTimeToGregorianTicks(
        dateTime.has_value() ? *dateTime : services_.clock->now());
    inputs.clockSequence = clockSequence.has_value()
        ? StaticClockSequenceService(*clockSequence).next()
        : services_.clockSequence->next();
    return inputs;
}

Uuid UuidFactory::createV1(std::optional<uint64_t> node, std::optional<DateTime> dateTime,
                           std::optional<uint32_t> clockSequence)
{
    const auto inputs = resolveTimeInputs(node, dateTime, clockSequence);

    Bytes bytes{};
    writeBigEndian(bytes, 0, 4, inputs.ticks & 0xFFFFFFFF); // time_low
    writeBigEndian(bytes, 4, 2, (inputs.ticks >> 32) & 0xFFFF); // time_mid
    writeBigEndian(bytes, 6, 2, (inputs.ticks >> 48) & 0x0FFF); // time_hi
    writeBigEndian(bytes, 8, 2, inputs.clockSequence);
    writeBigEndian(bytes, 10, 6, inputs.node);

    return Uuid::fromCanonicalBytes(applyVersionAndVariant(bytes, Version::GREGORIAN_TIME),
                                    Kind::V1);
}

Uuid UuidFactory::createV2(DceDomain localDomain, std::optional<uint32_t> localIdentifier,
                           std::optional<uint64_t> node, std::optional<uint32_t> clockSequence,
                           std::optional<DateTime> dateTime)
{
    if (!localIdentifier.has_value()) {
        switch (localDomain) {
        case DceDomain::PERSON:
            localIdentifier = services_.dce->userId();
            break;
        case DceDomain::GROUP:
            localIdentifier = services_.dce->groupId();
            break;
        case DceDomain::ORG:
            localIdentifier = services_.dce->orgId();
            break;
        }
    }

    const auto inputs = resolveTimeInputs(node, dateTime, clockSequence);

    Bytes bytes{};
    writeBigEndian(bytes, 0, 4, *localIdentifier);
    writeBigEndian(bytes, 4, 2, (inputs.ticks >> 32) & 0xFFFF);
    writeBigEndian(bytes, 6, 2, (inputs.ticks >> 48) & 0x0FFF);
    // Младшие 6 бит останутся после записи варианта
    bytes[8] = static_cast<uint8_t>(inputs.clockSequence & 0xFF);
    bytes[9] = static_cast<uint8_t>(localDomain);
    writeBigEndian(bytes, 10, 6, inputs.node);

    return Uuid::fromCanonicalBytes(applyVersionAndVariant(bytes, Version::DCE_SECURITY),
                                    Kind::V2);
}

Uuid UuidFactory::createV4()
{
    const auto bytes = services_.randomGenerator->randomBytes();
    return Uuid::fromCanonicalBytes(applyVersionAndVariant(bytes, Version::RANDOM), Kind::V4);
}

Uuid UuidFactory::createV6(std::optional<uint64_t> node, std::optional<DateTime> dateTime,
                           std::optional<uint32_t> clockSequence)
{
    const auto inputs = resolveTimeInputs(node, dateTime, clockSequence);

    Bytes bytes{};
    writeBigEndian(bytes, 0, 6, inputs.ticks >> 12);
    writeBigEndian(bytes, 6, 2, inputs.ticks & 0x0FFF);
    writeBigEndian(bytes, 8, 2, inputs.clockSequence);
    writeBigEndian(bytes, 10, 6, inputs.node);

    return Uuid::fromCanonicalBytes(
        applyVersionAndVariant(bytes, Version::REORDERED_GREGORIAN_TIME), Kind::V6);
}

Uuid UuidFactory::createV7(std::optional<DateTime> dateTime)
{
    const auto milliseconds = fields::dateTimeToUnixMilliseconds(
        dateTime.has_value() ? *dateTime : services_.clock->now());

    auto bytes = services_.randomGenerator->randomBytes();
    writeBigEndian(bytes, 0, 6, milliseconds);

    return Uuid::fromCanonicalBytes(applyVersionAndVariant(bytes, Version::UNIX_TIME), Kind::V7);
}

Uuid UuidFactory::createV8(const Bytes &bytes)
{
    return Uuid::fromCanonicalBytes(applyVersionAndVariant(bytes, Version::CUSTOM), Kind::V8);
}

Uuid UuidFactory::createMicrosoftGuid()
{
    const auto bytes = applyVersionAndVariant(services_.randomGenerator->randomBytes(),
                                              Version::RANDOM, Variant::RESERVED_MICROSOFT);
    return Uuid::fromCanonicalBytes(bytes, Kind::MICROSOFT_GUID);
}

Uuid UuidFactory::microsoftGuidFromRfc4122(const Uuid &uuid)
{
    const auto version = versionForKind(uuid.kind());
    if (!version.has_value()) {
        LOG_DEBUG << "Преобразование в Microsoft GUID не определено для " << kindToString(uuid.kind());
        throw InvalidArgument("Ожидался UUID версий 1-8, получен " + kindToString(uuid.kind()));
    }

    const auto bytes
        = applyVersionAndVariant(uuid.canonicalBytes(), *version, Variant::RESERVED_MICROSOFT);
    return Uuid::fromCanonicalBytes(bytes, Kind::MICROSOFT_GUID);
}

Uuid UuidFactory::fromString(std::string_view input, Kind kind) const
{
    return Uuid::fromString(input, kind);
}

Uuid UuidFactory::fromHexadecimal(std::string_view input, Kind kind) const
{
    return Uuid::fromHexadecimal(input, kind);
}

Uuid UuidFactory::fromBytes(std::string_view input, Kind kind) const
{
    return Uuid::fromBytes(input, kind);
}

Uuid UuidFactory::fromInteger(std::string_view decimal, Kind kind) const
{
    return Uuid::fromInteger(decimal, kind);
}
} // namespace ident
