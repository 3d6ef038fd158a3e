#include <gtest/gtest.h>

#include <boost/date_time/posix_time/posix_time.hpp>

#include "identifier/byte_swap.hpp"
#include "identifier/errors.hpp"
#include "identifier/fields.hpp"
#include "identifier/uuid.hpp"
#include "testing_utils.hpp"

namespace ident::tests {

// Примеры из RFC 9562 (2022-02-22 19:22:22 UTC)
class FieldsTest : public ::testing::Test {
protected:
    const Bytes v1 = bytesFromHex("c232ab00-9414-11ec-b3c8-9f6bdeced846");
    const Bytes v6 = bytesFromHex("1ec9414c-232a-6b00-b3c8-9f6bdeced846");
    const Bytes v7 = bytesFromHex("017f22e2-79b0-7cc3-98c4-dc0c0c07398f");
    // Локальный идентификатор 1000, домен person, 6-битная последовательность часов 0x33
    const Bytes v2 = bytesFromHex("000003e8-9414-21ec-b300-9f6bdeced846");
};

// Одна и та же метка в раскладках версий 1 и 6
TEST_F(FieldsTest, GregorianTicks)
{
    constexpr uint64_t ticks = 0x1EC9414C232AB00ULL;
    EXPECT_EQ(ticks, fields::gregorianTicks(v1, TimestampEncoding::GREGORIAN_LOW_MID_HIGH));
    EXPECT_EQ(ticks, fields::gregorianTicks(v6, TimestampEncoding::GREGORIAN_HIGH_MID_LOW));
    EXPECT_EQ("2022-02-22 19:22:22.000000",
              fields::formatDateTime(fields::gregorianTicksToDateTime(ticks)));
    EXPECT_THROW(fields::gregorianTicks(v1, TimestampEncoding::NONE), BadMethodCall);
}

// Декодирование полей версии 1
TEST_F(FieldsTest, DecodeV1)
{
    const auto decoded = fields::decode(v1, Version::GREGORIAN_TIME);
    EXPECT_EQ(0x1EC9414C232AB00ULL, decoded.timestamp.value_or(0));
    EXPECT_EQ(0x33C8, decoded.clockSequence.value_or(0));
    EXPECT_EQ("9f6bdeced846", decoded.node.value_or(""));
    EXPECT_FALSE(decoded.localIdentifier.has_value());

    const auto uuid = Uuid::fromCanonicalBytes(v1, Kind::V1);
    EXPECT_EQ("2022-02-22 19:22:22.000000", fields::formatDateTime(uuid.dateTime()));
}

// Декодирование полей версии 2
TEST_F(FieldsTest, DecodeV2)
{
    const auto uuid = Uuid::fromCanonicalBytes(v2, Kind::V2);
    EXPECT_EQ(1000U, uuid.localIdentifier());
    EXPECT_EQ(DceDomain::PERSON, uuid.localDomain());
    EXPECT_EQ(0x33, uuid.clockSequence());
    EXPECT_EQ("9f6bdeced846", uuid.node());
    // Младшие 32 бита временной метки потеряны
    EXPECT_EQ(0x1EC941400000000ULL, uuid.timestamp());
    EXPECT_EQ("2022-02-22 19:16:56.189952", fields::formatDateTime(uuid.dateTime()));

    auto unknownDomain = v2;
    unknownDomain[9] = 0x07;
    const auto other = Uuid::fromCanonicalBytes(unknownDomain, Kind::V2);
    EXPECT_EQ(7, other.localDomainValue());
    EXPECT_FALSE(other.localDomain().has_value());
}

// Декодирование полей версии 7
TEST_F(FieldsTest, DecodeV7)
{
    const auto decoded = fields::decode(v7, Version::UNIX_TIME);
    EXPECT_EQ(0x017F22E279B0ULL, decoded.timestamp.value_or(0));
    ASSERT_TRUE(decoded.dateTime.has_value());
    EXPECT_EQ("2022-02-22 19:22:22.000000", fields::formatDateTime(*decoded.dateTime));
    EXPECT_FALSE(decoded.clockSequence.has_value());
    EXPECT_FALSE(decoded.node.has_value());

    const auto uuid = Uuid::fromCanonicalBytes(v7, Kind::V7);
    EXPECT_THROW(uuid.node(), BadMethodCall);
    EXPECT_THROW(uuid.clockSequence(), BadMethodCall);
}

// Метка версии 7 позже 9999 года не переводится в дату
TEST_F(FieldsTest, DecodeV7BeyondDateRange)
{
    const auto last = fields::decode(bytesFromHex("e677d21fdbff7fffbfffffffffffffff"),
                                     Version::UNIX_TIME);
    ASSERT_TRUE(last.dateTime.has_value());
    EXPECT_EQ("9999-12-31 23:59:59.999000", fields::formatDateTime(*last.dateTime));

    const auto max = fields::decode(bytesFromHex("ffffffffffff7fffbfffffffffffffff"),
                                    Version::UNIX_TIME);
    EXPECT_EQ(fields::MAX_UNIX_MILLISECONDS, max.timestamp.value_or(0));
    EXPECT_FALSE(max.dateTime.has_value());

    const Uuid uuid("ffffffff-ffff-7fff-bfff-ffffffffffff", Kind::V7);
    EXPECT_EQ(fields::MAX_UNIX_MILLISECONDS, uuid.timestamp());
    EXPECT_THROW(uuid.dateTime(), InvalidArgument);
    EXPECT_FALSE(uuid.decodedFields().dateTime.has_value());
}

// Версии 3, 4 и 5 не содержат полей
TEST_F(FieldsTest, VersionsWithoutFields)
{
    for (const auto version : { Version::NAME_BASED_MD5, Version::RANDOM, Version::NAME_BASED_SHA1 }) {
        const auto decoded = fields::decode(randomBytes(), version);
        EXPECT_FALSE(decoded.timestamp.has_value());
        EXPECT_FALSE(decoded.node.has_value());
        EXPECT_FALSE(decoded.customFieldA.has_value());
    }
}

// Перевод даты во временную метку и обратно
TEST(DateTimeConversionTest, Bounds)
{
    using namespace boost::posix_time;
    using namespace boost::gregorian;

    EXPECT_EQ(0U, fields::dateTimeToGregorianTicks(fields::gregorianEpoch()));
    EXPECT_EQ(fields::GREGORIAN_TO_UNIX_TICKS, fields::dateTimeToGregorianTicks(fields::unixEpoch()));
    EXPECT_THROW(fields::dateTimeToGregorianTicks(ptime(date(1582, Oct, 14))), InvalidArgument);
    EXPECT_THROW(fields::dateTimeToGregorianTicks(ptime(date(5300, Jan, 1))), InvalidArgument);
    EXPECT_THROW(fields::dateTimeToGregorianTicks(ptime(not_a_date_time)), InvalidArgument);

    const ptime moment(date(2022, Feb, 22), hours(19) + minutes(22) + seconds(22));
    EXPECT_EQ(0x1EC9414C232AB00ULL, fields::dateTimeToGregorianTicks(moment));
    EXPECT_EQ(0x017F22E279B0ULL, fields::dateTimeToUnixMilliseconds(moment));
    EXPECT_THROW(fields::dateTimeToUnixMilliseconds(ptime(date(1969, Dec, 31))), InvalidArgument);

    EXPECT_EQ("5236-03-31 21:21:00.684697",
              fields::formatDateTime(fields::gregorianTicksToDateTime(fields::MAX_GREGORIAN_TICKS)));
    EXPECT_EQ("1970-01-01 00:00:00.000000",
              fields::formatDateTime(fields::unixMillisecondsToDateTime(0)));
    EXPECT_EQ(ptime(date(1970, Jan, 1)), fields::unixEpoch());

    // Boost.DateTime не представляет даты после 9999 года
    EXPECT_TRUE(fields::isRepresentableUnixMilliseconds(253402300799999ULL));
    EXPECT_FALSE(fields::isRepresentableUnixMilliseconds(253402300800000ULL));
    EXPECT_THROW(fields::unixMillisecondsToDateTime(253402300800000ULL), InvalidArgument);
    EXPECT_THROW(fields::unixMillisecondsToDateTime(fields::MAX_UNIX_MILLISECONDS), InvalidArgument);
}

// Имена доменов DCE
TEST(DceDomainTest, Names)
{
    EXPECT_EQ("person", fields::dceDomainToString(DceDomain::PERSON));
    EXPECT_EQ("group", fields::dceDomainToString(DceDomain::GROUP));
    EXPECT_EQ("org", fields::dceDomainToString(DceDomain::ORG));
    EXPECT_EQ(DceDomain::ORG, fields::toDceDomain(2));
    EXPECT_FALSE(fields::toDceDomain(3).has_value());
}

// Перестановка байт Microsoft GUID
TEST(ByteSwapTest, VendorLayout)
{
    const auto rfc = bytesFromHex("00112233-4455-6677-8899-aabbccddeeff");
    const auto vendor = toVendorLayout(rfc);
    EXPECT_EQ(bytesFromHex("33221100-5544-7766-8899-aabbccddeeff"), vendor);
    EXPECT_EQ(rfc, toRfcLayout(vendor));

    // Перестановка обратима для любых значений
    for (size_t i = 0; i < 1000; i++) {
        const auto bytes = randomBytes();
        EXPECT_EQ(bytes, toRfcLayout(toVendorLayout(bytes)));
    }
}
} // namespace ident::tests
