#include <gtest/gtest.h>
#include <algorithm>
#include <cctype>
#include <sstream>
#include <string>
#include <unordered_set>
#include <vector>

#include "identifier/errors.hpp"
#include "identifier/fields.hpp"
#include "identifier/uuid.hpp"
#include "testing_utils.hpp"

namespace {
constexpr char UUID_V6_STRING[] = "a6a011d2-7433-6d43-9161-1550863792c9";
constexpr char UUID_V6_HEX[] = "a6a011d274336d4391611550863792c9";
constexpr char UUID_V6_INTEGER[] = "221482976272501429736935490600400556745";

constexpr char UUID_V8_STRING[] = "27433d43-011d-8a6a-9161-1550863792c9";
constexpr char UUID_V8_HEX[] = "27433d43011d8a6a91611550863792c9";
constexpr char UUID_V8_INTEGER[] = "52189018260751461212961852937641366217";

std::string toUpper(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char symbol) { return static_cast<char>(std::toupper(symbol)); });
    return value;
}
} // namespace

namespace ident::tests {

class UuidV6Test : public ::testing::Test {
protected:
    const std::string bytes = bytesToString(bytesFromHex(UUID_V6_HEX));
    const Uuid uuidWithString{ UUID_V6_STRING, Kind::V6 };
    const Uuid uuidWithHex{ UUID_V6_HEX, Kind::V6 };
    const Uuid uuidWithBytes{ bytes, Kind::V6 };

    std::vector<const Uuid *> all() const { return { &uuidWithString, &uuidWithHex, &uuidWithBytes }; }
};

// Все три представления дают одно и то же значение
TEST_F(UuidV6Test, RepresentationsAreInterchangeable)
{
    for (const auto *uuid : all()) {
        EXPECT_EQ(Kind::V6, uuid->kind());
        EXPECT_EQ(UUID_V6_STRING, uuid->toString());
        EXPECT_EQ(UUID_V6_HEX, uuid->toHexadecimal());
        EXPECT_EQ(bytes, uuid->toBytesString());
        EXPECT_EQ(UUID_V6_INTEGER, uuid->toInteger());
        EXPECT_EQ(std::string("urn:uuid:") + UUID_V6_STRING, uuid->toUrn());
        EXPECT_EQ(Variant::RFC_4122, uuid->variant());
        EXPECT_EQ(6, uuid->version());
    }
    EXPECT_EQ(uuidWithString, uuidWithHex);
    EXPECT_EQ(uuidWithHex, uuidWithBytes);
}

// Создание из целочисленного представления
TEST_F(UuidV6Test, FromInteger)
{
    const auto uuid = Uuid::fromInteger(UUID_V6_INTEGER, Kind::V6);
    EXPECT_EQ(uuidWithString, uuid);
    EXPECT_EQ(UInt128(UUID_V6_INTEGER), uuid.toUInt128());
    EXPECT_EQ(uuid, Uuid::fromInteger(UInt128(UUID_V6_INTEGER), Kind::V6));
}

// Поля версии 6
TEST_F(UuidV6Test, Fields)
{
    for (const auto *uuid : all()) {
        EXPECT_EQ("3960-10-02 03:47:43.500627", fields::formatDateTime(uuid->dateTime()));
        EXPECT_EQ("1550863792c9", uuid->node());
        EXPECT_EQ(0x1550863792c9ULL, uuid->nodeValue());
        EXPECT_EQ(0x1161, uuid->clockSequence());

        const auto decoded = uuid->decodedFields();
        ASSERT_TRUE(decoded.dateTime.has_value());
        EXPECT_EQ(uuid->dateTime(), *decoded.dateTime);
        EXPECT_EQ(uuid->timestamp(), decoded.timestamp.value_or(0));
        EXPECT_EQ("1550863792c9", decoded.node.value_or(""));
        EXPECT_FALSE(decoded.localIdentifier.has_value());
        EXPECT_FALSE(decoded.customFieldA.has_value());
    }
}

// Граничные значения временной метки версии 6
TEST_F(UuidV6Test, DateTimeBounds)
{
    const Uuid maxDate("ffffffff-ffff-6fff-bfff-ffffffffffff", Kind::V6);
    EXPECT_EQ("5236-03-31 21:21:00.684697", fields::formatDateTime(maxDate.dateTime()));
    EXPECT_EQ(fields::MAX_GREGORIAN_TICKS, maxDate.timestamp());

    const Uuid minDate("00000000-0000-6000-bfff-ffffffffffff", Kind::V6);
    EXPECT_EQ("1582-10-15 00:00:00.000000", fields::formatDateTime(minDate.dateTime()));
    EXPECT_EQ(0U, minDate.timestamp());
}

// Поля других версий недоступны
TEST_F(UuidV6Test, FieldsOfOtherVersionsThrow)
{
    EXPECT_THROW(uuidWithString.localIdentifier(), BadMethodCall);
    EXPECT_THROW(uuidWithString.localDomain(), BadMethodCall);
    EXPECT_THROW(uuidWithString.customFieldA(), BadMethodCall);
    EXPECT_THROW(uuidWithString.customFieldC(), BadMethodCall);
}

// Строковое представление всегда в нижнем регистре
TEST_F(UuidV6Test, LowercaseConversion)
{
    for (const auto &input :
         { toUpper(UUID_V6_STRING), toUpper(UUID_V6_HEX), randomizeCase(UUID_V6_STRING) }) {
        const Uuid uuid(input, Kind::V6);
        EXPECT_TRUE(uuid.equals(input));
        EXPECT_EQ(UUID_V6_STRING, uuid.toString());
    }
}

// Значения, некорректные для версии 6
TEST_F(UuidV6Test, RejectsInvalidValues)
{
    std::vector<std::string> invalid = {
        "",
        "a6a011d2-7433-6d43-9161-1550863792c",
        "a6a011d274336d4391611550863792c",
        std::string(15, '\0'),
        "foobarbazquux123",
        "00000000-0000-0000-0000-00000000000g",
        "0000000000000000000000000000000g",
        "00000000-0000-0000-0000-00000000",
        "00000000-0000-0000-0000-000000000000",
        "00000000000000000000000000000000",
        std::string(16, '\0'),
        "ffffffff-ffff-ffff-ffff-ffffffffffff",
        "ffffffffffffffffffffffffffffffff",
        std::string(16, '\xff'),
    };
    for (const char version : std::string("1234578")) {
        std::string value = "ffffffff-ffff-0fff-9fff-ffffffffffff";
        value[14] = version;
        invalid.push_back(value);
        std::string hex = "ffffffffffff0fff9fffffffffffffff";
        hex[12] = version;
        invalid.push_back(hex);
        invalid.push_back(bytesToString(bytesFromHex(hex)));
    }
    for (const char version : std::string("12345678")) {
        // Неверный вариант (110x)
        std::string value = "ffffffff-ffff-0fff-cfff-ffffffffffff";
        value[14] = version;
        invalid.push_back(value);
        std::string hex = "ffffffffffff0fffcfffffffffffffff";
        hex[12] = version;
        invalid.push_back(hex);
        invalid.push_back(bytesToString(bytesFromHex(hex)));
    }

    for (const auto &value : invalid) {
        EXPECT_THROW(Uuid::fromRepresentation(value, Format::BYTES, Kind::V6), InvalidArgument);
        EXPECT_THROW((Uuid{ value, Kind::V6 }), InvalidArgument) << codec::printable(value);
        EXPECT_FALSE(Uuid::tryParse(value, Format::STRING, Kind::V6).has_value());
    }
}

// Текст ошибки содержит тип и исходное значение
TEST_F(UuidV6Test, ErrorMessage)
{
    try {
        Uuid("a6a011d2-7433-9d43-9161-1550863792c9", Kind::V6);
        FAIL() << "Ожидалось исключение InvalidArgument";
    }
    catch (const InvalidArgument &e) {
        EXPECT_STREQ("Некорректный UUID версии 6: \"a6a011d2-7433-9d43-9161-1550863792c9\"",
                     e.what());
    }
}

class UuidV8Test : public ::testing::Test {
protected:
    const Uuid uuidWithString{ UUID_V8_STRING, Kind::V8 };
    const Uuid uuidWithHex{ UUID_V8_HEX, Kind::V8 };
    const Uuid uuidWithBytes{ bytesToString(bytesFromHex(UUID_V8_HEX)), Kind::V8 };
};

// Пользовательские поля версии 8
TEST_F(UuidV8Test, CustomFields)
{
    for (const auto *uuid : { &uuidWithString, &uuidWithHex, &uuidWithBytes }) {
        EXPECT_EQ(8, uuid->version());
        EXPECT_EQ(UUID_V8_STRING, uuid->toString());
        EXPECT_EQ(UUID_V8_INTEGER, uuid->toInteger());
        EXPECT_EQ("27433d43011d", uuid->customFieldA());
        EXPECT_EQ("a6a", uuid->customFieldB());
        EXPECT_EQ("11611550863792c9", uuid->customFieldC());

        const auto decoded = uuid->decodedFields();
        EXPECT_EQ("a6a", decoded.customFieldB.value_or(""));
        EXPECT_FALSE(decoded.timestamp.has_value());
    }
}

// У версии 8 нет временной метки и узла
TEST_F(UuidV8Test, NoTimeFields)
{
    EXPECT_THROW(uuidWithString.timestamp(), BadMethodCall);
    EXPECT_THROW(uuidWithString.dateTime(), BadMethodCall);
    EXPECT_THROW(uuidWithString.node(), BadMethodCall);
    EXPECT_THROW(uuidWithString.clockSequence(), BadMethodCall);
}

// Nil и Max UUID
TEST(SpecialUuidTest, NilAndMax)
{
    const auto nil = Uuid::nil();
    EXPECT_EQ(Kind::NIL, nil.kind());
    EXPECT_EQ("00000000-0000-0000-0000-000000000000", nil.toString());
    EXPECT_EQ("0", nil.toInteger());
    EXPECT_EQ(Variant::RFC_4122, nil.variant());
    EXPECT_THROW(nil.version(), BadMethodCall);
    EXPECT_THROW(nil.timestamp(), BadMethodCall);
    EXPECT_FALSE(nil.decodedFields().timestamp.has_value());
    EXPECT_EQ(nil, Uuid());

    const auto max = Uuid::max();
    EXPECT_EQ(Kind::MAX, max.kind());
    EXPECT_EQ("ffffffff-ffff-ffff-ffff-ffffffffffff", max.toString());
    EXPECT_EQ("340282366920938463463374607431768211455", max.toInteger());
    EXPECT_THROW(max.version(), BadMethodCall);
    EXPECT_LT(nil, max);

    EXPECT_EQ(nil, Uuid("00000000000000000000000000000000", Kind::NIL));
    EXPECT_EQ(max, Uuid("FFFFFFFF-FFFF-FFFF-FFFF-FFFFFFFFFFFF", Kind::MAX));
    EXPECT_THROW(Uuid("00000000-0000-0000-0000-000000000001", Kind::NIL), InvalidArgument);
    EXPECT_THROW(Uuid("ffffffff-ffff-ffff-ffff-fffffffffffe", Kind::MAX), InvalidArgument);
}

// Определение типа по битам
TEST(SpecialUuidTest, ParseAnyClassifies)
{
    EXPECT_EQ(Kind::V6, Uuid::parseAny(UUID_V6_STRING).kind());
    EXPECT_EQ(Kind::V8, Uuid::parseAny(UUID_V8_HEX).kind());
    EXPECT_EQ(Kind::NIL, Uuid::parseAny("00000000-0000-0000-0000-000000000000").kind());
    EXPECT_EQ(Kind::MAX, Uuid::parseAny(std::string(16, '\xff')).kind());
    EXPECT_EQ(Kind::V4, Uuid::parseAny("550e8400-e29b-41d4-a716-446655440000").kind());

    EXPECT_THROW(Uuid::parseAny("foobar"), InvalidArgument);
    // Версия 0 не определена стандартом
    EXPECT_THROW(Uuid::parseAny("a6a011d2-7433-0d43-9161-1550863792c9"), InvalidArgument);
    EXPECT_FALSE(Uuid::tryParseAny("a6a011d2-7433-0d43-9161-1550863792c9").has_value());
    EXPECT_TRUE(Uuid::tryParseAny(UUID_V6_HEX).has_value());
}

// Microsoft GUID хранит значение в порядке RFC, а бинарное представление - в смешанном
TEST(MicrosoftGuidTest, VendorByteLayout)
{
    const Uuid guid("00112233-4455-6677-c899-aabbccddeeff", Kind::MICROSOFT_GUID);
    EXPECT_EQ(Variant::RESERVED_MICROSOFT, guid.variant());
    EXPECT_EQ(6, guid.version());
    EXPECT_EQ("00112233-4455-6677-c899-aabbccddeeff", guid.toString());

    const auto vendor = bytesFromHex("3322110055447766c899aabbccddeeff");
    EXPECT_EQ(vendor, guid.toBytes());
    EXPECT_EQ(bytesToString(vendor), guid.toBytesString());

    // Разбор бинарного представления учитывает смешанную раскладку
    EXPECT_EQ(guid, Uuid(bytesToString(vendor), Kind::MICROSOFT_GUID));
    EXPECT_EQ(guid, Uuid::fromBytes(vendor, Kind::MICROSOFT_GUID));

    // Вариант RFC тоже допустим для GUID
    EXPECT_NO_THROW(Uuid(UUID_V6_STRING, Kind::MICROSOFT_GUID));
    EXPECT_TRUE(Uuid(UUID_V6_STRING, Kind::MICROSOFT_GUID).equals(UUID_V6_STRING));
    // Вариант NCS и неизвестная версия - нет
    EXPECT_THROW(Uuid("00112233-4455-6677-0899-aabbccddeeff", Kind::MICROSOFT_GUID),
                 InvalidArgument);
    EXPECT_THROW(Uuid("00112233-4455-0677-c899-aabbccddeeff", Kind::MICROSOFT_GUID),
                 InvalidArgument);
}

// Установка битов версии и варианта
TEST(ApplyVersionAndVariantTest, SetsBits)
{
    Bytes bytes;
    bytes.fill(0xFF);

    const auto v4 = applyVersionAndVariant(bytes, Version::RANDOM);
    EXPECT_EQ(0x4F, v4[6]);
    EXPECT_EQ(0xBF, v4[8]);

    const auto guid = applyVersionAndVariant(bytes, Version::RANDOM, Variant::RESERVED_MICROSOFT);
    EXPECT_EQ(0xDF, guid[8]);

    const auto ncs = applyVersionAndVariant(Bytes{}, Version::CUSTOM, Variant::RESERVED_NCS);
    EXPECT_EQ(0x80, ncs[6]);
    EXPECT_EQ(0x00, ncs[8]);

    const auto future = applyVersionAndVariant(Bytes{}, Version::CUSTOM, Variant::RESERVED_FUTURE);
    EXPECT_EQ(0xE0, future[8]);
}

// Операторы сравнения и хеширование
TEST(UuidOperatorsTest, OrderingAndHash)
{
    const Uuid v6(UUID_V6_STRING, Kind::V6);
    const Uuid v8(UUID_V8_STRING, Kind::V8);

    EXPECT_TRUE(v8 < v6);
    EXPECT_TRUE(v8 <= v6);
    EXPECT_TRUE(v6 > v8);
    EXPECT_TRUE(v6 >= v6);
    EXPECT_TRUE(v6 != v8);

    // Равенство не зависит от типа, с которым значение было создано
    EXPECT_EQ(v6, Uuid(UUID_V6_STRING, Kind::MICROSOFT_GUID));

    std::unordered_set<Uuid> set{ v6, v8, Uuid(UUID_V6_HEX, Kind::V6) };
    EXPECT_EQ(2U, set.size());

    std::ostringstream stream;
    stream << v6;
    EXPECT_EQ(UUID_V6_STRING, stream.str());
}
} // namespace ident::tests
