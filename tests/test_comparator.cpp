#include <gtest/gtest.h>
#include <algorithm>
#include <any>
#include <string>
#include <vector>

#include "identifier/byte_swap.hpp"
#include "identifier/comparator.hpp"
#include "identifier/errors.hpp"
#include "identifier/uuid.hpp"
#include "testing_utils.hpp"

namespace {
constexpr char UUID_V6_STRING[] = "a6a011d2-7433-6d43-9161-1550863792c9";
constexpr char UUID_V6_HEX[] = "a6a011d274336d4391611550863792c9";
constexpr char MAX_STRING[] = "ffffffff-ffff-ffff-ffff-ffffffffffff";
constexpr char NIL_STRING[] = "00000000-0000-0000-0000-000000000000";

// Идентификатор из сторонней библиотеки
class ForeignIdentifier : public ident::BinaryIdentifier {
public:
    ForeignIdentifier(ident::Bytes bytes, bool vendorLayout)
        : bytes_(bytes)
        , vendorLayout_(vendorLayout)
    {
    }

    ident::Bytes toBytes() const override { return bytes_; }
    bool usesVendorLayout() const override { return vendorLayout_; }

private:
    ident::Bytes bytes_;
    bool vendorLayout_;
};
} // namespace

namespace ident::tests {

class ComparatorTest : public ::testing::Test {
protected:
    const Uuid uuid{ UUID_V6_STRING, Kind::V6 };
};

// Сравнение с операндами разных типов
TEST_F(ComparatorTest, CompareTo)
{
    EXPECT_EQ(1, uuid.compareTo(nullptr));
    EXPECT_EQ(1, uuid.compareTo(123));
    EXPECT_EQ(-1, uuid.compareTo("foobar"));
    EXPECT_EQ(1, uuid.compareTo(NIL_STRING));
    EXPECT_EQ(0, uuid.compareTo(UUID_V6_STRING));
    EXPECT_EQ(0, uuid.compareTo(randomizeCase(UUID_V6_STRING)));
    EXPECT_EQ(0, uuid.compareTo(UUID_V6_HEX));
    EXPECT_EQ(0, uuid.compareTo(bytesToString(bytesFromHex(UUID_V6_HEX))));
    EXPECT_EQ(-1, uuid.compareTo(MAX_STRING));
    EXPECT_EQ(-1, uuid.compareTo("FFFFFFFF-FFFF-FFFF-FFFF-FFFFFFFFFFFF"));
    EXPECT_EQ(1, uuid.compareTo(true));
    EXPECT_EQ(1, uuid.compareTo(false));
    EXPECT_EQ(1, uuid.compareTo(Uuid::nil()));
    EXPECT_EQ(-1, uuid.compareTo(Uuid::max()));
    EXPECT_EQ(0, uuid.compareTo(Uuid(UUID_V6_HEX, Kind::V6)));
    EXPECT_EQ(0, uuid.compareTo(Uuid(UUID_V6_STRING, Kind::MICROSOFT_GUID)));
    EXPECT_EQ(0, uuid.compareTo(Operand::integer("221482976272501429736935490600400556745")));
}

// Сравнение с неподдерживаемым типом
TEST_F(ComparatorTest, CompareToUnsupportedThrows)
{
    EXPECT_THROW(uuid.compareTo(Operand::fromAny(std::vector<int>{})), NotComparable);
    EXPECT_THROW(uuid.compareTo(-1), NotComparable);
    EXPECT_THROW(compare(Operand::unsupported("float"), uuid), NotComparable);

    try {
        uuid.compareTo(Operand::fromAny(std::vector<int>{}));
        FAIL() << "Ожидалось исключение NotComparable";
    }
    catch (const NotComparable &e) {
        EXPECT_NE(std::string::npos, std::string(e.what()).find("std::vector<int"));
    }
}

// Равенство не бросает исключений
TEST_F(ComparatorTest, Equals)
{
    EXPECT_FALSE(uuid.equals(nullptr));
    EXPECT_FALSE(uuid.equals(123));
    EXPECT_FALSE(uuid.equals("foobar"));
    EXPECT_FALSE(uuid.equals(NIL_STRING));
    EXPECT_TRUE(uuid.equals(UUID_V6_STRING));
    EXPECT_TRUE(uuid.equals(UUID_V6_HEX));
    EXPECT_TRUE(uuid.equals(bytesToString(bytesFromHex(UUID_V6_HEX))));
    EXPECT_FALSE(uuid.equals(MAX_STRING));
    EXPECT_FALSE(uuid.equals(true));
    EXPECT_FALSE(uuid.equals(false));
    EXPECT_FALSE(uuid.equals(Uuid::nil()));
    EXPECT_FALSE(uuid.equals(Uuid::max()));
    EXPECT_TRUE(uuid.equals(Uuid(UUID_V6_STRING, Kind::V6)));
    EXPECT_FALSE(uuid.equals(Operand::fromAny(std::vector<int>{})));
    EXPECT_FALSE(uuid.equals(-5));
}

// Внешний идентификатор сравнивается по байтам
TEST_F(ComparatorTest, BinaryIdentifier)
{
    const auto rfc = bytesFromHex(UUID_V6_HEX);
    const ForeignIdentifier plain(rfc, false);
    EXPECT_EQ(0, uuid.compareTo(plain));
    EXPECT_TRUE(uuid.equals(plain));

    // Байты в раскладке Microsoft приводятся к порядку RFC
    const ForeignIdentifier vendor(toVendorLayout(rfc), true);
    EXPECT_EQ(0, uuid.compareTo(vendor));

    // Без признака смешанной раскладки те же байты дают другое значение
    const ForeignIdentifier misread(toVendorLayout(rfc), false);
    EXPECT_FALSE(uuid.equals(misread));
}

// Nil меньше любой нераспознанной строки, начинающейся с буквы
TEST_F(ComparatorTest, NilOrdering)
{
    EXPECT_EQ(-1, Uuid::nil().compareTo("foobar"));
    EXPECT_EQ(-1, Uuid::nil().compareTo(MAX_STRING));
    EXPECT_EQ(0, Uuid::nil().compareTo(0));
    EXPECT_EQ(1, Uuid::max().compareTo(Uuid::nil()));
}

// Порядок null < false < true < идентификаторы
TEST(OperandOrderTest, CategoryRanks)
{
    EXPECT_EQ(0, compare(nullptr, nullptr));
    EXPECT_EQ(-1, compare(nullptr, false));
    EXPECT_EQ(-1, compare(false, true));
    EXPECT_EQ(0, compare(true, true));
    EXPECT_EQ(-1, compare(true, Uuid::nil()));
    EXPECT_EQ(-1, compare(true, "foobar"));
    EXPECT_EQ(1, compare("foobar", nullptr));
    EXPECT_EQ(0, compare("FooBar", "foobar"));
    EXPECT_EQ(-1, compare("abc", "abd"));
}

// Целые числа сравниваются как целочисленное представление
TEST(OperandOrderTest, Integers)
{
    EXPECT_EQ(-1, compare(1, 2));
    EXPECT_EQ(0, compare(42U, Operand::integer("42")));
    EXPECT_EQ(1, compare(UInt128(UInt128(1) << 100), 1ULL));
    EXPECT_THROW(Operand::integer("-1"), InvalidArgument);
    EXPECT_THROW(Operand::integer("340282366920938463463374607431768211456"), InvalidArgument);
}

// Сравнение согласовано для случайных значений разных представлений
TEST(OperandOrderTest, TotalOrderOnRandomValues)
{
    std::vector<Bytes> values;
    for (size_t i = 0; i < 200; i++) {
        values.push_back(randomBytes());
    }
    for (size_t i = 0; i + 1 < values.size(); i++) {
        const auto &left = values[i];
        const auto &right = values[i + 1];
        const auto expected = left < right ? -1 : (left == right ? 0 : 1);

        const auto leftString = codec::render(left, Format::STRING);
        const auto rightHex = codec::render(right, Format::HEXADECIMAL);
        EXPECT_EQ(expected, compare(leftString, rightHex));
        EXPECT_EQ(expected, compare(codec::toInteger(left), bytesToString(right)));
        EXPECT_EQ(-expected, compare(rightHex, randomizeCase(leftString)));
    }
}

// Операнды из std::any
TEST(OperandOrderTest, FromAny)
{
    EXPECT_EQ(Operand::Type::NONE, Operand::fromAny(std::any{}).type());
    EXPECT_EQ(Operand::Type::NONE, Operand::fromAny(std::any(nullptr)).type());
    EXPECT_EQ(Operand::Type::BOOLEAN, Operand::fromAny(std::any(true)).type());
    EXPECT_EQ(Operand::Type::TEXT, Operand::fromAny(std::any(std::string("foobar"))).type());
    EXPECT_EQ(Operand::Type::IDENTIFIER, Operand::fromAny(std::any(7)).type());
    EXPECT_EQ(Operand::Type::UNSUPPORTED, Operand::fromAny(std::any(-7L)).type());
    EXPECT_EQ(Operand::Type::UNSUPPORTED, Operand::fromAny(std::any(1.5)).type());
    EXPECT_EQ("double", Operand::fromAny(std::any(1.5)).typeName());

    const auto uuid = Operand::fromAny(std::any(Uuid::max()));
    ASSERT_TRUE(uuid.bytes().has_value());
    EXPECT_EQ(Uuid::max().canonicalBytes(), *uuid.bytes());
}
} // namespace ident::tests
