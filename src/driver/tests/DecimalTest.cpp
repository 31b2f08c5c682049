#include "boost/test/unit_test.hpp"
#include "../driver/Decimal.h"
#include "../common/fbd_exception.h"

#include <string>

using namespace FbDriver;

BOOST_AUTO_TEST_SUITE(DriverSuite)
BOOST_AUTO_TEST_SUITE(DecimalSuite)


BOOST_AUTO_TEST_CASE(FromStringTest)
{
	BOOST_TEST(Decimal::fromString("123.45").toString() == "123.45");
	BOOST_TEST(Decimal::fromString("-0.005").toString() == "-0.005");
	BOOST_TEST(Decimal::fromString("+7").toString() == "7");
	BOOST_TEST(Decimal::fromString("1e3").toString() == "1000");
	BOOST_TEST(Decimal::fromString("15E-1").toString() == "1.5");
	BOOST_TEST(Decimal::fromString("007.10").getDigits() == "710");
	BOOST_TEST(Decimal::fromString("007.10").getExponent() == -2);

	const Decimal zero = Decimal::fromString("-0.00");
	BOOST_TEST(zero.isZero());
	BOOST_TEST(!zero.isNegative());
	BOOST_TEST(zero.toString() == "0.00");
}

BOOST_AUTO_TEST_CASE(InvalidTextTest)
{
	BOOST_CHECK_THROW(Decimal::fromString(""), DataError);
	BOOST_CHECK_THROW(Decimal::fromString("abc"), DataError);
	BOOST_CHECK_THROW(Decimal::fromString("1.2.3"), DataError);
	BOOST_CHECK_THROW(Decimal::fromString("1e"), DataError);
	BOOST_CHECK_THROW(Decimal::fromString("-"), DataError);
}

BOOST_AUTO_TEST_CASE(UnscaledConstructorTest)
{
	BOOST_TEST(Decimal(12345, -2).toString() == "123.45");
	BOOST_TEST(Decimal(-5, -3).toString() == "-0.005");
	BOOST_TEST(Decimal(12, 2).toString() == "1200");
	BOOST_TEST(Decimal(0, -2).toString() == "0.00");
	BOOST_TEST(Decimal(INT64_MIN, 0).toString() == "-9223372036854775808");
}

BOOST_AUTO_TEST_CASE(RoundHalfEvenTest)
{
	BOOST_TEST(Decimal::fromString("0.15").rescaled(-1).toString() == "0.2");
	BOOST_TEST(Decimal::fromString("0.25").rescaled(-1).toString() == "0.2");
	BOOST_TEST(Decimal::fromString("2.5").rescaled(0).toString() == "2");
	BOOST_TEST(Decimal::fromString("3.5").rescaled(0).toString() == "4");
	BOOST_TEST(Decimal::fromString("-2.5").rescaled(0).toString() == "-2");
	BOOST_TEST(Decimal::fromString("2.501").rescaled(0).toString() == "3");
	BOOST_TEST(Decimal::fromString("9.99").rescaled(-1).toString() == "10.0");
	BOOST_TEST(Decimal::fromString("0.05").rescaled(-1).toString() == "0.0");
	BOOST_TEST(Decimal::fromString("0.004").rescaled(-1).toString() == "0.0");
}

BOOST_AUTO_TEST_CASE(RescaleUpTest)
{
	const Decimal value = Decimal(15, -1).rescaled(-3);

	BOOST_TEST(value.toString() == "1.500");
	BOOST_TEST(value.getExponent() == -3);

	SINT64 unscaled = 0;
	BOOST_TEST(value.getUnscaled(unscaled));
	BOOST_TEST(unscaled == 1500);
}

BOOST_AUTO_TEST_CASE(UnscaledBoundsTest)
{
	SINT64 value = 0;

	BOOST_TEST(Decimal::fromString("9223372036854775807").getUnscaled(value));
	BOOST_TEST(value == INT64_MAX);

	BOOST_TEST(Decimal::fromString("-9223372036854775808").getUnscaled(value));
	BOOST_TEST(value == INT64_MIN);

	BOOST_TEST(!Decimal::fromString("9223372036854775808").getUnscaled(value));
	BOOST_TEST(!Decimal::fromString("-9223372036854775809").getUnscaled(value));
}

BOOST_AUTO_TEST_CASE(NumericEqualityTest)
{
	BOOST_TEST((Decimal::fromString("1.50") == Decimal::fromString("1.5")));
	BOOST_TEST((Decimal::fromString("100") == Decimal(1, 2)));
	BOOST_TEST((Decimal::fromString("0.0") == Decimal()));
	BOOST_TEST((Decimal::fromString("1.5") != Decimal::fromString("-1.5")));
	BOOST_TEST((Decimal::fromString("1.5") != Decimal::fromString("15")));
}

BOOST_AUTO_TEST_CASE(ToDoubleTest)
{
	BOOST_TEST(Decimal::fromString("-12.25").toDouble() == -12.25);
}


BOOST_AUTO_TEST_SUITE_END()	// DecimalSuite
BOOST_AUTO_TEST_SUITE_END()	// DriverSuite
