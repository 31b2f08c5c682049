#include "boost/test/unit_test.hpp"
#include "../common/common.h"

#include <string>

using namespace FbDriver;

BOOST_AUTO_TEST_SUITE(CommonSuite)
BOOST_AUTO_TEST_SUITE(UtilsSuite)


BOOST_AUTO_TEST_CASE(VaxIntegerTest)
{
	const UCHAR positive[] = {0x10, 0x27, 0x00, 0x00};
	BOOST_TEST(vaxInteger(positive, 4) == 10000);
	BOOST_TEST(vaxInteger(positive, 2) == 10000);

	const UCHAR negative[] = {0xFE, 0xFF};
	BOOST_TEST(vaxInteger(negative, 2) == -2);

	BOOST_TEST(vaxInteger(positive, 0) == 0);
	BOOST_TEST(vaxInteger(nullptr, 2) == 0);

	UCHAR buffer[4];
	putVaxInteger(buffer, 70000, 4);
	BOOST_TEST(vaxInteger(buffer, 4) == 70000);
}

BOOST_AUTO_TEST_CASE(PrintfStringTest)
{
	BOOST_TEST(printfString("%s=%d", "dialect", 3) == "dialect=3");

	const std::string longText(3000, 'x');
	BOOST_TEST(printfString("[%s]", longText.c_str()).length() == 3002u);
}

BOOST_AUTO_TEST_CASE(TruncateCharsTest)
{
	BOOST_TEST(truncateChars("abcdef", 0, 4) == "abcd");
	BOOST_TEST(truncateChars("ab", 0, 4) == "ab");

	// two-byte UTF-8 characters
	const std::string text = "\xC3\xA1\xC3\xA9\xC3\xAD";
	BOOST_TEST(truncateChars(text, CS_UTF8, 2) == "\xC3\xA1\xC3\xA9");
	BOOST_TEST(truncateChars(text, CS_UTF8, 5) == text);

	BOOST_TEST(bytesPerChar(CS_UTF8) == 4u);
	BOOST_TEST(bytesPerChar(CS_UNICODE_FSS) == 3u);
	BOOST_TEST(bytesPerChar(CS_OCTETS) == 1u);
}


BOOST_AUTO_TEST_SUITE_END()	// UtilsSuite
BOOST_AUTO_TEST_SUITE_END()	// CommonSuite
