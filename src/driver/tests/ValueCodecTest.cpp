#include "boost/test/unit_test.hpp"
#include "../driver/ValueCodec.h"
#include "../driver/BlobReader.h"
#include "../driver/tests/TestFakes.h"

#include <sstream>
#include <string>

using namespace FbDriver;
using namespace FbDriverTest;

namespace
{
	SINT64 intAt(const Bytes& buffer, const MessageField& field)
	{
		return vaxInteger(buffer.data() + field.offset, field.length);
	}

	SSHORT nullAt(const Bytes& buffer, const MessageField& field)
	{
		SSHORT flag;
		memcpy(&flag, buffer.data() + field.nullOffset, sizeof(flag));
		return flag;
	}

	std::string textAt(const Bytes& buffer, const MessageField& field)
	{
		return std::string(reinterpret_cast<const char*>(buffer.data()) + field.offset, field.length);
	}

	class CodecFixture
	{
	public:
		CodecFixture()
			: codec(converter, &lobs, 3)
		{ }

		FakeConverter converter;
		FakeLobAccess lobs;
		ValueCodec codec;
	};
}

BOOST_AUTO_TEST_SUITE(DriverSuite)
BOOST_FIXTURE_TEST_SUITE(ValueCodecSuite, CodecFixture)


BOOST_AUTO_TEST_CASE(EncodeNumbersAndTextTest)
{
	LayoutBuilder builder;
	builder.add(SQL_LONG, 4).add(SQL_VARYING, 12).add(SQL_SHORT, 2, -2, 1).add(SQL_LONG, 4);
	const MessageLayout& layout = builder.get();

	ValueList params;
	params.push_back(42);
	params.push_back("abc");
	params.push_back(Decimal::fromString("1.235"));
	params.push_back(Value());

	Bytes buffer;
	codec.encode(layout, params, buffer);

	BOOST_TEST(buffer.size() == layout.getLength());
	BOOST_TEST(intAt(buffer, layout[0]) == 42);
	BOOST_TEST(nullAt(buffer, layout[0]) == 0);
	BOOST_TEST(textAt(buffer, layout[1]).substr(0, 5) == std::string("\x03\x00" "abc", 5));
	BOOST_TEST(intAt(buffer, layout[2]) == 124);
	BOOST_TEST(nullAt(buffer, layout[3]) == -1);

	const Row row = codec.decode(layout, buffer);

	BOOST_TEST(row.size() == 4u);
	BOOST_TEST(row[0].asInteger() == 42);
	BOOST_TEST(row[1].asText() == "abc");
	BOOST_TEST(row[2].asDecimal().toString() == "1.24");
	BOOST_TEST(row[3].isNull());
}

BOOST_AUTO_TEST_CASE(CharPaddingTest)
{
	LayoutBuilder builder;
	builder.add(SQL_TEXT, 5).add(SQL_TEXT, 8, 0, 0, CS_UTF8);
	const MessageLayout& layout = builder.get();

	ValueList params;
	params.push_back("ab");
	params.push_back("\xC3\xA1");

	Bytes buffer;
	codec.encode(layout, params, buffer);

	BOOST_TEST(textAt(buffer, layout[0]) == "ab   ");

	const Row row = codec.decode(layout, buffer);

	BOOST_TEST(row[0].asText() == "ab   ");
	// CHAR(2) of UTF8 reserves 8 bytes, two characters are returned
	BOOST_TEST(row[1].asText() == "\xC3\xA1 ");
}

BOOST_AUTO_TEST_CASE(OctetsTest)
{
	LayoutBuilder builder;
	builder.add(SQL_TEXT, 3, 0, 0, CS_OCTETS).add(SQL_VARYING, 6, 0, 0, CS_OCTETS);
	const MessageLayout& layout = builder.get();

	Bytes buffer(layout.getLength(), 0);
	memcpy(buffer.data() + layout[0].offset, "\x01\x02\x03", 3);
	const USHORT length = 2;
	memcpy(buffer.data() + layout[1].offset, &length, sizeof(length));
	memcpy(buffer.data() + layout[1].offset + 2, "\xFF\x00", 2);

	const Row row = codec.decode(layout, buffer);

	BOOST_TEST(row[0].getKind() == Value::BINARY);
	BOOST_TEST(row[0].asBytes().size() == 3u);
	BOOST_TEST(row[0].asBytes()[2] == 3);
	BOOST_TEST(row[1].getKind() == Value::BINARY);
	BOOST_TEST(row[1].asBytes().size() == 2u);
	BOOST_TEST(row[1].asBytes()[0] == 0xFF);
}

BOOST_AUTO_TEST_CASE(StringTruncationTest)
{
	LayoutBuilder builder;
	builder.add(SQL_VARYING, 5).add(SQL_TEXT, 3);
	const MessageLayout& layout = builder.get();

	Bytes buffer;

	ValueList params;
	params.push_back("abcdef");
	params.push_back("x");

	try
	{
		codec.encode(layout, params, buffer);
		BOOST_FAIL("DataError expected");
	}
	catch (const DataError& ex)
	{
		BOOST_TEST(ex.getSqlState() == "22001");
		BOOST_TEST(ex.getMessage() ==
			"string right truncation: value of parameter (0) is too long, expected 5, found 6");
	}

	params[0] = "abcde";
	params[1] = "wxyz";
	BOOST_CHECK_THROW(codec.encode(layout, params, buffer), DataError);

	// both values fill the whole item
	params[1] = "xyz";
	BOOST_CHECK_NO_THROW(codec.encode(layout, params, buffer));
	BOOST_TEST(textAt(buffer, layout[0]).substr(0, 2) == std::string("\x05\x00", 2));
}

BOOST_AUTO_TEST_CASE(FullWidthVarcharTest)
{
	LayoutBuilder builder;
	builder.add(SQL_VARYING, 5).add(SQL_VARYING, 2).add(SQL_LONG, 4);
	const MessageLayout& layout = builder.get();

	BOOST_TEST(layout[0].nullOffset == layout[0].offset + 8u);

	Bytes buffer(layout.getLength(), 0);

	USHORT length = 5;
	memcpy(buffer.data() + layout[0].offset, &length, sizeof(length));
	memcpy(buffer.data() + layout[0].offset + 2, "hello", 5);

	length = 2;
	memcpy(buffer.data() + layout[1].offset, &length, sizeof(length));
	memcpy(buffer.data() + layout[1].offset + 2, "ok", 2);

	const SLONG number = 17;
	memcpy(buffer.data() + layout[2].offset, &number, sizeof(number));

	Row row = codec.decode(layout, buffer);

	BOOST_TEST(row[0].asText() == "hello");
	BOOST_TEST(row[1].asText() == "ok");
	BOOST_TEST(row[2].asInteger() == 17);

	// length above the declared one is a broken message
	length = 3;
	memcpy(buffer.data() + layout[1].offset, &length, sizeof(length));
	BOOST_CHECK_THROW(codec.decode(layout, buffer), InterfaceError);

	// encoded full width values read back unchanged
	ValueList params;
	params.push_back("world");
	params.push_back("no");
	params.push_back(3);

	codec.encode(layout, params, buffer);
	row = codec.decode(layout, buffer);

	BOOST_TEST(row[0].asText() == "world");
	BOOST_TEST(row[1].asText() == "no");
	BOOST_TEST(row[2].asInteger() == 3);
}

BOOST_AUTO_TEST_CASE(NumericOverflowTest)
{
	LayoutBuilder builder;
	builder.add(SQL_SHORT, 2, -2, 1).add(SQL_SHORT, 2);
	const MessageLayout& layout = builder.get();

	Bytes buffer;
	ValueList params;
	params.push_back(Decimal::fromString("400.00"));
	params.push_back(1);

	try
	{
		codec.encode(layout, params, buffer);
		BOOST_FAIL("DataError expected");
	}
	catch (const DataError& ex)
	{
		BOOST_TEST(ex.getSqlState() == "22003");
		BOOST_TEST(ex.getMessage().find("numeric overflow: value 40000\n(NUMERIC scaled for") == 0u);
		BOOST_TEST(ex.getMessage().find("internal storage type SHORT") != std::string::npos);
		BOOST_TEST(ex.getMessage().find("[-32768,32767]") != std::string::npos);
	}

	params[0] = Decimal::fromString("327.67");
	params[1] = 70000;
	BOOST_CHECK_THROW(codec.encode(layout, params, buffer), DataError);

	params[1] = -32768;
	codec.encode(layout, params, buffer);
	BOOST_TEST(intAt(buffer, layout[0]) == 32767);
	BOOST_TEST(intAt(buffer, layout[1]) == -32768);
}

BOOST_AUTO_TEST_CASE(ScaleIntegerTest)
{
	BOOST_TEST(ValueCodec::scaleInteger(Value(5), 3, SQL_LONG, 1, -2) == 500);
	BOOST_TEST(ValueCodec::scaleInteger(Value(0.125), 3, SQL_LONG, 1, -2) == 12);
	BOOST_TEST(ValueCodec::scaleInteger(Value(2.5), 3, SQL_LONG, 1, 0) == 2);
	BOOST_TEST(ValueCodec::scaleInteger(Value(Decimal::fromString("-0.005")), 3, SQL_INT64, 2, -2) == 0);
	BOOST_TEST(ValueCodec::scaleInteger(Value(Decimal::fromString("-0.015")), 3, SQL_INT64, 2, -2) == -2);
	BOOST_TEST(ValueCodec::scaleInteger(Value(-7), 3, SQL_INT64, 0, 0) == -7);

	BOOST_CHECK_THROW(ValueCodec::scaleInteger(Value("1"), 3, SQL_LONG, 1, -2), InterfaceError);
	BOOST_CHECK_THROW(ValueCodec::scaleInteger(Value(1e30), 3, SQL_INT64, 1, -2), DataError);
}

BOOST_AUTO_TEST_CASE(ParameterCountTest)
{
	LayoutBuilder builder;
	builder.add(SQL_LONG, 4).add(SQL_LONG, 4);

	ValueList params;
	params.push_back(1);

	try
	{
		ValueCodec::checkParameterCount(builder.get(), params);
		BOOST_FAIL("ProgrammingError expected");
	}
	catch (const ProgrammingError& ex)
	{
		BOOST_TEST(ex.getSqlState() == "07001");
		BOOST_TEST(ex.getMessage() ==
			"Statement parameter sequence contains 1 items, but exactly 2 are required");
	}

	params.push_back(2);
	params.push_back(3);
	BOOST_CHECK_THROW(ValueCodec::checkParameterCount(builder.get(), params), ProgrammingError);
}

BOOST_AUTO_TEST_CASE(NoParametersTest)
{
	const MessageLayout empty;

	ValueList params;
	params.push_back(1);
	params.push_back("unused");

	BOOST_CHECK_NO_THROW(ValueCodec::checkParameterCount(empty, params));
	BOOST_TEST(ValueCodec::textOverrides(empty, params).empty());

	Bytes buffer(4, 1);
	codec.encode(empty, params, buffer);
	BOOST_TEST(buffer.empty());
}

BOOST_AUTO_TEST_CASE(TextOverridesTest)
{
	LayoutBuilder builder;
	builder.add(SQL_LONG, 4).add(SQL_BLOB, 8, 0, isc_blob_text).add(SQL_VARYING, 12).add(SQL_TEXT, 4)
		.add(SQL_LONG, 4);

	ValueList params;
	params.push_back("12");
	params.push_back("blob text");
	params.push_back(5);
	params.push_back(Value());
	params.push_back(7);

	const std::vector<TextOverride> overrides = ValueCodec::textOverrides(builder.get(), params);

	BOOST_TEST(overrides.size() == 2u);
	BOOST_TEST(overrides[0].index == 0u);
	BOOST_TEST(overrides[0].length == 2u);
	BOOST_TEST(overrides[1].index == 2u);
	BOOST_TEST(overrides[1].length == 1u);
}

BOOST_AUTO_TEST_CASE(DateTimeTest)
{
	LayoutBuilder builder;
	builder.add(SQL_TYPE_DATE, 4).add(SQL_TYPE_TIME, 4).add(SQL_TIMESTAMP, 8);
	const MessageLayout& layout = builder.get();

	const Date date = {1858, 11, 18};
	const Time time = {13, 30, 15, 2500};
	const TimeStamp ts = {{2024, 2, 29}, {23, 59, 59, 9999}};

	ValueList params;
	params.push_back(date);
	params.push_back(time);
	params.push_back(ts);

	Bytes buffer;
	codec.encode(layout, params, buffer);

	BOOST_TEST(intAt(buffer, layout[0]) == 1);
	BOOST_TEST(intAt(buffer, layout[1]) == 486152500);

	const Row row = codec.decode(layout, buffer);

	BOOST_TEST((row[0].asDate() == date));
	BOOST_TEST((row[1].asTime() == time));
	BOOST_TEST((row[2].asTimeStamp() == ts));
	BOOST_TEST(row[2].toString() == "2024-02-29 23:59:59.9999");
}

BOOST_AUTO_TEST_CASE(BooleanAndFloatTest)
{
	LayoutBuilder builder;
	builder.add(SQL_BOOLEAN, 1).add(SQL_BOOLEAN, 1).add(SQL_DOUBLE, 8).add(SQL_FLOAT, 4);
	const MessageLayout& layout = builder.get();

	ValueList params;
	params.push_back(true);
	params.push_back(0);
	params.push_back(3);
	params.push_back(0.5);

	Bytes buffer;
	codec.encode(layout, params, buffer);

	const Row row = codec.decode(layout, buffer);

	BOOST_TEST(row[0].asBoolean());
	BOOST_TEST(!row[1].asBoolean());
	BOOST_TEST(row[2].asDouble() == 3.0);
	BOOST_TEST(row[3].asDouble() == 0.5);
}

BOOST_AUTO_TEST_CASE(DialectOneFixedPointTest)
{
	ValueCodec dialect1(converter, &lobs, 1);

	LayoutBuilder builder;
	builder.add(SQL_DOUBLE, 8, -1);
	const MessageLayout& layout = builder.get();

	Bytes buffer(layout.getLength(), 0);
	const double number = 12.5;
	memcpy(buffer.data() + layout[0].offset, &number, sizeof(number));

	const Row row = dialect1.decode(layout, buffer);

	BOOST_TEST(row[0].getKind() == Value::DECIMAL);
	BOOST_TEST(row[0].asDecimal().toString() == "12.5");

	BOOST_TEST(ValueCodec::isFixedPoint(1, SQL_DOUBLE, 0, -2));
	BOOST_TEST(!ValueCodec::isFixedPoint(3, SQL_DOUBLE, 0, -2));
	BOOST_TEST(ValueCodec::isFixedPoint(3, SQL_INT64, 1, 0));
}

BOOST_AUTO_TEST_CASE(TextBlobTest)
{
	LayoutBuilder builder;
	builder.add(SQL_BLOB, 8, 0, isc_blob_text);
	const MessageLayout& layout = builder.get();

	ValueList params;
	params.push_back("hello world");

	Bytes buffer;
	codec.encode(layout, params, buffer);

	BOOST_TEST(lobs.blobs.size() == 1u);
	BOOST_TEST(lobs.blobs[0]->content == "hello world");
	BOOST_TEST(!lobs.blobs[0]->stream);
	BOOST_TEST(lobs.openCount == 0u);

	const Row row = codec.decode(layout, buffer);

	BOOST_TEST(row[0].getKind() == Value::TEXT);
	BOOST_TEST(row[0].asText() == "hello world");
	BOOST_TEST(lobs.openCount == 0u);
}

BOOST_AUTO_TEST_CASE(BinaryBlobTest)
{
	LayoutBuilder builder;
	builder.add(SQL_BLOB, 8);
	const MessageLayout& layout = builder.get();

	ValueList params;
	params.push_back("not binary");

	Bytes buffer;
	BOOST_CHECK_THROW(codec.encode(layout, params, buffer), InterfaceError);

	const UCHAR raw[] = {0, 1, 2, 250};
	params[0] = Bytes(raw, raw + sizeof(raw));
	codec.encode(layout, params, buffer);

	const Row row = codec.decode(layout, buffer);

	BOOST_TEST(row[0].getKind() == Value::BINARY);
	BOOST_TEST(row[0].asBytes().size() == 4u);
	BOOST_TEST(row[0].asBytes()[3] == 250);

	params[0] = 15;
	BOOST_CHECK_THROW(codec.encode(layout, params, buffer), InterfaceError);
}

BOOST_AUTO_TEST_CASE(StreamParameterTest)
{
	LayoutBuilder builder;
	builder.add(SQL_BLOB, 8);
	const MessageLayout& layout = builder.get();

	const std::string content(MAX_BLOB_SEGMENT_SIZE + 10, 'z');
	std::shared_ptr<std::istream> stream = std::make_shared<std::istringstream>(content);

	ValueList params;
	params.push_back(stream);

	Bytes buffer;
	codec.encode(layout, params, buffer);

	BOOST_TEST(lobs.blobs.size() == 1u);
	BOOST_TEST(lobs.blobs[0]->stream);
	BOOST_TEST(lobs.blobs[0]->content == content);
}

BOOST_AUTO_TEST_CASE(BlobReaderThresholdTest)
{
	LayoutBuilder builder;
	builder.add(SQL_BLOB, 8, 0, isc_blob_text, 0, "MEMO").add(SQL_BLOB, 8, 0, isc_blob_text, 0, "NOTE");
	const MessageLayout& layout = builder.get();

	const ISC_QUAD memoId = lobs.addBlob("0123456789");
	const ISC_QUAD noteId = lobs.addBlob("short");

	Bytes buffer(layout.getLength(), 0);
	memcpy(buffer.data() + layout[0].offset, &memoId, sizeof(memoId));
	memcpy(buffer.data() + layout[1].offset, &noteId, sizeof(noteId));

	codec.setStreamBlobThreshold(8);
	Row row = codec.decode(layout, buffer);

	BOOST_TEST(row[0].getKind() == Value::BLOB_READER);
	BOOST_TEST(row[1].getKind() == Value::TEXT);
	BOOST_TEST(lobs.readers.size() == 1u);
	BOOST_TEST(row[0].asReader()->read() == "0123456789");

	codec.setStreamBlobThreshold(0);
	std::set<std::string> names;
	names.insert("NOTE");
	codec.setStreamBlobs(names);
	row = codec.decode(layout, buffer);

	BOOST_TEST(row[0].getKind() == Value::TEXT);
	BOOST_TEST(row[1].getKind() == Value::BLOB_READER);
	BOOST_TEST(lobs.readers.size() == 2u);
}

BOOST_AUTO_TEST_CASE(MissingLobAccessTest)
{
	ValueCodec plain(converter, nullptr, 3);

	LayoutBuilder builder;
	builder.add(SQL_BLOB, 8, 0, isc_blob_text);

	ValueList params;
	params.push_back("text");

	Bytes buffer;
	BOOST_CHECK_THROW(plain.encode(builder.get(), params, buffer), InterfaceError);
}

BOOST_AUTO_TEST_CASE(DescribeColumnTest)
{
	MessageField field;
	field.field = "SALARY";
	field.alias = "PAY";
	field.type = SQL_INT64;
	field.subType = 1;
	field.scale = -2;
	field.length = 8;
	field.nullable = false;

	ColumnDescription desc = ValueCodec::describeColumn(field, 3, 10);

	BOOST_TEST(desc.name == "PAY");
	BOOST_TEST(desc.typeCode == Value::DECIMAL);
	BOOST_TEST(desc.displaySize == 20);
	BOOST_TEST(desc.internalSize == 8u);
	BOOST_TEST(desc.precision == 10);
	BOOST_TEST(desc.scale == -2);
	BOOST_TEST(!desc.nullable);

	field.alias = "SALARY";
	field.type = SQL_SHORT;
	field.subType = 0;
	field.scale = 0;
	field.length = 2;
	desc = ValueCodec::describeColumn(field, 3, 0);

	BOOST_TEST(desc.name == "SALARY");
	BOOST_TEST(desc.typeCode == Value::INTEGER);
	BOOST_TEST(desc.displaySize == 6);
	BOOST_TEST(desc.precision == 0);

	field.type = SQL_VARYING;
	field.charSet = CS_UTF8;
	field.length = 40;
	desc = ValueCodec::describeColumn(field, 3, 0);

	BOOST_TEST(desc.typeCode == Value::TEXT);
	BOOST_TEST(desc.displaySize == 10);

	field.type = SQL_BLOB;
	field.subType = 0;
	desc = ValueCodec::describeColumn(field, 3, 0);

	BOOST_TEST(desc.typeCode == Value::BINARY);
	BOOST_TEST(desc.displaySize == 0);

	field.type = SQL_TIMESTAMP;
	BOOST_TEST(ValueCodec::describeColumn(field, 3, 0).displaySize == 22);
	field.type = SQL_TYPE_TIME;
	BOOST_TEST(ValueCodec::describeColumn(field, 3, 0).displaySize == 11);
	field.type = SQL_BOOLEAN;
	BOOST_TEST(ValueCodec::describeColumn(field, 3, 0).displaySize == 5);
	field.type = SQL_ARRAY;
	BOOST_TEST(ValueCodec::describeColumn(field, 3, 0).displaySize == -1);
}

BOOST_AUTO_TEST_CASE(TypeNamesTest)
{
	BOOST_TEST(ValueCodec::externalTypeName(3, SQL_LONG, 2, -2) == "DECIMAL");
	BOOST_TEST(ValueCodec::externalTypeName(3, SQL_LONG, 0, -2) == "NUMERIC/DECIMAL");
	BOOST_TEST(ValueCodec::externalTypeName(3, SQL_LONG, 0, 0) == "INTEGER");
	BOOST_TEST(ValueCodec::externalTypeName(3, SQL_VARYING, 0, 0) == "VARCHAR");
	BOOST_TEST(std::string(ValueCodec::internalTypeName(SQL_INT64)) == "INT64");
}


BOOST_AUTO_TEST_SUITE_END()	// ValueCodecSuite
BOOST_AUTO_TEST_SUITE_END()	// DriverSuite
