#include "boost/test/unit_test.hpp"
#include "../driver/ArrayCodec.h"
#include "../driver/ValueCodec.h"
#include "../driver/tests/TestFakes.h"

#include <string.h>

using namespace FbDriver;
using namespace FbDriverTest;

namespace
{
	ArrayDescriptor makeDesc(UCHAR dtype, unsigned short length, const std::vector<unsigned>& dims,
		int scale = 0, int subType = 0)
	{
		ArrayDescriptor result;
		memset(&result.desc, 0, sizeof(result.desc));

		result.desc.array_desc_dtype = dtype;
		result.desc.array_desc_length = length;
		result.desc.array_desc_scale = (ISC_SCHAR) scale;
		result.desc.array_desc_dimensions = (short) dims.size();

		for (unsigned i = 0; i < dims.size(); ++i)
		{
			result.desc.array_desc_bounds[i].array_bound_lower = 1;
			result.desc.array_desc_bounds[i].array_bound_upper = (short) dims[i];
		}

		result.subType = subType;
		return result;
	}

	Value intList(std::initializer_list<int> items)
	{
		ValueList list;
		for (const int item : items)
			list.push_back(item);
		return Value::array(list);
	}

	Value textList(std::initializer_list<const char*> items)
	{
		ValueList list;
		for (const char* item : items)
			list.push_back(item);
		return Value::array(list);
	}
}

BOOST_AUTO_TEST_SUITE(DriverSuite)
BOOST_AUTO_TEST_SUITE(ArrayCodecSuite)


BOOST_AUTO_TEST_CASE(IntegerMatrixTest)
{
	FakeConverter converter;
	const ArrayCodec codec(converter, makeDesc(blr_long, 4, {2, 3}), 3);

	BOOST_TEST(codec.getElementSize() == 4u);
	BOOST_TEST(codec.getDimensions().size() == 2u);
	BOOST_TEST(codec.getTotalSize() == 24u);

	ValueList rows;
	rows.push_back(intList({1, 2, 3}));
	rows.push_back(intList({4, 5, -6}));
	const Value matrix = Value::array(rows);

	Bytes buffer;
	codec.flatten(matrix, buffer);

	BOOST_TEST(buffer.size() == 24u);
	BOOST_TEST(vaxInteger(buffer.data(), 4) == 1);
	BOOST_TEST(vaxInteger(buffer.data() + 12, 4) == 4);
	BOOST_TEST(vaxInteger(buffer.data() + 20, 4) == -6);

	const Value rebuilt = codec.rebuild(buffer);
	BOOST_TEST((rebuilt == matrix));
	BOOST_TEST(rebuilt.asArray()[1].asArray()[2].asInteger() == -6);
}

BOOST_AUTO_TEST_CASE(ShapeValidationTest)
{
	FakeConverter converter;
	const ArrayCodec codec(converter, makeDesc(blr_long, 4, {2, 3}), 3);

	ValueList rows;
	rows.push_back(intList({1, 2, 3}));
	BOOST_TEST(!codec.validate(Value::array(rows)));

	rows.push_back(intList({4, 5}));
	BOOST_TEST(!codec.validate(Value::array(rows)));

	rows[1] = textList({"4", "5", "6"});
	BOOST_TEST(!codec.validate(Value::array(rows)));

	BOOST_TEST(!codec.validate(Value(5)));

	Bytes buffer;

	try
	{
		codec.flatten(Value::array(rows), buffer);
		BOOST_FAIL("DataError expected");
	}
	catch (const DataError& ex)
	{
		BOOST_TEST(ex.getMessage() == "Incorrect ARRAY field value.");
		BOOST_TEST(ex.getSqlState() == "22000");
	}
}

BOOST_AUTO_TEST_CASE(FixedPointElementsTest)
{
	FakeConverter converter;
	const ArrayCodec codec(converter, makeDesc(blr_short, 2, {2}, -2, 1), 3);

	ValueList items;
	items.push_back(Decimal::fromString("1.25"));
	items.push_back(Decimal::fromString("-0.5"));

	Bytes buffer;
	codec.flatten(Value::array(items), buffer);

	BOOST_TEST(vaxInteger(buffer.data(), 2) == 125);
	BOOST_TEST(vaxInteger(buffer.data() + 2, 2) == -50);

	const Value rebuilt = codec.rebuild(buffer);
	BOOST_TEST(rebuilt.asArray()[0].asDecimal().toString() == "1.25");
	BOOST_TEST(rebuilt.asArray()[1].asDecimal().toString() == "-0.50");

	// plain integers are not accepted by NUMERIC arrays
	BOOST_TEST(!codec.validate(intList({1, 2})));

	items[0] = Decimal::fromString("400");
	BOOST_CHECK_THROW(codec.flatten(Value::array(items), buffer), DataError);
}

BOOST_AUTO_TEST_CASE(VaryingElementsTest)
{
	FakeConverter converter;
	const ArrayCodec codec(converter, makeDesc(blr_varying, 3, {2}), 3);

	BOOST_TEST(codec.getElementSize() == 5u);

	Bytes buffer;
	codec.flatten(textList({"ab", "xyz"}), buffer);

	BOOST_TEST(buffer.size() == 10u);
	BOOST_TEST(std::string(reinterpret_cast<const char*>(buffer.data())) == "ab");

	const Value rebuilt = codec.rebuild(buffer);
	BOOST_TEST(rebuilt.asArray()[0].asText() == "ab");
	BOOST_TEST(rebuilt.asArray()[1].asText() == "xyz");

	try
	{
		codec.flatten(textList({"ab", "long"}), buffer);
		BOOST_FAIL("DataError expected");
	}
	catch (const DataError& ex)
	{
		BOOST_TEST(ex.getSqlState() == "22001");
		BOOST_TEST(ex.getMessage() == "ARRAY value of parameter is too long, expected 3, found 4");
	}
}

BOOST_AUTO_TEST_CASE(CharElementsTest)
{
	FakeConverter converter;
	const ArrayCodec codec(converter, makeDesc(blr_text, 4, {1}), 3);

	Bytes buffer;
	codec.flatten(textList({"ab"}), buffer);

	BOOST_TEST(std::string(buffer.begin(), buffer.end()) == "ab  ");
	BOOST_TEST(codec.rebuild(buffer).asArray()[0].asText() == "ab  ");
}

BOOST_AUTO_TEST_CASE(DateElementsTest)
{
	FakeConverter converter;
	const ArrayCodec codec(converter, makeDesc(blr_sql_date, 4, {2}), 3);

	const Date first = {2000, 1, 1};
	const Date second = {1858, 11, 17};

	ValueList items;
	items.push_back(first);
	items.push_back(second);

	Bytes buffer;
	codec.flatten(Value::array(items), buffer);

	BOOST_TEST(vaxInteger(buffer.data() + 4, 4) == 0);

	const Value rebuilt = codec.rebuild(buffer);
	BOOST_TEST((rebuilt.asArray()[0].asDate() == first));
	BOOST_TEST((rebuilt.asArray()[1].asDate() == second));
}

BOOST_AUTO_TEST_CASE(InvalidDescriptorTest)
{
	FakeConverter converter;

	BOOST_CHECK_THROW(ArrayCodec(converter, makeDesc(blr_long, 4, {}), 3), InterfaceError);

	ArrayDescriptor desc = makeDesc(blr_long, 4, {2});
	desc.desc.array_desc_bounds[0].array_bound_lower = 5;
	BOOST_CHECK_THROW(ArrayCodec(converter, desc, 3), InterfaceError);

	const ArrayCodec codec(converter, makeDesc(blr_long, 4, {2}), 3);
	BOOST_CHECK_THROW(codec.rebuild(Bytes(4)), InterfaceError);
}

BOOST_AUTO_TEST_CASE(ArrayParameterTest)
{
	FakeConverter converter;
	FakeLobAccess lobs;
	lobs.arrayDesc = makeDesc(blr_long, 4, {3});

	ValueCodec codec(converter, &lobs, 3);

	LayoutBuilder builder;
	builder.add(SQL_ARRAY, 8, 0, 0, 0, "SCORES");
	const MessageLayout& layout = builder.get();

	ValueList params;
	params.push_back(intList({7, 8, 9}));

	Bytes buffer;
	codec.encode(layout, params, buffer);

	BOOST_TEST(lobs.lookups.size() == 1u);
	BOOST_TEST(lobs.lookups[0] == "T.SCORES");
	BOOST_TEST(lobs.slices.size() == 1u);
	BOOST_TEST(lobs.slices[0].size() == 12u);

	const Row row = codec.decode(layout, buffer);

	BOOST_TEST(row[0].getKind() == Value::ARRAY);
	BOOST_TEST((row[0] == intList({7, 8, 9})));
}


BOOST_AUTO_TEST_SUITE_END()	// ArrayCodecSuite
BOOST_AUTO_TEST_SUITE_END()	// DriverSuite
