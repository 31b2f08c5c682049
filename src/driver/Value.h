/*
 *	PROGRAM:		Firebird client driver.
 *	MODULE:			Value.h
 *	DESCRIPTION:	Parameter and column values.
 *
 *  The contents of this file are subject to the Initial
 *  Developer's Public License Version 1.0 (the "License");
 *  you may not use this file except in compliance with the
 *  License. You may obtain a copy of the License at
 *  http://www.ibphoenix.com/main.nfs?a=ibphoenix&page=ibp_idpl.
 *
 *  Software distributed under the License is distributed AS IS,
 *  WITHOUT WARRANTY OF ANY KIND, either express or implied.
 *  See the License for the specific language governing rights
 *  and limitations under the License.
 *
 *  The Original Code was created by the fbdriver contributors
 *  for the Firebird Open Source RDBMS project.
 *
 *  All Rights Reserved.
 *  Contributor(s): ______________________________________.
 */

#ifndef FBDRIVER_DRIVER_VALUE_H
#define FBDRIVER_DRIVER_VALUE_H

#include "../common/common.h"
#include "../driver/Decimal.h"

#include <istream>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace FbDriver {

class BlobReader;
class Value;

typedef std::vector<Value> ValueList;
typedef std::vector<Value> Row;

struct Date
{
	int year;
	unsigned month;
	unsigned day;

	bool operator==(const Date& other) const
	{
		return year == other.year && month == other.month && day == other.day;
	}
};

// fractions are in engine units, 1/10000 of a second
struct Time
{
	unsigned hours;
	unsigned minutes;
	unsigned seconds;
	unsigned fractions;

	bool operator==(const Time& other) const
	{
		return hours == other.hours && minutes == other.minutes &&
			seconds == other.seconds && fractions == other.fractions;
	}
};

struct TimeStamp
{
	Date date;
	Time time;

	bool operator==(const TimeStamp& other) const
	{
		return date == other.date && time == other.time;
	}
};

struct TimeTz
{
	Time time;
	std::string zone;

	bool operator==(const TimeTz& other) const
	{
		return time == other.time && zone == other.zone;
	}
};

struct TimeStampTz
{
	TimeStamp timeStamp;
	std::string zone;

	bool operator==(const TimeStampTz& other) const
	{
		return timeStamp == other.timeStamp && zone == other.zone;
	}
};

// DECFLOAT in the engine's own text form
struct DecFloat
{
	std::string text;

	bool operator==(const DecFloat& other) const
	{
		return text == other.text;
	}
};


class Value
{
public:
	// Order matches the alternatives of m_data
	enum Kind
	{
		NULL_VALUE,
		BOOLEAN,
		INTEGER,
		FLOAT,
		DECIMAL,
		DECFLOAT,
		TEXT,
		BINARY,
		DATE,
		TIME,
		TIMESTAMP,
		TIME_TZ,
		TIMESTAMP_TZ,
		BLOB_STREAM,
		BLOB_READER,
		ARRAY
	};

	Value()
	{ }

	Value(bool value)
		: m_data(value)
	{ }

	Value(int value)
		: m_data(SINT64(value))
	{ }

	Value(long value)
		: m_data(SINT64(value))
	{ }

	Value(long long value)
		: m_data(SINT64(value))
	{ }

	Value(double value)
		: m_data(value)
	{ }

	Value(const Decimal& value)
		: m_data(value)
	{ }

	Value(const DecFloat& value)
		: m_data(value)
	{ }

	Value(const char* value)
		: m_data(std::string(value))
	{ }

	Value(const std::string& value)
		: m_data(value)
	{ }

	Value(const Bytes& value)
		: m_data(value)
	{ }

	Value(const Date& value)
		: m_data(value)
	{ }

	Value(const Time& value)
		: m_data(value)
	{ }

	Value(const TimeStamp& value)
		: m_data(value)
	{ }

	Value(const TimeTz& value)
		: m_data(value)
	{ }

	Value(const TimeStampTz& value)
		: m_data(value)
	{ }

	// BLOB parameter read from the stream in segments
	Value(std::shared_ptr<std::istream> stream)
		: m_data(stream)
	{ }

	Value(std::shared_ptr<BlobReader> reader)
		: m_data(reader)
	{ }

	static Value array(const ValueList& items)
	{
		Value v;
		v.m_data = std::make_shared<ValueList>(items);
		return v;
	}

	Kind getKind() const
	{
		return Kind(m_data.index());
	}

	bool isNull() const
	{
		return getKind() == NULL_VALUE;
	}

	static const char* kindName(Kind kind);

	// Accessors raise InterfaceError when the value holds another kind
	bool asBoolean() const;
	SINT64 asInteger() const;
	double asDouble() const;
	const Decimal& asDecimal() const;
	const DecFloat& asDecFloat() const;
	const std::string& asText() const;
	const Bytes& asBytes() const;
	const Date& asDate() const;
	const Time& asTime() const;
	const TimeStamp& asTimeStamp() const;
	const TimeTz& asTimeTz() const;
	const TimeStampTz& asTimeStampTz() const;
	std::shared_ptr<std::istream> asStream() const;
	std::shared_ptr<BlobReader> asReader() const;
	const ValueList& asArray() const;

	// Text form used when a parameter is sent as string
	std::string toString() const;

	// Deep for arrays, numeric for decimals, identity for BLOB streams and readers
	bool operator==(const Value& other) const;

	bool operator!=(const Value& other) const
	{
		return !(*this == other);
	}

private:
	template <typename T>
	const T& get(Kind kind) const;

	typedef std::variant<
		std::monostate,
		bool,
		SINT64,
		double,
		Decimal,
		DecFloat,
		std::string,
		Bytes,
		Date,
		Time,
		TimeStamp,
		TimeTz,
		TimeStampTz,
		std::shared_ptr<std::istream>,
		std::shared_ptr<BlobReader>,
		std::shared_ptr<ValueList> > Data;

	Data m_data;
};

} // namespace FbDriver

#endif // FBDRIVER_DRIVER_VALUE_H
