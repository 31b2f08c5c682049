/*
 *	PROGRAM:		Firebird client driver.
 *	MODULE:			Value.cpp
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

#include "../driver/Value.h"
#include "../common/fbd_exception.h"

#include <stdio.h>

namespace FbDriver {

const char* Value::kindName(Kind kind)
{
	static const char* const NAMES[] = {
		"NULL", "BOOLEAN", "INTEGER", "FLOAT", "DECIMAL", "DECFLOAT", "TEXT", "BINARY",
		"DATE", "TIME", "TIMESTAMP", "TIME WITH TIME ZONE", "TIMESTAMP WITH TIME ZONE",
		"BLOB STREAM", "BLOB READER", "ARRAY"
	};

	const unsigned index = unsigned(kind);
	return index < sizeof(NAMES) / sizeof(NAMES[0]) ? NAMES[index] : "UNKNOWN";
}

template <typename T>
const T& Value::get(Kind kind) const
{
	const T* const ptr = std::get_if<T>(&m_data);

	if (!ptr)
	{
		InterfaceError::raise("Value of type %s used as %s",
			kindName(getKind()), kindName(kind));
	}

	return *ptr;
}

bool Value::asBoolean() const
{
	return get<bool>(BOOLEAN);
}

SINT64 Value::asInteger() const
{
	return get<SINT64>(INTEGER);
}

double Value::asDouble() const
{
	if (getKind() == INTEGER)
		return double(asInteger());

	if (getKind() == DECIMAL)
		return asDecimal().toDouble();

	return get<double>(FLOAT);
}

const Decimal& Value::asDecimal() const
{
	return get<Decimal>(DECIMAL);
}

const DecFloat& Value::asDecFloat() const
{
	return get<DecFloat>(DECFLOAT);
}

const std::string& Value::asText() const
{
	return get<std::string>(TEXT);
}

const Bytes& Value::asBytes() const
{
	return get<Bytes>(BINARY);
}

const Date& Value::asDate() const
{
	return get<Date>(DATE);
}

const Time& Value::asTime() const
{
	return get<Time>(TIME);
}

const TimeStamp& Value::asTimeStamp() const
{
	return get<TimeStamp>(TIMESTAMP);
}

const TimeTz& Value::asTimeTz() const
{
	return get<TimeTz>(TIME_TZ);
}

const TimeStampTz& Value::asTimeStampTz() const
{
	return get<TimeStampTz>(TIMESTAMP_TZ);
}

std::shared_ptr<std::istream> Value::asStream() const
{
	return get<std::shared_ptr<std::istream> >(BLOB_STREAM);
}

std::shared_ptr<BlobReader> Value::asReader() const
{
	return get<std::shared_ptr<BlobReader> >(BLOB_READER);
}

const ValueList& Value::asArray() const
{
	return *get<std::shared_ptr<ValueList> >(ARRAY);
}

std::string Value::toString() const
{
	switch (getKind())
	{
	case NULL_VALUE:
		return "";

	case BOOLEAN:
		return asBoolean() ? "TRUE" : "FALSE";

	case INTEGER:
		return std::to_string(asInteger());

	case FLOAT:
	{
		char buffer[BUFFER_TINY];
		snprintf(buffer, sizeof(buffer), "%.17g", get<double>(FLOAT));
		return buffer;
	}

	case DECIMAL:
		return asDecimal().toString();

	case DECFLOAT:
		return asDecFloat().text;

	case TEXT:
		return asText();

	case BINARY:
		return std::string(asBytes().begin(), asBytes().end());

	case DATE:
	{
		const Date& d = asDate();
		return printfString("%04d-%02u-%02u", d.year, d.month, d.day);
	}

	case TIME:
	{
		const Time& t = asTime();
		return printfString("%02u:%02u:%02u.%04u", t.hours, t.minutes, t.seconds, t.fractions);
	}

	case TIMESTAMP:
		return Value(asTimeStamp().date).toString() + " " + Value(asTimeStamp().time).toString();

	case TIME_TZ:
		return Value(asTimeTz().time).toString() + " " + asTimeTz().zone;

	case TIMESTAMP_TZ:
		return Value(asTimeStampTz().timeStamp).toString() + " " + asTimeStampTz().zone;

	default:
		InterfaceError::raise("Value of type %s has no text form", kindName(getKind()));
	}
}

bool Value::operator==(const Value& other) const
{
	if (getKind() != other.getKind())
		return false;

	if (getKind() == ARRAY)
		return asArray() == other.asArray();

	return m_data == other.m_data;
}

} // namespace FbDriver
