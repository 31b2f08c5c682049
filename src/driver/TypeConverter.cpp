/*
 *	PROGRAM:		Firebird client driver.
 *	MODULE:			TypeConverter.cpp
 *	DESCRIPTION:	Engine formats of date, time and extended numeric types.
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

#include "../driver/TypeConverter.h"
#include "../driver/ClientLibrary.h"
#include "../driver/Interfaces.h"

using namespace Firebird;

namespace
{
	using namespace FbDriver;

	enum UtilVariant
	{
		UTIL_EXTENDED,
		UTIL_BASIC
	};

	const InterfaceVariant UTIL_VARIANTS[] = {
		{4, UTIL_EXTENDED},
		{2, UTIL_BASIC}
	};

	StatusWrapper* status()
	{
		return ClientLibrary::get().getStatus();
	}
}

namespace FbDriver {

UtilTypeConverter::UtilTypeConverter()
	: UtilTypeConverter(ClientLibrary::get().getUtil())
{ }

UtilTypeConverter::UtilTypeConverter(IUtil* util)
	: m_util(checkInterface(util))
{
	if (!m_util)
		InterfaceError::raise("Utility interface is not available");

	m_extended = negotiateVersion("IUtil", interfaceVersion(m_util), UTIL_VARIANTS) == UTIL_EXTENDED;
}

void UtilTypeConverter::checkExtended(const char* what) const
{
	if (!m_extended)
	{
		throw NotSupportedError(printfString("%s requires client library version 4 or later", what),
			"0A000");
	}
}

ISC_DATE UtilTypeConverter::encodeDate(const Date& date)
{
	return m_util->encodeDate(unsigned(date.year), date.month, date.day);
}

Date UtilTypeConverter::decodeDate(ISC_DATE date)
{
	unsigned year, month, day;
	m_util->decodeDate(date, &year, &month, &day);

	Date result = {int(year), month, day};
	return result;
}

ISC_TIME UtilTypeConverter::encodeTime(const Time& time)
{
	return m_util->encodeTime(time.hours, time.minutes, time.seconds, time.fractions);
}

Time UtilTypeConverter::decodeTime(ISC_TIME time)
{
	Time result;
	m_util->decodeTime(time, &result.hours, &result.minutes, &result.seconds, &result.fractions);
	return result;
}

void UtilTypeConverter::encodeTimeTz(const TimeTz& value, ISC_TIME_TZ& time)
{
	checkExtended("TIME WITH TIME ZONE");

	const Time& t = value.time;
	m_util->encodeTimeTz(status(), &time, t.hours, t.minutes, t.seconds, t.fractions,
		value.zone.c_str());
}

TimeTz UtilTypeConverter::decodeTimeTz(const ISC_TIME_TZ& time)
{
	checkExtended("TIME WITH TIME ZONE");

	TimeTz result;
	Time& t = result.time;
	char zone[BUFFER_TINY];

	m_util->decodeTimeTz(status(), &time, &t.hours, &t.minutes, &t.seconds, &t.fractions,
		sizeof(zone), zone);

	result.zone = zone;
	return result;
}

TimeTz UtilTypeConverter::decodeTimeTzEx(const ISC_TIME_TZ_EX& time)
{
	checkExtended("TIME WITH TIME ZONE");

	TimeTz result;
	Time& t = result.time;
	char zone[BUFFER_TINY];

	m_util->decodeTimeTzEx(status(), &time, &t.hours, &t.minutes, &t.seconds, &t.fractions,
		sizeof(zone), zone);

	result.zone = zone;
	return result;
}

void UtilTypeConverter::encodeTimeStampTz(const TimeStampTz& value, ISC_TIMESTAMP_TZ& timeStamp)
{
	checkExtended("TIMESTAMP WITH TIME ZONE");

	const Date& d = value.timeStamp.date;
	const Time& t = value.timeStamp.time;

	m_util->encodeTimeStampTz(status(), &timeStamp, unsigned(d.year), d.month, d.day,
		t.hours, t.minutes, t.seconds, t.fractions, value.zone.c_str());
}

TimeStampTz UtilTypeConverter::decodeTimeStampTz(const ISC_TIMESTAMP_TZ& timeStamp)
{
	checkExtended("TIMESTAMP WITH TIME ZONE");

	TimeStampTz result;
	Time& t = result.timeStamp.time;
	unsigned year;
	char zone[BUFFER_TINY];

	m_util->decodeTimeStampTz(status(), &timeStamp, &year,
		&result.timeStamp.date.month, &result.timeStamp.date.day,
		&t.hours, &t.minutes, &t.seconds, &t.fractions, sizeof(zone), zone);

	result.timeStamp.date.year = int(year);
	result.zone = zone;
	return result;
}

TimeStampTz UtilTypeConverter::decodeTimeStampTzEx(const ISC_TIMESTAMP_TZ_EX& timeStamp)
{
	checkExtended("TIMESTAMP WITH TIME ZONE");

	TimeStampTz result;
	Time& t = result.timeStamp.time;
	unsigned year;
	char zone[BUFFER_TINY];

	m_util->decodeTimeStampTzEx(status(), &timeStamp, &year,
		&result.timeStamp.date.month, &result.timeStamp.date.day,
		&t.hours, &t.minutes, &t.seconds, &t.fractions, sizeof(zone), zone);

	result.timeStamp.date.year = int(year);
	result.zone = zone;
	return result;
}

std::string UtilTypeConverter::decFloat16ToString(const FB_DEC16& value)
{
	checkExtended("DECFLOAT(16)");

	char buffer[IDecFloat16::STRING_SIZE];
	IDecFloat16* const df = checkInterface(m_util->getDecFloat16(status()));
	df->toString(status(), &value, sizeof(buffer), buffer);

	return buffer;
}

void UtilTypeConverter::decFloat16FromString(const std::string& text, FB_DEC16& value)
{
	checkExtended("DECFLOAT(16)");

	IDecFloat16* const df = checkInterface(m_util->getDecFloat16(status()));
	df->fromString(status(), text.c_str(), &value);
}

std::string UtilTypeConverter::decFloat34ToString(const FB_DEC34& value)
{
	checkExtended("DECFLOAT(34)");

	char buffer[IDecFloat34::STRING_SIZE];
	IDecFloat34* const df = checkInterface(m_util->getDecFloat34(status()));
	df->toString(status(), &value, sizeof(buffer), buffer);

	return buffer;
}

void UtilTypeConverter::decFloat34FromString(const std::string& text, FB_DEC34& value)
{
	checkExtended("DECFLOAT(34)");

	IDecFloat34* const df = checkInterface(m_util->getDecFloat34(status()));
	df->fromString(status(), text.c_str(), &value);
}

std::string UtilTypeConverter::int128ToString(const FB_I128& value, int scale)
{
	checkExtended("INT128");

	char buffer[IInt128::STRING_SIZE];
	IInt128* const i128 = checkInterface(m_util->getInt128(status()));
	i128->toString(status(), &value, scale, sizeof(buffer), buffer);

	return buffer;
}

void UtilTypeConverter::int128FromString(const std::string& text, int scale, FB_I128& value)
{
	checkExtended("INT128");

	IInt128* const i128 = checkInterface(m_util->getInt128(status()));
	i128->fromString(status(), scale, text.c_str(), &value);
}

} // namespace FbDriver
