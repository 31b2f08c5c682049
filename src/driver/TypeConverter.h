/*
 *	PROGRAM:		Firebird client driver.
 *	MODULE:			TypeConverter.h
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

#ifndef FBDRIVER_DRIVER_TYPE_CONVERTER_H
#define FBDRIVER_DRIVER_TYPE_CONVERTER_H

#include "ibase.h"
#include "firebird/Interface.h"
#include "../driver/Value.h"

#include <string>

namespace FbDriver {

// Conversions whose epoch, units and binary layout belong to the engine

class TypeConverter
{
public:
	virtual ~TypeConverter()
	{ }

	virtual ISC_DATE encodeDate(const Date& date) = 0;
	virtual Date decodeDate(ISC_DATE date) = 0;
	virtual ISC_TIME encodeTime(const Time& time) = 0;
	virtual Time decodeTime(ISC_TIME time) = 0;

	virtual void encodeTimeTz(const TimeTz& value, ISC_TIME_TZ& time) = 0;
	virtual TimeTz decodeTimeTz(const ISC_TIME_TZ& time) = 0;
	virtual TimeTz decodeTimeTzEx(const ISC_TIME_TZ_EX& time) = 0;
	virtual void encodeTimeStampTz(const TimeStampTz& value, ISC_TIMESTAMP_TZ& timeStamp) = 0;
	virtual TimeStampTz decodeTimeStampTz(const ISC_TIMESTAMP_TZ& timeStamp) = 0;
	virtual TimeStampTz decodeTimeStampTzEx(const ISC_TIMESTAMP_TZ_EX& timeStamp) = 0;

	virtual std::string decFloat16ToString(const FB_DEC16& value) = 0;
	virtual void decFloat16FromString(const std::string& text, FB_DEC16& value) = 0;
	virtual std::string decFloat34ToString(const FB_DEC34& value) = 0;
	virtual void decFloat34FromString(const std::string& text, FB_DEC34& value) = 0;

	// Text has the decimal point placed according to scale
	virtual std::string int128ToString(const FB_I128& value, int scale) = 0;
	virtual void int128FromString(const std::string& text, int scale, FB_I128& value) = 0;
};

// Implementation on top of IUtil of the loaded client library

class UtilTypeConverter : public TypeConverter
{
public:
	UtilTypeConverter();
	explicit UtilTypeConverter(Firebird::IUtil* util);

	// Time zones, DECFLOAT and INT128 need version 4 of the client library
	bool hasExtendedTypes() const
	{
		return m_extended;
	}

	ISC_DATE encodeDate(const Date& date) override;
	Date decodeDate(ISC_DATE date) override;
	ISC_TIME encodeTime(const Time& time) override;
	Time decodeTime(ISC_TIME time) override;

	void encodeTimeTz(const TimeTz& value, ISC_TIME_TZ& time) override;
	TimeTz decodeTimeTz(const ISC_TIME_TZ& time) override;
	TimeTz decodeTimeTzEx(const ISC_TIME_TZ_EX& time) override;
	void encodeTimeStampTz(const TimeStampTz& value, ISC_TIMESTAMP_TZ& timeStamp) override;
	TimeStampTz decodeTimeStampTz(const ISC_TIMESTAMP_TZ& timeStamp) override;
	TimeStampTz decodeTimeStampTzEx(const ISC_TIMESTAMP_TZ_EX& timeStamp) override;

	std::string decFloat16ToString(const FB_DEC16& value) override;
	void decFloat16FromString(const std::string& text, FB_DEC16& value) override;
	std::string decFloat34ToString(const FB_DEC34& value) override;
	void decFloat34FromString(const std::string& text, FB_DEC34& value) override;

	std::string int128ToString(const FB_I128& value, int scale) override;
	void int128FromString(const std::string& text, int scale, FB_I128& value) override;

private:
	void checkExtended(const char* what) const;

	Firebird::IUtil* m_util;
	bool m_extended;
};

} // namespace FbDriver

#endif // FBDRIVER_DRIVER_TYPE_CONVERTER_H
