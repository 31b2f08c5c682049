/*
 *	PROGRAM:		Firebird client driver.
 *	MODULE:			ValueCodec.h
 *	DESCRIPTION:	Conversion between message buffers and values.
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

#ifndef FBDRIVER_DRIVER_VALUE_CODEC_H
#define FBDRIVER_DRIVER_VALUE_CODEC_H

#include "../driver/Message.h"
#include "../driver/Value.h"
#include "../driver/TypeConverter.h"
#include "../driver/LobAccess.h"

#include <set>
#include <string>
#include <vector>

namespace FbDriver {

// Column description in the order of DB API 2.0

struct ColumnDescription
{
	std::string name;
	Value::Kind typeCode;
	int displaySize;
	unsigned internalSize;
	int precision;
	int scale;
	bool nullable;
};

const SINT64 DEFAULT_STREAM_BLOB_THRESHOLD = 65536;

class ValueCodec
{
public:
	// LOB access may be null when no BLOB or ARRAY item is expected
	ValueCodec(TypeConverter& converter, LobAccess* lobs, unsigned dialect);

	// Names of BLOB columns always returned as BlobReader
	void setStreamBlobs(const std::set<std::string>& names)
	{
		m_streamBlobs = names;
	}

	const std::set<std::string>& getStreamBlobs() const
	{
		return m_streamBlobs;
	}

	// BLOBs longer than this are returned as BlobReader, 0 disables the limit
	void setStreamBlobThreshold(SINT64 threshold)
	{
		m_streamBlobThreshold = threshold;
	}

	SINT64 getStreamBlobThreshold() const
	{
		return m_streamBlobThreshold;
	}

	unsigned getDialect() const
	{
		return m_dialect;
	}

	// Parameters which must be sent as CHAR of exact byte length: strings bound to
	// anything except BLOB, and any value bound to CHAR or VARCHAR.
	// Raises ProgrammingError when the number of values does not match.
	static std::vector<TextOverride> textOverrides(const MessageLayout& input, const ValueList& params);

	// Fills buffer (resized to the message length) from parameter values
	void encode(const MessageLayout& layout, const ValueList& params, Bytes& buffer);

	Row decode(const MessageLayout& layout, const Bytes& buffer);

	static ColumnDescription describeColumn(const MessageField& field, unsigned dialect, int precision);

	// NUMERIC and DECIMAL, including scaled DOUBLE of dialect 1
	static bool isFixedPoint(unsigned dialect, unsigned type, int subType, int scale);

	static std::string externalTypeName(unsigned dialect, unsigned type, int subType, int scale);
	static const char* internalTypeName(unsigned type);

	// Integer to be stored into SHORT, LONG or INT64 item, scaled when the item is fixed point.
	// Raises DataError with SQLSTATE 22003 when the value does not fit.
	static SINT64 scaleInteger(const Value& value, unsigned dialect, unsigned type,
		int subType, int scale);

	static void checkParameterCount(const MessageLayout& input, const ValueList& params);

private:
	void encodeBlob(const MessageField& field, const Value& value, UCHAR* ptr);
	void encodeArray(const MessageField& field, const Value& value, UCHAR* ptr);
	Value decodeBlob(const MessageField& field, const UCHAR* ptr);
	Value decodeArray(const MessageField& field, const UCHAR* ptr);

	LobAccess* getLobs(const MessageField& field) const;

	TypeConverter& m_converter;
	LobAccess* const m_lobs;
	const unsigned m_dialect;
	std::set<std::string> m_streamBlobs;
	SINT64 m_streamBlobThreshold;
};

} // namespace FbDriver

#endif // FBDRIVER_DRIVER_VALUE_CODEC_H
