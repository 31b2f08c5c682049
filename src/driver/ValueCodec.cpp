/*
 *	PROGRAM:		Firebird client driver.
 *	MODULE:			ValueCodec.cpp
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

#include "../driver/ValueCodec.h"
#include "../driver/ArrayCodec.h"
#include "../driver/BlobReader.h"
#include "../common/fbd_exception.h"
#include "ibase.h"

#include <algorithm>
#include <math.h>
#include <stdio.h>
#include <string.h>

namespace
{
	using namespace FbDriver;

	bool isTextValue(const Value& value)
	{
		return value.getKind() == Value::TEXT;
	}

	bool isStringParam(const Value& value, unsigned type)
	{
		if (value.isNull())
			return false;

		return (isTextValue(value) && type != SQL_BLOB) || type == SQL_TEXT || type == SQL_VARYING;
	}

	std::string textValue(const Value& value)
	{
		return value.toString();
	}

	void getRange(unsigned type, SINT64& min, SINT64& max)
	{
		switch (type)
		{
		case SQL_SHORT:
			min = INT16_MIN;
			max = INT16_MAX;
			break;

		case SQL_LONG:
			min = INT32_MIN;
			max = INT32_MAX;
			break;

		default:
			min = INT64_MIN;
			max = INT64_MAX;
			break;
		}
	}

	[[noreturn]] void numericOverflow(const std::string& scaled, unsigned dialect, unsigned type,
		int subType, int scale)
	{
		SINT64 min, max;
		getRange(type, min, max);

		const std::string message = printfString(
			"numeric overflow: value %s\n"
			"(%s scaled for %d decimal places) is of\n"
			"too great a magnitude to fit into its internal storage type %s,\n"
			"which has range [%lld,%lld].",
			scaled.c_str(),
			ValueCodec::externalTypeName(dialect, type, subType, scale).c_str(),
			scale, ValueCodec::internalTypeName(type), (long long) min, (long long) max);

		throw DataError(message, SQLSTATE_NUMERIC_OVERFLOW);
	}

	UCHAR* itemData(Bytes& buffer, unsigned offset, unsigned length)
	{
		if (size_t(offset) + length > buffer.size())
			InterfaceError::raise("Message item at offset %u exceeds the message buffer", offset);

		return buffer.data() + offset;
	}

	const UCHAR* itemData(const Bytes& buffer, unsigned offset, unsigned length)
	{
		if (size_t(offset) + length > buffer.size())
			InterfaceError::raise("Message item at offset %u exceeds the message buffer", offset);

		return buffer.data() + offset;
	}

	// VARCHAR keeps its length prefix outside of the declared length
	unsigned itemSize(const MessageField& field)
	{
		return field.type == SQL_VARYING ? field.length + unsigned(sizeof(USHORT)) : field.length;
	}

	template <typename T>
	void putValue(UCHAR* ptr, const T& value)
	{
		memcpy(ptr, &value, sizeof(T));
	}

	template <typename T>
	T getValue(const UCHAR* ptr)
	{
		T value;
		memcpy(&value, ptr, sizeof(T));
		return value;
	}

	// Numbers passed as text to DECFLOAT and INT128 converters
	std::string numberText(const Value& value)
	{
		switch (value.getKind())
		{
		case Value::DECFLOAT:
		case Value::DECIMAL:
		case Value::INTEGER:
		case Value::FLOAT:
			return value.toString();

		default:
			InterfaceError::raise("Objects of type %s are not acceptable input for a numeric column",
				Value::kindName(value.getKind()));
		}
	}
}

namespace FbDriver {

ValueCodec::ValueCodec(TypeConverter& converter, LobAccess* lobs, unsigned dialect)
	: m_converter(converter),
	  m_lobs(lobs),
	  m_dialect(dialect),
	  m_streamBlobThreshold(DEFAULT_STREAM_BLOB_THRESHOLD)
{ }

bool ValueCodec::isFixedPoint(unsigned dialect, unsigned type, int subType, int scale)
{
	if (type == SQL_SHORT || type == SQL_LONG || type == SQL_INT64)
		return subType || scale;

	return dialect < 3 && scale && (type == SQL_DOUBLE || type == SQL_D_FLOAT);
}

std::string ValueCodec::externalTypeName(unsigned dialect, unsigned type, int subType, int scale)
{
	if (type == SQL_TEXT)
		return "CHAR";

	if (type == SQL_VARYING)
		return "VARCHAR";

	if (isFixedPoint(dialect, type, subType, scale))
	{
		switch (subType)
		{
		case 1:
			return "NUMERIC";
		case 2:
			return "DECIMAL";
		default:
			return "NUMERIC/DECIMAL";
		}
	}

	switch (type)
	{
	case SQL_SHORT:
		return "SMALLINT";
	case SQL_LONG:
		return "INTEGER";
	case SQL_INT64:
		return "BIGINT";
	case SQL_FLOAT:
		return "FLOAT";
	case SQL_DOUBLE:
	case SQL_D_FLOAT:
		return "DOUBLE";
	case SQL_TIMESTAMP:
		return "TIMESTAMP";
	case SQL_TYPE_DATE:
		return "DATE";
	case SQL_TYPE_TIME:
		return "TIME";
	case SQL_BLOB:
		return "BLOB";
	case SQL_BOOLEAN:
		return "BOOLEAN";
	default:
		return "UNKNOWN";
	}
}

const char* ValueCodec::internalTypeName(unsigned type)
{
	switch (type)
	{
	case SQL_TEXT:
		return "TEXT";
	case SQL_VARYING:
		return "VARYING";
	case SQL_SHORT:
		return "SHORT";
	case SQL_LONG:
		return "LONG";
	case SQL_INT64:
		return "INT64";
	case SQL_FLOAT:
		return "FLOAT";
	case SQL_DOUBLE:
	case SQL_D_FLOAT:
		return "DOUBLE";
	case SQL_TIMESTAMP:
		return "TIMESTAMP";
	case SQL_TYPE_DATE:
		return "DATE";
	case SQL_TYPE_TIME:
		return "TIME";
	case SQL_BLOB:
		return "BLOB";
	case SQL_ARRAY:
		return "ARRAY";
	case SQL_BOOLEAN:
		return "BOOLEAN";
	default:
		return "UNKNOWN";
	}
}

SINT64 ValueCodec::scaleInteger(const Value& value, unsigned dialect, unsigned type,
	int subType, int scale)
{
	SINT64 min, max;
	getRange(type, min, max);

	SINT64 result = 0;

	if (subType || scale)
	{
		const int exponent = scale < 0 ? scale : -scale;

		switch (value.getKind())
		{
		case Value::DECIMAL:
		case Value::INTEGER:
		{
			const Decimal number = value.getKind() == Value::DECIMAL ?
				value.asDecimal() : Decimal(value.asInteger(), 0);
			const Decimal scaled = number.rescaled(exponent);

			if (!scaled.getUnscaled(result))
			{
				const std::string digits = (scaled.isNegative() ? "-" : "") + scaled.getDigits();
				numericOverflow(digits, dialect, type, subType, scale);
			}
			break;
		}

		case Value::FLOAT:
		{
			// nearbyint() rounds half to even in the default rounding mode
			const double scaled = nearbyint(value.asDouble() * pow(10.0, -exponent));

			if (!(scaled >= -9223372036854775808.0 && scaled < 9223372036854775808.0))
			{
				char buffer[BUFFER_TINY];
				snprintf(buffer, sizeof(buffer), "%.0f", scaled);
				numericOverflow(buffer, dialect, type, subType, scale);
			}

			result = SINT64(scaled);
			break;
		}

		default:
			InterfaceError::raise("Objects of type %s are not acceptable input for a fixed-point column.",
				Value::kindName(value.getKind()));
		}
	}
	else
		result = value.asInteger();

	if (result < min || result > max)
		numericOverflow(std::to_string(result), dialect, type, subType, scale);

	return result;
}

void ValueCodec::checkParameterCount(const MessageLayout& input, const ValueList& params)
{
	// statement without parameters ignores whatever was passed
	if (input.getCount() && params.size() != input.getCount())
	{
		throw ProgrammingError(printfString(
			"Statement parameter sequence contains %u items, but exactly %u are required",
			unsigned(params.size()), input.getCount()), SQLSTATE_WRONG_PARAM_COUNT);
	}
}

std::vector<TextOverride> ValueCodec::textOverrides(const MessageLayout& input, const ValueList& params)
{
	checkParameterCount(input, params);

	std::vector<TextOverride> result;

	for (unsigned i = 0; i < input.getCount(); ++i)
	{
		if (isStringParam(params[i], input[i].type))
		{
			TextOverride item = {i, unsigned(textValue(params[i]).length())};
			result.push_back(item);
		}
	}

	return result;
}

void ValueCodec::encode(const MessageLayout& layout, const ValueList& params, Bytes& buffer)
{
	checkParameterCount(layout, params);

	buffer.assign(layout.getLength(), 0);

	for (unsigned i = 0; i < layout.getCount(); ++i)
	{
		const MessageField& field = layout[i];
		const Value& value = params[i];

		putValue<SSHORT>(itemData(buffer, field.nullOffset, sizeof(SSHORT)), value.isNull() ? -1 : 0);

		if (value.isNull())
			continue;

		UCHAR* const ptr = itemData(buffer, field.offset, itemSize(field));

		if (isStringParam(value, field.type))
		{
			const std::string text = textValue(value);
			const unsigned length = (unsigned) text.length();

			if (field.type == SQL_VARYING)
			{
				if (length > field.length)
				{
					throw DataError(printfString("string right truncation: value of parameter (%u) "
						"is too long, expected %u, found %u", i, field.length, length),
						SQLSTATE_STRING_TRUNCATION);
				}

				putValue<USHORT>(ptr, USHORT(length));
				memcpy(ptr + sizeof(USHORT), text.data(), length);
				continue;
			}

			if (length > field.length)
			{
				throw DataError(printfString("string right truncation: value of parameter (%u) "
					"is too long, expected %u, found %u", i, field.length, length),
					SQLSTATE_STRING_TRUNCATION);
			}

			memcpy(ptr, text.data(), length);
			memset(ptr + length, ' ', field.length - length);
			continue;
		}

		switch (field.type)
		{
		case SQL_SHORT:
		case SQL_LONG:
		case SQL_INT64:
			putVaxInteger(ptr, scaleInteger(value, m_dialect, field.type, field.subType, field.scale),
				field.length);
			break;

		case SQL_INT128:
			m_converter.int128FromString(numberText(value), field.scale, *reinterpret_cast<FB_I128*>(ptr));
			break;

		case SQL_DEC16:
			m_converter.decFloat16FromString(numberText(value), *reinterpret_cast<FB_DEC16*>(ptr));
			break;

		case SQL_DEC34:
			m_converter.decFloat34FromString(numberText(value), *reinterpret_cast<FB_DEC34*>(ptr));
			break;

		case SQL_TYPE_DATE:
			putValue<ISC_DATE>(ptr, m_converter.encodeDate(value.asDate()));
			break;

		case SQL_TYPE_TIME:
			putValue<ISC_TIME>(ptr, m_converter.encodeTime(value.asTime()));
			break;

		case SQL_TIMESTAMP:
		{
			const TimeStamp& ts = value.asTimeStamp();
			putValue<ISC_DATE>(ptr, m_converter.encodeDate(ts.date));
			putValue<ISC_TIME>(ptr + sizeof(ISC_DATE), m_converter.encodeTime(ts.time));
			break;
		}

		// extended forms share the leading part
		case SQL_TIME_TZ:
		case SQL_TIME_TZ_EX:
		{
			ISC_TIME_TZ tz;
			m_converter.encodeTimeTz(value.asTimeTz(), tz);
			putValue(ptr, tz);
			break;
		}

		case SQL_TIMESTAMP_TZ:
		case SQL_TIMESTAMP_TZ_EX:
		{
			ISC_TIMESTAMP_TZ tz;
			m_converter.encodeTimeStampTz(value.asTimeStampTz(), tz);
			putValue(ptr, tz);
			break;
		}

		case SQL_FLOAT:
			putValue<float>(ptr, float(value.asDouble()));
			break;

		case SQL_DOUBLE:
		case SQL_D_FLOAT:
			putValue<double>(ptr, value.asDouble());
			break;

		case SQL_BOOLEAN:
			*ptr = (value.getKind() == Value::INTEGER ? value.asInteger() != 0 : value.asBoolean()) ? 1 : 0;
			break;

		case SQL_BLOB:
			encodeBlob(field, value, ptr);
			break;

		case SQL_ARRAY:
			encodeArray(field, value, ptr);
			break;

		default:
			throw NotSupportedError(printfString("Unsupported data type %u of parameter (%u)",
				field.type, i), "0A000");
		}
	}
}

LobAccess* ValueCodec::getLobs(const MessageField& field) const
{
	if (!m_lobs)
		InterfaceError::raise("No BLOB or ARRAY access available for %s", field.name().c_str());

	return m_lobs;
}

void ValueCodec::encodeBlob(const MessageField& field, const Value& value, UCHAR* ptr)
{
	LobAccess* const lobs = getLobs(field);
	ISC_QUAD blobId = {0, 0};

	if (value.getKind() == Value::BLOB_STREAM)
	{
		std::shared_ptr<std::istream> stream = value.asStream();
		std::unique_ptr<BlobHandle> blob = lobs->createBlob(blobId, true);
		std::vector<char> chunk(MAX_BLOB_SEGMENT_SIZE);

		while (stream->read(chunk.data(), chunk.size()) || stream->gcount() > 0)
		{
			const unsigned length = unsigned(stream->gcount());
			blob->putSegment(length, chunk.data());

			if (length < chunk.size())
				break;
		}

		if (stream->bad())
			InterfaceError::raise("Error reading stream for BLOB parameter %s", field.name().c_str());

		blob->close();
		putValue(ptr, blobId);
		return;
	}

	std::string data;

	switch (value.getKind())
	{
	case Value::TEXT:
		if (field.subType != isc_blob_text)
		{
			InterfaceError::raise("String value is not acceptable type for a non-textual BLOB column.");
		}
		data = value.asText();
		break;

	case Value::BINARY:
		data.assign(value.asBytes().begin(), value.asBytes().end());
		break;

	default:
		InterfaceError::raise("Objects of type %s are not acceptable input for a BLOB column.",
			Value::kindName(value.getKind()));
	}

	std::unique_ptr<BlobHandle> blob = lobs->createBlob(blobId, false);

	for (size_t written = 0; written < data.length(); )
	{
		const unsigned length = unsigned(std::min<size_t>(data.length() - written, MAX_BLOB_SEGMENT_SIZE));
		blob->putSegment(length, data.data() + written);
		written += length;
	}

	blob->close();
	putValue(ptr, blobId);
}

void ValueCodec::encodeArray(const MessageField& field, const Value& value, UCHAR* ptr)
{
	LobAccess* const lobs = getLobs(field);

	const ArrayDescriptor desc = lobs->lookupArray(field.relation, field.field);
	ArrayCodec codec(m_converter, desc, m_dialect);

	Bytes data;
	codec.flatten(value, data);

	ISC_QUAD arrayId = {0, 0};
	lobs->putSlice(arrayId, desc, data);
	putValue(ptr, arrayId);
}

Row ValueCodec::decode(const MessageLayout& layout, const Bytes& buffer)
{
	Row row;
	row.reserve(layout.getCount());

	for (unsigned i = 0; i < layout.getCount(); ++i)
	{
		const MessageField& field = layout[i];

		if (getValue<SSHORT>(itemData(buffer, field.nullOffset, sizeof(SSHORT))))
		{
			row.push_back(Value());
			continue;
		}

		const UCHAR* const ptr = itemData(buffer, field.offset, itemSize(field));

		switch (field.type)
		{
		case SQL_TEXT:
			if (field.charSet == CS_OCTETS)
				row.push_back(Bytes(ptr, ptr + field.length));
			else
			{
				// CHAR of multibyte character set reserves the maximum bytes per character
				const std::string text(reinterpret_cast<const char*>(ptr), field.length);
				row.push_back(truncateChars(text, field.charSet, field.length / bytesPerChar(field.charSet)));
			}
			break;

		case SQL_VARYING:
		{
			const USHORT length = getValue<USHORT>(ptr);

			if (length > field.length)
				InterfaceError::raise("Invalid length %u of VARCHAR column %s", length, field.name().c_str());

			const UCHAR* const data = ptr + sizeof(USHORT);

			if (field.charSet == CS_OCTETS)
				row.push_back(Bytes(data, data + length));
			else
				row.push_back(std::string(reinterpret_cast<const char*>(data), length));
			break;
		}

		case SQL_BOOLEAN:
			row.push_back(*ptr != 0);
			break;

		case SQL_SHORT:
		case SQL_LONG:
		case SQL_INT64:
		{
			const SINT64 number = vaxInteger(ptr, field.length);

			if (field.subType || field.scale)
				row.push_back(Decimal(number, field.scale));
			else
				row.push_back(number);
			break;
		}

		case SQL_INT128:
			row.push_back(Decimal::fromString(
				m_converter.int128ToString(*reinterpret_cast<const FB_I128*>(ptr), field.scale)));
			break;

		case SQL_DEC16:
		{
			const DecFloat value = {m_converter.decFloat16ToString(*reinterpret_cast<const FB_DEC16*>(ptr))};
			row.push_back(value);
			break;
		}

		case SQL_DEC34:
		{
			const DecFloat value = {m_converter.decFloat34ToString(*reinterpret_cast<const FB_DEC34*>(ptr))};
			row.push_back(value);
			break;
		}

		case SQL_TYPE_DATE:
			row.push_back(m_converter.decodeDate(getValue<ISC_DATE>(ptr)));
			break;

		case SQL_TYPE_TIME:
			row.push_back(m_converter.decodeTime(getValue<ISC_TIME>(ptr)));
			break;

		case SQL_TIMESTAMP:
		{
			const TimeStamp ts = {
				m_converter.decodeDate(getValue<ISC_DATE>(ptr)),
				m_converter.decodeTime(getValue<ISC_TIME>(ptr + sizeof(ISC_DATE)))
			};
			row.push_back(ts);
			break;
		}

		case SQL_TIME_TZ:
			row.push_back(m_converter.decodeTimeTz(getValue<ISC_TIME_TZ>(ptr)));
			break;

		case SQL_TIME_TZ_EX:
			row.push_back(m_converter.decodeTimeTzEx(getValue<ISC_TIME_TZ_EX>(ptr)));
			break;

		case SQL_TIMESTAMP_TZ:
			row.push_back(m_converter.decodeTimeStampTz(getValue<ISC_TIMESTAMP_TZ>(ptr)));
			break;

		case SQL_TIMESTAMP_TZ_EX:
			row.push_back(m_converter.decodeTimeStampTzEx(getValue<ISC_TIMESTAMP_TZ_EX>(ptr)));
			break;

		case SQL_FLOAT:
			row.push_back(double(getValue<float>(ptr)));
			break;

		case SQL_DOUBLE:
		case SQL_D_FLOAT:
		{
			const double number = getValue<double>(ptr);

			// dialect 1 NUMERIC and DECIMAL are stored as DOUBLE
			if (isFixedPoint(m_dialect, field.type, field.subType, field.scale))
			{
				char buffer[BUFFER_SMALL];
				snprintf(buffer, sizeof(buffer), "%.*f", field.scale < 0 ? -field.scale : field.scale, number);
				row.push_back(Decimal::fromString(buffer));
			}
			else
				row.push_back(number);
			break;
		}

		case SQL_BLOB:
			row.push_back(decodeBlob(field, ptr));
			break;

		case SQL_ARRAY:
			row.push_back(decodeArray(field, ptr));
			break;

		default:
			throw NotSupportedError(printfString("Unsupported data type %u of column %s",
				field.type, field.name().c_str()), "0A000");
		}
	}

	return row;
}

Value ValueCodec::decodeBlob(const MessageField& field, const UCHAR* ptr)
{
	LobAccess* const lobs = getLobs(field);
	const ISC_QUAD blobId = getValue<ISC_QUAD>(ptr);

	std::unique_ptr<BlobHandle> blob = lobs->openBlob(blobId);
	const BlobInfo info = blob->getInfo();

	if (m_streamBlobs.count(field.name()) ||
		(m_streamBlobThreshold && info.totalLength > m_streamBlobThreshold))
	{
		std::shared_ptr<BlobReader> reader =
			std::make_shared<BlobReader>(std::move(blob), blobId, field.subType, info);
		lobs->trackReader(reader);

		return Value(reader);
	}

	std::string data;
	data.reserve(size_t(info.totalLength));

	const unsigned segment = info.maxSegment ? info.maxSegment : MAX_BLOB_SEGMENT_SIZE;
	std::vector<char> chunk(segment);

	while (SINT64(data.length()) < info.totalLength)
	{
		const unsigned wanted = unsigned(std::min<SINT64>(segment, info.totalLength - data.length()));
		unsigned length = 0;

		if (!blob->getSegment(wanted, chunk.data(), length))
			break;

		data.append(chunk.data(), length);
	}

	blob->close();

	if (field.subType == isc_blob_text)
		return Value(data);

	return Value(Bytes(data.begin(), data.end()));
}

Value ValueCodec::decodeArray(const MessageField& field, const UCHAR* ptr)
{
	LobAccess* const lobs = getLobs(field);
	const ISC_QUAD arrayId = getValue<ISC_QUAD>(ptr);

	const ArrayDescriptor desc = lobs->lookupArray(field.relation, field.field);
	ArrayCodec codec(m_converter, desc, m_dialect);

	Bytes data(codec.getTotalSize());
	lobs->getSlice(arrayId, desc, data);

	return codec.rebuild(data);
}

ColumnDescription ValueCodec::describeColumn(const MessageField& field, unsigned dialect, int precision)
{
	ColumnDescription desc;

	desc.name = field.name();
	desc.internalSize = field.length;
	desc.precision = 0;
	desc.scale = field.scale;
	desc.nullable = field.nullable;

	switch (field.type)
	{
	case SQL_TEXT:
	case SQL_VARYING:
		desc.typeCode = Value::TEXT;
		desc.displaySize = int(field.length / bytesPerChar(field.charSet));
		break;

	case SQL_SHORT:
	case SQL_LONG:
	case SQL_INT64:
		if (field.subType || field.scale)
		{
			desc.typeCode = Value::DECIMAL;
			desc.precision = precision;
			desc.displaySize = 20;
		}
		else
		{
			desc.typeCode = Value::INTEGER;
			desc.displaySize = field.type == SQL_SHORT ? 6 : field.type == SQL_LONG ? 11 : 20;
		}
		break;

	case SQL_FLOAT:
	case SQL_DOUBLE:
	case SQL_D_FLOAT:
		if (dialect < 3 && field.scale)
		{
			desc.typeCode = Value::DECIMAL;
			desc.precision = precision;
		}
		else
			desc.typeCode = Value::FLOAT;
		desc.displaySize = 17;
		break;

	case SQL_BLOB:
		desc.typeCode = field.subType == isc_blob_text ? Value::TEXT : Value::BINARY;
		desc.scale = field.subType;
		desc.displaySize = 0;
		break;

	case SQL_TIMESTAMP:
		desc.typeCode = Value::TIMESTAMP;
		desc.displaySize = 22;
		break;

	case SQL_TYPE_DATE:
		desc.typeCode = Value::DATE;
		desc.displaySize = 10;
		break;

	case SQL_TYPE_TIME:
		desc.typeCode = Value::TIME;
		desc.displaySize = 11;
		break;

	case SQL_ARRAY:
		desc.typeCode = Value::ARRAY;
		desc.displaySize = -1;
		break;

	case SQL_BOOLEAN:
		desc.typeCode = Value::BOOLEAN;
		desc.displaySize = 5;
		break;

	default:
		desc.typeCode = Value::NULL_VALUE;
		desc.displaySize = -1;
		break;
	}

	return desc;
}

} // namespace FbDriver
