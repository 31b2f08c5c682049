/*
 *	PROGRAM:		Firebird client driver.
 *	MODULE:			ArrayCodec.cpp
 *	DESCRIPTION:	Conversion between array slices and nested values.
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

#include "../driver/ArrayCodec.h"
#include "../driver/ValueCodec.h"
#include "../common/fbd_exception.h"
#include "ibase.h"

#include <string.h>

namespace
{
	using namespace FbDriver;

	// Storage type of integer elements, used for range checks and messages
	unsigned integerType(unsigned size)
	{
		switch (size)
		{
		case 2:
			return SQL_SHORT;
		case 4:
			return SQL_LONG;
		default:
			return SQL_INT64;
		}
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
}

namespace FbDriver {

ArrayCodec::ArrayCodec(TypeConverter& converter, const ArrayDescriptor& desc, unsigned dialect)
	: m_converter(converter),
	  m_dialect(dialect),
	  m_dtype(desc.desc.array_desc_dtype),
	  m_scale(desc.desc.array_desc_scale),
	  m_subType(desc.subType),
	  m_elementSize(desc.desc.array_desc_length)
{
	if (m_dtype == blr_varying || m_dtype == blr_varying2)
		m_elementSize += 2;

	const int count = desc.desc.array_desc_dimensions;

	if (count <= 0 || count > 16)
		InterfaceError::raise("Invalid number of array dimensions %d", count);

	for (int i = 0; i < count; ++i)
	{
		const ISC_ARRAY_BOUND& bounds = desc.desc.array_desc_bounds[i];
		const int size = bounds.array_bound_upper + 1 - bounds.array_bound_lower;

		if (size <= 0)
			InterfaceError::raise("Invalid bounds of array dimension %d", i + 1);

		m_dimensions.push_back(unsigned(size));
	}
}

unsigned ArrayCodec::getTotalSize() const
{
	unsigned total = m_elementSize;

	for (const unsigned dim : m_dimensions)
		total *= dim;

	return total;
}

bool ArrayCodec::validate(const Value& value) const
{
	return validateLevel(0, value);
}

bool ArrayCodec::validateLevel(unsigned dim, const Value& value) const
{
	if (value.getKind() != Value::ARRAY)
		return false;

	const ValueList& items = value.asArray();

	if (items.size() != m_dimensions[dim])
		return false;

	const bool leaf = (dim == m_dimensions.size() - 1);

	for (const auto& item : items)
	{
		if (!(leaf ? validateElement(item) : validateLevel(dim + 1, item)))
			return false;
	}

	return true;
}

bool ArrayCodec::validateElement(const Value& value) const
{
	const Value::Kind kind = value.getKind();

	switch (m_dtype)
	{
	case blr_text:
	case blr_text2:
	case blr_varying:
	case blr_varying2:
		return kind == Value::TEXT;

	case blr_short:
	case blr_long:
	case blr_int64:
		return kind == (isFixed() ? Value::DECIMAL : Value::INTEGER);

	case blr_float:
	case blr_double:
	case blr_d_float:
		return kind == Value::FLOAT;

	case blr_timestamp:
		return kind == Value::TIMESTAMP;

	case blr_sql_date:
		return kind == Value::DATE;

	case blr_sql_time:
		return kind == Value::TIME;

	case blr_bool:
		return kind == Value::BOOLEAN;

	default:
		return false;
	}
}

void ArrayCodec::flatten(const Value& value, Bytes& buffer) const
{
	if (!validate(value))
		throw DataError("Incorrect ARRAY field value.", SQLSTATE_DATA_EXCEPTION);

	buffer.assign(getTotalSize(), 0);

	UCHAR* ptr = buffer.data();
	putLevel(0, value, ptr);
}

void ArrayCodec::putLevel(unsigned dim, const Value& value, UCHAR*& ptr) const
{
	const bool leaf = (dim == m_dimensions.size() - 1);

	for (const auto& item : value.asArray())
	{
		if (leaf)
		{
			putElement(item, ptr);
			ptr += m_elementSize;
		}
		else
			putLevel(dim + 1, item, ptr);
	}
}

void ArrayCodec::putElement(const Value& value, UCHAR* ptr) const
{
	switch (m_dtype)
	{
	case blr_text:
	case blr_text2:
	case blr_varying:
	case blr_varying2:
	{
		const std::string& text = value.asText();
		const bool varying = (m_dtype == blr_varying || m_dtype == blr_varying2);
		const unsigned limit = varying ? m_elementSize - 2 : m_elementSize;

		if (text.length() > limit)
		{
			throw DataError(printfString("ARRAY value of parameter is too long, expected %u, found %u",
				limit, unsigned(text.length())), SQLSTATE_STRING_TRUNCATION);
		}

		// varying elements travel as zero terminated strings, CHAR is blank padded
		memcpy(ptr, text.data(), text.length());

		if (!varying)
			memset(ptr + text.length(), ' ', m_elementSize - text.length());
		break;
	}

	case blr_short:
	case blr_long:
	case blr_int64:
	{
		const SINT64 number = ValueCodec::scaleInteger(value, m_dialect,
			integerType(m_elementSize), m_subType, m_scale);
		putVaxInteger(ptr, number, m_elementSize);
		break;
	}

	case blr_float:
		putValue<float>(ptr, float(value.asDouble()));
		break;

	case blr_double:
	case blr_d_float:
		putValue<double>(ptr, value.asDouble());
		break;

	case blr_timestamp:
		putValue<ISC_DATE>(ptr, m_converter.encodeDate(value.asTimeStamp().date));
		putValue<ISC_TIME>(ptr + sizeof(ISC_DATE), m_converter.encodeTime(value.asTimeStamp().time));
		break;

	case blr_sql_date:
		putValue<ISC_DATE>(ptr, m_converter.encodeDate(value.asDate()));
		break;

	case blr_sql_time:
		putValue<ISC_TIME>(ptr, m_converter.encodeTime(value.asTime()));
		break;

	case blr_bool:
		*ptr = value.asBoolean() ? 1 : 0;
		break;

	default:
		InterfaceError::raise("Unsupported Firebird ARRAY subtype: %u", unsigned(m_dtype));
	}
}

Value ArrayCodec::rebuild(const Bytes& buffer) const
{
	if (buffer.size() < getTotalSize())
	{
		InterfaceError::raise("ARRAY slice of %u bytes is shorter than expected %u",
			unsigned(buffer.size()), getTotalSize());
	}

	const UCHAR* ptr = buffer.data();
	return getLevel(0, ptr);
}

Value ArrayCodec::getLevel(unsigned dim, const UCHAR*& ptr) const
{
	const bool leaf = (dim == m_dimensions.size() - 1);
	ValueList items;
	items.reserve(m_dimensions[dim]);

	for (unsigned i = 0; i < m_dimensions[dim]; ++i)
	{
		if (leaf)
		{
			items.push_back(getElement(ptr));
			ptr += m_elementSize;
		}
		else
			items.push_back(getLevel(dim + 1, ptr));
	}

	return Value::array(items);
}

Value ArrayCodec::getElement(const UCHAR* ptr) const
{
	switch (m_dtype)
	{
	case blr_text:
	case blr_text2:
	{
		// character set id is the subtype of text elements
		const std::string text(reinterpret_cast<const char*>(ptr), m_elementSize);
		const unsigned charSet = unsigned(m_subType);

		return Value(truncateChars(text, charSet, m_elementSize / bytesPerChar(charSet)));
	}

	case blr_varying:
	case blr_varying2:
	{
		const char* const text = reinterpret_cast<const char*>(ptr);
		return Value(std::string(text, strnlen(text, m_elementSize)));
	}

	case blr_short:
	case blr_long:
	case blr_int64:
	{
		const SINT64 number = vaxInteger(ptr, m_elementSize);

		if (isFixed())
			return Value(Decimal(number, m_scale));

		return Value(number);
	}

	case blr_float:
		return Value(double(getValue<float>(ptr)));

	case blr_double:
	case blr_d_float:
		return Value(getValue<double>(ptr));

	case blr_timestamp:
	{
		const TimeStamp ts = {
			m_converter.decodeDate(getValue<ISC_DATE>(ptr)),
			m_converter.decodeTime(getValue<ISC_TIME>(ptr + sizeof(ISC_DATE)))
		};
		return Value(ts);
	}

	case blr_sql_date:
		return Value(m_converter.decodeDate(getValue<ISC_DATE>(ptr)));

	case blr_sql_time:
		return Value(m_converter.decodeTime(getValue<ISC_TIME>(ptr)));

	case blr_bool:
		return Value(*ptr == 1);

	default:
		InterfaceError::raise("Unsupported Firebird ARRAY subtype: %u", unsigned(m_dtype));
	}
}

} // namespace FbDriver
