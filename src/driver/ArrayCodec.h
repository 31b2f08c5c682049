/*
 *	PROGRAM:		Firebird client driver.
 *	MODULE:			ArrayCodec.h
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

#ifndef FBDRIVER_DRIVER_ARRAY_CODEC_H
#define FBDRIVER_DRIVER_ARRAY_CODEC_H

#include "../driver/LobAccess.h"
#include "../driver/TypeConverter.h"
#include "../driver/Value.h"

#include <vector>

namespace FbDriver {

// Slice layout: elements of the last dimension are adjacent, each of element size bytes

class ArrayCodec
{
public:
	ArrayCodec(TypeConverter& converter, const ArrayDescriptor& desc, unsigned dialect);

	unsigned getElementSize() const
	{
		return m_elementSize;
	}

	const std::vector<unsigned>& getDimensions() const
	{
		return m_dimensions;
	}

	unsigned getTotalSize() const;

	// Nested lists of the declared shape with leaves of the element type
	bool validate(const Value& value) const;

	// Raises DataError "Incorrect ARRAY field value." when validation fails
	void flatten(const Value& value, Bytes& buffer) const;

	Value rebuild(const Bytes& buffer) const;

private:
	bool validateLevel(unsigned dim, const Value& value) const;
	bool validateElement(const Value& value) const;
	void putLevel(unsigned dim, const Value& value, UCHAR*& ptr) const;
	void putElement(const Value& value, UCHAR* ptr) const;
	Value getLevel(unsigned dim, const UCHAR*& ptr) const;
	Value getElement(const UCHAR* ptr) const;

	bool isFixed() const
	{
		return m_subType || m_scale;
	}

	TypeConverter& m_converter;
	const unsigned m_dialect;
	UCHAR m_dtype;
	int m_scale;
	int m_subType;
	unsigned m_elementSize;
	std::vector<unsigned> m_dimensions;
};

} // namespace FbDriver

#endif // FBDRIVER_DRIVER_ARRAY_CODEC_H
