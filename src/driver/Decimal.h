/*
 *	PROGRAM:		Firebird client driver.
 *	MODULE:			Decimal.h
 *	DESCRIPTION:	Exact decimal numbers of fixed point columns.
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

#ifndef FBDRIVER_DRIVER_DECIMAL_H
#define FBDRIVER_DRIVER_DECIMAL_H

#include "../common/common.h"

#include <string>

namespace FbDriver {

// Value is (-1)^negative * digits * 10^exponent.
// Digits never carry leading zeros, zero is kept as "0".

class Decimal
{
public:
	Decimal();

	// Unscaled integer with the column scale, as stored by the engine
	Decimal(SINT64 unscaled, int exponent);

	// Accepts [+-]digits[.digits][(e|E)[+-]digits], raises DataError otherwise
	static Decimal fromString(const std::string& text);

	// Same value with the given exponent, dropped digits rounded half to even
	Decimal rescaled(int exponent) const;

	// Digits as signed integer ignoring the exponent. Returns false on overflow.
	bool getUnscaled(SINT64& value) const;

	// Plain notation, never exponential
	std::string toString() const;

	double toDouble() const;

	bool isNegative() const
	{
		return m_negative;
	}

	bool isZero() const
	{
		return m_digits == "0";
	}

	const std::string& getDigits() const
	{
		return m_digits;
	}

	int getExponent() const
	{
		return m_exponent;
	}

	// Numeric comparison, 1.50 equals 1.5
	bool operator==(const Decimal& other) const;

	bool operator!=(const Decimal& other) const
	{
		return !(*this == other);
	}

private:
	Decimal(bool negative, const std::string& digits, int exponent);

	void normalize();

	bool m_negative;
	std::string m_digits;
	int m_exponent;
};

} // namespace FbDriver

#endif // FBDRIVER_DRIVER_DECIMAL_H
