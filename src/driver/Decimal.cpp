/*
 *	PROGRAM:		Firebird client driver.
 *	MODULE:			Decimal.cpp
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

#include "../driver/Decimal.h"
#include "../common/fbd_exception.h"

#include <stdlib.h>

namespace
{
	using namespace FbDriver;

	const FB_UINT64 MAX_POSITIVE = FB_UINT64(INT64_MAX);
	const FB_UINT64 MAX_NEGATIVE = FB_UINT64(INT64_MAX) + 1;

	// Adds one to a string of decimal digits
	void increment(std::string& digits)
	{
		for (size_t i = digits.length(); i > 0; --i)
		{
			char& c = digits[i - 1];

			if (c != '9')
			{
				++c;
				return;
			}

			c = '0';
		}

		digits.insert(digits.begin(), '1');
	}

	[[noreturn]] void badNumber(const std::string& text)
	{
		throw DataError(printfString("Invalid decimal number '%s'", text.c_str()),
			SQLSTATE_DATA_EXCEPTION);
	}
}

namespace FbDriver {

Decimal::Decimal()
	: m_negative(false),
	  m_digits("0"),
	  m_exponent(0)
{ }

Decimal::Decimal(SINT64 unscaled, int exponent)
	: m_negative(unscaled < 0),
	  m_exponent(exponent)
{
	// INT64_MIN has no positive counterpart
	const FB_UINT64 magnitude = m_negative ?
		FB_UINT64(-(unscaled + 1)) + 1 : FB_UINT64(unscaled);

	m_digits = std::to_string(magnitude);
	normalize();
}

Decimal::Decimal(bool negative, const std::string& digits, int exponent)
	: m_negative(negative),
	  m_digits(digits),
	  m_exponent(exponent)
{
	normalize();
}

void Decimal::normalize()
{
	const size_t first = m_digits.find_first_not_of('0');

	if (first == std::string::npos)
	{
		m_digits = "0";
		m_negative = false;
	}
	else if (first > 0)
		m_digits.erase(0, first);
}

Decimal Decimal::fromString(const std::string& text)
{
	size_t pos = 0;
	bool negative = false;

	if (pos < text.length() && (text[pos] == '+' || text[pos] == '-'))
		negative = (text[pos++] == '-');

	std::string digits;
	int exponent = 0;
	bool seenPoint = false;

	for (; pos < text.length(); ++pos)
	{
		const char c = text[pos];

		if (c >= '0' && c <= '9')
		{
			digits += c;

			if (seenPoint)
				--exponent;
		}
		else if (c == '.' && !seenPoint)
			seenPoint = true;
		else
			break;
	}

	if (digits.empty())
		badNumber(text);

	if (pos < text.length())
	{
		if (text[pos] != 'e' && text[pos] != 'E')
			badNumber(text);

		const char* const start = text.c_str() + pos + 1;
		char* end = nullptr;
		const long power = strtol(start, &end, 10);

		if (end == start || *end || power > 100000 || power < -100000)
			badNumber(text);

		exponent += (int) power;
	}

	return Decimal(negative, digits, exponent);
}

Decimal Decimal::rescaled(int exponent) const
{
	if (exponent <= m_exponent)
	{
		const std::string digits = isZero() ?
			m_digits : m_digits + std::string(m_exponent - exponent, '0');

		return Decimal(m_negative, digits, exponent);
	}

	const size_t drop = size_t(exponent - m_exponent);
	std::string kept, dropped;

	if (drop >= m_digits.length())
	{
		kept = "0";
		dropped = std::string(drop - m_digits.length(), '0') + m_digits;
	}
	else
	{
		kept = m_digits.substr(0, m_digits.length() - drop);
		dropped = m_digits.substr(m_digits.length() - drop);
	}

	// round half to even
	bool roundUp = false;
	const char first = dropped[0];

	if (first > '5')
		roundUp = true;
	else if (first == '5')
	{
		const bool exactHalf = dropped.find_first_not_of('0', 1) == std::string::npos;
		roundUp = !exactHalf || ((kept.back() - '0') % 2 == 1);
	}

	if (roundUp)
		increment(kept);

	return Decimal(m_negative, kept, exponent);
}

bool Decimal::getUnscaled(SINT64& value) const
{
	const FB_UINT64 limit = m_negative ? MAX_NEGATIVE : MAX_POSITIVE;
	FB_UINT64 magnitude = 0;

	for (const char c : m_digits)
	{
		const unsigned digit = unsigned(c - '0');

		if (magnitude > (limit - digit) / 10)
			return false;

		magnitude = magnitude * 10 + digit;
	}

	if (m_negative)
		value = (magnitude == MAX_NEGATIVE) ? INT64_MIN : -SINT64(magnitude);
	else
		value = SINT64(magnitude);

	return true;
}

std::string Decimal::toString() const
{
	std::string result = m_negative ? "-" : "";

	if (m_exponent >= 0)
	{
		result += m_digits;

		if (!isZero())
			result.append(m_exponent, '0');

		return result;
	}

	const size_t fraction = size_t(-m_exponent);
	std::string digits = m_digits;

	if (digits.length() <= fraction)
		digits.insert(0, fraction - digits.length() + 1, '0');

	digits.insert(digits.length() - fraction, 1, '.');
	return result + digits;
}

double Decimal::toDouble() const
{
	return strtod(toString().c_str(), nullptr);
}

bool Decimal::operator==(const Decimal& other) const
{
	if (isZero() || other.isZero())
		return isZero() && other.isZero();

	if (m_negative != other.m_negative)
		return false;

	// compare without trailing zeros
	size_t len1 = m_digits.find_last_not_of('0') + 1;
	size_t len2 = other.m_digits.find_last_not_of('0') + 1;

	const int exp1 = m_exponent + int(m_digits.length() - len1);
	const int exp2 = other.m_exponent + int(other.m_digits.length() - len2);

	return exp1 == exp2 && m_digits.compare(0, len1, other.m_digits, 0, len2) == 0;
}

} // namespace FbDriver
