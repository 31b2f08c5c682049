/*
 *	PROGRAM:		Firebird client driver.
 *	MODULE:			common.cpp
 *	DESCRIPTION:	Common helpers.
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

#include "../common/common.h"

#include <stdarg.h>
#include <stdio.h>

namespace
{
	using namespace FbDriver;

	// Length of the UTF-8 sequence started by the given lead byte
	unsigned utf8Length(UCHAR c)
	{
		if (c < 0x80)
			return 1;
		if ((c & 0xE0) == 0xC0)
			return 2;
		if ((c & 0xF0) == 0xE0)
			return 3;
		if ((c & 0xF8) == 0xF0)
			return 4;
		return 1;
	}

	// GB18030 characters are 1, 2 or 4 bytes long
	unsigned gb18030Length(const UCHAR* p, const UCHAR* end)
	{
		if (p[0] < 0x80 || p + 1 >= end)
			return 1;
		if (p[1] >= 0x30 && p[1] <= 0x39)
			return 4;
		return 2;
	}
}

namespace FbDriver
{
	std::string printfString(const char* format, ...)
	{
		char buffer[BUFFER_LARGE];

		va_list ptr;
		va_start(ptr, format);
		const int len = vsnprintf(buffer, sizeof(buffer), format, ptr);
		va_end(ptr);

		if (len < 0)
			return std::string();

		if (unsigned(len) < sizeof(buffer))
			return std::string(buffer, len);

		std::string result(len, '\0');
		va_start(ptr, format);
		vsnprintf(&result[0], len + 1, format, ptr);
		va_end(ptr);

		return result;
	}

	std::string truncateChars(const std::string& text, unsigned charSet, unsigned charCount)
	{
		if (bytesPerChar(charSet) == 1)
			return text.length() > charCount ? text.substr(0, charCount) : text;

		const UCHAR* const start = reinterpret_cast<const UCHAR*>(text.data());
		const UCHAR* const end = start + text.length();
		const UCHAR* p = start;

		for (unsigned n = 0; n < charCount && p < end; ++n)
		{
			const unsigned step = (charSet == CS_GB18030) ? gb18030Length(p, end) : utf8Length(*p);
			p += step;
		}

		if (p > end)
			p = end;

		return std::string(text.data(), p - start);
	}

} // namespace FbDriver
