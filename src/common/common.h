/*
 *	PROGRAM:		Firebird client driver.
 *	MODULE:			common.h
 *	DESCRIPTION:	Common types and helpers.
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

#ifndef FBDRIVER_COMMON_COMMON_H
#define FBDRIVER_COMMON_COMMON_H

#include <stdint.h>
#include <string>
#include <vector>

namespace FbDriver
{
	typedef unsigned char UCHAR;
	typedef signed char SCHAR;
	typedef unsigned short USHORT;
	typedef short SSHORT;
	typedef int32_t SLONG;
	typedef uint32_t ULONG;
	typedef int64_t SINT64;
	typedef uint64_t FB_UINT64;

	typedef std::vector<UCHAR> Bytes;

	const unsigned BUFFER_TINY = 128;
	const unsigned BUFFER_SMALL = 256;
	const unsigned BUFFER_MEDIUM = 512;
	const unsigned BUFFER_LARGE = 1024;

	// Largest segment the engine accepts for a single BLOB get/put call
	const unsigned MAX_BLOB_SEGMENT_SIZE = 65535;

	// Engine limit for names in a single event block
	const unsigned MAX_EVENT_NAMES = 15;

	// Little endian integer of up to 8 bytes as found in info buffers
	inline SINT64 vaxInteger(const UCHAR* ptr, unsigned length)
	{
		if (!ptr || length == 0 || length > 8)
			return 0;

		FB_UINT64 value = 0;
		unsigned shift = 0;

		for (unsigned i = 0; i < length; ++i, shift += 8)
			value += FB_UINT64(ptr[i]) << shift;

		// sign extension
		if (length < 8 && (ptr[length - 1] & 0x80))
			value |= ~FB_UINT64(0) << (8 * length);

		return (SINT64) value;
	}

	inline void putVaxInteger(UCHAR* ptr, SINT64 value, unsigned length)
	{
		FB_UINT64 v = (FB_UINT64) value;

		for (unsigned i = 0; i < length; ++i, v >>= 8)
			ptr[i] = UCHAR(v & 0xFF);
	}

	std::string printfString(const char* format, ...)
#ifdef __GNUC__
		__attribute__((format(printf, 1, 2)))
#endif
		;

	// Character set identifiers with special CHAR length handling
	const unsigned CS_OCTETS = 1;
	const unsigned CS_UNICODE_FSS = 3;
	const unsigned CS_UTF8 = 4;
	const unsigned CS_GB18030 = 69;

	// Number of bytes the engine reserves per character in CHAR columns
	inline unsigned bytesPerChar(unsigned charSet)
	{
		switch (charSet)
		{
		case CS_UTF8:
		case CS_GB18030:
			return 4;

		case CS_UNICODE_FSS:
			return 3;

		default:
			return 1;
		}
	}

	// Cuts text to at most charCount characters of the given character set
	std::string truncateChars(const std::string& text, unsigned charSet, unsigned charCount);

} // namespace FbDriver

#endif // FBDRIVER_COMMON_COMMON_H
