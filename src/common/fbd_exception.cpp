/*
 *	PROGRAM:		Firebird client driver.
 *	MODULE:			fbd_exception.cpp
 *	DESCRIPTION:	Driver exception classes.
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

#include "../common/fbd_exception.h"
#include "../common/common.h"

#include <stdarg.h>
#include <stdio.h>

namespace FbDriver {

void InterfaceError::raise(const char* format, ...)
{
	char buffer[BUFFER_LARGE];

	va_list ptr;
	va_start(ptr, format);
	vsnprintf(buffer, sizeof(buffer), format, ptr);
	va_end(ptr);

	throw InterfaceError(buffer);
}

void DatabaseError::raise(const std::string& message, const std::string& sqlState,
	int sqlCode, const GdsCodes& gdsCodes)
{
	const std::string sqlClass = sqlState.substr(0, 2);

	if (sqlClass == "22")
		throw DataError(message, sqlState, sqlCode, gdsCodes);

	if (sqlClass == "23")
		throw IntegrityError(message, sqlState, sqlCode, gdsCodes);

	if (sqlClass == "42")
		throw ProgrammingError(message, sqlState, sqlCode, gdsCodes);

	if (sqlClass == "0A")
		throw NotSupportedError(message, sqlState, sqlCode, gdsCodes);

	if (sqlClass == "XX")
		throw InternalError(message, sqlState, sqlCode, gdsCodes);

	if (sqlClass == "08" || sqlClass == "40" || sqlClass == "57" || sqlClass == "HY")
		throw OperationalError(message, sqlState, sqlCode, gdsCodes);

	throw DatabaseError(message, sqlState, sqlCode, gdsCodes);
}

} // namespace FbDriver
