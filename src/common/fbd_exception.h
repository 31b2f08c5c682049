/*
 *	PROGRAM:		Firebird client driver.
 *	MODULE:			fbd_exception.h
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

#ifndef FBDRIVER_COMMON_EXCEPTION_H
#define FBDRIVER_COMMON_EXCEPTION_H

#include <stdint.h>
#include <exception>
#include <string>
#include <vector>

namespace FbDriver
{

// Base of all driver exceptions

class Error : public std::exception
{
public:
	explicit Error(const std::string& message)
		: m_message(message)
	{}

	const char* what() const noexcept override
	{
		return m_message.c_str();
	}

	const std::string& getMessage() const
	{
		return m_message;
	}

private:
	std::string m_message;
};

// Driver or API misuse, never reported by the server

class InterfaceError : public Error
{
public:
	explicit InterfaceError(const std::string& message)
		: Error(message)
	{}

	[[noreturn]] static void raise(const char* format, ...)
#ifdef __GNUC__
		__attribute__((format(printf, 1, 2)))
#endif
		;
};

typedef std::vector<intptr_t> GdsCodes;

// Errors carrying SQLSTATE, legacy SQLCODE and engine error codes

class DatabaseError : public Error
{
public:
	DatabaseError(const std::string& message, const std::string& sqlState = "",
				  int sqlCode = 0, const GdsCodes& gdsCodes = GdsCodes())
		: Error(message),
		  m_sqlState(sqlState),
		  m_sqlCode(sqlCode),
		  m_gdsCodes(gdsCodes)
	{}

	const std::string& getSqlState() const
	{
		return m_sqlState;
	}

	int getSqlCode() const
	{
		return m_sqlCode;
	}

	const GdsCodes& getGdsCodes() const
	{
		return m_gdsCodes;
	}

	// Throws the most specific subclass for the SQLSTATE class
	[[noreturn]] static void raise(const std::string& message, const std::string& sqlState,
		int sqlCode, const GdsCodes& gdsCodes);

private:
	std::string m_sqlState;
	int m_sqlCode;
	GdsCodes m_gdsCodes;
};

#define FBDRIVER_DATABASE_ERROR(NAME)										\
class NAME : public DatabaseError												\
{																				\
public:																			\
	NAME(const std::string& message, const std::string& sqlState = "",			\
		 int sqlCode = 0, const GdsCodes& gdsCodes = GdsCodes())				\
		: DatabaseError(message, sqlState, sqlCode, gdsCodes)					\
	{}																			\
};

FBDRIVER_DATABASE_ERROR(DataError)
FBDRIVER_DATABASE_ERROR(OperationalError)
FBDRIVER_DATABASE_ERROR(IntegrityError)
FBDRIVER_DATABASE_ERROR(InternalError)
FBDRIVER_DATABASE_ERROR(ProgrammingError)
FBDRIVER_DATABASE_ERROR(NotSupportedError)

#undef FBDRIVER_DATABASE_ERROR

// Non-fatal condition reported together with a successful call

struct Warning
{
	std::string message;
	std::string sqlState;
	int sqlCode;
	GdsCodes gdsCodes;
};

// SQLSTATE values raised by the driver itself
const char* const SQLSTATE_NUMERIC_OVERFLOW = "22003";
const char* const SQLSTATE_STRING_TRUNCATION = "22001";
const char* const SQLSTATE_DATA_EXCEPTION = "22000";
const char* const SQLSTATE_WRONG_PARAM_COUNT = "07001";

} // namespace FbDriver

#endif // FBDRIVER_COMMON_EXCEPTION_H
