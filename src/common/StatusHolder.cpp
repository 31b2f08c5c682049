/*
 *	PROGRAM:		Firebird client driver.
 *	MODULE:			StatusHolder.cpp
 *	DESCRIPTION:	Status wrapper and status vector translation.
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

#include "../common/StatusHolder.h"
#include "../common/log/LogWriter.h"

#include <atomic>
#include <mutex>

using namespace Firebird;

namespace
{
	using namespace FbDriver;

	std::atomic<StatusInterpreter*> g_interpreter(nullptr);

	std::mutex g_handlerMutex;
	WarningHandler g_warningHandler;

	const char* const UNKNOWN_SQLSTATE = "HY000";
}

namespace FbDriver {

bool StatusTranslator::parseVector(const ISC_STATUS* vector, GdsCodes& gdsCodes, int& sqlCode)
{
	bool found = false;

	if (!vector)
		return found;

	const ISC_STATUS* p = vector;

	while (*p != isc_arg_end)
	{
		const ISC_STATUS tag = *p++;

		switch (tag)
		{
		case isc_arg_gds:
		case isc_arg_warning:
			{
				const ISC_STATUS code = *p++;

				if ((code & GDS_FACILITY_MASK) == GDS_FACILITY_MASK)
					gdsCodes.push_back(code);

				if (code == GDS_SQLERR && p[0] == isc_arg_number)
				{
					sqlCode = (int) p[1];
					found = true;
				}
			}
			break;

		case isc_arg_cstring:
			p += 2;
			break;

		default:
			// string, number, interpreted, sql_state and OS codes carry a single word
			++p;
			break;
		}
	}

	return found;
}

void StatusTranslator::translate(const ISC_STATUS* vector, std::string& message,
	std::string& sqlState, int& sqlCode, GdsCodes& gdsCodes)
{
	StatusInterpreter* const interpreter = g_interpreter.load();

	if (interpreter)
	{
		message = interpreter->formatMessage(vector);
		sqlState = interpreter->getSqlState(vector);
		sqlCode = interpreter->getSqlCode(vector);
	}
	else
	{
		message = "Unknown database error";
		sqlState = UNKNOWN_SQLSTATE;
		sqlCode = 0;
	}

	parseVector(vector, gdsCodes, sqlCode);
}

std::string StatusTranslator::formatMessage(const ISC_STATUS* vector)
{
	StatusInterpreter* const interpreter = g_interpreter.load();
	return interpreter ? interpreter->formatMessage(vector) : std::string("Unknown database error");
}

void StatusTranslator::check(const ISC_STATUS* vector)
{
	if (vector[0] == isc_arg_gds && vector[1] != isc_arg_end)
		raise(vector);
}

void StatusTranslator::raise(const ISC_STATUS* errors)
{
	std::string message, sqlState;
	int sqlCode = 0;
	GdsCodes gdsCodes;

	translate(errors, message, sqlState, sqlCode, gdsCodes);
	DatabaseError::raise(message, sqlState, sqlCode, gdsCodes);
}

void StatusTranslator::reportWarning(const ISC_STATUS* warnings)
{
	Warning warning;
	warning.sqlCode = 0;
	translate(warnings, warning.message, warning.sqlState, warning.sqlCode, warning.gdsCodes);

	logWarning(warning.message);

	WarningHandler handler;
	{
		std::lock_guard<std::mutex> guard(g_handlerMutex);
		handler = g_warningHandler;
	}

	if (handler)
		handler(warning);
}

void StatusTranslator::setInterpreter(StatusInterpreter* interpreter)
{
	g_interpreter.store(interpreter);
}

void StatusTranslator::setWarningHandler(const WarningHandler& handler)
{
	std::lock_guard<std::mutex> guard(g_handlerMutex);
	g_warningHandler = handler;
}


// StatusWrapper class

void StatusWrapper::checkException(StatusWrapper* status)
{
	if (!status->isDirty())
		return;

	const unsigned state = status->getState();

	if (state & IStatus::STATE_ERRORS)
	{
		std::string message, sqlState;
		int sqlCode = 0;
		GdsCodes gdsCodes;

		StatusTranslator::translate(status->getErrors(), message, sqlState, sqlCode, gdsCodes);

		// status object is reused by the next call of this thread
		status->init();

		DatabaseError::raise(message, sqlState, sqlCode, gdsCodes);
	}

	if (state & IStatus::STATE_WARNINGS)
	{
		try
		{
			StatusTranslator::reportWarning(status->getWarnings());
		}
		catch (...)
		{
			status->init();
			throw;
		}
	}

	status->init();
}

} // namespace FbDriver
