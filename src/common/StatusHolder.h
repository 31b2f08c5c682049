/*
 *	PROGRAM:		Firebird client driver.
 *	MODULE:			StatusHolder.h
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
 *
 *
 */

#ifndef FBDRIVER_COMMON_STATUS_HOLDER_H
#define FBDRIVER_COMMON_STATUS_HOLDER_H

#include "ibase.h"
#include "firebird/Interface.h"
#include "../common/fbd_exception.h"

#include <functional>
#include <string>

namespace FbDriver {

// Engine code carrying an explicit SQLCODE in the following numeric argument
const ISC_STATUS GDS_SQLERR = 335544436;

// Engine error codes share this facility prefix
const ISC_STATUS GDS_FACILITY_MASK = 0x14000000;


// Source of message text and SQL codes for a status vector.
// The client library provides the real one, tests plug their own.

class StatusInterpreter
{
public:
	virtual ~StatusInterpreter() {}

	virtual std::string formatMessage(const ISC_STATUS* vector) = 0;
	virtual std::string getSqlState(const ISC_STATUS* vector) = 0;
	virtual int getSqlCode(const ISC_STATUS* vector) = 0;
};

typedef std::function<void (const Warning&)> WarningHandler;


class StatusTranslator
{
public:
	// Walks the tagged words of a status vector collecting engine codes.
	// Returns true when an explicit SQLCODE argument was found and stored into sqlCode.
	static bool parseVector(const ISC_STATUS* vector, GdsCodes& gdsCodes, int& sqlCode);

	static void translate(const ISC_STATUS* vector, std::string& message,
		std::string& sqlState, int& sqlCode, GdsCodes& gdsCodes);

	static std::string formatMessage(const ISC_STATUS* vector);

	// Legacy status arrays (ISC API) are checked with this one
	static void check(const ISC_STATUS* vector);

	[[noreturn]] static void raise(const ISC_STATUS* errors);
	static void reportWarning(const ISC_STATUS* warnings);

	static void setInterpreter(StatusInterpreter* interpreter);
	static void setWarningHandler(const WarningHandler& handler);
};


// Status wrapper passed to every call of the native interfaces.
// Errors are raised as driver exceptions, warnings are reported and never abort.

class StatusWrapper : public Firebird::BaseStatusWrapper<StatusWrapper>
{
public:
	explicit StatusWrapper(Firebird::IStatus* status)
		: BaseStatusWrapper(status)
	{ }

	static void checkException(StatusWrapper* status);
};

} // namespace FbDriver


#endif // FBDRIVER_COMMON_STATUS_HOLDER_H
