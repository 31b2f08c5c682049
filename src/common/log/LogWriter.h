/*
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

#ifndef FBDRIVER_COMMON_LOG_WRITER_H
#define FBDRIVER_COMMON_LOG_WRITER_H

#include <stdint.h>
#include <string>

namespace FbDriver
{
	// Ordered by verbosity, a configured level accepts itself and everything above it
	enum LogMsgType
	{
		ERROR_MSG,
		WARNING_MSG,
		VERBOSE_MSG,
		DEBUG_MSG
	};

	const char* logLevelName(LogMsgType type);
	bool parseLogLevel(const std::string& input, LogMsgType& output);

	void logMessage(LogMsgType type, const std::string& message);

	void logError(const std::string& message);
	void logWarning(const std::string& message);
	void logVerbose(const std::string& message);
	void logDebug(const std::string& message);

	// Status vector rendered the same way as raised errors
	void logStatus(LogMsgType type, const intptr_t* status);
}

#endif // FBDRIVER_COMMON_LOG_WRITER_H
