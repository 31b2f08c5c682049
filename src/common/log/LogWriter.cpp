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

#include "../common/log/LogWriter.h"
#include "../common/config/DriverConfig.h"
#include "../common/common.h"
#include "../common/StatusHolder.h"

#include <boost/algorithm/string/predicate.hpp>

#include <unistd.h>
#include <sys/types.h>
#include <sys/stat.h>
#include <sys/file.h>

#include <mutex>
#include <stdio.h>
#include <time.h>

using namespace FbDriver;

namespace
{
	// Must match items inside enum LogMsgType
	const char* LOG_MSG_TYPES[] = {
		"ERROR",	// LogMsgType::ERROR_MSG
		"WARNING",	// LogMsgType::WARNING_MSG
		"VERBOSE",	// LogMsgType::VERBOSE_MSG
		"DEBUG"		// LogMsgType::DEBUG_MSG
	};

	class LogWriter
	{
	public:
		LogWriter()
		{
			char host[BUFFER_LARGE];
			if (gethostname(host, sizeof(host)) == 0)
			{
				host[sizeof(host) - 1] = 0;
				m_hostname = host;
			}
			else
				m_hostname = "localhost";
		}

		void logMessage(const std::string& fileName, LogMsgType type, const std::string& message)
		{
			const time_t now = time(NULL);

			// serializes threads of this process, flock() covers other processes
			std::lock_guard<std::mutex> guard(m_mutex);

			FILE* const file = fopen(fileName.c_str(), "a");
			if (file)
			{
				if (!lock(file))
				{
					fclose(file);
					return;
				}

				char timeBuffer[BUFFER_TINY];
				ctime_r(&now, timeBuffer);

				const std::string text = printfString("\n%s %s\t%s: %s\n",
					m_hostname.c_str(), timeBuffer, LOG_MSG_TYPES[type], message.c_str());

				fseek(file, 0, SEEK_END);
				fputs(text.c_str(), file);
				fclose(file);
			}
		}

	private:
		bool lock(FILE* file)
		{
			if (flock(fileno(file), LOCK_EX))
				return false;

			return true;
		}

		std::string m_hostname;
		std::mutex m_mutex;
	};
}

namespace FbDriver
{
	const char* logLevelName(LogMsgType type)
	{
		return LOG_MSG_TYPES[type];
	}

	bool parseLogLevel(const std::string& input, LogMsgType& output)
	{
		for (unsigned i = 0; i < sizeof(LOG_MSG_TYPES) / sizeof(LOG_MSG_TYPES[0]); ++i)
		{
			if (boost::algorithm::iequals(input, LOG_MSG_TYPES[i]))
			{
				output = LogMsgType(i);
				return true;
			}
		}

		return false;
	}

	void logMessage(LogMsgType type, const std::string& message)
	{
		static LogWriter g_writer;

		const auto config = DriverConfig::get();

		if (config->logFile.empty() || type > config->logLevel)
			return;

		g_writer.logMessage(config->logFile, type, message);
	}

	void logError(const std::string& message)
	{
		logMessage(ERROR_MSG, message);
	}

	void logWarning(const std::string& message)
	{
		logMessage(WARNING_MSG, message);
	}

	void logVerbose(const std::string& message)
	{
		logMessage(VERBOSE_MSG, message);
	}

	void logDebug(const std::string& message)
	{
		logMessage(DEBUG_MSG, message);
	}

	void logStatus(LogMsgType type, const intptr_t* status)
	{
		if (status && status[1])
			logMessage(type, StatusTranslator::formatMessage(status));
	}
}
