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


#ifndef FBDRIVER_COMMON_DRIVER_CONFIG_H
#define FBDRIVER_COMMON_DRIVER_CONFIG_H

#include "../common/common.h"
#include "../common/log/LogWriter.h"

#include <istream>
#include <memory>
#include <string>
#include <vector>

namespace FbDriver
{
	// Connection defaults, either global or of a named database section
	struct DatabaseConfig
	{
		DatabaseConfig();

		std::string name;
		std::string database;
		std::string user;
		std::string password;
		std::string role;
		std::string charset;
		ULONG sqlDialect;
		ULONG timeout;
		std::string sessionTimeZone;
		ULONG pageSize;
		int forcedWrites;		// -1 when not specified
	};

	struct DriverConfig
	{
		DriverConfig();

		// Process configuration, read on first use from $FBDRIVER_CONF or ./fbdriver.conf
		static std::shared_ptr<const DriverConfig> get();
		static void set(const std::shared_ptr<const DriverConfig>& config);

		static std::shared_ptr<DriverConfig> load(const std::string& fileName);
		static std::shared_ptr<DriverConfig> parse(std::istream& input, const std::string& fileName);

		const DatabaseConfig* findDatabase(const std::string& name) const;

		std::string clientLibrary;
		ULONG streamBlobThreshold;
		std::string logFile;
		LogMsgType logLevel;
		DatabaseConfig defaults;
		std::vector<DatabaseConfig> databases;
	};
}

#endif // FBDRIVER_COMMON_DRIVER_CONFIG_H
