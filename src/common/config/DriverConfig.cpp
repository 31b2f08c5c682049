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

#include "../common/config/DriverConfig.h"
#include "../common/fbd_exception.h"

#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <unistd.h>

#include <fstream>
#include <mutex>
#include <stdlib.h>

using namespace FbDriver;
using boost::algorithm::iequals;

namespace
{
	const char* DRIVER_CFGFILE = "fbdriver.conf";
	const char* DRIVER_CFGENV = "FBDRIVER_CONF";

	const ULONG DEFAULT_STREAM_BLOB_THRESHOLD = 65536;	// bytes
	const ULONG DEFAULT_SQL_DIALECT = 3;

	std::mutex g_configMutex;
	std::shared_ptr<const DriverConfig> g_config;

	bool parseLong(const std::string& input, ULONG& output)
	{
		char* tail = nullptr;
		auto number = strtol(input.c_str(), &tail, 10);
		if (tail && *tail == 0 && number >= 0)
		{
			output = (ULONG) number;
			return true;
		}

		return false;
	}

	bool parseBoolean(const std::string& input, bool& output)
	{
		if (iequals(input, "true") || iequals(input, "yes") || iequals(input, "on") || input == "1")
			output = true;
		else if (iequals(input, "false") || iequals(input, "no") || iequals(input, "off") || input == "0")
			output = false;
		else
			return false;

		return true;
	}

	[[noreturn]] void configError(const std::string& type, const std::string& key, const std::string& value)
	{
		InterfaceError::raise("%s specifies %s: %s", key.c_str(), type.c_str(), value.c_str());
	}

	void parseNumber(const std::string& key, const std::string& value, ULONG& output)
	{
		if (!parseLong(value, output))
			configError("invalid (misformatted) value", key, value);
	}

	std::string unquote(const std::string& value)
	{
		if (value.length() >= 2 && value.front() == '"' && value.back() == '"')
			return value.substr(1, value.length() - 2);

		return value;
	}

	const char* getEnv(const char* name)
	{
		const char* const value = getenv(name);
		return value ? value : "";
	}

	// Returns false for keys not valid inside a database section
	bool applyDatabaseKey(DatabaseConfig& config, const std::string& key, const std::string& value)
	{
		if (iequals(key, "User"))
			config.user = value;
		else if (iequals(key, "Password"))
			config.password = value;
		else if (iequals(key, "Role"))
			config.role = value;
		else if (iequals(key, "Charset"))
			config.charset = value;
		else if (iequals(key, "SqlDialect"))
		{
			parseNumber(key, value, config.sqlDialect);
			if (config.sqlDialect < 1 || config.sqlDialect > 3)
				configError("unsupported SQL dialect", key, value);
		}
		else if (iequals(key, "Timeout"))
			parseNumber(key, value, config.timeout);
		else if (iequals(key, "SessionTimeZone"))
			config.sessionTimeZone = value;
		else if (iequals(key, "PageSize"))
			parseNumber(key, value, config.pageSize);
		else if (iequals(key, "ForcedWrites"))
		{
			bool flag = false;
			if (!parseBoolean(value, flag))
				configError("invalid boolean value", key, value);
			config.forcedWrites = flag ? 1 : 0;
		}
		else
			return false;

		return true;
	}

	void applyGlobalKey(DriverConfig& config, const std::string& key, const std::string& value)
	{
		if (iequals(key, "ClientLibrary"))
			config.clientLibrary = value;
		else if (iequals(key, "StreamBlobThreshold"))
			parseNumber(key, value, config.streamBlobThreshold);
		else if (iequals(key, "LogFile"))
			config.logFile = value;
		else if (iequals(key, "LogLevel"))
		{
			if (!parseLogLevel(value, config.logLevel))
				configError("unknown log level", key, value);
		}
		else
			applyDatabaseKey(config.defaults, key, value);
	}
}


// FbDriver::DatabaseConfig class

DatabaseConfig::DatabaseConfig()
	: user(getEnv("ISC_USER")),
	  password(getEnv("ISC_PASSWORD")),
	  sqlDialect(DEFAULT_SQL_DIALECT),
	  timeout(0),
	  pageSize(0),
	  forcedWrites(-1)
{
}


// FbDriver::DriverConfig class

DriverConfig::DriverConfig()
	: streamBlobThreshold(DEFAULT_STREAM_BLOB_THRESHOLD),
	  logLevel(WARNING_MSG)
{
}

std::shared_ptr<const DriverConfig> DriverConfig::get()
{
	std::lock_guard<std::mutex> guard(g_configMutex);

	if (!g_config)
	{
		std::string fileName = getEnv(DRIVER_CFGENV);

		if (fileName.empty() && access(DRIVER_CFGFILE, R_OK) == 0)
			fileName = DRIVER_CFGFILE;

		if (fileName.empty())
			g_config = std::make_shared<DriverConfig>();
		else
			g_config = load(fileName);
	}

	return g_config;
}

void DriverConfig::set(const std::shared_ptr<const DriverConfig>& config)
{
	std::lock_guard<std::mutex> guard(g_configMutex);
	g_config = config;
}

std::shared_ptr<DriverConfig> DriverConfig::load(const std::string& fileName)
{
	std::ifstream input(fileName.c_str());

	if (!input)
		InterfaceError::raise("Cannot open configuration file %s", fileName.c_str());

	return parse(input, fileName);
}

// Entries are applied in file order. A database section starts from the
// defaults set above it and keeps everything it does not override.

std::shared_ptr<DriverConfig> DriverConfig::parse(std::istream& input, const std::string& fileName)
{
	std::shared_ptr<DriverConfig> config(new DriverConfig);

	DatabaseConfig* section = nullptr;
	bool sectionOpen = false, braceExpected = false;
	unsigned lineNumber = 0;
	std::string line;

	try
	{
		while (std::getline(input, line))
		{
			++lineNumber;

			const std::string::size_type comment = line.find('#');
			if (comment != std::string::npos)
				line.erase(comment);

			boost::algorithm::trim(line);

			if (line.empty())
				continue;

			if (line == "{")
			{
				if (!braceExpected)
					InterfaceError::raise("Unexpected opening brace");

				braceExpected = false;
				sectionOpen = true;
				continue;
			}

			braceExpected = false;

			if (line == "}")
			{
				if (!sectionOpen)
					InterfaceError::raise("Unexpected closing brace");

				sectionOpen = false;
				section = nullptr;
				continue;
			}

			const std::string::size_type eq = line.find('=');
			if (eq == std::string::npos)
				InterfaceError::raise("Missing value for parameter %s", line.c_str());

			std::string key = line.substr(0, eq);
			std::string value = line.substr(eq + 1);
			boost::algorithm::trim(key);
			boost::algorithm::trim(value);

			bool openHere = false;
			if (!value.empty() && value.back() == '{')
			{
				value.erase(value.length() - 1);
				boost::algorithm::trim(value);
				openHere = true;
			}

			value = unquote(value);

			if (iequals(key, "database") && !sectionOpen)
			{
				if (value.empty())
					InterfaceError::raise("Database section requires a name");

				if (config->findDatabase(value))
					InterfaceError::raise("Database %s is defined twice", value.c_str());

				DatabaseConfig dbConfig(config->defaults);
				dbConfig.name = value;
				dbConfig.database = value;
				config->databases.push_back(dbConfig);
				section = &config->databases.back();

				sectionOpen = openHere;
				braceExpected = !openHere;
				continue;
			}

			if (openHere)
				InterfaceError::raise("Unexpected opening brace");

			if (value.empty())
				continue;

			if (sectionOpen)
			{
				if (iequals(key, "Database"))
					section->database = value;
				else if (!applyDatabaseKey(*section, key, value))
					configError("parameter not allowed inside database section", key, value);
			}
			else
				applyGlobalKey(*config, key, value);
		}

		if (sectionOpen)
			InterfaceError::raise("Missing closing brace");
	}
	catch (const InterfaceError& ex)
	{
		InterfaceError::raise("Incorrect entry in %s at line %u: %s",
			fileName.c_str(), lineNumber, ex.what());
	}

	return config;
}

const DatabaseConfig* DriverConfig::findDatabase(const std::string& name) const
{
	for (const auto& db : databases)
	{
		if (db.name == name)
			return &db;
	}

	return nullptr;
}
