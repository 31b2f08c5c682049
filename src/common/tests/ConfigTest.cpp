#include "boost/test/unit_test.hpp"
#include "../common/config/DriverConfig.h"
#include "../common/fbd_exception.h"

#include <sstream>
#include <string>

using namespace FbDriver;

namespace
{
	std::shared_ptr<DriverConfig> parseText(const std::string& text)
	{
		std::istringstream input(text);
		return DriverConfig::parse(input, "test.conf");
	}

	std::string parseError(const std::string& text)
	{
		try
		{
			parseText(text);
		}
		catch (const InterfaceError& ex)
		{
			return ex.getMessage();
		}

		return "";
	}
}

BOOST_AUTO_TEST_SUITE(CommonSuite)
BOOST_AUTO_TEST_SUITE(ConfigSuite)


BOOST_AUTO_TEST_CASE(GlobalEntriesTest)
{
	const auto config = parseText(
		"# driver settings\n"
		"ClientLibrary = /opt/firebird/lib/libfbclient.so\n"
		"StreamBlobThreshold = 1024   # bytes\n"
		"LogFile = \"/tmp/fbdriver.log\"\n"
		"LogLevel = verbose\n"
		"Charset = UTF8\n"
		"SqlDialect = 1\n");

	BOOST_TEST(config->clientLibrary == "/opt/firebird/lib/libfbclient.so");
	BOOST_TEST(config->streamBlobThreshold == 1024u);
	BOOST_TEST(config->logFile == "/tmp/fbdriver.log");
	BOOST_TEST(config->logLevel == VERBOSE_MSG);
	BOOST_TEST(config->defaults.charset == "UTF8");
	BOOST_TEST(config->defaults.sqlDialect == 1u);
	BOOST_TEST(config->databases.empty());
}

BOOST_AUTO_TEST_CASE(DefaultsTest)
{
	const auto config = parseText("");

	BOOST_TEST(config->clientLibrary.empty());
	BOOST_TEST(config->streamBlobThreshold == 65536u);
	BOOST_TEST(config->logLevel == WARNING_MSG);
	BOOST_TEST(config->defaults.sqlDialect == 3u);
	BOOST_TEST(config->defaults.forcedWrites == -1);
}

BOOST_AUTO_TEST_CASE(DatabaseSectionTest)
{
	const auto config = parseText(
		"Charset = WIN1252\n"
		"Role = READER\n"
		"database = employee\n"
		"{\n"
		"\tDatabase = localhost:/data/employee.fdb\n"
		"\tCharset = UTF8\n"
		"\tForcedWrites = off\n"
		"}\n"
		"database = test {\n"
		"\tPageSize = 16384\n"
		"}\n");

	BOOST_TEST(config->databases.size() == 2u);

	const DatabaseConfig* const employee = config->findDatabase("employee");
	BOOST_REQUIRE(employee);
	BOOST_TEST(employee->database == "localhost:/data/employee.fdb");
	BOOST_TEST(employee->charset == "UTF8");
	BOOST_TEST(employee->role == "READER");
	BOOST_TEST(employee->forcedWrites == 0);

	const DatabaseConfig* const test = config->findDatabase("test");
	BOOST_REQUIRE(test);
	BOOST_TEST(test->database == "test");
	BOOST_TEST(test->charset == "WIN1252");
	BOOST_TEST(test->pageSize == 16384u);

	BOOST_TEST(!config->findDatabase("missing"));
	BOOST_TEST(config->defaults.charset == "WIN1252");
}

BOOST_AUTO_TEST_CASE(IncorrectEntriesTest)
{
	BOOST_TEST(parseError("SqlDialect = 4\n") ==
		"Incorrect entry in test.conf at line 1: SqlDialect specifies unsupported SQL dialect: 4");

	BOOST_TEST(parseError("Timeout = abc\n") ==
		"Incorrect entry in test.conf at line 1: Timeout specifies invalid (misformatted) value: abc");

	BOOST_TEST(parseError("LogLevel = chatty\n") ==
		"Incorrect entry in test.conf at line 1: LogLevel specifies unknown log level: chatty");

	BOOST_TEST(parseError("database = a {\n}\ndatabase = a {\n}\n") ==
		"Incorrect entry in test.conf at line 3: Database a is defined twice");

	BOOST_TEST(parseError("database = a {\nClientLibrary = x\n}\n") ==
		"Incorrect entry in test.conf at line 2: ClientLibrary specifies "
		"parameter not allowed inside database section: x");

	BOOST_TEST(parseError("database = a {\nUser = x\n") ==
		"Incorrect entry in test.conf at line 2: Missing closing brace");

	BOOST_TEST(parseError("}\n") ==
		"Incorrect entry in test.conf at line 1: Unexpected closing brace");

	BOOST_TEST(parseError("ForcedWrites = maybe\n") ==
		"Incorrect entry in test.conf at line 1: ForcedWrites specifies invalid boolean value: maybe");
}

BOOST_AUTO_TEST_CASE(LogLevelNamesTest)
{
	LogMsgType level = ERROR_MSG;

	BOOST_TEST(parseLogLevel("Debug", level));
	BOOST_TEST(level == DEBUG_MSG);
	BOOST_TEST(parseLogLevel("ERROR", level));
	BOOST_TEST(level == ERROR_MSG);
	BOOST_TEST(!parseLogLevel("trace", level));
	BOOST_TEST(std::string(logLevelName(WARNING_MSG)) == "WARNING");
}


BOOST_AUTO_TEST_SUITE_END()	// ConfigSuite
BOOST_AUTO_TEST_SUITE_END()	// CommonSuite
