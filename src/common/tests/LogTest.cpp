#include "boost/test/unit_test.hpp"
#include "../common/config/DriverConfig.h"
#include "../common/log/LogWriter.h"

#include <fstream>
#include <sstream>
#include <string>

#include <stdlib.h>
#include <unistd.h>

using namespace FbDriver;

namespace
{
	class LogFileFixture
	{
	public:
		LogFileFixture()
		{
			char name[] = "/tmp/fbdriver_log_XXXXXX";
			const int fd = mkstemp(name);
			BOOST_REQUIRE(fd >= 0);
			close(fd);
			fileName = name;
		}

		~LogFileFixture()
		{
			DriverConfig::set(std::make_shared<DriverConfig>());
			unlink(fileName.c_str());
		}

		void configure(LogMsgType level)
		{
			std::shared_ptr<DriverConfig> config(new DriverConfig);
			config->logFile = fileName;
			config->logLevel = level;
			DriverConfig::set(config);
		}

		std::string content() const
		{
			std::ifstream input(fileName.c_str());
			std::ostringstream text;
			text << input.rdbuf();
			return text.str();
		}

		std::string fileName;
	};
}

BOOST_AUTO_TEST_SUITE(CommonSuite)
BOOST_FIXTURE_TEST_SUITE(LogSuite, LogFileFixture)


BOOST_AUTO_TEST_CASE(LevelFilterTest)
{
	configure(WARNING_MSG);

	logError("connection lost");
	logWarning("deprecated option");
	logVerbose("statement prepared");
	logDebug("reader destroyed");

	const std::string text = content();

	BOOST_TEST(text.find("\tERROR: connection lost\n") != std::string::npos);
	BOOST_TEST(text.find("\tWARNING: deprecated option\n") != std::string::npos);
	BOOST_TEST(text.find("statement prepared") == std::string::npos);
	BOOST_TEST(text.find("reader destroyed") == std::string::npos);
}

BOOST_AUTO_TEST_CASE(DebugLevelTest)
{
	configure(DEBUG_MSG);

	logDebug("reader destroyed");
	BOOST_TEST(content().find("\tDEBUG: reader destroyed\n") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(DisabledLogTest)
{
	DriverConfig::set(std::make_shared<DriverConfig>());

	logError("nowhere");
	BOOST_TEST(content().empty());
}


BOOST_AUTO_TEST_SUITE_END()	// LogSuite
BOOST_AUTO_TEST_SUITE_END()	// CommonSuite
