#define BOOST_TEST_MODULE DriverTest
#include "boost/test/included/unit_test.hpp"
