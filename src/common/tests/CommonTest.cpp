#define BOOST_TEST_MODULE CommonTest
#include "boost/test/included/unit_test.hpp"
