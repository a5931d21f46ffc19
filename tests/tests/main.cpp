#define BOOST_TEST_MODULE lazystr tests
#include <boost/test/unit_test.hpp>
