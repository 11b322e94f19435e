#define BOOST_TEST_MODULE exceptions_test
#include <boost/test/unit_test.hpp>
#include "libsplitbench/except.h"

#include <stdexcept>
#include <string>

using namespace splitbench;

BOOST_AUTO_TEST_SUITE(exception_base_tests)

BOOST_AUTO_TEST_CASE(exception_with_default_code)
{
    Exception ex("Test exception");
    BOOST_CHECK_EQUAL(std::string(ex.what()), "Test exception");
    BOOST_CHECK_EQUAL(ex.code(), -1);
}

BOOST_AUTO_TEST_CASE(exception_with_custom_code)
{
    Exception ex("Custom error", -12345);
    BOOST_CHECK_EQUAL(ex.code(), -12345);
}

BOOST_AUTO_TEST_CASE(exception_inheritance)
{
    Exception ex("Test");
    std::runtime_error& ref = ex;
    BOOST_CHECK_EQUAL(std::string(ref.what()), "Test");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(malformed_line_tests)

BOOST_AUTO_TEST_CASE(malformed_line_message)
{
    Malformed_line ex("GET");
    BOOST_CHECK_EQUAL(std::string(ex.what()), "Malformed line 'GET'");
    BOOST_CHECK_EQUAL(ex.code(), -1);
}

BOOST_AUTO_TEST_CASE(malformed_line_control_chars_replaced)
{
    Malformed_line ex(std::string_view("A\r\nB\0C", 6));
    BOOST_CHECK_EQUAL(std::string(ex.what()), "Malformed line 'A??B?C'");
}

BOOST_AUTO_TEST_CASE(malformed_line_long_input_truncated)
{
    std::string line(200, 'x');
    Malformed_line ex(line);
    std::string expected = "Malformed line '" + std::string(64, 'x') + "...'";
    BOOST_CHECK_EQUAL(std::string(ex.what()), expected);
}

BOOST_AUTO_TEST_CASE(malformed_line_caught_as_base)
{
    try {
        throw Malformed_line("x");
    } catch (const Exception& e) {
        BOOST_CHECK_EQUAL(e.code(), -1);
    }
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(probe_and_config_tests)

BOOST_AUTO_TEST_CASE(probe_unavailable)
{
    Probe_unavailable ex("counter is not installed");
    BOOST_CHECK_EQUAL(std::string(ex.what()), "Probe unavailable. counter is not installed");
    BOOST_CHECK_EQUAL(ex.code(), -2);
}

BOOST_AUTO_TEST_CASE(probe_error)
{
    Probe_error ex("went backwards");
    BOOST_CHECK_EQUAL(std::string(ex.what()), "Probe error. went backwards");
    BOOST_CHECK_EQUAL(ex.code(), -3);
}

BOOST_AUTO_TEST_CASE(bad_config)
{
    Bad_config ex("no trials");
    BOOST_CHECK_EQUAL(std::string(ex.what()), "Bad config. no trials");
    BOOST_CHECK_EQUAL(ex.code(), -4);
}

BOOST_AUTO_TEST_CASE(codes_are_distinct)
{
    BOOST_CHECK_NE(Malformed_line("a").code(), Probe_unavailable("b").code());
    BOOST_CHECK_NE(Probe_unavailable("b").code(), Probe_error("c").code());
    BOOST_CHECK_NE(Probe_error("c").code(), Bad_config("d").code());
}

BOOST_AUTO_TEST_SUITE_END()

// vim:ts=2:sw=2:et
