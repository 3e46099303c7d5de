/**
 * @file LoggerTests.cpp
 * @author  Ethan Schweinsberg <ethan.e.schweinsberg@nasa.gov>
 *
 * @copyright Copyright (c) 2021 United States Government as represented by
 * the National Aeronautics and Space Administration.
 * No copyright is claimed in the United States under Title 17, U.S.Code.
 * All Other Rights Reserved.
 *
 * @section LICENSE
 * Released under the NASA Open Source Agreement (NOSA)
 * See LICENSE.md in the source root directory for more information.
 */

#include <sstream>
#include <boost/regex.hpp>
#include <boost/test/unit_test.hpp>
#include "Logger.h"

/**
 * OutputTester redirects cout and cerr into string streams
 * so that the console sink output can be inspected.
 */
class OutputTester {
public:
    OutputTester() : cerr_backup(nullptr), cout_backup(nullptr) {}

    void redirect_cout_cerr()
    {
        cerr_backup = std::cerr.rdbuf();
        cout_backup = std::cout.rdbuf();
        std::cerr.rdbuf(cerr_test_stream.rdbuf());
        std::cout.rdbuf(cout_test_stream.rdbuf());
    }

    void reset_cout_cerr()
    {
        if (cout_backup) {
            std::cout.rdbuf(cout_backup);
        }
        if (cerr_backup) {
            std::cerr.rdbuf(cerr_backup);
        }
    }

    std::stringstream cerr_test_stream;
    std::stringstream cout_test_stream;

private:
    std::streambuf *cerr_backup;
    std::streambuf *cout_backup;
};

BOOST_AUTO_TEST_CASE(LoggerToStringTestCase)
{
    BOOST_REQUIRE_EQUAL(srplink::Logger::toString(srplink::Logger::Process::fpgasim), "fpgasim");
    BOOST_REQUIRE_EQUAL(srplink::Logger::toString(srplink::Logger::Process::unittest), "unittest");
    BOOST_REQUIRE_EQUAL(srplink::Logger::toString(srplink::Logger::Process::none), "");

    BOOST_REQUIRE_EQUAL(srplink::Logger::toString(srplink::Logger::SubProcess::rssi), "rssi");
    BOOST_REQUIRE_EQUAL(srplink::Logger::toString(srplink::Logger::SubProcess::axistream), "axistream");
    BOOST_REQUIRE_EQUAL(srplink::Logger::toString(srplink::Logger::SubProcess::srp), "srp");
    BOOST_REQUIRE_EQUAL(srplink::Logger::toString(srplink::Logger::SubProcess::fpga), "fpga");
    BOOST_REQUIRE_EQUAL(srplink::Logger::toString(srplink::Logger::SubProcess::fpgasim), "fpgasim");
    BOOST_REQUIRE_EQUAL(srplink::Logger::toString(srplink::Logger::SubProcess::unittest), "unittest");
    BOOST_REQUIRE_EQUAL(srplink::Logger::toString(srplink::Logger::SubProcess::none), "");
}

BOOST_AUTO_TEST_CASE(LoggerVersionStringTestCase)
{
    BOOST_REQUIRE(boost::regex_match(srplink::Logger::GetSrpLinkVersionAsString(), boost::regex("^\\d+\\.\\d+\\.\\d+$")));
}

#ifdef LOG_TO_CONSOLE
BOOST_AUTO_TEST_CASE(LoggerStdoutTestCase)
{
    OutputTester output_tester;
    output_tester.redirect_cout_cerr();

    _LOG_INTERNAL(srplink::Logger::SubProcess::rssi, boost::log::trivial::severity_level::trace) << "segment foo bar";
    _LOG_INTERNAL(srplink::Logger::SubProcess::axistream, boost::log::trivial::severity_level::debug) << "packet foo bar";
    _LOG_INTERNAL(srplink::Logger::SubProcess::srp, boost::log::trivial::severity_level::info) << "register foo bar";
    _LOG_INTERNAL(srplink::Logger::SubProcess::rssi, boost::log::trivial::severity_level::warning) << "segment foo bar?";
    _LOG_INTERNAL(srplink::Logger::SubProcess::fpga, boost::log::trivial::severity_level::error) << "fpga foo bar!";

    output_tester.reset_cout_cerr();

    BOOST_REQUIRE_EQUAL(output_tester.cout_test_stream.str(),
        std::string("[ rssi     ][ trace]: segment foo bar\n") +
        std::string("[ axistream][ debug]: packet foo bar\n") +
        std::string("[ srp      ][ info ]: register foo bar\n") +
        std::string("[ rssi     ][ warning]: segment foo bar?\n") +
        std::string("[ fpga     ][ error]: fpga foo bar!\n")
    );
}

BOOST_AUTO_TEST_CASE(LoggerProcessNameWithoutChannelTestCase)
{
    // Without a channel, the process name fills the first column
    OutputTester output_tester;
    output_tester.redirect_cout_cerr();

    _LOG_INTERNAL(srplink::Logger::SubProcess::none, boost::log::trivial::severity_level::info) << "Unittest foo bar";

    output_tester.reset_cout_cerr();
    BOOST_REQUIRE_EQUAL(output_tester.cout_test_stream.str(),
        std::string("[ unittest ][ info ]: Unittest foo bar\n")
    );
}
#endif
