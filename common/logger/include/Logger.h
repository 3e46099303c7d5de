/***************************************************************************
 * NASA Glenn Research Center, Cleveland, OH
 * Released under the NASA Open Source Agreement (NOSA)
 * May  2021
 *
 ***************************************************************************
 */

#ifndef _SRPLINK_LOG_H
#define _SRPLINK_LOG_H

#include <cstddef>
#include <iomanip>
#include <ostream>
#include <iostream>
#include <string>
#include <memory>
#include <atomic>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/log/attributes.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_channel_logger.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/utility/manipulators/add_value.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/thread/mutex.hpp>
#include "log_lib_export.h"

namespace srplink{

/**
 * Log levels. These match the Boost trivial level definitions
 */
#define LOG_LEVEL_TRACE 0
#define LOG_LEVEL_DEBUG 1
#define LOG_LEVEL_INFO 2
#define LOG_LEVEL_WARNING 3
#define LOG_LEVEL_ERROR 4
#define LOG_LEVEL_FATAL 5

#ifndef LOG_LEVEL
#define LOG_LEVEL LOG_LEVEL_INFO
#endif

/**
 * _NO_OP_STREAM_LOGGER discards a streaming expression. Since the "else"
 * branch is never taken, the compiler should optimize it out.
 */
#define _NO_OP_STREAM_LOGGER if (true) {} else std::cout

#if LOG_LEVEL > LOG_LEVEL_TRACE
    #define LOG_TRACE(subprocess) _NO_OP_STREAM_LOGGER
#else
    #define LOG_TRACE(subprocess) _LOG_INTERNAL(subprocess, boost::log::trivial::severity_level::trace)
#endif

#if LOG_LEVEL > LOG_LEVEL_DEBUG
    #define LOG_DEBUG(subprocess) _NO_OP_STREAM_LOGGER
#else
    #define LOG_DEBUG(subprocess) _LOG_INTERNAL(subprocess, boost::log::trivial::severity_level::debug)
#endif

#if LOG_LEVEL > LOG_LEVEL_INFO
    #define LOG_INFO(subprocess) _NO_OP_STREAM_LOGGER
#else
    #define LOG_INFO(subprocess) _LOG_INTERNAL(subprocess, boost::log::trivial::severity_level::info)
#endif

#if LOG_LEVEL > LOG_LEVEL_WARNING
    #define LOG_WARNING(subprocess) _NO_OP_STREAM_LOGGER
#else
    #define LOG_WARNING(subprocess) _LOG_INTERNAL(subprocess, boost::log::trivial::severity_level::warning)
#endif

#if LOG_LEVEL > LOG_LEVEL_ERROR
    #define LOG_ERROR(subprocess) _NO_OP_STREAM_LOGGER
#else
    #define LOG_ERROR(subprocess) _LOG_INTERNAL(subprocess, boost::log::trivial::severity_level::error)
#endif

#if LOG_LEVEL > LOG_LEVEL_FATAL
    #define LOG_FATAL(subprocess) _NO_OP_STREAM_LOGGER
#else
    #define LOG_FATAL(subprocess) _LOG_INTERNAL(subprocess, boost::log::trivial::severity_level::fatal)
#endif

#define _LOG_INTERNAL(subprocess, lvl)\
    srplink::Logger::ensureInitialized();\
    BOOST_LOG_STREAM_CHANNEL_SEV(srplink::Logger::m_severityChannelLogger, subprocess, lvl)\
        << boost::log::add_value("File", __FILE__)\
        << boost::log::add_value("Line", __LINE__)


typedef boost::log::sinks::synchronous_sink<boost::log::sinks::text_file_backend> sink_t;

/**
 * @brief Process-wide logger shared by the protocol libraries and applications.
 *
 * Records are routed by channel (SubProcess) and severity.  Which sinks exist is decided
 * at compile time by LOG_TO_CONSOLE, LOG_TO_PROCESS_FILE, LOG_TO_SUBPROCESS_FILES and LOG_TO_ERROR_FILE.
 */
class Logger
{
public:
    /**
     * Returns SRPLINK_VERSION from SrpLinkVersion.hpp formatted as "MAJOR.MINOR.PATCH" (example: "1.0.0").
     */
    LOG_LIB_EXPORT static const std::string& GetSrpLinkVersionAsString();

    /**
     * Creates the logger if it hasn't been created yet. Called from the LOG_* macros.
     */
    LOG_LIB_EXPORT static void ensureInitialized() noexcept;

    /**
     * Executables using the logger. New executables should be added to this list
     * and to the string table in Logger.cpp.
     */
    enum class Process {
        fpgasim,
        unittest,
        none
    };

    /**
     * Library components that log on their own channel.
     */
    enum class SubProcess {
        rssi,
        axistream,
        srp,
        fpga,
        fpgasim,
        unittest,
        none
    };

    LOG_LIB_EXPORT static std::string toString(Logger::Process process);
    LOG_LIB_EXPORT static std::string toString(Logger::SubProcess subProcess);

    typedef boost::log::attributes::constant<Logger::Process> process_attr_t;
    LOG_LIB_EXPORT static Logger::process_attr_t process_attr;

    /**
     * Tags all subsequent records with the given process and logs the srplink version.
     */
    LOG_LIB_EXPORT static void initializeWithProcess(Logger::Process process);

    typedef boost::log::sources::severity_channel_logger_mt<
        boost::log::trivial::severity_level,
        Logger::SubProcess
    > severity_channel_logger_t; //mt for multithreaded
    LOG_LIB_EXPORT static Logger::severity_channel_logger_t m_severityChannelLogger;

    LOG_LIB_EXPORT ~Logger();

private:
    LOG_LIB_EXPORT Logger();
    Logger(Logger const&) = delete;
    Logger& operator=(Logger const&) = delete;

    LOG_LIB_NO_EXPORT void init();

    /**
     * Adds a rotating text file sink "logs/<fileNamePrefix>_NNNNN.log".
     */
    LOG_LIB_NO_EXPORT void addRotatingFileSink(const std::string& fileNamePrefix,
        const boost::log::formatter& formatter, const boost::log::filter& filter);

    LOG_LIB_NO_EXPORT void createStdoutSink();

    LOG_LIB_NO_EXPORT Logger::Process getProcessAttributeVal();

    LOG_LIB_NO_EXPORT static boost::log::formatter consoleFormatter();
    LOG_LIB_NO_EXPORT static boost::log::formatter levelFileFormatter();
    LOG_LIB_NO_EXPORT static boost::log::formatter processFileFormatter();
    LOG_LIB_NO_EXPORT static boost::log::formatter subprocessFileFormatter();

    static std::unique_ptr<Logger> logger_; //singleton instance
    static boost::mutex mutexSingletonInstance_;
    static std::atomic<bool> loggerSingletonFullyInitialized_;
};
}

#endif //_SRPLINK_LOG_H
