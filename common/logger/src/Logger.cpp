/***************************************************************************
 * NASA Glenn Research Center, Cleveland, OH
 * Released under the NASA Open Source Agreement (NOSA)
 * May  2021
 *
 ****************************************************************************
 */

#include "Logger.h"

#include "SrpLinkVersion.hpp"
#include <boost/core/null_deleter.hpp>
#include <boost/filesystem/path.hpp>
#include <boost/make_shared.hpp>
#include <boost/preprocessor/slot/slot.hpp>
#include <boost/preprocessor/stringize.hpp>
#define BOOST_PP_VALUE SRPLINK_VERSION_MAJOR
#include BOOST_PP_ASSIGN_SLOT(1)
#undef BOOST_PP_VALUE

#define BOOST_PP_VALUE SRPLINK_VERSION_MINOR
#include BOOST_PP_ASSIGN_SLOT(2)
#undef BOOST_PP_VALUE

#define BOOST_PP_VALUE SRPLINK_VERSION_PATCH
#include BOOST_PP_ASSIGN_SLOT(3)
#undef BOOST_PP_VALUE

#ifdef SRPLINK_COMMIT_SHA
#define SRPLINK_COMMIT_SHA_STRING BOOST_PP_STRINGIZE(SRPLINK_COMMIT_SHA)
#endif

#define SRPLINK_VERSION_STRING BOOST_PP_STRINGIZE( \
    BOOST_PP_CAT(BOOST_PP_SLOT(1), \
    BOOST_PP_CAT(., \
    BOOST_PP_CAT(BOOST_PP_SLOT(2), \
    BOOST_PP_CAT(., BOOST_PP_SLOT(3))))))


/**
 * String values of the "Process" enum in Logger.h, in enum order.
 */
static const std::string process_strings[static_cast<unsigned int>(srplink::Logger::Process::none) + 1] =
{
    "fpgasim",
    "unittest",
    ""
};

/**
 * String values of the "SubProcess" enum in Logger.h, in enum order.
 */
static const std::string subprocess_strings[static_cast<unsigned int>(srplink::Logger::SubProcess::none) + 1] =
{
    "rssi",
    "axistream",
    "srp",
    "fpga",
    "fpgasim",
    "unittest",
    ""
};

static const uint32_t file_rotation_size = 5 * 1024 * 1024; //5 MiB
static const uint8_t console_message_offset_process = 9;
static const uint8_t console_message_offset_severity = 5;

// Namespaces recommended by the Boost log library
namespace logging = boost::log;
namespace expr = boost::log::expressions;
namespace sinks = boost::log::sinks;
namespace keywords = boost::log::keywords;

namespace srplink{

BOOST_LOG_ATTRIBUTE_KEYWORD(severity, "Severity", logging::trivial::severity_level) //no ending ";"
BOOST_LOG_ATTRIBUTE_KEYWORD(channel, "Channel", Logger::SubProcess) //no ending ";"

static std::ostream& operator<< (std::ostream& strm, const Logger::Process& process)
{
    return strm << Logger::toString(process);
}

static std::ostream& operator<< (std::ostream& strm, const Logger::SubProcess& subprocess)
{
    return strm << Logger::toString(subprocess);
}

Logger::Logger()
{
    init();
}

Logger::~Logger(){}

std::unique_ptr<Logger> Logger::logger_; //initialized to "null"
boost::mutex Logger::mutexSingletonInstance_;
std::atomic<bool> Logger::loggerSingletonFullyInitialized_(false);
Logger::process_attr_t Logger::process_attr(Logger::Process::none);
Logger::severity_channel_logger_t Logger::m_severityChannelLogger;

const std::string& Logger::GetSrpLinkVersionAsString() {
    static const std::string srpLinkVersionString = SRPLINK_VERSION_STRING;
    return srpLinkVersionString;
}

void Logger::initializeWithProcess(Logger::Process process) {
    Logger::process_attr = process_attr_t(process);
    ensureInitialized();
    LOG_INFO(Logger::SubProcess::none) << "This is srplink version " SRPLINK_VERSION_STRING;
#ifdef SRPLINK_COMMIT_SHA_STRING
    LOG_INFO(Logger::SubProcess::none) << "srplink Git commit SHA-1 is: " SRPLINK_COMMIT_SHA_STRING;
#endif
}

void Logger::ensureInitialized() noexcept {
    while (!loggerSingletonFullyInitialized_.load(std::memory_order_acquire)) { //fast way to bypass a mutex lock all the time
        try {
            //first thread that uses the logger gets to create the logger
            boost::mutex::scoped_lock theLock(mutexSingletonInstance_);
            if (!loggerSingletonFullyInitialized_) { //check it again now that mutex is locked
                logger_.reset(new Logger());
                loggerSingletonFullyInitialized_ = true;
            }
        }
        catch (const boost::lock_error&) {
            continue;
        }
        catch (const std::exception&) {
            continue;
        }
    }
}

void Logger::init()
{
    //To prevent crash on termination
    boost::filesystem::path::imbue(std::locale("C"));

    Logger::m_severityChannelLogger = Logger::severity_channel_logger_t(
        keywords::channel = Logger::SubProcess::none
    );
    m_severityChannelLogger.add_attribute("Process", Logger::process_attr);

    #ifdef LOG_TO_PROCESS_FILE
    {
        const Logger::Process process = getProcessAttributeVal();
        addRotatingFileSink(Logger::toString(process), processFileFormatter(),
            expr::attr<Logger::Process>("Process") == process);
    }
    #endif

    #ifdef LOG_TO_SUBPROCESS_FILES
    {
        static const Logger::SubProcess protocolLayers[] = {
            Logger::SubProcess::rssi,
            Logger::SubProcess::axistream,
            Logger::SubProcess::srp,
            Logger::SubProcess::fpga
        };
        for (std::size_t i = 0; i < (sizeof(protocolLayers) / sizeof(*protocolLayers)); ++i) {
            addRotatingFileSink(Logger::toString(protocolLayers[i]), subprocessFileFormatter(),
                channel == protocolLayers[i]);
        }
    }
    #endif

    #ifdef LOG_TO_ERROR_FILE
        addRotatingFileSink("error", levelFileFormatter(), severity == logging::trivial::severity_level::error);
        addRotatingFileSink("fatal", levelFileFormatter(), severity == logging::trivial::severity_level::fatal);
    #endif

    #ifdef LOG_TO_CONSOLE
        createStdoutSink();
    #endif

    logging::add_common_attributes(); //necessary for timestamp
}

void Logger::addRotatingFileSink(const std::string& fileNamePrefix,
    const logging::formatter& formatter, const logging::filter& filter)
{
    boost::shared_ptr<sinks::text_file_backend> sink_backend =
        boost::make_shared<sinks::text_file_backend>(
            keywords::file_name = "logs/" + fileNamePrefix + "_%5N.log",
            keywords::rotation_size = file_rotation_size
        );
    boost::shared_ptr<sink_t> sink = boost::make_shared<sink_t>(sink_backend);
    sink->set_formatter(formatter);
    sink->set_filter(filter);
    sink->locked_backend()->auto_flush(true);
    logging::core::get()->add_sink(sink);
}

logging::formatter Logger::processFileFormatter()
{
    static const logging::formatter fmt = expr::stream
        << "[ " << std::setw(console_message_offset_process) << std::left
        << expr::if_ (channel != Logger::SubProcess::none)
        [
            expr::stream << channel
        ]
        .else_
        [
            expr::stream << expr::attr<Logger::Process>("Process")
        ]
        << "]"
        << "[ " << expr::format_date_time<boost::posix_time::ptime>("TimeStamp","%Y-%m-%d %H:%M:%S") << "]"
        << "[ " << severity << "]: " << expr::smessage;
    return fmt;
}

logging::formatter Logger::subprocessFileFormatter()
{
    static const logging::formatter fmt = expr::stream
        << "[ " << expr::format_date_time<boost::posix_time::ptime>("TimeStamp","%Y-%m-%d %H:%M:%S.%f")
        << "][ " << severity << "]: " << expr::smessage;
    return fmt;
}

logging::formatter Logger::levelFileFormatter()
{
    static const logging::formatter fmt = expr::stream
        << expr::if_ (expr::has_attr<Logger::Process>("Process"))
        [
            expr::stream << "[ " << expr::attr<Logger::Process>("Process") << "]"
        ]
        << expr::if_ (channel != Logger::SubProcess::none)
        [
            expr::stream << "[ " << channel << "]"
        ]
        << "[ " << expr::format_date_time<boost::posix_time::ptime>("TimeStamp","%Y-%m-%d %H:%M:%S") << "]"
        << "[ " << expr::attr<std::string>("File") << ":"
        << expr::attr<int>("Line") << "]: " << expr::smessage;
    return fmt;
}

std::string Logger::toString(Logger::Process process)
{
    static constexpr uint32_t num_processes = sizeof(process_strings)/sizeof(*process_strings);
    const uint32_t process_val = static_cast<typename std::underlying_type<Logger::Process>::type>(process);
    if (process_val >= num_processes) {
        return "";
    }
    return process_strings[process_val];
}

std::string Logger::toString(Logger::SubProcess subprocess)
{
    static constexpr uint32_t num_subprocesses = sizeof(subprocess_strings)/sizeof(*subprocess_strings);
    const uint32_t subprocess_val = static_cast<typename std::underlying_type<Logger::SubProcess>::type>(subprocess);
    if (subprocess_val >= num_subprocesses) {
        return "";
    }
    return subprocess_strings[subprocess_val];
}

void Logger::createStdoutSink() {
    boost::shared_ptr<sinks::text_ostream_backend> stdout_sink_backend =
        boost::make_shared<sinks::text_ostream_backend>();
    stdout_sink_backend->add_stream(
        boost::shared_ptr<std::ostream>(&std::cout, boost::null_deleter())
    );

    typedef sinks::synchronous_sink< sinks::text_ostream_backend > ostream_sink_t;
    boost::shared_ptr<ostream_sink_t> stdout_sink = boost::make_shared<ostream_sink_t>(stdout_sink_backend);

    stdout_sink->set_filter(expr::has_attr<logging::trivial::severity_level>("Severity"));
    stdout_sink->set_formatter(Logger::consoleFormatter());
    stdout_sink->locked_backend()->auto_flush(true);
    logging::core::get()->add_sink(stdout_sink);
}

boost::log::formatter Logger::consoleFormatter() {
   static const logging::formatter fmt = expr::stream
        << "[ " << std::setw(console_message_offset_process) << std::left
        << expr::if_ (channel != Logger::SubProcess::none)
        [
            expr::stream << channel
        ]
        .else_
        [
            expr::stream << expr::attr<Logger::Process>("Process")
        ]
        << "]"
        << "[ " << std::setw(console_message_offset_severity) << std::left
        << severity << "]: " << expr::smessage;

    return fmt;
}

Logger::Process Logger::getProcessAttributeVal()
{
    logging::value_ref< Logger::Process > val = logging::extract< Logger::Process >
        (Logger::process_attr.get_value());
    if (val) {
        return val.get();
    }
    return Logger::Process::none;
}


} //namespace srplink
