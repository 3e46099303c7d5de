/**
 * @file ThreadNamer.cpp
 * @author  Brian Tomko <brian.j.tomko@nasa.gov>
 *
 * @copyright Copyright © 2021 United States Government as represented by
 * the National Aeronautics and Space Administration.
 * No copyright is claimed in the United States under Title 17, U.S.Code.
 * All Other Rights Reserved.
 *
 * @section LICENSE
 * Released under the NASA Open Source Agreement (NOSA)
 * See LICENSE.md in the source root directory for more information.
 */

#include "ThreadNamer.h"
#include "Logger.h"
#include <boost/asio/post.hpp>
#include <boost/bind/bind.hpp>
#include <pthread.h>

static constexpr srplink::Logger::SubProcess subprocess = srplink::Logger::SubProcess::none;
static constexpr std::size_t MAX_LINUX_THREAD_NAME_LENGTH = 15;

static std::string TruncateThreadName(const std::string& threadName) {
    return (threadName.size() > MAX_LINUX_THREAD_NAME_LENGTH) ? threadName.substr(0, MAX_LINUX_THREAD_NAME_LENGTH) : threadName;
}

void ThreadNamer::SetIoServiceThreadName(boost::asio::io_service& ioService, const std::string& threadName) {
    boost::asio::post(ioService, boost::bind(&ThreadNamer::SetThisThreadName, threadName));
}

void ThreadNamer::SetThisThreadName(const std::string& threadName) {
    const int ret = pthread_setname_np(pthread_self(), TruncateThreadName(threadName).c_str());
    if (ret != 0) {
        LOG_WARNING(subprocess) << "cannot set name of current thread to " << threadName << " (error " << ret << ")";
    }
}
