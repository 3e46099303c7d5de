/**
 * @file ThreadNamer.h
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
 *
 * @section DESCRIPTION
 *
 * This ThreadNamer static class names the control and dispatch threads of a
 * connection so they can be told apart in a debugger or in top -H.
 * Linux limits thread names to 15 characters; longer names are truncated.
 */

#ifndef _THREAD_NAMER_H
#define _THREAD_NAMER_H 1

#include <boost/asio/io_service.hpp>
#include <string>
#include "srplink_util_export.h"

class ThreadNamer {
public:

    ThreadNamer() = delete;

    /** Set the name of whichever thread runs the given io_service
     * by posting the naming operation onto it.
     *
     * @param ioService The io_service whose run() thread is to be named.
     * @param threadName The name to assign to the thread.
     */
    SRPLINK_UTIL_EXPORT static void SetIoServiceThreadName(boost::asio::io_service& ioService, const std::string& threadName);

    /** Set the thread name for the current/calling thread.
     *
     * @param threadName The name to assign to the current/calling thread.
     */
    SRPLINK_UTIL_EXPORT static void SetThisThreadName(const std::string& threadName);
};



#endif //_THREAD_NAMER_H
