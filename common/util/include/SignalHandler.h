/**
 * @file SignalHandler.h
 * @author  Brian Tomko <brian.j.tomko@nasa.gov>
 *
 * @copyright Copyright (c) 2021 United States Government as represented by
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
 * This SignalHandler class captures SIGINT, SIGTERM and SIGQUIT
 * and calls a custom function once when the first of them arrives.
 */

#ifndef SIGNAL_HANDLER_H
#define SIGNAL_HANDLER_H 1
#include <boost/asio.hpp>
#include <boost/thread.hpp>
#include <boost/function.hpp>
#include <memory>
#include "srplink_util_export.h"

class SignalHandler {
public:
    SignalHandler() = delete;

    /**
     * Register the termination signals to listen for.
     * @param handleSignalFunction Called (from the listening thread) when a signal is received.
     */
    SRPLINK_UTIL_EXPORT SignalHandler(const boost::function<void() > & handleSignalFunction);

    /// Stop listening and join the dedicated thread if there is one
    SRPLINK_UTIL_EXPORT ~SignalHandler();

    /** Start the signal event listener.
     *
     * @param useDedicatedThread Spawn a thread running the listener; if false, call PollOnce periodically.
     */
    SRPLINK_UTIL_EXPORT void Start(bool useDedicatedThread = true);

    /** Poll the signal event listener from the calling thread.
     *
     * Only call when NOT using a dedicated thread.
     * @return True if a signal event was handled by this call.
     */
    SRPLINK_UTIL_EXPORT bool PollOnce();

private:
    SRPLINK_UTIL_NO_EXPORT void HandleSignal(const boost::system::error_code& error, int signalNumber);

private:
    boost::asio::io_service m_ioService;
    boost::asio::signal_set m_signals;
    std::unique_ptr<boost::thread> m_ioServiceThreadPtr;
    boost::function<void() > m_handleSignalFunction;
};
#endif
