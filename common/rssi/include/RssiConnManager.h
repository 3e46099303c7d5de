/**
 * @file RssiConnManager.h
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
 * This RssiConnManager class is the RSSI handshake state machine.
 * An active (client) open sends a SYN and waits for the SYN+ACK.
 * A passive (listening) open waits for a SYN, replies with a SYN+ACK,
 * and waits for the first non-SYN ACK.
 * The SYN (or SYN+ACK) is resent on each retransmission deadline until
 * the handshake completes or the retransmission limit is reached.
 * Time is passed in explicitly so the state machine can be driven without sockets.
 */

#ifndef _RSSI_CONN_MANAGER_H
#define _RSSI_CONN_MANAGER_H 1

#include <cstdint>
#include <boost/function.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "RssiSegment.h"
#include "rssi_lib_export.h"

enum class RSSI_CONN_MANAGER_STATE {
    IDLE = 0,
    AWAITING_SYN,
    AWAITING_SYN_ACK,
    AWAITING_ACK,
    ESTABLISHED,
    FAILED
};
RSSI_LIB_EXPORT std::ostream& operator<<(std::ostream& os, const RSSI_CONN_MANAGER_STATE& o);

class RssiConnManager {
public:
    typedef boost::function<bool(const RssiSegment& segment)> SendSegmentFunction_t;
    typedef boost::function<void(bool success, uint8_t initialLocalSequenceNumber,
        uint8_t initialRemoteSequenceNumber, const RssiSynHeader& negotiatedSynHeader)> ConnectionFinishedCallback_t;

    RSSI_LIB_EXPORT RssiConnManager();
    RSSI_LIB_EXPORT ~RssiConnManager();

    /** Active open: send the SYN immediately and arm the retransmission deadline.
     *
     * @param initialLocalSequenceNumber The sequence number of the SYN.
     * @param localSynHeader The local synchronization parameters to advertise.
     * @param sendSegmentFunction Transmits a segment.
     * @param connectionFinishedCallback Called exactly once with the handshake result.
     * @param now The current time.
     */
    RSSI_LIB_EXPORT void Connect(uint8_t initialLocalSequenceNumber, const RssiSynHeader& localSynHeader,
        const SendSegmentFunction_t& sendSegmentFunction, const ConnectionFinishedCallback_t& connectionFinishedCallback,
        const boost::posix_time::ptime& now);

    /// Passive open: wait (indefinitely) for a SYN
    RSSI_LIB_EXPORT void Listen(uint8_t initialLocalSequenceNumber, const RssiSynHeader& localSynHeader,
        const SendSegmentFunction_t& sendSegmentFunction, const ConnectionFinishedCallback_t& connectionFinishedCallback);

    /** Process a received segment.
     *
     * @return True if the segment completed a passive open and carries no SYN,
     * in which case it must also be processed by the data queue.
     */
    RSSI_LIB_EXPORT bool SegmentReceived(const RssiSegment& segment, const boost::posix_time::ptime& now);

    /// Periodic service: resend on retransmission deadline, or fail at the retransmission limit
    RSSI_LIB_EXPORT void OnControlPeriod(const boost::posix_time::ptime& now);

    RSSI_LIB_EXPORT RSSI_CONN_MANAGER_STATE GetState() const;
    RSSI_LIB_EXPORT int GetResendCount() const;

private:
    RSSI_LIB_NO_EXPORT void SendConnectionSegment(const boost::posix_time::ptime& now);
    RSSI_LIB_NO_EXPORT void Finish(bool success, uint8_t initialRemoteSequenceNumber, const RssiSynHeader& negotiatedSynHeader);

private:
    RSSI_CONN_MANAGER_STATE m_state;
    uint8_t m_initialLocalSequenceNumber;
    uint8_t m_initialRemoteSequenceNumber;
    RssiSynHeader m_localSynHeader;
    RssiSynHeader m_negotiatedSynHeader;
    SendSegmentFunction_t m_sendSegmentFunction;
    ConnectionFinishedCallback_t m_connectionFinishedCallback;
    boost::posix_time::ptime m_retransmissionDeadline;
    boost::posix_time::time_duration m_retransmissionTimeout;
    int m_resends;
};

#endif //_RSSI_CONN_MANAGER_H
