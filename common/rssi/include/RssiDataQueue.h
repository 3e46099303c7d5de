/**
 * @file RssiDataQueue.h
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
 * This RssiDataQueue class implements the RSSI sliding window of an established connection:
 * in-order delivery of received data, cumulative acknowledgment,
 * full window retransmission on the oldest segment's timeout,
 * null (keep-alive) segments, and the graceful (RST) disconnect.
 * The in-flight window is (lastAckedLocalSeq, lastLocalSeq] in modulo 256 arithmetic.
 * Segments that cannot be sent because the window is full wait in an unsent queue (FIFO).
 * Time is passed in explicitly so the queue can be driven without sockets.
 */

#ifndef _RSSI_DATA_QUEUE_H
#define _RSSI_DATA_QUEUE_H 1

#include <cstdint>
#include <deque>
#include <vector>
#include <boost/function.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "RssiSegment.h"
#include "rssi_lib_export.h"

enum class RSSI_DISCONNECT_REASON {
    GRACEFUL = 0,
    PEER_RESET,
    RETRANSMISSION_LIMIT
};
RSSI_LIB_EXPORT std::ostream& operator<<(std::ostream& os, const RSSI_DISCONNECT_REASON& o);

class RssiDataQueue {
public:
    typedef boost::function<bool(const RssiSegment& segment)> SendSegmentFunction_t;
    typedef boost::function<void(std::vector<uint8_t>& movablePayload)> DataReceivedCallback_t;
    typedef boost::function<void(RSSI_DISCONNECT_REASON reason)> DisconnectedCallback_t;

    RSSI_LIB_EXPORT RssiDataQueue();
    RSSI_LIB_EXPORT ~RssiDataQueue();

    /** Start (or restart) the queue after a successful handshake.
     *
     * @param initialLocalSequenceNumber The local SYN sequence number.
     * @param initialRemoteSequenceNumber The remote SYN sequence number.
     * @param negotiatedSynHeader Timeouts, window size, and retransmission limits to use.
     * @param now The current time.
     */
    RSSI_LIB_EXPORT void Reset(uint8_t initialLocalSequenceNumber, uint8_t initialRemoteSequenceNumber,
        const RssiSynHeader& negotiatedSynHeader,
        const SendSegmentFunction_t& sendSegmentFunction,
        const DataReceivedCallback_t& dataReceivedCallback,
        const DisconnectedCallback_t& disconnectedCallback,
        const boost::posix_time::ptime& now);

    /** Send one chunk of user data (at most maxSegmentSize - 8 bytes) as a data segment.
     *
     * @return False if rejected because a disconnect was requested or the queue is inactive.
     */
    RSSI_LIB_EXPORT bool SendUserData(const uint8_t* data, std::size_t size, const boost::posix_time::ptime& now);

    /// Process a received non-SYN segment (its payload may be moved out)
    RSSI_LIB_EXPORT void SegmentReceived(RssiSegment& segment, const boost::posix_time::ptime& now);

    /// Begin the graceful disconnect by sending ACK+RST
    RSSI_LIB_EXPORT void Disconnect(const boost::posix_time::ptime& now);

    /// Periodic service: retransmission, cumulative ack, and null timers
    RSSI_LIB_EXPORT void OnControlPeriod(const boost::posix_time::ptime& now);

    RSSI_LIB_EXPORT bool IsActive() const;
    RSSI_LIB_EXPORT bool IsDisconnectRequested() const;
    RSSI_LIB_EXPORT uint8_t GetLastLocalSequenceNumber() const;
    RSSI_LIB_EXPORT uint8_t GetLastAckedLocalSequenceNumber() const;
    RSSI_LIB_EXPORT uint8_t GetLastRemoteSequenceNumber() const;
    RSSI_LIB_EXPORT uint8_t GetLastAckedRemoteSequenceNumber() const;
    RSSI_LIB_EXPORT std::size_t GetNumUnackedSegments() const;
    RSSI_LIB_EXPORT std::size_t GetNumUnsentSegments() const;
    RSSI_LIB_EXPORT boost::posix_time::time_duration GetRetransmissionTimeout() const;

    RSSI_LIB_EXPORT static uint8_t IncrementSequenceNumber(uint8_t seq);
    /// (a - b) modulo 256
    RSSI_LIB_EXPORT static uint8_t SequenceNumberDifference(uint8_t a, uint8_t b);
    /// True if seq lies within [begin, end], where the interval may wrap past 255
    RSSI_LIB_EXPORT static bool SequenceNumberInRangeInclusive(uint8_t begin, uint8_t end, uint8_t seq);

private:
    struct unacked_item_t {
        std::vector<uint8_t> data;
        RSSI_CONTROL_BITS controlBits;
        uint8_t sequenceNumber;
        boost::posix_time::ptime retransmissionTime;
        unsigned int resends;
    };
    struct unsent_item_t {
        std::vector<uint8_t> data;
        RSSI_CONTROL_BITS controlBits;
    };

    RSSI_LIB_NO_EXPORT bool IsReceivedSegmentValid(const RssiSegment& segment) const;
    RSSI_LIB_NO_EXPORT bool UpdateAckQueues(uint8_t acknowledgmentNumber, const boost::posix_time::ptime& now);
    RSSI_LIB_NO_EXPORT bool CheckDisconnectionComplete();
    RSSI_LIB_NO_EXPORT bool SendNextSegment(std::vector<uint8_t>& movableData, RSSI_CONTROL_BITS controlBits, const boost::posix_time::ptime& now);
    RSSI_LIB_NO_EXPORT bool SendEmptySegment(RSSI_CONTROL_BITS controlBits, const boost::posix_time::ptime& now);
    RSSI_LIB_NO_EXPORT RssiSegment MakeSegment(RSSI_CONTROL_BITS controlBits, uint8_t sequenceNumber, const std::vector<uint8_t>& data);
    RSSI_LIB_NO_EXPORT bool SendSegment(const RssiSegment& segment, const boost::posix_time::ptime& now);
    RSSI_LIB_NO_EXPORT bool IsWindowFull() const;
    RSSI_LIB_NO_EXPORT void Finish(RSSI_DISCONNECT_REASON reason);

private:
    bool m_active;
    bool m_disconnectRequested;
    bool m_remoteNeedsAck;
    uint8_t m_lastLocalSequenceNumber;
    uint8_t m_lastAckedLocalSequenceNumber;
    uint8_t m_lastRemoteSequenceNumber;
    uint8_t m_lastAckedRemoteSequenceNumber;
    unsigned int m_maxOutstandingSegments;
    unsigned int m_maxRetransmissions;
    unsigned int m_maxCumulativeAcks;
    boost::posix_time::time_duration m_retransmissionTimeout;
    boost::posix_time::time_duration m_cumulativeAckTimeout;
    boost::posix_time::time_duration m_nullTimeout;
    boost::posix_time::ptime m_cumulativeAckTime;
    boost::posix_time::ptime m_nullTime;
    std::deque<unacked_item_t> m_unackedQueue;
    std::deque<unsent_item_t> m_unsentQueue;
    SendSegmentFunction_t m_sendSegmentFunction;
    DataReceivedCallback_t m_dataReceivedCallback;
    DisconnectedCallback_t m_disconnectedCallback;
};

#endif //_RSSI_DATA_QUEUE_H
