/**
 * @file RssiDataQueue.cpp
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

#include "RssiDataQueue.h"
#include "Logger.h"

static constexpr srplink::Logger::SubProcess subprocess = srplink::Logger::SubProcess::rssi;

std::ostream& operator<<(std::ostream& os, const RSSI_DISCONNECT_REASON& o) {
    static const char* const names[] = { "GRACEFUL", "PEER_RESET", "RETRANSMISSION_LIMIT" };
    os << names[static_cast<unsigned int>(o)];
    return os;
}

RssiDataQueue::RssiDataQueue() :
    m_active(false),
    m_disconnectRequested(false),
    m_remoteNeedsAck(false),
    m_lastLocalSequenceNumber(0),
    m_lastAckedLocalSequenceNumber(0),
    m_lastRemoteSequenceNumber(0),
    m_lastAckedRemoteSequenceNumber(0),
    m_maxOutstandingSegments(1),
    m_maxRetransmissions(0),
    m_maxCumulativeAcks(1) {}

RssiDataQueue::~RssiDataQueue() {}

uint8_t RssiDataQueue::IncrementSequenceNumber(uint8_t seq) {
    return static_cast<uint8_t>(seq + 1);
}

uint8_t RssiDataQueue::SequenceNumberDifference(uint8_t a, uint8_t b) {
    return static_cast<uint8_t>(a - b);
}

bool RssiDataQueue::SequenceNumberInRangeInclusive(uint8_t begin, uint8_t end, uint8_t seq) {
    if (begin <= end) {
        return (begin <= seq) && (seq <= end);
    }
    return (seq >= begin) || (seq <= end); //wrapped interval
}

void RssiDataQueue::Reset(uint8_t initialLocalSequenceNumber, uint8_t initialRemoteSequenceNumber,
    const RssiSynHeader& negotiatedSynHeader,
    const SendSegmentFunction_t& sendSegmentFunction,
    const DataReceivedCallback_t& dataReceivedCallback,
    const DisconnectedCallback_t& disconnectedCallback,
    const boost::posix_time::ptime& now)
{
    m_lastLocalSequenceNumber = initialLocalSequenceNumber;
    m_lastAckedLocalSequenceNumber = initialLocalSequenceNumber;
    m_lastRemoteSequenceNumber = initialRemoteSequenceNumber;
    m_lastAckedRemoteSequenceNumber = initialRemoteSequenceNumber;
    m_maxOutstandingSegments = negotiatedSynHeader.maxOutstandingSegments;
    m_maxRetransmissions = negotiatedSynHeader.maxRetransmissions;
    m_maxCumulativeAcks = negotiatedSynHeader.maxCumulativeAcks;
    m_retransmissionTimeout = negotiatedSynHeader.GetRetransmissionTimeoutDuration();
    m_cumulativeAckTimeout = negotiatedSynHeader.GetCumulativeAckTimeoutDuration();
    m_nullTimeout = negotiatedSynHeader.GetNullTimeoutDuration();
    m_sendSegmentFunction = sendSegmentFunction;
    m_dataReceivedCallback = dataReceivedCallback;
    m_disconnectedCallback = disconnectedCallback;
    m_unackedQueue.clear();
    m_unsentQueue.clear();
    m_remoteNeedsAck = false;
    m_disconnectRequested = false;
    m_cumulativeAckTime = now + m_cumulativeAckTimeout;
    m_nullTime = now; //send the first NUL on the first control period
    m_active = true;
}

bool RssiDataQueue::IsWindowFull() const {
    return (m_unackedQueue.size() >= m_maxOutstandingSegments);
}

bool RssiDataQueue::SendUserData(const uint8_t* data, std::size_t size, const boost::posix_time::ptime& now) {
    if (!m_active) {
        LOG_WARNING(subprocess) << "dropping " << size << " bytes of user data: connection not established";
        return false;
    }
    if (m_disconnectRequested) {
        LOG_WARNING(subprocess) << "dropping " << size << " bytes of user data: disconnect requested";
        return false;
    }
    std::vector<uint8_t> userData(data, data + size);
    SendNextSegment(userData, RSSI_CONTROL_BITS::ACK, now);
    return true;
}

bool RssiDataQueue::IsReceivedSegmentValid(const RssiSegment& segment) const {
    if (segment.IsSyn()) {
        LOG_WARNING(subprocess) << "dropping SYN segment on an established connection: " << segment;
        return false;
    }
    if (!HasAnyFlag(segment.m_controlBits, RSSI_CONTROL_BITS::ACK | RSSI_CONTROL_BITS::RST)) {
        LOG_WARNING(subprocess) << "dropping segment with invalid control bits: " << segment;
        return false;
    }
    if (segment.m_sequenceNumber != IncrementSequenceNumber(m_lastRemoteSequenceNumber)) {
        LOG_WARNING(subprocess) << "dropping out of sequence segment: expected seq "
            << static_cast<unsigned int>(IncrementSequenceNumber(m_lastRemoteSequenceNumber)) << " but got " << segment;
        return false;
    }
    return true;
}

void RssiDataQueue::SegmentReceived(RssiSegment& segment, const boost::posix_time::ptime& now) {
    if (!m_active) {
        LOG_DEBUG(subprocess) << "ignoring segment on inactive queue: " << segment;
        return;
    }
    if (!IsReceivedSegmentValid(segment)) {
        return;
    }
    LOG_DEBUG(subprocess) << "received " << segment;

    bool segmentsSent = false;
    if (HasAnyFlag(segment.m_controlBits, RSSI_CONTROL_BITS::ACK)) {
        segmentsSent = UpdateAckQueues(segment.m_acknowledgmentNumber, now);
    }

    const bool isRst = HasAnyFlag(segment.m_controlBits, RSSI_CONTROL_BITS::RST);
    const bool consumesSequenceNumber = (!segment.m_payload.empty())
        || HasAnyFlag(segment.m_controlBits, RSSI_CONTROL_BITS::NUL | RSSI_CONTROL_BITS::RST);
    if (consumesSequenceNumber) {
        m_lastRemoteSequenceNumber = segment.m_sequenceNumber;
        if (!m_remoteNeedsAck) {
            m_cumulativeAckTime = now + m_cumulativeAckTimeout;
        }
        m_remoteNeedsAck = true;
    }

    if (isRst) {
        LOG_INFO(subprocess) << "received RST from remote";
        if (!SendEmptySegment(RSSI_CONTROL_BITS::ACK, now)) {
            LOG_WARNING(subprocess) << "unable to acknowledge RST";
        }
        if ((!m_unackedQueue.empty()) || (!m_unsentQueue.empty())) {
            LOG_WARNING(subprocess) << "connection reset by remote with data loss: "
                << m_unackedQueue.size() << " unacknowledged and " << m_unsentQueue.size() << " unsent segments discarded";
        }
        Finish(RSSI_DISCONNECT_REASON::PEER_RESET);
        return;
    }

    if (!segment.m_payload.empty()) {
        if (m_dataReceivedCallback) {
            m_dataReceivedCallback(segment.m_payload);
        }
    }

    if (CheckDisconnectionComplete()) {
        return;
    }
    if (segmentsSent) {
        return;
    }
    if (SequenceNumberDifference(m_lastRemoteSequenceNumber, m_lastAckedRemoteSequenceNumber) > m_maxCumulativeAcks) {
        segmentsSent = SendEmptySegment(RSSI_CONTROL_BITS::ACK, now);
    }
    if ((!segmentsSent) && (IncrementSequenceNumber(m_lastRemoteSequenceNumber) == m_lastAckedRemoteSequenceNumber)) {
        if (!SendEmptySegment(RSSI_CONTROL_BITS::ACK, now)) {
            LOG_WARNING(subprocess) << "unable to send ACK to avoid remote sequence number exhaustion";
        }
    }
}

bool RssiDataQueue::UpdateAckQueues(uint8_t acknowledgmentNumber, const boost::posix_time::ptime& now) {
    const uint8_t numOutstanding = SequenceNumberDifference(m_lastLocalSequenceNumber, m_lastAckedLocalSequenceNumber);
    const uint8_t numNewlyAcked = SequenceNumberDifference(acknowledgmentNumber, m_lastAckedLocalSequenceNumber);
    if (numNewlyAcked > numOutstanding) {
        LOG_WARNING(subprocess) << "ack " << static_cast<unsigned int>(acknowledgmentNumber) << " outside of in-flight window ("
            << static_cast<unsigned int>(m_lastAckedLocalSequenceNumber) << ", " << static_cast<unsigned int>(m_lastLocalSequenceNumber) << "]";
        return false;
    }
    m_lastAckedLocalSequenceNumber = acknowledgmentNumber;
    for (unsigned int i = 0; (i < numNewlyAcked) && (!m_unackedQueue.empty()); ++i) {
        m_unackedQueue.pop_front();
    }
    if ((numNewlyAcked == 0) || m_unsentQueue.empty()) {
        return false;
    }
    //promote queued segments into the now larger window
    for (unsigned int i = 0; (i < numNewlyAcked) && (!m_unsentQueue.empty()); ++i) {
        unsent_item_t item(std::move(m_unsentQueue.front()));
        m_unsentQueue.pop_front();
        SendNextSegment(item.data, item.controlBits, now);
    }
    return true;
}

bool RssiDataQueue::CheckDisconnectionComplete() {
    if (m_disconnectRequested && m_unackedQueue.empty() && m_unsentQueue.empty()) {
        Finish(RSSI_DISCONNECT_REASON::GRACEFUL);
        return true;
    }
    return false;
}

bool RssiDataQueue::SendNextSegment(std::vector<uint8_t>& movableData, RSSI_CONTROL_BITS controlBits, const boost::posix_time::ptime& now) {
    const bool hasData = !movableData.empty();
    const bool isNul = HasAnyFlag(controlBits, RSSI_CONTROL_BITS::NUL);
    const bool isRst = HasAnyFlag(controlBits, RSSI_CONTROL_BITS::RST);
    const bool isEmptyAck = !(hasData || isNul || isRst);
    if ((!isEmptyAck) && IsWindowFull()) {
        if (isNul) {
            return false; //traffic is already outstanding
        }
        m_unsentQueue.emplace_back();
        m_unsentQueue.back().data = std::move(movableData);
        m_unsentQueue.back().controlBits = controlBits;
        return false;
    }

    const uint8_t sequenceNumber = IncrementSequenceNumber(m_lastLocalSequenceNumber);
    if (!isEmptyAck) {
        m_lastLocalSequenceNumber = sequenceNumber;
    }
    const RssiSegment segment = MakeSegment(controlBits, sequenceNumber, movableData);
    if (!isEmptyAck) {
        m_unackedQueue.emplace_back();
        unacked_item_t& item = m_unackedQueue.back();
        item.data = std::move(movableData);
        item.controlBits = controlBits;
        item.sequenceNumber = sequenceNumber;
        item.retransmissionTime = now + m_retransmissionTimeout;
        item.resends = 0;
    }
    return SendSegment(segment, now);
}

bool RssiDataQueue::SendEmptySegment(RSSI_CONTROL_BITS controlBits, const boost::posix_time::ptime& now) {
    std::vector<uint8_t> noData;
    return SendNextSegment(noData, controlBits, now);
}

RssiSegment RssiDataQueue::MakeSegment(RSSI_CONTROL_BITS controlBits, uint8_t sequenceNumber, const std::vector<uint8_t>& data) {
    m_lastAckedRemoteSequenceNumber = m_lastRemoteSequenceNumber;
    return RssiSegment::MakeNonSyn(controlBits, sequenceNumber, m_lastRemoteSequenceNumber, data, true);
}

bool RssiDataQueue::SendSegment(const RssiSegment& segment, const boost::posix_time::ptime& now) {
    m_remoteNeedsAck = false;
    m_nullTime = now + (m_nullTimeout / 3);
    LOG_DEBUG(subprocess) << "sending " << segment;
    return m_sendSegmentFunction(segment);
}

void RssiDataQueue::Disconnect(const boost::posix_time::ptime& now) {
    if (!m_active) {
        return;
    }
    if (m_disconnectRequested) {
        LOG_WARNING(subprocess) << "disconnect already requested";
        return;
    }
    LOG_INFO(subprocess) << "disconnect requested with " << m_unackedQueue.size() << " unacknowledged and "
        << m_unsentQueue.size() << " unsent segments";
    m_disconnectRequested = true;
    const boost::posix_time::time_duration nullTimeoutThird = m_nullTimeout / 3;
    if (nullTimeoutThird < m_retransmissionTimeout) {
        m_retransmissionTimeout = nullTimeoutThird;
    }
    if ((!m_unackedQueue.empty()) && (m_nullTime < m_unackedQueue.front().retransmissionTime)) {
        m_unackedQueue.front().retransmissionTime = m_nullTime;
    }
    SendEmptySegment(RSSI_CONTROL_BITS::ACK | RSSI_CONTROL_BITS::RST, now);
}

void RssiDataQueue::OnControlPeriod(const boost::posix_time::ptime& now) {
    if (!m_active) {
        return;
    }
    bool segmentSent = false;
    if ((!m_unackedQueue.empty()) && (now >= m_unackedQueue.front().retransmissionTime)) {
        if ((m_maxRetransmissions != 0) && (m_unackedQueue.front().resends >= m_maxRetransmissions)) {
            LOG_ERROR(subprocess) << "segment " << static_cast<unsigned int>(m_unackedQueue.front().sequenceNumber)
                << " not acknowledged after " << m_maxRetransmissions << " retransmissions, connection lost";
            Finish(RSSI_DISCONNECT_REASON::RETRANSMISSION_LIMIT);
            return;
        }
        LOG_DEBUG(subprocess) << "retransmission timeout, resending " << m_unackedQueue.size() << " segments";
        for (std::deque<unacked_item_t>::iterator it = m_unackedQueue.begin(); it != m_unackedQueue.end(); ++it) {
            it->retransmissionTime = now + m_retransmissionTimeout;
            ++it->resends;
            segmentSent = SendSegment(MakeSegment(it->controlBits, it->sequenceNumber, it->data), now) || segmentSent;
        }
    }
    if ((!segmentSent) && m_remoteNeedsAck && (now >= m_cumulativeAckTime)) {
        segmentSent = SendEmptySegment(RSSI_CONTROL_BITS::ACK, now);
    }
    if ((!segmentSent) && (!m_disconnectRequested) && (now >= m_nullTime)) {
        SendEmptySegment(RSSI_CONTROL_BITS::ACK | RSSI_CONTROL_BITS::NUL, now);
    }
}

void RssiDataQueue::Finish(RSSI_DISCONNECT_REASON reason) {
    m_active = false;
    m_unackedQueue.clear();
    m_unsentQueue.clear();
    LOG_INFO(subprocess) << "connection closed (" << reason << ")";
    if (m_disconnectedCallback) {
        m_disconnectedCallback(reason);
    }
}

bool RssiDataQueue::IsActive() const {
    return m_active;
}
bool RssiDataQueue::IsDisconnectRequested() const {
    return m_disconnectRequested;
}
uint8_t RssiDataQueue::GetLastLocalSequenceNumber() const {
    return m_lastLocalSequenceNumber;
}
uint8_t RssiDataQueue::GetLastAckedLocalSequenceNumber() const {
    return m_lastAckedLocalSequenceNumber;
}
uint8_t RssiDataQueue::GetLastRemoteSequenceNumber() const {
    return m_lastRemoteSequenceNumber;
}
uint8_t RssiDataQueue::GetLastAckedRemoteSequenceNumber() const {
    return m_lastAckedRemoteSequenceNumber;
}
std::size_t RssiDataQueue::GetNumUnackedSegments() const {
    return m_unackedQueue.size();
}
std::size_t RssiDataQueue::GetNumUnsentSegments() const {
    return m_unsentQueue.size();
}
boost::posix_time::time_duration RssiDataQueue::GetRetransmissionTimeout() const {
    return m_retransmissionTimeout;
}
