/**
 * @file RssiConnManager.cpp
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

#include "RssiConnManager.h"
#include "Logger.h"
#include <algorithm>

static constexpr srplink::Logger::SubProcess subprocess = srplink::Logger::SubProcess::rssi;

std::ostream& operator<<(std::ostream& os, const RSSI_CONN_MANAGER_STATE& o) {
    static const char* const names[] = { "IDLE", "AWAITING_SYN", "AWAITING_SYN_ACK", "AWAITING_ACK", "ESTABLISHED", "FAILED" };
    os << names[static_cast<unsigned int>(o)];
    return os;
}

RssiConnManager::RssiConnManager() :
    m_state(RSSI_CONN_MANAGER_STATE::IDLE),
    m_initialLocalSequenceNumber(0),
    m_initialRemoteSequenceNumber(0),
    m_retransmissionTimeout(boost::posix_time::seconds(0)),
    m_resends(-1) {}

RssiConnManager::~RssiConnManager() {}

void RssiConnManager::Connect(uint8_t initialLocalSequenceNumber, const RssiSynHeader& localSynHeader,
    const SendSegmentFunction_t& sendSegmentFunction, const ConnectionFinishedCallback_t& connectionFinishedCallback,
    const boost::posix_time::ptime& now)
{
    m_initialLocalSequenceNumber = initialLocalSequenceNumber;
    m_localSynHeader = localSynHeader;
    m_sendSegmentFunction = sendSegmentFunction;
    m_connectionFinishedCallback = connectionFinishedCallback;
    m_retransmissionTimeout = localSynHeader.GetRetransmissionTimeoutDuration();
    m_resends = -1;
    m_state = RSSI_CONN_MANAGER_STATE::AWAITING_SYN_ACK;
    LOG_INFO(subprocess) << "sending SYN (connection id " << localSynHeader.connectionId << ")";
    SendConnectionSegment(now);
}

void RssiConnManager::Listen(uint8_t initialLocalSequenceNumber, const RssiSynHeader& localSynHeader,
    const SendSegmentFunction_t& sendSegmentFunction, const ConnectionFinishedCallback_t& connectionFinishedCallback)
{
    m_initialLocalSequenceNumber = initialLocalSequenceNumber;
    m_localSynHeader = localSynHeader;
    m_sendSegmentFunction = sendSegmentFunction;
    m_connectionFinishedCallback = connectionFinishedCallback;
    m_retransmissionTimeout = localSynHeader.GetRetransmissionTimeoutDuration();
    m_resends = -1;
    m_state = RSSI_CONN_MANAGER_STATE::AWAITING_SYN;
}

void RssiConnManager::SendConnectionSegment(const boost::posix_time::ptime& now) {
    if ((m_localSynHeader.maxRetransmissions != 0) && (m_resends == static_cast<int>(m_localSynHeader.maxRetransmissions))) {
        LOG_ERROR(subprocess) << "connection failed: no reply after " << m_resends << " resends";
        Finish(false, 0, RssiSynHeader());
        return;
    }
    ++m_resends;
    m_retransmissionDeadline = now + m_retransmissionTimeout;
    const RssiSegment segment = (m_state == RSSI_CONN_MANAGER_STATE::AWAITING_SYN_ACK) ?
        RssiSegment::MakeSyn(RSSI_CONTROL_BITS::NONE, m_initialLocalSequenceNumber, 0, m_localSynHeader) :
        RssiSegment::MakeSyn(RSSI_CONTROL_BITS::ACK, m_initialLocalSequenceNumber, m_initialRemoteSequenceNumber, m_negotiatedSynHeader);
    if (!m_sendSegmentFunction(segment)) {
        LOG_WARNING(subprocess) << "unable to send " << segment;
    }
}

void RssiConnManager::Finish(bool success, uint8_t initialRemoteSequenceNumber, const RssiSynHeader& negotiatedSynHeader) {
    m_state = (success) ? RSSI_CONN_MANAGER_STATE::ESTABLISHED : RSSI_CONN_MANAGER_STATE::FAILED;
    if (m_connectionFinishedCallback) {
        m_connectionFinishedCallback(success, m_initialLocalSequenceNumber, initialRemoteSequenceNumber, negotiatedSynHeader);
    }
}

bool RssiConnManager::SegmentReceived(const RssiSegment& segment, const boost::posix_time::ptime& now) {
    if (m_state == RSSI_CONN_MANAGER_STATE::AWAITING_SYN_ACK) {
        if (!segment.HasControlBits(RSSI_CONTROL_BITS::SYN | RSSI_CONTROL_BITS::ACK)) {
            LOG_WARNING(subprocess) << "dropping segment while awaiting SYN+ACK: " << segment;
            return false;
        }
        if (segment.m_acknowledgmentNumber != m_initialLocalSequenceNumber) {
            LOG_WARNING(subprocess) << "dropping SYN+ACK acknowledging " << static_cast<unsigned int>(segment.m_acknowledgmentNumber)
                << " instead of " << static_cast<unsigned int>(m_initialLocalSequenceNumber);
            return false;
        }
        if (HasAnyFlag(segment.m_controlBits, RSSI_CONTROL_BITS::BUSY | RSSI_CONTROL_BITS::RST)) {
            LOG_ERROR(subprocess) << "connection refused by remote: " << segment;
            Finish(false, 0, RssiSynHeader());
            return false;
        }
        RssiSynHeader negotiated = segment.m_synHeader;
        negotiated.maxSegmentSize = std::min(m_localSynHeader.maxSegmentSize, segment.m_synHeader.maxSegmentSize);
        m_initialRemoteSequenceNumber = segment.m_sequenceNumber;
        LOG_INFO(subprocess) << "connection established with remote parameters {" << negotiated << "}";
        Finish(true, segment.m_sequenceNumber, negotiated);
        return false;
    }
    else if ((m_state == RSSI_CONN_MANAGER_STATE::AWAITING_SYN) || (m_state == RSSI_CONN_MANAGER_STATE::AWAITING_ACK)) {
        if (segment.IsSyn()) {
            if (HasAnyFlag(segment.m_controlBits, RSSI_CONTROL_BITS::ACK | RSSI_CONTROL_BITS::RST | RSSI_CONTROL_BITS::BUSY)) {
                LOG_WARNING(subprocess) << "dropping unexpected segment while listening: " << segment;
                return false;
            }
            if (m_state == RSSI_CONN_MANAGER_STATE::AWAITING_ACK) {
                LOG_DEBUG(subprocess) << "repeated SYN, resending SYN+ACK";
                const RssiSegment reply = RssiSegment::MakeSyn(RSSI_CONTROL_BITS::ACK, m_initialLocalSequenceNumber,
                    m_initialRemoteSequenceNumber, m_negotiatedSynHeader);
                if (!m_sendSegmentFunction(reply)) {
                    LOG_WARNING(subprocess) << "unable to send " << reply;
                }
                return false;
            }
            m_initialRemoteSequenceNumber = segment.m_sequenceNumber;
            m_negotiatedSynHeader = m_localSynHeader;
            m_negotiatedSynHeader.maxSegmentSize = std::min(m_localSynHeader.maxSegmentSize, segment.m_synHeader.maxSegmentSize);
            m_state = RSSI_CONN_MANAGER_STATE::AWAITING_ACK;
            LOG_INFO(subprocess) << "received SYN (connection id " << segment.m_synHeader.connectionId << "), replying with SYN+ACK";
            SendConnectionSegment(now);
            return false;
        }
        if (m_state == RSSI_CONN_MANAGER_STATE::AWAITING_SYN) {
            LOG_WARNING(subprocess) << "dropping non-SYN segment while awaiting SYN: " << segment;
            return false;
        }
        if (HasAnyFlag(segment.m_controlBits, RSSI_CONTROL_BITS::RST | RSSI_CONTROL_BITS::BUSY)) {
            LOG_ERROR(subprocess) << "connection reset by remote during handshake: " << segment;
            Finish(false, 0, RssiSynHeader());
            return false;
        }
        if ((!HasAnyFlag(segment.m_controlBits, RSSI_CONTROL_BITS::ACK)) || (segment.m_acknowledgmentNumber != m_initialLocalSequenceNumber)) {
            LOG_WARNING(subprocess) << "dropping segment while awaiting ACK of SYN+ACK: " << segment;
            return false;
        }
        LOG_INFO(subprocess) << "connection established with parameters {" << m_negotiatedSynHeader << "}";
        Finish(true, m_initialRemoteSequenceNumber, m_negotiatedSynHeader);
        return true;
    }
    LOG_DEBUG(subprocess) << "ignoring segment in state " << m_state;
    return false;
}

void RssiConnManager::OnControlPeriod(const boost::posix_time::ptime& now) {
    if ((m_state != RSSI_CONN_MANAGER_STATE::AWAITING_SYN_ACK) && (m_state != RSSI_CONN_MANAGER_STATE::AWAITING_ACK)) {
        return;
    }
    if (now >= m_retransmissionDeadline) {
        LOG_DEBUG(subprocess) << "retransmission deadline reached, resend " << (m_resends + 1);
        SendConnectionSegment(now);
    }
}

RSSI_CONN_MANAGER_STATE RssiConnManager::GetState() const {
    return m_state;
}

int RssiConnManager::GetResendCount() const {
    return m_resends;
}
