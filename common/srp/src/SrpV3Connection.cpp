/**
 * @file SrpV3Connection.cpp
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

#include "SrpV3Connection.h"
#include "Logger.h"
#include <boost/bind/bind.hpp>

static constexpr srplink::Logger::SubProcess subprocess = srplink::Logger::SubProcess::srp;

constexpr uint32_t SrpV3Connection::INITIAL_TRANSACTION_ID;

SrpV3Connection::SrpV3Connection(AxiStreamPacketConnection& axiStreamPacketConnection, uint8_t channel, const PacketCallback_t& packetCallback) :
    m_axiStreamPacketConnection(axiStreamPacketConnection),
    M_CHANNEL(channel),
    m_packetCallback(packetCallback),
    m_nextTransactionId(INITIAL_TRANSACTION_ID),
    m_countRequestsSent(0),
    m_countResponsesReceived(0),
    m_countMalformedResponses(0)
{
    m_axiStreamPacketConnection.SetChannelCallback(M_CHANNEL, boost::bind(&SrpV3Connection::OnChannelMessage, this, boost::placeholders::_1));
}

SrpV3Connection::~SrpV3Connection() {}

uint8_t SrpV3Connection::GetChannel() const {
    return M_CHANNEL;
}

bool SrpV3Connection::SendReadRequest(uint64_t address, uint32_t sizeBytes, uint32_t& transactionIdUsed) {
    if (sizeBytes == 0) {
        LOG_ERROR(subprocess) << "SendReadRequest: size must be at least 1 byte";
        return false;
    }
    SrpPacket packet;
    packet.m_header.opcode = SRP_OPCODE::READ;
    packet.m_header.address = address;
    packet.m_header.size = sizeBytes - 1;
    return SendRequest(packet, transactionIdUsed);
}

bool SrpV3Connection::SendWriteRequest(uint64_t address, const std::vector<uint8_t>& data, bool posted, uint32_t& transactionIdUsed) {
    if (data.empty()) {
        LOG_ERROR(subprocess) << "SendWriteRequest: no data to write";
        return false;
    }
    SrpPacket packet;
    packet.m_header.opcode = (posted) ? SRP_OPCODE::POSTED_WRITE : SRP_OPCODE::WRITE;
    packet.m_header.address = address;
    packet.m_header.size = static_cast<uint32_t>(data.size() - 1);
    packet.m_payload = data;
    return SendRequest(packet, transactionIdUsed);
}

bool SrpV3Connection::SendRequest(SrpPacket& packet, uint32_t& transactionIdUsed) {
    boost::mutex::scoped_lock lock(m_sendMutex);
    packet.m_header.transactionId = m_nextTransactionId++; //wraps modulo 2^32
    transactionIdUsed = packet.m_header.transactionId;
    packet.Serialize(m_requestSerialization);
    LOG_DEBUG(subprocess) << "sending request " << packet;
    if (!m_axiStreamPacketConnection.SendData(M_CHANNEL, m_requestSerialization)) {
        return false;
    }
    ++m_countRequestsSent;
    return true;
}

void SrpV3Connection::OnChannelMessage(std::vector<uint8_t>& movableMessage) {
    SrpPacket packet;
    if (!packet.DeserializeResponse(movableMessage.data(), movableMessage.size())) {
        ++m_countMalformedResponses;
        LOG_WARNING(subprocess) << "dropping malformed SRP response of " << movableMessage.size() << " bytes";
        return;
    }
    ++m_countResponsesReceived;
    LOG_DEBUG(subprocess) << "received response " << packet;
    if (m_packetCallback) {
        m_packetCallback(packet);
    }
}
