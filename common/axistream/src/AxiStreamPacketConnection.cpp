/**
 * @file AxiStreamPacketConnection.cpp
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

#include "AxiStreamPacketConnection.h"
#include "Logger.h"
#include <cstring>
#include <algorithm>
#include <boost/bind/bind.hpp>

static constexpr srplink::Logger::SubProcess subprocess = srplink::Logger::SubProcess::axistream;

AxiStreamPacketConnection::AxiStreamPacketConnection(RssiConfig& rssiConfig, uint16_t remoteUdpPort) :
    m_rssiConnection(rssiConfig, remoteUdpPort),
    m_countFramesSent(0),
    m_countFramesReceived(0),
    m_countMessagesSent(0),
    m_countMessagesReceived(0),
    m_countMalformedFrames(0),
    m_countCrcErrors(0),
    m_countFramesForUnregisteredChannels(0)
{
    memset(m_nextSequenceNumbers, 0, sizeof(m_nextSequenceNumbers));
    m_framePacket.m_crcType = AXI_STREAM_CRC_TYPE::FULL;
}

AxiStreamPacketConnection::~AxiStreamPacketConnection() {
    CloseAndJoin();
}

void AxiStreamPacketConnection::SetChannelCallback(uint8_t channel, const ChannelCallback_t& callback) {
    boost::mutex::scoped_lock lock(m_channelsMutex);
    channel_t& ch = m_channels[channel];
    ch.callback = callback;
    ch.partialMessage.clear();
}

bool AxiStreamPacketConnection::Connect(const std::string& remoteHostname, uint16_t localUdpPort,
    const RssiConnection::ConnectionStateChangedCallback_t& connectionStateChangedCallback)
{
    return m_rssiConnection.Connect(remoteHostname, localUdpPort, connectionStateChangedCallback,
        boost::bind(&AxiStreamPacketConnection::OnRssiDataReceived, this, boost::placeholders::_1));
}

bool AxiStreamPacketConnection::Listen(uint16_t localUdpPort,
    const RssiConnection::ConnectionStateChangedCallback_t& connectionStateChangedCallback)
{
    return m_rssiConnection.Listen(localUdpPort, connectionStateChangedCallback,
        boost::bind(&AxiStreamPacketConnection::OnRssiDataReceived, this, boost::placeholders::_1));
}

void AxiStreamPacketConnection::Disconnect() {
    m_rssiConnection.Disconnect();
}

void AxiStreamPacketConnection::Interrupt() {
    m_rssiConnection.Interrupt();
}

void AxiStreamPacketConnection::CloseAndJoin() {
    m_rssiConnection.CloseAndJoin();
}

std::size_t AxiStreamPacketConnection::GetMaxPayloadSizePerPacket() const {
    const std::size_t maxSegmentSize = m_rssiConnection.GetMaxSegmentSize();
    static constexpr std::size_t overhead = RssiSegment::NON_SYN_HEADER_SIZE + AxiStreamPacket::OVERHEAD_SIZE;
    if (maxSegmentSize <= overhead) {
        return 0;
    }
    return (maxSegmentSize - overhead) & (~static_cast<std::size_t>(AxiStreamPacket::WORD_SIZE - 1));
}

bool AxiStreamPacketConnection::SendData(uint8_t channel, const std::vector<uint8_t>& data) {
    return SendData(channel, data.data(), data.size());
}

bool AxiStreamPacketConnection::SendData(uint8_t channel, const uint8_t* data, std::size_t size) {
    if (m_rssiConnection.GetConnectionState() != RSSI_CONNECTION_STATE::CONNECTED) {
        LOG_WARNING(subprocess) << "cannot send " << size << " bytes on channel " << static_cast<unsigned int>(channel) << ": not connected";
        return false;
    }
    const std::size_t maxPayloadSize = GetMaxPayloadSizePerPacket();
    if (maxPayloadSize == 0) {
        LOG_ERROR(subprocess) << "maximum segment size " << m_rssiConnection.GetMaxSegmentSize() << " too small for an AXI-Stream frame";
        return false;
    }

    boost::mutex::scoped_lock lock(m_sendMutex);
    std::size_t offset = 0;
    bool isFirst = true;
    do {
        const std::size_t chunkSize = std::min(maxPayloadSize, size - offset);
        AxiStreamPacket& p = m_framePacket;
        p.m_channel = channel;
        p.m_sequence = m_nextSequenceNumbers[channel]++; //8-bit rolling
        p.m_sof = isFirst;
        p.m_eof = ((offset + chunkSize) == size);
        p.SetPayload(data + offset, chunkSize);
        p.SetCrc();
        p.Serialize(m_frameSerialization);
        LOG_DEBUG(subprocess) << "sending frame " << p;
        if (!m_rssiConnection.SendData(m_frameSerialization)) {
            LOG_WARNING(subprocess) << "connection lost while sending on channel " << static_cast<unsigned int>(channel);
            return false;
        }
        ++m_countFramesSent;
        offset += chunkSize;
        isFirst = false;
    } while (offset < size);
    ++m_countMessagesSent;
    return true;
}

void AxiStreamPacketConnection::OnRssiDataReceived(std::vector<uint8_t>& movableData) {
    AxiStreamPacket packet;
    if (!packet.Deserialize(movableData.data(), movableData.size())) {
        ++m_countMalformedFrames;
        LOG_WARNING(subprocess) << "dropping malformed frame of " << movableData.size() << " bytes";
        return;
    }
    ++m_countFramesReceived;
    LOG_DEBUG(subprocess) << "received frame " << packet;
    if (!packet.VerifyCrc()) {
        ++m_countCrcErrors;
        LOG_WARNING(subprocess) << "crc mismatch on channel " << static_cast<unsigned int>(packet.m_channel)
            << " (received 0x" << std::hex << packet.m_crc << ", computed 0x" << packet.CalculateCrc() << std::dec << ")";
    }

    ChannelCallback_t callback;
    std::vector<uint8_t> message;
    {
        boost::mutex::scoped_lock lock(m_channelsMutex);
        std::map<uint8_t, channel_t>::iterator it = m_channels.find(packet.m_channel);
        if ((it == m_channels.end()) || (!it->second.callback)) {
            ++m_countFramesForUnregisteredChannels;
            return;
        }
        channel_t& ch = it->second;
        if (packet.m_sof) {
            ch.partialMessage.clear();
        }
        else if (ch.partialMessage.empty()) {
            LOG_WARNING(subprocess) << "frame without SOF on channel " << static_cast<unsigned int>(packet.m_channel)
                << " with no message in progress";
        }
        packet.AppendValidPayload(ch.partialMessage);
        if (!packet.m_eof) {
            return;
        }
        message.swap(ch.partialMessage);
        callback = ch.callback;
    }
    ++m_countMessagesReceived;
    callback(message);
}

RSSI_CONNECTION_STATE AxiStreamPacketConnection::GetConnectionState() const {
    return m_rssiConnection.GetConnectionState();
}

uint16_t AxiStreamPacketConnection::GetBoundLocalPort() const {
    return m_rssiConnection.GetBoundLocalPort();
}

RssiConnection& AxiStreamPacketConnection::GetRssiConnection() {
    return m_rssiConnection;
}
