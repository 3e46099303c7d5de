/**
 * @file AxiStreamPacketConnection.h
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
 * This AxiStreamPacketConnection class multiplexes logical channels over one RssiConnection.
 * A message sent on a channel is split into AxiStreamPacket frames (first frame SOF, last frame EOF),
 * each frame passed to the RssiConnection as one SendData call.  Because every frame fits in a single
 * RSSI segment, each received RSSI payload is exactly one frame.
 * Received frames are reassembled per channel and the complete message is handed to that channel's
 * callback on the RssiConnection dispatch thread.  Frames for channels without a callback are discarded.
 */

#ifndef _AXI_STREAM_PACKET_CONNECTION_H
#define _AXI_STREAM_PACKET_CONNECTION_H 1

#include <cstdint>
#include <string>
#include <vector>
#include <map>
#include <atomic>
#include <boost/thread.hpp>
#include <boost/function.hpp>
#include "RssiConnection.h"
#include "AxiStreamPacket.h"
#include "axistream_lib_export.h"

class AxiStreamPacketConnection {
public:
    typedef boost::function<void(std::vector<uint8_t>& movableMessage)> ChannelCallback_t;

    AXISTREAM_LIB_EXPORT AxiStreamPacketConnection(RssiConfig& rssiConfig, uint16_t remoteUdpPort = RssiConnection::DEFAULT_REMOTE_UDP_PORT);
    AXISTREAM_LIB_EXPORT ~AxiStreamPacketConnection();

    /// Register (or replace) the callback and an empty reassembly buffer for a channel
    AXISTREAM_LIB_EXPORT void SetChannelCallback(uint8_t channel, const ChannelCallback_t& callback);

    AXISTREAM_LIB_EXPORT bool Connect(const std::string& remoteHostname, uint16_t localUdpPort,
        const RssiConnection::ConnectionStateChangedCallback_t& connectionStateChangedCallback);
    AXISTREAM_LIB_EXPORT bool Listen(uint16_t localUdpPort,
        const RssiConnection::ConnectionStateChangedCallback_t& connectionStateChangedCallback);
    AXISTREAM_LIB_EXPORT void Disconnect();
    AXISTREAM_LIB_EXPORT void Interrupt();
    AXISTREAM_LIB_EXPORT void CloseAndJoin();

    /** Send one message on a channel.
     *
     * An empty message is sent as a single frame with both SOF and EOF set.
     * @return False if the RSSI connection is not connected.
     */
    AXISTREAM_LIB_EXPORT bool SendData(uint8_t channel, const uint8_t* data, std::size_t size);
    AXISTREAM_LIB_EXPORT bool SendData(uint8_t channel, const std::vector<uint8_t>& data);

    /// Largest frame payload for the current segment size: (maxSegmentSize - 24) rounded down to a multiple of 8
    AXISTREAM_LIB_EXPORT std::size_t GetMaxPayloadSizePerPacket() const;

    AXISTREAM_LIB_EXPORT RSSI_CONNECTION_STATE GetConnectionState() const;
    AXISTREAM_LIB_EXPORT uint16_t GetBoundLocalPort() const;
    AXISTREAM_LIB_EXPORT RssiConnection& GetRssiConnection();

private:
    AXISTREAM_LIB_NO_EXPORT void OnRssiDataReceived(std::vector<uint8_t>& movableData);

private:
    struct channel_t {
        ChannelCallback_t callback;
        std::vector<uint8_t> partialMessage;
    };

    RssiConnection m_rssiConnection;

    boost::mutex m_channelsMutex;
    std::map<uint8_t, channel_t> m_channels;

    boost::mutex m_sendMutex; //keeps the frames of one message contiguous
    uint8_t m_nextSequenceNumbers[256];
    std::vector<uint8_t> m_frameSerialization;
    AxiStreamPacket m_framePacket;

public:
    //stats
    std::atomic<uint64_t> m_countFramesSent;
    std::atomic<uint64_t> m_countFramesReceived;
    std::atomic<uint64_t> m_countMessagesSent;
    std::atomic<uint64_t> m_countMessagesReceived;
    std::atomic<uint64_t> m_countMalformedFrames;
    std::atomic<uint64_t> m_countCrcErrors;
    std::atomic<uint64_t> m_countFramesForUnregisteredChannels;
};

#endif //_AXI_STREAM_PACKET_CONNECTION_H
