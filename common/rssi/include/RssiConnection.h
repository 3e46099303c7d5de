/**
 * @file RssiConnection.h
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
 * This RssiConnection class is one RSSI endpoint over UDP.
 * It owns a UDP socket and an io_service running on its own (control) thread.
 * The control thread receives datagrams, drives the RssiConnManager handshake
 * and then the RssiDataQueue, and services their timers every 1 ms.
 * Connection state changes and received data are queued to a second (dispatch)
 * thread which invokes the user callbacks, so callback execution time never
 * delays socket I/O.
 * The connection is single use: Connecting -> Connected -> Disconnected.
 */

#ifndef _RSSI_CONNECTION_H
#define _RSSI_CONNECTION_H 1

#include <cstdint>
#include <string>
#include <vector>
#include <deque>
#include <memory>
#include <atomic>
#include <boost/asio.hpp>
#include <boost/thread.hpp>
#include <boost/function.hpp>
#include "RssiConfig.h"
#include "RssiConnManager.h"
#include "RssiDataQueue.h"
#include "rssi_lib_export.h"

enum class RSSI_CONNECTION_STATE {
    DISCONNECTED = 0,
    CONNECTING,
    CONNECTED
};
RSSI_LIB_EXPORT std::ostream& operator<<(std::ostream& os, const RSSI_CONNECTION_STATE& o);

class RssiConnection {
public:
    typedef boost::function<void(RSSI_CONNECTION_STATE newState)> ConnectionStateChangedCallback_t;
    typedef boost::function<void(std::vector<uint8_t>& movableData)> DataReceivedCallback_t;
    /// Return true to drop the outbound datagram
    typedef boost::function<bool(const std::vector<uint8_t>& udpPacket, std::size_t bytesToSend)> UdpDropSimulatorFunction_t;

    static constexpr uint16_t DEFAULT_REMOTE_UDP_PORT = 8192;
    static constexpr std::size_t UDP_RECEIVE_BUFFER_SIZE = 65536;
    static constexpr unsigned int CONTROL_PERIOD_MILLISECONDS = 1;

    /**
     * @param config The local synchronization parameters. Its connection id is incremented.
     * @param remoteUdpPort The UDP port of the remote endpoint when connecting (unused when listening).
     */
    RSSI_LIB_EXPORT RssiConnection(RssiConfig& config, uint16_t remoteUdpPort = DEFAULT_REMOTE_UDP_PORT);
    RSSI_LIB_EXPORT ~RssiConnection();

    /** Active open to a remote endpoint.
     *
     * @param remoteHostname The remote host name or address.
     * @param localUdpPort The local UDP port to bind (0 for an ephemeral port).
     * @param connectionStateChangedCallback Called from the dispatch thread on each state change.
     * @param dataReceivedCallback Called from the dispatch thread with received data in order.
     * @return True if the socket was bound and the handshake started, or False otherwise.
     */
    RSSI_LIB_EXPORT bool Connect(const std::string& remoteHostname, uint16_t localUdpPort,
        const ConnectionStateChangedCallback_t& connectionStateChangedCallback,
        const DataReceivedCallback_t& dataReceivedCallback);

    /// Passive open: wait on localUdpPort for a SYN and lock onto its sender
    RSSI_LIB_EXPORT bool Listen(uint16_t localUdpPort,
        const ConnectionStateChangedCallback_t& connectionStateChangedCallback,
        const DataReceivedCallback_t& dataReceivedCallback);

    /// Begin a graceful disconnect (only valid when connected)
    RSSI_LIB_EXPORT void Disconnect();

    /** Queue data for reliable in-order delivery, sliced into chunks of at most maxSegmentSize - 8 bytes.
     *
     * @return False if not connected.
     */
    RSSI_LIB_EXPORT bool SendData(const uint8_t* data, std::size_t size);
    RSSI_LIB_EXPORT bool SendData(const std::vector<uint8_t>& data);

    RSSI_LIB_EXPORT RSSI_CONNECTION_STATE GetConnectionState() const;
    /// The negotiated maximum segment size once connected (the local value before)
    RSSI_LIB_EXPORT uint16_t GetMaxSegmentSize() const;
    RSSI_LIB_EXPORT uint16_t GetBoundLocalPort() const;

    /// Wake the dispatch thread so it exits
    RSSI_LIB_EXPORT void Interrupt();

    /** Force the connection closed (no handshake) if still open, then join both threads.
     *
     * Must not be called from inside a callback.
     */
    RSSI_LIB_EXPORT void CloseAndJoin();

    /// Install (or clear with an empty function) a predicate evaluated for every outbound datagram
    RSSI_LIB_EXPORT void SetUdpDropSimulatorFunction_ThreadSafe(const UdpDropSimulatorFunction_t& udpDropSimulatorFunction);

private:
    RSSI_LIB_NO_EXPORT bool Start(uint16_t localUdpPort,
        const ConnectionStateChangedCallback_t& connectionStateChangedCallback,
        const DataReceivedCallback_t& dataReceivedCallback);
    RSSI_LIB_NO_EXPORT void StartUdpReceive();
    RSSI_LIB_NO_EXPORT void HandleUdpReceive(const boost::system::error_code& error, std::size_t bytesTransferred);
    RSSI_LIB_NO_EXPORT void StartControlTimer();
    RSSI_LIB_NO_EXPORT void HandleControlTimer(const boost::system::error_code& e);
    RSSI_LIB_NO_EXPORT void HandleStartHandshake();
    RSSI_LIB_NO_EXPORT void HandleSendData(const std::shared_ptr<std::vector<uint8_t> >& dataPtr);
    RSSI_LIB_NO_EXPORT void HandleDisconnectRequest();
    RSSI_LIB_NO_EXPORT void HandleForcedClose();
    RSSI_LIB_NO_EXPORT void HandleSocketShutdown();
    RSSI_LIB_NO_EXPORT void SetUdpDropSimulatorFunction(const UdpDropSimulatorFunction_t& udpDropSimulatorFunction);
    RSSI_LIB_NO_EXPORT bool SendSegment(const RssiSegment& segment);
    RSSI_LIB_NO_EXPORT void OnConnectionFinished(bool success, uint8_t initialLocalSequenceNumber,
        uint8_t initialRemoteSequenceNumber, const RssiSynHeader& negotiatedSynHeader);
    RSSI_LIB_NO_EXPORT void OnDataQueueDataReceived(std::vector<uint8_t>& movablePayload);
    RSSI_LIB_NO_EXPORT void OnDataQueueDisconnected(RSSI_DISCONNECT_REASON reason);
    RSSI_LIB_NO_EXPORT void ChangeState(RSSI_CONNECTION_STATE newState);
    RSSI_LIB_NO_EXPORT void DispatchThreadFunc();

private:
    struct dispatch_task_t {
        bool isStateChange;
        RSSI_CONNECTION_STATE newState;
        std::vector<uint8_t> data;
    };

    const uint16_t M_REMOTE_UDP_PORT;
    RssiSynHeader m_localSynHeader;
    boost::asio::io_service m_ioService;
    boost::asio::ip::udp::socket m_udpSocket;
    boost::asio::deadline_timer m_controlTimer;
    std::unique_ptr<boost::thread> m_ioServiceThreadPtr;
    std::unique_ptr<boost::thread> m_dispatchThreadPtr;
    std::vector<uint8_t> m_udpReceiveBuffer;
    std::vector<uint8_t> m_udpSendBuffer;
    boost::asio::ip::udp::endpoint m_remoteEndpoint;
    boost::asio::ip::udp::endpoint m_receivedFromEndpoint;
    bool m_started;
    bool m_passiveOpen;
    bool m_remoteEndpointLocked;
    bool m_verifyChecksums;

    //touched only from the control thread
    RssiConnManager m_connManager;
    RssiDataQueue m_dataQueue;
    UdpDropSimulatorFunction_t m_udpDropSimulatorFunction;

    std::atomic<RSSI_CONNECTION_STATE> m_state;
    std::atomic<uint16_t> m_maxSegmentSize;
    std::atomic<uint16_t> m_boundLocalPort;

    ConnectionStateChangedCallback_t m_connectionStateChangedCallback;
    DataReceivedCallback_t m_dataReceivedCallback;

    boost::mutex m_dispatchMutex;
    boost::condition_variable m_dispatchConditionVariable;
    std::deque<dispatch_task_t> m_dispatchQueue;
    bool m_dispatchInterrupted;

    boost::mutex m_mutexSetUdpDropSimulatorFunction;
    boost::condition_variable m_cvSetUdpDropSimulatorFunction;
    bool m_setUdpDropSimulatorFunctionInProgress;

public:
    //stats
    std::atomic<uint64_t> m_countUdpPacketsSent;
    std::atomic<uint64_t> m_countUdpPacketsReceived;
    std::atomic<uint64_t> m_countUdpPacketsDroppedBySimulator;
    std::atomic<uint64_t> m_countUdpPacketsRejected;
    std::atomic<uint64_t> m_totalUserDataBytesSent;
    std::atomic<uint64_t> m_totalUserDataBytesReceived;
};

#endif //_RSSI_CONNECTION_H
