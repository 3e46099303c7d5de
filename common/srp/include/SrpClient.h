/**
 * @file SrpClient.h
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
 * This SrpClient class provides blocking register reads and writes to a device.
 * It owns the RSSI/AXI-Stream connection, an SrpV3Connection on the SRP channel,
 * and forwards messages of the stream channel to a user callback.
 * Only one read or acknowledged write may be in flight at a time; a second concurrent
 * call is rejected with NOT_CONNECTED_OR_BUSY.  Responses are matched to the
 * in-flight request in arrival order.
 */

#ifndef _SRP_CLIENT_H
#define _SRP_CLIENT_H 1

#include <cstdint>
#include <string>
#include <vector>
#include <memory>
#include <boost/thread.hpp>
#include <boost/function.hpp>
#include "RssiConfig.h"
#include "AxiStreamPacketConnection.h"
#include "SrpV3Connection.h"
#include "srp_lib_export.h"

class SrpClient {
public:
    typedef boost::function<void(std::vector<uint8_t>& movableStreamData)> StreamCallback_t;

    static constexpr uint8_t DEFAULT_SRP_CHANNEL = 0;
    static constexpr uint8_t DEFAULT_STREAM_CHANNEL = 1;

    SRP_LIB_EXPORT SrpClient(const RssiConfig& rssiConfig, const StreamCallback_t& streamCallback,
        uint16_t remoteUdpPort = RssiConnection::DEFAULT_REMOTE_UDP_PORT,
        uint8_t srpChannel = DEFAULT_SRP_CHANNEL, uint8_t streamChannel = DEFAULT_STREAM_CHANNEL);
    SRP_LIB_EXPORT ~SrpClient();

    /** Build a new connection and start the handshake (does not wait for it).
     *
     * @return False if the host could not be resolved or the local port could not be bound.
     */
    SRP_LIB_EXPORT bool ConnectAndStart(const std::string& remoteHostname, uint16_t localUdpPort);

    /** Wait until the handshake completes or fails.
     *
     * @param timeoutMilliseconds 0 waits forever.
     * @return True if connected.
     */
    SRP_LIB_EXPORT bool WaitConnected(unsigned int timeoutMilliseconds);

    /** Blocking read of sizeBytes bytes.
     *
     * @param data Set to the returned bytes on SUCCESS, cleared otherwise.
     * @param timeoutMilliseconds 0 waits forever; otherwise LOCAL_TIMEOUT is returned on expiry.
     */
    SRP_LIB_EXPORT SRP_REQUEST_RESULT Read(uint64_t address, uint32_t sizeBytes, std::vector<uint8_t>& data, unsigned int timeoutMilliseconds = 0);

    /** Write data.  A posted write returns SUCCESS once queued, without a round trip.
     *
     * @param timeoutMilliseconds 0 waits forever; ignored for posted writes.
     */
    SRP_LIB_EXPORT SRP_REQUEST_RESULT Write(uint64_t address, const std::vector<uint8_t>& data, bool posted, unsigned int timeoutMilliseconds = 0);

    /// Graceful RSSI disconnect
    SRP_LIB_EXPORT void Disconnect();

    /** Close the current connection, connect again to the same host and port, and wait.
     *
     * Must not be called concurrently with Read or Write.
     * @return True if connected.
     */
    SRP_LIB_EXPORT bool Reconnect(unsigned int timeoutMilliseconds);

    SRP_LIB_EXPORT bool IsConnected() const;

    /// Force the connection closed and join its threads
    SRP_LIB_EXPORT void CloseAndJoin();

private:
    enum class request_type_t {
        NONE = 0,
        READ,
        WRITE
    };

    SRP_LIB_NO_EXPORT void OnConnectionStateChanged(RSSI_CONNECTION_STATE newState);
    SRP_LIB_NO_EXPORT void OnSrpResponse(SrpPacket& responsePacket);
    SRP_LIB_NO_EXPORT void OnStreamData(std::vector<uint8_t>& movableStreamData);
    SRP_LIB_NO_EXPORT SRP_REQUEST_RESULT WaitForResponse(boost::mutex::scoped_lock& lock, unsigned int timeoutMilliseconds);

private:
    RssiConfig m_rssiConfig;
    const StreamCallback_t m_streamCallback;
    const uint16_t M_REMOTE_UDP_PORT;
    const uint8_t M_SRP_CHANNEL;
    const uint8_t M_STREAM_CHANNEL;
    std::string m_remoteHostname;
    uint16_t m_localUdpPort;

    std::unique_ptr<AxiStreamPacketConnection> m_axiStreamPacketConnectionPtr;
    std::unique_ptr<SrpV3Connection> m_srpV3ConnectionPtr;

    mutable boost::mutex m_requestMutex;
    boost::condition_variable m_requestConditionVariable;
    RSSI_CONNECTION_STATE m_connectionState;
    request_type_t m_currentRequestType;
    uint32_t m_currentTransactionId;
    bool m_requestDone;
    SRP_REQUEST_RESULT m_requestResult;
    std::vector<uint8_t> m_readData;

public:
    //stats
    uint64_t m_countReads;
    uint64_t m_countWrites;
    uint64_t m_countPostedWrites;
    uint64_t m_countUnsolicitedResponses;
    uint64_t m_countReconnects;
};

#endif //_SRP_CLIENT_H
