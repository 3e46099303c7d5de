/**
 * @file RssiConnection.cpp
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

#include "RssiConnection.h"
#include "Logger.h"
#include "ThreadNamer.h"
#include <boost/bind/bind.hpp>
#include <boost/make_unique.hpp>
#include <algorithm>
#include <boost/lexical_cast.hpp>

static constexpr srplink::Logger::SubProcess subprocess = srplink::Logger::SubProcess::rssi;

constexpr uint16_t RssiConnection::DEFAULT_REMOTE_UDP_PORT;
constexpr std::size_t RssiConnection::UDP_RECEIVE_BUFFER_SIZE;
constexpr unsigned int RssiConnection::CONTROL_PERIOD_MILLISECONDS;

std::ostream& operator<<(std::ostream& os, const RSSI_CONNECTION_STATE& o) {
    static const char* const names[] = { "DISCONNECTED", "CONNECTING", "CONNECTED" };
    os << names[static_cast<unsigned int>(o)];
    return os;
}

RssiConnection::RssiConnection(RssiConfig& config, uint16_t remoteUdpPort) :
    M_REMOTE_UDP_PORT(remoteUdpPort),
    m_localSynHeader(config.ToSynHeader()),
    m_udpSocket(m_ioService),
    m_controlTimer(m_ioService),
    m_udpReceiveBuffer(UDP_RECEIVE_BUFFER_SIZE),
    m_started(false),
    m_passiveOpen(false),
    m_remoteEndpointLocked(false),
    m_verifyChecksums(config.m_useChecksum),
    m_state(RSSI_CONNECTION_STATE::DISCONNECTED),
    m_maxSegmentSize(m_localSynHeader.maxSegmentSize),
    m_boundLocalPort(0),
    m_dispatchInterrupted(false),
    m_setUdpDropSimulatorFunctionInProgress(false),
    m_countUdpPacketsSent(0),
    m_countUdpPacketsReceived(0),
    m_countUdpPacketsDroppedBySimulator(0),
    m_countUdpPacketsRejected(0),
    m_totalUserDataBytesSent(0),
    m_totalUserDataBytesReceived(0)
{
}

RssiConnection::~RssiConnection() {
    CloseAndJoin();
    if (m_started) {
        //print stats once
        LOG_INFO(subprocess) << "RssiConnection (connection id " << m_localSynHeader.connectionId << "):"
            << "\n countUdpPacketsSent " << m_countUdpPacketsSent
            << "\n countUdpPacketsReceived " << m_countUdpPacketsReceived
            << "\n countUdpPacketsDroppedBySimulator " << m_countUdpPacketsDroppedBySimulator
            << "\n countUdpPacketsRejected " << m_countUdpPacketsRejected
            << "\n totalUserDataBytesSent " << m_totalUserDataBytesSent
            << "\n totalUserDataBytesReceived " << m_totalUserDataBytesReceived;
    }
}

bool RssiConnection::Connect(const std::string& remoteHostname, uint16_t localUdpPort,
    const ConnectionStateChangedCallback_t& connectionStateChangedCallback,
    const DataReceivedCallback_t& dataReceivedCallback)
{
    static const boost::asio::ip::resolver_query_base::flags UDP_RESOLVER_FLAGS = boost::asio::ip::resolver_query_base::canonical_name; //boost resolver flags
    if (m_started) {
        LOG_ERROR(subprocess) << "RssiConnection::Connect: connection already used";
        return false;
    }
    LOG_INFO(subprocess) << "RssiConnection resolving " << remoteHostname << ":" << M_REMOTE_UDP_PORT;
    {
        boost::asio::ip::udp::resolver resolver(m_ioService);
        try {
            m_remoteEndpoint = *resolver.resolve(boost::asio::ip::udp::resolver::query(boost::asio::ip::udp::v4(), remoteHostname,
                boost::lexical_cast<std::string>(M_REMOTE_UDP_PORT), UDP_RESOLVER_FLAGS));
        }
        catch (const boost::system::system_error& e) {
            LOG_ERROR(subprocess) << "RssiConnection::Connect: " << e.what() << "  code=" << e.code();
            return false;
        }
    }
    m_passiveOpen = false;
    m_remoteEndpointLocked = true;
    return Start(localUdpPort, connectionStateChangedCallback, dataReceivedCallback);
}

bool RssiConnection::Listen(uint16_t localUdpPort,
    const ConnectionStateChangedCallback_t& connectionStateChangedCallback,
    const DataReceivedCallback_t& dataReceivedCallback)
{
    if (m_started) {
        LOG_ERROR(subprocess) << "RssiConnection::Listen: connection already used";
        return false;
    }
    m_passiveOpen = true;
    m_remoteEndpointLocked = false;
    return Start(localUdpPort, connectionStateChangedCallback, dataReceivedCallback);
}

bool RssiConnection::Start(uint16_t localUdpPort,
    const ConnectionStateChangedCallback_t& connectionStateChangedCallback,
    const DataReceivedCallback_t& dataReceivedCallback)
{
    m_connectionStateChangedCallback = connectionStateChangedCallback;
    m_dataReceivedCallback = dataReceivedCallback;
    try {
        m_udpSocket.open(boost::asio::ip::udp::v4());
        m_udpSocket.bind(boost::asio::ip::udp::endpoint(boost::asio::ip::udp::v4(), localUdpPort));
        m_boundLocalPort = m_udpSocket.local_endpoint().port();
    }
    catch (const boost::system::system_error& e) {
        LOG_ERROR(subprocess) << "Could not bind on UDP port " << localUdpPort;
        LOG_ERROR(subprocess) << e.what();
        boost::system::error_code ec;
        m_udpSocket.close(ec);
        return false;
    }
    LOG_INFO(subprocess) << "RssiConnection bound successfully on UDP port " << m_boundLocalPort
        << ((m_passiveOpen) ? ", listening" : ", connecting to ") << ((m_passiveOpen) ? std::string() : m_remoteEndpoint.address().to_string());
    m_started = true;
    m_state = RSSI_CONNECTION_STATE::CONNECTING;

    m_dispatchInterrupted = false;
    m_dispatchThreadPtr = boost::make_unique<boost::thread>(
        boost::bind(&RssiConnection::DispatchThreadFunc, this)); //create and start the worker thread

    //call before creating io_service thread so that it has "work"
    StartUdpReceive();
    StartControlTimer();
    boost::asio::post(m_ioService, boost::bind(&RssiConnection::HandleStartHandshake, this));

    m_ioServiceThreadPtr = boost::make_unique<boost::thread>(boost::bind(&boost::asio::io_service::run, &m_ioService));
    ThreadNamer::SetIoServiceThreadName(m_ioService, "ioServiceRssi");
    return true;
}

void RssiConnection::HandleStartHandshake() {
    if (m_passiveOpen) {
        m_connManager.Listen(static_cast<uint8_t>(m_localSynHeader.connectionId), m_localSynHeader,
            boost::bind(&RssiConnection::SendSegment, this, boost::placeholders::_1),
            boost::bind(&RssiConnection::OnConnectionFinished, this, boost::placeholders::_1, boost::placeholders::_2,
                boost::placeholders::_3, boost::placeholders::_4));
    }
    else {
        m_connManager.Connect(0, m_localSynHeader,
            boost::bind(&RssiConnection::SendSegment, this, boost::placeholders::_1),
            boost::bind(&RssiConnection::OnConnectionFinished, this, boost::placeholders::_1, boost::placeholders::_2,
                boost::placeholders::_3, boost::placeholders::_4),
            boost::posix_time::microsec_clock::universal_time());
    }
}

void RssiConnection::StartUdpReceive() {
    m_udpSocket.async_receive_from(
        boost::asio::buffer(m_udpReceiveBuffer),
        m_receivedFromEndpoint,
        boost::bind(&RssiConnection::HandleUdpReceive, this,
            boost::asio::placeholders::error,
            boost::asio::placeholders::bytes_transferred));
}

void RssiConnection::HandleUdpReceive(const boost::system::error_code& error, std::size_t bytesTransferred) {
    if (error) {
        if (error == boost::asio::error::operation_aborted) {
            return; //socket closed
        }
        if ((error == boost::asio::error::connection_refused) || (error == boost::asio::error::connection_reset)) {
            LOG_DEBUG(subprocess) << "RssiConnection::HandleUdpReceive: ignoring " << error.message();
            StartUdpReceive();
            return;
        }
        LOG_ERROR(subprocess) << "RssiConnection::HandleUdpReceive: " << error.message();
        ChangeState(RSSI_CONNECTION_STATE::DISCONNECTED);
        return;
    }
    ++m_countUdpPacketsReceived;

    if (m_remoteEndpointLocked && (m_receivedFromEndpoint != m_remoteEndpoint)) {
        LOG_WARNING(subprocess) << "dropping datagram from unexpected sender " << m_receivedFromEndpoint
            << " (expected " << m_remoteEndpoint << ")";
        ++m_countUdpPacketsRejected;
        StartUdpReceive();
        return;
    }

    RssiSegment segment;
    if (!segment.Deserialize(m_udpReceiveBuffer.data(), bytesTransferred)) {
        LOG_WARNING(subprocess) << "dropping malformed segment of " << bytesTransferred << " bytes";
        ++m_countUdpPacketsRejected;
        StartUdpReceive();
        return;
    }
    if (m_verifyChecksums && (!segment.VerifyChecksum())) {
        LOG_WARNING(subprocess) << "dropping segment with bad checksum: " << segment;
        ++m_countUdpPacketsRejected;
        StartUdpReceive();
        return;
    }

    const boost::posix_time::ptime now = boost::posix_time::microsec_clock::universal_time();
    const RSSI_CONNECTION_STATE state = m_state.load();
    if (state == RSSI_CONNECTION_STATE::CONNECTING) {
        if (m_passiveOpen && (!m_remoteEndpointLocked)) {
            if ((!segment.IsSyn()) || HasAnyFlag(segment.m_controlBits, RSSI_CONTROL_BITS::ACK)) {
                LOG_DEBUG(subprocess) << "listening, ignoring " << segment << " from " << m_receivedFromEndpoint;
                ++m_countUdpPacketsRejected;
                StartUdpReceive();
                return;
            }
            m_remoteEndpoint = m_receivedFromEndpoint;
            m_remoteEndpointLocked = true;
            LOG_INFO(subprocess) << "accepting connection from " << m_remoteEndpoint;
        }
        if (m_connManager.SegmentReceived(segment, now) && (m_state.load() == RSSI_CONNECTION_STATE::CONNECTED)) {
            m_dataQueue.SegmentReceived(segment, now);
        }
    }
    else if (state == RSSI_CONNECTION_STATE::CONNECTED) {
        m_dataQueue.SegmentReceived(segment, now);
    }

    if (m_state.load() != RSSI_CONNECTION_STATE::DISCONNECTED) {
        StartUdpReceive();
    }
}

void RssiConnection::StartControlTimer() {
    m_controlTimer.expires_from_now(boost::posix_time::milliseconds(CONTROL_PERIOD_MILLISECONDS));
    m_controlTimer.async_wait(boost::bind(&RssiConnection::HandleControlTimer, this, boost::asio::placeholders::error));
}

void RssiConnection::HandleControlTimer(const boost::system::error_code& e) {
    if (e == boost::asio::error::operation_aborted) {
        return;
    }
    const boost::posix_time::ptime now = boost::posix_time::microsec_clock::universal_time();
    const RSSI_CONNECTION_STATE state = m_state.load();
    if (state == RSSI_CONNECTION_STATE::CONNECTING) {
        m_connManager.OnControlPeriod(now);
    }
    else if (state == RSSI_CONNECTION_STATE::CONNECTED) {
        m_dataQueue.OnControlPeriod(now);
    }
    if (m_state.load() != RSSI_CONNECTION_STATE::DISCONNECTED) {
        StartControlTimer();
    }
}

bool RssiConnection::SendSegment(const RssiSegment& segment) {
    segment.Serialize(m_udpSendBuffer);
    if (m_udpDropSimulatorFunction && m_udpDropSimulatorFunction(m_udpSendBuffer, m_udpSendBuffer.size())) {
        LOG_DEBUG(subprocess) << "drop simulator dropped " << segment;
        ++m_countUdpPacketsDroppedBySimulator;
        return true;
    }
    boost::system::error_code ec;
    m_udpSocket.send_to(boost::asio::buffer(m_udpSendBuffer), m_remoteEndpoint, 0, ec);
    if (ec) {
        LOG_WARNING(subprocess) << "RssiConnection::SendSegment: " << ec.message();
        return false;
    }
    ++m_countUdpPacketsSent;
    return true;
}

void RssiConnection::OnConnectionFinished(bool success, uint8_t initialLocalSequenceNumber,
    uint8_t initialRemoteSequenceNumber, const RssiSynHeader& negotiatedSynHeader)
{
    if (!success) {
        LOG_ERROR(subprocess) << "RSSI handshake failed";
        ChangeState(RSSI_CONNECTION_STATE::DISCONNECTED);
        return;
    }
    m_verifyChecksums = negotiatedSynHeader.checksumEnabled;
    m_maxSegmentSize = negotiatedSynHeader.maxSegmentSize;
    m_dataQueue.Reset(initialLocalSequenceNumber, initialRemoteSequenceNumber, negotiatedSynHeader,
        boost::bind(&RssiConnection::SendSegment, this, boost::placeholders::_1),
        boost::bind(&RssiConnection::OnDataQueueDataReceived, this, boost::placeholders::_1),
        boost::bind(&RssiConnection::OnDataQueueDisconnected, this, boost::placeholders::_1),
        boost::posix_time::microsec_clock::universal_time());
    ChangeState(RSSI_CONNECTION_STATE::CONNECTED);
}

void RssiConnection::OnDataQueueDataReceived(std::vector<uint8_t>& movablePayload) {
    m_totalUserDataBytesReceived += movablePayload.size();
    {
        boost::mutex::scoped_lock lock(m_dispatchMutex);
        m_dispatchQueue.emplace_back();
        dispatch_task_t& task = m_dispatchQueue.back();
        task.isStateChange = false;
        task.newState = RSSI_CONNECTION_STATE::CONNECTED;
        task.data = std::move(movablePayload);
    }
    m_dispatchConditionVariable.notify_one();
}

void RssiConnection::OnDataQueueDisconnected(RSSI_DISCONNECT_REASON reason) {
    LOG_INFO(subprocess) << "data queue finished: " << reason;
    ChangeState(RSSI_CONNECTION_STATE::DISCONNECTED);
}

void RssiConnection::ChangeState(RSSI_CONNECTION_STATE newState) {
    if (m_state.load() == newState) {
        return;
    }
    m_state = newState;
    LOG_INFO(subprocess) << "connection state changed to " << newState;
    {
        boost::mutex::scoped_lock lock(m_dispatchMutex);
        m_dispatchQueue.emplace_back();
        dispatch_task_t& task = m_dispatchQueue.back();
        task.isStateChange = true;
        task.newState = newState;
    }
    m_dispatchConditionVariable.notify_one();
    if (newState == RSSI_CONNECTION_STATE::DISCONNECTED) {
        boost::asio::post(m_ioService, boost::bind(&RssiConnection::HandleSocketShutdown, this));
    }
}

void RssiConnection::HandleSocketShutdown() {
    boost::system::error_code ec;
    m_controlTimer.cancel(ec);
    if (m_udpSocket.is_open()) {
        LOG_INFO(subprocess) << "closing RSSI UDP socket on port " << m_boundLocalPort;
        m_udpSocket.close(ec);
        if (ec) {
            LOG_WARNING(subprocess) << "error closing RSSI UDP socket: " << ec.message();
        }
    }
}

void RssiConnection::DispatchThreadFunc() {
    ThreadNamer::SetThisThreadName("rssiDispatch");
    while (true) {
        dispatch_task_t task;
        {
            boost::mutex::scoped_lock lock(m_dispatchMutex);
            while (m_dispatchQueue.empty() && (!m_dispatchInterrupted)) {
                m_dispatchConditionVariable.wait(lock); // call lock.unlock() and blocks the current thread
            }
            if (m_dispatchInterrupted) {
                break;
            }
            task = std::move(m_dispatchQueue.front());
            m_dispatchQueue.pop_front();
        }
        if (task.isStateChange) {
            if (m_connectionStateChangedCallback) {
                m_connectionStateChangedCallback(task.newState);
            }
            if (task.newState == RSSI_CONNECTION_STATE::DISCONNECTED) {
                break;
            }
        }
        else if (m_dataReceivedCallback) {
            m_dataReceivedCallback(task.data);
        }
    }
    LOG_DEBUG(subprocess) << "RssiConnection dispatch thread exiting";
}

void RssiConnection::Interrupt() {
    {
        boost::mutex::scoped_lock lock(m_dispatchMutex);
        m_dispatchInterrupted = true;
    }
    m_dispatchConditionVariable.notify_one();
}

void RssiConnection::HandleForcedClose() {
    if (m_state.load() != RSSI_CONNECTION_STATE::DISCONNECTED) {
        LOG_INFO(subprocess) << "forcing connection closed";
        ChangeState(RSSI_CONNECTION_STATE::DISCONNECTED);
    }
    HandleSocketShutdown();
}

void RssiConnection::CloseAndJoin() {
    if (m_ioServiceThreadPtr) {
        boost::asio::post(m_ioService, boost::bind(&RssiConnection::HandleForcedClose, this));
        try {
            m_ioServiceThreadPtr->join();
            m_ioServiceThreadPtr.reset(); //delete it
        }
        catch (const boost::thread_resource_error&) {
            LOG_ERROR(subprocess) << "error stopping RssiConnection io_service";
        }
    }
    if (m_dispatchThreadPtr) {
        try {
            m_dispatchThreadPtr->join();
            m_dispatchThreadPtr.reset(); //delete it
        }
        catch (const boost::thread_resource_error&) {
            LOG_ERROR(subprocess) << "error stopping RssiConnection dispatch thread";
        }
    }
}

void RssiConnection::Disconnect() {
    if (m_state.load() != RSSI_CONNECTION_STATE::CONNECTED) {
        LOG_WARNING(subprocess) << "RssiConnection::Disconnect: not connected";
        return;
    }
    boost::asio::post(m_ioService, boost::bind(&RssiConnection::HandleDisconnectRequest, this));
}

void RssiConnection::HandleDisconnectRequest() {
    if (m_state.load() == RSSI_CONNECTION_STATE::CONNECTED) {
        m_dataQueue.Disconnect(boost::posix_time::microsec_clock::universal_time());
    }
}

bool RssiConnection::SendData(const uint8_t* data, std::size_t size) {
    if (m_state.load() != RSSI_CONNECTION_STATE::CONNECTED) {
        return false;
    }
    std::shared_ptr<std::vector<uint8_t> > dataPtr = std::make_shared<std::vector<uint8_t> >(data, data + size);
    boost::asio::post(m_ioService, boost::bind(&RssiConnection::HandleSendData, this, dataPtr));
    return true;
}

bool RssiConnection::SendData(const std::vector<uint8_t>& data) {
    return SendData(data.data(), data.size());
}

void RssiConnection::HandleSendData(const std::shared_ptr<std::vector<uint8_t> >& dataPtr) {
    if (m_state.load() != RSSI_CONNECTION_STATE::CONNECTED) {
        LOG_WARNING(subprocess) << "dropping " << dataPtr->size() << " bytes of user data: no longer connected";
        return;
    }
    const std::size_t maxChunkSize = (m_maxSegmentSize > RssiSegment::NON_SYN_HEADER_SIZE) ?
        (m_maxSegmentSize - RssiSegment::NON_SYN_HEADER_SIZE) : 0;
    if (maxChunkSize == 0) {
        LOG_ERROR(subprocess) << "max segment size " << m_maxSegmentSize << " too small to carry data";
        return;
    }
    const std::vector<uint8_t>& data = *dataPtr;
    const boost::posix_time::ptime now = boost::posix_time::microsec_clock::universal_time();
    for (std::size_t offset = 0; offset < data.size(); offset += maxChunkSize) {
        const std::size_t chunkSize = std::min(maxChunkSize, data.size() - offset);
        if (!m_dataQueue.SendUserData(&data[offset], chunkSize, now)) {
            return;
        }
        m_totalUserDataBytesSent += chunkSize;
    }
}

RSSI_CONNECTION_STATE RssiConnection::GetConnectionState() const {
    return m_state.load();
}

uint16_t RssiConnection::GetMaxSegmentSize() const {
    return m_maxSegmentSize.load();
}

uint16_t RssiConnection::GetBoundLocalPort() const {
    return m_boundLocalPort.load();
}

void RssiConnection::SetUdpDropSimulatorFunction_ThreadSafe(const UdpDropSimulatorFunction_t& udpDropSimulatorFunction) {
    if (!m_ioServiceThreadPtr) {
        m_udpDropSimulatorFunction = udpDropSimulatorFunction;
        return;
    }
    boost::mutex::scoped_lock cvLock(m_mutexSetUdpDropSimulatorFunction);
    m_setUdpDropSimulatorFunctionInProgress = true;
    boost::asio::post(m_ioService, boost::bind(&RssiConnection::SetUdpDropSimulatorFunction, this, udpDropSimulatorFunction));
    while (m_setUdpDropSimulatorFunctionInProgress) {
        if (m_ioService.stopped()) { //control thread has finished, no handler can be running
            m_udpDropSimulatorFunction = udpDropSimulatorFunction;
            m_setUdpDropSimulatorFunctionInProgress = false;
            break;
        }
        m_cvSetUdpDropSimulatorFunction.timed_wait(cvLock, boost::posix_time::milliseconds(100));
    }
}

void RssiConnection::SetUdpDropSimulatorFunction(const UdpDropSimulatorFunction_t& udpDropSimulatorFunction) {
    m_udpDropSimulatorFunction = udpDropSimulatorFunction;
    m_mutexSetUdpDropSimulatorFunction.lock();
    m_setUdpDropSimulatorFunctionInProgress = false;
    m_mutexSetUdpDropSimulatorFunction.unlock();
    m_cvSetUdpDropSimulatorFunction.notify_one();
}
