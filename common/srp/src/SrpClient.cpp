/**
 * @file SrpClient.cpp
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

#include "SrpClient.h"
#include "Logger.h"
#include <boost/bind/bind.hpp>
#include <boost/make_unique.hpp>

static constexpr srplink::Logger::SubProcess subprocess = srplink::Logger::SubProcess::srp;

constexpr uint8_t SrpClient::DEFAULT_SRP_CHANNEL;
constexpr uint8_t SrpClient::DEFAULT_STREAM_CHANNEL;

SrpClient::SrpClient(const RssiConfig& rssiConfig, const StreamCallback_t& streamCallback,
    uint16_t remoteUdpPort, uint8_t srpChannel, uint8_t streamChannel) :
    m_rssiConfig(rssiConfig),
    m_streamCallback(streamCallback),
    M_REMOTE_UDP_PORT(remoteUdpPort),
    M_SRP_CHANNEL(srpChannel),
    M_STREAM_CHANNEL(streamChannel),
    m_localUdpPort(0),
    m_connectionState(RSSI_CONNECTION_STATE::DISCONNECTED),
    m_currentRequestType(request_type_t::NONE),
    m_currentTransactionId(0),
    m_requestDone(false),
    m_requestResult(SRP_REQUEST_RESULT::SUCCESS),
    m_countReads(0),
    m_countWrites(0),
    m_countPostedWrites(0),
    m_countUnsolicitedResponses(0),
    m_countReconnects(0) {}

SrpClient::~SrpClient() {
    CloseAndJoin();
}

bool SrpClient::ConnectAndStart(const std::string& remoteHostname, uint16_t localUdpPort) {
    if (m_axiStreamPacketConnectionPtr) {
        LOG_ERROR(subprocess) << "SrpClient::ConnectAndStart: already started, call Reconnect instead";
        return false;
    }
    m_remoteHostname = remoteHostname;
    m_localUdpPort = localUdpPort;
    {
        boost::mutex::scoped_lock lock(m_requestMutex);
        m_connectionState = RSSI_CONNECTION_STATE::CONNECTING;
    }
    m_axiStreamPacketConnectionPtr = boost::make_unique<AxiStreamPacketConnection>(m_rssiConfig, M_REMOTE_UDP_PORT);
    m_srpV3ConnectionPtr = boost::make_unique<SrpV3Connection>(*m_axiStreamPacketConnectionPtr, M_SRP_CHANNEL,
        boost::bind(&SrpClient::OnSrpResponse, this, boost::placeholders::_1));
    m_axiStreamPacketConnectionPtr->SetChannelCallback(M_STREAM_CHANNEL, boost::bind(&SrpClient::OnStreamData, this, boost::placeholders::_1));
    if (!m_axiStreamPacketConnectionPtr->Connect(remoteHostname, localUdpPort,
        boost::bind(&SrpClient::OnConnectionStateChanged, this, boost::placeholders::_1)))
    {
        boost::mutex::scoped_lock lock(m_requestMutex);
        m_connectionState = RSSI_CONNECTION_STATE::DISCONNECTED;
        return false;
    }
    return true;
}

bool SrpClient::WaitConnected(unsigned int timeoutMilliseconds) {
    boost::mutex::scoped_lock lock(m_requestMutex);
    const boost::posix_time::ptime deadline = boost::posix_time::microsec_clock::universal_time() + boost::posix_time::milliseconds(timeoutMilliseconds);
    while (m_connectionState == RSSI_CONNECTION_STATE::CONNECTING) {
        if (timeoutMilliseconds == 0) {
            m_requestConditionVariable.wait(lock);
        }
        else if (!m_requestConditionVariable.timed_wait(lock, deadline)) {
            LOG_WARNING(subprocess) << "timed out waiting for connection to " << m_remoteHostname;
            break;
        }
    }
    return (m_connectionState == RSSI_CONNECTION_STATE::CONNECTED);
}

bool SrpClient::IsConnected() const {
    boost::mutex::scoped_lock lock(m_requestMutex);
    return (m_connectionState == RSSI_CONNECTION_STATE::CONNECTED);
}

void SrpClient::OnConnectionStateChanged(RSSI_CONNECTION_STATE newState) {
    LOG_INFO(subprocess) << "SrpClient connection state " << newState;
    {
        boost::mutex::scoped_lock lock(m_requestMutex);
        m_connectionState = newState;
        if ((newState == RSSI_CONNECTION_STATE::DISCONNECTED) && (m_currentRequestType != request_type_t::NONE) && (!m_requestDone)) {
            m_requestResult = SRP_REQUEST_RESULT::DISCONNECTED;
            m_requestDone = true;
        }
    }
    m_requestConditionVariable.notify_all();
}

void SrpClient::OnSrpResponse(SrpPacket& responsePacket) {
    {
        boost::mutex::scoped_lock lock(m_requestMutex);
        if ((m_currentRequestType == request_type_t::NONE) || m_requestDone) {
            ++m_countUnsolicitedResponses;
            LOG_WARNING(subprocess) << "received unsolicited SRP response: " << responsePacket;
            return;
        }
        if (responsePacket.m_header.transactionId != m_currentTransactionId) {
            LOG_WARNING(subprocess) << "SRP response transaction id 0x" << std::hex << responsePacket.m_header.transactionId
                << " does not match request 0x" << m_currentTransactionId << std::dec;
        }
        m_requestResult = responsePacket.m_footer.ToRequestResult();
        if (m_requestResult != SRP_REQUEST_RESULT::SUCCESS) {
            LOG_WARNING(subprocess) << "SRP request failed: " << m_requestResult << " (" << responsePacket.m_footer << ")";
        }
        else if (m_currentRequestType == request_type_t::READ) {
            m_readData = std::move(responsePacket.m_payload);
        }
        m_requestDone = true;
    }
    m_requestConditionVariable.notify_all();
}

void SrpClient::OnStreamData(std::vector<uint8_t>& movableStreamData) {
    if (m_streamCallback) {
        m_streamCallback(movableStreamData);
    }
}

SRP_REQUEST_RESULT SrpClient::WaitForResponse(boost::mutex::scoped_lock& lock, unsigned int timeoutMilliseconds) {
    const boost::posix_time::ptime deadline = boost::posix_time::microsec_clock::universal_time() + boost::posix_time::milliseconds(timeoutMilliseconds);
    while (!m_requestDone) {
        if (timeoutMilliseconds == 0) {
            m_requestConditionVariable.wait(lock);
        }
        else if ((!m_requestConditionVariable.timed_wait(lock, deadline)) && (!m_requestDone)) {
            LOG_ERROR(subprocess) << "no SRP response within " << timeoutMilliseconds << " ms (transaction id 0x"
                << std::hex << m_currentTransactionId << std::dec << ")";
            m_requestResult = SRP_REQUEST_RESULT::LOCAL_TIMEOUT;
            break;
        }
    }
    m_currentRequestType = request_type_t::NONE;
    return m_requestResult;
}

SRP_REQUEST_RESULT SrpClient::Read(uint64_t address, uint32_t sizeBytes, std::vector<uint8_t>& data, unsigned int timeoutMilliseconds) {
    data.clear();
    boost::mutex::scoped_lock lock(m_requestMutex);
    if (m_connectionState != RSSI_CONNECTION_STATE::CONNECTED) {
        return SRP_REQUEST_RESULT::DISCONNECTED;
    }
    if (m_currentRequestType != request_type_t::NONE) {
        LOG_ERROR(subprocess) << "SrpClient::Read: another request is in flight";
        return SRP_REQUEST_RESULT::NOT_CONNECTED_OR_BUSY;
    }
    m_currentRequestType = request_type_t::READ;
    m_requestDone = false;
    m_readData.clear();
    if (!m_srpV3ConnectionPtr->SendReadRequest(address, sizeBytes, m_currentTransactionId)) {
        m_currentRequestType = request_type_t::NONE;
        return (sizeBytes == 0) ? SRP_REQUEST_RESULT::REQUEST_ERROR : SRP_REQUEST_RESULT::DISCONNECTED;
    }
    ++m_countReads;
    const SRP_REQUEST_RESULT result = WaitForResponse(lock, timeoutMilliseconds);
    if (result == SRP_REQUEST_RESULT::SUCCESS) {
        if (m_readData.size() != sizeBytes) {
            LOG_WARNING(subprocess) << "SRP read of " << sizeBytes << " bytes at 0x" << std::hex << address << std::dec
                << " returned " << m_readData.size() << " bytes";
        }
        data.swap(m_readData);
    }
    return result;
}

SRP_REQUEST_RESULT SrpClient::Write(uint64_t address, const std::vector<uint8_t>& data, bool posted, unsigned int timeoutMilliseconds) {
    boost::mutex::scoped_lock lock(m_requestMutex);
    if (m_connectionState != RSSI_CONNECTION_STATE::CONNECTED) {
        return SRP_REQUEST_RESULT::DISCONNECTED;
    }
    if (posted) {
        uint32_t transactionId;
        if (!m_srpV3ConnectionPtr->SendWriteRequest(address, data, true, transactionId)) {
            return (data.empty()) ? SRP_REQUEST_RESULT::REQUEST_ERROR : SRP_REQUEST_RESULT::DISCONNECTED;
        }
        ++m_countPostedWrites;
        return SRP_REQUEST_RESULT::SUCCESS;
    }
    if (m_currentRequestType != request_type_t::NONE) {
        LOG_ERROR(subprocess) << "SrpClient::Write: another request is in flight";
        return SRP_REQUEST_RESULT::NOT_CONNECTED_OR_BUSY;
    }
    m_currentRequestType = request_type_t::WRITE;
    m_requestDone = false;
    if (!m_srpV3ConnectionPtr->SendWriteRequest(address, data, false, m_currentTransactionId)) {
        m_currentRequestType = request_type_t::NONE;
        return (data.empty()) ? SRP_REQUEST_RESULT::REQUEST_ERROR : SRP_REQUEST_RESULT::DISCONNECTED;
    }
    ++m_countWrites;
    return WaitForResponse(lock, timeoutMilliseconds);
}

void SrpClient::Disconnect() {
    if (m_axiStreamPacketConnectionPtr) {
        m_axiStreamPacketConnectionPtr->Disconnect();
    }
}

void SrpClient::CloseAndJoin() {
    if (m_axiStreamPacketConnectionPtr) {
        m_axiStreamPacketConnectionPtr->CloseAndJoin();
        m_srpV3ConnectionPtr.reset();
        m_axiStreamPacketConnectionPtr.reset();
    }
}

bool SrpClient::Reconnect(unsigned int timeoutMilliseconds) {
    LOG_INFO(subprocess) << "SrpClient reconnecting to " << m_remoteHostname << ":" << M_REMOTE_UDP_PORT;
    CloseAndJoin();
    ++m_countReconnects;
    if (!ConnectAndStart(m_remoteHostname, m_localUdpPort)) {
        return false;
    }
    return WaitConnected(timeoutMilliseconds);
}
