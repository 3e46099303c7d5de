/**
 * @file FpgaSimulator.cpp
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

#include "FpgaSimulator.h"
#include "Logger.h"
#include "ThreadNamer.h"
#include <boost/bind/bind.hpp>
#include <boost/make_unique.hpp>
#include <boost/endian/conversion.hpp>

static constexpr srplink::Logger::SubProcess subprocess = srplink::Logger::SubProcess::fpgasim;

static constexpr uint64_t MAX_READ_SIZE_BYTES = 1u << 20;

constexpr uint8_t FpgaSimulator::SRP_CHANNEL;
constexpr uint8_t FpgaSimulator::STREAM_CHANNEL;

FpgaSimulator::FpgaSimulator(const RssiConfig& rssiConfig) :
    m_rssiConfig(rssiConfig),
    m_boundLocalPort(0),
    m_running(false),
    m_clientConnected(false),
    m_needsRelisten(false),
    m_hasNextResponseFooter(false),
    m_countConnections(0),
    m_countReadRequests(0),
    m_countWriteRequests(0),
    m_countPostedWriteRequests(0),
    m_countNullRequests(0),
    m_countErrorResponses(0),
    m_countMalformedRequests(0) {}

FpgaSimulator::~FpgaSimulator() {
    Stop();
}

bool FpgaSimulator::Start(uint16_t localUdpPort) {
    {
        boost::mutex::scoped_lock lock(m_stateMutex);
        if (m_running) {
            LOG_ERROR(subprocess) << "FpgaSimulator already started";
            return false;
        }
    }
    if (!CreateAndListen(localUdpPort)) {
        return false;
    }
    {
        boost::mutex::scoped_lock lock(m_stateMutex);
        m_running = true;
        m_needsRelisten = false;
    }
    m_relistenThreadPtr = boost::make_unique<boost::thread>(boost::bind(&FpgaSimulator::RelistenThreadFunc, this));
    LOG_INFO(subprocess) << "FpgaSimulator listening on UDP port " << m_boundLocalPort;
    return true;
}

void FpgaSimulator::Stop() {
    {
        boost::mutex::scoped_lock lock(m_stateMutex);
        m_running = false;
    }
    m_stateConditionVariable.notify_all();
    if (m_relistenThreadPtr) {
        try {
            m_relistenThreadPtr->join();
            m_relistenThreadPtr.reset(); //delete it
        }
        catch (const boost::thread_resource_error&) {
            LOG_ERROR(subprocess) << "error stopping FpgaSimulator relisten thread";
        }
    }
    std::shared_ptr<AxiStreamPacketConnection> connPtr;
    {
        boost::mutex::scoped_lock lock(m_connectionMutex);
        connPtr.swap(m_connectionPtr);
    }
    if (connPtr) {
        connPtr->CloseAndJoin();
        LOG_INFO(subprocess) << "FpgaSimulator stopped:"
            << "\n countConnections " << m_countConnections
            << "\n countReadRequests " << m_countReadRequests
            << "\n countWriteRequests " << m_countWriteRequests
            << "\n countPostedWriteRequests " << m_countPostedWriteRequests
            << "\n countNullRequests " << m_countNullRequests
            << "\n countErrorResponses " << m_countErrorResponses
            << "\n countMalformedRequests " << m_countMalformedRequests;
    }
}

bool FpgaSimulator::CreateAndListen(uint16_t localUdpPort) {
    std::shared_ptr<AxiStreamPacketConnection> connPtr = std::make_shared<AxiStreamPacketConnection>(m_rssiConfig);
    connPtr->SetChannelCallback(SRP_CHANNEL, boost::bind(&FpgaSimulator::OnSrpRequest, this, connPtr.get(), boost::placeholders::_1));
    {
        //current before listening so its first state change is not ignored
        boost::mutex::scoped_lock lock(m_connectionMutex);
        m_connectionPtr = connPtr;
    }
    if (!connPtr->Listen(localUdpPort, boost::bind(&FpgaSimulator::OnConnectionStateChanged, this, connPtr.get(), boost::placeholders::_1))) {
        LOG_ERROR(subprocess) << "FpgaSimulator unable to listen on UDP port " << localUdpPort;
        boost::mutex::scoped_lock lock(m_connectionMutex);
        m_connectionPtr.reset();
        return false;
    }
    m_boundLocalPort = connPtr->GetBoundLocalPort();
    return true;
}

uint16_t FpgaSimulator::GetBoundLocalPort() const {
    return m_boundLocalPort;
}

void FpgaSimulator::OnConnectionStateChanged(AxiStreamPacketConnection* connPtr, RSSI_CONNECTION_STATE newState) {
    {
        boost::mutex::scoped_lock lock(m_connectionMutex);
        if (connPtr != m_connectionPtr.get()) {
            return; //a connection being replaced or stopped
        }
    }
    {
        boost::mutex::scoped_lock lock(m_stateMutex);
        if (newState == RSSI_CONNECTION_STATE::CONNECTED) {
            LOG_INFO(subprocess) << "client connected";
            m_clientConnected = true;
            ++m_countConnections;
        }
        else if (newState == RSSI_CONNECTION_STATE::DISCONNECTED) {
            LOG_INFO(subprocess) << "client disconnected";
            m_clientConnected = false;
            m_needsRelisten = true;
        }
    }
    m_stateConditionVariable.notify_all();
}

void FpgaSimulator::RelistenThreadFunc() {
    ThreadNamer::SetThisThreadName("fpgaSimRelisten");
    boost::mutex::scoped_lock lock(m_stateMutex);
    while (m_running) {
        if (!m_needsRelisten) {
            m_stateConditionVariable.wait(lock);
            continue;
        }
        m_needsRelisten = false;
        lock.unlock();
        std::shared_ptr<AxiStreamPacketConnection> oldConnPtr;
        {
            boost::mutex::scoped_lock connLock(m_connectionMutex);
            oldConnPtr.swap(m_connectionPtr);
        }
        if (oldConnPtr) {
            oldConnPtr->CloseAndJoin();
            oldConnPtr.reset();
        }
        const bool success = CreateAndListen(m_boundLocalPort);
        if (success) {
            LOG_INFO(subprocess) << "FpgaSimulator listening again on UDP port " << m_boundLocalPort;
        }
        lock.lock();
        if (!success) {
            LOG_ERROR(subprocess) << "FpgaSimulator can no longer accept connections";
            break;
        }
    }
}

bool FpgaSimulator::IsClientConnected() const {
    boost::mutex::scoped_lock lock(m_stateMutex);
    return m_clientConnected;
}

bool FpgaSimulator::WaitClientConnected(unsigned int timeoutMilliseconds) {
    boost::mutex::scoped_lock lock(m_stateMutex);
    const boost::posix_time::ptime deadline = boost::posix_time::microsec_clock::universal_time() + boost::posix_time::milliseconds(timeoutMilliseconds);
    while (!m_clientConnected) {
        if (!m_stateConditionVariable.timed_wait(lock, deadline)) {
            break;
        }
    }
    return m_clientConnected;
}

void FpgaSimulator::SetRegister(uint64_t address, uint32_t value) {
    boost::mutex::scoped_lock lock(m_registersMutex);
    m_registers[address] = value;
}

uint32_t FpgaSimulator::GetRegister(uint64_t address) const {
    boost::mutex::scoped_lock lock(m_registersMutex);
    std::map<uint64_t, uint32_t>::const_iterator it = m_registers.find(address);
    return (it == m_registers.cend()) ? 0 : it->second;
}

void FpgaSimulator::SetNextResponseFooter(const SrpFooter& footer) {
    boost::mutex::scoped_lock lock(m_registersMutex);
    m_nextResponseFooter = footer;
    m_hasNextResponseFooter = true;
}

bool FpgaSimulator::SendStreamData(const std::vector<uint8_t>& data) {
    std::shared_ptr<AxiStreamPacketConnection> connPtr;
    {
        boost::mutex::scoped_lock lock(m_connectionMutex);
        connPtr = m_connectionPtr;
    }
    if (!connPtr) {
        return false;
    }
    return connPtr->SendData(STREAM_CHANNEL, data);
}

void FpgaSimulator::OnSrpRequest(AxiStreamPacketConnection* connPtr, std::vector<uint8_t>& movableMessage) {
    SrpPacket request;
    if (!request.DeserializeRequest(movableMessage.data(), movableMessage.size())) {
        ++m_countMalformedRequests;
        LOG_WARNING(subprocess) << "dropping malformed SRP request of " << movableMessage.size() << " bytes";
        return;
    }
    LOG_DEBUG(subprocess) << "received request " << request;
    SrpPacket response;
    if (!ProcessRequest(request, response)) {
        return; //posted writes are never answered
    }
    std::vector<uint8_t> serialization;
    response.Serialize(serialization);
    LOG_DEBUG(subprocess) << "sending response " << response;
    if (!connPtr->SendData(SRP_CHANNEL, serialization)) {
        LOG_WARNING(subprocess) << "unable to send SRP response (tid 0x" << std::hex << response.m_header.transactionId << std::dec << ")";
    }
}

bool FpgaSimulator::ProcessRequest(const SrpPacket& request, SrpPacket& response) {
    const SrpHeader& h = request.m_header;
    response.m_header = h;
    response.m_payload.clear();
    response.m_hasFooter = true;
    SrpFooter& footer = response.m_footer;

    const bool sendResponse = (h.opcode != SRP_OPCODE::POSTED_WRITE);
    boost::mutex::scoped_lock lock(m_registersMutex);
    if (m_hasNextResponseFooter && sendResponse) {
        footer = m_nextResponseFooter;
        m_hasNextResponseFooter = false;
    }
    else {
        footer = SrpFooter();
    }
    if (h.version != SrpHeader::VERSION_3) {
        footer.verMismatch = true;
    }

    const uint64_t sizeBytes = static_cast<uint64_t>(h.size) + 1;
    const bool aligned = ((h.address % sizeof(uint32_t)) == 0) && ((sizeBytes % sizeof(uint32_t)) == 0);
    if (h.opcode == SRP_OPCODE::READ) {
        ++m_countReadRequests;
        if ((!aligned) || (sizeBytes > MAX_READ_SIZE_BYTES)) {
            footer.reqError = true;
        }
        if (!footer.HasError()) {
            response.m_payload.resize(static_cast<std::size_t>(sizeBytes));
            for (uint64_t offset = 0; offset < sizeBytes; offset += sizeof(uint32_t)) {
                std::map<uint64_t, uint32_t>::const_iterator it = m_registers.find(h.address + offset);
                const uint32_t value = (it == m_registers.cend()) ? 0 : it->second;
                boost::endian::store_little_u32(&response.m_payload[static_cast<std::size_t>(offset)], value);
            }
        }
    }
    else if ((h.opcode == SRP_OPCODE::WRITE) || (h.opcode == SRP_OPCODE::POSTED_WRITE)) {
        if (h.opcode == SRP_OPCODE::WRITE) {
            ++m_countWriteRequests;
        }
        else {
            ++m_countPostedWriteRequests;
        }
        if ((!aligned) || (request.m_payload.size() != sizeBytes)) {
            footer.reqError = true;
        }
        if (!footer.HasError()) {
            for (std::size_t offset = 0; offset < request.m_payload.size(); offset += sizeof(uint32_t)) {
                m_registers[h.address + offset] = boost::endian::load_little_u32(&request.m_payload[offset]);
            }
            if (sendResponse) {
                response.m_payload = request.m_payload; //acked writes echo the data
            }
        }
    }
    else {
        //null request: header and footer only, no register access
        ++m_countNullRequests;
    }
    if (!sendResponse) {
        if (footer.HasError()) {
            LOG_WARNING(subprocess) << "posted SRP write " << h << " not applied: " << footer;
        }
        return false;
    }
    if (footer.HasError()) {
        ++m_countErrorResponses;
        LOG_WARNING(subprocess) << "SRP request " << h << " answered with error " << footer;
    }
    return true;
}
