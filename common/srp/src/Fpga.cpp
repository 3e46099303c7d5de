/**
 * @file Fpga.cpp
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

#include "Fpga.h"
#include "Logger.h"
#include <boost/endian/conversion.hpp>

static constexpr srplink::Logger::SubProcess subprocess = srplink::Logger::SubProcess::fpga;

constexpr unsigned int Fpga::RETRY_COUNT;
constexpr unsigned int Fpga::DEFAULT_REQUEST_TIMEOUT_MILLISECONDS;
constexpr unsigned int Fpga::DEFAULT_CONNECT_TIMEOUT_MILLISECONDS;

RegisterAccessInterface::~RegisterAccessInterface() {}

Fpga::Fpga(const RssiConfig& rssiConfig, const SrpClient::StreamCallback_t& streamCallback, uint16_t remoteUdpPort,
    unsigned int requestTimeoutMilliseconds, unsigned int connectTimeoutMilliseconds) :
    m_srpClient(rssiConfig, streamCallback, remoteUdpPort),
    M_REQUEST_TIMEOUT_MILLISECONDS(requestTimeoutMilliseconds),
    M_CONNECT_TIMEOUT_MILLISECONDS(connectTimeoutMilliseconds) {}

Fpga::~Fpga() {}

bool Fpga::Connect(const std::string& remoteHostname, uint16_t localUdpPort) {
    if (!m_srpClient.ConnectAndStart(remoteHostname, localUdpPort)) {
        LOG_ERROR(subprocess) << "unable to start connection to " << remoteHostname;
        return false;
    }
    if (!m_srpClient.WaitConnected(M_CONNECT_TIMEOUT_MILLISECONDS)) {
        LOG_ERROR(subprocess) << "unable to connect to " << remoteHostname;
        return false;
    }
    return true;
}

SrpClient& Fpga::GetSrpClient() {
    return m_srpClient;
}

bool Fpga::ShouldRetry(SRP_REQUEST_RESULT result, unsigned int attempt) {
    if (result != SRP_REQUEST_RESULT::DISCONNECTED) {
        return false;
    }
    if ((attempt + 1) >= RETRY_COUNT) {
        return false;
    }
    LOG_ERROR(subprocess) << "Disconnected, reconnecting (try " << (attempt + 1) << " of " << RETRY_COUNT << ").";
    if (!m_srpClient.Reconnect(M_CONNECT_TIMEOUT_MILLISECONDS)) {
        LOG_WARNING(subprocess) << "reconnect attempt " << (attempt + 1) << " failed";
    }
    return true;
}

bool Fpga::ReadWord(uint64_t address, uint32_t& value) {
    std::vector<uint32_t> values;
    if (!ReadWords(address, 1, values)) {
        return false;
    }
    value = values[0];
    return true;
}

bool Fpga::ReadWords(uint64_t address, std::size_t count, std::vector<uint32_t>& values) {
    values.clear();
    if (count == 0) {
        return true;
    }
    std::vector<uint8_t> bytes;
    SRP_REQUEST_RESULT result = SRP_REQUEST_RESULT::DISCONNECTED;
    for (unsigned int attempt = 0; attempt < RETRY_COUNT; ++attempt) {
        result = m_srpClient.Read(address, static_cast<uint32_t>(count * sizeof(uint32_t)), bytes, M_REQUEST_TIMEOUT_MILLISECONDS);
        if (!ShouldRetry(result, attempt)) {
            break;
        }
    }
    if (result == SRP_REQUEST_RESULT::DISCONNECTED) {
        LOG_ERROR(subprocess) << "Maximum reconnect count exceeded, aborting.";
        return false;
    }
    if (result != SRP_REQUEST_RESULT::SUCCESS) {
        LOG_ERROR(subprocess) << "read of " << count << " words at 0x" << std::hex << address << std::dec << " failed: " << result;
        return false;
    }
    if (bytes.size() != (count * sizeof(uint32_t))) {
        LOG_ERROR(subprocess) << "read of " << count << " words at 0x" << std::hex << address << std::dec
            << " returned " << bytes.size() << " bytes";
        return false;
    }
    LittleEndianBytesToWords(bytes, values);
    return true;
}

bool Fpga::WriteWord(uint64_t address, uint32_t value) {
    return WriteWords(address, std::vector<uint32_t>(1, value));
}

bool Fpga::WriteWords(uint64_t address, const std::vector<uint32_t>& values) {
    if (values.empty()) {
        return true;
    }
    std::vector<uint8_t> bytes;
    WordsToLittleEndianBytes(values, bytes);
    SRP_REQUEST_RESULT result = SRP_REQUEST_RESULT::DISCONNECTED;
    for (unsigned int attempt = 0; attempt < RETRY_COUNT; ++attempt) {
        result = m_srpClient.Write(address, bytes, false, M_REQUEST_TIMEOUT_MILLISECONDS);
        if (!ShouldRetry(result, attempt)) {
            break;
        }
    }
    if (result == SRP_REQUEST_RESULT::DISCONNECTED) {
        LOG_ERROR(subprocess) << "Maximum reconnect count exceeded, aborting.";
        return false;
    }
    if (result != SRP_REQUEST_RESULT::SUCCESS) {
        LOG_ERROR(subprocess) << "write of " << values.size() << " words at 0x" << std::hex << address << std::dec << " failed: " << result;
        return false;
    }
    return true;
}

void Fpga::LittleEndianBytesToWords(const std::vector<uint8_t>& bytes, std::vector<uint32_t>& words) {
    words.resize(bytes.size() / sizeof(uint32_t));
    for (std::size_t i = 0; i < words.size(); ++i) {
        words[i] = boost::endian::load_little_u32(&bytes[i * sizeof(uint32_t)]);
    }
}

void Fpga::WordsToLittleEndianBytes(const std::vector<uint32_t>& words, std::vector<uint8_t>& bytes) {
    bytes.resize(words.size() * sizeof(uint32_t));
    for (std::size_t i = 0; i < words.size(); ++i) {
        boost::endian::store_little_u32(&bytes[i * sizeof(uint32_t)], words[i]);
    }
}
