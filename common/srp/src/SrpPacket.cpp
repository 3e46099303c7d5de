/**
 * @file SrpPacket.cpp
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

#include "SrpPacket.h"
#include <cstring>
#include <boost/endian/conversion.hpp>

constexpr std::size_t SrpHeader::SIZE;
constexpr uint8_t SrpHeader::VERSION_3;
constexpr std::size_t SrpFooter::SIZE;

std::ostream& operator<<(std::ostream& os, const SRP_OPCODE& o) {
    switch (o) {
        case SRP_OPCODE::READ:
            os << "READ";
            break;
        case SRP_OPCODE::WRITE:
            os << "WRITE";
            break;
        case SRP_OPCODE::POSTED_WRITE:
            os << "POSTED_WRITE";
            break;
        case SRP_OPCODE::NULL_REQUEST:
            os << "NULL_REQUEST";
            break;
        default:
            os << "UNKNOWN(" << static_cast<unsigned int>(o) << ")";
            break;
    }
    return os;
}

std::ostream& operator<<(std::ostream& os, const SRP_REQUEST_RESULT& o) {
    static const char* const names[] = {
        "SUCCESS", "DISCONNECTED", "TIMEOUT_ERROR", "EOF_ERROR", "FRAME_ERROR", "VERSION_MISMATCH",
        "REQUEST_ERROR", "MEMORY_BUS_ERROR", "LOCAL_TIMEOUT", "NOT_CONNECTED_OR_BUSY"
    };
    const unsigned int index = static_cast<unsigned int>(o);
    if (index < (sizeof(names) / sizeof(names[0]))) {
        os << names[index];
    }
    else {
        os << "UNKNOWN(" << index << ")";
    }
    return os;
}

SrpHeader::SrpHeader() :
    version(VERSION_3),
    opcode(SRP_OPCODE::NULL_REQUEST),
    unalignedAccess(false),
    byteAccess(false),
    writeSupported(false),
    readSupported(false),
    ignoreMemResp(false),
    prot(0),
    timeoutCount(0),
    transactionId(0),
    address(0),
    size(0) {}

bool SrpHeader::operator==(const SrpHeader& o) const {
    return (version == o.version)
        && (opcode == o.opcode)
        && (unalignedAccess == o.unalignedAccess)
        && (byteAccess == o.byteAccess)
        && (writeSupported == o.writeSupported)
        && (readSupported == o.readSupported)
        && (ignoreMemResp == o.ignoreMemResp)
        && (prot == o.prot)
        && (timeoutCount == o.timeoutCount)
        && (transactionId == o.transactionId)
        && (address == o.address)
        && (size == o.size);
}
bool SrpHeader::operator!=(const SrpHeader& o) const {
    return !(*this == o);
}

void SrpHeader::Serialize(uint8_t* buffer) const {
    buffer[0] = version;
    buffer[1] = static_cast<uint8_t>(
        ((ignoreMemResp) ? (1u << 6) : 0u)
        | ((readSupported) ? (1u << 5) : 0u)
        | ((writeSupported) ? (1u << 4) : 0u)
        | ((byteAccess) ? (1u << 3) : 0u)
        | ((unalignedAccess) ? (1u << 2) : 0u)
        | (static_cast<uint8_t>(opcode) & 0x3));
    buffer[2] = static_cast<uint8_t>(prot << 6);
    buffer[3] = timeoutCount;
    boost::endian::store_little_u32(&buffer[4], transactionId);
    boost::endian::store_little_u64(&buffer[8], address);
    boost::endian::store_little_u32(&buffer[16], size);
}

void SrpHeader::Deserialize(const uint8_t* buffer) {
    version = buffer[0];
    const uint8_t opAccIgn = buffer[1];
    opcode = static_cast<SRP_OPCODE>(opAccIgn & 0x3);
    unalignedAccess = ((opAccIgn >> 2) & 1) != 0;
    byteAccess = ((opAccIgn >> 3) & 1) != 0;
    writeSupported = ((opAccIgn >> 4) & 1) != 0;
    readSupported = ((opAccIgn >> 5) & 1) != 0;
    ignoreMemResp = ((opAccIgn >> 6) & 1) != 0;
    prot = (buffer[2] & 0xc0) >> 6;
    timeoutCount = buffer[3];
    transactionId = boost::endian::load_little_u32(&buffer[4]);
    address = boost::endian::load_little_u64(&buffer[8]);
    size = boost::endian::load_little_u32(&buffer[16]);
}

std::ostream& operator<<(std::ostream& os, const SrpHeader& o) {
    os << "version=" << static_cast<unsigned int>(o.version)
        << " opcode=" << o.opcode
        << " tid=0x" << std::hex << o.transactionId
        << " addr=0x" << o.address << std::dec
        << " size=" << o.size
        << " timeoutCnt=" << static_cast<unsigned int>(o.timeoutCount);
    if (o.ignoreMemResp) {
        os << " ignoreMemResp";
    }
    return os;
}

SrpFooter::SrpFooter() :
    memBusResp(0),
    timeout(false),
    eofe(false),
    frameError(false),
    verMismatch(false),
    reqError(false) {}

bool SrpFooter::operator==(const SrpFooter& o) const {
    return (memBusResp == o.memBusResp)
        && (timeout == o.timeout)
        && (eofe == o.eofe)
        && (frameError == o.frameError)
        && (verMismatch == o.verMismatch)
        && (reqError == o.reqError);
}
bool SrpFooter::operator!=(const SrpFooter& o) const {
    return !(*this == o);
}

void SrpFooter::Serialize(uint8_t* buffer) const {
    buffer[0] = memBusResp;
    buffer[1] = static_cast<uint8_t>(
        ((timeout) ? (1u << 0) : 0u)
        | ((eofe) ? (1u << 1) : 0u)
        | ((frameError) ? (1u << 2) : 0u)
        | ((verMismatch) ? (1u << 3) : 0u)
        | ((reqError) ? (1u << 4) : 0u));
    buffer[2] = 0; //reserved
    buffer[3] = 0;
}

void SrpFooter::Deserialize(const uint8_t* buffer) {
    memBusResp = buffer[0];
    const uint8_t flags = buffer[1];
    timeout = (flags & 0x01) != 0;
    eofe = (flags & 0x02) != 0;
    frameError = (flags & 0x04) != 0;
    verMismatch = (flags & 0x08) != 0;
    reqError = (flags & 0x10) != 0;
}

bool SrpFooter::HasError() const {
    return (ToRequestResult() != SRP_REQUEST_RESULT::SUCCESS);
}

SRP_REQUEST_RESULT SrpFooter::ToRequestResult() const {
    if (timeout) {
        return SRP_REQUEST_RESULT::TIMEOUT_ERROR;
    }
    if (eofe) {
        return SRP_REQUEST_RESULT::EOF_ERROR;
    }
    if (frameError) {
        return SRP_REQUEST_RESULT::FRAME_ERROR;
    }
    if (verMismatch) {
        return SRP_REQUEST_RESULT::VERSION_MISMATCH;
    }
    if (reqError) {
        return SRP_REQUEST_RESULT::REQUEST_ERROR;
    }
    if (memBusResp) {
        return SRP_REQUEST_RESULT::MEMORY_BUS_ERROR;
    }
    return SRP_REQUEST_RESULT::SUCCESS;
}

std::ostream& operator<<(std::ostream& os, const SrpFooter& o) {
    os << "memBusResp=" << static_cast<unsigned int>(o.memBusResp);
    if (o.timeout) {
        os << " timeout";
    }
    if (o.eofe) {
        os << " eofe";
    }
    if (o.frameError) {
        os << " frameError";
    }
    if (o.verMismatch) {
        os << " verMismatch";
    }
    if (o.reqError) {
        os << " reqError";
    }
    return os;
}

SrpPacket::SrpPacket() : m_hasFooter(false) {}

bool SrpPacket::operator==(const SrpPacket& o) const {
    if ((m_header != o.m_header) || (m_payload != o.m_payload) || (m_hasFooter != o.m_hasFooter)) {
        return false;
    }
    return (!m_hasFooter) || (m_footer == o.m_footer);
}
bool SrpPacket::operator!=(const SrpPacket& o) const {
    return !(*this == o);
}

void SrpPacket::Serialize(std::vector<uint8_t>& serialization) const {
    serialization.resize(SrpHeader::SIZE + m_payload.size() + ((m_hasFooter) ? SrpFooter::SIZE : 0));
    m_header.Serialize(serialization.data());
    if (!m_payload.empty()) {
        memcpy(&serialization[SrpHeader::SIZE], m_payload.data(), m_payload.size());
    }
    if (m_hasFooter) {
        m_footer.Serialize(&serialization[SrpHeader::SIZE + m_payload.size()]);
    }
}

bool SrpPacket::DeserializeRequest(const uint8_t* data, std::size_t size) {
    if (size < SrpHeader::SIZE) {
        return false;
    }
    m_header.Deserialize(data);
    m_payload.assign(data + SrpHeader::SIZE, data + size);
    m_hasFooter = false;
    m_footer = SrpFooter();
    return true;
}

bool SrpPacket::DeserializeResponse(const uint8_t* data, std::size_t size) {
    if (size < (SrpHeader::SIZE + SrpFooter::SIZE)) {
        return false;
    }
    m_header.Deserialize(data);
    m_payload.assign(data + SrpHeader::SIZE, data + (size - SrpFooter::SIZE));
    m_hasFooter = true;
    m_footer.Deserialize(data + (size - SrpFooter::SIZE));
    return true;
}

std::ostream& operator<<(std::ostream& os, const SrpPacket& o) {
    os << o.m_header << " payloadBytes=" << o.m_payload.size();
    if (o.m_hasFooter) {
        os << " footer(" << o.m_footer << ")";
    }
    return os;
}
