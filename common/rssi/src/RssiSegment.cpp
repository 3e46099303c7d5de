/**
 * @file RssiSegment.cpp
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

#include "RssiSegment.h"
#include <sstream>
#include <cstring>
#include <boost/endian/conversion.hpp>

constexpr std::size_t RssiSegment::COMMON_HEADER_SIZE;
constexpr std::size_t RssiSegment::SYN_HEADER_SIZE;
constexpr std::size_t RssiSegment::NON_SYN_HEADER_SIZE;
constexpr uint8_t RssiSegment::SYN_VERSION;

static const char* const CONTROL_BIT_NAMES[8] = { "BUSY", "RESERVED1", "RESERVED2", "NUL", "RST", "EAC", "ACK", "SYN" };

std::string RssiControlBitsToString(RSSI_CONTROL_BITS controlBits) {
    std::string s;
    const uint8_t bits = static_cast<uint8_t>(controlBits);
    for (int i = 7; i >= 0; --i) { //most significant first
        if (bits & (1u << i)) {
            if (!s.empty()) {
                s.push_back('|');
            }
            s += CONTROL_BIT_NAMES[i];
        }
    }
    if (s.empty()) {
        s = "NONE";
    }
    return s;
}

RssiSynHeader::RssiSynHeader() :
    version(RssiSegment::SYN_VERSION),
    checksumEnabled(false),
    maxOutstandingSegments(0),
    maxSegmentSize(0),
    retransmissionTimeout(0),
    cumulativeAckTimeout(0),
    nullTimeout(0),
    maxRetransmissions(0),
    maxCumulativeAcks(0),
    maxOutOfSequenceAcks(0),
    minusLog10TimeoutUnit(0),
    connectionId(0) {}

bool RssiSynHeader::operator==(const RssiSynHeader& o) const {
    return (version == o.version)
        && (checksumEnabled == o.checksumEnabled)
        && (maxOutstandingSegments == o.maxOutstandingSegments)
        && (maxSegmentSize == o.maxSegmentSize)
        && (retransmissionTimeout == o.retransmissionTimeout)
        && (cumulativeAckTimeout == o.cumulativeAckTimeout)
        && (nullTimeout == o.nullTimeout)
        && (maxRetransmissions == o.maxRetransmissions)
        && (maxCumulativeAcks == o.maxCumulativeAcks)
        && (maxOutOfSequenceAcks == o.maxOutOfSequenceAcks)
        && (minusLog10TimeoutUnit == o.minusLog10TimeoutUnit)
        && (connectionId == o.connectionId);
}
bool RssiSynHeader::operator!=(const RssiSynHeader& o) const {
    return !(*this == o);
}

boost::posix_time::time_duration RssiSynHeader::MachineUnitsToDuration(uint16_t machineUnits, uint8_t minusLog10TimeoutUnit) {
    //microsecond resolution
    int64_t us = machineUnits;
    if (minusLog10TimeoutUnit <= 6) {
        for (unsigned int i = minusLog10TimeoutUnit; i < 6; ++i) {
            us *= 10;
        }
    }
    else {
        for (unsigned int i = 6; i < minusLog10TimeoutUnit; ++i) {
            us /= 10;
        }
    }
    return boost::posix_time::microseconds(us);
}
boost::posix_time::time_duration RssiSynHeader::GetRetransmissionTimeoutDuration() const {
    return MachineUnitsToDuration(retransmissionTimeout, minusLog10TimeoutUnit);
}
boost::posix_time::time_duration RssiSynHeader::GetCumulativeAckTimeoutDuration() const {
    return MachineUnitsToDuration(cumulativeAckTimeout, minusLog10TimeoutUnit);
}
boost::posix_time::time_duration RssiSynHeader::GetNullTimeoutDuration() const {
    return MachineUnitsToDuration(nullTimeout, minusLog10TimeoutUnit);
}

std::ostream& operator<<(std::ostream& os, const RssiSynHeader& o) {
    os << "version=" << static_cast<unsigned int>(o.version)
        << " chk=" << o.checksumEnabled
        << " maxOutSegs=" << static_cast<unsigned int>(o.maxOutstandingSegments)
        << " mss=" << o.maxSegmentSize
        << " retrTO=" << o.retransmissionTimeout
        << " cumAckTO=" << o.cumulativeAckTimeout
        << " nullTO=" << o.nullTimeout
        << " maxRetrans=" << static_cast<unsigned int>(o.maxRetransmissions)
        << " maxCumAcks=" << static_cast<unsigned int>(o.maxCumulativeAcks)
        << " maxOutOfSeq=" << static_cast<unsigned int>(o.maxOutOfSequenceAcks)
        << " unit=1e-" << static_cast<unsigned int>(o.minusLog10TimeoutUnit)
        << " connId=" << o.connectionId;
    return os;
}

RssiSegment::RssiSegment() :
    m_controlBits(RSSI_CONTROL_BITS::NONE),
    m_headerLength(static_cast<uint8_t>(NON_SYN_HEADER_SIZE)),
    m_sequenceNumber(0),
    m_acknowledgmentNumber(0),
    m_spare(0),
    m_checksum(0) {}

RssiSegment::RssiSegment(const RssiSegment& o) :
    m_controlBits(o.m_controlBits),
    m_headerLength(o.m_headerLength),
    m_sequenceNumber(o.m_sequenceNumber),
    m_acknowledgmentNumber(o.m_acknowledgmentNumber),
    m_synHeader(o.m_synHeader),
    m_spare(o.m_spare),
    m_checksum(o.m_checksum),
    m_payload(o.m_payload) {}

RssiSegment::RssiSegment(RssiSegment&& o) :
    m_controlBits(o.m_controlBits),
    m_headerLength(o.m_headerLength),
    m_sequenceNumber(o.m_sequenceNumber),
    m_acknowledgmentNumber(o.m_acknowledgmentNumber),
    m_synHeader(o.m_synHeader),
    m_spare(o.m_spare),
    m_checksum(o.m_checksum),
    m_payload(std::move(o.m_payload)) {}

RssiSegment& RssiSegment::operator=(const RssiSegment& o) {
    m_controlBits = o.m_controlBits;
    m_headerLength = o.m_headerLength;
    m_sequenceNumber = o.m_sequenceNumber;
    m_acknowledgmentNumber = o.m_acknowledgmentNumber;
    m_synHeader = o.m_synHeader;
    m_spare = o.m_spare;
    m_checksum = o.m_checksum;
    m_payload = o.m_payload;
    return *this;
}

RssiSegment& RssiSegment::operator=(RssiSegment&& o) {
    m_controlBits = o.m_controlBits;
    m_headerLength = o.m_headerLength;
    m_sequenceNumber = o.m_sequenceNumber;
    m_acknowledgmentNumber = o.m_acknowledgmentNumber;
    m_synHeader = o.m_synHeader;
    m_spare = o.m_spare;
    m_checksum = o.m_checksum;
    m_payload = std::move(o.m_payload);
    return *this;
}

bool RssiSegment::operator==(const RssiSegment& o) const {
    if ((m_controlBits != o.m_controlBits)
        || (m_headerLength != o.m_headerLength)
        || (m_sequenceNumber != o.m_sequenceNumber)
        || (m_acknowledgmentNumber != o.m_acknowledgmentNumber)
        || (m_checksum != o.m_checksum)
        || (m_payload != o.m_payload))
    {
        return false;
    }
    if (IsSyn()) {
        return (m_synHeader == o.m_synHeader);
    }
    return (m_spare == o.m_spare);
}
bool RssiSegment::operator!=(const RssiSegment& o) const {
    return !(*this == o);
}

bool RssiSegment::IsSyn() const {
    return HasAnyFlag(m_controlBits, RSSI_CONTROL_BITS::SYN);
}

bool RssiSegment::HasControlBits(RSSI_CONTROL_BITS controlBits) const {
    return (m_controlBits & controlBits) == controlBits;
}

std::size_t RssiSegment::GetHeaderSize() const {
    return (IsSyn()) ? SYN_HEADER_SIZE : NON_SYN_HEADER_SIZE;
}

RssiSegment RssiSegment::MakeSyn(RSSI_CONTROL_BITS controlBits, uint8_t sequenceNumber, uint8_t acknowledgmentNumber, const RssiSynHeader& synHeader) {
    RssiSegment seg;
    seg.m_controlBits = controlBits | RSSI_CONTROL_BITS::SYN;
    seg.m_headerLength = static_cast<uint8_t>(SYN_HEADER_SIZE);
    seg.m_sequenceNumber = sequenceNumber;
    seg.m_acknowledgmentNumber = acknowledgmentNumber;
    seg.m_synHeader = synHeader;
    seg.SetChecksum();
    return seg;
}

RssiSegment RssiSegment::MakeNonSyn(RSSI_CONTROL_BITS controlBits, uint8_t sequenceNumber, uint8_t acknowledgmentNumber,
    const std::vector<uint8_t>& payload, bool setChecksum)
{
    RssiSegment seg;
    seg.m_controlBits = controlBits & (~RSSI_CONTROL_BITS::SYN);
    seg.m_headerLength = static_cast<uint8_t>(NON_SYN_HEADER_SIZE);
    seg.m_sequenceNumber = sequenceNumber;
    seg.m_acknowledgmentNumber = acknowledgmentNumber;
    seg.m_payload = payload;
    if (setChecksum) {
        seg.SetChecksum();
    }
    return seg;
}

uint16_t RssiSegment::ComputeChecksum(const uint8_t* data, std::size_t size) {
    uint32_t sum = 0;
    const std::size_t sizeEven = size & (~static_cast<std::size_t>(1));
    for (std::size_t i = 0; i < sizeEven; i += 2) {
        sum += boost::endian::load_big_u16(&data[i]);
        sum = (sum & 0xffff) + (sum >> 16);
    }
    if (size & 1) {
        sum += static_cast<uint32_t>(data[size - 1]) << 8; //pad with zero
    }
    while (sum >> 16) {
        sum = (sum & 0xffff) + (sum >> 16);
    }
    return static_cast<uint16_t>((~sum) & 0xffff);
}

bool RssiSegment::VerifyChecksum(const uint8_t* data, std::size_t size, uint16_t checksum) {
    return (ComputeChecksum(data, size) == checksum);
}

uint16_t RssiSegment::CalculateHeaderChecksum() const {
    uint8_t headerBuffer[SYN_HEADER_SIZE];
    SerializeHeader(headerBuffer);
    return ComputeChecksum(headerBuffer, GetHeaderSize() - sizeof(uint16_t));
}

void RssiSegment::SetChecksum() {
    m_checksum = CalculateHeaderChecksum();
}

bool RssiSegment::VerifyChecksum() const {
    return (CalculateHeaderChecksum() == m_checksum);
}

void RssiSegment::SerializeHeader(uint8_t* headerBuffer) const {
    headerBuffer[0] = static_cast<uint8_t>(m_controlBits);
    headerBuffer[1] = m_headerLength;
    headerBuffer[2] = m_sequenceNumber;
    headerBuffer[3] = m_acknowledgmentNumber;
    if (IsSyn()) {
        const RssiSynHeader& h = m_synHeader;
        headerBuffer[4] = static_cast<uint8_t>((h.version << 4) | (1u << 3) | ((h.checksumEnabled) ? (1u << 2) : 0u));
        headerBuffer[5] = h.maxOutstandingSegments;
        boost::endian::store_big_u16(&headerBuffer[6], h.maxSegmentSize);
        boost::endian::store_big_u16(&headerBuffer[8], h.retransmissionTimeout);
        boost::endian::store_big_u16(&headerBuffer[10], h.cumulativeAckTimeout);
        boost::endian::store_big_u16(&headerBuffer[12], h.nullTimeout);
        headerBuffer[14] = h.maxRetransmissions;
        headerBuffer[15] = h.maxCumulativeAcks;
        headerBuffer[16] = h.maxOutOfSequenceAcks;
        headerBuffer[17] = h.minusLog10TimeoutUnit;
        boost::endian::store_big_u32(&headerBuffer[18], h.connectionId);
        boost::endian::store_big_u16(&headerBuffer[22], m_checksum);
    }
    else {
        boost::endian::store_big_u16(&headerBuffer[4], m_spare);
        boost::endian::store_big_u16(&headerBuffer[6], m_checksum);
    }
}

void RssiSegment::Serialize(std::vector<uint8_t>& serialization) const {
    const std::size_t headerSize = GetHeaderSize();
    serialization.resize(headerSize + m_payload.size());
    SerializeHeader(serialization.data());
    if (!m_payload.empty()) {
        memcpy(&serialization[headerSize], m_payload.data(), m_payload.size());
    }
}

bool RssiSegment::Deserialize(const uint8_t* data, std::size_t size) {
    if (size < COMMON_HEADER_SIZE) {
        return false;
    }
    m_controlBits = static_cast<RSSI_CONTROL_BITS>(data[0]);
    const std::size_t headerSize = GetHeaderSize();
    if (size < headerSize) {
        return false;
    }
    m_headerLength = data[1];
    m_sequenceNumber = data[2];
    m_acknowledgmentNumber = data[3];
    if (IsSyn()) {
        RssiSynHeader& h = m_synHeader;
        h.version = data[4] >> 4;
        h.checksumEnabled = ((data[4] >> 2) & 1) != 0;
        h.maxOutstandingSegments = data[5];
        h.maxSegmentSize = boost::endian::load_big_u16(&data[6]);
        h.retransmissionTimeout = boost::endian::load_big_u16(&data[8]);
        h.cumulativeAckTimeout = boost::endian::load_big_u16(&data[10]);
        h.nullTimeout = boost::endian::load_big_u16(&data[12]);
        h.maxRetransmissions = data[14];
        h.maxCumulativeAcks = data[15];
        h.maxOutOfSequenceAcks = data[16];
        h.minusLog10TimeoutUnit = data[17];
        h.connectionId = boost::endian::load_big_u32(&data[18]);
        m_checksum = boost::endian::load_big_u16(&data[22]);
        m_spare = 0;
    }
    else {
        m_spare = boost::endian::load_big_u16(&data[4]);
        m_checksum = boost::endian::load_big_u16(&data[6]);
    }
    m_payload.assign(data + headerSize, data + size);
    return true;
}

std::string RssiSegment::ToString() const {
    std::ostringstream oss;
    oss << *this;
    return oss.str();
}

std::ostream& operator<<(std::ostream& os, const RssiSegment& o) {
    os << "[" << RssiControlBitsToString(o.m_controlBits)
        << "] seq=" << static_cast<unsigned int>(o.m_sequenceNumber)
        << " ack=" << static_cast<unsigned int>(o.m_acknowledgmentNumber)
        << " payloadLen=" << o.m_payload.size();
    if (o.IsSyn()) {
        os << " {" << o.m_synHeader << "}";
    }
    return os;
}
