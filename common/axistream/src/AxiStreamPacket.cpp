/**
 * @file AxiStreamPacket.cpp
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

#include "AxiStreamPacket.h"
#include <cstring>
#include <boost/crc.hpp>
#include <boost/endian/conversion.hpp>

constexpr std::size_t AxiStreamPacket::HEADER_SIZE;
constexpr std::size_t AxiStreamPacket::TAIL_SIZE;
constexpr std::size_t AxiStreamPacket::OVERHEAD_SIZE;
constexpr std::size_t AxiStreamPacket::WORD_SIZE;
constexpr uint8_t AxiStreamPacket::DEFAULT_VERSION;
constexpr uint8_t AxiStreamPacket::DEFAULT_TUSER_FIRST;

std::ostream& operator<<(std::ostream& os, const AXI_STREAM_CRC_TYPE& o) {
    switch (o) {
        case AXI_STREAM_CRC_TYPE::NONE:
            os << "NONE";
            break;
        case AXI_STREAM_CRC_TYPE::PAYLOAD_ONLY:
            os << "PAYLOAD_ONLY";
            break;
        case AXI_STREAM_CRC_TYPE::FULL:
            os << "FULL";
            break;
        default:
            os << "UNKNOWN(" << static_cast<unsigned int>(o) << ")";
            break;
    }
    return os;
}

AxiStreamPacket::AxiStreamPacket() :
    m_version(DEFAULT_VERSION),
    m_crcType(AXI_STREAM_CRC_TYPE::FULL),
    m_tuserFirst(DEFAULT_TUSER_FIRST),
    m_channel(0),
    m_tid(0),
    m_sequence(0),
    m_sof(false),
    m_tuserLast(0),
    m_eof(false),
    m_lastByteCount(0),
    m_crc(0) {}

bool AxiStreamPacket::operator==(const AxiStreamPacket& o) const {
    return (m_version == o.m_version)
        && (m_crcType == o.m_crcType)
        && (m_tuserFirst == o.m_tuserFirst)
        && (m_channel == o.m_channel)
        && (m_tid == o.m_tid)
        && (m_sequence == o.m_sequence)
        && (m_sof == o.m_sof)
        && (m_tuserLast == o.m_tuserLast)
        && (m_eof == o.m_eof)
        && (m_lastByteCount == o.m_lastByteCount)
        && (m_crc == o.m_crc)
        && (m_paddedPayload == o.m_paddedPayload);
}
bool AxiStreamPacket::operator!=(const AxiStreamPacket& o) const {
    return !(*this == o);
}

void AxiStreamPacket::SetPayload(const uint8_t* data, std::size_t size) {
    if (size == 0) {
        m_lastByteCount = 0;
        m_paddedPayload.clear();
        return;
    }
    const std::size_t remainder = size % WORD_SIZE;
    m_lastByteCount = static_cast<uint8_t>((remainder == 0) ? WORD_SIZE : remainder);
    m_paddedPayload.assign(size + (WORD_SIZE - m_lastByteCount), 0);
    memcpy(m_paddedPayload.data(), data, size);
}

std::size_t AxiStreamPacket::GetValidPayloadSize() const {
    if (m_paddedPayload.empty()) {
        return 0;
    }
    return m_paddedPayload.size() - (WORD_SIZE - m_lastByteCount);
}

void AxiStreamPacket::AppendValidPayload(std::vector<uint8_t>& buffer) const {
    buffer.insert(buffer.end(), m_paddedPayload.begin(), m_paddedPayload.begin() + GetValidPayloadSize());
}

uint32_t AxiStreamPacket::ComputeCrc32(const uint8_t* data, std::size_t size) {
    boost::crc_32_type crc;
    crc.process_bytes(data, size);
    return crc.checksum();
}

uint32_t AxiStreamPacket::CalculateCrc() const {
    if (m_crcType == AXI_STREAM_CRC_TYPE::PAYLOAD_ONLY) {
        return ComputeCrc32(m_paddedPayload.data(), m_paddedPayload.size());
    }
    else if (m_crcType == AXI_STREAM_CRC_TYPE::FULL) {
        uint8_t headerBuffer[HEADER_SIZE];
        uint8_t tailBuffer[TAIL_SIZE];
        SerializeHeader(headerBuffer);
        SerializeTail(tailBuffer);
        boost::crc_32_type crc;
        crc.process_bytes(headerBuffer, HEADER_SIZE);
        crc.process_bytes(m_paddedPayload.data(), m_paddedPayload.size());
        crc.process_bytes(tailBuffer, TAIL_SIZE - sizeof(uint32_t)); //all but the crc field
        return crc.checksum();
    }
    return 0;
}

void AxiStreamPacket::SetCrc() {
    m_crc = CalculateCrc();
}

bool AxiStreamPacket::VerifyCrc() const {
    return (CalculateCrc() == m_crc);
}

void AxiStreamPacket::SerializeHeader(uint8_t* headerBuffer) const {
    headerBuffer[0] = static_cast<uint8_t>((static_cast<uint8_t>(m_crcType) << 4) | (m_version & 0x0f));
    headerBuffer[1] = m_tuserFirst;
    headerBuffer[2] = m_channel;
    headerBuffer[3] = m_tid;
    boost::endian::store_little_u16(&headerBuffer[4], m_sequence);
    headerBuffer[6] = 0; //unused
    headerBuffer[7] = (m_sof) ? 0x80 : 0;
}

void AxiStreamPacket::SerializeTail(uint8_t* tailBuffer) const {
    tailBuffer[0] = m_tuserLast;
    tailBuffer[1] = (m_eof) ? 1 : 0;
    boost::endian::store_little_u16(&tailBuffer[2], m_lastByteCount);
    boost::endian::store_big_u32(&tailBuffer[4], m_crc);
}

void AxiStreamPacket::Serialize(std::vector<uint8_t>& serialization) const {
    serialization.resize(OVERHEAD_SIZE + m_paddedPayload.size());
    SerializeHeader(serialization.data());
    if (!m_paddedPayload.empty()) {
        memcpy(&serialization[HEADER_SIZE], m_paddedPayload.data(), m_paddedPayload.size());
    }
    SerializeTail(&serialization[HEADER_SIZE + m_paddedPayload.size()]);
}

bool AxiStreamPacket::Deserialize(const uint8_t* data, std::size_t size) {
    if (size < OVERHEAD_SIZE) {
        return false;
    }
    const std::size_t paddedPayloadSize = size - OVERHEAD_SIZE;
    if (paddedPayloadSize % WORD_SIZE) {
        return false;
    }
    const uint8_t* const tail = data + (size - TAIL_SIZE);
    const uint8_t lastByteCount = static_cast<uint8_t>(boost::endian::load_little_u16(&tail[2]) & 0x0f);
    if (paddedPayloadSize && ((lastByteCount == 0) || (lastByteCount > WORD_SIZE))) {
        return false;
    }

    m_version = data[0] & 0x0f;
    m_crcType = static_cast<AXI_STREAM_CRC_TYPE>(data[0] >> 4);
    m_tuserFirst = data[1];
    m_channel = data[2];
    m_tid = data[3];
    m_sequence = boost::endian::load_little_u16(&data[4]);
    m_sof = ((data[7] & 0x80) != 0);

    m_tuserLast = tail[0];
    m_eof = ((tail[1] & 0x01) != 0);
    m_lastByteCount = lastByteCount;
    m_crc = boost::endian::load_big_u32(&tail[4]);

    m_paddedPayload.assign(data + HEADER_SIZE, data + HEADER_SIZE + paddedPayloadSize);
    return true;
}

std::ostream& operator<<(std::ostream& os, const AxiStreamPacket& o) {
    os << "version=" << static_cast<unsigned int>(o.m_version)
        << " crcType=" << o.m_crcType
        << " tuser=" << static_cast<unsigned int>(o.m_tuserFirst)
        << " channel=" << static_cast<unsigned int>(o.m_channel)
        << " tid=" << static_cast<unsigned int>(o.m_tid)
        << " seq=" << o.m_sequence
        << " sof=" << o.m_sof
        << " tuserLast=" << static_cast<unsigned int>(o.m_tuserLast)
        << " eof=" << o.m_eof
        << " lastByteCnt=" << static_cast<unsigned int>(o.m_lastByteCount)
        << " crc=0x" << std::hex << o.m_crc << std::dec
        << " payloadBytes=" << o.GetValidPayloadSize();
    return os;
}
