/**
 * @file AxiStreamPacket.h
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
 * This AxiStreamPacket class is the codec for one AXI-Stream packetizer (version 2) frame:
 * an 8-byte header, a payload padded to a multiple of 8 bytes, and an 8-byte tail.
 * The logical channel is carried in the TDEST header field.
 * Header and tail integers are little endian except the CRC, which is big endian on the wire.
 */

#ifndef _AXI_STREAM_PACKET_H
#define _AXI_STREAM_PACKET_H 1

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include <ostream>
#include "axistream_lib_export.h"

enum class AXI_STREAM_CRC_TYPE : uint8_t {
    NONE = 0,
    PAYLOAD_ONLY = 1,
    FULL = 2
};
AXISTREAM_LIB_EXPORT std::ostream& operator<<(std::ostream& os, const AXI_STREAM_CRC_TYPE& o);

class AxiStreamPacket {
public:
    static constexpr std::size_t HEADER_SIZE = 8;
    static constexpr std::size_t TAIL_SIZE = 8;
    static constexpr std::size_t OVERHEAD_SIZE = HEADER_SIZE + TAIL_SIZE;
    static constexpr std::size_t WORD_SIZE = 8;
    static constexpr uint8_t DEFAULT_VERSION = 2;
    static constexpr uint8_t DEFAULT_TUSER_FIRST = 2;

    AXISTREAM_LIB_EXPORT AxiStreamPacket();
    AXISTREAM_LIB_EXPORT bool operator==(const AxiStreamPacket& o) const;
    AXISTREAM_LIB_EXPORT bool operator!=(const AxiStreamPacket& o) const;

    /** Copy the payload, zero padding it to a multiple of 8 bytes.
     *
     * Sets m_lastByteCount to the number of valid bytes in the final 8-byte word (0 for an empty payload).
     */
    AXISTREAM_LIB_EXPORT void SetPayload(const uint8_t* data, std::size_t size);
    AXISTREAM_LIB_EXPORT std::size_t GetValidPayloadSize() const;
    /// Append the valid (unpadded) payload bytes to a buffer
    AXISTREAM_LIB_EXPORT void AppendValidPayload(std::vector<uint8_t>& buffer) const;

    /// The zlib-compatible CRC-32 of a byte range
    AXISTREAM_LIB_EXPORT static uint32_t ComputeCrc32(const uint8_t* data, std::size_t size);
    /// The CRC over the region selected by m_crcType (0 for NONE)
    AXISTREAM_LIB_EXPORT uint32_t CalculateCrc() const;
    AXISTREAM_LIB_EXPORT void SetCrc();
    AXISTREAM_LIB_EXPORT bool VerifyCrc() const;

    AXISTREAM_LIB_EXPORT void SerializeHeader(uint8_t* headerBuffer) const;
    AXISTREAM_LIB_EXPORT void SerializeTail(uint8_t* tailBuffer) const;
    AXISTREAM_LIB_EXPORT void Serialize(std::vector<uint8_t>& serialization) const;

    /** Decode one received frame.
     *
     * @return false if the frame is shorter than 16 bytes, its payload is not a multiple of 8 bytes,
     * or its last byte count does not fit the payload (malformed).
     */
    AXISTREAM_LIB_EXPORT bool Deserialize(const uint8_t* data, std::size_t size);

    AXISTREAM_LIB_EXPORT friend std::ostream& operator<<(std::ostream& os, const AxiStreamPacket& o);

public:
    //header
    uint8_t m_version;
    AXI_STREAM_CRC_TYPE m_crcType;
    uint8_t m_tuserFirst;
    uint8_t m_channel; //tdest
    uint8_t m_tid;
    uint16_t m_sequence;
    bool m_sof;
    //tail
    uint8_t m_tuserLast;
    bool m_eof;
    uint8_t m_lastByteCount;
    uint32_t m_crc;

    std::vector<uint8_t> m_paddedPayload;
};

#endif //_AXI_STREAM_PACKET_H
