/**
 * @file RssiSegment.h
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
 * This RssiSegment class is the bit-exact codec for one RSSI (reliable SSI) segment.
 * A segment is a 4 byte common header (control bits, header length, sequence number,
 * acknowledgment number) followed by either a SYN header (24 bytes total)
 * or a non-SYN header (8 bytes total), followed by the payload.
 * All multi-byte fields are big endian.
 * The 16-bit one's complement checksum covers the header bytes preceding the checksum field.
 */

#ifndef _RSSI_SEGMENT_H
#define _RSSI_SEGMENT_H 1

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include <ostream>
#include <boost/date_time/posix_time/posix_time_duration.hpp>
#include "EnumAsFlagsMacro.h"
#include "rssi_lib_export.h"

enum class RSSI_CONTROL_BITS : uint8_t {
    NONE = 0,
    BUSY = 1 << 0,
    RESERVED1 = 1 << 1,
    RESERVED2 = 1 << 2,
    NUL = 1 << 3,
    RST = 1 << 4,
    EAC = 1 << 5,
    ACK = 1 << 6,
    SYN = 1 << 7
};
MAKE_ENUM_SUPPORT_FLAG_OPERATORS(RSSI_CONTROL_BITS);
MAKE_ENUM_SUPPORT_OSTREAM_OPERATOR(RSSI_CONTROL_BITS);

/// Human readable list of the set control bits, e.g. "ACK|NUL"
RSSI_LIB_EXPORT std::string RssiControlBitsToString(RSSI_CONTROL_BITS controlBits);

/**
 * Synchronization parameters carried by a SYN segment.
 * The four timeouts are in machine units of 10^-minusLog10TimeoutUnit seconds.
 */
struct RssiSynHeader {
    uint8_t version;
    bool checksumEnabled;
    uint8_t maxOutstandingSegments;
    uint16_t maxSegmentSize;
    uint16_t retransmissionTimeout;
    uint16_t cumulativeAckTimeout;
    uint16_t nullTimeout;
    uint8_t maxRetransmissions;
    uint8_t maxCumulativeAcks;
    uint8_t maxOutOfSequenceAcks;
    uint8_t minusLog10TimeoutUnit;
    uint32_t connectionId;

    RSSI_LIB_EXPORT RssiSynHeader();
    RSSI_LIB_EXPORT bool operator==(const RssiSynHeader& o) const;
    RSSI_LIB_EXPORT bool operator!=(const RssiSynHeader& o) const;

    RSSI_LIB_EXPORT static boost::posix_time::time_duration MachineUnitsToDuration(uint16_t machineUnits, uint8_t minusLog10TimeoutUnit);
    RSSI_LIB_EXPORT boost::posix_time::time_duration GetRetransmissionTimeoutDuration() const;
    RSSI_LIB_EXPORT boost::posix_time::time_duration GetCumulativeAckTimeoutDuration() const;
    RSSI_LIB_EXPORT boost::posix_time::time_duration GetNullTimeoutDuration() const;
    RSSI_LIB_EXPORT friend std::ostream& operator<<(std::ostream& os, const RssiSynHeader& o);
};

class RssiSegment {
public:
    static constexpr std::size_t COMMON_HEADER_SIZE = 4;
    static constexpr std::size_t SYN_HEADER_SIZE = 24;
    static constexpr std::size_t NON_SYN_HEADER_SIZE = 8;
    static constexpr uint8_t SYN_VERSION = 1;

    RSSI_LIB_EXPORT RssiSegment();
    RSSI_LIB_EXPORT RssiSegment(const RssiSegment& o);
    RSSI_LIB_EXPORT RssiSegment(RssiSegment&& o);
    RSSI_LIB_EXPORT RssiSegment& operator=(const RssiSegment& o);
    RSSI_LIB_EXPORT RssiSegment& operator=(RssiSegment&& o);
    RSSI_LIB_EXPORT bool operator==(const RssiSegment& o) const;
    RSSI_LIB_EXPORT bool operator!=(const RssiSegment& o) const;

    RSSI_LIB_EXPORT bool IsSyn() const;
    RSSI_LIB_EXPORT bool HasControlBits(RSSI_CONTROL_BITS controlBits) const;
    RSSI_LIB_EXPORT std::size_t GetHeaderSize() const;

    /** Build a SYN segment (header length 24) with the given parameters.
     *
     * The checksum is computed and set.
     */
    RSSI_LIB_EXPORT static RssiSegment MakeSyn(RSSI_CONTROL_BITS controlBits, uint8_t sequenceNumber, uint8_t acknowledgmentNumber, const RssiSynHeader& synHeader);

    /** Build a non-SYN segment (header length 8).
     *
     * @param setChecksum If false, the checksum field is left zero.
     */
    RSSI_LIB_EXPORT static RssiSegment MakeNonSyn(RSSI_CONTROL_BITS controlBits, uint8_t sequenceNumber, uint8_t acknowledgmentNumber,
        const std::vector<uint8_t>& payload, bool setChecksum);

    /** 16-bit one's complement Internet style checksum.
     *
     * Sums big endian 16-bit words (an odd final byte is padded with zero),
     * folds the carries until none remain, and returns the complement.
     */
    RSSI_LIB_EXPORT static uint16_t ComputeChecksum(const uint8_t* data, std::size_t size);
    RSSI_LIB_EXPORT static bool VerifyChecksum(const uint8_t* data, std::size_t size, uint16_t checksum);

    /// Checksum of the serialized header bytes preceding the checksum field
    RSSI_LIB_EXPORT uint16_t CalculateHeaderChecksum() const;
    RSSI_LIB_EXPORT void SetChecksum();
    RSSI_LIB_EXPORT bool VerifyChecksum() const;

    /// Write the header (GetHeaderSize() bytes) into a buffer
    RSSI_LIB_EXPORT void SerializeHeader(uint8_t* headerBuffer) const;
    RSSI_LIB_EXPORT void Serialize(std::vector<uint8_t>& serialization) const;

    /** Decode a received datagram.
     *
     * @return false if the datagram is too short for its fixed header (malformed).
     */
    RSSI_LIB_EXPORT bool Deserialize(const uint8_t* data, std::size_t size);

    RSSI_LIB_EXPORT std::string ToString() const;
    RSSI_LIB_EXPORT friend std::ostream& operator<<(std::ostream& os, const RssiSegment& o);

public:
    RSSI_CONTROL_BITS m_controlBits;
    uint8_t m_headerLength;
    uint8_t m_sequenceNumber;
    uint8_t m_acknowledgmentNumber;
    RssiSynHeader m_synHeader; //only used when SYN is set
    uint16_t m_spare; //only used when SYN is not set
    uint16_t m_checksum;
    std::vector<uint8_t> m_payload;
};

#endif //_RSSI_SEGMENT_H
