/**
 * @file SrpPacket.h
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
 * SRPv3 (Streaming Register Protocol version 3) packet codec.
 * Every packet starts with a 20-byte little endian header.
 * Write requests and non-posted responses carry a payload.
 * Responses end with a 4-byte footer holding the memory bus response and error flags.
 */

#ifndef _SRP_PACKET_H
#define _SRP_PACKET_H 1

#include <cstdint>
#include <cstddef>
#include <vector>
#include <ostream>
#include "srp_lib_export.h"

enum class SRP_OPCODE : uint8_t {
    READ = 0,
    WRITE = 1,
    POSTED_WRITE = 2,
    NULL_REQUEST = 3
};
SRP_LIB_EXPORT std::ostream& operator<<(std::ostream& os, const SRP_OPCODE& o);

enum class SRP_REQUEST_RESULT {
    SUCCESS = 0,
    DISCONNECTED,
    TIMEOUT_ERROR,
    EOF_ERROR,
    FRAME_ERROR,
    VERSION_MISMATCH,
    REQUEST_ERROR,
    MEMORY_BUS_ERROR,
    LOCAL_TIMEOUT,
    NOT_CONNECTED_OR_BUSY
};
SRP_LIB_EXPORT std::ostream& operator<<(std::ostream& os, const SRP_REQUEST_RESULT& o);

struct SrpHeader {
    static constexpr std::size_t SIZE = 20;
    static constexpr uint8_t VERSION_3 = 3;

    uint8_t version;
    SRP_OPCODE opcode;
    //support field
    bool unalignedAccess;
    bool byteAccess;
    bool writeSupported;
    bool readSupported;
    bool ignoreMemResp;
    uint8_t prot;
    uint8_t timeoutCount;
    uint32_t transactionId;
    uint64_t address;
    uint32_t size; //number of bytes minus one

    SRP_LIB_EXPORT SrpHeader();
    SRP_LIB_EXPORT bool operator==(const SrpHeader& o) const;
    SRP_LIB_EXPORT bool operator!=(const SrpHeader& o) const;
    SRP_LIB_EXPORT void Serialize(uint8_t* buffer) const;
    SRP_LIB_EXPORT void Deserialize(const uint8_t* buffer);
    SRP_LIB_EXPORT friend std::ostream& operator<<(std::ostream& os, const SrpHeader& o);
};

struct SrpFooter {
    static constexpr std::size_t SIZE = 4;

    uint8_t memBusResp;
    bool timeout;
    bool eofe;
    bool frameError;
    bool verMismatch;
    bool reqError;

    SRP_LIB_EXPORT SrpFooter();
    SRP_LIB_EXPORT bool operator==(const SrpFooter& o) const;
    SRP_LIB_EXPORT bool operator!=(const SrpFooter& o) const;
    SRP_LIB_EXPORT void Serialize(uint8_t* buffer) const;
    SRP_LIB_EXPORT void Deserialize(const uint8_t* buffer);
    SRP_LIB_EXPORT bool HasError() const;
    /// Map the error flags (first match in priority order: timeout, eofe, frameError, verMismatch, reqError, memBusResp) to a result
    SRP_LIB_EXPORT SRP_REQUEST_RESULT ToRequestResult() const;
    SRP_LIB_EXPORT friend std::ostream& operator<<(std::ostream& os, const SrpFooter& o);
};

class SrpPacket {
public:
    SRP_LIB_EXPORT SrpPacket();
    SRP_LIB_EXPORT bool operator==(const SrpPacket& o) const;
    SRP_LIB_EXPORT bool operator!=(const SrpPacket& o) const;

    /// Serialize header, payload and (when m_hasFooter) footer
    SRP_LIB_EXPORT void Serialize(std::vector<uint8_t>& serialization) const;

    /** Decode a request (header then payload).
     *
     * @return false if shorter than the header.
     */
    SRP_LIB_EXPORT bool DeserializeRequest(const uint8_t* data, std::size_t size);

    /** Decode a response (header, payload, footer).
     *
     * @return false if shorter than header plus footer.
     */
    SRP_LIB_EXPORT bool DeserializeResponse(const uint8_t* data, std::size_t size);

    SRP_LIB_EXPORT friend std::ostream& operator<<(std::ostream& os, const SrpPacket& o);

public:
    SrpHeader m_header;
    std::vector<uint8_t> m_payload;
    bool m_hasFooter;
    SrpFooter m_footer;
};

#endif //_SRP_PACKET_H
