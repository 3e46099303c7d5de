/**
 * @file SrpV3Connection.h
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
 * This SrpV3Connection class encodes SRPv3 read and write requests onto one
 * AXI-Stream channel and decodes the responses arriving on that channel.
 * It performs no request/response matching; see SrpClient for the blocking layer.
 */

#ifndef _SRP_V3_CONNECTION_H
#define _SRP_V3_CONNECTION_H 1

#include <cstdint>
#include <vector>
#include <atomic>
#include <boost/thread.hpp>
#include <boost/function.hpp>
#include "AxiStreamPacketConnection.h"
#include "SrpPacket.h"
#include "srp_lib_export.h"

class SrpV3Connection {
public:
    typedef boost::function<void(SrpPacket& responsePacket)> PacketCallback_t;

    static constexpr uint32_t INITIAL_TRANSACTION_ID = 0x5a0d;

    /// Registers itself as the callback of the given channel
    SRP_LIB_EXPORT SrpV3Connection(AxiStreamPacketConnection& axiStreamPacketConnection, uint8_t channel, const PacketCallback_t& packetCallback);
    SRP_LIB_EXPORT ~SrpV3Connection();

    /** Send a read request for sizeBytes bytes (the header size field carries sizeBytes - 1).
     *
     * @param transactionIdUsed Set to the transaction id of the request.
     * @return False if sizeBytes is zero or the AXI-Stream connection rejected the send.
     */
    SRP_LIB_EXPORT bool SendReadRequest(uint64_t address, uint32_t sizeBytes, uint32_t& transactionIdUsed);
    SRP_LIB_EXPORT bool SendWriteRequest(uint64_t address, const std::vector<uint8_t>& data, bool posted, uint32_t& transactionIdUsed);

    SRP_LIB_EXPORT uint8_t GetChannel() const;

private:
    SRP_LIB_NO_EXPORT bool SendRequest(SrpPacket& packet, uint32_t& transactionIdUsed);
    SRP_LIB_NO_EXPORT void OnChannelMessage(std::vector<uint8_t>& movableMessage);

    AxiStreamPacketConnection& m_axiStreamPacketConnection;
    const uint8_t M_CHANNEL;
    const PacketCallback_t m_packetCallback;

    boost::mutex m_sendMutex;
    uint32_t m_nextTransactionId;
    std::vector<uint8_t> m_requestSerialization;

public:
    //stats
    std::atomic<uint64_t> m_countRequestsSent;
    std::atomic<uint64_t> m_countResponsesReceived;
    std::atomic<uint64_t> m_countMalformedResponses;
};

#endif //_SRP_V3_CONNECTION_H
