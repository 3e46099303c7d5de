/**
 * @file FpgaSimulator.h
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
 * This FpgaSimulator class is a software stand-in for a device: a passive RSSI endpoint
 * with an AXI-Stream packetizer, an SRPv3 responder on channel 0 backed by a sparse
 * 32-bit register map, and a stream channel (1) for pushing data to the client.
 * After the client disconnects, the simulator listens again on the same UDP port
 * until Stop() is called.
 */

#ifndef _FPGA_SIMULATOR_H
#define _FPGA_SIMULATOR_H 1

#include <cstdint>
#include <vector>
#include <map>
#include <memory>
#include <atomic>
#include <boost/thread.hpp>
#include "RssiConfig.h"
#include "AxiStreamPacketConnection.h"
#include "SrpPacket.h"
#include "fpga_sim_lib_export.h"

class FpgaSimulator {
public:
    static constexpr uint8_t SRP_CHANNEL = 0;
    static constexpr uint8_t STREAM_CHANNEL = 1;

    FPGA_SIM_LIB_EXPORT FpgaSimulator(const RssiConfig& rssiConfig);
    FPGA_SIM_LIB_EXPORT ~FpgaSimulator();

    /** Start listening.
     *
     * @param localUdpPort The UDP port to bind (0 for an ephemeral port).
     * @return False if the port could not be bound.
     */
    FPGA_SIM_LIB_EXPORT bool Start(uint16_t localUdpPort);
    FPGA_SIM_LIB_EXPORT void Stop();
    FPGA_SIM_LIB_EXPORT uint16_t GetBoundLocalPort() const;

    FPGA_SIM_LIB_EXPORT void SetRegister(uint64_t address, uint32_t value);
    /// Unset registers read 0
    FPGA_SIM_LIB_EXPORT uint32_t GetRegister(uint64_t address) const;
    /// The error flags of the next response (applied once, posted writes skip it); a response with errors performs no access
    FPGA_SIM_LIB_EXPORT void SetNextResponseFooter(const SrpFooter& footer);

    /// Send a message to the client on the stream channel
    FPGA_SIM_LIB_EXPORT bool SendStreamData(const std::vector<uint8_t>& data);

    FPGA_SIM_LIB_EXPORT bool IsClientConnected() const;
    FPGA_SIM_LIB_EXPORT bool WaitClientConnected(unsigned int timeoutMilliseconds);

private:
    FPGA_SIM_LIB_NO_EXPORT bool CreateAndListen(uint16_t localUdpPort);
    FPGA_SIM_LIB_NO_EXPORT void OnConnectionStateChanged(AxiStreamPacketConnection* connPtr, RSSI_CONNECTION_STATE newState);
    FPGA_SIM_LIB_NO_EXPORT void OnSrpRequest(AxiStreamPacketConnection* connPtr, std::vector<uint8_t>& movableMessage);
    /// @return False for a posted write, which is never answered
    FPGA_SIM_LIB_NO_EXPORT bool ProcessRequest(const SrpPacket& request, SrpPacket& response);
    FPGA_SIM_LIB_NO_EXPORT void RelistenThreadFunc();

private:
    RssiConfig m_rssiConfig;
    uint16_t m_boundLocalPort;

    boost::mutex m_connectionMutex;
    std::shared_ptr<AxiStreamPacketConnection> m_connectionPtr;

    mutable boost::mutex m_stateMutex;
    boost::condition_variable m_stateConditionVariable;
    bool m_running;
    bool m_clientConnected;
    bool m_needsRelisten;
    std::unique_ptr<boost::thread> m_relistenThreadPtr;

    mutable boost::mutex m_registersMutex;
    std::map<uint64_t, uint32_t> m_registers;
    bool m_hasNextResponseFooter;
    SrpFooter m_nextResponseFooter;

public:
    //stats
    std::atomic<uint64_t> m_countConnections;
    std::atomic<uint64_t> m_countReadRequests;
    std::atomic<uint64_t> m_countWriteRequests;
    std::atomic<uint64_t> m_countPostedWriteRequests;
    std::atomic<uint64_t> m_countNullRequests;
    std::atomic<uint64_t> m_countErrorResponses;
    std::atomic<uint64_t> m_countMalformedRequests;
};

#endif //_FPGA_SIMULATOR_H
