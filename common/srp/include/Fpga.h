/**
 * @file Fpga.h
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
 * This Fpga class is the RegisterAccessInterface of a device reached through an SrpClient.
 * Words are little endian on the wire.  A request that fails because the connection
 * dropped is retried after a reconnect, up to RETRY_COUNT attempts.
 */

#ifndef _FPGA_H
#define _FPGA_H 1

#include <cstdint>
#include <string>
#include <vector>
#include "RegisterAccessInterface.h"
#include "SrpClient.h"
#include "srp_lib_export.h"

class Fpga : public RegisterAccessInterface {
public:
    static constexpr unsigned int RETRY_COUNT = 10;
    static constexpr unsigned int DEFAULT_REQUEST_TIMEOUT_MILLISECONDS = 5000;
    static constexpr unsigned int DEFAULT_CONNECT_TIMEOUT_MILLISECONDS = 5000;

    SRP_LIB_EXPORT Fpga(const RssiConfig& rssiConfig, const SrpClient::StreamCallback_t& streamCallback,
        uint16_t remoteUdpPort = RssiConnection::DEFAULT_REMOTE_UDP_PORT,
        unsigned int requestTimeoutMilliseconds = DEFAULT_REQUEST_TIMEOUT_MILLISECONDS,
        unsigned int connectTimeoutMilliseconds = DEFAULT_CONNECT_TIMEOUT_MILLISECONDS);
    SRP_LIB_EXPORT virtual ~Fpga() override;

    /** Connect and wait for the handshake.
     *
     * @return True if connected.
     */
    SRP_LIB_EXPORT bool Connect(const std::string& remoteHostname, uint16_t localUdpPort);
    SRP_LIB_EXPORT SrpClient& GetSrpClient();

    SRP_LIB_EXPORT virtual bool ReadWord(uint64_t address, uint32_t& value) override;
    SRP_LIB_EXPORT virtual bool ReadWords(uint64_t address, std::size_t count, std::vector<uint32_t>& values) override;
    SRP_LIB_EXPORT virtual bool WriteWord(uint64_t address, uint32_t value) override;
    SRP_LIB_EXPORT virtual bool WriteWords(uint64_t address, const std::vector<uint32_t>& values) override;

    /// A trailing partial word is ignored
    SRP_LIB_EXPORT static void LittleEndianBytesToWords(const std::vector<uint8_t>& bytes, std::vector<uint32_t>& words);
    SRP_LIB_EXPORT static void WordsToLittleEndianBytes(const std::vector<uint32_t>& words, std::vector<uint8_t>& bytes);

private:
    SRP_LIB_NO_EXPORT bool ShouldRetry(SRP_REQUEST_RESULT result, unsigned int attempt);

    SrpClient m_srpClient;
    const unsigned int M_REQUEST_TIMEOUT_MILLISECONDS;
    const unsigned int M_CONNECT_TIMEOUT_MILLISECONDS;
};

#endif //_FPGA_H
