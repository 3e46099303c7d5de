/**
 * @file AxiVersionDevice.h
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
 * This AxiVersionDevice class is the standard firmware version block:
 * the firmware version word, the reload and user reset strobes, and the device DNA.
 */

#ifndef _AXI_VERSION_DEVICE_H
#define _AXI_VERSION_DEVICE_H 1

#include <cstdint>
#include <string>
#include <vector>
#include "RegisterField.h"
#include "RegisterMemory.h"
#include "srp_lib_export.h"

class AxiVersionDevice {
public:
    static constexpr uint64_t FPGA_VERSION_OFFSET = 0x000;
    static constexpr uint64_t FPGA_RELOAD_OFFSET = 0x104;
    static constexpr uint64_t USER_RESET_OFFSET = 0x10C;
    static constexpr uint64_t DEVICE_DNA_OFFSET = 0x700;
    static constexpr std::size_t DEVICE_DNA_WORDS = 3;

    SRP_LIB_EXPORT AxiVersionDevice(RegisterAccessInterface& registerAccess, uint64_t baseAddress);

    SRP_LIB_EXPORT bool GetFpgaVersion(uint32_t& version) const;
    /// Pulse the user reset
    SRP_LIB_EXPORT bool Reset();
    /// Request a firmware reload
    SRP_LIB_EXPORT bool Reload();

    /** Read the device DNA.
     *
     * @param dnaWords Set to the 3 words as read, least significant first.
     */
    SRP_LIB_EXPORT bool GetDeviceDna(std::vector<uint32_t>& dnaWords) const;
    /// The DNA as one hex number, most significant word first (e.g. "0x0000000a_00000002_00000001")
    SRP_LIB_EXPORT static std::string DeviceDnaToHexString(const std::vector<uint32_t>& dnaWords);

public:
    RegisterField m_fpgaVersion;
    RegisterField m_fpgaReload;
    RegisterField m_userReset;
    RegisterMemory m_deviceDna;
};

#endif //_AXI_VERSION_DEVICE_H
