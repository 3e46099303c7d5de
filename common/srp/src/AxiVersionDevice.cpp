/**
 * @file AxiVersionDevice.cpp
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

#include "AxiVersionDevice.h"
#include <sstream>
#include <iomanip>

constexpr uint64_t AxiVersionDevice::FPGA_VERSION_OFFSET;
constexpr uint64_t AxiVersionDevice::FPGA_RELOAD_OFFSET;
constexpr uint64_t AxiVersionDevice::USER_RESET_OFFSET;
constexpr uint64_t AxiVersionDevice::DEVICE_DNA_OFFSET;
constexpr std::size_t AxiVersionDevice::DEVICE_DNA_WORDS;

AxiVersionDevice::AxiVersionDevice(RegisterAccessInterface& registerAccess, uint64_t baseAddress) :
    m_fpgaVersion(registerAccess, baseAddress + FPGA_VERSION_OFFSET, 0, 32, REGISTER_ACCESS::READ_ONLY),
    m_fpgaReload(registerAccess, baseAddress + FPGA_RELOAD_OFFSET, 0, 1),
    m_userReset(registerAccess, baseAddress + USER_RESET_OFFSET, 0, 1),
    m_deviceDna(registerAccess, baseAddress + DEVICE_DNA_OFFSET) {}

bool AxiVersionDevice::GetFpgaVersion(uint32_t& version) const {
    return m_fpgaVersion.Get(version);
}

bool AxiVersionDevice::Reset() {
    return m_userReset.Set(1);
}

bool AxiVersionDevice::Reload() {
    return m_fpgaReload.Set(1);
}

bool AxiVersionDevice::GetDeviceDna(std::vector<uint32_t>& dnaWords) const {
    return m_deviceDna.Read(DEVICE_DNA_WORDS, dnaWords);
}

std::string AxiVersionDevice::DeviceDnaToHexString(const std::vector<uint32_t>& dnaWords) {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::setfill('0');
    for (std::size_t i = dnaWords.size(); i > 0; --i) {
        oss << std::setw(8) << dnaWords[i - 1];
        if (i > 1) {
            oss << '_';
        }
    }
    return oss.str();
}
