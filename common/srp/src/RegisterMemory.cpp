/**
 * @file RegisterMemory.cpp
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

#include "RegisterMemory.h"

RegisterMemory::RegisterMemory(RegisterAccessInterface& registerAccess, uint64_t baseAddress) :
    m_registerAccess(registerAccess),
    M_BASE_ADDRESS(baseAddress) {}

bool RegisterMemory::Read(std::size_t count, std::vector<uint32_t>& words) const {
    return m_registerAccess.ReadWords(M_BASE_ADDRESS, count, words);
}

bool RegisterMemory::Write(const std::vector<uint32_t>& words) {
    return m_registerAccess.WriteWords(M_BASE_ADDRESS, words);
}

uint64_t RegisterMemory::GetBaseAddress() const {
    return M_BASE_ADDRESS;
}
