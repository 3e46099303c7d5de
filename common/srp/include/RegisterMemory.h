/**
 * @file RegisterMemory.h
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
 * This RegisterMemory class is a contiguous array of 32-bit words (4-byte stride).
 */

#ifndef _REGISTER_MEMORY_H
#define _REGISTER_MEMORY_H 1

#include <cstdint>
#include <vector>
#include "RegisterAccessInterface.h"
#include "srp_lib_export.h"

class RegisterMemory {
public:
    SRP_LIB_EXPORT RegisterMemory(RegisterAccessInterface& registerAccess, uint64_t baseAddress);

    /// Read the first count words
    SRP_LIB_EXPORT bool Read(std::size_t count, std::vector<uint32_t>& words) const;
    /// Write words starting at the first word
    SRP_LIB_EXPORT bool Write(const std::vector<uint32_t>& words);
    SRP_LIB_EXPORT uint64_t GetBaseAddress() const;

private:
    RegisterAccessInterface& m_registerAccess;
    const uint64_t M_BASE_ADDRESS;
};

#endif //_REGISTER_MEMORY_H
