/**
 * @file RegisterAccessInterface.h
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
 * This RegisterAccessInterface abstract class is the 32-bit word register access
 * used by RegisterField, RegisterMemory and the device classes built from them.
 */

#ifndef _REGISTER_ACCESS_INTERFACE_H
#define _REGISTER_ACCESS_INTERFACE_H 1

#include <cstdint>
#include <cstddef>
#include <vector>
#include "srp_lib_export.h"

class RegisterAccessInterface {
public:
    SRP_LIB_EXPORT virtual ~RegisterAccessInterface();

    virtual bool ReadWord(uint64_t address, uint32_t& value) = 0;
    /// Read count consecutive words starting at address (4-byte stride)
    virtual bool ReadWords(uint64_t address, std::size_t count, std::vector<uint32_t>& values) = 0;
    virtual bool WriteWord(uint64_t address, uint32_t value) = 0;
    virtual bool WriteWords(uint64_t address, const std::vector<uint32_t>& values) = 0;
};

#endif //_REGISTER_ACCESS_INTERFACE_H
