/**
 * @file RegisterField.h
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
 * This RegisterField class is a bit field (bitOffset, bitSize) of one 32-bit register.
 * Set on a read-write field is a read-modify-write; set on a write-only field writes
 * the shifted value directly (other bits zero).
 * An optional dictionary names the field values.
 */

#ifndef _REGISTER_FIELD_H
#define _REGISTER_FIELD_H 1

#include <cstdint>
#include <string>
#include <map>
#include <ostream>
#include "RegisterAccessInterface.h"
#include "srp_lib_export.h"

enum class REGISTER_ACCESS {
    READ_WRITE = 0,
    READ_ONLY,
    WRITE_ONLY
};
SRP_LIB_EXPORT std::ostream& operator<<(std::ostream& os, const REGISTER_ACCESS& o);

class RegisterField {
public:
    typedef std::map<uint32_t, std::string> value_names_map_t;

    SRP_LIB_EXPORT RegisterField(RegisterAccessInterface& registerAccess, uint64_t address,
        unsigned int bitOffset = 0, unsigned int bitSize = 32,
        REGISTER_ACCESS access = REGISTER_ACCESS::READ_WRITE,
        const value_names_map_t& valueNames = value_names_map_t());

    SRP_LIB_EXPORT bool Get(uint32_t& value) const;
    /// Values wider than the field are truncated to the field width (with a warning)
    SRP_LIB_EXPORT bool Set(uint32_t value);

    /// Get the dictionary name of the current value (fails if the value is unnamed)
    SRP_LIB_EXPORT bool GetName(std::string& name) const;
    SRP_LIB_EXPORT bool SetByName(const std::string& name);

    SRP_LIB_EXPORT uint64_t GetAddress() const;
    SRP_LIB_EXPORT unsigned int GetBitOffset() const;
    SRP_LIB_EXPORT unsigned int GetBitSize() const;
    SRP_LIB_EXPORT REGISTER_ACCESS GetAccess() const;
    /// Mask of the field width (unshifted)
    SRP_LIB_EXPORT uint32_t GetValueMask() const;
    SRP_LIB_EXPORT const value_names_map_t& GetValueNames() const;

private:
    SRP_LIB_NO_EXPORT bool IsLayoutValid() const;

    RegisterAccessInterface& m_registerAccess;
    const uint64_t M_ADDRESS;
    const unsigned int M_BIT_OFFSET;
    const unsigned int M_BIT_SIZE;
    const REGISTER_ACCESS M_ACCESS;
    const value_names_map_t m_valueNames;
};

#endif //_REGISTER_FIELD_H
