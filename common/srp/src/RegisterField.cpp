/**
 * @file RegisterField.cpp
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

#include "RegisterField.h"
#include "Logger.h"

static constexpr srplink::Logger::SubProcess subprocess = srplink::Logger::SubProcess::fpga;

std::ostream& operator<<(std::ostream& os, const REGISTER_ACCESS& o) {
    switch (o) {
        case REGISTER_ACCESS::READ_WRITE:
            os << "READ_WRITE";
            break;
        case REGISTER_ACCESS::READ_ONLY:
            os << "READ_ONLY";
            break;
        case REGISTER_ACCESS::WRITE_ONLY:
            os << "WRITE_ONLY";
            break;
        default:
            os << "UNKNOWN";
            break;
    }
    return os;
}

RegisterField::RegisterField(RegisterAccessInterface& registerAccess, uint64_t address,
    unsigned int bitOffset, unsigned int bitSize, REGISTER_ACCESS access, const value_names_map_t& valueNames) :
    m_registerAccess(registerAccess),
    M_ADDRESS(address),
    M_BIT_OFFSET(bitOffset),
    M_BIT_SIZE(bitSize),
    M_ACCESS(access),
    m_valueNames(valueNames)
{
    if (!IsLayoutValid()) {
        LOG_ERROR(subprocess) << "register field at 0x" << std::hex << M_ADDRESS << std::dec
            << " has invalid layout (offset " << M_BIT_OFFSET << ", size " << M_BIT_SIZE << "); all accesses will fail";
    }
}

bool RegisterField::IsLayoutValid() const {
    return (M_BIT_SIZE >= 1) && (M_BIT_SIZE <= 32) && ((M_BIT_OFFSET + M_BIT_SIZE) <= 32);
}

uint32_t RegisterField::GetValueMask() const {
    return (M_BIT_SIZE >= 32) ? UINT32_MAX : ((static_cast<uint32_t>(1) << M_BIT_SIZE) - 1);
}

bool RegisterField::Get(uint32_t& value) const {
    if (M_ACCESS == REGISTER_ACCESS::WRITE_ONLY) {
        LOG_ERROR(subprocess) << "reading write-only register field at 0x" << std::hex << M_ADDRESS << std::dec;
        return false;
    }
    if (!IsLayoutValid()) {
        return false;
    }
    uint32_t registerValue;
    if (!m_registerAccess.ReadWord(M_ADDRESS, registerValue)) {
        return false;
    }
    value = (registerValue >> M_BIT_OFFSET) & GetValueMask();
    return true;
}

bool RegisterField::Set(uint32_t value) {
    if (M_ACCESS == REGISTER_ACCESS::READ_ONLY) {
        LOG_ERROR(subprocess) << "writing read-only register field at 0x" << std::hex << M_ADDRESS << std::dec;
        return false;
    }
    if (!IsLayoutValid()) {
        return false;
    }
    const uint32_t valueMask = GetValueMask();
    if (value & (~valueMask)) {
        LOG_WARNING(subprocess) << "value 0x" << std::hex << value << " truncated to the " << std::dec << M_BIT_SIZE
            << "-bit field at 0x" << std::hex << M_ADDRESS << std::dec;
        value &= valueMask;
    }
    const uint32_t shiftedMask = valueMask << M_BIT_OFFSET;
    const uint32_t shiftedValue = value << M_BIT_OFFSET;
    if (M_ACCESS == REGISTER_ACCESS::WRITE_ONLY) {
        return m_registerAccess.WriteWord(M_ADDRESS, shiftedValue);
    }
    uint32_t registerValue;
    if (!m_registerAccess.ReadWord(M_ADDRESS, registerValue)) {
        return false;
    }
    registerValue = (registerValue & (~shiftedMask)) | shiftedValue;
    return m_registerAccess.WriteWord(M_ADDRESS, registerValue);
}

bool RegisterField::GetName(std::string& name) const {
    uint32_t value;
    if (!Get(value)) {
        return false;
    }
    value_names_map_t::const_iterator it = m_valueNames.find(value);
    if (it == m_valueNames.cend()) {
        LOG_ERROR(subprocess) << "register field at 0x" << std::hex << M_ADDRESS << " holds unnamed value 0x" << value << std::dec;
        return false;
    }
    name = it->second;
    return true;
}

bool RegisterField::SetByName(const std::string& name) {
    for (value_names_map_t::const_iterator it = m_valueNames.cbegin(); it != m_valueNames.cend(); ++it) {
        if (it->second == name) {
            return Set(it->first);
        }
    }
    LOG_ERROR(subprocess) << "register field at 0x" << std::hex << M_ADDRESS << std::dec << " has no value named " << name;
    return false;
}

uint64_t RegisterField::GetAddress() const {
    return M_ADDRESS;
}
unsigned int RegisterField::GetBitOffset() const {
    return M_BIT_OFFSET;
}
unsigned int RegisterField::GetBitSize() const {
    return M_BIT_SIZE;
}
REGISTER_ACCESS RegisterField::GetAccess() const {
    return M_ACCESS;
}
const RegisterField::value_names_map_t& RegisterField::GetValueNames() const {
    return m_valueNames;
}
