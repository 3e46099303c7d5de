/**
 * @file RssiConfig.h
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
 * This RssiConfig class holds the local RSSI synchronization parameters
 * (the values this endpoint advertises in its SYN segment).
 * Timeouts are configured in seconds and converted to 16-bit machine units
 * of 10^-minusLog10TimeoutUnit seconds, truncating toward zero.
 * All values are range checked when loaded from JSON.
 */

#ifndef _RSSI_CONFIG_H
#define _RSSI_CONFIG_H 1

#include <string>
#include <memory>
#include <cstdint>
#include <boost/filesystem/path.hpp>
#include "JsonSerializable.h"
#include "RssiSegment.h"
#include "rssi_lib_export.h"

class RssiConfig;
typedef std::shared_ptr<RssiConfig> RssiConfig_ptr;

class RssiConfig : public JsonSerializable {
public:
    RSSI_LIB_EXPORT RssiConfig();
    RSSI_LIB_EXPORT ~RssiConfig();

    //a copy constructor: X(const X&)
    RSSI_LIB_EXPORT RssiConfig(const RssiConfig& o);

    //a move constructor: X(X&&)
    RSSI_LIB_EXPORT RssiConfig(RssiConfig&& o) noexcept;

    //a copy assignment: operator=(const X&)
    RSSI_LIB_EXPORT RssiConfig& operator=(const RssiConfig& o);

    //a move assignment: operator=(X&&)
    RSSI_LIB_EXPORT RssiConfig& operator=(RssiConfig&& o) noexcept;

    /// Compares the serializable values (the connection id is not compared)
    RSSI_LIB_EXPORT bool operator==(const RssiConfig& other) const;

    RSSI_LIB_EXPORT static RssiConfig_ptr CreateFromPtree(const boost::property_tree::ptree& pt);
    RSSI_LIB_EXPORT static RssiConfig_ptr CreateFromJson(const std::string& jsonString, bool verifyNoUnusedJsonKeys = true);
    RSSI_LIB_EXPORT static RssiConfig_ptr CreateFromJsonFilePath(const boost::filesystem::path& jsonFilePath, bool verifyNoUnusedJsonKeys = true);
    RSSI_LIB_EXPORT virtual boost::property_tree::ptree GetNewPropertyTree() const override;
    RSSI_LIB_EXPORT virtual bool SetValuesFromPropertyTree(const boost::property_tree::ptree& pt) override;

    /** Check every field against its allowed range.
     *
     * @return True if valid, or False (with the reason logged) otherwise.
     */
    RSSI_LIB_EXPORT bool Validate() const;

    /** Convert a timeout in seconds to machine units (truncates toward zero).
     *
     * @return The machine units, saturated to the int64_t range (-1 for NaN), which may be out of the 16-bit range (check before use).
     */
    RSSI_LIB_EXPORT static int64_t ToMachineUnits(double seconds, unsigned int minusLog10TimeoutUnit);

    /** Produce the SYN parameters for a new connection attempt.
     *
     * Increments this instance's connection id (modulo 2^32) first.
     * Call only on a validated config.
     */
    RSSI_LIB_EXPORT RssiSynHeader ToSynHeader();

    RSSI_LIB_EXPORT uint32_t GetConnectionId() const;
    RSSI_LIB_EXPORT void SetConnectionId(uint32_t connectionId);

public:
    bool m_useChecksum;
    unsigned int m_maxOutstandingSegments;
    unsigned int m_maxSegmentSize;
    unsigned int m_maxRetransmissions;
    unsigned int m_maxCumulativeAcks;
    unsigned int m_minusLog10TimeoutUnit;
    double m_retransmissionTimeoutSeconds;
    double m_cumulativeAckTimeoutSeconds;
    double m_nullTimeoutSeconds;

private:
    uint32_t m_connectionId;
};

#endif //_RSSI_CONFIG_H
