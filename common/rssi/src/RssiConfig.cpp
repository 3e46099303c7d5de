/**
 * @file RssiConfig.cpp
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

#include "RssiConfig.h"
#include "Logger.h"
#include <cmath>
#include <cstdint>
#include <boost/random/random_device.hpp>

static constexpr srplink::Logger::SubProcess subprocess = srplink::Logger::SubProcess::rssi;

static uint32_t GenerateRandomConnectionId() {
    boost::random_device randomDevice;
    return static_cast<uint32_t>(randomDevice());
}

RssiConfig::RssiConfig() :
    m_useChecksum(true),
    m_maxOutstandingSegments(8),
    m_maxSegmentSize(1024),
    m_maxRetransmissions(5),
    m_maxCumulativeAcks(3),
    m_minusLog10TimeoutUnit(3),
    m_retransmissionTimeoutSeconds(0.1),
    m_cumulativeAckTimeoutSeconds(0.05),
    m_nullTimeoutSeconds(1.0),
    m_connectionId(GenerateRandomConnectionId()) { }

RssiConfig::~RssiConfig() {
}

//a copy constructor: X(const X&)
RssiConfig::RssiConfig(const RssiConfig& o) :
    m_useChecksum(o.m_useChecksum),
    m_maxOutstandingSegments(o.m_maxOutstandingSegments),
    m_maxSegmentSize(o.m_maxSegmentSize),
    m_maxRetransmissions(o.m_maxRetransmissions),
    m_maxCumulativeAcks(o.m_maxCumulativeAcks),
    m_minusLog10TimeoutUnit(o.m_minusLog10TimeoutUnit),
    m_retransmissionTimeoutSeconds(o.m_retransmissionTimeoutSeconds),
    m_cumulativeAckTimeoutSeconds(o.m_cumulativeAckTimeoutSeconds),
    m_nullTimeoutSeconds(o.m_nullTimeoutSeconds),
    m_connectionId(o.m_connectionId) { }

//a move constructor: X(X&&)
RssiConfig::RssiConfig(RssiConfig&& o) noexcept :
    m_useChecksum(o.m_useChecksum),
    m_maxOutstandingSegments(o.m_maxOutstandingSegments),
    m_maxSegmentSize(o.m_maxSegmentSize),
    m_maxRetransmissions(o.m_maxRetransmissions),
    m_maxCumulativeAcks(o.m_maxCumulativeAcks),
    m_minusLog10TimeoutUnit(o.m_minusLog10TimeoutUnit),
    m_retransmissionTimeoutSeconds(o.m_retransmissionTimeoutSeconds),
    m_cumulativeAckTimeoutSeconds(o.m_cumulativeAckTimeoutSeconds),
    m_nullTimeoutSeconds(o.m_nullTimeoutSeconds),
    m_connectionId(o.m_connectionId) { }

//a copy assignment: operator=(const X&)
RssiConfig& RssiConfig::operator=(const RssiConfig& o) {
    m_useChecksum = o.m_useChecksum;
    m_maxOutstandingSegments = o.m_maxOutstandingSegments;
    m_maxSegmentSize = o.m_maxSegmentSize;
    m_maxRetransmissions = o.m_maxRetransmissions;
    m_maxCumulativeAcks = o.m_maxCumulativeAcks;
    m_minusLog10TimeoutUnit = o.m_minusLog10TimeoutUnit;
    m_retransmissionTimeoutSeconds = o.m_retransmissionTimeoutSeconds;
    m_cumulativeAckTimeoutSeconds = o.m_cumulativeAckTimeoutSeconds;
    m_nullTimeoutSeconds = o.m_nullTimeoutSeconds;
    m_connectionId = o.m_connectionId;
    return *this;
}

//a move assignment: operator=(X&&)
RssiConfig& RssiConfig::operator=(RssiConfig&& o) noexcept {
    m_useChecksum = o.m_useChecksum;
    m_maxOutstandingSegments = o.m_maxOutstandingSegments;
    m_maxSegmentSize = o.m_maxSegmentSize;
    m_maxRetransmissions = o.m_maxRetransmissions;
    m_maxCumulativeAcks = o.m_maxCumulativeAcks;
    m_minusLog10TimeoutUnit = o.m_minusLog10TimeoutUnit;
    m_retransmissionTimeoutSeconds = o.m_retransmissionTimeoutSeconds;
    m_cumulativeAckTimeoutSeconds = o.m_cumulativeAckTimeoutSeconds;
    m_nullTimeoutSeconds = o.m_nullTimeoutSeconds;
    m_connectionId = o.m_connectionId;
    return *this;
}

bool RssiConfig::operator==(const RssiConfig& other) const {
    return
        (m_useChecksum == other.m_useChecksum) &&
        (m_maxOutstandingSegments == other.m_maxOutstandingSegments) &&
        (m_maxSegmentSize == other.m_maxSegmentSize) &&
        (m_maxRetransmissions == other.m_maxRetransmissions) &&
        (m_maxCumulativeAcks == other.m_maxCumulativeAcks) &&
        (m_minusLog10TimeoutUnit == other.m_minusLog10TimeoutUnit) &&
        (m_retransmissionTimeoutSeconds == other.m_retransmissionTimeoutSeconds) &&
        (m_cumulativeAckTimeoutSeconds == other.m_cumulativeAckTimeoutSeconds) &&
        (m_nullTimeoutSeconds == other.m_nullTimeoutSeconds);
}

static double ToMachineUnitsAsDouble(double seconds, unsigned int minusLog10TimeoutUnit) {
    return seconds / std::pow(10.0, -static_cast<double>(minusLog10TimeoutUnit));
}

int64_t RssiConfig::ToMachineUnits(double seconds, unsigned int minusLog10TimeoutUnit) {
    const double machineUnits = ToMachineUnitsAsDouble(seconds, minusLog10TimeoutUnit);
    //saturates at the int64_t limits, NaN maps to -1
    if (std::isnan(machineUnits)) {
        return -1;
    }
    if (machineUnits >= 9223372036854775807.0) {
        return INT64_MAX;
    }
    if (machineUnits <= -9223372036854775808.0) {
        return INT64_MIN;
    }
    return static_cast<int64_t>(machineUnits);
}

static bool ValidateTimeout(const char* name, double seconds, unsigned int minusLog10TimeoutUnit) {
    const double machineUnits = ToMachineUnitsAsDouble(seconds, minusLog10TimeoutUnit);
    if ((!std::isfinite(machineUnits)) || (machineUnits < 1.0) || (machineUnits >= 65536.0)) {
        LOG_ERROR(subprocess) << "error in RSSI config: " << name << " of " << seconds
            << "s is " << machineUnits << " machine units of 1e-" << minusLog10TimeoutUnit << "s, but must be within 1..65535";
        return false;
    }
    return true;
}

bool RssiConfig::Validate() const {
    if ((m_maxOutstandingSegments < 1) || (m_maxOutstandingSegments > 255)) {
        LOG_ERROR(subprocess) << "error in RSSI config: maxOutstandingSegments (" << m_maxOutstandingSegments << ") must be within 1..255";
        return false;
    }
    if ((m_maxSegmentSize < 1) || (m_maxSegmentSize > 65535)) {
        LOG_ERROR(subprocess) << "error in RSSI config: maxSegmentSize (" << m_maxSegmentSize << ") must be within 1..65535";
        return false;
    }
    if (m_maxRetransmissions > 255) {
        LOG_ERROR(subprocess) << "error in RSSI config: maxRetransmissions (" << m_maxRetransmissions << ") must be within 0..255";
        return false;
    }
    if ((m_maxCumulativeAcks < 1) || (m_maxCumulativeAcks > 255)) {
        LOG_ERROR(subprocess) << "error in RSSI config: maxCumulativeAcks (" << m_maxCumulativeAcks << ") must be within 1..255";
        return false;
    }
    if (m_minusLog10TimeoutUnit > 15) {
        LOG_ERROR(subprocess) << "error in RSSI config: minusLog10TimeoutUnit (" << m_minusLog10TimeoutUnit << ") must be within 0..15";
        return false;
    }
    return ValidateTimeout("retransmissionTimeoutSeconds", m_retransmissionTimeoutSeconds, m_minusLog10TimeoutUnit)
        && ValidateTimeout("cumulativeAckTimeoutSeconds", m_cumulativeAckTimeoutSeconds, m_minusLog10TimeoutUnit)
        && ValidateTimeout("nullTimeoutSeconds", m_nullTimeoutSeconds, m_minusLog10TimeoutUnit);
}

bool RssiConfig::SetValuesFromPropertyTree(const boost::property_tree::ptree& pt) {
    try {
        m_useChecksum = pt.get<bool>("useChecksum");
        m_maxOutstandingSegments = pt.get<unsigned int>("maxOutstandingSegments");
        m_maxSegmentSize = pt.get<unsigned int>("maxSegmentSize");
        m_maxRetransmissions = pt.get<unsigned int>("maxRetransmissions");
        m_maxCumulativeAcks = pt.get<unsigned int>("maxCumulativeAcks");
        m_minusLog10TimeoutUnit = pt.get<unsigned int>("minusLog10TimeoutUnit");
        m_retransmissionTimeoutSeconds = pt.get<double>("retransmissionTimeoutSeconds");
        m_cumulativeAckTimeoutSeconds = pt.get<double>("cumulativeAckTimeoutSeconds");
        m_nullTimeoutSeconds = pt.get<double>("nullTimeoutSeconds");
    }
    catch (const boost::property_tree::ptree_error& e) {
        LOG_ERROR(subprocess) << "error parsing JSON RSSI config: " << e.what();
        return false;
    }
    return Validate();
}

RssiConfig_ptr RssiConfig::CreateFromJson(const std::string& jsonString, bool verifyNoUnusedJsonKeys) {
    boost::property_tree::ptree pt;
    RssiConfig_ptr config; //NULL
    if (GetPropertyTreeFromJsonString(jsonString, pt)) { //prints message if failed
        config = CreateFromPtree(pt);
        //verify that there are no unused variables within the original json
        if (config && verifyNoUnusedJsonKeys) {
            std::string returnedErrorMessage;
            if (JsonSerializable::HasUnusedJsonVariablesInString(*config, jsonString, returnedErrorMessage)) {
                LOG_ERROR(subprocess) << returnedErrorMessage;
                config.reset(); //NULL
            }
        }
    }
    return config;
}

RssiConfig_ptr RssiConfig::CreateFromJsonFilePath(const boost::filesystem::path& jsonFilePath, bool verifyNoUnusedJsonKeys) {
    boost::property_tree::ptree pt;
    RssiConfig_ptr config; //NULL
    if (GetPropertyTreeFromJsonFilePath(jsonFilePath, pt)) { //prints message if failed
        config = CreateFromPtree(pt);
        if (config && verifyNoUnusedJsonKeys) {
            std::string returnedErrorMessage;
            if (JsonSerializable::HasUnusedJsonVariablesInFilePath(*config, jsonFilePath, returnedErrorMessage)) {
                LOG_ERROR(subprocess) << returnedErrorMessage;
                config.reset(); //NULL
            }
        }
    }
    return config;
}

RssiConfig_ptr RssiConfig::CreateFromPtree(const boost::property_tree::ptree& pt) {
    RssiConfig_ptr ptrRssiConfig = std::make_shared<RssiConfig>();
    if (!ptrRssiConfig->SetValuesFromPropertyTree(pt)) {
        ptrRssiConfig = RssiConfig_ptr(); //failed, so delete and set it NULL
    }
    return ptrRssiConfig;
}

boost::property_tree::ptree RssiConfig::GetNewPropertyTree() const {
    boost::property_tree::ptree pt;
    pt.put("useChecksum", m_useChecksum);
    pt.put("maxOutstandingSegments", m_maxOutstandingSegments);
    pt.put("maxSegmentSize", m_maxSegmentSize);
    pt.put("maxRetransmissions", m_maxRetransmissions);
    pt.put("maxCumulativeAcks", m_maxCumulativeAcks);
    pt.put("minusLog10TimeoutUnit", m_minusLog10TimeoutUnit);
    pt.put("retransmissionTimeoutSeconds", m_retransmissionTimeoutSeconds);
    pt.put("cumulativeAckTimeoutSeconds", m_cumulativeAckTimeoutSeconds);
    pt.put("nullTimeoutSeconds", m_nullTimeoutSeconds);
    return pt;
}

RssiSynHeader RssiConfig::ToSynHeader() {
    ++m_connectionId; //unsigned wraps modulo 2^32
    RssiSynHeader h;
    h.version = RssiSegment::SYN_VERSION;
    h.checksumEnabled = m_useChecksum;
    h.maxOutstandingSegments = static_cast<uint8_t>(m_maxOutstandingSegments);
    h.maxSegmentSize = static_cast<uint16_t>(m_maxSegmentSize);
    h.retransmissionTimeout = static_cast<uint16_t>(ToMachineUnits(m_retransmissionTimeoutSeconds, m_minusLog10TimeoutUnit));
    h.cumulativeAckTimeout = static_cast<uint16_t>(ToMachineUnits(m_cumulativeAckTimeoutSeconds, m_minusLog10TimeoutUnit));
    h.nullTimeout = static_cast<uint16_t>(ToMachineUnits(m_nullTimeoutSeconds, m_minusLog10TimeoutUnit));
    h.maxRetransmissions = static_cast<uint8_t>(m_maxRetransmissions);
    h.maxCumulativeAcks = static_cast<uint8_t>(m_maxCumulativeAcks);
    h.maxOutOfSequenceAcks = 0;
    h.minusLog10TimeoutUnit = static_cast<uint8_t>(m_minusLog10TimeoutUnit);
    h.connectionId = m_connectionId;
    return h;
}

uint32_t RssiConfig::GetConnectionId() const {
    return m_connectionId;
}

void RssiConfig::SetConnectionId(uint32_t connectionId) {
    m_connectionId = connectionId;
}
