/**
 * @file TestRssiSegment.cpp
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

#include <boost/test/unit_test.hpp>
#include "RssiSegment.h"
#include <algorithm>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/random/mersenne_twister.hpp>
#include <boost/random/uniform_int_distribution.hpp>

static RssiSynHeader MakeTestSynHeader() {
    RssiSynHeader h;
    h.version = 1;
    h.checksumEnabled = true;
    h.maxOutstandingSegments = 8;
    h.maxSegmentSize = 1024;
    h.retransmissionTimeout = 100;
    h.cumulativeAckTimeout = 50;
    h.nullTimeout = 1000;
    h.maxRetransmissions = 5;
    h.maxCumulativeAcks = 3;
    h.maxOutOfSequenceAcks = 0;
    h.minusLog10TimeoutUnit = 3;
    h.connectionId = 0x12345678;
    return h;
}

BOOST_AUTO_TEST_CASE(RssiChecksumTestCase)
{
    //RFC 1071 example words 0001 f203 f4f5 f6f7 sum to 0xddf2 (after fold) => checksum 0x220d
    {
        const uint8_t data[8] = { 0x00, 0x01, 0xf2, 0x03, 0xf4, 0xf5, 0xf6, 0xf7 };
        BOOST_REQUIRE_EQUAL(RssiSegment::ComputeChecksum(data, sizeof(data)), 0x220d);
        BOOST_REQUIRE(RssiSegment::VerifyChecksum(data, sizeof(data), 0x220d));
        BOOST_REQUIRE(!RssiSegment::VerifyChecksum(data, sizeof(data), 0x220e));
    }
    //odd length pads with zero
    {
        const uint8_t odd[3] = { 0x12, 0x34, 0x56 };
        const uint8_t padded[4] = { 0x12, 0x34, 0x56, 0x00 };
        BOOST_REQUIRE_EQUAL(RssiSegment::ComputeChecksum(odd, 3), RssiSegment::ComputeChecksum(padded, 4));
    }
    //carries folded more than once
    {
        std::vector<uint8_t> ones(600, 0xff);
        const uint16_t c = RssiSegment::ComputeChecksum(ones.data(), ones.size());
        BOOST_REQUIRE_EQUAL(c, 0);
        BOOST_REQUIRE(RssiSegment::VerifyChecksum(ones.data(), ones.size(), c));
    }
    //single bit corruption of random data is detected
    {
        boost::random::mt19937 gen(42);
        boost::random::uniform_int_distribution<unsigned int> dist(0, 255);
        for (unsigned int trial = 0; trial < 50; ++trial) {
            std::vector<uint8_t> data(1 + trial * 3);
            for (std::size_t i = 0; i < data.size(); ++i) {
                data[i] = static_cast<uint8_t>(dist(gen));
            }
            const uint16_t c = RssiSegment::ComputeChecksum(data.data(), data.size());
            BOOST_REQUIRE(RssiSegment::VerifyChecksum(data.data(), data.size(), c));
            data[trial % data.size()] ^= static_cast<uint8_t>(1u << (trial % 8));
            BOOST_REQUIRE(!RssiSegment::VerifyChecksum(data.data(), data.size(), c));
        }
    }
}

BOOST_AUTO_TEST_CASE(RssiSynSegmentTestCase)
{
    const RssiSynHeader synHeader = MakeTestSynHeader();
    const RssiSegment syn = RssiSegment::MakeSyn(RSSI_CONTROL_BITS::NONE, 0, 0, synHeader);
    BOOST_REQUIRE(syn.IsSyn());
    BOOST_REQUIRE_EQUAL(syn.GetHeaderSize(), RssiSegment::SYN_HEADER_SIZE);
    BOOST_REQUIRE(syn.VerifyChecksum());

    std::vector<uint8_t> wire;
    syn.Serialize(wire);
    BOOST_REQUIRE_EQUAL(wire.size(), 24);
    static const uint8_t expectedPrefix[22] = {
        0x80, 24, 0, 0, //SYN, header length, seq, ack
        0x1c, //version 1, one bit, checksum enabled
        8, 0x04, 0x00, //max outstanding, mss 1024
        0x00, 100, 0x00, 50, 0x03, 0xe8, //timeouts 100, 50, 1000
        5, 3, 0, 3, //max retrans, max cum ack, max out of seq, unit
        0x12, 0x34, 0x56, 0x78 //connection id
    };
    BOOST_REQUIRE(std::equal(expectedPrefix, expectedPrefix + 22, wire.begin()));
    const uint16_t wireChecksum = (static_cast<uint16_t>(wire[22]) << 8) | wire[23];
    BOOST_REQUIRE_EQUAL(wireChecksum, RssiSegment::ComputeChecksum(wire.data(), 22));

    RssiSegment parsed;
    BOOST_REQUIRE(parsed.Deserialize(wire.data(), wire.size()));
    BOOST_REQUIRE(parsed == syn);
    BOOST_REQUIRE(parsed.m_synHeader == synHeader);
    BOOST_REQUIRE(parsed.VerifyChecksum());
    BOOST_REQUIRE_EQUAL(parsed.m_synHeader.GetRetransmissionTimeoutDuration(), boost::posix_time::milliseconds(100));
    BOOST_REQUIRE_EQUAL(parsed.m_synHeader.GetNullTimeoutDuration(), boost::posix_time::seconds(1));

    //corrupt a parameter
    wire[6] ^= 0x01;
    BOOST_REQUIRE(parsed.Deserialize(wire.data(), wire.size()));
    BOOST_REQUIRE(!parsed.VerifyChecksum());

    //too short for a SYN header
    BOOST_REQUIRE(!parsed.Deserialize(wire.data(), 23));
    BOOST_REQUIRE(!parsed.Deserialize(wire.data(), 3));
}

BOOST_AUTO_TEST_CASE(RssiNonSynSegmentTestCase)
{
    const std::vector<uint8_t> payload = { 'h', 'e', 'l', 'l', 'o' };
    const RssiSegment seg = RssiSegment::MakeNonSyn(RSSI_CONTROL_BITS::ACK, 7, 200, payload, true);
    BOOST_REQUIRE(!seg.IsSyn());
    BOOST_REQUIRE(seg.HasControlBits(RSSI_CONTROL_BITS::ACK));
    BOOST_REQUIRE(!seg.HasControlBits(RSSI_CONTROL_BITS::ACK | RSSI_CONTROL_BITS::NUL));
    std::vector<uint8_t> wire;
    seg.Serialize(wire);
    BOOST_REQUIRE_EQUAL(wire.size(), 8 + payload.size());
    BOOST_REQUIRE_EQUAL(wire[0], 0x40);
    BOOST_REQUIRE_EQUAL(wire[1], 8);
    BOOST_REQUIRE_EQUAL(wire[2], 7);
    BOOST_REQUIRE_EQUAL(wire[3], 200);
    BOOST_REQUIRE_EQUAL(wire[4], 0);
    BOOST_REQUIRE_EQUAL(wire[5], 0);
    const uint16_t wireChecksum = (static_cast<uint16_t>(wire[6]) << 8) | wire[7];
    BOOST_REQUIRE_EQUAL(wireChecksum, RssiSegment::ComputeChecksum(wire.data(), 6));
    BOOST_REQUIRE(std::equal(payload.begin(), payload.end(), wire.begin() + 8));

    RssiSegment parsed;
    BOOST_REQUIRE(parsed.Deserialize(wire.data(), wire.size()));
    BOOST_REQUIRE(parsed == seg);
    BOOST_REQUIRE(parsed.m_payload == payload);
    BOOST_REQUIRE(parsed.VerifyChecksum());

    //the payload is not covered by the checksum
    wire.back() ^= 0xff;
    BOOST_REQUIRE(parsed.Deserialize(wire.data(), wire.size()));
    BOOST_REQUIRE(parsed.VerifyChecksum());

    //header only
    BOOST_REQUIRE(parsed.Deserialize(wire.data(), 8));
    BOOST_REQUIRE(parsed.m_payload.empty());
    BOOST_REQUIRE(!parsed.Deserialize(wire.data(), 7));

    //checksum left unset
    const RssiSegment noChecksum = RssiSegment::MakeNonSyn(RSSI_CONTROL_BITS::ACK | RSSI_CONTROL_BITS::NUL, 1, 2, std::vector<uint8_t>(), false);
    BOOST_REQUIRE_EQUAL(noChecksum.m_checksum, 0);
    BOOST_REQUIRE(!noChecksum.VerifyChecksum());
}

BOOST_AUTO_TEST_CASE(RssiControlBitsToStringTestCase)
{
    BOOST_REQUIRE_EQUAL(RssiControlBitsToString(RSSI_CONTROL_BITS::NONE), "NONE");
    BOOST_REQUIRE_EQUAL(RssiControlBitsToString(RSSI_CONTROL_BITS::SYN | RSSI_CONTROL_BITS::ACK), "SYN|ACK");
    BOOST_REQUIRE_EQUAL(RssiControlBitsToString(RSSI_CONTROL_BITS::ACK | RSSI_CONTROL_BITS::NUL), "ACK|NUL");
}
