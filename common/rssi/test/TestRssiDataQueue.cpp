/**
 * @file TestRssiDataQueue.cpp
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
#include "RssiDataQueue.h"
#include "RssiConfig.h"
#include <boost/bind/bind.hpp>
#include <algorithm>
#include <deque>

namespace {
//two data queues wired back to back through in-memory outboxes
struct QueuePair {
    QueuePair() :
        m_t0(boost::gregorian::date(2021, 1, 1)),
        m_countSentFromA(0),
        m_dropEveryNthFromA(0),
        m_dropAllFromA(false),
        m_maxUnackedA(0),
        m_countDataSegmentsSentFromA(0)
    {
        RssiConfig config;
        m_synHeader = config.ToSynHeader();
    }

    void Reset() {
        a.Reset(0, 42, m_synHeader,
            boost::bind(&QueuePair::SendFromA, this, boost::placeholders::_1),
            boost::bind(&QueuePair::DataReceivedByA, this, boost::placeholders::_1),
            boost::bind(&QueuePair::DisconnectedA, this, boost::placeholders::_1),
            m_t0);
        b.Reset(42, 0, m_synHeader,
            boost::bind(&QueuePair::SendFromB, this, boost::placeholders::_1),
            boost::bind(&QueuePair::DataReceivedByB, this, boost::placeholders::_1),
            boost::bind(&QueuePair::DisconnectedB, this, boost::placeholders::_1),
            m_t0);
    }

    bool SendFromA(const RssiSegment& segment) {
        m_maxUnackedA = std::max(m_maxUnackedA, a.GetNumUnackedSegments());
        if (!segment.m_payload.empty()) {
            ++m_countDataSegmentsSentFromA;
        }
        ++m_countSentFromA;
        if (m_dropAllFromA || (m_dropEveryNthFromA && ((m_countSentFromA % m_dropEveryNthFromA) == 0))) {
            return true;
        }
        m_toB.push_back(segment);
        return true;
    }
    bool SendFromB(const RssiSegment& segment) {
        m_toA.push_back(segment);
        return true;
    }
    void DataReceivedByA(std::vector<uint8_t>& data) {
        m_receivedByA.push_back(std::move(data));
    }
    void DataReceivedByB(std::vector<uint8_t>& data) {
        m_receivedByB.push_back(std::move(data));
    }
    void DisconnectedA(RSSI_DISCONNECT_REASON reason) {
        m_disconnectReasonsA.push_back(reason);
    }
    void DisconnectedB(RSSI_DISCONNECT_REASON reason) {
        m_disconnectReasonsB.push_back(reason);
    }

    //deliver everything in flight (alternating directions) at time now
    void Deliver(const boost::posix_time::ptime& now) {
        while ((!m_toB.empty()) || (!m_toA.empty())) {
            if (!m_toB.empty()) {
                RssiSegment segment(std::move(m_toB.front()));
                m_toB.pop_front();
                b.SegmentReceived(segment, now);
            }
            if (!m_toA.empty()) {
                RssiSegment segment(std::move(m_toA.front()));
                m_toA.pop_front();
                a.SegmentReceived(segment, now);
            }
        }
    }
    void Step(const boost::posix_time::ptime& now) {
        Deliver(now);
        a.OnControlPeriod(now);
        b.OnControlPeriod(now);
    }
    bool AnyDisconnected() const {
        return (!m_disconnectReasonsA.empty()) || (!m_disconnectReasonsB.empty());
    }

    RssiDataQueue a;
    RssiDataQueue b;
    RssiSynHeader m_synHeader;
    const boost::posix_time::ptime m_t0;
    std::deque<RssiSegment> m_toB;
    std::deque<RssiSegment> m_toA;
    std::vector<std::vector<uint8_t> > m_receivedByA;
    std::vector<std::vector<uint8_t> > m_receivedByB;
    std::vector<RSSI_DISCONNECT_REASON> m_disconnectReasonsA;
    std::vector<RSSI_DISCONNECT_REASON> m_disconnectReasonsB;
    uint64_t m_countSentFromA;
    uint64_t m_dropEveryNthFromA;
    bool m_dropAllFromA;
    std::size_t m_maxUnackedA;
    uint64_t m_countDataSegmentsSentFromA;
};
}

BOOST_AUTO_TEST_CASE(RssiSequenceNumberArithmeticTestCase)
{
    uint8_t seq = 17;
    for (unsigned int i = 0; i < 256; ++i) {
        seq = RssiDataQueue::IncrementSequenceNumber(seq);
    }
    BOOST_REQUIRE_EQUAL(seq, 17);
    BOOST_REQUIRE_EQUAL(RssiDataQueue::IncrementSequenceNumber(255), 0);
    BOOST_REQUIRE_EQUAL(RssiDataQueue::SequenceNumberDifference(2, 250), 8);
    BOOST_REQUIRE_EQUAL(RssiDataQueue::SequenceNumberDifference(250, 2), 248);
    BOOST_REQUIRE(RssiDataQueue::SequenceNumberInRangeInclusive(10, 20, 10));
    BOOST_REQUIRE(RssiDataQueue::SequenceNumberInRangeInclusive(10, 20, 20));
    BOOST_REQUIRE(!RssiDataQueue::SequenceNumberInRangeInclusive(10, 20, 21));
    BOOST_REQUIRE(!RssiDataQueue::SequenceNumberInRangeInclusive(10, 20, 9));
    //wrapped interval
    BOOST_REQUIRE(RssiDataQueue::SequenceNumberInRangeInclusive(250, 3, 255));
    BOOST_REQUIRE(RssiDataQueue::SequenceNumberInRangeInclusive(250, 3, 0));
    BOOST_REQUIRE(RssiDataQueue::SequenceNumberInRangeInclusive(250, 3, 3));
    BOOST_REQUIRE(!RssiDataQueue::SequenceNumberInRangeInclusive(250, 3, 4));
    BOOST_REQUIRE(!RssiDataQueue::SequenceNumberInRangeInclusive(250, 3, 249));
}

BOOST_AUTO_TEST_CASE(RssiDataQueueSendReceiveTestCase)
{
    QueuePair qp;
    qp.Reset();
    const boost::posix_time::ptime& t0 = qp.m_t0;
    const std::string helloStr("hello world");
    const std::vector<uint8_t> hello(helloStr.begin(), helloStr.end());

    BOOST_REQUIRE(qp.a.SendUserData(hello.data(), hello.size(), t0));
    BOOST_REQUIRE_EQUAL(qp.a.GetNumUnackedSegments(), 1);
    BOOST_REQUIRE_EQUAL(qp.a.GetLastLocalSequenceNumber(), 1);
    BOOST_REQUIRE_EQUAL(qp.m_toB.size(), 1);
    const RssiSegment sent = qp.m_toB.front();
    BOOST_REQUIRE(sent.m_controlBits == RSSI_CONTROL_BITS::ACK);
    BOOST_REQUIRE_EQUAL(sent.m_sequenceNumber, 1);
    BOOST_REQUIRE_EQUAL(sent.m_acknowledgmentNumber, 42);
    BOOST_REQUIRE(sent.VerifyChecksum());

    qp.Deliver(t0);
    BOOST_REQUIRE_EQUAL(qp.m_receivedByB.size(), 1);
    BOOST_REQUIRE(qp.m_receivedByB[0] == hello);
    BOOST_REQUIRE_EQUAL(qp.b.GetLastRemoteSequenceNumber(), 1);
    //single segment is acknowledged cumulatively, not immediately
    BOOST_REQUIRE(qp.m_toA.empty());
    BOOST_REQUIRE_EQUAL(qp.a.GetNumUnackedSegments(), 1);

    qp.b.OnControlPeriod(t0 + boost::posix_time::milliseconds(49));
    BOOST_REQUIRE_EQUAL(qp.m_toA.size(), 1); //first period after reset sends a NUL
    BOOST_REQUIRE(qp.m_toA.front().HasControlBits(RSSI_CONTROL_BITS::ACK | RSSI_CONTROL_BITS::NUL));
    BOOST_REQUIRE_EQUAL(qp.m_toA.front().m_acknowledgmentNumber, 1); //piggybacked ack
    qp.Deliver(t0 + boost::posix_time::milliseconds(49));
    BOOST_REQUIRE_EQUAL(qp.a.GetNumUnackedSegments(), 0);
    BOOST_REQUIRE_EQUAL(qp.a.GetLastAckedLocalSequenceNumber(), 1);
    BOOST_REQUIRE(qp.m_receivedByA.empty()); //NUL delivers nothing
    BOOST_REQUIRE_EQUAL(qp.a.GetLastRemoteSequenceNumber(), 43);

    //a owes b an ack for the NUL, sent on cumulative ack timeout
    qp.a.OnControlPeriod(t0 + boost::posix_time::milliseconds(60));
    BOOST_REQUIRE(qp.m_toB.empty());
    qp.a.OnControlPeriod(t0 + boost::posix_time::milliseconds(99));
    BOOST_REQUIRE_EQUAL(qp.m_toB.size(), 1);
    BOOST_REQUIRE(qp.m_toB.front().m_controlBits == RSSI_CONTROL_BITS::ACK);
    BOOST_REQUIRE(qp.m_toB.front().m_payload.empty());
    BOOST_REQUIRE_EQUAL(qp.m_toB.front().m_sequenceNumber, 2); //empty ack does not consume
    BOOST_REQUIRE_EQUAL(qp.m_toB.front().m_acknowledgmentNumber, 43);
    qp.Deliver(t0 + boost::posix_time::milliseconds(99));
    BOOST_REQUIRE_EQUAL(qp.b.GetNumUnackedSegments(), 0);
    BOOST_REQUIRE_EQUAL(qp.a.GetLastLocalSequenceNumber(), 1);
    BOOST_REQUIRE(!qp.AnyDisconnected());
}

BOOST_AUTO_TEST_CASE(RssiDataQueueInvalidSegmentsTestCase)
{
    QueuePair qp;
    qp.Reset();
    const boost::posix_time::ptime& t0 = qp.m_t0;
    const std::vector<uint8_t> data(4, 0x55);

    //out of sequence
    RssiSegment seg = RssiSegment::MakeNonSyn(RSSI_CONTROL_BITS::ACK, 2, 42, data, true);
    qp.b.SegmentReceived(seg, t0);
    BOOST_REQUIRE(qp.m_receivedByB.empty());
    //neither ACK nor RST
    seg = RssiSegment::MakeNonSyn(RSSI_CONTROL_BITS::NONE, 1, 42, data, true);
    qp.b.SegmentReceived(seg, t0);
    BOOST_REQUIRE(qp.m_receivedByB.empty());
    //SYN on an established connection
    seg = RssiSegment::MakeSyn(RSSI_CONTROL_BITS::ACK, 1, 42, qp.m_synHeader);
    qp.b.SegmentReceived(seg, t0);
    BOOST_REQUIRE(qp.m_receivedByB.empty());
    BOOST_REQUIRE_EQUAL(qp.b.GetLastRemoteSequenceNumber(), 0);

    //in sequence
    seg = RssiSegment::MakeNonSyn(RSSI_CONTROL_BITS::ACK, 1, 42, data, true);
    qp.b.SegmentReceived(seg, t0);
    BOOST_REQUIRE_EQUAL(qp.m_receivedByB.size(), 1);
    //duplicate
    seg = RssiSegment::MakeNonSyn(RSSI_CONTROL_BITS::ACK, 1, 42, data, true);
    qp.b.SegmentReceived(seg, t0);
    BOOST_REQUIRE_EQUAL(qp.m_receivedByB.size(), 1);
    BOOST_REQUIRE(qp.m_toA.empty());
}

BOOST_AUTO_TEST_CASE(RssiDataQueueAckHandlingTestCase)
{
    QueuePair qp;
    qp.Reset();
    const boost::posix_time::ptime& t0 = qp.m_t0;
    for (uint8_t i = 0; i < 10; ++i) {
        BOOST_REQUIRE(qp.a.SendUserData(&i, 1, t0));
    }
    BOOST_REQUIRE_EQUAL(qp.a.GetNumUnackedSegments(), 8);
    BOOST_REQUIRE_EQUAL(qp.a.GetNumUnsentSegments(), 2);
    BOOST_REQUIRE_EQUAL(qp.m_toB.size(), 8);
    qp.m_toB.clear();

    //ack equal to lastAckedLocal acknowledges nothing and sends nothing
    RssiSegment ack = RssiSegment::MakeNonSyn(RSSI_CONTROL_BITS::ACK, 43, 0, std::vector<uint8_t>(), true);
    qp.a.SegmentReceived(ack, t0);
    BOOST_REQUIRE_EQUAL(qp.a.GetNumUnackedSegments(), 8);
    BOOST_REQUIRE_EQUAL(qp.a.GetNumUnsentSegments(), 2);
    BOOST_REQUIRE(qp.m_toB.empty());

    //ack beyond lastLocal is ignored
    ack = RssiSegment::MakeNonSyn(RSSI_CONTROL_BITS::ACK, 43, 9, std::vector<uint8_t>(), true);
    qp.a.SegmentReceived(ack, t0);
    BOOST_REQUIRE_EQUAL(qp.a.GetNumUnackedSegments(), 8);
    BOOST_REQUIRE_EQUAL(qp.a.GetLastAckedLocalSequenceNumber(), 0);

    //ack of 3 promotes 2 unsent into the window
    ack = RssiSegment::MakeNonSyn(RSSI_CONTROL_BITS::ACK, 43, 3, std::vector<uint8_t>(), true);
    qp.a.SegmentReceived(ack, t0);
    BOOST_REQUIRE_EQUAL(qp.a.GetLastAckedLocalSequenceNumber(), 3);
    BOOST_REQUIRE_EQUAL(qp.a.GetNumUnackedSegments(), 7);
    BOOST_REQUIRE_EQUAL(qp.a.GetNumUnsentSegments(), 0);
    BOOST_REQUIRE_EQUAL(qp.m_toB.size(), 2);
    BOOST_REQUIRE_EQUAL(qp.m_toB[0].m_sequenceNumber, 9);
    BOOST_REQUIRE_EQUAL(qp.m_toB[1].m_sequenceNumber, 10);
    BOOST_REQUIRE_EQUAL(qp.m_toB[1].m_payload[0], 9);
    BOOST_REQUIRE_EQUAL(qp.a.GetLastLocalSequenceNumber(), 10);
}

BOOST_AUTO_TEST_CASE(RssiDataQueueWindowWraparoundAndDisconnectTestCase)
{
    QueuePair qp;
    qp.Reset();
    const boost::posix_time::ptime& t0 = qp.m_t0;
    static const unsigned int NUM_MESSAGES = 300;
    for (unsigned int i = 0; i < NUM_MESSAGES; ++i) {
        const uint8_t data[2] = { static_cast<uint8_t>(i >> 8), static_cast<uint8_t>(i) };
        BOOST_REQUIRE(qp.a.SendUserData(data, 2, t0));
    }
    BOOST_REQUIRE_EQUAL(qp.a.GetNumUnackedSegments(), 8);
    BOOST_REQUIRE_EQUAL(qp.a.GetNumUnsentSegments(), NUM_MESSAGES - 8);

    //disconnect with everything still queued, the RST queues behind the data
    qp.a.Disconnect(t0);
    BOOST_REQUIRE(qp.a.IsDisconnectRequested());
    BOOST_REQUIRE_EQUAL(qp.a.GetNumUnsentSegments(), NUM_MESSAGES - 8 + 1);
    BOOST_REQUIRE(!qp.a.SendUserData(reinterpret_cast<const uint8_t*>("x"), 1, t0));
    BOOST_REQUIRE(qp.a.GetRetransmissionTimeout() <= boost::posix_time::milliseconds(100));

    boost::posix_time::ptime t = t0;
    for (unsigned int step = 0; (step < 10000) && (qp.m_disconnectReasonsA.empty() || qp.m_disconnectReasonsB.empty()); ++step) {
        t += boost::posix_time::milliseconds(10);
        qp.Step(t);
    }
    BOOST_REQUIRE_EQUAL(qp.m_disconnectReasonsA.size(), 1);
    BOOST_REQUIRE_EQUAL(qp.m_disconnectReasonsA[0], RSSI_DISCONNECT_REASON::GRACEFUL);
    BOOST_REQUIRE_EQUAL(qp.m_disconnectReasonsB.size(), 1);
    BOOST_REQUIRE_EQUAL(qp.m_disconnectReasonsB[0], RSSI_DISCONNECT_REASON::PEER_RESET);
    BOOST_REQUIRE(!qp.a.IsActive());
    BOOST_REQUIRE(!qp.b.IsActive());

    //everything delivered in order before the peer saw the RST
    BOOST_REQUIRE_EQUAL(qp.m_receivedByB.size(), NUM_MESSAGES);
    for (unsigned int i = 0; i < NUM_MESSAGES; ++i) {
        BOOST_REQUIRE_EQUAL(qp.m_receivedByB[i].size(), 2);
        BOOST_REQUIRE_EQUAL((static_cast<unsigned int>(qp.m_receivedByB[i][0]) << 8) | qp.m_receivedByB[i][1], i);
    }
    BOOST_REQUIRE_LE(qp.m_maxUnackedA, 8);
    //300 data segments plus the RST, modulo 256
    BOOST_REQUIRE_EQUAL(qp.a.GetLastLocalSequenceNumber(), (NUM_MESSAGES + 1) % 256);

    //inert after the callback
    qp.Step(t + boost::posix_time::seconds(5));
    BOOST_REQUIRE(qp.m_toA.empty());
    BOOST_REQUIRE(qp.m_toB.empty());
    BOOST_REQUIRE_EQUAL(qp.m_disconnectReasonsA.size(), 1);
}

BOOST_AUTO_TEST_CASE(RssiDataQueueRetransmissionLimitTestCase)
{
    QueuePair qp;
    qp.Reset();
    qp.m_dropAllFromA = true;
    const boost::posix_time::ptime& t0 = qp.m_t0;
    const uint8_t data[3] = { 1, 2, 3 };
    BOOST_REQUIRE(qp.a.SendUserData(data, sizeof(data), t0));

    boost::posix_time::ptime t = t0;
    while (qp.m_disconnectReasonsA.empty() && (t < (t0 + boost::posix_time::seconds(10)))) {
        t += boost::posix_time::milliseconds(10);
        qp.Step(t);
    }
    BOOST_REQUIRE_EQUAL(qp.m_disconnectReasonsA.size(), 1);
    BOOST_REQUIRE_EQUAL(qp.m_disconnectReasonsA[0], RSSI_DISCONNECT_REASON::RETRANSMISSION_LIMIT);
    //original transmission plus 5 retransmissions, declared dead on the 6th deadline
    BOOST_REQUIRE_EQUAL(qp.m_countDataSegmentsSentFromA, 6);
    BOOST_REQUIRE_EQUAL(t, t0 + boost::posix_time::milliseconds(600));
    BOOST_REQUIRE(!qp.a.IsActive());
    BOOST_REQUIRE(qp.m_receivedByB.empty());
}

BOOST_AUTO_TEST_CASE(RssiDataQueueLossRecoveryTestCase)
{
    //every 3rd datagram from a is lost, messages sent one at a time
    QueuePair qp;
    qp.Reset();
    qp.m_dropEveryNthFromA = 3;
    static const unsigned int NUM_MESSAGES = 50;
    unsigned int numSent = 0;
    boost::posix_time::ptime t = qp.m_t0;
    for (unsigned int step = 0; (step < 100000) && (!qp.AnyDisconnected()); ++step) {
        t += boost::posix_time::milliseconds(1);
        if ((numSent < NUM_MESSAGES) && (qp.m_receivedByB.size() == numSent)) {
            const uint8_t data = static_cast<uint8_t>(numSent);
            BOOST_REQUIRE(qp.a.SendUserData(&data, 1, t));
            ++numSent;
        }
        qp.Step(t);
        if ((qp.m_receivedByB.size() == NUM_MESSAGES) && (qp.a.GetNumUnackedSegments() == 0)) {
            break;
        }
    }
    BOOST_REQUIRE(!qp.AnyDisconnected());
    BOOST_REQUIRE_EQUAL(qp.m_receivedByB.size(), NUM_MESSAGES);
    for (unsigned int i = 0; i < NUM_MESSAGES; ++i) {
        BOOST_REQUIRE_EQUAL(qp.m_receivedByB[i].size(), 1);
        BOOST_REQUIRE_EQUAL(qp.m_receivedByB[i][0], i);
    }
    BOOST_REQUIRE_GT(qp.m_countDataSegmentsSentFromA, NUM_MESSAGES); //retransmissions happened
}

BOOST_AUTO_TEST_CASE(RssiDataQueuePeerResetTestCase)
{
    QueuePair qp;
    qp.Reset();
    const boost::posix_time::ptime& t0 = qp.m_t0;
    const uint8_t data[2] = { 9, 9 };
    BOOST_REQUIRE(qp.b.SendUserData(data, 2, t0));
    qp.m_toA.clear(); //lost, so b still holds unacknowledged data

    RssiSegment rst = RssiSegment::MakeNonSyn(RSSI_CONTROL_BITS::ACK | RSSI_CONTROL_BITS::RST, 1, 42, std::vector<uint8_t>(), true);
    qp.b.SegmentReceived(rst, t0);
    BOOST_REQUIRE_EQUAL(qp.m_disconnectReasonsB.size(), 1);
    BOOST_REQUIRE_EQUAL(qp.m_disconnectReasonsB[0], RSSI_DISCONNECT_REASON::PEER_RESET);
    //the RST is acknowledged before teardown
    BOOST_REQUIRE_EQUAL(qp.m_toA.size(), 1);
    BOOST_REQUIRE(qp.m_toA.front().m_controlBits == RSSI_CONTROL_BITS::ACK);
    BOOST_REQUIRE_EQUAL(qp.m_toA.front().m_acknowledgmentNumber, 1);
    BOOST_REQUIRE_EQUAL(qp.b.GetNumUnackedSegments(), 0);
    BOOST_REQUIRE(!qp.b.SendUserData(data, 2, t0));
}
