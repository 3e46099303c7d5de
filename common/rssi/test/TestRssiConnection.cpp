/**
 * @file TestRssiConnection.cpp
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
#include "RssiConnection.h"
#include "Logger.h"
#include <boost/bind/bind.hpp>
#include <boost/make_unique.hpp>

static constexpr srplink::Logger::SubProcess subprocess = srplink::Logger::SubProcess::unittest;

namespace {
struct RssiTestEndpoint {
    RssiTestEndpoint() : m_connectedCount(0), m_disconnectedCount(0) {}

    void OnStateChanged(RSSI_CONNECTION_STATE newState) {
        {
            boost::mutex::scoped_lock cvLock(cvMutex); //boost unit test assertions are not thread safe
            m_states.push_back(newState);
            if (newState == RSSI_CONNECTION_STATE::CONNECTED) {
                ++m_connectedCount;
            }
            else if (newState == RSSI_CONNECTION_STATE::DISCONNECTED) {
                ++m_disconnectedCount;
            }
        }
        cv.notify_all();
    }
    void OnDataReceived(std::vector<uint8_t>& data) {
        {
            boost::mutex::scoped_lock cvLock(cvMutex);
            m_received.push_back(std::move(data));
        }
        cv.notify_all();
    }
    RssiConnection::ConnectionStateChangedCallback_t StateCallback() {
        return boost::bind(&RssiTestEndpoint::OnStateChanged, this, boost::placeholders::_1);
    }
    RssiConnection::DataReceivedCallback_t DataCallback() {
        return boost::bind(&RssiTestEndpoint::OnDataReceived, this, boost::placeholders::_1);
    }
    bool WaitConnected(unsigned int timeoutMs) {
        boost::mutex::scoped_lock cvLock(cvMutex);
        const boost::posix_time::ptime deadline = boost::posix_time::microsec_clock::universal_time() + boost::posix_time::milliseconds(timeoutMs);
        while ((m_connectedCount == 0) && (m_disconnectedCount == 0)) {
            if (!cv.timed_wait(cvLock, deadline)) {
                break;
            }
        }
        return (m_connectedCount != 0) && (m_disconnectedCount == 0);
    }
    bool WaitDisconnected(unsigned int timeoutMs) {
        boost::mutex::scoped_lock cvLock(cvMutex);
        const boost::posix_time::ptime deadline = boost::posix_time::microsec_clock::universal_time() + boost::posix_time::milliseconds(timeoutMs);
        while (m_disconnectedCount == 0) {
            if (!cv.timed_wait(cvLock, deadline)) {
                break;
            }
        }
        return (m_disconnectedCount != 0);
    }
    bool WaitReceivedCount(std::size_t count, unsigned int timeoutMs) {
        boost::mutex::scoped_lock cvLock(cvMutex);
        const boost::posix_time::ptime deadline = boost::posix_time::microsec_clock::universal_time() + boost::posix_time::milliseconds(timeoutMs);
        while (m_received.size() < count) {
            if (!cv.timed_wait(cvLock, deadline)) {
                break;
            }
        }
        return (m_received.size() >= count);
    }

    boost::mutex cvMutex;
    boost::condition_variable cv;
    std::vector<RSSI_CONNECTION_STATE> m_states;
    std::vector<std::vector<uint8_t> > m_received;
    unsigned int m_connectedCount;
    unsigned int m_disconnectedCount;
};

struct EveryNthDropper {
    EveryNthDropper(uint64_t n) : m_n(n), m_count(0), m_dropped(0) {}
    bool ShouldDrop(const std::vector<uint8_t>&, std::size_t) { //runs on the control thread only
        ++m_count;
        if ((m_count % m_n) == 0) {
            ++m_dropped;
            return true;
        }
        return false;
    }
    const uint64_t m_n;
    uint64_t m_count;
    std::atomic<uint64_t> m_dropped;
};

//a listening server on an ephemeral port and a client connected to it over localhost
struct RssiLoopback {
    RssiLoopback() {
        m_serverPtr = boost::make_unique<RssiConnection>(m_serverConfig);
        BOOST_REQUIRE(m_serverPtr->Listen(0, m_server.StateCallback(), m_server.DataCallback()));
        const uint16_t serverPort = m_serverPtr->GetBoundLocalPort();
        BOOST_REQUIRE_NE(serverPort, 0);
        BOOST_REQUIRE(m_serverPtr->GetConnectionState() == RSSI_CONNECTION_STATE::CONNECTING);
        m_clientPtr = boost::make_unique<RssiConnection>(m_clientConfig, serverPort);
    }
    bool ConnectClient() {
        if (!m_clientPtr->Connect("localhost", 0, m_client.StateCallback(), m_client.DataCallback())) {
            return false;
        }
        return m_client.WaitConnected(5000) && m_server.WaitConnected(5000);
    }

    RssiConfig m_serverConfig;
    RssiConfig m_clientConfig;
    RssiTestEndpoint m_server;
    RssiTestEndpoint m_client;
    std::unique_ptr<RssiConnection> m_serverPtr;
    std::unique_ptr<RssiConnection> m_clientPtr;
};
}

BOOST_AUTO_TEST_CASE(RssiConnectionHelloWorldTestCase)
{
    RssiLoopback lb;
    BOOST_REQUIRE(!lb.m_clientPtr->SendData(std::vector<uint8_t>(1, 0))); //not connected yet
    BOOST_REQUIRE(lb.ConnectClient());
    BOOST_REQUIRE(lb.m_clientPtr->GetConnectionState() == RSSI_CONNECTION_STATE::CONNECTED);
    BOOST_REQUIRE(lb.m_serverPtr->GetConnectionState() == RSSI_CONNECTION_STATE::CONNECTED);
    BOOST_REQUIRE_EQUAL(lb.m_clientPtr->GetMaxSegmentSize(), 1024);

    const std::string helloStr("hello world");
    const std::vector<uint8_t> hello(helloStr.begin(), helloStr.end());
    BOOST_REQUIRE(lb.m_clientPtr->SendData(hello));
    BOOST_REQUIRE(lb.m_server.WaitReceivedCount(1, 5000));
    boost::this_thread::sleep(boost::posix_time::milliseconds(200)); //no duplicates show up later
    {
        boost::mutex::scoped_lock cvLock(lb.m_server.cvMutex);
        BOOST_REQUIRE_EQUAL(lb.m_server.m_received.size(), 1);
        BOOST_REQUIRE(lb.m_server.m_received[0] == hello);
        BOOST_REQUIRE_EQUAL(lb.m_server.m_states.size(), 1);
        BOOST_REQUIRE(lb.m_server.m_states[0] == RSSI_CONNECTION_STATE::CONNECTED);
    }

    //and in the other direction, sliced into maxSegmentSize - 8 byte chunks
    std::vector<uint8_t> big(5000);
    for (std::size_t i = 0; i < big.size(); ++i) {
        big[i] = static_cast<uint8_t>(i * 7);
    }
    BOOST_REQUIRE(lb.m_serverPtr->SendData(big));
    const std::size_t expectedChunks = (big.size() + 1015) / 1016;
    BOOST_REQUIRE(lb.m_client.WaitReceivedCount(expectedChunks, 5000));
    {
        boost::mutex::scoped_lock cvLock(lb.m_client.cvMutex);
        BOOST_REQUIRE_EQUAL(lb.m_client.m_received.size(), expectedChunks);
        std::vector<uint8_t> joined;
        for (std::size_t i = 0; i < lb.m_client.m_received.size(); ++i) {
            BOOST_REQUIRE_LE(lb.m_client.m_received[i].size(), 1016);
            joined.insert(joined.end(), lb.m_client.m_received[i].begin(), lb.m_client.m_received[i].end());
        }
        BOOST_REQUIRE(joined == big);
    }
    BOOST_REQUIRE_EQUAL(lb.m_serverPtr->m_countUdpPacketsRejected.load(), 0);
    BOOST_REQUIRE_EQUAL(lb.m_clientPtr->m_countUdpPacketsRejected.load(), 0);
}

BOOST_AUTO_TEST_CASE(RssiConnectionLossyChannelTestCase)
{
    RssiLoopback lb;
    BOOST_REQUIRE(lb.ConnectClient());
    EveryNthDropper dropper(3);
    lb.m_clientPtr->SetUdpDropSimulatorFunction_ThreadSafe(
        boost::bind(&EveryNthDropper::ShouldDrop, &dropper, boost::placeholders::_1, boost::placeholders::_2));

    //request/response style traffic: each message waits for the previous one to arrive
    static const unsigned int NUM_MESSAGES = 20;
    for (unsigned int i = 0; i < NUM_MESSAGES; ++i) {
        const std::vector<uint8_t> msg(10 + i, static_cast<uint8_t>(i));
        BOOST_REQUIRE(lb.m_clientPtr->SendData(msg));
        //worst case maxRetransmissions * retransmissionTimeout of extra latency, plus margin
        BOOST_REQUIRE(lb.m_server.WaitReceivedCount(i + 1, 2000));
    }
    lb.m_clientPtr->SetUdpDropSimulatorFunction_ThreadSafe(RssiConnection::UdpDropSimulatorFunction_t());
    BOOST_REQUIRE(lb.m_clientPtr->GetConnectionState() == RSSI_CONNECTION_STATE::CONNECTED);
    BOOST_REQUIRE_GT(dropper.m_dropped.load(), 0);
    BOOST_REQUIRE_GT(lb.m_clientPtr->m_countUdpPacketsDroppedBySimulator.load(), 0);
    {
        boost::mutex::scoped_lock cvLock(lb.m_server.cvMutex);
        BOOST_REQUIRE_EQUAL(lb.m_server.m_received.size(), NUM_MESSAGES);
        for (unsigned int i = 0; i < NUM_MESSAGES; ++i) {
            BOOST_REQUIRE(lb.m_server.m_received[i] == std::vector<uint8_t>(10 + i, static_cast<uint8_t>(i)));
        }
        BOOST_REQUIRE_EQUAL(lb.m_server.m_disconnectedCount, 0);
    }
    {
        boost::mutex::scoped_lock cvLock(lb.m_client.cvMutex);
        BOOST_REQUIRE_EQUAL(lb.m_client.m_disconnectedCount, 0);
    }
}

BOOST_AUTO_TEST_CASE(RssiConnectionGracefulDisconnectTestCase)
{
    RssiLoopback lb;
    BOOST_REQUIRE(lb.ConnectClient());
    static const unsigned int NUM_MESSAGES = 100;
    for (unsigned int i = 0; i < NUM_MESSAGES; ++i) {
        BOOST_REQUIRE(lb.m_clientPtr->SendData(std::vector<uint8_t>(100, static_cast<uint8_t>(i))));
    }
    lb.m_clientPtr->Disconnect();
    BOOST_REQUIRE(lb.m_client.WaitDisconnected(10000));
    BOOST_REQUIRE(lb.m_server.WaitDisconnected(10000));
    BOOST_REQUIRE(lb.m_clientPtr->GetConnectionState() == RSSI_CONNECTION_STATE::DISCONNECTED);
    BOOST_REQUIRE(lb.m_serverPtr->GetConnectionState() == RSSI_CONNECTION_STATE::DISCONNECTED);
    BOOST_REQUIRE(!lb.m_clientPtr->SendData(std::vector<uint8_t>(1, 0)));
    {
        //all queued data arrived before the peer's teardown
        boost::mutex::scoped_lock cvLock(lb.m_server.cvMutex);
        BOOST_REQUIRE_EQUAL(lb.m_server.m_received.size(), NUM_MESSAGES);
        for (unsigned int i = 0; i < NUM_MESSAGES; ++i) {
            BOOST_REQUIRE(lb.m_server.m_received[i] == std::vector<uint8_t>(100, static_cast<uint8_t>(i)));
        }
        BOOST_REQUIRE_EQUAL(lb.m_server.m_states.size(), 2);
        BOOST_REQUIRE(lb.m_server.m_states[1] == RSSI_CONNECTION_STATE::DISCONNECTED);
    }
    lb.m_clientPtr->CloseAndJoin();
    lb.m_serverPtr->CloseAndJoin();
    LOG_INFO(subprocess) << "client sent " << lb.m_clientPtr->m_countUdpPacketsSent.load() << " datagrams";
}

BOOST_AUTO_TEST_CASE(RssiConnectionNoPeerTestCase)
{
    //nobody listens on the remote port, so the SYN is never answered
    RssiConfig config;
    config.m_retransmissionTimeoutSeconds = 0.02;
    config.m_maxRetransmissions = 3;
    RssiTestEndpoint endpoint;
    uint16_t unusedPort;
    {
        boost::asio::io_service ioService;
        boost::asio::ip::udp::socket socket(ioService, boost::asio::ip::udp::endpoint(boost::asio::ip::udp::v4(), 0));
        unusedPort = socket.local_endpoint().port();
    }
    RssiConnection conn(config, unusedPort);
    BOOST_REQUIRE(conn.Connect("127.0.0.1", 0, endpoint.StateCallback(), endpoint.DataCallback()));
    BOOST_REQUIRE(endpoint.WaitDisconnected(5000));
    BOOST_REQUIRE(conn.GetConnectionState() == RSSI_CONNECTION_STATE::DISCONNECTED);
    {
        boost::mutex::scoped_lock cvLock(endpoint.cvMutex);
        BOOST_REQUIRE_EQUAL(endpoint.m_connectedCount, 0);
    }
    //a connection object is single use
    BOOST_REQUIRE(!conn.Connect("127.0.0.1", 0, endpoint.StateCallback(), endpoint.DataCallback()));
    conn.CloseAndJoin();
    BOOST_REQUIRE_EQUAL(conn.m_countUdpPacketsSent.load() + conn.m_countUdpPacketsDroppedBySimulator.load(), 4); //SYN plus 3 resends
}

BOOST_AUTO_TEST_CASE(RssiConnectionUnresolvableHostTestCase)
{
    RssiConfig config;
    RssiTestEndpoint endpoint;
    RssiConnection conn(config);
    BOOST_REQUIRE(!conn.Connect("this.host.does.not.exist.invalid", 0, endpoint.StateCallback(), endpoint.DataCallback()));
    BOOST_REQUIRE(conn.GetConnectionState() == RSSI_CONNECTION_STATE::DISCONNECTED);
}
