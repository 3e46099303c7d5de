/**
 * @file TestAxiStreamPacketConnection.cpp
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
#include "AxiStreamPacketConnection.h"
#include "Logger.h"
#include <boost/bind/bind.hpp>
#include <boost/make_unique.hpp>

static constexpr srplink::Logger::SubProcess subprocess = srplink::Logger::SubProcess::unittest;

namespace {
struct AxiStreamTestEndpoint {
    AxiStreamTestEndpoint() : m_connected(false) {}

    void OnStateChanged(RSSI_CONNECTION_STATE newState) {
        {
            boost::mutex::scoped_lock cvLock(cvMutex); //boost unit test assertions are not thread safe
            m_connected = (newState == RSSI_CONNECTION_STATE::CONNECTED);
        }
        cv.notify_all();
    }
    void OnChannelMessage(uint8_t channel, std::vector<uint8_t>& message) {
        {
            boost::mutex::scoped_lock cvLock(cvMutex);
            m_messages[channel].push_back(std::move(message));
        }
        cv.notify_all();
    }
    AxiStreamPacketConnection::ChannelCallback_t ChannelCallback(uint8_t channel) {
        return boost::bind(&AxiStreamTestEndpoint::OnChannelMessage, this, channel, boost::placeholders::_1);
    }
    bool WaitConnected() {
        boost::mutex::scoped_lock cvLock(cvMutex);
        while (!m_connected) {
            if (!cv.timed_wait(cvLock, boost::posix_time::milliseconds(5000))) {
                LOG_ERROR(subprocess) << "timed out waiting for connection";
                return false;
            }
        }
        return true;
    }
    bool WaitMessageCount(uint8_t channel, std::size_t count) {
        boost::mutex::scoped_lock cvLock(cvMutex);
        while (m_messages[channel].size() < count) {
            if (!cv.timed_wait(cvLock, boost::posix_time::milliseconds(5000))) {
                LOG_ERROR(subprocess) << "timed out waiting for messages on channel " << static_cast<unsigned int>(channel);
                return false;
            }
        }
        return true;
    }

    boost::mutex cvMutex;
    boost::condition_variable cv;
    bool m_connected;
    std::map<uint8_t, std::vector<std::vector<uint8_t> > > m_messages;
};
}

BOOST_AUTO_TEST_CASE(AxiStreamPacketConnectionReassemblyTestCase)
{
    RssiConfig serverConfig;
    RssiConfig clientConfig;
    AxiStreamTestEndpoint server;
    AxiStreamTestEndpoint client;
    AxiStreamPacketConnection serverConn(serverConfig);
    serverConn.SetChannelCallback(0, server.ChannelCallback(0));
    serverConn.SetChannelCallback(3, server.ChannelCallback(3));
    BOOST_REQUIRE(serverConn.Listen(0, boost::bind(&AxiStreamTestEndpoint::OnStateChanged, &server, boost::placeholders::_1)));
    AxiStreamPacketConnection clientConn(clientConfig, serverConn.GetBoundLocalPort());
    clientConn.SetChannelCallback(0, client.ChannelCallback(0));
    BOOST_REQUIRE(!clientConn.SendData(0, std::vector<uint8_t>(1, 0))); //not connected yet
    BOOST_REQUIRE(clientConn.Connect("localhost", 0, boost::bind(&AxiStreamTestEndpoint::OnStateChanged, &client, boost::placeholders::_1)));
    BOOST_REQUIRE(client.WaitConnected());
    BOOST_REQUIRE(server.WaitConnected());

    const std::size_t S = clientConn.GetRssiConnection().GetMaxSegmentSize();
    BOOST_REQUIRE_EQUAL(S, 1024);
    BOOST_REQUIRE_EQUAL(clientConn.GetMaxPayloadSizePerPacket(), 1000);

    const std::size_t sizes[6] = { 0, 1, S - 25, S - 24, S - 23, 5 * S };
    std::vector<std::vector<uint8_t> > sent;
    for (unsigned int i = 0; i < 6; ++i) {
        std::vector<uint8_t> msg(sizes[i]);
        for (std::size_t j = 0; j < msg.size(); ++j) {
            msg[j] = static_cast<uint8_t>((j * 13) + i);
        }
        BOOST_REQUIRE(clientConn.SendData(0, msg));
        sent.push_back(std::move(msg));
    }
    //an unregistered channel is silently discarded, another registered channel is independent
    BOOST_REQUIRE(clientConn.SendData(7, std::vector<uint8_t>(100, 7)));
    BOOST_REQUIRE(clientConn.SendData(3, std::vector<uint8_t>(2500, 3)));

    BOOST_REQUIRE(server.WaitMessageCount(0, sent.size()));
    BOOST_REQUIRE(server.WaitMessageCount(3, 1));
    {
        boost::mutex::scoped_lock cvLock(server.cvMutex);
        BOOST_REQUIRE_EQUAL(server.m_messages[0].size(), sent.size());
        for (std::size_t i = 0; i < sent.size(); ++i) {
            BOOST_REQUIRE_EQUAL(server.m_messages[0][i].size(), sent[i].size());
            BOOST_REQUIRE(server.m_messages[0][i] == sent[i]);
        }
        BOOST_REQUIRE(server.m_messages[3][0] == std::vector<uint8_t>(2500, 3));
        BOOST_REQUIRE(server.m_messages.find(7) == server.m_messages.end());
    }
    BOOST_REQUIRE_EQUAL(serverConn.m_countCrcErrors.load(), 0);
    BOOST_REQUIRE_EQUAL(serverConn.m_countMalformedFrames.load(), 0);
    BOOST_REQUIRE_EQUAL(serverConn.m_countFramesForUnregisteredChannels.load(), 1);
    //0 and 1 byte and S-25..S-23 messages need one or two frames, 5*S needs six
    BOOST_REQUIRE_EQUAL(clientConn.m_countFramesSent.load(), 1 + 1 + 1 + 1 + 2 + 6 + 1 + 3);
    BOOST_REQUIRE_EQUAL(serverConn.m_countMessagesReceived.load(), 7);

    //and back to the client
    BOOST_REQUIRE(serverConn.SendData(0, sent[5]));
    BOOST_REQUIRE(client.WaitMessageCount(0, 1));
    {
        boost::mutex::scoped_lock cvLock(client.cvMutex);
        BOOST_REQUIRE(client.m_messages[0][0] == sent[5]);
    }
    clientConn.CloseAndJoin();
    serverConn.CloseAndJoin();
}
