/**
 * @file TestFpgaSimulator.cpp
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
#include "FpgaSimulator.h"
#include "FpgaSimulatorRunner.h"
#include "SrpClient.h"
#include "Fpga.h"
#include "AxiVersionDevice.h"
#include <boost/thread.hpp>
#include <boost/bind/bind.hpp>

namespace {
struct StreamReceiver {
    void OnStreamData(std::vector<uint8_t>& movableStreamData) {
        {
            boost::mutex::scoped_lock lock(m_mutex);
            m_messages.push_back(std::move(movableStreamData));
        }
        m_cv.notify_all();
    }
    bool WaitMessageCount(std::size_t count, unsigned int timeoutMilliseconds) {
        boost::mutex::scoped_lock lock(m_mutex);
        const boost::posix_time::ptime deadline = boost::posix_time::microsec_clock::universal_time() + boost::posix_time::milliseconds(timeoutMilliseconds);
        while (m_messages.size() < count) {
            if (!m_cv.timed_wait(lock, deadline)) {
                break;
            }
        }
        return (m_messages.size() >= count);
    }

    boost::mutex m_mutex;
    boost::condition_variable m_cv;
    std::vector<std::vector<uint8_t> > m_messages;
};

static bool WaitSimulatorIdle(FpgaSimulator& sim, unsigned int timeoutMilliseconds) {
    for (unsigned int waited = 0; waited < timeoutMilliseconds; waited += 10) {
        if (!sim.IsClientConnected()) {
            return true;
        }
        boost::this_thread::sleep(boost::posix_time::milliseconds(10));
    }
    return false;
}
}

BOOST_AUTO_TEST_CASE(FpgaSimulatorReadWriteTestCase)
{
    RssiConfig simConfig;
    FpgaSimulator sim(simConfig);
    sim.SetRegister(0x10000000, 0xEFBEADDE);
    BOOST_REQUIRE(sim.Start(0));
    BOOST_REQUIRE(!sim.Start(0)); //already started

    RssiConfig clientConfig;
    SrpClient client(clientConfig, SrpClient::StreamCallback_t(), sim.GetBoundLocalPort());
    BOOST_REQUIRE(client.ConnectAndStart("localhost", 0));
    BOOST_REQUIRE(client.WaitConnected(5000));
    BOOST_REQUIRE(sim.WaitClientConnected(5000));

    std::vector<uint8_t> data;
    BOOST_REQUIRE(client.Read(0x10000000, 4, data, 2000) == SRP_REQUEST_RESULT::SUCCESS);
    const std::vector<uint8_t> expectedBytes = { 0xde, 0xad, 0xbe, 0xef };
    BOOST_REQUIRE(data == expectedBytes);

    //unwritten registers read as zero
    BOOST_REQUIRE(client.Read(0x200, 8, data, 2000) == SRP_REQUEST_RESULT::SUCCESS);
    BOOST_REQUIRE(data == std::vector<uint8_t>(8, 0));

    const std::vector<uint8_t> writeBytes = { 1, 2, 3, 4, 5, 6, 7, 8 };
    BOOST_REQUIRE(client.Write(0x300, writeBytes, false, 2000) == SRP_REQUEST_RESULT::SUCCESS);
    BOOST_REQUIRE_EQUAL(sim.GetRegister(0x300), 0x04030201);
    BOOST_REQUIRE_EQUAL(sim.GetRegister(0x304), 0x08070605);
    BOOST_REQUIRE(client.Read(0x300, 8, data, 2000) == SRP_REQUEST_RESULT::SUCCESS);
    BOOST_REQUIRE(data == writeBytes);

    //a posted write has no response, so follow it with a read to order it
    BOOST_REQUIRE(client.Write(0x400, std::vector<uint8_t>(4, 0x11), true) == SRP_REQUEST_RESULT::SUCCESS);
    BOOST_REQUIRE(client.Read(0x400, 4, data, 2000) == SRP_REQUEST_RESULT::SUCCESS);
    BOOST_REQUIRE(data == std::vector<uint8_t>(4, 0x11));
    BOOST_REQUIRE_EQUAL(sim.m_countPostedWriteRequests.load(), 1);
    BOOST_REQUIRE_EQUAL(client.m_countUnsolicitedResponses, 0);

    client.Disconnect();
    BOOST_REQUIRE(WaitSimulatorIdle(sim, 5000));
    sim.Stop();
}

BOOST_AUTO_TEST_CASE(FpgaSimulatorErrorResponsesTestCase)
{
    RssiConfig simConfig;
    FpgaSimulator sim(simConfig);
    BOOST_REQUIRE(sim.Start(0));
    RssiConfig clientConfig;
    SrpClient client(clientConfig, SrpClient::StreamCallback_t(), sim.GetBoundLocalPort());
    BOOST_REQUIRE(client.ConnectAndStart("localhost", 0));
    BOOST_REQUIRE(client.WaitConnected(5000));

    std::vector<uint8_t> data;
    //unaligned address or size
    BOOST_REQUIRE(client.Read(0x2, 4, data, 2000) == SRP_REQUEST_RESULT::REQUEST_ERROR);
    BOOST_REQUIRE(data.empty());
    BOOST_REQUIRE(client.Read(0x0, 3, data, 2000) == SRP_REQUEST_RESULT::REQUEST_ERROR);
    BOOST_REQUIRE(client.Write(0x1, std::vector<uint8_t>(4, 0), false, 2000) == SRP_REQUEST_RESULT::REQUEST_ERROR);
    BOOST_REQUIRE_EQUAL(sim.GetRegister(0x0), 0);

    //injected footers map to their result and suppress the access
    SrpFooter footer;
    footer.timeout = true;
    sim.SetNextResponseFooter(footer);
    BOOST_REQUIRE(client.Read(0x0, 4, data, 2000) == SRP_REQUEST_RESULT::TIMEOUT_ERROR);

    footer = SrpFooter();
    footer.memBusResp = 2;
    sim.SetNextResponseFooter(footer);
    BOOST_REQUIRE(client.Write(0x8, std::vector<uint8_t>(4, 0xff), false, 2000) == SRP_REQUEST_RESULT::MEMORY_BUS_ERROR);
    BOOST_REQUIRE_EQUAL(sim.GetRegister(0x8), 0);

    footer = SrpFooter();
    footer.frameError = true;
    footer.reqError = true;
    sim.SetNextResponseFooter(footer);
    BOOST_REQUIRE(client.Read(0x0, 4, data, 2000) == SRP_REQUEST_RESULT::FRAME_ERROR);

    //one shot only
    BOOST_REQUIRE(client.Read(0x0, 4, data, 2000) == SRP_REQUEST_RESULT::SUCCESS);
    BOOST_REQUIRE_EQUAL(sim.m_countErrorResponses.load(), 6);

    client.Disconnect();
    BOOST_REQUIRE(WaitSimulatorIdle(sim, 5000));
    sim.Stop();
}

BOOST_AUTO_TEST_CASE(FpgaSimulatorPostedAndNullRequestsTestCase)
{
    RssiConfig simConfig;
    FpgaSimulator sim(simConfig);
    BOOST_REQUIRE(sim.Start(0));

    //raw SRP frames, so that opcodes the client never sends can be tested
    RssiConfig clientConfig;
    AxiStreamPacketConnection conn(clientConfig, sim.GetBoundLocalPort());
    StreamReceiver responses;
    conn.SetChannelCallback(FpgaSimulator::SRP_CHANNEL, boost::bind(&StreamReceiver::OnStreamData, &responses, boost::placeholders::_1));
    BOOST_REQUIRE(conn.Connect("localhost", 0, RssiConnection::ConnectionStateChangedCallback_t()));
    for (unsigned int waited = 0; (conn.GetConnectionState() != RSSI_CONNECTION_STATE::CONNECTED) && (waited < 5000); waited += 10) {
        boost::this_thread::sleep(boost::posix_time::milliseconds(10));
    }
    BOOST_REQUIRE(conn.GetConnectionState() == RSSI_CONNECTION_STATE::CONNECTED);

    //an injected footer is kept for the next answered request
    SrpFooter footer;
    footer.memBusResp = 1;
    sim.SetNextResponseFooter(footer);

    std::vector<uint8_t> serialization;
    SrpPacket posted;
    posted.m_header.opcode = SRP_OPCODE::POSTED_WRITE;
    posted.m_header.transactionId = 1;
    posted.m_header.address = 0x100;
    posted.m_header.size = 3;
    posted.m_payload.assign(4, 0x22);
    posted.Serialize(serialization);
    BOOST_REQUIRE(conn.SendData(FpgaSimulator::SRP_CHANNEL, serialization));

    //unaligned, so dropped without an error response
    posted.m_header.transactionId = 2;
    posted.m_header.address = 0x102;
    posted.Serialize(serialization);
    BOOST_REQUIRE(conn.SendData(FpgaSimulator::SRP_CHANNEL, serialization));

    SrpPacket nullRequest;
    nullRequest.m_header.opcode = SRP_OPCODE::NULL_REQUEST;
    nullRequest.m_header.transactionId = 3;
    nullRequest.Serialize(serialization);
    BOOST_REQUIRE(conn.SendData(FpgaSimulator::SRP_CHANNEL, serialization));

    //frames arrive in order, so the first answer would belong to a posted write if it had one
    BOOST_REQUIRE(responses.WaitMessageCount(1, 5000));
    BOOST_REQUIRE(!responses.WaitMessageCount(2, 300));
    SrpPacket response;
    BOOST_REQUIRE(response.DeserializeResponse(responses.m_messages[0].data(), responses.m_messages[0].size()));
    BOOST_REQUIRE_EQUAL(response.m_header.transactionId, 3);
    BOOST_REQUIRE(response.m_header.opcode == SRP_OPCODE::NULL_REQUEST);
    BOOST_REQUIRE(response.m_payload.empty());
    BOOST_REQUIRE_EQUAL(static_cast<unsigned int>(response.m_footer.memBusResp), 1);

    BOOST_REQUIRE_EQUAL(sim.GetRegister(0x100), 0x22222222);
    BOOST_REQUIRE_EQUAL(sim.GetRegister(0x102), 0);
    BOOST_REQUIRE_EQUAL(sim.m_countPostedWriteRequests.load(), 2);
    BOOST_REQUIRE_EQUAL(sim.m_countNullRequests.load(), 1);
    BOOST_REQUIRE_EQUAL(sim.m_countErrorResponses.load(), 1);

    conn.Disconnect();
    BOOST_REQUIRE(WaitSimulatorIdle(sim, 5000));
    conn.CloseAndJoin();
    sim.Stop();
}

BOOST_AUTO_TEST_CASE(FpgaGivesUpAfterRetryCountTestCase)
{
    //find a port with nothing listening on it
    uint16_t deadPort;
    {
        RssiConfig simConfig;
        FpgaSimulator sim(simConfig);
        BOOST_REQUIRE(sim.Start(0));
        deadPort = sim.GetBoundLocalPort();
        sim.Stop();
    }

    RssiConfig clientConfig;
    Fpga fpga(clientConfig, SrpClient::StreamCallback_t(), deadPort, 200, 100);
    BOOST_REQUIRE(!fpga.Connect("localhost", 0));
    BOOST_REQUIRE_EQUAL(fpga.GetSrpClient().m_countReconnects, 0);

    //every attempt but the last one reconnects
    uint32_t value = 0;
    BOOST_REQUIRE(!fpga.ReadWord(0x0, value));
    BOOST_REQUIRE_EQUAL(fpga.GetSrpClient().m_countReconnects, Fpga::RETRY_COUNT - 1);
    BOOST_REQUIRE(!fpga.WriteWord(0x0, 1));
    BOOST_REQUIRE_EQUAL(fpga.GetSrpClient().m_countReconnects, 2 * (Fpga::RETRY_COUNT - 1));
    BOOST_REQUIRE_EQUAL(fpga.GetSrpClient().m_countReads, 0);
}

BOOST_AUTO_TEST_CASE(FpgaSimulatorStreamAndReconnectTestCase)
{
    RssiConfig simConfig;
    FpgaSimulator sim(simConfig);
    BOOST_REQUIRE(sim.Start(0));
    BOOST_REQUIRE(!sim.SendStreamData(std::vector<uint8_t>(10, 1))); //no client yet

    StreamReceiver receiver;
    RssiConfig clientConfig;
    SrpClient client(clientConfig, boost::bind(&StreamReceiver::OnStreamData, &receiver, boost::placeholders::_1), sim.GetBoundLocalPort());
    BOOST_REQUIRE(client.ConnectAndStart("localhost", 0));
    BOOST_REQUIRE(client.WaitConnected(5000));
    BOOST_REQUIRE(sim.WaitClientConnected(5000));

    std::vector<uint8_t> streamData(3000);
    for (std::size_t i = 0; i < streamData.size(); ++i) {
        streamData[i] = static_cast<uint8_t>(i);
    }
    BOOST_REQUIRE(sim.SendStreamData(streamData));
    BOOST_REQUIRE(receiver.WaitMessageCount(1, 5000));
    BOOST_REQUIRE(receiver.m_messages[0] == streamData);

    client.Disconnect();
    BOOST_REQUIRE(WaitSimulatorIdle(sim, 5000));
    boost::this_thread::sleep(boost::posix_time::milliseconds(200)); //let the simulator listen again

    BOOST_REQUIRE(client.Reconnect(5000));
    BOOST_REQUIRE_EQUAL(client.m_countReconnects, 1);
    BOOST_REQUIRE(sim.WaitClientConnected(5000));
    BOOST_REQUIRE_EQUAL(sim.m_countConnections.load(), 2);
    sim.SetRegister(0x20, 0xabcd);
    std::vector<uint8_t> data;
    BOOST_REQUIRE(client.Read(0x20, 4, data, 2000) == SRP_REQUEST_RESULT::SUCCESS);
    BOOST_REQUIRE_EQUAL(data[0], 0xcd);
    BOOST_REQUIRE_EQUAL(data[1], 0xab);

    client.Disconnect();
    BOOST_REQUIRE(WaitSimulatorIdle(sim, 5000));
    sim.Stop();
}

BOOST_AUTO_TEST_CASE(FpgaAxiVersionDeviceTestCase)
{
    RssiConfig simConfig;
    FpgaSimulator sim(simConfig);
    const uint64_t base = 0x00020000;
    sim.SetRegister(base + AxiVersionDevice::FPGA_VERSION_OFFSET, 0x01000203);
    sim.SetRegister(base + AxiVersionDevice::DEVICE_DNA_OFFSET, 0x89abcdef);
    sim.SetRegister(base + AxiVersionDevice::DEVICE_DNA_OFFSET + 4, 0x01234567);
    sim.SetRegister(base + AxiVersionDevice::DEVICE_DNA_OFFSET + 8, 0x00000042);
    BOOST_REQUIRE(sim.Start(0));

    RssiConfig clientConfig;
    Fpga fpga(clientConfig, SrpClient::StreamCallback_t(), sim.GetBoundLocalPort(), 2000, 5000);
    BOOST_REQUIRE(fpga.Connect("localhost", 0));

    AxiVersionDevice axiVersion(fpga, base);
    uint32_t version;
    BOOST_REQUIRE(axiVersion.GetFpgaVersion(version));
    BOOST_REQUIRE_EQUAL(version, 0x01000203);
    std::vector<uint32_t> dna;
    BOOST_REQUIRE(axiVersion.GetDeviceDna(dna));
    BOOST_REQUIRE_EQUAL(AxiVersionDevice::DeviceDnaToHexString(dna), "0x00000042_01234567_89abcdef");

    BOOST_REQUIRE(axiVersion.Reset());
    BOOST_REQUIRE_EQUAL(sim.GetRegister(base + AxiVersionDevice::USER_RESET_OFFSET), 1);

    const std::vector<uint32_t> words = { 10, 20, 30 };
    BOOST_REQUIRE(fpga.WriteWords(0x5000, words));
    std::vector<uint32_t> readBack;
    BOOST_REQUIRE(fpga.ReadWords(0x5000, 3, readBack));
    BOOST_REQUIRE(readBack == words);

    //a dropped connection is re-established transparently
    fpga.GetSrpClient().Disconnect();
    BOOST_REQUIRE(WaitSimulatorIdle(sim, 5000));
    for (unsigned int i = 0; (i < 100) && fpga.GetSrpClient().IsConnected(); ++i) {
        boost::this_thread::sleep(boost::posix_time::milliseconds(10));
    }
    BOOST_REQUIRE(!fpga.GetSrpClient().IsConnected());
    uint32_t value;
    BOOST_REQUIRE(fpga.ReadWord(0x5004, value));
    BOOST_REQUIRE_EQUAL(value, 20);
    BOOST_REQUIRE_GE(fpga.GetSrpClient().m_countReconnects, 1);

    //a device error is not retried
    SrpFooter footer;
    footer.verMismatch = true;
    sim.SetNextResponseFooter(footer);
    BOOST_REQUIRE(!fpga.WriteWord(0x5000, 1));
    BOOST_REQUIRE_EQUAL(sim.GetRegister(0x5000), 10);

    fpga.GetSrpClient().CloseAndJoin();
    sim.Stop();
}

BOOST_AUTO_TEST_CASE(FpgaSimulatorRegisterAssignmentTestCase)
{
    uint64_t address;
    uint32_t value;
    BOOST_REQUIRE(FpgaSimulatorRunner::ParseRegisterAssignment("0x10000000=0xEFBEADDE", address, value));
    BOOST_REQUIRE_EQUAL(address, 0x10000000);
    BOOST_REQUIRE_EQUAL(value, 0xEFBEADDE);
    BOOST_REQUIRE(FpgaSimulatorRunner::ParseRegisterAssignment("256=42", address, value));
    BOOST_REQUIRE_EQUAL(address, 256);
    BOOST_REQUIRE_EQUAL(value, 42);
    BOOST_REQUIRE(!FpgaSimulatorRunner::ParseRegisterAssignment("256", address, value));
    BOOST_REQUIRE(!FpgaSimulatorRunner::ParseRegisterAssignment("=5", address, value));
    BOOST_REQUIRE(!FpgaSimulatorRunner::ParseRegisterAssignment("0x10=", address, value));
    BOOST_REQUIRE(!FpgaSimulatorRunner::ParseRegisterAssignment("0x10=0x100000000", address, value));
    BOOST_REQUIRE(!FpgaSimulatorRunner::ParseRegisterAssignment("0x10=12abc", address, value));
    BOOST_REQUIRE(!FpgaSimulatorRunner::ParseRegisterAssignment("-1=3", address, value));
}
