/**
 * @file TestRegisterField.cpp
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
#include "RegisterField.h"
#include "RegisterMemory.h"
#include "AxiVersionDevice.h"
#include "Fpga.h"
#include <map>
#include <algorithm>

//register space backed by a map, counting bus accesses
class MapRegisterAccess : public RegisterAccessInterface {
public:
    MapRegisterAccess() : m_reads(0), m_writes(0), m_failAll(false) {}
    virtual ~MapRegisterAccess() override {}

    virtual bool ReadWord(uint64_t address, uint32_t& value) override {
        if (m_failAll) {
            return false;
        }
        ++m_reads;
        value = m_regs[address];
        return true;
    }
    virtual bool ReadWords(uint64_t address, std::size_t count, std::vector<uint32_t>& values) override {
        if (m_failAll) {
            return false;
        }
        ++m_reads;
        values.resize(count);
        for (std::size_t i = 0; i < count; ++i) {
            values[i] = m_regs[address + (i * 4)];
        }
        return true;
    }
    virtual bool WriteWord(uint64_t address, uint32_t value) override {
        if (m_failAll) {
            return false;
        }
        ++m_writes;
        m_regs[address] = value;
        return true;
    }
    virtual bool WriteWords(uint64_t address, const std::vector<uint32_t>& values) override {
        if (m_failAll) {
            return false;
        }
        ++m_writes;
        for (std::size_t i = 0; i < values.size(); ++i) {
            m_regs[address + (i * 4)] = values[i];
        }
        return true;
    }

    std::map<uint64_t, uint32_t> m_regs;
    unsigned int m_reads;
    unsigned int m_writes;
    bool m_failAll;
};

BOOST_AUTO_TEST_CASE(RegisterFieldReadModifyWriteTestCase)
{
    MapRegisterAccess regs;
    regs.m_regs[0x20] = 0xffff00ff;
    RegisterField field(regs, 0x20, 8, 4);
    BOOST_REQUIRE_EQUAL(field.GetValueMask(), 0xf);

    uint32_t value = 99;
    BOOST_REQUIRE(field.Get(value));
    BOOST_REQUIRE_EQUAL(value, 0);

    BOOST_REQUIRE(field.Set(0xa));
    BOOST_REQUIRE_EQUAL(regs.m_regs[0x20], 0xffff0aff);
    BOOST_REQUIRE(field.Get(value));
    BOOST_REQUIRE_EQUAL(value, 0xa);

    //too wide a value is truncated to the field
    BOOST_REQUIRE(field.Set(0x13));
    BOOST_REQUIRE_EQUAL(regs.m_regs[0x20], 0xffff03ff);

    RegisterField whole(regs, 0x24);
    BOOST_REQUIRE_EQUAL(whole.GetValueMask(), 0xffffffff);
    BOOST_REQUIRE(whole.Set(0xdeadbeef));
    BOOST_REQUIRE(whole.Get(value));
    BOOST_REQUIRE_EQUAL(value, 0xdeadbeef);

    regs.m_failAll = true;
    BOOST_REQUIRE(!field.Get(value));
    BOOST_REQUIRE(!field.Set(1));
}

BOOST_AUTO_TEST_CASE(RegisterFieldAccessModesTestCase)
{
    MapRegisterAccess regs;
    regs.m_regs[0x0] = 0x12345678;
    RegisterField readOnly(regs, 0x0, 0, 32, REGISTER_ACCESS::READ_ONLY);
    uint32_t value;
    BOOST_REQUIRE(!readOnly.Set(1));
    BOOST_REQUIRE_EQUAL(regs.m_writes, 0);
    BOOST_REQUIRE(readOnly.Get(value));
    BOOST_REQUIRE_EQUAL(value, 0x12345678);

    //a write-only field writes without reading back the other bits
    regs.m_regs[0x4] = 0xffffffff;
    RegisterField writeOnly(regs, 0x4, 4, 2, REGISTER_ACCESS::WRITE_ONLY);
    const unsigned int readsBefore = regs.m_reads;
    BOOST_REQUIRE(!writeOnly.Get(value));
    BOOST_REQUIRE(writeOnly.Set(3));
    BOOST_REQUIRE_EQUAL(regs.m_reads, readsBefore);
    BOOST_REQUIRE_EQUAL(regs.m_regs[0x4], 0x30);

    //layout past bit 31 rejects every access
    RegisterField bad(regs, 0x8, 30, 4);
    BOOST_REQUIRE(!bad.Get(value));
    BOOST_REQUIRE(!bad.Set(1));
    RegisterField empty(regs, 0x8, 0, 0);
    BOOST_REQUIRE(!empty.Get(value));
}

BOOST_AUTO_TEST_CASE(RegisterFieldValueNamesTestCase)
{
    MapRegisterAccess regs;
    const RegisterField::value_names_map_t names = { { 0, "Idle" }, { 1, "Run" }, { 2, "Halt" } };
    RegisterField mode(regs, 0x40, 4, 2, REGISTER_ACCESS::READ_WRITE, names);
    std::string name;
    BOOST_REQUIRE(mode.GetName(name));
    BOOST_REQUIRE_EQUAL(name, "Idle");
    BOOST_REQUIRE(mode.SetByName("Halt"));
    BOOST_REQUIRE_EQUAL(regs.m_regs[0x40], 0x20);
    BOOST_REQUIRE(mode.GetName(name));
    BOOST_REQUIRE_EQUAL(name, "Halt");
    BOOST_REQUIRE(!mode.SetByName("Explode"));
    BOOST_REQUIRE(mode.Set(3));
    BOOST_REQUIRE(!mode.GetName(name));
}

BOOST_AUTO_TEST_CASE(RegisterMemoryTestCase)
{
    MapRegisterAccess regs;
    RegisterMemory mem(regs, 0x1000);
    BOOST_REQUIRE_EQUAL(mem.GetBaseAddress(), 0x1000);
    const std::vector<uint32_t> words = { 1, 2, 3, 0xcafebabe };
    BOOST_REQUIRE(mem.Write(words));
    BOOST_REQUIRE_EQUAL(regs.m_writes, 1);
    BOOST_REQUIRE_EQUAL(regs.m_regs[0x100c], 0xcafebabe);
    std::vector<uint32_t> readBack;
    BOOST_REQUIRE(mem.Read(4, readBack));
    BOOST_REQUIRE(readBack == words);
}

BOOST_AUTO_TEST_CASE(AxiVersionDeviceTestCase)
{
    MapRegisterAccess regs;
    const uint64_t base = 0x00020000;
    regs.m_regs[base + AxiVersionDevice::FPGA_VERSION_OFFSET] = 0x01020304;
    regs.m_regs[base + AxiVersionDevice::DEVICE_DNA_OFFSET] = 0x33333333;
    regs.m_regs[base + AxiVersionDevice::DEVICE_DNA_OFFSET + 4] = 0x22222222;
    regs.m_regs[base + AxiVersionDevice::DEVICE_DNA_OFFSET + 8] = 0x00000011;
    regs.m_regs[base + AxiVersionDevice::USER_RESET_OFFSET] = 0x80000000;

    AxiVersionDevice axiVersion(regs, base);
    uint32_t version;
    BOOST_REQUIRE(axiVersion.GetFpgaVersion(version));
    BOOST_REQUIRE_EQUAL(version, 0x01020304);

    BOOST_REQUIRE(axiVersion.Reset());
    BOOST_REQUIRE_EQUAL(regs.m_regs[base + AxiVersionDevice::USER_RESET_OFFSET], 0x80000001);
    BOOST_REQUIRE(axiVersion.Reload());
    BOOST_REQUIRE_EQUAL(regs.m_regs[base + AxiVersionDevice::FPGA_RELOAD_OFFSET], 1);

    std::vector<uint32_t> dna;
    BOOST_REQUIRE(axiVersion.GetDeviceDna(dna));
    BOOST_REQUIRE_EQUAL(dna.size(), AxiVersionDevice::DEVICE_DNA_WORDS);
    BOOST_REQUIRE_EQUAL(dna[0], 0x33333333);
    BOOST_REQUIRE_EQUAL(AxiVersionDevice::DeviceDnaToHexString(dna), "0x00000011_22222222_33333333");
    BOOST_REQUIRE_EQUAL(AxiVersionDevice::DeviceDnaToHexString(std::vector<uint32_t>()), "0x");
}

BOOST_AUTO_TEST_CASE(FpgaWordConversionTestCase)
{
    const std::vector<uint8_t> bytes = { 0xde, 0xad, 0xbe, 0xef, 0x01, 0x00, 0x00, 0x00, 0xff };
    std::vector<uint32_t> words;
    Fpga::LittleEndianBytesToWords(bytes, words);
    BOOST_REQUIRE_EQUAL(words.size(), 2);
    BOOST_REQUIRE_EQUAL(words[0], 0xefbeadde);
    BOOST_REQUIRE_EQUAL(words[1], 1);

    std::vector<uint8_t> back;
    Fpga::WordsToLittleEndianBytes(words, back);
    BOOST_REQUIRE_EQUAL(back.size(), 8);
    BOOST_REQUIRE(std::equal(back.begin(), back.end(), bytes.begin()));
}
