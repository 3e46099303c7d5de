/**
 * @file TestJsonSerializable.cpp
 * @author  Brian Tomko <brian.j.tomko@nasa.gov>
 *
 * @copyright Copyright (c) 2021 United States Government as represented by
 * the National Aeronautics and Space Administration.
 * No copyright is claimed in the United States under Title 17, U.S.Code.
 * All Other Rights Reserved.
 *
 * @section LICENSE
 * Released under the NASA Open Source Agreement (NOSA)
 * See LICENSE.md in the source root directory for more information.
 */

#include <boost/test/unit_test.hpp>
#include "JsonSerializable.h"
#include <boost/filesystem/operations.hpp>

namespace {
class RegisterInitConfig : public JsonSerializable {
public:
    RegisterInitConfig() : m_enabled(true), m_address(0), m_name("scratch") {}
    virtual ~RegisterInitConfig() {}

    virtual boost::property_tree::ptree GetNewPropertyTree() const {
        boost::property_tree::ptree pt;
        pt.put("enabled", m_enabled);
        pt.put("address", m_address);
        pt.put("name", m_name);
        return pt;
    }
    virtual bool SetValuesFromPropertyTree(const boost::property_tree::ptree & pt) {
        try {
            m_enabled = pt.get<bool>("enabled");
            m_address = pt.get<uint64_t>("address");
            m_name = pt.get<std::string>("name");
        }
        catch (const boost::property_tree::ptree_error &) {
            return false;
        }
        return true;
    }

    bool m_enabled;
    uint64_t m_address;
    std::string m_name;
};
}

BOOST_AUTO_TEST_CASE(JsonSerializableTestCase)
{
    static const std::string jsonText =
    "{\n"
    "    \"enabled\": false,\n"
    "    \"address\"  :  268435456,\n"
    "    \"name\": \"axiVersion\"\n"
    "}\n";

    {
        boost::property_tree::ptree pt;
        BOOST_REQUIRE(JsonSerializable::GetPropertyTreeFromJsonString(jsonText, pt));
        BOOST_REQUIRE_EQUAL(pt.get<bool>("enabled", true), false);
        BOOST_REQUIRE_EQUAL(pt.get<uint64_t>("address", 0), 0x10000000);
        BOOST_REQUIRE_EQUAL(pt.get<std::string>("name", ""), "axiVersion");
    }
    {
        boost::property_tree::ptree pt;
        BOOST_REQUIRE(!JsonSerializable::GetPropertyTreeFromJsonString("{\"enabled\": ", pt));
    }

    {
        std::set<std::string> jsonKeys;
        JsonSerializable::GetAllJsonKeys(jsonText, jsonKeys);
        BOOST_REQUIRE(jsonKeys == std::set<std::string>({ "enabled", "address", "name" }));
    }

    RegisterInitConfig config;
    BOOST_REQUIRE(config.SetValuesFromJson(jsonText));
    BOOST_REQUIRE(!config.m_enabled);
    BOOST_REQUIRE_EQUAL(config.m_address, 0x10000000);
    BOOST_REQUIRE_EQUAL(config.m_name, "axiVersion");

    //numbers and booleans are written without quotes
    const std::string jsonOut = config.ToJson(false);
    BOOST_REQUIRE_NE(jsonOut.find("\"enabled\":false"), std::string::npos);
    BOOST_REQUIRE_NE(jsonOut.find("\"address\":268435456"), std::string::npos);
    BOOST_REQUIRE_NE(jsonOut.find("\"name\":\"axiVersion\""), std::string::npos);

    std::string errorMessage;
    BOOST_REQUIRE(!JsonSerializable::HasUnusedJsonVariablesInString(config, jsonText, errorMessage));
    BOOST_REQUIRE(errorMessage.empty());

    static const std::string misspelledJsonText =
    "{\n"
    "    \"enabled\": false,\n"
    "    \"adress\": 4,\n"
    "    \"name\": \"x\"\n"
    "}\n";
    BOOST_REQUIRE(JsonSerializable::HasUnusedJsonVariablesInString(config, misspelledJsonText, errorMessage));
    BOOST_REQUIRE_EQUAL(errorMessage, "line 3: unused JSON key: adress");
}

BOOST_AUTO_TEST_CASE(JsonSerializableFileTestCase)
{
    const boost::filesystem::path jsonFilePath = boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("srplink_json_%%%%-%%%%.json");
    RegisterInitConfig config;
    config.m_address = 0x704;
    BOOST_REQUIRE(config.ToJsonFile(jsonFilePath));

    std::string contents;
    BOOST_REQUIRE(JsonSerializable::LoadTextFileIntoString(jsonFilePath, contents));
    BOOST_REQUIRE_EQUAL(contents, config.ToJson());

    boost::property_tree::ptree pt;
    BOOST_REQUIRE(JsonSerializable::GetPropertyTreeFromJsonFilePath(jsonFilePath, pt));
    RegisterInitConfig config2;
    BOOST_REQUIRE(config2.SetValuesFromPropertyTree(pt));
    BOOST_REQUIRE_EQUAL(config2.m_address, 0x704);

    std::string errorMessage;
    BOOST_REQUIRE(!JsonSerializable::HasUnusedJsonVariablesInFilePath(config, jsonFilePath, errorMessage));
    boost::filesystem::remove(jsonFilePath);

    BOOST_REQUIRE(!JsonSerializable::GetPropertyTreeFromJsonFilePath(jsonFilePath, pt));
    BOOST_REQUIRE(!JsonSerializable::LoadTextFileIntoString(jsonFilePath, contents));
}
