/**
 * @file JsonSerializable.h
 * @author  Brian Tomko <brian.j.tomko@nasa.gov>
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
 * This JsonSerializable virtual base class provides methods to
 * use a boost::property_tree::ptree for the serialization and deserialization
 * of configuration classes to and from JSON.
 * Numbers and booleans are written unquoted, and user supplied JSON can be
 * checked for keys the configuration class does not recognize (misspellings).
 */

#ifndef JSON_SERIALIZABLE_H
#define JSON_SERIALIZABLE_H 1

#include <string>
#include <set>
#include <istream>
#include <boost/property_tree/ptree.hpp>
#include <boost/filesystem/path.hpp>
#include <boost/version.hpp>
#include "srplink_util_export.h"

//since boost versions below 1.59 use boost spirit classic to do json parsing, and boost spirit is not thread safe by default,
//we need to make sure that BOOST_SPIRIT_THREADSAFE is defined globally if using boost version 1.58 and below
//to prevent runtime errors in a multi-threaded environment.
#if BOOST_VERSION < 105900 && !defined(BOOST_SPIRIT_THREADSAFE)
#error "Boost version is below 1.59.0 and BOOST_SPIRIT_THREADSAFE is not defined"
#endif


class SRPLINK_UTIL_EXPORT JsonSerializable {
public:
    static bool LoadTextFileIntoString(const boost::filesystem::path& filePath, std::string& fileContentsAsString);
    static void GetAllJsonKeys(const std::string& jsonText, std::set<std::string> & jsonKeysNoQuotesSetToAppend);

    /**
     * Compare the keys of a user's JSON text against the keys the config would write.
     * @return true if the user JSON contains a key unknown to the config (returnedErrorMessage says which line)
     */
    static bool HasUnusedJsonVariablesInFilePath(const JsonSerializable& config, const boost::filesystem::path& originalUserJsonFilePath, std::string& returnedErrorMessage);
    static bool HasUnusedJsonVariablesInString(const JsonSerializable& config, const std::string& originalUserJsonString, std::string& returnedErrorMessage);
    static bool HasUnusedJsonVariablesInStream(const JsonSerializable& config, std::istream& originalUserJsonStream, std::string& returnedErrorMessage);

    static std::string PtToJsonString(const boost::property_tree::ptree& pt, bool pretty = true);

    std::string ToJson(bool pretty = true) const;
    bool ToJsonFile(const boost::filesystem::path& filePath, bool pretty = true) const;
    static bool GetPropertyTreeFromJsonStream(std::istream& jsonStream, boost::property_tree::ptree& pt);
    static bool GetPropertyTreeFromJsonString(const std::string & jsonStr, boost::property_tree::ptree& pt);
    static bool GetPropertyTreeFromJsonFilePath(const boost::filesystem::path& jsonFilePath, boost::property_tree::ptree& pt);

    virtual boost::property_tree::ptree GetNewPropertyTree() const = 0;
    virtual bool SetValuesFromPropertyTree(const boost::property_tree::ptree & pt) = 0;
    bool SetValuesFromJson(const std::string & jsonString);


protected:
    JsonSerializable();
    virtual ~JsonSerializable();
};

#endif // JSON_SERIALIZABLE_H
