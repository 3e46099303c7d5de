/**
 * @file Environment.cpp
 * @author  Jeff Follo
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

#include "Environment.h"
#include <cstdlib>

#ifndef INSTALL_DATA_DIR
#warning "INSTALL_DATA_DIR not set, using /usr/local/share/srplink"
#define INSTALL_DATA_DIR /usr/local/share/srplink
#endif
#define str_(s) #s
#define str(s) str_(s)

static const std::string InstallDataDir{str(INSTALL_DATA_DIR)};

std::string Environment::GetValue(const std::string & variableName) {
    std::string value;
    if (const char * const variableValue = std::getenv(variableName.c_str())) {
        value = variableValue;
    }
    return value;
}

boost::filesystem::path Environment::GetPathSrpLinkSourceRoot() {
    return boost::filesystem::path(Environment::GetValue("SRPLINK_SOURCE_ROOT"));
}

boost::filesystem::path Environment::GetPathConfigFiles() {
    const boost::filesystem::path sourceRoot = GetPathSrpLinkSourceRoot();
    if (!sourceRoot.empty()) {
        return sourceRoot / "config_files";
    }
    return boost::filesystem::path(InstallDataDir) / "config_files";
}
