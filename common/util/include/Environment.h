/**
 * @file Environment.h
 * @author  Jeff Follo
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
 * This Environment static class is a utility used to get system environmental variables,
 * including SRPLINK_SOURCE_ROOT, and the directory holding the shipped JSON configuration files.
 */

#ifndef ENVIRONMENT_H
#define ENVIRONMENT_H 1

#include <string>
#include <boost/filesystem/path.hpp>
#include "srplink_util_export.h"

class SRPLINK_UTIL_EXPORT Environment {
protected:
    Environment() = delete;
public:
    /// @return the value of the environment variable, or an empty string if it is not set
    static std::string GetValue(const std::string & variableName);
    static boost::filesystem::path GetPathSrpLinkSourceRoot();

    /**
     * @return SRPLINK_SOURCE_ROOT/config_files when SRPLINK_SOURCE_ROOT is set,
     * otherwise the installed data directory's config_files
     */
    static boost::filesystem::path GetPathConfigFiles();
};

#endif /* ENVIRONMENT_H */
