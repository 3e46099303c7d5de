/**
 * @file SrpLinkVersion.hpp
 *
 * @copyright Copyright (c) 2021 United States Government as represented by
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
 * Defines the current srplink version.
 * It is based off of boost/version.hpp
 */

#ifndef SRPLINK_VERSION_HPP
#define SRPLINK_VERSION_HPP


 //  SRPLINK_VERSION % 100 is the patch level
 //  SRPLINK_VERSION / 100 % 1000 is the minor version
 //  SRPLINK_VERSION / 100000 is the major version
 //  00.000.00 where MAJOR_MINOR_PATCH

#define SRPLINK_VERSION 100000

#define SRPLINK_VERSION_PATCH (SRPLINK_VERSION % 100)
#define SRPLINK_VERSION_MINOR ((SRPLINK_VERSION / 100) % 1000)
#define SRPLINK_VERSION_MAJOR (SRPLINK_VERSION / 100000)

#endif
