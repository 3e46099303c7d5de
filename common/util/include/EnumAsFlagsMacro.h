/**
 * @file EnumAsFlagsMacro.h
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
 * This EnumAsFlagsMacro include file gives strongly-typed bit-field enums
 * (wire control bits, protocol flag bytes) inlined bitwise operators,
 * a flag test helper, and a hex ostream operator.
 */

#ifndef _ENUM_AS_FLAGS_MACRO_H
#define _ENUM_AS_FLAGS_MACRO_H 1
#include <stdint.h>
#include <type_traits>
#include <boost/config/detail/suffix.hpp>
#include <ostream>

#define _ENUM_FLAGS_UNDERLYING(ENUMTYPE) std::underlying_type<ENUMTYPE>::type
#define _ENUM_FLAGS_BINARY_OPERATOR(ENUMTYPE, OP) \
BOOST_FORCEINLINE ENUMTYPE operator OP (ENUMTYPE a, ENUMTYPE b) { \
    return static_cast<ENUMTYPE>(static_cast<_ENUM_FLAGS_UNDERLYING(ENUMTYPE)>(a) OP static_cast<_ENUM_FLAGS_UNDERLYING(ENUMTYPE)>(b)); \
} \
BOOST_FORCEINLINE ENUMTYPE &operator OP##= (ENUMTYPE &a, ENUMTYPE b) { a = a OP b; return a; }

//note: static_assert(true, "") is to require a semicolon after the macro to eliminate warnings when -Wpedantic is enabled as a compiler warning
#define MAKE_ENUM_SUPPORT_FLAG_OPERATORS(ENUMTYPE) \
_ENUM_FLAGS_BINARY_OPERATOR(ENUMTYPE, |) \
_ENUM_FLAGS_BINARY_OPERATOR(ENUMTYPE, &) \
_ENUM_FLAGS_BINARY_OPERATOR(ENUMTYPE, ^) \
BOOST_FORCEINLINE ENUMTYPE operator ~ (ENUMTYPE a) { return static_cast<ENUMTYPE>(~static_cast<_ENUM_FLAGS_UNDERLYING(ENUMTYPE)>(a)); } \
BOOST_FORCEINLINE bool HasAnyFlag(ENUMTYPE value, ENUMTYPE flags) { return static_cast<_ENUM_FLAGS_UNDERLYING(ENUMTYPE)>(value & flags) != 0; } static_assert(true, "")

#define MAKE_ENUM_SUPPORT_OSTREAM_OPERATOR(ENUMTYPE) \
BOOST_FORCEINLINE std::ostream& operator<<(std::ostream& os, const ENUMTYPE & a) { \
    os << std::hex << "0x" << static_cast<uint64_t>(static_cast<_ENUM_FLAGS_UNDERLYING(ENUMTYPE)>(a)) << std::dec; return os; \
} static_assert(true, "")


#endif      // _ENUM_AS_FLAGS_MACRO_H
