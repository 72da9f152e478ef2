/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#pragma once
#ifndef TAXMAP_COMMON_HPP
#define TAXMAP_COMMON_HPP

#include "error/master.hpp"
#include <util/log/log.hpp> // Make logging common to all.

#include <boost/optional.hpp>
#include <boost/optional/optional_io.hpp>
#include <boost/outcome.hpp>

#include <compare>
#include <cstdint>
#include <ostream>
#include <set>
#include <string>
#include <vector>

namespace taxmap {

using StringSet = std::set< std::string >;
using StringVec = std::vector< std::string >;
using Label = std::string;
using Term = std::string;
using TermSet = StringSet;
using IndexVec = std::vector< uint32_t >;
using Score = double;
template< typename T > using Optional = boost::optional< T >;
template< typename T > using Result = error_code::Result< T >;
inline auto const nullopt = boost::none;

} // namespace taxmap

#endif // TAXMAP_COMMON_HPP
