/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#pragma once
#ifndef TAXMAP_UTIL_JSON_HPP
#define TAXMAP_UTIL_JSON_HPP

#include <common.hpp>

#include <boost/json.hpp>

#include <string>

namespace taxmap {

// Each fetch fails with common::data_not_found for a missing key and common::invalid_value for a wrong kind.
auto fetch_bool( boost::json::object const& obj
               , std::string const& key )
    -> Result< bool >;
auto fetch_float( boost::json::object const& obj
                , std::string const& key )
    -> Result< double >;
auto fetch_object( boost::json::object const& obj
                 , std::string const& key )
    -> Result< boost::json::object >;
auto fetch_string( boost::json::object const& obj
                 , std::string const& key )
    -> Result< std::string >;
auto fetch_strings( boost::json::object const& obj
                  , std::string const& key )
    -> Result< StringVec >;
auto fetch_uint( boost::json::object const& obj
               , std::string const& key )
    -> Result< uint64_t >;
auto fetch_value( boost::json::object const& obj
                , std::string const& key )
    -> Result< boost::json::value >;
auto parse_object( std::string const& text )
    -> Result< boost::json::object >;

} // namespace taxmap

#endif // TAXMAP_UTIL_JSON_HPP
