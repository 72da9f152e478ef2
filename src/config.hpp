/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#pragma once
#ifndef TAXMAP_CONFIG_HPP
#define TAXMAP_CONFIG_HPP

#include "common.hpp"

#include <boost/json/object.hpp>

#include <string>

namespace taxmap {

// How many source terms must find a counterpart before a node is accepted.
enum class TermAggregation
{
    any // At least one.
,   majority // Strictly more than half.
,   all
};

struct TermPolicy
{
    bool use_stemming = true;
    StringSet stop_words = default_stop_words();

    static auto default_stop_words()
        -> StringSet;
};

struct MatchConfig
{
    double threshold = 0.8; // tnode: minimum edit-distance similarity per term.
    TermAggregation aggregation = TermAggregation::majority;
    bool disambiguate = true;
    double disambiguation_overlap = 0.5;
    double depth_decay = 0.5;
    double min_score = 0.0;
    uint32_t concurrency = 1;
    TermPolicy terms = {};
};

[[ nodiscard ]]
auto from_json( boost::json::object const& obj )
    -> Result< MatchConfig >;
[[ nodiscard ]]
auto load_config( std::string const& json_text )
    -> Result< MatchConfig >;
[[ nodiscard ]]
auto to_aggregation( std::string const& s )
    -> Result< TermAggregation >;
[[ nodiscard ]]
auto to_string( TermAggregation const& agg )
    -> std::string;

} // namespace taxmap

#endif // TAXMAP_CONFIG_HPP
