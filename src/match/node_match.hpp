/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#pragma once
#ifndef TAXMAP_MATCH_NODE_MATCH_HPP
#define TAXMAP_MATCH_NODE_MATCH_HPP

#include <common.hpp>

#include <ostream>
#include <string>
#include <vector>

namespace taxmap {

// Declaration order is strength order: earlier kinds are stronger evidence.
enum class MatchKind
{
    exact
,   synonym
,   hypernym
,   hyponym
,   edit_distance
,   context // Confirmed only by the candidate's parent or children terms.
,   insufficient // Empty term set on either side; neither confirms nor rejects.
,   none
};

struct TermMatch
{
    Term term = {};
    MatchKind kind = MatchKind::none;
    Term matched = {}; // Candidate term (or related phrase) that confirmed the match.
    double similarity = 0.0;

    auto operator==( TermMatch const& ) const -> bool = default;
};

struct NodeMatch
{
    MatchKind kind = MatchKind::none;
    double coverage = 0.0; // Fraction of source terms matched.
    std::vector< TermMatch > terms = {};

    auto accepted() const
        -> bool;
    auto insufficient() const
        -> bool;
};

// True for every kind other than insufficient and none.
[[ nodiscard ]]
auto is_confirming( MatchKind const kind )
    -> bool;
[[ nodiscard ]]
auto weaker( MatchKind const lhs
           , MatchKind const rhs )
    -> MatchKind;
[[ nodiscard ]]
auto to_string( MatchKind const kind )
    -> std::string;
[[ nodiscard ]]
auto to_string( NodeMatch const& match )
    -> std::string;
auto operator<<( std::ostream& os
               , MatchKind const kind )
    -> std::ostream&;

} // namespace taxmap

#endif // TAXMAP_MATCH_NODE_MATCH_HPP
