/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#pragma once
#ifndef TAXMAP_TERM_SET_HPP
#define TAXMAP_TERM_SET_HPP

#include "common.hpp"
#include "config.hpp"

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace taxmap {

class Path;

using SurfaceMap = std::map< Term, Term >; // Stemmed term to the lower-cased word it came from.

/**
 * @brief Split terms of one category with its tree context. Groups are kept apart: a hit against a single
 *        child's vocabulary says which child confirmed the sense.
 */
struct ExtendedTermSet
{
    TermSet category = {};
    TermSet parent = {}; // Empty for a root.
    std::vector< TermSet > children = {}; // One per child; empty for a leaf.
    SurfaceMap surface = {}; // Only terms that stemming changed.

    // Union of parent and children terms.
    auto context() const
        -> TermSet;
    auto empty() const
        -> bool;
    // Unstemmed form of term, for dictionary lookups; term itself when stemming left it unchanged.
    auto surface_of( Term const& term ) const
        -> Term;
};

/**
 * @brief Lower-cases, strips edge punctuation and apostrophes, and stems per policy.
 * @return Empty string when the token carries no term: stop word, number, or punctuation only.
 */
[[ nodiscard ]]
auto normalize_term( std::string_view const token
                   , TermPolicy const& policy = {} )
    -> std::string;
/**
 * @brief Splits a label on whitespace and "&/,;()+|", dropping stop words and numbers.
 * @note Order is kept; see split_terms() for the set.
 */
[[ nodiscard ]]
auto split_tokens( std::string_view const label
                 , TermPolicy const& policy = {} )
    -> StringVec;
[[ nodiscard ]]
auto split_terms( std::string_view const label
                , TermPolicy const& policy = {} )
    -> TermSet;
[[ nodiscard ]]
auto surface_forms( std::string_view const label
                  , TermPolicy const& policy = {} )
    -> SurfaceMap;
[[ nodiscard ]]
auto make_extended_term_set( Label const& category
                           , Label const& parent
                           , StringVec const& children
                           , TermPolicy const& policy = {} )
    -> ExtendedTermSet;
/**
 * @brief Context is taken positionally: the preceding node is the parent; the following node and the node's
 *        off-path child labels are the children.
 */
[[ nodiscard ]]
auto make_extended_term_set( Path const& path
                           , uint32_t const index
                           , TermPolicy const& policy = {} )
    -> Result< ExtendedTermSet >;
[[ nodiscard ]]
auto to_string( TermSet const& terms )
    -> std::string;
[[ nodiscard ]]
auto to_string( ExtendedTermSet const& ets )
    -> std::string;

} // namespace taxmap

#endif // TAXMAP_TERM_SET_HPP
