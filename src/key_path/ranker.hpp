/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#pragma once
#ifndef TAXMAP_KEY_PATH_RANKER_HPP
#define TAXMAP_KEY_PATH_RANKER_HPP

#include <common.hpp>
#include <key_path/key_path.hpp>
#include <match/node_match.hpp>
#include <match/semantic_matcher.hpp>

#include <functional>
#include <ostream>
#include <string>
#include <vector>

namespace taxmap {

struct Ranking
{
    uint32_t candidate_index = {}; // Into the caller's candidate list.
    Score score = {};
    MatchedKeyPath key_path;
};

/**
 * @brief Scores key-path alignments in [0,1].
 *
 * Each aligned position contributes weight(kind) * coverage, discounted by depth_decay per step away from the
 * leaf. Positions whose source node has no terms are left out of both sums. A candidate whose leaf does not match
 * scores 0.
 */
class KeyPathRanker
{
public:
    explicit KeyPathRanker( SemanticMatcher const& matcher );

    auto rank( MatchedKeyPath const& mkp ) const
        -> Score;
    // Compares two key paths position by position from the leaf up; unpaired positions count as unmatched.
    auto rank( KeyPath const& source
             , KeyPath const& candidate ) const
        -> Score;
    // Best first: score, then closeness of key-path length to the source's, then input order.
    auto order( std::vector< Ranking > const& rankings ) const
        -> std::vector< Ranking >;

    static auto weight( MatchKind const kind )
        -> double;

protected:
    // Leaf first.
    auto score( std::vector< NodeMatch > const& positions ) const
        -> Score;

private:
    std::reference_wrapper< SemanticMatcher const > matcher_;
};

[[ nodiscard ]]
auto to_string( Ranking const& ranking )
    -> std::string;
auto operator<<( std::ostream& os
               , Ranking const& ranking )
    -> std::ostream&;

} // namespace taxmap

#endif // TAXMAP_KEY_PATH_RANKER_HPP
