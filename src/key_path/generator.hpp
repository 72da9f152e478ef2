/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#pragma once
#ifndef TAXMAP_KEY_PATH_GENERATOR_HPP
#define TAXMAP_KEY_PATH_GENERATOR_HPP

#include <common.hpp>
#include <key_path/key_path.hpp>
#include <match/node_match.hpp>
#include <match/semantic_matcher.hpp>
#include <path.hpp>
#include <term_set.hpp>

#include <functional>
#include <vector>

namespace taxmap {

/**
 * @brief Finds the minimal subsequence of the source path (its key path) that still selects the same candidates,
 *        and aligns it against each candidate.
 *
 * A candidate is consistent with a key path K when its leaf matches K's leaf and K's remaining nodes, walked
 * upward, match candidate ancestors in the same upward order. The leaf is always kept. An ancestor is kept when it
 * rules out some candidate whose leaf matches: the ancestor matches nothing above that leaf, or dropping it alone
 * from the full path makes the candidate consistent. Ancestors are judged independently, so a subset of the
 * candidates never yields a longer key path.
 *
 * Node matches for every (source node, candidate node) pair are computed once in make() and reused by both the
 * reduction and the alignment.
 *
 * @note Source, candidates and matcher are referenced, not copied; they must outlive the generator and anything
 *       it returns.
 */
class KeyPathGenerator
{
public:
    struct Matches
    {
        std::vector< MatchedKeyPath > key_paths = {};
        std::vector< std::reference_wrapper< Path const > > candidates = {};
        IndexVec candidate_indices = {}; // Into the candidate list given to make().
    };

    static auto make( Path const& source
                    , std::vector< Path > const& candidates
                    , SemanticMatcher const& matcher )
        -> Result< KeyPathGenerator >;
    static auto make( Path&&, std::vector< Path > const&, SemanticMatcher const& ) -> Result< KeyPathGenerator > = delete;
    static auto make( Path const&, std::vector< Path >&&, SemanticMatcher const& ) -> Result< KeyPathGenerator > = delete;

    [[ nodiscard ]]
    auto candidate_count() const
        -> uint32_t;
    // Positions into the valid candidates consistent with key_path.
    [[ nodiscard ]]
    auto consistent_candidates( KeyPath const& key_path ) const
        -> IndexVec;
    [[ nodiscard ]]
    auto matched_candidate_key_paths() const
        -> Matches;
    auto source_key_path() const
        -> KeyPath const&;
    auto source_term_sets() const
        -> std::vector< ExtendedTermSet > const&;

protected:
    using MatchTable = std::vector< std::vector< NodeMatch > >; // [ source index ][ candidate index ]

    struct Candidate
    {
        uint32_t index = {};
        std::reference_wrapper< Path const > path;
        MatchTable table = {};
    };

    KeyPathGenerator( Path const& source
                    , std::vector< ExtendedTermSet > const& source_terms
                    , std::vector< Candidate >&& candidates );

    auto is_consistent( KeyPath const& key_path
                      , Candidate const& candidate ) const
        -> bool;
    auto is_ruled_out( uint32_t const ancestor
                     , Candidate const& candidate ) const
        -> bool;
    auto align( Candidate const& candidate ) const
        -> MatchedKeyPath;
    auto reduce() const
        -> KeyPath;

private:
    std::reference_wrapper< Path const > source_;
    std::vector< ExtendedTermSet > source_terms_ = {};
    std::vector< Candidate > candidates_ = {};
    KeyPath key_path_;
};

} // namespace taxmap

#endif // TAXMAP_KEY_PATH_GENERATOR_HPP
