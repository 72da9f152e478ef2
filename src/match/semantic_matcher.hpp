/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#pragma once
#ifndef TAXMAP_MATCH_SEMANTIC_MATCHER_HPP
#define TAXMAP_MATCH_SEMANTIC_MATCHER_HPP

#include <common.hpp>
#include <config.hpp>
#include <match/node_match.hpp>
#include <ontology/cached_ontology.hpp>
#include <ontology/ontology.hpp>
#include <term_set.hpp>

namespace taxmap {

/**
 * @brief Decides whether two categories denote the same concept.
 *
 * Per source term: exact, then ontology relation (synonym, hypernym, hyponym, in both directions), then
 * edit-distance similarity against tnode, then the same lexical tests against the candidate's context. Relation
 * matches are categorical and ignore tnode. Ontology failures degrade to "no relations known".
 *
 * Lookups go through a private read-through cache, so one matcher may be shared by concurrent callers.
 */
class SemanticMatcher
{
public:
    SemanticMatcher( ontology::Ontology const& onto
                   , MatchConfig const& config = {} );

    auto config() const
        -> MatchConfig const&;
    auto match( ExtendedTermSet const& source
              , ExtendedTermSet const& candidate ) const
        -> NodeMatch;
    auto match( ExtendedTermSet const& source
              , ExtendedTermSet const& candidate
              , double const tnode ) const
        -> NodeMatch;
    /**
     * @param surface Unstemmed form of term; ontology lookups try it and its singular forms before the stem.
     */
    auto match_term( Term const& term
                   , TermSet const& source_context
                   , ExtendedTermSet const& candidate
                   , double const tnode
                   , Term const& surface = {} ) const
        -> TermMatch;
    /**
     * @brief Relations of term, restricted to the sense that fits the context when disambiguation is on.
     */
    auto related_terms( Term const& term
                      , TermSet const& context
                      , Term const& surface = {} ) const
        -> ontology::RelatedTermSet;
    auto clear_cache()
        -> void;

protected:
    auto fetch_entry( Term const& term
                    , Term const& surface ) const
        -> ontology::Entry;
    auto match_relation( Term const& term
                       , ontology::RelatedTermSet const& related
                       , TermSet const& targets
                       , TermSet const& target_context
                       , SurfaceMap const& target_surface ) const
        -> Optional< TermMatch >;
    auto is_accepted( uint32_t const hits
                    , uint32_t const total ) const
        -> bool;

private:
    ontology::CachedOntology cache_;
    MatchConfig config_;
};

[[ nodiscard ]]
auto to_match_kind( ontology::Relation const& relation )
    -> MatchKind;

} // namespace taxmap

#endif // TAXMAP_MATCH_SEMANTIC_MATCHER_HPP
