/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#include <match/semantic_matcher.hpp>

#include <contract.hpp>
#include <match/disambiguate.hpp>
#include <util/edit_distance.hpp>
#include <util/stem.hpp>
#include <util/result.hpp>

#include <fmt/format.h>
#include <range/v3/algorithm/all_of.hpp>
#include <range/v3/algorithm/count_if.hpp>
#include <range/v3/algorithm/find.hpp>

namespace taxmap {

namespace {

auto keep_stronger( Optional< TermMatch >& best
                  , TermMatch const& candidate )
    -> void
{
    if( !best || candidate.kind < best->kind )
    {
        best = candidate;
    }
}

} // namespace anon

SemanticMatcher::SemanticMatcher( ontology::Ontology const& onto
                                , MatchConfig const& config )
    : cache_{ onto }
    , config_{ config }
{
}

auto SemanticMatcher::config() const
    -> MatchConfig const&
{
    return config_;
}

auto SemanticMatcher::clear_cache()
    -> void
{
    cache_.clear();
}

auto SemanticMatcher::fetch_entry( Term const& term
                                 , Term const& surface ) const
    -> ontology::Entry
{
    auto forms = util::base_forms( surface.empty() ? term : surface );

    if( ranges::find( forms, term ) == forms.end() )
    {
        forms.emplace_back( term );
    }

    // First dictionary form the ontology knows wins.
    for( auto const& form : forms )
    {
        if( auto const entry = cache_.lookup( form )
          ; entry )
        {
            if( !entry.value().empty() )
            {
                return entry.value();
            }
        }
        else
        {
            TM_LOG_MSG( "ontology", fmt::format( "lookup failed for '{}'; falling back to edit distance\n{}", form, error_code::to_string( entry.error() ) ) );
        }
    }

    return {};
}

auto SemanticMatcher::related_terms( Term const& term
                                   , TermSet const& context
                                   , Term const& surface ) const
    -> ontology::RelatedTermSet
{
    auto const entry = fetch_entry( term, surface );

    if( config_.disambiguate )
    {
        if( auto const sense = disambiguate( entry, context, config_.disambiguation_overlap, config_.terms )
          ; sense )
        {
            TM_LOG_MSG( "disambiguate", fmt::format( "'{}' resolved to sense {}: {}", term, sense.value(), entry.senses[ sense.value() ].gloss ) );

            return ontology::relations( entry.senses[ sense.value() ] );
        }
    }

    return ontology::relations( entry );
}

auto SemanticMatcher::match_relation( Term const& term
                                    , ontology::RelatedTermSet const& related
                                    , TermSet const& targets
                                    , TermSet const& target_context
                                    , SurfaceMap const& target_surface ) const
    -> Optional< TermMatch >
{
    auto rv = Optional< TermMatch >{};

    // Forward: a related phrase of the source term names the candidate; every word of the phrase must be present.
    for( auto const& rel : related )
    {
        auto const phrase = split_tokens( rel.term, config_.terms );

        if( !phrase.empty()
         && ranges::all_of( phrase, [ & ]( auto const& e ){ return targets.contains( e ); } ) )
        {
            keep_stronger( rv, TermMatch{ term, to_match_kind( rel.relation ), rel.term, 1.0 } );
        }
    }
    // Reverse: the candidate term's own relations name the source term.
    for( auto const& target : targets )
    {
        auto const it = target_surface.find( target );
        auto const surface = it != target_surface.end() ? it->second : target;

        for( auto const& rel : related_terms( target, target_context, surface ) )
        {
            if( auto const phrase = split_tokens( rel.term, config_.terms )
              ; phrase.size() == 1 && phrase.front() == term )
            {
                keep_stronger( rv, TermMatch{ term, to_match_kind( ontology::invert( rel.relation ) ), target, 1.0 } );
            }
        }
    }

    return rv;
}

auto SemanticMatcher::match_term( Term const& term
                                , TermSet const& source_context
                                , ExtendedTermSet const& candidate
                                , double const tnode
                                , Term const& surface ) const
    -> TermMatch
{
    if( candidate.category.contains( term ) )
    {
        return TermMatch{ term, MatchKind::exact, term, 1.0 };
    }

    auto const related = related_terms( term, source_context, surface );
    auto const candidate_context = candidate.context();

    if( auto const rm = match_relation( term, related, candidate.category, candidate_context, candidate.surface )
      ; rm )
    {
        return rm.value();
    }

    // Edit distance covers out-of-vocabulary terms as well as known terms misspelled on the candidate side.
    {
        auto best = TermMatch{ term, MatchKind::none, {}, 0.0 };

        for( auto const& cterm : candidate.category )
        {
            if( auto const sim = util::edit_similarity( term, cterm )
              ; sim > best.similarity )
            {
                best.matched = cterm;
                best.similarity = sim;
            }
        }

        if( !best.matched.empty() && best.similarity >= tnode )
        {
            best.kind = MatchKind::edit_distance;

            return best;
        }
    }

    // Context: the candidate's parent or children vouch for the term.
    {
        auto const groups = [ & ]
        {
            auto gs = std::vector< TermSet >{ candidate.parent };

            gs.insert( gs.end(), candidate.children.begin(), candidate.children.end() );

            return gs;
        }();

        for( auto const& group : groups )
        {
            if( group.contains( term ) )
            {
                return TermMatch{ term, MatchKind::context, term, 1.0 };
            }
            else if( auto const rm = match_relation( term, related, group, {}, candidate.surface )
                   ; rm )
            {
                return TermMatch{ term, MatchKind::context, rm->matched, 1.0 };
            }
        }
    }

    return TermMatch{ term, MatchKind::none, {}, 0.0 };
}

auto SemanticMatcher::is_accepted( uint32_t const hits
                                 , uint32_t const total ) const
    -> bool
{
    switch( config_.aggregation )
    {
        case TermAggregation::any: return hits >= 1;
        case TermAggregation::majority: return hits * 2 > total;
        case TermAggregation::all: return hits == total;
    }

    return false;
}

auto SemanticMatcher::match( ExtendedTermSet const& source
                           , ExtendedTermSet const& candidate ) const
    -> NodeMatch
{
    return match( source, candidate, config_.threshold );
}

auto SemanticMatcher::match( ExtendedTermSet const& source
                           , ExtendedTermSet const& candidate
                           , double const tnode ) const
    -> NodeMatch
{
    auto rv = NodeMatch{};

    BC_CONTRACT()
        BC_POST([ & ]
        {
            BC_ASSERT( rv.coverage >= 0.0 && rv.coverage <= 1.0 );
            BC_ASSERT( rv.terms.size() == source.category.size() );
        })
    ;

    if( source.category.empty() || candidate.category.empty() )
    {
        rv.kind = MatchKind::insufficient;

        for( auto const& term : source.category )
        {
            rv.terms.emplace_back( TermMatch{ term, MatchKind::insufficient, {}, 0.0 } );
        }

        return rv;
    }

    auto const source_context = source.context();

    for( auto const& term : source.category )
    {
        rv.terms.emplace_back( match_term( term, source_context, candidate, tnode, source.surface_of( term ) ) );
    }

    auto const total = static_cast< uint32_t >( rv.terms.size() );
    auto const hits = static_cast< uint32_t >( ranges::count_if( rv.terms, []( auto const& e ){ return is_confirming( e.kind ); } ) );

    rv.coverage = static_cast< double >( hits ) / static_cast< double >( total );

    if( is_accepted( hits, total ) )
    {
        rv.kind = MatchKind::exact;

        for( auto const& tm : rv.terms )
        {
            if( is_confirming( tm.kind ) )
            {
                rv.kind = weaker( rv.kind, tm.kind );
            }
        }
    }
    else
    {
        rv.kind = MatchKind::none;
    }

    return rv;
}

auto to_match_kind( ontology::Relation const& relation )
    -> MatchKind
{
    switch( relation )
    {
        case ontology::Relation::synonym: return MatchKind::synonym;
        case ontology::Relation::hypernym: return MatchKind::hypernym;
        case ontology::Relation::hyponym: return MatchKind::hyponym;
    }

    return MatchKind::none;
}

} // namespace taxmap
