/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#include <taxmap.hpp>

#include <match/semantic_matcher.hpp>
#include <util/result.hpp>

#include <fmt/format.h>

namespace taxmap {

auto map_category( Path const& source
                 , std::vector< Path > const& candidates
                 , SemanticMatcher const& matcher )
    -> Result< std::vector< Ranking > >
{
    TM_RESULT_PROLOG();
        TM_RESULT_PUSH( "source", to_string( source ) );

    auto rv = std::vector< Ranking >{};
    auto const generator = TTRY( KeyPathGenerator::make( source, candidates, matcher ) );
    auto const ranker = KeyPathRanker{ matcher };
    auto const matches = generator.matched_candidate_key_paths();

    TM_LOG_MSG( "key_path", fmt::format( "source key path: {}", to_string( generator.source_key_path() ) ) );

    for( auto i = size_t{ 0 }; i < matches.key_paths.size(); ++i )
    {
        auto const& mkp = matches.key_paths[ i ];

        rv.emplace_back( Ranking{ matches.candidate_indices[ i ], ranker.rank( mkp ), mkp } );
    }

    return ranker.order( rv );
}

auto map_category( Path const& source
                 , std::vector< Path > const& candidates
                 , ontology::Ontology const& onto
                 , MatchConfig const& config )
    -> Result< std::vector< Ranking > >
{
    auto const matcher = SemanticMatcher{ onto, config };

    return map_category( source, candidates, matcher );
}

auto best_match( Path const& source
               , std::vector< Path > const& candidates
               , ontology::Ontology const& onto
               , MatchConfig const& config )
    -> Result< Optional< Ranking > >
{
    TM_RESULT_PROLOG();
        TM_RESULT_PUSH( "source", to_string( source ) );

    auto rv = Optional< Ranking >{};
    auto const rankings = TTRY( map_category( source, candidates, onto, config ) );

    if( !rankings.empty()
     && rankings.front().key_path.is_match()
     && rankings.front().score >= config.min_score )
    {
        rv = rankings.front();
    }
    else
    {
        TM_LOG_MSG( "key_path", fmt::format( "'{}' left unmapped", to_string( source ) ) );
    }

    return rv;
}

} // namespace taxmap
