/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#include <key_path/ranker.hpp>

#include <contract.hpp>
#include <term_set.hpp>

#include <fmt/format.h>
#include <range/v3/algorithm/stable_sort.hpp>
#include <range/v3/view/iota.hpp>
#include <range/v3/view/reverse.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>

#include <cstdlib>

namespace rvs = ranges::views;

namespace taxmap {

KeyPathRanker::KeyPathRanker( SemanticMatcher const& matcher )
    : matcher_{ matcher }
{
}

auto KeyPathRanker::weight( MatchKind const kind )
    -> double
{
    switch( kind )
    {
        case MatchKind::exact: return 1.0;
        case MatchKind::synonym: return 0.85;
        case MatchKind::hypernym: return 0.7;
        case MatchKind::hyponym: return 0.7;
        case MatchKind::edit_distance: return 0.55;
        case MatchKind::context: return 0.4;
        case MatchKind::insufficient: return 0.0;
        case MatchKind::none: return 0.0;
    }

    return 0.0;
}

auto KeyPathRanker::score( std::vector< NodeMatch > const& positions ) const
    -> Score
{
    auto rv = Score{};

    BC_CONTRACT()
        BC_POST([ & ]
        {
            BC_ASSERT( rv >= 0.0 && rv <= 1.0 );
        })
    ;

    auto const decay = matcher_.get().config().depth_decay;
    auto num = 0.0;
    auto den = 0.0;
    auto w = 1.0;

    for( auto const& m : positions )
    {
        if( !m.insufficient() )
        {
            den += w;

            if( m.accepted() )
            {
                num += w * weight( m.kind ) * m.coverage;
            }
        }

        w *= decay;
    }

    if( den > 0.0 )
    {
        rv = num / den;
    }

    return rv;
}

auto KeyPathRanker::rank( MatchedKeyPath const& mkp ) const
    -> Score
{
    if( !mkp.is_match() )
    {
        return 0.0;
    }

    return score( mkp.nodes()
                | rvs::reverse
                | rvs::transform( []( auto const& e ){ return e.match; } )
                | ranges::to< std::vector< NodeMatch > >() );
}

auto KeyPathRanker::rank( KeyPath const& source
                        , KeyPath const& candidate ) const
    -> Score
{
    if( source.empty() || candidate.empty() )
    {
        return 0.0;
    }

    auto const& matcher = matcher_.get();
    auto const& policy = matcher.config().terms;
    auto const len = std::max( source.size(), candidate.size() );
    auto positions = std::vector< NodeMatch >{};

    for( auto const d : rvs::iota( uint32_t{ 0 }, len ) )
    {
        if( d >= source.size() )
        {
            positions.emplace_back( NodeMatch{ MatchKind::none, 0.0, {} } );
        }
        else
        {
            auto const sets = make_extended_term_set( source.path(), source[ source.size() - 1 - d ], policy );

            if( !sets || sets.value().category.empty() )
            {
                positions.emplace_back( NodeMatch{ MatchKind::insufficient, 0.0, {} } );
            }
            else if( d >= candidate.size() )
            {
                positions.emplace_back( NodeMatch{ MatchKind::none, 0.0, {} } );
            }
            else if( auto const csets = make_extended_term_set( candidate.path(), candidate[ candidate.size() - 1 - d ], policy )
                   ; csets )
            {
                positions.emplace_back( matcher.match( sets.value(), csets.value() ) );
            }
            else
            {
                positions.emplace_back( NodeMatch{ MatchKind::none, 0.0, {} } );
            }
        }
    }

    // Leaf mismatch disqualifies, as for aligned key paths.
    if( !positions.front().accepted() )
    {
        return 0.0;
    }

    return score( positions );
}

auto KeyPathRanker::order( std::vector< Ranking > const& rankings ) const
    -> std::vector< Ranking >
{
    auto rv = rankings;
    auto const length_gap = []( Ranking const& r )
    {
        return std::abs( static_cast< int64_t >( r.key_path.candidate_key_path().size() )
                       - static_cast< int64_t >( r.key_path.source_key_path().size() ) );
    };

    ranges::stable_sort( rv
                       , [ & ]( Ranking const& lhs, Ranking const& rhs )
                         {
                             if( lhs.score != rhs.score )
                             {
                                 return lhs.score > rhs.score;
                             }
                             if( auto const lg = length_gap( lhs ), rg = length_gap( rhs )
                               ; lg != rg )
                             {
                                 return lg < rg;
                             }

                             return lhs.candidate_index < rhs.candidate_index;
                         } );

    return rv;
}

auto to_string( Ranking const& ranking )
    -> std::string
{
    return fmt::format( "[{}] {:.3f} {}"
                      , ranking.candidate_index
                      , ranking.score
                      , to_string( ranking.key_path ) );
}

auto operator<<( std::ostream& os
               , Ranking const& ranking )
    -> std::ostream&
{
    os << to_string( ranking );

    return os;
}

} // namespace taxmap
