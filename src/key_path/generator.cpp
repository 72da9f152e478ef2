/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#include <key_path/generator.hpp>

#include <contract.hpp>
#include <error/match.hpp>
#include <util/result.hpp>

#include <fmt/format.h>
#include <range/v3/algorithm/any_of.hpp>
#include <range/v3/algorithm/reverse.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/iota.hpp>
#include <range/v3/view/transform.hpp>

#include <algorithm>
#include <future>

namespace rvs = ranges::views;

namespace taxmap {

namespace {

auto make_term_sets( Path const& path
                   , TermPolicy const& policy )
    -> Result< std::vector< ExtendedTermSet > >
{
    auto rv = std::vector< ExtendedTermSet >{};

    for( auto const i : rvs::iota( uint32_t{ 0 }, path.size() ) )
    {
        rv.emplace_back( TTRY( make_extended_term_set( path, i, policy ) ) );
    }

    return rv;
}

auto make_table( std::vector< ExtendedTermSet > const& source
               , std::vector< ExtendedTermSet > const& candidate
               , SemanticMatcher const& matcher )
    -> std::vector< std::vector< NodeMatch > >
{
    return source
         | rvs::transform( [ & ]( auto const& s )
           {
               return candidate
                    | rvs::transform( [ & ]( auto const& c ){ return matcher.match( s, c ); } )
                    | ranges::to< std::vector< NodeMatch > >();
           } )
         | ranges::to< std::vector< std::vector< NodeMatch > > >();
}

} // namespace anon

KeyPathGenerator::KeyPathGenerator( Path const& source
                                  , std::vector< ExtendedTermSet > const& source_terms
                                  , std::vector< Candidate >&& candidates )
    : source_{ source }
    , source_terms_{ source_terms }
    , candidates_{ std::move( candidates ) }
    , key_path_{ reduce() }
{
}

auto KeyPathGenerator::make( Path const& source
                           , std::vector< Path > const& candidates
                           , SemanticMatcher const& matcher )
    -> Result< KeyPathGenerator >
{
    TM_RESULT_PROLOG();
        TM_RESULT_PUSH( "source", to_string( source ) );
        TM_RESULT_PUSH( "candidates", candidates.size() );

    TAXMAP_ENSURE_MSG( !source.empty(), error_code::match::invalid_input, "source path is empty" );

    auto const& policy = matcher.config().terms;
    auto const source_terms = TTRY( make_term_sets( source, policy ) );

    TAXMAP_ENSURE_MSG( !source_terms.back().category.empty()
                     , error_code::match::invalid_input
                     , fmt::format( "source leaf '{}' has no terms", source.leaf().label ) );

    auto pending = std::vector< Candidate >{};
    auto candidate_terms = std::vector< std::vector< ExtendedTermSet > >{};

    for( auto const i : rvs::iota( uint32_t{ 0 }, static_cast< uint32_t >( candidates.size() ) ) )
    {
        auto const& cand = candidates[ i ];

        if( cand.empty() )
        {
            TM_LOG_MSG( "key_path", fmt::format( "skipping candidate {}: empty path", i ) );

            continue;
        }

        auto cterms = TTRY( make_term_sets( cand, policy ) );

        if( cterms.back().category.empty() )
        {
            TM_LOG_MSG( "key_path", fmt::format( "skipping candidate {}: leaf '{}' has no terms", i, cand.leaf().label ) );

            continue;
        }

        pending.emplace_back( Candidate{ i, std::cref( cand ), {} } );
        candidate_terms.emplace_back( std::move( cterms ) );
    }

    auto const fill = [ & ]( size_t const first
                           , size_t const last )
    {
        for( auto i = first; i < last; ++i )
        {
            pending[ i ].table = make_table( source_terms, candidate_terms[ i ], matcher );
        }
    };
    auto const workers = std::min( static_cast< size_t >( std::max( matcher.config().concurrency, uint32_t{ 1 } ) )
                                 , std::max( pending.size(), size_t{ 1 } ) );

    if( workers == 1 )
    {
        fill( 0, pending.size() );
    }
    else
    {
        auto const chunk = ( pending.size() + workers - 1 ) / workers;
        auto futures = std::vector< std::future< void > >{};

        for( auto first = size_t{ 0 }; first < pending.size(); first += chunk )
        {
            futures.emplace_back( std::async( std::launch::async, fill, first, std::min( first + chunk, pending.size() ) ) );
        }
        for( auto& f : futures )
        {
            f.get();
        }
    }

    return KeyPathGenerator{ source, source_terms, std::move( pending ) };
}

auto KeyPathGenerator::candidate_count() const
    -> uint32_t
{
    return static_cast< uint32_t >( candidates_.size() );
}

auto KeyPathGenerator::is_consistent( KeyPath const& key_path
                                    , Candidate const& candidate ) const
    -> bool
{
    auto const& table = candidate.table;
    auto const leaf_c = candidate.path.get().leaf_index();

    if( key_path.empty()
     || !table[ key_path.indices().back() ][ leaf_c ].accepted() )
    {
        return false;
    }

    auto cursor = leaf_c; // Next candidate match must lie strictly above.

    for( auto pos = key_path.size() - 1; pos > 0; --pos )
    {
        auto const s = key_path[ pos - 1 ];

        if( source_terms_[ s ].category.empty() )
        {
            continue;
        }

        auto found = false;

        for( auto c = cursor; c > 0; --c )
        {
            if( table[ s ][ c - 1 ].accepted() )
            {
                cursor = c - 1;
                found = true;

                break;
            }
        }

        if( !found )
        {
            return false;
        }
    }

    return true;
}

auto KeyPathGenerator::consistent_candidates( KeyPath const& key_path ) const
    -> IndexVec
{
    auto rv = IndexVec{};

    for( auto const i : rvs::iota( uint32_t{ 0 }, candidate_count() ) )
    {
        if( is_consistent( key_path, candidates_[ i ] ) )
        {
            rv.emplace_back( i );
        }
    }

    return rv;
}

auto KeyPathGenerator::is_ruled_out( uint32_t const ancestor
                                   , Candidate const& candidate ) const
    -> bool
{
    auto const& source = source_.get();
    auto const full = KeyPath::full( source );
    auto const leaf_s = source.leaf_index();

    if( !candidate.table[ leaf_s ][ candidate.path.get().leaf_index() ].accepted() )
    {
        return false;
    }

    // Either the ancestor matches nothing above the candidate's leaf, or it is the one node that breaks the
    // candidate's consistency with the full path.
    return !is_consistent( KeyPath{ source, { ancestor, leaf_s } }, candidate )
        || ( !is_consistent( full, candidate ) && is_consistent( full.drop( ancestor ), candidate ) );
}

auto KeyPathGenerator::reduce() const
    -> KeyPath
{
    auto const& source = source_.get();
    auto indices = IndexVec{};

    // Each ancestor is judged against the full path, never against an earlier reduction, so removing candidates can
    // only remove ancestors.
    for( auto const i : rvs::iota( uint32_t{ 0 }, source.leaf_index() ) )
    {
        if( source_terms_[ i ].category.empty() )
        {
            TM_LOG_MSG( "key_path", fmt::format( "dropping '{}': no terms", source[ i ].label ) );
        }
        else if( ranges::any_of( candidates_, [ & ]( auto const& c ){ return is_ruled_out( i, c ); } ) )
        {
            indices.emplace_back( i );
        }
        else
        {
            TM_LOG_MSG( "key_path", fmt::format( "dropping '{}': rules out no candidate", source[ i ].label ) );
        }
    }

    indices.emplace_back( source.leaf_index() );

    auto rv = KeyPath{ source, indices };

    BC_CONTRACT()
        BC_POST([ & ]
        {
            BC_ASSERT( !rv.empty() );
            BC_ASSERT( rv.indices().back() == source.leaf_index() );
        })
    ;

    return rv;
}

auto KeyPathGenerator::align( Candidate const& candidate ) const
    -> MatchedKeyPath
{
    auto const& table = candidate.table;
    auto const& kp = key_path_;
    auto const leaf_s = kp.indices().back();
    auto const leaf_c = candidate.path.get().leaf_index();
    auto nodes = std::vector< MatchedNode >{ MatchedNode{ leaf_s, leaf_c, table[ leaf_s ][ leaf_c ] } };
    auto cursor = leaf_c;

    for( auto pos = kp.size() - 1; pos > 0; --pos )
    {
        auto const s = kp[ pos - 1 ];

        if( source_terms_[ s ].category.empty() )
        {
            nodes.emplace_back( MatchedNode{ s, nullopt, NodeMatch{ MatchKind::insufficient, 0.0, {} } } );

            continue;
        }

        // Nearest direct match above the cursor; a context match only when no direct one exists. A node's own
        // parent or child confirms it by context, so the nearest accepted node may sit beside the true counterpart.
        auto direct = Optional< uint32_t >{};
        auto by_context = Optional< uint32_t >{};

        for( auto c = cursor; c > 0 && !direct; --c )
        {
            auto const& m = table[ s ][ c - 1 ];

            if( !m.accepted() )
            {
                continue;
            }
            else if( m.kind != MatchKind::context )
            {
                direct = c - 1;
            }
            else if( !by_context )
            {
                by_context = c - 1;
            }
        }

        if( auto const c = direct ? direct : by_context
          ; c )
        {
            nodes.emplace_back( MatchedNode{ s, c.value(), table[ s ][ c.value() ] } );
            cursor = c.value();
        }
        else
        {
            nodes.emplace_back( MatchedNode{ s, nullopt, NodeMatch{ MatchKind::none, 0.0, {} } } );
        }
    }

    ranges::reverse( nodes );

    return MatchedKeyPath{ kp, candidate.path, nodes };
}

auto KeyPathGenerator::matched_candidate_key_paths() const
    -> Matches
{
    auto rv = Matches{};

    for( auto const& cand : candidates_ )
    {
        rv.key_paths.emplace_back( align( cand ) );
        rv.candidates.emplace_back( cand.path );
        rv.candidate_indices.emplace_back( cand.index );
    }

    return rv;
}

auto KeyPathGenerator::source_key_path() const
    -> KeyPath const&
{
    return key_path_;
}

auto KeyPathGenerator::source_term_sets() const
    -> std::vector< ExtendedTermSet > const&
{
    return source_terms_;
}

} // namespace taxmap
