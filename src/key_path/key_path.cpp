/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#include <key_path/key_path.hpp>

#include <contract.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <range/v3/algorithm/adjacent_find.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/filter.hpp>
#include <range/v3/view/iota.hpp>
#include <range/v3/view/remove.hpp>
#include <range/v3/view/transform.hpp>

namespace rvs = ranges::views;

namespace taxmap {

KeyPath::KeyPath( Path const& path
                , IndexVec const& indices )
    : path_{ path }
    , indices_{ indices }
{
    BC_CONTRACT()
        BC_PRE([ & ]
        {
            BC_ASSERT( ranges::adjacent_find( indices, std::greater_equal<>{} ) == indices.end() );
            BC_ASSERT( indices.empty() || indices.back() < path.size() );
        })
    ;
}

auto KeyPath::full( Path const& path )
    -> KeyPath
{
    return KeyPath{ path
                  , rvs::iota( uint32_t{ 0 }, path.size() ) | ranges::to< IndexVec >() };
}

auto KeyPath::drop( uint32_t const path_index ) const
    -> KeyPath
{
    return KeyPath{ path_.get()
                  , indices_ | rvs::remove( path_index ) | ranges::to< IndexVec >() };
}

auto KeyPath::empty() const
    -> bool
{
    return indices_.empty();
}

auto KeyPath::indices() const
    -> IndexVec const&
{
    return indices_;
}

auto KeyPath::labels() const
    -> StringVec
{
    return indices_
         | rvs::transform( [ & ]( auto const& e ){ return path_.get()[ e ].label; } )
         | ranges::to< StringVec >();
}

auto KeyPath::path() const
    -> Path const&
{
    return path_;
}

auto KeyPath::size() const
    -> uint32_t
{
    return static_cast< uint32_t >( indices_.size() );
}

auto KeyPath::operator[]( uint32_t const position ) const
    -> uint32_t
{
    return indices_[ position ];
}

MatchedKeyPath::MatchedKeyPath( KeyPath const& source
                              , Path const& candidate
                              , std::vector< MatchedNode > const& nodes )
    : source_{ source }
    , candidate_{ candidate }
    , nodes_{ nodes }
{
    BC_CONTRACT()
        BC_PRE([ & ]
        {
            BC_ASSERT( nodes.size() == source.size() );
        })
    ;
}

auto MatchedKeyPath::candidate() const
    -> Path const&
{
    return candidate_;
}

auto MatchedKeyPath::candidate_key_path() const
    -> KeyPath
{
    return KeyPath{ candidate_.get()
                  , nodes_
                  | rvs::filter( []( auto const& e ){ return e.candidate_index && e.match.accepted(); } )
                  | rvs::transform( []( auto const& e ){ return e.candidate_index.value(); } )
                  | ranges::to< IndexVec >() };
}

auto MatchedKeyPath::is_match() const
    -> bool
{
    return !nodes_.empty()
        && nodes_.back().match.accepted();
}

auto MatchedKeyPath::nodes() const
    -> std::vector< MatchedNode > const&
{
    return nodes_;
}

auto MatchedKeyPath::source_key_path() const
    -> KeyPath const&
{
    return source_;
}

auto to_string( KeyPath const& kp )
    -> std::string
{
    return fmt::format( "{}", fmt::join( kp.labels(), " > " ) );
}

auto to_string( MatchedKeyPath const& mkp )
    -> std::string
{
    auto const pairs = mkp.nodes()
                     | rvs::transform( [ & ]( auto const& e )
                       {
                           auto const clabel = e.candidate_index ? mkp.candidate()[ e.candidate_index.value() ].label : std::string{ "-" };

                           return fmt::format( "{} ~ {} ({})"
                                             , mkp.source_key_path().path()[ e.source_index ].label
                                             , clabel
                                             , to_string( e.match.kind ) );
                       } )
                     | ranges::to< StringVec >();

    return fmt::format( "{}", fmt::join( pairs, " > " ) );
}

auto operator<<( std::ostream& os
               , KeyPath const& kp )
    -> std::ostream&
{
    os << to_string( kp );

    return os;
}

} // namespace taxmap
