/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#include "path.hpp"

#include "contract.hpp"
#include "error/match.hpp"
#include "util/result.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>

#include <string>

namespace rvs = ranges::views;

namespace taxmap {

Path::Path( std::initializer_list< Label > labels )
{
    for( auto const& label : labels )
    {
        add_node( label );
    }
}

Path::Path( StringVec const& labels )
{
    for( auto const& label : labels )
    {
        add_node( label );
    }
}

auto Path::add_node( Label const& label
                   , StringVec const& child_labels )
    -> Node const&
{
    BC_CONTRACT()
        BC_POST([ & ]
        {
            BC_ASSERT( nodes_.back().depth == nodes_.size() - 1 );
        })
    ;

    return nodes_.emplace_back( Node{ .label = label
                                    , .depth = size()
                                    , .child_labels = child_labels } );
}

auto Path::at( uint32_t const index ) const
    -> Result< std::reference_wrapper< Node const > >
{
    TM_RESULT_PROLOG();
        TM_RESULT_PUSH( "index", index );

    TAXMAP_ENSURE( index < nodes_.size(), error_code::match::invalid_node );

    return std::cref( nodes_[ index ] );
}

auto Path::begin() const
    -> const_iterator
{
    return nodes_.begin();
}

auto Path::end() const
    -> const_iterator
{
    return nodes_.end();
}

auto Path::child( uint32_t const index ) const
    -> Optional< uint32_t >
{
    if( index + 1 < size() )
    {
        return index + 1;
    }

    return nullopt;
}

auto Path::empty() const
    -> bool
{
    return nodes_.empty();
}

auto Path::labels() const
    -> StringVec
{
    return nodes_
         | rvs::transform( []( auto const& e ){ return e.label; } )
         | ranges::to< StringVec >();
}

auto Path::leaf() const
    -> Node const&
{
    BC_CONTRACT()
        BC_PRE([ & ]
        {
            BC_ASSERT( !nodes_.empty() );
        })
    ;

    return nodes_.back();
}

auto Path::leaf_index() const
    -> uint32_t
{
    BC_CONTRACT()
        BC_PRE([ & ]
        {
            BC_ASSERT( !nodes_.empty() );
        })
    ;

    return size() - 1;
}

auto Path::parent( uint32_t const index ) const
    -> Optional< uint32_t >
{
    if( index > 0 && index < size() )
    {
        return index - 1;
    }

    return nullopt;
}

auto Path::root() const
    -> Node const&
{
    BC_CONTRACT()
        BC_PRE([ & ]
        {
            BC_ASSERT( !nodes_.empty() );
        })
    ;

    return nodes_.front();
}

auto Path::size() const
    -> uint32_t
{
    return static_cast< uint32_t >( nodes_.size() );
}

auto Path::operator[]( uint32_t const index ) const
    -> Node const&
{
    return nodes_[ index ];
}

auto Path::operator==( Path const& other ) const
    -> bool
{
    return nodes_ == other.nodes_;
}

auto to_string( Path const& path )
    -> std::string
{
    return fmt::format( "{}", fmt::join( path.labels(), " > " ) );
}

auto operator<<( std::ostream& os
               , Path const& path )
    -> std::ostream&
{
    os << to_string( path );

    return os;
}

} // namespace taxmap
