/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#include <util/edit_distance.hpp>

#include <contract.hpp>

#include <algorithm>
#include <vector>

namespace taxmap::util {

auto edit_distance( std::string_view const lhs
                  , std::string_view const rhs )
    -> uint32_t
{
    auto const n = lhs.size();
    auto const m = rhs.size();

    if( n == 0 ) { return static_cast< uint32_t >( m ); }
    if( m == 0 ) { return static_cast< uint32_t >( n ); }

    // Row-major ( n + 1 ) x ( m + 1 ) table.
    auto d = std::vector< uint32_t >( ( n + 1 ) * ( m + 1 ), 0 );
    auto const at = [ & ]( size_t const i, size_t const j ) -> uint32_t& { return d[ i * ( m + 1 ) + j ]; };

    for( auto i = size_t{ 0 }; i <= n; ++i ) { at( i, 0 ) = static_cast< uint32_t >( i ); }
    for( auto j = size_t{ 0 }; j <= m; ++j ) { at( 0, j ) = static_cast< uint32_t >( j ); }

    for( auto i = size_t{ 1 }; i <= n; ++i )
    {
        for( auto j = size_t{ 1 }; j <= m; ++j )
        {
            auto const cost = lhs[ i - 1 ] == rhs[ j - 1 ] ? 0u : 1u;

            at( i, j ) = std::min( { at( i - 1, j ) + 1
                                   , at( i, j - 1 ) + 1
                                   , at( i - 1, j - 1 ) + cost } );

            if( i > 1
             && j > 1
             && lhs[ i - 1 ] == rhs[ j - 2 ]
             && lhs[ i - 2 ] == rhs[ j - 1 ] )
            {
                at( i, j ) = std::min( at( i, j ), at( i - 2, j - 2 ) + 1 );
            }
        }
    }

    return at( n, m );
}

auto edit_similarity( std::string_view const lhs
                    , std::string_view const rhs )
    -> double
{
    auto rv = 1.0;

    BC_CONTRACT()
        BC_POST([ & ]
        {
            BC_ASSERT( rv >= 0.0 && rv <= 1.0 );
        })
    ;

    if( auto const longest = std::max( lhs.size(), rhs.size() )
      ; longest > 0 )
    {
        rv = 1.0 - static_cast< double >( edit_distance( lhs, rhs ) ) / static_cast< double >( longest );
    }

    return rv;
}

auto longest_common_substring( std::string_view const lhs
                             , std::string_view const rhs )
    -> uint32_t
{
    auto rv = uint32_t{};
    auto prev = std::vector< uint32_t >( rhs.size() + 1, 0 );
    auto curr = prev;

    for( auto i = size_t{ 1 }; i <= lhs.size(); ++i )
    {
        for( auto j = size_t{ 1 }; j <= rhs.size(); ++j )
        {
            if( lhs[ i - 1 ] == rhs[ j - 1 ] )
            {
                curr[ j ] = prev[ j - 1 ] + 1;
                rv = std::max( rv, curr[ j ] );
            }
            else
            {
                curr[ j ] = 0;
            }
        }

        std::swap( prev, curr );
    }

    return rv;
}

auto common_substring_ratio( std::string_view const lhs
                           , std::string_view const rhs )
    -> double
{
    auto const longest = std::max( lhs.size(), rhs.size() );

    if( longest == 0 )
    {
        return 0.0;
    }

    return static_cast< double >( longest_common_substring( lhs, rhs ) ) / static_cast< double >( longest );
}

} // namespace taxmap::util
