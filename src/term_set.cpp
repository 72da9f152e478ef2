/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#include "term_set.hpp"

#include "path.hpp"
#include "util/result.hpp"
#include "util/stem.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <range/v3/algorithm/all_of.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/remove_if.hpp>
#include <range/v3/view/split_when.hpp>
#include <range/v3/view/transform.hpp>

#include <cctype>
#include <string>

namespace rvs = ranges::views;

namespace taxmap {

namespace {

auto is_separator( char const c )
    -> bool
{
    switch( c )
    {
        case '&': case '/': case ',': case ';':
        case '(': case ')': case '+': case '|':
            return true;
        default:
            return std::isspace( static_cast< unsigned char >( c ) ) != 0;
    }
}

auto is_numeric( std::string_view const token )
    -> bool
{
    return ranges::all_of( token, []( char const c ){ return std::isdigit( static_cast< unsigned char >( c ) ) || c == '.' || c == '-'; } );
}

} // namespace anon

auto ExtendedTermSet::context() const
    -> TermSet
{
    auto rv = parent;

    for( auto const& child : children )
    {
        rv.insert( child.begin(), child.end() );
    }

    return rv;
}

auto ExtendedTermSet::empty() const
    -> bool
{
    return category.empty();
}

auto ExtendedTermSet::surface_of( Term const& term ) const
    -> Term
{
    if( auto const it = surface.find( term )
      ; it != surface.end() )
    {
        return it->second;
    }

    return term;
}

namespace {

// Lower-cased token without edge punctuation or apostrophes; empty for stop words and numbers.
auto clean_token( std::string_view const token
                , TermPolicy const& policy )
    -> std::string
{
    // Bytes of multi-byte UTF-8 sequences count as letters; only ASCII punctuation is stripped.
    auto const is_word = []( char const c )
    {
        auto const u = static_cast< unsigned char >( c );

        return u >= 0x80 || std::isalnum( u ) != 0;
    };
    auto first = token.begin();
    auto last = token.end();

    while( first != last && !is_word( *first ) ) { ++first; }
    while( last != first && !is_word( *( last - 1 ) ) ) { --last; }

    auto const lowered = std::string_view{ first, last }
                       | rvs::remove_if( []( char const c ){ return c == '\''; } )
                       | rvs::transform( []( char const c ){ return static_cast< char >( std::tolower( static_cast< unsigned char >( c ) ) ); } )
                       | ranges::to< std::string >();

    if( lowered.empty()
     || is_numeric( lowered )
     || policy.stop_words.contains( lowered ) )
    {
        return {};
    }

    return lowered;
}

} // namespace anon

auto normalize_term( std::string_view const token
                   , TermPolicy const& policy )
    -> std::string
{
    auto const cleaned = clean_token( token, policy );

    if( !cleaned.empty()
     && policy.use_stemming )
    {
        return util::stem( cleaned );
    }

    return cleaned;
}

auto surface_forms( std::string_view const label
                  , TermPolicy const& policy )
    -> SurfaceMap
{
    auto rv = SurfaceMap{};

    if( !policy.use_stemming )
    {
        return rv;
    }

    for( auto const& token : label | rvs::split_when( is_separator ) )
    {
        auto const cleaned = clean_token( token | ranges::to< std::string >(), policy );

        if( cleaned.empty() )
        {
            continue;
        }

        if( auto const stemmed = util::stem( cleaned )
          ; stemmed != cleaned )
        {
            rv.emplace( stemmed, cleaned );
        }
    }

    return rv;
}

auto split_tokens( std::string_view const label
                 , TermPolicy const& policy )
    -> StringVec
{
    return label
         | rvs::split_when( is_separator )
         | rvs::transform( [ & ]( auto const& e ){ return normalize_term( e | ranges::to< std::string >(), policy ); } )
         | rvs::remove_if( []( auto const& e ){ return e.empty(); } )
         | ranges::to< StringVec >();
}

auto split_terms( std::string_view const label
                , TermPolicy const& policy )
    -> TermSet
{
    auto const tokens = split_tokens( label, policy );

    return tokens | ranges::to< TermSet >();
}

auto make_extended_term_set( Label const& category
                           , Label const& parent
                           , StringVec const& children
                           , TermPolicy const& policy )
    -> ExtendedTermSet
{
    auto rv = ExtendedTermSet{ .category = split_terms( category, policy )
                             , .parent = split_terms( parent, policy )
                             , .children = children
                                         | rvs::transform( [ & ]( auto const& e ){ return split_terms( e, policy ); } )
                                         | ranges::to< std::vector< TermSet > >() };

    rv.surface.merge( surface_forms( category, policy ) );
    rv.surface.merge( surface_forms( parent, policy ) );

    for( auto const& child : children )
    {
        rv.surface.merge( surface_forms( child, policy ) );
    }

    return rv;
}

auto make_extended_term_set( Path const& path
                           , uint32_t const index
                           , TermPolicy const& policy )
    -> Result< ExtendedTermSet >
{
    TM_RESULT_PROLOG();
        TM_RESULT_PUSH( "index", index );

    Node const& node = TTRY( path.at( index ) );
    auto const parent = [ & ]() -> Label
    {
        if( auto const p = path.parent( index )
          ; p )
        {
            return path[ p.value() ].label;
        }

        return {};
    }();
    auto children = StringVec{};

    if( auto const c = path.child( index )
      ; c )
    {
        children.emplace_back( path[ c.value() ].label );
    }

    children.insert( children.end(), node.child_labels.begin(), node.child_labels.end() );

    return make_extended_term_set( node.label, parent, children, policy );
}

auto to_string( TermSet const& terms )
    -> std::string
{
    return fmt::format( "{{{}}}", fmt::join( terms, ", " ) );
}

auto to_string( ExtendedTermSet const& ets )
    -> std::string
{
    return fmt::format( "category: {}, parent: {}, children: [{}]"
                      , to_string( ets.category )
                      , to_string( ets.parent )
                      , fmt::join( ets.children | rvs::transform( []( auto const& e ){ return to_string( e ); } ) | ranges::to< StringVec >(), ", " ) );
}

} // namespace taxmap
