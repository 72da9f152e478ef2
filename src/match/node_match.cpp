/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#include <match/node_match.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>

#include <algorithm>

namespace taxmap {

auto NodeMatch::accepted() const
    -> bool
{
    return is_confirming( kind );
}

auto NodeMatch::insufficient() const
    -> bool
{
    return kind == MatchKind::insufficient;
}

auto is_confirming( MatchKind const kind )
    -> bool
{
    return kind != MatchKind::insufficient
        && kind != MatchKind::none;
}

auto weaker( MatchKind const lhs
           , MatchKind const rhs )
    -> MatchKind
{
    return std::max( lhs, rhs );
}

auto to_string( MatchKind const kind )
    -> std::string
{
    switch( kind )
    {
        case MatchKind::exact: return "exact";
        case MatchKind::synonym: return "synonym";
        case MatchKind::hypernym: return "hypernym";
        case MatchKind::hyponym: return "hyponym";
        case MatchKind::edit_distance: return "edit_distance";
        case MatchKind::context: return "context";
        case MatchKind::insufficient: return "insufficient";
        case MatchKind::none: return "none";
    }

    return "unknown";
}

auto to_string( NodeMatch const& match )
    -> std::string
{
    auto const terms = match.terms
                     | ranges::views::transform( []( auto const& e ){ return fmt::format( "{}->{}:{}", e.term, e.matched, to_string( e.kind ) ); } )
                     | ranges::to< StringVec >();

    return fmt::format( "{}({:.2f})[{}]", to_string( match.kind ), match.coverage, fmt::join( terms, ", " ) );
}

auto operator<<( std::ostream& os
               , MatchKind const kind )
    -> std::ostream&
{
    os << to_string( kind );

    return os;
}

} // namespace taxmap
