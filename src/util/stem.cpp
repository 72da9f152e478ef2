/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#include <util/stem.hpp>

#include <range/v3/algorithm/find.hpp>

#include <array>
#include <string>
#include <string_view>

namespace taxmap::util {

namespace {

auto ends_with( std::string_view const word
              , std::string_view const suffix )
    -> bool
{
    return word.size() >= suffix.size()
        && word.substr( word.size() - suffix.size() ) == suffix;
}

auto drop( std::string_view const word
         , size_t const n )
    -> std::string
{
    return std::string{ word.substr( 0, word.size() - n ) };
}

} // namespace anon

auto stem( std::string_view const word )
    -> std::string
{
    auto constexpr keep = std::array< std::string_view, 3 >{ "ss", "us", "is" };
    auto constexpr sibilant = std::array< std::string_view, 4 >{ "ches", "shes", "xes", "zes" };

    if( word.size() <= 3 )
    {
        return std::string{ word };
    }
    else if( ends_with( word, "ies" ) && word.size() > 4 )
    {
        return drop( word, 3 ) + "y";
    }
    else if( ends_with( word, "ie" ) )
    {
        return drop( word, 2 ) + "y"; // "cookie" stems as "cookies" does.
    }
    else if( ends_with( word, "sses" ) )
    {
        return drop( word, 2 );
    }

    for( auto const& suffix : sibilant )
    {
        if( ends_with( word, suffix ) )
        {
            return drop( word, 2 );
        }
    }
    for( auto const& suffix : keep )
    {
        if( ends_with( word, suffix ) )
        {
            return std::string{ word };
        }
    }

    if( ends_with( word, "s" ) )
    {
        return drop( word, 1 );
    }

    return std::string{ word };
}

auto base_forms( std::string_view const word )
    -> StringVec
{
    auto rv = StringVec{ std::string{ word } };
    auto const add = [ & ]( std::string const& form )
    {
        if( form.size() > 1
         && ranges::find( rv, form ) == rv.end() )
        {
            rv.emplace_back( form );
        }
    };

    if( ends_with( word, "ies" ) )
    {
        add( drop( word, 1 ) );
        add( drop( word, 3 ) + "y" );
    }
    else if( ends_with( word, "es" ) )
    {
        add( drop( word, 2 ) );
        add( drop( word, 1 ) );
    }
    else if( ends_with( word, "s" )
          && !ends_with( word, "ss" ) )
    {
        add( drop( word, 1 ) );
    }

    return rv;
}

} // namespace taxmap::util
