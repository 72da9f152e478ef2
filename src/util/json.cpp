/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#include <util/json.hpp>

#include <util/result.hpp>

#include <boost/json.hpp>
#include <fmt/format.h>

#include <string>
#include <utility>

namespace bjn = boost::json;

namespace taxmap {

namespace {

auto kind_name( bjn::kind const k )
    -> std::string
{
    return std::string{ bjn::to_string( k ) };
}

// Value at key, required to be of one of the given kinds.
template< typename... Kinds >
auto fetch_of_kind( bjn::object const& obj
                  , std::string const& key
                  , Kinds const... kinds )
    -> Result< bjn::value >
{
    auto const at = TTRY( fetch_value( obj, key ) );

    TAXMAP_ENSURE_MSG( ( ( at.kind() == kinds ) || ... )
                     , error_code::common::invalid_value
                     , fmt::format( "'{}' has kind {}", key, kind_name( at.kind() ) ) );

    return at;
}

} // namespace anon

auto fetch_bool( bjn::object const& obj
               , std::string const& key )
    -> Result< bool >
{
    TM_RESULT_PROLOG();
        TM_RESULT_PUSH( "key", key );

    return TTRY( fetch_of_kind( obj, key, bjn::kind::bool_ ) ).as_bool();
}

// Integers are accepted where a float is expected: "1" and "1.0" both arrive as thresholds.
auto fetch_float( bjn::object const& obj
                , std::string const& key )
    -> Result< double >
{
    TM_RESULT_PROLOG();
        TM_RESULT_PUSH( "key", key );

    auto const at = TTRY( fetch_of_kind( obj, key, bjn::kind::double_, bjn::kind::int64, bjn::kind::uint64 ) );

    return at.to_number< double >();
}

auto fetch_object( bjn::object const& obj
                 , std::string const& key )
    -> Result< bjn::object >
{
    TM_RESULT_PROLOG();
        TM_RESULT_PUSH( "key", key );

    return TTRY( fetch_of_kind( obj, key, bjn::kind::object ) ).as_object();
}

auto fetch_string( bjn::object const& obj
                 , std::string const& key )
    -> Result< std::string >
{
    TM_RESULT_PROLOG();
        TM_RESULT_PUSH( "key", key );

    auto const at = TTRY( fetch_of_kind( obj, key, bjn::kind::string ) );

    return std::string{ at.as_string() };
}

auto fetch_strings( bjn::object const& obj
                  , std::string const& key )
    -> Result< StringVec >
{
    TM_RESULT_PROLOG();
        TM_RESULT_PUSH( "key", key );

    auto rv = StringVec{};
    auto const at = TTRY( fetch_of_kind( obj, key, bjn::kind::array ) );

    for( auto const& e : at.as_array() )
    {
        TAXMAP_ENSURE_MSG( e.is_string()
                         , error_code::common::invalid_value
                         , fmt::format( "'{}' holds a {}", key, kind_name( e.kind() ) ) );

        rv.emplace_back( e.as_string() );
    }

    return rv;
}

auto fetch_uint( bjn::object const& obj
               , std::string const& key )
    -> Result< uint64_t >
{
    TM_RESULT_PROLOG();
        TM_RESULT_PUSH( "key", key );

    auto const at = TTRY( fetch_of_kind( obj, key, bjn::kind::uint64, bjn::kind::int64 ) );

    TAXMAP_ENSURE_MSG( !at.is_int64() || at.as_int64() >= 0
                     , error_code::common::invalid_value
                     , fmt::format( "'{}' is negative", key ) );

    return at.to_number< uint64_t >();
}

auto fetch_value( bjn::object const& obj
                , std::string const& key )
    -> Result< bjn::value >
{
    auto const it = obj.find( key );

    TAXMAP_ENSURE_MSG( it != obj.end(), error_code::common::data_not_found, key );

    return it->value();
}

auto parse_object( std::string const& text )
    -> Result< bjn::object >
{
    TM_RESULT_PROLOG();

    auto ec = bjn::error_code{};
    auto jv = bjn::parse( text, ec );

    TAXMAP_ENSURE_MSG( !ec, error_code::common::conversion_failed, ec.message() );
    TAXMAP_ENSURE_MSG( jv.is_object(), error_code::common::conversion_failed, "top level must be an object" );

    return std::move( jv.as_object() );
}

} // namespace taxmap
