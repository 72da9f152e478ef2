/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#include "config.hpp"

#include "util/json.hpp"
#include "util/result.hpp"

#include <boost/json.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>

#include <cctype>
#include <string>

namespace rvs = ranges::views;

namespace taxmap {

auto TermPolicy::default_stop_words()
    -> StringSet
{
    return { "a", "an", "and", "by", "for", "from", "in", "of", "on", "or", "the", "to", "with", "&" };
}

auto from_json( boost::json::object const& obj )
    -> Result< MatchConfig >
{
    TM_RESULT_PROLOG();

    auto rv = MatchConfig{};

    if( obj.contains( "threshold" ) )
    {
        rv.threshold = TTRY( fetch_float( obj, "threshold" ) );

        TAXMAP_ENSURE_MSG( rv.threshold >= 0.0 && rv.threshold <= 1.0, error_code::common::invalid_value, "threshold must lie in [0,1]" );
    }
    if( obj.contains( "aggregation" ) )
    {
        auto const aggregation = TTRY( fetch_string( obj, "aggregation" ) );

        rv.aggregation = TTRY( to_aggregation( aggregation ) );
    }
    if( obj.contains( "use_stemming" ) )
    {
        rv.terms.use_stemming = TTRY( fetch_bool( obj, "use_stemming" ) );
    }
    if( obj.contains( "disambiguate" ) )
    {
        rv.disambiguate = TTRY( fetch_bool( obj, "disambiguate" ) );
    }
    if( obj.contains( "disambiguation_overlap" ) )
    {
        rv.disambiguation_overlap = TTRY( fetch_float( obj, "disambiguation_overlap" ) );

        TAXMAP_ENSURE_MSG( rv.disambiguation_overlap >= 0.0 && rv.disambiguation_overlap <= 1.0, error_code::common::invalid_value, "disambiguation_overlap must lie in [0,1]" );
    }
    if( obj.contains( "depth_decay" ) )
    {
        rv.depth_decay = TTRY( fetch_float( obj, "depth_decay" ) );

        TAXMAP_ENSURE_MSG( rv.depth_decay > 0.0 && rv.depth_decay <= 1.0, error_code::common::invalid_value, "depth_decay must lie in (0,1]" );
    }
    if( obj.contains( "min_score" ) )
    {
        rv.min_score = TTRY( fetch_float( obj, "min_score" ) );

        TAXMAP_ENSURE_MSG( rv.min_score >= 0.0 && rv.min_score <= 1.0, error_code::common::invalid_value, "min_score must lie in [0,1]" );
    }
    if( obj.contains( "concurrency" ) )
    {
        auto const concurrency = TTRY( fetch_uint( obj, "concurrency" ) );

        TAXMAP_ENSURE_MSG( concurrency > 0 && concurrency <= 256, error_code::common::invalid_value, "concurrency must lie in [1,256]" );

        rv.concurrency = static_cast< uint32_t >( concurrency );
    }
    if( obj.contains( "stop_words" ) )
    {
        for( auto const& word : TTRY( fetch_strings( obj, "stop_words" ) ) )
        {
            rv.terms.stop_words.emplace( word | rvs::transform( []( unsigned char const c ){ return static_cast< char >( std::tolower( c ) ); } )
                                            | ranges::to< std::string >() );
        }
    }

    return rv;
}

auto load_config( std::string const& json_text )
    -> Result< MatchConfig >
{
    TM_RESULT_PROLOG();

    auto const obj = TTRY( parse_object( json_text ) );

    return TTRY( from_json( obj ) );
}

auto to_aggregation( std::string const& s )
    -> Result< TermAggregation >
{
    TM_RESULT_PROLOG();
        TM_RESULT_PUSH( "aggregation", s );

    auto rv = result::make_result< TermAggregation >();

         if( s == "any" ) { rv = TermAggregation::any; }
    else if( s == "majority" ) { rv = TermAggregation::majority; }
    else if( s == "all" ) { rv = TermAggregation::all; }
    else
    {
        rv = TAXMAP_MAKE_ERROR_MSG( error_code::common::invalid_value, s );
    }

    return rv;
}

auto to_string( TermAggregation const& agg )
    -> std::string
{
    switch( agg )
    {
        case TermAggregation::any: return "any";
        case TermAggregation::majority: return "majority";
        case TermAggregation::all: return "all";
    }

    return "unknown";
}

} // namespace taxmap
