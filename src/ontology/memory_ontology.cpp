/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#include <ontology/memory_ontology.hpp>

#include <error/ontology.hpp>
#include <util/json.hpp>
#include <util/result.hpp>

#include <boost/json.hpp>
#include <range/v3/range/conversion.hpp>

#include <string>

namespace bjn = boost::json;

namespace taxmap::ontology {

namespace {

auto fetch_term_set( bjn::object const& obj
                   , std::string const& key )
    -> Result< StringSet >
{
    TM_RESULT_PROLOG();
        TM_RESULT_PUSH( "key", key );

    if( !obj.contains( key ) )
    {
        return StringSet{};
    }

    auto const words = TTRY( fetch_strings( obj, key ) );

    return words | ranges::to< StringSet >();
}

auto sense_from_json( bjn::value const& jv )
    -> Result< Sense >
{
    TM_RESULT_PROLOG();

    TAXMAP_ENSURE( jv.is_object(), error_code::ontology::invalid_format );

    auto const& obj = jv.as_object();
    auto rv = Sense{};

    if( obj.contains( "gloss" ) )
    {
        rv.gloss = TTRY( fetch_string( obj, "gloss" ) );
    }

    rv.synonyms = TTRY( fetch_term_set( obj, "synonyms" ) );
    rv.hypernyms = TTRY( fetch_term_set( obj, "hypernyms" ) );
    rv.hyponyms = TTRY( fetch_term_set( obj, "hyponyms" ) );

    return rv;
}

} // namespace anon

auto MemoryOntology::from_json( bjn::object const& obj )
    -> Result< MemoryOntology >
{
    TM_RESULT_PROLOG();

    auto rv = MemoryOntology{};
    auto const terms = TTRY( fetch_object( obj, "terms" ) );

    for( auto const& [ term, senses ] : terms )
    {
        TM_RESULT_PUSH( "term", std::string{ term } );

        TAXMAP_ENSURE_MSG( senses.is_array(), error_code::ontology::invalid_format, std::string{ term } );

        for( auto const& sense : senses.as_array() )
        {
            rv.add_sense( std::string{ term }, TTRY( sense_from_json( sense ) ) );
        }
    }

    return rv;
}

auto MemoryOntology::from_json( std::string const& json_text )
    -> Result< MemoryOntology >
{
    TM_RESULT_PROLOG();

    auto const obj = TTRY( parse_object( json_text ) );

    return TTRY( from_json( obj ) );
}

auto MemoryOntology::add_sense( Term const& term
                              , Sense const& sense )
    -> void
{
    entries_[ term ].senses.emplace_back( sense );
}

auto MemoryOntology::add_synonyms( StringVec const& group
                                 , std::string const& gloss )
    -> void
{
    for( auto const& term : group )
    {
        auto sense = Sense{ .gloss = gloss };

        for( auto const& other : group )
        {
            if( other != term )
            {
                sense.synonyms.emplace( other );
            }
        }

        add_sense( term, sense );
    }
}

auto MemoryOntology::lookup( Term const& term ) const
    -> Result< Entry >
{
    if( auto const it = entries_.find( term )
      ; it != entries_.end() )
    {
        return it->second;
    }

    return Entry{};
}

auto MemoryOntology::size() const
    -> size_t
{
    return entries_.size();
}

} // namespace taxmap::ontology
