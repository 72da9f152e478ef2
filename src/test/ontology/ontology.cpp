/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#include "error/ontology.hpp"
#include "ontology/cached_ontology.hpp"
#include "ontology/memory_ontology.hpp"
#include "test/util.hpp"

#include <catch2/catch_test_macros.hpp>

#include <future>
#include <vector>

using namespace taxmap;
using namespace taxmap::ontology;
using namespace taxmap::test;

SCENARIO( "MemoryOntology", "[ontology]" )
{
    GIVEN( "the grocery vocabulary" )
    {
        auto const onto = make_grocery_ontology();

        THEN( "known terms return their senses" )
        {
            auto const entry = REQUIRE_TRY( onto.lookup( "cheese" ) );

            REQUIRE( entry.senses.size() == 2 );
            REQUIRE( entry.senses[ 1 ].hypernyms.contains( "dairy product" ) );
        }
        THEN( "unknown terms return an empty entry, not an error" )
        {
            auto const entry = REQUIRE_TRY( onto.lookup( "quinoa" ) );

            REQUIRE( entry.empty() );
        }
        THEN( "synonym groups point both ways" )
        {
            auto const sofa = REQUIRE_TRY( onto.lookup( "sofa" ) );
            auto const couch = REQUIRE_TRY( onto.lookup( "couch" ) );

            REQUIRE( sofa.senses.front().synonyms == StringSet{ "couch" } );
            REQUIRE( couch.senses.front().synonyms == StringSet{ "sofa" } );
        }
        THEN( "relations flatten every sense" )
        {
            auto const entry = REQUIRE_TRY( onto.lookup( "cheese" ) );
            auto const rels = relations( entry );

            REQUIRE( rels.contains( RelatedTerm{ "boss", Relation::synonym } ) );
            REQUIRE( rels.contains( RelatedTerm{ "ricotta", Relation::hyponym } ) );
        }
    }
    GIVEN( "JSON input" )
    {
        auto const onto = REQUIRE_TRY( MemoryOntology::from_json( R"({ "terms":
                                                                       { "sofa": [ { "gloss": "a long upholstered seat"
                                                                                   , "synonyms": [ "couch", "settee" ]
                                                                                   , "hypernyms": [ "seat" ] } ] } })" ) );

        THEN( "entries are loaded" )
        {
            auto const entry = REQUIRE_TRY( onto.lookup( "sofa" ) );

            REQUIRE( onto.size() == 1 );
            REQUIRE( entry.senses.front().synonyms == StringSet{ "couch", "settee" } );
            REQUIRE( entry.senses.front().hypernyms == StringSet{ "seat" } );
            REQUIRE( entry.senses.front().hyponyms.empty() );
        }
    }
    GIVEN( "malformed JSON input" )
    {
        THEN( "a missing terms object fails" )
        {
            REQUIRE_RFAIL( MemoryOntology::from_json( R"({ "words": {} })" ) );
        }
        THEN( "a non-array sense list fails" )
        {
            auto const r = MemoryOntology::from_json( R"({ "terms": { "sofa": "couch" } })" );

            REQUIRE_RFAIL( r );
            REQUIRE( r.error().ec == error_code::ontology::invalid_format );
        }
    }
}

SCENARIO( "CachedOntology", "[ontology]" )
{
    GIVEN( "a backing ontology that fails once" )
    {
        auto const backing = make_grocery_ontology();
        auto const flaky = FlakyOntology{ backing, 1 };
        auto cache = CachedOntology{ flaky };

        THEN( "the failure is reported and not cached" )
        {
            REQUIRE_RFAIL( cache.lookup( "milk" ) );
            REQUIRE( cache.size() == 0 );

            auto const entry = REQUIRE_TRY( cache.lookup( "milk" ) );

            REQUIRE( entry.senses.size() == 1 );
            REQUIRE( cache.size() == 1 );
        }
        THEN( "hits do not reach the backing ontology" )
        {
            REQUIRE_RFAIL( cache.lookup( "milk" ) );
            REQUIRE_RES( cache.lookup( "milk" ) );
            REQUIRE_RES( cache.lookup( "milk" ) );
            REQUIRE_RES( cache.lookup( "milk" ) );
            REQUIRE( flaky.calls() == 2 );
        }
        THEN( "clearing empties the cache" )
        {
            REQUIRE_RFAIL( cache.lookup( "milk" ) );
            REQUIRE_RES( cache.lookup( "milk" ) );

            cache.clear();

            REQUIRE( cache.size() == 0 );
        }
    }
    GIVEN( "concurrent readers" )
    {
        auto const backing = make_grocery_ontology();
        auto const cache = CachedOntology{ backing };
        auto const terms = StringVec{ "sofa", "couch", "cheese", "cheddar", "milk", "quinoa" };
        auto const reader = [ & ]
        {
            auto ok = true;

            for( auto i = 0; i < 200; ++i )
            {
                for( auto const& term : terms )
                {
                    auto const cached = cache.lookup( term );
                    auto const direct = backing.lookup( term );

                    ok = ok
                      && cached
                      && direct
                      && cached.value().senses.size() == direct.value().senses.size();
                }
            }

            return ok;
        };

        WHEN( "they look up the same terms at once" )
        {
            auto futures = std::vector< std::future< bool > >{};

            for( auto i = 0; i < 8; ++i )
            {
                futures.emplace_back( std::async( std::launch::async, reader ) );
            }

            THEN( "every read agrees with the backing ontology" )
            {
                for( auto& f : futures )
                {
                    REQUIRE( f.get() );
                }
            }
            THEN( "each term is cached once" )
            {
                for( auto& f : futures )
                {
                    f.wait();
                }

                REQUIRE( cache.size() == terms.size() );
            }
        }
    }
}
