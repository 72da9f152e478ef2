/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#include "path.hpp"
#include "term_set.hpp"
#include "test/util.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace taxmap;
using namespace taxmap::test;

SCENARIO( "labels split into term sets", "[term_set]" )
{
    GIVEN( "a label with separators and plurals" )
    {
        THEN( "terms are lower-cased, stemmed and de-duplicated" )
        {
            REQUIRE( split_terms( "Cheese & Cheese Alternatives" ) == TermSet{ "cheese", "alternative" } );
            REQUIRE( split_terms( "Dairy & Eggs" ) == TermSet{ "dairy", "egg" } );
            REQUIRE( split_terms( "Cottage & Ricotta Cheese" ) == TermSet{ "cottage", "ricotta", "cheese" } );
        }
        THEN( "token order is kept by split_tokens" )
        {
            REQUIRE( split_tokens( "Whole Milk/Cream" ) == StringVec{ "whole", "milk", "cream" } );
        }
    }
    GIVEN( "stop words, numbers and punctuation" )
    {
        THEN( "they carry no terms" )
        {
            REQUIRE( split_terms( "Fruits of the Forest" ) == TermSet{ "fruit", "forest" } );
            REQUIRE( split_terms( "Size 12 (Large)" ) == TermSet{ "size", "large" } );
            REQUIRE( split_terms( "Women's Shoes" ) == TermSet{ "women", "shoe" } );
            REQUIRE( split_terms( "&" ).empty() );
            REQUIRE( split_terms( "" ).empty() );
        }
    }
    GIVEN( "stemming turned off" )
    {
        auto const policy = TermPolicy{ .use_stemming = false };

        THEN( "plurals are kept" )
        {
            REQUIRE( split_terms( "Dairy & Eggs", policy ) == TermSet{ "dairy", "eggs" } );
        }
    }
    GIVEN( "an added stop word" )
    {
        auto policy = TermPolicy{};

        policy.stop_words.emplace( "fresh" );

        THEN( "it is dropped" )
        {
            REQUIRE( split_terms( "Fresh Fruit", policy ) == TermSet{ "fruit" } );
        }
    }
}

SCENARIO( "labels outside ASCII", "[term_set]" )
{
    GIVEN( "accented and non-Latin labels" )
    {
        THEN( "multi-byte characters are kept as part of the term" )
        {
            REQUIRE( split_terms( "Café" ) == TermSet{ "café" } );
            REQUIRE( split_terms( "Crème Fraîche" ) == TermSet{ "crème", "fraîche" } );
            REQUIRE( split_terms( "奶酪" ) == TermSet{ "奶酪" } );
            REQUIRE( !split_terms( "Ä" ).empty() );
        }
        THEN( "ASCII punctuation around them is still stripped" )
        {
            REQUIRE( split_terms( "(Café)" ) == TermSet{ "café" } );
            REQUIRE( normalize_term( "\"奶酪\"" ) == "奶酪" );
        }
    }
    GIVEN( "a path whose leaf is non-ASCII" )
    {
        auto const path = Path{ "乳制品", "奶酪" };

        THEN( "the leaf has terms" )
        {
            auto const ets = REQUIRE_TRY( make_extended_term_set( path, 1 ) );

            REQUIRE( ets.category == TermSet{ "奶酪" } );
            REQUIRE( ets.parent == TermSet{ "乳制品" } );
        }
    }
}

SCENARIO( "stemmed terms remember their surface form", "[term_set]" )
{
    GIVEN( "a label with an ies plural" )
    {
        auto const ets = make_extended_term_set( "Cookies & Crackers", "Snacks", { "Sandwich Cookies" } );

        THEN( "the stem maps back to the lower-cased word" )
        {
            REQUIRE( ets.category == TermSet{ "cooky", "cracker" } );
            REQUIRE( ets.surface_of( "cooky" ) == "cookies" );
            REQUIRE( ets.surface_of( "cracker" ) == "crackers" );
        }
        THEN( "unchanged terms are their own surface" )
        {
            REQUIRE( ets.surface_of( "sandwich" ) == "sandwich" );
        }
    }
    GIVEN( "stemming turned off" )
    {
        auto const policy = TermPolicy{ .use_stemming = false };

        THEN( "no surface forms are recorded" )
        {
            REQUIRE( surface_forms( "Cookies", policy ).empty() );
        }
    }
}

SCENARIO( "extended term sets carry tree context", "[term_set]" )
{
    GIVEN( "labels" )
    {
        auto const ets = make_extended_term_set( "Cottage Cheese", "Cheese", { "Small Curd", "Large Curd" } );

        THEN( "each group is split on its own" )
        {
            REQUIRE( ets.category == TermSet{ "cottage", "cheese" } );
            REQUIRE( ets.parent == TermSet{ "cheese" } );
            REQUIRE( ets.children.size() == 2 );
            REQUIRE( ets.context() == TermSet{ "cheese", "small", "large", "curd" } );
        }
    }
    GIVEN( "a path" )
    {
        auto path = Path{};

        path.add_node( "Dairy" );
        path.add_node( "Cheese", { "Cheese Alternatives" } );
        path.add_node( "Cottage Cheese" );

        THEN( "the root has no parent" )
        {
            auto const ets = REQUIRE_TRY( make_extended_term_set( path, 0 ) );

            REQUIRE( ets.parent.empty() );
            REQUIRE( ets.children == std::vector< TermSet >{ { "cheese" } } );
        }
        THEN( "an inner node sees the next node and its off-path children" )
        {
            auto const ets = REQUIRE_TRY( make_extended_term_set( path, 1 ) );

            REQUIRE( ets.parent == TermSet{ "dairy" } );
            REQUIRE( ets.children == std::vector< TermSet >{ { "cottage", "cheese" }, { "cheese", "alternative" } } );
        }
        THEN( "the leaf has no children" )
        {
            auto const ets = REQUIRE_TRY( make_extended_term_set( path, 2 ) );

            REQUIRE( ets.children.empty() );
        }
        THEN( "an index past the leaf fails" )
        {
            REQUIRE_RFAIL( make_extended_term_set( path, 3 ) );
        }
    }
}
