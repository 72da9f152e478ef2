/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#include "key_path/generator.hpp"
#include "key_path/ranker.hpp"
#include "ontology/memory_ontology.hpp"
#include "test/util.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <vector>

using namespace taxmap;
using namespace taxmap::test;
using Catch::Approx;

namespace {

auto const exact = NodeMatch{ MatchKind::exact, 1.0, {} };
auto const unmatched = NodeMatch{ MatchKind::none, 0.0, {} };

} // namespace anon

SCENARIO( "lockstep ranking of key paths", "[ranker]" )
{
    auto const onto = make_grocery_ontology();
    auto const matcher = SemanticMatcher{ onto };
    auto const ranker = KeyPathRanker{ matcher };

    GIVEN( "a key path ranked against itself" )
    {
        auto const path = Path{ "Dairy", "Cheese", "Cottage Cheese" };
        auto const kp = KeyPath::full( path );

        THEN( "the score is one" )
        {
            REQUIRE( ranker.rank( kp, kp ) == Approx( 1.0 ) );
        }
    }
    GIVEN( "a key path with a term-less ancestor ranked against itself" )
    {
        auto const path = Path{ "Dairy", "&", "Cheese" };
        auto const kp = KeyPath::full( path );

        THEN( "the term-less position is left out and the score is one" )
        {
            REQUIRE( ranker.rank( kp, kp ) == Approx( 1.0 ) );
        }
    }
    GIVEN( "empty key paths" )
    {
        auto const path = Path{ "Dairy", "Cheese" };
        auto const empty = KeyPath{ path, {} };
        auto const kp = KeyPath::full( path );

        THEN( "the score is zero" )
        {
            REQUIRE( ranker.rank( empty, empty ) == 0.0 );
            REQUIRE( ranker.rank( empty, kp ) == 0.0 );
            REQUIRE( ranker.rank( kp, empty ) == 0.0 );
        }
    }
    GIVEN( "key paths of different lengths" )
    {
        auto const long_path = Path{ "Dairy", "Cheese" };
        auto const short_path = Path{ "Cheese" };
        auto const a = KeyPath::full( long_path );
        auto const b = KeyPath::full( short_path );

        THEN( "missing positions count as unmatched, whichever side is longer" )
        {
            REQUIRE( ranker.rank( a, b ) == Approx( 1.0 / 1.5 ) );
            REQUIRE( ranker.rank( b, a ) == Approx( 1.0 / 1.5 ) );
        }
    }
    GIVEN( "leaves that do not match" )
    {
        auto const lhs = Path{ "Dairy", "Cheese" };
        auto const rhs = Path{ "Dairy", "Milk" };

        THEN( "the score is zero" )
        {
            REQUIRE( ranker.rank( KeyPath::full( lhs ), KeyPath::full( rhs ) ) == 0.0 );
        }
    }
    GIVEN( "leaves related by the ontology" )
    {
        auto const lhs = Path{ "Sofa" };
        auto const rhs = Path{ "Couch" };

        THEN( "the kind weight applies" )
        {
            REQUIRE( ranker.rank( KeyPath::full( lhs ), KeyPath::full( rhs ) ) == Approx( KeyPathRanker::weight( MatchKind::synonym ) ) );
        }
    }
}

SCENARIO( "ranking matched key paths", "[ranker]" )
{
    auto const onto = ontology::MemoryOntology{};
    auto const matcher = SemanticMatcher{ onto };
    auto const ranker = KeyPathRanker{ matcher };
    auto const source = Path{ "Dairy", "Cheese" };
    auto const candidate = Path{ "Dairy", "Cheese" };
    auto const skp = KeyPath::full( source );

    GIVEN( "every position matched exactly" )
    {
        auto const mkp = MatchedKeyPath{ skp, candidate, { { 0u, 0u, exact }, { 1u, 1u, exact } } };

        THEN( "the score is one" )
        {
            REQUIRE( ranker.rank( mkp ) == Approx( 1.0 ) );
        }
    }
    GIVEN( "an unmatched ancestor" )
    {
        auto const mkp = MatchedKeyPath{ skp, candidate, { { 0u, nullopt, unmatched }, { 1u, 1u, exact } } };

        THEN( "the ancestor weighs half the leaf" )
        {
            REQUIRE( ranker.rank( mkp ) == Approx( 1.0 / 1.5 ) );
        }
    }
    GIVEN( "an unmatched leaf" )
    {
        auto const mkp = MatchedKeyPath{ skp, candidate, { { 0u, 0u, exact }, { 1u, 1u, unmatched } } };

        THEN( "the score is zero" )
        {
            REQUIRE( !mkp.is_match() );
            REQUIRE( ranker.rank( mkp ) == 0.0 );
        }
    }
    GIVEN( "an insufficient ancestor" )
    {
        auto const mkp = MatchedKeyPath{ skp, candidate, { { 0u, nullopt, NodeMatch{ MatchKind::insufficient, 0.0, {} } }, { 1u, 1u, exact } } };

        THEN( "it is excluded from the score" )
        {
            REQUIRE( ranker.rank( mkp ) == Approx( 1.0 ) );
        }
    }
    GIVEN( "a partially covered leaf" )
    {
        auto const mkp = MatchedKeyPath{ KeyPath{ source, { 1 } }, candidate, { { 1u, 1u, NodeMatch{ MatchKind::exact, 0.5, {} } } } };

        THEN( "coverage scales the contribution" )
        {
            REQUIRE( ranker.rank( mkp ) == Approx( 0.5 ) );
        }
    }
    GIVEN( "kinds of decreasing strength" )
    {
        THEN( "weights decrease" )
        {
            REQUIRE( KeyPathRanker::weight( MatchKind::exact ) > KeyPathRanker::weight( MatchKind::synonym ) );
            REQUIRE( KeyPathRanker::weight( MatchKind::synonym ) > KeyPathRanker::weight( MatchKind::hypernym ) );
            REQUIRE( KeyPathRanker::weight( MatchKind::hypernym ) == KeyPathRanker::weight( MatchKind::hyponym ) );
            REQUIRE( KeyPathRanker::weight( MatchKind::hyponym ) > KeyPathRanker::weight( MatchKind::edit_distance ) );
            REQUIRE( KeyPathRanker::weight( MatchKind::edit_distance ) > KeyPathRanker::weight( MatchKind::context ) );
            REQUIRE( KeyPathRanker::weight( MatchKind::context ) > KeyPathRanker::weight( MatchKind::none ) );
        }
    }
}

SCENARIO( "ordering rankings", "[ranker]" )
{
    auto const onto = ontology::MemoryOntology{};
    auto const matcher = SemanticMatcher{ onto };
    auto const ranker = KeyPathRanker{ matcher };
    auto const source = Path{ "Dairy", "Cheese" };
    auto const same_shape = Path{ "Dairy", "Cheese" };
    auto const shorter = Path{ "Cheese" };
    auto const skp = KeyPath::full( source );
    auto const aligned = MatchedKeyPath{ skp, same_shape, { { 0u, 0u, exact }, { 1u, 1u, exact } } };
    auto const leaf_only = MatchedKeyPath{ skp, shorter, { { 0u, nullopt, unmatched }, { 1u, 0u, exact } } };

    GIVEN( "ties in score" )
    {
        auto const ordered = ranker.order( { Ranking{ 0, 0.5, aligned }
                                           , Ranking{ 1, 0.9, leaf_only }
                                           , Ranking{ 2, 0.9, aligned }
                                           , Ranking{ 3, 0.9, leaf_only } } );

        THEN( "score decides first, then key-path length closeness, then input order" )
        {
            REQUIRE( ordered.size() == 4 );
            REQUIRE( ordered[ 0 ].candidate_index == 2 );
            REQUIRE( ordered[ 1 ].candidate_index == 1 );
            REQUIRE( ordered[ 2 ].candidate_index == 3 );
            REQUIRE( ordered[ 3 ].candidate_index == 0 );
        }
    }
}

SCENARIO( "generated alignments prefer direct matches over context", "[ranker]" )
{
    auto const onto = make_grocery_ontology();
    auto const matcher = SemanticMatcher{ onto };
    auto const ranker = KeyPathRanker{ matcher };

    GIVEN( "cottage cheese under dairy, against a candidate with an intermediate cheese node" )
    {
        auto const source = Path{ "Dairy", "Cottage Cheese" };
        auto const candidates = std::vector< Path >{ Path{ "Dairy", "Cheese", "Cottage Cheese" }
                                                   , Path{ "Snacks", "Cottage Cheese" } };
        auto const gen = REQUIRE_TRY( KeyPathGenerator::make( source, candidates, matcher ) );
        auto const matches = gen.matched_candidate_key_paths();
        auto const& mkp = matches.key_paths[ 0 ];

        THEN( "dairy aligns with dairy, not with the cheese node its parent confirms" )
        {
            auto const cheese = REQUIRE_TRY( make_extended_term_set( candidates[ 0 ], 1, matcher.config().terms ) );

            REQUIRE( matcher.match( gen.source_term_sets()[ 0 ], cheese ).kind == MatchKind::context );
            REQUIRE( gen.source_key_path().indices() == IndexVec{ 0, 1 } );
            REQUIRE( mkp.nodes()[ 0 ].candidate_index.value() == 0 );
            REQUIRE( mkp.nodes()[ 0 ].match.kind == MatchKind::exact );
            REQUIRE( mkp.candidate_key_path().indices() == IndexVec{ 0, 2 } );
        }
        THEN( "the candidate scores as a full match" )
        {
            REQUIRE( ranker.rank( mkp ) == Approx( 1.0 ) );
        }
    }
}
