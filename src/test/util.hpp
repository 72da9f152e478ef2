/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#pragma once
#ifndef TAXMAP_TEST_UTIL_HPP
#define TAXMAP_TEST_UTIL_HPP

// Assumes REQUIRE halts flow on failure.
#define REQUIRE_TRY( ... ) \
    ({ \
        auto&& res = ( __VA_ARGS__ ); \
        REQUIRE( taxmap::test::succ( res ) ); \
        res.value(); \
    })
#define REQUIRE_RES( ... ) REQUIRE( taxmap::test::succ( __VA_ARGS__ ) )
#define REQUIRE_RFAIL( ... ) REQUIRE( taxmap::test::fail( __VA_ARGS__ ) )

#include <common.hpp>
#include <ontology/memory_ontology.hpp>
#include <ontology/ontology.hpp>
#include <term_set.hpp>

#include <fmt/format.h>

#include <atomic>
#include <string>
#include <string_view>

namespace taxmap::test {

template< typename T >
concept Boolean = requires( T t )
{
    static_cast< bool >( t );
};

template< Boolean T >
auto succ( T const& t
         , const char* file = __builtin_FILE()
         , unsigned line = __builtin_LINE() )
{
    auto const ok = static_cast< bool >( t );

    if constexpr( requires{ t.error(); } )
    {
        if( !ok )
        {
            fmt::print( stderr, "{}:{}: failed Result\n{}\n", file, line, to_string( t.error() ) );
        }
    }

    return ok;
}
template< Boolean T >
auto fail( T const& t )
{
    return !static_cast< bool >( t );
}

/**
 * Small grocery and furniture vocabulary. "cheese" carries two senses, the dairy one second, so that
 * disambiguation has something to choose.
 */
auto make_grocery_ontology()
    -> ontology::MemoryOntology;

// Category-only term set, taken verbatim: no splitting or stemming.
auto make_term_set( TermSet const& category
                  , TermSet const& parent = {}
                  , std::vector< TermSet > const& children = {} )
    -> ExtendedTermSet;

// Every lookup fails as if the lexical resource were down.
class FailingOntology : public ontology::Ontology
{
public:
    auto lookup( Term const& term ) const
        -> Result< ontology::Entry > override;
    auto name() const
        -> std::string_view override { return "failing_ontology"; }
};

// Fails the first `failures` lookups, then defers to backing. Counts every call.
class FlakyOntology : public ontology::Ontology
{
public:
    FlakyOntology( ontology::Ontology const& backing
                 , uint32_t const failures );

    auto calls() const
        -> uint32_t;
    auto lookup( Term const& term ) const
        -> Result< ontology::Entry > override;
    auto name() const
        -> std::string_view override { return "flaky_ontology"; }

private:
    ontology::Ontology const& backing_;
    uint32_t failures_;
    mutable std::atomic< uint32_t > calls_ = 0;
};

} // namespace taxmap::test

#endif // TAXMAP_TEST_UTIL_HPP
