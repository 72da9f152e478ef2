/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#include "common.hpp"
#include "error/master.hpp"
#include "error/match.hpp"
#include "test/util.hpp"
#include "util/result.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace taxmap;
using namespace taxmap::test;

namespace {

auto checked_half( uint32_t const n )
    -> Result< uint32_t >
{
    TM_RESULT_PROLOG();
        TM_RESULT_PUSH( "n", n );

    TAXMAP_ENSURE_MSG( n % 2 == 0, error_code::common::invalid_value, "odd" );

    return n / 2;
}

auto checked_quarter( uint32_t const n )
    -> Result< uint32_t >
{
    TM_RESULT_PROLOG();

    auto const half = TTRY( checked_half( n ) );

    return TTRY( checked_half( half ) );
}

} // namespace anon

SCENARIO( "test taxmap::Result", "[result]" )
{
    GIVEN( "default Result< void >" )
    {
        auto r = result::make_result< void >();

        THEN( "explicit bool false" )
        {
            REQUIRE( fail( r ) );
        }
        THEN( "has_error" )
        {
            REQUIRE( r.has_error() );
        }
        THEN( "error succeeds" )
        {
            REQUIRE( r.error().ec == error_code::common::uncategorized );
        }
        THEN( "doesn't have value")
        {
            REQUIRE( !r.has_value() );
        }
    }
    GIVEN( "default Result< void >" )
    {
        auto r = result::make_result< void >();

        WHEN( "set to success" )
        {
            r = outcome::success();

            THEN( "explicit bool true" )
            {
                REQUIRE( succ( r ) );
            }
            THEN( "doesn't have error" )
            {
                REQUIRE( !r.has_error() );
            }
            THEN( "has value" )
            {
                REQUIRE( r.has_value() );
            }
        }
    }
}

SCENARIO( "TTRY propagates failure with a growing stack", "[result]" )
{
    GIVEN( "a value divisible by four" )
    {
        THEN( "both steps succeed" )
        {
            auto const q = REQUIRE_TRY( checked_quarter( 12 ) );

            REQUIRE( q == 3 );
        }
    }
    GIVEN( "a value divisible by two only" )
    {
        auto const r = checked_quarter( 6 );

        THEN( "the inner failure reaches the caller" )
        {
            REQUIRE_RFAIL( r );
            REQUIRE( r.error().ec == error_code::common::invalid_value );
        }
        THEN( "the stack records the failing check and each propagation" )
        {
            REQUIRE( r.error().stack.size() == 2 );
            REQUIRE( r.error().stack.front().message.find( "odd" ) != std::string::npos );
        }
        THEN( "the payload renders to text" )
        {
            REQUIRE( error_code::to_string( r.error() ).find( "invalid value" ) != std::string::npos );
        }
    }
    GIVEN( "errors from distinct categories" )
    {
        auto const mec = make_error_code( error_code::match::invalid_input );
        auto const cec = make_error_code( error_code::common::invalid_value );

        THEN( "categories are told apart" )
        {
            REQUIRE( mec.category() != cec.category() );
            REQUIRE( std::string{ mec.category().name() } == "match error" );
        }
    }
}
