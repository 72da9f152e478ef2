/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#pragma once
#ifndef TAXMAP_EC_MASTER_HPP
#define TAXMAP_EC_MASTER_HPP

#define TAXMAP_MAKE_STACK_ELEM_MSG( msg ) \
    taxmap::error_code::StackElement{ __LINE__ \
                                    , __PRETTY_FUNCTION__ \
                                    , __FILE__ \
                                    , ( msg ) }
#define TAXMAP_MAKE_STACK_ELEM() TAXMAP_MAKE_STACK_ELEM_MSG( "" )
#define TAXMAP_MAKE_ERROR_MSG( ec, msg ) \
    taxmap::error_code::Payload{ ( ec ) \
                               , { TAXMAP_MAKE_STACK_ELEM_MSG( msg ) } }
#define TAXMAP_THROW_EXCEPTION_MSG( msg ) \
    ({ \
        taxmap::error_code::log_exception( ( msg ), __PRETTY_FUNCTION__, __FILE__, __LINE__ ); \
        throw std::runtime_error( fmt::format( "exception: {}\n\t{}|{}|{}", ( msg ), __LINE__, __PRETTY_FUNCTION__, __FILE__ ) ); \
    })
// Returns from the enclosing function when pred is false (or a failed Result, whose payload is extended).
#define TAXMAP_ENSURE_MSG( pred, ec, msg ) \
    { \
        auto&& res = ( pred ); \
        if( !( res ) ) \
        { \
            return taxmap::error_code::ensure_propagate_error( res, ec, TAXMAP_MAKE_STACK_ELEM_MSG( ( fmt::format( "predicate: {}\n\tmessage: {}", #pred, msg ) ) ) ); \
        } \
    }
#define TAXMAP_ENSURE( pred, ec ) TAXMAP_ENSURE_MSG( ( pred ), ( ec ), "" )
// Value of a successful Result; otherwise returns the failure from the enclosing function, one stack frame longer.
#define TAXMAP_TRY( ... ) \
    ({ \
        auto&& res = ( __VA_ARGS__ ); \
        if( !BOOST_OUTCOME_V2_NAMESPACE::try_operation_has_value( res ) ) \
        { \
            res.error().stack.emplace_back( TAXMAP_MAKE_STACK_ELEM() ); \
            return BOOST_OUTCOME_V2_NAMESPACE::try_operation_return_as( static_cast< decltype( res )&& >( res ) ); \
        } \
        BOOST_OUTCOME_V2_NAMESPACE::try_operation_extract_value( static_cast< decltype( res )&& >( res ) ); \
    })
#define TTRY( ... ) TAXMAP_TRY( __VA_ARGS__ )

#include "error/common.hpp"

#include <boost/outcome.hpp>
#include <boost/system/error_code.hpp>
#include <fmt/format.h>

#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace outcome = BOOST_OUTCOME_V2_NAMESPACE;

namespace taxmap::error_code {

struct StackElement
{
    uint32_t line = {};
    std::string function = {};
    std::string file = {};
    std::string message = {};
};

// Error code plus the frames it passed through; innermost first.
struct Payload
{
    boost::system::error_code ec = {};
    std::vector< StackElement > stack = {};
};

inline
auto make_error_code( Payload const& payload )
    -> boost::system::error_code;

template< typename T >
using Result = outcome::result< T
                              , Payload
                              , outcome::policy::default_policy< T, Payload, void > >;

inline
auto log_exception( std::string const& msg
                  , std::string const& fn
                  , std::string const& file
                  , uint32_t const line )
    -> void
{
#if TAXMAP_DEBUG
    fmt::print( stderr, "exception:\n\tmessage: {}\n\tfunction: {}\n\tfile: {}\n\tline: {}\n", msg, fn, file, line );
#else
    ( void )msg; ( void )fn; ( void )file; ( void )line;
#endif // TAXMAP_DEBUG
}

// Extends a failed Result, or makes a new Payload from a false predicate.
template< typename Pred
        , typename ErrorCode >
auto ensure_propagate_error( Pred const& pred
                           , ErrorCode const& ec
                           , StackElement const& se )
{
    if constexpr( requires{ pred.as_failure(); } )
    {
        auto tpred = pred;
        tpred.error().stack.emplace_back( se );
        return tpred.as_failure();
    }
    else
    {
        return Payload{ ec, { se } };
    }
}

auto to_string( Payload const& payload )
    -> std::string;

// ADL hooks for Boost.Outcome: value() on a failed Result throws with the rendered payload.
inline
auto make_error_code( Payload const& payload )
    -> boost::system::error_code
{
     return payload.ec;
}
inline
auto outcome_throw_as_system_error_with_payload( Payload const& payload )
    -> void
{
    TAXMAP_THROW_EXCEPTION_MSG( to_string( payload ) );
}

template< typename T >
auto operator<<( std::ostream& os, Result< T > const& lhs )
    -> std::ostream&
{
    if( !lhs )
    {
        os << lhs.error().ec.message();
    }
    else if constexpr( requires( T const& t ){ to_string( t ); } )
    {
        os << to_string( lhs.value() );
    }
    else
    {
        os << "success";
    }

    return os;
}

} // namespace taxmap::error_code

#endif // TAXMAP_EC_MASTER_HPP
