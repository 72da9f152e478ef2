/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#pragma once
#ifndef TAXMAP_UTIL_RESULT_HPP
#define TAXMAP_UTIL_RESULT_HPP

#include <common.hpp>
#include <util/log/log.hpp>

#include <fmt/format.h>

#include <string>
#include <utility>
#include <vector>

// Opens a call node for the enclosing function when call stack capture is on.
#define TM_RESULT_PROLOG() \
    auto tm_result_local_state = taxmap::result::LocalState{};
// Records an argument against the enclosing call node.
#define TM_RESULT_PUSH( key, value ) \
    tm_result_local_state.push( key, taxmap::result::to_log_value( value ) );

namespace taxmap::result {

using KeyValue = std::pair< std::string, std::string >;

class LocalState
{
#if TAXMAP_LOG
    util::log::ScopedFunctionLog scoped_log_;
#endif // TAXMAP_LOG
    std::vector< KeyValue > kvs_ = {};

public:
#if TAXMAP_LOG
    LocalState( const char* function = __builtin_FUNCTION()
              , const char* file = __builtin_FILE()
              , unsigned line = __builtin_LINE() );
#else
    LocalState() = default;
#endif // TAXMAP_LOG

    auto push( std::string const& key
             , std::string const& value )
        -> void;
    auto values() const
        -> std::vector< KeyValue > const&;
};

template< typename T >
auto to_log_value( T const& t )
    -> std::string
{
    return fmt::format( "{}", t );
}

auto to_string( LocalState const& state )
    -> std::string;

template< typename T >
auto make_result( error_code::Payload const& payload )
    -> Result< T >
{
    return Result< T >{ payload };
}

// Failed by default: callers assign the success value once it is known.
template< typename T >
auto make_result( const char* function = __builtin_FUNCTION()
                , const char* file = __builtin_FILE()
                , unsigned line = __builtin_LINE() )
    -> Result< T >
{
    return make_result< T >( error_code::Payload{ error_code::common::uncategorized
                                                , { error_code::StackElement{ line, function, file, "" } } } );
}

} // namespace taxmap::result

#endif // TAXMAP_UTIL_RESULT_HPP
