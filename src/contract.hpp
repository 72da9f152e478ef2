/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#pragma once
#ifndef TAXMAP_CONTRACT_HPP
#define TAXMAP_CONTRACT_HPP

#include <util/log/log.hpp>

#include <boost/contract.hpp>
#include <boost/contract_macro.hpp>
#include <fmt/format.h>

#include <exception>
#include <iostream>

#define BC_CONTRACT( ... ) BOOST_CONTRACT_FUNCTION( __VA_ARGS__ )
#define BC_PRE( ... ) BOOST_CONTRACT_PRECONDITION( __VA_ARGS__ )
#define BC_POST( ... ) BOOST_CONTRACT_POSTCONDITION( __VA_ARGS__ )
// Throws boost::contract::assertion_failure; the handlers below decide what happens next.
#define BC_ASSERT( ... ) BOOST_CONTRACT_ASSERT( ( __VA_ARGS__ ) )

namespace taxmap {

/**
 * @brief Failed contracts print the failing condition and, under TAXMAP_LOG, the captured call stack, then terminate.
 */
inline
auto configure_contract_failure_handlers()
    -> void
{
    using boost::contract::set_precondition_failure;
    using boost::contract::set_postcondition_failure;
    using boost::contract::set_invariant_failure;
    using boost::contract::set_old_failure;
    using boost::contract::from;
    using boost::contract::from_destructor;

    set_precondition_failure(
    set_postcondition_failure(
    set_invariant_failure(
    set_old_failure( []( from where )
    {
        try
        {
            throw;
        }
        catch( boost::contract::assertion_failure const& af )
        {
            fmt::print( stderr, "contract failure: {}\n", af.what() );
        }
        catch( std::exception const& e )
        {
            fmt::print( stderr, "contract failure: {}\n", e.what() );
        }

#if TAXMAP_LOG
        taxmap::util::log::write_call_stack( std::cerr );
#endif // TAXMAP_LOG

        if( where == from_destructor )
        {
            fmt::print( stderr
                      , "Ignoring destructor contract failure\n" );
        }
        else
        {
            std::terminate();
        }
    } ) ) ) );
}

} // namespace taxmap

#endif // TAXMAP_CONTRACT_HPP
