/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#pragma once
#ifndef TAXMAP_UTIL_LOG_LOG_HPP
#define TAXMAP_UTIL_LOG_LOG_HPP

#if TAXMAP_LOG

#include <boost/property_tree/ptree.hpp>

#include <atomic>
#include <functional>
#include <mutex>
#include <ostream>
#include <set>
#include <string>
#include <thread>

    #define TM_LOG_ENABLE( tags ) taxmap::util::log::Singleton::instance().enable( tags );
    #define TM_LOG_DISABLE( tags ) taxmap::util::log::Singleton::instance().disable( tags );
    #define TM_LOG_IS_ENABLED() taxmap::util::log::Singleton::instance().is_enabled()
    #define TM_LOG_MSG( tags, msg ) taxmap::util::log::Singleton::instance().push( tags, msg );
    #define TM_LOG_CALL_STACK_SCOPE() auto tm_log_scoped_call_stack = taxmap::util::log::ScopedCallStack{};

namespace taxmap::util::log {

/**
 * @brief Call tree of the functions that opened a TM_RESULT_PROLOG(), with the values they pushed.
 *
 * Only the thread that opened the capture scope records; calls made from worker threads are left out of the tree.
 * Callers hold GlobalState::mutex.
 */
class CallStack
{
public:
    using Node = boost::property_tree::ptree;

    CallStack();

    auto add_value( std::string const& key
                  , std::string const& value )
        -> void;
    auto current()
        -> Node&;
    auto owner() const
        -> std::thread::id;
    auto pop( Node& parent )
        -> void;
    auto push_call( std::string const& function
                  , std::string const& file
                  , unsigned const line )
        -> void;
    auto reset( std::thread::id const owner )
        -> void;
    auto root() const
        -> Node const&;

private:
    Node root_ = {};
    std::reference_wrapper< Node > current_;
    std::thread::id owner_ = {};
};

class GlobalState
{
public:
    using Tags = std::set< std::string >;

    // Comma separated. "*" or no tags at all admits every message.
    auto enable( std::string const& tags )
        -> void;
    auto disable( std::string const& tags )
        -> void;
    auto is_enabled() const
        -> bool;
    auto is_tag_enabled( std::string const& tags ) const
        -> bool;
    auto push( std::string const& tags
             , std::string const& msg )
        -> void;

    std::atomic< bool > enable_logging = false;
    std::atomic< bool > enable_call_stack = false;
    CallStack call_stack = {};
    mutable std::recursive_mutex mutex = {};

private:
    Tags tags_ = {};
};

class Singleton
{
public:
    static auto instance()
        -> GlobalState&;
};

class ScopedFunctionLog
{
public:
    ScopedFunctionLog( const char* function = __builtin_FUNCTION()
                     , const char* file = __builtin_FILE()
                     , unsigned line = __builtin_LINE() );
    ~ScopedFunctionLog();

    ScopedFunctionLog( ScopedFunctionLog const& ) = delete;
    auto operator=( ScopedFunctionLog const& ) -> ScopedFunctionLog& = delete;

    bool pushed = false;

private:
    CallStack::Node* parent_ = nullptr;
};

// Clears the call tree on entry unless capture was already on.
class ScopedCallStack
{
    bool const was_enabled_;

public:
    ScopedCallStack();
    ~ScopedCallStack();
};

// Writes the captured call tree as XML.
auto write_call_stack( std::ostream& os )
    -> void;

} // namespace taxmap::util::log

#else // TAXMAP_LOG
    #define TM_LOG_ENABLE( tags )
    #define TM_LOG_DISABLE( tags )
    #define TM_LOG_IS_ENABLED() false
    #define TM_LOG_MSG( tags, msg )
    #define TM_LOG_CALL_STACK_SCOPE()
#endif // TAXMAP_LOG

#endif // TAXMAP_UTIL_LOG_LOG_HPP
