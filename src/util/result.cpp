/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#include <util/result.hpp>

#include <fmt/format.h>

#include <mutex>
#include <string>
#include <vector>

namespace taxmap::result {

#if TAXMAP_LOG
LocalState::LocalState( const char* function
                      , const char* file
                      , unsigned line )
    : scoped_log_{ function, file, line }
{
}
#endif // TAXMAP_LOG

auto LocalState::push( std::string const& key
                     , std::string const& value )
    -> void
{
#if TAXMAP_LOG
    if( scoped_log_.pushed )
    {
        auto& linst = util::log::Singleton::instance();
        auto const lock = std::scoped_lock{ linst.mutex };

        linst.call_stack.add_value( key, value );
    }
#endif // TAXMAP_LOG

    kvs_.emplace_back( key, value );
}

auto LocalState::values() const
    -> std::vector< KeyValue > const&
{
    return kvs_;
}

auto to_string( LocalState const& state )
    -> std::string
{
    auto rv = std::string{};

    for( auto const& [ key, value ] : state.values() )
    {
        rv += fmt::format( "{}: {}\n", key, value );
    }

    return rv;
}

} // namespace taxmap::result
