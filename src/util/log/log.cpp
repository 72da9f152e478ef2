/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#include <util/log/log.hpp>

#include <boost/property_tree/xml_parser.hpp>
#include <fmt/format.h>
#include <range/v3/algorithm/any_of.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/filter.hpp>
#include <range/v3/view/split.hpp>
#include <range/v3/view/transform.hpp>

#if TAXMAP_LOG
namespace taxmap::util::log {

namespace {

auto split_tags( std::string const& tags )
    -> GlobalState::Tags
{
    return tags
         | ranges::views::split( ',' )
         | ranges::views::transform( []( auto const& e ){ return e | ranges::to< std::string >(); } )
         | ranges::views::filter( []( auto const& e ){ return !e.empty(); } )
         | ranges::to< GlobalState::Tags >();
}

} // namespace anon

CallStack::CallStack()
    : current_{ root_.put( "log.callstack", "" ) }
{
}

auto CallStack::add_value( std::string const& key
                         , std::string const& value )
    -> void
{
    auto& node = current_.get().add( "value", value );

    node.put( "<xmlattr>.key", key );
}

auto CallStack::current()
    -> Node&
{
    return current_;
}

auto CallStack::owner() const
    -> std::thread::id
{
    return owner_;
}

auto CallStack::pop( Node& parent )
    -> void
{
    current_ = parent;
}

auto CallStack::push_call( std::string const& function
                         , std::string const& file
                         , unsigned const line )
    -> void
{
    auto& node = current_.get().add_child( "call", Node{} );

    node.put( "<xmlattr>.function", function );
    node.put( "<xmlattr>.file", file );
    node.put( "<xmlattr>.line", line );

    current_ = node;
}

auto CallStack::reset( std::thread::id const owner )
    -> void
{
    root_.clear();

    current_ = root_.put( "log.callstack", "" );
    owner_ = owner;
}

auto CallStack::root() const
    -> Node const&
{
    return root_;
}

auto GlobalState::enable( std::string const& tags )
    -> void
{
    auto const lock = std::scoped_lock{ mutex };

    for( auto const& tag : split_tags( tags ) )
    {
        tags_.emplace( tag );
    }

    enable_logging = true;
}

auto GlobalState::disable( std::string const& tags )
    -> void
{
    auto const lock = std::scoped_lock{ mutex };
    auto const dtags = split_tags( tags );

    if( dtags.empty() || dtags.contains( "*" ) )
    {
        enable_logging = false;
        tags_.clear();
    }
    else
    {
        for( auto const& tag : dtags )
        {
            tags_.erase( tag );
        }

        enable_logging = !tags_.empty();
    }
}

auto GlobalState::is_enabled() const
    -> bool
{
    return enable_logging;
}

auto GlobalState::is_tag_enabled( std::string const& tags ) const
    -> bool
{
    auto const lock = std::scoped_lock{ mutex };

    if( tags_.empty() || tags_.contains( "*" ) )
    {
        return true;
    }

    return ranges::any_of( split_tags( tags ), [ & ]( auto const& e ){ return tags_.contains( e ); } );
}

auto GlobalState::push( std::string const& tags
                      , std::string const& msg )
    -> void
{
    if( is_enabled()
     && is_tag_enabled( tags ) )
    {
        auto const lock = std::scoped_lock{ mutex };

        fmt::print( stderr, "[log][{}] {}\n", tags, msg );
    }
}

auto Singleton::instance()
    -> GlobalState&
{
    static GlobalState inst;

    return inst;
}

ScopedFunctionLog::ScopedFunctionLog( const char* function
                                    , const char* file
                                    , unsigned line )
{
    auto& linst = Singleton::instance();

    if( linst.is_enabled()
     && linst.enable_call_stack )
    {
        auto const lock = std::scoped_lock{ linst.mutex };

        if( linst.call_stack.owner() == std::this_thread::get_id() )
        {
            parent_ = &linst.call_stack.current();

            linst.call_stack.push_call( function, file, line );

            pushed = true;
        }
    }
}

ScopedFunctionLog::~ScopedFunctionLog()
{
    if( pushed )
    {
        auto& linst = Singleton::instance();
        auto const lock = std::scoped_lock{ linst.mutex };

        linst.call_stack.pop( *parent_ );
    }
}

ScopedCallStack::ScopedCallStack()
    : was_enabled_{ Singleton::instance().enable_call_stack }
{
    auto& linst = Singleton::instance();

    if( !was_enabled_ )
    {
        auto const lock = std::scoped_lock{ linst.mutex };

        linst.call_stack.reset( std::this_thread::get_id() );
    }

    linst.enable_call_stack = true;
}

ScopedCallStack::~ScopedCallStack()
{
    Singleton::instance().enable_call_stack = was_enabled_;
}

auto write_call_stack( std::ostream& os )
    -> void
{
    auto& linst = Singleton::instance();
    auto const lock = std::scoped_lock{ linst.mutex };

    boost::property_tree::write_xml( os
                                   , linst.call_stack.root()
                                   , boost::property_tree::xml_writer_make_settings< std::string >( ' ', 2 ) );
}

} // namespace taxmap::util::log

#endif // TAXMAP_LOG
