/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#include "error/master.hpp"

#include <boost/filesystem/path.hpp>
#include <range/v3/view/enumerate.hpp>

#include <string>

namespace taxmap::error_code {

auto to_string( Payload const& payload )
    -> std::string
{
    auto rv = fmt::format( "{}: {}\n", payload.ec.category().name(), payload.ec.message() );

    for( auto const& [ depth, frame ] : payload.stack | ranges::views::enumerate )
    {
        rv += fmt::format( "  #{} {}:{} in {}\n"
                         , depth
                         , boost::filesystem::path{ frame.file }.filename().string()
                         , frame.line
                         , frame.function );

        if( !frame.message.empty() )
        {
            rv += fmt::format( "     {}\n", frame.message );
        }
    }

    return rv;
}

} // namespace taxmap::error_code
