/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#pragma once
#ifndef TAXMAP_EC_MATCH_HPP
#define TAXMAP_EC_MATCH_HPP

#include "../common.hpp"

namespace taxmap::error_code
{

enum class match
{
    success = 0
,   invalid_input // Empty source path, or a source leaf that yields no terms.
,   invalid_node
};

} // namespace taxmap::error_code

namespace boost::system
{

template <>
struct is_error_code_enum< taxmap::error_code::match > : std::true_type
{
};

} // namespace boost::system

namespace taxmap::error_code::detail
{

class match_category : public boost::system::error_category
{
public:
    // Return a short descriptive name for the category
    virtual const char* name() const noexcept override final { return "match error"; }
    // Return what each enum means in text
    virtual std::string message( int c ) const override final
    {
        using namespace taxmap::error_code;

        switch ( static_cast< match >( c ) )
        {
        case match::success: return "success";
        case match::invalid_input: return "invalid input; source path is empty or its leaf has no terms";
        case match::invalid_node: return "invalid node; index not within path";
        }

        return "unknown";
    }
};

} // namespace taxmap::error_code::detail

// Note: Ensure this is in global scope
extern inline
auto match_category()
    -> taxmap::error_code::detail::match_category const&
{
  static taxmap::error_code::detail::match_category c;

  return c;
}

namespace taxmap::error_code
{

inline
auto make_error_code( match ec )
    -> boost::system::error_code
{
  return { static_cast< int >( ec )
         , ::match_category() };
}

} // namespace taxmap::error_code

#endif // TAXMAP_EC_MATCH_HPP
