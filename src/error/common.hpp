/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#pragma once
#ifndef TAXMAP_EC_COMMON_HPP
#define TAXMAP_EC_COMMON_HPP

#include <boost/system/error_code.hpp>

#include <string>

namespace taxmap::error_code
{

enum class common
{
    uncategorized = 1 // 0 should never be an error.
,   data_not_found // Required key absent.
,   conversion_failed // Text is not valid JSON.
,   invalid_value // Wrong type or out of range.
};

} // namespace taxmap::error_code

namespace boost::system
{

template <>
struct is_error_code_enum< taxmap::error_code::common > : std::true_type
{
};

} // namespace boost::system

namespace taxmap::error_code::detail
{

class common_category : public boost::system::error_category
{
public:
    // Return a short descriptive name for the category
    virtual const char* name() const noexcept override final { return "common error"; }
    // Return what each enum means in text
    virtual std::string message( int c ) const override final
    {
        using namespace taxmap::error_code;

        switch ( static_cast< common >( c ) )
        {
        case common::uncategorized: return "uncategorized";
        case common::data_not_found: return "data not found";
        case common::conversion_failed: return "conversion failed";
        case common::invalid_value: return "invalid value";
        }

        return "unknown";
    }
};

} // namespace taxmap::error_code::detail

extern inline
auto common_category()
    -> taxmap::error_code::detail::common_category const&
{
  static taxmap::error_code::detail::common_category c;

  return c;
}

namespace taxmap::error_code
{

inline
auto make_error_code( common ec )
    -> boost::system::error_code
{
  return { static_cast< int >( ec )
         , ::common_category() };
}

} // namespace taxmap::error_code

#endif // TAXMAP_EC_COMMON_HPP
