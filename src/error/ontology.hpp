/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#pragma once
#ifndef TAXMAP_EC_ONTOLOGY_HPP
#define TAXMAP_EC_ONTOLOGY_HPP

#include "../common.hpp"

namespace taxmap::error_code
{

enum class ontology
{
    success = 0
,   lookup_failed
,   unavailable
,   invalid_format
};

} // namespace taxmap::error_code

namespace boost::system
{

template <>
struct is_error_code_enum< taxmap::error_code::ontology > : std::true_type
{
};

} // namespace boost::system

namespace taxmap::error_code::detail
{

class ontology_category : public boost::system::error_category
{
public:
    virtual const char* name() const noexcept override final { return "ontology error"; }
    virtual std::string message( int c ) const override final
    {
        using namespace taxmap::error_code;

        switch ( static_cast< ontology >( c ) )
        {
        case ontology::success: return "success";
        case ontology::lookup_failed: return "ontology lookup failed";
        case ontology::unavailable: return "ontology unavailable";
        case ontology::invalid_format: return "invalid ontology format";
        }

        return "unknown";
    }
};

} // namespace taxmap::error_code::detail

extern inline
auto ontology_category()
    -> taxmap::error_code::detail::ontology_category const&
{
  static taxmap::error_code::detail::ontology_category c;

  return c;
}

namespace taxmap::error_code
{

inline
auto make_error_code( ontology ec )
    -> boost::system::error_code
{
  return { static_cast< int >( ec )
         , ::ontology_category() };
}

} // namespace taxmap::error_code

#endif // TAXMAP_EC_ONTOLOGY_HPP
