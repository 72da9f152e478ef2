/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#pragma once
#ifndef TAXMAP_UTIL_STEM_HPP
#define TAXMAP_UTIL_STEM_HPP

#include <common.hpp>

#include <string>
#include <string_view>

namespace taxmap::util {

// Reduces English plural forms to the singular. Expects lower-case input.
[[ nodiscard ]]
auto stem( std::string_view const word )
    -> std::string;
/**
 * @brief The word itself followed by the singular forms it may be a plural of: "cookies" gives
 *        { "cookies", "cookie", "cooky" }. Used where a dictionary form is wanted rather than a stem.
 */
[[ nodiscard ]]
auto base_forms( std::string_view const word )
    -> StringVec;

} // namespace taxmap::util

#endif // TAXMAP_UTIL_STEM_HPP
