/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#pragma once
#ifndef TAXMAP_UTIL_EDIT_DISTANCE_HPP
#define TAXMAP_UTIL_EDIT_DISTANCE_HPP

#include <cstdint>
#include <string_view>

namespace taxmap::util {

/**
 * @brief Damerau-Levenshtein distance (optimal string alignment variant): insertions, deletions,
 *        substitutions and transpositions of adjacent characters each cost one edit.
 */
[[ nodiscard ]]
auto edit_distance( std::string_view const lhs
                  , std::string_view const rhs )
    -> uint32_t;
/**
 * @brief 1 - distance / max( |lhs|, |rhs| ), in [0,1]. Two empty strings are fully similar.
 */
[[ nodiscard ]]
auto edit_similarity( std::string_view const lhs
                    , std::string_view const rhs )
    -> double;
[[ nodiscard ]]
auto longest_common_substring( std::string_view const lhs
                             , std::string_view const rhs )
    -> uint32_t;
/**
 * @brief Longest common run of characters divided by the longer length, in [0,1].
 */
[[ nodiscard ]]
auto common_substring_ratio( std::string_view const lhs
                           , std::string_view const rhs )
    -> double;

} // namespace taxmap::util

#endif // TAXMAP_UTIL_EDIT_DISTANCE_HPP
