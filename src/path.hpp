/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#pragma once
#ifndef TAXMAP_PATH_HPP
#define TAXMAP_PATH_HPP

#include "common.hpp"

#include <functional>
#include <initializer_list>
#include <string>
#include <vector>

namespace taxmap {

struct Node
{
    Label label = {};
    uint32_t depth = {}; // Index within the owning Path.
    StringVec child_labels = {}; // Children that lie off the path; context only.

    auto operator==( Node const& ) const -> bool = default;
};

// Root first, leaf last. Parent/child relations are positional; labels may repeat.
class Path
{
public:
    using const_iterator = std::vector< Node >::const_iterator;

    Path() = default;
    Path( std::initializer_list< Label > labels );
    explicit Path( StringVec const& labels );

    auto add_node( Label const& label
                 , StringVec const& child_labels = {} )
        -> Node const&;

    auto at( uint32_t const index ) const
        -> Result< std::reference_wrapper< Node const > >;
    auto begin() const
        -> const_iterator;
    auto end() const
        -> const_iterator;
    [[ nodiscard ]]
    auto child( uint32_t const index ) const
        -> Optional< uint32_t >;
    [[ nodiscard ]]
    auto empty() const
        -> bool;
    [[ nodiscard ]]
    auto labels() const
        -> StringVec;
    auto leaf() const
        -> Node const&;
    [[ nodiscard ]]
    auto leaf_index() const
        -> uint32_t;
    [[ nodiscard ]]
    auto parent( uint32_t const index ) const
        -> Optional< uint32_t >;
    auto root() const
        -> Node const&;
    [[ nodiscard ]]
    auto size() const
        -> uint32_t;

    auto operator[]( uint32_t const index ) const
        -> Node const&;
    auto operator==( Path const& other ) const
        -> bool;

private:
    std::vector< Node > nodes_ = {};
};

[[ nodiscard ]]
auto to_string( Path const& path )
    -> std::string;
auto operator<<( std::ostream& os
               , Path const& path )
    -> std::ostream&;

} // namespace taxmap

#endif // TAXMAP_PATH_HPP
