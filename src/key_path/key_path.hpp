/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#pragma once
#ifndef TAXMAP_KEY_PATH_KEY_PATH_HPP
#define TAXMAP_KEY_PATH_KEY_PATH_HPP

#include <common.hpp>
#include <match/node_match.hpp>
#include <path.hpp>

#include <functional>
#include <ostream>
#include <string>
#include <vector>

namespace taxmap {

/**
 * @brief Ascending subsequence of a Path's node indices. The last index, when present, is the path's leaf.
 *
 * @note Refers to, and does not own, the Path; the Path must outlive it.
 */
class KeyPath
{
public:
    KeyPath( Path const& path
           , IndexVec const& indices );
    KeyPath( Path&&, IndexVec const& ) = delete;

    static auto full( Path const& path )
        -> KeyPath;

    // Copy without the node at path index; no-op when absent.
    [[ nodiscard ]]
    auto drop( uint32_t const path_index ) const
        -> KeyPath;
    [[ nodiscard ]]
    auto empty() const
        -> bool;
    auto indices() const
        -> IndexVec const&;
    [[ nodiscard ]]
    auto labels() const
        -> StringVec;
    auto path() const
        -> Path const&;
    [[ nodiscard ]]
    auto size() const
        -> uint32_t;

    // Path index of the key node at position.
    auto operator[]( uint32_t const position ) const
        -> uint32_t;

private:
    std::reference_wrapper< Path const > path_;
    IndexVec indices_ = {};
};

struct MatchedNode
{
    uint32_t source_index = {};
    Optional< uint32_t > candidate_index = {};
    NodeMatch match = {};
};

/**
 * @brief Alignment of a source key path against one candidate: one MatchedNode per source key node, root first.
 */
class MatchedKeyPath
{
public:
    MatchedKeyPath( KeyPath const& source
                  , Path const& candidate
                  , std::vector< MatchedNode > const& nodes );

    auto candidate() const
        -> Path const&;
    // Accepted candidate nodes only.
    [[ nodiscard ]]
    auto candidate_key_path() const
        -> KeyPath;
    // True when the leaves match; a candidate whose leaf fails is an explicit no-match.
    [[ nodiscard ]]
    auto is_match() const
        -> bool;
    auto nodes() const
        -> std::vector< MatchedNode > const&;
    auto source_key_path() const
        -> KeyPath const&;

private:
    KeyPath source_;
    std::reference_wrapper< Path const > candidate_;
    std::vector< MatchedNode > nodes_ = {};
};

[[ nodiscard ]]
auto to_string( KeyPath const& kp )
    -> std::string;
[[ nodiscard ]]
auto to_string( MatchedKeyPath const& mkp )
    -> std::string;
auto operator<<( std::ostream& os
               , KeyPath const& kp )
    -> std::ostream&;

} // namespace taxmap

#endif // TAXMAP_KEY_PATH_KEY_PATH_HPP
