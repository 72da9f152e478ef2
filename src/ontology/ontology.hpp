/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#pragma once
#ifndef TAXMAP_ONTOLOGY_ONTOLOGY_HPP
#define TAXMAP_ONTOLOGY_ONTOLOGY_HPP

#include <common.hpp>

#include <compare>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace taxmap::ontology {

enum class Relation
{
    synonym
,   hypernym
,   hyponym
};

// One meaning of a term.
struct Sense
{
    std::string gloss = {};
    StringSet synonyms = {};
    StringSet hypernyms = {};
    StringSet hyponyms = {};
};

struct Entry
{
    std::vector< Sense > senses = {};

    auto empty() const
        -> bool;
};

struct RelatedTerm
{
    std::string term = {};
    Relation relation = Relation::synonym;

    auto operator<=>( RelatedTerm const& ) const = default;
};

using RelatedTermSet = std::set< RelatedTerm >;

/**
 * @brief Lexical resource queried one normalized term at a time.
 *
 * An unknown term yields an empty Entry, not an error. Errors mean the resource itself failed; callers treat
 * them as "no relations known". Implementations must allow concurrent lookups.
 */
class Ontology
{
public:
    virtual ~Ontology() = default;

    virtual auto lookup( Term const& term ) const
        -> Result< Entry > = 0;
    virtual auto name() const
        -> std::string_view = 0;
};

[[ nodiscard ]]
auto relations( Sense const& sense )
    -> RelatedTermSet;
[[ nodiscard ]]
auto relations( Entry const& entry )
    -> RelatedTermSet;
// Relation as seen from the other end: hypernym <-> hyponym.
[[ nodiscard ]]
auto invert( Relation const& relation )
    -> Relation;
[[ nodiscard ]]
auto to_string( Relation const& relation )
    -> std::string;

} // namespace taxmap::ontology

#endif // TAXMAP_ONTOLOGY_ONTOLOGY_HPP
