/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#pragma once
#ifndef TAXMAP_ONTOLOGY_MEMORY_ONTOLOGY_HPP
#define TAXMAP_ONTOLOGY_MEMORY_ONTOLOGY_HPP

#include <common.hpp>
#include <ontology/ontology.hpp>

#include <boost/json/object.hpp>

#include <map>
#include <string>
#include <string_view>

namespace taxmap::ontology {

/**
 * @brief Ontology held in memory, filled programmatically or from JSON of the form:
 *
 *        { "terms": { "sofa": [ { "gloss": "...", "synonyms": [ "couch" ], "hypernyms": [ "seat" ], "hyponyms": [] } ] } }
 *
 * @note Read-only after construction, so concurrent lookups are safe.
 */
class MemoryOntology : public Ontology
{
public:
    static constexpr auto id = "memory_ontology";

    MemoryOntology() = default;
    virtual ~MemoryOntology() = default;

    static auto from_json( boost::json::object const& obj )
        -> Result< MemoryOntology >;
    static auto from_json( std::string const& json_text )
        -> Result< MemoryOntology >;

    auto add_sense( Term const& term
                  , Sense const& sense )
        -> void;
    // Each term of the group receives one sense whose synonyms are the other terms.
    auto add_synonyms( StringVec const& group
                     , std::string const& gloss = {} )
        -> void;
    auto lookup( Term const& term ) const
        -> Result< Entry > override;
    auto name() const
        -> std::string_view override { return id; }
    auto size() const
        -> size_t;

private:
    std::map< Term, Entry > entries_ = {};
};

} // namespace taxmap::ontology

#endif // TAXMAP_ONTOLOGY_MEMORY_ONTOLOGY_HPP
