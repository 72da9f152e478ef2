/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#pragma once
#ifndef TAXMAP_ONTOLOGY_CACHED_ONTOLOGY_HPP
#define TAXMAP_ONTOLOGY_CACHED_ONTOLOGY_HPP

#include <common.hpp>
#include <ontology/ontology.hpp>

#include <functional>
#include <shared_mutex>
#include <string_view>
#include <unordered_map>

namespace taxmap::ontology {

/**
 * @brief Read-through cache in front of another Ontology.
 *
 * Entries are immutable once cached. Failed lookups are not cached, so a transient failure is retried on the
 * next request. The cache may be cleared at any time.
 */
class CachedOntology : public Ontology
{
public:
    static constexpr auto id = "cached_ontology";

    explicit CachedOntology( Ontology const& backing );
    virtual ~CachedOntology() = default;

    auto clear()
        -> void;
    auto lookup( Term const& term ) const
        -> Result< Entry > override;
    auto name() const
        -> std::string_view override { return id; }
    auto size() const
        -> size_t;

private:
    std::reference_wrapper< Ontology const > backing_;
    mutable std::shared_mutex mutex_ = {};
    mutable std::unordered_map< Term, Entry > cache_ = {};
};

} // namespace taxmap::ontology

#endif // TAXMAP_ONTOLOGY_CACHED_ONTOLOGY_HPP
