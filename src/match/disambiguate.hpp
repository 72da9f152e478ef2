/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#pragma once
#ifndef TAXMAP_MATCH_DISAMBIGUATE_HPP
#define TAXMAP_MATCH_DISAMBIGUATE_HPP

#include <common.hpp>
#include <config.hpp>
#include <ontology/ontology.hpp>

namespace taxmap {

/**
 * @brief Overlap between a sense's vocabulary (gloss words and related terms) and context terms.
 *
 * Each (sense word, context term) pair contributes its common substring ratio when that ratio reaches min_overlap.
 */
[[ nodiscard ]]
auto sense_score( ontology::Sense const& sense
                , TermSet const& context
                , double const min_overlap
                , TermPolicy const& policy = {} )
    -> double;
/**
 * @brief Picks the sense that best fits the context.
 * @return Index into entry.senses; empty when there is nothing to choose between or no sense overlaps the context.
 */
[[ nodiscard ]]
auto disambiguate( ontology::Entry const& entry
                 , TermSet const& context
                 , double const min_overlap
                 , TermPolicy const& policy = {} )
    -> Optional< uint32_t >;

} // namespace taxmap

#endif // TAXMAP_MATCH_DISAMBIGUATE_HPP
