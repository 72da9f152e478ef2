/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#pragma once
#ifndef TAXMAP_TAXMAP_HPP
#define TAXMAP_TAXMAP_HPP

#include <common.hpp>
#include <config.hpp>
#include <key_path/generator.hpp>
#include <key_path/key_path.hpp>
#include <key_path/ranker.hpp>
#include <ontology/ontology.hpp>
#include <path.hpp>

#include <vector>

namespace taxmap {

/**
 * @brief Ranks every valid candidate against source, best first.
 *
 * @note Rankings refer to source and candidates; both must outlive the result.
 */
auto map_category( Path const& source
                 , std::vector< Path > const& candidates
                 , ontology::Ontology const& onto
                 , MatchConfig const& config = {} )
    -> Result< std::vector< Ranking > >;
auto map_category( Path const& source
                 , std::vector< Path > const& candidates
                 , SemanticMatcher const& matcher )
    -> Result< std::vector< Ranking > >;
/**
 * @brief Top ranking, or empty when nothing matched at the leaf or the top score falls below min_score.
 */
auto best_match( Path const& source
               , std::vector< Path > const& candidates
               , ontology::Ontology const& onto
               , MatchConfig const& config = {} )
    -> Result< Optional< Ranking > >;

} // namespace taxmap

#endif // TAXMAP_TAXMAP_HPP
