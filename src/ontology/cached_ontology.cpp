/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#include <ontology/cached_ontology.hpp>

#include <util/result.hpp>

#include <fmt/format.h>

#include <mutex>
#include <shared_mutex>

namespace taxmap::ontology {

CachedOntology::CachedOntology( Ontology const& backing )
    : backing_{ backing }
{
}

auto CachedOntology::clear()
    -> void
{
    auto const lock = std::unique_lock{ mutex_ };

    cache_.clear();
}

auto CachedOntology::lookup( Term const& term ) const
    -> Result< Entry >
{
    TM_RESULT_PROLOG();
        TM_RESULT_PUSH( "term", term );

    {
        auto const lock = std::shared_lock{ mutex_ };

        if( auto const it = cache_.find( term )
          ; it != cache_.end() )
        {
            return it->second;
        }
    }

    // Backing lookup runs unlocked; two racing misses compute the same entry and the first insert wins.
    auto const entry = TTRY( backing_.get().lookup( term ) );

    {
        auto const lock = std::unique_lock{ mutex_ };

        cache_.try_emplace( term, entry );
    }

    TM_LOG_MSG( "ontology", fmt::format( "cached '{}' ({} senses) from {}", term, entry.senses.size(), backing_.get().name() ) );

    return entry;
}

auto CachedOntology::size() const
    -> size_t
{
    auto const lock = std::shared_lock{ mutex_ };

    return cache_.size();
}

} // namespace taxmap::ontology
